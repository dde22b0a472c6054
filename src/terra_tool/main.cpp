/**
 * Open Space Program
 * Copyright © 2019-2024 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include <terra/ground/collider.h>
#include <terra/ground/mesh_builder.h>
#include <terra/ground/splat.h>
#include <terra/util/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <Corrade/Utility/Arguments.h>

#include <Magnum/PixelFormat.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>

using namespace terra;
using namespace terra::ground;

namespace
{

constexpr long long gc_maxSamples = 8192;

/// Rolling hills: a slow swell along Z plus smaller ripples along X
HeightMap make_hills(std::size_t const width, std::size_t const height, float const scale, float const amplitude)
{
    constexpr double const twoPi = 2.0 * 3.14159265358979;

    HeightMap heightmap{width, height, scale};
    for (std::size_t z = 0; z < height; ++z)
    {
        for (std::size_t x = 0; x < width; ++x)
        {
            double const u = double(x) / double(width);
            double const v = double(z) / double(height);

            double const h =   0.2*(0.5 - 0.5*std::cos(u * 4.0 * twoPi))
                             + 0.8*(0.5 - 0.5*std::cos(v * 1.0 * twoPi));
            heightmap.set(x, z, float(amplitude * h));
        }
    }
    return heightmap;
}

/**
 * @brief Assign blend layers by height band, then blend in layer 3 (rock) on steep slopes
 */
WeightMap make_splat(HeightMap const &heightmap, Magnum::Trade::MeshData const &mesh, float const amplitude)
{
    WeightMap out{heightmap.width(), heightmap.height()};

    auto const normals = mesh.attribute<Vector3>(Magnum::Trade::MeshAttribute::Normal);

    for (std::size_t z = 0; z < heightmap.height(); ++z)
    {
        for (std::size_t x = 0; x < heightmap.width(); ++x)
        {
            float const t     = std::clamp(heightmap.get(x, z) / std::max(amplitude, 1e-6f), 0.0f, 1.0f);
            float const slope = 1.0f - normals[z * heightmap.width() + x].y();
            float const rock  = std::clamp(slope * 4.0f, 0.0f, 1.0f);

            float const low   = std::clamp(1.0f - 2.0f*t, 0.0f, 1.0f);
            float const high  = std::clamp(2.0f*t - 1.0f, 0.0f, 1.0f);
            float const mid   = 1.0f - low - high;

            auto const byte = [] (float w) { return Magnum::UnsignedByte(std::lround(std::clamp(w, 0.0f, 1.0f) * 255.0f)); };

            out.set(x, z, {byte(low  * (1.0f - rock)),
                           byte(mid  * (1.0f - rock)),
                           byte(high * (1.0f - rock)),
                           byte(rock)});
        }
    }
    return out;
}

} // namespace

int main(int argc, char** argv)
{
    Corrade::Utility::Arguments args;
    args.addOption("width", "64").setHelp("width", "number of height samples along X")
        .addOption("height", "64").setHelp("height", "number of height samples along Z")
        .addOption("scale", "1").setHelp("scale", "world units between height samples")
        .addOption("amplitude", "8").setHelp("amplitude", "maximum hill height in world units")
        .addOption("uv-tile", "4").setHelp("uv-tile", "world-space size of one UV tile")
        .addOption("normals", "area").setHelp("normals", "normal calculation method: area or sobel")
        .addOption("obj").setHelp("obj", "path to write the generated mesh as wavefront .obj")
        .addBooleanOption('v', "verbose").setHelp("verbose", "log verbosely")
        .setGlobalHelp("Generates a terrain mesh and splat texture from procedural height data.")
        .parse(argc, argv);

    // Setup logger
    {
        auto pSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        pSink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        auto pLogger = std::make_shared<spdlog::logger>("terra", std::move(pSink));
        pLogger->set_level(args.isSet("verbose") ? spdlog::level::debug : spdlog::level::info);
        terra::set_thread_logger(std::move(pLogger));
    }

    // Signed, so negative input is caught instead of wrapping around
    auto const widthArg  = args.value<long long>("width");
    auto const heightArg = args.value<long long>("height");
    auto const scale     = args.value<float>("scale");
    auto const amplitude = args.value<float>("amplitude");

    HeightMeshConfig config{ .uvTileSize = args.value<float>("uv-tile") };

    std::string const normals = args.value("normals");
    if (normals == "area")
    {
        config.normalMethod = ENormalMethod::AreaWeighted;
    }
    else if (normals == "sobel")
    {
        config.normalMethod = ENormalMethod::Sobel;
    }
    else
    {
        TERRA_LOG_ERROR("Unknown normal method '{}', expected 'area' or 'sobel'", normals);
        return 1;
    }

    if (   widthArg  < 2 || widthArg  > gc_maxSamples
        || heightArg < 2 || heightArg > gc_maxSamples)
    {
        TERRA_LOG_ERROR("Height map dimensions must be between 2 and {}, got {}x{}",
                        gc_maxSamples, widthArg, heightArg);
        return 1;
    }

    auto const width  = std::size_t(widthArg);
    auto const height = std::size_t(heightArg);

    if ( ! (scale > 0.0f) || ! std::isfinite(scale) )
    {
        TERRA_LOG_ERROR("Scale must be positive and finite, got {}", scale);
        return 1;
    }

    HeightMap const heightmap = make_hills(width, height, scale, amplitude);

    Magnum::Trade::MeshData const mesh = build_heightmap_mesh(heightmap, config);
    TERRA_LOG_INFO("Built terrain mesh: {} vertices, {} indices, {} normals",
                   mesh.vertexCount(), mesh.indexCount(), normals);

    HeightFieldColliderData const collider = make_heightfield_collider_data(heightmap);
    TERRA_LOG_INFO("Collider height field: {}x{}, extent ({}, {}, {})",
                   collider.rows, collider.columns,
                   collider.scale.x(), collider.scale.y(), collider.scale.z());

    // Splat texture goes through the same sync path a renderer would use each frame
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    images.data_emplace(splat.image, Magnum::Trade::ImageData2D{Magnum::PixelFormat::RGBA8Unorm, {1, 1},
                                                                Corrade::Containers::Array<char>{Corrade::ValueInit, 4}});

    GroundMaterialSettings settings{ .weightMap = make_splat(heightmap, mesh, amplitude) };
    if ( ! sync_splat_texture(settings, splat, images) )
    {
        TERRA_LOG_ERROR("Splat texture failed to sync");
        return 1;
    }

    Magnum::Trade::ImageData2D const &image = *images.data_try_get(splat.image);
    TERRA_LOG_INFO("Splat texture: {}x{}, {} bytes", image.size().x(), image.size().y(), image.data().size());

    if ( ! args.value("obj").empty() )
    {
        std::string const path = args.value("obj");
        std::ofstream file{path};
        if ( ! file )
        {
            TERRA_LOG_ERROR("Failed to open '{}' for writing", path);
            return 1;
        }
        write_obj(file, mesh);
        TERRA_LOG_INFO("Wrote {}", path);
    }

    spdlog::shutdown();
    return 0;
}
