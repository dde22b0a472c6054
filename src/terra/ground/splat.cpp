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
#include "splat.h"

#include <terra/util/logging.h>

#include <Magnum/PixelFormat.h>
#include <Magnum/Sampler.h>

#include <longeron/utility/asserts.hpp>

#include <utility>

using Corrade::Containers::Array;
using Magnum::PixelFormat;
using Magnum::SamplerFilter;
using Magnum::SamplerMipmap;
using Magnum::SamplerWrapping;
using Magnum::Trade::ImageData2D;
using Magnum::Trade::TextureData;
using Magnum::Trade::TextureType;

namespace terra::ground
{

namespace
{

constexpr std::size_t gc_bytesPerPixel = 4;

Vector2i image_size(WeightMap const &weightMap) noexcept
{
    return {Magnum::Int(weightMap.width), Magnum::Int(weightMap.height)};
}

void write_packed(WeightMap const &weightMap, ArrayView<char> out) noexcept
{
    LGRN_ASSERTM(weightMap.data.size() == weightMap.width * weightMap.height,
                 "WeightMap data must hold exactly width*height pixels");
    LGRN_ASSERTM(out.size() == weightMap.width * weightMap.height * gc_bytesPerPixel,
                 "Output must hold exactly 4 bytes per pixel");

    auto const rows = as_2d(out, weightMap.width * gc_bytesPerPixel);

    for (std::size_t z = 0; z < weightMap.height; ++z)
    {
        ArrayView<char> const row = rows.row(z);
        for (std::size_t x = 0; x < weightMap.width; ++x)
        {
            WeightMap::Pixel_t const pixel = weightMap.data[z * weightMap.width + x];
            for (std::size_t c = 0; c < gc_bytesPerPixel; ++c)
            {
                row[x * gc_bytesPerPixel + c] = char(pixel[c]);
            }
        }
    }
}

} // namespace

Array<char> pack_weight_map(WeightMap const &weightMap)
{
    Array<char> out{Corrade::NoInit, weightMap.width * weightMap.height * gc_bytesPerPixel};
    write_packed(weightMap, out);
    return out;
}

ImageData2D splat_to_image(WeightMap const &weightMap)
{
    return ImageData2D{PixelFormat::RGBA8Unorm, image_size(weightMap), pack_weight_map(weightMap)};
}

TextureData splat_texture_data(Magnum::UnsignedInt const image)
{
    return TextureData{TextureType::Texture2D,
                       SamplerFilter::Linear, SamplerFilter::Linear, SamplerMipmap::Base,
                       SamplerWrapping::Repeat,
                       image};
}

bool sync_splat_texture(
        GroundMaterialSettings          &rSettings,
        SplatTexture              const &splatTexture,
        ImageStore                      &rImages)
{
    if ( ! rSettings.dirty )
    {
        return false;
    }

    ImageData2D *pImage = rImages.data_try_get(splatTexture.image);
    if (pImage == nullptr)
    {
        TERRA_LOG_DEBUG("Splat texture image not ready, retrying next sync");
        return false;
    }

    WeightMap const &weightMap = rSettings.weightMap;
    Vector2i  const newSize    = image_size(weightMap);

    if (pImage->size() != newSize || pImage->format() != PixelFormat::RGBA8Unorm)
    {
        TERRA_LOG_INFO("Resizing splat texture from {}x{} to {}x{}",
                       pImage->size().x(), pImage->size().y(), newSize.x(), newSize.y());
        rImages.data_emplace(splatTexture.image, splat_to_image(weightMap));
    }
    else
    {
        write_packed(weightMap, pImage->mutableData());
    }

    rSettings.dirty = false;
    return true;
}

} // namespace terra::ground
