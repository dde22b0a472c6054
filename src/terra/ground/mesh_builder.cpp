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
#include "mesh_builder.h"

#include <terra/util/logging.h>

#include <Corrade/Containers/Array.h>

#include <Magnum/Mesh.h>

#include <longeron/utility/asserts.hpp>

#include <cstdlib>
#include <limits>
#include <ostream>

using Corrade::Containers::Array;
using Magnum::UnsignedInt;
using Magnum::Trade::MeshAttribute;
using Magnum::Trade::MeshAttributeData;
using Magnum::Trade::MeshData;
using Magnum::Trade::MeshIndexData;

namespace terra::ground
{

void write_grid_vertices(
        HeightMap                   const &heightmap,
        float                       const uvTileSize,
        StridedArrayView1D<Vector3>       positionsOut,
        StridedArrayView1D<Vector2>       uvsOut)
{
    std::size_t const width  = heightmap.width();
    std::size_t const height = heightmap.height();
    float       const scale  = heightmap.scale();

    LGRN_ASSERT(positionsOut.size() == width * height);
    LGRN_ASSERT(uvsOut.size()       == width * height);

    for (std::size_t z = 0; z < height; ++z)
    {
        for (std::size_t x = 0; x < width; ++x)
        {
            std::size_t const vertex = z * width + x;
            float const worldX = float(x) * scale;
            float const worldZ = float(z) * scale;

            positionsOut[vertex] = {worldX, heightmap.get(x, z), worldZ};
            uvsOut[vertex]       = {worldX / uvTileSize, worldZ / uvTileSize};
        }
    }
}

void write_grid_indices(
        std::size_t             const width,
        std::size_t             const height,
        ArrayView<UnsignedInt>        indicesOut)
{
    LGRN_ASSERTM(indicesOut.size() == (width - 1) * (height - 1) * 6, "Need 6 indices per quad");

    UnsignedInt *pCurrent = indicesOut.begin();

    for (std::size_t z = 0; z < height - 1; ++z)
    {
        for (std::size_t x = 0; x < width - 1; ++x)
        {
            auto const tl = UnsignedInt( z      * width + x    );
            auto const tr = UnsignedInt( z      * width + x + 1);
            auto const bl = UnsignedInt((z + 1) * width + x    );
            auto const br = UnsignedInt((z + 1) * width + x + 1);

            // Triangle 1, cross(bl-tl, tr-tl) = +Y for flat terrain
            *pCurrent++ = tl;
            *pCurrent++ = bl;
            *pCurrent++ = tr;

            // Triangle 2, cross(bl-tr, br-tr) = +Y for flat terrain
            *pCurrent++ = tr;
            *pCurrent++ = bl;
            *pCurrent++ = br;
        }
    }

    LGRN_ASSERTM(pCurrent == indicesOut.end(), "Code above must always add a known number of indices");
}

MeshData build_heightmap_mesh(HeightMap const &heightmap, HeightMeshConfig const &config)
{
    std::size_t const width  = heightmap.width();
    std::size_t const height = heightmap.height();

    if (width < 2 || height < 2)
    {
        TERRA_LOG_CRITICAL("HeightMap must be at least 2x2 to generate a mesh (got {}x{})", width, height);
        std::abort();
    }

    if ( ! height_mesh_fits_32bit(width, height) )
    {
        TERRA_LOG_CRITICAL("HeightMap of {}x{} has too many vertices or indices for 32-bit indices", width, height);
        std::abort();
    }

    // Comparison also rejects NaN
    float const minTileSize = std::numeric_limits<float>::epsilon();
    float const uvTileSize  = (config.uvTileSize > minTileSize) ? config.uvTileSize : minTileSize;

    HeightMeshBufferInfo const info = make_height_mesh_buffer_info(width, height);

    Array<char> vrtxBuffer{Corrade::ValueInit, info.vbufSize};
    Array<char> indxBuffer{Corrade::ValueInit, info.indxTotal * sizeof(UnsignedInt)};

    StridedArrayView1D<Vector3> const positions = info.vbufPositions.view(vrtxBuffer, info.vrtxTotal);
    StridedArrayView1D<Vector3> const normals   = info.vbufNormals  .view(vrtxBuffer, info.vrtxTotal);
    StridedArrayView1D<Vector2> const uvs       = info.vbufUVs      .view(vrtxBuffer, info.vrtxTotal);
    ArrayView<UnsignedInt>      const indices   = arrayCast<UnsignedInt>(indxBuffer);

    write_grid_vertices(heightmap, uvTileSize, positions, uvs);
    write_grid_indices(width, height, indices);
    calc_normals(config.normalMethod, heightmap, positions, indices, normals);

    // Views stay valid; moving the Arrays into MeshData doesn't reallocate
    return MeshData{Magnum::MeshPrimitive::Triangles,
                    std::move(indxBuffer), MeshIndexData{ArrayView<UnsignedInt const>{indices}},
                    std::move(vrtxBuffer),
                    {
                        MeshAttributeData{MeshAttribute::Position,              positions},
                        MeshAttributeData{MeshAttribute::Normal,                normals},
                        MeshAttributeData{MeshAttribute::TextureCoordinates,    uvs}
                    },
                    info.vrtxTotal};
}

void write_obj(std::ostream &rStream, MeshData const &mesh)
{
    bool const hasNormals = mesh.hasAttribute(MeshAttribute::Normal);
    bool const hasUVs     = mesh.hasAttribute(MeshAttribute::TextureCoordinates);

    rStream << "# Terrain mesh debug output\n"
            << "# Vertices: " << mesh.vertexCount() << "\n"
            << "# Indices: "  << mesh.indexCount()  << "\n";

    rStream << "o Terrain\n";

    for (Vector3 const v : mesh.attribute<Vector3>(MeshAttribute::Position))
    {
        rStream << "v " << v.x() << " " << v.y() << " " << v.z() << "\n";
    }

    if (hasUVs)
    {
        for (Vector2 const v : mesh.attribute<Vector2>(MeshAttribute::TextureCoordinates))
        {
            rStream << "vt " << v.x() << " " << v.y() << "\n";
        }
    }

    if (hasNormals)
    {
        for (Vector3 const v : mesh.attribute<Vector3>(MeshAttribute::Normal))
        {
            rStream << "vn " << v.x() << " " << v.y() << " " << v.z() << "\n";
        }
    }

    StridedArrayView1D<UnsignedInt const> const indices = mesh.indices<UnsignedInt>();

    // Indexes start at 1 for .obj files
    // Format: "f vertex1/uv1/normal1 vertex2/uv2/normal2 vertex3/uv3/normal3"
    auto const write_corner = [&rStream, hasNormals, hasUVs] (UnsignedInt const index)
    {
        UnsignedInt const objIndex = index + 1;
        rStream << " " << objIndex;
        if (hasUVs || hasNormals)
        {
            rStream << "/";
            if (hasUVs)
            {
                rStream << objIndex;
            }
            if (hasNormals)
            {
                rStream << "/" << objIndex;
            }
        }
    };

    for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
    {
        rStream << "f";
        write_corner(indices[i]);
        write_corner(indices[i + 1]);
        write_corner(indices[i + 2]);
        rStream << "\n";
    }
}

} // namespace terra::ground
