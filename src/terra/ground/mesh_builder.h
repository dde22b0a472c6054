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
/**
 * @file
 * @brief Triangulated mesh generation from HeightMap data
 *
 * Meshes cover world space [0, world_width] x [0, world_depth] in the XZ plane, with heights
 * along the Y axis. Output is a Magnum::Trade::MeshData triangle list with positions, normals,
 * and tiling texture coordinates.
 */
#pragma once

#include "heightmap.h"
#include "normals.h"

#include <terra/core/array_view.h>
#include <terra/core/buffer_format.h>
#include <terra/core/math_types.h>

#include <Magnum/Trade/MeshData.h>

#include <cstdint>
#include <iosfwd>
#include <limits>

namespace terra::ground
{

/**
 * @brief Settings for build_heightmap_mesh
 */
struct HeightMeshConfig
{
    /// World-space size of one UV tile. 1.0 tiles a texture once per world unit, and
    /// HeightMap::scale() tiles once per grid cell. Clamped to a positive minimum when building.
    float           uvTileSize      {1.0f};

    ENormalMethod   normalMethod    {ENormalMethod::AreaWeighted};
};

/**
 * @brief Describes how a height mesh's vertex and index buffers are laid out
 *
 * Vertices are row-major along Z, vertex (x, z) is at index z*width + x. Positions, normals, and
 * UVs are each a contiguous block within the same vertex buffer.
 */
struct HeightMeshBufferInfo
{
    BufAttribFormat<Vector3>    vbufPositions;
    BufAttribFormat<Vector3>    vbufNormals;
    BufAttribFormat<Vector2>    vbufUVs;

    std::size_t                 vbufSize;   ///< Vertex buffer size in bytes
    std::uint32_t               vrtxTotal;  ///< width*height
    std::uint32_t               indxTotal;  ///< (width-1)*(height-1)*6, 2 triangles per quad
};

/**
 * @brief Check if both vertex and index counts of a width x height mesh fit in 32-bit indices
 *
 * Must be true before calling make_height_mesh_buffer_info, which stores counts as uint32_t.
 */
constexpr bool height_mesh_fits_32bit(std::size_t const width, std::size_t const height) noexcept
{
    constexpr std::size_t limit = std::numeric_limits<std::uint32_t>::max();

    if (height != 0 && width > limit / height)
    {
        return false; // Too many vertices
    }

    // Can't overflow, quads are fewer than vertices
    std::size_t const quadTotal = (width < 2 || height < 2) ? 0 : (width - 1) * (height - 1);

    return quadTotal <= limit / 6;
}

constexpr HeightMeshBufferInfo make_height_mesh_buffer_info(std::size_t const width, std::size_t const height)
{
    std::uint32_t const vrtxTotal = std::uint32_t(width * height);
    std::uint32_t const quadTotal = std::uint32_t((width - 1) * (height - 1));

    BufferFormatBuilder formatBuilder;
    BufAttribFormat<Vector3> const positions = formatBuilder.insert_block<Vector3>(vrtxTotal);
    BufAttribFormat<Vector3> const normals   = formatBuilder.insert_block<Vector3>(vrtxTotal);
    BufAttribFormat<Vector2> const uvs       = formatBuilder.insert_block<Vector2>(vrtxTotal);

    return
    {
        .vbufPositions  = positions,
        .vbufNormals    = normals,
        .vbufUVs        = uvs,
        .vbufSize       = formatBuilder.total_size(),
        .vrtxTotal      = vrtxTotal,
        .indxTotal      = quadTotal * 6
    };
}

/**
 * @brief Write a vertex for each height sample
 *
 * Vertex (x, z) gets position (x*scale, height, z*scale) and UV (x*scale, z*scale) / uvTileSize.
 *
 * @param heightmap     [in] Height samples
 * @param uvTileSize    [in] World-space size of one UV tile, must be positive
 * @param positionsOut  [out] width*height positions
 * @param uvsOut        [out] width*height texture coordinates
 */
void write_grid_vertices(
        HeightMap                   const &heightmap,
        float                             uvTileSize,
        StridedArrayView1D<Vector3>       positionsOut,
        StridedArrayView1D<Vector2>       uvsOut);

/**
 * @brief Write counter-clockwise triangle list indices for a grid of vertices
 *
 * Each quad (x, z) to (x+1, z+1) emits two triangles:
 *
 * @code{.unparsed}
 *   tl---tr
 *   | \   |     Triangle 1: tl, bl, tr
 *   |  \  |     Triangle 2: tr, bl, br
 *   |   \ |
 *   bl---br
 * @endcode
 *
 * Face normals point +Y for flat terrain; cross(bl-tl, tr-tl) = +Y.
 *
 * @param width      [in] Vertices along X, at least 2
 * @param height     [in] Vertices along Z, at least 2
 * @param indicesOut [out] (width-1)*(height-1)*6 indices
 */
void write_grid_indices(
        std::size_t                     width,
        std::size_t                     height,
        ArrayView<Magnum::UnsignedInt>  indicesOut);

/**
 * @brief Build a renderable triangle list mesh from a height map
 *
 * Resulting mesh has MeshAttribute::Position, MeshAttribute::Normal, and
 * MeshAttribute::TextureCoordinates, plus UnsignedInt indices. Ownership of all data is passed
 * to the caller.
 *
 * The height map must be at least 2x2, since a smaller grid can't form any triangles. This is a
 * fatal precondition: the error is logged and the process is aborted.
 *
 * @param heightmap [in] Height samples
 * @param config    [in] UV tiling and normal method
 */
[[nodiscard]] Magnum::Trade::MeshData build_heightmap_mesh(
        HeightMap           const &heightmap,
        HeightMeshConfig    const &config = {});

/**
 * @brief Write mesh in wavefront .obj format
 */
void write_obj(std::ostream &rStream, Magnum::Trade::MeshData const &mesh);

} // namespace terra::ground
