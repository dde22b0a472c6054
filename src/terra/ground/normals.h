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
 * @brief Per-vertex normal estimation for height map grid meshes
 */
#pragma once

#include "heightmap.h"

#include <terra/core/array_view.h>
#include <terra/core/math_types.h>

#include <cstdint>

namespace terra::ground
{

/**
 * @brief Vertex normal calculation method
 */
enum class ENormalMethod : std::uint8_t
{
    /// Sum of unnormalized face normals of connected triangles, weighting each face by its area.
    /// Follows the actual rendered triangles, including jagged or eroded terrain.
    AreaWeighted,

    /// 3x3 Sobel gradient of the height samples, clamped at the grid edges
    Sobel
};

/// Output for normals that can't be calculated, such as vertices with no connected faces
inline constexpr Vector3 gc_defaultNormal{0.0f, 1.0f, 0.0f};

/**
 * @brief Calculate normals from a triangle list
 *
 * Each face's cross product (p1-p0) x (p2-p0) is added to all 3 of its vertices, then each sum
 * is normalized. Sums with a length of machine epsilon or less become gc_defaultNormal.
 *
 * @param positions  [in] Vertex positions
 * @param indices    [in] Triangle list, 3 indices per face, each index < positions.size()
 * @param normalsOut [out] One normal per vertex, same size as positions
 */
void calc_normals_area_weighted(
        StridedArrayView1D<Vector3 const>   positions,
        ArrayView<Magnum::UnsignedInt const> indices,
        StridedArrayView1D<Vector3>         normalsOut);

/**
 * @brief Calculate normals from a height map using a Sobel filter
 *
 * Horizontal and vertical gradients gx and gz are taken over the 3x3 neighborhood of each
 * sample, with coordinates clamped to the grid. The Sobel kernels scale the derivative by
 * 8*scale, giving the normal (-gx, 8*scale, -gz) before normalization.
 *
 * @param heightmap  [in] Height samples
 * @param normalsOut [out] One normal per sample, row-major, size width*height
 */
void calc_normals_sobel(
        HeightMap                   const &heightmap,
        StridedArrayView1D<Vector3>       normalsOut);

/**
 * @brief Calculate normals using the given method
 *
 * @param method     [in] Method to use
 * @param heightmap  [in] Height samples, used by ENormalMethod::Sobel
 * @param positions  [in] Vertex positions, used by ENormalMethod::AreaWeighted
 * @param indices    [in] Triangle list, used by ENormalMethod::AreaWeighted
 * @param normalsOut [out] One normal per vertex
 */
void calc_normals(
        ENormalMethod                           method,
        HeightMap                         const &heightmap,
        StridedArrayView1D<Vector3 const>       positions,
        ArrayView<Magnum::UnsignedInt const>    indices,
        StridedArrayView1D<Vector3>             normalsOut);

} // namespace terra::ground
