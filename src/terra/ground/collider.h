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
 * @brief Static height field collision shape data from a HeightMap
 */
#pragma once

#include "heightmap.h"

#include <terra/core/math_types.h>

#include <Corrade/Containers/Array.h>

namespace terra::ground
{

/**
 * @brief Height samples rearranged for physics engine height field shapes
 *
 * Physics engines expect heights as [row][column] where rows are subdivisions along X and
 * columns are along Z. This is transposed from HeightMap's data[z*width + x].
 *
 * The shape spans [-world_width/2, world_width/2] x [-world_depth/2, world_depth/2], while
 * meshes from build_heightmap_mesh start at (0, 0, 0). Offset the body by
 * (-world_width/2, 0, -world_depth/2) to line them up.
 */
struct HeightFieldColliderData
{
    /// 2D, heights[x*columns + z] = HeightMap::get(x, z)
    Corrade::Containers::Array<float>   heights;

    std::size_t                         rows;       ///< HeightMap::width()
    std::size_t                         columns;    ///< HeightMap::height()

    /// Total world extent on each axis. Y is 1, since heights are already in world units.
    Vector3                             scale;
};

[[nodiscard]] HeightFieldColliderData make_heightfield_collider_data(HeightMap const &heightmap);

} // namespace terra::ground
