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
#include "collider.h"

#include <terra/core/array_view.h>

namespace terra::ground
{

HeightFieldColliderData make_heightfield_collider_data(HeightMap const &heightmap)
{
    std::size_t const width  = heightmap.width();
    std::size_t const height = heightmap.height();

    HeightFieldColliderData out
    {
        .heights = Corrade::Containers::Array<float>{Corrade::NoInit, width * height},
        .rows    = width,
        .columns = height,
        .scale   = {heightmap.world_width(), 1.0f, heightmap.world_depth()}
    };

    auto const rows = as_2d(out.heights, height);

    for (std::size_t x = 0; x < width; ++x)
    {
        ArrayView<float> const row = rows.row(x);
        for (std::size_t z = 0; z < height; ++z)
        {
            row[z] = heightmap.get(x, z);
        }
    }

    return out;
}

} // namespace terra::ground
