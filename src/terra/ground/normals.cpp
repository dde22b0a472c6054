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
#include "normals.h"

#include <longeron/utility/asserts.hpp>

#include <algorithm>
#include <array>
#include <limits>

using Magnum::UnsignedInt;

namespace terra::ground
{

namespace
{

/// Normalize, or return gc_defaultNormal for zero-length or near-zero-length vectors
Vector3 normalized_or_default(Vector3 const vec) noexcept
{
    float const length = vec.length();
    return (length > std::numeric_limits<float>::epsilon()) ? vec / length : gc_defaultNormal;
}

constexpr std::array<std::array<float, 3>, 3> gc_sobelX
{{
    {-1.0f, 0.0f, 1.0f},
    {-2.0f, 0.0f, 2.0f},
    {-1.0f, 0.0f, 1.0f}
}};

constexpr std::array<std::array<float, 3>, 3> gc_sobelZ
{{
    {-1.0f, -2.0f, -1.0f},
    { 0.0f,  0.0f,  0.0f},
    { 1.0f,  2.0f,  1.0f}
}};

} // namespace

void calc_normals_area_weighted(
        StridedArrayView1D<Vector3 const>       positions,
        ArrayView<UnsignedInt const>            indices,
        StridedArrayView1D<Vector3>             normalsOut)
{
    LGRN_ASSERTM(positions.size() == normalsOut.size(), "Need exactly one normal per vertex");
    LGRN_ASSERTM(indices.size() % 3 == 0, "Indices must form a triangle list");

    std::fill(normalsOut.begin(), normalsOut.end(), Vector3{ZeroInit});

    for (std::size_t i = 0; i < indices.size(); i += 3)
    {
        UnsignedInt const a = indices[i];
        UnsignedInt const b = indices[i + 1];
        UnsignedInt const c = indices[i + 2];

        LGRN_ASSERTMV(a < positions.size() && b < positions.size() && c < positions.size(),
                      "Triangle index out of range", a, b, c, positions.size());

        // Magnitude is twice the face's area, larger faces contribute more
        Vector3 const faceNormal = Magnum::Math::cross(positions[b] - positions[a],
                                                       positions[c] - positions[a]);
        normalsOut[a] += faceNormal;
        normalsOut[b] += faceNormal;
        normalsOut[c] += faceNormal;
    }

    for (Vector3 &rNormal : normalsOut)
    {
        rNormal = normalized_or_default(rNormal);
    }
}

void calc_normals_sobel(
        HeightMap                   const &heightmap,
        StridedArrayView1D<Vector3>       normalsOut)
{
    std::size_t const width  = heightmap.width();
    std::size_t const height = heightmap.height();

    LGRN_ASSERTM(normalsOut.size() == width * height, "Need exactly one normal per height sample");

    auto const heights    = as_2d(heightmap.data(), width);
    auto const normalRows = as_2d(normalsOut, width);
    float const upScale   = 8.0f * heightmap.scale();

    // Samples outside of the grid take the value of the nearest edge sample
    auto const clamped = [] (std::size_t const center, int const offset, std::size_t const size) noexcept
    {
        if (offset < 0)
        {
            return (center == 0) ? center : center - 1;
        }
        else if (offset > 0)
        {
            return std::min(center + 1, size - 1);
        }
        return center;
    };

    for (std::size_t z = 0; z < height; ++z)
    {
        StridedArrayView1D<Vector3> const normalRow = normalRows.row(z);

        for (std::size_t x = 0; x < width; ++x)
        {
            float gx = 0.0f;
            float gz = 0.0f;

            for (int dz = -1; dz <= 1; ++dz)
            {
                ArrayView<float const> const heightRow = heights.row(clamped(z, dz, height));

                for (int dx = -1; dx <= 1; ++dx)
                {
                    float const sample = heightRow[clamped(x, dx, width)];
                    gx += gc_sobelX[dz + 1][dx + 1] * sample;
                    gz += gc_sobelZ[dz + 1][dx + 1] * sample;
                }
            }

            normalRow[x] = normalized_or_default({-gx, upScale, -gz});
        }
    }
}

void calc_normals(
        ENormalMethod                       const method,
        HeightMap                           const &heightmap,
        StridedArrayView1D<Vector3 const>         positions,
        ArrayView<UnsignedInt const>              indices,
        StridedArrayView1D<Vector3>               normalsOut)
{
    switch (method)
    {
    case ENormalMethod::AreaWeighted:
        calc_normals_area_weighted(positions, indices, normalsOut);
        break;
    case ENormalMethod::Sobel:
        calc_normals_sobel(heightmap, normalsOut);
        break;
    }
}

} // namespace terra::ground
