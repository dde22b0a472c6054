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
#include "heightmap.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace terra::ground
{

namespace
{

void check_dimensions(std::size_t const width, std::size_t const height)
{
    if (width == 0 || height == 0)
    {
        throw std::invalid_argument("Grid dimensions must be non-zero, got "
                                    + std::to_string(width) + "x" + std::to_string(height));
    }
}

void check_coords(std::size_t const x, std::size_t const z, std::size_t const width, std::size_t const height)
{
    if (x >= width || z >= height)
    {
        throw std::out_of_range("Grid coordinate (" + std::to_string(x) + ", " + std::to_string(z)
                                + ") out of range for " + std::to_string(width) + "x" + std::to_string(height));
    }
}

} // namespace

HeightMap::HeightMap(std::size_t const width, std::size_t const height, float const scale)
 : HeightMap(width, height, scale, std::vector<float>(width * height, 0.0f))
{ }

HeightMap::HeightMap(std::size_t const width, std::size_t const height, float const scale, std::vector<float> data)
 : m_width  {width}
 , m_height {height}
 , m_scale  {scale}
 , m_data   {std::move(data)}
{
    check_dimensions(width, height);

    if ( ! (std::isfinite(scale) && scale > 0.0f) )
    {
        throw std::invalid_argument("HeightMap scale must be a positive number, got " + std::to_string(scale));
    }

    if (m_data.size() != width * height)
    {
        throw std::invalid_argument("HeightMap data has " + std::to_string(m_data.size())
                                    + " samples, expected " + std::to_string(width * height));
    }
}

float HeightMap::get(std::size_t const x, std::size_t const z) const
{
    check_coords(x, z, m_width, m_height);
    return m_data[z * m_width + x];
}

void HeightMap::set(std::size_t const x, std::size_t const z, float const value)
{
    check_coords(x, z, m_width, m_height);
    m_data[z * m_width + x] = value;
}

WeightMap::WeightMap(std::size_t const width, std::size_t const height)
 : width  {width}
 , height {height}
{
    check_dimensions(width, height);
    data.resize(width * height, Pixel_t{ZeroInit});
}

WeightMap::Pixel_t WeightMap::get(std::size_t const x, std::size_t const z) const
{
    check_coords(x, z, width, height);
    return data[z * width + x];
}

void WeightMap::set(std::size_t const x, std::size_t const z, Pixel_t const pixel)
{
    check_coords(x, z, width, height);
    data[z * width + x] = pixel;
}

} // namespace terra::ground
