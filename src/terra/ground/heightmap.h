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
 * @brief Height and weight grids that terrain meshes and splat textures are generated from
 */
#pragma once

#include <terra/core/array_view.h>
#include <terra/core/math_types.h>

#include <cstddef>
#include <vector>

namespace terra::ground
{

/**
 * @brief Dense 2D grid of elevation samples at a uniform world-space spacing
 *
 * Samples are stored row-major: data[z*width + x]. World-space X and Z of a sample are
 * x*scale and z*scale; heights are already in world units.
 */
class HeightMap
{
public:

    /**
     * @brief Construct a flat (all zero) height map
     *
     * @throws std::invalid_argument if width or height is zero, or scale isn't a positive number
     */
    HeightMap(std::size_t width, std::size_t height, float scale);

    /**
     * @brief Construct from existing row-major samples
     *
     * @throws std::invalid_argument on invalid dimensions, or if data.size() != width*height
     */
    HeightMap(std::size_t width, std::size_t height, float scale, std::vector<float> data);

    /**
     * @return Height at grid coordinates (x, z)
     *
     * @throws std::out_of_range if x >= width() or z >= height()
     */
    [[nodiscard]] float get(std::size_t x, std::size_t z) const;

    /**
     * @throws std::out_of_range if x >= width() or z >= height()
     */
    void set(std::size_t x, std::size_t z, float value);

    [[nodiscard]] constexpr std::size_t width()  const noexcept { return m_width; }
    [[nodiscard]] constexpr std::size_t height() const noexcept { return m_height; }
    [[nodiscard]] constexpr float       scale()  const noexcept { return m_scale; }

    /// World-space extent along X
    [[nodiscard]] constexpr float world_width() const noexcept { return float(m_width) * m_scale; }

    /// World-space extent along Z
    [[nodiscard]] constexpr float world_depth() const noexcept { return float(m_height) * m_scale; }

    [[nodiscard]] ArrayView<float const> data() const noexcept { return terra::arrayView(m_data); }

private:

    std::size_t         m_width;
    std::size_t         m_height;
    float               m_scale;
    std::vector<float>  m_data;

}; // class HeightMap

/**
 * @brief Dense 2D grid of 4-channel texture blend weights, one pixel per grid cell
 *
 * Channels R, G, B, A are the weights of blend layers 0 to 3. Same row-major layout as
 * HeightMap: data[z*width + x].
 */
struct WeightMap
{
    using Pixel_t = Vector4ub;

    /**
     * @brief Construct a weight map with all weights zero
     *
     * @throws std::invalid_argument if width or height is zero
     */
    WeightMap(std::size_t width, std::size_t height);

    /**
     * @throws std::out_of_range if x >= width or z >= height
     */
    [[nodiscard]] Pixel_t get(std::size_t x, std::size_t z) const;

    /**
     * @throws std::out_of_range if x >= width or z >= height
     */
    void set(std::size_t x, std::size_t z, Pixel_t pixel);

    std::size_t             width;
    std::size_t             height;
    std::vector<Pixel_t>    data;
};

} // namespace terra::ground
