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
#pragma once

#include <Corrade/Containers/ArrayView.h>
#include <Corrade/Containers/StridedArrayView.h>

#include <cstddef>

namespace terra
{

/**
 * @brief Buffer Attribute Format. Describes how to access element attribute data within a buffer.
 *
 * Vertex buffers handed to Magnum::Trade::MeshData are plain char arrays; positions, normals and
 * texture coordinates are placed within them according to these formats.
 */
template <typename T>
struct BufAttribFormat
{
    using View_t        = Corrade::Containers::StridedArrayView1D<T>;
    using Data_t        = Corrade::Containers::ArrayView<char>;

    View_t view(Data_t data, std::size_t count) const noexcept
    {
        return View_t{data, reinterpret_cast<T*>(data.data() + offset), count, stride};
    }

    std::size_t     offset{};
    std::ptrdiff_t  stride{};
};

/**
 * @brief Builder to more easily create BufAttribFormats
 */
class BufferFormatBuilder
{
public:

    /**
     * @brief Insert a single contiguous block of attribute data
     *
     * To make the buffer format [PPPP... NNNN... UUUU...] for example, use:
     *
     * @code{.cpp}
     * builder.insert_block<Vector3>(count); // Positions
     * builder.insert_block<Vector3>(count); // Normals
     * builder.insert_block<Vector2>(count); // UVs
     * @endcode
     *
     * @param count [in] Number of elements
     */
    template <typename T>
    constexpr BufAttribFormat<T> insert_block(std::size_t const count)
    {
        auto const prevbytesUsed = m_totalSize;
        m_totalSize += sizeof(T) * count;

        return { .offset = prevbytesUsed, .stride = sizeof(T) };
    }

    constexpr std::size_t total_size() const noexcept
    {
        return m_totalSize;
    }

private:

    std::size_t m_totalSize{0};
};

} // namespace terra
