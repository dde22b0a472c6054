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

#include <cstddef>
#include <vector>

namespace terra
{

/**
 * @brief Wraps an std::vector intended to be accessed using a strong ID type
 */
template <typename ID_T, typename DATA_T, typename ALLOC_T = std::allocator<DATA_T>>
class KeyedVec : public std::vector<DATA_T, ALLOC_T>
{
    using vector_t  = std::vector<DATA_T, ALLOC_T>;

public:

    using reference                 = typename vector_t::reference;
    using const_reference           = typename vector_t::const_reference;

    reference operator[] (ID_T const id)
    {
        return vector_t::operator[](std::size_t(id));
    }

    const_reference operator[] (ID_T const id) const
    {
        return vector_t::operator[](std::size_t(id));
    }

}; // class KeyedVec

} // namespace terra
