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

// IWYU pragma: begin_exports
#include <Corrade/Containers/ArrayView.h>
#include <Corrade/Containers/StridedArrayView.h>
#include <Corrade/Containers/StridedArrayViewStl.h>
// IWYU pragma: end_exports

namespace terra
{

using Corrade::Containers::ArrayView;
using Corrade::Containers::StridedArrayView1D;
using Corrade::Containers::arrayView;

using Corrade::Containers::arrayCast;

/**
 * @brief Wraps a Corrade ArrayView to use as a 2D array of equally sized rows
 *
 * Grids in this project are row-major along Z, so a row is one line of constant Z.
 */
template<typename T>
struct ArrayView2DWrapper
{
    constexpr T row(std::size_t const rowIndex) const noexcept
    {
        return view.sliceSize(rowIndex * rowSize, rowSize);
    }

    T view;
    std::size_t rowSize; ///< Size of each row, same as the number of columns
};

/**
 * @brief Returns an interface that treats an ArrayView as a 2D array of equally sized rows.
 *
 * This overload auto-converts ArrayView-compatible types.
 */
template<typename T>
    requires requires (T &view) { terra::arrayView(view); }
constexpr decltype(auto) as_2d(T &view, std::size_t rowSize) noexcept
{
    return ArrayView2DWrapper<decltype(terra::arrayView(view))>{ .view = terra::arrayView(view), .rowSize = rowSize };
}

/**
 * @brief Returns an interface that treats an ArrayView as a 2D array of equally sized rows.
 */
template<typename T>
constexpr ArrayView2DWrapper< ArrayView<T> > as_2d(ArrayView<T> view, std::size_t rowSize) noexcept
{
    return { .view = view, .rowSize = rowSize };
}

/**
 * @brief Returns an interface that treats a StridedArrayView1D as a 2D array of equally sized rows.
 */
template<typename T>
constexpr ArrayView2DWrapper< StridedArrayView1D<T> >
        as_2d(StridedArrayView1D<T> view, std::size_t rowSize) noexcept
{
    return { .view = view, .rowSize = rowSize };
}

} // namespace terra
