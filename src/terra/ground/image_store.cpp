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
#include "image_store.h"

#include <longeron/utility/asserts.hpp>

using Magnum::Trade::ImageData2D;

namespace terra::ground
{

ImageId ImageStore::create()
{
    ImageId const id = m_ids.create();
    m_data.resize(m_ids.capacity());
    return id;
}

void ImageStore::remove(ImageId const id)
{
    LGRN_ASSERTM(exists(id), "Removing Image Id that doesn't exist");
    m_data[id].reset();
    m_ids.remove(id);
}

bool ImageStore::exists(ImageId const id) const noexcept
{
    return id.has_value() && std::size_t(id) < m_ids.capacity() && m_ids.exists(id);
}

ImageData2D& ImageStore::data_emplace(ImageId const id, ImageData2D &&image)
{
    LGRN_ASSERTM(exists(id), "Image Id must be created before assigning data");
    std::unique_ptr<ImageData2D> &rPtr = m_data[id];
    rPtr = std::make_unique<ImageData2D>(std::move(image));
    return *rPtr;
}

ImageData2D* ImageStore::data_try_get(ImageId const id) noexcept
{
    return exists(id) ? m_data[id].get() : nullptr;
}

ImageData2D const* ImageStore::data_try_get(ImageId const id) const noexcept
{
    return exists(id) ? m_data[id].get() : nullptr;
}

} // namespace terra::ground
