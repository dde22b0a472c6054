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
 * @brief Storage for images owned by the rendering side, addressed by ImageId
 */
#pragma once

#include <terra/core/copymove_macros.h>
#include <terra/core/keyed_vector.h>
#include <terra/core/strong_id.h>

#include <Magnum/Trade/ImageData.h>

#include <longeron/id_management/registry_stl.hpp>

#include <cstdint>
#include <memory>

namespace terra::ground
{

using ImageId = StrongId<std::uint32_t, struct DummyForImageId>;

/**
 * @brief Owns GPU-uploadable images
 *
 * An ImageId can be created before any image data is assigned to it. Until data_emplace is
 * called, the image is considered not ready: data_try_get returns nullptr, and users such as
 * sync_splat_texture are expected to try again later.
 */
class ImageStore
{
public:

    ImageStore() = default;
    TERRA_MOVE_ONLY_CTOR_ASSIGN(ImageStore);

    /**
     * @brief Create a new Image Id with no image data
     */
    [[nodiscard]] ImageId create();

    /**
     * @brief Delete an Image Id and its data
     */
    void remove(ImageId id);

    [[nodiscard]] bool exists(ImageId id) const noexcept;

    /**
     * @brief Assign image data to an Image Id, replacing any existing data
     *
     * @return Reference to the stored image
     */
    Magnum::Trade::ImageData2D& data_emplace(ImageId id, Magnum::Trade::ImageData2D &&image);

    /**
     * @return Pointer to image data, nullptr if the Id doesn't exist or has no data yet
     */
    [[nodiscard]] Magnum::Trade::ImageData2D*       data_try_get(ImageId id) noexcept;

    /**
     * @copydoc ImageStore::data_try_get(ImageId)
     */
    [[nodiscard]] Magnum::Trade::ImageData2D const* data_try_get(ImageId id) const noexcept;

private:

    lgrn::IdRegistryStl<ImageId>                                        m_ids;
    KeyedVec<ImageId, std::unique_ptr<Magnum::Trade::ImageData2D>>      m_data;

}; // class ImageStore

} // namespace terra::ground
