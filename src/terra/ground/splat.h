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
 * @brief WeightMap (splat map) to GPU texture conversion and sync
 */
#pragma once

#include "heightmap.h"
#include "image_store.h"

#include <Corrade/Containers/Array.h>

#include <Magnum/Trade/ImageData.h>
#include <Magnum/Trade/TextureData.h>

namespace terra::ground
{

/**
 * @brief Flatten a WeightMap into a tightly packed RGBA8 byte buffer
 *
 * Byte 4*(z*width + x) + c is channel c of pixel (x, z). R, G, B, A map directly to blend layer
 * weights 0 to 3. No compression, mipmaps, or color-space conversion.
 *
 * @return Buffer of width*height*4 bytes
 */
[[nodiscard]] Corrade::Containers::Array<char> pack_weight_map(WeightMap const &weightMap);

/**
 * @brief Convert a WeightMap into an RGBA8Unorm image of the same dimensions
 */
[[nodiscard]] Magnum::Trade::ImageData2D splat_to_image(WeightMap const &weightMap);

/**
 * @brief Describe how a splat texture is sampled
 *
 * Repeat wrapping on all axes, so adjacent terrain patches tile seamlessly when sampled with
 * world-space UVs.
 *
 * @param image [in] Index of the image the texture refers to
 */
[[nodiscard]] Magnum::Trade::TextureData splat_texture_data(Magnum::UnsignedInt image);

/**
 * @brief The current WeightMap of a terrain surface, and whether it has changed
 *
 * Modify weightMap and call mark_dirty() to have the next sync_splat_texture call re-upload it.
 * Starts dirty, so the first sync uploads the initial data.
 *
 * Intended to be modified and synced from a single update phase (once per frame); this struct
 * does no locking of its own.
 */
struct GroundMaterialSettings
{
    void mark_dirty() noexcept { dirty = true; }

    WeightMap   weightMap;
    bool        dirty{true};
};

/**
 * @brief Handle to the GPU-side splat texture image
 */
struct SplatTexture
{
    ImageId image;
};

/**
 * @brief Re-upload the splat texture if GroundMaterialSettings is marked dirty
 *
 * Does nothing if not dirty, so this is cheap enough to call every frame. If the destination
 * image isn't ready yet (no data in rImages), nothing happens and the dirty flag is kept, so the
 * upload is retried on the next call.
 *
 * If the WeightMap dimensions differ from the image, the image is replaced with one of the new
 * size. Otherwise, the existing image's pixels are overwritten.
 *
 * @return true if the texture was re-uploaded
 */
bool sync_splat_texture(
        GroundMaterialSettings          &rSettings,
        SplatTexture              const &splatTexture,
        ImageStore                      &rImages);

} // namespace terra::ground
