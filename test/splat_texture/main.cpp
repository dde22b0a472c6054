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
#include <terra/ground/splat.h>

#include <Corrade/Containers/Array.h>

#include <Magnum/PixelFormat.h>
#include <Magnum/Sampler.h>

#include <gtest/gtest.h>

#include <cstring>

using namespace terra;
using namespace terra::ground;

using Corrade::Containers::Array;
using Magnum::PixelFormat;
using Magnum::UnsignedByte;
using Magnum::Trade::ImageData2D;

namespace
{

UnsignedByte byte_at(ArrayView<char const> data, std::size_t const i)
{
    return UnsignedByte(data[i]);
}

// Each pixel gets a distinct value per channel
WeightMap make_pattern(std::size_t const w, std::size_t const h)
{
    WeightMap map{w, h};
    for (std::size_t z = 0; z < h; ++z)
    {
        for (std::size_t x = 0; x < w; ++x)
        {
            auto const base = UnsignedByte((z * w + x) * 4);
            map.set(x, z, {base, UnsignedByte(base + 1), UnsignedByte(base + 2), UnsignedByte(base + 3)});
        }
    }
    return map;
}

ImageData2D make_placeholder_image()
{
    return ImageData2D{PixelFormat::RGBA8Unorm, {1, 1}, Array<char>{Corrade::ValueInit, 4}};
}

} // namespace

TEST(SplatTexture, ImageHasMapDimensions)
{
    ImageData2D const image = splat_to_image(WeightMap{16, 32});

    EXPECT_EQ(image.size().x(), 16);
    EXPECT_EQ(image.size().y(), 32);
    EXPECT_EQ(image.format(), PixelFormat::RGBA8Unorm);
    EXPECT_EQ(image.data().size(), 16u * 32u * 4u);
}

TEST(SplatTexture, PackedLength)
{
    Array<char> const packed = pack_weight_map(WeightMap{8, 8});
    EXPECT_EQ(packed.size(), 8u * 8u * 4u);
}

TEST(SplatTexture, PixelValuesPreserved)
{
    WeightMap map{4, 4};
    map.set(0, 0, {10, 20, 30, 40});
    map.set(1, 1, {100, 150, 200, 250});

    ImageData2D const image = splat_to_image(map);
    ArrayView<char const> const data = image.data();

    // Pixel (0, 0)
    EXPECT_EQ(byte_at(data, 0), 10);
    EXPECT_EQ(byte_at(data, 1), 20);
    EXPECT_EQ(byte_at(data, 2), 30);
    EXPECT_EQ(byte_at(data, 3), 40);

    // Pixel (1, 1) is pixel index 1*4+1 = 5
    EXPECT_EQ(byte_at(data, 5*4 + 0), 100);
    EXPECT_EQ(byte_at(data, 5*4 + 1), 150);
    EXPECT_EQ(byte_at(data, 5*4 + 2), 200);
    EXPECT_EQ(byte_at(data, 5*4 + 3), 250);

    // Untouched pixels stay zero
    EXPECT_EQ(byte_at(data, 4), 0);
    EXPECT_EQ(byte_at(data, 15*4 + 3), 0);
}

TEST(SplatTexture, RowMajorLayout)
{
    // Non-square to catch swapped axes
    WeightMap const map = make_pattern(5, 3);
    Array<char> const packed = pack_weight_map(map);

    ASSERT_EQ(packed.size(), 5u * 3u * 4u);
    for (std::size_t i = 0; i < packed.size(); ++i)
    {
        EXPECT_EQ(byte_at(packed, i), UnsignedByte(i));
    }

    // Pixel (x=3, z=2)
    WeightMap::Pixel_t const pixel = map.get(3, 2);
    std::size_t const offset = (2 * 5 + 3) * 4;
    for (std::size_t c = 0; c < 4; ++c)
    {
        EXPECT_EQ(byte_at(packed, offset + c), pixel[c]);
    }
}

TEST(SplatTexture, TextureRepeats)
{
    Magnum::Trade::TextureData const texture = splat_texture_data(7);

    EXPECT_EQ(texture.type(), Magnum::Trade::TextureType::Texture2D);
    EXPECT_EQ(texture.wrapping().x(), Magnum::SamplerWrapping::Repeat);
    EXPECT_EQ(texture.wrapping().y(), Magnum::SamplerWrapping::Repeat);
    EXPECT_EQ(texture.wrapping().z(), Magnum::SamplerWrapping::Repeat);
    EXPECT_EQ(texture.image(), 7u);
}

TEST(ImageStore, CreateEmplaceRemove)
{
    ImageStore images;

    ImageId const a = images.create();
    ImageId const b = images.create();

    EXPECT_NE(a, b);
    EXPECT_TRUE(images.exists(a));
    EXPECT_TRUE(images.exists(b));
    EXPECT_FALSE(images.exists(ImageId{}));

    // Created but not ready
    EXPECT_EQ(images.data_try_get(a), nullptr);

    images.data_emplace(a, make_placeholder_image());
    ASSERT_NE(images.data_try_get(a), nullptr);
    EXPECT_EQ(images.data_try_get(a)->size().x(), 1);
    EXPECT_EQ(images.data_try_get(b), nullptr);

    images.remove(a);
    EXPECT_FALSE(images.exists(a));
    EXPECT_EQ(images.data_try_get(a), nullptr);
    EXPECT_TRUE(images.exists(b));
}

TEST(SplatSync, NotReadyKeepsDirty)
{
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    GroundMaterialSettings settings{ .weightMap = make_pattern(4, 4) };

    ASSERT_TRUE(settings.dirty);

    EXPECT_FALSE(sync_splat_texture(settings, splat, images));
    EXPECT_TRUE(settings.dirty);

    // Image becomes ready later; the pending upload goes through
    images.data_emplace(splat.image, splat_to_image(WeightMap{4, 4}));

    EXPECT_TRUE(sync_splat_texture(settings, splat, images));
    EXPECT_FALSE(settings.dirty);
}

TEST(SplatSync, UploadsWhenDirty)
{
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    images.data_emplace(splat.image, splat_to_image(WeightMap{4, 4}));

    GroundMaterialSettings settings{ .weightMap = make_pattern(4, 4) };

    EXPECT_TRUE(sync_splat_texture(settings, splat, images));
    EXPECT_FALSE(settings.dirty);

    ImageData2D const *pImage = images.data_try_get(splat.image);
    ASSERT_NE(pImage, nullptr);

    Array<char> const expected = pack_weight_map(settings.weightMap);
    ASSERT_EQ(pImage->data().size(), expected.size());
    EXPECT_EQ(std::memcmp(pImage->data().data(), expected.data(), expected.size()), 0);
}

TEST(SplatSync, CleanIsNoOp)
{
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    images.data_emplace(splat.image, splat_to_image(WeightMap{2, 2}));

    GroundMaterialSettings settings{ .weightMap = WeightMap{2, 2} };

    ASSERT_TRUE(sync_splat_texture(settings, splat, images));
    EXPECT_FALSE(sync_splat_texture(settings, splat, images));

    // Changes without mark_dirty() aren't uploaded
    settings.weightMap.set(1, 0, {255, 255, 255, 255});
    EXPECT_FALSE(sync_splat_texture(settings, splat, images));
    EXPECT_EQ(byte_at(images.data_try_get(splat.image)->data(), 4), 0);

    settings.mark_dirty();
    EXPECT_TRUE(sync_splat_texture(settings, splat, images));
    EXPECT_EQ(byte_at(images.data_try_get(splat.image)->data(), 4), 255);
}

TEST(SplatSync, ResizesImage)
{
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    images.data_emplace(splat.image, make_placeholder_image());

    GroundMaterialSettings settings{ .weightMap = make_pattern(6, 3) };

    EXPECT_TRUE(sync_splat_texture(settings, splat, images));

    ImageData2D const *pImage = images.data_try_get(splat.image);
    ASSERT_NE(pImage, nullptr);
    EXPECT_EQ(pImage->size().x(), 6);
    EXPECT_EQ(pImage->size().y(), 3);
    EXPECT_EQ(pImage->format(), PixelFormat::RGBA8Unorm);
    EXPECT_EQ(pImage->data().size(), 6u * 3u * 4u);
    EXPECT_EQ(byte_at(pImage->data(), 17), 17);
}

TEST(SplatSync, RemovedImageIsSkipped)
{
    ImageStore images;
    SplatTexture const splat{ .image = images.create() };
    images.data_emplace(splat.image, make_placeholder_image());
    images.remove(splat.image);

    GroundMaterialSettings settings{ .weightMap = WeightMap{2, 2} };

    EXPECT_FALSE(sync_splat_texture(settings, splat, images));
    EXPECT_TRUE(settings.dirty);
}

TEST(SplatTexture, MismatchedWeightMapAsserts)
{
    #ifdef NDEBUG
        GTEST_SKIP(); // following death tests use asserts
    #endif

    // Public members can be edited out of sync with each other
    EXPECT_DEATH({
        WeightMap map{4, 4};
        map.data.resize(3);
        (void)pack_weight_map(map);
    }, "");

    EXPECT_DEATH({
        WeightMap map{4, 4};
        map.width = 8;
        (void)splat_to_image(map);
    }, "");
}
