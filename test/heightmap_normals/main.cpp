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
#include <terra/ground/normals.h>

#include <Corrade/Containers/ArrayViewStl.h>

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <vector>

using namespace terra;
using namespace terra::ground;

using Magnum::UnsignedInt;

namespace
{

HeightMap ramp_x(std::size_t const w, std::size_t const h, float const scale)
{
    HeightMap map{w, h, scale};
    for (std::size_t z = 0; z < h; ++z)
    {
        for (std::size_t x = 0; x < w; ++x)
        {
            map.set(x, z, float(x) * scale);
        }
    }
    return map;
}

void expect_near(Vector3 const a, Vector3 const b, float const tolerance)
{
    EXPECT_NEAR(a.x(), b.x(), tolerance);
    EXPECT_NEAR(a.y(), b.y(), tolerance);
    EXPECT_NEAR(a.z(), b.z(), tolerance);
}

} // namespace

TEST(AreaWeightedNormals, LargerFacesContributeMore)
{
    std::array<Vector3, 5> const positions
    {{
        { 0.0f, 0.0f,  0.0f},
        { 0.0f, 0.0f, 10.0f},
        {10.0f, 0.0f,  0.0f},
        { 1.0f, 0.0f,  0.0f},
        { 0.0f, 1.0f,  0.0f}
    }};

    // Large face is horizontal (+Y, area 50), small face is vertical (+Z, area 0.5)
    std::array<UnsignedInt, 6> const indices{0, 1, 2, 0, 3, 4};

    std::array<Vector3, 5> normals;
    calc_normals_area_weighted(arrayView(positions), arrayView(indices), arrayView(normals));

    EXPECT_GT(normals[0].y(), 0.999f);
    EXPECT_GT(normals[0].z(), 0.0f);
    EXPECT_LT(normals[0].z(), 0.02f);

    expect_near(normals[1], {0.0f, 1.0f, 0.0f}, 1e-6f);
    expect_near(normals[3], {0.0f, 0.0f, 1.0f}, 1e-6f);
}

TEST(AreaWeightedNormals, DegenerateFallsBackToUp)
{
    std::array<Vector3, 4> const positions
    {{
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {2.0f, 0.0f, 0.0f}, // collinear with the first two
        {5.0f, 5.0f, 5.0f}  // not used by any face
    }};
    std::array<UnsignedInt, 3> const indices{0, 1, 2};

    std::array<Vector3, 4> normals;
    normals.fill({9.0f, 9.0f, 9.0f});
    calc_normals_area_weighted(arrayView(positions), arrayView(indices), arrayView(normals));

    for (Vector3 const normal : normals)
    {
        EXPECT_EQ(normal, gc_defaultNormal);
    }
}

TEST(AreaWeightedNormals, OppositeFacesCancel)
{
    std::array<Vector3, 3> const positions
    {{
        {0.0f, 0.0f, 0.0f},
        {0.0f, 0.0f, 1.0f},
        {1.0f, 0.0f, 0.0f}
    }};

    // Same triangle twice with opposite winding
    std::array<UnsignedInt, 6> const indices{0, 1, 2, 0, 2, 1};

    std::array<Vector3, 3> normals;
    calc_normals_area_weighted(arrayView(positions), arrayView(indices), arrayView(normals));

    for (Vector3 const normal : normals)
    {
        EXPECT_EQ(normal, gc_defaultNormal);
    }
}

TEST(AreaWeightedNormals, FaceOrderIndependent)
{
    // Bumpy 3x3 grid
    std::vector<Vector3> positions;
    float const heights[9] = {0.0f, 1.0f, 0.5f, 2.0f, 3.0f, 0.0f, 1.5f, 0.25f, 4.0f};
    for (int z = 0; z < 3; ++z)
    {
        for (int x = 0; x < 3; ++x)
        {
            positions.emplace_back(float(x), heights[z*3 + x], float(z));
        }
    }

    std::vector<UnsignedInt> const forward
    {
        0, 3, 1,  1, 3, 4,  1, 4, 2,  2, 4, 5,
        3, 6, 4,  4, 6, 7,  4, 7, 5,  5, 7, 8
    };
    std::vector<UnsignedInt> backward;
    for (std::size_t i = forward.size(); i != 0; i -= 3)
    {
        backward.insert(backward.end(), forward.begin() + (i - 3), forward.begin() + i);
    }

    std::vector<Vector3> normalsA(9);
    std::vector<Vector3> normalsB(9);
    calc_normals_area_weighted(arrayView(positions), arrayView(forward),  arrayView(normalsA));
    calc_normals_area_weighted(arrayView(positions), arrayView(backward), arrayView(normalsB));

    for (std::size_t i = 0; i < 9; ++i)
    {
        expect_near(normalsA[i], normalsB[i], 1e-6f);
        EXPECT_NEAR(normalsA[i].length(), 1.0f, 1e-5f);
    }
}

TEST(SobelNormals, FlatPointsUp)
{
    HeightMap map{5, 4, 3.0f};
    for (std::size_t z = 0; z < 4; ++z)
    {
        for (std::size_t x = 0; x < 5; ++x)
        {
            map.set(x, z, 12.0f);
        }
    }

    std::vector<Vector3> normals(5 * 4);
    calc_normals_sobel(map, arrayView(normals));

    for (Vector3 const normal : normals)
    {
        expect_near(normal, {0.0f, 1.0f, 0.0f}, 1e-6f);
    }
}

TEST(SobelNormals, EdgesAreClamped)
{
    // 2x2 ramp along X: every neighborhood is clamped on at least one side
    HeightMap const map{2, 2, 1.0f, std::vector<float>{0.0f, 1.0f, 0.0f, 1.0f}};

    std::vector<Vector3> normals(4);
    calc_normals_sobel(map, arrayView(normals));

    // Each kernel row sees h(1) - h(0) = 1, so gx = 1+2+1 = 4 and gz = 0
    Vector3 const expected = Vector3{-4.0f, 8.0f, 0.0f}.normalized();
    for (Vector3 const normal : normals)
    {
        expect_near(normal, expected, 1e-6f);
    }
}

TEST(SobelNormals, RampAlongZ)
{
    HeightMap map{4, 4, 1.0f};
    for (std::size_t z = 0; z < 4; ++z)
    {
        for (std::size_t x = 0; x < 4; ++x)
        {
            map.set(x, z, 2.0f * float(z));
        }
    }

    std::vector<Vector3> normals(16);
    calc_normals_sobel(map, arrayView(normals));

    // Interior: gz = (1+2+1) * (h(z+1) - h(z-1)) = 4 * 4 = 16
    expect_near(normals[1*4 + 1], Vector3{0.0f, 8.0f, -16.0f}.normalized(), 1e-6f);
    expect_near(normals[2*4 + 2], Vector3{0.0f, 8.0f, -16.0f}.normalized(), 1e-6f);
}

TEST(SobelNormals, UnitLength)
{
    HeightMap map{7, 5, 0.75f};
    for (std::size_t z = 0; z < 5; ++z)
    {
        for (std::size_t x = 0; x < 7; ++x)
        {
            map.set(x, z, std::sin(float(x)) * 3.0f + std::cos(float(z) * 2.0f));
        }
    }

    std::vector<Vector3> normals(7 * 5);
    calc_normals_sobel(map, arrayView(normals));

    for (Vector3 const normal : normals)
    {
        EXPECT_NEAR(normal.length(), 1.0f, 1e-5f);
        EXPECT_GT(normal.y(), 0.0f);
    }
}

TEST(Normals, MethodsAgreeOnPlanarSlope)
{
    HeightMap const map = ramp_x(6, 6, 2.0f);

    std::vector<Vector3> positions;
    for (std::size_t z = 0; z < 6; ++z)
    {
        for (std::size_t x = 0; x < 6; ++x)
        {
            positions.emplace_back(float(x) * 2.0f, map.get(x, z), float(z) * 2.0f);
        }
    }

    std::vector<UnsignedInt> indices;
    for (UnsignedInt z = 0; z < 5; ++z)
    {
        for (UnsignedInt x = 0; x < 5; ++x)
        {
            UnsignedInt const tl = z*6 + x;
            UnsignedInt const tr = tl + 1;
            UnsignedInt const bl = tl + 6;
            UnsignedInt const br = bl + 1;
            indices.insert(indices.end(), {tl, bl, tr, tr, bl, br});
        }
    }

    std::vector<Vector3> area(36);
    std::vector<Vector3> sobel(36);
    calc_normals(ENormalMethod::AreaWeighted, map, arrayView(positions), arrayView(indices), arrayView(area));
    calc_normals(ENormalMethod::Sobel,        map, arrayView(positions), arrayView(indices), arrayView(sobel));

    // Surface is the plane y = X, normal is (-1, 1, 0) normalized
    Vector3 const expected = Vector3{-1.0f, 1.0f, 0.0f}.normalized();
    for (std::size_t z = 1; z < 5; ++z)
    {
        for (std::size_t x = 1; x < 5; ++x)
        {
            expect_near(area [z*6 + x], expected, 1e-5f);
            expect_near(sobel[z*6 + x], expected, 1e-5f);
        }
    }
}
