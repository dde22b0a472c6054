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
#include <terra/ground/mesh_builder.h>

#include <benchmark/benchmark.h>

#include <cmath>

using namespace terra;
using namespace terra::ground;

namespace
{

HeightMap make_sine_field(std::size_t const size)
{
    HeightMap map{size, size, 1.0f};
    for (std::size_t z = 0; z < size; ++z)
    {
        for (std::size_t x = 0; x < size; ++x)
        {
            map.set(x, z, std::sin(float(x + z) * 0.1f));
        }
    }
    return map;
}

void run_build_heightmap_mesh(benchmark::State &rState, ENormalMethod const method)
{
    HeightMap const map = make_sine_field(std::size_t(rState.range(0)));
    HeightMeshConfig const config{ .uvTileSize = 4.0f, .normalMethod = method };

    for (auto _ : rState)
    {
        Magnum::Trade::MeshData mesh = build_heightmap_mesh(map, config);
        benchmark::DoNotOptimize(mesh.vertexData().data());
        benchmark::ClobberMemory();
    }

    rState.SetItemsProcessed(rState.iterations() * rState.range(0) * rState.range(0));
}

void bench_mesh_area_weighted(benchmark::State &rState)
{
    run_build_heightmap_mesh(rState, ENormalMethod::AreaWeighted);
}

void bench_mesh_sobel(benchmark::State &rState)
{
    run_build_heightmap_mesh(rState, ENormalMethod::Sobel);
}

} // namespace

BENCHMARK(bench_mesh_area_weighted)->Arg(128)->Arg(512);
BENCHMARK(bench_mesh_sobel)->Arg(128)->Arg(512);

BENCHMARK_MAIN();
