#include <memory>
#include <random>
#include <vector>
#include <benchmark/benchmark.h>
#include "vpool/frame_scope.hpp"
#include "vpool/vector2_pool.hpp"

static constexpr auto VALUES_PER_FRAME{1000};

// A frame's worth of screen coordinate math using pooled
// vectors, reclaimed once at the end of the frame
static void BM_vector2_pool_frame(benchmark::State& state) {
	std::random_device dev;
	std::mt19937 rng(dev());
	std::uniform_real_distribution<double> coord(-500.0, 500.0);
	vpl::vector2_pool pool{VALUES_PER_FRAME};
	const vpl::vector2 camera{120.0, 80.0};
	double sum{0.0};
	for (auto _ : state) {
		auto frame = vpl::make_frame_scope(&pool);
		for (auto i = 0; i < VALUES_PER_FRAME; i++) {
			auto& v = pool.get(coord(rng), coord(rng));
			sum += v.subtract(camera).multiply(0.5).length();
		}
	}
	benchmark::DoNotOptimize(sum);
}
BENCHMARK(BM_vector2_pool_frame);

// Same frame with every value checked out and released
// through an RAII handle
static void BM_vector2_pool_checkout(benchmark::State& state) {
	std::random_device dev;
	std::mt19937 rng(dev());
	std::uniform_real_distribution<double> coord(-500.0, 500.0);
	vpl::vector2_pool pool{16};
	const vpl::vector2 camera{120.0, 80.0};
	double sum{0.0};
	for (auto _ : state) {
		for (auto i = 0; i < VALUES_PER_FRAME; i++) {
			auto v = pool.checkout(coord(rng), coord(rng));
			sum += v->subtract(camera).multiply(0.5).length();
		}
	}
	benchmark::DoNotOptimize(sum);
}
BENCHMARK(BM_vector2_pool_checkout);

// Baseline: a fresh heap allocation per value
static void BM_vector2_heap(benchmark::State& state) {
	std::random_device dev;
	std::mt19937 rng(dev());
	std::uniform_real_distribution<double> coord(-500.0, 500.0);
	const vpl::vector2 camera{120.0, 80.0};
	double sum{0.0};
	for (auto _ : state) {
		std::vector<std::unique_ptr<vpl::vector2>> frame;
		for (auto i = 0; i < VALUES_PER_FRAME; i++) {
			frame.push_back(std::make_unique<vpl::vector2>(coord(rng), coord(rng)));
			sum += frame.back()->subtract(camera).multiply(0.5).length();
		}
	}
	benchmark::DoNotOptimize(sum);
}
BENCHMARK(BM_vector2_heap);

BENCHMARK_MAIN();
