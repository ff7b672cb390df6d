#include "batch_partition.h"
#include "rearrange_digits.h"
#include <algorithm>
#include <benchmark/benchmark.h>
#include <functional>
#include <random>
#include <string>
#include <vector>

// Generate random digits 0-9
static std::vector<int> generate_random_digits(size_t size, unsigned seed = 42) {
    std::vector<int> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 9);
    for (auto& val : data) {
        val = dist(gen);
    }
    return data;
}

// Greedy placement after a comparison sort, for comparison with counting
static void sort_then_deal(std::vector<int>& digits, std::string& a, std::string& b) {
    std::sort(digits.begin(), digits.end(), std::greater<int>());
    a.clear();
    b.clear();
    for (size_t i = 0; i < digits.size(); ++i) {
        (i % 2 == 0 ? a : b).push_back(static_cast<char>('0' + digits[i]));
    }
}

static void BM_PartitionForMaxSum(benchmark::State& state) {
    const size_t size = state.range(0);
    auto digits = generate_random_digits(size);

    for (auto _ : state) {
        auto result = rearrange::partition_for_max_sum(digits);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * size);
}

static void BM_ReferenceMaxSum(benchmark::State& state) {
    const size_t size = state.range(0);
    auto digits = generate_random_digits(size);

    for (auto _ : state) {
        benchmark::DoNotOptimize(rearrange::reference_max_sum(digits));
    }

    state.SetItemsProcessed(state.iterations() * size);
}

// Counting sort placement on long inputs
static void BM_SplitDigits(benchmark::State& state) {
    const size_t size = state.range(0);
    auto digits = generate_random_digits(size);

    for (auto _ : state) {
        auto split = rearrange::split_digits(digits);
        benchmark::DoNotOptimize(split.first.data());
        benchmark::DoNotOptimize(split.second.data());
    }

    state.SetComplexityN(size);
    state.SetItemsProcessed(state.iterations() * size);
}

static void BM_StdSortSplit(benchmark::State& state) {
    const size_t size = state.range(0);
    auto original_data = generate_random_digits(size);
    std::string a, b;

    for (auto _ : state) {
        state.PauseTiming();
        auto data = original_data;
        state.ResumeTiming();

        sort_then_deal(data, a, b);

        benchmark::DoNotOptimize(a.data());
        benchmark::DoNotOptimize(b.data());
        benchmark::ClobberMemory();
    }

    state.SetComplexityN(size);
    state.SetItemsProcessed(state.iterations() * size);
}

static void BM_PartitionBatch(benchmark::State& state) {
    const size_t count = state.range(0);
    const int nthreads = state.range(1);
    std::vector<std::vector<int>> batch(count);
    for (size_t i = 0; i < count; ++i) {
        batch[i] = generate_random_digits(rearrange::kMaxIntegerDigits, static_cast<unsigned>(i));
    }

    for (auto _ : state) {
        auto results = rearrange::partition_batch(batch, nthreads);
        benchmark::DoNotOptimize(results.data());
        benchmark::ClobberMemory();
    }

    state.SetItemsProcessed(state.iterations() * count);
    state.SetLabel("threads=" + std::to_string(nthreads));
}

BENCHMARK(BM_PartitionForMaxSum)->Arg(2)->Arg(8)->Arg(18)->Arg(36);
BENCHMARK(BM_ReferenceMaxSum)->Arg(2)->Arg(8)->Arg(18)->Arg(36);

BENCHMARK(BM_SplitDigits)->RangeMultiplier(8)->Range(1 << 6, 1 << 21)->Complexity(benchmark::oN);
BENCHMARK(BM_StdSortSplit)->RangeMultiplier(8)->Range(1 << 6, 1 << 21)->Complexity(benchmark::oNLogN);

BENCHMARK(BM_PartitionBatch)->Args({1 << 16, 1});
BENCHMARK(BM_PartitionBatch)->Args({1 << 16, 2});
BENCHMARK(BM_PartitionBatch)->Args({1 << 16, 4});
BENCHMARK(BM_PartitionBatch)->Args({1 << 16, 8});

BENCHMARK_MAIN();
