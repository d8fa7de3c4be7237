/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "binomkit/math/combinatorics.hpp"
#include "binomkit/stats/Binomial.hpp"

#include <memory>

//-------------------------------------------------------------------------

using namespace binomkit;

//-------------------------------------------------------------------------

struct BinomialFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto kTrials = static_cast<Count>(state.range(0));
        const double kSuccessProbability = static_cast<double>(state.range(1)) / 100.0;
        binomial = std::make_unique<stats::Binomial>(kTrials, kSuccessProbability);
    }

    void TearDown(benchmark::State&) override { binomial.reset(); }

    std::unique_ptr<stats::Binomial> binomial;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(BinomialFixture, Distribution)(benchmark::State& state)
{
    for (auto _ : state) {
        benchmark::DoNotOptimize(binomial->distribution());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK_REGISTER_F(BinomialFixture, Distribution)
    ->ArgsProduct({benchmark::CreateRange(8, 4096, 4), {30, 50}})
    ->Complexity();

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(BinomialFixture, CumulativeMedian)(benchmark::State& state)
{
    const Count median = binomial->trials() / 2;
    for (auto _ : state) {
        benchmark::DoNotOptimize(binomial->cumulative(median));
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK_REGISTER_F(BinomialFixture, CumulativeMedian)
    ->ArgsProduct({benchmark::CreateRange(8, 4096, 4), {50}})
    ->Complexity();

//-------------------------------------------------------------------------

static void BM_LogCombinations(benchmark::State& state)
{
    const auto n = static_cast<Count>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(math::logCombinations(n, n / 2));
    }
}
BENCHMARK(BM_LogCombinations)->RangeMultiplier(4)->Range(16, 16384);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}

//-------------------------------------------------------------------------
