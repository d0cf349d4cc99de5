// =============================================================================
// CNPJ Codec Performance Benchmarks
// =============================================================================
// This file contains performance benchmarks for validation, check digit
// computation and generation using Google Benchmark framework.
//
// Run with: ./cnpj_benchmarks --benchmark_format=console
// =============================================================================

#include <benchmark/benchmark.h>
#include "cnpj/cnpj.h"
#include <vector>
#include <string>

using namespace cnpj;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

// Pre-generated identifiers so the loop measures validation only
std::vector<std::string> createSamples(size_t count, bool alphanumeric, uint32_t seed = 42) {
    GeneratorConfig config;
    config.alphanumeric = alphanumeric;
    config.seed = seed;
    Generator generator(config);

    std::vector<std::string> samples;
    samples.reserve(count);
    for (size_t i = 0; i < count; i++) {
        samples.push_back(generator.generate());
    }
    return samples;
}

}  // namespace

// =============================================================================
// Check Digit Benchmarks
// =============================================================================

static void BM_ComputeCheckDigits_Numeric(benchmark::State& state) {
    const std::string body = "110144004848";

    for (auto _ : state) {
        auto result = computeCheckDigits(body);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComputeCheckDigits_Numeric);

static void BM_ComputeCheckDigits_Masked(benchmark::State& state) {
    const std::string body = "12.ABC.345/01DE";

    for (auto _ : state) {
        auto result = computeCheckDigits(body);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComputeCheckDigits_Masked);

// =============================================================================
// Validation Benchmarks
// =============================================================================

static void BM_ValidatePlain(benchmark::State& state) {
    auto samples = createSamples(256, true);
    size_t i = 0;

    for (auto _ : state) {
        bool valid = validate(samples[i++ % samples.size()]);
        benchmark::DoNotOptimize(valid);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidatePlain);

static void BM_ValidateMasked(benchmark::State& state) {
    auto samples = createSamples(256, true);
    for (auto& s : samples) {
        s = utils::applyMask(s);
    }
    size_t i = 0;

    for (auto _ : state) {
        bool valid = validate(samples[i++ % samples.size()]);
        benchmark::DoNotOptimize(valid);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateMasked);

static void BM_ValidateRejectDisallowed(benchmark::State& state) {
    const std::string input = "AB#12345678901";

    for (auto _ : state) {
        bool valid = validate(input);
        benchmark::DoNotOptimize(valid);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateRejectDisallowed);

static void BM_ValidateDetailed(benchmark::State& state) {
    auto samples = createSamples(256, false);
    size_t i = 0;

    for (auto _ : state) {
        auto result = validateDetailed(samples[i++ % samples.size()]);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateDetailed);

// =============================================================================
// Generation Benchmarks
// =============================================================================

static void BM_GenerateNumeric(benchmark::State& state) {
    GeneratorConfig config;
    config.alphanumeric = false;
    config.seed = 7;
    Generator generator(config);

    for (auto _ : state) {
        auto id = generator.generate();
        benchmark::DoNotOptimize(id);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateNumeric);

static void BM_GenerateAlphanumeric(benchmark::State& state) {
    GeneratorConfig config;
    config.seed = 7;
    Generator generator(config);

    for (auto _ : state) {
        auto id = generator.generate();
        benchmark::DoNotOptimize(id);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateAlphanumeric);

static void BM_GenerateThreadLocal(benchmark::State& state) {
    for (auto _ : state) {
        auto id = generate();
        benchmark::DoNotOptimize(id);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateThreadLocal)->Threads(1)->Threads(4);

// =============================================================================
// Main
// =============================================================================

BENCHMARK_MAIN();
