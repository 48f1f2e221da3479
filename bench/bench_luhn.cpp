// bench/bench_luhn.cpp - Benchmarks for Luhn validation and check digit computation.

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <luhn/luhn.hpp>
#include <luhn/util/random.hpp>

namespace {

constexpr std::size_t SAMPLE_COUNT = 256;

std::vector<std::string> make_samples(std::uint64_t seed, std::size_t length, bool alphanumeric) {
    std::mt19937_64 rng(seed);
    std::vector<std::string> samples;
    samples.reserve(SAMPLE_COUNT);
    for (std::size_t index = 0; index < SAMPLE_COUNT; ++index) {
        samples.push_back(alphanumeric ? luhn::util::random_alnum(rng, length)
                                       : luhn::util::random_digits(rng, length));
    }
    return samples;
}

} // namespace

static void bench_validate(benchmark::State &state) {
    const std::string card = "4111111111111111";
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(luhn::validate(card));
    }
}

static void bench_checksum(benchmark::State &state) {
    const std::string payload = "111111118";
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(luhn::checksum(payload));
    }
}

static void bench_validate_length(benchmark::State &state) {
    const auto samples = make_samples(0x5eedc0de, static_cast<std::size_t>(state.range(0)), false);
    std::size_t cursor = 0;
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(luhn::validate(samples[cursor]));
        cursor = (cursor + 1) % samples.size();
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}

static void bench_checksum_alnum_length(benchmark::State &state) {
    const auto samples = make_samples(0x5eedc0df, static_cast<std::size_t>(state.range(0)), true);
    std::size_t cursor = 0;
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(luhn::checksum_alnum(samples[cursor]));
        cursor = (cursor + 1) % samples.size();
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}

static void bench_try_validate_malformed(benchmark::State &state) {
    const std::string malformed = "411111111111111a";
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(luhn::try_validate(malformed));
    }
}

BENCHMARK(bench_validate);
BENCHMARK(bench_checksum);
BENCHMARK(bench_validate_length)->RangeMultiplier(4)->Range(4, 4096);
BENCHMARK(bench_checksum_alnum_length)->RangeMultiplier(4)->Range(4, 4096);
BENCHMARK(bench_try_validate_malformed);

BENCHMARK_MAIN();
