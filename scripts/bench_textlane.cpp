/**
 *  @brief   Throughput benchmarks for the case conversion and UTF-8 analysis backends.
 *  @file    bench_textlane.cpp
 *
 *  Every backend compiled into this binary is registered against every dataset. Backends the CPU can't run
 *  are reported as skipped. The libc `toupper` and `tolower` loops serve as a baseline for case conversions.
 *
 *  @code{.sh}
 *  TL_BENCH_BYTES=16777216 ./build_release/textlane_bench --benchmark_filter=utf8
 *  @endcode
 */
#include <cctype>  // `std::toupper`, `std::tolower`
#include <cstdlib> // `std::getenv`, `std::strtoull`
#include <random>  // `std::mt19937`
#include <string>  // `std::string`
#include <vector>  // `std::vector`

#include <benchmark/benchmark.h>

#include <textlane/textlane.h>

namespace bm = benchmark;

constexpr double default_secs_k = 1;
constexpr std::size_t default_bytes_k = 1 << 24; // 16 MB per dataset

struct dataset_t {
    char const *name;
    std::string text;
};

static std::vector<dataset_t> datasets;

/** @brief Dataset size, overridable with the `TL_BENCH_BYTES` environment variable. */
static std::size_t dataset_bytes() {
    char const *env = std::getenv("TL_BENCH_BYTES");
    if (env && env[0] != '\0') {
        std::size_t parsed = std::strtoull(env, nullptr, 10);
        if (parsed) return parsed;
    }
    return default_bytes_k;
}

static std::string sample(std::mt19937 &rng, std::size_t bytes, std::vector<std::string> const &alphabet) {
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
    std::string result;
    result.reserve(bytes + 4);
    while (result.size() < bytes) result += alphabet[pick(rng)];
    return result;
}

static void fill_datasets() {
    std::mt19937 rng(42);
    std::size_t const bytes = dataset_bytes();

    std::vector<std::string> lower, upper, mixed, ascii;
    for (char c = 'a'; c <= 'z'; ++c) lower.push_back(std::string(1, c));
    for (char c = 'A'; c <= 'Z'; ++c) upper.push_back(std::string(1, c));
    mixed = lower, mixed.insert(mixed.end(), upper.begin(), upper.end());
    for (char c = ' '; c <= '~'; ++c) ascii.push_back(std::string(1, c));
    ascii.push_back("\n");

    // Mostly Latin, with a share of Cyrillic, CJK, and emoji
    std::vector<std::string> multilingual = ascii;
    for (char const *rune : {"\xC3\xA9", "\xC3\xBC", "\xD0\x96", "\xD0\xBF", "\xE4\xB8\x96", "\xE7\x95\x8C",
                             "\xE3\x81\x82", "\xF0\x9F\x94\xA5", "\xF0\x9F\x98\x80"})
        multilingual.push_back(rune);

    datasets.push_back({"mixed_case", sample(rng, bytes, mixed)});
    datasets.push_back({"all_lower", sample(rng, bytes, lower)});
    datasets.push_back({"all_upper", sample(rng, bytes, upper)});
    datasets.push_back({"ascii_text", sample(rng, bytes, ascii)});
    datasets.push_back({"multilingual", sample(rng, bytes, multilingual)});
}

static void report_bytes(bm::State &state, std::size_t bytes) {
    if (state.thread_index() == 0) {
        std::size_t bytes_scanned = state.iterations() * bytes * state.threads();
        state.counters["bytes/s"] = bm::Counter(static_cast<double>(bytes_scanned), bm::Counter::kIsRate);
    }
}

static bool supported(bm::State &state, tl_capability_t cap) {
    if (cap == tl_caps_none_k || (tl_capabilities() & cap)) return true;
    state.SkipWithError("Unsupported by this CPU");
    return false;
}

/** @brief In-place conversion of a private copy, restored from the dataset before every pass. */
static void transform(bm::State &state, dataset_t const *dataset, tl_capability_t cap, tl_transform_t function) {
    if (!supported(state, cap)) return;
    std::string copy = dataset->text;
    for (auto _ : state) {
        state.PauseTiming();
        copy.assign(dataset->text);
        state.ResumeTiming();
        function(&copy[0], copy.size());
        bm::DoNotOptimize(copy.data());
        bm::ClobberMemory();
    }
    report_bytes(state, copy.size());
}

static void libc_to_upper(tl_ptr_t text, tl_size_t length) {
    for (tl_size_t i = 0; i != length; ++i) text[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
}

static void libc_to_lower(tl_ptr_t text, tl_size_t length) {
    for (tl_size_t i = 0; i != length; ++i) text[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
}

static void valid(bm::State &state, dataset_t const *dataset, tl_capability_t cap, tl_utf8_valid_t function) {
    if (!supported(state, cap)) return;
    for (auto _ : state) bm::DoNotOptimize(function(dataset->text.data(), dataset->text.size()));
    report_bytes(state, dataset->text.size());
}

static void count(bm::State &state, dataset_t const *dataset, tl_capability_t cap, tl_utf8_count_t function) {
    if (!supported(state, cap)) return;
    for (auto _ : state) bm::DoNotOptimize(function(dataset->text.data(), dataset->text.size()));
    report_bytes(state, dataset->text.size());
}

struct backend_t {
    char const *name;
    tl_capability_t cap;
    tl_transform_t to_upper;
    tl_transform_t to_lower;
    tl_utf8_valid_t utf8_valid;
    tl_utf8_count_t utf8_count;
};

int main(int argc, char **argv) {

    fill_datasets();

    std::vector<backend_t> backends;
    backends.push_back({"serial", tl_cap_serial_k, tl_to_upper_serial, tl_to_lower_serial, tl_utf8_valid_serial,
                        tl_utf8_count_serial});
#if TL_USE_WESTMERE
    backends.push_back({"westmere", tl_cap_westmere_k, tl_to_upper_westmere, tl_to_lower_westmere,
                        tl_utf8_valid_westmere, tl_utf8_count_westmere});
#endif
#if TL_USE_HASWELL
    backends.push_back({"haswell", tl_cap_haswell_k, tl_to_upper_haswell, tl_to_lower_haswell, tl_utf8_valid_haswell,
                        tl_utf8_count_haswell});
#endif
#if TL_USE_NEON
    backends.push_back(
        {"neon", tl_cap_neon_k, tl_to_upper_neon, tl_to_lower_neon, tl_utf8_valid_neon, tl_utf8_count_neon});
#endif
    backends.push_back({"dispatched", tl_caps_none_k, tl_to_upper, tl_to_lower, tl_utf8_valid, tl_utf8_count});

    for (dataset_t const &dataset : datasets) {
        std::string const suffix = std::string("/") + dataset.name;
        dataset_t const *data = &dataset;

        bm::RegisterBenchmark(("to_upper/libc" + suffix).c_str(), &transform, data, tl_caps_none_k, &libc_to_upper)
            ->MinTime(default_secs_k);
        bm::RegisterBenchmark(("to_lower/libc" + suffix).c_str(), &transform, data, tl_caps_none_k, &libc_to_lower)
            ->MinTime(default_secs_k);

        for (backend_t const &backend : backends) {
            std::string const name = std::string("/") + backend.name + suffix;
            bm::RegisterBenchmark(("to_upper" + name).c_str(), &transform, data, backend.cap, backend.to_upper)
                ->MinTime(default_secs_k);
            bm::RegisterBenchmark(("to_lower" + name).c_str(), &transform, data, backend.cap, backend.to_lower)
                ->MinTime(default_secs_k);
            bm::RegisterBenchmark(("utf8_valid" + name).c_str(), &valid, data, backend.cap, backend.utf8_valid)
                ->MinTime(default_secs_k);
            bm::RegisterBenchmark(("utf8_count" + name).c_str(), &count, data, backend.cap, backend.utf8_count)
                ->MinTime(default_secs_k);
        }
    }

    bm::Initialize(&argc, argv);
    bm::RunSpecifiedBenchmarks();
    bm::Shutdown();
    return 0;
}
