/**
 * @file bench_ruleset.cpp
 * @brief Benchmarks for subtitle text decoding and ruleset application
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_fetch/core/text_decoder.h>
#include <kcenon/media_fetch/library/episode_classifier.h>
#include <kcenon/media_fetch/subtitle/ruleset.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace kcenon::media_fetch::benchmark {

namespace {

auto make_rules(std::size_t count) -> ruleset {
    ruleset rules = {{"Kirito", "Kazuto"}, {"Asuna", "Yuuki"}, {"Mr. Agil", "Andrew"},
                     {"(laughs)", "*laughs*"}, {"Klein", "Ryoutarou"}};
    for (std::size_t i = rules.size(); i < count; ++i) {
        rules.push_back({"name" + std::to_string(i), "renamed" + std::to_string(i)});
    }
    return rules;
}

}  // namespace

/**
 * @brief Benchmark for the built-in stutter and line-break normalizations
 */
static void BM_StandardReplacements(::benchmark::State& state) {
    const auto text = test_data_generator::generate_subtitle_text(
        static_cast<std::size_t>(state.range(0)), 42);

    for (auto _ : state) {
        auto out = apply_standard_replacements(text);
        ::benchmark::DoNotOptimize(out);
    }

    state.SetBytesProcessed(static_cast<int64_t>(text.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for whole-token ruleset application
 */
static void BM_ApplyRuleset(::benchmark::State& state) {
    const auto text = test_data_generator::generate_subtitle_text(
        static_cast<std::size_t>(state.range(0)), 42);
    const auto rules = make_rules(static_cast<std::size_t>(state.range(1)));

    for (auto _ : state) {
        auto out = apply_ruleset(text, rules);
        ::benchmark::DoNotOptimize(out);
    }

    state.SetBytesProcessed(static_cast<int64_t>(text.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for decode-with-fallback on UTF-8 input
 */
static void BM_DecodeWithFallback(::benchmark::State& state) {
    const auto text = test_data_generator::generate_subtitle_text(
        static_cast<std::size_t>(state.range(0)), 42);

    for (auto _ : state) {
        auto decoded = decode_with_fallback(text);
        if (!decoded) {
            state.SkipWithError("Failed to decode");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(text.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for episode number extraction
 */
static void BM_ExtractEpisode(::benchmark::State& state) {
    const std::string name = "[GroupA] Some Long Show Title S2 - 07 (WEB 1080p HEVC).mkv";

    for (auto _ : state) {
        auto match = episode_classifier::extract_episode(name);
        ::benchmark::DoNotOptimize(match);
    }
}

BENCHMARK(BM_StandardReplacements)->Arg(500)->Arg(5000)->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ApplyRuleset)
    ->Args({500, 5})
    ->Args({5000, 5})
    ->Args({5000, 50})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_DecodeWithFallback)->Arg(500)->Arg(5000)->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ExtractEpisode);

}  // namespace kcenon::media_fetch::benchmark
