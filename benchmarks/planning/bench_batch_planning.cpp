/**
 * @file bench_batch_planning.cpp
 * @brief Benchmarks for descriptor building, command rendering and output parsing
 *
 * Performance Targets:
 * - 10K descriptors built and rendered: < 50ms
 * - Output classification: > 500K lines/s
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_transfer/command/batch_command_generator.h>
#include <kcenon/object_transfer/descriptor/descriptor_builder.h>
#include <kcenon/object_transfer/execution/output_classifier.h>

#include <string>
#include <vector>

namespace kcenon::object_transfer::benchmark {

namespace {

auto make_request(std::size_t count) -> transfer_request {
    transfer_request request;
    request.destination_prefix = "s3://market-archive/binance";
    request.sources.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        request.sources.emplace_back(
            "s3://data.binance.vision/data/spot/daily/klines/BTCUSDT/1m/BTCUSDT-1m-" +
            std::to_string(i) + ".zip");
    }
    return request;
}

auto make_output(std::size_t count) -> std::vector<std::string> {
    std::vector<std::string> lines;
    lines.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto name = "BTCUSDT-1m-" + std::to_string(i) + ".zip";
        if (i % 10 == 9) {
            lines.push_back("ERROR \"cp s3://data.binance.vision/k/" + name +
                            " s3://market-archive/binance/k/" + name +
                            "\": SlowDown: Please reduce your request rate.");
        } else {
            lines.push_back("cp s3://data.binance.vision/k/" + name +
                            " s3://market-archive/binance/k/" + name);
        }
    }
    return lines;
}

}  // namespace

/**
 * @brief Build descriptors from raw identifiers
 */
static void BM_DescriptorBuilder_Build(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto request = make_request(count);

    for (auto _ : state) {
        auto descriptors = descriptor_builder::build(request);
        if (!descriptors) {
            state.SkipWithError("descriptor build failed");
            return;
        }
        ::benchmark::DoNotOptimize(descriptors.value().data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Render command documents for a prepared batch
 */
static void BM_CommandGenerator_Generate(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto batch_size = static_cast<std::size_t>(state.range(1));

    auto descriptors = descriptor_builder::build(make_request(count));
    if (!descriptors) {
        state.SkipWithError("descriptor build failed");
        return;
    }

    command_options options;
    options.max_batch_size = batch_size;
    batch_command_generator generator(bulk_tool_config{}, options);

    for (auto _ : state) {
        auto documents = generator.generate(descriptors.value());
        if (!documents) {
            state.SkipWithError("command generation failed");
            return;
        }
        ::benchmark::DoNotOptimize(documents.value().data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Classify tool output lines
 */
static void BM_OutputClassifier_Classify(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto lines = make_output(count);
    regex_line_classifier classifier;

    for (auto _ : state) {
        for (const auto& line : lines) {
            auto classified = classifier.classify(output_stream::standard_output, line);
            ::benchmark::DoNotOptimize(classified.kind);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_DescriptorBuilder_Build)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_CommandGenerator_Generate)
    ->Args({1000, 1000})
    ->Args({10000, 1000})
    ->Args({10000, 100})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_OutputClassifier_Classify)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::object_transfer::benchmark
