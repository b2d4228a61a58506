#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include "lokiship.hpp"
#include "null_transport.hpp"

static std::unique_ptr<lokiship::Shipper> makeShipper(size_t maxLogs, bool gzip) {
    auto shipper = lokiship::ShipperBuilder("http://127.0.0.1:3100/loki/api/v1/push",
                                            lokiship::LabelSet{{"app", "bench"}})
        .formatter<lokiship::LogfmtFormatter>()
        .maxLogs(maxLogs)
        .maxLogLifetime(std::chrono::seconds(60))
        .compression(gzip)
        .transport(lokiship::detail::make_unique<lokiship::NullTransport>())
        .build();
    shipper->start();
    return shipper;
}

// ---------------------------------------------------------------------------
// BM_Accept_SingleStream
// One global stream, count trigger every 1000 entries.
// ---------------------------------------------------------------------------
static void BM_Accept_SingleStream(benchmark::State& state) {
    auto shipper = makeShipper(1000, false);
    lokiship::LogRecord record(lokiship::LogLevel::INFO, "request handled");
    record.withField("status", "200").withField("path", "/api/v1/items");

    for (auto _ : state) {
        shipper->accept(record);
    }
    shipper->shutdown();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Accept_SingleStream);

// ---------------------------------------------------------------------------
// BM_Accept_RoutedStreams
// Field promotion spreads records over 16 streams.
// ---------------------------------------------------------------------------
static void BM_Accept_RoutedStreams(benchmark::State& state) {
    auto shipper = lokiship::ShipperBuilder("http://127.0.0.1:3100/loki/api/v1/push",
                                            lokiship::LabelSet{{"app", "bench"}})
        .formatter<lokiship::LogfmtFormatter>()
        .mergeFieldsAsLabels({"shard"})
        .maxLogs(1000)
        .transport(lokiship::detail::make_unique<lokiship::NullTransport>())
        .build();
    shipper->start();

    size_t i = 0;
    for (auto _ : state) {
        lokiship::LogRecord record(lokiship::LogLevel::INFO, "routed");
        record.withField("shard", std::to_string(i++ % 16));
        shipper->accept(record);
    }
    shipper->shutdown();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Accept_RoutedStreams);

// ---------------------------------------------------------------------------
// BM_Accept_Gzip
// Same as SingleStream with compression on the worker.
// ---------------------------------------------------------------------------
static void BM_Accept_Gzip(benchmark::State& state) {
    auto shipper = makeShipper(1000, true);
    lokiship::LogRecord record(lokiship::LogLevel::INFO, "compressed");

    for (auto _ : state) {
        shipper->accept(record);
    }
    shipper->shutdown();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Accept_Gzip);

// ---------------------------------------------------------------------------
// BM_Encode_Batch
// JSON push body for a sealed batch of N entries.
// ---------------------------------------------------------------------------
static void BM_Encode_Batch(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    std::unique_ptr<lokiship::GenerationBuffer> buffer(new lokiship::GenerationBuffer(1));
    lokiship::LabelSet labels{{"app", "bench"}};
    for (size_t i = 0; i < n; ++i) {
        buffer->append(labels, static_cast<int64_t>(i), "level=info message=\"line " + std::to_string(i) + "\"");
    }
    lokiship::SealedBatch batch(std::move(buffer));
    lokiship::PushEncoder encoder(false);

    for (auto _ : state) {
        auto payload = encoder.encode(batch);
        benchmark::DoNotOptimize(payload.body().data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Encode_Batch)->Arg(100)->Arg(1000)->Arg(10000);
