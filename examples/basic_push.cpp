// basic_push.cpp
//
// Buffers a few records and pushes them to a Loki instance.
//
// Compile: g++ -std=c++11 -I include examples/basic_push.cpp -o basic_push \
//              -lcurl -lz -pthread
//
// Run Loki locally first, e.g.:
//   docker run -p 3100:3100 grafana/loki
// then query: {app="basic_push"}

#include "lokiship.hpp"
#include <iostream>

int main(int argc, char** argv) {
    std::string endpoint = argc > 1 ? argv[1] : "http://localhost:3100/loki/api/v1/push";

    std::unique_ptr<lokiship::Shipper> shipper;
    try {
        shipper = lokiship::ShipperBuilder(endpoint,
                                           lokiship::LabelSet{{"app", "basic_push"}, {"env", "dev"}})
            .formatter<lokiship::LogfmtFormatter>()
            .mergeFieldsAsLabels({"region"})
            .maxLogs(100)
            .maxLogLifetime(std::chrono::seconds(2))
            .retry(lokiship::RetryPolicy().setMaxRetries(2).setInitialBackoffMs(200))
            .flushGrace(std::chrono::seconds(10))
            .onDeliveryError([](const lokiship::DeliveryReport& r) {
                std::cerr << "push failed for generation " << r.generation
                          << " (" << r.entries << " entries): " << r.message << "\n";
            })
            .build();
    } catch (const lokiship::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    shipper->start();

    shipper->accept(lokiship::LogRecord(lokiship::LogLevel::INFO, "service started")
                        .withModule("basic_push"));
    for (int i = 0; i < 5; ++i) {
        shipper->accept(lokiship::LogRecord(lokiship::LogLevel::DEBUG, "tick")
                            .withField("n", std::to_string(i))
                            .withField("region", i % 2 ? "eu" : "us"));
    }
    shipper->accept(lokiship::LogRecord(lokiship::LogLevel::WARN, "queue depth high")
                        .withField("depth", "812"));

    try {
        shipper->flush();
        shipper->shutdown();
    } catch (const lokiship::DeliveryError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const lokiship::FlushTimeout& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    lokiship::ShipperStats s = shipper->stats();
    std::cout << s.entriesDelivered << " entries delivered in "
              << s.batchesDelivered << " request(s)\n";
    return 0;
}
