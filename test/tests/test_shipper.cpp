#include <gtest/gtest.h>
#include "lokiship.hpp"
#include "utils/test_utils.hpp"
#include "utils/mock_transport.hpp"
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <cstdlib>

using namespace lokiship;

namespace {

// Throws for records whose message is "bad".
class PickyFormatter : public IFormatter {
public:
    std::string format(const LogRecord &record) const override {
        if (record.message == "bad") throw FormatError("cannot render 'bad'");
        return record.message;
    }
};

} // namespace

class ShipperTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTransport::State> state = std::make_shared<MockTransport::State>();

    ShipperBuilder builder() {
        ShipperBuilder b("http://127.0.0.1:3100/loki/api/v1/push", LabelSet{{"app", "test"}});
        b.formatter<LogfmtFormatter>()
         .transport(detail::make_unique<MockTransport>(state))
         .maxLogLifetime(std::chrono::seconds(60))
         .retry(RetryPolicy().setMaxRetries(2).setInitialBackoffMs(1).setMaxBackoffMs(5))
         .flushGrace(std::chrono::seconds(5));
        return b;
    }

    static LogRecord rec(const std::string &msg, LogLevel lvl = LogLevel::INFO) {
        return LogRecord(lvl, msg);
    }

    size_t deliveredEntries() {
        size_t total = 0;
        for (const auto &p : state->deliveredCopy()) total += p.entryCount();
        return total;
    }

    std::vector<std::string> deliveredLines() {
        std::vector<std::string> lines;
        for (const auto &p : state->deliveredCopy()) {
            for (const auto &e : TestUtils::entries(TestUtils::decodePayload(p))) {
                lines.push_back(e.second);
            }
        }
        return lines;
    }
};

// --- Test 1: nothing is sent below both thresholds ---
TEST_F(ShipperTest, NoPushBelowThresholds) {
    auto shipper = builder().maxLogs(100).build();
    shipper->start();
    for (int i = 0; i < 10; ++i) shipper->accept(rec("m" + std::to_string(i)));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(state->requestCount(), 0u);
    EXPECT_EQ(shipper->liveEntries(), 10u);
    EXPECT_EQ(shipper->stats().bufferedEntries, 10u);
}

// --- Test 2: count trigger produces a batch of exactly maxLogs ---
TEST_F(ShipperTest, CountTriggerExactBatch) {
    auto shipper = builder().maxLogs(5).build();
    shipper->start();
    for (int i = 0; i < 5; ++i) shipper->accept(rec("m" + std::to_string(i)));

    ASSERT_TRUE(TestUtils::waitFor([this] { return state->deliveredCount() == 1; }));
    EXPECT_EQ(state->deliveredCopy()[0].entryCount(), 5u);
    EXPECT_EQ(shipper->liveEntries(), 0u);
    ASSERT_TRUE(TestUtils::waitFor([&shipper] { return shipper->stats().bufferedEntries == 0; }));
}

// --- Test 3: count trigger keeps batches exact under a steady stream ---
TEST_F(ShipperTest, CountTriggerRepeats) {
    auto shipper = builder().maxLogs(5).build();
    shipper->start();
    for (int i = 0; i < 12; ++i) shipper->accept(rec("m" + std::to_string(i)));

    ASSERT_TRUE(TestUtils::waitFor([this] { return state->deliveredCount() == 2; }));
    for (const auto &p : state->deliveredCopy()) EXPECT_EQ(p.entryCount(), 5u);
    EXPECT_EQ(shipper->liveEntries(), 2u);
}

// --- Test 4: lifetime trigger ---
TEST_F(ShipperTest, LifetimeTrigger) {
    auto shipper = builder().maxLogs(1000).maxLogLifetime(std::chrono::milliseconds(100)).build();
    shipper->start();
    shipper->accept(rec("a"));
    shipper->accept(rec("b"));

    ASSERT_TRUE(TestUtils::waitFor([this] { return state->deliveredCount() == 1; }));
    EXPECT_EQ(state->deliveredCopy()[0].entryCount(), 2u);
    EXPECT_EQ(shipper->liveEntries(), 0u);
}

// --- Test 5: the lifetime clock starts with the first entry ---
TEST_F(ShipperTest, IdleShipperDoesNotPush) {
    auto shipper = builder().maxLogLifetime(std::chrono::milliseconds(50)).build();
    shipper->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(state->requestCount(), 0u);

    shipper->accept(rec("late"));
    ASSERT_TRUE(TestUtils::waitFor([this] { return state->deliveredCount() == 1; }));
}

// --- Test 6: flushing an empty shipper sends nothing ---
TEST_F(ShipperTest, EmptyFlushSendsNothing) {
    auto shipper = builder().build();
    shipper->start();
    EXPECT_NO_THROW(shipper->flush());
    EXPECT_EQ(state->requestCount(), 0u);
}

// --- Test 7: flush delivers every buffered entry ---
TEST_F(ShipperTest, FlushDeliversEverything) {
    auto shipper = builder().mergeFieldsAsLabels({"region"}).build();
    shipper->start();
    shipper->accept(rec("a").withField("region", "eu"));
    shipper->accept(rec("b").withField("region", "us"));
    shipper->accept(rec("c"));
    shipper->flush();

    ASSERT_EQ(state->deliveredCount(), 1u);
    auto body = TestUtils::decodePayload(state->deliveredCopy()[0]);
    EXPECT_EQ(body["streams"].size(), 3u);
    EXPECT_EQ(TestUtils::linesFor(body, {{"app", "test"}, {"region", "eu"}}).size(), 1u);
    EXPECT_EQ(TestUtils::linesFor(body, {{"app", "test"}}).size(), 1u);

    ShipperStats s = shipper->stats();
    EXPECT_EQ(s.recordsAccepted, 3u);
    EXPECT_EQ(s.entriesDelivered, 3u);
    EXPECT_EQ(s.batchesDelivered, 1u);
    EXPECT_EQ(s.bufferedEntries, 0u);
    EXPECT_EQ(s.httpRequests, 1u);
}

// --- Test 8: records accepted before start are kept ---
TEST_F(ShipperTest, AcceptBeforeStart) {
    auto shipper = builder().build();
    shipper->accept(rec("early"));
    EXPECT_THROW(shipper->flush(), std::logic_error);

    shipper->start();
    shipper->start();
    shipper->flush();
    EXPECT_EQ(deliveredLines(), std::vector<std::string>{"level=info message=early"});
}

// --- Test 9: shutdown drains and stops ---
TEST_F(ShipperTest, ShutdownDrainsAndStops) {
    auto shipper = builder().build();
    shipper->start();
    EXPECT_TRUE(shipper->running());
    for (int i = 0; i < 3; ++i) shipper->accept(rec("m" + std::to_string(i)));
    shipper->shutdown();

    EXPECT_FALSE(shipper->running());
    EXPECT_EQ(deliveredEntries(), 3u);

    shipper->accept(rec("too late"));
    EXPECT_EQ(shipper->stats().recordsDiscarded, 1u);
    EXPECT_EQ(shipper->liveEntries(), 0u);
    EXPECT_THROW(shipper->flush(), std::logic_error);
    EXPECT_THROW(shipper->start(), std::logic_error);
    EXPECT_NO_THROW(shipper->shutdown());
}

// --- Test 10: shutdown of a never-started shipper still delivers ---
TEST_F(ShipperTest, ShutdownWithoutStart) {
    auto shipper = builder().build();
    shipper->accept(rec("pending"));
    shipper->shutdown();
    EXPECT_EQ(deliveredEntries(), 1u);
}

// --- Test 11: destructor performs shutdown ---
TEST_F(ShipperTest, DestructorFlushes) {
    {
        auto shipper = builder().build();
        shipper->start();
        shipper->accept(rec("a"));
        shipper->accept(rec("b"));
    }
    EXPECT_EQ(deliveredEntries(), 2u);
}

// --- Test 12: Reject policy refuses records at the ceiling ---
TEST_F(ShipperTest, CapacityReject) {
    auto shipper = builder().maxLogs(4).capacity(4, OverflowPolicy::Reject).build();
    for (int i = 0; i < 4; ++i) shipper->accept(rec("m" + std::to_string(i)));
    EXPECT_THROW(shipper->accept(rec("overflow")), CapacityError);
    EXPECT_EQ(shipper->stats().recordsRejected, 1u);
    EXPECT_EQ(shipper->stats().bufferedEntries, 4u);

    shipper->start();
    ASSERT_TRUE(TestUtils::waitFor([&shipper] { return shipper->stats().bufferedEntries == 0; }));
    EXPECT_NO_THROW(shipper->accept(rec("fits again")));
    shipper->flush();
    EXPECT_EQ(deliveredEntries(), 5u);
}

// --- Test 13: SealAndContinue admits past the ceiling ---
TEST_F(ShipperTest, CapacitySealAndContinue) {
    auto shipper = builder().maxLogs(4).capacity(4, OverflowPolicy::SealAndContinue).build();
    for (int i = 0; i < 6; ++i) {
        EXPECT_NO_THROW(shipper->accept(rec("m" + std::to_string(i))));
    }
    EXPECT_EQ(shipper->stats().bufferedEntries, 6u);
    EXPECT_EQ(shipper->stats().recordsRejected, 0u);

    shipper->start();
    shipper->flush();
    EXPECT_EQ(deliveredEntries(), 6u);
    auto lines = deliveredLines();
    ASSERT_EQ(lines.size(), 6u);
    for (size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i], "level=info message=m" + std::to_string(i));
    }
}

// --- Test 14: a format failure drops only that record ---
TEST_F(ShipperTest, FormatErrorIsolated) {
    std::vector<std::string> failed;
    std::mutex mu;
    ShipperBuilder b = builder();
    b.formatter<PickyFormatter>()
     .onFormatError([&](const FormatError &, const LogRecord &r) {
         std::lock_guard<std::mutex> lock(mu);
         failed.push_back(r.message);
     });
    auto shipper = b.build();
    shipper->start();
    shipper->accept(rec("good1"));
    EXPECT_NO_THROW(shipper->accept(rec("bad")));
    shipper->accept(rec("good2"));
    shipper->flush();

    EXPECT_EQ(deliveredLines(), (std::vector<std::string>{"good1", "good2"}));
    EXPECT_EQ(shipper->stats().formatErrors, 1u);
    EXPECT_EQ(failed, std::vector<std::string>{"bad"});
}

// --- Test 15: records below the minimum level are ignored ---
TEST_F(ShipperTest, LevelFilter) {
    auto shipper = builder().minLevel(LogLevel::WARN).build();
    shipper->start();
    shipper->accept(rec("d", LogLevel::DEBUG));
    shipper->accept(rec("i", LogLevel::INFO));
    shipper->accept(rec("w", LogLevel::WARN));
    shipper->accept(rec("e", LogLevel::ERROR));
    shipper->flush();

    EXPECT_EQ(deliveredLines(),
              (std::vector<std::string>{"level=warn message=w", "level=error message=e"}));
    EXPECT_EQ(shipper->stats().recordsFiltered, 2u);
    EXPECT_EQ(shipper->stats().recordsAccepted, 2u);
}

// --- Test 16: permanent rejection surfaces through flush and the hook ---
TEST_F(ShipperTest, PermanentFailureReported) {
    std::vector<DeliveryReport> reports;
    std::mutex mu;
    state->push({400});
    ShipperBuilder b = builder();
    b.onDeliveryError([&](const DeliveryReport &r) {
        std::lock_guard<std::mutex> lock(mu);
        reports.push_back(r);
    });
    auto shipper = b.build();
    shipper->start();
    shipper->accept(rec("a"));
    shipper->accept(rec("b"));

    try {
        shipper->flush();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError &e) {
        EXPECT_EQ(e.failedBatches(), 1u);
        EXPECT_TRUE(e.firstFailure().permanent);
        EXPECT_EQ(e.firstFailure().statusCode, 400);
        EXPECT_EQ(e.firstFailure().entries, 2u);
        EXPECT_EQ(e.firstFailure().attempts, 1u);
    }
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].requeued);

    ShipperStats s = shipper->stats();
    EXPECT_EQ(s.batchesFailed, 1u);
    EXPECT_EQ(s.entriesDropped, 2u);
    EXPECT_EQ(s.bufferedEntries, 0u);

    // The next batch is unaffected.
    shipper->accept(rec("c"));
    EXPECT_NO_THROW(shipper->flush());
    EXPECT_EQ(deliveredLines(), std::vector<std::string>{"level=info message=c"});
}

// --- Test 17: transient failures are retried transparently ---
TEST_F(ShipperTest, RetriedThenDelivered) {
    state->push({500, 500, 200});
    auto shipper = builder().build();
    shipper->start();
    shipper->accept(rec("x"));
    EXPECT_NO_THROW(shipper->flush());
    EXPECT_EQ(state->requestCount(), 3u);
    EXPECT_EQ(state->deliveredCount(), 1u);
    EXPECT_EQ(shipper->stats().httpRequests, 3u);
}

// --- Test 18: exhausted retries under the Drop policy ---
TEST_F(ShipperTest, ExhaustedRetriesDropped) {
    state->setDefault(503);
    auto shipper = builder().build();
    shipper->start();
    shipper->accept(rec("x"));
    try {
        shipper->flush();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError &e) {
        EXPECT_FALSE(e.firstFailure().permanent);
        EXPECT_EQ(e.firstFailure().attempts, 3u);
        EXPECT_EQ(e.firstFailure().statusCode, 503);
    }
    EXPECT_EQ(state->requestCount(), 3u);
    EXPECT_EQ(shipper->stats().bufferedEntries, 0u);
}

// --- Test 19: Requeue keeps the batch and sends it before newer ones ---
TEST_F(ShipperTest, RequeueRetriesBeforeNewerBatches) {
    state->push({503});
    auto shipper = builder()
        .retry(RetryPolicy().setMaxRetries(0))
        .onRetriesExhausted(ExhaustedPolicy::Requeue, 4)
        .build();
    shipper->start();
    shipper->accept(rec("old1"));
    shipper->accept(rec("old2"));

    try {
        shipper->flush();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError &e) {
        EXPECT_TRUE(e.firstFailure().requeued);
    }
    EXPECT_EQ(shipper->stats().batchesRequeued, 1u);
    EXPECT_EQ(shipper->stats().bufferedEntries, 2u);
    EXPECT_EQ(shipper->stats().entriesDropped, 0u);

    shipper->accept(rec("new"));
    EXPECT_NO_THROW(shipper->flush());
    EXPECT_EQ(deliveredLines(), (std::vector<std::string>{
        "level=info message=old1", "level=info message=old2", "level=info message=new"}));
    auto delivered = state->deliveredCopy();
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_LT(delivered[0].generation(), delivered[1].generation());
    EXPECT_EQ(shipper->stats().bufferedEntries, 0u);
}

// --- Test 20: the requeue list is bounded ---
TEST_F(ShipperTest, RequeueEvictsOldest) {
    state->setDefault(503);
    auto shipper = builder()
        .retry(RetryPolicy().setMaxRetries(0))
        .onRetriesExhausted(ExhaustedPolicy::Requeue, 1)
        .build();
    shipper->start();

    shipper->accept(rec("first"));
    EXPECT_THROW(shipper->flush(), DeliveryError);
    shipper->accept(rec("second"));
    shipper->accept(rec("second"));
    EXPECT_THROW(shipper->flush(), DeliveryError);

    ShipperStats s = shipper->stats();
    EXPECT_EQ(s.batchesFailed, 1u);
    EXPECT_EQ(s.entriesDropped, 1u);
    EXPECT_EQ(s.bufferedEntries, 2u);

    // The final flush of shutdown drops what is still requeued.
    EXPECT_THROW(shipper->shutdown(), DeliveryError);
    EXPECT_EQ(shipper->stats().entriesDropped, 3u);
    EXPECT_EQ(shipper->stats().bufferedEntries, 0u);
}

// --- Test 21: a stuck request turns into FlushTimeout ---
TEST_F(ShipperTest, FlushAndShutdownTimeout) {
    state->setDelay(std::chrono::seconds(10));
    auto shipper = builder().build();
    shipper->start();
    shipper->accept(rec("slow"));

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(shipper->flush(std::chrono::milliseconds(100)), FlushTimeout);
    EXPECT_THROW(shipper->shutdown(std::chrono::milliseconds(100)), FlushTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_FALSE(shipper->running());
    EXPECT_TRUE(state->cancelled.load());
    EXPECT_EQ(state->deliveredCount(), 0u);
}

// --- Test 22: timestamps stay increasing across generations ---
TEST_F(ShipperTest, MonotonicAcrossGenerations) {
    const int64_t t = 1700000000000000000LL;
    auto shipper = builder().maxLogs(2).build();
    shipper->start();
    for (int i = 0; i < 4; ++i) {
        shipper->accept(rec("m" + std::to_string(i)).withTimestamp(t));
    }
    shipper->flush();

    auto delivered = state->deliveredCopy();
    ASSERT_EQ(delivered.size(), 2u);
    std::vector<int64_t> stamps;
    for (const auto &p : delivered) {
        for (const auto &e : TestUtils::entries(TestUtils::decodePayload(p))) stamps.push_back(e.first);
    }
    EXPECT_EQ(stamps, (std::vector<int64_t>{t, t + 1, t + 2, t + 3}));
}

// --- Test 23: batches are delivered one at a time in seal order ---
TEST_F(ShipperTest, SequentialDeliveryOrder) {
    state->setDelay(std::chrono::milliseconds(5));
    auto shipper = builder().maxLogs(3).build();
    shipper->start();
    for (int i = 0; i < 9; ++i) shipper->accept(rec("m" + std::to_string(i)));
    shipper->flush();

    auto delivered = state->deliveredCopy();
    ASSERT_EQ(delivered.size(), 3u);
    for (size_t i = 1; i < delivered.size(); ++i) {
        EXPECT_LT(delivered[i - 1].generation(), delivered[i].generation());
    }
    auto lines = deliveredLines();
    ASSERT_EQ(lines.size(), 9u);
    for (size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i], "level=info message=m" + std::to_string(i));
    }
}

// --- Test 24: concurrent producers lose nothing ---
TEST_F(ShipperTest, ConcurrentProducers) {
    const int threads = 4;
    const int perThread = 250;
    auto shipper = builder().maxLogs(64).build();
    shipper->start();

    std::vector<std::thread> producers;
    for (int t = 0; t < threads; ++t) {
        producers.emplace_back([&shipper, t, perThread] {
            for (int n = 0; n < perThread; ++n) {
                shipper->accept(LogRecord(LogLevel::INFO, "p")
                                    .withField("t", std::to_string(t))
                                    .withField("n", std::to_string(n)));
            }
        });
    }
    for (auto &p : producers) p.join();
    shipper->flush();

    EXPECT_EQ(deliveredEntries(), static_cast<size_t>(threads * perThread));
    for (const auto &p : state->deliveredCopy()) EXPECT_LE(p.entryCount(), 64u);

    // Each producer's records arrive in the order it accepted them.
    std::vector<int> next(threads, 0);
    for (const auto &line : deliveredLines()) {
        size_t tp = line.find(" t=");
        size_t np = line.find(" n=");
        ASSERT_NE(tp, std::string::npos);
        ASSERT_NE(np, std::string::npos);
        int t = std::atoi(line.c_str() + tp + 3);
        int n = std::atoi(line.c_str() + np + 3);
        EXPECT_EQ(n, next[t]);
        next[t] = n + 1;
    }
    EXPECT_EQ(shipper->stats().recordsAccepted, static_cast<size_t>(threads * perThread));
}

// --- Test 25: gzip end to end ---
TEST_F(ShipperTest, CompressedPayloads) {
    auto shipper = builder().compression(true).build();
    shipper->start();
    shipper->accept(rec("zipped"));
    shipper->flush();

    auto delivered = state->deliveredCopy();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_TRUE(delivered[0].gzipped());
    EXPECT_EQ(deliveredLines(), std::vector<std::string>{"level=info message=zipped"});
}

// --- Test 26: per-LabelSet timestamp tracking forgets idle streams ---
TEST_F(ShipperTest, TrackedLabelSetsStayBounded) {
    auto shipper = builder()
        .maxLogLifetime(std::chrono::milliseconds(50))
        .mergeFieldsAsLabels({"req"})
        .build();
    shipper->start();
    for (int i = 0; i < 500; ++i) {
        shipper->accept(rec("r").withField("req", std::to_string(i)));
    }
    shipper->flush();
    EXPECT_LE(shipper->stats().trackedLabelSets, 500u);
    EXPECT_EQ(deliveredEntries(), 500u);

    // Once idle for a full lifetime, the next delivery pass forgets them.
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    const int64_t t = 1700000000000000000LL;
    shipper->accept(rec("tail1").withField("req", "tail").withTimestamp(t));
    shipper->flush();
    EXPECT_EQ(shipper->stats().trackedLabelSets, 1u);

    // A LabelSet that is still tracked keeps its timeline across generations.
    shipper->accept(rec("tail2").withField("req", "tail").withTimestamp(t));
    shipper->flush();
    std::vector<int64_t> stamps;
    for (const auto &p : state->deliveredCopy()) {
        for (int64_t ts : TestUtils::timestampsFor(TestUtils::decodePayload(p),
                                                   {{"app", "test"}, {"req", "tail"}})) {
            stamps.push_back(ts);
        }
    }
    EXPECT_EQ(stamps, (std::vector<int64_t>{t, t + 1}));
}

// --- Test 27: a later flush cannot overwrite an earlier flush's failure ---
TEST_F(ShipperTest, OverlappingFlushesKeepTheirOwnResult) {
    state->setDelay(std::chrono::milliseconds(30));
    auto shipper = builder().build();
    shipper->start();

    for (int round = 0; round < 5; ++round) {
        state->push({400});
        const size_t before = state->requestCount();
        shipper->accept(rec("doomed"));

        std::atomic<bool> gotError(false);
        std::thread first([&] {
            try {
                shipper->flush();
            } catch (const DeliveryError &e) {
                gotError = e.firstFailure().statusCode == 400;
            }
        });
        EXPECT_TRUE(TestUtils::waitFor([&] { return state->requestCount() > before; }));
        // The failing push was in flight when this flush began, so it may
        // report the same failure.
        try {
            shipper->flush();
        } catch (const DeliveryError &e) {
            EXPECT_EQ(e.firstFailure().statusCode, 400);
        }
        first.join();
        EXPECT_TRUE(gotError.load()) << "round " << round;
    }
}
