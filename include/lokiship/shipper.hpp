#ifndef LOKISHIP_SHIPPER_HPP
#define LOKISHIP_SHIPPER_HPP

#include "shipper_options.hpp"
#include "core/log_common.hpp"
#include "core/log_record.hpp"
#include "core/errors.hpp"
#include "formatter/formatter_interface.hpp"
#include "router/stream_router.hpp"
#include "buffer/generation_buffer.hpp"
#include "encoder/push_encoder.hpp"
#include "transport/transport_interface.hpp"
#include "transport/curl_transport.hpp"
#include "transport/batch_sender.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <deque>
#include <map>
#include <vector>
#include <memory>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <cstdio>

namespace lokiship {

    /// Point-in-time copy of a shipper's counters.
    struct ShipperStats {
        size_t recordsAccepted;    ///< buffered into a generation
        size_t recordsFiltered;    ///< below minLevel
        size_t recordsRejected;    ///< refused with CapacityError
        size_t recordsDiscarded;   ///< arrived after shutdown began
        size_t formatErrors;
        size_t entriesDelivered;
        size_t batchesDelivered;
        size_t batchesFailed;      ///< dropped after a permanent failure or exhausted retries
        size_t batchesRequeued;
        size_t entriesDropped;
        size_t httpRequests;
        size_t bufferedEntries;    ///< live + sealed + in flight + requeued
        size_t trackedLabelSets;   ///< LabelSets with a remembered last timestamp
    };

    /// Client-side buffering engine for a Loki push endpoint.
    ///
    /// Producers call accept() from any thread. The record is formatted and
    /// routed on the calling thread, then appended to the live generation
    /// under a short lock. A single worker thread seals generations when one
    /// of the triggers fires (maxLogs entries, maxLogLifetime since the first
    /// entry, flush(), shutdown()), encodes them and pushes them one at a
    /// time, so generation N resolves before generation N+1 is sent.
    /// The count and capacity triggers are the exception: the producer that
    /// trips them swaps the live generation itself, inside the append lock.
    ///
    /// @code
    ///   auto shipper = ShipperBuilder("http://loki:3100/loki/api/v1/push",
    ///                                 LabelSet{{"app", "billing"}})
    ///       .formatter<LogfmtFormatter>()
    ///       .maxLogs(500)
    ///       .maxLogLifetime(std::chrono::seconds(5))
    ///       .build();
    ///   shipper->start();
    ///   shipper->accept(LogRecord(LogLevel::INFO, "invoice sent").withField("id", "42"));
    ///   shipper->shutdown();
    /// @endcode
    ///
    /// Delivery failures never reach accept(). They go to the delivery error
    /// handler (or stderr) and, for batches resolved during an explicit
    /// flush()/shutdown(), to that caller as a DeliveryError.
    class Shipper {
    public:
        typedef std::chrono::steady_clock Clock;

        /// @throws ConfigError for invalid options or a missing formatter.
        /// A null transport selects CurlTransport built from the options.
        Shipper(ShipperOptions opts,
                std::unique_ptr<IFormatter> formatter,
                std::unique_ptr<ITransport> transport = std::unique_ptr<ITransport>())
            : m_opts(std::move(opts))
            , m_formatter(std::move(formatter))
            , m_router(m_opts.routing)
            , m_encoder(m_opts.gzip)
            , m_transport(std::move(transport))
            , m_nextGeneration(1)
            , m_bufferedEntries(0)
            , m_requeuedBatches(0)
            , m_flushRequested(0)
            , m_flushCompleted(0)
            , m_started(false)
            , m_stopping(false)
            , m_stopped(false)
            , m_workerExited(false)
            , m_delivering(false)
            , m_timerDirty(false)
            , m_accepting(true)
            , m_overflowWarned(false)
        {
            validateOptions(m_opts);
            if (!m_formatter) {
                throw ConfigError("a formatter is required");
            }
            if (!m_transport) {
                m_transport = detail::make_unique<CurlTransport>(m_opts.transportOptions());
            }
            m_sender.reset(new BatchSender(*m_transport, m_opts.retry));
            m_live.reset(new GenerationBuffer(m_nextGeneration++));
        }

        ~Shipper() noexcept {
            bool needShutdown;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                needShutdown = !m_stopped && !m_stopping;
            }
            if (!needShutdown) return;
            try {
                shutdown(m_opts.flushGrace);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[LokiShip][Shipper] shutdown during destruction: %s\n", e.what());
            }
        }

        Shipper(const Shipper&) = delete;
        Shipper& operator=(const Shipper&) = delete;

        /// Launch the worker. A second call is a no-op.
        /// @throws std::logic_error after shutdown().
        void start() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping || m_stopped) {
                throw std::logic_error("Shipper::start: shipper has been shut down");
            }
            startLocked();
        }

        /// Buffer one record. Never blocks on the network and never fails
        /// because the backend is unavailable.
        /// @throws CapacityError when the ceiling is hit under OverflowPolicy::Reject.
        void accept(const LogRecord& record) {
            if (record.level < m_opts.minLevel) {
                m_counters.filtered.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            if (!m_accepting.load(std::memory_order_acquire)) {
                m_counters.discarded.fetch_add(1, std::memory_order_relaxed);
                return;
            }

            std::string line;
            try {
                line = m_formatter->format(record);
            } catch (const FormatError& e) {
                reportFormatError(e, record);
                return;
            } catch (const std::exception& e) {
                reportFormatError(FormatError(e.what()), record);
                return;
            }
            LabelSet labels = m_router.route(record, m_opts.labels);

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_accepting.load(std::memory_order_relaxed)) {
                    m_counters.discarded.fetch_add(1, std::memory_order_relaxed);
                    return;
                }

                if (m_opts.capacity > 0 && m_bufferedEntries >= m_opts.capacity) {
                    if (m_opts.overflowPolicy == OverflowPolicy::Reject) {
                        m_counters.rejected.fetch_add(1, std::memory_order_relaxed);
                        throw CapacityError(m_bufferedEntries, m_opts.capacity);
                    }
                    if (!m_overflowWarned) {
                        m_overflowWarned = true;
                        std::fprintf(stderr, "[LokiShip][Shipper] WARNING: %zu entries buffered, "
                                             "capacity %zu reached; sealing early\n",
                                     m_bufferedEntries, m_opts.capacity);
                    }
                    sealLiveLocked();
                } else {
                    m_overflowWarned = false;
                }

                Watermark& wm = m_watermarks[labels];
                bool created = false;
                wm.lastNs = m_live->append(labels, record.timestampNs, std::move(line),
                                           wm.lastNs, &created);
                if (created) ++wm.generations;
                ++m_bufferedEntries;
                m_counters.accepted.fetch_add(1, std::memory_order_relaxed);

                if (m_live->entryCount() >= m_opts.maxLogs) {
                    sealLiveLocked();
                } else if (m_live->entryCount() == 1) {
                    // New generation: the worker must arm its lifetime deadline.
                    m_timerDirty = true;
                } else {
                    return;
                }
            }
            m_workCV.notify_all();
        }

        /// Seal the live generation and block until every pending batch has
        /// been delivered or has failed. Returns at once when nothing is
        /// buffered or in flight.
        /// @throws DeliveryError if a batch of this flush failed.
        /// @throws FlushTimeout if delivery did not resolve within `grace`.
        /// @throws std::logic_error when the shipper is not running.
        void flush(std::chrono::milliseconds grace) {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_started || m_stopping || m_stopped) {
                throw std::logic_error("Shipper::flush: shipper is not running");
            }
            if (m_live->empty() && m_sealed.empty() && !m_delivering && m_requeuedBatches == 0) {
                return;
            }

            const uint64_t seq = ++m_flushRequested;
            m_flushResults[seq] = FlushResult();
            m_workCV.notify_all();
            bool done = m_flushCV.wait_for(lock, grace, [this, seq] {
                return m_flushResults[seq].done || m_workerExited;
            });
            FlushResult result = takeFlushResultLocked(seq);
            if (!done) {
                throw FlushTimeout("Shipper::flush: delivery did not resolve within "
                                   + std::to_string(grace.count()) + " ms");
            }
            if (!result.done) {
                throw std::logic_error("Shipper::flush: worker stopped before the flush completed");
            }
            if (result.failedBatches > 0) {
                throw DeliveryError(result.failedBatches, result.firstFailure);
            }
        }

        void flush() { flush(m_opts.flushGrace); }

        /// Stop accepting records, deliver everything still buffered, then
        /// stop the worker. If `grace` elapses first, in-flight requests and
        /// backoff waits are cancelled, the remaining batches are dropped,
        /// and FlushTimeout is thrown once the worker has been joined.
        /// @throws DeliveryError if a batch of the final flush failed.
        void shutdown(std::chrono::milliseconds grace) {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_stopped) return;
            if (m_stopping) {
                // Another thread owns the shutdown; wait for it.
                m_flushCV.wait_for(lock, grace, [this] { return m_stopped; });
                return;
            }

            m_accepting.store(false, std::memory_order_release);
            m_stopping = true;
            if (!m_started) {
                if (m_live->empty()) {
                    m_stopped = true;
                    return;
                }
                startLocked();
            }
            const uint64_t seq = ++m_flushRequested;
            m_flushResults[seq] = FlushResult();
            m_workCV.notify_all();

            bool exited = m_flushCV.wait_for(lock, grace, [this] { return m_workerExited; });
            lock.unlock();
            if (!exited) {
                m_sender->abort();
            }
            if (m_worker.joinable()) {
                m_worker.join();
            }
            lock.lock();
            m_stopped = true;
            FlushResult result = takeFlushResultLocked(seq);
            m_flushCV.notify_all();

            if (!exited) {
                throw FlushTimeout("Shipper::shutdown: delivery did not resolve within "
                                   + std::to_string(grace.count()) + " ms; remaining batches dropped");
            }
            if (result.failedBatches > 0) {
                throw DeliveryError(result.failedBatches, result.firstFailure);
            }
        }

        void shutdown() { shutdown(m_opts.flushGrace); }

        bool running() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_started && !m_stopping && !m_stopped;
        }

        ShipperStats stats() const {
            ShipperStats s;
            s.recordsAccepted = m_counters.accepted.load(std::memory_order_relaxed);
            s.recordsFiltered = m_counters.filtered.load(std::memory_order_relaxed);
            s.recordsRejected = m_counters.rejected.load(std::memory_order_relaxed);
            s.recordsDiscarded = m_counters.discarded.load(std::memory_order_relaxed);
            s.formatErrors = m_counters.formatErrors.load(std::memory_order_relaxed);
            s.entriesDelivered = m_counters.entriesDelivered.load(std::memory_order_relaxed);
            s.batchesDelivered = m_counters.batchesDelivered.load(std::memory_order_relaxed);
            s.batchesFailed = m_counters.batchesFailed.load(std::memory_order_relaxed);
            s.batchesRequeued = m_counters.batchesRequeued.load(std::memory_order_relaxed);
            s.entriesDropped = m_counters.entriesDropped.load(std::memory_order_relaxed);
            s.httpRequests = m_sender->requestCount();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                s.bufferedEntries = m_bufferedEntries;
                s.trackedLabelSets = m_watermarks.size();
            }
            return s;
        }

        /// Entries in the live generation, i.e. not yet sealed.
        size_t liveEntries() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_live->entryCount();
        }

        const ShipperOptions& options() const { return m_opts; }

    private:
        struct Counters {
            std::atomic<size_t> accepted{0};
            std::atomic<size_t> filtered{0};
            std::atomic<size_t> rejected{0};
            std::atomic<size_t> discarded{0};
            std::atomic<size_t> formatErrors{0};
            std::atomic<size_t> entriesDelivered{0};
            std::atomic<size_t> batchesDelivered{0};
            std::atomic<size_t> batchesFailed{0};
            std::atomic<size_t> batchesRequeued{0};
            std::atomic<size_t> entriesDropped{0};
        };

        struct RequeuedBatch {
            PushPayload payload;
            std::vector<LabelSet> labels;
            RequeuedBatch(PushPayload p, std::vector<LabelSet> l)
                : payload(std::move(p)), labels(std::move(l)) {}
        };

        /// Last timestamp issued for a LabelSet, and how many unresolved
        /// generations (live, sealed, in flight, requeued) hold a stream for it.
        /// `idleSince` is set when that count drops to zero.
        struct Watermark {
            int64_t lastNs;
            size_t generations;
            Clock::time_point idleSince;
            Watermark() : lastNs(std::numeric_limits<int64_t>::min()), generations(0) {}
        };

        /// Outcome of one flush()/shutdown() request, keyed by its sequence.
        struct FlushResult {
            bool done;
            size_t failedBatches;
            DeliveryReport firstFailure;
            FlushResult() : done(false), failedBatches(0) {}
        };

        FlushResult takeFlushResultLocked(uint64_t seq) {
            FlushResult result;
            std::map<uint64_t, FlushResult>::iterator it = m_flushResults.find(seq);
            if (it != m_flushResults.end()) {
                result = it->second;
                m_flushResults.erase(it);
            }
            return result;
        }

        /// Resolve every pending flush request up to `target`.
        void completeFlushLocked(uint64_t target, const std::vector<DeliveryReport>& failures) {
            m_flushCompleted = target;
            for (std::map<uint64_t, FlushResult>::iterator it = m_flushResults.begin();
                 it != m_flushResults.end() && it->first <= target; ++it) {
                if (it->second.done) continue;
                it->second.done = true;
                it->second.failedBatches = failures.size();
                if (!failures.empty()) {
                    it->second.firstFailure = failures.front();
                }
            }
            m_flushCV.notify_all();
        }

        /// Drop one generation reference per resolved stream, then forget
        /// LabelSets that nothing has held for a whole maxLogLifetime.
        void releaseWatermarksLocked(const std::vector<LabelSet>& resolved) {
            const Clock::time_point now = Clock::now();
            for (size_t i = 0; i < resolved.size(); ++i) {
                std::map<LabelSet, Watermark>::iterator it = m_watermarks.find(resolved[i]);
                if (it != m_watermarks.end() && it->second.generations > 0
                        && --it->second.generations == 0) {
                    it->second.idleSince = now;
                }
            }
            std::map<LabelSet, Watermark>::iterator it = m_watermarks.begin();
            while (it != m_watermarks.end()) {
                if (it->second.generations == 0 && now - it->second.idleSince >= m_opts.maxLogLifetime) {
                    m_watermarks.erase(it++);
                } else {
                    ++it;
                }
            }
        }

        static std::vector<LabelSet> labelsOf(const SealedBatch& batch) {
            std::vector<LabelSet> labels;
            labels.reserve(batch.streamCount());
            for (size_t i = 0; i < batch.streams().size(); ++i) {
                labels.push_back(batch.streams()[i].labels());
            }
            return labels;
        }

        void startLocked() {
            if (m_started) return;
            m_started = true;
            m_worker = std::thread(&Shipper::workerLoop, this);
        }

        /// Swap the live generation for an empty one. No-op when empty.
        void sealLiveLocked() {
            if (m_live->empty()) return;
            std::unique_ptr<GenerationBuffer> fresh(new GenerationBuffer(m_nextGeneration++));
            m_live.swap(fresh);
            m_sealed.push_back(SealedBatch(std::move(fresh)));
        }

        bool shouldWakeLocked() const {
            return m_stopping
                || m_flushRequested > m_flushCompleted
                || !m_sealed.empty()
                || m_timerDirty;
        }

        void workerLoop() {
            try {
                runWorker();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "[LokiShip][Shipper] worker stopped: %s\n", e.what());
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_workerExited = true;
            m_delivering = false;
            m_flushCV.notify_all();
        }

        void runWorker() {
            std::unique_lock<std::mutex> lock(m_mutex);
            std::vector<DeliveryReport> cycleFailures;
            // Requeued batches are retried once per flush cycle so a dead
            // endpoint cannot keep a flush spinning.
            uint64_t requeueTriedFor = 0;
            for (;;) {
                m_timerDirty = false;
                if (m_live->expired(Clock::now(), m_opts.maxLogLifetime)) {
                    sealLiveLocked();
                }

                const uint64_t flushTarget = m_flushRequested;
                const bool flushing = flushTarget > m_flushCompleted;
                const bool finalPass = m_stopping;
                if (flushing || finalPass) {
                    sealLiveLocked();
                }

                bool requeueDue = m_requeuedBatches > 0
                    && (!m_sealed.empty() || finalPass
                        || (flushing && requeueTriedFor != flushTarget));
                if (!m_sealed.empty() || requeueDue) {
                    if (flushing) requeueTriedFor = flushTarget;
                    std::deque<SealedBatch> work;
                    work.swap(m_sealed);
                    m_delivering = true;
                    lock.unlock();

                    std::vector<DeliveryReport> failures;
                    std::vector<LabelSet> resolved;
                    size_t released = deliverAll(work, finalPass, failures, resolved);

                    lock.lock();
                    m_delivering = false;
                    m_bufferedEntries -= released;
                    m_requeuedBatches = m_requeued.size();
                    releaseWatermarksLocked(resolved);
                    if (flushing || finalPass || m_flushRequested > m_flushCompleted) {
                        cycleFailures.insert(cycleFailures.end(), failures.begin(), failures.end());
                    }
                    continue;
                }

                if (flushing) {
                    completeFlushLocked(flushTarget, cycleFailures);
                    cycleFailures.clear();
                    continue;
                }
                if (finalPass) break;

                if (m_live->empty()) {
                    m_workCV.wait(lock, [this] { return shouldWakeLocked(); });
                } else {
                    Clock::time_point deadline = m_live->firstEntryTime() + m_opts.maxLogLifetime;
                    m_workCV.wait_until(lock, deadline, [this] { return shouldWakeLocked(); });
                }
            }
        }

        /// Deliver requeued batches first, then `work` in seal order.
        /// Runs without the lock. Returns the number of entries that left
        /// the buffer (delivered or dropped); the LabelSets of those batches
        /// are appended to `resolved`.
        size_t deliverAll(std::deque<SealedBatch>& work, bool finalPass,
                          std::vector<DeliveryReport>& failures,
                          std::vector<LabelSet>& resolved) {
            size_t released = 0;

            std::deque<RequeuedBatch> retry;
            retry.swap(m_requeued);
            for (size_t i = 0; i < retry.size(); ++i) {
                released += deliverPayload(std::move(retry[i].payload), std::move(retry[i].labels),
                                           finalPass, failures, resolved);
            }

            while (!work.empty()) {
                SealedBatch batch = std::move(work.front());
                work.pop_front();
                std::vector<LabelSet> labels = labelsOf(batch);
                std::unique_ptr<PushPayload> payload;
                try {
                    payload.reset(new PushPayload(m_encoder.encode(batch)));
                } catch (const std::exception& e) {
                    DeliveryReport report;
                    report.generation = batch.generation();
                    report.streams = batch.streamCount();
                    report.entries = batch.entryCount();
                    report.permanent = true;
                    report.message = std::string("encoding failed: ") + e.what();
                    dropBatch(report, failures);
                    released += batch.entryCount();
                    resolved.insert(resolved.end(), labels.begin(), labels.end());
                    continue;
                }
                released += deliverPayload(std::move(*payload), std::move(labels),
                                           finalPass, failures, resolved);
            }
            return released;
        }

        size_t deliverPayload(PushPayload payload, std::vector<LabelSet> labels, bool finalPass,
                              std::vector<DeliveryReport>& failures,
                              std::vector<LabelSet>& resolved) {
            DeliveryOutcome outcome = m_sender->deliver(payload);
            if (outcome.delivered) {
                m_counters.batchesDelivered.fetch_add(1, std::memory_order_relaxed);
                m_counters.entriesDelivered.fetch_add(payload.entryCount(), std::memory_order_relaxed);
                resolved.insert(resolved.end(), labels.begin(), labels.end());
                return payload.entryCount();
            }

            DeliveryReport report;
            report.generation = payload.generation();
            report.streams = payload.streamCount();
            report.entries = payload.entryCount();
            report.attempts = outcome.attempts;
            report.statusCode = outcome.statusCode;
            report.permanent = outcome.permanent;
            report.message = outcome.message;

            bool requeue = m_opts.exhaustedPolicy == ExhaustedPolicy::Requeue
                && !outcome.permanent && !outcome.aborted && !finalPass;
            if (!requeue) {
                dropBatch(report, failures);
                resolved.insert(resolved.end(), labels.begin(), labels.end());
                return payload.entryCount();
            }

            size_t released = 0;
            if (m_requeued.size() >= m_opts.maxRequeuedBatches) {
                const PushPayload& oldest = m_requeued.front().payload;
                DeliveryReport evicted;
                evicted.generation = oldest.generation();
                evicted.streams = oldest.streamCount();
                evicted.entries = oldest.entryCount();
                evicted.message = "requeue limit reached; oldest batch evicted";
                released += oldest.entryCount();
                resolved.insert(resolved.end(), m_requeued.front().labels.begin(),
                                m_requeued.front().labels.end());
                m_requeued.pop_front();
                dropBatch(evicted, failures);
            }
            report.requeued = true;
            m_counters.batchesRequeued.fetch_add(1, std::memory_order_relaxed);
            m_requeued.push_back(RequeuedBatch(std::move(payload), std::move(labels)));
            failures.push_back(report);
            reportDeliveryError(report);
            return released;
        }

        void dropBatch(const DeliveryReport& report, std::vector<DeliveryReport>& failures) {
            m_counters.batchesFailed.fetch_add(1, std::memory_order_relaxed);
            m_counters.entriesDropped.fetch_add(report.entries, std::memory_order_relaxed);
            failures.push_back(report);
            reportDeliveryError(report);
        }

        void reportDeliveryError(const DeliveryReport& report) {
            if (m_opts.onDeliveryError) {
                try {
                    m_opts.onDeliveryError(report);
                    return;
                } catch (const std::exception& e) {
                    std::fprintf(stderr, "[LokiShip][Shipper] delivery error handler threw: %s\n", e.what());
                }
            }
            std::fprintf(stderr, "[LokiShip][Shipper] push of %zu entries (generation %llu) failed "
                                 "after %zu attempt(s): %s; %s\n",
                         report.entries, static_cast<unsigned long long>(report.generation),
                         report.attempts, report.message.c_str(),
                         report.requeued ? "requeued" : "dropped");
        }

        void reportFormatError(const FormatError& error, const LogRecord& record) {
            m_counters.formatErrors.fetch_add(1, std::memory_order_relaxed);
            if (m_opts.onFormatError) {
                try {
                    m_opts.onFormatError(error, record);
                    return;
                } catch (const std::exception& e) {
                    std::fprintf(stderr, "[LokiShip][Shipper] format error handler threw: %s\n", e.what());
                }
            }
            std::fprintf(stderr, "[LokiShip][Shipper] dropped record that failed to format: %s\n",
                         error.what());
        }

        ShipperOptions m_opts;
        std::unique_ptr<IFormatter> m_formatter;
        StreamRouter m_router;
        PushEncoder m_encoder;
        std::unique_ptr<ITransport> m_transport;
        std::unique_ptr<BatchSender> m_sender;

        // Guarded by m_mutex.
        mutable std::mutex m_mutex;
        std::condition_variable m_workCV;
        std::condition_variable m_flushCV;
        std::unique_ptr<GenerationBuffer> m_live;
        std::deque<SealedBatch> m_sealed;
        std::map<LabelSet, Watermark> m_watermarks;
        uint64_t m_nextGeneration;
        size_t m_bufferedEntries;
        size_t m_requeuedBatches;
        uint64_t m_flushRequested;
        uint64_t m_flushCompleted;
        std::map<uint64_t, FlushResult> m_flushResults;
        bool m_started;
        bool m_stopping;
        bool m_stopped;
        bool m_workerExited;
        bool m_delivering;
        bool m_timerDirty;

        // Worker thread only.
        std::deque<RequeuedBatch> m_requeued;

        std::atomic<bool> m_accepting;
        bool m_overflowWarned;
        Counters m_counters;
        std::thread m_worker;
    };

} // namespace lokiship

#endif // LOKISHIP_SHIPPER_HPP
