#ifndef LOKISHIP_BATCH_SENDER_HPP
#define LOKISHIP_BATCH_SENDER_HPP

#include "transport_interface.hpp"
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>

namespace lokiship {

    /// Bounded exponential backoff for retryable push failures.
    ///
    /// The wait before retry k (1-based) is
    /// min(initialBackoffMs * multiplier^(k-1), maxBackoffMs).
    struct RetryPolicy {
        size_t maxRetries;         ///< retries after the first attempt
        size_t initialBackoffMs;
        double multiplier;
        size_t maxBackoffMs;

        RetryPolicy()
            : maxRetries(6)
            , initialBackoffMs(1000)
            , multiplier(2.0)
            , maxBackoffMs(60000) {}

        RetryPolicy& setMaxRetries(size_t n) { maxRetries = n; return *this; }
        RetryPolicy& setInitialBackoffMs(size_t ms) { initialBackoffMs = ms; return *this; }
        RetryPolicy& setMultiplier(double m) { multiplier = m; return *this; }
        RetryPolicy& setMaxBackoffMs(size_t ms) { maxBackoffMs = ms; return *this; }

        std::chrono::milliseconds backoffFor(size_t retry) const {
            double delay = static_cast<double>(initialBackoffMs);
            for (size_t i = 1; i < retry && delay < static_cast<double>(maxBackoffMs); ++i) {
                delay *= multiplier;
            }
            if (delay > static_cast<double>(maxBackoffMs)) {
                delay = static_cast<double>(maxBackoffMs);
            }
            return std::chrono::milliseconds(static_cast<long long>(delay));
        }
    };

    /// Result of pushing one payload through the retry loop.
    struct DeliveryOutcome {
        bool delivered;
        bool permanent;    ///< stopped on a non-retryable failure
        bool aborted;      ///< stopped because abort() was called
        size_t attempts;
        long statusCode;   ///< last HTTP status seen, 0 if none
        std::string message;

        DeliveryOutcome()
            : delivered(false), permanent(false), aborted(false)
            , attempts(0), statusCode(0) {}
    };

    /// Drives ITransport::send() through the retry policy for one payload
    /// at a time. deliver() runs on the worker thread; abort() may be called
    /// from any thread and ends the current and all later deliveries quickly.
    class BatchSender {
    public:
        BatchSender(ITransport& transport, RetryPolicy policy)
            : m_transport(transport)
            , m_policy(policy)
            , m_aborted(false)
            , m_requests(0) {}

        BatchSender(const BatchSender&) = delete;
        BatchSender& operator=(const BatchSender&) = delete;

        DeliveryOutcome deliver(const PushPayload& payload) {
            DeliveryOutcome outcome;
            for (size_t attempt = 0; attempt <= m_policy.maxRetries; ++attempt) {
                if (isAborted()) {
                    outcome.aborted = true;
                    if (outcome.message.empty()) outcome.message = "delivery aborted";
                    return outcome;
                }
                if (attempt > 0 && !waitBackoff(m_policy.backoffFor(attempt))) {
                    outcome.aborted = true;
                    return outcome;
                }

                ++outcome.attempts;
                m_requests.fetch_add(1, std::memory_order_relaxed);
                try {
                    outcome.statusCode = m_transport.send(payload);
                    outcome.delivered = true;
                    return outcome;
                } catch (const TransportError& e) {
                    outcome.statusCode = e.statusCode();
                    outcome.message = e.what();
                    if (!e.retryable()) {
                        outcome.permanent = true;
                        outcome.aborted = isAborted();
                        return outcome;
                    }
                } catch (const std::exception& e) {
                    // Anything else out of a transport is treated as a
                    // network-level failure.
                    outcome.statusCode = 0;
                    outcome.message = e.what();
                }
            }
            return outcome;
        }

        void abort() {
            {
                std::lock_guard<std::mutex> lock(m_waitMutex);
                m_aborted.store(true, std::memory_order_release);
            }
            m_waitCV.notify_all();
            m_transport.cancel();
        }

        bool isAborted() const { return m_aborted.load(std::memory_order_acquire); }

        /// HTTP requests issued so far, retries included.
        size_t requestCount() const { return m_requests.load(std::memory_order_relaxed); }

        const RetryPolicy& policy() const { return m_policy; }

    private:
        /// Sleep for `delay` unless aborted first. Returns false on abort.
        bool waitBackoff(std::chrono::milliseconds delay) {
            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_waitCV.wait_for(lock, delay, [this] { return isAborted(); });
            return !isAborted();
        }

        ITransport& m_transport;
        RetryPolicy m_policy;
        std::mutex m_waitMutex;
        std::condition_variable m_waitCV;
        std::atomic<bool> m_aborted;
        std::atomic<size_t> m_requests;
    };

} // namespace lokiship

#endif // LOKISHIP_BATCH_SENDER_HPP
