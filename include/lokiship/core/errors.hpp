#ifndef LOKISHIP_ERRORS_HPP
#define LOKISHIP_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

namespace lokiship {

    /// Invalid or contradictory shipper configuration. Raised by
    /// ShipperBuilder::build(); the shipper is never constructed.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& what)
            : std::invalid_argument("LokiShip config: " + what) {}
    };

    /// accept() refused a record because the capacity ceiling was reached
    /// under OverflowPolicy::Reject.
    class CapacityError : public std::runtime_error {
    public:
        CapacityError(size_t buffered, size_t capacity)
            : std::runtime_error("LokiShip: buffer capacity reached ("
                + std::to_string(buffered) + "/" + std::to_string(capacity) + " entries)")
            , m_buffered(buffered)
            , m_capacity(capacity) {}

        size_t buffered() const { return m_buffered; }
        size_t capacity() const { return m_capacity; }

    private:
        size_t m_buffered;
        size_t m_capacity;
    };

    /// A formatter could not render one record.
    class FormatError : public std::runtime_error {
    public:
        explicit FormatError(const std::string& what) : std::runtime_error(what) {}
    };

    /// One failed HTTP push. Retryable failures feed the backoff loop,
    /// permanent ones end delivery of the batch immediately.
    class TransportError : public std::runtime_error {
    public:
        TransportError(const std::string& what, bool retryable, long statusCode = 0)
            : std::runtime_error(what)
            , m_retryable(retryable)
            , m_statusCode(statusCode) {}

        bool retryable() const { return m_retryable; }

        /// HTTP status, or 0 when no response was received.
        long statusCode() const { return m_statusCode; }

    private:
        bool m_retryable;
        long m_statusCode;
    };

    /// Outcome of delivering one sealed batch that did not succeed.
    struct DeliveryReport {
        uint64_t generation;
        size_t streams;
        size_t entries;
        size_t attempts;
        long statusCode;
        bool permanent;     ///< true for a non-retryable response, false for exhausted retries
        bool requeued;      ///< batch kept for a later attempt instead of dropped
        std::string message;

        DeliveryReport()
            : generation(0), streams(0), entries(0), attempts(0)
            , statusCode(0), permanent(false), requeued(false) {}
    };

    /// Raised by flush()/shutdown() when a batch of that flush cycle failed.
    class DeliveryError : public std::runtime_error {
    public:
        DeliveryError(size_t failedBatches, const DeliveryReport& first)
            : std::runtime_error("LokiShip: " + std::to_string(failedBatches)
                + " batch(es) failed to deliver: " + first.message)
            , m_failedBatches(failedBatches)
            , m_first(first) {}

        size_t failedBatches() const { return m_failedBatches; }
        const DeliveryReport& firstFailure() const { return m_first; }

    private:
        size_t m_failedBatches;
        DeliveryReport m_first;
    };

    /// flush()/shutdown() grace period elapsed before delivery resolved.
    class FlushTimeout : public std::runtime_error {
    public:
        explicit FlushTimeout(const std::string& what) : std::runtime_error(what) {}
    };

} // namespace lokiship

#endif // LOKISHIP_ERRORS_HPP
