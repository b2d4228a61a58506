#ifndef LOKISHIP_SHIPPER_OPTIONS_HPP
#define LOKISHIP_SHIPPER_OPTIONS_HPP

#include "core/label_set.hpp"
#include "core/log_level.hpp"
#include "core/log_record.hpp"
#include "core/errors.hpp"
#include "core/endpoint.hpp"
#include "core/log_common.hpp"
#include "router/stream_router.hpp"
#include "transport/curl_transport.hpp"
#include "transport/batch_sender.hpp"
#include <string>
#include <map>
#include <chrono>
#include <functional>

namespace lokiship {

    /// What accept() does once the capacity ceiling is reached.
    enum class OverflowPolicy {
        Reject,            ///< throw CapacityError; the record is not buffered
        SealAndContinue    ///< seal the live generation for delivery and admit the record
    };

    /// What happens to a batch whose retries are exhausted.
    enum class ExhaustedPolicy {
        Drop,     ///< report and discard (default)
        Requeue   ///< keep for another delivery pass, up to maxRequeuedBatches
    };

    typedef std::function<void(const DeliveryReport&)> DeliveryErrorHandler;
    typedef std::function<void(const FormatError&, const LogRecord&)> FormatErrorHandler;

    /// Complete configuration of a Shipper.
    ///
    /// Usually filled in through ShipperBuilder; validateOptions() is applied
    /// by the Shipper constructor either way.
    struct ShipperOptions {
        std::string endpoint;
        LabelSet labels;
        std::map<std::string, std::string> headers;
        std::string basicAuthUser;
        std::string basicAuthPassword;
        TlsOptions tls;
        bool gzip;
        LogLevel minLevel;
        RouterOptions routing;

        size_t maxLogs;                           ///< seal when a generation holds this many entries
        std::chrono::milliseconds maxLogLifetime; ///< seal when the first entry is this old
        size_t capacity;                          ///< buffered-entry ceiling, 0 = unbounded
        OverflowPolicy overflowPolicy;

        RetryPolicy retry;
        ExhaustedPolicy exhaustedPolicy;
        size_t maxRequeuedBatches;

        size_t timeoutMs;                         ///< per-request HTTP timeout
        std::chrono::milliseconds flushGrace;     ///< default grace for flush()/shutdown()

        DeliveryErrorHandler onDeliveryError;
        FormatErrorHandler onFormatError;

        ShipperOptions()
            : gzip(false)
            , minLevel(LogLevel::TRACE)
            , maxLogs(4096)
            , maxLogLifetime(std::chrono::seconds(300))
            , capacity(0)
            , overflowPolicy(OverflowPolicy::Reject)
            , exhaustedPolicy(ExhaustedPolicy::Drop)
            , maxRequeuedBatches(8)
            , timeoutMs(30000)
            , flushGrace(std::chrono::seconds(60)) {}

        CurlTransportOptions transportOptions() const {
            CurlTransportOptions t(endpoint);
            t.headers = headers;
            t.timeoutMs = timeoutMs;
            t.basicAuthUser = basicAuthUser;
            t.basicAuthPassword = basicAuthPassword;
            t.tls = tls;
            return t;
        }
    };

    /// Throws ConfigError naming the first invalid or contradictory setting.
    inline void validateOptions(const ShipperOptions& opts) {
        std::string problem = detail::endpointProblem(opts.endpoint);
        if (!problem.empty()) {
            throw ConfigError("invalid endpoint URL '" + opts.endpoint + "': " + problem);
        }
        if (opts.labels.empty()) {
            throw ConfigError("at least one global label is required");
        }
        for (LabelSet::const_iterator it = opts.labels.begin(); it != opts.labels.end(); ++it) {
            if (!detail::isValidLabelName(it->first)) {
                throw ConfigError("invalid label name '" + it->first + "'");
            }
            if (it->second.empty()) {
                throw ConfigError("label '" + it->first + "' has an empty value");
            }
        }
        for (std::set<std::string>::const_iterator it = opts.routing.labelKeys.begin();
             it != opts.routing.labelKeys.end(); ++it) {
            if (!detail::isValidLabelName(*it)) {
                throw ConfigError("field '" + *it + "' cannot be promoted to a label");
            }
        }
        for (std::map<std::string, std::string>::const_iterator it = opts.headers.begin();
             it != opts.headers.end(); ++it) {
            if (it->first.empty() || detail::hasControlChars(it->first)
                    || detail::hasControlChars(it->second)) {
                throw ConfigError("header '" + it->first + "' contains invalid characters");
            }
        }
        if (opts.maxLogs == 0) {
            throw ConfigError("maxLogs must be at least 1");
        }
        if (opts.maxLogLifetime.count() <= 0) {
            throw ConfigError("maxLogLifetime must be positive");
        }
        if (opts.capacity != 0 && opts.capacity < opts.maxLogs) {
            throw ConfigError("capacity (" + std::to_string(opts.capacity)
                + ") is below maxLogs (" + std::to_string(opts.maxLogs) + ")");
        }
        if (opts.retry.multiplier < 1.0) {
            throw ConfigError("retry backoff multiplier must be >= 1");
        }
        if (opts.retry.initialBackoffMs > opts.retry.maxBackoffMs) {
            throw ConfigError("initial retry backoff exceeds the maximum backoff");
        }
        if (opts.exhaustedPolicy == ExhaustedPolicy::Requeue && opts.maxRequeuedBatches == 0) {
            throw ConfigError("requeue policy needs maxRequeuedBatches >= 1");
        }
        if (opts.timeoutMs == 0) {
            throw ConfigError("request timeout must be positive");
        }
        if (opts.flushGrace.count() <= 0) {
            throw ConfigError("flush grace period must be positive");
        }
        if (!opts.tls.clientKeyPath.empty() && opts.tls.clientCertPath.empty()) {
            throw ConfigError("TLS client key given without a client certificate");
        }
    }

} // namespace lokiship

#endif // LOKISHIP_SHIPPER_OPTIONS_HPP
