#ifndef LOKISHIP_TRANSPORT_INTERFACE_HPP
#define LOKISHIP_TRANSPORT_INTERFACE_HPP

#include "../encoder/push_payload.hpp"
#include "../core/errors.hpp"
#include <string>

namespace lokiship {

    /// Performs one HTTP push of an encoded payload.
    ///
    /// send() returns the 2xx status on success and throws TransportError
    /// otherwise; retryable() on the error drives the retry loop. Called
    /// only from the shipper's worker thread.
    class ITransport {
    public:
        virtual ~ITransport() = default;

        virtual long send(const PushPayload& payload) = 0;

        /// Abort any in-flight request and fail later ones fast. Called from
        /// another thread when a shutdown grace period runs out.
        virtual void cancel() {}
    };

namespace detail {

    /// 408 Request Timeout and 429 Too Many Requests are worth retrying,
    /// as is any 5xx. Every other non-2xx status is permanent.
    inline bool isRetryableStatus(long status) {
        return status == 408 || status == 429 || status >= 500;
    }

    inline bool isSuccessStatus(long status) {
        return status >= 200 && status < 300;
    }

    /// Throw the TransportError matching a non-2xx response.
    inline void throwForStatus(long status, const std::string& responseBody) {
        std::string msg = "HTTP " + std::to_string(status);
        if (!responseBody.empty()) {
            msg += ": " + responseBody;
        }
        throw TransportError(msg, isRetryableStatus(status), status);
    }

} // namespace detail
} // namespace lokiship

#endif // LOKISHIP_TRANSPORT_INTERFACE_HPP
