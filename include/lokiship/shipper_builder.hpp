#ifndef LOKISHIP_SHIPPER_BUILDER_HPP
#define LOKISHIP_SHIPPER_BUILDER_HPP

#include "shipper.hpp"
#include "shipper_options.hpp"
#include "core/log_common.hpp"
#include "formatter/formatter_interface.hpp"
#include "transport/transport_interface.hpp"
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <type_traits>
#include <stdexcept>

namespace lokiship {

    /// Fluent configuration for a Shipper.
    ///
    /// @code
    ///   auto shipper = ShipperBuilder("https://loki.internal/loki/api/v1/push",
    ///                                 LabelSet{{"app", "api"}, {"env", "prod"}})
    ///       .tenant("team-a")
    ///       .compression(true)
    ///       .formatter<LogfmtFormatter>()
    ///       .mergeFieldsAsLabels({"region"})
    ///       .maxLogs(1000)
    ///       .build();
    /// @endcode
    ///
    /// Settings are stored as given; build() validates them all at once and
    /// returns an unstarted shipper.
    class ShipperBuilder {
    public:
        ShipperBuilder(const std::string& endpoint, LabelSet labels)
            : m_built(false) {
            m_opts.endpoint = endpoint;
            m_opts.labels = std::move(labels);
        }

        ShipperBuilder(const ShipperBuilder&) = delete;
        ShipperBuilder& operator=(const ShipperBuilder&) = delete;
        ShipperBuilder(ShipperBuilder&&) = default;
        ShipperBuilder& operator=(ShipperBuilder&&) = default;

        // ------------------------------------------------------------------
        //  Request
        // ------------------------------------------------------------------

        ShipperBuilder& header(const std::string& name, const std::string& value) {
            m_opts.headers[name] = value;
            return *this;
        }

        ShipperBuilder& basicAuth(const std::string& user, const std::string& password) {
            m_opts.basicAuthUser = user;
            m_opts.basicAuthPassword = password;
            return *this;
        }

        ShipperBuilder& bearerToken(const std::string& token) {
            return header("Authorization", "Bearer " + token);
        }

        /// Loki multi-tenancy (X-Scope-OrgID).
        ShipperBuilder& tenant(const std::string& orgId) {
            return header("X-Scope-OrgID", orgId);
        }

        ShipperBuilder& tls(TlsOptions options) {
            m_opts.tls = std::move(options);
            return *this;
        }

        ShipperBuilder& compression(bool gzip) {
            m_opts.gzip = gzip;
            return *this;
        }

        ShipperBuilder& timeout(std::chrono::milliseconds perRequest) {
            m_opts.timeoutMs = perRequest.count() > 0 ? static_cast<size_t>(perRequest.count()) : 0;
            return *this;
        }

        /// Replace the libcurl transport, e.g. with an in-memory one.
        ShipperBuilder& transport(std::unique_ptr<ITransport> t) {
            m_transport = std::move(t);
            return *this;
        }

        // ------------------------------------------------------------------
        //  Records
        // ------------------------------------------------------------------

        ShipperBuilder& formatter(std::unique_ptr<IFormatter> f) {
            m_formatter = std::move(f);
            return *this;
        }

        template<typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<IFormatter, FormatterType>::value,
            ShipperBuilder&
        >::type
        formatter(Args&&... args) {
            m_formatter = detail::make_unique<FormatterType>(std::forward<Args>(args)...);
            return *this;
        }

        ShipperBuilder& minLevel(LogLevel level) {
            m_opts.minLevel = level;
            return *this;
        }

        /// Promote the named structured fields into the stream's labels.
        ShipperBuilder& mergeFieldsAsLabels(const std::vector<std::string>& keys) {
            m_opts.routing.setMergeFields(true);
            for (size_t i = 0; i < keys.size(); ++i) {
                m_opts.routing.addLabelKey(keys[i]);
            }
            return *this;
        }

        ShipperBuilder& labelOverride(LabelOverride policy) {
            m_opts.routing.setOverridePolicy(policy);
            return *this;
        }

        // ------------------------------------------------------------------
        //  Buffering
        // ------------------------------------------------------------------

        ShipperBuilder& maxLogs(size_t n) {
            m_opts.maxLogs = n;
            return *this;
        }

        ShipperBuilder& maxLogLifetime(std::chrono::milliseconds lifetime) {
            m_opts.maxLogLifetime = lifetime;
            return *this;
        }

        /// Ceiling on entries held anywhere in the shipper; 0 disables it.
        ShipperBuilder& capacity(size_t entries, OverflowPolicy policy = OverflowPolicy::Reject) {
            m_opts.capacity = entries;
            m_opts.overflowPolicy = policy;
            return *this;
        }

        // ------------------------------------------------------------------
        //  Delivery
        // ------------------------------------------------------------------

        ShipperBuilder& retry(RetryPolicy policy) {
            m_opts.retry = policy;
            return *this;
        }

        ShipperBuilder& onRetriesExhausted(ExhaustedPolicy policy, size_t maxRequeued = 8) {
            m_opts.exhaustedPolicy = policy;
            m_opts.maxRequeuedBatches = maxRequeued;
            return *this;
        }

        ShipperBuilder& flushGrace(std::chrono::milliseconds grace) {
            m_opts.flushGrace = grace;
            return *this;
        }

        ShipperBuilder& onDeliveryError(DeliveryErrorHandler handler) {
            m_opts.onDeliveryError = std::move(handler);
            return *this;
        }

        ShipperBuilder& onFormatError(FormatErrorHandler handler) {
            m_opts.onFormatError = std::move(handler);
            return *this;
        }

        const ShipperOptions& options() const { return m_opts; }

        // ------------------------------------------------------------------
        //  build()
        // ------------------------------------------------------------------

        /// Validate the configuration and construct the shipper. The worker
        /// is not running until Shipper::start().
        ///
        /// @throws ConfigError naming the first invalid setting.
        /// @throws std::logic_error if called more than once.
        std::unique_ptr<Shipper> build() {
            if (m_built) {
                throw std::logic_error("ShipperBuilder::build() called more than once");
            }
            if (!m_formatter) {
                throw ConfigError("a formatter is required");
            }
            validateOptions(m_opts);
            m_built = true;
            return detail::make_unique<Shipper>(std::move(m_opts), std::move(m_formatter),
                                                std::move(m_transport));
        }

    private:
        ShipperOptions m_opts;
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
        bool m_built;
    };

} // namespace lokiship

#endif // LOKISHIP_SHIPPER_BUILDER_HPP
