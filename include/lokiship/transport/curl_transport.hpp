#ifndef LOKISHIP_CURL_TRANSPORT_HPP
#define LOKISHIP_CURL_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "../core/log_common.hpp"
#include "../core/endpoint.hpp"
#include <curl/curl.h>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include <cctype>
#include <cstring>
#include <algorithm>
#include <stdexcept>

namespace lokiship {

    /// TLS settings for the push connection. Empty paths leave libcurl's
    /// defaults in place.
    struct TlsOptions {
        std::string clientCertPath;   ///< PEM client certificate for mutual TLS
        std::string clientKeyPath;    ///< PEM private key for the client certificate
        std::string keyPassword;      ///< passphrase for clientKeyPath, if encrypted
        std::string caInfoPath;       ///< CA bundle file replacing the system trust store
        std::string caPath;           ///< directory of hashed CA certificates
        bool verifyPeer;

        TlsOptions() : verifyPeer(true) {}

        TlsOptions& setClientIdentity(const std::string& cert, const std::string& key,
                                      const std::string& password = std::string()) {
            clientCertPath = cert;
            clientKeyPath = key;
            keyPassword = password;
            return *this;
        }
        TlsOptions& setCaInfo(const std::string& path) { caInfoPath = path; return *this; }
        TlsOptions& setCaPath(const std::string& path) { caPath = path; return *this; }
        TlsOptions& setVerifyPeer(bool v) { verifyPeer = v; return *this; }

        bool mutualTls() const { return !clientCertPath.empty(); }
    };

    /// Connection settings for CurlTransport.
    struct CurlTransportOptions {
        std::string url;
        std::map<std::string, std::string> headers;
        size_t timeoutMs;
        size_t connectTimeoutMs;
        std::string basicAuthUser;      ///< empty disables HTTP basic auth
        std::string basicAuthPassword;
        TlsOptions tls;

        explicit CurlTransportOptions(const std::string& url_ = std::string())
            : url(url_)
            , timeoutMs(30000)
            , connectTimeoutMs(10000) {}
    };

namespace detail {

    inline bool equalsIgnoreCase(const std::string& a, const char* b) {
        size_t n = std::strlen(b);
        if (a.size() != n) return false;
        for (size_t i = 0; i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i]))
                    != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    /// Header lines for one push request. Content-Type and Content-Encoding
    /// are owned by the payload and cannot be overridden; a user header
    /// replaces the default User-Agent. Headers with control characters in
    /// the name or value are skipped.
    inline std::vector<std::string> buildPushHeaders(
            const std::map<std::string, std::string>& userHeaders, bool gzipped) {
        std::vector<std::string> lines;
        lines.push_back("Content-Type: application/json");
        if (gzipped) {
            lines.push_back("Content-Encoding: gzip");
        }
        // Empty Expect suppresses curl's 100-continue round trip.
        lines.push_back("Expect:");

        bool userAgentSet = false;
        for (std::map<std::string, std::string>::const_iterator it = userHeaders.begin();
             it != userHeaders.end(); ++it) {
            if (it->first.empty()) continue;
            if (hasControlChars(it->first) || hasControlChars(it->second)) continue;
            if (equalsIgnoreCase(it->first, "Content-Type")
                    || equalsIgnoreCase(it->first, "Content-Encoding")
                    || equalsIgnoreCase(it->first, "Content-Length")) {
                continue;
            }
            if (equalsIgnoreCase(it->first, "User-Agent")) userAgentSet = true;
            lines.push_back(it->first + ": " + it->second);
        }
        if (!userAgentSet) {
            lines.push_back("User-Agent: LokiShip/1.0");
        }
        return lines;
    }

    /// curl_global_init must run once before any handle is created and is
    /// not thread-safe itself; a function-local static serializes it.
    inline void ensureCurlInitialized() {
        struct CurlGlobal {
            CURLcode rc;
            CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
        };
        static CurlGlobal global;
        if (global.rc != CURLE_OK) {
            throw std::runtime_error(std::string("CurlTransport: curl_global_init failed: ")
                                     + curl_easy_strerror(global.rc));
        }
    }

    struct CurlHandleDeleter {
        void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); }
    };

    struct CurlSlistGuard {
        struct curl_slist* list;
        CurlSlistGuard() : list(nullptr) {}
        ~CurlSlistGuard() { if (list) curl_slist_free_all(list); }
        CurlSlistGuard(const CurlSlistGuard&) = delete;
        CurlSlistGuard& operator=(const CurlSlistGuard&) = delete;

        void append(const std::string& line) {
            struct curl_slist* next = curl_slist_append(list, line.c_str());
            if (!next) throw std::bad_alloc();
            list = next;
        }
    };

    /// Keeps at most the first 512 bytes of the response for error messages.
    inline size_t captureResponse(char* data, size_t size, size_t nmemb, void* userp) {
        size_t total = size * nmemb;
        std::string* out = static_cast<std::string*>(userp);
        if (out->size() < 512) {
            out->append(data, std::min(total, static_cast<size_t>(512) - out->size()));
        }
        return total;
    }

    inline int abortOnCancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const std::atomic<bool>* cancelled = static_cast<const std::atomic<bool>*>(clientp);
        return cancelled->load(std::memory_order_acquire) ? 1 : 0;
    }

    /// Local setup failures that another attempt cannot fix.
    inline bool isPermanentCurlError(CURLcode rc) {
        switch (rc) {
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_ABORTED_BY_CALLBACK:
                return true;
            default:
                return false;
        }
    }

} // namespace detail

    /// HTTP(S) push transport on top of libcurl.
    ///
    /// One easy handle is reused across requests so keep-alive connections
    /// survive between batches. TLS client identity and trust-store overrides
    /// come from TlsOptions.
    ///
    /// @code
    ///   CurlTransportOptions opts("https://loki.example.com/loki/api/v1/push");
    ///   opts.headers["X-Scope-OrgID"] = "tenant-1";
    ///   opts.tls.setClientIdentity("/etc/ssl/client.pem", "/etc/ssl/client.key")
    ///           .setCaInfo("/etc/ssl/loki-ca.pem");
    ///   CurlTransport transport(opts);
    /// @endcode
    class CurlTransport : public ITransport {
    public:
        explicit CurlTransport(CurlTransportOptions opts)
            : m_opts(std::move(opts))
            , m_cancelled(false)
        {
            std::string problem = detail::endpointProblem(m_opts.url);
            if (!problem.empty()) {
                throw std::invalid_argument("CurlTransport: invalid URL " + m_opts.url + ": " + problem);
            }
            detail::ensureCurlInitialized();
            m_handle.reset(curl_easy_init());
            if (!m_handle) {
                throw std::runtime_error("CurlTransport: curl_easy_init failed");
            }
        }

        long send(const PushPayload& payload) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_cancelled.load(std::memory_order_acquire)) {
                throw TransportError("push cancelled", false);
            }

            CURL* h = m_handle.get();
            curl_easy_reset(h);

            detail::CurlSlistGuard headers;
            std::vector<std::string> lines = detail::buildPushHeaders(m_opts.headers, payload.gzipped());
            for (size_t i = 0; i < lines.size(); ++i) {
                headers.append(lines[i]);
            }

            std::string response;
            char errorBuf[CURL_ERROR_SIZE];
            errorBuf[0] = '\0';

            curl_easy_setopt(h, CURLOPT_URL, m_opts.url.c_str());
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.body().data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(payload.body().size()));
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
            curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(m_opts.timeoutMs));
            curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_opts.connectTimeoutMs));
            // Timeouts via signals are unsafe with a worker thread.
            curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, detail::captureResponse);
            curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
            curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errorBuf);
            curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, detail::abortOnCancel);
            curl_easy_setopt(h, CURLOPT_XFERINFODATA, &m_cancelled);
            if (!m_opts.basicAuthUser.empty()) {
                curl_easy_setopt(h, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
                curl_easy_setopt(h, CURLOPT_USERNAME, m_opts.basicAuthUser.c_str());
                curl_easy_setopt(h, CURLOPT_PASSWORD, m_opts.basicAuthPassword.c_str());
            }
            applyTls(h);

            CURLcode rc = curl_easy_perform(h);
            if (rc != CURLE_OK) {
                std::string msg = std::string("curl: ") + curl_easy_strerror(rc);
                if (errorBuf[0] != '\0') {
                    msg += " (";
                    msg += errorBuf;
                    msg += ")";
                }
                throw TransportError(msg, !detail::isPermanentCurlError(rc));
            }

            long status = 0;
            curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
            if (!detail::isSuccessStatus(status)) {
                detail::throwForStatus(status, response);
            }
            return status;
        }

        void cancel() override {
            m_cancelled.store(true, std::memory_order_release);
        }

        const CurlTransportOptions& options() const { return m_opts; }

    private:
        void applyTls(CURL* h) {
            const TlsOptions& tls = m_opts.tls;
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, tls.verifyPeer ? 1L : 0L);
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, tls.verifyPeer ? 2L : 0L);
            if (!tls.clientCertPath.empty()) {
                curl_easy_setopt(h, CURLOPT_SSLCERT, tls.clientCertPath.c_str());
                curl_easy_setopt(h, CURLOPT_SSLCERTTYPE, "PEM");
            }
            if (!tls.clientKeyPath.empty()) {
                curl_easy_setopt(h, CURLOPT_SSLKEY, tls.clientKeyPath.c_str());
                curl_easy_setopt(h, CURLOPT_SSLKEYTYPE, "PEM");
            }
            if (!tls.keyPassword.empty()) {
                curl_easy_setopt(h, CURLOPT_KEYPASSWD, tls.keyPassword.c_str());
            }
            if (!tls.caInfoPath.empty()) {
                curl_easy_setopt(h, CURLOPT_CAINFO, tls.caInfoPath.c_str());
            }
            if (!tls.caPath.empty()) {
                curl_easy_setopt(h, CURLOPT_CAPATH, tls.caPath.c_str());
            }
        }

        CurlTransportOptions m_opts;
        std::unique_ptr<CURL, detail::CurlHandleDeleter> m_handle;
        std::mutex m_mutex;
        std::atomic<bool> m_cancelled;
    };

} // namespace lokiship

#endif // LOKISHIP_CURL_TRANSPORT_HPP
