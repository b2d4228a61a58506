#ifndef LOKISHIP_ENDPOINT_HPP
#define LOKISHIP_ENDPOINT_HPP

#include <string>
#include <cstdlib>
#include <cctype>

namespace lokiship {
namespace detail {

    /// Checks a push endpoint before it is handed to libcurl.
    ///
    /// Accepts absolute http/https URLs (scheme case-insensitive) with a
    /// non-empty host, an optional port in 1..65535, and no spaces or
    /// control characters anywhere. Bracketed IPv6 hosts are refused.
    /// Returns an empty string when the URL is usable, otherwise the reason.
    inline std::string endpointProblem(const std::string& url) {
        for (size_t i = 0; i < url.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(url[i]);
            if (c <= 0x20 || c == 0x7F) return "contains a space or control character";
        }

        const size_t sep = url.find("://");
        if (sep == std::string::npos) return "missing http:// or https:// scheme";
        std::string scheme;
        for (size_t i = 0; i < sep; ++i) {
            scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url[i])));
        }
        if (scheme != "http" && scheme != "https") return "unsupported scheme '" + scheme + "'";

        const size_t authStart = sep + 3;
        const size_t authEnd = url.find_first_of("/?#", authStart);
        const std::string authority = url.substr(authStart,
            authEnd == std::string::npos ? std::string::npos : authEnd - authStart);
        if (authority.empty()) return "missing host";
        if (authority[0] == '[') return "IPv6 hosts are not supported";

        const size_t colon = authority.find(':');
        if (colon == 0) return "missing host";
        if (colon != std::string::npos) {
            const std::string port = authority.substr(colon + 1);
            char* end = nullptr;
            long n = std::strtol(port.c_str(), &end, 10);
            if (port.empty() || *end != '\0' || n < 1 || n > 65535) {
                return "invalid port '" + port + "'";
            }
        }
        return std::string();
    }

} // namespace detail
} // namespace lokiship

#endif // LOKISHIP_ENDPOINT_HPP
