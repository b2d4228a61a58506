#ifndef LOKISHIP_COMMON_HPP
#define LOKISHIP_COMMON_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

namespace lokiship {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    /// Nanoseconds since the Unix epoch for a wall-clock time point.
    inline int64_t toUnixNanos(const std::chrono::system_clock::time_point &time) {
        return static_cast<int64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count());
    }

    inline int64_t unixNanosNow() {
        return toUnixNanos(std::chrono::system_clock::now());
    }

    inline bool hasControlChars(const std::string &s) {
        for (size_t i = 0; i < s.size(); ++i) {
            unsigned char ch = static_cast<unsigned char>(s[i]);
            if (ch < 0x20 || ch == 0x7F) return true;
        }
        return false;
    }
} // namespace detail
} // namespace lokiship

#endif // LOKISHIP_COMMON_HPP
