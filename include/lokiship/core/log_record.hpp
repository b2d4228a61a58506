#ifndef LOKISHIP_RECORD_HPP
#define LOKISHIP_RECORD_HPP

#include "log_level.hpp"
#include "log_common.hpp"
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace lokiship {

    /// One discrete log event handed to Shipper::accept().
    ///
    /// Fields keep their insertion order; formatters render them in that
    /// order. Values are already stringified scalars.
    struct LogRecord {
        int64_t timestampNs;
        LogLevel level;
        std::string message;
        std::vector<std::pair<std::string, std::string> > fields;
        std::string target;
        std::string modulePath;
        std::string file;
        unsigned int line;

        LogRecord()
            : timestampNs(detail::unixNanosNow())
            , level(LogLevel::INFO)
            , line(0) {}

        LogRecord(LogLevel lvl, std::string msg)
            : timestampNs(detail::unixNanosNow())
            , level(lvl)
            , message(std::move(msg))
            , line(0) {}

        LogRecord& withField(const std::string& key, const std::string& value) {
            fields.push_back(std::make_pair(key, value));
            return *this;
        }

        LogRecord& withTarget(const std::string& t) {
            target = t;
            return *this;
        }

        LogRecord& withModule(const std::string& m) {
            modulePath = m;
            return *this;
        }

        LogRecord& withLocation(const std::string& f, unsigned int l) {
            file = f;
            line = l;
            return *this;
        }

        LogRecord& withTimestamp(int64_t ns) {
            timestampNs = ns;
            return *this;
        }
    };

} // namespace lokiship

#endif // LOKISHIP_RECORD_HPP
