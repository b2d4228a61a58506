#ifndef LOKISHIP_FORMATTER_INTERFACE_HPP
#define LOKISHIP_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace lokiship {

    /// Renders one record into the line text stored in a stream entry.
    ///
    /// Implementations must be deterministic and safe to call from several
    /// producer threads at once. A record that cannot be rendered is
    /// signalled by throwing FormatError; the shipper drops that record and
    /// keeps going.
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace lokiship

#endif // LOKISHIP_FORMATTER_INTERFACE_HPP
