#ifndef LOKISHIP_LOGFMT_FORMATTER_HPP
#define LOKISHIP_LOGFMT_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <string>
#include <set>
#include <cstdio>

namespace lokiship {

    /// Which parts of a LogRecord LogfmtFormatter writes, in output order.
    namespace LogfmtFields {
        enum : unsigned {
            Level      = 1u << 0,  ///< `level=info`
            Message    = 1u << 1,  ///< `message=...`, skipped when empty
            Target     = 1u << 2,  ///< `target=...`, skipped when empty
            ModulePath = 1u << 3,  ///< `module=...`, skipped when empty
            File       = 1u << 4,  ///< `file=...`, skipped when empty
            Line       = 1u << 5,  ///< `line=42`, skipped when 0
            Extra      = 1u << 6,  ///< the record's structured fields

            Default = Level | Message | ModulePath | Extra,
            All = Level | Message | Target | ModulePath | File | Line | Extra
        };
    } // namespace LogfmtFields

    /// Formatter producing logfmt (`key=value key2="quoted value"`) lines,
    /// which Loki parses natively with the `| logfmt` stage.
    ///
    /// Keys lose any space, `=` or `"` characters; a key that ends up empty
    /// becomes `_`. When two pairs share a key only the first is written, so
    /// the auto fields win over same-named structured fields.
    ///
    /// @code
    ///   LogfmtFormatter fmt(LogfmtFields::Default | LogfmtFields::Line);
    ///   fmt.format(record); // level=info message="user logged in" user=42
    /// @endcode
    class LogfmtFormatter : public IFormatter {
    public:
        explicit LogfmtFormatter(unsigned fields = LogfmtFields::Default,
                                 bool escapeNewlines = false)
            : m_fields(fields)
            , m_escapeNewlines(escapeNewlines) {}

        std::string format(const LogRecord &record) const override {
            std::string out;
            out.reserve(64 + record.message.size());
            std::set<std::string> used;

            if (m_fields & LogfmtFields::Level) {
                writePair(out, used, "level", getLevelName(record.level));
            }
            if ((m_fields & LogfmtFields::Message) && !record.message.empty()) {
                writePair(out, used, "message", record.message);
            }
            if ((m_fields & LogfmtFields::Target) && !record.target.empty()) {
                writePair(out, used, "target", record.target);
            }
            if ((m_fields & LogfmtFields::ModulePath) && !record.modulePath.empty()) {
                writePair(out, used, "module", record.modulePath);
            }
            if ((m_fields & LogfmtFields::File) && !record.file.empty()) {
                writePair(out, used, "file", record.file);
            }
            if ((m_fields & LogfmtFields::Line) && record.line != 0) {
                writePair(out, used, "line", std::to_string(record.line));
            }
            if (m_fields & LogfmtFields::Extra) {
                for (size_t i = 0; i < record.fields.size(); ++i) {
                    writePair(out, used, record.fields[i].first, record.fields[i].second);
                }
            }
            return out;
        }

        unsigned fields() const { return m_fields; }
        bool escapesNewlines() const { return m_escapeNewlines; }

    private:
        static std::string normalizeKey(const std::string& key) {
            std::string result;
            result.reserve(key.size());
            for (size_t i = 0; i < key.size(); ++i) {
                char c = key[i];
                if (c == ' ' || c == '=' || c == '"') continue;
                result += c;
            }
            if (result.empty()) result = "_";
            return result;
        }

        void writePair(std::string& out, std::set<std::string>& used,
                       const std::string& rawKey, const std::string& value) const {
            std::string key = normalizeKey(rawKey);
            if (!used.insert(key).second) return;

            std::string formatted;
            formatted.reserve(value.size() + 8);
            bool needQuotes = false;
            for (size_t i = 0; i < value.size(); ++i) {
                char c = value[i];
                switch (c) {
                    case '\\':
                    case '"':
                        needQuotes = true;
                        formatted += '\\';
                        formatted += c;
                        break;
                    case ' ':
                    case '=':
                        needQuotes = true;
                        formatted += c;
                        break;
                    case '\n':
                    case '\r':
                    case '\t':
                        needQuotes = true;
                        if (m_escapeNewlines) {
                            formatted += '\\';
                            formatted += (c == '\n' ? 'n' : (c == '\r' ? 'r' : 't'));
                        } else {
                            formatted += c;
                        }
                        break;
                    default: {
                        unsigned char uc = static_cast<unsigned char>(c);
                        if (uc < 0x20 || uc == 0x7F) {
                            needQuotes = true;
                            char buf[12];
                            std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned>(uc));
                            formatted += buf;
                        } else {
                            formatted += c;
                        }
                    }
                }
            }
            // An empty value still needs a visible token.
            if (value.empty()) needQuotes = true;

            if (!out.empty()) out += ' ';
            out += key;
            out += '=';
            if (needQuotes) out += '"';
            out += formatted;
            if (needQuotes) out += '"';
        }

        unsigned m_fields;
        bool m_escapeNewlines;
    };

} // namespace lokiship

#endif // LOKISHIP_LOGFMT_FORMATTER_HPP
