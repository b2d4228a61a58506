#ifndef LOKISHIP_JSON_LINE_FORMATTER_HPP
#define LOKISHIP_JSON_LINE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/errors.hpp"
#include <nlohmann/json.hpp>

namespace lokiship {

    /// Renders a record as one compact JSON object, for use with Loki's
    /// `| json` stage. Keys appear in record order: level, message, target,
    /// module, then the structured fields. Structured fields never replace
    /// the built-in keys.
    class JsonLineFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            nlohmann::ordered_json j;
            j["level"] = getLevelName(record.level);
            j["message"] = record.message;
            if (!record.target.empty()) j["target"] = record.target;
            if (!record.modulePath.empty()) j["module"] = record.modulePath;
            for (const auto &field : record.fields) {
                if (j.contains(field.first)) continue;
                j[field.first] = field.second;
            }
            try {
                return j.dump();
            } catch (const nlohmann::json::type_error &e) {
                // dump() rejects strings that are not valid UTF-8
                throw FormatError(std::string("JsonLineFormatter: ") + e.what());
            }
        }
    };
} // namespace lokiship

#endif // LOKISHIP_JSON_LINE_FORMATTER_HPP
