#ifndef LOKISHIP_STREAM_ROUTER_HPP
#define LOKISHIP_STREAM_ROUTER_HPP

#include "../core/label_set.hpp"
#include "../core/log_record.hpp"
#include <set>
#include <string>

namespace lokiship {

    /// What happens when a promoted record field names a global label.
    enum class LabelOverride {
        KeepGlobal,   ///< the global value stays in the stream identity (default)
        RecordWins    ///< the record's value replaces the global one
    };

    /// Controls how record fields become stream labels.
    struct RouterOptions {
        bool mergeFields;               ///< promote structured fields at all
        std::set<std::string> labelKeys; ///< field keys eligible for promotion
        LabelOverride overridePolicy;

        RouterOptions()
            : mergeFields(false)
            , overridePolicy(LabelOverride::KeepGlobal) {}

        RouterOptions& setMergeFields(bool v) { mergeFields = v; return *this; }
        RouterOptions& addLabelKey(const std::string& key) { labelKeys.insert(key); return *this; }
        RouterOptions& setOverridePolicy(LabelOverride p) { overridePolicy = p; return *this; }
    };

    /// Resolves the stream identity of a record.
    ///
    /// Pure: the result depends only on the record, the global labels and
    /// the options, so it runs on the producer thread outside any lock.
    /// Only fields listed in `labelKeys` are promoted, and only when
    /// `mergeFields` is on. The first occurrence of a key in the record
    /// wins. Fields whose key is not a valid label name or whose value is
    /// empty are never promoted. Promotion never touches the line text;
    /// the formatter renders every field with the record's own value.
    class StreamRouter {
    public:
        explicit StreamRouter(RouterOptions opts = RouterOptions())
            : m_opts(std::move(opts)) {}

        LabelSet route(const LogRecord& record, const LabelSet& globalLabels) const {
            if (!m_opts.mergeFields || m_opts.labelKeys.empty() || record.fields.empty()) {
                return globalLabels;
            }

            LabelSet::Map merged = globalLabels.asMap();
            std::set<std::string> seen;
            for (size_t i = 0; i < record.fields.size(); ++i) {
                const std::string& key = record.fields[i].first;
                const std::string& value = record.fields[i].second;
                if (!seen.insert(key).second) continue;
                if (m_opts.labelKeys.find(key) == m_opts.labelKeys.end()) continue;
                if (value.empty() || !detail::isValidLabelName(key)) continue;

                if (globalLabels.contains(key)
                        && m_opts.overridePolicy == LabelOverride::KeepGlobal) {
                    continue;
                }
                merged[key] = value;
            }
            return LabelSet(std::move(merged));
        }

        const RouterOptions& options() const { return m_opts; }

    private:
        RouterOptions m_opts;
    };

} // namespace lokiship

#endif // LOKISHIP_STREAM_ROUTER_HPP
