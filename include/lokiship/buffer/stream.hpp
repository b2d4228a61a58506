#ifndef LOKISHIP_STREAM_HPP
#define LOKISHIP_STREAM_HPP

#include "../core/label_set.hpp"
#include <string>
#include <vector>
#include <limits>
#include <cstdint>

namespace lokiship {

    struct StreamEntry {
        int64_t timestampNs;
        std::string line;
    };

    /// Ordered entries for one LabelSet within one generation.
    ///
    /// Timestamps are strictly increasing: an entry whose timestamp is not
    /// greater than the previous one is moved to previous + 1ns. The floor
    /// passed at construction carries the last timestamp issued for this
    /// LabelSet by earlier generations. The bump saturates at INT64_MAX.
    class Stream {
    public:
        explicit Stream(LabelSet labels,
                        int64_t floorNs = std::numeric_limits<int64_t>::min())
            : m_labels(std::move(labels))
            , m_lastNs(floorNs) {}

        /// Append a line; returns the timestamp actually stored.
        int64_t append(int64_t timestampNs, std::string line) {
            if (timestampNs <= m_lastNs) {
                timestampNs = m_lastNs == std::numeric_limits<int64_t>::max() ? m_lastNs : m_lastNs + 1;
            }
            m_lastNs = timestampNs;
            StreamEntry entry;
            entry.timestampNs = timestampNs;
            entry.line = std::move(line);
            m_entries.push_back(std::move(entry));
            return timestampNs;
        }

        const LabelSet& labels() const { return m_labels; }
        const std::vector<StreamEntry>& entries() const { return m_entries; }
        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }
        int64_t lastTimestamp() const { return m_lastNs; }

    private:
        LabelSet m_labels;
        std::vector<StreamEntry> m_entries;
        int64_t m_lastNs;
    };

} // namespace lokiship

#endif // LOKISHIP_STREAM_HPP
