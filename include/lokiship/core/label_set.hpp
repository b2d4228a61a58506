#ifndef LOKISHIP_LABEL_SET_HPP
#define LOKISHIP_LABEL_SET_HPP

#include <map>
#include <string>
#include <utility>
#include <initializer_list>

namespace lokiship {

    /// Immutable key/value identity of a stream.
    ///
    /// Pairs are held sorted by key, so two sets built from the same pairs in
    /// a different order compare equal and order identically. Adding a key
    /// that is already present replaces its value.
    class LabelSet {
    public:
        typedef std::map<std::string, std::string> Map;
        typedef Map::const_iterator const_iterator;

        LabelSet() {}

        explicit LabelSet(Map labels) : m_labels(std::move(labels)) {}

        LabelSet(std::initializer_list<std::pair<const std::string, std::string> > init)
            : m_labels(init) {}

        /// Copy of this set with `key` set to `value`.
        LabelSet with(const std::string& key, const std::string& value) const {
            LabelSet copy(*this);
            copy.m_labels[key] = value;
            return copy;
        }

        bool contains(const std::string& key) const {
            return m_labels.find(key) != m_labels.end();
        }

        /// Value for `key`, or an empty string when absent.
        std::string get(const std::string& key) const {
            const_iterator it = m_labels.find(key);
            return it == m_labels.end() ? std::string() : it->second;
        }

        size_t size() const { return m_labels.size(); }
        bool empty() const { return m_labels.empty(); }

        const_iterator begin() const { return m_labels.begin(); }
        const_iterator end() const { return m_labels.end(); }

        const Map& asMap() const { return m_labels; }

        /// Loki stream selector form, e.g. `{app="api",env="prod"}`.
        std::string toString() const {
            std::string out = "{";
            bool first = true;
            for (const_iterator it = m_labels.begin(); it != m_labels.end(); ++it) {
                if (!first) out += ',';
                first = false;
                out += it->first;
                out += "=\"";
                for (size_t i = 0; i < it->second.size(); ++i) {
                    char c = it->second[i];
                    if (c == '"' || c == '\\') out += '\\';
                    out += c;
                }
                out += '"';
            }
            out += '}';
            return out;
        }

        friend bool operator==(const LabelSet& a, const LabelSet& b) {
            return a.m_labels == b.m_labels;
        }
        friend bool operator!=(const LabelSet& a, const LabelSet& b) {
            return !(a == b);
        }
        friend bool operator<(const LabelSet& a, const LabelSet& b) {
            return a.m_labels < b.m_labels;
        }

    private:
        Map m_labels;
    };

namespace detail {

    /// Loki label names follow the Prometheus grammar [A-Za-z_][A-Za-z0-9_]*.
    inline bool isValidLabelName(const std::string& name) {
        if (name.empty()) return false;
        for (size_t i = 0; i < name.size(); ++i) {
            char c = name[i];
            bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
            bool digit = (c >= '0' && c <= '9');
            if (!(alpha || (i > 0 && digit))) return false;
        }
        return true;
    }

} // namespace detail
} // namespace lokiship

#endif // LOKISHIP_LABEL_SET_HPP
