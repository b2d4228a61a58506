#ifndef LOKISHIP_PUSH_PAYLOAD_HPP
#define LOKISHIP_PUSH_PAYLOAD_HPP

#include <string>
#include <cstdint>

namespace lokiship {

    /// Wire-ready body of one push request, built once per sealed batch.
    class PushPayload {
    public:
        PushPayload(std::string body, bool gzipped, uint64_t generation,
                    size_t streams, size_t entries)
            : m_body(std::move(body))
            , m_gzipped(gzipped)
            , m_generation(generation)
            , m_streams(streams)
            , m_entries(entries) {}

        const std::string& body() const { return m_body; }
        bool gzipped() const { return m_gzipped; }
        uint64_t generation() const { return m_generation; }
        size_t streamCount() const { return m_streams; }
        size_t entryCount() const { return m_entries; }

    private:
        std::string m_body;
        bool m_gzipped;
        uint64_t m_generation;
        size_t m_streams;
        size_t m_entries;
    };

} // namespace lokiship

#endif // LOKISHIP_PUSH_PAYLOAD_HPP
