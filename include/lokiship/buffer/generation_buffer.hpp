#ifndef LOKISHIP_GENERATION_BUFFER_HPP
#define LOKISHIP_GENERATION_BUFFER_HPP

#include "stream.hpp"
#include <map>
#include <memory>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <cstdint>

namespace lokiship {

    /// One buffering cycle: the streams accepted since the last seal.
    ///
    /// Not synchronized; the shipper guards the live generation with its
    /// buffer mutex. Streams are kept in creation order so encoding is
    /// deterministic. entryCount() always equals the sum of stream sizes.
    class GenerationBuffer {
    public:
        typedef std::chrono::steady_clock Clock;

        explicit GenerationBuffer(uint64_t generation)
            : m_generation(generation)
            , m_entryCount(0)
            , m_hasFirst(false) {}

        GenerationBuffer(const GenerationBuffer&) = delete;
        GenerationBuffer& operator=(const GenerationBuffer&) = delete;

        /// Append one formatted line to the stream for `labels`, creating the
        /// stream when absent. `floorNs` seeds a newly created stream's
        /// monotonic floor. Returns the timestamp stored; `created`, when
        /// given, says whether the stream was opened by this call.
        int64_t append(const LabelSet& labels, int64_t timestampNs, std::string line,
                       int64_t floorNs = std::numeric_limits<int64_t>::min(),
                       bool* created = nullptr) {
            std::map<LabelSet, size_t>::iterator it = m_index.find(labels);
            size_t slot;
            if (it == m_index.end()) {
                slot = m_streams.size();
                m_streams.push_back(Stream(labels, floorNs));
                m_index.insert(std::make_pair(labels, slot));
            } else {
                slot = it->second;
            }
            if (created) *created = it == m_index.end();

            int64_t stored = m_streams[slot].append(timestampNs, std::move(line));
            if (!m_hasFirst) {
                m_firstEntryTime = Clock::now();
                m_hasFirst = true;
            }
            ++m_entryCount;
            return stored;
        }

        uint64_t generation() const { return m_generation; }
        size_t entryCount() const { return m_entryCount; }
        bool empty() const { return m_entryCount == 0; }
        size_t streamCount() const { return m_streams.size(); }
        const std::vector<Stream>& streams() const { return m_streams; }

        /// Monotonic time of the first accepted entry; meaningless when empty().
        Clock::time_point firstEntryTime() const { return m_firstEntryTime; }

        bool expired(Clock::time_point now, Clock::duration lifetime) const {
            return m_hasFirst && now - m_firstEntryTime >= lifetime;
        }

    private:
        uint64_t m_generation;
        std::vector<Stream> m_streams;
        std::map<LabelSet, size_t> m_index;
        size_t m_entryCount;
        Clock::time_point m_firstEntryTime;
        bool m_hasFirst;
    };

    /// A generation that has been swapped out of the live slot. Read-only;
    /// owned by the delivery side from the moment it is sealed.
    class SealedBatch {
    public:
        explicit SealedBatch(std::unique_ptr<GenerationBuffer> buffer)
            : m_buffer(std::move(buffer)) {
            if (!m_buffer) throw std::invalid_argument("SealedBatch: null generation");
        }

        SealedBatch(SealedBatch&&) = default;
        SealedBatch& operator=(SealedBatch&&) = default;

        uint64_t generation() const { return m_buffer->generation(); }
        size_t entryCount() const { return m_buffer->entryCount(); }
        size_t streamCount() const { return m_buffer->streamCount(); }
        const std::vector<Stream>& streams() const { return m_buffer->streams(); }

    private:
        std::unique_ptr<const GenerationBuffer> m_buffer;
    };

} // namespace lokiship

#endif // LOKISHIP_GENERATION_BUFFER_HPP
