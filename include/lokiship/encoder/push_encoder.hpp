#ifndef LOKISHIP_PUSH_ENCODER_HPP
#define LOKISHIP_PUSH_ENCODER_HPP

#include "push_payload.hpp"
#include "gzip.hpp"
#include "../buffer/generation_buffer.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lokiship {

    /// Serializes a sealed batch into a Loki push API body:
    ///
    /// @code
    ///   {"streams":[{"stream":{"app":"api"},
    ///                "values":[["1700000000000000000","level=info message=hi"]]}]}
    /// @endcode
    ///
    /// Timestamps are decimal nanosecond strings. Streams and entries keep
    /// their acceptance order. With gzip enabled the whole document is
    /// wrapped in a single gzip member.
    class PushEncoder {
    public:
        explicit PushEncoder(bool gzip = false) : m_gzip(gzip) {}

        PushPayload encode(const SealedBatch& batch) const {
            std::string json = toJson(batch);
            if (m_gzip) {
                json = detail::gzipCompress(json);
            }
            return PushPayload(std::move(json), m_gzip, batch.generation(),
                               batch.streamCount(), batch.entryCount());
        }

        /// Uncompressed JSON document for `batch`.
        static std::string toJson(const SealedBatch& batch) {
            nlohmann::json streams = nlohmann::json::array();
            const std::vector<Stream>& src = batch.streams();
            for (size_t i = 0; i < src.size(); ++i) {
                if (src[i].empty()) continue;

                nlohmann::json labels = nlohmann::json::object();
                for (LabelSet::const_iterator it = src[i].labels().begin();
                     it != src[i].labels().end(); ++it) {
                    labels[it->first] = it->second;
                }

                nlohmann::json values = nlohmann::json::array();
                const std::vector<StreamEntry>& entries = src[i].entries();
                for (size_t e = 0; e < entries.size(); ++e) {
                    values.push_back(nlohmann::json::array(
                        {std::to_string(entries[e].timestampNs), entries[e].line}));
                }

                nlohmann::json stream = nlohmann::json::object();
                stream["stream"] = std::move(labels);
                stream["values"] = std::move(values);
                streams.push_back(std::move(stream));
            }

            nlohmann::json doc = nlohmann::json::object();
            doc["streams"] = std::move(streams);
            // Invalid UTF-8 in a line is replaced rather than failing the batch.
            return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        bool gzipEnabled() const { return m_gzip; }

    private:
        bool m_gzip;
    };

} // namespace lokiship

#endif // LOKISHIP_PUSH_ENCODER_HPP
