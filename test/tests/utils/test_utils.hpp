#pragma once

#include "lokiship/encoder/push_payload.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <chrono>
#include <cstdint>

class TestUtils {
public:
    /// Poll `condition` every few milliseconds until it holds or `timeout`
    /// elapses. Returns the final value of the condition.
    static bool waitFor(const std::function<bool()> &condition,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    /// Parse a push body, gunzipping it first when the payload is compressed.
    static nlohmann::json decodePayload(const lokiship::PushPayload &payload);

    /// All [timestamp, line] pairs of a decoded push body, stream by stream.
    static std::vector<std::pair<int64_t, std::string>> entries(const nlohmann::json &body);

    /// Lines of the stream whose labels equal `labels`, in order.
    static std::vector<std::string> linesFor(const nlohmann::json &body,
                                             const nlohmann::json &labels);

    /// Nanosecond timestamps of the stream whose labels equal `labels`.
    static std::vector<int64_t> timestampsFor(const nlohmann::json &body,
                                              const nlohmann::json &labels);
};
