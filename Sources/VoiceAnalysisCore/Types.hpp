#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace va {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Label -> confidence distribution produced by one prediction channel.
using ProbabilityMap = std::map<std::string, double>;

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Lifecycle of the inference request for an analysis.
/// Stored in SQLite as an integer (0/1/2).
enum class SendStatus {
    pending = 0,
    sent    = 1,
    error   = 2
};

inline int send_status_to_int(SendStatus s) {
    return static_cast<int>(s);
}

/// Parse the integer column back to the enum.  Values written by a newer
/// schema are treated as errors so they surface to the user.
inline SendStatus send_status_from_int(int64_t v) {
    switch (v) {
        case 0: return SendStatus::pending;
        case 1: return SendStatus::sent;
        case 2: return SendStatus::error;
    }
    return SendStatus::error;
}

inline const char* send_status_to_string(SendStatus s) {
    switch (s) {
        case SendStatus::pending: return "pending";
        case SendStatus::sent:    return "sent";
        case SendStatus::error:   return "error";
    }
    return "unknown";
}

/// Prediction categories.  Each one owns a map column and a feedback column.
enum class Channel {
    age,
    gender,
    nationality,
    emotion
};

constexpr std::array<Channel, 4> kAllChannels = {
    Channel::age, Channel::gender, Channel::nationality, Channel::emotion
};

/// Upper-case name used as the column prefix (AGE_RESULT, AGE_USER_FEEDBACK).
inline const char* channel_to_string(Channel c) {
    switch (c) {
        case Channel::age:         return "AGE";
        case Channel::gender:      return "GENDER";
        case Channel::nationality: return "NATIONALITY";
        case Channel::emotion:     return "EMOTION";
    }
    return "UNKNOWN";
}

/// Case-insensitive parse of a channel name.
std::optional<Channel> channel_from_string(const std::string& s);

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// User label attached to analyses.  Two tags are the same tag if their
/// names match.
struct Tag {
    int64_t     id = 0;
    std::string name;

    bool operator==(const Tag& other) const { return name == other.name; }
    bool operator!=(const Tag& other) const { return !(*this == other); }
};

/// One channel's prediction plus the user's verdict on it.
struct ChannelResult {
    std::optional<ProbabilityMap> prediction;
    std::optional<bool>           feedback;
};

/// One voice sample and everything known about it.
struct AnalysisRecord {
    std::optional<int64_t>      id;             // assigned by AnalysisStore
    std::string                 title;
    std::optional<std::string>  description;
    SendStatus                  send_status = SendStatus::pending;
    std::optional<std::string>  error_message;
    std::string                 audio_path;
    TimePoint                   creation_date{};
    std::optional<TimePoint>    completion_date;
    std::array<ChannelResult, 4> channels{};    // indexed by Channel
    std::vector<Tag>            tags;           // loaded separately

    ChannelResult& channel(Channel c) {
        return channels[static_cast<size_t>(c)];
    }
    const ChannelResult& channel(Channel c) const {
        return channels[static_cast<size_t>(c)];
    }

    /// True if any channel carries a prediction map.
    bool has_predictions() const {
        for (const auto& c : channels) {
            if (c.prediction) return true;
        }
        return false;
    }
};

/// A single channel delivered by an inference engine.
struct PredictionResult {
    Channel        channel;
    ProbabilityMap probabilities;
    TimePoint      completed_at;
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired with a progress value 0.0 – 1.0 during long-running inference.
using ProgressCallback = std::function<void(float)>;

/// Fired during capture with the current audio level 0.0 – 1.0.
using MeteringCallback = std::function<void(float)>;

} // namespace va
