#pragma once

#include "Types.hpp"

#include <optional>
#include <string>

namespace va {

/// Text encoding of a ProbabilityMap used as a column value:
///
///   [label1:0.91,label2:0.09]
///
/// Decoding is tolerant because rows written by older releases must still
/// load; anything unreadable simply means "no prediction".  Nothing here
/// throws.
class ProbabilityMapCodec {
public:
    enum class DecodeStatus {
        full,         // every pair parsed
        partial,      // at least one pair was dropped
        unparseable   // not a bracketed list at all
    };

    struct DecodeResult {
        DecodeStatus                  status = DecodeStatus::unparseable;
        std::optional<ProbabilityMap> map;      // nullopt iff unparseable
        size_t                        dropped = 0;
    };

    /// nullopt in, nullopt out.  An empty map encodes as "[]".
    static std::optional<std::string> encode(const std::optional<ProbabilityMap>& map);

    /// Always produces a string; see is_encodable() for which maps
    /// survive a decode unchanged.
    static std::string encode(const ProbabilityMap& map);

    /// nullopt for null or malformed input.
    static std::optional<ProbabilityMap> decode(const std::optional<std::string>& text);

    /// Same parse as decode(), reporting what was dropped.
    static DecodeResult decode_detailed(const std::string& text);

    /// True if every key is free of ':' ',' '[' ']' and surrounding
    /// whitespace, and every value is finite.
    static bool is_encodable(const ProbabilityMap& map);

private:
    static std::string format_value(double v);
    static std::optional<double> parse_value(const std::string& s);
    static std::string trim(const std::string& s);
};

} // namespace va
