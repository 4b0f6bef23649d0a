#include "Types.hpp"

#include <algorithm>
#include <cctype>

namespace va {

std::optional<Channel> channel_from_string(const std::string& s) {
    std::string upper(s);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (Channel c : kAllChannels) {
        if (upper == channel_to_string(c)) return c;
    }
    return std::nullopt;
}

} // namespace va
