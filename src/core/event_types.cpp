#include "core/event_types.h"

#include <algorithm>
#include <cctype>

namespace flowbench {

bool parseMode(const std::string& s, TransportMode& out) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "stream" || lower == "str") {
        out = TransportMode::STREAM;
        return true;
    }
    if (lower == "datagram" || lower == "dg") {
        out = TransportMode::DATAGRAM;
        return true;
    }
    return false;
}

}  // namespace flowbench
