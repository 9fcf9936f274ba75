#include "betting.hpp"

#include <algorithm>
#include <cctype>

namespace hilo {

const char* toString(Side side) {
    return side == Side::Higher ? "higher" : "lower";
}

std::optional<Side> parseSide(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "higher" || lowered == "h" || lowered == "up") {
        return Side::Higher;
    }
    if (lowered == "lower" || lowered == "l" || lowered == "down") {
        return Side::Lower;
    }
    return std::nullopt;
}

} // namespace hilo
