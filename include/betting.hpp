#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "fixed_point.hpp"

namespace hilo {

using Address = std::string;
using Amount = std::uint64_t;
using Timestamp = std::uint64_t; // seconds
using Duration = std::uint64_t;  // seconds
using RoundId = std::uint64_t;

enum class Side { Higher, Lower };

const char* toString(Side side);
// "higher"/"h"/"up" and "lower"/"l"/"down", case-insensitive.
std::optional<Side> parseSide(const std::string& text);

inline Side opposite(Side side) { return side == Side::Higher ? Side::Lower : Side::Higher; }

// One participant's cumulative stake in a round.
struct Position {
    Amount higher = 0;
    Amount lower = 0;

    Amount on(Side side) const { return side == Side::Higher ? higher : lower; }
    Amount total() const { return higher + lower; }
    bool empty() const { return higher == 0 && lower == 0; }
};

struct Bet {
    Address participant;
    Side side;
    Amount amount;
};

} // namespace hilo
