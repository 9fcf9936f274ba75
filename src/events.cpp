#include "events.hpp"

#include <sstream>
#include <type_traits>

namespace hilo {

namespace {

enum class EventTag : std::uint8_t {
    BetPlaced = 1,
    RoundSettled = 2,
    WinningsClaimed = 3,
    FundsRescued = 4,
    ConfigChanged = 5,
};

void writeU8(std::string& out, std::uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeI64(std::string& out, std::int64_t v) {
    writeU64(out, static_cast<std::uint64_t>(v));
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

std::uint8_t sideByte(Side side) {
    return side == Side::Higher ? 1 : 2;
}

} // namespace

std::string encodeEvent(const MarketEvent& event) {
    // | tag u8 | fields in declaration order; integers u64/i64 LE, strings len-prefixed |
    // Optional side encodes as 0 when absent.
    std::string out;
    out.reserve(64);
    std::visit(
        [&out](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, BetPlaced>) {
                writeU8(out, static_cast<std::uint8_t>(EventTag::BetPlaced));
                writeU64(out, e.round);
                writeString(out, e.participant);
                writeU8(out, sideByte(e.side));
                writeU64(out, e.amount);
                writeI64(out, e.baseline.raw());
            } else if constexpr (std::is_same_v<T, RoundSettled>) {
                writeU8(out, static_cast<std::uint8_t>(EventTag::RoundSettled));
                writeU64(out, e.round);
                writeI64(out, e.reportedOutcome.raw());
                writeI64(out, e.priorBaseline.raw());
                writeU8(out, e.winningSide ? sideByte(*e.winningSide) : 0);
                writeU8(out, e.tie ? 1 : 0);
                writeU64(out, e.totalPot);
                writeU64(out, e.fee);
            } else if constexpr (std::is_same_v<T, WinningsClaimed>) {
                writeU8(out, static_cast<std::uint8_t>(EventTag::WinningsClaimed));
                writeU64(out, e.round);
                writeString(out, e.participant);
                writeU64(out, e.amount);
            } else if constexpr (std::is_same_v<T, FundsRescued>) {
                writeU8(out, static_cast<std::uint8_t>(EventTag::FundsRescued));
                writeString(out, e.recipient);
                writeU64(out, e.amount);
            } else {
                writeU8(out, static_cast<std::uint8_t>(EventTag::ConfigChanged));
                writeString(out, e.field);
                writeString(out, e.value);
            }
        },
        event);
    return out;
}

std::string describeEvent(const MarketEvent& event) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, BetPlaced>) {
                oss << "BetPlaced round=" << e.round << " participant=" << e.participant
                    << " side=" << toString(e.side) << " amount=" << e.amount
                    << " baseline=" << e.baseline.toString();
            } else if constexpr (std::is_same_v<T, RoundSettled>) {
                oss << "RoundSettled round=" << e.round << " outcome=" << e.reportedOutcome.toString()
                    << " priorBaseline=" << e.priorBaseline.toString()
                    << " winner=" << (e.winningSide ? toString(*e.winningSide) : "none")
                    << " tie=" << (e.tie ? "true" : "false") << " pot=" << e.totalPot
                    << " fee=" << e.fee;
            } else if constexpr (std::is_same_v<T, WinningsClaimed>) {
                oss << "WinningsClaimed round=" << e.round << " participant=" << e.participant
                    << " amount=" << e.amount;
            } else if constexpr (std::is_same_v<T, FundsRescued>) {
                oss << "FundsRescued recipient=" << e.recipient << " amount=" << e.amount;
            } else {
                oss << "ConfigChanged " << e.field << "=" << e.value;
            }
        },
        event);
    return oss.str();
}

} // namespace hilo
