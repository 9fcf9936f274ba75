#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace hilo {

// Outcome values with two implied decimal digits ("12.10" == raw 1210).
class Centi {
public:
    static constexpr std::int64_t kScale = 100;

    Centi() : raw_(0) {}
    static Centi fromRaw(std::int64_t raw) { return Centi(raw); }
    // Accepts "1210", "12.1", "12.10", "-3.05". Throws MarketError(Validation) on anything else.
    static Centi parse(const std::string& text);

    std::int64_t raw() const { return raw_; }
    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::string toString() const;

    bool operator<(Centi other) const { return raw_ < other.raw_; }
    bool operator>(Centi other) const { return raw_ > other.raw_; }
    bool operator<=(Centi other) const { return raw_ <= other.raw_; }
    bool operator>=(Centi other) const { return raw_ >= other.raw_; }
    bool operator==(Centi other) const { return raw_ == other.raw_; }
    bool operator!=(Centi other) const { return raw_ != other.raw_; }

private:
    explicit Centi(std::int64_t raw) : raw_(raw) {}

    std::int64_t raw_;
};

// floor(a * b / d) with a 128-bit intermediate. d must be non-zero; a result
// above uint64 range throws MarketError(ArithmeticOverflow).
std::uint64_t mulDivFloor(std::uint64_t a, std::uint64_t b, std::uint64_t d);

// a + b, throwing MarketError(ArithmeticOverflow) instead of wrapping.
std::uint64_t checkedAdd(std::uint64_t a, std::uint64_t b);

inline std::uint64_t saturatingAdd(std::uint64_t a, std::uint64_t b) {
    return (a > std::numeric_limits<std::uint64_t>::max() - b)
               ? std::numeric_limits<std::uint64_t>::max()
               : a + b;
}

} // namespace hilo
