#include "fixed_point.hpp"

#include "errors.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace hilo {

Centi Centi::parse(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    constexpr __int128 maxRaw = static_cast<__int128>(std::numeric_limits<std::int64_t>::max());
    __int128 whole = 0;
    std::size_t wholeDigits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        whole = whole * 10 + (text[pos] - '0');
        if (whole * kScale > maxRaw) {
            throw MarketError(ErrorCode::OutcomeOutOfRange, "Outcome value too large: " + text);
        }
        ++pos;
        ++wholeDigits;
    }

    __int128 fraction = 0;
    std::size_t fractionDigits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fractionDigits == 2) {
                throw MarketError(ErrorCode::OutcomeOutOfRange,
                                  "Outcome value has more than two decimals: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++pos;
            ++fractionDigits;
        }
        if (fractionDigits == 0) {
            throw MarketError(ErrorCode::OutcomeOutOfRange, "Malformed outcome value: " + text);
        }
    }

    if (wholeDigits == 0 || pos != text.size()) {
        throw MarketError(ErrorCode::OutcomeOutOfRange, "Malformed outcome value: " + text);
    }
    if (fractionDigits == 1) {
        fraction *= 10;
    }

    __int128 raw = whole * kScale + fraction;
    if (raw > maxRaw) {
        throw MarketError(ErrorCode::OutcomeOutOfRange, "Outcome value too large: " + text);
    }
    return Centi(static_cast<std::int64_t>(negative ? -raw : raw));
}

std::string Centi::toString() const {
    __int128 wide = raw_;
    bool negative = wide < 0;
    if (negative) {
        wide = -wide;
    }
    std::ostringstream oss;
    if (negative) {
        oss << '-';
    }
    oss << static_cast<std::uint64_t>(wide / kScale) << '.' << std::setw(2) << std::setfill('0')
        << static_cast<int>(wide % kScale);
    return oss.str();
}

std::uint64_t mulDivFloor(std::uint64_t a, std::uint64_t b, std::uint64_t d) {
    if (d == 0) {
        throw MarketError(ErrorCode::ArithmeticOverflow, "mulDivFloor by zero");
    }
    unsigned __int128 wide = static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
    wide /= d;
    if (wide > static_cast<unsigned __int128>(std::numeric_limits<std::uint64_t>::max())) {
        throw MarketError(ErrorCode::ArithmeticOverflow, "mulDivFloor result exceeds 64-bit range");
    }
    return static_cast<std::uint64_t>(wide);
}

std::uint64_t checkedAdd(std::uint64_t a, std::uint64_t b) {
    if (a > std::numeric_limits<std::uint64_t>::max() - b) {
        throw MarketError(ErrorCode::ArithmeticOverflow, "Pool capacity exceeded");
    }
    return a + b;
}

} // namespace hilo
