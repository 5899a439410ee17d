#pragma once
#include <cstdint>
#include <string>

namespace mip65::core {

// Signed 128-bit integer carrying 18 implied decimal digits.
__extension__ typedef __int128 Amount;

namespace fixed {

constexpr int DECIMALS = 18;
constexpr Amount SCALE = 1000000000000000000LL;

// Whole units (e.g. 1350) to fixed point.
Amount from_units(int64_t units);

// a * b / 10^18, truncated toward zero. Throws Overflow if the
// intermediate product leaves the 128-bit range.
Amount mul(Amount a, Amount b);

Amount checked_add(Amount a, Amount b);
Amount checked_sub(Amount a, Amount b);

// Raw integer text, e.g. "-1500000000000000000".
std::string to_string(Amount value);

// Decimal text with all 18 fraction digits, e.g. "-1.500000000000000000".
std::string format(Amount value);

// Parses "[-+]digits[.fraction]" with at most 18 fraction digits.
// Throws std::invalid_argument on malformed input or overflow.
Amount parse(const std::string& text);

// Parses "[-+]digits" as an already scaled raw value.
Amount parse_raw(const std::string& text);

} // namespace fixed
} // namespace mip65::core
