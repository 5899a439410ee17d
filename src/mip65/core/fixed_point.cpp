#include <mip65/core/fixed_point.hpp>
#include <mip65/core/errors.hpp>
#include <algorithm>
#include <stdexcept>

namespace mip65::core::fixed {

namespace {

__extension__ typedef unsigned __int128 UAmount;

UAmount magnitude(Amount value) {
    // Negating in the unsigned domain keeps the minimum value representable
    return value < 0 ? UAmount(0) - static_cast<UAmount>(value) : static_cast<UAmount>(value);
}

std::string digits_of(UAmount value) {
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// Appends one decimal digit to an accumulated magnitude.
bool push_digit(Amount& acc, char c) {
    Amount shifted;
    if (__builtin_mul_overflow(acc, Amount(10), &shifted)) {
        return false;
    }
    return !__builtin_add_overflow(shifted, Amount(c - '0'), &acc);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

Amount from_units(int64_t units) {
    // |int64| * 10^18 always fits in 128 bits
    return static_cast<Amount>(units) * SCALE;
}

Amount mul(Amount a, Amount b) {
    // With A = ah*S + al and B = bh*S + bl on magnitudes,
    // floor(A*B / S) = ah*bh*S + ah*bl + al*bh + floor(al*bl / S).
    // al*bl < 10^36, so only a result outside 128 bits can overflow.
    const UAmount scale = static_cast<UAmount>(SCALE);
    const UAmount ma = magnitude(a);
    const UAmount mb = magnitude(b);
    const UAmount ah = ma / scale, al = ma % scale;
    const UAmount bh = mb / scale, bl = mb % scale;

    UAmount result = al * bl / scale;
    UAmount term;
    bool overflow = __builtin_mul_overflow(ah, bh, &term) ||
                    __builtin_mul_overflow(term, scale, &term) ||
                    __builtin_add_overflow(result, term, &result) ||
                    __builtin_mul_overflow(ah, bl, &term) ||
                    __builtin_add_overflow(result, term, &result) ||
                    __builtin_mul_overflow(al, bh, &term) ||
                    __builtin_add_overflow(result, term, &result);

    const bool negative = (a < 0) != (b < 0);
    const UAmount max_positive = ~UAmount(0) >> 1;
    const UAmount limit = negative ? max_positive + 1 : max_positive;
    if (overflow || result > limit) {
        throw Overflow("fixed-point multiplication overflow: " + to_string(a) + " * " + to_string(b));
    }
    // Truncation toward zero: the floor was taken on the magnitude
    return negative ? static_cast<Amount>(UAmount(0) - result) : static_cast<Amount>(result);
}

Amount checked_add(Amount a, Amount b) {
    Amount sum;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw Overflow("fixed-point addition overflow: " + to_string(a) + " + " + to_string(b));
    }
    return sum;
}

Amount checked_sub(Amount a, Amount b) {
    Amount diff;
    if (__builtin_sub_overflow(a, b, &diff)) {
        throw Overflow("fixed-point subtraction overflow: " + to_string(a) + " - " + to_string(b));
    }
    return diff;
}

std::string to_string(Amount value) {
    std::string digits = digits_of(magnitude(value));
    return value < 0 ? "-" + digits : digits;
}

std::string format(Amount value) {
    const UAmount mag = magnitude(value);
    const UAmount scale = static_cast<UAmount>(SCALE);

    std::string fraction = digits_of(mag % scale);
    fraction.insert(0, DECIMALS - fraction.size(), '0');

    std::string out = value < 0 ? "-" : "";
    out += digits_of(mag / scale);
    out += '.';
    out += fraction;
    return out;
}

Amount parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Amount whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && is_digit(text[pos])) {
        if (!push_digit(whole, text[pos])) {
            throw std::invalid_argument("amount out of range: " + text);
        }
        ++pos;
        ++whole_digits;
    }
    if (whole_digits == 0) {
        throw std::invalid_argument("malformed amount: '" + text + "'");
    }

    Amount fraction = 0;
    int fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            if (fraction_digits == DECIMALS) {
                throw std::invalid_argument("more than 18 fraction digits: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++pos;
            ++fraction_digits;
        }
        if (fraction_digits == 0) {
            throw std::invalid_argument("malformed amount: '" + text + "'");
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("malformed amount: '" + text + "'");
    }

    for (int i = fraction_digits; i < DECIMALS; ++i) {
        fraction *= 10;
    }

    Amount scaled;
    if (__builtin_mul_overflow(whole, SCALE, &scaled) ||
        __builtin_add_overflow(scaled, fraction, &scaled)) {
        throw std::invalid_argument("amount out of range: " + text);
    }
    return negative ? -scaled : scaled;
}

Amount parse_raw(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos == text.size()) {
        throw std::invalid_argument("malformed raw amount: '" + text + "'");
    }

    // Accumulate unsigned so the most negative value still parses
    const UAmount limit = (UAmount(1) << 127) - (negative ? 0 : 1);
    UAmount mag = 0;
    for (; pos < text.size(); ++pos) {
        if (!is_digit(text[pos])) {
            throw std::invalid_argument("malformed raw amount: '" + text + "'");
        }
        const UAmount digit = static_cast<UAmount>(text[pos] - '0');
        if (mag > (limit - digit) / 10) {
            throw std::invalid_argument("raw amount out of range: " + text);
        }
        mag = mag * 10 + digit;
    }
    return negative ? static_cast<Amount>(UAmount(0) - mag) : static_cast<Amount>(mag);
}

} // namespace mip65::core::fixed
