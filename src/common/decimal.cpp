#include "common/decimal.hpp"

#include <algorithm>

namespace loft {

namespace {

using Limbs = std::array<uint32_t, 3>;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// m = m * mul + add. Returns false if the result does not fit 96 bits.
bool mul_add(Limbs& m, uint32_t mul, uint32_t add) {
    uint64_t carry = add;
    for (auto& limb : m) {
        uint64_t v = static_cast<uint64_t>(limb) * mul + carry;
        limb = static_cast<uint32_t>(v);
        carry = v >> 32;
    }
    return carry == 0;
}

// m = m / div. Returns the remainder.
uint32_t div_rem(Limbs& m, uint32_t div) {
    uint64_t rem = 0;
    for (size_t i = m.size(); i-- > 0;) {
        uint64_t v = (rem << 32) | m[i];
        m[i] = static_cast<uint32_t>(v / div);
        rem = v % div;
    }
    return static_cast<uint32_t>(rem);
}

} // namespace

std::optional<Decimal> Decimal::parse(std::string_view text) {
    if (text.empty() || !is_digit(text.front())) {
        return std::nullopt;
    }

    Decimal result;
    bool seen_dot = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.') {
            // Exactly one dot, with digits on both sides.
            if (seen_dot || i + 1 >= text.size()) {
                return std::nullopt;
            }
            seen_dot = true;
            continue;
        }
        if (!is_digit(c)) {
            return std::nullopt;
        }

        if (!mul_add(result.mantissa, 10, static_cast<uint32_t>(c - '0'))) {
            return std::nullopt;
        }

        if (seen_dot) {
            if (result.scale == kMaxScale) {
                return std::nullopt;
            }
            ++result.scale;
        }
    }
    return result;
}

std::string Decimal::to_string() const {
    std::string digits;
    Limbs m = mantissa;
    do {
        digits += static_cast<char>('0' + div_rem(m, 10));
    } while (m[0] != 0 || m[1] != 0 || m[2] != 0);

    // At least one digit before the point.
    while (digits.size() < static_cast<size_t>(scale) + 1) {
        digits += '0';
    }
    std::reverse(digits.begin(), digits.end());

    if (scale == 0) {
        return digits;
    }
    digits.insert(digits.size() - scale, 1, '.');
    return digits;
}

Decimal Decimal::normalized() const {
    Decimal d = *this;
    while (d.scale > 0) {
        Limbs q = d.mantissa;
        if (div_rem(q, 10) != 0) {
            break;
        }
        d.mantissa = q;
        --d.scale;
    }
    return d;
}

bool Decimal::operator==(const Decimal& other) const {
    Decimal a = normalized();
    Decimal b = other.normalized();
    return a.mantissa == b.mantissa && a.scale == b.scale;
}

} // namespace loft
