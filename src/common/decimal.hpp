#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace loft {

/// Fixed-point decimal used for numeric literals: value = mantissa / 10^scale.
///
/// The mantissa is a 96-bit unsigned integer held as three 32-bit limbs,
/// least significant first, and the scale is at most 28. Trailing fractional
/// zeros are kept so that a literal prints back the way it was written, but
/// equality is numeric: "1.5" == "1.50".
struct Decimal {
    static constexpr uint8_t kMaxScale = 28;

    std::array<uint32_t, 3> mantissa{};
    uint8_t scale = 0;

    /// Parse `digit+ ('.' digit+)?`. Returns nullopt for malformed text, a
    /// value that does not fit 96 bits, or more than kMaxScale fraction digits.
    [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    /// Same value with trailing fractional zeros removed.
    [[nodiscard]] Decimal normalized() const;

    [[nodiscard]] bool operator==(const Decimal& other) const;
};

} // namespace loft
