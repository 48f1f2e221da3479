// include/luhn/core/detail/digits.hpp - Character to digit value tables for the Luhn engine.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace luhn::core::detail {

    // Which characters a sequence may contain.
    enum class digit_set : std::uint8_t {
        decimal,     // '0'..'9'
        alphanumeric // '0'..'9', 'A'..'Z' as base-36 values
    };

    inline constexpr std::int8_t INVALID_DIGIT = -1;

    constexpr std::array<std::int8_t, 256> make_digit_table(digit_set set) {
        std::array<std::int8_t, 256> table{};
        for (auto &entry : table) {
            entry = INVALID_DIGIT;
        }
        for (char ch = '0'; ch <= '9'; ++ch) {
            table[static_cast<unsigned char>(ch)] = static_cast<std::int8_t>(ch - '0');
        }
        if (set == digit_set::alphanumeric) {
            for (char ch = 'A'; ch <= 'Z'; ++ch) {
                table[static_cast<unsigned char>(ch)] = static_cast<std::int8_t>(10 + (ch - 'A'));
            }
        }
        return table;
    }

    constexpr auto DECIMAL_DIGITS = make_digit_table(digit_set::decimal);
    constexpr auto ALPHANUMERIC_DIGITS = make_digit_table(digit_set::alphanumeric);

    // Returns the value of ch in the given set, or INVALID_DIGIT.
    constexpr int digit_value(char ch, digit_set set) noexcept {
        const auto index = static_cast<unsigned char>(ch);
        return set == digit_set::decimal ? DECIMAL_DIGITS[index] : ALPHANUMERIC_DIGITS[index];
    }

    constexpr char digit_char(int digit) noexcept { return static_cast<char>('0' + digit); }

    // Offset of the first character outside the set, or text.size() when there is none.
    constexpr std::size_t first_invalid(std::string_view text, digit_set set) noexcept {
        for (std::size_t index = 0; index < text.size(); ++index) {
            if (digit_value(text[index], set) == INVALID_DIGIT) {
                return index;
            }
        }
        return text.size();
    }

} // namespace luhn::core::detail
