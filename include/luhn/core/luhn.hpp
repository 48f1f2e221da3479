// include/luhn/core/luhn.hpp - Luhn validation and check digit computation.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <luhn/core/detail/digits.hpp>
#include <luhn/core/detail/fold.hpp>
#include <luhn/core/errors.hpp>

namespace luhn::core {

namespace detail {

inline fold_state require_fold(std::string_view text, digit_set set) {
    if (text.empty()) {
        throw invalid_input("empty digit sequence", 0);
    }
    const auto state = luhn_fold(text, set);
    if (!state) {
        const std::size_t position = first_invalid(text, set);
        throw invalid_input("invalid digit in sequence at offset " + std::to_string(position),
                            position);
    }
    return *state;
}

constexpr std::optional<fold_state> try_fold(std::string_view text, digit_set set) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    return luhn_fold(text, set);
}

} // namespace detail

// Checks a sequence whose last digit is the check digit. Weights 1, 2, 1, 2, ...
// run leftwards from the check digit; the weighted sum must be a multiple of 10.
// Throws invalid_input for empty input or any non-digit character.
inline bool validate(std::string_view sequence) {
    const auto state = detail::require_fold(sequence, detail::digit_set::decimal);
    return detail::validation_total(state) % 10 == 0;
}

// Computes the check digit to append to payload. The last payload digit takes
// weight 2 because it moves one place left once the check digit is appended.
inline char checksum(std::string_view payload) {
    const auto state = detail::require_fold(payload, detail::digit_set::decimal);
    return detail::digit_char(detail::check_digit_for(detail::payload_total(state)));
}

// Non-throwing forms: std::nullopt exactly where validate/checksum throw.
constexpr std::optional<bool> try_validate(std::string_view sequence) noexcept {
    const auto state = detail::try_fold(sequence, detail::digit_set::decimal);
    if (!state) {
        return std::nullopt;
    }
    return detail::validation_total(*state) % 10 == 0;
}

constexpr std::optional<char> try_checksum(std::string_view payload) noexcept {
    const auto state = detail::try_fold(payload, detail::digit_set::decimal);
    if (!state) {
        return std::nullopt;
    }
    return detail::digit_char(detail::check_digit_for(detail::payload_total(*state)));
}

// Alphanumeric forms accept '0'..'9' and 'A'..'Z'. Each letter is replaced by
// its base-36 value written in decimal (A -> "10", Z -> "35") before the
// Luhn transform runs, which is how ISIN check digits are formed.
inline bool validate_alnum(std::string_view sequence) {
    const auto state = detail::require_fold(sequence, detail::digit_set::alphanumeric);
    return detail::validation_total(state) % 10 == 0;
}

inline char checksum_alnum(std::string_view payload) {
    const auto state = detail::require_fold(payload, detail::digit_set::alphanumeric);
    return detail::digit_char(detail::check_digit_for(detail::payload_total(state)));
}

constexpr std::optional<bool> try_validate_alnum(std::string_view sequence) noexcept {
    const auto state = detail::try_fold(sequence, detail::digit_set::alphanumeric);
    if (!state) {
        return std::nullopt;
    }
    return detail::validation_total(*state) % 10 == 0;
}

constexpr std::optional<char> try_checksum_alnum(std::string_view payload) noexcept {
    const auto state = detail::try_fold(payload, detail::digit_set::alphanumeric);
    if (!state) {
        return std::nullopt;
    }
    return detail::digit_char(detail::check_digit_for(detail::payload_total(*state)));
}

} // namespace luhn::core
