#pragma once

#include <ostream>
#include <string_view>

#include <luhn/core/detail/fold.hpp>

namespace luhn::util {

inline std::ostream& dump(std::ostream& os, const luhn::core::detail::parity_sum& value) {
    return os << "parity_sum(sum=" << value.sum << ", fives=" << value.five_or_higher << ')';
}

inline std::ostream& dump(std::ostream& os, const luhn::core::detail::fold_state& value) {
    namespace detail = luhn::core::detail;
    os << "fold(rightmost=";
    dump(os, value.rightmost);
    os << ", preceding=";
    dump(os, value.preceding);
    return os << ", as_sequence=" << detail::validation_total(value)
              << ", as_payload=" << detail::payload_total(value) << ", check_digit="
              << detail::digit_char(detail::check_digit_for(detail::payload_total(value))) << ')';
}

// Prints the fold of text, or "fold(invalid)" when text is not a well-formed sequence.
inline std::ostream& dump(std::ostream& os,
                          std::string_view text,
                          luhn::core::detail::digit_set set = luhn::core::detail::digit_set::decimal) {
    const auto state = luhn::core::detail::luhn_fold(text, set);
    if (text.empty() || !state) {
        return os << "fold(invalid)";
    }
    return dump(os, *state);
}

} // namespace luhn::util
