// include/luhn/core/detail/fold.hpp - Single-pass weighted digit sum shared by validate and checksum.

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include <luhn/core/detail/digits.hpp>

namespace luhn::core::detail {

    // Running totals for one parity class of the digit stream.
    struct parity_sum {
        std::size_t sum = 0;
        std::size_t five_or_higher = 0;

        // Total when every digit of this class carries weight 2. Doubling d >= 5
        // overshoots by exactly 9, hence the correction.
        constexpr std::size_t doubled() const noexcept { return sum * 2 - five_or_higher * 9; }
    };

    // Parity classes counted from the right end of the stream. "rightmost" holds
    // the last digit and every second one before it.
    struct fold_state {
        parity_sum rightmost;
        parity_sum preceding;
    };

    // Feeds one decimal digit (0..9) into the state.
    constexpr void fold_digit(fold_state &state, int digit) noexcept {
        parity_sum &current = state.preceding;
        if (digit >= 5) {
            ++current.five_or_higher;
        }
        current.sum += static_cast<std::size_t>(digit);
        std::swap(state.rightmost, state.preceding);
    }

    // Folds the text from left to right. Values above 9 (letters in the
    // alphanumeric set) are split into their decimal digits, tens first.
    // The weighting is decided by the caller once the stream has ended, so the
    // expanded length never needs to be known up front.
    constexpr std::optional<fold_state> luhn_fold(std::string_view text, digit_set set) noexcept {
        fold_state state{};
        for (const char ch : text) {
            const int value = digit_value(ch, set);
            if (value == INVALID_DIGIT) {
                return std::nullopt;
            }
            if (value < 10) {
                fold_digit(state, value);
            } else {
                fold_digit(state, value / 10);
                fold_digit(state, value % 10);
            }
        }
        return state;
    }

    // Weighted total of a sequence whose last digit is the check digit.
    constexpr std::size_t validation_total(const fold_state &state) noexcept {
        return state.preceding.doubled() + state.rightmost.sum;
    }

    // Weighted total of a payload whose check digit is still missing.
    constexpr std::size_t payload_total(const fold_state &state) noexcept {
        return state.rightmost.doubled() + state.preceding.sum;
    }

    constexpr int check_digit_for(std::size_t total) noexcept {
        return static_cast<int>((10 - total % 10) % 10);
    }

} // namespace luhn::core::detail
