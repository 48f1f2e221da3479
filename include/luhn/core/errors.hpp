// include/luhn/core/errors.hpp - Error type raised for malformed digit sequences.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace luhn::core {

// Raised when a sequence is empty or contains a character outside its digit
// set. position() is the offset of the offending character, or the length of
// the sequence (zero) when it was empty.
class invalid_input : public std::invalid_argument {
public:
    invalid_input(const std::string &message, std::size_t position)
        : std::invalid_argument(message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

} // namespace luhn::core
