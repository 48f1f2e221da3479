#pragma once

#include <cstddef>
#include <random>
#include <string>

#include <luhn/core/luhn.hpp>

namespace luhn::util {

inline std::string random_digits(std::mt19937_64& generator, std::size_t length) {
    static std::uniform_int_distribution<int> digit_dist(0, 9);
    std::string result;
    result.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
        result.push_back(static_cast<char>('0' + digit_dist(generator)));
    }
    return result;
}

// Uppercase alphanumeric payload, roughly one letter in four.
inline std::string random_alnum(std::mt19937_64& generator, std::size_t length) {
    static std::uniform_int_distribution<int> digit_dist(0, 9);
    static std::uniform_int_distribution<int> letter_dist(0, 25);
    static std::bernoulli_distribution letter_choice(0.25);
    std::string result;
    result.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
        if (letter_choice(generator)) {
            result.push_back(static_cast<char>('A' + letter_dist(generator)));
        } else {
            result.push_back(static_cast<char>('0' + digit_dist(generator)));
        }
    }
    return result;
}

// Random payload of the given length with its check digit appended.
inline std::string random_valid_sequence(std::mt19937_64& generator, std::size_t payload_length) {
    std::string sequence = random_digits(generator, payload_length);
    sequence.push_back(luhn::core::checksum(sequence));
    return sequence;
}

} // namespace luhn::util
