// examples/example_check_digit.cpp - Computes and verifies check digits for a few identifiers.

#include <iostream>
#include <string>

#include <luhn/luhn.hpp>

int
main() {
    const std::string payload = "7992739871";
    const char digit = luhn::checksum(payload);
    std::cout << "check digit for " << payload << " = " << digit << "\n";
    std::cout << payload + digit << " valid = " << std::boolalpha << luhn::validate(payload + digit)
              << "\n";

    std::cout << "4111111111111112 valid = " << luhn::validate("4111111111111112") << "\n";

    const std::string isin_payload = "US594918104";
    std::cout << "ISIN " << isin_payload << luhn::checksum_alnum(isin_payload) << "\n";

    luhn::util::dump(std::cout << "fold of " << payload << ": ", payload) << "\n";

    try {
        (void)luhn::validate("4111 1111 1111 1111");
    } catch (const luhn::invalid_input &err) {
        std::cout << "rejected: " << err.what() << " (offset " << err.position() << ")\n";
    }

    if (const auto result = luhn::try_checksum("12a"); !result) {
        std::cout << "try_checksum(12a) produced no digit\n";
    }

    return 0;
}
