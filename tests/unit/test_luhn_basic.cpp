// tests/unit/test_luhn_basic.cpp - Known vectors for validate and checksum.

#include <iostream>
#include <string>

#include <luhn/luhn.hpp>

static_assert(luhn::core::try_validate("4111111111111111") == true);
static_assert(luhn::core::try_validate("4111111111111112") == false);
static_assert(luhn::core::try_checksum("11111111") == '8');
static_assert(!luhn::core::try_checksum("").has_value());

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message) {
        if (!condition) {
            all_good = false;
            std::cerr << "luhn basic test failed: " << message << '\n';
        }
    };

    expect(luhn::validate("4111111111111111"), "4111111111111111 must validate");
    expect(!luhn::validate("4111111111111112"), "4111111111111112 must not validate");
    expect(luhn::validate("49927398716"), "49927398716 must validate");
    expect(!luhn::validate("234"), "234 must not validate");

    expect(luhn::checksum("11111111") == '8', "checksum(11111111) should be 8");
    expect(luhn::validate("111111118"), "111111118 must validate");
    expect(luhn::checksum("411111111111111") == '1', "card payload check digit should be 1");
    expect(luhn::checksum("4992739871") == '6', "checksum(4992739871) should be 6");

    expect(luhn::validate("0"), "single 0 is the only valid single digit");
    for (char digit = '1'; digit <= '9'; ++digit) {
        expect(!luhn::validate(std::string(1, digit)), "single non-zero digit must not validate");
    }
    expect(luhn::validate("00"), "00 must validate");
    expect(luhn::validate("18"), "18 must validate");
    expect(luhn::validate("59"), "59 must validate");

    // A lone payload digit d is doubled, so its check digit follows directly.
    expect(luhn::checksum("0") == '0', "checksum(0) should be 0");
    expect(luhn::checksum("1") == '8', "checksum(1) should be 8");
    expect(luhn::checksum("5") == '9', "checksum(5) should be 9");
    expect(luhn::checksum("9") == '1', "checksum(9) should be 1");

    expect(luhn::checksum("7992739871") == '3', "checksum(7992739871) should be 3");

    if (!all_good) {
        return 1;
    }
    std::cout << "luhn_basic tests passed\n";
    return 0;
}
