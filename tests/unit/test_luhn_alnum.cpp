// tests/unit/test_luhn_alnum.cpp - Alphanumeric (ISIN style) check digits.

#include <array>
#include <iostream>
#include <random>
#include <string>
#include <string_view>

#include <luhn/luhn.hpp>
#include <luhn/util/random.hpp>

namespace {

constexpr std::array<std::string_view, 20> GOOD_ISINS = {
    "US5949181045", "US38259P5089", "US0378331005", "BMG491BT1088", "IE00B4BNMY34",
    "US0231351067", "US64110L1061", "US30303M1027", "CH0031240127", "CA9861913023",
    // One per possible check digit.
    "KR4101R60000", "KR4201QB2551", "KR4201RC3102", "KR4201Q92623", "KR4205QB2904",
    "KR4301R12825", "KR4301QC2906", "KR4205Q92327", "KR4301QB3228", "KR4301Q93579",
};

// Check digit replaced with 0.
constexpr std::array<std::string_view, 10> ZEROED_ISINS = {
    "US5949181040", "US38259P5080", "US0378331000", "BMG491BT1080", "IE00B4BNMY30",
    "US0231351060", "US64110L1060", "US30303M1020", "CH0031240120", "CA9861913020",
};

// Two characters transposed.
constexpr std::array<std::string_view, 10> TRANSPOSED_ISINS = {
    "SU5941981045", "US3825P95089", "US0378313005", "BMG491BT0188", "IE00B4BNM3Y4",
    "US2031351067", "US61410L1061", "US30033M1027", "CH0032140127", "CA9861193023",
};

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message, std::string_view input) {
        if (!condition) {
            all_good = false;
            std::cerr << "luhn alnum test failed: " << message << " [" << input << "]\n";
        }
    };

    for (const auto isin : GOOD_ISINS) {
        expect(luhn::validate_alnum(isin), "good ISIN must validate", isin);
        expect(luhn::checksum_alnum(isin.substr(0, 11)) == isin[11], "check digit must match", isin);
        expect(luhn::try_checksum_alnum(isin.substr(0, 11)) == isin[11],
               "try_checksum_alnum must agree", isin);
    }
    for (const auto isin : ZEROED_ISINS) {
        expect(!luhn::validate_alnum(isin), "zeroed check digit must not validate", isin);
        expect(luhn::checksum_alnum(isin.substr(0, 11)) != isin[11], "zeroed digit must differ", isin);
    }
    for (const auto isin : TRANSPOSED_ISINS) {
        expect(!luhn::validate_alnum(isin), "transposed ISIN must not validate", isin);
        expect(luhn::try_validate_alnum(isin) == false, "try_validate_alnum must agree", isin);
    }

    expect(!luhn::try_validate_alnum("us5949181045").has_value(), "lowercase is rejected",
           "us5949181045");
    expect(!luhn::try_checksum_alnum("").has_value(), "empty payload is rejected", "");
    expect(!luhn::try_validate_alnum("US-594918104").has_value(), "separators are rejected",
           "US-594918104");
    try {
        (void)luhn::validate_alnum("banana");
        expect(false, "validate_alnum(banana) must throw", "banana");
    } catch (const luhn::invalid_input& err) {
        expect(err.position() == 0, "error must point at the first lowercase letter", "banana");
    }

    std::mt19937_64 rng(0x15156e5);
    std::uniform_int_distribution<std::size_t> length_dist(1, 32);
    for (int iteration = 0; iteration < 1000; ++iteration) {
        const std::string digits = luhn::util::random_digits(rng, length_dist(rng));
        expect(luhn::checksum_alnum(digits) == luhn::checksum(digits),
               "digit-only input must match the decimal form", digits);
        expect(luhn::validate_alnum(digits) == luhn::validate(digits),
               "digit-only validation must match the decimal form", digits);

        const std::string payload = luhn::util::random_alnum(rng, length_dist(rng));
        expect(luhn::validate_alnum(payload + luhn::checksum_alnum(payload)),
               "alphanumeric round trip must validate", payload);
    }

    if (!all_good) {
        return 1;
    }
    std::cout << "luhn_alnum tests passed\n";
    return 0;
}
