/**
 * OpenFIGI checksum and pattern engine
 */

#include "figi/checksum.hpp"
#include "figi/error.hpp"

#include <string>

namespace figi {

namespace {

inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

inline bool in_alphabet(char c) noexcept {
    return FIGI_ALPHABET.find(c) != std::string_view::npos;
}

} // anonymous namespace

bool matches_pattern(std::string_view s) noexcept {
    if (s.size() != SYMBOL_LENGTH) return false;

    std::string_view prefix = s.substr(0, PREFIX_LENGTH);
    if (prefix != PREFIX_BBG && prefix != PREFIX_KKG) return false;

    for (std::size_t i = PREFIX_LENGTH; i < PREFIX_LENGTH + BODY_LENGTH; ++i) {
        if (!in_alphabet(s[i])) return false;
    }

    return is_digit(s[CHECKSUM_POS]);
}

int char_value(char c) noexcept {
    if (is_digit(c)) {
        return c - '0';
    }
    return c - 'A' + 10;
}

int char_value_with_pos(char c, std::size_t pos) noexcept {
    if (pos % 2 == 0 || pos == CHECKSUM_POS) {
        return char_value(c);
    }
    return char_value(c) * 2;
}

int digit_sum(std::string_view s) noexcept {
    int sum = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const int value = char_value_with_pos(s[i], i);
        sum += (value / 10) + (value % 10);
    }
    return sum;
}

char check_digit(std::string_view prefix_and_body) {
    FIGI_CHECK_ARGUMENT(prefix_and_body.size() == CHECKSUM_POS,
                        "Expected " + std::to_string(CHECKSUM_POS) + " characters, got " +
                        std::to_string(prefix_and_body.size()));

    const int sum = digit_sum(prefix_and_body);
    return static_cast<char>('0' + (10 - (sum % 10)) % 10);
}

Outcome validate(std::string_view s) noexcept {
    if (!matches_pattern(s)) {
        return Outcome::PatternMismatch;
    }
    if (digit_sum(s) % 10 != 0) {
        return Outcome::InvalidChecksum;
    }
    return Outcome::Valid;
}

} // namespace figi
