#pragma once
/**
 * OpenFIGI checksum and pattern engine
 *
 * Pure functions over symbol strings. No I/O, no state.
 *
 * A symbol is BBG|KKG, then 8 characters of FIGI_ALPHABET, then one checksum
 * digit. The checksum is a Luhn variant: every character is mapped to a value
 * (digits to themselves, letters to A=10 .. Z=35), values at odd positions are
 * doubled except for the checksum slot, and the decimal digits of all values
 * are summed. A valid symbol has a sum divisible by 10.
 */

#include <string_view>

#include "figi/types.hpp"

namespace figi {

// Exact, case-sensitive structural match. No trimming.
bool matches_pattern(std::string_view s) noexcept;

// Value of a single character, ignoring its position.
// Expects a digit or an uppercase letter.
int char_value(char c) noexcept;

// Value of a character at zero-based position pos, doubled at odd positions
// other than the checksum slot.
int char_value_with_pos(char c, std::size_t pos) noexcept;

// Crossfoot sum over all characters of s. Only meaningful for strings that
// passed matches_pattern, or for the 11-character prefix of a candidate.
int digit_sum(std::string_view s) noexcept;

/**
 * Checksum digit for an 11-character prefix + body.
 *
 * Returns the character '0'..'9' that makes the digit sum of the completed
 * symbol a multiple of 10.
 *
 * @throws InvalidArgumentError if prefix_and_body is not 11 characters long
 */
char check_digit(std::string_view prefix_and_body);

// Pattern first, checksum second. Never throws.
Outcome validate(std::string_view s) noexcept;

} // namespace figi
