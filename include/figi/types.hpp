#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace figi {

// =============================================================================
// Symbol layout
// =============================================================================

constexpr std::size_t SYMBOL_LENGTH = 12;
constexpr std::size_t PREFIX_LENGTH = 3;
constexpr std::size_t BODY_LENGTH = 8;
constexpr std::size_t CHECKSUM_POS = SYMBOL_LENGTH - 1;

// Digits plus every uppercase consonant. Vowels are excluded, Y is not.
constexpr std::string_view FIGI_ALPHABET = "0123456789BCDFGHJKLMNPQRSTVWXYZ";

constexpr std::string_view PREFIX_BBG = "BBG";
constexpr std::string_view PREFIX_KKG = "KKG";

constexpr std::size_t DEFAULT_BUFFER_CAPACITY = 100;

// =============================================================================
// Validation results
// =============================================================================

enum class Outcome {
    Valid,
    PatternMismatch,
    InvalidChecksum
};

constexpr std::string_view outcome_message(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Valid:           return "valid";
        case Outcome::PatternMismatch: return "pattern mismatch";
        case Outcome::InvalidChecksum: return "invalid checksum";
    }
    return "unknown";
}

struct ValidationResult {
    std::string input;
    Outcome outcome = Outcome::PatternMismatch;

    bool is_valid() const noexcept { return outcome == Outcome::Valid; }
    std::string_view message() const noexcept { return outcome_message(outcome); }
};

} // namespace figi
