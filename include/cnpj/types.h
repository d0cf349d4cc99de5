#ifndef CNPJ_TYPES_H
#define CNPJ_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>

namespace cnpj {

// Identifier layout
constexpr size_t BODY_LENGTH = 12;          // Characters before the check digits
constexpr size_t CHECK_DIGITS_LENGTH = 2;   // Trailing numeric check digits
constexpr size_t CNPJ_LENGTH = BODY_LENGTH + CHECK_DIGITS_LENGTH;
constexpr size_t MASKED_LENGTH = CNPJ_LENGTH + 4;  // XX.XXX.XXX/XXXX-XX

// Modulo-11 weights. The first sum uses entries 1..12, the second sum
// entries 0..11 plus entry 12 for the first check digit.
constexpr int CHECK_DIGIT_WEIGHTS[BODY_LENGTH + 1] = {
    6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2
};

// Reason a candidate identifier was rejected
enum class ValidationError : uint8_t {
    NONE = 0,
    EMPTY_INPUT = 1,                // Empty string or null pointer
    DISALLOWED_CHARACTER = 2,       // Character outside [A-Za-z0-9./-]
    INVALID_LENGTH = 3,             // Not 14 characters after stripping the mask
    INVALID_BODY = 4,               // Body not [A-Z0-9]{12}
    NON_NUMERIC_CHECK_DIGITS = 5,   // Last two characters not [0-9]{2}
    ALL_ZERO = 6,                   // 00000000000000
    CHECK_DIGIT_MISMATCH = 7        // Well formed, wrong check digits
};

// The two computed check digits (each 0-9)
struct CheckDigits {
    uint8_t first = 0;
    uint8_t second = 0;

    std::string toString() const {
        std::string out;
        out += static_cast<char>('0' + first);
        out += static_cast<char>('0' + second);
        return out;
    }

    bool operator==(const CheckDigits& other) const {
        return first == other.first && second == other.second;
    }
    bool operator!=(const CheckDigits& other) const {
        return !(*this == other);
    }
};

// Result of a check-digit computation.
// success == false means the body was rejected; digits is then meaningless.
struct CheckDigitsResult {
    bool success = false;
    CheckDigits digits;
    std::string error;              // Reason if the body was rejected
};

// Detailed validation outcome
struct ValidationResult {
    bool valid = false;
    ValidationError error = ValidationError::NONE;
    std::string message;            // Human-readable reason if invalid
    std::string normalized;         // Stripped, uppercased input (if it passed the format guard)
};

// Generator configuration
struct GeneratorConfig {
    bool alphanumeric = true;       // Mix letters into the body
    uint32_t seed = 0;              // 0 = seed from std::random_device
};

} // namespace cnpj

#endif // CNPJ_TYPES_H
