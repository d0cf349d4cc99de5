#ifndef CNPJ_NORMALIZER_H
#define CNPJ_NORMALIZER_H

#include <string>

namespace cnpj {
namespace utils {

// Mask handling and character classes for CNPJ input.
// All checks are ASCII-only; any byte >= 0x80 is treated as disallowed.

// Remove every '.', '/' and '-' from the input, keeping the order of
// the remaining characters. Case is left untouched.
std::string stripMask(const std::string& input);

// ASCII uppercase conversion (non-letters are copied as-is)
std::string toUpper(const std::string& input);

// True if any character is outside [A-Za-z0-9./-].
// Meant for the raw input, before the mask is stripped.
bool hasDisallowedCharacters(const std::string& input);

/**
 * Render a 14-character CNPJ with the display mask XX.XXX.XXX/XXXX-XX.
 *
 * The input may already carry mask characters at any position; they are
 * stripped first and the result is uppercased. Check digits are not
 * verified.
 *
 * @throws std::invalid_argument if the input has disallowed characters
 *         or does not hold exactly 14 characters once stripped
 */
std::string applyMask(const std::string& cnpj);

// Inline character classes
inline bool isMaskCharacter(char c) {
    return c == '.' || c == '/' || c == '-';
}

inline bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

inline bool isUpperLetter(char c) {
    return c >= 'A' && c <= 'Z';
}

inline bool isLowerLetter(char c) {
    return c >= 'a' && c <= 'z';
}

// Characters allowed in a normalized body: [A-Z0-9]
inline bool isBodyCharacter(char c) {
    return isDigit(c) || isUpperLetter(c);
}

} // namespace utils
} // namespace cnpj

#endif // CNPJ_NORMALIZER_H
