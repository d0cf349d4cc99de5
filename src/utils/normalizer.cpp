#include "cnpj/normalizer.h"
#include "cnpj/types.h"
#include <algorithm>
#include <stdexcept>

namespace cnpj {
namespace utils {

std::string stripMask(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    for (char c : input) {
        if (!isMaskCharacter(c)) {
            result.push_back(c);
        }
    }

    return result;
}

std::string toUpper(const std::string& input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return isLowerLetter(c) ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return result;
}

bool hasDisallowedCharacters(const std::string& input) {
    for (char c : input) {
        if (isDigit(c) || isUpperLetter(c) || isLowerLetter(c) || isMaskCharacter(c)) {
            continue;
        }
        return true;
    }
    return false;
}

std::string applyMask(const std::string& cnpj) {
    if (hasDisallowedCharacters(cnpj)) {
        throw std::invalid_argument("applyMask: input contains disallowed characters");
    }

    std::string plain = toUpper(stripMask(cnpj));
    if (plain.size() != CNPJ_LENGTH) {
        throw std::invalid_argument("applyMask: expected 14 characters without mask");
    }

    // XX.XXX.XXX/XXXX-XX
    std::string masked;
    masked.reserve(MASKED_LENGTH);
    masked.append(plain, 0, 2);
    masked += '.';
    masked.append(plain, 2, 3);
    masked += '.';
    masked.append(plain, 5, 3);
    masked += '/';
    masked.append(plain, 8, 4);
    masked += '-';
    masked.append(plain, 12, 2);

    return masked;
}

} // namespace utils
} // namespace cnpj
