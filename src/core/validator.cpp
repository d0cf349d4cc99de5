#include "cnpj/validator.h"
#include "cnpj/check_digits.h"
#include "cnpj/normalizer.h"
#include <algorithm>

namespace cnpj {

namespace {

ValidationResult reject(ValidationResult result, ValidationError error) {
    result.valid = false;
    result.error = error;
    result.message = errorToString(error);
    return result;
}

bool isAllZero(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c == '0'; });
}

} // namespace

ValidationResult validateDetailed(const std::string& candidate) {
    ValidationResult result;

    if (candidate.empty()) {
        return reject(result, ValidationError::EMPTY_INPUT);
    }

    // Must run on the raw input: stripping could hide injected characters
    if (utils::hasDisallowedCharacters(candidate)) {
        return reject(result, ValidationError::DISALLOWED_CHARACTER);
    }

    result.normalized = utils::toUpper(utils::stripMask(candidate));
    const std::string& plain = result.normalized;

    if (plain.size() != CNPJ_LENGTH) {
        return reject(result, ValidationError::INVALID_LENGTH);
    }

    for (size_t i = 0; i < BODY_LENGTH; i++) {
        if (!utils::isBodyCharacter(plain[i])) {
            return reject(result, ValidationError::INVALID_BODY);
        }
    }

    for (size_t i = BODY_LENGTH; i < CNPJ_LENGTH; i++) {
        if (!utils::isDigit(plain[i])) {
            return reject(result, ValidationError::NON_NUMERIC_CHECK_DIGITS);
        }
    }

    std::string body = plain.substr(0, BODY_LENGTH);
    std::string claimed = plain.substr(BODY_LENGTH);

    // Covers 00000000000000 and any all-zero body, which has no check digits
    if (isAllZero(body)) {
        return reject(result, ValidationError::ALL_ZERO);
    }

    CheckDigitsResult computed = computeCheckDigits(body);
    if (!computed.success) {
        result = reject(result, ValidationError::INVALID_BODY);
        result.message = computed.error;
        return result;
    }

    if (computed.digits.toString() != claimed) {
        return reject(result, ValidationError::CHECK_DIGIT_MISMATCH);
    }

    result.valid = true;
    result.error = ValidationError::NONE;
    return result;
}

bool validate(const std::string& candidate) {
    return validateDetailed(candidate).valid;
}

bool validate(const char* candidate) {
    if (!candidate) {
        return false;
    }
    return validate(std::string(candidate));
}

bool isLegacyNumeric(const std::string& candidate) {
    ValidationResult result = validateDetailed(candidate);
    if (!result.valid) {
        return false;
    }
    return std::all_of(result.normalized.begin(), result.normalized.end(), utils::isDigit);
}

const char* errorToString(ValidationError error) {
    switch (error) {
        case ValidationError::NONE: return "No error";
        case ValidationError::EMPTY_INPUT: return "Empty input";
        case ValidationError::DISALLOWED_CHARACTER: return "Input contains disallowed characters";
        case ValidationError::INVALID_LENGTH: return "Expected 14 characters without mask";
        case ValidationError::INVALID_BODY: return "Body must contain only digits and letters";
        case ValidationError::NON_NUMERIC_CHECK_DIGITS: return "Check digits must be numeric";
        case ValidationError::ALL_ZERO: return "All-zero CNPJ is not valid";
        case ValidationError::CHECK_DIGIT_MISMATCH: return "Check digits do not match";
    }
    return "Unknown error";
}

} // namespace cnpj
