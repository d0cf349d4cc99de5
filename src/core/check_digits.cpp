#include "cnpj/check_digits.h"
#include "cnpj/normalizer.h"

namespace cnpj {

// Constants for the modulo-11 computation
constexpr int MODULUS = 11;
constexpr int ZERO_THRESHOLD = 2;   // Remainders below this map to digit 0
constexpr const char* ZERO_BODY = "000000000000";

namespace {

uint8_t digitFromSum(int sum) {
    int remainder = sum % MODULUS;
    if (remainder < ZERO_THRESHOLD) {
        return 0;
    }
    return static_cast<uint8_t>(MODULUS - remainder);
}

} // namespace

CheckDigitsResult computeCheckDigits(const std::string& body) {
    CheckDigitsResult result;
    result.success = false;

    if (utils::hasDisallowedCharacters(body)) {
        result.error = "Body contains disallowed characters";
        return result;
    }

    std::string plain = utils::toUpper(utils::stripMask(body));

    if (plain.size() != BODY_LENGTH) {
        result.error = "Body must have exactly 12 characters";
        return result;
    }

    for (char c : plain) {
        if (!utils::isBodyCharacter(c)) {
            result.error = "Body must contain only digits and letters";
            return result;
        }
    }

    if (plain == ZERO_BODY) {
        result.error = "All-zero body has no check digits";
        return result;
    }

    // Both sums run in one pass; the first uses the weights shifted by one
    int sum1 = 0;
    int sum2 = 0;
    for (size_t i = 0; i < BODY_LENGTH; i++) {
        int value = characterValue(plain[i]);
        sum1 += value * CHECK_DIGIT_WEIGHTS[i + 1];
        sum2 += value * CHECK_DIGIT_WEIGHTS[i];
    }

    uint8_t dv1 = digitFromSum(sum1);
    sum2 += dv1 * CHECK_DIGIT_WEIGHTS[BODY_LENGTH];
    uint8_t dv2 = digitFromSum(sum2);

    result.success = true;
    result.digits.first = dv1;
    result.digits.second = dv2;
    return result;
}

} // namespace cnpj
