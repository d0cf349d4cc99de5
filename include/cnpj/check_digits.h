#ifndef CNPJ_CHECK_DIGITS_H
#define CNPJ_CHECK_DIGITS_H

#include "cnpj/types.h"
#include <string>

namespace cnpj {

/**
 * Compute the two modulo-11 check digits of a CNPJ body.
 *
 * The body may carry mask characters and lowercase letters; it is
 * stripped and uppercased before the computation. Rejected bodies
 * (disallowed characters, not 12 alphanumerics, all zeros) come back
 * with success == false and a reason in error.
 */
CheckDigitsResult computeCheckDigits(const std::string& body);

// Ordinal value of a body character: offset from '0' in ASCII.
// '0'..'9' -> 0..9, 'A'..'Z' -> 17..42
inline int characterValue(char c) {
    return static_cast<int>(c) - static_cast<int>('0');
}

} // namespace cnpj

#endif // CNPJ_CHECK_DIGITS_H
