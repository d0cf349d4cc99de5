#ifndef CNPJ_VALIDATOR_H
#define CNPJ_VALIDATOR_H

#include "cnpj/types.h"
#include <string>

namespace cnpj {

/**
 * Check whether a CNPJ, masked or not, is valid.
 *
 * Accepts lowercase letters in the body and mask characters anywhere.
 * Never throws; every malformed input yields false.
 */
bool validate(const std::string& candidate);

// Null pointer is treated as absent input
bool validate(const char* candidate);

/**
 * Same checks as validate(), reporting which one rejected the input.
 * validate(x) == validateDetailed(x).valid for every input.
 */
ValidationResult validateDetailed(const std::string& candidate);

// Valid CNPJ whose body is made only of digits (pre-alphanumeric format)
bool isLegacyNumeric(const std::string& candidate);

// Short description of a validation error
const char* errorToString(ValidationError error);

} // namespace cnpj

#endif // CNPJ_VALIDATOR_H
