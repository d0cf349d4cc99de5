#ifndef CNPJ_H
#define CNPJ_H

// Open CNPJ Codec - Main include header
// Include this file to access all validation and generation functionality

#include "cnpj/types.h"
#include "cnpj/normalizer.h"
#include "cnpj/check_digits.h"
#include "cnpj/validator.h"
#include "cnpj/generator.h"

namespace cnpj {

// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace cnpj

#endif // CNPJ_H
