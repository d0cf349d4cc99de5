// =============================================================================
// CNPJ Fuzz Target - libFuzzer entry point
// =============================================================================
// Build with: clang++ -g -O1 -fno-omit-frame-pointer -fsanitize=fuzzer,address
//             fuzz/fuzz_validator.cpp -I include src/*/*.cpp -o fuzz_validator
//
// Run with: ./fuzz_validator -max_len=64 -timeout=5
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "cnpj/cnpj.h"
#include "cnpj/cnpj_c.h"

using namespace cnpj;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 256) {
        return 0;
    }

    std::string input(reinterpret_cast<const char*>(data), size);

    // Validation must never throw and must agree with the detailed form
    bool valid = validate(input);
    ValidationResult detailed = validateDetailed(input);
    if (valid != detailed.valid) {
        std::abort();
    }

    // A valid input stays valid once its mask is stripped or re-applied
    if (valid) {
        if (!validate(utils::stripMask(input))) {
            std::abort();
        }
        if (!validate(utils::applyMask(input))) {
            std::abort();
        }
    }

    {
        auto result = computeCheckDigits(input);
        (void)result;
    }

    try {
        auto masked = utils::applyMask(input);
        (void)masked;
    } catch (const std::invalid_argument&) {
        // Expected for anything that is not 14 characters
    }

    // C API with a NUL-terminated copy
    {
        char out[CNPJ_MASKED_BUFFER_SIZE];
        cnpj_validation_t result;
        cnpj_validate_detailed(input.c_str(), &result);
        cnpj_compute_check_digits(input.c_str(), out);
        cnpj_format(input.c_str(), out, sizeof(out));
        cnpj_strip_mask(input.c_str(), out, sizeof(out));
    }

    return 0;
}
