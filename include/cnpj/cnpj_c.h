#ifndef CNPJ_C_H
#define CNPJ_C_H

/**
 * CNPJ C API - Pure C interface for cross-language bindings
 *
 * This header provides a C-compatible API for use with:
 * - JNI (Android/Java)
 * - Python ctypes/cffi
 * - Other FFI systems
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Opaque handle types
 * ============================================================================ */

typedef struct cnpj_generator_t cnpj_generator_t;

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum {
    CNPJ_ERROR_NONE = 0,
    CNPJ_ERROR_EMPTY_INPUT = 1,
    CNPJ_ERROR_DISALLOWED_CHARACTER = 2,
    CNPJ_ERROR_INVALID_LENGTH = 3,
    CNPJ_ERROR_INVALID_BODY = 4,
    CNPJ_ERROR_NON_NUMERIC_CHECK_DIGITS = 5,
    CNPJ_ERROR_ALL_ZERO = 6,
    CNPJ_ERROR_CHECK_DIGIT_MISMATCH = 7
} cnpj_error_t;

/* ============================================================================
 * Data structures (C-compatible, fixed-size)
 * ============================================================================ */

#define CNPJ_MAX_LENGTH 64           /* Normalized buffer, truncated if longer */
#define CNPJ_PLAIN_BUFFER_SIZE 15    /* 14 characters + NUL */
#define CNPJ_MASKED_BUFFER_SIZE 19   /* XX.XXX.XXX/XXXX-XX + NUL */

typedef struct {
    int valid;
    cnpj_error_t error;
    char message[128];
    char normalized[CNPJ_MAX_LENGTH];
} cnpj_validation_t;

typedef struct {
    int alphanumeric;
    uint32_t seed;      /* 0 = nondeterministic */
} cnpj_config_t;

/* ============================================================================
 * Library functions
 * ============================================================================ */

/**
 * Get library version string
 */
const char* cnpj_version(void);

/**
 * Validate a CNPJ, with or without mask
 * @param candidate NUL-terminated string (NULL is treated as invalid)
 * @return 1 if valid, 0 otherwise
 */
int cnpj_validate(const char* candidate);

/**
 * Validate a CNPJ and report the reason for rejection
 * @param candidate NUL-terminated string (NULL reports CNPJ_ERROR_EMPTY_INPUT)
 * @param result Output result structure
 * @return 0 on success, non-zero on error
 */
int cnpj_validate_detailed(const char* candidate, cnpj_validation_t* result);

/**
 * Compute the check digits of a 12-character body
 * @param body Body, mask characters allowed
 * @param out Output buffer of at least 3 bytes, receives "DD\0"
 * @return 0 on success, -1 if the body is rejected
 */
int cnpj_compute_check_digits(const char* body, char* out);

/**
 * Remove mask characters ('.', '/', '-')
 * @param input NUL-terminated input
 * @param out Output buffer
 * @param out_len Size of output buffer (result is truncated to out_len - 1)
 * @return Number of characters written, excluding NUL
 */
size_t cnpj_strip_mask(const char* input, char* out, size_t out_len);

/**
 * Render a CNPJ as XX.XXX.XXX/XXXX-XX (check digits are not verified)
 * @param cnpj 14 characters, mask characters allowed
 * @param out Output buffer
 * @param out_len At least CNPJ_MASKED_BUFFER_SIZE
 * @return 0 on success, -1 on error
 */
int cnpj_format(const char* cnpj, char* out, size_t out_len);

/**
 * Generate a random valid CNPJ (thread-local source)
 * @param alphanumeric Non-zero to mix letters into the body
 * @param out Output buffer
 * @param out_len At least CNPJ_PLAIN_BUFFER_SIZE
 * @return 0 on success, -1 on error
 */
int cnpj_generate(int alphanumeric, char* out, size_t out_len);

/**
 * Get default generator configuration
 */
cnpj_config_t cnpj_default_config(void);

/**
 * Create a generator with default configuration
 * @return Generator handle, or NULL on failure
 */
cnpj_generator_t* cnpj_generator_create(void);

/**
 * Create a generator with custom configuration (seeded if seed != 0)
 * @param config Configuration options
 * @return Generator handle, or NULL on failure
 */
cnpj_generator_t* cnpj_generator_create_with_config(const cnpj_config_t* config);

/**
 * Destroy a generator and free resources
 * @param generator Generator handle
 */
void cnpj_generator_destroy(cnpj_generator_t* generator);

/**
 * Generate the next CNPJ from a generator
 * @param generator Generator handle
 * @param out Output buffer
 * @param out_len At least CNPJ_PLAIN_BUFFER_SIZE
 * @return 0 on success, -1 on error
 */
int cnpj_generator_next(cnpj_generator_t* generator, char* out, size_t out_len);

#ifdef __cplusplus
}
#endif

#endif /* CNPJ_C_H */
