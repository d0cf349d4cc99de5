#include "cnpj/cnpj_c.h"
#include "cnpj/cnpj.h"
#include <cstring>
#include <exception>
#include <stdexcept>

/* ============================================================================
 * Internal wrapper structure
 * ============================================================================ */

struct cnpj_generator_t {
    cnpj::Generator generator;

    cnpj_generator_t() = default;

    explicit cnpj_generator_t(const cnpj::GeneratorConfig& config)
        : generator(config) {}
};

/* ============================================================================
 * Helper functions
 * ============================================================================ */

static void copy_string(const std::string& src, char* dest, size_t dest_len) {
    std::strncpy(dest, src.c_str(), dest_len - 1);
    dest[dest_len - 1] = '\0';
}

static cnpj::GeneratorConfig convert_config_from_c(const cnpj_config_t* config) {
    cnpj::GeneratorConfig cfg;
    cfg.alphanumeric = config->alphanumeric != 0;
    cfg.seed = config->seed;
    return cfg;
}

/* ============================================================================
 * Library functions implementation
 * ============================================================================ */

extern "C" {

const char* cnpj_version(void) {
    return cnpj::VERSION;
}

int cnpj_validate(const char* candidate) {
    try {
        return cnpj::validate(candidate) ? 1 : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

int cnpj_validate_detailed(const char* candidate, cnpj_validation_t* result) {
    if (!result) {
        return -1;
    }

    std::memset(result, 0, sizeof(cnpj_validation_t));

    try {
        cnpj::ValidationResult cpp_result = candidate
            ? cnpj::validateDetailed(candidate)
            : cnpj::validateDetailed(std::string());

        result->valid = cpp_result.valid ? 1 : 0;
        result->error = static_cast<cnpj_error_t>(cpp_result.error);
        copy_string(cpp_result.message, result->message, sizeof(result->message));
        copy_string(cpp_result.normalized, result->normalized, sizeof(result->normalized));
        return 0;
    } catch (const std::exception&) {
        copy_string("Internal error", result->message, sizeof(result->message));
        return -1;
    }
}

int cnpj_compute_check_digits(const char* body, char* out) {
    if (!body || !out) {
        return -1;
    }

    try {
        cnpj::CheckDigitsResult dv = cnpj::computeCheckDigits(body);
        if (!dv.success) {
            return -1;
        }
        copy_string(dv.digits.toString(), out, 3);
        return 0;
    } catch (const std::exception&) {
        return -1;
    }
}

size_t cnpj_strip_mask(const char* input, char* out, size_t out_len) {
    if (!input || !out || out_len == 0) {
        return 0;
    }

    try {
        std::string plain = cnpj::utils::stripMask(input);
        copy_string(plain, out, out_len);
        return std::strlen(out);
    } catch (const std::exception&) {
        out[0] = '\0';
        return 0;
    }
}

int cnpj_format(const char* cnpj, char* out, size_t out_len) {
    if (!cnpj || !out || out_len < CNPJ_MASKED_BUFFER_SIZE) {
        return -1;
    }

    try {
        copy_string(cnpj::utils::applyMask(cnpj), out, out_len);
        return 0;
    } catch (const std::invalid_argument&) {
        out[0] = '\0';
        return -1;
    }
}

int cnpj_generate(int alphanumeric, char* out, size_t out_len) {
    if (!out || out_len < CNPJ_PLAIN_BUFFER_SIZE) {
        return -1;
    }

    try {
        copy_string(cnpj::generate(alphanumeric != 0), out, out_len);
        return 0;
    } catch (const std::exception&) {
        out[0] = '\0';
        return -1;
    }
}

cnpj_config_t cnpj_default_config(void) {
    cnpj_config_t config;
    config.alphanumeric = 1;
    config.seed = 0;
    return config;
}

cnpj_generator_t* cnpj_generator_create(void) {
    try {
        return new cnpj_generator_t();
    } catch (const std::exception&) {
        return nullptr;
    }
}

cnpj_generator_t* cnpj_generator_create_with_config(const cnpj_config_t* config) {
    if (!config) {
        return cnpj_generator_create();
    }

    try {
        return new cnpj_generator_t(convert_config_from_c(config));
    } catch (const std::exception&) {
        return nullptr;
    }
}

void cnpj_generator_destroy(cnpj_generator_t* generator) {
    delete generator;
}

int cnpj_generator_next(cnpj_generator_t* generator, char* out, size_t out_len) {
    if (!generator || !out || out_len < CNPJ_PLAIN_BUFFER_SIZE) {
        return -1;
    }

    try {
        copy_string(generator->generator.generate(), out, out_len);
        return 0;
    } catch (const std::exception&) {
        out[0] = '\0';
        return -1;
    }
}

} /* extern "C" */
