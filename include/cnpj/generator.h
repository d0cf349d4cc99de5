#ifndef CNPJ_GENERATOR_H
#define CNPJ_GENERATOR_H

#include "cnpj/types.h"
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace cnpj {

// Source of uniform integers used by the generator.
// Implement this to make generation deterministic in tests.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform draw in [min, max], both inclusive
    virtual uint32_t uniform(uint32_t min, uint32_t max) = 0;
};

// Default source backed by std::mt19937
class MersenneTwisterSource : public RandomSource {
public:
    // seed == 0 seeds from std::random_device
    explicit MersenneTwisterSource(uint32_t seed = 0);

    uint32_t uniform(uint32_t min, uint32_t max) override;

private:
    std::mt19937 engine_;
};

/**
 * Random CNPJ generator
 *
 * Every identifier it returns is 14 characters, unmasked, uppercase,
 * and passes validate().
 */
class Generator {
public:
    Generator();
    explicit Generator(const GeneratorConfig& config);
    Generator(std::unique_ptr<RandomSource> source, const GeneratorConfig& config = GeneratorConfig{});
    ~Generator();

    // Non-copyable
    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Movable
    Generator(Generator&&) noexcept;
    Generator& operator=(Generator&&) noexcept;

    // Generate using config.alphanumeric
    std::string generate();

    // Generate a full identifier (body + check digits).
    // Throws std::runtime_error if the source keeps yielding the all-zero
    // body, std::out_of_range if it draws outside the requested range.
    std::string generate(bool alphanumeric);

    // Generate only the 12-character body.
    // May return the all-zero body; generate() redraws in that case.
    std::string generateBody(bool alphanumeric);

    const GeneratorConfig& config() const { return config_; }

private:
    // Draw in [0, max] from the source, rejecting out-of-range values
    uint32_t draw(uint32_t max);
    char randomDigit();
    char randomLetter();

    GeneratorConfig config_;
    std::unique_ptr<RandomSource> source_;
};

// Generate with a thread-local generator seeded from std::random_device
std::string generate(bool alphanumeric = true);

} // namespace cnpj

#endif // CNPJ_GENERATOR_H
