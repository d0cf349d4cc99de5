#include "cnpj/generator.h"
#include "cnpj/check_digits.h"
#include <stdexcept>

namespace cnpj {

namespace {

// A healthy source hits the all-zero body with odds of 1 in 10^12 per draw
constexpr int MAX_BODY_ATTEMPTS = 16;

} // namespace

MersenneTwisterSource::MersenneTwisterSource(uint32_t seed)
    : engine_(seed != 0 ? seed : std::random_device{}()) {}

uint32_t MersenneTwisterSource::uniform(uint32_t min, uint32_t max) {
    std::uniform_int_distribution<uint32_t> dist(min, max);
    return dist(engine_);
}

Generator::Generator()
    : Generator(GeneratorConfig{}) {}

Generator::Generator(const GeneratorConfig& config)
    : config_(config)
    , source_(std::make_unique<MersenneTwisterSource>(config.seed)) {}

Generator::Generator(std::unique_ptr<RandomSource> source, const GeneratorConfig& config)
    : config_(config)
    , source_(std::move(source)) {
    if (!source_) {
        source_ = std::make_unique<MersenneTwisterSource>(config_.seed);
    }
}

Generator::~Generator() = default;

Generator::Generator(Generator&&) noexcept = default;
Generator& Generator::operator=(Generator&&) noexcept = default;

std::string Generator::generate() {
    return generate(config_.alphanumeric);
}

std::string Generator::generate(bool alphanumeric) {
    for (int attempt = 0; attempt < MAX_BODY_ATTEMPTS; attempt++) {
        std::string body = generateBody(alphanumeric);
        CheckDigitsResult dv = computeCheckDigits(body);
        if (dv.success) {
            return body + dv.digits.toString();
        }
    }
    throw std::runtime_error("Generator: random source keeps producing the all-zero body");
}

std::string Generator::generateBody(bool alphanumeric) {
    std::string body;
    body.reserve(BODY_LENGTH);

    for (size_t i = 0; i < BODY_LENGTH; i++) {
        if (!alphanumeric) {
            body += randomDigit();
            continue;
        }

        // Fair coin: digit or letter
        if (draw(1) == 0) {
            body += randomDigit();
        } else {
            body += randomLetter();
        }
    }

    return body;
}

uint32_t Generator::draw(uint32_t max) {
    uint32_t value = source_->uniform(0, max);
    if (value > max) {
        throw std::out_of_range("Generator: random source returned a value above the requested range");
    }
    return value;
}

char Generator::randomDigit() {
    return static_cast<char>('0' + draw(9));
}

char Generator::randomLetter() {
    return static_cast<char>('A' + draw(25));
}

std::string generate(bool alphanumeric) {
    thread_local Generator generator;
    return generator.generate(alphanumeric);
}

} // namespace cnpj
