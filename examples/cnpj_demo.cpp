#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include "cnpj/cnpj.h"

// Example: generating and validating CNPJs

int main() {
    std::cout << "Open CNPJ Codec v" << cnpj::VERSION << std::endl;
    std::cout << "========================================" << std::endl;

    std::cout << "\nGenerated identifiers:" << std::endl;
    for (int i = 0; i < 4; i++) {
        bool alphanumeric = (i % 2 == 0);
        std::string id = cnpj::generate(alphanumeric);
        std::cout << "  " << std::left << std::setw(14) << (alphanumeric ? "alphanumeric" : "numeric")
                  << id << "  " << cnpj::utils::applyMask(id)
                  << "  valid=" << std::boolalpha << cnpj::validate(id) << std::endl;
    }

    // Reproducible sequence from a seeded generator
    cnpj::GeneratorConfig config;
    config.seed = 2024;
    cnpj::Generator seeded(config);

    std::cout << "\nSeeded generator (seed " << config.seed << "):" << std::endl;
    for (int i = 0; i < 3; i++) {
        std::cout << "  " << seeded.generate() << std::endl;
    }

    std::vector<std::string> samples = {
        "12.ABC.345/01DE-35",
        "12abc34501de35",
        "11.222.333/0001-81",
        "12.ABC.345/01DE-36",
        "00.000.000/0000-00",
        "AB#12345678901",
        "12ABC34501DE3",
    };

    std::cout << "\nValidating samples:" << std::endl;
    for (const auto& sample : samples) {
        auto result = cnpj::validateDetailed(sample);
        std::cout << "  " << std::left << std::setw(20) << sample;
        if (result.valid) {
            std::cout << "[VALID]" << (cnpj::isLegacyNumeric(sample) ? " numeric" : " alphanumeric");
        } else {
            std::cout << "[INVALID] " << result.message;
        }
        std::cout << std::endl;
    }

    auto dv = cnpj::computeCheckDigits("12ABC34501DE");
    if (dv.success) {
        std::cout << "\nCheck digits of 12ABC34501DE: " << dv.digits.toString() << std::endl;
    }

    return 0;
}
