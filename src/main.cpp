/**
 * GF(256) Demo Entry Point
 *
 * Builds two field elements, adds and divides them, and prints both results.
 *
 * Usage:
 *   gf256_demo [--config demo.yaml] [--a <byte>] [--b <byte>] [--self-test]
 */

#include "common/config_loader.h"
#include "common/errors.h"
#include "field/field_element.h"
#include "field/field_tables.h"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace gf256;
using field::FieldElement;

namespace {

bool runSelfTest() {
    std::cout << "[SelfTest] Verifying exp/log/inv tables...\n";
    auto problem = field::FieldTables::get().verify();
    if (problem) {
        std::cout << "[SelfTest] ❌ " << *problem << "\n";
        return false;
    }
    std::cout << "[SelfTest] ✅ All table invariants hold\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    config::DemoConfig config;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::string(argv[i]) == "--config") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for --config");
                }
                config.loadFromFile(argv[++i]);
            }
        }
        config.applyCommandLineOverrides(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Demo] Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (config.self_test && !runSelfTest()) {
        return 1;
    }

    FieldElement a = FieldElement::fromByte(config.a);
    FieldElement b = FieldElement::fromByte(config.b);

    FieldElement c = a + b;
    std::cout << "c = " << c << "\n";

    try {
        FieldElement d = a / b;
        std::cout << "d = " << d << "\n";
    } catch (const DivisionByZeroError& e) {
        std::cerr << "[Demo] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
