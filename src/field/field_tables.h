#ifndef GF256_FIELD_TABLES_H
#define GF256_FIELD_TABLES_H

#include "../common/types.h"
#include <array>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace gf256 {
namespace field {

/**
 * Replicate the least significant bit of `bit` into every bit of the result
 * (0x00 or 0xFF).
 */
constexpr uint8_t mask(uint8_t bit) {
    return static_cast<uint8_t>(0u - (bit & 1u));
}

/**
 * Multiply a polynomial by x and reduce modulo the field polynomial.
 *
 * Shifting left drops the x^8 coefficient; when it was set, XOR-ing in
 * REDUCTION_POLY replaces x^8 by x^4 + x^3 + x^2 + 1.
 */
constexpr uint8_t xtimes(uint8_t poly) {
    return static_cast<uint8_t>((poly << 1) ^ (mask(poly >> 7) & REDUCTION_POLY));
}

/**
 * Carry-less shift-and-add multiplication, without the tables.
 * Reference implementation used to cross-check the table-driven product.
 */
constexpr uint8_t polyMultiply(uint8_t a, uint8_t b) {
    uint8_t result = 0;
    while (b != 0) {
        result ^= static_cast<uint8_t>(mask(b) & a);
        a = xtimes(a);
        b = static_cast<uint8_t>(b >> 1);
    }
    return result;
}

/**
 * Exponent / logarithm / inverse tables for GF(256)
 *
 * Layout (indexed by byte value):
 * - exp[i] = GENERATOR^i for i in 0..254, exp[255] = exp[0] = 1
 * - log[v] = i such that exp[i] == v, for v != 0 (log[0] is never read)
 * - inv[v] = w such that v * w == 1, for v != 0 (inv[0] is unused)
 *
 * The tables are built by a constexpr routine and live in constant-initialized
 * storage, so they exist before any thread runs and are never written again.
 * get() is the only way the element operations reach them.
 */
struct FieldTables {
    std::array<uint8_t, FIELD_SIZE> exp{};
    std::array<uint8_t, FIELD_SIZE> log{};
    std::array<uint8_t, FIELD_SIZE> inv{};

    static constexpr FieldTables build() {
        FieldTables tables{};

        uint8_t value = 1;
        for (uint16_t power = 0; power < GROUP_ORDER; ++power) {
            tables.exp[power] = value;
            tables.log[value] = static_cast<uint8_t>(power);
            value = xtimes(value);
        }

        // Lets exponent sums that land exactly on 255 index without a modulo
        tables.exp[GROUP_ORDER] = tables.exp[0];

        for (uint16_t v = 1; v < FIELD_SIZE; ++v) {
            tables.inv[v] = tables.exp[(GROUP_ORDER - tables.log[v]) % GROUP_ORDER];
        }

        return tables;
    }

    static const FieldTables& get() {
        static constexpr FieldTables tables = build();
        return tables;
    }

    /**
     * Check every table invariant.
     *
     * @return Description of the first violation, or std::nullopt if the
     *         tables are consistent
     */
    std::optional<std::string> verify() const {
        std::ostringstream problem;

        if (exp[0] != 1 || exp[GROUP_ORDER] != exp[0]) {
            problem << "exp[0] and exp[255] must both be 1 (got "
                    << static_cast<int>(exp[0]) << ", "
                    << static_cast<int>(exp[GROUP_ORDER]) << ")";
            return problem.str();
        }

        std::array<bool, FIELD_SIZE> seen{};
        for (uint16_t i = 0; i < GROUP_ORDER; ++i) {
            uint8_t v = exp[i];
            if (v == 0 || seen[v]) {
                problem << "exp[" << i << "] = " << static_cast<int>(v)
                        << " repeats or is zero; generator order is not 255";
                return problem.str();
            }
            seen[v] = true;

            if (log[v] != i) {
                problem << "log[exp[" << i << "]] = " << static_cast<int>(log[v]);
                return problem.str();
            }

            uint8_t next = (i + 1 < GROUP_ORDER) ? exp[i + 1] : exp[0];
            if (polyMultiply(v, GENERATOR) != next) {
                problem << "exp[" << i + 1 << "] is not exp[" << i << "] * x";
                return problem.str();
            }
        }

        for (uint16_t v = 1; v < FIELD_SIZE; ++v) {
            if (exp[log[v]] != v) {
                problem << "exp[log[" << v << "]] = " << static_cast<int>(exp[log[v]]);
                return problem.str();
            }
            if ((log[v] + log[inv[v]]) % GROUP_ORDER != 0) {
                problem << "inv[" << v << "] = " << static_cast<int>(inv[v])
                        << " is not the inverse";
                return problem.str();
            }
        }

        return std::nullopt;
    }
};

} // namespace field
} // namespace gf256

#endif // GF256_FIELD_TABLES_H
