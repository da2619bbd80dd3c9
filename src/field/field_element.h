#ifndef GF256_FIELD_ELEMENT_H
#define GF256_FIELD_ELEMENT_H

#include "../common/types.h"
#include "../common/errors.h"
#include "field_tables.h"
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>

namespace gf256 {
namespace field {

/**
 * Element of the finite field GF(256)
 *
 * The byte is the coefficient vector of a polynomial of degree <= 7 over
 * GF(2), bit i holding the coefficient of x^i.
 *
 * - Addition and subtraction are both XOR (characteristic 2)
 * - Multiplication and division add / subtract discrete logarithms modulo
 *   255 and look the result up in FieldTables
 *
 * Values are immutable; every operation returns a new element.
 */
class FieldElement {
private:
    uint8_t poly_;

    constexpr explicit FieldElement(uint8_t poly) : poly_(poly) {}

public:
    constexpr FieldElement() : poly_(0) {}

    // Additive identity
    static constexpr FieldElement zero() { return FieldElement(0); }

    // Multiplicative identity
    static constexpr FieldElement one() { return FieldElement(1); }

    static constexpr FieldElement fromByte(uint8_t b) { return FieldElement(b); }

    constexpr uint8_t toByte() const { return poly_; }

    constexpr bool isZero() const { return poly_ == 0; }

    /**
     * Discrete logarithm in base x: the exponent i in 0..254 with x^i == *this
     *
     * @return std::nullopt for zero, which has no logarithm
     */
    std::optional<uint8_t> log() const {
        if (isZero()) {
            return std::nullopt;
        }
        return FieldTables::get().log[poly_];
    }

    // x^power, power in 0..255 (x^255 == x^0 == 1)
    static FieldElement xexp(uint8_t power) {
        return FieldElement(FieldTables::get().exp[power]);
    }

    /**
     * Raise to `power`.
     *
     * Zero stays zero for every power, including power == 0.
     */
    FieldElement exp(uint8_t power) const {
        auto l = log();
        if (!l) {
            return zero();
        }
        return xexp(static_cast<uint8_t>(
            (static_cast<uint16_t>(*l) * power) % GROUP_ORDER));
    }

    /**
     * Multiplicative inverse: y such that *this * y == 1
     *
     * @return std::nullopt for zero, which has no inverse
     */
    std::optional<FieldElement> inv() const {
        auto l = log();
        if (!l) {
            return std::nullopt;
        }
        return xexp(static_cast<uint8_t>(GROUP_ORDER - *l));
    }

    static constexpr FieldElement add(FieldElement a, FieldElement b) {
        return FieldElement(static_cast<uint8_t>(a.poly_ ^ b.poly_));
    }

    // Same as add in characteristic 2
    static constexpr FieldElement subtract(FieldElement a, FieldElement b) {
        return FieldElement(static_cast<uint8_t>(a.poly_ ^ b.poly_));
    }

    static FieldElement multiply(FieldElement a, FieldElement b) {
        auto la = a.log();
        auto lb = b.log();
        if (!la || !lb) {
            return zero();
        }
        return xexp(static_cast<uint8_t>(
            (static_cast<uint16_t>(*la) + *lb) % GROUP_ORDER));
    }

    /**
     * Divide a by b.
     *
     * @throws DivisionByZeroError if b is zero, whatever a is
     */
    static FieldElement divide(FieldElement a, FieldElement b) {
        auto lb = b.log();
        if (!lb) {
            throw DivisionByZeroError();
        }
        auto la = a.log();
        if (!la) {
            return zero();
        }
        return xexp(static_cast<uint8_t>(
            (static_cast<uint16_t>(*la) + GROUP_ORDER - *lb) % GROUP_ORDER));
    }

    FieldElement& operator+=(FieldElement rhs) {
        *this = add(*this, rhs);
        return *this;
    }

    FieldElement& operator-=(FieldElement rhs) {
        *this = subtract(*this, rhs);
        return *this;
    }

    FieldElement& operator*=(FieldElement rhs) {
        *this = multiply(*this, rhs);
        return *this;
    }

    FieldElement& operator/=(FieldElement rhs) {
        *this = divide(*this, rhs);
        return *this;
    }

    friend constexpr bool operator==(FieldElement a, FieldElement b) {
        return a.poly_ == b.poly_;
    }

    friend constexpr bool operator!=(FieldElement a, FieldElement b) {
        return a.poly_ != b.poly_;
    }
};

inline constexpr FieldElement operator+(FieldElement a, FieldElement b) {
    return FieldElement::add(a, b);
}

inline constexpr FieldElement operator-(FieldElement a, FieldElement b) {
    return FieldElement::subtract(a, b);
}

inline FieldElement operator*(FieldElement a, FieldElement b) {
    return FieldElement::multiply(a, b);
}

inline FieldElement operator/(FieldElement a, FieldElement b) {
    return FieldElement::divide(a, b);
}

// Renders as GF256(0xNN)
inline std::ostream& operator<<(std::ostream& os, FieldElement e) {
    std::ostringstream ss;
    ss << "GF256(0x" << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(e.toByte()) << ")";
    return os << ss.str();
}

} // namespace field
} // namespace gf256

#endif // GF256_FIELD_ELEMENT_H
