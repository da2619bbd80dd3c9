#ifndef GF256_ERRORS_H
#define GF256_ERRORS_H

#include <stdexcept>

namespace gf256 {

/**
 * Raised by FieldElement::divide() and operator/ when the divisor is zero.
 *
 * This is the only failure the field arithmetic raises. The logarithm and
 * inverse of zero are not failures: they come back as an empty optional.
 */
class DivisionByZeroError : public std::domain_error {
public:
    DivisionByZeroError()
        : std::domain_error("Division by zero in GF(256)") {}
};

} // namespace gf256

#endif // GF256_ERRORS_H
