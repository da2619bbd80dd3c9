#ifndef GF256_TYPES_H
#define GF256_TYPES_H

#include <cstdint>

namespace gf256 {

// Field parameters
constexpr uint16_t FIELD_SIZE = 256;
constexpr uint16_t GROUP_ORDER = 255;  // order of the multiplicative group

// x^8 + x^4 + x^3 + x^2 + 1 (0x11D) with the x^8 term dropped
constexpr uint8_t REDUCTION_POLY = 0x1D;

// x is primitive for 0x11D: x^0 .. x^254 enumerate every nonzero element
constexpr uint8_t GENERATOR = 0x02;

} // namespace gf256

#endif // GF256_TYPES_H
