#ifndef SHAMIR256_GF256_TABLES_H
#define SHAMIR256_GF256_TABLES_H

#include "../common/types.h"
#include <array>
#include <cstdint>

namespace shamir256 {
namespace gf256 {

/**
 * Logarithm / exponential tables for GF(2^8)
 *
 * Reduction polynomial: x^8 + x^4 + x^3 + x + 1 (0x11B)
 * Generator: 0x03 (0x02 is not primitive for 0x11B)
 *
 * exp[i] = 3^(i mod 255), so exp[255] == exp[0] == 1.
 * log[a] is the discrete log of a for a in 1..255. log[0] is left at 0 and is
 * never meaningful; callers mask the zero case with a constant-time select.
 *
 * Both tables are built at compile time and are immutable.
 */
struct Tables {
    std::array<uint8_t, 256> exp;
    std::array<uint8_t, 256> log;
};

constexpr Tables buildTables() {
    Tables t{};
    uint16_t x = 1;

    for (int i = 0; i < FIELD_ORDER; ++i) {
        t.exp[i] = static_cast<uint8_t>(x);
        t.log[x] = static_cast<uint8_t>(i);

        // x *= 3, i.e. (x * 2) + x
        uint16_t x2 = static_cast<uint16_t>(x << 1);
        if (x2 & 0x100) {
            x2 ^= FIELD_POLYNOMIAL;
        }
        x = static_cast<uint16_t>((x2 ^ x) & 0xFF);
    }

    t.exp[FIELD_ORDER] = t.exp[0];
    return t;
}

inline constexpr Tables TABLES = buildTables();

inline constexpr const std::array<uint8_t, 256>& expTable = TABLES.exp;
inline constexpr const std::array<uint8_t, 256>& logTable = TABLES.log;

static_assert(TABLES.exp[0] == 1, "generator power 0 must be 1");
static_assert(TABLES.exp[1] == FIELD_GENERATOR, "generator power 1 must be the generator");
static_assert(TABLES.exp[255] == TABLES.exp[0], "exp table must wrap at 255");

} // namespace gf256
} // namespace shamir256

#endif // SHAMIR256_GF256_TABLES_H
