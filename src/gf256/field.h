#ifndef SHAMIR256_GF256_FIELD_H
#define SHAMIR256_GF256_FIELD_H

#include "tables.h"
#include "constant_time.h"
#include "../common/errors.h"
#include <cstdint>

namespace shamir256 {
namespace gf256 {

/**
 * Galois Field GF(256) arithmetic
 *
 * Operands may be secret-derived (polynomial coefficients, share bytes), so the
 * zero special cases are resolved with ConstantTime::select instead of an if.
 * The table lookup for log[0] still happens; its result is simply discarded.
 */
class GF256 {
public:
    // Add (XOR in GF(2^8)); also subtraction
    static uint8_t add(uint8_t a, uint8_t b) {
        return static_cast<uint8_t>(a ^ b);
    }

    // Multiply two elements in GF(256)
    static uint8_t mult(uint8_t a, uint8_t b) {
        int sum = (logTable[a] + logTable[b]) % FIELD_ORDER;
        int ret = expTable[sum];

        ret = ConstantTime::select(ConstantTime::byteEq(a, 0), 0, ret);
        ret = ConstantTime::select(ConstantTime::byteEq(b, 0), 0, ret);
        return static_cast<uint8_t>(ret);
    }

    /**
     * Divide a by b in GF(256)
     *
     * @throws DivisionByZeroError if b == 0. Only reachable when two samples
     *         share an x-coordinate, so the branch does not leak anything secret.
     */
    static uint8_t div(uint8_t a, uint8_t b) {
        if (b == 0) {
            throw DivisionByZeroError();
        }

        int diff = ((logTable[a] - logTable[b]) + FIELD_ORDER) % FIELD_ORDER;
        int ret = expTable[diff];

        return static_cast<uint8_t>(ConstantTime::select(ConstantTime::byteEq(a, 0), 0, ret));
    }
};

} // namespace gf256
} // namespace shamir256

#endif // SHAMIR256_GF256_FIELD_H
