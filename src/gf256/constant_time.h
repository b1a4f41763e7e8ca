#ifndef SHAMIR256_GF256_CONSTANT_TIME_H
#define SHAMIR256_GF256_CONSTANT_TIME_H

#include "../common/errors.h"

namespace shamir256 {
namespace gf256 {

/**
 * Branch-free helpers for secret-dependent values
 *
 * The contract checks below may branch: they look only at whether the inputs
 * are in range, never at which in-range value was passed.
 */
class ConstantTime {
public:
    /**
     * Returns 1 if x == y and 0 otherwise
     *
     * @throws InvalidArgumentError if either value is outside 0..255
     */
    static int byteEq(int x, int y) {
        if (((~0xFF & x) | (~0xFF & y)) != 0) {
            throw InvalidArgumentError("Not uint8 values passed");
        }

        // z is 0 iff x == y; (z - 1) then borrows into bit 8
        unsigned int z = static_cast<unsigned int>(x ^ y);
        return static_cast<int>(((z - 1u) >> 8) & 1u);
    }

    /**
     * Returns x if v == 1 and y if v == 0
     *
     * @throws UndefinedBehaviorError for any other v
     */
    static int select(int v, int x, int y) {
        if (v != 0 && v != 1) {
            throw UndefinedBehaviorError();
        }
        return (~(v - 1) & x) | ((v - 1) & y);
    }
};

} // namespace gf256
} // namespace shamir256

#endif // SHAMIR256_GF256_CONSTANT_TIME_H
