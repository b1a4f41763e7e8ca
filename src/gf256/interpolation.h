#ifndef SHAMIR256_GF256_INTERPOLATION_H
#define SHAMIR256_GF256_INTERPOLATION_H

#include "field.h"
#include "../common/errors.h"
#include <cstdint>
#include <vector>

namespace shamir256 {
namespace gf256 {

/**
 * Lagrange interpolation over GF(256)
 *
 * P(x) = sum_i y_i * prod_{j != i} (x - x_j) / (x_i - x_j)
 *
 * Subtraction is XOR in characteristic 2. Reconstruction evaluates at x = 0,
 * which yields the intercept.
 */
class Interpolator {
public:
    /**
     * @param x_samples Sample x-coordinates, pairwise distinct
     * @param y_samples Sample values, same length as x_samples
     * @param x Point to evaluate at
     * @throws DivisionByZeroError if two x-coordinates coincide
     */
    static uint8_t interpolate(const std::vector<uint8_t>& x_samples,
                               const std::vector<uint8_t>& y_samples,
                               uint8_t x) {
        if (x_samples.size() != y_samples.size()) {
            throw InvalidArgumentError("Sample sets must be the same length");
        }

        const size_t limit = x_samples.size();
        uint8_t result = 0;

        for (size_t i = 0; i < limit; ++i) {
            uint8_t basis = 1;

            for (size_t j = 0; j < limit; ++j) {
                if (i == j) continue;

                uint8_t num = GF256::add(x, x_samples[j]);
                uint8_t denom = GF256::add(x_samples[i], x_samples[j]);
                basis = GF256::mult(basis, GF256::div(num, denom));
            }

            result = GF256::add(result, GF256::mult(y_samples[i], basis));
        }

        return result;
    }
};

} // namespace gf256
} // namespace shamir256

#endif // SHAMIR256_GF256_INTERPOLATION_H
