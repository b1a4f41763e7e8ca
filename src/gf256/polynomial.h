#ifndef SHAMIR256_GF256_POLYNOMIAL_H
#define SHAMIR256_GF256_POLYNOMIAL_H

#include "field.h"
#include "../crypto/random_source.h"
#include <cstdint>
#include <vector>

namespace shamir256 {
namespace gf256 {

/**
 * Polynomial over GF(256), coefficients in ascending order of degree
 *
 * coefficients[0] is the intercept P(0). In Shamir's scheme that is one byte
 * of the secret and the remaining coefficients are uniformly random.
 */
class Polynomial {
public:
    /**
     * Build a random polynomial of the given degree with a fixed intercept
     *
     * @param intercept Value of P(0)
     * @param degree Polynomial degree (threshold - 1)
     * @param rng Secure random source for coefficients 1..degree
     * @return degree + 1 coefficients
     */
    static std::vector<uint8_t> make(uint8_t intercept, size_t degree,
                                     crypto::RandomSource& rng) {
        std::vector<uint8_t> coefficients(degree + 1);
        coefficients[0] = intercept;

        for (size_t i = 1; i <= degree; ++i) {
            coefficients[i] = rng.randomByte();
        }

        return coefficients;
    }

    static std::vector<uint8_t> make(uint8_t intercept, size_t degree) {
        return make(intercept, degree, crypto::SodiumRandomSource::instance());
    }

    /**
     * Evaluate polynomial at point x using Horner's method
     *
     * P(x) = a_0 + x(a_1 + x(a_2 + ... ))
     */
    static uint8_t evaluate(const std::vector<uint8_t>& coefficients, uint8_t x) {
        if (coefficients.empty()) return 0;

        // Special case the origin
        if (x == 0) {
            return coefficients[0];
        }

        uint8_t result = coefficients.back();
        for (int i = static_cast<int>(coefficients.size()) - 2; i >= 0; --i) {
            result = GF256::add(GF256::mult(result, x), coefficients[i]);
        }

        return result;
    }
};

} // namespace gf256
} // namespace shamir256

#endif // SHAMIR256_GF256_POLYNOMIAL_H
