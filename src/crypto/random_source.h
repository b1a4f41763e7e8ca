#ifndef SHAMIR256_RANDOM_SOURCE_H
#define SHAMIR256_RANDOM_SOURCE_H

#include "../common/errors.h"
#include <cstdint>
#include <vector>
#include <sodium.h>

namespace shamir256 {
namespace crypto {

/**
 * Source of cryptographically secure randomness
 *
 * Split draws polynomial coefficients through randomByte() and the x-coordinate
 * permutation through uniformInt(). Predictable output here breaks secrecy of
 * every share, so production code should only ever use SodiumRandomSource.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform byte in [0, 255]
    virtual uint8_t randomByte() = 0;

    // Unbiased uniform integer in [0, max_inclusive]
    virtual uint32_t uniformInt(uint32_t max_inclusive) = 0;
};

/**
 * libsodium-backed random source
 *
 * randombytes_uniform() rejection-samples, so uniformInt() has no modulo bias.
 * The object is stateless; one instance can be shared between threads.
 */
class SodiumRandomSource : public RandomSource {
public:
    SodiumRandomSource() {
        // Initialize libsodium (safe to call multiple times)
        if (sodium_init() < 0) {
            throw RandomSourceError("libsodium initialization failed");
        }
    }

    uint8_t randomByte() override {
        uint8_t value = 0;
        randombytes_buf(&value, sizeof(value));
        return value;
    }

    uint32_t uniformInt(uint32_t max_inclusive) override {
        if (max_inclusive == UINT32_MAX) {
            return randombytes_random();
        }
        return randombytes_uniform(max_inclusive + 1);
    }

    /**
     * Process-wide default instance
     */
    static SodiumRandomSource& instance() {
        static SodiumRandomSource source;
        return source;
    }
};

/**
 * Zero a buffer that held secret material
 *
 * sodium_memzero is not optimised away the way a plain fill can be.
 */
inline void secureWipe(std::vector<uint8_t>& buffer) {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

} // namespace crypto
} // namespace shamir256

#endif // SHAMIR256_RANDOM_SOURCE_H
