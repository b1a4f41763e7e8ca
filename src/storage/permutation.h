#ifndef SHAMIR256_PERMUTATION_H
#define SHAMIR256_PERMUTATION_H

#include "../crypto/random_source.h"
#include <cstdint>
#include <vector>

namespace shamir256 {
namespace storage {

/**
 * Uniformly random permutation of 0..n-1 (inside-out Fisher-Yates)
 *
 * For each i, j is drawn from [0, i]; m[i] takes m[j] and m[j] takes i.
 * Split uses the first `parts` entries (+1) as share x-coordinates.
 */
inline std::vector<uint32_t> perm(uint32_t n, crypto::RandomSource& rng) {
    std::vector<uint32_t> m(n);

    for (uint32_t i = 0; i < n; ++i) {
        uint32_t j = rng.uniformInt(i);
        m[i] = m[j];
        m[j] = i;
    }

    return m;
}

} // namespace storage
} // namespace shamir256

#endif // SHAMIR256_PERMUTATION_H
