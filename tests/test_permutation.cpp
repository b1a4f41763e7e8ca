/**
 * Inside-out Fisher-Yates permutation used for share x-coordinates
 */

#include "storage/permutation.h"
#include "crypto/random_source.h"
#include "test_support.h"

#include <string>
#include <vector>

using namespace shamir256;
using namespace shamir256::storage;
using namespace shamir256::test;

namespace {

bool isPermutation(const std::vector<uint32_t>& m) {
    std::vector<bool> seen(m.size(), false);
    for (uint32_t v : m) {
        if (v >= m.size() || seen[v]) return false;
        seen[v] = true;
    }
    return true;
}

TestResult test_perm_is_permutation() {
    for (uint8_t seed : {0x00, 0x01, 0x7F, 0xFE}) {
        SequenceRandomSource rng({seed, static_cast<uint8_t>(seed * 3 + 1), 0x42});
        auto m = perm(255, rng);
        if (m.size() != 255 || !isPermutation(m)) {
            return {"perm(255) contains 0..254 exactly once", false,
                    "seed=" + std::to_string(seed)};
        }
    }
    return {"perm(255) contains 0..254 exactly once", true, ""};
}

TestResult test_perm_identity_when_j_equals_i() {
    FailingRandomSource rng(0);  // uniformInt(i) == i
    auto m = perm(10, rng);
    bool ok = true;
    for (uint32_t i = 0; i < m.size(); ++i) {
        ok = ok && m[i] == i;
    }
    return {"j == i at every step yields the identity", ok, ""};
}

TestResult test_perm_rotation_when_j_is_zero() {
    // j == 0 every step: m[i] = m[0], m[0] = i  ->  {n-1, 0, 1, ..., n-2}
    SequenceRandomSource rng({0x00});
    auto m = perm(5, rng);
    bool ok = m == std::vector<uint32_t>{4, 0, 1, 2, 3};
    return {"j == 0 at every step rotates", ok, ""};
}

TestResult test_perm_secure_source() {
    auto& rng = crypto::SodiumRandomSource::instance();
    for (int round = 0; round < 50; ++round) {
        if (!isPermutation(perm(255, rng))) {
            return {"perm(255) with libsodium source", false, "round " + std::to_string(round)};
        }
    }
    return {"perm(255) with libsodium source", true, ""};
}

TestResult test_perm_empty() {
    auto& rng = crypto::SodiumRandomSource::instance();
    return {"perm(0) is empty", perm(0, rng).empty(), ""};
}

} // namespace

int main() {
    return runAll("Permutation Test", {
        test_perm_is_permutation,
        test_perm_identity_when_j_equals_i,
        test_perm_rotation_when_j_is_zero,
        test_perm_secure_source,
        test_perm_empty,
    });
}
