#ifndef SHAMIR256_TYPES_H
#define SHAMIR256_TYPES_H

#include <cstdint>
#include <vector>
#include <string>

namespace shamir256 {

// Type aliases
using Bytes = std::vector<uint8_t>;
using Share = Bytes;  // {y_0, y_1, ..., y_{n-1}, x}

// Sharing limits (a share tag and the threshold both fit in one byte)
constexpr int MIN_THRESHOLD = 2;
constexpr int MAX_THRESHOLD = 255;
constexpr int MAX_PARTS = 255;

// GF(2^8) parameters
constexpr uint16_t FIELD_POLYNOMIAL = 0x11B;  // x^8 + x^4 + x^3 + x + 1
constexpr uint8_t FIELD_GENERATOR = 0x03;
constexpr int FIELD_ORDER = 255;  // size of the multiplicative group

// Number of candidate x-coordinates; tag = permutation value + 1 lands in [1, 255]
constexpr int TAG_SPACE = 255;

inline Bytes toBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

inline std::string toString(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace shamir256

#endif // SHAMIR256_TYPES_H
