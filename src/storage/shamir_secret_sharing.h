#ifndef SHAMIR256_SHAMIR_SECRET_SHARING_H
#define SHAMIR256_SHAMIR_SECRET_SHARING_H

#include "../common/types.h"
#include "../common/errors.h"
#include "../common/logger.h"
#include "../crypto/random_source.h"
#include "../gf256/polynomial.h"
#include "../gf256/interpolation.h"
#include "permutation.h"
#include <array>
#include <exception>
#include <string>
#include <vector>

namespace shamir256 {
namespace storage {

/**
 * Shamir Secret Sharing over GF(256)
 *
 * Mathematical background:
 * - One polynomial P(x) of degree t-1 per secret byte, with P(0) = that byte
 * - Shares are P evaluated at distinct non-zero x, one byte per secret byte
 * - Any t shares recover P(0) via Lagrange interpolation
 *
 * Share layout: {y_0, y_1, ..., y_{n-1}, x}, x in [1, 255]. The x-coordinate
 * is stored once as the trailing tag, so shares are self-describing and can
 * be passed to reconstruct() in any order.
 *
 * Security: fewer than t shares reveal nothing about the secret, provided
 * every polynomial is drawn independently from a secure source.
 *
 * All functions are stateless and safe to call concurrently.
 */
class ShamirSecretSharing {
public:
    /**
     * Split secret into `parts` shares where `threshold` are needed to reconstruct
     *
     * @param secret The secret data to split (non-empty)
     * @param parts Number of shares to generate, threshold..255
     * @param threshold Shares required for reconstruction, 2..255
     * @param rng Secure random source for coefficients and x-coordinates
     * @return `parts` shares, each secret.size() + 1 bytes long
     * @throws InvalidArgumentError on invalid parameters
     * @throws RandomSourceError if the random source fails
     */
    static std::vector<Share> split(const Bytes& secret, int parts, int threshold,
                                    crypto::RandomSource& rng) {
        if (threshold < MIN_THRESHOLD) {
            throw InvalidArgumentError("Threshold must be at least 2");
        }
        if (threshold > MAX_THRESHOLD) {
            throw InvalidArgumentError("Threshold cannot exceed 255");
        }
        if (parts < threshold) {
            throw InvalidArgumentError("Parts cannot be less than threshold");
        }
        if (parts > MAX_PARTS) {
            throw InvalidArgumentError("Parts cannot exceed 255");
        }
        if (secret.empty()) {
            throw InvalidArgumentError("Cannot split an empty secret");
        }

        if (Logger::enabled(LogLevel::DEBUG)) {
            Logger::debug("Shamir", "Splitting " + std::to_string(secret.size()) +
                          "-byte secret into " + std::to_string(parts) +
                          " shares, threshold " + std::to_string(threshold));
        }

        const size_t secret_len = secret.size();

        // Random distinct x-coordinates; +1 keeps them in [1, 255] since 0 is
        // the evaluation point of the secret
        std::vector<uint32_t> x_coordinates = perm(TAG_SPACE, rng);

        std::vector<Share> shares(static_cast<size_t>(parts));
        for (size_t i = 0; i < shares.size(); ++i) {
            shares[i].resize(secret_len + 1);
            shares[i][secret_len] = static_cast<uint8_t>(x_coordinates[i] + 1);
        }

        // A field of size 256 holds one byte per intercept, so each secret
        // byte gets its own independent polynomial
        for (size_t byte_idx = 0; byte_idx < secret_len; ++byte_idx) {
            std::vector<uint8_t> coefficients;
            try {
                coefficients = gf256::Polynomial::make(
                    secret[byte_idx], static_cast<size_t>(threshold - 1), rng);
            } catch (const std::exception& e) {
                for (auto& share : shares) {
                    crypto::secureWipe(share);
                }
                throw RandomSourceError(std::string("Failed to generate polynomial: ") + e.what());
            }

            for (auto& share : shares) {
                share[byte_idx] = gf256::Polynomial::evaluate(coefficients, share[secret_len]);
            }

            crypto::secureWipe(coefficients);
        }

        return shares;
    }

    static std::vector<Share> split(const Bytes& secret, int parts, int threshold) {
        return split(secret, parts, threshold, crypto::SodiumRandomSource::instance());
    }

    /**
     * Reconstruct secret from threshold or more shares
     *
     * @param parts Shares from one split() call, any subset of size >= threshold, any order
     * @return Reconstructed secret (share length - 1 bytes)
     * @throws InvalidArgumentError on malformed input
     * @throws DuplicatePartError if two shares carry the same x-coordinate
     */
    static Bytes reconstruct(const std::vector<Share>& parts) {
        if (parts.size() < 2) {
            throw InvalidArgumentError("Less than two parts cannot be used to reconstruct the secret");
        }

        const size_t part_len = parts[0].size();
        if (part_len < 2) {
            throw InvalidArgumentError("Parts must be at least two bytes");
        }

        // Verify all shares have the same length
        for (const auto& part : parts) {
            if (part.size() != part_len) {
                throw InvalidArgumentError("All parts must be the same length");
            }
        }

        if (Logger::enabled(LogLevel::DEBUG)) {
            Logger::debug("Shamir", "Reconstructing " + std::to_string(part_len - 1) +
                          "-byte secret from " + std::to_string(parts.size()) + " shares");
        }

        // Distinct x values, otherwise div() would see a zero denominator
        std::vector<uint8_t> x_samples(parts.size());
        std::array<bool, 256> seen{};
        for (size_t i = 0; i < parts.size(); ++i) {
            uint8_t x = parts[i][part_len - 1];
            if (seen[x]) {
                throw DuplicatePartError();
            }
            seen[x] = true;
            x_samples[i] = x;
        }

        Bytes secret(part_len - 1);
        std::vector<uint8_t> y_samples(parts.size());

        for (size_t byte_idx = 0; byte_idx < secret.size(); ++byte_idx) {
            for (size_t i = 0; i < parts.size(); ++i) {
                y_samples[i] = parts[i][byte_idx];
            }

            // P(0) is the secret byte
            secret[byte_idx] = gf256::Interpolator::interpolate(x_samples, y_samples, 0);
        }

        crypto::secureWipe(y_samples);
        return secret;
    }
};

} // namespace storage
} // namespace shamir256

#endif // SHAMIR256_SHAMIR_SECRET_SHARING_H
