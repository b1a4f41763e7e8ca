/**
 * shamir256 command-line tool
 *
 * split:   secret (argument or stdin) -> one encoded share per line
 * combine: encoded shares -> secret on stdout
 * demo:    split a sample secret, shuffle the shares, reconstruct from `threshold` of them
 */

#include "common/types.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/config_loader.h"
#include "crypto/random_source.h"
#include "storage/shamir_secret_sharing.h"
#include "cli/share_codec.h"

#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace shamir256;

namespace {

constexpr int EXIT_INVALID_ARGUMENT = 2;

int runSplit(const config::ShamirConfig& cfg) {
    Bytes secret;
    if (!cfg.secret.empty()) {
        secret = toBytes(cfg.secret);
    } else {
        secret.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto encoding = cli::ShareCodec::parseEncoding(cfg.encoding);
    auto shares = storage::ShamirSecretSharing::split(secret, cfg.parts, cfg.threshold);
    crypto::secureWipe(secret);

    for (auto& share : shares) {
        std::cout << cli::ShareCodec::encode(share, encoding) << "\n";
        crypto::secureWipe(share);
    }

    Logger::debug("CLI", "Wrote " + std::to_string(shares.size()) + " shares");
    return 0;
}

int runCombine(const config::ShamirConfig& cfg, const std::vector<std::string>& encoded) {
    auto encoding = cli::ShareCodec::parseEncoding(cfg.encoding);

    std::vector<Share> shares;
    shares.reserve(encoded.size());
    for (const auto& text : encoded) {
        shares.push_back(cli::ShareCodec::decode(text, encoding));
    }

    Bytes secret = storage::ShamirSecretSharing::reconstruct(shares);
    std::cout.write(reinterpret_cast<const char*>(secret.data()),
                    static_cast<std::streamsize>(secret.size()));
    std::cout.flush();

    crypto::secureWipe(secret);
    for (auto& share : shares) {
        crypto::secureWipe(share);
    }
    return 0;
}

int runDemo(const config::ShamirConfig& cfg) {
    auto& rng = crypto::SodiumRandomSource::instance();

    auto shares = storage::ShamirSecretSharing::split(
        toBytes(cfg.demo_secret), cfg.parts, cfg.threshold, rng);

    std::cout << "Base64 encoded shares:\n";
    for (size_t i = 0; i < shares.size(); ++i) {
        std::cout << i << ": " << cli::ShareCodec::encode(shares[i], cli::Encoding::BASE64) << "\n";
    }

    // Shuffle with the secure source, reusing the share-tag permutation
    auto order = storage::perm(static_cast<uint32_t>(shares.size()), rng);
    std::vector<Share> subset;
    for (int i = 0; i < cfg.threshold; ++i) {
        subset.push_back(shares[order[i]]);
    }

    Bytes recovered = storage::ShamirSecretSharing::reconstruct(subset);
    std::cout << "\nRecovered string: " << toString(recovered) << "\n";

    return recovered == toBytes(cfg.demo_secret) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            config::ShamirConfig::printUsage(argv[0]);
            return 0;
        }
    }

    try {
        config::ShamirConfig cfg;

        // --config is applied first so command-line options win
        std::vector<std::string> remaining;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 >= args.size()) {
                    throw InvalidArgumentError("Missing value for --config");
                }
                if (!cfg.loadFromFile(args[++i])) {
                    throw InvalidArgumentError("Cannot read config file: " + args[i]);
                }
            } else {
                remaining.push_back(args[i]);
            }
        }

        std::vector<std::string> positional = cfg.applyCommandLineOverrides(remaining);
        cfg.validate();
        Logger::setLevel(Logger::parseLevel(cfg.log_level));

        if (positional.empty()) {
            config::ShamirConfig::printUsage(argv[0]);
            return EXIT_INVALID_ARGUMENT;
        }

        const std::string command = positional[0];
        positional.erase(positional.begin());

        if (Logger::enabled(LogLevel::DEBUG)) {
            cfg.printSummary();
        }

        if (command == "split") {
            return runSplit(cfg);
        }
        if (command == "combine") {
            return runCombine(cfg, positional);
        }
        if (command == "demo") {
            return runDemo(cfg);
        }

        throw InvalidArgumentError("Unknown command: " + command);
    } catch (const InvalidArgumentError& e) {
        Logger::error("CLI", e.what());
        return EXIT_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        Logger::error("CLI", e.what());
        return 1;
    }
}
