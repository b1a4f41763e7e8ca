#ifndef SHAMIR256_CONFIG_LOADER_H
#define SHAMIR256_CONFIG_LOADER_H

#include "types.h"
#include "errors.h"
#include "logger.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shamir256 {
namespace config {

/**
 * YAML Configuration File Parser
 * Lightweight implementation without yaml-cpp (minimize external dependencies)
 *
 * Supported formats:
 * - Simple key: value
 * - Nested sections (section:), flattened to "section.key"
 * - Comments (# comment)
 */
class SimpleYAMLParser {
private:
    std::map<std::string, std::string> values_;
    std::vector<std::pair<int, std::string>> section_stack_;  // (indent, name)

public:
    bool parseFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            Logger::error("ConfigLoader", "Failed to open: " + filepath);
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            parseLine(line);
        }

        return true;
    }

    void parseString(const std::string& text) {
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            parseLine(text.substr(start, end - start));
            start = end + 1;
        }
    }

    std::optional<std::string> getString(const std::string& key) const {
        auto it = values_.find(key);
        if (it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<int> getInt(const std::string& key) const {
        auto str = getString(key);
        if (!str.has_value()) {
            return std::nullopt;
        }
        return parseInt(*str);
    }

    size_t size() const { return values_.size(); }

    /**
     * Strict integer parse: the whole string must be a (signed) decimal number
     */
    static std::optional<int> parseInt(const std::string& str) {
        if (str.empty()) return std::nullopt;

        size_t pos = 0;
        int value = 0;
        try {
            value = std::stoi(str, &pos);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }

        if (pos != str.size()) return std::nullopt;
        return value;
    }

private:
    void parseLine(std::string line) {
        // Calculate indentation before trimming
        int indent = 0;
        while (indent < static_cast<int>(line.size()) &&
               std::isspace(static_cast<unsigned char>(line[indent]))) {
            indent++;
        }

        line = trim(stripComment(line));

        // Skip empty lines and comments
        if (line.empty()) return;

        // Skip list items (- item)
        if (line[0] == '-') return;

        // Leaving a section: pop everything at the same or deeper indentation
        while (!section_stack_.empty() && indent <= section_stack_.back().first) {
            section_stack_.pop_back();
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) return;

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Section header
        if (value.empty()) {
            section_stack_.emplace_back(indent, key);
            return;
        }

        // Remove quotes from value
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Build full key with all sections in stack
        std::string full_key;
        for (const auto& section : section_stack_) {
            full_key += section.second + ".";
        }
        full_key += key;

        values_[full_key] = value;
    }

    // Drop a trailing "# comment" that is not inside quotes
    static std::string stripComment(const std::string& str) {
        char quote = 0;
        for (size_t i = 0; i < str.size(); ++i) {
            char c = str[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(str[i - 1])))) {
                return str.substr(0, i);
            }
        }
        return str;
    }

    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) start++;

        size_t end = str.size();
        while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;

        return str.substr(start, end - start);
    }
};

/**
 * shamir256 tool configuration
 */
struct ShamirConfig {
    // Sharing
    int parts = 5;
    int threshold = 3;

    // Output
    std::string encoding = "base64";  // "base64" or "hex"

    // Logging
    std::string log_level = "INFO";

    // Demo
    std::string demo_secret = "Some super secret";

    // Secret given on the command line (empty: read stdin)
    std::string secret;

    /**
     * Load configuration from YAML file
     */
    bool loadFromFile(const std::string& filepath) {
        SimpleYAMLParser parser;
        if (!parser.parseFile(filepath)) {
            return false;
        }

        Logger::debug("ConfigLoader", "Loading configuration from: " + filepath);
        apply(parser);
        return true;
    }

    void apply(const SimpleYAMLParser& parser) {
        if (auto v = parser.getInt("sharing.parts")) parts = *v;
        if (auto v = parser.getInt("sharing.threshold")) threshold = *v;
        if (auto v = parser.getString("output.encoding")) encoding = *v;
        if (auto v = parser.getString("logging.level")) log_level = *v;
        if (auto v = parser.getString("demo.secret")) demo_secret = *v;
    }

    /**
     * Override configuration with CLI arguments
     *
     * Recognised options are consumed; everything else is returned in order.
     *
     * @throws InvalidArgumentError on a missing or non-numeric option value
     */
    std::vector<std::string> applyCommandLineOverrides(const std::vector<std::string>& args) {
        std::vector<std::string> rest;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            auto next = [&]() -> const std::string& {
                if (i + 1 >= args.size()) {
                    throw InvalidArgumentError("Missing value for " + arg);
                }
                return args[++i];
            };

            if (arg == "--parts") {
                parts = requireInt(arg, next());
                Logger::debug("ConfigLoader", "Override: parts = " + std::to_string(parts));
            }
            else if (arg == "--threshold") {
                threshold = requireInt(arg, next());
                Logger::debug("ConfigLoader", "Override: threshold = " + std::to_string(threshold));
            }
            else if (arg == "--encoding") {
                encoding = next();
                Logger::debug("ConfigLoader", "Override: encoding = " + encoding);
            }
            else if (arg == "--log-level") {
                log_level = next();
            }
            else if (arg == "--secret") {
                secret = next();
            }
            else {
                rest.push_back(arg);
            }
        }

        return rest;
    }

    /**
     * @throws InvalidArgumentError for an unknown encoding or log level
     */
    void validate() const {
        if (encoding != "base64" && encoding != "hex") {
            throw InvalidArgumentError("Unknown encoding: " + encoding);
        }
        Logger::parseLevel(log_level);
    }

    /**
     * Print usage information
     */
    static void printUsage(const char* program_name) {
        std::cout << "\nUsage: " << program_name << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  split                Split a secret into shares (one per line)\n";
        std::cout << "  combine <share>...   Reconstruct a secret from shares\n";
        std::cout << "  demo                 Split, shuffle and reconstruct a sample secret\n\n";
        std::cout << "Options:\n";
        std::cout << "  --config <file>      YAML config file path\n";
        std::cout << "  --parts <count>      Number of shares (default: 5)\n";
        std::cout << "  --threshold <count>  Shares needed to reconstruct (default: 3)\n";
        std::cout << "  --secret <text>      Secret to split (default: read stdin)\n";
        std::cout << "  --encoding <enc>     base64 or hex (default: base64)\n";
        std::cout << "  --log-level <level>  DEBUG, INFO, WARN, ERROR or OFF (default: INFO)\n";
        std::cout << "  --help, -h           Show this help message\n\n";
        std::cout << "Examples:\n";
        std::cout << "  echo -n hunter2 | " << program_name << " split --parts 5 --threshold 3\n";
        std::cout << "  " << program_name << " combine <share1> <share2> <share3>\n\n";
    }

    /**
     * Print configuration summary
     */
    void printSummary() const {
        Logger::info("ConfigLoader", "parts=" + std::to_string(parts) +
                     " threshold=" + std::to_string(threshold) +
                     " encoding=" + encoding +
                     " log_level=" + log_level);
    }

private:
    static int requireInt(const std::string& option, const std::string& value) {
        auto parsed = SimpleYAMLParser::parseInt(value);
        if (!parsed.has_value()) {
            throw InvalidArgumentError("Invalid value for " + option + ": " + value);
        }
        return *parsed;
    }
};

} // namespace config
} // namespace shamir256

#endif // SHAMIR256_CONFIG_LOADER_H
