/**
 * YAML config parsing, command-line overrides and log level handling
 */

#include "common/config_loader.h"
#include "common/logger.h"
#include "common/errors.h"
#include "test_support.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace shamir256;
using namespace shamir256::config;
using namespace shamir256::test;

namespace {

const char* SAMPLE_YAML =
    "# shamir256 sample\n"
    "sharing:\n"
    "  parts: 7        # total shares\n"
    "  threshold: 4\n"
    "\n"
    "output:\n"
    "  encoding: \"hex\"\n"
    "logging:\n"
    "  level: debug\n"
    "demo:\n"
    "  secret: 'a # not a comment'\n";

TestResult test_parser_sections() {
    SimpleYAMLParser parser;
    parser.parseString(SAMPLE_YAML);

    bool ok = parser.getInt("sharing.parts") == 7 &&
              parser.getInt("sharing.threshold") == 4 &&
              parser.getString("output.encoding") == std::string("hex") &&
              parser.getString("logging.level") == std::string("debug") &&
              parser.getString("demo.secret") == std::string("a # not a comment");
    return {"nested sections flatten to dotted keys", ok,
            "parsed " + std::to_string(parser.size()) + " values"};
}

TestResult test_parser_missing_and_malformed() {
    SimpleYAMLParser parser;
    parser.parseString("sharing:\n  parts: five\n");

    bool ok = !parser.getInt("sharing.parts").has_value() &&
              !parser.getString("sharing.threshold").has_value();
    return {"non-numeric ints and missing keys are empty", ok, ""};
}

TestResult test_parse_int_strict() {
    bool ok = SimpleYAMLParser::parseInt("42") == 42 &&
              SimpleYAMLParser::parseInt("-3") == -3 &&
              !SimpleYAMLParser::parseInt("").has_value() &&
              !SimpleYAMLParser::parseInt("12abc").has_value() &&
              !SimpleYAMLParser::parseInt("99999999999999").has_value();
    return {"parseInt accepts only whole decimal numbers", ok, ""};
}

TestResult test_load_from_file() {
    const std::string path = "shamir256_test_config.yaml";
    {
        std::ofstream out(path);
        out << SAMPLE_YAML;
    }

    ShamirConfig cfg;
    bool loaded = cfg.loadFromFile(path);
    std::remove(path.c_str());

    bool ok = loaded && cfg.parts == 7 && cfg.threshold == 4 &&
              cfg.encoding == "hex" && cfg.log_level == "debug" &&
              cfg.demo_secret == "a # not a comment";
    return {"loadFromFile applies every key", ok, ""};
}

TestResult test_load_missing_file() {
    Logger::setLevel(LogLevel::OFF);
    ShamirConfig cfg;
    bool ok = !cfg.loadFromFile("/nonexistent/shamir256.yaml") && cfg.parts == 5 && cfg.threshold == 3;
    Logger::setLevel(LogLevel::INFO);
    return {"missing config file leaves defaults", ok, ""};
}

TestResult test_command_line_overrides() {
    ShamirConfig cfg;
    auto rest = cfg.applyCommandLineOverrides(
        {"split", "--parts", "9", "--threshold", "6", "--encoding", "hex", "--secret", "s3cr3t", "extra"});

    bool ok = cfg.parts == 9 && cfg.threshold == 6 && cfg.encoding == "hex" &&
              cfg.secret == "s3cr3t" &&
              rest == std::vector<std::string>{"split", "extra"};
    return {"overrides are consumed, positionals kept in order", ok, ""};
}

TestResult test_command_line_bad_values() {
    std::string details;
    bool ok = throwsWithMessage<InvalidArgumentError>(
        [] {
            ShamirConfig cfg;
            cfg.applyCommandLineOverrides({"--parts", "lots"});
        },
        "Invalid value for --parts: lots", details);
    if (ok) {
        ok = throwsWithMessage<InvalidArgumentError>(
            [] {
                ShamirConfig cfg;
                cfg.applyCommandLineOverrides({"--threshold"});
            },
            "Missing value for --threshold", details);
    }
    return {"bad override values are rejected", ok, details};
}

TestResult test_validate() {
    ShamirConfig cfg;
    cfg.validate();

    std::string details;
    cfg.encoding = "base32";
    bool ok = throwsWithMessage<InvalidArgumentError>(
        [&] { cfg.validate(); }, "Unknown encoding: base32", details);

    cfg.encoding = "hex";
    cfg.log_level = "loud";
    if (ok) {
        ok = throwsWithMessage<InvalidArgumentError>(
            [&] { cfg.validate(); }, "Unknown log level: loud", details);
    }
    return {"validate rejects unknown encoding and log level", ok, details};
}

TestResult test_log_level_parsing() {
    bool ok = Logger::parseLevel("debug") == LogLevel::DEBUG &&
              Logger::parseLevel("INFO") == LogLevel::INFO &&
              Logger::parseLevel("Warn") == LogLevel::WARN &&
              Logger::parseLevel("error") == LogLevel::ERROR &&
              Logger::parseLevel("off") == LogLevel::OFF;

    Logger::setLevel(LogLevel::WARN);
    ok = ok && !Logger::enabled(LogLevel::INFO) && Logger::enabled(LogLevel::ERROR);
    Logger::setLevel(LogLevel::OFF);
    ok = ok && !Logger::enabled(LogLevel::ERROR);
    Logger::setLevel(LogLevel::INFO);

    return {"log levels parse and gate output", ok, ""};
}

} // namespace

int main() {
    return runAll("Config Loader Test", {
        test_parser_sections,
        test_parser_missing_and_malformed,
        test_parse_int_strict,
        test_load_from_file,
        test_load_missing_file,
        test_command_line_overrides,
        test_command_line_bad_values,
        test_validate,
        test_log_level_parsing,
    });
}
