#ifndef SHAMIR256_ERRORS_H
#define SHAMIR256_ERRORS_H

#include <stdexcept>
#include <string>

namespace shamir256 {

/**
 * Error taxonomy
 *
 * - InvalidArgumentError: the caller passed something the contract forbids
 *   (bad threshold/parts, empty secret, malformed shares). Fix the call.
 * - FatalInvariantError: an internal invariant broke (duplicate x-coordinates,
 *   undefined selector). The operation is aborted; nothing is recovered.
 * - RandomSourceError: the secure random source could not deliver.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what)
        : std::invalid_argument(what) {}
};

class FatalInvariantError : public std::logic_error {
public:
    explicit FatalInvariantError(const std::string& what)
        : std::logic_error(what) {}
};

class DivisionByZeroError : public FatalInvariantError {
public:
    DivisionByZeroError() : FatalInvariantError("Divide by zero") {}
};

class DuplicatePartError : public FatalInvariantError {
public:
    DuplicatePartError() : FatalInvariantError("Duplicate part detected") {}
};

class UndefinedBehaviorError : public FatalInvariantError {
public:
    UndefinedBehaviorError() : FatalInvariantError("Undefined behavior") {}
};

class RandomSourceError : public std::runtime_error {
public:
    explicit RandomSourceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace shamir256

#endif // SHAMIR256_ERRORS_H
