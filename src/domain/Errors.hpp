#pragma once

#include <stdexcept>
#include <string>

namespace domain {

// Input rejected by the validator. The message is safe to return to the client.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// The persistence medium failed, or the writer lock could not be acquired in time.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace domain
