#pragma once
#include <stdexcept>
#include <string>

// Malformed configuration. Raised before any simulated user starts.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// The run cannot be set up at all, e.g. results cannot be persisted.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& message) : std::runtime_error(message) {}
};
