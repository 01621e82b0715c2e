#pragma once
#ifndef SLOTFORGE_ERRORS_H
#define SLOTFORGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace slotforge {

// Malformed provider calendar or out-of-range configuration value
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Optimization requested for a date/provider with no bookings.
// Callers usually report this as "nothing to do" rather than a failure.
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed external input (timestamps, request documents, strategy names)
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace slotforge

#endif  // SLOTFORGE_ERRORS_H
