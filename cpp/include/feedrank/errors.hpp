#pragma once

#include <stdexcept>
#include <string>

namespace feedrank {

// Both candidate sources were empty; there is nothing to rank.
class EmptyPoolError : public std::invalid_argument {
public:
    explicit EmptyPoolError(const std::string& what) : std::invalid_argument(what) {}
};

// A supplied action probability lies outside [0, 1].
class InvalidProbabilityError : public std::out_of_range {
public:
    explicit InvalidProbabilityError(const std::string& what) : std::out_of_range(what) {}
};

// Weight, window or decay settings are out of range or unrecognized.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace feedrank
