#pragma once

#include <stdexcept>
#include <string>

namespace pmx {

class PMXException : public std::runtime_error {
public:
    explicit PMXException(const std::string& message) : std::runtime_error(message) {}
    explicit PMXException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public PMXException {
public:
    explicit ConfigurationError(const std::string& message) 
        : PMXException("Configuration Error: " + message) {}
};

class ValidationError : public PMXException {
public:
    explicit ValidationError(const std::string& message) 
        : PMXException("Validation Error: " + message) {}
};

} // namespace pmx
