#pragma once

#include <stdexcept>
#include <string>

namespace vw_guider {

class VwGuiderError : public std::runtime_error {
public:
    explicit VwGuiderError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public VwGuiderError {
public:
    explicit ConfigError(const std::string& message)
        : VwGuiderError("Config error: " + message) {}
};

class ValidationError : public VwGuiderError {
public:
    explicit ValidationError(const std::string& message)
        : VwGuiderError("Validation error: " + message) {}
};

class IOError : public VwGuiderError {
public:
    explicit IOError(const std::string& message)
        : VwGuiderError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public VwGuiderError {
public:
    explicit PipelineError(const std::string& message)
        : VwGuiderError("Pipeline error: " + message) {}
};

} // namespace vw_guider
