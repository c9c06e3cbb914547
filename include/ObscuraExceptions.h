#ifndef OBSCURA_EXCEPTIONS_H
#define OBSCURA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Obscura {

class ObscuraException : public std::runtime_error {
public:
    explicit ObscuraException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public ObscuraException {
public:
    explicit IOException(const std::string& message) : ObscuraException("IO Error: " + message) {}
};

class DatasetException : public ObscuraException {
public:
    explicit DatasetException(const std::string& message) : ObscuraException("Dataset Error: " + message) {}
};

class ConfigurationException : public ObscuraException {
public:
    explicit ConfigurationException(const std::string& message) : ObscuraException("Configuration Error: " + message) {}
};

// Base for errors scoped to a single field. The engine records these and moves on.
class FieldException : public ObscuraException {
public:
    explicit FieldException(const std::string& message) : ObscuraException(message) {}
};

class UnsupportedStrategyError : public FieldException {
public:
    explicit UnsupportedStrategyError(const std::string& message) : FieldException("Unsupported Strategy: " + message) {}
};

class InvalidParameterError : public FieldException {
public:
    explicit InvalidParameterError(const std::string& message) : FieldException("Invalid Parameter: " + message) {}
};

class RangeDecodeError : public ObscuraException {
public:
    explicit RangeDecodeError(const std::string& message) : ObscuraException("Range Decode Error: " + message) {}
};

} // namespace Obscura

#endif // OBSCURA_EXCEPTIONS_H
