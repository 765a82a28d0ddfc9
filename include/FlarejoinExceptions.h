#ifndef FLAREJOIN_EXCEPTIONS_H
#define FLAREJOIN_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Flarejoin {

class FlarejoinException : public std::runtime_error {
public:
    explicit FlarejoinException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public FlarejoinException {
public:
    explicit IOException(const std::string& message) : FlarejoinException("IO Error: " + message) {}
};

class DatasetException : public FlarejoinException {
public:
    explicit DatasetException(const std::string& message) : FlarejoinException("Dataset Error: " + message) {}
};

class ConfigurationException : public FlarejoinException {
public:
    explicit ConfigurationException(const std::string& message) : FlarejoinException("Configuration Error: " + message) {}
};

class RegressionException : public FlarejoinException {
public:
    explicit RegressionException(const std::string& message) : FlarejoinException("Regression Error: " + message) {}
};

} // namespace Flarejoin

#endif // FLAREJOIN_EXCEPTIONS_H
