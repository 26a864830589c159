#ifndef FITKIT_EXCEPTIONS_HPP
#define FITKIT_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace fitkit {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the objective function library.
 */
class FitkitException : public std::runtime_error {
public:
    /**
     * @brief Construct a FitkitException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    FitkitException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    FitkitException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method or constructor arguments.
 */
class InvalidParameterException : public FitkitException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : FitkitException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : FitkitException(file, line, functionName, "InvalidParameter", message) {}
};

/**
 * @brief Exception for objects that cannot be assembled from the given parts.
 *
 * Raised at construction time (empty component lists, weight/component count
 * mismatch, components of differing dimension). No partially built object escapes.
 */
class ConfigurationException : public FitkitException {
public:
    ConfigurationException(const std::string& functionName, const std::string& message)
        : FitkitException(functionName, "Configuration Error: " + message) {}
    ConfigurationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : FitkitException(file, line, functionName, "ConfigurationError", message) {}
};

/**
 * @brief Exception for a parameter vector whose length differs from the expected dimension.
 */
class DimensionMismatchException : public FitkitException {
public:
    /**
     * @brief Construct a DimensionMismatchException.
     * @param functionName Name of the function where the error occurred.
     * @param expected The dimension the callee requires.
     * @param actual The length of the vector it received.
     */
    DimensionMismatchException(const std::string& functionName, long expected, long actual)
        : FitkitException(functionName, "Dimension Mismatch: " + describe(expected, actual)),
          expected_(expected), actual_(actual) {}
    DimensionMismatchException(const char* file, int line, const std::string& functionName, long expected, long actual)
        : FitkitException(file, line, functionName, "DimensionMismatch", describe(expected, actual)),
          expected_(expected), actual_(actual) {}

    long getExpected() const noexcept { return expected_; }
    long getActual() const noexcept { return actual_; }

private:
    static std::string describe(long expected, long actual) {
        return "expected a vector of length " + std::to_string(expected) +
               ", got " + std::to_string(actual) + ".";
    }

    long expected_;
    long actual_;
};

/**
 * @brief Exception for numerical simulation errors.
 */
class SimulationException : public FitkitException {
public:
    SimulationException(const std::string& functionName, const std::string& message)
        : FitkitException(functionName, "Simulation Error: " + message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : FitkitException(file, line, functionName, "SimulationError", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public FitkitException {
public:
    FileIOException(const std::string& functionName, const std::string& message)
        : FitkitException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public FitkitException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : FitkitException(functionName, "Data Format Error: " + message) {}
};

} // namespace fitkit

#define FITKIT_THROW_INVALID_PARAM(func, msg) throw fitkit::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define FITKIT_THROW_CONFIGURATION_ERROR(func, msg) throw fitkit::ConfigurationException(__FILE__, __LINE__, func, msg)
#define FITKIT_THROW_DIMENSION_MISMATCH(func, expected, actual) throw fitkit::DimensionMismatchException(__FILE__, __LINE__, func, expected, actual)
#define FITKIT_THROW_SIMULATION_ERROR(func, msg) throw fitkit::SimulationException(__FILE__, __LINE__, func, msg)

#endif // FITKIT_EXCEPTIONS_HPP
