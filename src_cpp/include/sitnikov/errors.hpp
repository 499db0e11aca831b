#pragma once
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace sitnikov {

// Base of every error raised by the library
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Newton-Raphson exhausted its iteration budget
class ConvergenceFailure : public Error {
public:
    explicit ConvergenceFailure(double initial);

    double initial() const { return initial_; }

private:
    double initial_;
};

// A user-supplied derivative or acceleration callback failed; the cause is nested
class CallbackFailure : public Error {
public:
    using Error::Error;
};

// State vector length doesn't match the buffer or the integrator layout
class DimensionMismatch : public Error {
public:
    using Error::Error;

    DimensionMismatch(std::size_t expected, std::size_t actual)
        : Error("dimension mismatch: expected " + std::to_string(expected) +
                " components, got " + std::to_string(actual)) {}
};

// Out-of-range model configuration
class ConfigurationInvalid : public Error {
public:
    using Error::Error;
};

// Flatten a chain of nested exceptions into "outer: inner: innermost"
std::string describe(const std::exception& e);

} // namespace sitnikov
