#ifndef FAIR_REPRESENTATION_ERRORS_HPP
#define FAIR_REPRESENTATION_ERRORS_HPP

#include <stdexcept>
#include <string>

// Raised when the numerical minimizer produced no usable parameter vector.
class OptimizationError : public std::runtime_error
{
public:
    explicit OptimizationError(const std::string &what_arg)
        : std::runtime_error(what_arg) {}
};

// Raised when predict/transform/accessors are used before a successful fit.
class NotFittedError : public std::runtime_error
{
public:
    explicit NotFittedError(const std::string &what_arg)
        : std::runtime_error(what_arg) {}
};

// Raised when reading prototype quantities of a model fitted without
// sensitive features.
class AttributeUnavailableError : public std::logic_error
{
public:
    explicit AttributeUnavailableError(const std::string &what_arg)
        : std::logic_error(what_arg) {}
};

#endif // FAIR_REPRESENTATION_ERRORS_HPP
