/*
/   Exception types raised by the mobility engine.
/
/   ConfigurationError : missing or invalid parameters
/   DimensionError     : inconsistent lattice / supercell shapes
/   NumericalError     : non-finite matrices, failed eigendecomposition
/   InterruptedError   : run stopped by a signal
*/

#pragma once

#include <stdexcept>
#include <string>

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

class DimensionError : public std::invalid_argument {
public:
    explicit DimensionError(const std::string& what) : std::invalid_argument(what) {}
};

class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

class InterruptedError : public std::runtime_error {
public:
    explicit InterruptedError(const std::string& what) : std::runtime_error(what) {}
};
