// Error kinds raised by the pool engines and the arbitrage solver
#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ammsim {

// Base for every simulator error
class SimError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Iterative solve exceeded its cap or ended outside the converged domain
class CalculationError : public SimError {
public:
    using SimError::SimError;
};

// Inputs or results outside the validated parameter space (A, gamma, balance ratios)
class SafetyBoundError : public SimError {
public:
    using SimError::SimError;
};

// Cryptoswap economic invariant violated ("Loss") or unsupported layout
class CryptoPoolError : public SimError {
public:
    using SimError::SimError;
};

class SnapshotError : public SimError {
public:
    using SimError::SimError;
};

// Pool cannot be driven through the trading surface as configured
class SimPoolError : public SimError {
public:
    using SimError::SimError;
};

// Invalid configuration (duplicate indices, missing parameters, bad JSON)
class ConfigError : public SimError {
public:
    using SimError::SimError;
};

// Name of the most derived simulator error kind, for reports
inline const char* error_kind(const std::exception& e) {
    if (dynamic_cast<const CalculationError*>(&e)) return "CalculationError";
    if (dynamic_cast<const SafetyBoundError*>(&e)) return "SafetyBoundError";
    if (dynamic_cast<const CryptoPoolError*>(&e)) return "CryptoPoolError";
    if (dynamic_cast<const SnapshotError*>(&e)) return "SnapshotError";
    if (dynamic_cast<const SimPoolError*>(&e)) return "SimPoolError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "InvalidArgument";
    return "Error";
}

} // namespace ammsim
