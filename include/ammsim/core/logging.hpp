// Diagnostic output: env-gated trace flags and error reporting on stderr
#pragma once

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace ammsim {

// Serializes diagnostic lines written from the solver and the driver
inline std::mutex io_mu;

// Set AMMSIM_TRACE=1 for pool-level traces (tweak_price, rebalancing)
inline bool trace_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("AMMSIM_TRACE");
        return env && std::string(env) == "1";
    }();
    return enabled;
}

// Set AMMSIM_TRACE_ARB=1 for arbitrage solver traces
inline bool trace_arb_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("AMMSIM_TRACE_ARB");
        return env && std::string(env) == "1";
    }();
    return enabled;
}

inline void log_error(const std::string& where, const std::string& msg) {
    std::lock_guard<std::mutex> lk(io_mu);
    std::cerr << "[ERROR] " << where << ": " << msg << "\n";
}

} // namespace ammsim
