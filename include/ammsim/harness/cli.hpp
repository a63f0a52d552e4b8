// CLI argument parsing
#pragma once

#include <cstddef>
#include <string>

namespace ammsim {
namespace harness {

struct CliArgs {
    // Positional arguments
    std::string config_path;
    std::string samples_path;
    std::string out_path;

    // Options
    std::size_t max_samples{0};  // 0 = all
    std::string trader;          // overrides the config's trader when set
    double vol_mult{-1.0};       // overrides the config's vol_mult when >= 0
    bool quiet{false};

    // Validation
    bool valid{false};
    std::string error_msg;
};

// Parse command line arguments
// Returns CliArgs with valid=true on success, valid=false with error_msg on failure
CliArgs parse_cli(int argc, char* argv[]);

// Print usage message
void print_usage(const char* prog_name);

} // namespace harness
} // namespace ammsim
