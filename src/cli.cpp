// CLI argument parsing implementation

#include "ammsim/harness/cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace ammsim {
namespace harness {

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name
              << " <config.json> <samples.json> <output.json>\n"
              << "       [--n-samples N] [--trader volume_limited|simple]\n"
              << "       [--vol-mult F] [--quiet]\n";
}

CliArgs parse_cli(int argc, char* argv[]) {
    CliArgs args{};

    if (argc < 4) {
        args.valid = false;
        args.error_msg = "Not enough arguments (need config.json, samples.json, output.json)";
        return args;
    }

    args.config_path = argv[1];
    args.samples_path = argv[2];
    args.out_path = argv[3];

    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        try {
            if (arg == "--n-samples" && i + 1 < argc) {
                args.max_samples = static_cast<std::size_t>(std::stoull(argv[++i]));
            } else if (arg == "--trader" && i + 1 < argc) {
                args.trader = argv[++i];
            } else if (arg == "--vol-mult" && i + 1 < argc) {
                args.vol_mult = std::stod(argv[++i]);
            } else if (arg == "--quiet") {
                args.quiet = true;
            } else {
                args.error_msg = "Unknown or incomplete option: " + arg;
                return args;
            }
        } catch (const std::logic_error&) {
            args.error_msg = "Invalid value for " + arg + ": " + argv[i];
            return args;
        }
    }

    args.valid = true;
    return args;
}

} // namespace harness
} // namespace ammsim
