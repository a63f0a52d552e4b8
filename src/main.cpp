// ammsim - replays price/volume samples through a pool parameter grid

#include <chrono>
#include <iostream>

#include "ammsim/core/errors.hpp"
#include "ammsim/harness/cli.hpp"
#include "ammsim/harness/output.hpp"
#include "ammsim/harness/runner.hpp"
#include "ammsim/harness/samples.hpp"
#include "ammsim/pools/config.hpp"

int main(int argc, char* argv[]) {
    auto args = ammsim::harness::parse_cli(argc, argv);
    if (!args.valid) {
        std::cerr << "Error: " << args.error_msg << "\n";
        ammsim::harness::print_usage(argv[0]);
        return 1;
    }

    try {
        auto sim_cfg = ammsim::pools::load_sim_config(args.config_path);
        if (!args.trader.empty()) sim_cfg.trader = ammsim::pools::parse_trader_kind(args.trader);
        if (args.vol_mult >= 0.0) sim_cfg.vol_mult = args.vol_mult;

        auto t_read0 = std::chrono::high_resolution_clock::now();
        auto samples = ammsim::harness::load_samples(args.samples_path, args.max_samples);
        auto t_read1 = std::chrono::high_resolution_clock::now();
        double samples_read_ms = std::chrono::duration<double, std::milli>(t_read1 - t_read0).count();

        if (!args.quiet) {
            std::cout << "loaded " << samples.size() << " samples from " << args.samples_path << "\n"
                      << std::flush;
        }

        ammsim::harness::RunConfig run_cfg{};
        run_cfg.trader = sim_cfg.trader;
        run_cfg.vol_mult = sim_cfg.vol_mult;
        run_cfg.verbose = !args.quiet;

        auto t_exec0 = std::chrono::high_resolution_clock::now();
        auto results = ammsim::harness::run_grid(sim_cfg, samples, run_cfg);
        auto t_exec1 = std::chrono::high_resolution_clock::now();
        double exec_ms = std::chrono::duration<double, std::milli>(t_exec1 - t_exec0).count();

        bool ok = ammsim::harness::write_results_json(
            args.out_path, results, sim_cfg.tag, samples.size(), args.samples_path,
            samples_read_ms, exec_ms);
        if (!ok) {
            std::cerr << "Error: Failed to write output to " << args.out_path << "\n";
            return 1;
        }

        std::size_t failed = 0;
        for (const auto& r : results) {
            if (!r.success) ++failed;
        }
        if (!args.quiet) {
            std::cout << "wrote " << results.size() << " runs (" << failed << " failed) to "
                      << args.out_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << ammsim::error_kind(e) << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
