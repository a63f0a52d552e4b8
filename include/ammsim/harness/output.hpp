// JSON output writer for run results
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "ammsim/harness/runner.hpp"

namespace ammsim {
namespace harness {

// Summary block of one run
boost::json::object run_summary_json(const RunResult& r);

// Output format for the entire run:
// { "metadata": {...}, "runs": [ { "params", "result", "final_state", "success", "error" }, ... ] }
boost::json::object build_output_json(
    const std::vector<RunResult>& results,
    const std::string& tag,
    std::size_t n_samples,
    const std::string& samples_path,
    double samples_read_ms,
    double exec_ms
);

// Write results to JSON file; false when the file cannot be written
bool write_results_json(
    const std::string& output_path,
    const std::vector<RunResult>& results,
    const std::string& tag,
    std::size_t n_samples,
    const std::string& samples_path,
    double samples_read_ms,
    double exec_ms
);

} // namespace harness
} // namespace ammsim
