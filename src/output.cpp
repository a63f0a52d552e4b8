// JSON output writer - implementation
#include "ammsim/harness/output.hpp"

#include <fstream>

#include "ammsim/core/json_utils.hpp"

namespace ammsim {
namespace harness {

namespace json = boost::json;

json::object run_summary_json(const RunResult& r) {
    json::object summary;
    summary["samples"] = static_cast<uint64_t>(r.samples_run);
    summary["trades"] = static_cast<uint64_t>(r.n_trades);
    summary["degraded_steps"] = static_cast<uint64_t>(r.n_degraded);
    summary["volume"] = int_to_json(r.volume);
    summary["mean_abs_price_error"] = r.mean_abs_price_error;
    summary["pool_exec_ms"] = r.elapsed_ms;
    return summary;
}

json::object build_output_json(
    const std::vector<RunResult>& results,
    const std::string& tag,
    std::size_t n_samples,
    const std::string& samples_path,
    double samples_read_ms,
    double exec_ms
) {
    json::object meta;
    if (!tag.empty()) meta["tag"] = tag;
    meta["samples_file"] = samples_path;
    meta["samples"] = static_cast<uint64_t>(n_samples);
    meta["samples_read_ms"] = samples_read_ms;
    meta["exec_ms"] = exec_ms;

    json::array runs;
    runs.reserve(results.size());
    for (const auto& r : results) {
        json::object run;
        run["params"] = r.params;
        run["result"] = run_summary_json(r);
        run["success"] = r.success;
        if (r.success) {
            run["final_state"] = r.final_state;
        } else {
            json::object err;
            err["kind"] = r.error_kind;
            err["message"] = r.error_msg;
            run["error"] = std::move(err);
        }
        runs.push_back(std::move(run));
    }

    json::object O;
    O["metadata"] = meta;
    O["runs"] = runs;
    return O;
}

bool write_results_json(
    const std::string& output_path,
    const std::vector<RunResult>& results,
    const std::string& tag,
    std::size_t n_samples,
    const std::string& samples_path,
    double samples_read_ms,
    double exec_ms
) {
    auto O = build_output_json(results, tag, n_samples, samples_path, samples_read_ms, exec_ms);

    std::ofstream of(output_path);
    if (!of) {
        return false;
    }
    of << json::serialize(O) << '\n';
    return of.good();
}

} // namespace harness
} // namespace ammsim
