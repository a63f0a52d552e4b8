// Price/volume time samples - implementation
#include "ammsim/harness/samples.hpp"

#include "ammsim/core/errors.hpp"
#include "ammsim/core/json_utils.hpp"

namespace ammsim {
namespace harness {

namespace json = boost::json;

std::vector<PriceSample> parse_samples(const json::value& root, std::size_t max_samples) {
    if (!root.is_object()) throw ConfigError("Invalid samples json root type");
    const auto& obj = root.as_object();

    const auto& pairs_v = get_required(obj, "pairs");
    if (!pairs_v.is_array()) throw ConfigError("samples: 'pairs' must be an array");
    std::vector<trading::CoinPair> pairs;
    for (const auto& p : pairs_v.as_array()) {
        if (!p.is_array() || p.as_array().size() != 2 || !p.as_array()[0].is_string() ||
            !p.as_array()[1].is_string()) {
            throw ConfigError("samples: each pair must be [coin_in, coin_out]");
        }
        pairs.emplace_back(p.as_array()[0].as_string().c_str(), p.as_array()[1].as_string().c_str());
    }

    const auto& samples_v = get_required(obj, "samples");
    if (!samples_v.is_array()) throw ConfigError("samples: 'samples' must be an array");

    std::vector<PriceSample> out;
    out.reserve(samples_v.as_array().size());
    for (const auto& sv : samples_v.as_array()) {
        if (max_samples > 0 && out.size() >= max_samples) break;
        if (!sv.is_object()) throw ConfigError("samples: each sample must be an object");
        const auto& s = sv.as_object();

        PriceSample sample;
        sample.timestamp = get_u64_opt(s, "timestamp", 0);

        const auto& prices = get_required(s, "prices");
        if (!prices.is_array() || prices.as_array().size() != pairs.size()) {
            throw ConfigError("samples: 'prices' must have one entry per pair");
        }
        for (std::size_t k = 0; k < pairs.size(); ++k) {
            sample.prices[pairs[k]] = parse_real(prices.as_array()[k]);
        }

        if (auto* v = s.if_contains("volumes")) {
            if (!v->is_array() || v->as_array().size() != pairs.size()) {
                throw ConfigError("samples: 'volumes' must have one entry per pair");
            }
            for (std::size_t k = 0; k < pairs.size(); ++k) {
                sample.volumes[pairs[k]] = parse_real(v->as_array()[k]);
            }
        }
        out.push_back(std::move(sample));
    }
    return out;
}

std::vector<PriceSample> load_samples(const std::string& path, std::size_t max_samples) {
    const std::string s = read_file(path);
    json::error_code ec;
    json::value root = json::parse(s, ec);
    if (ec) throw ConfigError("Invalid samples json " + path + ": " + ec.message());
    return parse_samples(root, max_samples);
}

trading::VolumeLimits volume_limits(const PriceSample& sample, double vol_mult) {
    if (sample.volumes.size() != sample.prices.size()) {
        throw ConfigError("volume-limited arbitrage needs a volume for every priced pair");
    }
    trading::VolumeLimits limits;
    for (const auto& [pair, volume] : sample.volumes) limits[pair] = volume * vol_mult;
    return limits;
}

} // namespace harness
} // namespace ammsim
