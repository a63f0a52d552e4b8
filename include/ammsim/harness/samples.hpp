// Price/volume time samples fed to the arbitrageur
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "ammsim/trading/trade.hpp"

namespace ammsim {
namespace harness {

// Market state at one timestep; volumes are in whole coin units and may be empty
struct PriceSample {
    uint64_t timestamp{0};
    trading::PriceMap prices;
    trading::VolumeLimits volumes;
};

// Parse samples from JSON
// Format:
// {
//   "pairs": [["DAI", "USDC"], ...],
//   "samples": [ { "timestamp": 1690000000, "prices": [1.0002, ...], "volumes": [12000.0, ...] }, ... ]
// }
std::vector<PriceSample> parse_samples(const boost::json::value& root, std::size_t max_samples = 0);

std::vector<PriceSample> load_samples(const std::string& path, std::size_t max_samples = 0);

// Volume caps for one sample: volume * vol_mult per pair
trading::VolumeLimits volume_limits(const PriceSample& sample, double vol_mult);

} // namespace harness
} // namespace ammsim
