// Trade intents and their execution records
#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ammsim/core/numeric_types.hpp"

namespace ammsim {
namespace trading {

// (coin_in, coin_out) by asset name
using CoinPair = std::pair<std::string, std::string>;

// Market price of coin_in in units of coin_out, per pair
using PriceMap = std::map<CoinPair, double>;

// Per-pair volume caps in whole coin units (scaled by 1e18 before use)
using VolumeLimits = std::map<CoinPair, double>;

struct Trade {
    std::string coin_in;
    std::string coin_out;
    Int amount_in;
};

// A trade sized to move the pool price of coin_in/coin_out to price_target
struct ArbTrade {
    std::string coin_in;
    std::string coin_out;
    Int amount_in;
    double price_target{0.0};

    CoinPair pair() const { return {coin_in, coin_out}; }
    Trade trade() const { return {coin_in, coin_out, amount_in}; }

    ArbTrade replace_amount_in(const Int& new_amount_in) const {
        return {coin_in, coin_out, new_amount_in, price_target};
    }
};

// Outcome of an executed trade. amount_out, fee and volume are set once, after the real exchange.
class TradeResult {
public:
    explicit TradeResult(const Trade& trade) : trade_(trade) {}

    const std::string& coin_in() const { return trade_.coin_in; }
    const std::string& coin_out() const { return trade_.coin_out; }
    const Int& amount_in() const { return trade_.amount_in; }

    bool executed() const { return amount_out_.has_value(); }

    const Int& amount_out() const {
        if (!amount_out_) throw std::logic_error("trade outcome not set");
        return *amount_out_;
    }

    const Int& fee() const {
        if (!fee_) throw std::logic_error("trade outcome not set");
        return *fee_;
    }

    // Input amount in pool value units; zero for trades the pool does not count as volume
    const Int& volume() const {
        if (!volume_) throw std::logic_error("trade outcome not set");
        return *volume_;
    }

    void set_outcome(const Int& amount_out, const Int& fee, const Int& volume) {
        if (amount_out_ || fee_ || volume_) throw std::logic_error("trade outcome already set");
        amount_out_ = amount_out;
        fee_ = fee;
        volume_ = volume;
    }

private:
    Trade trade_;
    std::optional<Int> amount_out_;
    std::optional<Int> fee_;
    std::optional<Int> volume_;
};

} // namespace trading
} // namespace ammsim
