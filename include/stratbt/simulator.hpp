#pragma once
#include <vector>
#include "types.hpp"

namespace stratbt {

struct SimulationOptions {
    double take_profit_pct = 20.0;
    double stop_loss_pct = 10.0;
};

struct SimulationResult {
    std::vector<Trade> trades;
    Statistics stats;
};

void validate(const SimulationOptions& opts);

SimulationResult simulate_trades(
    const std::vector<Signal>& signals,
    const std::vector<Candle>& candles,
    const SimulationOptions& opts
);

} // namespace stratbt
