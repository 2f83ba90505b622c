#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace stratbt {

enum class StrategyKind {
    EmaCrossover,
    RsiReversal,
    MomentumBreakout,
    MeanReversion
};

std::vector<Signal> ema_crossover(const std::vector<Candle>& candles);
std::vector<Signal> rsi_reversal(const std::vector<Candle>& candles);
std::vector<Signal> momentum_breakout(const std::vector<Candle>& candles);
std::vector<Signal> mean_reversion(const std::vector<Candle>& candles);

std::vector<Signal> evaluate(StrategyKind kind, const std::vector<Candle>& candles);

// "ema_crossover", "rsi_reversal", ...
std::string strategy_key(StrategyKind kind);
// "EMA Crossover (9/21)", ...
std::string strategy_label(StrategyKind kind);
// Throws std::invalid_argument for unknown names.
StrategyKind parse_strategy(const std::string& name);

const std::vector<StrategyKind>& all_strategies();

} // namespace stratbt
