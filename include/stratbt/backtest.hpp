#pragma once
#include <functional>
#include <string>
#include <vector>
#include "types.hpp"
#include "strategy.hpp"

namespace stratbt {

constexpr std::size_t kMinBacktestCandles = 30;
constexpr std::size_t kMinSignalCandles = 22;
// A signal is fresh when it falls within the last few candles.
constexpr std::size_t kFreshSignalCandles = 3;

constexpr double kWalkForwardSplit = 0.7;
// Out-of-sample win rate within this many percentage points of in-sample counts as robust.
constexpr double kRobustWinRateGap = 15.0;
constexpr int kRobustMinTrades = 5;
constexpr int kGridMinTrades = 10;

struct BacktestOptions {
    std::string timeframe = "1h";
    int lookback_candles = 300;
    double take_profit_pct = 20.0;
    double stop_loss_pct = 10.0;
};

// Supplies candles for (timeframe, lookback_candles). Implemented by the caller.
using CandleSource = std::function<std::vector<Candle>(const std::string& timeframe, int lookback_candles)>;

struct CurrentSignal {
    std::string strategy_name;
    Direction direction;
    double price;
    long long timestamp;
    std::string reason;
};

struct Consensus {
    Direction direction;
    int buy_votes, sell_votes, hold_votes;
};

struct WalkForwardResult {
    BacktestResult in_sample;
    BacktestResult out_of_sample;
    std::size_t split_index = 0;
    bool robust = false;
};

struct GridPoint {
    double take_profit_pct;
    double stop_loss_pct;
    BacktestResult result;
};

void validate(const BacktestOptions& opts);

BacktestResult run_backtest(const CandleSource& source, StrategyKind strategy, const BacktestOptions& opts = {});
BacktestResult run_backtest(const std::vector<Candle>& candles, StrategyKind strategy, const BacktestOptions& opts = {});

std::vector<BacktestResult> run_all_backtests(
    const std::vector<Candle>& candles,
    const BacktestOptions& opts = {},
    const std::vector<StrategyKind>& kinds = all_strategies()
);

// Splits the lookback window at split and backtests each side on its own.
WalkForwardResult walk_forward(
    const std::vector<Candle>& candles,
    StrategyKind strategy,
    const BacktestOptions& opts = {},
    double split = kWalkForwardSplit
);

// Every (take profit, stop loss) pair on the same signals. Pairs with fewer than
// min_trades trades are dropped; the rest are ordered by expectancy, best first.
std::vector<GridPoint> grid_search(
    const std::vector<Candle>& candles,
    StrategyKind strategy,
    const std::vector<double>& tp_list,
    const std::vector<double>& sl_list,
    const BacktestOptions& opts = {},
    int min_trades = kGridMinTrades
);

CurrentSignal get_current_signal(StrategyKind strategy, const std::vector<Candle>& candles);

std::vector<CurrentSignal> current_signals(
    const std::vector<Candle>& candles,
    const std::vector<StrategyKind>& kinds = all_strategies()
);

Consensus get_consensus(const std::vector<CurrentSignal>& signals);

} // namespace stratbt
