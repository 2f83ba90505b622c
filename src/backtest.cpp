#include "../include/stratbt/backtest.hpp"
#include "../include/stratbt/simulator.hpp"
#include "../include/stratbt/statistics.hpp"
#include "../include/stratbt/utils.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>

namespace stratbt {

void validate(const BacktestOptions& opts) {
    timeframe_seconds(opts.timeframe);
    if (opts.lookback_candles < 1) {
        throw std::invalid_argument("lookback_candles must be >= 1, got " + std::to_string(opts.lookback_candles));
    }
    validate(SimulationOptions{opts.take_profit_pct, opts.stop_loss_pct});
}

static void keep_lookback(std::vector<Candle>& candles, int lookback_candles) {
    if (candles.size() > static_cast<size_t>(lookback_candles)) {
        candles.erase(candles.begin(), candles.end() - lookback_candles);
    }
}

static BacktestResult make_result(StrategyKind strategy, SimulationResult sim) {
    BacktestResult result;
    result.strategy_name = strategy_label(strategy);
    result.total_trades = sim.stats.total_trades;
    result.win_rate = sim.stats.win_rate;
    result.avg_return = sim.stats.avg_return;
    result.max_drawdown = sim.stats.max_drawdown;
    result.sharpe_ratio = sim.stats.sharpe_ratio;
    result.profit_factor = sim.stats.profit_factor;
    result.trades = std::move(sim.trades);
    result.wins = sim.stats.wins;
    result.losses = sim.stats.losses;
    result.best_trade_pct = sim.stats.best_trade_pct;
    result.worst_trade_pct = sim.stats.worst_trade_pct;
    result.avg_holding_minutes = sim.stats.avg_holding_minutes;
    result.expectancy = sim.stats.expectancy;
    result.equity_curve = std::move(sim.stats.equity_curve);
    result.exits = sim.stats.exits;
    return result;
}

// Candles must already be cut to the lookback window.
static BacktestResult backtest_window(const std::vector<Candle>& candles, StrategyKind strategy, const SimulationOptions& sim_opts) {
    if (candles.size() < kMinBacktestCandles) {
        return make_result(strategy, SimulationResult{{}, compute_statistics({})});
    }
    auto signals = evaluate(strategy, candles);
    return make_result(strategy, simulate_trades(signals, candles, sim_opts));
}

BacktestResult run_backtest(const CandleSource& source, StrategyKind strategy, const BacktestOptions& opts) {
    validate(opts);
    if (!source) {
        throw std::invalid_argument("run_backtest: candle source is empty");
    }
    auto candles = source(opts.timeframe, opts.lookback_candles);
    keep_lookback(candles, opts.lookback_candles);
    return backtest_window(candles, strategy, SimulationOptions{opts.take_profit_pct, opts.stop_loss_pct});
}

BacktestResult run_backtest(const std::vector<Candle>& candles, StrategyKind strategy, const BacktestOptions& opts) {
    return run_backtest([&candles](const std::string&, int) { return candles; }, strategy, opts);
}

std::vector<BacktestResult> run_all_backtests(
    const std::vector<Candle>& candles,
    const BacktestOptions& opts,
    const std::vector<StrategyKind>& kinds
) {
    validate(opts);
    std::vector<std::future<BacktestResult>> jobs;
    jobs.reserve(kinds.size());
    for (auto kind : kinds) {
        jobs.push_back(std::async(std::launch::async, [&candles, &opts, kind]() {
            return run_backtest(candles, kind, opts);
        }));
    }
    std::vector<BacktestResult> results;
    results.reserve(jobs.size());
    for (auto& job : jobs) {
        results.push_back(job.get());
    }
    return results;
}

WalkForwardResult walk_forward(
    const std::vector<Candle>& candles,
    StrategyKind strategy,
    const BacktestOptions& opts,
    double split
) {
    validate(opts);
    if (!(split > 0.0 && split < 1.0)) {
        throw std::invalid_argument("walk_forward: split must be in (0, 1), got " + std::to_string(split));
    }
    std::vector<Candle> window = candles;
    keep_lookback(window, opts.lookback_candles);

    WalkForwardResult out;
    out.split_index = static_cast<std::size_t>(std::floor(window.size() * split));
    const auto mid = window.begin() + static_cast<std::ptrdiff_t>(out.split_index);
    const SimulationOptions sim_opts{opts.take_profit_pct, opts.stop_loss_pct};
    out.in_sample = backtest_window(std::vector<Candle>(window.begin(), mid), strategy, sim_opts);
    out.out_of_sample = backtest_window(std::vector<Candle>(mid, window.end()), strategy, sim_opts);
    out.robust = std::fabs(out.in_sample.win_rate - out.out_of_sample.win_rate) <= kRobustWinRateGap &&
                 out.out_of_sample.total_trades >= kRobustMinTrades;
    return out;
}

std::vector<GridPoint> grid_search(
    const std::vector<Candle>& candles,
    StrategyKind strategy,
    const std::vector<double>& tp_list,
    const std::vector<double>& sl_list,
    const BacktestOptions& opts,
    int min_trades
) {
    validate(opts);
    if (tp_list.empty() || sl_list.empty()) {
        throw std::invalid_argument("grid_search: take profit and stop loss lists must not be empty");
    }
    for (double sl : sl_list) {
        for (double tp : tp_list) {
            validate(SimulationOptions{tp, sl});
        }
    }

    std::vector<Candle> window = candles;
    keep_lookback(window, opts.lookback_candles);
    std::vector<GridPoint> points;
    if (window.size() < kMinBacktestCandles) {
        return points;
    }

    auto signals = evaluate(strategy, window);
    for (double sl : sl_list) {
        for (double tp : tp_list) {
            auto result = make_result(strategy, simulate_trades(signals, window, SimulationOptions{tp, sl}));
            if (result.total_trades >= min_trades) {
                points.push_back(GridPoint{tp, sl, std::move(result)});
            }
        }
    }
    std::stable_sort(points.begin(), points.end(), [](const GridPoint& a, const GridPoint& b) {
        return a.result.expectancy > b.result.expectancy;
    });
    return points;
}

CurrentSignal get_current_signal(StrategyKind strategy, const std::vector<Candle>& candles) {
    CurrentSignal out{strategy_label(strategy), Direction::Hold, 0.0, 0, ""};
    if (candles.size() < kMinSignalCandles) {
        out.reason = "insufficient data: need " + std::to_string(kMinSignalCandles) +
                     " candles, have " + std::to_string(candles.size());
        if (!candles.empty()) {
            out.price = candles.back().close;
            out.timestamp = candles.back().time;
        }
        return out;
    }

    out.price = candles.back().close;
    out.timestamp = candles.back().time;

    auto signals = evaluate(strategy, candles);
    if (signals.empty()) {
        out.reason = "no signal";
        return out;
    }

    const auto& last = signals.back();
    size_t cutoff_index = candles.size() > kFreshSignalCandles + 1 ? candles.size() - kFreshSignalCandles - 1 : 0;
    if (last.timestamp < candles[cutoff_index].time) {
        out.reason = "stale signal";
        return out;
    }

    out.direction = last.direction;
    out.price = last.price;
    out.timestamp = last.timestamp;
    out.reason = last.reason;
    return out;
}

std::vector<CurrentSignal> current_signals(const std::vector<Candle>& candles, const std::vector<StrategyKind>& kinds) {
    std::vector<CurrentSignal> out;
    out.reserve(kinds.size());
    for (auto kind : kinds) {
        out.push_back(get_current_signal(kind, candles));
    }
    return out;
}

Consensus get_consensus(const std::vector<CurrentSignal>& signals) {
    Consensus c{Direction::Hold, 0, 0, 0};
    for (const auto& s : signals) {
        switch (s.direction) {
            case Direction::Buy: ++c.buy_votes; break;
            case Direction::Sell: ++c.sell_votes; break;
            case Direction::Hold: ++c.hold_votes; break;
        }
    }
    if (c.buy_votes > c.sell_votes && c.buy_votes > c.hold_votes) {
        c.direction = Direction::Buy;
    } else if (c.sell_votes > c.buy_votes && c.sell_votes > c.hold_votes) {
        c.direction = Direction::Sell;
    }
    return c;
}

} // namespace stratbt
