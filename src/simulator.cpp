#include "../include/stratbt/simulator.hpp"
#include "../include/stratbt/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace stratbt {

namespace {

enum class PositionState { Flat, Open };

struct Position {
    long long entry_time = 0;
    double entry_price = 0.0;
    double tp_price = 0.0;
    double sl_price = 0.0;
};

Trade close_trade(const Position& pos, long long exit_time, double exit_price, ExitReason reason) {
    return Trade{
        pos.entry_time,
        exit_time,
        pos.entry_price,
        exit_price,
        (exit_price - pos.entry_price) / pos.entry_price * 100.0,
        static_cast<double>(exit_time - pos.entry_time) / 60.0,
        reason
    };
}

} // namespace

void validate(const SimulationOptions& opts) {
    if (!(opts.take_profit_pct >= 0.0)) {
        throw std::invalid_argument("take_profit_pct must be >= 0");
    }
    if (!(opts.stop_loss_pct >= 0.0) || opts.stop_loss_pct >= 100.0) {
        throw std::invalid_argument("stop_loss_pct must be in [0, 100)");
    }
}

SimulationResult simulate_trades(
    const std::vector<Signal>& signals,
    const std::vector<Candle>& candles,
    const SimulationOptions& opts
) {
    validate(opts);
    SimulationResult result;
    if (signals.empty() || candles.empty()) {
        return result;
    }

    std::vector<Signal> buys;
    std::set<long long> sell_times;
    for (const auto& s : signals) {
        if (s.direction == Direction::Buy) buys.push_back(s);
        else if (s.direction == Direction::Sell) sell_times.insert(s.timestamp);
    }
    std::stable_sort(buys.begin(), buys.end(), [](const Signal& a, const Signal& b) {
        return a.timestamp < b.timestamp;
    });

    PositionState state = PositionState::Flat;
    Position pos;
    size_t next_buy = 0;

    for (const auto& candle : candles) {
        if (state == PositionState::Flat) {
            if (next_buy < buys.size() && buys[next_buy].timestamp <= candle.time) {
                const auto& buy = buys[next_buy++];
                pos.entry_time = candle.time;
                pos.entry_price = buy.price;
                pos.tp_price = buy.price * (1.0 + opts.take_profit_pct / 100.0);
                pos.sl_price = buy.price * (1.0 - opts.stop_loss_pct / 100.0);
                state = PositionState::Open;
            }
        }

        if (state == PositionState::Open) {
            // Stop-loss wins when a single candle spans both thresholds.
            if (candle.low <= pos.sl_price) {
                result.trades.push_back(close_trade(pos, candle.time, pos.sl_price, ExitReason::StopLoss));
                state = PositionState::Flat;
            } else if (candle.high >= pos.tp_price) {
                result.trades.push_back(close_trade(pos, candle.time, pos.tp_price, ExitReason::TakeProfit));
                state = PositionState::Flat;
            } else if (sell_times.count(candle.time)) {
                result.trades.push_back(close_trade(pos, candle.time, candle.close, ExitReason::Signal));
                state = PositionState::Flat;
            }
        }
    }

    // Force close at end
    if (state == PositionState::Open) {
        const auto& last = candles.back();
        result.trades.push_back(close_trade(pos, last.time, last.close, ExitReason::EndOfData));
    }

    result.stats = compute_statistics(result.trades);
    return result;
}

} // namespace stratbt
