#include "../include/stratbt/strategy.hpp"
#include "../include/stratbt/indicators.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace stratbt {

namespace {

constexpr int kFastEma = 9;
constexpr int kSlowEma = 21;
constexpr int kRsiPeriod = 14;
constexpr double kOversold = 30.0;
constexpr double kOverbought = 70.0;
constexpr size_t kBreakoutLookback = 20;
constexpr double kVolumeSpike = 2.0;
constexpr int kBandPeriod = 20;
constexpr double kBandWidth = 2.0;

std::vector<double> closes_of(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& c : candles) closes.push_back(c.close);
    return closes;
}

} // namespace

std::vector<Signal> ema_crossover(const std::vector<Candle>& candles) {
    std::vector<Signal> signals;
    auto closes = closes_of(candles);
    auto fast = ema(closes, kFastEma);
    auto slow = ema(closes, kSlowEma);

    for (size_t i = 1; i < candles.size(); ++i) {
        if (std::isnan(fast[i]) || std::isnan(slow[i]) ||
            std::isnan(fast[i - 1]) || std::isnan(slow[i - 1])) {
            continue;
        }
        double prev = fast[i - 1] - slow[i - 1];
        double cur = fast[i] - slow[i];
        if (prev <= 0 && cur > 0) {
            signals.push_back({candles[i].time, Direction::Buy, candles[i].close, "EMA9 crossed above EMA21"});
        } else if (prev >= 0 && cur < 0) {
            signals.push_back({candles[i].time, Direction::Sell, candles[i].close, "EMA9 crossed below EMA21"});
        }
    }
    return signals;
}

std::vector<Signal> rsi_reversal(const std::vector<Candle>& candles) {
    std::vector<Signal> signals;
    auto values = rsi(closes_of(candles), kRsiPeriod);

    for (size_t i = 1; i < candles.size(); ++i) {
        double prev = values[i - 1];
        double cur = values[i];
        if (std::isnan(prev) || std::isnan(cur)) continue;
        if (prev >= kOversold && cur < kOversold) {
            signals.push_back({candles[i].time, Direction::Buy, candles[i].close,
                               "RSI crossed below " + std::to_string(static_cast<int>(kOversold)) + " (oversold)"});
        }
        if (prev <= kOverbought && cur > kOverbought) {
            signals.push_back({candles[i].time, Direction::Sell, candles[i].close,
                               "RSI crossed above " + std::to_string(static_cast<int>(kOverbought)) + " (overbought)"});
        }
    }
    return signals;
}

std::vector<Signal> momentum_breakout(const std::vector<Candle>& candles) {
    std::vector<Signal> signals;

    for (size_t i = kBreakoutLookback; i < candles.size(); ++i) {
        const auto& row = candles[i];
        double volume_sum = 0.0;
        double period_high = candles[i - kBreakoutLookback].high;
        double period_low = candles[i - kBreakoutLookback].low;
        for (size_t j = i - kBreakoutLookback; j < i; ++j) {
            volume_sum += candles[j].volume;
            period_high = std::max(period_high, candles[j].high);
            period_low = std::min(period_low, candles[j].low);
        }
        double avg_volume = volume_sum / kBreakoutLookback;
        bool volume_spike = row.volume > kVolumeSpike * avg_volume;

        if (volume_spike && row.close > period_high) {
            signals.push_back({row.time, Direction::Buy, row.close, "Volume breakout above 20-period high"});
        }
        if (volume_spike && row.close < period_low) {
            signals.push_back({row.time, Direction::Sell, row.close, "Volume breakdown below 20-period low"});
        }
    }
    return signals;
}

std::vector<Signal> mean_reversion(const std::vector<Candle>& candles) {
    std::vector<Signal> signals;
    auto bands = bollinger_bands(closes_of(candles), kBandPeriod, kBandWidth);

    for (size_t i = 0; i < candles.size(); ++i) {
        if (std::isnan(bands.lower[i]) || std::isnan(bands.upper[i])) continue;
        double c = candles[i].close;
        if (c <= bands.lower[i]) {
            signals.push_back({candles[i].time, Direction::Buy, c, "Close at or below lower Bollinger band"});
        }
        if (c >= bands.upper[i]) {
            signals.push_back({candles[i].time, Direction::Sell, c, "Close at or above upper Bollinger band"});
        }
    }
    return signals;
}

std::vector<Signal> evaluate(StrategyKind kind, const std::vector<Candle>& candles) {
    switch (kind) {
        case StrategyKind::EmaCrossover: return ema_crossover(candles);
        case StrategyKind::RsiReversal: return rsi_reversal(candles);
        case StrategyKind::MomentumBreakout: return momentum_breakout(candles);
        case StrategyKind::MeanReversion: return mean_reversion(candles);
    }
    throw std::invalid_argument("evaluate: unknown strategy kind");
}

std::string strategy_key(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::EmaCrossover: return "ema_crossover";
        case StrategyKind::RsiReversal: return "rsi_reversal";
        case StrategyKind::MomentumBreakout: return "momentum_breakout";
        case StrategyKind::MeanReversion: return "mean_reversion";
    }
    throw std::invalid_argument("strategy_key: unknown strategy kind");
}

std::string strategy_label(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::EmaCrossover: return "EMA Crossover (9/21)";
        case StrategyKind::RsiReversal: return "RSI Reversal (14)";
        case StrategyKind::MomentumBreakout: return "Momentum Breakout (20)";
        case StrategyKind::MeanReversion: return "Mean Reversion (Bollinger 20/2)";
    }
    throw std::invalid_argument("strategy_label: unknown strategy kind");
}

StrategyKind parse_strategy(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    for (auto kind : all_strategies()) {
        if (s == strategy_key(kind)) return kind;
    }
    throw std::invalid_argument("Unknown strategy: " + name);
}

const std::vector<StrategyKind>& all_strategies() {
    static const std::vector<StrategyKind> kinds = {
        StrategyKind::EmaCrossover,
        StrategyKind::RsiReversal,
        StrategyKind::MomentumBreakout,
        StrategyKind::MeanReversion
    };
    return kinds;
}

} // namespace stratbt
