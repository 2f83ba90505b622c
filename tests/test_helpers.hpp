#pragma once
#include <cmath>
#include <vector>
#include "../include/stratbt/types.hpp"

namespace stratbt {
namespace fixtures {

constexpr long long kStartTime = 1700000000;
constexpr long long kHour = 3600;

inline Candle bar(size_t i, double close, double spread = 0.0, double volume = 100.0) {
    return Candle{kStartTime + static_cast<long long>(i) * kHour, close, close + spread, close - spread, close, volume};
}

inline std::vector<Candle> from_closes(const std::vector<double>& closes, double spread = 0.0) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < closes.size(); ++i) candles.push_back(bar(i, closes[i], spread));
    return candles;
}

// Falls from 3.0 for 30 candles, then climbs for `rise` candles.
inline std::vector<double> v_shape(size_t rise = 30) {
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(3.0 - 0.05 * i);
    for (size_t i = 1; i <= rise; ++i) closes.push_back(closes[29] + 0.2 * i);
    return closes;
}

inline std::vector<double> sine_wave(size_t n, double base = 100.0, double amp = 10.0) {
    std::vector<double> closes;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(base + amp * std::sin(i * 0.3) + 0.05 * i);
    }
    return closes;
}

} // namespace fixtures
} // namespace stratbt
