#include "../include/stratbt/indicators.hpp"
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace stratbt {

std::vector<double> ema(const std::vector<double>& values, int period) {
    std::vector<double> result(values.size(), NAN);
    if (period < 1 || static_cast<size_t>(period) > values.size()) {
        return result;
    }
    const double k = 2.0 / (period + 1);
    double seed = std::accumulate(values.begin(), values.begin() + period, 0.0) / period;
    result[period - 1] = seed;
    for (size_t i = period; i < values.size(); ++i) {
        result[i] = values[i] * k + result[i - 1] * (1.0 - k);
    }
    return result;
}

static double rsi_value(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) return 100.0;
    return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
}

std::vector<double> rsi(const std::vector<double>& closes, int period) {
    if (period < 1) {
        throw std::invalid_argument("rsi: period must be >= 1, got " + std::to_string(period));
    }
    std::vector<double> result(closes.size(), NAN);
    if (closes.size() <= static_cast<size_t>(period)) {
        return result;
    }

    double avg_gain = 0.0, avg_loss = 0.0;
    for (size_t i = 1; i <= static_cast<size_t>(period); ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= period;
    avg_loss /= period;
    result[period] = rsi_value(avg_gain, avg_loss);

    // Wilder smoothing
    for (size_t i = period + 1; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
        result[i] = rsi_value(avg_gain, avg_loss);
    }
    return result;
}

BollingerBands bollinger_bands(const std::vector<double>& closes, int period, double std_dev) {
    if (period < 1) {
        throw std::invalid_argument("bollinger_bands: period must be >= 1, got " + std::to_string(period));
    }
    if (!(std_dev >= 0.0)) {
        throw std::invalid_argument("bollinger_bands: std_dev must be >= 0");
    }
    BollingerBands bands{
        std::vector<double>(closes.size(), NAN),
        std::vector<double>(closes.size(), NAN),
        std::vector<double>(closes.size(), NAN)
    };
    if (static_cast<size_t>(period) > closes.size()) {
        return bands;
    }
    for (size_t i = period - 1; i < closes.size(); ++i) {
        auto first = closes.begin() + i - period + 1;
        auto last = closes.begin() + i + 1;
        double mean = std::accumulate(first, last, 0.0) / period;
        double sq = 0.0;
        for (auto it = first; it != last; ++it) {
            sq += (*it - mean) * (*it - mean);
        }
        double sd = std::sqrt(sq / period); // population
        bands.middle[i] = mean;
        bands.upper[i] = mean + std_dev * sd;
        bands.lower[i] = mean - std_dev * sd;
    }
    return bands;
}

} // namespace stratbt
