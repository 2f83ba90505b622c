#pragma once
#include <vector>

namespace stratbt {

struct BollingerBands {
    std::vector<double> upper, middle, lower;
};

// Output has the input's length; positions that cannot be computed yet hold NaN.
std::vector<double> ema(const std::vector<double>& values, int period);

std::vector<double> rsi(const std::vector<double>& closes, int period = 14);

BollingerBands bollinger_bands(const std::vector<double>& closes, int period = 20, double std_dev = 2.0);

} // namespace stratbt
