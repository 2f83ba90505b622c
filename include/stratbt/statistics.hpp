#pragma once
#include <vector>
#include "types.hpp"

namespace stratbt {

constexpr double kTradingDaysPerYear = 252.0;
constexpr double kStartingEquity = 100.0;

Statistics compute_statistics(const std::vector<Trade>& trades);

} // namespace stratbt
