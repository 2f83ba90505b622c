#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace stratbt {

// "15m", "1h", "1d", "1w" -> seconds. Throws std::invalid_argument otherwise.
long long timeframe_seconds(const std::string& timeframe);

std::string epoch_to_utc_iso(long long epoch_sec);

std::string trades_to_csv(const std::vector<Trade>& trades);
std::string signals_to_csv(const std::vector<Signal>& signals);

// Summary table, exit-reason totals and per-strategy best/worst lines.
std::string results_report(const std::vector<BacktestResult>& results);

} // namespace stratbt
