#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"
#include "backtest.hpp"

namespace stratbt {

using json = nlohmann::json;

void to_json(json& j, const Signal& s);
void to_json(json& j, const ExitCounts& e);
void to_json(json& j, const Trade& t);
void to_json(json& j, const Statistics& s);
void to_json(json& j, const BacktestResult& r);
void to_json(json& j, const CurrentSignal& s);
void to_json(json& j, const Consensus& c);
void to_json(json& j, const BacktestOptions& o);
void to_json(json& j, const WalkForwardResult& w);
void to_json(json& j, const GridPoint& p);

// Accepts object rows {time, open, ...} or array rows [time, open, high, low, close, volume].
std::vector<Candle> candles_from_json(const json& j);
std::vector<Candle> load_candles(const std::string& path);

// Keys missing from j keep the value from base.
BacktestOptions options_from_json(const json& j, const BacktestOptions& base = {});
BacktestOptions load_options(const std::string& path);

// NaN and infinities become null.
json number_or_null(double v);
json series_to_json(const std::vector<double>& series);

} // namespace stratbt
