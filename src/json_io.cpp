#include "../include/stratbt/json_io.hpp"
#include "../include/stratbt/utils.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace stratbt {

json number_or_null(double v) {
    if (!std::isfinite(v)) return nullptr;
    return v;
}

json series_to_json(const std::vector<double>& series) {
    json arr = json::array();
    for (double v : series) arr.push_back(number_or_null(v));
    return arr;
}

void to_json(json& j, const Signal& s) {
    j = json{
        {"timestamp", s.timestamp},
        {"direction", to_string(s.direction)},
        {"price", s.price},
        {"reason", s.reason}
    };
}

void to_json(json& j, const ExitCounts& e) {
    j = json{
        {"stop_loss", e.stop_loss},
        {"take_profit", e.take_profit},
        {"signal", e.signal},
        {"end_of_data", e.end_of_data}
    };
}

void to_json(json& j, const Trade& t) {
    j = json{
        {"entry_time", t.entry_time},
        {"exit_time", t.exit_time},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"return_pct", t.return_pct},
        {"holding_period_minutes", t.holding_period_minutes},
        {"exit_reason", to_string(t.exit_reason)}
    };
}

void to_json(json& j, const Statistics& s) {
    j = json{
        {"total_trades", s.total_trades},
        {"win_rate", s.win_rate},
        {"avg_return", s.avg_return},
        {"max_drawdown", s.max_drawdown},
        {"sharpe_ratio", s.sharpe_ratio},
        {"profit_factor", number_or_null(s.profit_factor)},
        {"wins", s.wins},
        {"losses", s.losses},
        {"best_trade_pct", s.best_trade_pct},
        {"worst_trade_pct", s.worst_trade_pct},
        {"avg_holding_minutes", s.avg_holding_minutes},
        {"expectancy", s.expectancy},
        {"equity_curve", series_to_json(s.equity_curve)},
        {"exits", s.exits}
    };
}

void to_json(json& j, const BacktestResult& r) {
    j = json{
        {"strategy_name", r.strategy_name},
        {"total_trades", r.total_trades},
        {"win_rate", r.win_rate},
        {"avg_return", r.avg_return},
        {"max_drawdown", r.max_drawdown},
        {"sharpe_ratio", r.sharpe_ratio},
        {"profit_factor", number_or_null(r.profit_factor)},
        {"wins", r.wins},
        {"losses", r.losses},
        {"best_trade_pct", r.best_trade_pct},
        {"worst_trade_pct", r.worst_trade_pct},
        {"avg_holding_minutes", r.avg_holding_minutes},
        {"expectancy", r.expectancy},
        {"equity_curve", series_to_json(r.equity_curve)},
        {"exits", r.exits},
        {"trades", r.trades}
    };
}

void to_json(json& j, const WalkForwardResult& w) {
    j = json{
        {"split_index", w.split_index},
        {"robust", w.robust},
        {"in_sample", w.in_sample},
        {"out_of_sample", w.out_of_sample}
    };
}

void to_json(json& j, const GridPoint& p) {
    j = json{
        {"take_profit_pct", p.take_profit_pct},
        {"stop_loss_pct", p.stop_loss_pct},
        {"result", p.result}
    };
}

void to_json(json& j, const CurrentSignal& s) {
    j = json{
        {"strategy_name", s.strategy_name},
        {"direction", to_string(s.direction)},
        {"price", s.price},
        {"timestamp", s.timestamp},
        {"reason", s.reason}
    };
}

void to_json(json& j, const Consensus& c) {
    j = json{
        {"direction", to_string(c.direction)},
        {"buy_votes", c.buy_votes},
        {"sell_votes", c.sell_votes},
        {"hold_votes", c.hold_votes}
    };
}

void to_json(json& j, const BacktestOptions& o) {
    j = json{
        {"timeframe", o.timeframe},
        {"lookback_candles", o.lookback_candles},
        {"take_profit_pct", o.take_profit_pct},
        {"stop_loss_pct", o.stop_loss_pct}
    };
}

static double field_to_double(const json& v, const char* name) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Candle field '") + name + "' is not numeric: " + v.dump());
        }
    }
    if (v.is_null()) {
        throw std::runtime_error(std::string("Candle field '") + name + "' is null");
    }
    throw std::runtime_error(std::string("Candle field '") + name + "' has unexpected type: " + v.dump());
}

static long long field_to_time(const json& v) {
    long long t = 0;
    if (v.is_string()) {
        try {
            t = std::stoll(v.get<std::string>());
        } catch (const std::exception&) {
            throw std::runtime_error("Candle field 'time' is not numeric: " + v.dump());
        }
    } else if (v.is_number_integer()) {
        t = v.get<long long>();
    } else if (v.is_number_float() && std::isfinite(v.get<double>()) &&
               std::fabs(v.get<double>()) < 9.0e18) {
        t = static_cast<long long>(v.get<double>());
    } else {
        throw std::runtime_error("Candle field 'time' has unexpected type: " + v.dump());
    }
    if (t > 1000000000000LL) t /= 1000; // milliseconds
    return t;
}

std::vector<Candle> candles_from_json(const json& j) {
    const json& arr = (j.is_object() && j.contains("candles")) ? j["candles"] : j;
    if (!arr.is_array()) {
        throw std::runtime_error("Expected a JSON array of candles");
    }

    std::vector<Candle> candles;
    candles.reserve(arr.size());
    for (const auto& item : arr) {
        Candle c{};
        if (item.is_array()) {
            if (item.size() < 5) {
                throw std::runtime_error("Candle row needs at least 5 fields: " + item.dump());
            }
            c.time = field_to_time(item[0]);
            c.open = field_to_double(item[1], "open");
            c.high = field_to_double(item[2], "high");
            c.low = field_to_double(item[3], "low");
            c.close = field_to_double(item[4], "close");
            c.volume = item.size() > 5 && !item[5].is_null() ? field_to_double(item[5], "volume") : 0.0;
        } else if (item.is_object()) {
            if (!item.contains("time")) {
                throw std::runtime_error("Candle object missing 'time': " + item.dump());
            }
            auto required = [&item](const char* key) {
                if (!item.contains(key)) {
                    throw std::runtime_error(std::string("Candle object missing '") + key + "': " + item.dump());
                }
                return field_to_double(item[key], key);
            };
            c.time = field_to_time(item["time"]);
            c.open = required("open");
            c.high = required("high");
            c.low = required("low");
            c.close = required("close");
            c.volume = item.contains("volume") && !item["volume"].is_null() ? field_to_double(item["volume"], "volume") : 0.0;
        } else {
            throw std::runtime_error("Unsupported candle row: " + item.dump());
        }

        // Skip invalid candles (all prices zero)
        if (c.open == 0 && c.high == 0 && c.low == 0 && c.close == 0) {
            continue;
        }
        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
            !std::isfinite(c.close) || !std::isfinite(c.volume)) {
            throw std::runtime_error("Candle at " + std::to_string(c.time) + " has a non-finite field");
        }
        if (c.open <= 0 || c.high <= 0 || c.low <= 0 || c.close <= 0) {
            throw std::runtime_error("Candle at " + std::to_string(c.time) + " has a non-positive price");
        }
        candles.push_back(c);
    }

    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.time < b.time;
    });
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].time == candles[i - 1].time) {
            throw std::runtime_error("Duplicate candle timestamp " + std::to_string(candles[i].time));
        }
    }
    return candles;
}

static json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error in " + path + ": " + e.what());
    }
}

std::vector<Candle> load_candles(const std::string& path) {
    return candles_from_json(read_json_file(path));
}

static int lookback_from_json(const json& v) {
    if (!v.is_number()) {
        throw std::invalid_argument("lookback_candles must be a number, got " + v.dump());
    }
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX)) {
            throw std::invalid_argument("lookback_candles out of range: " + v.dump());
        }
    } else if (v.is_number_integer()) {
        long long n = v.get<long long>();
        if (n < 1 || n > INT_MAX) {
            throw std::invalid_argument("lookback_candles out of range: " + v.dump());
        }
    } else {
        double d = v.get<double>();
        if (!std::isfinite(d) || d != std::floor(d) || d < 1 || d > INT_MAX) {
            throw std::invalid_argument("lookback_candles must be an integer in [1, " +
                                        std::to_string(INT_MAX) + "], got " + v.dump());
        }
    }
    return static_cast<int>(v.get<double>());
}

BacktestOptions options_from_json(const json& j, const BacktestOptions& base) {
    if (!j.is_object()) {
        throw std::invalid_argument("Backtest options must be a JSON object");
    }
    BacktestOptions opts = base;
    try {
        opts.timeframe = j.value("timeframe", base.timeframe);
        if (j.contains("lookback_candles")) {
            opts.lookback_candles = lookback_from_json(j["lookback_candles"]);
        }
        opts.take_profit_pct = j.value("take_profit_pct", base.take_profit_pct);
        opts.stop_loss_pct = j.value("stop_loss_pct", base.stop_loss_pct);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid backtest option: ") + e.what());
    }
    validate(opts);
    return opts;
}

BacktestOptions load_options(const std::string& path) {
    return options_from_json(read_json_file(path));
}

} // namespace stratbt
