#include "../include/stratbt/utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stratbt {

std::string to_string(Direction d) {
    switch (d) {
        case Direction::Buy: return "BUY";
        case Direction::Sell: return "SELL";
        case Direction::Hold: return "HOLD";
    }
    return "HOLD";
}

std::string to_string(ExitReason r) {
    switch (r) {
        case ExitReason::StopLoss: return "stop_loss";
        case ExitReason::TakeProfit: return "take_profit";
        case ExitReason::Signal: return "signal";
        case ExitReason::EndOfData: return "end_of_data";
    }
    return "end_of_data";
}

long long timeframe_seconds(const std::string& timeframe) {
    std::string s = timeframe;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s.size() < 2 || !std::all_of(s.begin(), s.end() - 1, ::isdigit)) {
        throw std::invalid_argument("Invalid timeframe: '" + timeframe + "'");
    }
    long long n = 0;
    try {
        n = std::stoll(s.substr(0, s.size() - 1));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Timeframe out of range: '" + timeframe + "'");
    }
    if (n <= 0) {
        throw std::invalid_argument("Invalid timeframe: '" + timeframe + "'");
    }
    long long unit = 0;
    switch (s.back()) {
        case 'm': unit = 60; break;
        case 'h': unit = 3600; break;
        case 'd': unit = 86400; break;
        case 'w': unit = 7 * 86400; break;
        default:
            throw std::invalid_argument("Invalid timeframe: '" + timeframe + "'");
    }
    if (n > LLONG_MAX / unit) {
        throw std::invalid_argument("Timeframe out of range: '" + timeframe + "'");
    }
    return n * unit;
}

std::string epoch_to_utc_iso(long long epoch_sec) {
    std::time_t t = static_cast<std::time_t>(epoch_sec);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

static std::string double_to_string(double v, int precision = 4) {
    if (std::isnan(v)) return "";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

std::string trades_to_csv(const std::vector<Trade>& trades) {
    std::ostringstream ss;
    ss << "entry_time,entry_price,exit_time,exit_price,return_pct,holding_period_minutes,exit_reason\n";
    for (const auto& t : trades) {
        ss << t.entry_time << ","
           << double_to_string(t.entry_price, 8) << ","
           << t.exit_time << ","
           << double_to_string(t.exit_price, 8) << ","
           << double_to_string(t.return_pct) << ","
           << double_to_string(t.holding_period_minutes, 1) << ","
           << to_string(t.exit_reason) << "\n";
    }
    return ss.str();
}

std::string signals_to_csv(const std::vector<Signal>& signals) {
    std::ostringstream ss;
    ss << "timestamp,direction,price,reason\n";
    for (const auto& s : signals) {
        ss << s.timestamp << ","
           << to_string(s.direction) << ","
           << double_to_string(s.price, 8) << ","
           << "\"" << s.reason << "\"\n";
    }
    return ss.str();
}

std::string results_report(const std::vector<BacktestResult>& results) {
    std::ostringstream ss;
    ss << "strategy,trades,win_rate,profit_factor,sharpe_ratio,max_drawdown,expectancy\n";
    for (const auto& r : results) {
        ss << r.strategy_name << ","
           << r.total_trades << ","
           << double_to_string(r.win_rate, 1) << ","
           << double_to_string(r.profit_factor, 2) << ","
           << double_to_string(r.sharpe_ratio, 2) << ","
           << double_to_string(r.max_drawdown, 1) << ","
           << double_to_string(r.expectancy) << "\n";
    }

    ExitCounts total;
    for (const auto& r : results) {
        total.stop_loss += r.exits.stop_loss;
        total.take_profit += r.exits.take_profit;
        total.signal += r.exits.signal;
        total.end_of_data += r.exits.end_of_data;
    }
    ss << "\nexits: stop_loss=" << total.stop_loss
       << " take_profit=" << total.take_profit
       << " signal=" << total.signal
       << " end_of_data=" << total.end_of_data << "\n";

    for (const auto& r : results) {
        if (r.total_trades == 0) continue;
        ss << r.strategy_name << ": best=" << double_to_string(r.best_trade_pct, 1)
           << "% worst=" << double_to_string(r.worst_trade_pct, 1)
           << "% avg=" << double_to_string(r.avg_return, 1)
           << "% avg_hold=" << double_to_string(r.avg_holding_minutes, 0) << "m\n";
    }
    return ss.str();
}

} // namespace stratbt
