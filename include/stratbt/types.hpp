#pragma once
#include <string>
#include <vector>

namespace stratbt {

struct Candle {
    long long time;
    double open, high, low, close, volume;
};

enum class Direction { Buy, Sell, Hold };

struct Signal {
    long long timestamp;
    Direction direction;
    double price;
    std::string reason;
};

enum class ExitReason { StopLoss, TakeProfit, Signal, EndOfData };

struct Trade {
    long long entry_time, exit_time;
    double entry_price, exit_price;
    double return_pct;
    double holding_period_minutes;
    ExitReason exit_reason;
};

// Number of trades closed by each exit rule.
struct ExitCounts {
    int stop_loss = 0;
    int take_profit = 0;
    int signal = 0;
    int end_of_data = 0;
};

struct Statistics {
    int total_trades = 0;
    double win_rate = 0.0;
    double avg_return = 0.0;
    double max_drawdown = 0.0;
    double sharpe_ratio = 0.0;
    double profit_factor = 0.0;

    int wins = 0;
    int losses = 0;
    double best_trade_pct = 0.0;
    double worst_trade_pct = 0.0;
    double avg_holding_minutes = 0.0;
    double expectancy = 0.0;
    // Compounded equity starting at 100, one point per closed trade.
    std::vector<double> equity_curve;
    ExitCounts exits;
};

struct BacktestResult {
    std::string strategy_name;
    int total_trades = 0;
    double win_rate = 0.0;
    double avg_return = 0.0;
    double max_drawdown = 0.0;
    double sharpe_ratio = 0.0;
    double profit_factor = 0.0;
    std::vector<Trade> trades;

    int wins = 0;
    int losses = 0;
    double best_trade_pct = 0.0;
    double worst_trade_pct = 0.0;
    double avg_holding_minutes = 0.0;
    double expectancy = 0.0;
    std::vector<double> equity_curve;
    ExitCounts exits;
};

std::string to_string(Direction d);
std::string to_string(ExitReason r);

} // namespace stratbt
