#include "../include/stratbt/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace stratbt {

Statistics compute_statistics(const std::vector<Trade>& trades) {
    Statistics stats;
    const size_t n = trades.size();
    stats.total_trades = static_cast<int>(n);
    stats.equity_curve.push_back(kStartingEquity);
    if (n == 0) {
        return stats;
    }
    stats.equity_curve.reserve(n + 1);

    int wins = 0;
    double sum = 0.0, gross_profit = 0.0, gross_loss = 0.0, hold_sum = 0.0;
    double cum_return = 0.0, peak = 0.0, max_dd = 0.0;
    double equity = kStartingEquity;
    stats.best_trade_pct = trades.front().return_pct;
    stats.worst_trade_pct = trades.front().return_pct;
    for (const auto& t : trades) {
        if (t.return_pct > 0) {
            ++wins;
            gross_profit += t.return_pct;
        } else {
            gross_loss += t.return_pct;
        }
        sum += t.return_pct;
        hold_sum += t.holding_period_minutes;
        stats.best_trade_pct = std::max(stats.best_trade_pct, t.return_pct);
        stats.worst_trade_pct = std::min(stats.worst_trade_pct, t.return_pct);

        cum_return += t.return_pct;
        peak = std::max(peak, cum_return);
        max_dd = std::min(max_dd, cum_return - peak);

        equity = std::max(equity * (1.0 + t.return_pct / 100.0), 0.0);
        stats.equity_curve.push_back(equity);

        switch (t.exit_reason) {
            case ExitReason::StopLoss: ++stats.exits.stop_loss; break;
            case ExitReason::TakeProfit: ++stats.exits.take_profit; break;
            case ExitReason::Signal: ++stats.exits.signal; break;
            case ExitReason::EndOfData: ++stats.exits.end_of_data; break;
        }
    }

    const int losses = static_cast<int>(n) - wins;
    double mean = sum / n;
    stats.wins = wins;
    stats.losses = losses;
    stats.win_rate = static_cast<double>(wins) / n * 100.0;
    stats.avg_return = mean;
    stats.max_drawdown = max_dd;
    stats.avg_holding_minutes = hold_sum / n;

    // Average win weighted by win probability minus average loss weighted by loss probability.
    double p_win = static_cast<double>(wins) / n;
    double avg_win = wins > 0 ? gross_profit / wins : 0.0;
    double avg_loss = losses > 0 ? std::fabs(gross_loss) / losses : 0.0;
    stats.expectancy = p_win * avg_win - (1.0 - p_win) * avg_loss;

    // Each trade counts as one trading day when annualising.
    double stddev = 0.0;
    if (n > 1) {
        double sq = 0.0;
        for (const auto& t : trades) sq += (t.return_pct - mean) * (t.return_pct - mean);
        stddev = std::sqrt(sq / (n - 1));
    }
    stats.sharpe_ratio = stddev > 0 ? mean / stddev * std::sqrt(kTradingDaysPerYear) : 0.0;

    gross_loss = std::fabs(gross_loss);
    if (gross_loss > 0) {
        stats.profit_factor = gross_profit / gross_loss;
    } else if (gross_profit > 0) {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    } else {
        stats.profit_factor = 0.0;
    }
    return stats;
}

} // namespace stratbt
