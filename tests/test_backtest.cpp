#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <string>
#include "../include/stratbt/backtest.hpp"
#include "../include/stratbt/simulator.hpp"
#include "test_helpers.hpp"

using namespace stratbt;
using stratbt::fixtures::from_closes;

namespace {

CurrentSignal vote(Direction d) {
    return CurrentSignal{"test", d, 1.0, 0, ""};
}

} // namespace

TEST(BacktestOptionsTest, Defaults) {
    BacktestOptions opts;
    EXPECT_EQ(opts.timeframe, "1h");
    EXPECT_EQ(opts.lookback_candles, 300);
    EXPECT_DOUBLE_EQ(opts.take_profit_pct, 20.0);
    EXPECT_DOUBLE_EQ(opts.stop_loss_pct, 10.0);
    EXPECT_NO_THROW(validate(opts));
}

TEST(BacktestOptionsTest, InvalidOptionsFailFast) {
    auto candles = from_closes(fixtures::sine_wave(100));
    BacktestOptions bad_tp;
    bad_tp.take_profit_pct = -1.0;
    BacktestOptions bad_lookback;
    bad_lookback.lookback_candles = 0;
    BacktestOptions bad_timeframe;
    bad_timeframe.timeframe = "hourly";
    for (const auto& opts : {bad_tp, bad_lookback, bad_timeframe}) {
        EXPECT_THROW(run_backtest(candles, StrategyKind::EmaCrossover, opts), std::invalid_argument);
    }
    EXPECT_THROW(run_backtest(CandleSource{}, StrategyKind::EmaCrossover), std::invalid_argument);
}

TEST(BacktestTest, FewerThanThirtyCandlesSkipsSimulation) {
    auto candles = from_closes(fixtures::sine_wave(29));
    auto r = run_backtest(candles, StrategyKind::MeanReversion);
    EXPECT_EQ(r.strategy_name, strategy_label(StrategyKind::MeanReversion));
    EXPECT_EQ(r.total_trades, 0);
    EXPECT_TRUE(r.trades.empty());
    EXPECT_EQ(r.win_rate, 0.0);
    EXPECT_EQ(r.profit_factor, 0.0);
}

TEST(BacktestTest, SourceReceivesTimeframeAndLookback) {
    BacktestOptions opts;
    opts.timeframe = "15m";
    opts.lookback_candles = 120;
    std::string seen_timeframe;
    int seen_lookback = 0;
    CandleSource source = [&](const std::string& timeframe, int lookback) {
        seen_timeframe = timeframe;
        seen_lookback = lookback;
        return from_closes(fixtures::sine_wave(lookback));
    };
    run_backtest(source, StrategyKind::RsiReversal, opts);
    EXPECT_EQ(seen_timeframe, "15m");
    EXPECT_EQ(seen_lookback, 120);
}

TEST(BacktestTest, KeepsOnlyTheLookbackWindow) {
    auto candles = from_closes(fixtures::sine_wave(400, 100.0, 15.0), 1.0);
    BacktestOptions opts;
    opts.lookback_candles = 100;
    auto r = run_backtest(candles, StrategyKind::EmaCrossover, opts);
    ASSERT_GT(r.total_trades, 0);
    for (const auto& t : r.trades) {
        EXPECT_GE(t.entry_time, candles[300].time);
    }
}

TEST(BacktestTest, MatchesStrategyThenSimulator) {
    auto candles = from_closes(fixtures::sine_wave(250, 100.0, 15.0), 1.0);
    BacktestOptions opts;
    opts.take_profit_pct = 8.0;
    opts.stop_loss_pct = 4.0;
    auto r = run_backtest(candles, StrategyKind::EmaCrossover, opts);
    auto sim = simulate_trades(evaluate(StrategyKind::EmaCrossover, candles), candles, SimulationOptions{8.0, 4.0});

    EXPECT_EQ(r.total_trades, sim.stats.total_trades);
    ASSERT_EQ(r.trades.size(), sim.trades.size());
    EXPECT_DOUBLE_EQ(r.win_rate, sim.stats.win_rate);
    EXPECT_DOUBLE_EQ(r.avg_return, sim.stats.avg_return);
    EXPECT_DOUBLE_EQ(r.max_drawdown, sim.stats.max_drawdown);
    EXPECT_DOUBLE_EQ(r.sharpe_ratio, sim.stats.sharpe_ratio);
    EXPECT_LE(r.max_drawdown, 0.0);
}

TEST(BacktestTest, ParallelSweepMatchesSequentialRuns) {
    auto candles = from_closes(fixtures::sine_wave(300, 100.0, 15.0), 1.0);
    auto results = run_all_backtests(candles);
    ASSERT_EQ(results.size(), all_strategies().size());
    for (size_t i = 0; i < results.size(); ++i) {
        auto expected = run_backtest(candles, all_strategies()[i]);
        EXPECT_EQ(results[i].strategy_name, expected.strategy_name);
        EXPECT_EQ(results[i].total_trades, expected.total_trades);
        EXPECT_DOUBLE_EQ(results[i].avg_return, expected.avg_return);
    }
}

TEST(BacktestTest, ResultCarriesExtendedStatistics) {
    auto candles = from_closes(fixtures::sine_wave(300, 100.0, 15.0), 1.0);
    auto r = run_backtest(candles, StrategyKind::EmaCrossover);
    ASSERT_GT(r.total_trades, 0);
    EXPECT_EQ(r.wins + r.losses, r.total_trades);
    EXPECT_EQ(r.exits.stop_loss + r.exits.take_profit + r.exits.signal + r.exits.end_of_data, r.total_trades);
    EXPECT_EQ(r.equity_curve.size(), r.trades.size() + 1);
    EXPECT_LE(r.worst_trade_pct, r.best_trade_pct);
    EXPECT_NEAR(r.expectancy, r.avg_return, 1e-9);
}

TEST(WalkForwardTest, SplitsLookbackWindowSeventyThirty) {
    auto candles = from_closes(fixtures::sine_wave(600, 100.0, 15.0), 1.0);
    BacktestOptions opts;
    auto wf = walk_forward(candles, StrategyKind::EmaCrossover, opts);
    // only the last 300 candles are used
    EXPECT_EQ(wf.split_index, 210u);

    std::vector<Candle> train(candles.begin() + 300, candles.begin() + 510);
    std::vector<Candle> test(candles.begin() + 510, candles.end());
    auto in = run_backtest(train, StrategyKind::EmaCrossover, opts);
    auto out = run_backtest(test, StrategyKind::EmaCrossover, opts);
    EXPECT_EQ(wf.in_sample.total_trades, in.total_trades);
    EXPECT_DOUBLE_EQ(wf.in_sample.win_rate, in.win_rate);
    EXPECT_EQ(wf.out_of_sample.total_trades, out.total_trades);
    EXPECT_DOUBLE_EQ(wf.out_of_sample.win_rate, out.win_rate);
    ASSERT_FALSE(wf.out_of_sample.trades.empty());
    EXPECT_GE(wf.out_of_sample.trades.front().entry_time, candles[510].time);
    // three out-of-sample trades are not enough to call it robust
    EXPECT_LT(wf.out_of_sample.total_trades, kRobustMinTrades);
    EXPECT_FALSE(wf.robust);
}

TEST(WalkForwardTest, RobustWhenWinRatesAgreeOnEnoughTrades) {
    auto candles = from_closes(fixtures::sine_wave(600, 100.0, 15.0), 1.0);
    BacktestOptions opts;
    opts.lookback_candles = 600;
    auto wf = walk_forward(candles, StrategyKind::EmaCrossover, opts);
    EXPECT_EQ(wf.split_index, 420u);
    EXPECT_GE(wf.out_of_sample.total_trades, kRobustMinTrades);
    EXPECT_LE(std::fabs(wf.in_sample.win_rate - wf.out_of_sample.win_rate), kRobustWinRateGap);
    EXPECT_TRUE(wf.robust);
}

TEST(WalkForwardTest, ShortSidesSkipSimulation) {
    auto candles = from_closes(fixtures::sine_wave(60));
    auto wf = walk_forward(candles, StrategyKind::MeanReversion);
    EXPECT_EQ(wf.split_index, 42u);
    EXPECT_EQ(wf.out_of_sample.total_trades, 0);
    EXPECT_FALSE(wf.robust);
}

TEST(WalkForwardTest, RejectsSplitOutsideUnitInterval) {
    auto candles = from_closes(fixtures::sine_wave(100));
    for (double split : {0.0, 1.0, -0.2, 1.5, std::nan("")}) {
        EXPECT_THROW(walk_forward(candles, StrategyKind::EmaCrossover, {}, split), std::invalid_argument);
    }
}

TEST(GridSearchTest, RanksPairsByExpectancy) {
    auto candles = from_closes(fixtures::sine_wave(300, 100.0, 15.0), 1.0);
    auto points = grid_search(candles, StrategyKind::EmaCrossover, {3.0, 8.0, 20.0}, {2.0, 4.0, 10.0});
    ASSERT_EQ(points.size(), 9u);
    EXPECT_DOUBLE_EQ(points.front().take_profit_pct, 3.0);
    EXPECT_DOUBLE_EQ(points.front().stop_loss_pct, 2.0);
    EXPECT_DOUBLE_EQ(points.back().take_profit_pct, 20.0);
    EXPECT_DOUBLE_EQ(points.back().stop_loss_pct, 10.0);
    for (size_t i = 1; i < points.size(); ++i) {
        EXPECT_GE(points[i - 1].result.expectancy, points[i].result.expectancy);
    }
    for (const auto& p : points) {
        EXPECT_GE(p.result.total_trades, kGridMinTrades);
        BacktestOptions opts;
        opts.take_profit_pct = p.take_profit_pct;
        opts.stop_loss_pct = p.stop_loss_pct;
        EXPECT_EQ(p.result.total_trades, run_backtest(candles, StrategyKind::EmaCrossover, opts).total_trades);
    }
}

TEST(GridSearchTest, DropsPairsWithFewTrades) {
    auto candles = from_closes(fixtures::sine_wave(300, 100.0, 15.0), 1.0);
    EXPECT_TRUE(grid_search(candles, StrategyKind::EmaCrossover, {3.0, 8.0}, {2.0}, {}, 15).empty());
    EXPECT_TRUE(grid_search(from_closes(fixtures::sine_wave(29)), StrategyKind::EmaCrossover, {3.0}, {2.0}).empty());
}

TEST(GridSearchTest, RejectsBadParameterLists) {
    auto candles = from_closes(fixtures::sine_wave(100));
    EXPECT_THROW(grid_search(candles, StrategyKind::EmaCrossover, {}, {5.0}), std::invalid_argument);
    EXPECT_THROW(grid_search(candles, StrategyKind::EmaCrossover, {10.0}, {100.0}), std::invalid_argument);
    EXPECT_THROW(grid_search(candles, StrategyKind::EmaCrossover, {-1.0}, {5.0}), std::invalid_argument);
}

TEST(CurrentSignalTest, HoldWithTooFewCandles) {
    auto candles = from_closes(fixtures::sine_wave(21));
    auto s = get_current_signal(StrategyKind::EmaCrossover, candles);
    EXPECT_EQ(s.direction, Direction::Hold);
    EXPECT_NE(s.reason.find("insufficient"), std::string::npos);
}

TEST(CurrentSignalTest, FreshSignalIsActionable) {
    auto candles = from_closes(fixtures::v_shape());
    auto signals = evaluate(StrategyKind::EmaCrossover, candles);
    ASSERT_EQ(signals.size(), 1u);
    size_t idx = 0;
    while (candles[idx].time != signals[0].timestamp) ++idx;

    // Signal lands exactly on index len - 4.
    std::vector<Candle> window(candles.begin(), candles.begin() + idx + 4);
    auto s = get_current_signal(StrategyKind::EmaCrossover, window);
    EXPECT_EQ(s.direction, Direction::Buy);
    EXPECT_EQ(s.timestamp, signals[0].timestamp);
    EXPECT_DOUBLE_EQ(s.price, signals[0].price);
    EXPECT_EQ(s.reason, signals[0].reason);
}

TEST(CurrentSignalTest, OldSignalIsStale) {
    auto candles = from_closes(fixtures::v_shape());
    auto signals = evaluate(StrategyKind::EmaCrossover, candles);
    ASSERT_EQ(signals.size(), 1u);
    size_t idx = 0;
    while (candles[idx].time != signals[0].timestamp) ++idx;

    std::vector<Candle> window(candles.begin(), candles.begin() + idx + 5);
    auto s = get_current_signal(StrategyKind::EmaCrossover, window);
    EXPECT_EQ(s.direction, Direction::Hold);
    EXPECT_EQ(s.reason, "stale signal");
}

TEST(CurrentSignalTest, NoSignalIsHold) {
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) closes.push_back(1.0 + 0.1 * i);
    auto s = get_current_signal(StrategyKind::EmaCrossover, from_closes(closes));
    EXPECT_EQ(s.direction, Direction::Hold);
    EXPECT_EQ(s.reason, "no signal");
    EXPECT_DOUBLE_EQ(s.price, closes.back());
}

TEST(ConsensusTest, StrictMajorityWins) {
    auto c = get_consensus({vote(Direction::Buy), vote(Direction::Buy), vote(Direction::Sell), vote(Direction::Hold)});
    EXPECT_EQ(c.direction, Direction::Buy);
    EXPECT_EQ(c.buy_votes, 2);
    EXPECT_EQ(c.sell_votes, 1);
    EXPECT_EQ(c.hold_votes, 1);

    EXPECT_EQ(get_consensus({vote(Direction::Sell), vote(Direction::Sell), vote(Direction::Hold)}).direction,
              Direction::Sell);
}

TEST(ConsensusTest, TiesDefaultToHold) {
    EXPECT_EQ(get_consensus({}).direction, Direction::Hold);
    EXPECT_EQ(get_consensus({vote(Direction::Buy), vote(Direction::Sell)}).direction, Direction::Hold);
    EXPECT_EQ(get_consensus({vote(Direction::Buy), vote(Direction::Hold)}).direction, Direction::Hold);
    EXPECT_EQ(get_consensus({vote(Direction::Buy), vote(Direction::Buy),
                             vote(Direction::Sell), vote(Direction::Sell)}).direction,
              Direction::Hold);
    EXPECT_EQ(get_consensus({vote(Direction::Hold), vote(Direction::Hold), vote(Direction::Buy)}).direction,
              Direction::Hold);
}

TEST(ConsensusTest, CurrentSignalsCoverEveryStrategy) {
    auto candles = from_closes(fixtures::sine_wave(100), 0.5);
    auto signals = current_signals(candles);
    ASSERT_EQ(signals.size(), all_strategies().size());
    for (size_t i = 0; i < signals.size(); ++i) {
        EXPECT_EQ(signals[i].strategy_name, strategy_label(all_strategies()[i]));
    }
    auto c = get_consensus(signals);
    EXPECT_EQ(c.buy_votes + c.sell_votes + c.hold_votes, 4);
}
