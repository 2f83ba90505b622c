#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../include/stratbt/backtest.hpp"
#include "../include/stratbt/json_io.hpp"
#include "../include/stratbt/strategy.hpp"
#include "../include/stratbt/utils.hpp"

using namespace stratbt;

namespace {

struct CliArgs {
    std::string candles_path;
    std::string config_path;
    std::string strategy = "all";
    std::string trades_csv;
    std::string report_path;
    bool signal_only = false;
    bool walk_forward = false;
    double split = kWalkForwardSplit;
    std::vector<double> grid_tp;
    std::vector<double> grid_sl;
};

void usage() {
    std::cerr << "usage: stratbt_cli --candles <file.json> [--config <file.json>]\n"
                 "                   [--strategy <key|all>] [--signal] [--trades-csv <file>]\n"
                 "                   [--walk-forward] [--split <0..1>] [--grid-tp <a,b,..> --grid-sl <a,b,..>]\n"
                 "                   [--report <file>]\n";
}

double parse_number(const std::string& flag, const std::string& text) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    return v;
}

std::vector<double> parse_list(const std::string& flag, const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        values.push_back(parse_number(flag, item));
    }
    if (values.empty()) throw std::invalid_argument(flag + " needs at least one value");
    return values;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };
        if (a == "--candles") args.candles_path = next();
        else if (a == "--config") args.config_path = next();
        else if (a == "--strategy") args.strategy = next();
        else if (a == "--trades-csv") args.trades_csv = next();
        else if (a == "--report") args.report_path = next();
        else if (a == "--signal") args.signal_only = true;
        else if (a == "--walk-forward") args.walk_forward = true;
        else if (a == "--split") args.split = parse_number(a, next());
        else if (a == "--grid-tp") args.grid_tp = parse_list(a, next());
        else if (a == "--grid-sl") args.grid_sl = parse_list(a, next());
        else throw std::invalid_argument("unknown argument " + a);
    }
    if (args.candles_path.empty()) {
        throw std::invalid_argument("--candles is required");
    }
    if (args.grid_tp.empty() != args.grid_sl.empty()) {
        throw std::invalid_argument("--grid-tp and --grid-sl go together");
    }
    return args;
}

std::vector<StrategyKind> selected(const std::string& name) {
    if (name == "all") return all_strategies();
    return {parse_strategy(name)};
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto args = parse_args(argc, argv);
        BacktestOptions opts = args.config_path.empty() ? BacktestOptions{} : load_options(args.config_path);
        validate(opts);
        auto kinds = selected(args.strategy);
        if (!args.trades_csv.empty() && kinds.size() != 1) {
            throw std::invalid_argument("--trades-csv needs a single --strategy");
        }

        auto candles = load_candles(args.candles_path);
        std::cerr << "[stratbt] loaded " << candles.size() << " candles from " << args.candles_path;
        if (!candles.empty()) {
            std::cerr << " (" << epoch_to_utc_iso(candles.front().time) << " .. "
                      << epoch_to_utc_iso(candles.back().time) << ")";
        }
        std::cerr << std::endl;

        if (args.signal_only) {
            auto signals = current_signals(candles, kinds);
            std::cout << json{{"signals", signals}, {"consensus", get_consensus(signals)}}.dump(2) << std::endl;
            return 0;
        }

        auto results = run_all_backtests(candles, opts, kinds);
        for (const auto& r : results) {
            std::cerr << "[stratbt] " << r.strategy_name << ": " << r.total_trades << " trades, win rate "
                      << r.win_rate << "%, sharpe " << r.sharpe_ratio << std::endl;
        }
        if (candles.size() < kMinBacktestCandles) {
            std::cerr << "[stratbt] fewer than " << kMinBacktestCandles << " candles, nothing simulated" << std::endl;
        }

        if (!args.trades_csv.empty()) {
            std::ofstream out(args.trades_csv);
            if (!out) throw std::runtime_error("Cannot write " + args.trades_csv);
            out << trades_to_csv(results.front().trades);
        }
        if (!args.report_path.empty()) {
            std::ofstream out(args.report_path);
            if (!out) throw std::runtime_error("Cannot write " + args.report_path);
            out << results_report(results);
        }

        json output{{"options", opts}, {"results", results}};
        if (args.walk_forward) {
            json verdicts = json::array();
            for (auto kind : kinds) {
                auto wf = walk_forward(candles, kind, opts, args.split);
                std::cerr << "[stratbt] " << strategy_label(kind) << ": walk-forward win rate "
                          << wf.in_sample.win_rate << "% in sample, " << wf.out_of_sample.win_rate
                          << "% out of sample" << (wf.robust ? ", robust" : "") << std::endl;
                verdicts.push_back(json(wf));
            }
            output["walk_forward"] = verdicts;
        }
        if (!args.grid_tp.empty()) {
            json grids = json::array();
            for (auto kind : kinds) {
                auto points = grid_search(candles, kind, args.grid_tp, args.grid_sl, opts);
                grids.push_back(json{{"strategy", strategy_key(kind)}, {"points", points}});
            }
            output["grid"] = grids;
        }

        std::cout << output.dump(2) << std::endl;
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[stratbt] error: " << e.what() << std::endl;
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[stratbt] error: " << e.what() << std::endl;
        return 1;
    }
}
