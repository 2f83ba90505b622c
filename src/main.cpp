#include <pistache/endpoint.h>
#include <pistache/router.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "../include/stratbt/backtest.hpp"
#include "../include/stratbt/indicators.hpp"
#include "../include/stratbt/json_io.hpp"
#include "../include/stratbt/strategy.hpp"

using namespace Pistache;
using namespace stratbt;

class BacktestHandler {
public:
    void handleHealth(const Rest::Request&, Http::ResponseWriter response) {
        sendJson(response, Http::Code::Ok, json{{"status", "healthy"}, {"service", "stratbt"}});
    }

    void handleStrategies(const Rest::Request&, Http::ResponseWriter response) {
        json list = json::array();
        for (auto kind : all_strategies()) {
            list.push_back({{"key", strategy_key(kind)}, {"label", strategy_label(kind)}});
        }
        sendJson(response, Http::Code::Ok, list);
    }

    void handleBacktest(const Rest::Request& request, Http::ResponseWriter response) {
        serve(response, "backtest", [&]() {
            auto data = json::parse(request.body());
            auto strategy = parse_strategy(data.value("strategy", std::string("ema_crossover")));
            auto opts = options_from_json(data);
            auto candles = candles_from_json(data.at("candles"));

            CandleSource source = [&candles](const std::string&, int) { return candles; };
            auto result = run_backtest(source, strategy, opts);
            std::cout << "[backtest] " << result.strategy_name << " on " << candles.size()
                      << " candles -> " << result.total_trades << " trades" << std::endl;

            json body = result;
            if (data.contains("walk_forward")) {
                const auto& wf = data.at("walk_forward");
                double split = wf.is_object() ? wf.value("split", kWalkForwardSplit) : kWalkForwardSplit;
                if (wf.is_object() || wf.get<bool>()) {
                    auto verdict = walk_forward(candles, strategy, opts, split);
                    std::cout << "[backtest] walk-forward split at " << verdict.split_index
                              << (verdict.robust ? " is robust" : " is not robust") << std::endl;
                    body["walk_forward"] = verdict;
                }
            }
            if (data.contains("grid")) {
                const auto& grid = data.at("grid");
                auto points = grid_search(candles, strategy,
                                          grid.at("take_profit_pct").get<std::vector<double>>(),
                                          grid.at("stop_loss_pct").get<std::vector<double>>(),
                                          opts, grid.value("min_trades", kGridMinTrades));
                std::cout << "[backtest] grid kept " << points.size() << " parameter pairs" << std::endl;
                body["grid"] = points;
            }
            return body;
        });
    }

    void handleBacktestAll(const Rest::Request& request, Http::ResponseWriter response) {
        serve(response, "backtest/all", [&]() {
            auto data = json::parse(request.body());
            auto opts = options_from_json(data);
            auto candles = candles_from_json(data.at("candles"));
            auto results = run_all_backtests(candles, opts, strategiesFrom(data));
            std::cout << "[backtest] sweep of " << results.size() << " strategies on "
                      << candles.size() << " candles" << std::endl;
            return json(results);
        });
    }

    void handleSignal(const Rest::Request& request, Http::ResponseWriter response) {
        serve(response, "signal", [&]() {
            auto data = json::parse(request.body());
            auto strategy = parse_strategy(data.at("strategy").get<std::string>());
            auto candles = candles_from_json(data.at("candles"));
            return json(get_current_signal(strategy, candles));
        });
    }

    void handleConsensus(const Rest::Request& request, Http::ResponseWriter response) {
        serve(response, "consensus", [&]() {
            auto data = json::parse(request.body());
            auto candles = candles_from_json(data.at("candles"));
            auto signals = current_signals(candles, strategiesFrom(data));
            return json{{"signals", signals}, {"consensus", get_consensus(signals)}};
        });
    }

    void handleIndicators(const Rest::Request& request, Http::ResponseWriter response) {
        serve(response, "indicators", [&]() {
            auto data = json::parse(request.body());
            auto candles = candles_from_json(data.at("candles"));
            std::vector<double> closes;
            for (const auto& c : candles) closes.push_back(c.close);

            auto bands = bollinger_bands(closes, data.value("bb_period", 20), data.value("bb_std_dev", 2.0));
            return json{
                {"ema", series_to_json(ema(closes, data.value("ema_period", 21)))},
                {"rsi", series_to_json(rsi(closes, data.value("rsi_period", 14)))},
                {"bollinger", {
                    {"upper", series_to_json(bands.upper)},
                    {"middle", series_to_json(bands.middle)},
                    {"lower", series_to_json(bands.lower)}
                }}
            };
        });
    }

private:
    static void sendJson(Http::ResponseWriter& response, Http::Code code, const json& body) {
        response.headers().add<Http::Header::ContentType>(MIME(Application, Json));
        response.send(code, body.dump(2));
    }

    static std::vector<StrategyKind> strategiesFrom(const json& data) {
        if (!data.contains("strategies")) return all_strategies();
        std::vector<StrategyKind> kinds;
        for (const auto& name : data.at("strategies")) {
            kinds.push_back(parse_strategy(name.get<std::string>()));
        }
        return kinds;
    }

    template <typename Fn>
    static void serve(Http::ResponseWriter& response, const char* route, Fn&& fn) {
        try {
            sendJson(response, Http::Code::Ok, fn());
        } catch (const std::exception& e) {
            std::cerr << "[server] /" << route << " failed: " << e.what() << std::endl;
            sendJson(response, Http::Code::Bad_Request, json{{"error", true}, {"message", e.what()}});
        }
    }
};

int main(int argc, char* argv[]) {
    int port = 9080;
    int threads = 4;
    try {
        if (argc > 1) port = std::stoi(argv[1]);
        if (argc > 2) threads = std::stoi(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[server] bad argument: " << e.what() << "\nusage: stratbt_server [port] [threads]" << std::endl;
        return 1;
    }

    Address addr(Ipv4::any(), Port(static_cast<uint16_t>(port)));
    auto opts = Http::Endpoint::options()
        .threads(threads)
        .flags(Tcp::Options::InstallSignalHandler);
    Http::Endpoint server(addr);
    server.init(opts);

    Rest::Router router;
    BacktestHandler handler;
    Rest::Routes::Get(router, "/health", Rest::Routes::bind(&BacktestHandler::handleHealth, &handler));
    Rest::Routes::Get(router, "/strategies", Rest::Routes::bind(&BacktestHandler::handleStrategies, &handler));
    Rest::Routes::Post(router, "/backtest", Rest::Routes::bind(&BacktestHandler::handleBacktest, &handler));
    Rest::Routes::Post(router, "/backtest/all", Rest::Routes::bind(&BacktestHandler::handleBacktestAll, &handler));
    Rest::Routes::Post(router, "/signal", Rest::Routes::bind(&BacktestHandler::handleSignal, &handler));
    Rest::Routes::Post(router, "/consensus", Rest::Routes::bind(&BacktestHandler::handleConsensus, &handler));
    Rest::Routes::Post(router, "/indicators", Rest::Routes::bind(&BacktestHandler::handleIndicators, &handler));

    server.setHandler(router.handler());
    std::cout << "[server] stratbt API listening on port " << port << " with " << threads << " threads" << std::endl;
    server.serve();
    return 0;
}
