#include "analytics/PayoffEngine.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "scoring/StrategyCatalog.h"
#include "scoring/StrategyScorer.h"
#include "validation/StrategyValidator.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace stratlab;

namespace {
void printUsage() {
    std::cerr << "Usage:\n"
              << "  StratLabReport validate <strategy.json> [--live]\n"
              << "  StratLabReport payoff <request.json>\n"
              << "  StratLabReport suggest <snapshot.json>\n"
              << "Options:\n"
              << "  --config <path>   config file (default config/config.json)\n";
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    nlohmann::json j;
    in >> j;
    return j;
}

std::optional<double> optNumber(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

// {symbol, underlyingPrice, legs: [{type, side, qty, strike?, theoreticalPrice}]}
std::vector<analytics::PricedLeg> parseLegs(const nlohmann::json& legs) {
    std::vector<analytics::PricedLeg> out;
    for (const auto& j : legs) {
        analytics::PricedLeg leg;
        const std::string type = j.value("type", std::string());
        const std::string side = j.value("side", std::string());
        auto parsed_type = legTypeFromString(type);
        auto parsed_side = legSideFromString(side);
        if (!parsed_type || !parsed_side) {
            throw ContractViolation("leg has invalid type/side: " + type + "/" + side);
        }
        leg.type = *parsed_type;
        leg.side = *parsed_side;
        leg.qty = j.value("qty", 1.0);
        leg.strike = optNumber(j, "strike");
        leg.expiration = j.value("expiration", std::string());
        leg.entry_price = j.value("theoreticalPrice", 0.0);
        out.push_back(leg);
    }
    return out;
}

scoring::MarketSnapshot parseSnapshot(const nlohmann::json& j) {
    scoring::MarketSnapshot s;
    s.symbol = j.value("symbol", std::string());
    s.current_price = j.value("currentPrice", 0.0);
    s.as_of = j.contains("asOfMs") ? fromEpochMs(j["asOfMs"].get<long long>())
                                   : std::chrono::system_clock::now();
    if (j.contains("earningsDateMs") && j["earningsDateMs"].is_number()) {
        s.earnings_date = fromEpochMs(j["earningsDateMs"].get<long long>());
    }

    if (j.contains("technicals")) {
        const auto& t = j["technicals"];
        s.technicals.sma20 = optNumber(t, "sma20");
        s.technicals.sma50 = optNumber(t, "sma50");
        s.technicals.sma200 = optNumber(t, "sma200");
        s.technicals.rsi = optNumber(t, "rsi");
        s.technicals.iv_percentile = optNumber(t, "iv_percentile");
        s.technicals.hv_20 = optNumber(t, "hv_20");
    }
    if (j.contains("optionsChain")) {
        const auto& o = j["optionsChain"];
        s.options.atm_call_oi = optNumber(o, "atmCallOI");
        s.options.atm_put_oi = optNumber(o, "atmPutOI");
        s.options.avg_spread = optNumber(o, "avgSpread");
        s.options.avg_call_iv = optNumber(o, "avgCallIV");
        s.options.avg_put_iv = optNumber(o, "avgPutIV");
    }
    return s;
}

int runValidate(const std::string& path, bool live) {
    const auto doc = readJsonFile(path);

    validation::AccountContext context;
    context.trading_mode = live ? TradingMode::LIVE : TradingMode::PAPER;
    context.as_of = std::chrono::system_clock::now();

    validation::StrategyValidator validator(Config::getInstance().getValidatorConfig());
    const auto result = validator.validate(doc, context);

    std::cout << validation::toJson(result).dump(2) << "\n";
    LOG_INFO("Validated {}: {} ({} errors, {} warnings)", path, result.valid ? "valid" : "invalid",
             result.errors.size(), result.warnings.size());
    return result.valid ? 0 : 2;
}

int runPayoff(const std::string& path) {
    const auto request = readJsonFile(path);
    const std::string symbol = request.value("symbol", std::string());
    const double price = request.value("underlyingPrice", 0.0);
    const auto legs = parseLegs(request.value("legs", nlohmann::json::array()));

    analytics::PayoffEngine engine(Config::getInstance().getPayoffConfig());
    const auto payoff = engine.computeTheoretical(symbol, price, legs);
    std::cout << analytics::toJson(payoff).dump(2) << "\n";
    return 0;
}

int runSuggest(const std::string& path) {
    const auto snapshot = parseSnapshot(readJsonFile(path));

    scoring::StrategyScorer scorer(Config::getInstance().getScorerConfig());
    const auto report = scorer.rank(scoring::StrategyCatalog::seedTemplates(), snapshot);
    std::cout << scoring::toJson(report).dump(2) << "\n";
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    const std::string input = argv[2];
    std::string config_path = "config/config.json";
    bool live = false;

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--live") {
            live = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    try {
        auto& cfg = Config::getInstance();
        cfg.load(config_path);
        Logger::getInstance().initialize(cfg.getLogDir(), cfg.getLogLevel());

        if (command == "validate") {
            return runValidate(input, live);
        }
        if (command == "payoff") {
            return runPayoff(input);
        }
        if (command == "suggest") {
            return runSuggest(input);
        }

        std::cerr << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    } catch (const ContractViolation& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Report failed: " << e.what() << "\n";
        return 1;
    }
}
