#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

// Simple manual test runner
int main() {
    using namespace crosstrade;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Defaults
    {
        const auto s = config.getStrategyConfig();
        assert(s.ema_short_period == 12);
        assert(s.ema_long_period == 26);
        assert(s.rsi_period == 14);
        assert(s.rsi_overbought == 70.0);
        assert(s.rsi_oversold == 30.0);
        assert(s.min_confidence == 60.0);
        assert(s.min_time_between_trades == 300);
        assert(!s.max_trade_amount.has_value());
        assert(config.getEngineConfig().initial_balance == 1000.0);
        assert(config.getEngineConfig().mode == engine::TradingMode::BACKTEST);
    }

    // 2. Missing file keeps defaults
    config.load("test_data/does_not_exist.json");
    assert(config.getStrategyConfig().ema_long_period == 26);

    // 3. File on disk
    std::filesystem::create_directories("test_data");
    const std::string path = "test_data/test_config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({
            "strategy": {"ema_short_period": 9, "ema_long_period": 21, "max_trade_amount": 250.0,
                         "min_time_between_trades": 600},
            "backtest": {"symbol": "ETH/USDT", "timeframe": "4h", "fee_rate": 0.001, "mode": "PAPER"},
            "data": {"path": "data/eth.csv"},
            "logging": {"level": "debug", "directory": "test_logs"}
        })";
    }
    config.load(path);

    const auto s = config.getStrategyConfig();
    const auto e = config.getEngineConfig();
    std::cout << "EMA: " << s.ema_short_period << "/" << s.ema_long_period << std::endl;
    assert(s.ema_short_period == 9);
    assert(s.ema_long_period == 21);
    assert(s.rsi_period == 14);
    assert(s.max_trade_amount && std::abs(*s.max_trade_amount - 250.0) < 1e-9);
    assert(s.min_time_between_trades == 600);
    assert(s.timeframe == Timeframe::H4);
    assert(e.symbol == "ETH/USDT");
    assert(e.timeframe == Timeframe::H4);
    assert(e.mode == engine::TradingMode::PAPER);
    assert(std::abs(e.fee_rate - 0.001) < 1e-12);
    assert(e.data_path == "data/eth.csv");
    assert(config.getLogLevel() == "debug");
    assert(config.getLogDirectory() == "test_logs");

    // 4. Invalid values are rejected and leave the loaded state untouched
    bool rejected = false;
    try {
        config.loadFromJson(nlohmann::json::parse(R"({"strategy": {"ema_short_period": 30, "ema_long_period": 20}})"));
    } catch (const InvalidConfigError& err) {
        std::cout << "Rejected: " << err.what() << std::endl;
        rejected = true;
    }
    assert(rejected);
    assert(config.getStrategyConfig().ema_short_period == 9);

    rejected = false;
    try {
        config.loadFromJson(nlohmann::json::parse(R"({"strategy": {"rsi_period": "fourteen"}})"));
    } catch (const InvalidConfigError&) {
        rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
        config.loadFromJson(nlohmann::json::parse(R"({"backtest": {"timeframe": "7m"}})"));
    } catch (const InvalidConfigError&) {
        rejected = true;
    }
    assert(rejected);

    rejected = false;
    try {
        config.loadFromJson(nlohmann::json::parse(R"({"backtest": {"initial_balance": -5}})"));
    } catch (const InvalidConfigError&) {
        rejected = true;
    }
    assert(rejected);

    // 5. Logger comes up from the loaded settings
    Logger::getInstance().initialize(config.getLogDirectory(), config.getLogLevel());
    assert(Logger::getInstance().isInitialized());
    LOG_INFO("config test logger online");
    Logger::getInstance().shutdown();
    assert(!Logger::getInstance().isInitialized());
    LOG_INFO("dropped while shut down");

    // 6. Trade ledger lines after a re-initialize
    {
        const auto log_dir = std::filesystem::absolute("test_data/trade_logs");
        std::filesystem::remove_all(log_dir);
        Logger::getInstance().initialize(log_dir.string(), "warn");
        assert(Logger::getInstance().isInitialized());
        Logger::getInstance().logTrade("BTC/USDT", "stop_loss", 100.0, 98.0, 0.5, -1.0);
        Logger::getInstance().shutdown();

        std::string ledger;
        for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
            if (entry.path().filename().string().rfind("trades", 0) != 0) continue;
            std::ifstream in(entry.path());
            std::getline(in, ledger);
        }
        assert(ledger == "BTC/USDT,stop_loss,100.00000000,98.00000000,0.50000000,-1.00");
        std::filesystem::remove_all(log_dir);
    }

    config.reset();
    std::filesystem::remove(path);

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
