#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace crosstrade {

namespace {
engine::TradingMode parseMode(const std::string& mode_str) {
    if (mode_str == "LIVE") return engine::TradingMode::LIVE;
    if (mode_str == "PAPER") return engine::TradingMode::PAPER;
    if (mode_str == "BACKTEST") return engine::TradingMode::BACKTEST;
    throw InvalidConfigError("unknown engine mode: " + mode_str);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_directory_ = "logs";
    log_level_ = "info";
    engine_config_ = engine::EngineConfig();
    strategy_config_ = strategy::StrategyConfig();
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigError("config parse error in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: " << engine_config_.symbol
              << " " << toString(engine_config_.timeframe)
              << ", EMA " << strategy_config_.ema_short_period << "/" << strategy_config_.ema_long_period
              << ", RSI " << strategy_config_.rsi_period << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    // Parse into copies so a bad document leaves the current state untouched.
    engine::EngineConfig engine_cfg = engine_config_;
    strategy::StrategyConfig strategy_cfg = strategy_config_;
    std::string log_dir = log_directory_;
    std::string log_level = log_level_;

    try {
        if (j.contains("strategy")) {
            const auto& s = j.at("strategy");
            strategy_cfg.ema_short_period = s.value("ema_short_period", strategy_cfg.ema_short_period);
            strategy_cfg.ema_long_period = s.value("ema_long_period", strategy_cfg.ema_long_period);
            strategy_cfg.rsi_period = s.value("rsi_period", strategy_cfg.rsi_period);
            strategy_cfg.rsi_overbought = s.value("rsi_overbought", strategy_cfg.rsi_overbought);
            strategy_cfg.rsi_oversold = s.value("rsi_oversold", strategy_cfg.rsi_oversold);
            strategy_cfg.min_confidence = s.value("min_confidence", strategy_cfg.min_confidence);
            strategy_cfg.trade_amount_percent = s.value("trade_amount_percent", strategy_cfg.trade_amount_percent);
            strategy_cfg.stop_loss_percent = s.value("stop_loss_percent", strategy_cfg.stop_loss_percent);
            strategy_cfg.take_profit_percent = s.value("take_profit_percent", strategy_cfg.take_profit_percent);
            strategy_cfg.min_time_between_trades =
                s.value("min_time_between_trades", strategy_cfg.min_time_between_trades);

            if (s.contains("max_trade_amount") && !s.at("max_trade_amount").is_null()) {
                strategy_cfg.max_trade_amount = s.at("max_trade_amount").get<double>();
            }
        }

        if (j.contains("backtest")) {
            const auto& b = j.at("backtest");
            engine_cfg.mode = parseMode(b.value("mode", std::string("BACKTEST")));
            engine_cfg.symbol = b.value("symbol", engine_cfg.symbol);
            engine_cfg.timeframe = parseTimeframe(b.value("timeframe", toString(engine_cfg.timeframe)));
            engine_cfg.initial_balance = b.value("initial_balance", engine_cfg.initial_balance);
            engine_cfg.fee_rate = b.value("fee_rate", engine_cfg.fee_rate);
            engine_cfg.start_ms = b.value("start_ms", engine_cfg.start_ms);
            engine_cfg.end_ms = b.value("end_ms", engine_cfg.end_ms);
        }

        if (j.contains("data")) {
            const auto& d = j.at("data");
            engine_cfg.data_path = d.value("path", engine_cfg.data_path);
            engine_cfg.journal_path = d.value("journal_path", engine_cfg.journal_path);
        }

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            log_dir = l.value("directory", log_dir);
            log_level = l.value("level", log_level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigError(std::string("config field error: ") + e.what());
    }

    strategy_cfg.timeframe = engine_cfg.timeframe;
    strategy_cfg.validate();

    if (engine_cfg.initial_balance <= 0.0) {
        throw InvalidConfigError("initial_balance must be positive");
    }
    if (engine_cfg.fee_rate < 0.0 || engine_cfg.fee_rate >= 1.0) {
        throw InvalidConfigError("fee_rate must be within [0, 1)");
    }

    engine_config_ = engine_cfg;
    strategy_config_ = strategy_cfg;
    log_directory_ = log_dir;
    log_level_ = log_level;
}

} // namespace crosstrade
