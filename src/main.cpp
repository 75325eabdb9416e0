#include "backtest/BacktestEngine.h"
#include "backtest/BacktestReport.h"
#include "backtest/DataHistory.h"
#include "backtest/MarketDataProviders.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/LiveSession.h"
#include "execution/PaperExecutionAdapter.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace crosstrade;

// Raised by Ctrl+C; the backtest stops before its next bar
static std::atomic<bool> g_cancel{false};

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_cancel.store(true);
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::optional<std::string> data_path;
    std::optional<std::string> symbol;
    std::optional<std::string> timeframe;
    std::optional<long long> start_ms;
    std::optional<long long> end_ms;
    std::optional<double> balance;
    std::string out_path;
    bool help = false;
};

static void printUsage() {
    std::cout
        << "Usage: crosstrade [options]\n"
        << "  --config <file>      JSON config (default config/config.json)\n"
        << "  --data <file>        CSV/JSON bar file, overrides data.path\n"
        << "  --symbol <S>         e.g. BTC/USDT\n"
        << "  --timeframe <TF>     1m 5m 15m 30m 1h 4h 1d\n"
        << "  --start <ms>         range start, epoch ms\n"
        << "  --end <ms>           range end, epoch ms\n"
        << "  --balance <X>        initial balance\n"
        << "  --out <file>         write the result as JSON\n";
}

static long long parseLong(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        const long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw InvalidConfigError(flag + " expects an integer, got '" + value + "'");
    }
}

static double parseDouble(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        const double parsed = std::stod(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw InvalidConfigError(flag + " expects a number, got '" + value + "'");
    }
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw InvalidConfigError("missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config") opts.config_path = value;
        else if (arg == "--data") opts.data_path = value;
        else if (arg == "--symbol") opts.symbol = value;
        else if (arg == "--timeframe") opts.timeframe = value;
        else if (arg == "--start") opts.start_ms = parseLong(arg, value);
        else if (arg == "--end") opts.end_ms = parseLong(arg, value);
        else if (arg == "--balance") opts.balance = parseDouble(arg, value);
        else if (arg == "--out") opts.out_path = value;
        else throw InvalidConfigError("unknown option: " + arg);
    }
    return opts;
}

static void printSummary(const backtest::BacktestResult& result) {
    const auto& s = result.stats;
    std::cout << std::fixed << std::setprecision(2)
              << "\n========== Backtest: " << result.symbol << " " << toString(result.timeframe) << " ==========\n"
              << "Bars processed   : " << result.bars_processed << "\n"
              << "Signals          : " << result.signals_generated
              << " (rejected " << result.rejections.total() << ")\n"
              << "Initial balance  : " << s.initial_balance << "\n"
              << "Final balance    : " << s.final_balance << "\n"
              << "Total return     : " << s.total_return_percent << "%\n"
              << "Trades           : " << s.total_trades
              << " (W " << s.winning_trades << " / L " << s.losing_trades << ")\n"
              << "Win rate         : " << s.win_rate * 100.0 << "%\n"
              << "Profit factor    : " << s.profit_factor << "\n"
              << "Max drawdown     : " << s.max_drawdown_percent << "%\n"
              << std::setprecision(3)
              << "Sharpe ratio     : " << s.sharpe_ratio << "\n"
              << "================================================\n";
}

static int runBacktest(const engine::EngineConfig& cfg, const strategy::StrategyConfig& strategy_cfg,
                       const std::string& out_path) {
    backtest::FileMarketDataProvider provider(cfg.symbol, cfg.data_path);

    backtest::BacktestRequest request;
    request.symbol = cfg.symbol;
    request.timeframe = cfg.timeframe;
    request.start_ms = cfg.start_ms;
    request.end_ms = cfg.end_ms;
    request.initial_balance = cfg.initial_balance;
    request.strategy_config = strategy_cfg;
    request.fee_rate = cfg.fee_rate;

    const backtest::BacktestEngine engine{};
    const auto result = engine.run(request, provider, &g_cancel);
    printSummary(result);

    if (!out_path.empty()) {
        backtest::BacktestReport::writeJson(result, out_path);
    }
    return 0;
}

// Replays the bar file through a live session against a simulated account
static int runPaper(const engine::EngineConfig& cfg, const strategy::StrategyConfig& strategy_cfg) {
    backtest::FileMarketDataProvider provider(cfg.symbol, cfg.data_path);
    const auto bars = provider.getBars(cfg.symbol, cfg.timeframe, cfg.start_ms, cfg.end_ms);

    execution::PaperExecutionAdapter account(cfg.symbol, cfg.initial_balance, cfg.fee_rate);
    core::EventJournalJsonl journal(utils::PathUtils::resolveRelativePath(cfg.journal_path));
    engine::LiveSession session(cfg, strategy_cfg, account, &journal);

    int failed_orders = 0;
    for (const auto& bar : bars) {
        if (g_cancel.load()) {
            throw CancelledError("paper session interrupted");
        }
        const auto outcome = session.onBar(bar);
        if (!outcome.ok()) {
            ++failed_orders;
        }
    }

    const double last_close = bars.empty() ? 0.0 : bars.back().close;
    std::cout << std::fixed << std::setprecision(2)
              << "\n========== Paper session: " << cfg.symbol << " ==========\n"
              << "Bars          : " << session.barsProcessed() << "\n"
              << "Closed trades : " << session.trades().size() << "\n"
              << "Failed orders : " << failed_orders << "\n"
              << "Open position : " << (session.inPosition() ? "yes" : "no") << "\n"
              << "Equity        : " << session.equity(last_close) << "\n";
    for (const auto& [asset, amount] : account.getBalance()) {
        std::cout << "  " << asset << ": " << std::setprecision(8) << amount << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);

    try {
        const CliOptions opts = parseArgs(argc, argv);
        if (opts.help) {
            printUsage();
            return 0;
        }

        Config& config = Config::getInstance();
        config.load(opts.config_path);
        Logger::getInstance().initialize(config.getLogDirectory(), config.getLogLevel());

        engine::EngineConfig cfg = config.getEngineConfig();
        strategy::StrategyConfig strategy_cfg = config.getStrategyConfig();

        if (opts.data_path) cfg.data_path = *opts.data_path;
        if (opts.symbol) cfg.symbol = *opts.symbol;
        if (opts.timeframe) cfg.timeframe = parseTimeframe(*opts.timeframe);
        if (opts.start_ms) cfg.start_ms = *opts.start_ms;
        if (opts.end_ms) cfg.end_ms = *opts.end_ms;
        if (opts.balance) cfg.initial_balance = *opts.balance;
        strategy_cfg.timeframe = cfg.timeframe;

        if (cfg.data_path.empty()) {
            throw InvalidConfigError("no bar data: set data.path or pass --data");
        }
        cfg.data_path = utils::PathUtils::resolveRelativePath(cfg.data_path).string();

        // Open ended range: take everything the file has
        if (cfg.end_ms <= 0) {
            const auto all_bars = backtest::DataHistory::load(cfg.data_path);
            if (all_bars.empty()) {
                throw DataUnavailableError("no bars in " + cfg.data_path);
            }
            if (cfg.start_ms <= 0) cfg.start_ms = all_bars.front().timestamp;
            cfg.end_ms = all_bars.back().timestamp;
        }

        int exit_code = 0;
        switch (cfg.mode) {
            case engine::TradingMode::BACKTEST:
                exit_code = runBacktest(cfg, strategy_cfg, opts.out_path);
                break;
            case engine::TradingMode::PAPER:
                exit_code = runPaper(cfg, strategy_cfg);
                break;
            case engine::TradingMode::LIVE:
                throw InvalidConfigError("LIVE mode needs an exchange execution adapter; none is built in");
        }
        Logger::getInstance().shutdown();
        return exit_code;
    } catch (const EngineError& e) {
        LOG_ERROR("Fatal: {}", e.what());
        Logger::getInstance().shutdown();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected failure: {}", e.what());
        Logger::getInstance().shutdown();
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 2;
    }
}
