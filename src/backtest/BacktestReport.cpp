#include "backtest/BacktestReport.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>

namespace crosstrade {
namespace backtest {

nlohmann::json BacktestReport::statsToJson(const analytics::PerformanceStats& stats) {
    nlohmann::json j;
    j["initialBalance"] = stats.initial_balance;
    j["finalBalance"] = stats.final_balance;
    j["totalReturn"] = stats.total_return;
    j["totalReturnPercent"] = stats.total_return_percent;
    j["totalTrades"] = stats.total_trades;
    j["winningTrades"] = stats.winning_trades;
    j["losingTrades"] = stats.losing_trades;
    j["winRate"] = stats.win_rate;
    j["grossProfit"] = stats.gross_profit;
    j["grossLoss"] = stats.gross_loss;
    j["averageProfit"] = stats.average_profit;
    j["averageLoss"] = stats.average_loss;
    j["profitFactor"] = stats.profit_factor;
    j["maxDrawdownPercent"] = stats.max_drawdown_percent;
    j["sharpeRatio"] = stats.sharpe_ratio;
    j["durationDays"] = stats.duration_days;
    return j;
}

nlohmann::json BacktestReport::tradeToJson(const risk::Trade& trade) {
    nlohmann::json j;
    j["symbol"] = trade.symbol;
    j["direction"] = toString(trade.direction);
    j["entryTimestamp"] = trade.entry_timestamp;
    j["entryPrice"] = trade.entry_price;
    j["quantity"] = trade.quantity;
    j["stopLoss"] = trade.stop_loss;
    j["takeProfit"] = trade.take_profit;
    j["exitTimestamp"] = trade.exit_timestamp;
    j["exitPrice"] = trade.exit_price;
    j["exitReason"] = toString(trade.exit_reason);
    j["profitLoss"] = trade.profit_loss;
    j["profitLossPct"] = trade.profit_loss_pct;
    j["feePaid"] = trade.fee_paid;
    return j;
}

nlohmann::json BacktestReport::toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["symbol"] = result.symbol;
    j["timeframe"] = toString(result.timeframe);
    j["startMs"] = result.start_ms;
    j["endMs"] = result.end_ms;
    j["stats"] = statsToJson(result.stats);

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(tradeToJson(trade));
    }

    j["equityCurve"] = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        j["equityCurve"].push_back({{"timestamp", point.timestamp}, {"balance", point.balance}});
    }

    j["barsProcessed"] = result.bars_processed;
    j["signalsGenerated"] = result.signals_generated;
    j["rejections"] = {
        {"lowConfidence", result.rejections.low_confidence},
        {"cooldown", result.rejections.cooldown},
        {"positionAlreadyOpen", result.rejections.position_already_open},
        {"noPositionToExit", result.rejections.no_position_to_exit},
        {"insufficientBalance", result.rejections.insufficient_balance},
        {"total", result.rejections.total()}
    };
    return j;
}

void BacktestReport::writeJson(const BacktestResult& result, const std::string& path) {
    const std::filesystem::path out_path(path);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out_path.parent_path(), ec);
    }

    std::ofstream out(out_path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw EngineError("cannot open result file: " + path);
    }
    out << toJson(result).dump(2) << '\n';
    if (!out) {
        throw EngineError("failed writing result file: " + path);
    }
    LOG_INFO("Backtest result written: {}", path);
}

} // namespace backtest
} // namespace crosstrade
