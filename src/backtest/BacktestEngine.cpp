#include "backtest/BacktestEngine.h"
#include "analytics/IndicatorPipeline.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "strategy/SignalGenerator.h"

#include <algorithm>
#include <optional>

namespace crosstrade {
namespace backtest {

namespace {

struct ProtectiveExit {
    double price;
    ExitReason reason;
};

// Long position against one bar. Stop-loss is checked first (conservative
// when both levels sit inside the bar's range).
std::optional<ProtectiveExit> checkProtectiveLevels(const risk::Position& pos, const Bar& bar) {
    if (bar.low <= pos.stop_loss) {
        const double fill = (bar.open <= pos.stop_loss) ? bar.open : pos.stop_loss;
        return ProtectiveExit{fill, ExitReason::STOP_LOSS};
    }
    if (bar.high >= pos.take_profit) {
        const double fill = (bar.open >= pos.take_profit) ? bar.open : pos.take_profit;
        return ProtectiveExit{fill, ExitReason::TAKE_PROFIT};
    }
    return std::nullopt;
}

// Mutable state of a single replay. Lives on the stack of replay(); nothing
// escapes until the run completes.
class ReplaySession {
public:
    ReplaySession(const strategy::StrategyConfig& config,
                  double initial_balance,
                  double fee_rate,
                  std::string symbol)
        : config_(config)
        , fee_rate_(fee_rate)
        , symbol_(std::move(symbol))
        , cash_(initial_balance)
        , pipeline_(config)
        , generator_(config, symbol_)
        , state_(Flat{})
    {}

    void processBar(const Bar& bar) {
        const auto point = pipeline_.update(bar);

        bool exited_this_bar = false;
        if (auto* held = std::get_if<InPosition>(&state_)) {
            if (auto exit = checkProtectiveLevels(held->position, bar)) {
                closePosition(*held, bar.timestamp, exit->price, exit->reason);
                risk_manager_.noteTrade(bar.timestamp);
                exited_this_bar = true;
            }
        }

        if (point) {
            // The generator sees every point so its crossover memory stays aligned.
            auto signal = generator_.onIndicatorPoint(*point, bar.close);
            if (signal) {
                ++signals_generated_;
                if (!exited_this_bar) {
                    handleSignal(*signal, bar);
                }
            }
        }

        equity_curve_.push_back({bar.timestamp, markToMarket(bar.close)});
        ++bars_processed_;
    }

    void finish(const Bar& last_bar) {
        if (auto* held = std::get_if<InPosition>(&state_)) {
            closePosition(*held, last_bar.timestamp, last_bar.close, ExitReason::END_OF_DATA);
            // Exit fee is the only difference from the mark already recorded.
            if (!equity_curve_.empty()) {
                equity_curve_.back().balance = cash_;
            }
        }
    }

    BacktestResult takeResult(double initial_balance) {
        BacktestResult result;
        result.symbol = symbol_;
        result.timeframe = config_.timeframe;
        result.trades = std::move(trades_);
        result.equity_curve = std::move(equity_curve_);
        result.stats = analytics::PerformanceAnalyzer::analyze(
            initial_balance, result.equity_curve, result.trades, config_.timeframe);
        result.bars_processed = bars_processed_;
        result.signals_generated = signals_generated_;
        result.rejections = risk_manager_.rejectionStats();
        return result;
    }

private:
    void handleSignal(const strategy::Signal& signal, const Bar& bar) {
        auto* held = std::get_if<InPosition>(&state_);
        const risk::Position* open_position = held ? &held->position : nullptr;

        const auto decision = risk_manager_.evaluate(signal, config_, open_position, cash_);
        if (!decision) {
            return;
        }

        if (decision->action == risk::RiskAction::ENTER_LONG) {
            if (const auto* flat = std::get_if<Flat>(&state_)) {
                openPosition(*flat, *decision, signal);
            }
        } else if (held) {
            closePosition(*held, bar.timestamp, decision->price, ExitReason::SIGNAL);
        }
    }

    void openPosition(const Flat&, const risk::RiskDecision& decision, const strategy::Signal& signal) {
        // Leave room for the entry fee so cash never goes negative.
        const double notional = std::min(decision.notional, cash_ / (1.0 + fee_rate_));
        if (notional <= 0.0 || decision.price <= 0.0) {
            LOG_WARN("{} entry skipped: nothing to invest (cash {:.2f})", symbol_, cash_);
            return;
        }

        InPosition next;
        next.position.symbol = symbol_;
        next.position.open_timestamp = decision.timestamp;
        next.position.entry_price = decision.price;
        next.position.quantity = notional / decision.price;
        next.position.invested_amount = notional;
        next.position.direction = Direction::BUY;
        next.position.stop_loss = decision.stop_loss;
        next.position.take_profit = decision.take_profit;
        next.position.entry_fee = notional * fee_rate_;
        next.position.signal_confidence = signal.confidence();

        cash_ -= notional + next.position.entry_fee;
        LOG_DEBUG("{} OPEN qty {:.8f} @ {:.8f} (SL {:.8f}, TP {:.8f})", symbol_,
                  next.position.quantity, next.position.entry_price,
                  next.position.stop_loss, next.position.take_profit);
        state_ = std::move(next);
    }

    void closePosition(const InPosition& held, TimestampMs timestamp, double exit_price, ExitReason reason) {
        const risk::Position& pos = held.position;
        const double proceeds = pos.quantity * exit_price;
        const double exit_fee = proceeds * fee_rate_;

        risk::Trade trade;
        trade.symbol = pos.symbol;
        trade.entry_timestamp = pos.open_timestamp;
        trade.entry_price = pos.entry_price;
        trade.quantity = pos.quantity;
        trade.direction = pos.direction;
        trade.stop_loss = pos.stop_loss;
        trade.take_profit = pos.take_profit;
        trade.exit_timestamp = timestamp;
        trade.exit_price = exit_price;
        trade.exit_reason = reason;
        trade.fee_paid = pos.entry_fee + exit_fee;
        trade.profit_loss = proceeds - exit_fee - (pos.invested_amount + pos.entry_fee);
        trade.profit_loss_pct = (pos.invested_amount > 0.0)
            ? (trade.profit_loss / pos.invested_amount) * 100.0
            : 0.0;

        cash_ += proceeds - exit_fee;
        Logger::getInstance().logTrade(symbol_, toString(reason), pos.entry_price, exit_price,
                                       pos.quantity, trade.profit_loss);
        LOG_DEBUG("{} CLOSE {} @ {:.8f} pnl {:.2f} ({:.2f}%)", symbol_, toString(reason),
                  exit_price, trade.profit_loss, trade.profit_loss_pct);

        trades_.push_back(trade);
        state_ = Flat{};
    }

    double markToMarket(double close) const {
        if (const auto* held = std::get_if<InPosition>(&state_)) {
            return cash_ + held->position.quantity * close;
        }
        return cash_;
    }

    strategy::StrategyConfig config_;
    double fee_rate_;
    std::string symbol_;
    double cash_;

    analytics::IndicatorPipeline pipeline_;
    strategy::SignalGenerator generator_;
    risk::RiskManager risk_manager_;
    PositionState state_;

    std::vector<risk::Trade> trades_;
    std::vector<analytics::EquityPoint> equity_curve_;
    int bars_processed_ = 0;
    int signals_generated_ = 0;
};

} // namespace

void BacktestEngine::validateRunParameters(const strategy::StrategyConfig& config,
                                           double initial_balance,
                                           double fee_rate) {
    config.validate();
    if (!(initial_balance > 0.0)) {
        throw InvalidConfigError("initial_balance must be positive, got " + std::to_string(initial_balance));
    }
    if (fee_rate < 0.0 || fee_rate >= 1.0) {
        throw InvalidConfigError("fee_rate must be within [0, 1), got " + std::to_string(fee_rate));
    }
}

void BacktestEngine::validateRequest(const BacktestRequest& request) {
    validateRunParameters(request.strategy_config, request.initial_balance, request.fee_rate);
    if (request.start_ms >= request.end_ms) {
        throw InvalidRangeError("start (" + std::to_string(request.start_ms) +
                                ") must be before end (" + std::to_string(request.end_ms) + ")");
    }
}

BacktestResult BacktestEngine::run(
    const BacktestRequest& request,
    const core::IMarketDataProvider& provider,
    const std::atomic<bool>* cancel_flag
) const {
    validateRequest(request);

    // The request's timeframe is authoritative for annualization.
    strategy::StrategyConfig config = request.strategy_config;
    config.timeframe = request.timeframe;

    const auto bars = provider.getBars(request.symbol, request.timeframe, request.start_ms, request.end_ms);
    LOG_INFO("Backtest {} {}: {} bars in [{}, {}]", request.symbol, toString(request.timeframe),
             bars.size(), request.start_ms, request.end_ms);

    BacktestResult result = replay(bars, config, request.initial_balance, request.fee_rate,
                                   request.symbol, cancel_flag);
    result.start_ms = request.start_ms;
    result.end_ms = request.end_ms;
    return result;
}

BacktestResult BacktestEngine::replay(
    const std::vector<Bar>& bars,
    const strategy::StrategyConfig& config,
    double initial_balance,
    double fee_rate,
    const std::string& symbol,
    const std::atomic<bool>* cancel_flag
) const {
    validateRunParameters(config, initial_balance, fee_rate);

    const int warmup = config.warmupBars();
    if (bars.size() < static_cast<size_t>(warmup)) {
        throw InsufficientDataError("backtest needs at least " + std::to_string(warmup) +
                                    " bars for warm-up, got " + std::to_string(bars.size()));
    }
    DataHistory::ensureStrictlyIncreasing(bars);

    ReplaySession session(config, initial_balance, fee_rate, symbol);
    for (const auto& bar : bars) {
        if (cancel_flag != nullptr && cancel_flag->load(std::memory_order_relaxed)) {
            LOG_WARN("Backtest {} cancelled", symbol);
            throw CancelledError("backtest cancelled for " + symbol);
        }
        session.processBar(bar);
    }
    session.finish(bars.back());

    BacktestResult result = session.takeResult(initial_balance);
    result.start_ms = bars.front().timestamp;
    result.end_ms = bars.back().timestamp;

    LOG_INFO("Backtest {} completed: {} trades, final balance {:.2f} ({:+.2f}%), MDD {:.2f}%, Sharpe {:.3f}",
             symbol, result.stats.total_trades, result.stats.final_balance,
             result.stats.total_return_percent, result.stats.max_drawdown_percent,
             result.stats.sharpe_ratio);
    return result;
}

} // namespace backtest
} // namespace crosstrade
