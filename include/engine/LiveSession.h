#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/IndicatorPipeline.h"
#include "backtest/BacktestEngine.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionAdapter.h"
#include "engine/EngineConfig.h"
#include "engine/SessionJournal.h"
#include "risk/RiskManager.h"
#include "strategy/SignalGenerator.h"

namespace crosstrade {
namespace engine {

// What one bar did to the session. error is set when the execution adapter
// refused an order; the session state is left as it was before that order.
struct LiveStepOutcome {
    std::optional<IndicatorPoint> indicators;
    std::optional<strategy::Signal> signal;
    std::optional<risk::RiskDecision> decision;
    std::optional<core::Fill> fill;
    std::optional<risk::Trade> closed_trade;
    std::string error;

    bool ok() const { return error.empty(); }
};

// Live Session - one strategy instance fed bar by bar from a live feed.
//
// Runs the same pipeline as the backtest (indicators -> signal -> risk gate),
// but every entry and exit goes through an IExecutionAdapter and the position
// follows the actual fill. Not thread-safe; drive one session from one thread.
class LiveSession {
public:
    LiveSession(
        const EngineConfig& config,
        const strategy::StrategyConfig& strategy_config,
        core::IExecutionAdapter& execution,
        core::IEventJournal* journal = nullptr
    );

    // Bars must arrive with strictly increasing timestamps (InvalidRangeError otherwise)
    LiveStepOutcome onBar(const Bar& bar);

    bool inPosition() const;
    const backtest::PositionState& positionState() const { return state_; }
    const std::vector<risk::Trade>& trades() const { return trades_; }
    double cash() const { return cash_; }
    double equity(double mark_price) const;
    const risk::RiskManager& riskManager() const { return risk_manager_; }
    long long barsProcessed() const { return bars_processed_; }

private:
    bool executeEntry(const risk::RiskDecision& decision, const strategy::Signal& signal,
                      const Bar& bar, LiveStepOutcome& outcome);
    bool executeExit(double price, ExitReason reason, const Bar& bar, LiveStepOutcome& outcome);

    EngineConfig config_;
    strategy::StrategyConfig strategy_config_;
    core::IExecutionAdapter& execution_;
    SessionJournal journal_;

    analytics::IndicatorPipeline pipeline_;
    strategy::SignalGenerator generator_;
    risk::RiskManager risk_manager_;
    backtest::PositionState state_;

    double cash_;
    std::vector<risk::Trade> trades_;
    long long bars_processed_;
};

} // namespace engine
} // namespace crosstrade
