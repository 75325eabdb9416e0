#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace crosstrade;
using risk::RejectReason;
using risk::RiskAction;
using risk::RiskManager;

static strategy::Signal makeSignal(Direction direction, TimestampMs ts, double confidence, double price = 100.0) {
    IndicatorPoint p;
    p.timestamp = ts;
    p.ema_short = 101.0;
    p.ema_long = 100.0;
    p.rsi = 50.0;
    return strategy::Signal(ts, direction, SignalStrength::MODERATE, confidence, price, p, "test", "BTC/USDT");
}

static risk::Position openLong(double qty = 1.0) {
    risk::Position pos;
    pos.symbol = "BTC/USDT";
    pos.entry_price = 100.0;
    pos.quantity = qty;
    pos.invested_amount = 100.0 * qty;
    return pos;
}

static void testConfidenceGate() {
    strategy::StrategyConfig config;        // min_confidence 60
    RiskManager rm;

    assert(!rm.evaluate(makeSignal(Direction::BUY, 1000, 59.9), config, nullptr, 1000.0));
    assert(rm.lastRejectReason() == RejectReason::LOW_CONFIDENCE);
    assert(rm.rejectionStats().low_confidence == 1);
    // Rejections never move the cooldown clock
    assert(!rm.lastTradeTimestamp().has_value());

    const auto decision = rm.evaluate(makeSignal(Direction::BUY, 2000, 60.0), config, nullptr, 1000.0);
    assert(decision.has_value());
    assert(decision->action == RiskAction::ENTER_LONG);
    assert(rm.lastTradeTimestamp() == 2000);
    std::cout << "  confidence gate ok\n";
}

static void testCooldown() {
    strategy::StrategyConfig config;
    config.min_time_between_trades = 300;   // seconds
    RiskManager rm;
    const auto pos = openLong();

    const TimestampMs t0 = 1700000000000LL;
    assert(rm.evaluate(makeSignal(Direction::BUY, t0, 90.0), config, nullptr, 1000.0));

    // 299 s later: blocked
    assert(!rm.evaluate(makeSignal(Direction::SELL, t0 + 299000, 90.0), config, &pos, 1000.0));
    assert(rm.lastRejectReason() == RejectReason::COOLDOWN);
    assert(rm.lastTradeTimestamp() == t0);

    // exactly 300 s later: allowed
    const auto exit = rm.evaluate(makeSignal(Direction::SELL, t0 + 300000, 90.0), config, &pos, 1000.0);
    assert(exit.has_value());
    assert(exit->action == RiskAction::EXIT_LONG);
    assert(std::abs(exit->quantity - pos.quantity) < 1e-12);

    // noteTrade advances the clock for protective exits
    rm.noteTrade(t0 + 400000);
    assert(!rm.evaluate(makeSignal(Direction::BUY, t0 + 500000, 90.0), config, nullptr, 1000.0));
    assert(rm.rejectionStats().cooldown == 2);
    std::cout << "  cooldown ok\n";
}

static void testCooldownBoundaries() {
    strategy::StrategyConfig config;
    config.min_time_between_trades = 300;
    const auto pos = openLong();
    const TimestampMs t0 = 1700000000000LL;

    // 299.999 s is still inside the window
    RiskManager rm;
    assert(rm.evaluate(makeSignal(Direction::BUY, t0, 90.0), config, nullptr, 1000.0));
    assert(!rm.evaluate(makeSignal(Direction::SELL, t0 + 299999, 90.0), config, &pos, 1000.0));
    assert(rm.evaluate(makeSignal(Direction::SELL, t0 + 300001, 90.0), config, &pos, 1000.0));

    // Very long cooldowns stay in force
    config.min_time_between_trades = 10000000000000000LL;
    config.validate();
    RiskManager long_wait;
    assert(long_wait.evaluate(makeSignal(Direction::BUY, t0, 90.0), config, nullptr, 1000.0));
    assert(!long_wait.evaluate(makeSignal(Direction::SELL, t0 + 1000, 90.0), config, &pos, 1000.0));
    assert(long_wait.lastRejectReason() == RejectReason::COOLDOWN);
    assert(long_wait.lastTradeTimestamp() == t0);
    std::cout << "  cooldown boundaries ok\n";
}

static void testPositionState() {
    strategy::StrategyConfig config;
    config.min_time_between_trades = 0;
    RiskManager rm;
    const auto pos = openLong();

    assert(!rm.evaluate(makeSignal(Direction::BUY, 1000, 90.0), config, &pos, 1000.0));
    assert(rm.lastRejectReason() == RejectReason::POSITION_ALREADY_OPEN);

    // Sell while flat is ignored
    assert(!rm.evaluate(makeSignal(Direction::SELL, 2000, 90.0), config, nullptr, 1000.0));
    assert(rm.lastRejectReason() == RejectReason::NO_POSITION_TO_EXIT);

    assert(!rm.evaluate(makeSignal(Direction::BUY, 3000, 90.0), config, nullptr, 0.0));
    assert(rm.lastRejectReason() == RejectReason::INSUFFICIENT_BALANCE);

    assert(rm.rejectionStats().total() == 3);
    rm.reset();
    assert(rm.rejectionStats().total() == 0);
    std::cout << "  position state ok\n";
}

static void testSizingAndLevels() {
    strategy::StrategyConfig config;        // 10 %, SL 2 %, TP 4 %
    RiskManager rm;

    const auto d = rm.evaluate(makeSignal(Direction::BUY, 1000, 90.0, 200.0), config, nullptr, 1000.0);
    assert(d.has_value());
    assert(std::abs(d->notional - 100.0) < 1e-9);
    assert(std::abs(d->quantity - 0.5) < 1e-12);
    assert(std::abs(d->stop_loss - 196.0) < 1e-9);
    assert(std::abs(d->take_profit - 208.0) < 1e-9);

    config.max_trade_amount = 25.0;
    assert(std::abs(RiskManager::entryNotional(1000.0, config) - 25.0) < 1e-12);
    assert(RiskManager::entryNotional(-5.0, config) == 0.0);

    const auto short_levels = RiskManager::protectiveLevels(100.0, Direction::SELL, config);
    assert(std::abs(short_levels.stop_loss - 102.0) < 1e-9);
    assert(std::abs(short_levels.take_profit - 96.0) < 1e-9);
    std::cout << "  sizing ok\n";
}

int main() {
    std::cout << "[TEST] Starting RiskManager Test..." << std::endl;

    testConfidenceGate();
    testCooldown();
    testCooldownBoundaries();
    testPositionState();
    testSizingAndLevels();

    std::cout << "[TEST] RiskManager PASSED" << std::endl;
    return 0;
}
