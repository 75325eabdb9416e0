#include "analytics/PerformanceAnalyzer.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace crosstrade;
using analytics::EquityPoint;
using analytics::PerformanceAnalyzer;

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

static std::vector<EquityPoint> curve(const std::vector<double>& balances) {
    std::vector<EquityPoint> out;
    for (size_t i = 0; i < balances.size(); ++i) {
        out.push_back({static_cast<TimestampMs>(i) * 3600000LL, balances[i]});
    }
    return out;
}

static risk::Trade trade(double pnl) {
    risk::Trade t;
    t.profit_loss = pnl;
    return t;
}

static void testDrawdown() {
    // Peak 1200, trough 900 -> -25 %
    const double mdd = PerformanceAnalyzer::maxDrawdownPercent(curve({1000, 1200, 1100, 900, 1300, 1250}));
    assert(near(mdd, -25.0));

    // Monotonic rise never draws down
    assert(PerformanceAnalyzer::maxDrawdownPercent(curve({1000, 1001, 1002})) == 0.0);
    assert(PerformanceAnalyzer::maxDrawdownPercent({}) == 0.0);
    std::cout << "  drawdown ok\n";
}

static void testSharpe() {
    // Constant returns -> zero volatility -> 0
    assert(PerformanceAnalyzer::sharpeRatio(curve({1000, 1000, 1000, 1000}), Timeframe::H1) == 0.0);
    // Fewer than two returns -> 0
    assert(PerformanceAnalyzer::sharpeRatio(curve({1000, 1100}), Timeframe::H1) == 0.0);

    const auto equity = curve({1000, 1010, 1005, 1020, 1030});
    const double h1 = PerformanceAnalyzer::sharpeRatio(equity, Timeframe::H1);
    const double d1 = PerformanceAnalyzer::sharpeRatio(equity, Timeframe::D1);
    assert(h1 > 0.0);
    // Same per-bar returns, annualized by sqrt(24) more bars
    assert(near(h1 / d1, std::sqrt(24.0), 1e-9));
    std::cout << "  sharpe ok\n";
}

static void testTradeStats() {
    const std::vector<risk::Trade> trades = {trade(50.0), trade(-20.0), trade(30.0), trade(-10.0)};
    const auto stats = PerformanceAnalyzer::analyze(1000.0, curve({1000, 1030, 1050}), trades, Timeframe::H1);

    assert(stats.total_trades == 4);
    assert(stats.winning_trades == 2);
    assert(stats.losing_trades == 2);
    assert(near(stats.win_rate, 0.5));
    assert(near(stats.gross_profit, 80.0));
    assert(near(stats.gross_loss, 30.0));
    assert(near(stats.average_profit, 40.0));
    assert(near(stats.average_loss, 15.0));
    assert(near(stats.profit_factor, 80.0 / 30.0));
    assert(near(stats.final_balance, 1050.0));
    assert(near(stats.total_return, 50.0));
    assert(near(stats.total_return_percent, 5.0));
    std::cout << "  trade stats ok\n";
}

static void testEmptyRun() {
    const auto stats = PerformanceAnalyzer::analyze(1000.0, curve({1000, 1000}), {}, Timeframe::H1);
    assert(stats.total_trades == 0);
    assert(stats.win_rate == 0.0);
    assert(stats.profit_factor == 0.0);
    assert(stats.total_return_percent == 0.0);
    assert(stats.max_drawdown_percent == 0.0);
}

static void testDurationDays() {
    std::vector<EquityPoint> equity = {{0, 1000.0}, {3LL * 86400000LL + 5, 1000.0}};
    const auto stats = PerformanceAnalyzer::analyze(1000.0, equity, {}, Timeframe::D1);
    assert(stats.duration_days == 3);
}

int main() {
    std::cout << "[TEST] Starting PerformanceAnalyzer Test..." << std::endl;

    testDrawdown();
    testSharpe();
    testTradeStats();
    testEmptyRun();
    testDurationDays();

    std::cout << "[TEST] PerformanceAnalyzer PASSED" << std::endl;
    return 0;
}
