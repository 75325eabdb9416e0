#pragma once

#include <vector>
#include "common/Timeframe.h"
#include "common/Types.h"
#include "risk/RiskManager.h"

namespace crosstrade {
namespace analytics {

struct EquityPoint {
    TimestampMs timestamp;
    double balance;     // cash + open position marked at close
};

struct PerformanceStats {
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double total_return = 0.0;              // final - initial
    double total_return_percent = 0.0;      // total_return / initial * 100

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;                  // winning / total, 0 ~ 1

    double gross_profit = 0.0;
    double gross_loss = 0.0;                // absolute value
    double average_profit = 0.0;
    double average_loss = 0.0;              // absolute value
    double profit_factor = 0.0;             // 0 when there are no losses

    double max_drawdown_percent = 0.0;      // <= 0, deepest (balance - peak) / peak * 100
    double sharpe_ratio = 0.0;              // annualized, 0 when volatility is 0

    long long duration_days = 0;
};

class PerformanceAnalyzer {
public:
    static PerformanceStats analyze(
        double initial_balance,
        const std::vector<EquityPoint>& equity_curve,
        const std::vector<risk::Trade>& trades,
        Timeframe timeframe
    );

    static double maxDrawdownPercent(const std::vector<EquityPoint>& equity_curve);

    // Per-bar simple returns, annualized by sqrt(bars per year)
    static double sharpeRatio(const std::vector<EquityPoint>& equity_curve, Timeframe timeframe);

    static std::vector<double> periodReturns(const std::vector<EquityPoint>& equity_curve);

private:
    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace crosstrade
