#include "analytics/PerformanceAnalyzer.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace crosstrade {
namespace analytics {

namespace {
constexpr double EPSILON = 1e-12;
constexpr long long MS_PER_DAY = 24LL * 60LL * 60LL * 1000LL;
}

PerformanceStats PerformanceAnalyzer::analyze(
    double initial_balance,
    const std::vector<EquityPoint>& equity_curve,
    const std::vector<risk::Trade>& trades,
    Timeframe timeframe
) {
    PerformanceStats stats;
    stats.initial_balance = initial_balance;
    stats.final_balance = equity_curve.empty() ? initial_balance : equity_curve.back().balance;
    stats.total_return = stats.final_balance - initial_balance;
    stats.total_return_percent = (initial_balance > 0.0)
        ? (stats.total_return / initial_balance) * 100.0
        : 0.0;

    stats.total_trades = static_cast<int>(trades.size());
    for (const auto& trade : trades) {
        if (trade.profit_loss > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.profit_loss;
        } else {
            stats.losing_trades++;
            stats.gross_loss += std::abs(trade.profit_loss);
        }
    }

    stats.win_rate = (stats.total_trades > 0)
        ? static_cast<double>(stats.winning_trades) / static_cast<double>(stats.total_trades)
        : 0.0;
    stats.average_profit = (stats.winning_trades > 0)
        ? stats.gross_profit / static_cast<double>(stats.winning_trades)
        : 0.0;
    stats.average_loss = (stats.losing_trades > 0)
        ? stats.gross_loss / static_cast<double>(stats.losing_trades)
        : 0.0;
    stats.profit_factor = (stats.gross_loss > EPSILON) ? (stats.gross_profit / stats.gross_loss) : 0.0;

    stats.max_drawdown_percent = maxDrawdownPercent(equity_curve);
    stats.sharpe_ratio = sharpeRatio(equity_curve, timeframe);

    if (equity_curve.size() >= 2) {
        stats.duration_days = (equity_curve.back().timestamp - equity_curve.front().timestamp) / MS_PER_DAY;
    }
    return stats;
}

double PerformanceAnalyzer::maxDrawdownPercent(const std::vector<EquityPoint>& equity_curve) {
    double running_peak = 0.0;
    double deepest = 0.0;
    bool first = true;

    for (const auto& point : equity_curve) {
        if (first || point.balance > running_peak) {
            running_peak = point.balance;
            first = false;
        }
        if (running_peak <= 0.0) {
            continue;
        }
        const double drawdown = (point.balance - running_peak) / running_peak * 100.0;
        deepest = std::min(deepest, drawdown);
    }
    return deepest;
}

std::vector<double> PerformanceAnalyzer::periodReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].balance;
        if (prev <= 0.0) {
            continue;
        }
        returns.push_back((equity_curve[i].balance - prev) / prev);
    }
    return returns;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<EquityPoint>& equity_curve, Timeframe timeframe) {
    const auto returns = periodReturns(equity_curve);
    if (returns.size() < 2) {
        return 0.0;
    }

    const double mean = calculateMean(returns);
    const double std_dev = calculateStandardDeviation(returns, mean);
    if (std_dev < EPSILON) {
        return 0.0;
    }
    return (mean / std_dev) * std::sqrt(barsPerYear(timeframe));
}

double PerformanceAnalyzer::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double PerformanceAnalyzer::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    // Sample standard deviation
    if (values.size() < 2) return 0.0;
    
    double sum_sq = 0.0;
    for (double v : values) {
        const double diff = v - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

} // namespace analytics
} // namespace crosstrade
