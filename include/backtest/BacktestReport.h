#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace crosstrade {
namespace backtest {

class BacktestReport {
public:
    static nlohmann::json toJson(const BacktestResult& result);
    static nlohmann::json statsToJson(const analytics::PerformanceStats& stats);
    static nlohmann::json tradeToJson(const risk::Trade& trade);

    // Pretty-printed; throws EngineError when the file cannot be written
    static void writeJson(const BacktestResult& result, const std::string& path);
};

} // namespace backtest
} // namespace crosstrade
