#include "execution/PaperExecutionAdapter.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>

namespace crosstrade {
namespace execution {

namespace {
constexpr double kBalanceEpsilon = 1e-9;
}

PaperExecutionAdapter::PaperExecutionAdapter(const std::string& symbol, double initial_quote, double fee_rate)
    : fee_rate_(fee_rate)
{
    const auto slash = symbol.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= symbol.size()) {
        throw InvalidConfigError("paper account needs a BASE/QUOTE symbol, got '" + symbol + "'");
    }
    if (initial_quote < 0.0) {
        throw InvalidConfigError("paper account balance must not be negative");
    }
    if (fee_rate < 0.0 || fee_rate >= 1.0) {
        throw InvalidConfigError("paper account fee_rate must be within [0, 1)");
    }

    base_asset_ = symbol.substr(0, slash);
    quote_asset_ = symbol.substr(slash + 1);
    balances_[base_asset_] = 0.0;
    balances_[quote_asset_] = initial_quote;
}

core::Fill PaperExecutionAdapter::placeOrder(Direction direction, double quantity, double price) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string order_id = fmt::format("paper-{}", ++order_seq_);
    if (pending_failures_ > 0) {
        --pending_failures_;
        throw ExecutionError(order_id + " rejected by venue");
    }
    if (!(quantity > 0.0) || !(price > 0.0)) {
        throw ExecutionError(fmt::format("{} invalid order: qty {} @ {}", order_id, quantity, price));
    }

    const double notional = quantity * price;
    const double fee = notional * fee_rate_;

    if (direction == Direction::BUY) {
        const double cost = notional + fee;
        if (cost > balances_[quote_asset_] + kBalanceEpsilon) {
            throw ExecutionError(fmt::format("{} insufficient {}: need {:.8f}, have {:.8f}",
                                             order_id, quote_asset_, cost, balances_[quote_asset_]));
        }
        balances_[quote_asset_] -= cost;
        balances_[base_asset_] += quantity;
    } else {
        if (quantity > balances_[base_asset_] + kBalanceEpsilon) {
            throw ExecutionError(fmt::format("{} insufficient {}: need {:.8f}, have {:.8f}",
                                             order_id, base_asset_, quantity, balances_[base_asset_]));
        }
        balances_[base_asset_] -= quantity;
        balances_[quote_asset_] += notional - fee;
    }
    ++filled_orders_;

    core::Fill fill;
    fill.order_id = order_id;
    fill.direction = direction;
    fill.price = price;
    fill.quantity = quantity;
    fill.fee = fee;

    LOG_INFO("[PAPER] {} {} {:.8f} {} @ {:.8f} (fee {:.8f})", order_id, toString(direction),
             quantity, base_asset_, price, fee);
    return fill;
}

std::map<std::string, double> PaperExecutionAdapter::getBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

void PaperExecutionAdapter::failNextOrders(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = count > 0 ? count : 0;
}

int PaperExecutionAdapter::filledOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_orders_;
}

} // namespace execution
} // namespace crosstrade
