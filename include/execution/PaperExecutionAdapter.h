#pragma once

#include <map>
#include <mutex>
#include <string>

#include "core/contracts/IExecutionAdapter.h"

namespace crosstrade {
namespace execution {

// Simulated exchange account for paper trading.
// Fills every order in full at the requested price and charges fee_rate on the notional.
// Balances are kept per asset, split from a "BASE/QUOTE" symbol.
class PaperExecutionAdapter : public core::IExecutionAdapter {
public:
    PaperExecutionAdapter(const std::string& symbol, double initial_quote, double fee_rate = 0.0);

    core::Fill placeOrder(Direction direction, double quantity, double price) override;
    std::map<std::string, double> getBalance() const override;

    // The next `count` orders fail with ExecutionError (venue outage drills)
    void failNextOrders(int count);

    const std::string& baseAsset() const { return base_asset_; }
    const std::string& quoteAsset() const { return quote_asset_; }
    int filledOrders() const;

private:
    std::string base_asset_;
    std::string quote_asset_;
    double fee_rate_;

    mutable std::mutex mutex_;
    std::map<std::string, double> balances_;
    int pending_failures_ = 0;
    int order_seq_ = 0;
    int filled_orders_ = 0;
};

} // namespace execution
} // namespace crosstrade
