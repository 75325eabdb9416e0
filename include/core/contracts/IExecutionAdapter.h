#pragma once

#include <map>
#include <string>

#include "common/Types.h"

namespace crosstrade {
namespace core {

struct Fill {
    std::string order_id;
    Direction direction = Direction::BUY;
    double price = 0.0;
    double quantity = 0.0;
    double fee = 0.0;
};

// Live order placement. Retry policy, if any, lives in the implementation.
class IExecutionAdapter {
public:
    virtual ~IExecutionAdapter() = default;

    // Throws ExecutionError when the order is not filled.
    virtual Fill placeOrder(Direction direction, double quantity, double price) = 0;

    // Asset -> free balance
    virtual std::map<std::string, double> getBalance() const = 0;
};

} // namespace core
} // namespace crosstrade
