#pragma once

#include "bar.hpp"
#include "order.hpp"
#include <cstddef>
#include <vector>

namespace zonetrade {

/// Execution gateway seen by a strategy. Orders are fire-and-forget.
class IContext {
public:
    virtual ~IContext() = default;

    /// Buy `quantity` at market (executed at next bar open in the simulator).
    virtual void openLong(double quantity) = 0;

    /// Sell `quantity` at market.
    virtual void openShort(double quantity) = 0;

    /// Reduce the open position by `quantity`, whichever side it is on.
    virtual void partialClose(double quantity) = 0;

    /// Flatten whatever is open when the order fills.
    virtual void closeAll() = 0;

    /// Current position: positive = long, negative = short, 0 = flat.
    virtual double position() const = 0;

    /// Price rounded to the instrument tick.
    virtual double roundToTick(double price) const = 0;

    /// Last bar's close.
    virtual double lastPrice() const = 0;

    /// Number of bars processed so far (0-based).
    virtual std::size_t barIndex() const = 0;

    /// History of bars up to and including current bar (no look-ahead).
    virtual const std::vector<Bar>& bars() const = 0;
};

} // namespace zonetrade
