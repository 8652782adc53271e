#pragma once

#include "bar.hpp"

namespace zonetrade {

class IContext;  // forward declaration

/// Interface a trading algorithm implements.
/// The backtester calls onBar() for each bar in chronological order (no look-ahead).
class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// Called once per bar. Use ctx to place orders and read state.
    virtual void onBar(const Bar& bar, IContext& ctx) = 0;

    /// Optional: called when the backtest starts.
    virtual void onStart(IContext& /*ctx*/) {}

    /// Optional: called when the backtest ends.
    virtual void onEnd(IContext& /*ctx*/) {}
};

} // namespace zonetrade
