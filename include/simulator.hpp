#pragma once

#include "bar.hpp"
#include "order.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace zonetrade {

/// One closing fill (full or partial) for reporting.
struct TradeRecord {
    std::string entry_time;
    std::string exit_time;
    Side side{Side::Long};
    double quantity{0};
    double entry_price{0};
    double exit_price{0};
    double pnl{0};
    double pnl_pct{0};
};

/// Simulates order execution and tracks positions, cash, and equity.
/// Orders placed during bar N are filled at bar N+1 open (avoids look-ahead), in the order
/// they were placed.
/// Slippage: fraction of fill price (e.g. 0.001 = 0.1%). Buys fill at open*(1+slippage), sells at open*(1-slippage).
/// Commission is charged per fill. Cash moves only by realized P&L and commission (futures-style margin).
class Simulator {
public:
    Simulator(double initial_cash = 100000.0, double commission_per_trade = 0.0, double slippage_fraction = 0.0);

    /// Fill all pending orders at the current bar's open (with slippage applied).
    void processOrders(const Bar& bar);

    /// Queue a market order for the next bar. Non-positive quantities are ignored.
    void placeOrder(Side side, double quantity);

    /// Queue an order that flattens whatever position is open at fill time.
    void placeClosePosition();

    /// Update equity snapshot using current bar's close for position value.
    void updateEquity(const Bar& bar);

    double position() const { return position_; }
    double cash() const { return cash_; }
    double equity() const { return equity_; }
    double lastClose() const { return last_close_; }
    double avgEntryPrice() const { return avg_entry_; }
    /// Cash plus open P&L marked at `price`.
    double equityAt(double price) const { return cash_ + position_ * (price - avg_entry_); }
    std::size_t pendingOrders() const { return pending_.size(); }
    const std::vector<TradeRecord>& trades() const { return trades_; }
    const std::vector<double>& equityCurve() const { return equity_curve_; }

private:
    void fill(const Order& order, const Bar& bar);

    double commission_;
    double slippage_;  // fraction, e.g. 0.001 = 0.1%
    double cash_;
    double position_;       // signed: + long, - short
    double avg_entry_;      // average entry price for P&L
    double equity_;
    double last_close_;

    std::vector<Order> pending_;

    std::vector<TradeRecord> trades_;
    std::vector<double> equity_curve_;
    std::string entry_time_;  // timestamp of the fill that opened the current position
};

} // namespace zonetrade
