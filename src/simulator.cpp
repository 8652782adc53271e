#include "simulator.hpp"
#include <cmath>
#include <algorithm>

namespace zonetrade {

namespace {
    constexpr double POSITION_ZERO_EPS = 1e-9;
}

Simulator::Simulator(double initial_cash, double commission_per_trade, double slippage_fraction)
    : commission_(commission_per_trade)
    , slippage_(slippage_fraction)
    , cash_(initial_cash)
    , position_(0)
    , avg_entry_(0)
    , equity_(initial_cash)
    , last_close_(0)
{
}

void Simulator::placeOrder(Side side, double quantity) {
    if (quantity <= 0) return;
    Order o;
    o.side = side;
    o.quantity = quantity;
    o.type = OrderType::Market;
    pending_.push_back(o);
}

void Simulator::placeClosePosition() {
    Order o;
    o.type = OrderType::ClosePosition;
    pending_.push_back(o);
}

void Simulator::processOrders(const Bar& bar) {
    std::vector<Order> orders;
    orders.swap(pending_);
    for (const Order& o : orders) {
        if (o.type == OrderType::ClosePosition) {
            if (std::abs(position_) < POSITION_ZERO_EPS) continue;
            Order close;
            close.side = position_ > 0 ? Side::Short : Side::Long;
            close.quantity = std::abs(position_);
            fill(close, bar);
        } else {
            fill(o, bar);
        }
    }
}

void Simulator::fill(const Order& order, const Bar& bar) {
    const Side side = order.side;
    const double fill_price = side == Side::Long ? bar.open * (1.0 + slippage_) : bar.open * (1.0 - slippage_);
    double qty = order.quantity;

    // Close or reduce opposite position first
    if ((side == Side::Long && position_ < 0) || (side == Side::Short && position_ > 0)) {
        double close_qty = std::min(qty, std::abs(position_));
        double pnl = (side == Side::Long)
            ? (avg_entry_ - fill_price) * close_qty   // was short, buy to cover
            : (fill_price - avg_entry_) * close_qty;  // was long, sell to close
        cash_ += pnl - commission_;

        TradeRecord t;
        t.entry_time = entry_time_;
        t.exit_time = bar.timestamp;
        t.side = position_ > 0 ? Side::Long : Side::Short;
        t.quantity = close_qty;
        t.entry_price = avg_entry_;
        t.exit_price = fill_price;
        t.pnl = pnl - commission_;
        t.pnl_pct = (t.entry_price != 0) ? (t.pnl / (t.entry_price * close_qty)) * 100.0 : 0;
        trades_.push_back(t);

        position_ += (position_ > 0) ? -close_qty : close_qty;
        if (std::abs(position_) < POSITION_ZERO_EPS) {
            position_ = 0;
            avg_entry_ = 0;
        }
        qty -= close_qty;
    }

    // Open or add to position
    if (qty > 0) {
        cash_ -= commission_;
        if (position_ == 0) {
            avg_entry_ = fill_price;
            entry_time_ = bar.timestamp;
            position_ = (side == Side::Long) ? qty : -qty;
        } else {
            double total_qty = std::abs(position_) + qty;
            avg_entry_ = (avg_entry_ * std::abs(position_) + fill_price * qty) / total_qty;
            position_ += (side == Side::Long) ? qty : -qty;
        }
    }
}

void Simulator::updateEquity(const Bar& bar) {
    last_close_ = bar.close;
    equity_ = equityAt(bar.close);
    equity_curve_.push_back(equity_);
}

} // namespace zonetrade
