#pragma once

namespace zonetrade {

enum class Side { Long, Short };

/// Market = fixed quantity. ClosePosition = whatever position is open when the order fills.
enum class OrderType { Market, ClosePosition };

struct Order {
    Side side{Side::Long};
    double quantity{0};
    OrderType type{OrderType::Market};
};

inline Side opposite(Side s) { return s == Side::Long ? Side::Short : Side::Long; }

inline const char* sideName(Side s) { return s == Side::Long ? "long" : "short"; }

} // namespace zonetrade
