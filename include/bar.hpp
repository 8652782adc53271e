#pragma once

#include <string>
#include <cstdint>

namespace zonetrade {

/// Single OHLC (Open, High, Low, Close) bar.
struct Bar {
    std::string timestamp;  // bar start, e.g. "2024-01-02T09:30" or "2024-01-02 09:30:00"
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};       // optional
    bool complete{true};    // false while the host is still updating the bar

    double body() const { return close > open ? close - open : open - close; }
    bool upClose() const { return close > open; }
    bool downClose() const { return close < open; }
};

} // namespace zonetrade
