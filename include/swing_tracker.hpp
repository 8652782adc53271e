#pragma once

#include "bar_history.hpp"
#include <optional>

namespace zonetrade {

enum class SwingKind { High, Low };

struct SwingPoint {
    double price{0};
    long bar_index{0};
    SwingKind kind{SwingKind::High};
};

/// Fractal pivots: a bar is a swing high when its high is strictly above the highs of
/// `left` bars before it and `right` bars after it (lows symmetric). Only the current and
/// the previous swing of each kind are kept.
class SwingTracker {
public:
    /// Evaluate the pivot candidate at index - right. Returns how many swings were confirmed (0..2).
    int update(const BarHistory& history, long index, int left, int right);

    const std::optional<SwingPoint>& lastHigh() const { return last_high_; }
    const std::optional<SwingPoint>& prevHigh() const { return prev_high_; }
    const std::optional<SwingPoint>& lastLow() const { return last_low_; }
    const std::optional<SwingPoint>& prevLow() const { return prev_low_; }

    /// Higher low: both lows known and the last one above the previous.
    bool higherLow() const;
    /// Lower high: both highs known and the last one below the previous.
    bool lowerHigh() const;

private:
    std::optional<SwingPoint> last_high_;
    std::optional<SwingPoint> prev_high_;
    std::optional<SwingPoint> last_low_;
    std::optional<SwingPoint> prev_low_;
};

} // namespace zonetrade
