#pragma once

#include "bar.hpp"
#include "bias_filter.hpp"
#include "config.hpp"
#include "swing_tracker.hpp"
#include <optional>
#include <vector>

namespace zonetrade {

enum class LiquidityOrigin { SessionHigh, SessionLow, SwingHigh, SwingLow, EqualHighs, EqualLows };

enum class DrawDirection { Up, Down };

struct LiquidityTarget {
    double price{0};
    LiquidityOrigin origin{LiquidityOrigin::SessionHigh};
    DrawDirection draw{DrawDirection::Up};
};

const char* originName(LiquidityOrigin o);

/// High/low of the bars inside the trade window of the current day.
struct SessionExtremes {
    std::optional<double> high;
    std::optional<double> low;

    void update(const Bar& bar);
    void reset() { high.reset(); low.reset(); }
};

/// Unfilled liquidity around close: levels above are drawn Up, levels below Down.
std::vector<LiquidityTarget> collectTargets(const LiquidityParams& p, double close,
                                            const SessionExtremes& session,
                                            const SwingTracker& swings);

/// Nearest target whose draw agrees with the bias (any draw when Neutral).
std::optional<LiquidityTarget> selectPrimaryTarget(const std::vector<LiquidityTarget>& targets,
                                                   double close, Bias bias);

} // namespace zonetrade
