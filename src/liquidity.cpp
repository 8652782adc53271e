#include "liquidity.hpp"
#include <algorithm>
#include <cmath>

namespace zonetrade {

const char* originName(LiquidityOrigin o) {
    switch (o) {
        case LiquidityOrigin::SessionHigh: return "session_high";
        case LiquidityOrigin::SessionLow: return "session_low";
        case LiquidityOrigin::SwingHigh: return "swing_high";
        case LiquidityOrigin::SwingLow: return "swing_low";
        case LiquidityOrigin::EqualHighs: return "equal_highs";
        case LiquidityOrigin::EqualLows: return "equal_lows";
    }
    return "?";
}

void SessionExtremes::update(const Bar& bar) {
    high = high ? std::max(*high, bar.high) : bar.high;
    low = low ? std::min(*low, bar.low) : bar.low;
}

std::vector<LiquidityTarget> collectTargets(const LiquidityParams& p, double close,
                                            const SessionExtremes& session,
                                            const SwingTracker& swings) {
    std::vector<LiquidityTarget> out;
    auto above = [&](double price, LiquidityOrigin origin) {
        if (close < price) out.push_back({price, origin, DrawDirection::Up});
    };
    auto below = [&](double price, LiquidityOrigin origin) {
        if (close > price) out.push_back({price, origin, DrawDirection::Down});
    };

    if (p.use_session) {
        if (session.high) above(*session.high, LiquidityOrigin::SessionHigh);
        if (session.low) below(*session.low, LiquidityOrigin::SessionLow);
    }
    if (p.use_swing) {
        if (swings.lastHigh()) above(swings.lastHigh()->price, LiquidityOrigin::SwingHigh);
        if (swings.lastLow()) below(swings.lastLow()->price, LiquidityOrigin::SwingLow);
    }
    if (p.use_equal) {
        const auto& h1 = swings.lastHigh();
        const auto& h2 = swings.prevHigh();
        if (h1 && h2 && std::abs(h1->price - h2->price) <= p.equal_tolerance)
            above(std::max(h1->price, h2->price), LiquidityOrigin::EqualHighs);
        const auto& l1 = swings.lastLow();
        const auto& l2 = swings.prevLow();
        if (l1 && l2 && std::abs(l1->price - l2->price) <= p.equal_tolerance)
            below(std::min(l1->price, l2->price), LiquidityOrigin::EqualLows);
    }
    return out;
}

std::optional<LiquidityTarget> selectPrimaryTarget(const std::vector<LiquidityTarget>& targets,
                                                   double close, Bias bias) {
    std::optional<LiquidityTarget> best;
    double best_dist = 0;
    for (const auto& t : targets) {
        if (bias == Bias::Bullish && t.draw != DrawDirection::Up) continue;
        if (bias == Bias::Bearish && t.draw != DrawDirection::Down) continue;
        double dist = std::abs(t.price - close);
        if (!best || dist < best_dist) {
            best = t;
            best_dist = dist;
        }
    }
    return best;
}

} // namespace zonetrade
