#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "entry_selector.hpp"
#include "events.hpp"
#include "liquidity.hpp"
#include "session_clock.hpp"
#include "swing_tracker.hpp"
#include "zones.hpp"
#include <optional>
#include <vector>

namespace zonetrade {

/// The one open position. Exists from trigger to flat.
struct OpenTrade {
    Direction direction{Direction::Bullish};
    EntryModel model{EntryModel::BreakerRetap};
    double entry_price{0};
    double stop_price{0};       // original protective stop
    double risk_points{0};
    double target_price{0};
    int quantity{0};            // remaining contracts
    long entry_index{0};
    bool partial_taken{false};
    bool breakeven_active{false};
    double breakeven_stop{0};   // valid while breakeven_active
    bool trailing_active{false};
    double trailing_stop{0};    // valid while trailing_active
    double best_price{0};       // most favorable price since entry
    bool progress_checked{false};

    bool isLong() const { return direction == Direction::Bullish; }
    /// Unrealized R at `price` (positive = in profit).
    double rMultiple(double price) const;
};

/// Nearest multiple of tick.
double roundToTick(double price, double tick);

/// Stop from the zone edge plus buffer. When that is closer to entry than stop.tight_threshold
/// (and stop.override_to_structure is on) the last swing extreme plus buffer is used, else
/// stop.default. The distance is clamped to [stop.min, stop.max].
double computeStop(const EngineConfig& cfg, Direction dir, double entry, const ZoneBounds& zone,
                   const SwingTracker& swings);

/// Target by target.mode. Liquidity falls back to fixed R when no target lies on the profit
/// side; Hybrid uses liquidity only when it is at least 1R away.
double computeTarget(const EngineConfig& cfg, Direction dir, double entry, double risk,
                     const std::optional<LiquidityTarget>& liquidity);

/// Build the trade for a triggered entry filled at `entry`.
OpenTrade openTrade(const EngineConfig& cfg, const PendingEntry& pending, double entry, long index,
                    const SwingTracker& swings, const std::optional<LiquidityTarget>& liquidity);

struct TradeStep {
    std::optional<OpenTrade> trade;  // empty once flat
    std::vector<Event> events;
    std::vector<OrderCommand> commands;
};

/// One closed bar of an open trade. Exits in priority order: end of day, trailing stop,
/// breakeven stop, original stop, target, time stop. Then breakeven, partial and trailing
/// updates. `atr` is only needed for trail.mode=atr.
TradeStep manageTrade(const EngineConfig& cfg, const OpenTrade& trade, const Bar& bar, long index,
                      const SessionTime& time, const std::optional<double>& atr);

/// Close everything at `price` (used when the session day rolls over with a trade open).
TradeStep flattenTrade(const OpenTrade& trade, long index, double price, EventKind reason,
                       const std::string& why);

} // namespace zonetrade
