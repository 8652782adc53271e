#pragma once

#include "bar.hpp"
#include "bar_history.hpp"
#include "bias_filter.hpp"
#include "config.hpp"
#include "daily_controller.hpp"
#include "entry_selector.hpp"
#include "events.hpp"
#include "liquidity.hpp"
#include "session_clock.hpp"
#include "swing_tracker.hpp"
#include "trade_manager.hpp"
#include "zones.hpp"
#include <optional>
#include <vector>

namespace zonetrade {

/// Everything the engine remembers between bars. A plain value: copy it to snapshot,
/// feed the copy the same bars to replay.
struct EngineState {
    BarHistory history;
    SwingTracker swings;
    Ema ema;
    HtfBiasTracker htf;
    Bias bias{Bias::Neutral};
    ZoneArena zones;
    SessionExtremes session;
    std::optional<LiquidityTarget> primary_target;
    EntrySlot entry;
    std::optional<OpenTrade> trade;
    DailyState daily;
    long last_index{-1};
};

struct StepResult {
    EngineState state;
    std::vector<Event> events;
    std::vector<OrderCommand> commands;
};

/// Advance the engine by one bar. Per bar: daily reset, context (swings, averages, HTF,
/// session extremes), zone detection, lifecycle, draw liquidity, then either the entry
/// state machine (flat) or trade management (in a position).
/// A bar_index not above state.last_index returns the state untouched with no output, so
/// replays are harmless. Incomplete bars are ignored the same way.
/// cfg must have passed validateConfig().
StepResult processBar(const EngineConfig& cfg, const SessionClock& clock, EngineState state,
                      const Bar& bar, long bar_index);

} // namespace zonetrade
