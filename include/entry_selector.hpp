#pragma once

#include "bar.hpp"
#include "bias_filter.hpp"
#include "config.hpp"
#include "zones.hpp"
#include <optional>
#include <string>

namespace zonetrade {

/// Setups in priority order.
enum class EntryModel { Unicorn, BreakerRetap, IfvgFlip, ObMean };

/// "UN1_UNICORN", "BR1_BREAKER", "IF1_IFVG", "OB1_MEAN"
const char* modelName(EntryModel m);

/// A matched setup waiting for its rejection candle. `bounds` is the span the confirmation
/// and the stop are measured from (the overlap for a Unicorn, the zone otherwise).
struct PendingEntry {
    ZoneId zone;
    EntryModel model{EntryModel::BreakerRetap};
    Direction direction{Direction::Bullish};
    ZoneBounds bounds;
    long armed_index{0};
};

enum class EntryState { Idle, Pending };

/// The single confirmation slot.
struct EntrySlot {
    EntryState state{EntryState::Idle};
    PendingEntry pending;
};

/// What the engine knows about this bar when the slot is stepped.
struct EntryInputs {
    const Bar* bar{nullptr};
    long index{0};
    const ZoneArena* zones{nullptr};
    Bias intraday{Bias::Neutral};
    Bias htf{Bias::Neutral};
    bool can_arm{false};      // all arming gates open
    bool can_trigger{false};  // flat, inside the window, under the trade limit
    bool long_allowed{true};  // direction enables and per-direction limits
    bool short_allowed{true};
};

enum class EntryTransition { None, Armed, TimedOut, ZoneLost, Triggered };

struct EntryStep {
    EntrySlot slot;
    EntryTransition transition{EntryTransition::None};
    std::optional<PendingEntry> triggered;  // set on Triggered
};

/// Highest-priority setup the close sits in, if any.
std::optional<PendingEntry> findSetup(const EngineConfig& cfg, const EntryInputs& in);

/// Rejection candle: close beyond open and at or beyond the mean, in the trade direction.
bool isConfirmation(const PendingEntry& pending, const Bar& bar);

/// Transition table:
///   Idle    + setup found            -> Pending  (Armed)
///   Pending + waited > max_wait_bars -> Idle     (TimedOut)
///   Pending + zone gone or inactive  -> Idle     (ZoneLost)
///   Pending + rejection candle       -> Idle     (Triggered)
///   otherwise                        -> unchanged
/// Confirmation is only looked for on bars after the arming bar.
EntryStep stepEntry(const EngineConfig& cfg, const EntrySlot& slot, const EntryInputs& in);

} // namespace zonetrade
