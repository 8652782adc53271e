#pragma once

#include "config.hpp"
#include "session_clock.hpp"
#include "zones.hpp"
#include <optional>

namespace zonetrade {

/// Per-day trade accounting. Reset once per calendar day of the session clock.
struct DailyState {
    std::optional<long> day_id;
    int trades_today{0};
    bool long_used{false};
    bool short_used{false};
    std::optional<long> last_trade_minute;  // SessionTime::absoluteMinute() of the last entry
};

/// True on the first bar of a new session day (including the very first bar).
bool isNewDay(const DailyState& d, const SessionTime& t);

/// Counters cleared, day id set. The cooldown clock carries over.
DailyState startDay(const DailyState& d, const SessionTime& t);

/// Inside [session.trade_start, session.trade_end).
bool inTradeWindow(const SessionParams& p, const SessionTime& t);

/// At or past the forced-flat time (when enabled).
bool pastFlatTime(const SessionParams& p, const SessionTime& t);

/// Window open, before flat time, under risk.max_trades_day, cooldown elapsed.
bool entryGatesOpen(const EngineConfig& cfg, const DailyState& d, const SessionTime& t);

/// Direction enable plus risk.one_per_direction.
bool directionAvailable(const EngineConfig& cfg, const DailyState& d, Direction dir);

/// Count an entry.
DailyState recordEntry(const DailyState& d, Direction dir, const SessionTime& t);

} // namespace zonetrade
