#include "daily_controller.hpp"

namespace zonetrade {

bool isNewDay(const DailyState& d, const SessionTime& t) {
    return !d.day_id || *d.day_id != t.day_id;
}

DailyState startDay(const DailyState& d, const SessionTime& t) {
    DailyState next;
    next.day_id = t.day_id;
    next.last_trade_minute = d.last_trade_minute;
    return next;
}

bool inTradeWindow(const SessionParams& p, const SessionTime& t) {
    return t.hhmm >= p.trade_start && t.hhmm < p.trade_end;
}

bool pastFlatTime(const SessionParams& p, const SessionTime& t) {
    return p.forced_flat_enabled && t.hhmm >= p.forced_flat;
}

bool entryGatesOpen(const EngineConfig& cfg, const DailyState& d, const SessionTime& t) {
    if (!inTradeWindow(cfg.session, t) || pastFlatTime(cfg.session, t)) return false;
    if (d.trades_today >= cfg.risk.max_trades_day) return false;
    if (d.last_trade_minute && t.absoluteMinute() - *d.last_trade_minute < cfg.session.cooldown_minutes)
        return false;
    return true;
}

bool directionAvailable(const EngineConfig& cfg, const DailyState& d, Direction dir) {
    if (dir == Direction::Bullish)
        return cfg.entry.enable_long && !(cfg.risk.one_per_direction && d.long_used);
    return cfg.entry.enable_short && !(cfg.risk.one_per_direction && d.short_used);
}

DailyState recordEntry(const DailyState& d, Direction dir, const SessionTime& t) {
    DailyState next = d;
    ++next.trades_today;
    if (dir == Direction::Bullish) next.long_used = true;
    else next.short_used = true;
    next.last_trade_minute = t.absoluteMinute();
    return next;
}

} // namespace zonetrade
