#include "engine.hpp"
#include "zone_detectors.hpp"
#include "zone_lifecycle.hpp"
#include <cstdio>
#include <string>
#include <utility>

namespace zonetrade {

namespace {

std::string setupTag(EntryModel model, Direction dir, const ZoneBounds& b) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s %s [%.2f, %.2f]", modelName(model), directionName(dir), b.bottom, b.top);
    return buf;
}

std::string entryTag(const OpenTrade& t, const ZoneBounds& b, const std::optional<LiquidityTarget>& draw) {
    char buf[200];
    int n = std::snprintf(buf, sizeof(buf), "%s [%.2f, %.2f] stop=%.2f target=%.2f qty=%d",
                          modelName(t.model), b.bottom, b.top, t.stop_price, t.target_price, t.quantity);
    if (draw && n > 0 && static_cast<std::size_t>(n) < sizeof(buf))
        std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), " draw=%s@%.2f",
                      originName(draw->origin), draw->price);
    return buf;
}

void append(StepResult& r, const TradeStep& ts) {
    r.events.insert(r.events.end(), ts.events.begin(), ts.events.end());
    r.commands.insert(r.commands.end(), ts.commands.begin(), ts.commands.end());
}

void detectZones(const EngineConfig& cfg, EngineState& s, const Bar& bar, long index,
                 std::vector<Event>& ev) {
    for (const Zone& z : detectOrderBlocks(cfg.zones, s.history, index)) addZone(s.zones, z, ev);
    for (const Zone& z : detectFairValueGaps(cfg.zones, s.history, index)) addZone(s.zones, z, ev);
    flipViolatedOrderBlocks(s.zones, bar.close, index, ev);
    for (const Zone& z : detectStructureBreakers(cfg.zones, s.history, index, s.swings, s.zones))
        addZone(s.zones, z, ev);
    invertFairValueGaps(s.zones, bar.close, index, ev);
    for (const Zone& z : detectBalancedRanges(cfg.zones, s.zones, index)) addZone(s.zones, z, ev);

    ageAndInvalidate(s.zones, cfg.zones, bar.close, index, ev);

    for (const auto& u : findUnicornSetups(s.zones)) {
        if (u.newest_birth != index) continue;
        ev.push_back({EventKind::UnicornSetup, index, u.overlap.mean,
                      setupTag(EntryModel::Unicorn, u.direction, u.overlap)});
    }
}

void stepFlat(const EngineConfig& cfg, EngineState& s, const Bar& bar, long index,
              const SessionTime& time, StepResult& r) {
    const bool gates = entryGatesOpen(cfg, s.daily, time);
    const bool has_target = s.primary_target.has_value() || !cfg.liquidity.require_target;

    EntryInputs in;
    in.bar = &bar;
    in.index = index;
    in.zones = &s.zones;
    in.intraday = s.bias;
    in.htf = s.htf.bias();
    in.can_arm = gates && has_target && alignmentPermits(cfg.bias, s.bias);
    in.can_trigger = gates;
    in.long_allowed = directionAvailable(cfg, s.daily, Direction::Bullish);
    in.short_allowed = directionAvailable(cfg, s.daily, Direction::Bearish);

    const PendingEntry before = s.entry.pending;
    EntryStep step = stepEntry(cfg, s.entry, in);
    s.entry = step.slot;

    switch (step.transition) {
        case EntryTransition::None:
            break;
        case EntryTransition::Armed: {
            const PendingEntry& p = s.entry.pending;
            r.events.push_back({EventKind::EntryArmed, index, bar.close, setupTag(p.model, p.direction, p.bounds)});
            break;
        }
        case EntryTransition::TimedOut:
            r.events.push_back({EventKind::EntryTimeout, index, bar.close,
                                setupTag(before.model, before.direction, before.bounds)});
            break;
        case EntryTransition::ZoneLost:
            r.events.push_back({EventKind::EntryCancelled, index, bar.close,
                                setupTag(before.model, before.direction, before.bounds)});
            break;
        case EntryTransition::Triggered: {
            const PendingEntry& p = *step.triggered;
            OpenTrade t = openTrade(cfg, p, bar.close, index, s.swings, s.primary_target);
            consumeZone(s.zones, p.zone, index, r.events);
            s.daily = recordEntry(s.daily, p.direction, time);
            const bool is_long = t.isLong();
            r.events.push_back({is_long ? EventKind::EntryLong : EventKind::EntryShort, index,
                                t.entry_price, entryTag(t, p.bounds, s.primary_target)});
            r.commands.push_back({is_long ? CommandType::OpenLong : CommandType::OpenShort, t.quantity});
            s.trade = t;
            break;
        }
    }
}

} // namespace

StepResult processBar(const EngineConfig& cfg, const SessionClock& clock, EngineState state,
                      const Bar& bar, long bar_index) {
    StepResult r;
    if (bar_index <= state.last_index || !bar.complete) {
        r.state = std::move(state);
        return r;
    }
    const long index = bar_index;
    const std::optional<SessionTime> time = clock.sessionTime(bar);
    if (!time) {
        state.last_index = index;
        r.state = std::move(state);
        return r;
    }

    if (isNewDay(state.daily, *time)) {
        const bool first_day = !state.daily.day_id;
        if (state.trade) {
            append(r, flattenTrade(*state.trade, index, bar.open, EventKind::ExitEndOfDay, "session rollover"));
            state.trade.reset();
        }
        state.daily = startDay(state.daily, *time);
        state.zones.clear();
        // patterns never span the session boundary
        state.history.clear();
        state.entry = EntrySlot{};
        state.session.reset();
        if (!first_day)
            r.events.push_back({EventKind::DailyReset, index, bar.open, "day " + std::to_string(time->day_id)});
    }

    state.history.push(bar, index, static_cast<std::size_t>(cfg.max_history));
    if (time->hhmm >= cfg.session.trade_start && time->hhmm <= cfg.session.trade_end)
        state.session.update(bar);
    state.swings.update(state.history, index, cfg.swing.left, cfg.swing.right);
    state.ema.update(bar.close, cfg.bias.ma_period);
    if (cfg.bias.htf_mode != HtfMode::Off)
        state.htf.update(bar, time->absoluteMinute(), cfg);
    state.bias = structureBias(bar.close, state.ema.value(), state.swings);

    detectZones(cfg, state, bar, index, r.events);

    auto targets = collectTargets(cfg.liquidity, bar.close, state.session, state.swings);
    state.primary_target = selectPrimaryTarget(targets, bar.close, state.bias);

    if (!state.trade) {
        stepFlat(cfg, state, bar, index, *time, r);
    } else {
        std::optional<double> atr;
        if (cfg.exits.trail_mode == TrailMode::Atr)
            atr = averageTrueRange(state.history, index, cfg.exits.trail_atr_period);
        TradeStep ts = manageTrade(cfg, *state.trade, bar, index, *time, atr);
        append(r, ts);
        state.trade = ts.trade;
    }

    sweepZones(state.zones, cfg.zones);
    state.last_index = index;
    r.state = std::move(state);
    return r;
}

} // namespace zonetrade
