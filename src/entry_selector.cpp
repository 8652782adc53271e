#include "entry_selector.hpp"
#include "zone_detectors.hpp"

namespace zonetrade {

namespace {

bool directionOk(const EngineConfig& cfg, const EntryInputs& in, Direction dir, bool unicorn) {
    if (dir == Direction::Bullish && !in.long_allowed) return false;
    if (dir == Direction::Bearish && !in.short_allowed) return false;
    return biasAllows(in.intraday, dir) && htfAllows(cfg.bias, in.htf, dir, unicorn);
}

PendingEntry makePending(ZoneId id, EntryModel model, Direction dir, const ZoneBounds& b, long index) {
    PendingEntry p;
    p.zone = id;
    p.model = model;
    p.direction = dir;
    p.bounds = b;
    p.armed_index = index;
    return p;
}

/// First active zone of `kind` containing close that passes the direction gates.
std::optional<PendingEntry> firstContaining(const EngineConfig& cfg, const EntryInputs& in,
                                            ZoneKind kind, EntryModel model) {
    const double close = in.bar->close;
    for (ZoneId id : in.zones->ids(kind)) {
        const Zone* z = in.zones->get(id);
        if (!z->isActive() || !z->bounds().contains(close)) continue;
        if (model == EntryModel::ObMean && cfg.zones.ob_mean_threshold) {
            if (z->direction == Direction::Bullish && close < z->bounds().mean) continue;
            if (z->direction == Direction::Bearish && close > z->bounds().mean) continue;
        }
        if (!directionOk(cfg, in, z->direction, false)) continue;
        return makePending(id, model, z->direction, z->bounds(), in.index);
    }
    return std::nullopt;
}

} // namespace

const char* modelName(EntryModel m) {
    switch (m) {
        case EntryModel::Unicorn: return "UN1_UNICORN";
        case EntryModel::BreakerRetap: return "BR1_BREAKER";
        case EntryModel::IfvgFlip: return "IF1_IFVG";
        case EntryModel::ObMean: return "OB1_MEAN";
    }
    return "?";
}

std::optional<PendingEntry> findSetup(const EngineConfig& cfg, const EntryInputs& in) {
    const double close = in.bar->close;

    if (cfg.entry.enable_unicorn) {
        for (const auto& u : findUnicornSetups(*in.zones)) {
            if (!u.overlap.contains(close)) continue;
            if (!directionOk(cfg, in, u.direction, true)) continue;
            return makePending(u.breaker, EntryModel::Unicorn, u.direction, u.overlap, in.index);
        }
    }
    if (cfg.entry.enable_breaker) {
        if (auto p = firstContaining(cfg, in, ZoneKind::Breaker, EntryModel::BreakerRetap)) return p;
    }
    if (cfg.entry.enable_ifvg) {
        if (auto p = firstContaining(cfg, in, ZoneKind::InvertedFvg, EntryModel::IfvgFlip)) return p;
    }
    if (cfg.entry.enable_ob) {
        if (auto p = firstContaining(cfg, in, ZoneKind::OrderBlock, EntryModel::ObMean)) return p;
    }
    return std::nullopt;
}

bool isConfirmation(const PendingEntry& pending, const Bar& bar) {
    if (pending.direction == Direction::Bullish)
        return bar.close > bar.open && bar.close >= pending.bounds.mean;
    return bar.close < bar.open && bar.close <= pending.bounds.mean;
}

EntryStep stepEntry(const EngineConfig& cfg, const EntrySlot& slot, const EntryInputs& in) {
    EntryStep step;
    step.slot = slot;

    switch (slot.state) {
        case EntryState::Idle: {
            if (!in.can_arm) return step;
            if (auto setup = findSetup(cfg, in)) {
                step.slot.state = EntryState::Pending;
                step.slot.pending = *setup;
                step.transition = EntryTransition::Armed;
            }
            return step;
        }
        case EntryState::Pending: {
            const PendingEntry& p = slot.pending;
            if (in.index - p.armed_index > cfg.entry.max_wait_bars) {
                step.slot = EntrySlot{};
                step.transition = EntryTransition::TimedOut;
                return step;
            }
            const Zone* z = in.zones->get(p.zone);
            if (!z || !z->isActive()) {
                step.slot = EntrySlot{};
                step.transition = EntryTransition::ZoneLost;
                return step;
            }
            if (in.index > p.armed_index && in.can_trigger && isConfirmation(p, *in.bar)) {
                step.slot = EntrySlot{};
                step.transition = EntryTransition::Triggered;
                step.triggered = p;
            }
            return step;
        }
    }
    return step;
}

} // namespace zonetrade
