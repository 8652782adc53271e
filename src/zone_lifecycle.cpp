#include "zone_lifecycle.hpp"
#include <variant>

namespace zonetrade {

namespace {

Direction flip(Direction d) {
    return d == Direction::Bullish ? Direction::Bearish : Direction::Bullish;
}

/// Closed through the zone against its direction.
bool closedThrough(const Zone& z, double close) {
    return z.direction == Direction::Bullish ? close < z.bounds().bottom : close > z.bounds().top;
}

void report(std::vector<Event>& events, EventKind kind, long index, const Zone& z) {
    double price = z.direction == Direction::Bullish ? z.bounds().bottom : z.bounds().top;
    events.push_back({kind, index, price, describeZone(z)});
}

/// Breakers and IFVGs made by this bar's flip pass were created by the close itself.
bool flippedThisBar(const Zone& z, long index) {
    if (z.birth_index != index) return false;
    if (const auto* br = std::get_if<Breaker>(&z.shape)) return br->origin == BreakerOrigin::Flip;
    return z.kind() == ZoneKind::InvertedFvg;
}

} // namespace

ZoneId addZone(ZoneArena& zones, const Zone& zone, std::vector<Event>& events) {
    ZoneId id = zones.insert(zone);
    report(events, EventKind::ZoneCreated, zone.birth_index, zone);
    return id;
}

std::vector<ZoneId> flipViolatedOrderBlocks(ZoneArena& zones, double close, long index,
                                            std::vector<Event>& events) {
    std::vector<ZoneId> created;
    for (ZoneId id : zones.ids(ZoneKind::OrderBlock)) {
        Zone* z = zones.get(id);
        auto* ob = std::get_if<OrderBlock>(&z->shape);
        if (!z->isActive() || ob->violated || z->birth_index == index) continue;
        if (!closedThrough(*z, close)) continue;

        ob->violated = true;
        z->validity = Validity::Violated;
        report(events, EventKind::ZoneInvalidated, index, *z);

        Zone breaker;
        breaker.shape = Breaker{ob->bounds, BreakerOrigin::Flip};
        breaker.direction = flip(z->direction);
        breaker.birth_index = index;
        // z may dangle after insert if the slot vector grows
        created.push_back(addZone(zones, breaker, events));
    }
    return created;
}

std::vector<ZoneId> invertFairValueGaps(ZoneArena& zones, double close, long index,
                                        std::vector<Event>& events) {
    std::vector<ZoneId> created;
    for (ZoneId id : zones.ids(ZoneKind::FairValueGap)) {
        Zone* z = zones.get(id);
        if (!z->isActive() || z->birth_index == index) continue;
        if (!closedThrough(*z, close)) continue;

        z->validity = Validity::Consumed;
        report(events, EventKind::ZoneConsumed, index, *z);

        Zone ifvg;
        ifvg.shape = InvertedFvg{z->bounds()};
        ifvg.direction = flip(z->direction);
        ifvg.birth_index = index;
        created.push_back(addZone(zones, ifvg, events));
    }
    return created;
}

void ageAndInvalidate(ZoneArena& zones, const ZoneParams& p, double close, long index,
                      std::vector<Event>& events) {
    for (ZoneId id : zones.ids()) {
        Zone* z = zones.get(id);
        if (!z->isActive() || flippedThisBar(*z, index)) continue;

        if (index - z->birth_index > p.max_age) {
            z->validity = Validity::Expired;
            report(events, EventKind::ZoneExpired, index, *z);
            continue;
        }
        // FVGs that are closed through invert instead
        if (z->kind() == ZoneKind::FairValueGap) continue;
        if (closedThrough(*z, close)) {
            if (auto* ob = std::get_if<OrderBlock>(&z->shape)) ob->violated = true;
            z->validity = Validity::Violated;
            report(events, EventKind::ZoneInvalidated, index, *z);
        }
    }
}

void consumeZone(ZoneArena& zones, ZoneId id, long index, std::vector<Event>& events) {
    Zone* z = zones.get(id);
    if (!z || !z->isActive()) return;
    z->validity = Validity::Consumed;
    report(events, EventKind::ZoneConsumed, index, *z);
}

std::vector<std::size_t> zoneCaps(const ZoneParams& p) {
    return {
        static_cast<std::size_t>(p.max_ob),
        static_cast<std::size_t>(p.max_breaker),
        static_cast<std::size_t>(p.max_fvg),
        static_cast<std::size_t>(p.max_ifvg),
        static_cast<std::size_t>(p.max_bpr),
    };
}

std::size_t sweepZones(ZoneArena& zones, const ZoneParams& p) {
    return zones.sweep(zoneCaps(p));
}

} // namespace zonetrade
