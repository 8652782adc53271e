#include "zone_detectors.hpp"
#include <algorithm>
#include <cmath>

namespace zonetrade {

namespace {

constexpr double SAME_LEVEL_EPS = 1e-9;

Zone makeZone(ZoneShape shape, Direction dir, long index) {
    Zone z;
    z.shape = shape;
    z.direction = dir;
    z.birth_index = index;
    return z;
}

/// Length of the run of bars ending at index-1 that satisfy pred, capped at max_run.
template <typename Pred>
int runLength(const BarHistory& history, long index, int max_run, Pred pred) {
    int n = 0;
    for (long i = index - 1; n < max_run; --i) {
        const Bar* b = history.at(i);
        if (!b || !pred(*b)) break;
        ++n;
    }
    return n;
}

/// Body span of bars [index - n, index).
ZoneBounds bodySpan(const BarHistory& history, long index, int n) {
    double top = -1e300;
    double bottom = 1e300;
    for (long i = index - n; i < index; ++i) {
        const Bar* b = history.at(i);
        top = std::max(top, std::max(b->open, b->close));
        bottom = std::min(bottom, std::min(b->open, b->close));
    }
    return makeBounds(top, bottom);
}

bool hasBreaker(const ZoneArena& zones, Direction dir, const ZoneBounds& b) {
    for (ZoneId id : zones.ids(ZoneKind::Breaker)) {
        const Zone* z = zones.get(id);
        if (z->direction != dir) continue;
        if (std::abs(z->bounds().top - b.top) < SAME_LEVEL_EPS &&
            std::abs(z->bounds().bottom - b.bottom) < SAME_LEVEL_EPS)
            return true;
    }
    return false;
}

} // namespace

std::vector<Zone> detectOrderBlocks(const ZoneParams& p, const BarHistory& history, long index) {
    std::vector<Zone> out;
    const Bar* cur = history.at(index);
    if (!cur) return out;

    if (cur->upClose()) {
        int n = runLength(history, index, p.ob_max_run, [](const Bar& b) { return b.downClose(); });
        if (n >= p.ob_min_candles) {
            ZoneBounds span = bodySpan(history, index, n);
            if (cur->close > span.top)
                out.push_back(makeZone(OrderBlock{span, false}, Direction::Bullish, index));
        }
    } else if (cur->downClose()) {
        int n = runLength(history, index, p.ob_max_run, [](const Bar& b) { return b.upClose(); });
        if (n >= p.ob_min_candles) {
            ZoneBounds span = bodySpan(history, index, n);
            if (cur->close < span.bottom)
                out.push_back(makeZone(OrderBlock{span, false}, Direction::Bearish, index));
        }
    }
    return out;
}

std::vector<Zone> detectFairValueGaps(const ZoneParams& p, const BarHistory& history, long index) {
    std::vector<Zone> out;
    const Bar* c1 = history.at(index - 2);
    const Bar* c3 = history.at(index);
    if (!c1 || !c3) return out;

    if (c3->low > c1->high && c3->low - c1->high >= p.fvg_min_gap)
        out.push_back(makeZone(FairValueGap{makeBounds(c3->low, c1->high)}, Direction::Bullish, index));
    if (c1->low > c3->high && c1->low - c3->high >= p.fvg_min_gap)
        out.push_back(makeZone(FairValueGap{makeBounds(c1->low, c3->high)}, Direction::Bearish, index));
    return out;
}

std::vector<Zone> detectStructureBreakers(const ZoneParams& p, const BarHistory& history, long index,
                                          const SwingTracker& swings, const ZoneArena& zones) {
    std::vector<Zone> out;
    const Bar* cur = history.at(index);
    const auto& sh = swings.lastHigh();
    const auto& sl = swings.lastLow();
    if (!cur || !sh || !sl) return out;

    const bool displaced = !p.breaker_require_displacement || cur->body() > p.breaker_displacement_body;
    const long stop = index - p.breaker_sweep_lookback;

    if (displaced && cur->close > sh->price) {
        for (long i = index - 1; i > sl->bar_index && i > stop; --i) {
            const Bar* b = history.at(i);
            if (!b) break;
            if (b->low < sl->price) {
                ZoneBounds bounds = makeBounds(b->low, sl->price + p.breaker_structure_buffer);
                if (!hasBreaker(zones, Direction::Bullish, bounds))
                    out.push_back(makeZone(Breaker{bounds, BreakerOrigin::Structure}, Direction::Bullish, index));
                break;
            }
        }
    }

    if (displaced && cur->close < sl->price) {
        for (long i = index - 1; i > sh->bar_index && i > stop; --i) {
            const Bar* b = history.at(i);
            if (!b) break;
            if (b->high > sh->price) {
                ZoneBounds bounds = makeBounds(sh->price - p.breaker_structure_buffer, b->high);
                if (!hasBreaker(zones, Direction::Bearish, bounds))
                    out.push_back(makeZone(Breaker{bounds, BreakerOrigin::Structure}, Direction::Bearish, index));
                break;
            }
        }
    }
    return out;
}

std::vector<Zone> detectBalancedRanges(const ZoneParams& p, const ZoneArena& zones, long index) {
    std::vector<Zone> out;
    std::vector<ZoneBounds> known;
    for (ZoneId id : zones.ids(ZoneKind::BalancedRange)) known.push_back(zones.get(id)->bounds());

    auto duplicate = [&](const ZoneBounds& b) {
        for (const auto& k : known) {
            if (std::abs(k.top - b.top) < p.bpr_dedupe_tolerance &&
                std::abs(k.bottom - b.bottom) < p.bpr_dedupe_tolerance)
                return true;
        }
        return false;
    };

    const std::vector<ZoneId> fvgs = zones.ids(ZoneKind::FairValueGap);
    for (ZoneKind kind : {ZoneKind::InvertedFvg, ZoneKind::Breaker}) {
        for (ZoneId oid : zones.ids(kind)) {
            const Zone* other = zones.get(oid);
            if (!other->isActive()) continue;
            for (ZoneId fid : fvgs) {
                const Zone* fvg = zones.get(fid);
                if (!fvg->isActive() || fvg->direction != other->direction) continue;
                if (kind == ZoneKind::InvertedFvg && fvg->birth_index == other->birth_index) continue;
                auto ov = overlap(other->bounds(), fvg->bounds(), p.bpr_min_width);
                if (!ov || duplicate(*ov)) continue;
                known.push_back(*ov);
                out.push_back(makeZone(BalancedRange{*ov}, other->direction, index));
            }
        }
    }
    return out;
}

std::vector<UnicornSetup> findUnicornSetups(const ZoneArena& zones) {
    std::vector<UnicornSetup> out;
    for (ZoneId bid : zones.ids(ZoneKind::Breaker)) {
        const Zone* br = zones.get(bid);
        if (!br->isActive()) continue;
        for (ZoneKind kind : {ZoneKind::BalancedRange, ZoneKind::InvertedFvg}) {
            for (ZoneId pid : zones.ids(kind)) {
                const Zone* partner = zones.get(pid);
                if (!partner->isActive() || partner->direction != br->direction) continue;
                auto ov = overlap(br->bounds(), partner->bounds());
                if (!ov) continue;
                out.push_back({bid, pid, *ov, br->direction,
                               std::max(br->birth_index, partner->birth_index)});
            }
        }
    }
    return out;
}

} // namespace zonetrade
