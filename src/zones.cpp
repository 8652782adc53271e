#include "zones.hpp"
#include <algorithm>
#include <cstdio>

namespace zonetrade {

ZoneBounds makeBounds(double a, double b) {
    ZoneBounds z;
    z.top = std::max(a, b);
    z.bottom = std::min(a, b);
    z.mean = (z.top + z.bottom) / 2.0;
    return z;
}

std::optional<ZoneBounds> overlap(const ZoneBounds& a, const ZoneBounds& b, double min_width) {
    double top = std::min(a.top, b.top);
    double bottom = std::max(a.bottom, b.bottom);
    if (top <= bottom || top - bottom < min_width) return std::nullopt;
    return makeBounds(top, bottom);
}

const ZoneBounds& Zone::bounds() const {
    return std::visit([](const auto& z) -> const ZoneBounds& { return z.bounds; }, shape);
}

ZoneId ZoneArena::insert(const Zone& zone) {
    std::size_t slot;
    if (!free_.empty()) {
        slot = free_.back();
        free_.pop_back();
    } else {
        slot = slots_.size();
        slots_.emplace_back();
    }
    Slot& s = slots_[slot];
    s.zone = zone;
    s.seq = next_seq_++;
    return ZoneId{slot, s.generation};
}

Zone* ZoneArena::get(ZoneId id) {
    if (id.slot >= slots_.size()) return nullptr;
    Slot& s = slots_[id.slot];
    if (s.generation != id.generation || !s.zone) return nullptr;
    return &*s.zone;
}

const Zone* ZoneArena::get(ZoneId id) const {
    if (id.slot >= slots_.size()) return nullptr;
    const Slot& s = slots_[id.slot];
    if (s.generation != id.generation || !s.zone) return nullptr;
    return &*s.zone;
}

bool ZoneArena::erase(ZoneId id) {
    if (!get(id)) return false;
    Slot& s = slots_[id.slot];
    s.zone.reset();
    ++s.generation;
    free_.push_back(id.slot);
    return true;
}

void ZoneArena::clear() {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i].zone) continue;
        slots_[i].zone.reset();
        ++slots_[i].generation;
        free_.push_back(i);
    }
}

std::vector<ZoneId> ZoneArena::ids() const {
    std::vector<std::pair<std::uint64_t, ZoneId>> live;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].zone) live.push_back({slots_[i].seq, ZoneId{i, slots_[i].generation}});
    }
    std::sort(live.begin(), live.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<ZoneId> out;
    out.reserve(live.size());
    for (const auto& p : live) out.push_back(p.second);
    return out;
}

std::vector<ZoneId> ZoneArena::ids(ZoneKind kind) const {
    std::vector<ZoneId> out;
    for (ZoneId id : ids()) {
        if (get(id)->kind() == kind) out.push_back(id);
    }
    return out;
}

std::size_t ZoneArena::size() const {
    return slots_.size() - free_.size();
}

std::size_t ZoneArena::count(ZoneKind kind) const {
    std::size_t n = 0;
    for (const auto& s : slots_) {
        if (s.zone && s.zone->kind() == kind) ++n;
    }
    return n;
}

std::size_t ZoneArena::sweep(const std::vector<std::size_t>& caps_by_kind) {
    std::size_t removed = 0;
    for (ZoneId id : ids()) {
        if (!get(id)->isActive()) {
            erase(id);
            ++removed;
        }
    }
    for (std::size_t k = 0; k < caps_by_kind.size(); ++k) {
        std::vector<ZoneId> of_kind = ids(static_cast<ZoneKind>(k));
        std::size_t cap = caps_by_kind[k];
        for (std::size_t i = 0; of_kind.size() > cap + i; ++i) {
            erase(of_kind[i]);
            ++removed;
        }
    }
    return removed;
}

const char* zoneKindName(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::OrderBlock: return "OB";
        case ZoneKind::Breaker: return "Breaker";
        case ZoneKind::FairValueGap: return "FVG";
        case ZoneKind::InvertedFvg: return "IFVG";
        case ZoneKind::BalancedRange: return "BPR";
    }
    return "?";
}

const char* directionName(Direction d) {
    return d == Direction::Bullish ? "bullish" : "bearish";
}

std::string describeZone(const Zone& zone) {
    const ZoneBounds& b = zone.bounds();
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s %s [%.2f, %.2f]",
                  zoneKindName(zone.kind()), directionName(zone.direction), b.bottom, b.top);
    std::string s(buf);
    if (const auto* br = std::get_if<Breaker>(&zone.shape))
        s += br->origin == BreakerOrigin::Flip ? " flip" : " structure";
    return s;
}

} // namespace zonetrade
