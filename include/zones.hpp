#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zonetrade {

enum class Direction { Bullish, Bearish };

enum class ZoneKind { OrderBlock, Breaker, FairValueGap, InvertedFvg, BalancedRange };

enum class Validity { Active, Violated, Expired, Consumed };

enum class BreakerOrigin { Flip, Structure };

/// Price span of a zone. top >= bottom; mean is fixed at creation.
struct ZoneBounds {
    double top{0};
    double bottom{0};
    double mean{0};

    bool contains(double price) const { return price >= bottom && price <= top; }
};

/// Orders the two edges so top >= bottom and fixes the mean.
ZoneBounds makeBounds(double a, double b);

/// Overlap of two spans; std::nullopt when they do not overlap or the overlap is narrower than min_width.
std::optional<ZoneBounds> overlap(const ZoneBounds& a, const ZoneBounds& b, double min_width = 0.0);

struct OrderBlock {
    ZoneBounds bounds;
    bool violated{false};  // set once when closed through; the flip to a Breaker follows
};

struct Breaker {
    ZoneBounds bounds;
    BreakerOrigin origin{BreakerOrigin::Flip};
};

struct FairValueGap {
    ZoneBounds bounds;
};

struct InvertedFvg {
    ZoneBounds bounds;
};

struct BalancedRange {
    ZoneBounds bounds;
};

/// Alternative order matches ZoneKind.
using ZoneShape = std::variant<OrderBlock, Breaker, FairValueGap, InvertedFvg, BalancedRange>;

struct Zone {
    ZoneShape shape;
    Direction direction{Direction::Bullish};
    long birth_index{0};
    Validity validity{Validity::Active};

    const ZoneBounds& bounds() const;
    ZoneKind kind() const { return static_cast<ZoneKind>(shape.index()); }
    bool isActive() const { return validity == Validity::Active; }
};

/// Stable handle into a ZoneArena. A handle whose slot was reused no longer resolves.
struct ZoneId {
    std::size_t slot{0};
    std::uint32_t generation{0};

    bool operator==(const ZoneId& o) const { return slot == o.slot && generation == o.generation; }
    bool operator!=(const ZoneId& o) const { return !(*this == o); }
};

/// Owns the zone set. Slots are recycled; each reuse bumps the slot's generation so stale
/// ZoneIds resolve to nullptr instead of a different zone.
class ZoneArena {
public:
    ZoneId insert(const Zone& zone);

    Zone* get(ZoneId id);
    const Zone* get(ZoneId id) const;

    bool erase(ZoneId id);
    void clear();

    /// Live zones, oldest first.
    std::vector<ZoneId> ids() const;
    std::vector<ZoneId> ids(ZoneKind kind) const;

    std::size_t size() const;
    std::size_t count(ZoneKind kind) const;

    /// Drop zones that are no longer Active, then trim each kind to its cap (oldest first).
    /// Returns the number of zones removed.
    std::size_t sweep(const std::vector<std::size_t>& caps_by_kind);

private:
    struct Slot {
        std::optional<Zone> zone;
        std::uint32_t generation{0};
        std::uint64_t seq{0};
    };

    std::vector<Slot> slots_;
    std::vector<std::size_t> free_;
    std::uint64_t next_seq_{0};
};

const char* zoneKindName(ZoneKind kind);
const char* directionName(Direction d);

/// e.g. "Breaker bullish [21820.00, 21830.00]"
std::string describeZone(const Zone& zone);

} // namespace zonetrade
