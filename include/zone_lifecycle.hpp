#pragma once

#include "config.hpp"
#include "events.hpp"
#include "zones.hpp"
#include <cstddef>
#include <vector>

namespace zonetrade {

// The only code that mutates zones after creation. Every change is reported as an Event.

/// Insert a detector's zone and report it.
ZoneId addZone(ZoneArena& zones, const Zone& zone, std::vector<Event>& events);

/// Active, unviolated OBs closed through on the far side become Violated, and a Breaker with the
/// same bounds and the opposite direction is added. Returns the new breakers.
std::vector<ZoneId> flipViolatedOrderBlocks(ZoneArena& zones, double close, long index,
                                            std::vector<Event>& events);

/// Active FVGs closed beyond their far edge are Consumed and replaced by an IFVG of the
/// opposite direction over the same span. Returns the new IFVGs.
std::vector<ZoneId> invertFairValueGaps(ZoneArena& zones, double close, long index,
                                        std::vector<Event>& events);

/// Expire zones older than zone.max_age, and mark Violated the ones the close went through
/// against their direction. Breakers and IFVGs flipped on this bar are left alone.
void ageAndInvalidate(ZoneArena& zones, const ZoneParams& p, double close, long index,
                      std::vector<Event>& events);

/// Mark a zone used by an entry. No-op for stale ids.
void consumeZone(ZoneArena& zones, ZoneId id, long index, std::vector<Event>& events);

/// Per-kind caps in ZoneKind order.
std::vector<std::size_t> zoneCaps(const ZoneParams& p);

/// End-of-bar sweep: drop non-active zones, then enforce the caps.
std::size_t sweepZones(ZoneArena& zones, const ZoneParams& p);

} // namespace zonetrade
