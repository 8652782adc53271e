#pragma once

#include "bar_history.hpp"
#include "config.hpp"
#include "swing_tracker.hpp"
#include "zones.hpp"
#include <vector>

namespace zonetrade {

// Detectors look at the last few bars (and, for derived zones, the live zone set) and
// return candidate zones. They never modify anything; too little history yields nothing.

/// Run of down closes (at least ob.min_candles, at most ob.max_run) ending on the previous
/// bar, then an up close above the run's body high: bullish OB over the run's bodies.
/// Up-close run broken by a down close below the body low: bearish OB.
std::vector<Zone> detectOrderBlocks(const ZoneParams& p, const BarHistory& history, long index);

/// Three-bar imbalance between bar index-2 and bar index. Gap must be >= fvg.min_gap.
std::vector<Zone> detectFairValueGaps(const ZoneParams& p, const BarHistory& history, long index);

/// Sweep of the last swing low within breaker.sweep_lookback bars, then a displacement close
/// above the last swing high: bullish Breaker [sweep low, swing low + buffer]. Bearish mirrors it.
/// Skips zones already present in `zones` with the same bounds.
std::vector<Zone> detectStructureBreakers(const ZoneParams& p, const BarHistory& history, long index,
                                          const SwingTracker& swings, const ZoneArena& zones);

/// Overlap of an active FVG with an active IFVG (from a different bar) or Breaker of the same
/// direction. Deduplicated against live BPRs within bpr.dedupe_tolerance.
std::vector<Zone> detectBalancedRanges(const ZoneParams& p, const ZoneArena& zones, long index);

/// Breaker overlapping an active BPR or IFVG of the same direction.
struct UnicornSetup {
    ZoneId breaker;
    ZoneId partner;
    ZoneBounds overlap;
    Direction direction{Direction::Bullish};
    long newest_birth{0};  // later birth index of the two zones
};

std::vector<UnicornSetup> findUnicornSetups(const ZoneArena& zones);

} // namespace zonetrade
