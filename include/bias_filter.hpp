#pragma once

#include "bar.hpp"
#include "bar_history.hpp"
#include "config.hpp"
#include "swing_tracker.hpp"
#include "zones.hpp"
#include <optional>

namespace zonetrade {

enum class Bias { Bearish = -1, Neutral = 0, Bullish = 1 };

/// Exponential moving average seeded with the simple average of the first `period` values.
class Ema {
public:
    void update(double value, int period);
    std::optional<double> value() const { return value_; }

private:
    std::optional<double> value_;
    int count_{0};
    double seed_sum_{0};
};

/// Bullish when close is above the average and the swing lows step up;
/// Bearish when close is below and the swing highs step down; otherwise Neutral.
Bias structureBias(double close, const std::optional<double>& average, const SwingTracker& swings);

/// Builds higher-timeframe bars from execution bars (bucket = absolute minute / htf_minutes)
/// and runs the same average + swing bias on each completed HTF bar.
class HtfBiasTracker {
public:
    /// Feed one execution bar. Returns true when this bar closed out the previous HTF bar.
    bool update(const Bar& bar, long absolute_minute, const EngineConfig& cfg);

    Bias bias() const { return bias_; }
    long completedBars() const { return next_index_; }

private:
    std::optional<Bar> building_;
    long bucket_{0};
    long next_index_{0};
    BarHistory history_;
    SwingTracker swings_;
    Ema ema_;
    Bias bias_{Bias::Neutral};
};

/// Simple ATR: mean of the last `period` true ranges ending at `index`.
std::optional<double> averageTrueRange(const BarHistory& history, long index, int period);

/// Whether a trade in `dir` passes the higher-timeframe gate.
/// Strict: HTF bias must equal the direction. Loose: a counter-HTF trade needs a Unicorn
/// when bias.loose_counter_unicorn_only is set. Off: always.
bool htfAllows(const BiasParams& p, Bias htf, Direction dir, bool unicorn);

/// Alignment permission: Off is always permitted; Strict/Loose need a non-Neutral
/// intraday bias when bias.require_align is on.
bool alignmentPermits(const BiasParams& p, Bias intraday);

/// Intraday bias rule per zone: bullish setups need bias >= Neutral, bearish <= Neutral.
bool biasAllows(Bias intraday, Direction dir);

} // namespace zonetrade
