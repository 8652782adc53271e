#include "bias_filter.hpp"
#include <algorithm>
#include <cmath>

namespace zonetrade {

void Ema::update(double value, int period) {
    if (period <= 0) return;
    if (count_ < period) {
        seed_sum_ += value;
        ++count_;
        if (count_ == period) value_ = seed_sum_ / period;
        return;
    }
    const double k = 2.0 / (period + 1.0);
    value_ = value * k + *value_ * (1.0 - k);
}

Bias structureBias(double close, const std::optional<double>& average, const SwingTracker& swings) {
    if (!average) return Bias::Neutral;
    if (close > *average && swings.higherLow()) return Bias::Bullish;
    if (close < *average && swings.lowerHigh()) return Bias::Bearish;
    return Bias::Neutral;
}

bool HtfBiasTracker::update(const Bar& bar, long absolute_minute, const EngineConfig& cfg) {
    const long bucket = absolute_minute / cfg.bias.htf_minutes;
    if (!building_) {
        building_ = bar;
        bucket_ = bucket;
        return false;
    }
    if (bucket == bucket_) {
        Bar& agg = *building_;
        agg.high = std::max(agg.high, bar.high);
        agg.low = std::min(agg.low, bar.low);
        agg.close = bar.close;
        agg.volume += bar.volume;
        return false;
    }

    const Bar done = *building_;
    const long index = next_index_++;
    history_.push(done, index, static_cast<std::size_t>(cfg.max_history));
    swings_.update(history_, index, cfg.swing.left, cfg.swing.right);
    ema_.update(done.close, cfg.bias.ma_period);
    bias_ = structureBias(done.close, ema_.value(), swings_);

    building_ = bar;
    bucket_ = bucket;
    return true;
}

std::optional<double> averageTrueRange(const BarHistory& history, long index, int period) {
    if (period <= 0) return std::nullopt;
    double sum = 0;
    for (long i = index - period + 1; i <= index; ++i) {
        const Bar* b = history.at(i);
        const Bar* prev = history.at(i - 1);
        if (!b || !prev) return std::nullopt;
        double tr = std::max({b->high - b->low,
                              std::abs(b->high - prev->close),
                              std::abs(b->low - prev->close)});
        sum += tr;
    }
    return sum / period;
}

bool htfAllows(const BiasParams& p, Bias htf, Direction dir, bool unicorn) {
    const Bias wanted = dir == Direction::Bullish ? Bias::Bullish : Bias::Bearish;
    switch (p.htf_mode) {
        case HtfMode::Off:
            return true;
        case HtfMode::Strict:
            return htf == wanted;
        case HtfMode::Loose:
            if (htf == Bias::Neutral || htf == wanted) return true;
            return !p.loose_counter_unicorn_only || unicorn;
    }
    return false;
}

bool alignmentPermits(const BiasParams& p, Bias intraday) {
    if (p.htf_mode == HtfMode::Off || !p.require_align) return true;
    return intraday != Bias::Neutral;
}

bool biasAllows(Bias intraday, Direction dir) {
    return dir == Direction::Bullish ? intraday != Bias::Bearish : intraday != Bias::Bullish;
}

} // namespace zonetrade
