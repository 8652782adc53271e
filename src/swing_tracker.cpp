#include "swing_tracker.hpp"

namespace zonetrade {

int SwingTracker::update(const BarHistory& history, long index, int left, int right) {
    const long pivot = index - right;
    const Bar* p = history.at(pivot);
    if (!p || !history.at(pivot - left) || !history.at(index)) return 0;

    bool is_high = true;
    bool is_low = true;
    for (long i = pivot - left; i <= index; ++i) {
        if (i == pivot) continue;
        const Bar* b = history.at(i);
        if (b->high >= p->high) is_high = false;
        if (b->low <= p->low) is_low = false;
    }

    int confirmed = 0;
    if (is_high) {
        prev_high_ = last_high_;
        last_high_ = SwingPoint{p->high, pivot, SwingKind::High};
        ++confirmed;
    }
    if (is_low) {
        prev_low_ = last_low_;
        last_low_ = SwingPoint{p->low, pivot, SwingKind::Low};
        ++confirmed;
    }
    return confirmed;
}

bool SwingTracker::higherLow() const {
    return last_low_ && prev_low_ && last_low_->price > prev_low_->price;
}

bool SwingTracker::lowerHigh() const {
    return last_high_ && prev_high_ && last_high_->price < prev_high_->price;
}

} // namespace zonetrade
