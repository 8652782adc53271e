#pragma once

#include "bar.hpp"
#include <cstddef>
#include <deque>

namespace zonetrade {

/// Rolling window of the most recent bars, addressed by absolute bar index.
/// Indices must be consecutive; a gap restarts the window.
class BarHistory {
public:
    void push(const Bar& bar, long index, std::size_t max_size) {
        if (!bars_.empty() && index != last_index_ + 1) bars_.clear();
        if (bars_.empty()) first_index_ = index;
        bars_.push_back(bar);
        last_index_ = index;
        while (bars_.size() > max_size) {
            bars_.pop_front();
            ++first_index_;
        }
    }

    /// nullptr when the bar has left the window (or was never seen).
    const Bar* at(long index) const {
        if (bars_.empty() || index < first_index_ || index > last_index_) return nullptr;
        return &bars_[static_cast<std::size_t>(index - first_index_)];
    }

    void clear() {
        bars_.clear();
        last_index_ = -1;
    }

    bool empty() const { return bars_.empty(); }
    std::size_t size() const { return bars_.size(); }
    long firstIndex() const { return first_index_; }

private:
    std::deque<Bar> bars_;
    long first_index_{0};
    long last_index_{-1};
};

} // namespace zonetrade
