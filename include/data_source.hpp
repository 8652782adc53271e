#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>

namespace zonetrade {

/// Loads OHLC bars from a CSV file.
/// CSV: expected columns timestamp/date, open, high, low, close [, volume] in any order.
/// Rows that fail to parse are skipped.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from CSV file. Returns false if the file is missing or lacks a required column.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    /// Get bar at index (0-based). Throws std::out_of_range.
    const Bar& at(std::size_t i) const { return bars_.at(i); }

    /// Aggregate 1m bars to "5m", "15m", "30m" or "1h" (also "1hr"); "1m" or "" = no-op.
    /// Returns false for an unknown resolution. Buckets are aligned to the start of the day.
    /// OHLCV: open=first, high=max, low=min, close=last, volume=sum.
    bool aggregateBars(const std::string& resolution);

private:
    std::string filepath_;
    std::vector<Bar> bars_;

    std::optional<Bar> parseLine(const std::string& line,
                                 const std::vector<std::string>& headers) const;
};

} // namespace zonetrade
