#pragma once

#include "simulator.hpp"
#include "data_source.hpp"
#include "events.hpp"
#include <vector>
#include <string>
#include <ostream>
#include <iostream>

namespace zonetrade {

/// Backtest metrics for reporting.
struct BacktestMetrics {
    double total_return_pct{0};   // (final_equity - initial) / initial * 100
    double max_drawdown_pct{0};   // max peak-to-trough decline %
    int num_trades{0};            // closing fills (a partial exit counts on its own)
    int winning_trades{0};
    double win_rate_pct{0};
    double avg_trade_pnl{0};
    double initial_equity{0};
    double final_equity{0};
    double open_position{0};      // contracts at end (+ long, - short); 0 = flat
    double unrealized_pnl{0};     // mark-to-market P&L on open position
    int entries{0};               // entry signals acted on
    int events{0};                // engine events logged
};

class Report {
public:
    /// strategy_name and strategy_params are included in report output (e.g. "zone", "target.r=2 stop.min=10").
    Report(const Simulator& sim, const DataSource& data, double initial_cash,
           const std::string& strategy_name = "",
           const std::string& strategy_params = "");

    /// Compute all metrics from simulator and equity curve.
    BacktestMetrics computeMetrics();

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write trade log CSV to file. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write equity curve CSV to file. Returns false and logs to stderr on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    /// Write the engine event log CSV (bar_index, timestamp, kind, price, tag). Returns false and logs to stderr on failure.
    bool writeEventLog(const std::string& filepath, const std::vector<EventRecord>& events) const;

    void setMetrics(const BacktestMetrics& m) { metrics_ = m; }

    void setStoppedReason(const std::string& reason) { stopped_reason_ = reason; }

private:
    /// Stop reason, strategy line and metrics, shared by the console summary and report.txt.
    void writeBody(std::ostream& out) const;

    const Simulator& sim_;
    const DataSource& data_;
    double initial_cash_;
    std::string strategy_name_;
    std::string strategy_params_;
    std::string stopped_reason_;
    BacktestMetrics metrics_;
};

} // namespace zonetrade
