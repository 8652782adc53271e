#include "report.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <iostream>

namespace zonetrade {

Report::Report(const Simulator& sim, const DataSource& data, double initial_cash,
               const std::string& strategy_name, const std::string& strategy_params)
    : sim_(sim), data_(data), initial_cash_(initial_cash)
    , strategy_name_(strategy_name), strategy_params_(strategy_params) {}

void Report::writeBody(std::ostream& out) const {
    if (!stopped_reason_.empty())
        out << "*** Backtest stopped: " << stopped_reason_ << " ***\n\n";
    if (!strategy_name_.empty()) {
        out << "Strategy: " << strategy_name_;
        if (!strategy_params_.empty()) out << " (" << strategy_params_ << ")";
        out << "\n";
    }
    out << std::fixed << std::setprecision(2);
    out << "Bars loaded:     " << data_.size() << "\n";
    out << "Initial equity:  " << metrics_.initial_equity << "\n";
    out << "Final equity:    " << metrics_.final_equity << "\n";
    out << "Total return:    " << metrics_.total_return_pct << "%\n";
    out << "Max drawdown:    " << std::min(metrics_.max_drawdown_pct, 100.0) << "%\n";
    out << "Closed trades:   " << metrics_.num_trades << "\n";
    out << "Winning trades:  " << metrics_.winning_trades << "\n";
    out << "Win rate:        " << metrics_.win_rate_pct << "%\n";
    out << "Avg trade P&L:   " << metrics_.avg_trade_pnl << "\n";
    out << "Entries:         " << metrics_.entries << "\n";
    out << "Engine events:   " << metrics_.events << "\n";
    if (std::abs(metrics_.open_position) >= 1e-9) {
        out << "Open position:   " << metrics_.open_position
            << (metrics_.open_position > 0 ? " (long)" : " (short)") << "\n";
        out << "Unrealized P&L:  " << metrics_.unrealized_pnl << "\n";
    }
}

BacktestMetrics Report::computeMetrics() {
    BacktestMetrics m;
    m.initial_equity = initial_cash_;
    m.final_equity = sim_.equity();
    m.total_return_pct = (initial_cash_ != 0)
        ? ((m.final_equity - initial_cash_) / initial_cash_) * 100.0
        : 0;

    const auto& curve = sim_.equityCurve();
    if (curve.empty()) return m;

    double peak = curve[0];
    double max_dd = 0;
    for (double eq : curve) {
        if (eq > peak) peak = eq;
        double dd = (peak != 0) ? (peak - eq) / peak * 100.0 : 0;
        if (dd > max_dd) max_dd = dd;
    }
    m.max_drawdown_pct = max_dd;

    const auto& trades = sim_.trades();
    m.num_trades = static_cast<int>(trades.size());
    int wins = 0;
    double total_pnl = 0;
    for (const auto& t : trades) {
        if (t.pnl > 0) ++wins;
        total_pnl += t.pnl;
    }
    m.winning_trades = wins;
    m.win_rate_pct = (m.num_trades > 0) ? (100.0 * wins / m.num_trades) : 0;
    m.avg_trade_pnl = (m.num_trades > 0) ? (total_pnl / m.num_trades) : 0;

    // Open position at end (only closed trades counted in num_trades)
    double pos = sim_.position();
    double avg_entry = sim_.avgEntryPrice();
    double last_close = sim_.lastClose();
    m.open_position = pos;
    if (std::abs(pos) >= 1e-9 && last_close > 0)
        m.unrealized_pnl = pos * (last_close - avg_entry);

    return m;
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Report ==========\n";
    writeBody(out);
    out << "======================================\n\n";
}

namespace {
    void writeCsvQuoted(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            if (c == '"') out << "\"\"";
            else out << c;
        }
        out << '"';
    }
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "entry_time,exit_time,side,quantity,entry_price,exit_price,pnl,pnl_pct\n";
    f << std::fixed << std::setprecision(2);
    for (const auto& t : sim_.trades()) {
        writeCsvQuoted(f, t.entry_time);
        f << ',';
        writeCsvQuoted(f, t.exit_time);
        f << ',' << sideName(t.side) << ','
          << t.quantity << ',' << t.entry_price << ',' << t.exit_price << ','
          << t.pnl << ',' << t.pnl_pct << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "bar_index,timestamp,equity\n";
    f << std::fixed << std::setprecision(2);
    const auto& curve = sim_.equityCurve();
    const std::size_t n = std::min(curve.size(), data_.size());
    for (std::size_t i = 0; i < n; ++i) {
        f << i << ',';
        writeCsvQuoted(f, data_.at(i).timestamp);
        f << ',' << curve[i] << "\n";
    }
    for (std::size_t i = n; i < curve.size(); ++i)
        f << i << ",\"\"," << curve[i] << "\n";
    if (!f) {
        std::cerr << "Failed to write equity curve: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest Report\n";
    f << "================\n\n";
    writeBody(f);
    return f ? true : (std::cerr << "Failed to write report: " << filepath << "\n", false);
}

bool Report::writeEventLog(const std::string& filepath, const std::vector<EventRecord>& events) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "bar_index,timestamp,kind,price,tag\n";
    f << std::fixed << std::setprecision(2);
    for (const auto& r : events) {
        f << r.event.bar_index << ',';
        writeCsvQuoted(f, r.timestamp);
        f << ',' << eventKindName(r.event.kind) << ',' << r.event.price << ',';
        writeCsvQuoted(f, r.event.tag);
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write event log: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace zonetrade
