#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include "context.hpp"
#include "data_source.hpp"
#include "simulator.hpp"
#include <memory>
#include <string>

namespace zonetrade {

/// IContext backed by the simulator: orders are queued and fill at the next bar's open.
class BacktestContext : public IContext {
public:
    BacktestContext(Simulator& sim, const std::vector<Bar>& bars, double tick_size);

    void openLong(double quantity) override;
    void openShort(double quantity) override;
    void partialClose(double quantity) override;
    void closeAll() override;
    double position() const override;
    double roundToTick(double price) const override;
    double lastPrice() const override;
    std::size_t barIndex() const override;
    const std::vector<Bar>& bars() const override;

    void setBarIndex(std::size_t i) { bar_index_ = i; }

private:
    Simulator& sim_;
    const std::vector<Bar>& bars_;
    double tick_size_;
    std::size_t bar_index_{0};
};

struct BacktestOptions {
    double initial_cash = 100000.0;
    double commission = 0.0;
    double slippage = 0.0;             // fraction of fill price
    std::string bar_resolution = "1m"; // see DataSource::aggregateBars
    double tick_size = 0.25;
};

/// Orchestrates the backtest: feed bars to strategy, run simulator, collect results.
class Backtester {
public:
    Backtester(std::unique_ptr<IStrategy> strategy,
               const std::string& data_path,
               const BacktestOptions& options = BacktestOptions{});

    /// Run the backtest. Returns false and fills error_msg if data failed to load.
    /// If equity <= 0 or max drawdown >= 100%, stops early and sets stoppedEarly() / stopReason().
    bool run(std::string& error_msg);

    const Simulator& simulator() const { return *sim_; }
    Simulator& simulator() { return *sim_; }
    const std::vector<Bar>& bars() const { return data_.bars(); }
    const DataSource& data() const { return data_; }

    bool stoppedEarly() const { return stopped_early_; }
    const std::string& stopReason() const { return stop_reason_; }

private:
    std::unique_ptr<IStrategy> strategy_;
    DataSource data_;
    std::string data_path_;
    BacktestOptions options_;
    std::unique_ptr<Simulator> sim_;
    std::unique_ptr<BacktestContext> ctx_;
    bool stopped_early_{false};
    std::string stop_reason_;
};

} // namespace zonetrade
