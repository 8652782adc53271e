#include "backtester.hpp"
#include <algorithm>
#include <cmath>

namespace zonetrade {

BacktestContext::BacktestContext(Simulator& sim, const std::vector<Bar>& bars, double tick_size)
    : sim_(sim), bars_(bars), tick_size_(tick_size) {}

void BacktestContext::openLong(double quantity) {
    sim_.placeOrder(Side::Long, quantity);
}

void BacktestContext::openShort(double quantity) {
    sim_.placeOrder(Side::Short, quantity);
}

void BacktestContext::partialClose(double quantity) {
    const double pos = sim_.position();
    if (pos == 0) return;
    sim_.placeOrder(pos > 0 ? Side::Short : Side::Long, std::min(quantity, std::abs(pos)));
}

void BacktestContext::closeAll() {
    sim_.placeClosePosition();
}

double BacktestContext::position() const { return sim_.position(); }

double BacktestContext::roundToTick(double price) const {
    if (tick_size_ <= 0) return price;
    return std::round(price / tick_size_) * tick_size_;
}

double BacktestContext::lastPrice() const { return sim_.lastClose(); }
std::size_t BacktestContext::barIndex() const { return bar_index_; }
const std::vector<Bar>& BacktestContext::bars() const { return bars_; }

Backtester::Backtester(std::unique_ptr<IStrategy> strategy,
                       const std::string& data_path,
                       const BacktestOptions& options)
    : strategy_(std::move(strategy))
    , data_(data_path)
    , data_path_(data_path)
    , options_(options)
    , sim_(std::make_unique<Simulator>(options.initial_cash, options.commission, options.slippage))
{
}

bool Backtester::run(std::string& error_msg) {
    if (!data_.load()) {
        error_msg = "failed to load bars from " + data_path_ + " (missing file or columns)";
        return false;
    }
    if (data_.empty()) {
        error_msg = "no bars in " + data_path_;
        return false;
    }
    if (!data_.aggregateBars(options_.bar_resolution)) {
        error_msg = "unknown bar resolution: " + options_.bar_resolution;
        return false;
    }

    ctx_ = std::make_unique<BacktestContext>(*sim_, data_.bars(), options_.tick_size);
    strategy_->onStart(*ctx_);

    double peak_equity = options_.initial_cash;
    for (std::size_t i = 0; i < data_.size(); ++i) {
        const Bar& bar = data_.at(i);
        ctx_->setBarIndex(i);

        // 1. Process orders from previous bar (fill at this bar's open)
        sim_->processOrders(bar);

        if (sim_->equityAt(bar.open) <= 0) {
            stopped_early_ = true;
            stop_reason_ = "no more equity";
            sim_->updateEquity(bar);  // record final equity at bar close for report
            break;
        }

        // 2. Strategy sees current bar and can place orders (filled next bar)
        strategy_->onBar(bar, *ctx_);

        // 3. Update equity at this bar's close (used for curve and next bar's checks)
        sim_->updateEquity(bar);

        double eq = sim_->equity();
        if (eq > peak_equity) peak_equity = eq;
        double drawdown_pct = (peak_equity > 0) ? ((peak_equity - eq) / peak_equity * 100.0) : 100.0;

        if (eq <= 0) {
            stopped_early_ = true;
            stop_reason_ = "no more equity";
            break;
        }
        if (drawdown_pct >= 100.0) {
            stopped_early_ = true;
            stop_reason_ = "max drawdown 100%";
            break;
        }
    }

    strategy_->onEnd(*ctx_);
    return true;
}

} // namespace zonetrade
