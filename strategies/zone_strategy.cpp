#include "zone_strategy.hpp"
#include "context.hpp"
#include <iomanip>
#include <iostream>

namespace zonetrade {

ZoneStrategy::ZoneStrategy(const EngineConfig& cfg, bool verbose)
    : cfg_(cfg)
    , clock_(cfg.session.utc_offset_minutes)
    , verbose_(verbose)
{
}

void ZoneStrategy::onStart(IContext& /*ctx*/) {
    state_ = EngineState{};
    log_.clear();
    entries_ = 0;
}

void ZoneStrategy::onBar(const Bar& bar, IContext& ctx) {
    StepResult step = processBar(cfg_, clock_, std::move(state_), bar, static_cast<long>(ctx.barIndex()));
    state_ = std::move(step.state);

    for (const Event& e : step.events) {
        if (verbose_) {
            std::cerr << "[" << e.bar_index << "] " << eventKindName(e.kind) << " "
                      << std::fixed << std::setprecision(2) << ctx.roundToTick(e.price)
                      << " " << e.tag << "\n";
        }
        log_.push_back({bar.timestamp, e});
    }
    for (const OrderCommand& cmd : step.commands)
        execute(cmd, ctx);
}

void ZoneStrategy::execute(const OrderCommand& cmd, IContext& ctx) {
    switch (cmd.type) {
        case CommandType::OpenLong:
            if (ctx.position() != 0) ctx.closeAll();
            ctx.openLong(cmd.quantity);
            ++entries_;
            break;
        case CommandType::OpenShort:
            if (ctx.position() != 0) ctx.closeAll();
            ctx.openShort(cmd.quantity);
            ++entries_;
            break;
        case CommandType::PartialClose:
            ctx.partialClose(cmd.quantity);
            break;
        case CommandType::CloseAll:
            ctx.closeAll();
            break;
    }
    if (verbose_) {
        std::cerr << "    -> " << commandTypeName(cmd.type);
        if (cmd.type != CommandType::CloseAll) std::cerr << " " << cmd.quantity;
        std::cerr << " @ ~" << std::fixed << std::setprecision(2) << ctx.lastPrice() << "\n";
    }
}

void ZoneStrategy::onEnd(IContext& ctx) {
    if (verbose_ && ctx.position() != 0)
        std::cerr << "Backtest ended with an open position of " << ctx.position() << "\n";
}

std::unique_ptr<ZoneStrategy> createZoneStrategy(const EngineConfig& cfg, bool verbose) {
    return std::make_unique<ZoneStrategy>(cfg, verbose);
}

} // namespace zonetrade
