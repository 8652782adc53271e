#pragma once

#include "strategy.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "events.hpp"
#include "session_clock.hpp"
#include <memory>
#include <vector>

namespace zonetrade {

/// Hosts the zone engine inside the backtester: feeds each bar to processBar(), sends the
/// resulting order commands to the context and keeps the event log.
class ZoneStrategy : public IStrategy {
public:
    /// cfg must already be validated.
    ZoneStrategy(const EngineConfig& cfg, bool verbose);

    void onStart(IContext& ctx) override;
    void onBar(const Bar& bar, IContext& ctx) override;
    void onEnd(IContext& ctx) override;

    const std::vector<EventRecord>& events() const { return log_; }
    const EngineState& state() const { return state_; }
    int entries() const { return entries_; }

private:
    void execute(const OrderCommand& cmd, IContext& ctx);

    EngineConfig cfg_;
    TimestampSessionClock clock_;
    EngineState state_;
    bool verbose_;
    std::vector<EventRecord> log_;
    int entries_{0};
};

std::unique_ptr<ZoneStrategy> createZoneStrategy(const EngineConfig& cfg, bool verbose = false);

} // namespace zonetrade
