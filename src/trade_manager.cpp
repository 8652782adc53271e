#include "trade_manager.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace zonetrade {

namespace {

std::string fmt(const char* label, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s=%.2f", label, v);
    return buf;
}

std::string tradeTag(const OpenTrade& t) {
    return std::string(modelName(t.model)) + " " + (t.isLong() ? "long" : "short");
}

bool longSide(Direction d) { return d == Direction::Bullish; }

} // namespace

double OpenTrade::rMultiple(double price) const {
    if (risk_points <= 0) return 0;
    return (isLong() ? price - entry_price : entry_price - price) / risk_points;
}

double roundToTick(double price, double tick) {
    if (tick <= 0) return price;
    return std::round(price / tick) * tick;
}

double computeStop(const EngineConfig& cfg, Direction dir, double entry, const ZoneBounds& zone,
                   const SwingTracker& swings) {
    const RiskParams& r = cfg.risk;
    const bool is_long = longSide(dir);

    double stop = is_long ? zone.bottom - r.stop_buffer : zone.top + r.stop_buffer;
    double dist = is_long ? entry - stop : stop - entry;

    if (dist < r.tight_threshold && r.override_to_structure) {
        const auto& swing = is_long ? swings.lastLow() : swings.lastHigh();
        if (swing && (is_long ? swing->price < entry : swing->price > entry))
            dist = is_long ? entry - (swing->price - r.stop_buffer) : (swing->price + r.stop_buffer) - entry;
        else
            dist = r.stop_default;
    }

    dist = std::max(r.stop_min, std::min(dist, r.stop_max));
    return roundToTick(is_long ? entry - dist : entry + dist, cfg.tick_size);
}

double computeTarget(const EngineConfig& cfg, Direction dir, double entry, double risk,
                     const std::optional<LiquidityTarget>& liquidity) {
    const bool is_long = longSide(dir);
    const double fixed = is_long ? entry + risk * cfg.exits.target_r : entry - risk * cfg.exits.target_r;

    std::optional<double> liq;
    if (liquidity) {
        double d = is_long ? liquidity->price - entry : entry - liquidity->price;
        if (d > 0) liq = liquidity->price;
    }

    double target = fixed;
    switch (cfg.exits.target_mode) {
        case TargetMode::FixedR:
            break;
        case TargetMode::Liquidity:
            if (liq) target = *liq;
            break;
        case TargetMode::Hybrid:
            if (liq && std::abs(*liq - entry) >= risk) target = *liq;
            break;
    }
    return roundToTick(target, cfg.tick_size);
}

OpenTrade openTrade(const EngineConfig& cfg, const PendingEntry& pending, double entry, long index,
                    const SwingTracker& swings, const std::optional<LiquidityTarget>& liquidity) {
    OpenTrade t;
    t.direction = pending.direction;
    t.model = pending.model;
    t.entry_price = entry;
    t.stop_price = computeStop(cfg, pending.direction, entry, pending.bounds, swings);
    t.risk_points = std::abs(entry - t.stop_price);
    t.target_price = computeTarget(cfg, pending.direction, entry, t.risk_points, liquidity);
    t.quantity = cfg.risk.contracts;
    t.entry_index = index;
    t.best_price = entry;
    return t;
}

TradeStep flattenTrade(const OpenTrade& trade, long index, double price, EventKind reason,
                       const std::string& why) {
    TradeStep step;
    step.events.push_back({reason, index, price, tradeTag(trade) + " " + why});
    step.commands.push_back({CommandType::CloseAll, trade.quantity});
    return step;
}

TradeStep manageTrade(const EngineConfig& cfg, const OpenTrade& trade, const Bar& bar, long index,
                      const SessionTime& time, const std::optional<double>& atr) {
    const ExitParams& x = cfg.exits;
    const bool is_long = trade.isLong();

    // 1. end of day always wins
    if (cfg.session.forced_flat_enabled && time.hhmm >= cfg.session.forced_flat)
        return flattenTrade(trade, index, bar.close, EventKind::ExitEndOfDay, "forced flat");

    auto breached = [&](double level) { return is_long ? bar.low <= level : bar.high >= level; };

    // 2-4. stops, tightest role first; stop before target when both print on one bar
    if (trade.trailing_active && breached(trade.trailing_stop))
        return flattenTrade(trade, index, trade.trailing_stop, EventKind::ExitTrail, fmt("stop", trade.trailing_stop));
    if (trade.breakeven_active && breached(trade.breakeven_stop))
        return flattenTrade(trade, index, trade.breakeven_stop, EventKind::ExitBreakeven, fmt("stop", trade.breakeven_stop));
    if (breached(trade.stop_price))
        return flattenTrade(trade, index, trade.stop_price, EventKind::ExitStop, fmt("stop", trade.stop_price));

    // 5. target
    if (is_long ? bar.high >= trade.target_price : bar.low <= trade.target_price)
        return flattenTrade(trade, index, trade.target_price, EventKind::ExitTarget, fmt("target", trade.target_price));

    // 6. time stop
    OpenTrade t = trade;
    const long bars_in_trade = index - t.entry_index;
    if (x.time_stop_enabled) {
        if (bars_in_trade >= x.max_bars)
            return flattenTrade(t, index, bar.close, EventKind::ExitTimeStop, "max bars");
        if (x.progress_bars > 0 && !t.progress_checked && bars_in_trade >= x.progress_bars) {
            t.progress_checked = true;
            if (t.rMultiple(bar.close) < x.progress_min_r)
                return flattenTrade(t, index, bar.close, EventKind::ExitTimeStop, fmt("progress r", t.rMultiple(bar.close)));
        }
    }

    TradeStep step;
    t.best_price = is_long ? std::max(t.best_price, bar.high) : std::min(t.best_price, bar.low);

    // 7. breakeven, one-shot
    const double unrealized = is_long ? bar.close - t.entry_price : t.entry_price - bar.close;
    if (x.be_enabled && !t.breakeven_active && unrealized >= x.be_trigger_points) {
        double be = roundToTick(is_long ? t.entry_price + x.be_offset : t.entry_price - x.be_offset, cfg.tick_size);
        t.breakeven_active = true;
        t.breakeven_stop = is_long ? std::max(be, t.stop_price) : std::min(be, t.stop_price);
        step.events.push_back({EventKind::BreakevenSet, index, t.breakeven_stop, tradeTag(t)});
    }

    // partial, one-shot; a partial that would leave nothing is a full close
    if (x.partial_enabled && !t.partial_taken && t.rMultiple(bar.close) >= x.partial_r) {
        int qty = static_cast<int>(std::ceil(t.quantity * x.partial_pct / 100.0));
        if (qty >= t.quantity) {
            TradeStep full = flattenTrade(t, index, bar.close, EventKind::PartialExit, "full size");
            step.events.insert(step.events.end(), full.events.begin(), full.events.end());
            step.commands = full.commands;
            return step;
        }
        t.quantity -= qty;
        t.partial_taken = true;
        step.commands.push_back({CommandType::PartialClose, qty});
        step.events.push_back({EventKind::PartialExit, index, bar.close,
                               tradeTag(t) + " qty=" + std::to_string(qty)});
    }

    // runner trailing: after the partial, or right away when partials are off
    if (x.trail_enabled && (t.partial_taken || !x.partial_enabled)) {
        std::optional<double> distance;
        if (x.trail_mode == TrailMode::Points) distance = x.trail_points;
        else if (atr) distance = *atr * x.trail_atr_mult;

        if (distance) {
            double candidate = roundToTick(is_long ? t.best_price - *distance : t.best_price + *distance, cfg.tick_size);
            double current = t.breakeven_active ? t.breakeven_stop : t.stop_price;
            if (t.trailing_active) current = t.trailing_stop;
            double next = is_long ? std::max(candidate, current) : std::min(candidate, current);
            if (!t.trailing_active) {
                t.trailing_active = true;
                step.events.push_back({EventKind::TrailActivated, index, next, tradeTag(t)});
            }
            t.trailing_stop = next;
        }
    }

    step.trade = t;
    return step;
}

} // namespace zonetrade
