#include "test_common.hpp"
#include "bar_history.hpp"
#include "config.hpp"
#include "entry_selector.hpp"
#include "events.hpp"
#include "liquidity.hpp"
#include "session_clock.hpp"
#include "swing_tracker.hpp"
#include "trade_manager.hpp"
#include <optional>
#include <string>

namespace {

using namespace zonetrade;
using test_util::makeBar;

/// Tracker whose only swing is a low at `price` (flat highs never pivot).
SwingTracker swingLowAt(double price) {
    BarHistory h;
    SwingTracker s;
    const double lows[] = {price + 5, price + 2, price, price + 3, price + 6};
    for (long i = 0; i < 5; ++i) {
        h.push(makeBar("", lows[i], price + 40, lows[i], lows[i] + 1), i, 10);
        s.update(h, i, 2, 2);
    }
    return s;
}

/// Tracker whose only swing is a high at `price`.
SwingTracker swingHighAt(double price) {
    BarHistory h;
    SwingTracker s;
    const double highs[] = {price - 5, price - 2, price, price - 3, price - 6};
    for (long i = 0; i < 5; ++i) {
        h.push(makeBar("", highs[i], highs[i], price - 40, highs[i] - 1), i, 10);
        s.update(h, i, 2, 2);
    }
    return s;
}

SessionTime at(int hhmm) {
    SessionTime t;
    t.day_id = 19724;
    t.hhmm = hhmm;
    t.minute_of_day = (hhmm / 100) * 60 + hhmm % 100;
    return t;
}

OpenTrade longTrade(int quantity) {
    OpenTrade t;
    t.direction = Direction::Bullish;
    t.model = EntryModel::BreakerRetap;
    t.entry_price = 100;
    t.stop_price = 90;
    t.risk_points = 10;
    t.target_price = 120;
    t.quantity = quantity;
    t.entry_index = 0;
    t.best_price = 100;
    return t;
}

void run_stop_placement() {
    EngineConfig cfg;  // buffer 2, tight 10, stop 10..15, default 12.5
    const ZoneBounds overlap = makeBounds(21820, 21825);
    ASSERT_TRUE(swingLowAt(21810).lastLow().has_value());

    // Zone stop 5 points away is too tight: structure stop below the swing low
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, overlap, swingLowAt(21810)), 21808, 1e-9);
    // No usable swing: default distance
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, overlap, SwingTracker{}), 21810.5, 1e-9);
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, overlap, swingLowAt(21830)), 21810.5, 1e-9);
    // Override off: zone stop widened to stop.min
    cfg.risk.override_to_structure = false;
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, overlap, swingLowAt(21810)), 21813, 1e-9);
    cfg.risk.override_to_structure = true;

    // Wide zone: clamped to stop.max
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, makeBounds(21800, 21825), SwingTracker{}), 21808, 1e-9);
    // Rounded to the tick
    ASSERT_NEAR(computeStop(cfg, Direction::Bullish, 21823, makeBounds(21812.8, 21825), SwingTracker{}), 21810.75, 1e-9);

    // Short breaker retap: structure stop above the swing high
    ASSERT_NEAR(computeStop(cfg, Direction::Bearish, 21855, makeBounds(21850, 21860), swingHighAt(21865)), 21867, 1e-9);
}

void run_target_modes() {
    EngineConfig cfg;  // fixed 2R
    const LiquidityTarget above{115, LiquidityOrigin::SwingHigh, DrawDirection::Up};
    const LiquidityTarget near{105, LiquidityOrigin::SessionHigh, DrawDirection::Up};
    const LiquidityTarget below{90, LiquidityOrigin::SwingLow, DrawDirection::Down};

    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, above), 120, 1e-9);
    cfg.exits.target_mode = TargetMode::Liquidity;
    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, above), 115, 1e-9);
    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, below), 120, 1e-9);  // wrong side
    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, std::nullopt), 120, 1e-9);
    ASSERT_NEAR(computeTarget(cfg, Direction::Bearish, 100, 10, below), 90, 1e-9);
    cfg.exits.target_mode = TargetMode::Hybrid;
    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, above), 115, 1e-9);
    ASSERT_NEAR(computeTarget(cfg, Direction::Bullish, 100, 10, near), 120, 1e-9);  // under 1R
}

void run_open_trade_unicorn_long() {
    EngineConfig cfg;
    PendingEntry p;
    p.model = EntryModel::Unicorn;
    p.direction = Direction::Bullish;
    p.bounds = makeBounds(21820, 21825);
    p.armed_index = 1;
    OpenTrade t = openTrade(cfg, p, 21823, 2, swingLowAt(21810), std::nullopt);
    ASSERT_NEAR(t.stop_price, 21808, 1e-9);
    ASSERT_NEAR(t.risk_points, 15, 1e-9);
    ASSERT_NEAR(t.target_price, 21853, 1e-9);
    ASSERT_EQ(t.quantity, 1);
    ASSERT_EQ(t.entry_index, 2L);
    ASSERT_NEAR(t.rMultiple(21838), 1.0, 1e-9);
}

void run_breakeven_one_shot() {
    EngineConfig cfg;
    cfg.exits.partial_enabled = false;
    cfg.exits.trail_enabled = false;

    TradeStep s1 = manageTrade(cfg, longTrade(2), makeBar("", 100, 104, 99.5, 103.5), 1, at(1000), std::nullopt);
    ASSERT_TRUE(s1.trade.has_value());
    ASSERT_EQ(s1.trade->breakeven_active, true);
    ASSERT_NEAR(s1.trade->breakeven_stop, 100, 1e-9);
    ASSERT_EQ(s1.events.size(), 1u);
    ASSERT_TRUE(s1.events[0].kind == EventKind::BreakevenSet);

    // Less open profit on the next bar: stop stays at breakeven, no second event
    TradeStep s2 = manageTrade(cfg, *s1.trade, makeBar("", 103, 103, 100.5, 101), 2, at(1001), std::nullopt);
    ASSERT_TRUE(s2.trade.has_value());
    ASSERT_EQ(s2.trade->breakeven_active, true);
    ASSERT_NEAR(s2.trade->breakeven_stop, 100, 1e-9);
    ASSERT_EQ(s2.events.size(), 0u);

    TradeStep s3 = manageTrade(cfg, *s2.trade, makeBar("", 101, 101.5, 99.75, 100.5), 3, at(1002), std::nullopt);
    ASSERT_TRUE(!s3.trade.has_value());
    ASSERT_TRUE(s3.events[0].kind == EventKind::ExitBreakeven);
    ASSERT_NEAR(s3.events[0].price, 100, 1e-9);
    ASSERT_EQ(s3.commands.size(), 1u);
    ASSERT_TRUE(s3.commands[0].type == CommandType::CloseAll);
}

void run_stop_and_target_exits() {
    EngineConfig cfg;
    TradeStep both = manageTrade(cfg, longTrade(1), makeBar("", 100, 121, 89, 110), 1, at(1000), std::nullopt);
    ASSERT_TRUE(!both.trade.has_value());
    ASSERT_TRUE(both.events[0].kind == EventKind::ExitStop);  // stop wins a two-sided bar
    ASSERT_NEAR(both.events[0].price, 90, 1e-9);

    TradeStep hit = manageTrade(cfg, longTrade(1), makeBar("", 100, 120, 99, 119), 1, at(1000), std::nullopt);
    ASSERT_TRUE(hit.events[0].kind == EventKind::ExitTarget);
    ASSERT_NEAR(hit.events[0].price, 120, 1e-9);

    TradeStep eod = manageTrade(cfg, longTrade(1), makeBar("", 100, 101, 99, 100.5), 1, at(1555), std::nullopt);
    ASSERT_TRUE(!eod.trade.has_value());
    ASSERT_TRUE(eod.events[0].kind == EventKind::ExitEndOfDay);
    ASSERT_NEAR(eod.events[0].price, 100.5, 1e-9);
}

void run_partial_then_trail() {
    EngineConfig cfg;  // 50% at 1R, 15 point trail
    TradeStep s1 = manageTrade(cfg, longTrade(2), makeBar("", 100, 110.5, 105, 110), 1, at(1000), std::nullopt);
    ASSERT_TRUE(s1.trade.has_value());
    ASSERT_EQ(s1.trade->quantity, 1);
    ASSERT_EQ(s1.trade->partial_taken, true);
    ASSERT_EQ(s1.events.size(), 3u);
    ASSERT_TRUE(s1.events[0].kind == EventKind::BreakevenSet);
    ASSERT_TRUE(s1.events[1].kind == EventKind::PartialExit);
    ASSERT_TRUE(s1.events[2].kind == EventKind::TrailActivated);
    ASSERT_EQ(s1.commands.size(), 1u);
    ASSERT_TRUE(s1.commands[0].type == CommandType::PartialClose);
    ASSERT_EQ(s1.commands[0].quantity, 1);
    ASSERT_NEAR(s1.trade->trailing_stop, 100, 1e-9);  // never below breakeven

    TradeStep s2 = manageTrade(cfg, *s1.trade, makeBar("", 110, 119, 105, 118), 2, at(1001), std::nullopt);
    ASSERT_NEAR(s2.trade->trailing_stop, 104, 1e-9);
    ASSERT_EQ(s2.events.size(), 0u);

    // Pullback: the trail only tightens
    TradeStep s3 = manageTrade(cfg, *s2.trade, makeBar("", 118, 118.5, 104.5, 110), 3, at(1002), std::nullopt);
    ASSERT_NEAR(s3.trade->trailing_stop, 104, 1e-9);

    TradeStep s4 = manageTrade(cfg, *s3.trade, makeBar("", 110, 111, 103, 104), 4, at(1003), std::nullopt);
    ASSERT_TRUE(!s4.trade.has_value());
    ASSERT_TRUE(s4.events[0].kind == EventKind::ExitTrail);
    ASSERT_NEAR(s4.events[0].price, 104, 1e-9);
    ASSERT_EQ(s4.commands[0].quantity, 1);
}

void run_partial_full_size_close() {
    EngineConfig cfg;
    TradeStep s = manageTrade(cfg, longTrade(1), makeBar("", 100, 110.5, 105, 110), 1, at(1000), std::nullopt);
    ASSERT_TRUE(!s.trade.has_value());
    ASSERT_TRUE(s.events.back().kind == EventKind::PartialExit);
    ASSERT_EQ(s.commands.size(), 1u);
    ASSERT_TRUE(s.commands[0].type == CommandType::CloseAll);
}

void run_time_stops() {
    EngineConfig cfg;  // 60 bars max, progress check at 20 bars for 0.25R
    TradeStep slow = manageTrade(cfg, longTrade(1), makeBar("", 100.5, 101.5, 100, 101), 20, at(1020), std::nullopt);
    ASSERT_TRUE(!slow.trade.has_value());
    ASSERT_TRUE(slow.events[0].kind == EventKind::ExitTimeStop);

    TradeStep ok = manageTrade(cfg, longTrade(1), makeBar("", 104, 105.5, 104, 105), 20, at(1020), std::nullopt);
    ASSERT_TRUE(ok.trade.has_value());
    ASSERT_EQ(ok.trade->progress_checked, true);

    TradeStep late = manageTrade(cfg, *ok.trade, makeBar("", 104, 105, 103, 104), 60, at(1100), std::nullopt);
    ASSERT_TRUE(!late.trade.has_value());
    ASSERT_TRUE(late.events[0].kind == EventKind::ExitTimeStop);
    ASSERT_TRUE(late.events[0].tag.find("max bars") != std::string::npos);
}

void run_atr_trail() {
    EngineConfig cfg;
    cfg.exits.partial_enabled = false;
    cfg.exits.be_enabled = false;
    cfg.exits.trail_mode = TrailMode::Atr;  // 2 x ATR
    Bar bar = makeBar("", 100, 104, 101, 103.5);

    TradeStep s = manageTrade(cfg, longTrade(1), bar, 1, at(1000), 3.0);
    ASSERT_EQ(s.trade->trailing_active, true);
    ASSERT_NEAR(s.trade->trailing_stop, 98, 1e-9);

    TradeStep none = manageTrade(cfg, longTrade(1), bar, 1, at(1000), std::nullopt);
    ASSERT_EQ(none.trade->trailing_active, false);
}

} // namespace

void run_trade_tests() {
    std::cerr << "  stop_placement ... "; run_stop_placement(); std::cerr << "ok\n";
    std::cerr << "  target_modes ... "; run_target_modes(); std::cerr << "ok\n";
    std::cerr << "  open_trade_unicorn_long ... "; run_open_trade_unicorn_long(); std::cerr << "ok\n";
    std::cerr << "  breakeven_one_shot ... "; run_breakeven_one_shot(); std::cerr << "ok\n";
    std::cerr << "  stop_and_target_exits ... "; run_stop_and_target_exits(); std::cerr << "ok\n";
    std::cerr << "  partial_then_trail ... "; run_partial_then_trail(); std::cerr << "ok\n";
    std::cerr << "  partial_full_size_close ... "; run_partial_full_size_close(); std::cerr << "ok\n";
    std::cerr << "  time_stops ... "; run_time_stops(); std::cerr << "ok\n";
    std::cerr << "  atr_trail ... "; run_atr_trail(); std::cerr << "ok\n";
}
