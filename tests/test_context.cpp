#include "test_common.hpp"
#include "bar_history.hpp"
#include "bias_filter.hpp"
#include "config.hpp"
#include "daily_controller.hpp"
#include "liquidity.hpp"
#include "session_clock.hpp"
#include "swing_tracker.hpp"
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace zonetrade;
using test_util::makeBar;

/// Push (high, low) pairs from index 0 and update the tracker after each one.
SwingTracker swingsFrom(BarHistory& h, const std::vector<std::pair<double, double>>& hl) {
    SwingTracker s;
    long i = 0;
    for (const auto& p : hl) {
        h.push(makeBar("2024-01-02T10:00", p.second, p.first, p.second, p.first), i, 100);
        s.update(h, i, 2, 2);
        ++i;
    }
    return s;
}

void run_session_clock() {
    TimestampSessionClock local;
    auto t = local.sessionTime(makeBar("2024-01-02T09:30", 1, 1, 1, 1));
    ASSERT_TRUE(t.has_value());
    ASSERT_EQ(t->hhmm, 930);
    ASSERT_EQ(t->minute_of_day, 570);
    ASSERT_EQ(t->day_id, daysFromCivil(2024, 1, 2));
    ASSERT_EQ(daysFromCivil(1970, 1, 1), 0L);

    // UTC feed read in New York winter time
    TimestampSessionClock ny(-300);
    auto u = ny.sessionTime(makeBar("2024-01-02 14:30:00", 1, 1, 1, 1));
    ASSERT_TRUE(u.has_value());
    ASSERT_EQ(u->hhmm, 930);
    auto early = ny.sessionTime(makeBar("2024-01-02T03:10", 1, 1, 1, 1));
    ASSERT_EQ(early->hhmm, 2210);
    ASSERT_EQ(early->day_id, daysFromCivil(2024, 1, 1));

    ASSERT_TRUE(!local.sessionTime(makeBar("not a time", 1, 1, 1, 1)).has_value());
    ASSERT_TRUE(!local.sessionTime(makeBar("2024-13-02T09:30", 1, 1, 1, 1)).has_value());
}

void run_bar_history_window() {
    BarHistory h;
    for (long i = 0; i < 5; ++i) h.push(makeBar("", 100.0 + i, 101, 99, 100), i, 3);
    ASSERT_EQ(h.size(), 3u);
    ASSERT_EQ(h.firstIndex(), 2L);
    ASSERT_TRUE(h.at(1) == nullptr);
    ASSERT_NEAR(h.at(4)->open, 104, 1e-9);

    // A gap in indices restarts the window
    h.push(makeBar("", 200, 201, 199, 200), 10, 3);
    ASSERT_EQ(h.size(), 1u);
    ASSERT_TRUE(h.at(4) == nullptr);
    ASSERT_NEAR(h.at(10)->open, 200, 1e-9);
}

void run_swing_tracker_pivots() {
    BarHistory h;
    // high pivot at 2 (110), low pivot at 4 (98); ties never make a pivot
    SwingTracker s = swingsFrom(h, {{105, 100}, {108, 103}, {110, 104}, {107, 101}, {104, 98},
                                    {103, 99}, {104, 100}});
    ASSERT_TRUE(s.lastHigh().has_value());
    ASSERT_NEAR(s.lastHigh()->price, 110, 1e-9);
    ASSERT_EQ(s.lastHigh()->bar_index, 2L);
    ASSERT_TRUE(s.lastLow().has_value());
    ASSERT_NEAR(s.lastLow()->price, 98, 1e-9);
    ASSERT_EQ(s.lastLow()->bar_index, 4L);
    ASSERT_TRUE(!s.prevHigh().has_value());

    BarHistory flat;
    SwingTracker none = swingsFrom(flat, {{100, 90}, {101, 90}, {101, 90}, {100, 90}, {99, 90}});
    ASSERT_TRUE(!none.lastHigh().has_value());
    ASSERT_TRUE(!none.lastLow().has_value());
}

void run_ema_and_structure_bias() {
    Ema ema;
    ema.update(10, 3);
    ema.update(11, 3);
    ASSERT_TRUE(!ema.value().has_value());
    ema.update(12, 3);
    ASSERT_NEAR(*ema.value(), 11.0, 1e-9);  // seeded with the simple average
    ema.update(15, 3);
    ASSERT_NEAR(*ema.value(), 13.0, 1e-9);  // k = 0.5

    // Two rising lows
    BarHistory h;
    SwingTracker up = swingsFrom(h, {{110, 100}, {111, 99}, {112, 95}, {113, 98}, {114, 99},
                                     {115, 97}, {116, 99}, {117, 100}, {118, 101}});
    ASSERT_TRUE(up.higherLow());
    ASSERT_TRUE(structureBias(120, 110.0, up) == Bias::Bullish);
    ASSERT_TRUE(structureBias(105, 110.0, up) == Bias::Neutral);
    ASSERT_TRUE(structureBias(120, std::nullopt, up) == Bias::Neutral);
}

void run_htf_gate() {
    BiasParams p;
    p.htf_mode = HtfMode::Strict;
    ASSERT_EQ(htfAllows(p, Bias::Bullish, Direction::Bullish, false), true);
    ASSERT_EQ(htfAllows(p, Bias::Neutral, Direction::Bullish, true), false);

    p.htf_mode = HtfMode::Loose;
    ASSERT_EQ(htfAllows(p, Bias::Neutral, Direction::Bearish, false), true);
    ASSERT_EQ(htfAllows(p, Bias::Bullish, Direction::Bearish, false), false);
    ASSERT_EQ(htfAllows(p, Bias::Bullish, Direction::Bearish, true), true);
    p.loose_counter_unicorn_only = false;
    ASSERT_EQ(htfAllows(p, Bias::Bullish, Direction::Bearish, false), true);

    p.htf_mode = HtfMode::Off;
    ASSERT_EQ(htfAllows(p, Bias::Bearish, Direction::Bullish, false), true);
    ASSERT_EQ(alignmentPermits(p, Bias::Neutral), true);
    p.htf_mode = HtfMode::Loose;
    ASSERT_EQ(alignmentPermits(p, Bias::Neutral), false);
    ASSERT_EQ(alignmentPermits(p, Bias::Bearish), true);

    ASSERT_EQ(biasAllows(Bias::Neutral, Direction::Bullish), true);
    ASSERT_EQ(biasAllows(Bias::Bearish, Direction::Bullish), false);
    ASSERT_EQ(biasAllows(Bias::Bearish, Direction::Bearish), true);
}

void run_htf_tracker_buckets() {
    EngineConfig cfg;
    cfg.bias.htf_minutes = 60;
    HtfBiasTracker htf;
    const long base = daysFromCivil(2024, 1, 2) * 1440L + 600;  // 10:00
    bool closed = false;
    for (long m = 0; m < 60; ++m)
        closed = htf.update(makeBar("", 100, 101, 99, 100), base + m, cfg) || closed;
    ASSERT_EQ(closed, false);
    ASSERT_EQ(htf.completedBars(), 0L);
    ASSERT_EQ(htf.update(makeBar("", 100, 101, 99, 100), base + 60, cfg), true);
    ASSERT_EQ(htf.completedBars(), 1L);
    ASSERT_TRUE(htf.bias() == Bias::Neutral);
}

void run_average_true_range() {
    BarHistory h;
    h.push(makeBar("", 100, 102, 98, 101), 0, 10);
    h.push(makeBar("", 101, 103, 100, 102), 1, 10);  // TR 3
    h.push(makeBar("", 108, 110, 107, 109), 2, 10);  // TR max(3, 8, 5) = 8
    ASSERT_NEAR(*averageTrueRange(h, 2, 2), 5.5, 1e-9);
    ASSERT_TRUE(!averageTrueRange(h, 2, 3).has_value());
}

void run_liquidity_targets() {
    BarHistory h;
    // swing highs 110 and 111 (equal within 2), swing low 98
    SwingTracker s = swingsFrom(h, {{105, 100}, {108, 103}, {110, 104}, {107, 101}, {104, 98},
                                    {108, 99}, {111, 100}, {109, 101}, {106, 102}});
    ASSERT_NEAR(s.lastHigh()->price, 111, 1e-9);
    ASSERT_NEAR(s.prevHigh()->price, 110, 1e-9);

    LiquidityParams p;
    SessionExtremes session;
    session.update(makeBar("", 103, 115, 97, 104));
    auto targets = collectTargets(p, 104, session, s);
    // session high/low, swing high/low, equal highs
    ASSERT_EQ(targets.size(), 5u);

    auto up = selectPrimaryTarget(targets, 104, Bias::Bullish);
    ASSERT_TRUE(up.has_value());
    ASSERT_NEAR(up->price, 111, 1e-9);
    ASSERT_TRUE(up->draw == DrawDirection::Up);
    auto down = selectPrimaryTarget(targets, 104, Bias::Bearish);
    ASSERT_NEAR(down->price, 98, 1e-9);
    auto any = selectPrimaryTarget(targets, 104, Bias::Neutral);
    ASSERT_NEAR(any->price, 98, 1e-9);

    // Levels already traded through are not liquidity
    auto above = collectTargets(p, 120, SessionExtremes{}, s);
    for (const auto& t : above) ASSERT_TRUE(t.draw == DrawDirection::Down);
}

void run_daily_gates() {
    EngineConfig cfg;
    TimestampSessionClock clock;
    SessionTime t1000 = *clock.sessionTime(makeBar("2024-01-02T10:00", 1, 1, 1, 1));
    SessionTime t1003 = *clock.sessionTime(makeBar("2024-01-02T10:03", 1, 1, 1, 1));
    SessionTime t1005 = *clock.sessionTime(makeBar("2024-01-02T10:05", 1, 1, 1, 1));
    SessionTime t0929 = *clock.sessionTime(makeBar("2024-01-02T09:29", 1, 1, 1, 1));
    SessionTime t1555 = *clock.sessionTime(makeBar("2024-01-02T15:55", 1, 1, 1, 1));
    SessionTime next = *clock.sessionTime(makeBar("2024-01-03T09:45", 1, 1, 1, 1));

    DailyState d;
    ASSERT_EQ(isNewDay(d, t1000), true);
    d = startDay(d, t1000);
    ASSERT_EQ(isNewDay(d, t1005), false);
    ASSERT_EQ(entryGatesOpen(cfg, d, t1000), true);
    ASSERT_EQ(entryGatesOpen(cfg, d, t0929), false);
    ASSERT_EQ(entryGatesOpen(cfg, d, t1555), false);

    d = recordEntry(d, Direction::Bullish, t1000);
    ASSERT_EQ(d.trades_today, 1);
    ASSERT_EQ(entryGatesOpen(cfg, d, t1003), false);  // cooldown
    ASSERT_EQ(entryGatesOpen(cfg, d, t1005), true);

    cfg.risk.one_per_direction = true;
    ASSERT_EQ(directionAvailable(cfg, d, Direction::Bullish), false);
    ASSERT_EQ(directionAvailable(cfg, d, Direction::Bearish), true);
    cfg.entry.enable_short = false;
    ASSERT_EQ(directionAvailable(cfg, d, Direction::Bearish), false);

    d = recordEntry(d, Direction::Bearish, t1005);
    d.last_trade_minute.reset();
    cfg.risk.max_trades_day = 2;
    ASSERT_EQ(entryGatesOpen(cfg, d, t1005), false);

    ASSERT_EQ(isNewDay(d, next), true);
    DailyState fresh = startDay(d, next);
    ASSERT_EQ(fresh.trades_today, 0);
    ASSERT_EQ(fresh.long_used, false);
}

} // namespace

void run_context_tests() {
    std::cerr << "  session_clock ... "; run_session_clock(); std::cerr << "ok\n";
    std::cerr << "  bar_history_window ... "; run_bar_history_window(); std::cerr << "ok\n";
    std::cerr << "  swing_tracker_pivots ... "; run_swing_tracker_pivots(); std::cerr << "ok\n";
    std::cerr << "  ema_and_structure_bias ... "; run_ema_and_structure_bias(); std::cerr << "ok\n";
    std::cerr << "  htf_gate ... "; run_htf_gate(); std::cerr << "ok\n";
    std::cerr << "  htf_tracker_buckets ... "; run_htf_tracker_buckets(); std::cerr << "ok\n";
    std::cerr << "  average_true_range ... "; run_average_true_range(); std::cerr << "ok\n";
    std::cerr << "  liquidity_targets ... "; run_liquidity_targets(); std::cerr << "ok\n";
    std::cerr << "  daily_gates ... "; run_daily_gates(); std::cerr << "ok\n";
}
