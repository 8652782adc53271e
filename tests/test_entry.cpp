#include "test_common.hpp"
#include "config.hpp"
#include "entry_selector.hpp"
#include "zones.hpp"
#include <string>

namespace {

using namespace zonetrade;
using test_util::makeBar;

EngineConfig entryConfig() {
    EngineConfig cfg;
    cfg.bias.htf_mode = HtfMode::Off;
    return cfg;
}

Zone zoneOf(ZoneShape shape, Direction dir, long birth) {
    Zone z;
    z.shape = shape;
    z.direction = dir;
    z.birth_index = birth;
    return z;
}

EntryInputs inputsFor(const ZoneArena& zones, const Bar& bar, long index) {
    EntryInputs in;
    in.bar = &bar;
    in.index = index;
    in.zones = &zones;
    in.can_arm = true;
    in.can_trigger = true;
    return in;
}

void run_setup_priority() {
    EngineConfig cfg = entryConfig();
    ZoneArena zones;
    zones.insert(zoneOf(OrderBlock{makeBounds(100, 110), false}, Direction::Bullish, 0));
    ZoneId br = zones.insert(zoneOf(Breaker{makeBounds(100, 110), BreakerOrigin::Flip}, Direction::Bullish, 1));
    Bar bar = makeBar("", 107, 108, 105, 106);

    auto setup = findSetup(cfg, inputsFor(zones, bar, 2));
    ASSERT_TRUE(setup.has_value());
    ASSERT_TRUE(setup->model == EntryModel::BreakerRetap);
    ASSERT_TRUE(setup->zone == br);

    // A Unicorn outranks a plain breaker; its span is the overlap
    zones.insert(zoneOf(BalancedRange{makeBounds(104, 108)}, Direction::Bullish, 1));
    setup = findSetup(cfg, inputsFor(zones, bar, 2));
    ASSERT_TRUE(setup->model == EntryModel::Unicorn);
    ASSERT_TRUE(setup->zone == br);
    ASSERT_NEAR(setup->bounds.bottom, 104, 1e-9);
    ASSERT_NEAR(setup->bounds.top, 108, 1e-9);
    ASSERT_EQ(std::string(modelName(setup->model)), std::string("UN1_UNICORN"));

    cfg.entry.enable_unicorn = false;
    cfg.entry.enable_breaker = false;
    setup = findSetup(cfg, inputsFor(zones, bar, 2));
    ASSERT_TRUE(setup->model == EntryModel::ObMean);
}

void run_ob_mean_threshold() {
    EngineConfig cfg = entryConfig();
    ZoneArena zones;
    zones.insert(zoneOf(OrderBlock{makeBounds(100, 110), false}, Direction::Bullish, 0));
    Bar below = makeBar("", 104, 104.5, 102, 103);
    Bar above = makeBar("", 104, 106.5, 103, 106);

    ASSERT_TRUE(!findSetup(cfg, inputsFor(zones, below, 1)).has_value());
    ASSERT_TRUE(findSetup(cfg, inputsFor(zones, above, 1)).has_value());
    cfg.zones.ob_mean_threshold = false;
    ASSERT_TRUE(findSetup(cfg, inputsFor(zones, below, 1)).has_value());
}

void run_direction_gates() {
    EngineConfig cfg = entryConfig();
    ZoneArena zones;
    zones.insert(zoneOf(Breaker{makeBounds(100, 110), BreakerOrigin::Flip}, Direction::Bullish, 0));
    Bar bar = makeBar("", 107, 108, 105, 106);

    EntryInputs in = inputsFor(zones, bar, 1);
    in.intraday = Bias::Bearish;
    ASSERT_TRUE(!findSetup(cfg, in).has_value());

    in = inputsFor(zones, bar, 1);
    in.long_allowed = false;
    ASSERT_TRUE(!findSetup(cfg, in).has_value());

    cfg.bias.htf_mode = HtfMode::Strict;
    in = inputsFor(zones, bar, 1);
    in.htf = Bias::Neutral;
    ASSERT_TRUE(!findSetup(cfg, in).has_value());
    in.htf = Bias::Bullish;
    ASSERT_TRUE(findSetup(cfg, in).has_value());

    // Price outside every zone
    Bar away = makeBar("", 115, 116, 113, 114);
    ASSERT_TRUE(!findSetup(entryConfig(), inputsFor(zones, away, 1)).has_value());
}

void run_confirmation_candle() {
    PendingEntry longEntry;
    longEntry.direction = Direction::Bullish;
    longEntry.bounds = makeBounds(21820, 21825);  // mean 21822.5
    ASSERT_EQ(isConfirmation(longEntry, makeBar("", 21821, 21824, 21820.5, 21823)), true);
    ASSERT_EQ(isConfirmation(longEntry, makeBar("", 21821, 21824, 21820.5, 21822.5)), true);  // at the mean
    ASSERT_EQ(isConfirmation(longEntry, makeBar("", 21821, 21823, 21820.5, 21822)), false);
    ASSERT_EQ(isConfirmation(longEntry, makeBar("", 21824, 21825, 21822, 21823)), false);  // down close

    PendingEntry shortEntry;
    shortEntry.direction = Direction::Bearish;
    shortEntry.bounds = makeBounds(21850, 21860);  // mean 21855
    ASSERT_EQ(isConfirmation(shortEntry, makeBar("", 21858, 21859, 21854, 21855)), true);
    ASSERT_EQ(isConfirmation(shortEntry, makeBar("", 21858, 21859, 21855.5, 21856)), false);
}

void run_pending_timeout() {
    EngineConfig cfg = entryConfig();  // max_wait_bars = 3
    ZoneArena zones;
    zones.insert(zoneOf(Breaker{makeBounds(100, 110), BreakerOrigin::Flip}, Direction::Bullish, 0));
    Bar touch = makeBar("", 107, 108, 105, 106);
    Bar drift = makeBar("", 106, 107, 104.5, 105.5);  // down close: never confirms

    EntryStep step = stepEntry(cfg, EntrySlot{}, inputsFor(zones, touch, 10));
    ASSERT_TRUE(step.transition == EntryTransition::Armed);
    ASSERT_TRUE(step.slot.state == EntryState::Pending);
    ASSERT_EQ(step.slot.pending.armed_index, 10L);

    EntrySlot slot = step.slot;
    for (long i = 11; i <= 13; ++i) {
        step = stepEntry(cfg, slot, inputsFor(zones, drift, i));
        ASSERT_TRUE(step.transition == EntryTransition::None);
        ASSERT_TRUE(!step.triggered.has_value());
        slot = step.slot;
    }
    step = stepEntry(cfg, slot, inputsFor(zones, drift, 14));
    ASSERT_TRUE(step.transition == EntryTransition::TimedOut);
    ASSERT_TRUE(step.slot.state == EntryState::Idle);
    ASSERT_TRUE(!step.triggered.has_value());
}

void run_pending_trigger_rules() {
    EngineConfig cfg = entryConfig();
    ZoneArena zones;
    ZoneId br = zones.insert(zoneOf(Breaker{makeBounds(100, 110), BreakerOrigin::Flip}, Direction::Bullish, 0));
    Bar reject = makeBar("", 104, 107, 103, 106);  // up close above mean 105

    EntryStep armed = stepEntry(cfg, EntrySlot{}, inputsFor(zones, reject, 5));
    ASSERT_TRUE(armed.transition == EntryTransition::Armed);

    // The arming bar itself never confirms
    EntryStep same = stepEntry(cfg, armed.slot, inputsFor(zones, reject, 5));
    ASSERT_TRUE(same.transition == EntryTransition::None);

    EntryInputs blocked = inputsFor(zones, reject, 6);
    blocked.can_trigger = false;
    ASSERT_TRUE(stepEntry(cfg, armed.slot, blocked).transition == EntryTransition::None);

    EntryStep fired = stepEntry(cfg, armed.slot, inputsFor(zones, reject, 6));
    ASSERT_TRUE(fired.transition == EntryTransition::Triggered);
    ASSERT_TRUE(fired.triggered->zone == br);
    ASSERT_TRUE(fired.slot.state == EntryState::Idle);

    // Idle without arming permission stays idle
    EntryInputs closed = inputsFor(zones, reject, 7);
    closed.can_arm = false;
    ASSERT_TRUE(stepEntry(cfg, EntrySlot{}, closed).transition == EntryTransition::None);

    zones.get(br)->validity = Validity::Violated;
    ASSERT_TRUE(stepEntry(cfg, armed.slot, inputsFor(zones, reject, 6)).transition == EntryTransition::ZoneLost);
    zones.erase(br);
    ASSERT_TRUE(stepEntry(cfg, armed.slot, inputsFor(zones, reject, 6)).transition == EntryTransition::ZoneLost);
}

} // namespace

void run_entry_tests() {
    std::cerr << "  setup_priority ... "; run_setup_priority(); std::cerr << "ok\n";
    std::cerr << "  ob_mean_threshold ... "; run_ob_mean_threshold(); std::cerr << "ok\n";
    std::cerr << "  direction_gates ... "; run_direction_gates(); std::cerr << "ok\n";
    std::cerr << "  confirmation_candle ... "; run_confirmation_candle(); std::cerr << "ok\n";
    std::cerr << "  pending_timeout ... "; run_pending_timeout(); std::cerr << "ok\n";
    std::cerr << "  pending_trigger_rules ... "; run_pending_trigger_rules(); std::cerr << "ok\n";
}
