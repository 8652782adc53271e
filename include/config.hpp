#pragma once

#include <string>
#include <ostream>

namespace zonetrade {

/// Higher-timeframe gate: Strict trades only with the HTF direction, Loose prefers it,
/// Off ignores it.
enum class HtfMode { Strict, Loose, Off };

enum class TargetMode { FixedR, Liquidity, Hybrid };

enum class TrailMode { Points, Atr };

struct SwingParams {
    int left = 2;    // bars left of the pivot that must be strictly lower (higher for lows)
    int right = 2;   // bars right of the pivot; confirmation delay
};

struct ZoneParams {
    int ob_min_candles = 2;
    int ob_max_run = 5;              // longest same-direction run scanned for an order block
    bool ob_mean_threshold = true;
    double fvg_min_gap = 2.0;        // points
    bool breaker_require_displacement = true;
    double breaker_displacement_body = 5.0;  // min |close - open| of the displacement bar
    int breaker_sweep_lookback = 20;         // bars scanned back for the sweep
    double breaker_structure_buffer = 3.0;   // distance past the swept swing level
    double bpr_min_width = 0.25;
    double bpr_dedupe_tolerance = 1.0;
    int max_age = 50;                // bars
    int max_ob = 15;
    int max_breaker = 15;
    int max_fvg = 20;
    int max_ifvg = 15;
    int max_bpr = 10;
};

struct BiasParams {
    int ma_period = 21;
    HtfMode htf_mode = HtfMode::Loose;
    int htf_minutes = 60;
    bool loose_counter_unicorn_only = true;  // Loose: counter-HTF trades need a Unicorn
    bool require_align = true;
};

struct LiquidityParams {
    bool require_target = true;
    bool use_session = true;
    bool use_swing = true;
    bool use_equal = true;
    double equal_tolerance = 2.0;
};

struct EntryParams {
    bool enable_long = true;
    bool enable_short = true;
    bool enable_unicorn = true;
    bool enable_breaker = true;
    bool enable_ifvg = true;
    bool enable_ob = true;
    int max_wait_bars = 3;
};

struct SessionParams {
    int trade_start = 930;    // HHMM, inclusive
    int trade_end = 1600;     // HHMM, exclusive for entries
    bool forced_flat_enabled = true;
    int forced_flat = 1555;   // HHMM
    int cooldown_minutes = 5;
    int utc_offset_minutes = 0;
};

struct RiskParams {
    int max_trades_day = 3;
    bool one_per_direction = false;
    int contracts = 1;
    double stop_default = 12.5;
    double stop_min = 10.0;
    double stop_max = 15.0;
    double stop_buffer = 2.0;
    double tight_threshold = 10.0;
    bool override_to_structure = true;
};

struct ExitParams {
    TargetMode target_mode = TargetMode::FixedR;
    double target_r = 2.0;
    bool be_enabled = true;
    double be_trigger_points = 3.0;
    double be_offset = 0.0;
    bool partial_enabled = true;
    double partial_r = 1.0;
    int partial_pct = 50;
    bool trail_enabled = true;
    TrailMode trail_mode = TrailMode::Points;
    double trail_points = 15.0;
    double trail_atr_mult = 2.0;
    int trail_atr_period = 14;
    bool time_stop_enabled = true;
    int max_bars = 60;
    int progress_bars = 20;         // 0 = no progress check
    double progress_min_r = 0.25;
};

/// Every tunable of the engine. Defaults are the live-trading defaults.
struct EngineConfig {
    SwingParams swing;
    ZoneParams zones;
    BiasParams bias;
    LiquidityParams liquidity;
    EntryParams entry;
    SessionParams session;
    RiskParams risk;
    ExitParams exits;
    double tick_size = 0.25;
    int max_history = 200;
};

/// Set one parameter by its flat key (e.g. "stop.min"). Type and range are checked.
bool applyParam(EngineConfig& cfg, const std::string& key, const std::string& value, std::string& error_msg);

/// Parse "key=value" and apply it.
bool applyAssignment(EngineConfig& cfg, const std::string& assignment, std::string& error_msg);

/// Load "key=value" lines; '#' starts a comment. Stops at the first bad line.
bool loadConfigFile(const std::string& path, EngineConfig& cfg, std::string& error_msg);

/// Cross-field checks. Must pass before any bar is processed.
bool validateConfig(const EngineConfig& cfg, std::string& error_msg);

/// One line per parameter: key, type, range, current value.
void describeParams(std::ostream& out, const EngineConfig& cfg);

/// Short "key=value ..." summary for report headers.
std::string configSummary(const EngineConfig& cfg);

} // namespace zonetrade
