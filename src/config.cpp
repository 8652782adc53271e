#include "config.hpp"
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace zonetrade {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parseInt(const std::string& s, int& out) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    } catch (...) {
        return false;
    }
}

bool parseDouble(const std::string& s, double& out) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (...) {
        return false;
    }
}

bool parseBool(const std::string& s, bool& out) {
    if (s == "true" || s == "1" || s == "on" || s == "yes") { out = true; return true; }
    if (s == "false" || s == "0" || s == "off" || s == "no") { out = false; return true; }
    return false;
}

std::string formatDouble(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

/// One row of the parameter table. set() checks type and range before writing the field.
struct ParamDef {
    std::string key;
    std::string type;
    std::string range;
    std::function<bool(EngineConfig&, const std::string&, std::string&)> set;
    std::function<std::string(const EngineConfig&)> get;
};

template <typename Access>
ParamDef intParam(const std::string& key, int lo, int hi, Access access) {
    ParamDef p;
    p.key = key;
    p.type = "int";
    p.range = std::to_string(lo) + ".." + std::to_string(hi);
    p.set = [key, lo, hi, access](EngineConfig& c, const std::string& v, std::string& err) {
        int out = 0;
        if (!parseInt(v, out)) { err = key + ": \"" + v + "\" is not an integer"; return false; }
        if (out < lo || out > hi) {
            err = key + ": " + v + " out of range " + std::to_string(lo) + ".." + std::to_string(hi);
            return false;
        }
        access(c) = out;
        return true;
    };
    p.get = [access](const EngineConfig& c) { return std::to_string(access(c)); };
    return p;
}

template <typename Access>
ParamDef doubleParam(const std::string& key, double lo, double hi, Access access) {
    ParamDef p;
    p.key = key;
    p.type = "double";
    p.range = formatDouble(lo) + ".." + formatDouble(hi);
    p.set = [key, lo, hi, access](EngineConfig& c, const std::string& v, std::string& err) {
        double out = 0;
        if (!parseDouble(v, out)) { err = key + ": \"" + v + "\" is not a number"; return false; }
        if (out < lo || out > hi) {
            err = key + ": " + v + " out of range " + formatDouble(lo) + ".." + formatDouble(hi);
            return false;
        }
        access(c) = out;
        return true;
    };
    p.get = [access](const EngineConfig& c) { return formatDouble(access(c)); };
    return p;
}

template <typename Access>
ParamDef boolParam(const std::string& key, Access access) {
    ParamDef p;
    p.key = key;
    p.type = "bool";
    p.range = "true|false";
    p.set = [key, access](EngineConfig& c, const std::string& v, std::string& err) {
        bool out = false;
        if (!parseBool(v, out)) { err = key + ": \"" + v + "\" is not a bool"; return false; }
        access(c) = out;
        return true;
    };
    p.get = [access](const EngineConfig& c) { return std::string(access(c) ? "true" : "false"); };
    return p;
}

/// Session times are HHMM integers; minutes must be below 60.
template <typename Access>
ParamDef hhmmParam(const std::string& key, Access access) {
    ParamDef p;
    p.key = key;
    p.type = "hhmm";
    p.range = "0000..2359";
    p.set = [key, access](EngineConfig& c, const std::string& v, std::string& err) {
        int out = 0;
        if (!parseInt(v, out) || out < 0 || out > 2359 || out % 100 >= 60) {
            err = key + ": \"" + v + "\" is not a valid HHMM time";
            return false;
        }
        access(c) = out;
        return true;
    };
    p.get = [access](const EngineConfig& c) { return std::to_string(access(c)); };
    return p;
}

template <typename Enum, typename Access>
ParamDef enumParam(const std::string& key, std::vector<std::pair<std::string, Enum>> names, Access access) {
    ParamDef p;
    p.key = key;
    p.type = "enum";
    for (const auto& n : names) {
        if (!p.range.empty()) p.range += "|";
        p.range += n.first;
    }
    std::string range = p.range;
    p.set = [key, names, range, access](EngineConfig& c, const std::string& v, std::string& err) {
        for (const auto& n : names) {
            if (n.first == v) { access(c) = n.second; return true; }
        }
        err = key + ": \"" + v + "\" is not one of " + range;
        return false;
    };
    p.get = [names, access](const EngineConfig& c) {
        for (const auto& n : names)
            if (n.second == access(c)) return n.first;
        return std::string("?");
    };
    return p;
}

const std::vector<ParamDef>& paramTable() {
    static const std::vector<ParamDef> table = {
        intParam("swing.left", 1, 10, [](auto& c) -> auto& { return c.swing.left; }),
        intParam("swing.right", 1, 10, [](auto& c) -> auto& { return c.swing.right; }),
        intParam("ob.min_candles", 1, 5, [](auto& c) -> auto& { return c.zones.ob_min_candles; }),
        intParam("ob.max_run", 1, 20, [](auto& c) -> auto& { return c.zones.ob_max_run; }),
        boolParam("ob.mean_threshold", [](auto& c) -> auto& { return c.zones.ob_mean_threshold; }),
        doubleParam("fvg.min_gap", 0.25, 50.0, [](auto& c) -> auto& { return c.zones.fvg_min_gap; }),
        boolParam("breaker.require_displacement", [](auto& c) -> auto& { return c.zones.breaker_require_displacement; }),
        doubleParam("breaker.displacement_body", 0.0, 100.0, [](auto& c) -> auto& { return c.zones.breaker_displacement_body; }),
        intParam("breaker.sweep_lookback", 2, 200, [](auto& c) -> auto& { return c.zones.breaker_sweep_lookback; }),
        doubleParam("breaker.structure_buffer", 0.0, 50.0, [](auto& c) -> auto& { return c.zones.breaker_structure_buffer; }),
        doubleParam("bpr.min_width", 0.0, 50.0, [](auto& c) -> auto& { return c.zones.bpr_min_width; }),
        doubleParam("bpr.dedupe_tolerance", 0.0, 10.0, [](auto& c) -> auto& { return c.zones.bpr_dedupe_tolerance; }),
        intParam("zone.max_age", 1, 1000, [](auto& c) -> auto& { return c.zones.max_age; }),
        intParam("zone.max_ob", 1, 200, [](auto& c) -> auto& { return c.zones.max_ob; }),
        intParam("zone.max_breaker", 1, 200, [](auto& c) -> auto& { return c.zones.max_breaker; }),
        intParam("zone.max_fvg", 1, 200, [](auto& c) -> auto& { return c.zones.max_fvg; }),
        intParam("zone.max_ifvg", 1, 200, [](auto& c) -> auto& { return c.zones.max_ifvg; }),
        intParam("zone.max_bpr", 1, 200, [](auto& c) -> auto& { return c.zones.max_bpr; }),
        intParam("bias.ma_period", 2, 500, [](auto& c) -> auto& { return c.bias.ma_period; }),
        enumParam<HtfMode>("bias.htf_mode",
            {{"strict", HtfMode::Strict}, {"loose", HtfMode::Loose}, {"off", HtfMode::Off}},
            [](auto& c) -> auto& { return c.bias.htf_mode; }),
        intParam("bias.htf_minutes", 2, 1440, [](auto& c) -> auto& { return c.bias.htf_minutes; }),
        boolParam("bias.loose_counter_unicorn_only", [](auto& c) -> auto& { return c.bias.loose_counter_unicorn_only; }),
        boolParam("bias.require_align", [](auto& c) -> auto& { return c.bias.require_align; }),
        boolParam("liquidity.require_target", [](auto& c) -> auto& { return c.liquidity.require_target; }),
        boolParam("liquidity.use_session", [](auto& c) -> auto& { return c.liquidity.use_session; }),
        boolParam("liquidity.use_swing", [](auto& c) -> auto& { return c.liquidity.use_swing; }),
        boolParam("liquidity.use_equal", [](auto& c) -> auto& { return c.liquidity.use_equal; }),
        doubleParam("liquidity.equal_tolerance", 0.0, 50.0, [](auto& c) -> auto& { return c.liquidity.equal_tolerance; }),
        boolParam("entry.enable_long", [](auto& c) -> auto& { return c.entry.enable_long; }),
        boolParam("entry.enable_short", [](auto& c) -> auto& { return c.entry.enable_short; }),
        boolParam("entry.enable_unicorn", [](auto& c) -> auto& { return c.entry.enable_unicorn; }),
        boolParam("entry.enable_breaker", [](auto& c) -> auto& { return c.entry.enable_breaker; }),
        boolParam("entry.enable_ifvg", [](auto& c) -> auto& { return c.entry.enable_ifvg; }),
        boolParam("entry.enable_ob", [](auto& c) -> auto& { return c.entry.enable_ob; }),
        intParam("entry.max_wait_bars", 1, 50, [](auto& c) -> auto& { return c.entry.max_wait_bars; }),
        hhmmParam("session.trade_start", [](auto& c) -> auto& { return c.session.trade_start; }),
        hhmmParam("session.trade_end", [](auto& c) -> auto& { return c.session.trade_end; }),
        boolParam("session.forced_flat_enabled", [](auto& c) -> auto& { return c.session.forced_flat_enabled; }),
        hhmmParam("session.forced_flat", [](auto& c) -> auto& { return c.session.forced_flat; }),
        intParam("session.cooldown_minutes", 0, 600, [](auto& c) -> auto& { return c.session.cooldown_minutes; }),
        intParam("session.utc_offset_minutes", -720, 840, [](auto& c) -> auto& { return c.session.utc_offset_minutes; }),
        intParam("risk.max_trades_day", 1, 100, [](auto& c) -> auto& { return c.risk.max_trades_day; }),
        boolParam("risk.one_per_direction", [](auto& c) -> auto& { return c.risk.one_per_direction; }),
        intParam("risk.contracts", 1, 1000, [](auto& c) -> auto& { return c.risk.contracts; }),
        doubleParam("stop.default", 0.25, 500.0, [](auto& c) -> auto& { return c.risk.stop_default; }),
        doubleParam("stop.min", 0.25, 500.0, [](auto& c) -> auto& { return c.risk.stop_min; }),
        doubleParam("stop.max", 0.25, 500.0, [](auto& c) -> auto& { return c.risk.stop_max; }),
        doubleParam("stop.buffer", 0.0, 50.0, [](auto& c) -> auto& { return c.risk.stop_buffer; }),
        doubleParam("stop.tight_threshold", 0.0, 200.0, [](auto& c) -> auto& { return c.risk.tight_threshold; }),
        boolParam("stop.override_to_structure", [](auto& c) -> auto& { return c.risk.override_to_structure; }),
        enumParam<TargetMode>("target.mode",
            {{"fixed_r", TargetMode::FixedR}, {"liquidity", TargetMode::Liquidity}, {"hybrid", TargetMode::Hybrid}},
            [](auto& c) -> auto& { return c.exits.target_mode; }),
        doubleParam("target.r", 0.25, 20.0, [](auto& c) -> auto& { return c.exits.target_r; }),
        boolParam("be.enabled", [](auto& c) -> auto& { return c.exits.be_enabled; }),
        doubleParam("be.trigger_points", 0.0, 500.0, [](auto& c) -> auto& { return c.exits.be_trigger_points; }),
        doubleParam("be.offset", 0.0, 50.0, [](auto& c) -> auto& { return c.exits.be_offset; }),
        boolParam("partial.enabled", [](auto& c) -> auto& { return c.exits.partial_enabled; }),
        doubleParam("partial.r", 0.1, 20.0, [](auto& c) -> auto& { return c.exits.partial_r; }),
        intParam("partial.pct", 1, 99, [](auto& c) -> auto& { return c.exits.partial_pct; }),
        boolParam("trail.enabled", [](auto& c) -> auto& { return c.exits.trail_enabled; }),
        enumParam<TrailMode>("trail.mode",
            {{"points", TrailMode::Points}, {"atr", TrailMode::Atr}},
            [](auto& c) -> auto& { return c.exits.trail_mode; }),
        doubleParam("trail.points", 0.25, 500.0, [](auto& c) -> auto& { return c.exits.trail_points; }),
        doubleParam("trail.atr_mult", 0.1, 20.0, [](auto& c) -> auto& { return c.exits.trail_atr_mult; }),
        intParam("trail.atr_period", 1, 200, [](auto& c) -> auto& { return c.exits.trail_atr_period; }),
        boolParam("time.enabled", [](auto& c) -> auto& { return c.exits.time_stop_enabled; }),
        intParam("time.max_bars", 1, 10000, [](auto& c) -> auto& { return c.exits.max_bars; }),
        intParam("time.progress_bars", 0, 10000, [](auto& c) -> auto& { return c.exits.progress_bars; }),
        doubleParam("time.progress_min_r", -10.0, 10.0, [](auto& c) -> auto& { return c.exits.progress_min_r; }),
        doubleParam("instrument.tick_size", 0.0001, 1000.0, [](auto& c) -> auto& { return c.tick_size; }),
        intParam("engine.max_history", 10, 10000, [](auto& c) -> auto& { return c.max_history; }),
    };
    return table;
}

} // namespace

bool applyParam(EngineConfig& cfg, const std::string& key, const std::string& value, std::string& error_msg) {
    for (const auto& p : paramTable()) {
        if (p.key == key) return p.set(cfg, trim(value), error_msg);
    }
    error_msg = "unknown parameter: " + key;
    return false;
}

bool applyAssignment(EngineConfig& cfg, const std::string& assignment, std::string& error_msg) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        error_msg = "expected key=value, got \"" + assignment + "\"";
        return false;
    }
    return applyParam(cfg, trim(assignment.substr(0, eq)), assignment.substr(eq + 1), error_msg);
}

bool loadConfigFile(const std::string& path, EngineConfig& cfg, std::string& error_msg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        error_msg = "cannot open config file: " + path;
        return false;
    }
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;
        if (!applyAssignment(cfg, line, error_msg)) {
            error_msg = path + ":" + std::to_string(line_no) + ": " + error_msg;
            return false;
        }
    }
    return true;
}

bool validateConfig(const EngineConfig& cfg, std::string& error_msg) {
    const RiskParams& r = cfg.risk;
    if (r.stop_min > r.stop_max) { error_msg = "stop.min must be <= stop.max"; return false; }
    if (r.stop_default < r.stop_min || r.stop_default > r.stop_max) {
        error_msg = "stop.default must lie within [stop.min, stop.max]";
        return false;
    }
    if (cfg.session.trade_start >= cfg.session.trade_end) {
        error_msg = "session.trade_start must be before session.trade_end";
        return false;
    }
    if (cfg.exits.partial_pct <= 0 || cfg.exits.partial_pct >= 100) {
        error_msg = "partial.pct must be within (0, 100)";
        return false;
    }
    if (cfg.exits.progress_bars > 0 && cfg.exits.progress_bars >= cfg.exits.max_bars) {
        error_msg = "time.progress_bars must be below time.max_bars";
        return false;
    }
    if (cfg.tick_size <= 0) { error_msg = "instrument.tick_size must be > 0"; return false; }
    if (cfg.swing.left < 1 || cfg.swing.right < 1) { error_msg = "swing strengths must be >= 1"; return false; }
    if (cfg.max_history < cfg.zones.breaker_sweep_lookback + cfg.swing.left + cfg.swing.right + 3) {
        error_msg = "engine.max_history too small for breaker.sweep_lookback and swing strengths";
        return false;
    }
    // ATR over `period` true ranges needs period + 1 bars in the window
    if (cfg.exits.trail_mode == TrailMode::Atr && cfg.max_history <= cfg.exits.trail_atr_period) {
        error_msg = "engine.max_history must exceed trail.atr_period when trail.mode=atr";
        return false;
    }
    return true;
}

void describeParams(std::ostream& out, const EngineConfig& cfg) {
    for (const auto& p : paramTable()) {
        out << std::left << std::setw(34) << p.key << std::setw(8) << p.type
            << std::setw(22) << p.range << p.get(cfg) << "\n";
    }
}

std::string configSummary(const EngineConfig& cfg) {
    std::string s;
    for (const char* key : {"target.mode", "target.r", "stop.min", "stop.max", "bias.htf_mode", "risk.max_trades_day"}) {
        for (const auto& p : paramTable()) {
            if (p.key != key) continue;
            if (!s.empty()) s += " ";
            s += p.key + "=" + p.get(cfg);
        }
    }
    return s;
}

} // namespace zonetrade
