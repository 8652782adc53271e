#include "backtester.hpp"
#include "config.hpp"
#include "report.hpp"
#include "zone_strategy.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <vector>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

//-----------------------------------------------------------------------------
// Config: run options in one place; engine parameters live in EngineConfig
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = "data/sample_ohlc.csv";
    std::string config_path;
    std::vector<std::string> overrides;  // --set key=value, applied after the file
    std::string reports_dir = "reports";
    std::string bar_resolution = "1m";
    double initial_cash = 100000.0;
    double commission = 0.0;
    double slippage = 0.0;
    bool verbose = false;
    bool list_params = false;
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (...) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: zonetrade --data bars.csv [--config file] [--set key=value]...\n"
        << "                 [--bar 1m|5m|15m|30m|1h] [--cash N] [--commission N] [--slippage F]\n"
        << "                 [--reports-dir dir] [--verbose] [--list-params]\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                error_msg = "Missing value for " + arg;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--data") { if (!next()) return false; cfg.data_path = argv[i]; }
        else if (arg == "--config") { if (!next()) return false; cfg.config_path = argv[i]; }
        else if (arg == "--set") { if (!next()) return false; cfg.overrides.push_back(argv[i]); }
        else if (arg == "--reports-dir") { if (!next()) return false; cfg.reports_dir = argv[i]; }
        else if (arg == "--bar") { if (!next()) return false; cfg.bar_resolution = argv[i]; }
        else if (arg == "--cash") { if (!next() || !parseDouble(argv[i], cfg.initial_cash, error_msg, "--cash")) return false; }
        else if (arg == "--commission") { if (!next() || !parseDouble(argv[i], cfg.commission, error_msg, "--commission")) return false; }
        else if (arg == "--slippage") { if (!next() || !parseDouble(argv[i], cfg.slippage, error_msg, "--slippage")) return false; }
        else if (arg == "--verbose" || arg == "-v") { cfg.verbose = true; }
        else if (arg == "--list-params") { cfg.list_params = true; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if run options are invalid.
bool validateRunConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.initial_cash < 0) { error_msg = "initial cash (--cash) must be >= 0"; return false; }
    if (cfg.commission < 0) { error_msg = "commission (--commission) must be >= 0"; return false; }
    if (cfg.slippage < 0 || cfg.slippage >= 1) { error_msg = "--slippage must be in [0, 1)"; return false; }
    return true;
}

/// Defaults, then the config file, then --set overrides; validated as a whole.
bool buildEngineConfig(const Config& cfg, zonetrade::EngineConfig& engine, std::string& error_msg) {
    using namespace zonetrade;
    if (!cfg.config_path.empty() && !loadConfigFile(cfg.config_path, engine, error_msg)) return false;
    for (const auto& o : cfg.overrides) {
        if (!applyAssignment(engine, o, error_msg)) {
            error_msg = "--set " + o + ": " + error_msg;
            return false;
        }
    }
    return validateConfig(engine, error_msg);
}

int runBacktest(const Config& cfg, const zonetrade::EngineConfig& engine) {
    using namespace zonetrade;
    auto strategy = createZoneStrategy(engine, cfg.verbose);
    ZoneStrategy* zone = strategy.get();

    BacktestOptions options;
    options.initial_cash = cfg.initial_cash;
    options.commission = cfg.commission;
    options.slippage = cfg.slippage;
    options.bar_resolution = cfg.bar_resolution;
    options.tick_size = engine.tick_size;
    Backtester bt(std::move(strategy), cfg.data_path, options);

    std::string error_msg;
    if (!bt.run(error_msg)) {
        std::cerr << "Failed to run backtest: " << error_msg << "\n";
        return 1;
    }

    Report report(bt.simulator(), bt.data(), cfg.initial_cash, "zone", configSummary(engine));
    BacktestMetrics m = report.computeMetrics();
    m.entries = zone->entries();
    m.events = static_cast<int>(zone->events().size());
    report.setMetrics(m);
    if (bt.stoppedEarly())
        report.setStoppedReason(bt.stopReason());
    report.printSummary(std::cout);

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create reports directory " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool ok = report.writeTradeLog((fs::path(cfg.reports_dir) / "trades.csv").string());
    ok = report.writeEquityCurve((fs::path(cfg.reports_dir) / "equity_curve.csv").string()) && ok;
    ok = report.writeEventLog((fs::path(cfg.reports_dir) / "events.csv").string(), zone->events()) && ok;
    ok = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!validateRunConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    zonetrade::EngineConfig engine;
    if (!buildEngineConfig(cfg, engine, error_msg)) {
        std::cerr << "Invalid configuration: " << error_msg << "\n";
        return 1;
    }
    if (cfg.list_params) {
        zonetrade::describeParams(std::cout, engine);
        return 0;
    }

    // Resolve default data path when running from build/
    if (!(fs::exists(cfg.data_path) && fs::is_regular_file(cfg.data_path)) &&
         fs::exists("../data/sample_ohlc.csv") && fs::is_regular_file("../data/sample_ohlc.csv"))
        cfg.data_path = "../data/sample_ohlc.csv";

    return runBacktest(cfg, engine);
}
