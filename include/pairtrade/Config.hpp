#pragma once
#include <string>
#include <vector>
#include <optional>
#include "pairtrade/Backtest.hpp"

namespace pairtrade {

// Everything one run of the pipeline needs.
struct RunConfig {
    std::string ticker_a = "KO";      // independent leg (x)
    std::string ticker_b = "PEP";     // dependent leg (y)
    std::string start = "2018-01-01";
    std::string end   = "2025-01-01";

    std::string prices_csv;           // local price source; empty = cache only
    std::string cache_dir = "data";
    std::string output = "outputs/backtest.csv";

    std::optional<double> beta;       // absent: estimated by OLS
    int freq = 252;                   // periods per year
    size_t rolling_window = 126;      // rolling Sharpe window

    BacktestParams params;
};

/**
 * Sets one key from its textual value. Keys are the RunConfig and
 * BacktestParams field names; "tp_threshold" and "beta" accept "none".
 * Returns false for an unknown key, throws ConfigError on a bad value.
 */
bool set_config_value(RunConfig& cfg, const std::string& key, const std::string& value);

// "key = value" lines, '#' comments. Unknown keys are warned about.
RunConfig load_config(const std::string& path, RunConfig base = RunConfig{});

// "--key value" pairs; "--config" is handled by the caller. Throws
// ConfigError on unknown flags or a missing value.
void apply_cli_overrides(RunConfig& cfg, const std::vector<std::string>& args);

// Full validation of a run: dates, tickers, backtest params, beta.
void validate(const RunConfig& cfg);

} // namespace pairtrade
