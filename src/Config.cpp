#include "pairtrade/Config.hpp"
#include "pairtrade/Errors.hpp"
#include "pairtrade/DataOrdering.hpp"
#include <fstream>
#include <iostream>
#include <cctype>
#include <cmath>
#include <limits>

namespace pairtrade {

static std::string trim(const std::string& s){
    size_t i=0, j=s.size();
    while (i<j && std::isspace((unsigned char)s[i])) ++i;
    while (j>i && std::isspace((unsigned char)s[j-1])) --j;
    return s.substr(i, j-i);
}

static bool is_none(const std::string& v){
    std::string t;
    for (char c : v) t.push_back((char)std::tolower((unsigned char)c));
    return t.empty() || t == "none" || t == "null" || t == "off";
}

static double parse_double(const std::string& key, const std::string& value){
    size_t idx = 0;
    double v = NAN;
    try {
        v = std::stod(value, &idx);
    } catch (const std::exception&) {
        throw ConfigError("'" + key + "' expects a number, got '" + value + "'");
    }
    if (idx != value.size()) throw ConfigError("'" + key + "' expects a number, got '" + value + "'");
    return v;
}

static int parse_int(const std::string& key, const std::string& value){
    size_t idx = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &idx);
    } catch (const std::exception&) {
        throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
    }
    if (idx != value.size()) throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw ConfigError("'" + key + "' is out of range: " + value);
    return static_cast<int>(v);
}

bool set_config_value(RunConfig& cfg, const std::string& key, const std::string& value)
{
    auto& p = cfg.params;
    if      (key == "ticker_a")      cfg.ticker_a = value;
    else if (key == "ticker_b")      cfg.ticker_b = value;
    else if (key == "start")         cfg.start = value;
    else if (key == "end")           cfg.end = value;
    else if (key == "prices_csv")    cfg.prices_csv = value;
    else if (key == "cache_dir")     cfg.cache_dir = value;
    else if (key == "output")        cfg.output = value;
    else if (key == "beta")          cfg.beta = is_none(value) ? std::nullopt
                                                               : std::optional<double>(parse_double(key, value));
    else if (key == "freq")          cfg.freq = parse_int(key, value);
    else if (key == "rolling_window"){
        const int w = parse_int(key, value);
        if (w < 2) throw ConfigError("rolling_window must be >= 2");
        cfg.rolling_window = static_cast<size_t>(w);
    }
    else if (key == "lookback")      p.lookback = parse_int(key, value);
    else if (key == "z_in")          p.z_in = parse_double(key, value);
    else if (key == "z_out")         p.z_out = parse_double(key, value);
    else if (key == "stop")          p.stop = parse_double(key, value);
    else if (key == "cost_bps")      p.cost_bps = parse_double(key, value);
    else if (key == "tp_threshold")  p.tp_threshold = is_none(value) ? std::nullopt
                                                                     : std::optional<double>(parse_double(key, value));
    else if (key == "confirm_delta") p.confirm_delta = parse_double(key, value);
    else return false;
    return true;
}

RunConfig load_config(const std::string& path, RunConfig base)
{
    std::ifstream file(path);
    if (!file.is_open()) throw ConfigError("cannot open config file: " + path);

    std::string line;
    size_t lineno = 0;
    while (std::getline(file, line)){
        ++lineno;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto pos = line.find('=');
        if (pos == std::string::npos){
            std::cerr << "[warn] " << path << ":" << lineno << ": expected key = value\n";
            continue;
        }
        const std::string key   = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));
        if (!set_config_value(base, key, value))
            std::cerr << "[warn] " << path << ":" << lineno << ": unknown key '" << key << "'\n";
    }
    return base;
}

void apply_cli_overrides(RunConfig& cfg, const std::vector<std::string>& args)
{
    for (size_t i=0; i<args.size(); ++i){
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) throw ConfigError("unexpected argument '" + arg + "'");
        if (i + 1 >= args.size())    throw ConfigError("missing value for " + arg);
        const std::string key = arg.substr(2);
        if (!set_config_value(cfg, key, args[++i]))
            throw ConfigError("unknown option " + arg);
    }
}

void validate(const RunConfig& cfg)
{
    if (cfg.ticker_a.empty() || cfg.ticker_b.empty())
        throw ConfigError("both ticker_a and ticker_b are required");
    if (cfg.ticker_a == cfg.ticker_b)
        throw ConfigError("ticker_a and ticker_b must differ");
    validate_dates(cfg.start, cfg.end);
    if (cfg.freq <= 0)
        throw ConfigError("freq must be positive");
    if (cfg.beta && !std::isfinite(*cfg.beta))
        throw ConfigError("beta must be finite");
    validate(cfg.params);
}

} // namespace pairtrade
