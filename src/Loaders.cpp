#include "pairtrade/Loaders.hpp"
#include "pairtrade/Errors.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace pairtrade {

// --------------------- basic helpers ---------------------
static bool is_space_like(unsigned char c){
    // NBSP (0xA0) + standard whitespace
    return std::isspace(c) || c == 0xA0;
}

static std::string trim_spaces(std::string s){
    size_t i=0, j=s.size();
    while (i<j && is_space_like((unsigned char)s[i])) ++i;
    while (j>i && is_space_like((unsigned char)s[j-1])) --j;
    return s.substr(i, j-i);
}

static std::vector<std::string> split_with_delim(const std::string& line, char delim){
    std::vector<std::string> out; out.reserve(16);
    std::string cur; bool in_quotes=false;
    for(char ch: line){
        if (ch=='"'){ in_quotes=!in_quotes; continue; }
        if (ch==delim && !in_quotes){ out.push_back(trim_spaces(cur)); cur.clear(); }
        else cur.push_back(ch);
    }
    out.push_back(trim_spaces(cur));
    return out;
}

static std::vector<std::string> split_auto(const std::string& line){
    auto a = split_with_delim(line, ',');
    auto b = split_with_delim(line, ';');
    if (b.size()>a.size() && b.size()>1) return b;
    return a;
}

static std::string to_upper(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}

// false for empty, NaN/NA or unparseable cells
static bool to_double(std::string s, double& out){
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c){
        return c==' ' || c=='\t' || c==0xA0;
    }), s.end());
    if (s.empty()) return false;
    const std::string up = to_upper(s);
    if (up=="NAN" || up=="NA") return false;
    // decimal comma only when there is no decimal point already
    if (s.find('.') == std::string::npos)
        for (char& ch : s) if (ch==',') ch='.';
    try {
        size_t idx=0;
        out = std::stod(s, &idx);
        return idx == s.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

// --------------------- date helpers ---------------------
static bool looks_like_iso(const std::string& s){
    if (s.size() < 10) return false;
    return std::isdigit((unsigned char)s[0]) &&
           std::isdigit((unsigned char)s[1]) &&
           std::isdigit((unsigned char)s[2]) &&
           std::isdigit((unsigned char)s[3]) &&
           s[4]=='-' && s[7]=='-';
}

static std::string pad2(int x){ char buf[8]; std::snprintf(buf, sizeof(buf), "%02d", x); return buf; }
static std::string pad4(int x){ char buf[8]; std::snprintf(buf, sizeof(buf), "%04d", x); return buf; }

static int yy_to_yyyy(int yy){ return (yy <= 69) ? (2000 + yy) : (1900 + yy); }

static std::vector<int> split_ints(const std::string& s, const std::string& seps){
    std::vector<int> parts;
    std::string cur;
    for (char c : s){
        if (seps.find(c) != std::string::npos){
            if (!cur.empty()){ parts.push_back(std::stoi(cur)); cur.clear(); }
        } else if (std::isdigit((unsigned char)c)) cur.push_back(c);
    }
    if (!cur.empty()) parts.push_back(std::stoi(cur));
    return parts;
}

// ISO passes through (a trailing "T" separator becomes a space); d/m/y
// becomes "YYYY-MM-DD", with " HH:MM:SS" appended only if a time was given.
static std::string normalize_timestamp(std::string s){
    s = trim_spaces(s);
    if (s.empty()) return s;

    if (looks_like_iso(s)) {
        if (s.size() > 10 && s[10]=='T') s[10] = ' ';
        return s;
    }

    std::string date, time;
    {
        size_t sp = s.find(' ');
        if (sp == std::string::npos) { date = s; }
        else { date = s.substr(0, sp); time = trim_spaces(s.substr(sp+1)); }
    }

    const auto d = split_ints(date, "/-.");
    if (d.size() < 3) return s;
    int y = d[2];
    if (y < 100) y = yy_to_yyyy(y);
    std::string out = pad4(y) + "-" + pad2(d[1]) + "-" + pad2(d[0]);

    if (!time.empty()){
        const auto t = split_ints(time, ": ");
        int H = t.size() > 0 ? t[0] : 0;
        int M = t.size() > 1 ? t[1] : 0;
        int S = t.size() > 2 ? t[2] : 0;
        out += " " + pad2(H) + ":" + pad2(M) + ":" + pad2(S);
    }
    return out;
}

// --------------------- CSV I/O ---------------------
PricePanel load_price_panel_csv(const std::string& filepath, const std::string& time_col)
{
    std::ifstream fin(filepath);
    if (!fin.is_open()) throw DataError("cannot open CSV: " + filepath);

    std::vector<std::string> headers;
    std::string line;
    while (std::getline(fin, line)){
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (trim_spaces(line).empty()) continue;
        headers = split_auto(line);
        break;
    }
    if (headers.size() < 2) throw DataError("CSV without a usable header: " + filepath);

    size_t tcol = headers.size();
    if (time_col == "*"){
        for (const char* want : {"Date", "Timestamp"}){
            for (size_t i=0;i<headers.size() && tcol==headers.size();++i)
                if (headers[i] == want) tcol = i;
        }
        for (size_t i=0;i<headers.size() && tcol==headers.size();++i)
            if (headers[i].find("Date") != std::string::npos ||
                headers[i].find("Timestamp") != std::string::npos) tcol = i;
        if (tcol == headers.size()) tcol = 0;
    } else {
        for (size_t i=0;i<headers.size();++i)
            if (headers[i] == time_col) { tcol = i; break; }
        if (tcol == headers.size()) throw DataError("missing time column: " + time_col);
    }

    PricePanel P;
    std::vector<size_t> value_cols;
    for (size_t i=0;i<headers.size();++i){
        if (i == tcol || headers[i].empty()) continue;
        value_cols.push_back(i);
        P.names.push_back(headers[i]);
    }
    P.columns.resize(value_cols.size());

    size_t lineno = 1;
    while (std::getline(fin, line)){
        ++lineno;
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (trim_spaces(line).empty()) continue;
        auto cols = split_auto(line);
        if (cols.size() <= tcol || cols[tcol].empty()){
            std::cerr << "[warn] " << filepath << ":" << lineno << " has no timestamp, skipped\n";
            continue;
        }

        P.time.push_back(normalize_timestamp(cols[tcol]));
        for (size_t j=0;j<value_cols.size();++j){
            double v = NAN;
            if (value_cols[j] < cols.size() && !to_double(cols[value_cols[j]], v)) v = NAN;
            P.columns[j].push_back(v);
        }
    }
    return P;
}

void save_price_panel_csv(const PricePanel& panel, const std::string& filepath)
{
    std::ofstream fout(filepath);
    if (!fout.is_open()) throw DataError("cannot open for writing: " + filepath);

    fout << "Date";
    for (const auto& n : panel.names) fout << "," << n;
    fout << "\n";

    fout << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t i=0;i<panel.size();++i){
        fout << panel.time[i];
        for (const auto& c : panel.columns){
            fout << ",";
            if (std::isfinite(c[i])) fout << c[i];
        }
        fout << "\n";
    }
    if (!fout) throw DataError("write failed: " + filepath);
}

// --------------------- cache ---------------------
std::string cache_path(const std::string& dir,
                       const std::vector<std::string>& tickers,
                       const std::string& start,
                       const std::string& end)
{
    std::vector<std::string> t = tickers;
    for (auto& s : t) std::replace(s.begin(), s.end(), '/', '-');
    std::sort(t.begin(), t.end());

    std::string slug;
    for (size_t i=0;i<t.size();++i){
        if (i) slug += "_";
        slug += t[i];
    }
    const std::string file = "adjclose_" + slug + "_" + start + "_" + end + ".csv";
    return (std::filesystem::path(dir) / file).string();
}

CsvPriceSource::CsvPriceSource(std::string filepath)
    : filepath_(std::move(filepath)) {}

PricePanel CsvPriceSource::operator()(const std::vector<std::string>& tickers,
                                      const std::string& start,
                                      const std::string& end) const
{
    auto all = load_price_panel_csv(filepath_);
    return select_columns(filter_by_date(all, start, end), tickers);
}

PriceCache::PriceCache(std::string dir)
    : dir_(std::move(dir)) {}

PricePanel PriceCache::get_price_data(const std::vector<std::string>& tickers,
                                      const std::string& start,
                                      const std::string& end,
                                      const PriceFetcher& fetch) const
{
    if (tickers.empty()) throw DataError("tickers must be a non-empty list");
    validate_dates(start, end);

    const std::string file = cache_path(dir_, tickers, start, end);

    std::error_code ec;
    if (std::filesystem::exists(file, ec)){
        try {
            auto cached = clean_price_panel(load_price_panel_csv(file));
            if (!cached.empty()) return select_columns(cached, tickers);
            std::cerr << "[warn] cache file " << file << " is empty, re-fetching\n";
        } catch (const std::exception& ex) {
            std::cerr << "[warn] cache read failed (" << ex.what() << "), re-fetching\n";
        }
    }

    if (!fetch) throw DataError("no price source configured and no usable cache at " + file);
    PricePanel prices = clean_price_panel(fetch(tickers, start, end));

    std::vector<std::string> missing;
    for (const auto& t : tickers)
        if (!prices.has_column(t)) missing.push_back(t);
    if (!missing.empty()){
        std::cerr << "[warn] missing tickers with no data:";
        for (const auto& m : missing) std::cerr << " " << m;
        std::cerr << "\n";
    }
    prices = select_columns(prices, tickers);
    if (prices.empty()) throw DataError("no data for any requested ticker");

    // cache is best-effort
    try {
        std::filesystem::create_directories(dir_, ec);
        save_price_panel_csv(prices, file);
    } catch (const std::exception& ex) {
        std::cerr << "[warn] could not write cache " << file << ": " << ex.what() << "\n";
    }
    return prices;
}

} // namespace pairtrade
