#include "pairtrade/DataOrdering.hpp"
#include "pairtrade/Errors.hpp"
#include <cmath>
#include <ctime>
#include <map>
#include <numeric>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace pairtrade {

static bool parse_iso_date(const std::string& s, std::tm& tm_out){
    // expected: "YYYY-MM-DD", anything after the date is ignored
    if (s.size() < 10) return false;
    std::istringstream ss(s.substr(0, 10));
    ss >> std::get_time(&tm_out, "%Y-%m-%d");
    return !ss.fail();
}

bool iso_less(const std::string& a, const std::string& b){
    return a < b;
}

bool is_iso_date(const std::string& s){
    std::tm tm{};
    return parse_iso_date(s, tm);
}

void validate_dates(const std::string& start, const std::string& end){
    if (!is_iso_date(start)) throw DataError("invalid start date '" + start + "'");
    if (!is_iso_date(end))   throw DataError("invalid end date '" + end + "'");
    if (iso_less(end, start))
        throw DataError("end date must be on/after start date (" + start + " > " + end + ")");
}

// ---------------------------
// PricePanel
// ---------------------------

static size_t find_column(const PricePanel& p, const std::string& name){
    for (size_t j=0; j<p.names.size(); ++j)
        if (p.names[j] == name) return j;
    return p.names.size();
}

bool PricePanel::has_column(const std::string& name) const {
    return find_column(*this, name) < names.size();
}

PriceSeries PricePanel::column(const std::string& name) const {
    const size_t j = find_column(*this, name);
    if (j >= names.size()) throw DataError("missing column: " + name);
    PriceSeries s;
    s.time  = time;
    s.value = columns[j];
    return s;
}

// ---------------------------
// Alignment
// ---------------------------

static std::map<std::string, double> finite_index(const PriceSeries& s){
    if (s.time.size() != s.value.size())
        throw DataError("price series time/value size mismatch");
    std::map<std::string, double> out;
    for (size_t i=0; i<s.size(); ++i){
        if (!std::isfinite(s.value[i])) continue;
        out.emplace(s.time[i], s.value[i]);   // emplace keeps the first duplicate
    }
    return out;
}

AlignedPair align_pair(const PriceSeries& a, const PriceSeries& b){
    const auto ia = finite_index(a);
    const auto ib = finite_index(b);

    AlignedPair out;
    out.time.reserve(std::min(ia.size(), ib.size()));
    auto pa = ia.begin();
    auto pb = ib.begin();
    while (pa != ia.end() && pb != ib.end()){
        if (iso_less(pa->first, pb->first))      ++pa;
        else if (iso_less(pb->first, pa->first)) ++pb;
        else {
            out.time.push_back(pa->first);
            out.a.push_back(pa->second);
            out.b.push_back(pb->second);
            ++pa; ++pb;
        }
    }
    return out;
}

// ---------------------------
// Panel transforms
// ---------------------------

PricePanel filter_by_date(const PricePanel& data,
                          const std::optional<std::string>& start,
                          const std::optional<std::string>& end){
    if (!start && !end) return data;

    PricePanel out;
    out.names = data.names;
    out.columns.resize(data.columns.size());
    for (size_t i=0; i<data.size(); ++i){
        const std::string& t = data.time[i];
        if (start && iso_less(t, *start)) continue;
        if (end   && !iso_less(t, *end))  continue;
        out.time.push_back(t);
        for (size_t j=0; j<data.columns.size(); ++j)
            out.columns[j].push_back(data.columns[j][i]);
    }
    return out;
}

PricePanel select_columns(const PricePanel& data, const std::vector<std::string>& names){
    PricePanel out;
    out.time = data.time;
    for (const auto& n : names){
        const size_t j = find_column(data, n);
        if (j >= data.names.size()) continue;
        out.names.push_back(n);
        out.columns.push_back(data.columns[j]);
    }
    return out;
}

static void ffill_limited(std::vector<double>& v, int limit){
    int run = 0;
    double last = NAN;
    for (auto& x : v){
        if (std::isfinite(x)) { last = x; run = 0; continue; }
        if (std::isfinite(last) && run < limit) { x = last; ++run; }
        else ++run;
    }
}

static void bfill_limited(std::vector<double>& v, int limit){
    int run = 0;
    double next = NAN;
    for (size_t k=v.size(); k-- > 0;){
        double& x = v[k];
        if (std::isfinite(x)) { next = x; run = 0; continue; }
        if (std::isfinite(next) && run < limit) { x = next; ++run; }
        else ++run;
    }
}

PricePanel clean_price_panel(const PricePanel& data, int ffill_limit, int bfill_limit){
    for (const auto& c : data.columns)
        if (c.size() != data.time.size()) throw DataError("price panel column size mismatch");

    // stable sort keeps the first of each duplicate timestamp in front
    std::vector<size_t> order(data.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t i, size_t j){
        return iso_less(data.time[i], data.time[j]);
    });

    PricePanel sorted;
    sorted.names = data.names;
    sorted.columns.resize(data.columns.size());
    for (size_t k=0; k<order.size(); ++k){
        const size_t i = order[k];
        if (!sorted.time.empty() && sorted.time.back() == data.time[i]) continue;
        sorted.time.push_back(data.time[i]);
        for (size_t j=0; j<data.columns.size(); ++j)
            sorted.columns[j].push_back(data.columns[j][i]);
    }

    PricePanel out;
    out.time = sorted.time;
    for (size_t j=0; j<sorted.columns.size(); ++j){
        auto col = sorted.columns[j];
        ffill_limited(col, ffill_limit);
        bfill_limited(col, bfill_limit);
        const bool all_missing = std::none_of(col.begin(), col.end(),
                                              [](double x){ return std::isfinite(x); });
        if (all_missing) continue;
        out.names.push_back(sorted.names[j]);
        out.columns.push_back(std::move(col));
    }
    return out;
}

} // namespace pairtrade
