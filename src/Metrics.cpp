#include "pairtrade/Metrics.hpp"
#include <cmath>
#include <algorithm>
#include <boost/math/statistics/univariate_statistics.hpp>

namespace pairtrade {

PerformanceMetrics compute_metrics(const std::vector<double>& ret, int freq)
{
    PerformanceMetrics M;

    std::vector<double> r; r.reserve(ret.size());
    for (double v : ret) if (std::isfinite(v)) r.push_back(v);
    if (r.empty()) return M;

    M.n_obs = r.size();
    const double f = static_cast<double>(freq);

    // the running peak starts at the first day's equity, not at 1
    double growth = 1.0, peak = -INFINITY, max_dd = 0.0;
    for (double v : r){
        growth *= (1.0 + v);
        peak    = std::max(peak, growth);
        max_dd  = std::min(max_dd, growth / peak - 1.0);
    }
    M.ann_return = std::pow(growth, f / static_cast<double>(r.size())) - 1.0;
    M.max_dd     = max_dd;

    if (r.size() > 1){
        const double var = boost::math::statistics::sample_variance(r);
        M.ann_vol = std::sqrt(std::max(0.0, var)) * std::sqrt(f);
    }
    M.sharpe = (M.ann_vol > 0.0) ? M.ann_return / M.ann_vol : 0.0;
    return M;
}

std::vector<double> drawdown_series(const std::vector<double>& ret)
{
    std::vector<double> dd(ret.size(), 0.0);
    double eq = 1.0, peak = -INFINITY;
    for (size_t i=0;i<ret.size();i++){
        const double v = std::isfinite(ret[i]) ? ret[i] : 0.0;
        eq  *= (1.0 + v);
        peak = std::max(peak, eq);
        dd[i] = eq / peak - 1.0;
    }
    return dd;
}

std::vector<double> rolling_sharpe(const std::vector<double>& ret, size_t window, int freq)
{
    std::vector<double> out(ret.size(), NAN);
    if (window < 2 || ret.size() < window) return out;

    std::vector<double> r(ret.size());
    for (size_t i=0;i<ret.size();i++) r[i] = std::isfinite(ret[i]) ? ret[i] : 0.0;

    const double ann = std::sqrt(static_cast<double>(freq));
    for (size_t i=window-1; i<r.size(); ++i){
        auto first = r.begin() + static_cast<std::ptrdiff_t>(i + 1 - window);
        auto last  = r.begin() + static_cast<std::ptrdiff_t>(i + 1);
        auto [mean, var] = boost::math::statistics::mean_and_sample_variance(first, last);
        if (!(var > 0.0)) continue;
        out[i] = mean / std::sqrt(var) * ann;
    }
    return out;
}

std::vector<size_t> trade_markers(const std::vector<double>& y_pos)
{
    std::vector<size_t> idx;
    double prev = 0.0;
    for (size_t i=0;i<y_pos.size();i++){
        const double y = std::isfinite(y_pos[i]) ? y_pos[i] : 0.0;
        if (y != prev) idx.push_back(i);
        prev = y;
    }
    return idx;
}

size_t count_trades(const std::vector<double>& y_pos)
{
    size_t n = 0;
    double prev = 0.0;
    for (double v : y_pos){
        const double y = std::isfinite(v) ? v : 0.0;
        if (y != 0.0 && y != prev) ++n;
        prev = y;
    }
    return n;
}

} // namespace pairtrade
