#include "pairtrade/Backtest.hpp"
#include "pairtrade/Errors.hpp"
#include <cmath>
#include <string>

namespace pairtrade {

SignalParams BacktestParams::signal() const {
    SignalParams s;
    s.z_in  = z_in;
    s.z_out = z_out;
    s.stop  = stop;
    s.tp_threshold  = tp_threshold;
    s.confirm_delta = confirm_delta;
    return s;
}

void validate(const BacktestParams& p){
    if (p.lookback <= 0)
        throw ConfigError("lookback must be positive (got " + std::to_string(p.lookback) + ")");
    if (!std::isfinite(p.cost_bps) || p.cost_bps < 0.0)
        throw ConfigError("cost_bps must be >= 0");
    validate(p.signal());
}

// x / d, with zero standing in for the undefined ratio on a flat book
static inline double safe_ratio(double x, double d){
    return (d != 0.0 && std::isfinite(d)) ? x / d : 0.0;
}

// last finite price carried over missing ones; a leg must open with a price
static std::vector<double> carry_forward(const std::vector<double>& px, const char* leg){
    if (px.empty() || !std::isfinite(px.front()))
        throw DataError(std::string("leg ") + leg + " has no price at the first timestamp");
    std::vector<double> out(px);
    for (size_t t=1; t<out.size(); ++t)
        if (!std::isfinite(out[t])) out[t] = out[t-1];
    return out;
}

BacktestResult backtest_aligned(const AlignedPair& px, double beta, const BacktestParams& params)
{
    validate(params);
    if (!std::isfinite(beta)) throw ConfigError("beta must be finite");
    if (px.a.size() != px.size() || px.b.size() != px.size())
        throw DataError("aligned pair size mismatch (time " + std::to_string(px.size())
                        + ", a " + std::to_string(px.a.size())
                        + ", b " + std::to_string(px.b.size()) + ")");
    if (px.size() < 2)
        throw DataError("need at least 2 overlapping observations (got " + std::to_string(px.size()) + ")");

    const size_t n = px.size();

    // the spread sees the raw prices (a missing price is a z gap); the
    // accounting marks a missing price at its last available value
    std::vector<double> spread(n);
    for (size_t t=0; t<n; ++t) spread[t] = px.b[t] - beta * px.a[t];

    const auto pxA = carry_forward(px.a, "a");
    const auto pxB = carry_forward(px.b, "b");

    BacktestResult R;
    R.time = px.time;
    R.z = rolling_zscore(spread, params.lookback);

    auto P = generate_positions(R.z, beta, params.signal());
    R.y_pos = std::move(P.y_pos);
    R.x_pos = std::move(P.x_pos);
    R.state = std::move(P.state);

    R.ret.resize(n);
    R.equity.resize(n);
    R.turnover.resize(n);
    R.gross_ret.resize(n);
    R.cost.resize(n);

    const double cost_rate = params.cost_bps / 1e4;
    double equity = 1.0;

    for (size_t t=0; t<n; ++t){
        // holdings through day t were decided at the close of t-1
        const double qB = (t > 0) ?  R.y_pos[t-1] : 0.0;
        const double qA = (t > 0) ? -R.x_pos[t-1] : 0.0;

        const double dB = (t > 0) ? pxB[t] - pxB[t-1] : 0.0;
        const double dA = (t > 0) ? pxA[t] - pxA[t-1] : 0.0;
        const double pnl = qB * dB + qA * dA;

        // capital base: yesterday's gross two-leg exposure
        const double exposure_prev = (t > 0)
            ? std::abs(qB) * pxB[t-1] + std::abs(qA) * pxA[t-1]
            : 0.0;

        const double dyB = (t > 0) ? std::abs(R.y_pos[t] - R.y_pos[t-1]) : 0.0;
        const double dxA = (t > 0) ? std::abs(R.x_pos[t] - R.x_pos[t-1]) : 0.0;
        const double traded_notional = dyB * pxB[t] + dxA * pxA[t];

        const double turnover = safe_ratio(traded_notional, exposure_prev);
        const double gross    = safe_ratio(pnl, exposure_prev);
        const double cost     = cost_rate * turnover;

        R.gross_ret[t] = gross;
        R.cost[t]      = cost;
        R.ret[t]       = gross - cost;
        R.turnover[t]  = turnover;

        equity *= (1.0 + R.ret[t]);
        R.equity[t] = equity;
    }
    return R;
}

BacktestResult backtest_pair(const PriceSeries& pricesA,
                             const PriceSeries& pricesB,
                             double beta,
                             const BacktestParams& params)
{
    // configuration problems surface before data problems
    validate(params);
    if (!std::isfinite(beta)) throw ConfigError("beta must be finite");

    return backtest_aligned(align_pair(pricesA, pricesB), beta, params);
}

} // namespace pairtrade
