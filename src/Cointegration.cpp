#include "pairtrade/Cointegration.hpp"
#include "pairtrade/Errors.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/statistics/univariate_statistics.hpp>
#include <boost/math/statistics/linear_regression.hpp>

namespace {

using Matrix = std::vector<std::vector<double>>;   // row-major, rows = observations

struct OlsFit {
    std::vector<double> params;
    std::vector<double> tvalues;
    double ssr = 0.0;
    double aic = 0.0;
};

// In-place Gauss-Jordan inverse of a small symmetric system; false if singular.
bool invert(Matrix& A)
{
    const size_t k = A.size();
    Matrix inv(k, std::vector<double>(k, 0.0));
    for (size_t i=0;i<k;i++) inv[i][i] = 1.0;

    for (size_t c=0;c<k;c++){
        size_t piv = c;
        for (size_t r=c+1;r<k;r++)
            if (std::abs(A[r][c]) > std::abs(A[piv][c])) piv = r;
        if (!(std::abs(A[piv][c]) > 1e-300)) return false;
        std::swap(A[c], A[piv]);
        std::swap(inv[c], inv[piv]);

        const double d = A[c][c];
        for (size_t j=0;j<k;j++){ A[c][j] /= d; inv[c][j] /= d; }
        for (size_t r=0;r<k;r++){
            if (r == c) continue;
            const double f = A[r][c];
            if (f == 0.0) continue;
            for (size_t j=0;j<k;j++){ A[r][j] -= f*A[c][j]; inv[r][j] -= f*inv[c][j]; }
        }
    }
    A.swap(inv);
    return true;
}

// OLS through the normal equations; statsmodels' AIC convention (-2 llf + 2k).
OlsFit ols(const Matrix& X, const std::vector<double>& y)
{
    const size_t n = X.size();
    const size_t k = n ? X.front().size() : 0;
    if (n <= k) throw pairtrade::DataError("regression with fewer observations than regressors");

    Matrix XtX(k, std::vector<double>(k, 0.0));
    std::vector<double> Xty(k, 0.0);
    for (size_t i=0;i<n;i++){
        const auto& row = X[i];
        for (size_t a=0;a<k;a++){
            Xty[a] += row[a]*y[i];
            for (size_t b=a;b<k;b++) XtX[a][b] += row[a]*row[b];
        }
    }
    for (size_t a=0;a<k;a++) for (size_t b=0;b<a;b++) XtX[a][b] = XtX[b][a];

    if (!invert(XtX)) throw pairtrade::DataError("singular regression design");

    OlsFit F;
    F.params.assign(k, 0.0);
    for (size_t a=0;a<k;a++)
        for (size_t b=0;b<k;b++) F.params[a] += XtX[a][b]*Xty[b];

    for (size_t i=0;i<n;i++){
        double fit = 0.0;
        for (size_t a=0;a<k;a++) fit += X[i][a]*F.params[a];
        const double e = y[i] - fit;
        F.ssr += e*e;
    }

    const double s2 = F.ssr / static_cast<double>(n - k);
    F.tvalues.assign(k, NAN);
    for (size_t a=0;a<k;a++){
        const double se = std::sqrt(s2 * XtX[a][a]);
        F.tvalues[a] = (se > 0.0) ? F.params[a]/se : NAN;
    }

    const double nd  = static_cast<double>(n);
    const double llf = -0.5*nd*(std::log(2.0*boost::math::constants::pi<double>()) + std::log(F.ssr/nd) + 1.0);
    F.aic = -2.0*llf + 2.0*static_cast<double>(k);
    return F;
}

std::vector<double> finite_only(const std::vector<double>& v)
{
    std::vector<double> out; out.reserve(v.size());
    for (double x : v) if (std::isfinite(x)) out.push_back(x);
    return out;
}

// ADF design with `lags` lagged differences, dropping the first `skip`
// usable rows so that fits for different lag counts share one sample.
// Columns: [level_{t-1}, d_{t-1}..d_{t-lags}, const]
void adf_design(const std::vector<double>& x, const std::vector<double>& dx,
                       int lags, int skip, Matrix& X, std::vector<double>& y)
{
    const size_t start = static_cast<size_t>(std::max(lags, skip));
    X.clear(); y.clear();
    for (size_t t=start; t<dx.size(); ++t){
        std::vector<double> row;
        row.reserve(static_cast<size_t>(lags) + 2);
        row.push_back(x[t]);
        for (int j=1;j<=lags;j++) row.push_back(dx[t - static_cast<size_t>(j)]);
        row.push_back(1.0);
        X.push_back(std::move(row));
        y.push_back(dx[t]);
    }
}

} // anon

namespace pairtrade {
namespace stats {

double hedge_ratio(const std::vector<double>& y, const std::vector<double>& x)
{
    if (y.size() != x.size()) throw DataError("hedge_ratio: series size mismatch");
    double sxy = 0.0, sxx = 0.0;
    size_t n = 0;
    for (size_t i=0;i<y.size();i++){
        if (!std::isfinite(y[i]) || !std::isfinite(x[i])) continue;
        sxy += x[i]*y[i];
        sxx += x[i]*x[i];
        ++n;
    }
    if (n < 2) throw DataError("not enough overlapping observations to estimate hedge ratio");
    if (sxx == 0.0) throw DataError("hedge_ratio: independent series is identically zero");
    return sxy / sxx;
}

double hedge_ratio(const PriceSeries& y, const PriceSeries& x)
{
    const AlignedPair px = align_pair(x, y);
    return hedge_ratio(px.b, px.a);
}

double half_life(const std::vector<double>& spread)
{
    const auto s = finite_only(spread);
    if (s.size() < 20)
        throw DataError("spread too short to estimate half-life (need >= 20 observations, got "
                        + std::to_string(s.size()) + ")");

    std::vector<double> lag(s.begin(), s.end() - 1);
    std::vector<double> ds(s.size() - 1);
    for (size_t i=1;i<s.size();i++) ds[i-1] = s[i] - s[i-1];

    // a constant spread has no regression to speak of
    if (!(boost::math::statistics::variance(lag) > 0.0))
        return std::numeric_limits<double>::infinity();

    const double phi = boost::math::statistics::simple_ordinary_least_squares(lag, ds).second;
    const double kappa = -std::log1p(phi);
    if (!(kappa > 0.0)) return std::numeric_limits<double>::infinity();
    return std::log(2.0) / kappa;
}

double mackinnon_pvalue(double stat)
{
    // constant-only regression, one series
    constexpr double tau_max  = 2.74;
    constexpr double tau_min  = -18.83;
    constexpr double tau_star = -1.61;
    static const double small_p[3] = {2.1659, 1.4412, 0.038269};
    static const double large_p[4] = {1.7339, 0.93202, -0.12745, -0.010368};

    if (std::isnan(stat)) return NAN;
    if (stat > tau_max) return 1.0;
    if (stat < tau_min) return 0.0;

    double poly = 0.0, p = 1.0;
    if (stat <= tau_star) { for (double c : small_p){ poly += c*p; p *= stat; } }
    else                  { for (double c : large_p){ poly += c*p; p *= stat; } }

    const boost::math::normal_distribution<double> N01(0.0, 1.0);
    return boost::math::cdf(N01, poly);
}

// MacKinnon (2010) response surface, constant-only
static std::array<double,3> adf_critical_values(size_t nobs)
{
    static const double b[3][4] = {
        {-3.43035, -6.5393, -16.786, -79.433},   // 1%
        {-2.86154, -2.8903,  -4.234, -40.040},   // 5%
        {-2.56677, -1.5384,  -2.809,   0.0  },   // 10%
    };
    const double inv = 1.0 / static_cast<double>(nobs);
    std::array<double,3> out{};
    for (size_t i=0;i<3;i++)
        out[i] = b[i][0] + b[i][1]*inv + b[i][2]*inv*inv + b[i][3]*inv*inv*inv;
    return out;
}

AdfResult adf_test(const std::vector<double>& series)
{
    const auto x = finite_only(series);
    if (x.size() < 10)
        throw DataError("series too short for ADF test (need >= 10 observations, got "
                        + std::to_string(x.size()) + ")");

    const double nobs0 = static_cast<double>(x.size());
    int maxlag = static_cast<int>(std::ceil(12.0 * std::pow(nobs0/100.0, 0.25)));
    maxlag = std::min(static_cast<int>(x.size())/2 - 2, maxlag);
    if (maxlag < 0) throw DataError("sample size is too short to use the ADF test");

    std::vector<double> dx(x.size() - 1);
    for (size_t i=1;i<x.size();i++) dx[i-1] = x[i] - x[i-1];

    // lag order by AIC on the common sample of the longest model
    Matrix X; std::vector<double> y;
    int best_lag = 0;
    double best_aic = std::numeric_limits<double>::infinity();
    for (int lag=0; lag<=maxlag; ++lag){
        adf_design(x, dx, lag, maxlag, X, y);
        const OlsFit F = ols(X, y);
        if (F.aic < best_aic) { best_aic = F.aic; best_lag = lag; }
    }

    adf_design(x, dx, best_lag, best_lag, X, y);
    const OlsFit F = ols(X, y);

    AdfResult R;
    R.statistic = F.tvalues[0];
    R.pvalue    = mackinnon_pvalue(R.statistic);
    R.used_lag  = best_lag;
    R.nobs      = y.size();
    R.critical  = adf_critical_values(R.nobs);
    return R;
}

double adf_pvalue(const std::vector<double>& series)
{
    return adf_test(series).pvalue;
}

} // namespace stats
} // namespace pairtrade
