#pragma once
#include <vector>
#include <array>
#include <cstddef>
#include <cmath>

#include "pairtrade/DataOrdering.hpp"

namespace pairtrade {
namespace stats {

    // OLS of y on x without intercept (y_t = beta * x_t + e_t) over the
    // finite overlap of the two series. Throws DataError with < 2 points.
    double hedge_ratio(const PriceSeries& y, const PriceSeries& x);
    double hedge_ratio(const std::vector<double>& y, const std::vector<double>& x);

    /**
     * Half-life of mean reversion from the AR(1) fit
     *   dS_t = c + phi * S_{t-1} + e_t,  kappa = -ln(1 + phi),  HL = ln 2 / kappa.
     * Returns +inf when no reversion is estimated (kappa <= 0).
     * Non-finite points are dropped; fewer than 20 left throws DataError.
     */
    double half_life(const std::vector<double>& spread);

    struct AdfResult {
        double statistic = NAN;
        double pvalue    = NAN;
        int    used_lag  = 0;
        size_t nobs      = 0;
        std::array<double,3> critical{NAN, NAN, NAN};   // 1%, 5%, 10%
    };

    // Augmented Dickey-Fuller with constant, lag chosen by AIC.
    // Fewer than 10 finite points throws DataError.
    AdfResult adf_test(const std::vector<double>& series);
    double adf_pvalue(const std::vector<double>& series);

    // MacKinnon (1994) approximate p-value for the constant-only ADF statistic.
    double mackinnon_pvalue(double stat);

} // namespace stats
} // namespace pairtrade
