#pragma once
#include <vector>
#include <cstddef>

namespace pairtrade {

    struct PerformanceMetrics {
        double ann_return = 0.0;
        double ann_vol    = 0.0;
        double sharpe     = 0.0;
        double max_dd     = 0.0;    // <= 0
        size_t n_obs      = 0;      // finite returns used
    };

    /**
     * Annualised summary of a daily return series. Non-finite returns are
     * skipped; an empty series gives all zeros.
     *   ann_return = prod(1 + r)^(freq / n) - 1
     *   ann_vol    = std(r, ddof=1) * sqrt(freq)
     *   sharpe     = ann_return / ann_vol   (0 when ann_vol == 0)
     */
    PerformanceMetrics compute_metrics(const std::vector<double>& ret, int freq = 252);

    // equity / running peak - 1, non-finite returns counted as 0
    std::vector<double> drawdown_series(const std::vector<double>& ret);

    // Annualised rolling Sharpe (mean/std * sqrt(freq)); NaN while the
    // window is filling and where the window std is 0.
    std::vector<double> rolling_sharpe(const std::vector<double>& ret,
                                       size_t window = 126,
                                       int freq = 252);

    // Indices where the decided position changes (entries, exits, stops).
    std::vector<size_t> trade_markers(const std::vector<double>& y_pos);

    // Number of trades opened: flat -> in position, or a direct side flip.
    size_t count_trades(const std::vector<double>& y_pos);

} // namespace pairtrade
