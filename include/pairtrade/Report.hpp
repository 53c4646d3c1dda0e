#pragma once
#include <string>
#include "pairtrade/Backtest.hpp"
#include "pairtrade/Cointegration.hpp"
#include "pairtrade/Metrics.hpp"

namespace pairtrade {

    // formatted tables on stdout
    void print_pair_diagnostics(double beta, const stats::AdfResult& adf, double half_life);
    void print_metrics(const PerformanceMetrics& m, size_t n_trades);

    /**
     * Writes the result table as CSV:
     *   time,ret,equity,z,y_pos,x_pos,turnover,drawdown,rolling_sharpe
     * Missing values (z warm-up, rolling Sharpe warm-up) are left empty.
     * Throws DataError if the file cannot be written.
     */
    void save_backtest_csv(const BacktestResult& R,
                           const std::string& filepath,
                           size_t rolling_window = 126,
                           int freq = 252);

} // namespace pairtrade
