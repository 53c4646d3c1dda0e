#include "pairtrade/Report.hpp"
#include "pairtrade/Errors.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <cmath>

namespace pairtrade {

static std::string fmt6(double x){
    std::ostringstream oss;
    if (std::isfinite(x)) oss << std::fixed << std::setprecision(6) << x;
    else if (std::isinf(x)) oss << (x > 0 ? "inf" : "-inf");
    return oss.str();
}

void print_pair_diagnostics(double beta, const stats::AdfResult& adf, double half_life){
    std::cout << "Pair Diagnostics\n"
              << "---------------------------------------------\n";
    std::cout << "beta        : " << fmt6(beta) << "\n";
    std::cout << "ADF stat    : " << fmt6(adf.statistic)
              << " (lag " << adf.used_lag << ", n=" << adf.nobs << ")\n";
    std::cout << "ADF p-value : " << fmt6(adf.pvalue)
              << ", crit 1%/5%/10% = [" << fmt6(adf.critical[0]) << ", "
              << fmt6(adf.critical[1]) << ", " << fmt6(adf.critical[2]) << "]\n";
    std::cout << "half-life   : " << fmt6(half_life) << " bars\n";
}

void print_metrics(const PerformanceMetrics& m, size_t n_trades){
    std::cout << "Performance\n"
              << "---------------------------------------------\n";
    std::cout << std::left
              << std::setw(14) << "ann_return" << fmt6(m.ann_return) << "\n"
              << std::setw(14) << "ann_vol"    << fmt6(m.ann_vol)    << "\n"
              << std::setw(14) << "sharpe"     << fmt6(m.sharpe)     << "\n"
              << std::setw(14) << "max_dd"     << fmt6(m.max_dd)     << "\n"
              << std::setw(14) << "n_obs"      << m.n_obs            << "\n"
              << std::setw(14) << "trades"     << n_trades           << "\n";
}

void save_backtest_csv(const BacktestResult& R, const std::string& filepath,
                       size_t rolling_window, int freq){
    const auto parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()){
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream fout(filepath);
    if (!fout.is_open()) throw DataError("cannot open " + filepath + " for writing");

    const auto dd = drawdown_series(R.ret);
    const auto rs = rolling_sharpe(R.ret, rolling_window, freq);

    auto cell = [](double x){
        std::ostringstream oss;
        if (std::isfinite(x)) oss << std::setprecision(12) << x;
        return oss.str();
    };

    fout << "time,ret,equity,z,y_pos,x_pos,turnover,drawdown,rolling_sharpe\n";
    for (size_t i=0;i<R.size();++i){
        fout << R.time[i] << ","
             << cell(R.ret[i]) << ","
             << cell(R.equity[i]) << ","
             << cell(R.z[i]) << ","
             << cell(R.y_pos[i]) << ","
             << cell(R.x_pos[i]) << ","
             << cell(R.turnover[i]) << ","
             << cell(dd[i]) << ","
             << cell(rs[i]) << "\n";
    }
    if (!fout) throw DataError("write failed: " + filepath);
}

} // namespace pairtrade
