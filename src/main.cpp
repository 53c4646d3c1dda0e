#include <iostream>
#include <vector>
#include <string>

#include "pairtrade/Config.hpp"
#include "pairtrade/Errors.hpp"
#include "pairtrade/Loaders.hpp"
#include "pairtrade/Cointegration.hpp"
#include "pairtrade/Backtest.hpp"
#include "pairtrade/Metrics.hpp"
#include "pairtrade/Report.hpp"

static void usage(const char* prog){
    std::cerr << "Usage: " << prog << " [--config run.cfg] [--prices_csv prices.csv]"
              << " [--ticker_a A] [--ticker_b B] [--start YYYY-MM-DD] [--end YYYY-MM-DD]"
              << " [--output out.csv] [--<param> value ...]\n";
}

int main(int argc, char** argv) {
    using namespace pairtrade;

    try {
        // ====== 0) CONFIG ======
        std::vector<std::string> args(argv + 1, argv + argc);
        if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
            usage(argv[0]);
            return 0;
        }

        RunConfig cfg;
        std::vector<std::string> overrides;
        for (size_t i=0; i<args.size(); ++i) {
            if (args[i] == "--config" && i + 1 < args.size()) cfg = load_config(args[++i], cfg);
            else overrides.push_back(args[i]);
        }
        apply_cli_overrides(cfg, overrides);
        validate(cfg);

        std::cout << "=== Pairs Backtest: " << cfg.ticker_b << " ~ " << cfg.ticker_a << " ===\n";

        // ====== 1) LOAD ======
        PriceFetcher fetch;
        if (!cfg.prices_csv.empty()) fetch = CsvPriceSource(cfg.prices_csv);

        const PriceCache cache(cfg.cache_dir);
        const auto px = cache.get_price_data({cfg.ticker_a, cfg.ticker_b}, cfg.start, cfg.end, fetch);

        if (px.size() < 2) throw DataError("not enough price rows in " + cfg.start + " .. " + cfg.end);

        const PriceSeries pxA = px.column(cfg.ticker_a);
        const PriceSeries pxB = px.column(cfg.ticker_b);
        std::cout << "[Info] Rows loaded: " << px.size()
                  << " (" << px.time.front() << " .. " << px.time.back() << ")\n";

        // ====== 2) HEDGE RATIO & DIAGNOSTICS ======
        const double beta = cfg.beta ? *cfg.beta : stats::hedge_ratio(pxB, pxA);

        const AlignedPair aligned = align_pair(pxA, pxB);
        std::vector<double> spread(aligned.size());
        for (size_t i=0; i<aligned.size(); ++i) spread[i] = aligned.b[i] - beta * aligned.a[i];

        const auto adf = stats::adf_test(spread);
        const double hl = stats::half_life(spread);
        std::cout << "\n";
        print_pair_diagnostics(beta, adf, hl);

        // ====== 3) BACKTEST ======
        const auto R = backtest_aligned(aligned, beta, cfg.params);
        const auto m = compute_metrics(R.ret, cfg.freq);

        std::cout << "\n";
        print_metrics(m, count_trades(R.y_pos));
        std::cout << "[Info] Final equity: " << R.equity.back() << "\n";

        // ====== 4) SAVE ======
        save_backtest_csv(R, cfg.output, cfg.rolling_window, cfg.freq);
        std::cout << "\n[Info] Saved: " << cfg.output << "\n";

        std::cout << "\n[OK] Done.\n";
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
