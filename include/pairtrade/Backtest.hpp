#pragma once
#include <vector>
#include <string>
#include <optional>

#include "pairtrade/DataOrdering.hpp"
#include "pairtrade/Signals.hpp"

namespace pairtrade {

struct BacktestParams {
    int    lookback = 60;
    double z_in     = 2.0;
    double z_out    = 0.5;
    double stop     = 3.5;
    double cost_bps = 1.0;                 // bps of traded notional, both legs combined
    std::optional<double> tp_threshold;    // absent: take-profit disabled
    double confirm_delta = 0.0;

    SignalParams signal() const;
};

// Throws ConfigError on lookback <= 0, cost_bps < 0 or any signal violation.
void validate(const BacktestParams& p);

/**
 * Result table, one entry per aligned timestamp.
 * - ret: net return of the day (gross_ret - cost)
 * - equity: prod(1 + ret), starts from the first day's (1 + ret)
 * - z: rolling z-score, NaN where it has no value
 * - y_pos, x_pos: decided positions (x_pos = beta * y_pos)
 * - turnover: traded notional / prior-day gross exposure (0 when flat)
 * gross_ret, cost and state are diagnostics.
 */
struct BacktestResult {
    std::vector<std::string> time;
    std::vector<double> ret;
    std::vector<double> equity;
    std::vector<double> z;
    std::vector<double> y_pos;
    std::vector<double> x_pos;
    std::vector<double> turnover;

    std::vector<double> gross_ret;
    std::vector<double> cost;
    std::vector<PositionState> state;

    size_t size() const { return time.size(); }
};

/**
 * Backtest one pair.
 * Spread S = B - beta * A, positions from the z-score state machine, held
 * with a one-day lag (the position decided at t-1 is carried through t).
 * Daily dollar PnL is normalised by the prior-day gross exposure of both
 * legs; costs are charged on the combined traded notional.
 *
 * Throws ConfigError on invalid params / non-finite beta and DataError when
 * the two series share fewer than 2 timestamps.
 */
BacktestResult backtest_pair(const PriceSeries& pricesA,
                             const PriceSeries& pricesB,
                             double beta,
                             const BacktestParams& params);

// Same engine on an already aligned pair. A non-finite price leaves the
// z-score without a value and is marked at the leg's last finite price for
// PnL and exposure. Throws DataError if the legs and the time column differ
// in length or a leg has no price at the first timestamp.
BacktestResult backtest_aligned(const AlignedPair& px,
                                double beta,
                                const BacktestParams& params);

} // namespace pairtrade
