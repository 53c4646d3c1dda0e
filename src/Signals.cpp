#include "pairtrade/Signals.hpp"
#include "pairtrade/Errors.hpp"
#include <cmath>
#include <algorithm>
#include <string>
#include <boost/math/statistics/univariate_statistics.hpp>

namespace pairtrade {

// ---------------- rolling_zscore ----------------
std::vector<double> rolling_zscore(const std::vector<double>& spread, int lookback)
{
    if (lookback <= 0)
        throw ConfigError("lookback must be positive (got " + std::to_string(lookback) + ")");

    const size_t n = spread.size();
    const size_t L = static_cast<size_t>(lookback);
    std::vector<double> z(n, NAN);

    // sample std needs at least two points
    if (L < 2 || n < L) return z;

    // index of the most recent non-finite observation seen so far (+1), 0 = none
    size_t last_bad = 0;
    for (size_t i=0; i<n; ++i){
        if (!std::isfinite(spread[i])) last_bad = i + 1;
        if (i + 1 < L) continue;

        const size_t first = i + 1 - L;
        if (last_bad > first) continue;            // window holds a missing point

        auto begin = spread.begin() + static_cast<std::ptrdiff_t>(first);
        auto end   = spread.begin() + static_cast<std::ptrdiff_t>(i + 1);
        auto [mean, var] = boost::math::statistics::mean_and_sample_variance(begin, end);
        if (!(var > 0.0)) continue;                // flat window: indeterminate

        z[i] = (spread[i] - mean) / std::sqrt(var);
    }
    return z;
}

// ---------------- validation ----------------
void validate(const SignalParams& p)
{
    if (!std::isfinite(p.z_in) || !std::isfinite(p.z_out) || !std::isfinite(p.stop))
        throw ConfigError("thresholds must be finite");
    if (p.z_in <= 0.0)
        throw ConfigError("z_in must be > 0");
    if (p.z_out < 0.0 || p.z_out >= p.z_in)
        throw ConfigError("z_out must lie in [0, z_in)");
    if (p.stop <= p.z_in)
        throw ConfigError("stop must be > z_in");
    if (p.tp_threshold){
        const double tp = *p.tp_threshold;
        if (!std::isfinite(tp) || tp < 0.0 || tp > p.z_out)
            throw ConfigError("tp_threshold must lie in [0, z_out]");
    }
    if (!std::isfinite(p.confirm_delta) || p.confirm_delta < 0.0)
        throw ConfigError("confirm_delta must be >= 0");
}

int signed_position(PositionState s)
{
    switch (s){
    case PositionState::Long:  return 1;
    case PositionState::Short: return -1;
    case PositionState::Flat:
    case PositionState::PendingLong:
    case PositionState::PendingShort:
        return 0;
    }
    return 0;
}

// ---------------- step_position ----------------
PositionStep step_position(const PositionStep& prev, double z, const SignalParams& p)
{
    PositionStep next = prev;

    // a data gap never forces an exit, and a pending cross survives it
    if (!has_value(z)){
        next.reason = (prev.state == PositionState::Flat) ? TransitionReason::None
                                                          : TransitionReason::GapHold;
        return next;
    }

    const double abs_z = std::abs(z);
    auto go_flat = [&](TransitionReason why){
        next.state  = PositionState::Flat;
        next.z_cross = NAN;
        next.reason = why;
        return next;
    };
    auto enter = [&](PositionState side){
        next.state  = side;
        next.z_cross = NAN;
        next.reason = TransitionReason::Entry;
        return next;
    };

    switch (prev.state){
    case PositionState::Long:
    case PositionState::Short:
        // stop dominates take-profit and exit
        if (abs_z >= p.stop)
            return go_flat(TransitionReason::Stop);
        if (p.tp_threshold && abs_z < *p.tp_threshold)
            return go_flat(TransitionReason::TakeProfit);
        if (abs_z <= p.z_out)
            return go_flat(TransitionReason::Exit);
        next.reason = TransitionReason::Hold;
        return next;

    case PositionState::Flat:
        if (z >= p.z_in){
            next.state   = PositionState::PendingShort;
            next.z_cross = z;
            next.reason  = TransitionReason::Cross;
        } else if (z <= -p.z_in){
            next.state   = PositionState::PendingLong;
            next.z_cross = z;
            next.reason  = TransitionReason::Cross;
        } else {
            next.reason  = TransitionReason::None;
        }
        return next;

    case PositionState::PendingShort:
        // confirmation: z must come back toward 0 from above
        if (p.confirm_delta <= 0.0 || z <= std::max(p.z_in, prev.z_cross - p.confirm_delta))
            return enter(PositionState::Short);
        next.reason = TransitionReason::Pending;
        return next;

    case PositionState::PendingLong:
        if (p.confirm_delta <= 0.0 || z >= std::min(-p.z_in, prev.z_cross + p.confirm_delta))
            return enter(PositionState::Long);
        next.reason = TransitionReason::Pending;
        return next;
    }
    return next;
}

// ---------------- generate_positions ----------------
PositionTrajectory generate_positions(const std::vector<double>& z,
                                      double beta,
                                      const SignalParams& p)
{
    validate(p);
    if (!std::isfinite(beta)) throw ConfigError("beta must be finite");

    PositionTrajectory T;
    const size_t n = z.size();
    T.y_pos.reserve(n);
    T.x_pos.reserve(n);
    T.state.reserve(n);
    T.reason.reserve(n);

    PositionStep st;
    for (size_t i=0; i<n; ++i){
        st = step_position(st, z[i], p);
        const double y = static_cast<double>(signed_position(st.state));
        T.y_pos.push_back(y);
        T.x_pos.push_back(beta * y);
        T.state.push_back(st.state);
        T.reason.push_back(st.reason);
    }
    return T;
}

const char* to_string(PositionState s)
{
    switch (s){
    case PositionState::Flat:         return "FLAT";
    case PositionState::PendingLong:  return "PENDING_LONG";
    case PositionState::PendingShort: return "PENDING_SHORT";
    case PositionState::Long:         return "LONG";
    case PositionState::Short:        return "SHORT";
    }
    return "?";
}

const char* to_string(TransitionReason r)
{
    switch (r){
    case TransitionReason::None:       return "none";
    case TransitionReason::Hold:       return "hold";
    case TransitionReason::GapHold:    return "gap_hold";
    case TransitionReason::Cross:      return "cross";
    case TransitionReason::Pending:    return "pending";
    case TransitionReason::Entry:      return "entry";
    case TransitionReason::Stop:       return "stop";
    case TransitionReason::TakeProfit: return "take_profit";
    case TransitionReason::Exit:       return "exit";
    }
    return "?";
}

} // namespace pairtrade
