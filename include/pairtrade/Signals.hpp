#pragma once
#include <vector>
#include <optional>
#include <cmath>

namespace pairtrade {

// "No value" marker for z-scores: warm-up, incomplete windows, zero std.
inline bool has_value(double z) { return std::isfinite(z); }

/**
 * Rolling z-score of a spread:
 *   z_t = (S_t - mean_{t-L+1..t}(S)) / std_{t-L+1..t}(S)      (std with n-1)
 * Points whose window is not full of finite observations, and points whose
 * window std is exactly zero, are NaN. lookback <= 0 throws ConfigError.
 */
std::vector<double> rolling_zscore(const std::vector<double>& spread, int lookback);

enum class PositionState { Flat, PendingLong, PendingShort, Long, Short };

// Which rule decided a step; stop, take-profit and exit are kept apart.
enum class TransitionReason {
    None,        // flat, nothing happened
    Hold,        // in position, inside the bands
    GapHold,     // z had no value; state carried over
    Cross,       // first cross of +-z_in, now pending
    Pending,     // pending, confirmation not yet met
    Entry,
    Stop,
    TakeProfit,
    Exit
};

struct SignalParams {
    double z_in  = 2.0;
    double z_out = 0.5;
    double stop  = 3.5;
    std::optional<double> tp_threshold;   // absent: take-profit disabled
    double confirm_delta = 0.0;           // 0: enter on the bar after the cross
};

// Throws ConfigError unless z_in > 0, 0 <= z_out < z_in, stop > z_in,
// tp in [0, z_out] when set and confirm_delta >= 0.
void validate(const SignalParams& p);

// Loop-carried state of the scan. z_cross is meaningful only while pending.
struct PositionStep {
    PositionState state = PositionState::Flat;
    double z_cross = NAN;
    TransitionReason reason = TransitionReason::None;
};

// -1 short spread, 0 flat or pending, +1 long spread
int signed_position(PositionState s);

// One bar of the state machine. Parameters are assumed validated.
PositionStep step_position(const PositionStep& prev, double z, const SignalParams& p);

struct PositionTrajectory {
    std::vector<double> y_pos;              // {-1, 0, +1}
    std::vector<double> x_pos;              // beta * y_pos
    std::vector<PositionState> state;
    std::vector<TransitionReason> reason;
};

/**
 * Dollar-neutral positions from a z-score series.
 * Long spread (z <= -z_in): long y, short beta*x.
 * Short spread (z >= z_in): short y, long beta*x.
 * Throws ConfigError on invalid parameters or non-finite beta.
 */
PositionTrajectory generate_positions(const std::vector<double>& z,
                                      double beta,
                                      const SignalParams& p);

const char* to_string(PositionState s);
const char* to_string(TransitionReason r);

} // namespace pairtrade
