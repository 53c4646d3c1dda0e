#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <random>
#include <string>
#include <vector>

#include "pairtrade/Backtest.hpp"
#include "pairtrade/Metrics.hpp"
#include "pairtrade/Errors.hpp"

using namespace pairtrade;

namespace {

std::vector<std::string> business_days(size_t n){
    std::vector<std::string> out;
    out.reserve(n);
    int offset = 0;
    while (out.size() < n){
        std::tm tm{};
        tm.tm_year = 2018 - 1900;
        tm.tm_mon  = 0;
        tm.tm_mday = 1 + offset++;
        tm.tm_hour = 12;
        std::mktime(&tm);
        if (tm.tm_wday == 0 || tm.tm_wday == 6) continue;
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
        out.emplace_back(buf);
    }
    return out;
}

PriceSeries make_series(const std::vector<std::string>& t, const std::vector<double>& v){
    PriceSeries s;
    s.time = t;
    s.value = v;
    return s;
}

bool same_bits(const std::vector<double>& a, const std::vector<double>& b){
    return a.size() == b.size() &&
           (a.empty() || std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0);
}

// x: geometric random walk, y = beta * x + AR(1) spread
struct SyntheticPair {
    PriceSeries a, b;
    double beta = 1.5;
};

SyntheticPair synthetic_pair(size_t n, double phi, std::uint64_t seed){
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> N(0.0, 1.0);

    std::vector<double> x(n), y(n);
    double log_x = 0.0, spread = 0.0;
    SyntheticPair P;
    for (size_t t=0;t<n;t++){
        log_x += 0.0005 + 0.01 * N(rng);
        x[t] = 100.0 * std::exp(log_x);
        const double eps = 0.5 * N(rng);
        if (t > 0) spread = phi * spread + eps;
        y[t] = P.beta * x[t] + spread;
    }
    const auto days = business_days(n);
    P.a = make_series(days, x);
    P.b = make_series(days, y);
    return P;
}

BacktestParams scenario_params(){
    BacktestParams p;
    p.lookback = 60;
    p.z_in  = 1.5;
    p.z_out = 0.5;
    p.stop  = 4.0;
    p.cost_bps = 0.5;
    return p;
}

} // namespace

// ---------------- errors ----------------

TEST(BacktestPair, FewerThanTwoOverlappingPointsIsDataError) {
    const auto a = make_series({"2020-01-01", "2020-01-02"}, {10.0, 10.5});
    const auto b = make_series({"2020-01-02", "2020-01-03"}, {20.0, 21.0});
    EXPECT_THROW(backtest_pair(a, b, 1.0, BacktestParams{}), DataError);

    const auto empty = make_series({}, {});
    EXPECT_THROW(backtest_pair(empty, empty, 1.0, BacktestParams{}), DataError);
}

TEST(BacktestPair, InvalidConfigurationIsRejectedBeforeData) {
    const auto a = make_series({"2020-01-01"}, {10.0});
    BacktestParams p;

    p = BacktestParams{}; p.lookback = 0;        EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    p = BacktestParams{}; p.cost_bps = -1.0;     EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    p = BacktestParams{}; p.z_out = 2.5;         EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    p = BacktestParams{}; p.stop = 1.0;          EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    p = BacktestParams{}; p.tp_threshold = 0.9;  EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    p = BacktestParams{}; p.confirm_delta = -1;  EXPECT_THROW(backtest_pair(a, a, 1.0, p), ConfigError);
    EXPECT_THROW(backtest_pair(a, a, NAN, BacktestParams{}), ConfigError);
}

// ---------------- alignment ----------------

TEST(BacktestPair, AlignsOnSharedTimestampsInOrder) {
    const auto a = make_series({"2020-01-03", "2020-01-01", "2020-01-02", "2020-01-05"},
                               {13.0, 11.0, 12.0, 15.0});
    const auto b = make_series({"2020-01-02", "2020-01-03", "2020-01-04", "2020-01-01"},
                               {22.0, 23.0, 24.0, NAN});
    BacktestParams p;
    p.lookback = 2;
    const auto R = backtest_pair(a, b, 1.0, p);

    const std::vector<std::string> expected = {"2020-01-02", "2020-01-03"};
    EXPECT_EQ(R.time, expected);
    EXPECT_EQ(R.size(), 2u);
}

// ---------------- accounting ----------------

// Constant A leg, beta = 1, lookback 3: positions are forced by hand-checked
// z values (cross at t2, short from t3, exit at t5).
TEST(BacktestPair, HandComputedShortRoundTrip) {
    const std::vector<std::string> t = {"d0", "d1", "d2", "d3", "d4", "d5", "d6"};
    const std::vector<double> A(7, 10.0);
    const std::vector<double> B = {20.0, 20.0, 21.0, 21.0, 22.0, 21.5, 21.5};

    BacktestParams p;
    p.lookback = 3;
    p.z_in  = 1.1;
    p.z_out = 0.5;
    p.stop  = 1.2;
    p.cost_bps = 10.0;

    const auto R = backtest_pair(make_series(t, A), make_series(t, B), 1.0, p);

    const std::vector<double> y = {0, 0, 0, -1, -1, 0, 0};
    EXPECT_EQ(R.y_pos, y);
    EXPECT_EQ(R.x_pos, y);
    EXPECT_EQ(R.state[2], PositionState::PendingShort);

    // t4: hold -1 B, +1 A through a +1 move in B on 31 of exposure
    EXPECT_DOUBLE_EQ(R.gross_ret[4], -1.0 / 31.0);
    EXPECT_DOUBLE_EQ(R.cost[4], 0.0);
    // t5: B falls 0.5 on 32 of exposure, flattening trades 21.5 + 10
    EXPECT_DOUBLE_EQ(R.gross_ret[5], 0.5 / 32.0);
    EXPECT_DOUBLE_EQ(R.turnover[5], 31.5 / 32.0);
    EXPECT_DOUBLE_EQ(R.cost[5], 10.0 / 1e4 * 31.5 / 32.0);
    EXPECT_DOUBLE_EQ(R.ret[5], 0.5 / 32.0 - 10.0 / 1e4 * 31.5 / 32.0);

    // entry day has no prior exposure: nothing is charged or reported
    EXPECT_EQ(R.turnover[3], 0.0);
    EXPECT_EQ(R.ret[3], 0.0);

    for (size_t i : {0u, 1u, 2u, 3u, 6u}) EXPECT_EQ(R.ret[i], 0.0);

    EXPECT_DOUBLE_EQ(R.equity[6], (1.0 - 1.0 / 31.0) * (1.0 + R.ret[5]));
}

// Same pair with B missing at t4: the short is held through the gap, t4
// is marked at the last price and t5 takes the whole move.
TEST(BacktestAligned, MissingPriceIsCarriedForwardNotLeaked) {
    AlignedPair px;
    px.time = {"d0", "d1", "d2", "d3", "d4", "d5"};
    px.a = std::vector<double>(6, 10.0);
    px.b = {20.0, 20.0, 21.0, 21.0, NAN, 21.5};

    BacktestParams p;
    p.lookback = 3;
    p.z_in  = 1.1;
    p.z_out = 0.5;
    p.stop  = 1.2;
    p.cost_bps = 10.0;

    const auto R = backtest_aligned(px, 1.0, p);

    const std::vector<double> y = {0, 0, 0, -1, -1, -1};
    EXPECT_EQ(R.y_pos, y);
    EXPECT_FALSE(has_value(R.z[4]));
    EXPECT_FALSE(has_value(R.z[5]));

    EXPECT_EQ(R.ret[4], 0.0);
    EXPECT_DOUBLE_EQ(R.gross_ret[5], -0.5 / 31.0);
    EXPECT_EQ(R.cost[5], 0.0);
    for (size_t i=0; i<R.size(); ++i){
        EXPECT_TRUE(std::isfinite(R.ret[i])) << "t=" << i;
        EXPECT_TRUE(std::isfinite(R.equity[i])) << "t=" << i;
    }
    EXPECT_DOUBLE_EQ(R.equity.back(), 1.0 - 0.5 / 31.0);
}

TEST(BacktestAligned, MalformedPairIsDataError) {
    BacktestParams p;
    p.lookback = 3;

    AlignedPair short_leg;
    short_leg.time = {"d0", "d1", "d2"};
    short_leg.a = {10.0, 10.0};
    short_leg.b = {20.0, 20.0, 21.0};
    EXPECT_THROW(backtest_aligned(short_leg, 1.0, p), DataError);

    AlignedPair no_opening_price;
    no_opening_price.time = {"d0", "d1", "d2"};
    no_opening_price.a = {10.0, 10.0, 10.0};
    no_opening_price.b = {NAN, 20.0, 21.0};
    EXPECT_THROW(backtest_aligned(no_opening_price, 1.0, p), DataError);
}

TEST(BacktestPair, ZeroCostLeavesGrossReturnUntouched) {
    const auto P = synthetic_pair(600, 0.9, 7);
    auto p = scenario_params();
    p.cost_bps = 0.0;
    const auto R = backtest_pair(P.a, P.b, P.beta, p);

    ASSERT_EQ(R.ret.size(), R.gross_ret.size());
    for (size_t i=0;i<R.size();i++){
        EXPECT_EQ(R.ret[i], R.gross_ret[i]);
        EXPECT_EQ(R.cost[i], 0.0);
    }
}

TEST(BacktestPair, CostIsCombinedLegTurnoverTimesRate) {
    const auto P = synthetic_pair(600, 0.9, 11);
    auto p = scenario_params();
    p.cost_bps = 5.0;
    const auto R = backtest_pair(P.a, P.b, P.beta, p);
    for (size_t i=0;i<R.size();i++){
        EXPECT_DOUBLE_EQ(R.cost[i], 5.0 / 1e4 * R.turnover[i]);
        EXPECT_DOUBLE_EQ(R.ret[i], R.gross_ret[i] - R.cost[i]);
    }
}

TEST(BacktestPair, IsIdempotent) {
    const auto P = synthetic_pair(800, 0.95, 3);
    auto p = scenario_params();
    p.tp_threshold = 0.1;
    p.confirm_delta = 0.2;

    const auto R1 = backtest_pair(P.a, P.b, P.beta, p);
    const auto R2 = backtest_pair(P.a, P.b, P.beta, p);

    EXPECT_EQ(R1.time, R2.time);
    EXPECT_TRUE(same_bits(R1.ret, R2.ret));
    EXPECT_TRUE(same_bits(R1.equity, R2.equity));
    EXPECT_TRUE(same_bits(R1.z, R2.z));
    EXPECT_TRUE(same_bits(R1.y_pos, R2.y_pos));
    EXPECT_TRUE(same_bits(R1.x_pos, R2.x_pos));
    EXPECT_TRUE(same_bits(R1.turnover, R2.turnover));
}

TEST(BacktestPair, ResultInvariants) {
    const auto P = synthetic_pair(1000, 0.95, 5);
    const auto R = backtest_pair(P.a, P.b, P.beta, scenario_params());

    double eq = 1.0;
    for (size_t i=0;i<R.size();i++){
        EXPECT_TRUE(R.y_pos[i] == -1.0 || R.y_pos[i] == 0.0 || R.y_pos[i] == 1.0);
        EXPECT_EQ(R.x_pos[i], P.beta * R.y_pos[i]);
        EXPECT_GE(R.turnover[i], 0.0);
        ASSERT_TRUE(std::isfinite(R.ret[i]));
        ASSERT_TRUE(std::isfinite(R.equity[i]));
        eq *= (1.0 + R.ret[i]);
        EXPECT_DOUBLE_EQ(R.equity[i], eq);
    }
    // warm-up z has no value, and the first lookback-1 bars stay flat
    for (int i=0;i<59;i++){
        EXPECT_FALSE(has_value(R.z[i]));
        EXPECT_EQ(R.y_pos[i], 0.0);
    }
    EXPECT_EQ(R.ret.front(), 0.0);
}

TEST(BacktestPair, SyntheticMeanRevertingScenario) {
    const auto P = synthetic_pair(1500, 0.95, 42);
    const auto R = backtest_pair(P.a, P.b, P.beta, scenario_params());

    size_t valid = 0;
    double turnover = 0.0;
    double residual = 0.0;
    for (size_t i=0;i<R.size();i++){
        if (std::isfinite(R.ret[i])) ++valid;
        turnover += R.turnover[i];
        const double r = std::abs(R.y_pos[i] + R.x_pos[i] / (-P.beta));
        EXPECT_LT(r, 1e-12);
        residual += r;
    }
    EXPECT_GE(valid, 500u);
    EXPECT_GT(turnover, 0.0);
    EXPECT_LT(residual / static_cast<double>(R.size()), 1e-8);

    const auto m = compute_metrics(R.ret);
    EXPECT_GT(m.sharpe, 0.5);
    EXPECT_GT(R.equity.back(), 1.0);
}
