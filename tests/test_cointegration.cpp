#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <vector>

#include "pairtrade/Cointegration.hpp"
#include "pairtrade/Errors.hpp"

using namespace pairtrade;

namespace {

std::vector<double> ar1(size_t n, double phi, double sigma, unsigned seed){
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> N(0.0, sigma);
    std::vector<double> s(n, 0.0);
    for (size_t t=1;t<n;t++) s[t] = phi * s[t-1] + N(rng);
    return s;
}

} // namespace

TEST(HedgeRatio, ExactProportionalLegs) {
    std::vector<double> x, y;
    for (int i=1;i<=50;i++){ x.push_back(10.0 + i); y.push_back(1.5 * (10.0 + i)); }
    EXPECT_NEAR(stats::hedge_ratio(y, x), 1.5, 1e-12);
}

TEST(HedgeRatio, UsesAlignedOverlapOfSeries) {
    PriceSeries x, y;
    x.time  = {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"};
    x.value = {1.0, 2.0, NAN, 4.0};
    y.time  = {"2020-01-02", "2020-01-03", "2020-01-04", "2020-01-05"};
    y.value = {6.0, 9.0, 12.0, 99.0};
    // overlap with finite values: (2, 6) and (4, 12)
    EXPECT_NEAR(stats::hedge_ratio(y, x), 3.0, 1e-12);
}

TEST(HedgeRatio, TooFewPointsIsDataError) {
    EXPECT_THROW(stats::hedge_ratio(std::vector<double>{1.0}, std::vector<double>{2.0}), DataError);
    EXPECT_THROW(stats::hedge_ratio(std::vector<double>{1.0, NAN}, std::vector<double>{2.0, 3.0}), DataError);
}

TEST(HalfLife, RecoversAr1Persistence) {
    const auto s = ar1(5000, 0.9, 1.0, 17);
    const double expected = std::log(2.0) / -std::log(0.9);   // ~6.58
    EXPECT_NEAR(stats::half_life(s), expected, 1.5);
}

TEST(HalfLife, ExplosiveSpreadHasInfiniteHalfLife) {
    std::vector<double> s;
    double v = 1.0;
    for (int i=0;i<40;i++){ s.push_back(v); v *= 1.05; }
    EXPECT_TRUE(std::isinf(stats::half_life(s)));
}

TEST(HalfLife, TooShortIsDataError) {
    EXPECT_THROW(stats::half_life(std::vector<double>(19, 1.0)), DataError);
}

TEST(Adf, MacKinnonPValueMatchesCriticalPoints) {
    EXPECT_NEAR(stats::mackinnon_pvalue(-3.43035), 0.01, 0.002);
    EXPECT_NEAR(stats::mackinnon_pvalue(-2.86154), 0.05, 0.005);
    EXPECT_NEAR(stats::mackinnon_pvalue(-2.56677), 0.10, 0.005);
    EXPECT_EQ(stats::mackinnon_pvalue(3.0), 1.0);
    EXPECT_EQ(stats::mackinnon_pvalue(-20.0), 0.0);
}

TEST(Adf, PValueIsMonotoneInStatistic) {
    double prev = 0.0;
    for (double s = -10.0; s <= 2.7; s += 0.1){
        const double p = stats::mackinnon_pvalue(s);
        EXPECT_GE(p, prev - 1e-12);
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
        prev = p;
    }
}

TEST(Adf, StationarySeriesRejectsUnitRoot) {
    const auto s = ar1(500, 0.5, 1.0, 23);
    const auto r = stats::adf_test(s);
    EXPECT_LT(r.statistic, r.critical[0]);
    EXPECT_LT(r.pvalue, 0.01);
    EXPECT_GE(r.used_lag, 0);
    EXPECT_GT(r.nobs, 400u);
}

TEST(Adf, RandomWalkLooksLessStationaryThanAr1) {
    const auto rw = ar1(500, 1.0, 1.0, 29);
    const auto st = ar1(500, 0.5, 1.0, 29);
    EXPECT_GT(stats::adf_pvalue(rw), stats::adf_pvalue(st));
}

TEST(Adf, CriticalValuesAreOrdered) {
    const auto r = stats::adf_test(ar1(300, 0.7, 1.0, 31));
    EXPECT_LT(r.critical[0], r.critical[1]);
    EXPECT_LT(r.critical[1], r.critical[2]);
    EXPECT_NEAR(r.critical[1], -2.87, 0.02);
}

TEST(Adf, TooShortIsDataError) {
    EXPECT_THROW(stats::adf_test(std::vector<double>(9, 1.0)), DataError);
}
