#include "starsim/propagation.h"
#include <gtest/gtest.h>
#include <cmath>

using namespace starsim::catalog;

TEST(PropagationTest, ZeroProperMotionIsIdentity) {
    std::vector<double> ra = {0.0, 45.5, 359.9, 120.0};
    std::vector<double> dec = {0.0, -30.25, 89.9, -89.5};
    std::vector<double> zero(ra.size(), 0.0);

    for (double target : {1900.0, 2000.0, 2018.0, 3000.0}) {
        auto pos = propagate(ra, dec, zero, zero, 2000.0, target);
        for (size_t i = 0; i < ra.size(); ++i) {
            EXPECT_EQ(pos.ra[i], ra[i]);
            EXPECT_EQ(pos.dec[i], dec[i]);
        }
    }
}

TEST(PropagationTest, DeclinationMovesLinearly) {
    // 3600 mas/yr = 0.001 deg/yr
    auto pos = propagateOne(10.0, 20.0, 0.0, 3600.0, 2000.0, 2100.0);
    EXPECT_NEAR(pos.dec, 20.1, 1e-12);
    EXPECT_DOUBLE_EQ(pos.ra, 10.0);
}

TEST(PropagationTest, RateIsUnprojectedAtMidpointDeclination) {
    const double pmra = 36000.0;   // 0.01 deg/yr projected
    const double pmdec = 360000.0; // 0.1 deg/yr
    const double dt = 100.0;

    auto pos = propagateOne(50.0, 60.0, pmra, pmdec, 2000.0, 2000.0 + dt);

    double mean_dec = 60.0 + dt * 0.1 / 2.0;
    double expected_ra = 50.0 + dt * 0.01 / std::cos(mean_dec * M_PI / 180.0);
    EXPECT_NEAR(pos.dec, 70.0, 1e-9);
    EXPECT_NEAR(pos.ra, expected_ra, 1e-9);

    // starting-declination un-projection would land measurably elsewhere
    double naive_ra = 50.0 + dt * 0.01 / std::cos(60.0 * M_PI / 180.0);
    EXPECT_GT(std::abs(pos.ra - naive_ra), 0.1);
}

TEST(PropagationTest, ForwardThenBackwardReturnsHome) {
    std::vector<double> ra = {10.0, 200.0, 300.0};
    std::vector<double> dec = {-45.0, 0.0, 75.0};
    std::vector<double> pmra = {120.0, -5000.0, 800.0};
    std::vector<double> pmdec = {-300.0, 10000.0, -1500.0};

    for (double dt : {0.5, 18.0, -25.0, 150.0}) {
        auto there = propagate(ra, dec, pmra, pmdec, 2000.0, 2000.0 + dt);
        auto back = propagate(there.ra, there.dec, pmra, pmdec, 2000.0 + dt, 2000.0);
        for (size_t i = 0; i < ra.size(); ++i) {
            EXPECT_NEAR(back.ra[i], ra[i], 1e-9) << "dt=" << dt << " star " << i;
            EXPECT_NEAR(back.dec[i], dec[i], 1e-9) << "dt=" << dt << " star " << i;
        }
    }
}

TEST(PropagationTest, ParallelMatchesSerial) {
    const size_t n = 50000;
    std::vector<double> ra(n), dec(n), pmra(n), pmdec(n);
    for (size_t i = 0; i < n; ++i) {
        ra[i] = std::fmod(i * 0.0071, 360.0);
        dec[i] = -80.0 + std::fmod(i * 0.0033, 160.0);
        pmra[i] = (i % 97) - 48.0;
        pmdec[i] = (i % 89) - 44.0;
    }

    auto serial = propagate(ra, dec, pmra, pmdec, 2000.0, 2024.0, false);
    auto parallel = propagate(ra, dec, pmra, pmdec, 2000.0, 2024.0, true);
    EXPECT_EQ(serial.ra, parallel.ra);
    EXPECT_EQ(serial.dec, parallel.dec);
}

TEST(PropagationTest, MismatchedLengthsThrow) {
    std::vector<double> two = {1.0, 2.0};
    std::vector<double> three = {1.0, 2.0, 3.0};
    try {
        propagate(two, two, three, two, 2000.0, 2010.0);
        FAIL() << "expected INVALID_PARAMS";
    } catch (const CatalogException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMS);
    }
}
