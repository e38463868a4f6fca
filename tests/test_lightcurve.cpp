#include "starsim/lightcurve.h"
#include "starsim/types.h"
#include <gtest/gtest.h>
#include <cmath>

using namespace starsim::catalog;

TEST(LightCurveTest, ConstantIntegratesToZero) {
    ConstantLightCurve constant;
    EXPECT_EQ(constant.integrated(2458354.5, 0.02), 0.0);
    EXPECT_EQ(constant.code(), "--");
    EXPECT_TRUE(constant.isConstant());

    auto many = constant.integrated(std::vector<double>{1.0, 2.0, 3.0}, 0.1);
    EXPECT_EQ(many, std::vector<double>(3, 0.0));
}

TEST(LightCurveTest, VectorFormMatchesSingleExposures) {
    SinusoidLightCurve sine(2.0, 0.1, 0.3);
    std::vector<double> starts{100.0, 100.25, 100.7, 101.9};

    auto many = sine.integrated(starts, 0.05);
    ASSERT_EQ(many.size(), starts.size());
    for (size_t i = 0; i < starts.size(); ++i) {
        EXPECT_DOUBLE_EQ(many[i], sine.integrated(starts[i], 0.05));
    }
    EXPECT_TRUE(sine.integrated(std::vector<double>{}, 0.05).empty());
}

TEST(LightCurveTest, SinusoidAveragesOutOverWholePeriods) {
    SinusoidLightCurve sine(2.0, 0.1, 0.3);
    EXPECT_NEAR(sine.integrated(100.0, 2.0), 0.0, 1e-12);
    EXPECT_LE(std::abs(sine.integrated(100.3, 0.01)), 0.1);
    EXPECT_EQ(sine.code().rfind("sin|p=2|a=0.1|phi=0.3", 0), 0u);
}

TEST(LightCurveTest, TrapezoidIsFullDepthMidEvent) {
    TrapezoidLightCurve transit(3.0, 1000.0, 0.2, 0.02, 0.01);
    EXPECT_NEAR(transit.integrated(1000.0 - 0.025, 0.05), 0.01, 1e-12);
    EXPECT_NEAR(transit.integrated(1001.5, 0.05), 0.0, 1e-12);
    EXPECT_NEAR(transit.integrated(1003.0 - 0.025, 0.05), 0.01, 1e-12);
    EXPECT_EQ(transit.code(), "trapezoid|p=3|t0=1000|dur=0.2|in=0.02|d=0.01");
}

TEST(LightCurveTest, InvalidShapesThrow) {
    EXPECT_THROW(SinusoidLightCurve(0.0, 0.1, 0.0), CatalogException);
    EXPECT_THROW(TrapezoidLightCurve(1.0, 0.0, 2.0, 0.1, 0.01), CatalogException);
    EXPECT_THROW(TrapezoidLightCurve(1.0, 0.0, 0.2, 0.15, 0.01), CatalogException);
}

TEST(LightCurveFactoryTest, SeededDrawsRepeat) {
    DefaultLightCurveFactory factory;
    LightCurveParams params;

    std::mt19937_64 first(7), second(7);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(factory.random(params, first)->code(), factory.random(params, second)->code());
    }
}

TEST(LightCurveFactoryTest, HonoursOptions) {
    DefaultLightCurveFactory factory;
    LightCurveParams params;
    params.options = {"sin"};

    std::mt19937_64 rng(3);
    for (int i = 0; i < 10; ++i) {
        auto lc = factory.random(params, rng);
        EXPECT_FALSE(lc->isConstant());
        EXPECT_EQ(lc->code().rfind("sin|", 0), 0u);
    }

    params.options = {"flare"};
    EXPECT_THROW(factory.random(params, rng), CatalogException);
    params.options.clear();
    EXPECT_THROW(factory.random(params, rng), CatalogException);
}

TEST(LightCurveFactoryTest, ConstantHandleIsShared) {
    DefaultLightCurveFactory factory;
    EXPECT_EQ(factory.constant(), factory.constant());
    EXPECT_TRUE(factory.constant()->isConstant());
}
