#include "starsim/catalog.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace starsim::catalog;
using namespace starsim::catalog::test_support;

namespace {

StarArrays threeStars() {
    StarArrays stars;
    stars.ra = {10.0, 20.0, 30.0};
    stars.dec = {-10.0, 0.0, 45.0};
    stars.pmra = {100.0, 0.0, -250.0};
    stars.pmdec = {50.0, 0.0, 400.0};
    stars.tmag = {8.0, 10.5, 12.0};
    stars.temperature = {5800.0, 4000.0, 9000.0};
    return stars;
}

/// Offsets every exposure by a fixed amount, for checking snapshot brightness
class StepLightCurve : public LightCurve {
public:
    explicit StepLightCurve(double offset) : offset_(offset) {}
    double integrated(double, double) const override { return offset_; }
    std::string code() const override { return "step"; }

private:
    double offset_;
};

} // anonymous namespace

class CatalogTest : public ::testing::Test {
protected:
    CatalogConfig config_ = quietConfig();
};

TEST_F(CatalogTest, ArraysAreStaticValues) {
    Catalog cat(CatalogKind::TEST_PATTERN, "three", threeStars(), 2000.0, config_);
    auto a = cat.arrays();
    EXPECT_EQ(a.ra, threeStars().ra);
    EXPECT_EQ(a.dec, threeStars().dec);
    EXPECT_EQ(a.tmag, threeStars().tmag);
    EXPECT_EQ(a.temperature, threeStars().temperature);
    EXPECT_EQ(cat.size(), 3u);
    EXPECT_EQ(cat.name(), "three");
}

TEST_F(CatalogTest, EveryStarStartsConstant) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);
    ASSERT_EQ(cat.lightcurves().size(), 3u);
    for (const auto& code : cat.lightCurveCodes()) {
        EXPECT_EQ(code, "--");
    }
}

TEST_F(CatalogTest, NonFiniteProperMotionBecomesZero) {
    StarArrays stars = threeStars();
    stars.pmra[0] = std::numeric_limits<double>::quiet_NaN();
    stars.pmdec[2] = std::numeric_limits<double>::infinity();

    Catalog cat(CatalogKind::SURVEY, "three", stars, 2000.0, config_);
    EXPECT_EQ(cat.pmra()[0], 0.0);
    EXPECT_EQ(cat.pmdec()[0], 50.0);
    EXPECT_EQ(cat.pmdec()[2], 0.0);
}

TEST_F(CatalogTest, RejectsBrokenInput) {
    StarArrays ragged = threeStars();
    ragged.tmag.pop_back();
    EXPECT_THROW(Catalog(CatalogKind::SURVEY, "x", ragged, 2000.0, config_), CatalogException);

    StarArrays dim = threeStars();
    dim.tmag[1] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Catalog(CatalogKind::SURVEY, "x", dim, 2000.0, config_), CatalogException);

    EXPECT_THROW(Catalog(CatalogKind::SURVEY, "x", threeStars(),
                         std::numeric_limits<double>::quiet_NaN(), config_), CatalogException);

    std::vector<LightCurvePtr> two(2, std::make_shared<ConstantLightCurve>());
    EXPECT_THROW(Catalog(CatalogKind::SURVEY, "x", threeStars(), two, 2000.0, config_),
                 CatalogException);
}

TEST_F(CatalogTest, AtOwnEpochIsUnchanged) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);
    auto pos = cat.atEpoch(2000.0);
    EXPECT_EQ(pos.ra, cat.ra());
    EXPECT_EQ(pos.dec, cat.dec());
}

TEST_F(CatalogTest, SnapshotByBjdAndByEpochAgree) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);

    auto by_epoch = cat.snapshotAtEpoch(2018.0);
    auto by_bjd = cat.snapshotAtBjd(2451544.5 + 18.0 * 365.25);
    for (size_t i = 0; i < cat.size(); ++i) {
        EXPECT_NEAR(by_epoch.ra[i], by_bjd.ra[i], 1e-12);
        EXPECT_NEAR(by_epoch.dec[i], by_bjd.dec[i], 1e-12);
    }

    auto moved = cat.atEpoch(2018.0);
    EXPECT_EQ(by_epoch.ra, moved.ra);
    EXPECT_EQ(by_epoch.dec, moved.dec);
    EXPECT_NE(by_epoch.dec[2], cat.dec()[2]);
}

TEST_F(CatalogTest, ConstantLightCurvesLeaveBrightnessUntouched) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);
    auto snap = cat.snapshotAtBjd(2458354.5);
    EXPECT_EQ(snap.tmag, cat.tmag());
    EXPECT_EQ(snap.temperature, cat.temperature());
    EXPECT_EQ(snap.ra.size(), snap.tmag.size());
}

TEST_F(CatalogTest, SnapshotAddsLightCurveOffsets) {
    std::vector<LightCurvePtr> lcs = {
        std::make_shared<ConstantLightCurve>(),
        std::make_shared<StepLightCurve>(0.25),
        std::make_shared<StepLightCurve>(-0.5)};
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), lcs, 2000.0, config_);

    auto snap = cat.snapshotAtEpoch(2010.0);
    EXPECT_DOUBLE_EQ(snap.tmag[0], 8.0);
    EXPECT_DOUBLE_EQ(snap.tmag[1], 10.75);
    EXPECT_DOUBLE_EQ(snap.tmag[2], 11.5);
    EXPECT_EQ(cat.lightCurveCodes()[1], "step");
}

TEST_F(CatalogTest, SnapshotNeedsExactlyOneTime) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);
    try {
        cat.snapshot(std::nullopt, std::nullopt);
        FAIL() << "expected INVALID_PARAMS";
    } catch (const CatalogException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMS);
    }
    EXPECT_THROW(cat.snapshot(2458354.5, 2018.0), CatalogException);
    EXPECT_NO_THROW(cat.snapshot(2458354.5, std::nullopt));
}

TEST_F(CatalogTest, AddLightCurvesOnlyChangesLightCurves) {
    Catalog cat(CatalogKind::SURVEY, "three", threeStars(), 2000.0, config_);
    auto before = cat.arrays();

    VariabilityOptions options;
    options.seed = 0;
    DefaultLightCurveFactory factory;
    cat.addLightCurves(options, factory);

    for (const auto& code : cat.lightCurveCodes()) {
        EXPECT_NE(code, "--");
    }
    auto after = cat.arrays();
    EXPECT_EQ(after.ra, before.ra);
    EXPECT_EQ(after.tmag, before.tmag);
    EXPECT_EQ(cat.epoch(), 2000.0);
}
