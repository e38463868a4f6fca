#include "starsim/survey_catalog.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <cmath>

using namespace starsim::catalog;
using namespace starsim::catalog::test_support;

// =============================================================================
// Band reconciliation
// =============================================================================

TEST(ReconcileBandsTest, PrimaryFilledFromAlternate1WhenAlternate2Missing) {
    BandMagnitudes bands{NaN, 5.0, NaN};
    reconcileBands(bands);
    EXPECT_EQ(bands.primary, 5.0);
    EXPECT_EQ(bands.alternate1, 5.0);
    EXPECT_EQ(bands.alternate2, 5.0);
}

TEST(ReconcileBandsTest, Alternate2TakesPrecedenceForPrimary) {
    BandMagnitudes bands{NaN, 9.0, 11.0};
    reconcileBands(bands);
    EXPECT_EQ(bands.primary, 11.0);
    EXPECT_EQ(bands.alternate1, 9.0);
    EXPECT_EQ(bands.alternate2, 11.0);
}

TEST(ReconcileBandsTest, Alternate1PrefersAlternate2OverPrimary) {
    BandMagnitudes bands{12.0, NaN, 13.0};
    reconcileBands(bands);
    EXPECT_EQ(bands.primary, 12.0);
    EXPECT_EQ(bands.alternate1, 13.0);
    EXPECT_EQ(bands.alternate2, 13.0);
}

TEST(ReconcileBandsTest, Alternate2FilledFromPrimary) {
    BandMagnitudes bands{12.0, 10.0, std::numeric_limits<double>::infinity()};
    reconcileBands(bands);
    EXPECT_EQ(bands.alternate2, 12.0);
}

TEST(ReconcileBandsTest, FiniteBandsAreNeverOverwritten) {
    BandMagnitudes bands{12.0, 10.0, 13.0};
    reconcileBands(bands);
    EXPECT_EQ(bands.primary, 12.0);
    EXPECT_EQ(bands.alternate1, 10.0);
    EXPECT_EQ(bands.alternate2, 13.0);
}

TEST(ReconcileBandsTest, AllMissingStaysMissing) {
    BandMagnitudes bands{NaN, NaN, NaN};
    reconcileBands(bands);
    EXPECT_FALSE(std::isfinite(bands.primary));
    EXPECT_FALSE(std::isfinite(bands.alternate1));
    EXPECT_FALSE(std::isfinite(bands.alternate2));
}

// =============================================================================
// Survey loading
// =============================================================================

class SurveyCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = quietConfig(dir_);
        cache_ = std::make_unique<SurveyCache>(config_);

        //                ra     dec    pmra  pmdec   f.mag  Jmag  Vmag
        provider_.addRow(10.00, -5.00, 12.0,  -3.0,  11.0, 10.0, 11.5);
        provider_.addRow(10.01, -5.01, NaN,   NaN,   NaN,  5.0,  NaN);
        provider_.addRow(10.02, -5.02, 1.0,   2.0,   NaN,  NaN,  NaN);
        provider_.addRow(10.03, -5.03, 4.0,   NaN,   14.0, 13.0, NaN);

        params_.ra = 10.0;
        params_.dec = -5.0;
        params_.radius = 0.1;
    }

    TempDirectory dir_;
    CatalogConfig config_;
    std::unique_ptr<SurveyCache> cache_;
    FakeSurveyProvider provider_;
    TabulatedColorRelations relations_;
    SurveyQueryParams params_;
};

TEST_F(SurveyCatalogTest, ReconcilesAndDropsUnmeasuredStars) {
    Catalog cat = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);

    ASSERT_EQ(cat.size(), 3u);
    EXPECT_EQ(cat.kind(), CatalogKind::SURVEY);
    EXPECT_EQ(cat.epoch(), 2000.0);

    // the all-NaN star (ra 10.02) is gone; order is preserved
    EXPECT_EQ(cat.ra()[0], 10.00);
    EXPECT_EQ(cat.ra()[1], 10.01);
    EXPECT_EQ(cat.ra()[2], 10.03);

    // star 0: colour 1.0
    EXPECT_DOUBLE_EQ(cat.tmag()[0], 11.0 - relations_.magnitudeCorrection(1.0));
    EXPECT_DOUBLE_EQ(cat.temperature()[0], relations_.temperature(1.0));

    // star 1: every band becomes 5.0, colour 0
    EXPECT_DOUBLE_EQ(cat.tmag()[1], 5.0 - relations_.magnitudeCorrection(0.0));
    EXPECT_DOUBLE_EQ(cat.temperature()[1], relations_.temperature(0.0));
}

TEST_F(SurveyCatalogTest, MissingProperMotionsBecomeZero) {
    Catalog cat = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
    EXPECT_EQ(cat.pmra()[0], 12.0);
    EXPECT_EQ(cat.pmdec()[0], -3.0);
    EXPECT_EQ(cat.pmra()[1], 0.0);
    EXPECT_EQ(cat.pmdec()[1], 0.0);
    EXPECT_EQ(cat.pmra()[2], 4.0);
    EXPECT_EQ(cat.pmdec()[2], 0.0);
}

TEST_F(SurveyCatalogTest, QueriesOnceThenUsesCache) {
    Catalog first = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
    EXPECT_EQ(provider_.calls, 1);
    EXPECT_DOUBLE_EQ(provider_.last_center.ra, 10.0);
    EXPECT_DOUBLE_EQ(provider_.last_center.dec, -5.0);
    EXPECT_DOUBLE_EQ(provider_.last_radius, 0.1);
    EXPECT_TRUE(cache_->contains("UCAC4", 10.0, -5.0, 0.1));

    // the provider would now fail; the cached copy is used instead
    provider_.failure = ErrorCode::NETWORK_ERROR;
    Catalog second = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
    EXPECT_EQ(provider_.calls, 1);
    EXPECT_EQ(second.tmag(), first.tmag());
    EXPECT_EQ(second.ra(), first.ra());
}

TEST_F(SurveyCatalogTest, ProviderFailureIsSourceUnavailable) {
    provider_.failure = ErrorCode::NETWORK_ERROR;
    try {
        loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
        FAIL() << "expected SOURCE_UNAVAILABLE";
    } catch (const CatalogException& e) {
        EXPECT_EQ(e.code(), ErrorCode::SOURCE_UNAVAILABLE);
    }
    EXPECT_EQ(provider_.calls, 1);
    EXPECT_FALSE(cache_->contains("UCAC4", 10.0, -5.0, 0.1));

    provider_.failure = ErrorCode::PARSE_ERROR;
    EXPECT_THROW(loadSurveyCatalog(params_, provider_, *cache_, relations_, config_), CatalogException);
    EXPECT_EQ(provider_.calls, 2);
}

TEST_F(SurveyCatalogTest, IncompleteReplyIsNotCached) {
    SurveyTable complete = provider_.table;
    provider_.table = SurveyTable();
    provider_.table.addColumn("RAJ2000", {10.0});

    try {
        loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
        FAIL() << "expected SOURCE_UNAVAILABLE";
    } catch (const CatalogException& e) {
        EXPECT_EQ(e.code(), ErrorCode::SOURCE_UNAVAILABLE);
    }
    EXPECT_FALSE(cache_->contains("UCAC4", 10.0, -5.0, 0.1));

    // a later good reply is fetched and used
    provider_.table = complete;
    Catalog cat = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
    EXPECT_EQ(provider_.calls, 2);
    EXPECT_EQ(cat.size(), 3u);
    EXPECT_TRUE(cache_->contains("UCAC4", 10.0, -5.0, 0.1));
}

TEST_F(SurveyCatalogTest, FaintLimitDropsFaintStars) {
    params_.faint_limit = 12.0;
    Catalog cat = loadSurveyCatalog(params_, provider_, *cache_, relations_, config_);
    for (double m : cat.tmag()) {
        EXPECT_LE(m, 12.0);
    }
    EXPECT_LT(cat.size(), 3u);
}

TEST_F(SurveyCatalogTest, EmptyConeGivesEmptyCatalog) {
    FakeSurveyProvider empty;
    for (const auto& name : empty.definition().columns()) {
        empty.table.addColumn(name, {});
    }
    Catalog cat = loadSurveyCatalog(params_, empty, *cache_, relations_, config_);
    EXPECT_TRUE(cat.empty());
    EXPECT_EQ(cat.epoch(), 2000.0);
}

TEST_F(SurveyCatalogTest, RejectsInvalidCone) {
    params_.radius = -1.0;
    EXPECT_THROW(loadSurveyCatalog(params_, provider_, *cache_, relations_, config_), CatalogException);
    EXPECT_EQ(provider_.calls, 0);
}
