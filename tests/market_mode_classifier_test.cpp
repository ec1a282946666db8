#include "test_helpers.hpp"
#include "trader/strategy_analysis/market_mode_classifier.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace ConfluenceTrader::Core;
using ConfluenceTrader::Testing::make_neutral_snapshot;

namespace {

class MarketModeClassifierTest : public ::testing::Test {
protected:
    StrategyConfig strategy_config;
    MarketModeClassifier classifier{strategy_config};
};

TEST_F(MarketModeClassifierTest, RangingHoldsInsideHysteresisBand) {
    MarketMode mode = MarketMode::RANGING;
    const double adx_sequence[] = {17.0, 19.0, 17.0, 19.0, 26.9, 18.0, 27.0};
    for (double adx : adx_sequence) {
        mode = classifier.classify(mode, adx, 30.0, 10.0);
        EXPECT_EQ(mode, MarketMode::RANGING) << "ADX " << adx;
    }
}

TEST_F(MarketModeClassifierTest, TrendEnteredAboveThresholdAndLeftBelowRangeThreshold) {
    MarketMode mode = classifier.classify(MarketMode::RANGING, 28.0, 30.0, 12.0);
    EXPECT_EQ(mode, MarketMode::TRENDING_UP);

    mode = classifier.classify(mode, 20.0, 30.0, 12.0);
    EXPECT_EQ(mode, MarketMode::TRENDING_UP);

    mode = classifier.classify(mode, 18.0, 30.0, 12.0);
    EXPECT_EQ(mode, MarketMode::TRENDING_UP);

    mode = classifier.classify(mode, 17.9, 30.0, 12.0);
    EXPECT_EQ(mode, MarketMode::RANGING);
}

TEST_F(MarketModeClassifierTest, DirectionFollowsDirectionalIndex) {
    EXPECT_EQ(classifier.classify(MarketMode::UNCERTAIN, 35.0, 12.0, 30.0), MarketMode::TRENDING_DOWN);
    EXPECT_EQ(classifier.classify(MarketMode::TRENDING_UP, 35.0, 12.0, 30.0), MarketMode::TRENDING_DOWN);
}

TEST_F(MarketModeClassifierTest, UncertainStaysUncertainInsideBand) {
    EXPECT_EQ(classifier.classify(MarketMode::UNCERTAIN, 22.0, 30.0, 10.0), MarketMode::UNCERTAIN);
}

TEST_F(MarketModeClassifierTest, EqualDirectionalIndexKeepsTrendOtherwiseUncertain) {
    EXPECT_EQ(classifier.classify(MarketMode::TRENDING_DOWN, 30.0, 20.0, 20.0), MarketMode::TRENDING_DOWN);
    EXPECT_EQ(classifier.classify(MarketMode::RANGING, 30.0, 20.0, 20.0), MarketMode::UNCERTAIN);
}

TEST_F(MarketModeClassifierTest, NonFiniteInputsKeepPreviousMode) {
    double not_a_number = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(classifier.classify(MarketMode::RANGING, not_a_number, 30.0, 10.0), MarketMode::RANGING);
    EXPECT_EQ(classifier.classify(MarketMode::TRENDING_UP, 10.0, std::numeric_limits<double>::infinity(), 10.0), MarketMode::TRENDING_UP);
}

TEST(MarketModeClassifierConstructionTest, RejectsInvertedThresholds) {
    StrategyConfig strategy_config;
    strategy_config.adx_range_entry_threshold = 27.0;
    strategy_config.adx_trend_entry_threshold = 27.0;
    EXPECT_THROW(MarketModeClassifier classifier(strategy_config), std::runtime_error);
}

TEST(MarketModeStateTest, ReclassifiesOnlyOnNewerM5Candle) {
    StrategyConfig strategy_config;
    MarketModeClassifier classifier(strategy_config);
    MarketModeState mode_state;

    IndicatorSnapshot m5 = make_neutral_snapshot(Timeframe::MINUTE_5);
    m5.adx = 12.0;
    EXPECT_EQ(mode_state.update_from_m5_close(classifier, m5), MarketMode::RANGING);
    EXPECT_EQ(mode_state.get_last_classified_m5_timestamp(), m5.candle.timestamp);

    // Same M5 candle with a trending reading is not reclassified
    IndicatorSnapshot same_candle = m5;
    same_candle.adx = 40.0;
    same_candle.plus_di = 35.0;
    same_candle.minus_di = 10.0;
    EXPECT_EQ(mode_state.update_from_m5_close(classifier, same_candle), MarketMode::RANGING);

    IndicatorSnapshot next_candle = same_candle;
    next_candle.candle.timestamp += 300;
    EXPECT_EQ(mode_state.update_from_m5_close(classifier, next_candle), MarketMode::TRENDING_UP);
    EXPECT_EQ(mode_state.get_mode(), MarketMode::TRENDING_UP);
}

TEST(MarketModeStateTest, InvalidSnapshotLeavesModeUntouched) {
    StrategyConfig strategy_config;
    MarketModeClassifier classifier(strategy_config);
    MarketModeState mode_state;

    IndicatorSnapshot invalid_m5;
    invalid_m5.adx = 50.0;
    EXPECT_EQ(mode_state.update_from_m5_close(classifier, invalid_m5), MarketMode::UNCERTAIN);

    mode_state.reset();
    EXPECT_EQ(mode_state.get_mode(), MarketMode::UNCERTAIN);
    EXPECT_EQ(mode_state.get_last_classified_m5_timestamp(), 0);
}

} // namespace
