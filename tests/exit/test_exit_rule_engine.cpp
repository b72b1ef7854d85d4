#include <gtest/gtest.h>
#include <vector>
#include "../core/test_base.hpp"
#include "../live/test_live_utils.hpp"
#include "paper_ngin/exit/exit_rule_engine.hpp"
#include "paper_ngin/exit/outcome_sample_cache.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class ExitRuleEngineTest : public TestBase {
protected:
    Position make_position(std::optional<double> stop_loss = std::nullopt,
                           TakeProfitMode mode = TakeProfitMode::FIXED_PERCENT,
                           double take_profit = 50.0) {
        Position position;
        position.key = PositionKey("TOKEN", SignalClass::DISCOVERY);
        position.entry_price = 1.0;
        position.size_usd = 50.0;
        position.opened_at = base_time();
        position.exit_config.take_profit_mode = mode;
        position.exit_config.take_profit_pct = take_profit;
        position.exit_config.stop_loss_pct = stop_loss;
        position.exit_config.expiry = std::chrono::hours(24);
        return position;
    }

    ExitRuleEngine engine;
    const std::vector<double> no_samples;
};

TEST_F(ExitRuleEngineTest, RoiPercent) {
    EXPECT_DOUBLE_EQ(ExitRuleEngine::roi_percent(1.0, 1.5), 50.0);
    EXPECT_NEAR(ExitRuleEngine::roi_percent(1.0, 0.85), -15.0, 1e-9);
    EXPECT_DOUBLE_EQ(ExitRuleEngine::roi_percent(0.0, 1.0), 0.0);
}

TEST_F(ExitRuleEngineTest, NothingFiresInsideTheBand) {
    auto position = make_position(10.0);
    EXPECT_EQ(engine.evaluate(position, 1.2, base_time() + std::chrono::hours(1), no_samples),
              ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, TakeProfitFiresAtTarget) {
    auto position = make_position();
    EXPECT_EQ(engine.evaluate(position, 1.5, base_time(), no_samples),
              ExitDecision::TAKE_PROFIT_HIT);
    EXPECT_EQ(engine.evaluate(position, 1.49, base_time(), no_samples), ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, StopLossFiresAtThreshold) {
    auto position = make_position(10.0);
    EXPECT_EQ(engine.evaluate(position, 0.85, base_time(), no_samples),
              ExitDecision::STOP_LOSS_HIT);
    EXPECT_EQ(engine.evaluate(position, 0.95, base_time(), no_samples), ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, StopLossFiresAtExactThresholdPrice) {
    auto position = make_position(10.0);
    EXPECT_EQ(engine.evaluate(position, 0.9, base_time(), no_samples),
              ExitDecision::STOP_LOSS_HIT);

    position.entry_price = 2.0;
    EXPECT_EQ(engine.evaluate(position, 1.8, base_time(), no_samples),
              ExitDecision::STOP_LOSS_HIT);

    position.entry_price = 0.5;
    EXPECT_EQ(engine.evaluate(position, 0.45, base_time(), no_samples),
              ExitDecision::STOP_LOSS_HIT);

    auto wide = make_position(20.0);
    EXPECT_EQ(engine.evaluate(wide, 0.8, base_time(), no_samples), ExitDecision::STOP_LOSS_HIT);
    EXPECT_EQ(engine.evaluate(wide, 0.8001, base_time(), no_samples), ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, TakeProfitFiresAtExactThresholdPrice) {
    auto position = make_position(std::nullopt, TakeProfitMode::FIXED_PERCENT, 20.0);
    EXPECT_EQ(engine.evaluate(position, 1.2, base_time(), no_samples),
              ExitDecision::TAKE_PROFIT_HIT);
    EXPECT_EQ(engine.evaluate(position, 1.1999, base_time(), no_samples), ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, StopLossWinsWhenTakeProfitAlsoHolds) {
    // A negative target is already reached at a price that also breaches the stop
    auto position = make_position(10.0, TakeProfitMode::FIXED_PERCENT, -20.0);
    EXPECT_EQ(engine.evaluate(position, 0.85, base_time(), no_samples),
              ExitDecision::STOP_LOSS_HIT);
    EXPECT_EQ(engine.evaluate(position, 0.95, base_time(), no_samples),
              ExitDecision::TAKE_PROFIT_HIT);
}

TEST_F(ExitRuleEngineTest, StopLossOutranksExpiry) {
    auto position = make_position(10.0);
    const auto late = base_time() + std::chrono::hours(48);
    EXPECT_EQ(engine.evaluate(position, 0.5, late, no_samples), ExitDecision::STOP_LOSS_HIT);
}

TEST_F(ExitRuleEngineTest, TakeProfitOutranksExpiry) {
    auto position = make_position();
    const auto late = base_time() + std::chrono::hours(48);
    EXPECT_EQ(engine.evaluate(position, 2.0, late, no_samples), ExitDecision::TAKE_PROFIT_HIT);
}

TEST_F(ExitRuleEngineTest, ExpiryFiresAtExactBoundaryAndWithoutPrice) {
    auto position = make_position();
    const auto boundary = base_time() + std::chrono::hours(24);
    EXPECT_EQ(engine.evaluate(position, 1.0, boundary - std::chrono::seconds(1), no_samples),
              ExitDecision::NONE);
    EXPECT_EQ(engine.evaluate(position, 1.0, boundary, no_samples), ExitDecision::EXPIRED);
    EXPECT_EQ(engine.evaluate(position, 0.0, boundary, no_samples), ExitDecision::EXPIRED);
    EXPECT_TRUE(ExitRuleEngine::is_expired(position, boundary));
}

TEST_F(ExitRuleEngineTest, DynamicTargetsFollowSamples) {
    const std::vector<double> samples = {10.0, 20.0, 30.0, 40.0, -15.0};
    ExitConfig config;

    config.take_profit_mode = TakeProfitMode::MEDIAN;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, samples), 25.0);
    config.take_profit_mode = TakeProfitMode::MEAN;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, samples), 25.0);
    config.take_profit_mode = TakeProfitMode::SMART_QUANTILE;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, samples), 20.0);
    config.take_profit_mode = TakeProfitMode::MODE;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, samples), 10.0);

    auto position = make_position(std::nullopt, TakeProfitMode::SMART_QUANTILE);
    EXPECT_EQ(engine.evaluate(position, 1.2, base_time(), samples),
              ExitDecision::TAKE_PROFIT_HIT);
    EXPECT_EQ(engine.evaluate(position, 1.19, base_time(), samples), ExitDecision::NONE);
}

TEST_F(ExitRuleEngineTest, EmptySamplesFallBackToDefault) {
    ExitConfig config;
    config.take_profit_mode = TakeProfitMode::MEDIAN;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, {}), kDefaultTakeProfitPercent);
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, {-5.0, -10.0}),
                     kDefaultTakeProfitPercent);

    ExitRuleConfig custom;
    custom.default_take_profit_pct = 80.0;
    ExitRuleEngine custom_engine(custom);
    EXPECT_DOUBLE_EQ(custom_engine.resolve_take_profit(config, {}), 80.0);
}

TEST_F(ExitRuleEngineTest, FixedTargetIgnoresSamples) {
    ExitConfig config;
    config.take_profit_pct = 33.0;
    EXPECT_DOUBLE_EQ(engine.resolve_take_profit(config, {10.0, 20.0}), 33.0);
}

TEST_F(ExitRuleEngineTest, DecisionsMapToExitReasons) {
    EXPECT_EQ(to_exit_reason(ExitDecision::STOP_LOSS_HIT), ExitReason::STOP_LOSS);
    EXPECT_EQ(to_exit_reason(ExitDecision::TAKE_PROFIT_HIT), ExitReason::TAKE_PROFIT);
    EXPECT_EQ(to_exit_reason(ExitDecision::EXPIRED), ExitReason::EXPIRED);
    EXPECT_EQ(exit_decision_to_string(ExitDecision::EXPIRED), "EXPIRED");
}

class OutcomeSampleCacheTest : public TestBase {};

TEST_F(OutcomeSampleCacheTest, RefreshLoadsEveryClass) {
    auto source = std::make_shared<MockOutcomeSource>();
    source->set_samples(SignalClass::DISCOVERY, {10.0, 20.0});
    source->set_samples(SignalClass::ALPHA, {60.0});
    OutcomeSampleCache cache(source);

    EXPECT_EQ(cache.refresh_all(), 0u);
    EXPECT_EQ(cache.samples(SignalClass::DISCOVERY).size(), 2u);
    EXPECT_EQ(cache.samples(SignalClass::ALPHA).size(), 1u);
    EXPECT_TRUE(cache.samples(SignalClass::MANUAL).empty());
}

TEST_F(OutcomeSampleCacheTest, FailedRefreshKeepsLastSamples) {
    auto source = std::make_shared<MockOutcomeSource>();
    source->set_samples(SignalClass::DISCOVERY, {10.0, 20.0});
    OutcomeSampleCache cache(source);
    ASSERT_TRUE(cache.refresh(SignalClass::DISCOVERY).is_ok());

    source->set_failing(true);
    auto refreshed = cache.refresh(SignalClass::DISCOVERY);
    ASSERT_TRUE(refreshed.is_error());
    EXPECT_EQ(refreshed.error()->code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(cache.samples(SignalClass::DISCOVERY), (std::vector<double>{10.0, 20.0}));
    EXPECT_EQ(cache.refresh_all(), 3u);
}

TEST_F(OutcomeSampleCacheTest, CacheWithoutSourceServesInjectedSamples) {
    OutcomeSampleCache cache;
    cache.set_samples(SignalClass::ALPHA, {5.0});
    EXPECT_TRUE(cache.refresh(SignalClass::ALPHA).is_ok());
    EXPECT_EQ(cache.samples(SignalClass::ALPHA).size(), 1u);
}
