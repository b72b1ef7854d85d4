#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "paper_ngin/execution/trade_executor.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class TradeExecutorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        ledger_ = std::make_shared<PortfolioLedger>();
        exit_engine_ = std::make_shared<ExitRuleEngine>();
        sample_cache_ = std::make_shared<OutcomeSampleCache>();
        event_bus_ = std::make_shared<TradeEventBus>();
        executor_ = std::make_unique<TradeExecutor>(ExecutorConfig(), ledger_, exit_engine_,
                                                    sample_cache_, event_bus_);

        TradeSubscriberInfo recorder;
        recorder.id = "recorder";
        recorder.event_types = {TradeEventType::POSITION_OPENED,
                                TradeEventType::POSITION_CLOSED};
        recorder.callback = [this](const TradeEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        };
        ASSERT_TRUE(event_bus_->subscribe(recorder).is_ok());
    }

    Signal make_signal(const std::string& asset, SignalClass cls = SignalClass::DISCOVERY,
                       Price price = 1.0, Grade grade = Grade::HIGH) {
        Signal signal;
        signal.asset_id = asset;
        signal.symbol = asset;
        signal.signal_class = cls;
        signal.graded_at = base_time();
        signal.price = price;
        signal.grade = grade;
        return signal;
    }

    Timestamp now() const {
        return base_time() + std::chrono::seconds(60);
    }

    ExecutionOutcome run(const std::string& user, const Signal& signal,
                         const UserPrefs& prefs = UserPrefs()) {
        auto result = executor_->execute(user, signal, prefs, now());
        EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error()->what() : "");
        return result.is_ok() ? result.value() : ExecutionOutcome();
    }

    std::vector<TradeEvent> events() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    std::shared_ptr<PortfolioLedger> ledger_;
    std::shared_ptr<ExitRuleEngine> exit_engine_;
    std::shared_ptr<OutcomeSampleCache> sample_cache_;
    std::shared_ptr<TradeEventBus> event_bus_;
    std::unique_ptr<TradeExecutor> executor_;

    std::mutex events_mutex_;
    std::vector<TradeEvent> events_;
};

TEST_F(TradeExecutorTest, OpensPositionAndPublishesEvent) {
    auto outcome = run("alice", make_signal("BONK"));
    ASSERT_EQ(outcome.status, ExecutionStatus::OPENED);
    ASSERT_TRUE(outcome.position.has_value());
    EXPECT_DOUBLE_EQ(outcome.position->size_usd, 100.0);  // 10% of 1000
    EXPECT_EQ(outcome.position->exit_config.expiry, std::chrono::seconds(24 * 3600));

    auto portfolio = ledger_->snapshot("alice");
    ASSERT_TRUE(portfolio.is_ok());
    EXPECT_DOUBLE_EQ(portfolio.value().capital, 900.0);

    auto published = events();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].type, TradeEventType::POSITION_OPENED);
    EXPECT_EQ(published[0].user_id, "alice");
    EXPECT_EQ(published[0].position.key.asset_id, "BONK");
}

TEST_F(TradeExecutorTest, RedeliveredSignalIsSkipped) {
    ASSERT_EQ(run("alice", make_signal("BONK")).status, ExecutionStatus::OPENED);

    auto again = run("alice", make_signal("BONK"));
    EXPECT_EQ(again.status, ExecutionStatus::SKIPPED);
    EXPECT_DOUBLE_EQ(ledger_->snapshot("alice").value().capital, 900.0);
    EXPECT_EQ(events().size(), 1u);
}

TEST_F(TradeExecutorTest, ConcurrentDuplicateDeliveriesOpenOnce) {
    std::atomic<int> opened{0};
    std::atomic<int> skipped{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([this, &opened, &skipped] {
            auto result = executor_->execute("alice", make_signal("BONK"), UserPrefs(), now());
            if (result.is_ok() && result.value().status == ExecutionStatus::OPENED) {
                ++opened;
            } else if (result.is_ok() && result.value().status == ExecutionStatus::SKIPPED) {
                ++skipped;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(opened.load(), 1);
    EXPECT_EQ(skipped.load(), 99);
    auto portfolio = ledger_->snapshot("alice").value();
    EXPECT_EQ(portfolio.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(portfolio.capital, 900.0);
}

TEST_F(TradeExecutorTest, SizeIsClampedToHardCap) {
    UserPrefs prefs;
    prefs.sizing_mode = SizingMode::FIXED;
    prefs.fixed_size_usd = 500.0;
    auto outcome = run("alice", make_signal("BONK"), prefs);
    ASSERT_EQ(outcome.status, ExecutionStatus::OPENED);
    EXPECT_DOUBLE_EQ(outcome.position->size_usd, 150.0);

    prefs.sizing_mode = SizingMode::PERCENT;
    prefs.percent_of_available = 50.0;
    EXPECT_DOUBLE_EQ(executor_->compute_size(prefs, 1000.0), 150.0);
}

TEST_F(TradeExecutorTest, PercentSizingRespectsMinimumTrade) {
    UserPrefs prefs;
    prefs.percent_of_available = 0.5;
    EXPECT_DOUBLE_EQ(executor_->compute_size(prefs, 1000.0), 10.0);
    prefs.percent_of_available = 5.0;
    EXPECT_DOUBLE_EQ(executor_->compute_size(prefs, 1000.0), 50.0);
}

TEST_F(TradeExecutorTest, InsufficientFundsIsRejected) {
    ASSERT_TRUE(ledger_->create_portfolio("alice", 100.0, 95.0).is_ok());

    auto outcome = run("alice", make_signal("BONK"));
    EXPECT_EQ(outcome.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(outcome.error_code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_TRUE(ledger_->snapshot("alice").value().positions.empty());
    EXPECT_TRUE(events().empty());
}

TEST_F(TradeExecutorTest, UserReserveBlocksTrading) {
    UserPrefs prefs;
    prefs.reserve_usd = 2000.0;
    auto outcome = run("alice", make_signal("BONK"), prefs);
    EXPECT_EQ(outcome.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(outcome.error_code, ErrorCode::INSUFFICIENT_FUNDS);
}

TEST_F(TradeExecutorTest, MalformedSignalIsRejectedWithoutSideEffects) {
    auto no_price = run("alice", make_signal("BONK", SignalClass::DISCOVERY, 0.0));
    EXPECT_EQ(no_price.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(no_price.error_code, ErrorCode::INVALID_SIGNAL);

    auto no_asset = run("alice", make_signal(""));
    EXPECT_EQ(no_asset.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(no_asset.error_code, ErrorCode::INVALID_SIGNAL);

    EXPECT_TRUE(ledger_->user_ids().empty());
}

TEST_F(TradeExecutorTest, EmptyUserIsAnError) {
    auto result = executor_->execute("", make_signal("BONK"), UserPrefs(), now());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(TradeExecutorTest, StaleSignalIsSkipped) {
    auto result = executor_->execute("alice", make_signal("BONK"), UserPrefs(),
                                     base_time() + std::chrono::hours(2));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, ExecutionStatus::SKIPPED);
    EXPECT_TRUE(ledger_->user_ids().empty());
}

TEST_F(TradeExecutorTest, PreferenceFiltersSkip) {
    UserPrefs disabled;
    disabled.trading_enabled = false;
    EXPECT_EQ(run("alice", make_signal("A"), disabled).status, ExecutionStatus::SKIPPED);

    // Manual entries bypass the automatic-trading switch
    EXPECT_EQ(run("alice", make_signal("A", SignalClass::MANUAL), disabled).status,
              ExecutionStatus::OPENED);

    UserPrefs prefs;
    EXPECT_EQ(run("alice", make_signal("B", SignalClass::ALPHA), prefs).status,
              ExecutionStatus::SKIPPED);
    prefs.alpha_enabled = true;
    EXPECT_EQ(run("alice", make_signal("B", SignalClass::ALPHA), prefs).status,
              ExecutionStatus::OPENED);

    UserPrefs graded;
    graded.allowed_grades = {Grade::CRITICAL};
    EXPECT_EQ(run("alice", make_signal("C", SignalClass::DISCOVERY, 1.0, Grade::LOW), graded)
                  .status,
              ExecutionStatus::SKIPPED);
    EXPECT_EQ(
        run("alice", make_signal("C", SignalClass::DISCOVERY, 1.0, Grade::CRITICAL), graded)
            .status,
        ExecutionStatus::OPENED);
}

TEST_F(TradeExecutorTest, ClassChangeSwapsPosition) {
    ASSERT_EQ(run("alice", make_signal("BONK")).status, ExecutionStatus::OPENED);

    UserPrefs prefs;
    prefs.alpha_enabled = true;
    auto outcome = run("alice", make_signal("BONK", SignalClass::ALPHA, 1.2), prefs);
    ASSERT_EQ(outcome.status, ExecutionStatus::OPENED);

    auto portfolio = ledger_->snapshot("alice").value();
    ASSERT_EQ(portfolio.positions.size(), 1u);
    EXPECT_EQ(portfolio.positions.begin()->first.signal_class, SignalClass::ALPHA);
    ASSERT_EQ(portfolio.history.size(), 1u);
    EXPECT_EQ(portfolio.history[0].position.exit_reason, ExitReason::SIGNAL_SWAP);
    EXPECT_NEAR(portfolio.history[0].pnl_usd, 20.0, 1e-9);

    // 1000 - 100 + 120, then 10% of 1020 committed to the alpha position
    EXPECT_NEAR(outcome.position->size_usd, 102.0, 1e-9);
    EXPECT_NEAR(portfolio.capital, 918.0, 1e-9);
    EXPECT_EQ(outcome.position->exit_config.expiry, std::chrono::seconds(168 * 3600));

    auto published = events();
    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(published[1].type, TradeEventType::POSITION_CLOSED);
    EXPECT_EQ(published[1].reason, ExitReason::SIGNAL_SWAP);
}

TEST_F(TradeExecutorTest, SwapCanBeDisabled) {
    UserPrefs prefs;
    prefs.alpha_enabled = true;
    prefs.swap_on_class_change = false;
    ASSERT_EQ(run("alice", make_signal("BONK"), prefs).status, ExecutionStatus::OPENED);
    ASSERT_EQ(run("alice", make_signal("BONK", SignalClass::ALPHA), prefs).status,
              ExecutionStatus::OPENED);
    EXPECT_EQ(ledger_->snapshot("alice").value().positions.size(), 2u);
}

TEST_F(TradeExecutorTest, ExitConfigFollowsPreferences) {
    sample_cache_->set_samples(SignalClass::DISCOVERY, {10.0, 20.0, 30.0, 40.0});

    UserPrefs prefs;
    prefs.take_profit_mode = TakeProfitMode::MEDIAN;
    prefs.stop_loss_pct = 20.0;
    auto outcome = run("alice", make_signal("BONK"), prefs);
    ASSERT_EQ(outcome.status, ExecutionStatus::OPENED);
    EXPECT_EQ(outcome.position->exit_config.take_profit_mode, TakeProfitMode::MEDIAN);
    EXPECT_DOUBLE_EQ(outcome.position->exit_config.take_profit_pct, 25.0);
    ASSERT_TRUE(outcome.position->exit_config.stop_loss_pct.has_value());
    EXPECT_DOUBLE_EQ(*outcome.position->exit_config.stop_loss_pct, 20.0);
}

TEST_F(TradeExecutorTest, ParsesSignalJson) {
    auto parsed = signal_from_json(nlohmann::json{{"asset_id", "So1111"},
                                                  {"symbol", "SOL"},
                                                  {"signal_class", "alpha"},
                                                  {"graded_at", "2025-01-01T12:00:00Z"},
                                                  {"price", "0.0012"},
                                                  {"grade", "CRITICAL"}});
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->what();
    EXPECT_EQ(parsed.value().signal_class, SignalClass::ALPHA);
    EXPECT_EQ(parsed.value().graded_at, base_time());
    EXPECT_DOUBLE_EQ(parsed.value().price, 0.0012);
    EXPECT_EQ(parsed.value().grade, Grade::CRITICAL);

    auto bad_class = signal_from_json(nlohmann::json{{"asset_id", "X"},
                                                     {"signal_class", "whale"},
                                                     {"graded_at", 1735732800},
                                                     {"price", 1.0}});
    ASSERT_TRUE(bad_class.is_error());
    EXPECT_EQ(bad_class.error()->code(), ErrorCode::INVALID_SIGNAL);

    auto no_time = signal_from_json(nlohmann::json{{"asset_id", "X"}, {"price", 1.0}});
    ASSERT_TRUE(no_time.is_error());
    EXPECT_EQ(no_time.error()->code(), ErrorCode::INVALID_SIGNAL);

    auto no_price =
        signal_from_json(nlohmann::json{{"asset_id", "X"}, {"graded_at", 1735732800}});
    ASSERT_TRUE(no_price.is_error());
    EXPECT_EQ(no_price.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(TradeExecutorTest, ParsesUserPrefsJson) {
    auto parsed = user_prefs_from_json(nlohmann::json{{"alpha_enabled", true},
                                                      {"allowed_grades", nlohmann::json::array({"HIGH", "CRITICAL"})},
                                                      {"sizing_mode", "fixed"},
                                                      {"fixed_size_usd", 40.0},
                                                      {"take_profit_mode", "smart"},
                                                      {"stop_loss_pct", 15.0}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().alpha_enabled);
    EXPECT_EQ(parsed.value().allowed_grades.size(), 2u);
    EXPECT_EQ(parsed.value().sizing_mode, SizingMode::FIXED);
    EXPECT_DOUBLE_EQ(parsed.value().fixed_size_usd, 40.0);
    EXPECT_EQ(parsed.value().take_profit_mode, TakeProfitMode::SMART_QUANTILE);
    EXPECT_DOUBLE_EQ(*parsed.value().stop_loss_pct, 15.0);
    EXPECT_TRUE(parsed.value().trading_enabled);

    auto bad_mode = user_prefs_from_json(nlohmann::json{{"take_profit_mode", "moon"}});
    ASSERT_TRUE(bad_mode.is_error());
    EXPECT_EQ(bad_mode.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
