#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../core/test_base.hpp"
#include "paper_ngin/portfolio/portfolio_types.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class PortfolioTypesTest : public TestBase {
protected:
    Position open_position(const std::string& asset, double size) {
        Position position;
        position.key = PositionKey(asset, SignalClass::DISCOVERY);
        position.symbol = asset;
        position.entry_price = 1.0;
        position.size_usd = size;
        position.opened_at = base_time();
        return position;
    }

    ClosedPosition closed_trade(double roi, double pnl) {
        ClosedPosition closed;
        closed.position = open_position("X", 100.0);
        closed.position.status = PositionStatus::CLOSED;
        closed.position.realized_roi_pct = roi;
        closed.pnl_usd = pnl;
        return closed;
    }
};

TEST_F(PortfolioTypesTest, TradeStatsTrackBestAndWorst) {
    TradeStats stats;
    stats.record(closed_trade(-10.0, -10.0));
    stats.record(closed_trade(35.0, 35.0));
    stats.record(closed_trade(0.0, 0.0));

    EXPECT_EQ(stats.total_trades, 3u);
    EXPECT_EQ(stats.wins, 1u);
    EXPECT_EQ(stats.losses, 2u);  // Break-even counts as a loss
    EXPECT_DOUBLE_EQ(stats.total_pnl_usd, 25.0);
    EXPECT_DOUBLE_EQ(stats.best_trade_pct, 35.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade_pct, -10.0);
    EXPECT_NEAR(stats.win_rate(), 1.0 / 3.0, 1e-12);
}

TEST_F(PortfolioTypesTest, AvailableNeverNegative) {
    Portfolio portfolio;
    portfolio.capital = 40.0;
    portfolio.reserve = 100.0;
    EXPECT_DOUBLE_EQ(portfolio.available(), 0.0);

    portfolio.capital = 140.0;
    EXPECT_DOUBLE_EQ(portfolio.available(), 40.0);
}

TEST_F(PortfolioTypesTest, IntegrityDetectsBrokenConservation) {
    Portfolio portfolio;
    portfolio.user_id = "alice";
    portfolio.starting_capital = 1000.0;
    portfolio.capital = 850.0;
    auto position = open_position("A", 150.0);
    portfolio.positions.emplace(position.key, position);
    EXPECT_EQ(portfolio.integrity_violation(), "");

    portfolio.capital = 900.0;
    EXPECT_NE(portfolio.integrity_violation().find("conservation"), std::string::npos);

    portfolio.capital = -5.0;
    EXPECT_NE(portfolio.integrity_violation().find("negative"), std::string::npos);
}

TEST_F(PortfolioTypesTest, RealizedPnlFollowsRecordedStats) {
    Portfolio portfolio;
    portfolio.starting_capital = 1000.0;
    portfolio.capital = 1025.0;
    for (const auto& closed : {closed_trade(-10.0, -10.0), closed_trade(35.0, 35.0)}) {
        portfolio.history.push_back(closed);
        portfolio.stats.record(closed);
    }
    EXPECT_DOUBLE_EQ(portfolio.realized_pnl(), 25.0);
    EXPECT_EQ(portfolio.integrity_violation(), "");

    // A history entry the stats never saw does not move the total
    portfolio.history.push_back(closed_trade(50.0, 50.0));
    EXPECT_DOUBLE_EQ(portfolio.realized_pnl(), 25.0);
}

TEST_F(PortfolioTypesTest, PortfolioJsonWithoutStatsRebuildsThem) {
    Portfolio portfolio;
    portfolio.user_id = "alice";
    portfolio.starting_capital = 1000.0;
    portfolio.capital = 1025.0;
    for (const auto& closed : {closed_trade(-10.0, -10.0), closed_trade(35.0, 35.0)}) {
        portfolio.history.push_back(closed);
        portfolio.stats.record(closed);
    }

    nlohmann::json j = portfolio;
    j.erase("stats");
    Portfolio parsed = j.get<Portfolio>();
    EXPECT_EQ(parsed.stats.total_trades, 2u);
    EXPECT_DOUBLE_EQ(parsed.realized_pnl(), 25.0);
    EXPECT_EQ(parsed.integrity_violation(), "");
}

TEST_F(PortfolioTypesTest, IntegrityDetectsMisfiledPositions) {
    Portfolio portfolio;
    portfolio.starting_capital = 1000.0;
    portfolio.capital = 900.0;
    auto position = open_position("A", 100.0);
    portfolio.positions.emplace(PositionKey("B", SignalClass::DISCOVERY), position);

    EXPECT_NE(portfolio.integrity_violation().find("carries key"), std::string::npos);
}

TEST_F(PortfolioTypesTest, PositionJsonKeepsCloseFields) {
    Position position = open_position("MINT", 25.0);
    position.status = PositionStatus::CLOSED;
    position.closed_at = base_time() + std::chrono::hours(2);
    position.exit_price = 1.5;
    position.realized_roi_pct = 50.0;
    position.exit_reason = ExitReason::TAKE_PROFIT;

    nlohmann::json j = position;
    EXPECT_EQ(j["signal_class"], "discovery");
    EXPECT_EQ(j["status"], "CLOSED");
    EXPECT_TRUE(j["exit_config"]["stop_loss_pct"].is_null());

    Position parsed = j.get<Position>();
    EXPECT_EQ(parsed.key, position.key);
    EXPECT_FALSE(parsed.is_open());
    EXPECT_EQ(*parsed.closed_at, *position.closed_at);
    EXPECT_EQ(parsed.exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_FALSE(parsed.exit_config.stop_loss_pct.has_value());
}

TEST_F(PortfolioTypesTest, UnknownEnumsInJsonThrow) {
    nlohmann::json j = open_position("MINT", 25.0);
    j["signal_class"] = "beta";
    EXPECT_THROW(j.get<Position>(), std::invalid_argument);

    nlohmann::json exit_config = ExitConfig();
    exit_config["take_profit_mode"] = "moon";
    EXPECT_THROW(exit_config.get<ExitConfig>(), std::invalid_argument);
}

TEST_F(PortfolioTypesTest, ExitReasonNames) {
    EXPECT_EQ(exit_reason_to_string(ExitReason::SIGNAL_SWAP), "SIGNAL_SWAP");
    EXPECT_EQ(exit_reason_from_string("STOP_LOSS"), ExitReason::STOP_LOSS);
    EXPECT_EQ(exit_reason_from_string("whatever"), ExitReason::NONE);
}
