#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "paper_ngin/core/error.hpp"

using namespace paper_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);
    EXPECT_EQ(int_result.error(), nullptr);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<double>(ErrorCode::INSUFFICIENT_FUNDS, "Not enough capital", "PortfolioLedger");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_STREQ(error_result.error()->what(), "Not enough capital");
    EXPECT_EQ(error_result.error()->component(), "PortfolioLedger");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in PortfolioLedger: Not enough capital (INSUFFICIENT_FUNDS)");
}

TEST_F(ResultTest, ValueOfErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::PRICE_UNAVAILABLE, "No quote", "Oracle");
    EXPECT_THROW(error_result.value(), TradeError);

    auto void_error = make_error<void>(ErrorCode::STORAGE_CONFLICT, "Version moved", "Store");
    EXPECT_THROW(void_error.value(), TradeError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndComponent) {
    auto original = make_error<int>(ErrorCode::CONNECTION_ERROR, "Socket closed", "Postgres");
    auto forwarded = forward_error<std::string>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_STREQ(forwarded.error()->what(), "Socket closed");
    EXPECT_EQ(forwarded.error()->component(), "Postgres");
}

TEST_F(ResultTest, MoveSemantics) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> ptr_result(std::move(ptr));
    Result<std::unique_ptr<int>> moved_ptr = std::move(ptr_result);

    EXPECT_TRUE(moved_ptr.is_ok());
    EXPECT_EQ(*moved_ptr.value(), 42);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
}

TEST_F(ResultTest, TransientCodes) {
    EXPECT_TRUE(is_transient(ErrorCode::DATABASE_ERROR));
    EXPECT_TRUE(is_transient(ErrorCode::CONNECTION_ERROR));
    EXPECT_TRUE(is_transient(ErrorCode::TIMEOUT_ERROR));
    EXPECT_TRUE(is_transient(ErrorCode::API_ERROR));
    EXPECT_TRUE(is_transient(ErrorCode::PRICE_UNAVAILABLE));

    EXPECT_FALSE(is_transient(ErrorCode::INSUFFICIENT_FUNDS));
    EXPECT_FALSE(is_transient(ErrorCode::STORAGE_CONFLICT));
    EXPECT_FALSE(is_transient(ErrorCode::CORRUPTED_STATE));
    EXPECT_FALSE(is_transient(ErrorCode::INVALID_SIGNAL));
}
