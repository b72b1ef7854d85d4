#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>
#include "../core/test_base.hpp"
#include "paper_ngin/live/http_price_oracle.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

namespace {

// Serves canned bodies instead of performing requests
class ScriptedHttpPriceOracle : public HttpPriceOracle {
public:
    explicit ScriptedHttpPriceOracle(PriceSourceConfig config)
        : HttpPriceOracle(std::move(config)) {}

    void respond(const std::string& url, const std::string& body) {
        bodies_[url] = body;
    }

    void fail(const std::string& url, ErrorCode code) {
        failures_[url] = code;
    }

    const std::vector<std::string>& requested() const {
        return requested_;
    }

protected:
    Result<std::string> http_get(const std::string& url) override {
        requested_.push_back(url);
        auto failure = failures_.find(url);
        if (failure != failures_.end()) {
            return make_error<std::string>(failure->second, "Injected failure for " + url,
                                           "ScriptedHttpPriceOracle");
        }
        auto body = bodies_.find(url);
        if (body == bodies_.end()) {
            return make_error<std::string>(ErrorCode::API_ERROR, "HTTP 404 from " + url,
                                           "ScriptedHttpPriceOracle");
        }
        return body->second;
    }

private:
    std::map<std::string, std::string> bodies_;
    std::map<std::string, ErrorCode> failures_;
    std::vector<std::string> requested_;
};

PriceSourceConfig test_sources() {
    PriceSourceConfig config;
    config.primary_url = "https://primary.test/price?ids={asset}";
    config.fallback_url = "https://fallback.test/tokens/{asset}";
    return config;
}

}  // namespace

class HttpPriceOracleTest : public TestBase {};

TEST_F(HttpPriceOracleTest, ExpandsEveryPlaceholder) {
    EXPECT_EQ(HttpPriceOracle::expand_url("https://x.test/{asset}?v={asset}", "MINT"),
              "https://x.test/MINT?v=MINT");
    EXPECT_EQ(HttpPriceOracle::expand_url("https://x.test/static", "MINT"),
              "https://x.test/static");
}

TEST_F(HttpPriceOracleTest, ParsesPrimaryResponses) {
    auto as_string =
        HttpPriceOracle::parse_primary_response(R"({"data":{"MINT":{"price":"0.00125"}}})", "MINT");
    ASSERT_TRUE(as_string.is_ok());
    EXPECT_DOUBLE_EQ(as_string.value(), 0.00125);

    auto as_number =
        HttpPriceOracle::parse_primary_response(R"({"data":{"MINT":{"price":3.5}}})", "MINT");
    ASSERT_TRUE(as_number.is_ok());
    EXPECT_DOUBLE_EQ(as_number.value(), 3.5);

    auto missing = HttpPriceOracle::parse_primary_response(R"({"data":{"MINT":null}})", "MINT");
    EXPECT_EQ(missing.error()->code(), ErrorCode::PRICE_UNAVAILABLE);

    auto garbage = HttpPriceOracle::parse_primary_response("<html>", "MINT");
    EXPECT_EQ(garbage.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto bad_number =
        HttpPriceOracle::parse_primary_response(R"({"data":{"MINT":{"price":"abc"}}})", "MINT");
    EXPECT_EQ(bad_number.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(HttpPriceOracleTest, ParsesFallbackResponses) {
    auto price = HttpPriceOracle::parse_fallback_response(
        R"({"pairs":[{"priceUsd":"0.42"},{"priceUsd":"9.0"}]})");
    ASSERT_TRUE(price.is_ok());
    EXPECT_DOUBLE_EQ(price.value(), 0.42);

    EXPECT_EQ(HttpPriceOracle::parse_fallback_response(R"({"pairs":[]})").error()->code(),
              ErrorCode::PRICE_UNAVAILABLE);
    EXPECT_EQ(HttpPriceOracle::parse_fallback_response(R"({"pairs":null})").error()->code(),
              ErrorCode::PRICE_UNAVAILABLE);
}

TEST_F(HttpPriceOracleTest, UsesPrimaryWhenItAnswers) {
    ScriptedHttpPriceOracle oracle(test_sources());
    oracle.respond("https://primary.test/price?ids=MINT", R"({"data":{"MINT":{"price":"2.0"}}})");

    auto quote = oracle.get_quote("MINT");
    ASSERT_TRUE(quote.is_ok());
    EXPECT_DOUBLE_EQ(quote.value().price, 2.0);
    EXPECT_EQ(quote.value().source, "primary");
    EXPECT_EQ(oracle.requested().size(), 1u);
}

TEST_F(HttpPriceOracleTest, FallsBackWhenPrimaryFails) {
    ScriptedHttpPriceOracle oracle(test_sources());
    oracle.fail("https://primary.test/price?ids=MINT", ErrorCode::TIMEOUT_ERROR);
    oracle.respond("https://fallback.test/tokens/MINT", R"({"pairs":[{"priceUsd":"1.75"}]})");

    auto quote = oracle.get_quote("MINT");
    ASSERT_TRUE(quote.is_ok());
    EXPECT_DOUBLE_EQ(quote.value().price, 1.75);
    EXPECT_EQ(quote.value().source, "fallback");
}

TEST_F(HttpPriceOracleTest, FallsBackOnUnusablePrimaryPrice) {
    ScriptedHttpPriceOracle oracle(test_sources());
    oracle.respond("https://primary.test/price?ids=MINT", R"({"data":{"MINT":{"price":0}}})");
    oracle.respond("https://fallback.test/tokens/MINT", R"({"pairs":[{"priceUsd":0.5}]})");

    auto quote = oracle.get_quote("MINT");
    ASSERT_TRUE(quote.is_ok());
    EXPECT_DOUBLE_EQ(quote.value().price, 0.5);
}

TEST_F(HttpPriceOracleTest, ReportsUnavailableWhenEverySourceFails) {
    ScriptedHttpPriceOracle oracle(test_sources());
    oracle.fail("https://primary.test/price?ids=MINT", ErrorCode::CONNECTION_ERROR);
    oracle.respond("https://fallback.test/tokens/MINT", R"({"pairs":[]})");

    auto quote = oracle.get_quote("MINT");
    ASSERT_TRUE(quote.is_error());
    EXPECT_EQ(quote.error()->code(), ErrorCode::PRICE_UNAVAILABLE);
    EXPECT_EQ(oracle.requested().size(), 2u);

    EXPECT_EQ(oracle.get_quote("").error()->code(), ErrorCode::INVALID_ARGUMENT);
}
