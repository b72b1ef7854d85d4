// include/paper_ngin/live/http_price_oracle.hpp
#pragma once

#include <string>
#include "paper_ngin/core/engine_config.hpp"
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/live/price_oracle_base.hpp"

namespace paper_ngin {

/**
 * @brief Price oracle backed by public HTTP price APIs
 *
 * The primary source (Jupiter price API shape: data.<asset>.price) is asked first and the
 * fallback source (DexScreener token API shape: pairs[0].priceUsd) only when the primary
 * has no usable price. Every request is bounded by the configured timeout.
 */
class HttpPriceOracle : public PriceOracleBase {
public:
    explicit HttpPriceOracle(PriceSourceConfig config);
    ~HttpPriceOracle() override = default;

    Result<PriceQuote> get_quote(const std::string& asset_id) override;

    /**
     * @brief Extract a price from a primary-source response body
     */
    static Result<double> parse_primary_response(const std::string& body,
                                                 const std::string& asset_id);

    /**
     * @brief Extract a price from a fallback-source response body
     */
    static Result<double> parse_fallback_response(const std::string& body);

    static std::string expand_url(const std::string& url_template, const std::string& asset_id);

protected:
    /**
     * @brief Perform a GET request and return the body
     * @return TIMEOUT_ERROR, CONNECTION_ERROR or API_ERROR (non-2xx) on failure
     */
    virtual Result<std::string> http_get(const std::string& url);

private:
    PriceSourceConfig config_;
};

}  // namespace paper_ngin
