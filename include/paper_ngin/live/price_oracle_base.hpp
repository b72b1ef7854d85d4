#pragma once

#include <cmath>
#include <string>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief A price observation and where it came from
 */
struct PriceQuote {
    Price price{0.0};
    Timestamp as_of;
    std::string source;
};

/**
 * Base class for current-price lookups used by the position monitor and executor
 */
class PriceOracleBase {
protected:
    // Micro-cap tokens trade far below a cent, so the floor is tiny
    static constexpr double MIN_VALID_PRICE = 1e-12;
    static constexpr double MAX_VALID_PRICE = 1e9;

public:
    virtual ~PriceOracleBase() = default;

    /**
     * @brief Latest price of an asset
     * @return The quote, or PRICE_UNAVAILABLE (or a transport error code) when no source answers
     */
    virtual Result<PriceQuote> get_quote(const std::string& asset_id) = 0;

    static bool is_valid_price(double price) {
        return std::isfinite(price) && price > MIN_VALID_PRICE && price < MAX_VALID_PRICE;
    }
};

}  // namespace paper_ngin
