// include/paper_ngin/storage/portfolio_store.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/portfolio/portfolio_types.hpp"

namespace paper_ngin {

/**
 * @brief Durable per-user portfolio storage with optimistic concurrency
 */
class PortfolioStore {
public:
    virtual ~PortfolioStore() = default;

    /**
     * @brief Read a user's portfolio
     * @return std::nullopt when nothing is stored for the user
     */
    virtual Result<std::optional<Portfolio>> load(const std::string& user_id) = 0;

    /**
     * @brief Write a portfolio if the stored version still equals expected_version
     *
     * An empty expected_version means the user must not be stored yet.
     * @return STORAGE_CONFLICT when the stored copy moved on, other codes for I/O failures
     */
    virtual Result<void> save(const std::string& user_id, const Portfolio& portfolio,
                              std::optional<uint64_t> expected_version) = 0;

    virtual Result<std::vector<std::string>> list_users() = 0;
};

}  // namespace paper_ngin
