// include/paper_ngin/data/database_interface.hpp

#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief A stored portfolio document and its optimistic-concurrency version
 */
struct PortfolioRecord {
    std::string user_id;
    std::string document;  // Serialized JSON
    uint64_t version{0};
};

/**
 * @brief Abstract interface for database operations
 * Defines the contract that any database implementation must fulfill
 */
class DatabaseInterface {
public:
    virtual ~DatabaseInterface() = default;

    virtual Result<void> connect() = 0;

    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief Fetch one portfolio document
     * @return std::nullopt when the user has no row
     */
    virtual Result<std::optional<PortfolioRecord>> load_portfolio(
        const std::string& user_id, const std::string& table_name = "paper_portfolios") = 0;

    /**
     * @brief Insert a portfolio document if the user has no row yet
     * @return false when a row already existed and nothing was written
     */
    virtual Result<bool> insert_portfolio(const PortfolioRecord& record,
                                          const std::string& table_name = "paper_portfolios") = 0;

    /**
     * @brief Replace a portfolio document only if its stored version equals expected_version
     * @return false when no row matched (missing or modified elsewhere)
     */
    virtual Result<bool> update_portfolio(const PortfolioRecord& record, uint64_t expected_version,
                                          const std::string& table_name = "paper_portfolios") = 0;

    virtual Result<std::vector<std::string>> list_portfolio_users(
        const std::string& table_name = "paper_portfolios") = 0;

    /**
     * @brief Most recent peak ROI outcomes recorded for a signal class
     * @return Arrow table with a float64 column "peak_roi"
     */
    virtual Result<std::shared_ptr<arrow::Table>> get_peak_roi_samples(
        SignalClass signal_class, size_t limit,
        const std::string& table_name = "signal_outcomes") = 0;

protected:
    /**
     * @brief Accept only [A-Za-z0-9_.] identifiers so table names can be spliced into SQL
     */
    Result<void> validate_table_name(const std::string& table_name) const {
        if (table_name.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Table name cannot be empty",
                                    "DatabaseInterface");
        }
        for (char c : table_name) {
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '_' || c == '.';
            if (!ok) {
                return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                        "Invalid table name: " + table_name, "DatabaseInterface");
            }
        }
        return Result<void>();
    }
};

}  // namespace paper_ngin
