// include/paper_ngin/data/postgres_database.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/data/database_interface.hpp"

namespace paper_ngin {

/**
 * @brief Database interface for PostgreSQL
 *
 * One connection guarded by a mutex. Every statement runs in its own transaction.
 */
class PostgresDatabase : public DatabaseInterface {
public:
    explicit PostgresDatabase(std::string connection_string);

    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    /**
     * @brief Open the connection and register with the StateManager
     * @return CONNECTION_ERROR if the server is unreachable
     */
    Result<void> connect() override;

    void disconnect() override;

    bool is_connected() const override;

    /**
     * @brief Create the portfolio and outcome tables if they do not exist
     */
    Result<void> initialize_schema(const std::string& portfolio_table = "paper_portfolios",
                                   const std::string& outcome_table = "signal_outcomes");

    Result<std::optional<PortfolioRecord>> load_portfolio(
        const std::string& user_id, const std::string& table_name = "paper_portfolios") override;

    Result<bool> insert_portfolio(const PortfolioRecord& record,
                                  const std::string& table_name = "paper_portfolios") override;

    Result<bool> update_portfolio(const PortfolioRecord& record, uint64_t expected_version,
                                  const std::string& table_name = "paper_portfolios") override;

    Result<std::vector<std::string>> list_portfolio_users(
        const std::string& table_name = "paper_portfolios") override;

    Result<std::shared_ptr<arrow::Table>> get_peak_roi_samples(
        SignalClass signal_class, size_t limit,
        const std::string& table_name = "signal_outcomes") override;

private:
    Result<void> validate_connection() const;

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace paper_ngin
