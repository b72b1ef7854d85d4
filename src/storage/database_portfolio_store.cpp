// src/storage/database_portfolio_store.cpp
#include "paper_ngin/storage/database_portfolio_store.hpp"

#include <nlohmann/json.hpp>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "DatabasePortfolioStore";
}

DatabasePortfolioStore::DatabasePortfolioStore(std::shared_ptr<DatabaseInterface> db,
                                               std::string table_name)
    : db_(std::move(db)), table_name_(std::move(table_name)) {}

Result<std::optional<Portfolio>> DatabasePortfolioStore::load(const std::string& user_id) {
    using ResultType = std::optional<Portfolio>;

    auto record = db_->load_portfolio(user_id, table_name_);
    if (record.is_error()) {
        return forward_error<ResultType>(record);
    }
    if (!record.value()) {
        return ResultType(std::nullopt);
    }

    try {
        Portfolio portfolio = nlohmann::json::parse(record.value()->document).get<Portfolio>();
        // The row version is authoritative for concurrency control
        portfolio.version = record.value()->version;
        if (portfolio.user_id != user_id) {
            return make_error<ResultType>(ErrorCode::CORRUPTED_STATE,
                                          "Stored document for " + user_id + " belongs to " +
                                              portfolio.user_id,
                                          kComponent);
        }
        return ResultType(std::move(portfolio));
    } catch (const std::exception& e) {
        return make_error<ResultType>(ErrorCode::JSON_PARSE_ERROR,
                                      "Unreadable portfolio document for " + user_id + ": " +
                                          e.what(),
                                      kComponent);
    }
}

Result<void> DatabasePortfolioStore::save(const std::string& user_id, const Portfolio& portfolio,
                                          std::optional<uint64_t> expected_version) {
    PortfolioRecord record;
    record.user_id = user_id;
    record.version = portfolio.version;
    try {
        record.document = nlohmann::json(portfolio).dump();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Failed to serialize portfolio for " + user_id + ": " + e.what(),
                                kComponent);
    }

    auto written = expected_version
                       ? db_->update_portfolio(record, *expected_version, table_name_)
                       : db_->insert_portfolio(record, table_name_);
    if (written.is_error()) {
        return forward_error<void>(written);
    }

    if (!written.value()) {
        std::string expected = expected_version ? std::to_string(*expected_version) : "none";
        return make_error<void>(ErrorCode::STORAGE_CONFLICT,
                                "Stored portfolio of " + user_id +
                                    " changed concurrently (expected version " + expected + ")",
                                kComponent);
    }

    DEBUG("Saved portfolio of " << user_id << " at version " << portfolio.version);
    return Result<void>();
}

Result<std::vector<std::string>> DatabasePortfolioStore::list_users() {
    return db_->list_portfolio_users(table_name_);
}

}  // namespace paper_ngin
