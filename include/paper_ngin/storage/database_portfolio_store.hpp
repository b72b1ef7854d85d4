// include/paper_ngin/storage/database_portfolio_store.hpp
#pragma once

#include <memory>
#include <string>
#include "paper_ngin/data/database_interface.hpp"
#include "paper_ngin/storage/portfolio_store.hpp"

namespace paper_ngin {

/**
 * @brief PortfolioStore keeping one JSON document and version per user in a database table
 */
class DatabasePortfolioStore : public PortfolioStore {
public:
    explicit DatabasePortfolioStore(std::shared_ptr<DatabaseInterface> db,
                                    std::string table_name = "paper_portfolios");

    Result<std::optional<Portfolio>> load(const std::string& user_id) override;

    Result<void> save(const std::string& user_id, const Portfolio& portfolio,
                      std::optional<uint64_t> expected_version) override;

    Result<std::vector<std::string>> list_users() override;

private:
    std::shared_ptr<DatabaseInterface> db_;
    std::string table_name_;
};

}  // namespace paper_ngin
