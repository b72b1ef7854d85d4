// src/data/postgres_database.cpp

#include "paper_ngin/data/postgres_database.hpp"
#include <atomic>
#include <chrono>
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "PostgresDatabase";
}

PostgresDatabase::PostgresDatabase(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", kComponent);
        }
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()), kComponent);
    }

    static std::atomic<int> counter{0};
    std::string unique_id = "POSTGRES_DB_" + std::to_string(++counter);

    ComponentInfo info;
    info.type = ComponentType::DATABASE;
    info.state = ComponentState::INITIALIZED;
    info.id = unique_id;

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        // The connection is still usable without lifecycle tracking
        WARN("Failed to register database with StateManager: "
             << register_result.error()->what());
    } else {
        component_id_ = unique_id;
        auto state_result =
            StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        if (state_result.is_error()) {
            WARN("Failed to mark database running: " << state_result.error()->what());
        }
    }

    INFO("Connected to PostgreSQL database as " << unique_id);
    return Result<void>();
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection_) {
        return;
    }

    try {
        connection_->close();
    } catch (const std::exception& e) {
        WARN("Error closing database connection: " << e.what());
    }
    connection_.reset();

    if (!component_id_.empty()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            DEBUG("Database component already unregistered: " << result.error()->what());
        }
        component_id_.clear();
    }

    INFO("Disconnected from PostgreSQL database");
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                kComponent);
    }
    return Result<void>();
}

Result<void> PostgresDatabase::initialize_schema(const std::string& portfolio_table,
                                                 const std::string& outcome_table) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    auto portfolio_validation = validate_table_name(portfolio_table);
    if (portfolio_validation.is_error())
        return portfolio_validation;
    auto outcome_validation = validate_table_name(outcome_table);
    if (outcome_validation.is_error())
        return outcome_validation;

    try {
        pqxx::work txn(*connection_);
        txn.exec("CREATE TABLE IF NOT EXISTS " + portfolio_table +
                 " (user_id TEXT PRIMARY KEY,"
                 " version BIGINT NOT NULL,"
                 " document JSONB NOT NULL,"
                 " updated_at TIMESTAMPTZ NOT NULL DEFAULT now())");
        txn.exec("CREATE TABLE IF NOT EXISTS " + outcome_table +
                 " (id BIGSERIAL PRIMARY KEY,"
                 " signal_class TEXT NOT NULL,"
                 " asset_id TEXT,"
                 " peak_roi DOUBLE PRECISION NOT NULL,"
                 " recorded_at TIMESTAMPTZ NOT NULL DEFAULT now())");
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to initialize schema: " + std::string(e.what()),
                                kComponent);
    }
}

Result<std::optional<PortfolioRecord>> PostgresDatabase::load_portfolio(
    const std::string& user_id, const std::string& table_name) {
    using ResultType = std::optional<PortfolioRecord>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<ResultType>(validation);
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error())
        return forward_error<ResultType>(table_validation);

    try {
        pqxx::work txn(*connection_);
        auto rows = txn.exec_params("SELECT user_id, version, document::text FROM " + table_name +
                                        " WHERE user_id = $1",
                                    user_id);
        txn.commit();

        if (rows.empty()) {
            return ResultType(std::nullopt);
        }

        PortfolioRecord record;
        record.user_id = rows[0][0].as<std::string>();
        record.version = static_cast<uint64_t>(rows[0][1].as<long long>());
        record.document = rows[0][2].as<std::string>();
        return ResultType(std::move(record));
    } catch (const std::exception& e) {
        return make_error<ResultType>(ErrorCode::DATABASE_ERROR,
                                      "Failed to load portfolio " + user_id + ": " + e.what(),
                                      kComponent);
    }
}

Result<bool> PostgresDatabase::insert_portfolio(const PortfolioRecord& record,
                                                const std::string& table_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<bool>(validation);
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error())
        return forward_error<bool>(table_validation);

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "INSERT INTO " + table_name +
                " (user_id, version, document, updated_at) VALUES ($1, $2, $3::jsonb, now())"
                " ON CONFLICT (user_id) DO NOTHING",
            record.user_id, static_cast<long long>(record.version), record.document);
        txn.commit();
        return result.affected_rows() == 1;
    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to insert portfolio " + record.user_id + ": " + e.what(),
                                kComponent);
    }
}

Result<bool> PostgresDatabase::update_portfolio(const PortfolioRecord& record,
                                                uint64_t expected_version,
                                                const std::string& table_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<bool>(validation);
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error())
        return forward_error<bool>(table_validation);

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "UPDATE " + table_name +
                " SET version = $2, document = $3::jsonb, updated_at = now()"
                " WHERE user_id = $1 AND version = $4",
            record.user_id, static_cast<long long>(record.version), record.document,
            static_cast<long long>(expected_version));
        txn.commit();
        return result.affected_rows() == 1;
    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to update portfolio " + record.user_id + ": " + e.what(),
                                kComponent);
    }
}

Result<std::vector<std::string>> PostgresDatabase::list_portfolio_users(
    const std::string& table_name) {
    using ResultType = std::vector<std::string>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<ResultType>(validation);
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error())
        return forward_error<ResultType>(table_validation);

    try {
        pqxx::work txn(*connection_);
        auto rows = txn.exec("SELECT user_id FROM " + table_name + " ORDER BY user_id");
        txn.commit();

        ResultType users;
        users.reserve(rows.size());
        for (const auto& row : rows) {
            users.push_back(row[0].as<std::string>());
        }
        return users;
    } catch (const std::exception& e) {
        return make_error<ResultType>(ErrorCode::DATABASE_ERROR,
                                      "Failed to list portfolio users: " + std::string(e.what()),
                                      kComponent);
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_peak_roi_samples(
    SignalClass signal_class, size_t limit, const std::string& table_name) {
    using ResultType = std::shared_ptr<arrow::Table>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<ResultType>(validation);
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error())
        return forward_error<ResultType>(table_validation);

    pqxx::result rows;
    try {
        pqxx::work txn(*connection_);
        rows = txn.exec_params("SELECT peak_roi FROM " + table_name +
                                   " WHERE signal_class = $1 AND peak_roi IS NOT NULL"
                                   " ORDER BY recorded_at DESC LIMIT $2",
                               signal_class_to_string(signal_class),
                               static_cast<long long>(limit));
        txn.commit();
    } catch (const std::exception& e) {
        return make_error<ResultType>(ErrorCode::DATABASE_ERROR,
                                      "Failed to load peak ROI samples: " + std::string(e.what()),
                                      kComponent);
    }

    arrow::DoubleBuilder builder(arrow::default_memory_pool());
    if (!builder.Reserve(static_cast<int64_t>(rows.size())).ok()) {
        return make_error<ResultType>(ErrorCode::CONVERSION_ERROR,
                                      "Failed to reserve peak_roi column", kComponent);
    }
    for (const auto& row : rows) {
        if (!builder.Append(row[0].as<double>()).ok()) {
            return make_error<ResultType>(ErrorCode::CONVERSION_ERROR,
                                          "Failed to append peak_roi value", kComponent);
        }
    }

    std::shared_ptr<arrow::Array> array;
    if (!builder.Finish(&array).ok()) {
        return make_error<ResultType>(ErrorCode::CONVERSION_ERROR,
                                      "Failed to finish peak_roi column", kComponent);
    }

    auto schema = arrow::schema({arrow::field("peak_roi", arrow::float64())});
    return arrow::Table::Make(schema, std::vector<std::shared_ptr<arrow::Array>>{array});
}

}  // namespace paper_ngin
