// include/paper_ngin/core/engine_config.hpp
#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief Take-profit percent used when no rule or sample set yields one
 */
constexpr double kDefaultTakeProfitPercent = 50.0;

/**
 * @brief Postgres connection settings
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    std::string port{"5432"};
    std::string username;
    std::string password;  // PAPER_NGIN_DB_PASSWORD overrides this when set
    std::string name{"paper_ngin"};
    std::string portfolio_table{"paper_portfolios"};
    std::string outcome_table{"signal_outcomes"};

    std::string get_connection_string() const {
        return "postgresql://" + username + ":" + password + "@" + host + ":" + port + "/" + name;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Endpoints used by the HTTP price oracle, tried in order
 * `{asset}` in a template is replaced by the asset id
 */
struct PriceSourceConfig : public ConfigBase {
    std::string primary_url{"https://api.jup.ag/price/v2?ids={asset}"};
    std::string fallback_url{"https://api.dexscreener.com/latest/dex/tokens/{asset}"};
    long timeout_ms{5000};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Top-level configuration of the paper trading engine
 */
struct EngineConfig : public ConfigBase {
    // Portfolio
    double starting_capital{1000.0};
    double default_reserve_percent{0.0};  // Percent of starting capital held back
    size_t page_size{10};

    // Execution
    double hard_cap_usd{150.0};
    double default_take_profit_pct{kDefaultTakeProfitPercent};
    int signal_freshness_seconds{3600};
    double smart_reach_fraction{0.75};

    // Monitoring
    int monitor_interval_seconds{60};
    int max_quote_age_seconds{300};
    int price_retry_attempts{3};
    size_t sample_limit{500};
    std::map<SignalClass, std::chrono::seconds> expiry_by_signal_class{
        {SignalClass::DISCOVERY, std::chrono::hours(24)},
        {SignalClass::ALPHA, std::chrono::hours(168)},
        {SignalClass::MANUAL, std::chrono::hours(24 * 365)}};

    // Persistence
    int persist_interval_seconds{30};

    DatabaseConfig database;
    PriceSourceConfig price_source;
    LoggerConfig logger;

    /**
     * @brief Expiry for a signal class, falling back to 24h for classes missing from the map
     */
    std::chrono::seconds expiry_for(SignalClass signal_class) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Configuration validation error
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief Range and consistency checks for EngineConfig
 */
class EngineConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const EngineConfig& config) const;

private:
    static void check_positive(double value, const std::string& field,
                               std::vector<ConfigValidationError>& errors);
    static void check_range(double value, const std::string& field, double min_val,
                            double max_val, std::vector<ConfigValidationError>& errors);
};

/**
 * @brief Load, apply environment overrides and validate an engine config file
 * @param filepath JSON config path
 * @return The config, or INVALID_ARGUMENT listing every validation failure
 */
Result<EngineConfig> load_engine_config(const std::string& filepath);

}  // namespace paper_ngin
