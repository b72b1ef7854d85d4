// src/core/engine_config.cpp
#include "paper_ngin/core/engine_config.hpp"

#include <cstdlib>
#include <sstream>

namespace paper_ngin {

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    j["host"] = host;
    j["port"] = port;
    j["username"] = username;
    j["password"] = password;
    j["name"] = name;
    j["portfolio_table"] = portfolio_table;
    j["outcome_table"] = outcome_table;
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    if (j.contains("host"))
        host = j.at("host").get<std::string>();
    if (j.contains("port")) {
        // Accept both "5432" and 5432
        port = j.at("port").is_number() ? std::to_string(j.at("port").get<int>())
                                        : j.at("port").get<std::string>();
    }
    if (j.contains("username"))
        username = j.at("username").get<std::string>();
    if (j.contains("password"))
        password = j.at("password").get<std::string>();
    if (j.contains("name"))
        name = j.at("name").get<std::string>();
    if (j.contains("portfolio_table"))
        portfolio_table = j.at("portfolio_table").get<std::string>();
    if (j.contains("outcome_table"))
        outcome_table = j.at("outcome_table").get<std::string>();
}

nlohmann::json PriceSourceConfig::to_json() const {
    nlohmann::json j;
    j["primary_url"] = primary_url;
    j["fallback_url"] = fallback_url;
    j["timeout_ms"] = timeout_ms;
    return j;
}

void PriceSourceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("primary_url"))
        primary_url = j.at("primary_url").get<std::string>();
    if (j.contains("fallback_url"))
        fallback_url = j.at("fallback_url").get<std::string>();
    if (j.contains("timeout_ms"))
        timeout_ms = j.at("timeout_ms").get<long>();
}

std::chrono::seconds EngineConfig::expiry_for(SignalClass signal_class) const {
    auto it = expiry_by_signal_class.find(signal_class);
    if (it == expiry_by_signal_class.end()) {
        return std::chrono::hours(24);
    }
    return it->second;
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["starting_capital"] = starting_capital;
    j["default_reserve_percent"] = default_reserve_percent;
    j["page_size"] = page_size;
    j["hard_cap_usd"] = hard_cap_usd;
    j["default_take_profit_pct"] = default_take_profit_pct;
    j["signal_freshness_seconds"] = signal_freshness_seconds;
    j["smart_reach_fraction"] = smart_reach_fraction;
    j["monitor_interval_seconds"] = monitor_interval_seconds;
    j["max_quote_age_seconds"] = max_quote_age_seconds;
    j["price_retry_attempts"] = price_retry_attempts;
    j["sample_limit"] = sample_limit;
    j["persist_interval_seconds"] = persist_interval_seconds;

    nlohmann::json expiry = nlohmann::json::object();
    for (const auto& [signal_class, seconds] : expiry_by_signal_class) {
        expiry[signal_class_to_string(signal_class)] = seconds.count();
    }
    j["expiry_by_signal_class"] = expiry;

    j["database"] = database.to_json();
    j["price_source"] = price_source.to_json();
    j["logger"] = logger.to_json();
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("starting_capital"))
        starting_capital = j.at("starting_capital").get<double>();
    if (j.contains("default_reserve_percent"))
        default_reserve_percent = j.at("default_reserve_percent").get<double>();
    if (j.contains("page_size"))
        page_size = j.at("page_size").get<size_t>();
    if (j.contains("hard_cap_usd"))
        hard_cap_usd = j.at("hard_cap_usd").get<double>();
    if (j.contains("default_take_profit_pct"))
        default_take_profit_pct = j.at("default_take_profit_pct").get<double>();
    if (j.contains("signal_freshness_seconds"))
        signal_freshness_seconds = j.at("signal_freshness_seconds").get<int>();
    if (j.contains("smart_reach_fraction"))
        smart_reach_fraction = j.at("smart_reach_fraction").get<double>();
    if (j.contains("monitor_interval_seconds"))
        monitor_interval_seconds = j.at("monitor_interval_seconds").get<int>();
    if (j.contains("max_quote_age_seconds"))
        max_quote_age_seconds = j.at("max_quote_age_seconds").get<int>();
    if (j.contains("price_retry_attempts"))
        price_retry_attempts = j.at("price_retry_attempts").get<int>();
    if (j.contains("sample_limit"))
        sample_limit = j.at("sample_limit").get<size_t>();
    if (j.contains("persist_interval_seconds"))
        persist_interval_seconds = j.at("persist_interval_seconds").get<int>();

    if (j.contains("expiry_by_signal_class")) {
        for (const auto& [name, seconds] : j.at("expiry_by_signal_class").items()) {
            auto signal_class = signal_class_from_string(name);
            if (!signal_class) {
                throw std::invalid_argument("Unknown signal class in expiry_by_signal_class: " +
                                            name);
            }
            expiry_by_signal_class[*signal_class] = std::chrono::seconds(seconds.get<long>());
        }
    }

    if (j.contains("database"))
        database.from_json(j.at("database"));
    if (j.contains("price_source"))
        price_source.from_json(j.at("price_source"));
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
}

void EngineConfigValidator::check_positive(double value, const std::string& field,
                                           std::vector<ConfigValidationError>& errors) {
    if (!(value > 0.0)) {
        errors.push_back({field, "Must be positive"});
    }
}

void EngineConfigValidator::check_range(double value, const std::string& field, double min_val,
                                        double max_val,
                                        std::vector<ConfigValidationError>& errors) {
    if (value < min_val || value > max_val) {
        std::ostringstream ss;
        ss << "Must be between " << min_val << " and " << max_val;
        errors.push_back({field, ss.str()});
    }
}

std::vector<ConfigValidationError> EngineConfigValidator::validate(
    const EngineConfig& config) const {
    std::vector<ConfigValidationError> errors;

    check_positive(config.starting_capital, "starting_capital", errors);
    check_range(config.default_reserve_percent, "default_reserve_percent", 0.0, 100.0, errors);
    check_positive(static_cast<double>(config.page_size), "page_size", errors);
    check_positive(config.hard_cap_usd, "hard_cap_usd", errors);
    check_positive(config.default_take_profit_pct, "default_take_profit_pct", errors);
    check_positive(config.signal_freshness_seconds, "signal_freshness_seconds", errors);
    check_range(config.smart_reach_fraction, "smart_reach_fraction", 0.01, 1.0, errors);
    check_positive(config.monitor_interval_seconds, "monitor_interval_seconds", errors);
    check_positive(config.max_quote_age_seconds, "max_quote_age_seconds", errors);
    check_range(config.price_retry_attempts, "price_retry_attempts", 1, 10, errors);
    check_positive(static_cast<double>(config.sample_limit), "sample_limit", errors);
    check_positive(config.persist_interval_seconds, "persist_interval_seconds", errors);
    check_positive(static_cast<double>(config.price_source.timeout_ms), "price_source.timeout_ms",
                   errors);

    for (const auto& [signal_class, seconds] : config.expiry_by_signal_class) {
        if (seconds.count() <= 0) {
            errors.push_back({"expiry_by_signal_class." + signal_class_to_string(signal_class),
                              "Must be positive"});
        }
    }

    if (config.price_source.primary_url.empty()) {
        errors.push_back({"price_source.primary_url", "Must be a non-empty string"});
    }
    if (config.database.host.empty()) {
        errors.push_back({"database.host", "Must be a non-empty string"});
    }
    if (config.database.portfolio_table.empty()) {
        errors.push_back({"database.portfolio_table", "Must be a non-empty string"});
    }

    return errors;
}

Result<EngineConfig> load_engine_config(const std::string& filepath) {
    EngineConfig config;
    auto load_result = config.load_from_file(filepath);
    if (load_result.is_error()) {
        return forward_error<EngineConfig>(load_result);
    }

    if (const char* password = std::getenv("PAPER_NGIN_DB_PASSWORD")) {
        config.database.password = password;
    }

    auto errors = EngineConfigValidator().validate(config);
    if (!errors.empty()) {
        std::ostringstream ss;
        ss << "Invalid engine config " << filepath << ":";
        for (const auto& error : errors) {
            ss << " " << error.field << " (" << error.message << ");";
        }
        return make_error<EngineConfig>(ErrorCode::INVALID_ARGUMENT, ss.str(), "EngineConfig");
    }

    return config;
}

}  // namespace paper_ngin
