// src/live/http_price_oracle.cpp
#include "paper_ngin/live/http_price_oracle.hpp"

#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "HttpPriceOracle";

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(data, size * nmemb);
    return size * nmemb;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Price fields arrive either as JSON numbers or as decimal strings
Result<double> read_price_field(const nlohmann::json& field) {
    if (field.is_number()) {
        return field.get<double>();
    }
    if (field.is_string()) {
        try {
            return std::stod(field.get<std::string>());
        } catch (const std::exception&) {
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Unparseable price: " + field.get<std::string>(),
                                      kComponent);
        }
    }
    return make_error<double>(ErrorCode::PRICE_UNAVAILABLE, "Price field missing or null",
                              kComponent);
}

}  // namespace

HttpPriceOracle::HttpPriceOracle(PriceSourceConfig config) : config_(std::move(config)) {
    ensure_curl_global_init();
}

std::string HttpPriceOracle::expand_url(const std::string& url_template,
                                        const std::string& asset_id) {
    static const std::string placeholder = "{asset}";
    std::string url = url_template;
    for (size_t pos = url.find(placeholder); pos != std::string::npos;
         pos = url.find(placeholder, pos + asset_id.size())) {
        url.replace(pos, placeholder.size(), asset_id);
    }
    return url;
}

Result<double> HttpPriceOracle::parse_primary_response(const std::string& body,
                                                       const std::string& asset_id) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.contains("data") || !j["data"].is_object() || !j["data"].contains(asset_id) ||
            !j["data"][asset_id].is_object() || !j["data"][asset_id].contains("price")) {
            return make_error<double>(ErrorCode::PRICE_UNAVAILABLE,
                                      "Primary source has no price for " + asset_id, kComponent);
        }
        return read_price_field(j["data"][asset_id]["price"]);
    } catch (const nlohmann::json::exception& e) {
        return make_error<double>(ErrorCode::JSON_PARSE_ERROR,
                                  std::string("Invalid primary response: ") + e.what(),
                                  kComponent);
    }
}

Result<double> HttpPriceOracle::parse_fallback_response(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.contains("pairs") || !j["pairs"].is_array() || j["pairs"].empty()) {
            return make_error<double>(ErrorCode::PRICE_UNAVAILABLE,
                                      "Fallback source returned no pairs", kComponent);
        }
        const auto& pair = j["pairs"][0];
        if (!pair.contains("priceUsd")) {
            return make_error<double>(ErrorCode::PRICE_UNAVAILABLE,
                                      "Fallback pair has no priceUsd", kComponent);
        }
        return read_price_field(pair["priceUsd"]);
    } catch (const nlohmann::json::exception& e) {
        return make_error<double>(ErrorCode::JSON_PARSE_ERROR,
                                  std::string("Invalid fallback response: ") + e.what(),
                                  kComponent);
    }
}

Result<std::string> HttpPriceOracle::http_get(const std::string& url) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                              &curl_easy_cleanup);
    if (!curl) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR, "Failed to initialize curl",
                                       kComponent);
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "paper_ngin/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<std::string>(ErrorCode::TIMEOUT_ERROR, "Request timed out: " + url,
                                       kComponent);
    }
    if (res != CURLE_OK) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR,
                                       "Request failed: " + std::string(curl_easy_strerror(res)),
                                       kComponent);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return make_error<std::string>(ErrorCode::API_ERROR,
                                       "HTTP " + std::to_string(status) + " from " + url,
                                       kComponent);
    }
    return body;
}

Result<PriceQuote> HttpPriceOracle::get_quote(const std::string& asset_id) {
    if (asset_id.empty()) {
        return make_error<PriceQuote>(ErrorCode::INVALID_ARGUMENT, "Asset ID cannot be empty",
                                      kComponent);
    }

    struct Source {
        const std::string* url_template;
        const char* name;
        bool primary;
    };
    const Source sources[] = {{&config_.primary_url, "primary", true},
                              {&config_.fallback_url, "fallback", false}};

    std::string last_error = "no price source configured";
    for (const auto& source : sources) {
        if (source.url_template->empty()) {
            continue;
        }

        auto body = http_get(expand_url(*source.url_template, asset_id));
        if (body.is_error()) {
            last_error = body.error()->what();
            DEBUG("Price source " << source.name << " failed for " << asset_id << ": "
                                  << last_error);
            continue;
        }

        auto price = source.primary ? parse_primary_response(body.value(), asset_id)
                                    : parse_fallback_response(body.value());
        if (price.is_error()) {
            last_error = price.error()->what();
            continue;
        }
        if (!is_valid_price(price.value())) {
            last_error = "price out of range: " + std::to_string(price.value());
            continue;
        }

        PriceQuote quote;
        quote.price = price.value();
        quote.as_of = std::chrono::system_clock::now();
        quote.source = source.name;
        return quote;
    }

    return make_error<PriceQuote>(ErrorCode::PRICE_UNAVAILABLE,
                                  "No price for " + asset_id + ": " + last_error, kComponent);
}

}  // namespace paper_ngin
