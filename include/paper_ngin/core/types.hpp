// include/paper_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace paper_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Category of trade opportunity
 * Each class carries its own default expiry
 */
enum class SignalClass {
    DISCOVERY,
    ALPHA,
    MANUAL
};

/**
 * @brief How the take-profit target of a position is derived
 */
enum class TakeProfitMode {
    FIXED_PERCENT,  // Use the configured percent as-is
    MEDIAN,         // Median peak ROI of past winners
    MEAN,           // Mean peak ROI of past winners
    MODE,           // Most frequent whole-percent peak ROI of past winners
    SMART_QUANTILE  // ROI reached by a fixed fraction of past winners
};

/**
 * @brief How the trade executor sizes a new position
 */
enum class SizingMode {
    FIXED,   // Constant USD amount
    PERCENT  // Percent of available capital
};

/**
 * @brief Signal grade assigned upstream
 */
enum class Grade {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW,
    NONE
};

inline std::string signal_class_to_string(SignalClass signal_class) {
    switch (signal_class) {
        case SignalClass::DISCOVERY:
            return "discovery";
        case SignalClass::ALPHA:
            return "alpha";
        case SignalClass::MANUAL:
            return "manual";
        default:
            return "unknown";
    }
}

inline std::optional<SignalClass> signal_class_from_string(const std::string& value) {
    if (value == "discovery")
        return SignalClass::DISCOVERY;
    if (value == "alpha")
        return SignalClass::ALPHA;
    if (value == "manual")
        return SignalClass::MANUAL;
    return std::nullopt;
}

inline std::string take_profit_mode_to_string(TakeProfitMode mode) {
    switch (mode) {
        case TakeProfitMode::FIXED_PERCENT:
            return "fixed";
        case TakeProfitMode::MEDIAN:
            return "median";
        case TakeProfitMode::MEAN:
            return "mean";
        case TakeProfitMode::MODE:
            return "mode";
        case TakeProfitMode::SMART_QUANTILE:
            return "smart";
        default:
            return "unknown";
    }
}

inline std::optional<TakeProfitMode> take_profit_mode_from_string(const std::string& value) {
    if (value == "fixed")
        return TakeProfitMode::FIXED_PERCENT;
    if (value == "median")
        return TakeProfitMode::MEDIAN;
    if (value == "mean")
        return TakeProfitMode::MEAN;
    if (value == "mode")
        return TakeProfitMode::MODE;
    if (value == "smart")
        return TakeProfitMode::SMART_QUANTILE;
    return std::nullopt;
}

inline std::string grade_to_string(Grade grade) {
    switch (grade) {
        case Grade::CRITICAL:
            return "CRITICAL";
        case Grade::HIGH:
            return "HIGH";
        case Grade::MEDIUM:
            return "MEDIUM";
        case Grade::LOW:
            return "LOW";
        default:
            return "NONE";
    }
}

inline Grade grade_from_string(const std::string& value) {
    if (value == "CRITICAL")
        return Grade::CRITICAL;
    if (value == "HIGH")
        return Grade::HIGH;
    if (value == "MEDIUM")
        return Grade::MEDIUM;
    if (value == "LOW")
        return Grade::LOW;
    return Grade::NONE;
}

/**
 * @brief Identity of a position inside a portfolio: (asset, signal class)
 */
struct PositionKey {
    std::string asset_id;
    SignalClass signal_class{SignalClass::DISCOVERY};

    PositionKey() = default;
    PositionKey(std::string asset, SignalClass cls)
        : asset_id(std::move(asset)), signal_class(cls) {}

    // Composite form "<asset>_<class>"
    std::string to_string() const {
        return asset_id + "_" + signal_class_to_string(signal_class);
    }

    bool operator==(const PositionKey& other) const {
        return asset_id == other.asset_id && signal_class == other.signal_class;
    }

    bool operator!=(const PositionKey& other) const {
        return !(*this == other);
    }
};

struct PositionKeyHash {
    std::size_t operator()(const PositionKey& key) const {
        std::size_t h1 = std::hash<std::string>{}(key.asset_id);
        std::size_t h2 = std::hash<int>{}(static_cast<int>(key.signal_class));
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace paper_ngin
