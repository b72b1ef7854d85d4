// src/data/outcome_sample_source.cpp
#include "paper_ngin/data/outcome_sample_source.hpp"

#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

DatabaseOutcomeSource::DatabaseOutcomeSource(std::shared_ptr<DatabaseInterface> db, size_t limit,
                                             std::string table_name)
    : db_(std::move(db)), limit_(limit), table_name_(std::move(table_name)) {}

Result<std::vector<double>> DatabaseOutcomeSource::get_peak_roi_samples(
    SignalClass signal_class) {
    using ResultType = std::vector<double>;

    if (!db_) {
        return make_error<ResultType>(ErrorCode::NOT_INITIALIZED, "No database configured",
                                      "DatabaseOutcomeSource");
    }

    auto table_result = db_->get_peak_roi_samples(signal_class, limit_, table_name_);
    if (table_result.is_error()) {
        return forward_error<ResultType>(table_result);
    }

    const auto& table = table_result.value();
    if (!table) {
        return ResultType{};
    }

    auto column = table->GetColumnByName("peak_roi");
    if (!column) {
        return make_error<ResultType>(ErrorCode::CONVERSION_ERROR,
                                      "Outcome table has no peak_roi column",
                                      "DatabaseOutcomeSource");
    }
    if (column->type()->id() != arrow::Type::DOUBLE) {
        return make_error<ResultType>(ErrorCode::CONVERSION_ERROR,
                                      "peak_roi column is " + column->type()->ToString() +
                                          ", expected double",
                                      "DatabaseOutcomeSource");
    }

    ResultType samples;
    samples.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        auto values = std::static_pointer_cast<arrow::DoubleArray>(chunk);
        for (int64_t i = 0; i < values->length(); ++i) {
            if (!values->IsNull(i)) {
                samples.push_back(values->Value(i));
            }
        }
    }

    DEBUG("Loaded " << samples.size() << " peak ROI samples for "
                    << signal_class_to_string(signal_class));
    return samples;
}

}  // namespace paper_ngin
