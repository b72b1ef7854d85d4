// include/paper_ngin/data/outcome_sample_source.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/data/database_interface.hpp"

namespace paper_ngin {

/**
 * @brief Provider of historical peak-ROI outcomes (percent) per signal class
 */
class OutcomeSampleSource {
public:
    virtual ~OutcomeSampleSource() = default;

    virtual Result<std::vector<double>> get_peak_roi_samples(SignalClass signal_class) = 0;
};

/**
 * @brief Outcome samples read from the signal outcome table
 */
class DatabaseOutcomeSource : public OutcomeSampleSource {
public:
    DatabaseOutcomeSource(std::shared_ptr<DatabaseInterface> db, size_t limit,
                          std::string table_name = "signal_outcomes");

    Result<std::vector<double>> get_peak_roi_samples(SignalClass signal_class) override;

private:
    std::shared_ptr<DatabaseInterface> db_;
    size_t limit_;
    std::string table_name_;
};

}  // namespace paper_ngin
