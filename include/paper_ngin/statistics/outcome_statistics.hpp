#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>
#include "paper_ngin/core/error.hpp"

namespace paper_ngin {
namespace statistics {

/**
 * @brief Summary of historical peak-ROI outcomes for one signal class
 */
struct OutcomeSummary {
    size_t sample_count{0};
    size_t winner_count{0};
    double median{0.0};
    double mean{0.0};
    double mode{0.0};
    double smart{0.0};
};

/**
 * @brief Keep only strictly positive samples
 */
Eigen::VectorXd winning_samples(const std::vector<double>& samples);

/**
 * @brief Median, averaging the two middle values for an even count
 * @return INVALID_ARGUMENT for an empty vector
 */
Result<double> median(const Eigen::VectorXd& values);

Result<double> mean(const Eigen::VectorXd& values);

/**
 * @brief Most frequent value after rounding to whole percent
 * Ties resolve to the smallest bucket.
 */
Result<double> whole_percent_mode(const Eigen::VectorXd& values);

/**
 * @brief Largest value reached by at least `reach_fraction` of the samples
 *
 * Samples are sorted descending and the element at ceil(reach_fraction * n) - 1 is returned,
 * e.g. 0.75 over [10, 20, 30, 40] gives 20.
 */
Result<double> reach_quantile(const Eigen::VectorXd& values, double reach_fraction);

/**
 * @brief All four statistics over the winners of a sample set
 * Statistics are left at zero when there are no winners.
 */
OutcomeSummary summarize(const std::vector<double>& samples, double reach_fraction);

}  // namespace statistics
}  // namespace paper_ngin
