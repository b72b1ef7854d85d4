#include "paper_ngin/statistics/outcome_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>

namespace paper_ngin {
namespace statistics {

namespace {

Result<double> empty_input(const std::string& what) {
    return make_error<double>(ErrorCode::INVALID_ARGUMENT, what + " of an empty sample set",
                              "OutcomeStatistics");
}

}  // namespace

Eigen::VectorXd winning_samples(const std::vector<double>& samples) {
    std::vector<double> winners;
    winners.reserve(samples.size());
    for (double sample : samples) {
        if (std::isfinite(sample) && sample > 0.0) {
            winners.push_back(sample);
        }
    }
    return Eigen::Map<const Eigen::VectorXd>(winners.data(),
                                             static_cast<Eigen::Index>(winners.size()));
}

Result<double> median(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return empty_input("Median");
    }

    Eigen::VectorXd sorted = values;
    std::sort(sorted.data(), sorted.data() + sorted.size());

    const Eigen::Index n = sorted.size();
    if (n % 2 == 1) {
        return sorted(n / 2);
    }
    return (sorted(n / 2 - 1) + sorted(n / 2)) / 2.0;
}

Result<double> mean(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return empty_input("Mean");
    }
    return values.mean();
}

Result<double> whole_percent_mode(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return empty_input("Mode");
    }

    // Ordered map so the first bucket with the top count is the smallest
    std::map<long, size_t> buckets;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        ++buckets[std::lround(values(i))];
    }

    long best_bucket = buckets.begin()->first;
    size_t best_count = 0;
    for (const auto& [bucket, count] : buckets) {
        if (count > best_count) {
            best_bucket = bucket;
            best_count = count;
        }
    }
    return static_cast<double>(best_bucket);
}

Result<double> reach_quantile(const Eigen::VectorXd& values, double reach_fraction) {
    if (values.size() == 0) {
        return empty_input("Reach quantile");
    }
    if (!(reach_fraction > 0.0) || reach_fraction > 1.0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Reach fraction must be in (0, 1]", "OutcomeStatistics");
    }

    Eigen::VectorXd sorted = values;
    std::sort(sorted.data(), sorted.data() + sorted.size(), std::greater<double>());

    const auto n = static_cast<double>(sorted.size());
    auto index = static_cast<Eigen::Index>(std::ceil(reach_fraction * n - 1e-9)) - 1;
    index = std::max<Eigen::Index>(0, std::min<Eigen::Index>(index, sorted.size() - 1));
    return sorted(index);
}

OutcomeSummary summarize(const std::vector<double>& samples, double reach_fraction) {
    OutcomeSummary summary;
    summary.sample_count = samples.size();

    const Eigen::VectorXd winners = winning_samples(samples);
    summary.winner_count = static_cast<size_t>(winners.size());
    if (winners.size() == 0) {
        return summary;
    }

    summary.median = median(winners).value();
    summary.mean = mean(winners).value();
    summary.mode = whole_percent_mode(winners).value();

    auto smart = reach_quantile(winners, reach_fraction);
    summary.smart = smart.is_ok() ? smart.value() : 0.0;
    return summary;
}

}  // namespace statistics
}  // namespace paper_ngin
