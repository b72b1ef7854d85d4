// include/paper_ngin/exit/outcome_sample_cache.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"
#include "paper_ngin/data/outcome_sample_source.hpp"

namespace paper_ngin {

/**
 * @brief Last known peak-ROI samples per signal class
 *
 * A failed refresh keeps the previously cached samples.
 */
class OutcomeSampleCache {
public:
    explicit OutcomeSampleCache(std::shared_ptr<OutcomeSampleSource> source = nullptr);

    /**
     * @brief Reload one signal class from the source
     */
    Result<void> refresh(SignalClass signal_class);

    /**
     * @brief Reload every signal class
     * @return Number of classes whose refresh failed
     */
    size_t refresh_all();

    std::vector<double> samples(SignalClass signal_class) const;

    void set_samples(SignalClass signal_class, std::vector<double> samples);

private:
    std::shared_ptr<OutcomeSampleSource> source_;
    std::map<SignalClass, std::vector<double>> samples_;
    mutable std::mutex mutex_;
};

}  // namespace paper_ngin
