// src/exit/outcome_sample_cache.cpp
#include "paper_ngin/exit/outcome_sample_cache.hpp"

#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

OutcomeSampleCache::OutcomeSampleCache(std::shared_ptr<OutcomeSampleSource> source)
    : source_(std::move(source)) {}

Result<void> OutcomeSampleCache::refresh(SignalClass signal_class) {
    if (!source_) {
        return Result<void>();
    }

    auto loaded = source_->get_peak_roi_samples(signal_class);
    if (loaded.is_error()) {
        WARN("Keeping cached samples for " << signal_class_to_string(signal_class)
                                           << ": " << loaded.error()->what());
        return forward_error<void>(loaded);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    samples_[signal_class] = loaded.value();
    return Result<void>();
}

size_t OutcomeSampleCache::refresh_all() {
    size_t failures = 0;
    for (auto signal_class : {SignalClass::DISCOVERY, SignalClass::ALPHA, SignalClass::MANUAL}) {
        if (refresh(signal_class).is_error()) {
            ++failures;
        }
    }
    return failures;
}

std::vector<double> OutcomeSampleCache::samples(SignalClass signal_class) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = samples_.find(signal_class);
    if (it == samples_.end()) {
        return {};
    }
    return it->second;
}

void OutcomeSampleCache::set_samples(SignalClass signal_class, std::vector<double> samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_[signal_class] = std::move(samples);
}

}  // namespace paper_ngin
