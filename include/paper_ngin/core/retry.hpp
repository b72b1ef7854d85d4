// include/paper_ngin/core/retry.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#include <thread>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {
namespace utils {

/**
 * @brief Call `func` until it succeeds, fails permanently or runs out of attempts
 *
 * Only errors for which is_transient() holds are retried. The delay doubles after every
 * attempt and gets up to 50% random jitter.
 *
 * @param func Callable returning a Result
 * @param max_attempts Total number of calls, at least one
 * @param initial_delay Wait before the second attempt
 * @return The last Result produced by func
 */
template <typename Func>
auto retry_with_backoff(Func func, int max_attempts = 3,
                        std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100))
    -> decltype(func()) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::chrono::milliseconds delay = initial_delay;

    for (int attempt = 1; attempt < max_attempts; ++attempt) {
        auto result = func();
        if (result.is_ok() || !is_transient(result.error()->code())) {
            return result;
        }

        WARN("Transient failure, retrying (attempt " << attempt << " of " << max_attempts
                                                      << "): " << result.error()->what());

        std::this_thread::sleep_for(delay);
        long jitter_bound = std::max<long>(1, static_cast<long>(delay.count() / 2));
        std::uniform_int_distribution<long> jitter(0, jitter_bound);
        delay = delay * 2 + std::chrono::milliseconds(jitter(rng));
    }

    return func();
}

}  // namespace utils
}  // namespace paper_ngin
