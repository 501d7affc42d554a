#pragma once

#include "core/result.hpp"
#include <chrono>
#include <functional>
#include <thread>

namespace vellum::sync {

/**
 * Bounded exponential backoff for push and delete operations.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{200};
    double multiplier = 2.0;

    /**
     * Delay after the given failed attempt (1-based).
     */
    [[nodiscard]] std::chrono::milliseconds delay_after(int attempt) const {
        double delay = static_cast<double>(initial_delay.count());
        for (int i = 1; i < attempt; ++i) {
            delay *= multiplier;
        }
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
    }

    [[nodiscard]] static RetryPolicy none() {
        return RetryPolicy{.max_attempts = 1, .initial_delay = {}, .multiplier = 1.0};
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]] inline Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

/**
 * Run `op` until it succeeds, fails with anything other than
 * ServerUnreachable, or runs out of attempts. Exhaustion is reported as
 * Transport carrying the last message. `attempts` receives the number
 * of calls made.
 */
template<typename Op>
[[nodiscard]] Result<void, Error> with_retry(const RetryPolicy& policy,
                                             const Sleeper& sleep,
                                             Op&& op,
                                             int& attempts) {
    attempts = 0;
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (;;) {
        ++attempts;
        Result<void, Error> result = op();
        if (result.is_ok()) {
            return result;
        }
        const auto& error = result.unwrap_err();
        if (!error.is(ErrorKind::ServerUnreachable)) {
            return result;
        }
        if (attempts >= max_attempts) {
            return Result<void, Error>::err(Error{
                ErrorKind::Transport,
                "Gave up after " + std::to_string(attempts) + " attempts: " + error.message,
                error.code});
        }
        if (sleep) {
            sleep(policy.delay_after(attempts));
        }
    }
}

} // namespace vellum::sync
