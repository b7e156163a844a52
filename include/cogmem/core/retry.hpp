#pragma once

#include "cogmem/core/errors.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace cogmem {

/**
 * @brief Backoff settings for transient failures
 */
struct RetryPolicy {
    int max_attempts = 5;                   ///< Total attempts including the first
    int base_delay_ms = 50;                 ///< Delay before the second attempt, doubled after
    bool verbose = false;
};

/**
 * @brief Call func, retrying with exponential backoff while it throws TransientError
 *
 * Any other exception propagates immediately. The last TransientError is
 * rethrown once attempts are exhausted.
 */
template<typename TransientError, typename Func>
auto retry_with_backoff(Func&& func, const RetryPolicy& policy, const std::string& operation_name)
    -> decltype(func())
{
    int attempts = 0;
    while (true) {
        try {
            return func();
        } catch (const TransientError& e) {
            attempts++;
            if (attempts >= policy.max_attempts) {
                if (policy.verbose) {
                    std::cerr << operation_name << " failed after " << attempts
                              << " attempts: " << e.what() << std::endl;
                }
                throw;
            }

            if (policy.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::milliseconds(policy.base_delay_ms * (1 << (attempts - 1)))
            );
        }
    }
}

} // namespace cogmem
