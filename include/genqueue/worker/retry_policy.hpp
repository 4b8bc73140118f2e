/**
 * @file retry_policy.hpp
 * @brief Bounded retry with backoff for worker-to-queue calls
 *
 * Only errors classified as transient (storage I/O, transport) are retried.
 * Rejections such as stale_claim are returned immediately: repeating them
 * cannot succeed.
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/di/ilogger.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string_view>
#include <thread>

namespace genqueue::worker {

/**
 * @brief Delay growth between attempts
 */
enum class retry_strategy {
    fixed,              ///< Same delay every time
    exponential,        ///< initial * multiplier^(attempt-1)
    exponential_jitter  ///< Exponential with +/- jitter_factor randomization
};

/**
 * @brief Retry policy configuration
 */
struct retry_config {
    std::size_t max_attempts{3};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier{2.0};
    double jitter_factor{0.1};
    retry_strategy strategy{retry_strategy::exponential_jitter};

    /// Decides whether an error is worth another attempt
    std::function<bool(const error_info&)> is_retryable = [](const error_info& error) {
        return error_codes::is_transient(error.code);
    };
};

/**
 * @brief Retry executor over Result-returning callables
 */
class retry_policy {
public:
    /// Sleep hook, replaceable so tests do not wait
    using sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit retry_policy(retry_config config = {},
                          std::shared_ptr<di::ILogger> logger = nullptr,
                          sleeper sleep = nullptr)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : di::null_logger()),
          sleep_(sleep ? std::move(sleep)
                       : sleeper([](std::chrono::milliseconds d) {
                             std::this_thread::sleep_for(d);
                         })),
          rng_(std::random_device{}()) {}

    /**
     * @brief Run an operation until it succeeds, fails permanently or runs out
     *
     * @param operation_name Name used in log messages
     * @param func Callable returning Result<T> (or VoidResult)
     * @return The last result
     */
    template <typename Func>
    auto execute(std::string_view operation_name, Func&& func) -> decltype(func()) {
        std::size_t attempt = 0;
        const auto attempts = std::max<std::size_t>(config_.max_attempts, 1);

        while (true) {
            ++attempt;
            auto result = func();
            if (result.is_ok()) {
                if (attempt > 1) {
                    logger_->info_fmt("{} succeeded after {} attempts", operation_name,
                                      attempt);
                }
                return result;
            }

            if (!config_.is_retryable || !config_.is_retryable(result.error())) {
                logger_->debug_fmt("{} failed with a non-retryable error: {}",
                                   operation_name, result.error().message);
                return result;
            }

            if (attempt >= attempts) {
                logger_->error_fmt("{} failed after {} attempts. Last error: {}",
                                   operation_name, attempt, result.error().message);
                return result;
            }

            auto delay = calculate_delay(attempt);
            logger_->warn_fmt("{} attempt {} failed: {}. Retrying in {} ms", operation_name,
                              attempt, result.error().message, delay.count());
            sleep_(delay);
        }
    }

    [[nodiscard]] auto config() const noexcept -> const retry_config& { return config_; }

    /**
     * @brief Delay before the attempt following the given one
     */
    [[nodiscard]] auto calculate_delay(std::size_t attempt) -> std::chrono::milliseconds {
        std::chrono::milliseconds delay{0};
        const auto base = static_cast<double>(config_.initial_delay.count());

        switch (config_.strategy) {
            case retry_strategy::fixed:
                delay = config_.initial_delay;
                break;

            case retry_strategy::exponential:
                delay = std::chrono::milliseconds(static_cast<long long>(
                    base * std::pow(config_.backoff_multiplier,
                                    static_cast<double>(attempt - 1))));
                break;

            case retry_strategy::exponential_jitter: {
                auto exponential = base * std::pow(config_.backoff_multiplier,
                                                   static_cast<double>(attempt - 1));
                double jitter = 1.0;
                if (config_.jitter_factor > 0.0) {
                    std::lock_guard lock(rng_mutex_);
                    std::uniform_real_distribution<double> dist(-config_.jitter_factor,
                                                                config_.jitter_factor);
                    jitter += dist(rng_);
                }
                delay = std::chrono::milliseconds(
                    static_cast<long long>(exponential * jitter));
                break;
            }
        }

        // Cap at max delay
        if (delay > config_.max_delay) {
            delay = config_.max_delay;
        }
        if (delay.count() < 0) {
            delay = std::chrono::milliseconds{0};
        }
        return delay;
    }

private:
    retry_config config_;
    std::shared_ptr<di::ILogger> logger_;
    sleeper sleep_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace genqueue::worker
