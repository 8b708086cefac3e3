/**
 * @file retry_manager.hpp
 * @brief Retry with exponential backoff for transient host stack failures
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_RETRY_MANAGER_HEADER_
#define APP_INCLUDE_RETRY_MANAGER_HEADER_

#include <functional>
#include <string>

#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <rsc_config.hpp>

enum retry_result
{
    RETRY_SUCCESS,
    RETRY_FAILED,
    RETRY_ABORTED
};

class RetryManager
{
  public:
    // Returns 0 on success or a negative errno
    using OperationFunc = std::function<int()>;

    RetryManager(const std::string &name, const retry_config_t &config);
    ~RetryManager() = default;

    retry_result execute(OperationFunc operation);

    // Stays set until rearm(), so an abort issued before execute() still wins
    void abort();
    void rearm();
    bool aborted() const;

    struct retry_stats
    {
        uint32_t total_attempts;
        uint32_t successful_attempts;
        uint32_t failed_attempts;
        uint32_t total_delay_ms;
        int last_error;
    };

    // Accumulated over every execute() since construction
    void getStats(retry_stats *stats) const;

  private:
    std::string name;
    retry_config_t config;
    retry_stats stats;
    atomic_t abort_requested;
    mutable struct k_mutex mutex;

    uint32_t calculateDelay(uint32_t attempt) const;
    void addJitter(uint32_t &delay_ms) const;
    bool sleepUnlessAborted(uint32_t delay_ms) const;
};

#endif // APP_INCLUDE_RETRY_MANAGER_HEADER_
