/**
 * @file retry_manager.cpp
 * @brief Retry with exponential backoff for transient host stack failures
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#define MODULE bluetooth

#include <algorithm>
#include <cstring>

#include <zephyr/logging/log.h>
#include <zephyr/random/random.h>

#include <retry_manager.hpp>

LOG_MODULE_DECLARE(MODULE, CONFIG_BLUETOOTH_MODULE_LOG_LEVEL);

// Granularity of the abort check while backing off
static constexpr uint32_t ABORT_POLL_MS = 50;

RetryManager::RetryManager(const std::string &name, const retry_config_t &config) : name(name), config(config)
{
    k_mutex_init(&mutex);
    memset(&stats, 0, sizeof(stats));
    atomic_set(&abort_requested, 0);

    if (config.max_attempts == 0)
    {
        LOG_WRN("%s: max_attempts is 0, using 1", name.c_str());
        this->config.max_attempts = 1;
    }

    if (config.backoff_multiplier < 1.0f)
    {
        LOG_WRN("%s: backoff_multiplier < 1.0, using 1.0", name.c_str());
        this->config.backoff_multiplier = 1.0f;
    }
}

retry_result RetryManager::execute(OperationFunc operation)
{
    uint32_t attempt = 0;
    uint32_t total_delay = 0;

    LOG_DBG("%s: up to %u attempts", name.c_str(), config.max_attempts);

    while (attempt < config.max_attempts)
    {
        attempt++;

        if (aborted())
        {
            LOG_WRN("%s: aborted before attempt %u", name.c_str(), attempt);
            return RETRY_ABORTED;
        }

        int result = operation();

        k_mutex_lock(&mutex, K_FOREVER);
        stats.total_attempts++;
        if (result == 0)
        {
            stats.successful_attempts++;
            stats.total_delay_ms += total_delay;
            k_mutex_unlock(&mutex);

            if (attempt > 1)
            {
                LOG_INF("%s: succeeded on attempt %u", name.c_str(), attempt);
            }
            return RETRY_SUCCESS;
        }
        stats.failed_attempts++;
        stats.last_error = result;
        k_mutex_unlock(&mutex);

        LOG_WRN("%s: attempt %u/%u failed (err %d)", name.c_str(), attempt, config.max_attempts, result);

        // No delay after the last attempt
        if (attempt < config.max_attempts)
        {
            uint32_t delay = calculateDelay(attempt);
            total_delay += delay;

            if (!sleepUnlessAborted(delay))
            {
                LOG_WRN("%s: aborted during backoff", name.c_str());
                return RETRY_ABORTED;
            }
        }
    }

    k_mutex_lock(&mutex, K_FOREVER);
    stats.total_delay_ms += total_delay;
    k_mutex_unlock(&mutex);

    LOG_ERR("%s: failed after %u attempts", name.c_str(), attempt);
    return RETRY_FAILED;
}

void RetryManager::abort()
{
    atomic_set(&abort_requested, 1);
    LOG_DBG("%s: abort requested", name.c_str());
}

void RetryManager::rearm()
{
    atomic_set(&abort_requested, 0);
}

bool RetryManager::aborted() const
{
    return atomic_get(&abort_requested) != 0;
}

void RetryManager::getStats(retry_stats *out) const
{
    if (!out)
    {
        return;
    }

    k_mutex_lock(&mutex, K_FOREVER);
    memcpy(out, &stats, sizeof(retry_stats));
    k_mutex_unlock(&mutex);
}

uint32_t RetryManager::calculateDelay(uint32_t attempt) const
{
    float delay = static_cast<float>(config.initial_delay_ms);

    for (uint32_t i = 1; i < attempt; i++)
    {
        delay *= config.backoff_multiplier;
        if (delay >= static_cast<float>(config.max_delay_ms))
        {
            break;
        }
    }

    uint32_t delay_ms = std::min(static_cast<uint32_t>(delay), config.max_delay_ms);

    if (config.jitter_enabled)
    {
        addJitter(delay_ms);
    }

    return delay_ms;
}

void RetryManager::addJitter(uint32_t &delay_ms) const
{
    // +/-20%
    uint32_t jitter_range = delay_ms / 5;
    if (jitter_range == 0)
    {
        return;
    }

    uint32_t random_val = sys_rand32_get() % (2 * jitter_range);
    delay_ms = delay_ms - jitter_range + random_val;
}

bool RetryManager::sleepUnlessAborted(uint32_t delay_ms) const
{
    while (delay_ms > 0)
    {
        uint32_t slice = std::min(delay_ms, ABORT_POLL_MS);
        k_sleep(K_MSEC(slice));
        delay_ms -= slice;

        if (aborted())
        {
            return false;
        }
    }
    return true;
}
