/**
 * @file job_store_factory.hpp
 * @brief Builds the configured job store implementation
 */

#pragma once

#include <genqueue/config/genqueue_config.hpp>
#include <genqueue/di/ilogger.hpp>
#include <genqueue/queue/job_store.hpp>
#include <genqueue/storage/shared_job_store.hpp>

#include <memory>

namespace genqueue::storage {

/**
 * @brief Shared store options for the queue settings
 *
 * A non-empty shared_url selects PostgreSQL with that connection string;
 * otherwise the shared_database file is opened with SQLite.
 */
[[nodiscard]] auto shared_options_for(const config::genqueue_config& config)
    -> shared_store_options;

/**
 * @brief Open the job store selected by the queue settings
 *
 * Uses genqueue_config::effective_backend() to choose between the local
 * document store and the shared SQL store (PostgreSQL when a connection
 * string is configured, otherwise an SQLite file).
 *
 * @param config Process configuration (only the queue section is read)
 * @param clock Source of timestamps
 * @param logger Logger handed to the store
 * @return The opened store, or the error that prevented opening it
 */
[[nodiscard]] auto make_job_store(const config::genqueue_config& config,
                                  queue::clock_source clock = queue::system_clock_source(),
                                  std::shared_ptr<di::ILogger> logger = nullptr)
    -> Result<std::unique_ptr<queue::job_store>>;

}  // namespace genqueue::storage
