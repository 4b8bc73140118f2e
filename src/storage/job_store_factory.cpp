/**
 * @file job_store_factory.cpp
 * @brief Builds the configured job store implementation
 */

#include <genqueue/storage/job_store_factory.hpp>

#include <genqueue/storage/local_job_store.hpp>

namespace genqueue::storage {

auto shared_options_for(const config::genqueue_config& config) -> shared_store_options {
    shared_store_options options;
    if (!config.queue.shared_url.empty()) {
        options.backend = database_backend::postgres;
        options.connection_string = config.queue.shared_url;
    } else {
        options.backend = database_backend::sqlite;
        options.database_path = config.queue.shared_database;
    }
    options.busy_timeout = config.queue.busy_timeout;
    return options;
}

auto make_job_store(const config::genqueue_config& config,
                    queue::clock_source clock,
                    std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<queue::job_store>> {
    using store_ptr = std::unique_ptr<queue::job_store>;

    const auto backend = config.effective_backend();

    if (backend == config::shared_backend) {
        auto opened = shared_job_store::open(shared_options_for(config), std::move(clock),
                                             std::move(logger));
        if (opened.is_err()) {
            return make_error<store_ptr>(opened.error().code, opened.error().message,
                                         "job_store_factory");
        }
        return ok(store_ptr(std::move(opened.value())));
    }

    if (backend == config::local_backend) {
        auto opened = local_job_store::open(config.queue.local_directory, std::move(clock),
                                            std::move(logger));
        if (opened.is_err()) {
            return make_error<store_ptr>(opened.error().code, opened.error().message,
                                         "job_store_factory");
        }
        return ok(store_ptr(std::move(opened.value())));
    }

    return make_error<store_ptr>(error_codes::config_invalid,
                                 "Unknown queue backend: " + backend, "job_store_factory");
}

}  // namespace genqueue::storage
