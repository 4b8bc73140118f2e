/**
 * @file generation_pipeline.hpp
 * @brief Interface to the external generation work a worker performs
 *
 * The queue never looks inside a job's input or output. A pipeline turns the
 * claimed record into an output reference (plus any externally computed
 * scores) and reports progress as it goes.
 */

#pragma once

#include <genqueue/core/result.hpp>
#include <genqueue/queue/job_types.hpp>

#include <optional>
#include <string_view>

namespace genqueue::worker {

/**
 * @brief Receives progress from a running pipeline
 *
 * Reporting never fails from the pipeline's point of view.
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    /**
     * @brief Report progress
     *
     * @param progress 0-100
     * @param message Human-readable stage description
     * @param status Requested in-flight status (e.g. uploading), if any
     */
    virtual void report(int progress, std::string_view message,
                        std::optional<queue::job_status> status = std::nullopt) = 0;
};

/**
 * @brief One generation run per claimed job
 */
class generation_pipeline {
public:
    virtual ~generation_pipeline() = default;

    /**
     * @brief Generate the output for a job
     *
     * @param job The claimed record (input reference and parameters)
     * @param progress Sink for progress reports
     * @return Output reference, or pipeline_failed with the failure text
     */
    [[nodiscard]] virtual auto run(const queue::job_record& job, progress_sink& progress)
        -> Result<queue::job_output> = 0;
};

}  // namespace genqueue::worker
