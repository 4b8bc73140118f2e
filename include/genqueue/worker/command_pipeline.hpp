/**
 * @file command_pipeline.hpp
 * @brief Generation pipeline that runs an external command per job
 *
 * For each job the command is invoked as
 * `<command> <work_dir>/<job_id>/job.json <work_dir>/<job_id>/output`.
 * The job file holds the record in its wire form. Standard output is read
 * line by line:
 *
 * - `progress <n> <message>` relays progress
 * - `status <name>` requests an in-flight status such as `uploading`
 * - `result {json}` carries the output reference and scores
 *
 * A non-zero exit fails the job with the last line printed. A zero exit
 * without a result line reports the output directory as the output.
 */

#pragma once

#include <genqueue/di/ilogger.hpp>
#include <genqueue/worker/generation_pipeline.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace genqueue::worker {

class command_pipeline final : public generation_pipeline {
public:
    command_pipeline(std::string command, std::filesystem::path work_directory,
                     std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto run(const queue::job_record& job, progress_sink& progress)
        -> Result<queue::job_output> override;

    [[nodiscard]] auto command() const noexcept -> const std::string& { return command_; }

private:
    std::string command_;
    std::filesystem::path work_directory_;
    std::shared_ptr<di::ILogger> logger_;
};

/**
 * @brief Quote a string for POSIX sh
 */
[[nodiscard]] auto shell_quote(std::string_view value) -> std::string;

}  // namespace genqueue::worker
