/**
 * @file command_pipeline.cpp
 * @brief Generation pipeline that runs an external command per job
 */

#include <genqueue/worker/command_pipeline.hpp>

#include <genqueue/compat/format.hpp>
#include <genqueue/queue/job_codec.hpp>
#include <genqueue/queue/job_state_machine.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>

#include <sys/wait.h>

namespace genqueue::worker {

namespace {

constexpr const char* module_name = "command_pipeline";

auto pipeline_error(const std::string& message) -> Result<queue::job_output> {
    return make_error<queue::job_output>(error_codes::pipeline_failed, message, module_name);
}

auto trim(std::string_view text) -> std::string_view {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Outcome of reading the command's output
struct command_output {
    std::optional<queue::job_output> result;
    std::optional<std::string> result_error;
    std::string last_line;
    int last_progress{0};
    std::string last_message;
};

/// Interpret one line of command output
void handle_line(std::string_view raw, progress_sink& progress, command_output& out) {
    auto line = trim(raw);
    if (line.empty()) {
        return;
    }
    out.last_line = std::string(line);

    if (line.rfind("progress ", 0) == 0) {
        std::istringstream iss{std::string(line.substr(9))};
        int value = 0;
        if (iss >> value) {
            std::string message;
            std::getline(iss, message);
            out.last_progress = value;
            out.last_message = std::string(trim(message));
            progress.report(out.last_progress, out.last_message);
        }
        return;
    }

    if (line.rfind("status ", 0) == 0) {
        auto status = queue::job_status_from_string(trim(line.substr(7)));
        if (status.has_value()) {
            progress.report(out.last_progress, out.last_message, status);
        }
        return;
    }

    if (line.rfind("result ", 0) == 0) {
        auto parsed = nlohmann::json::parse(line.substr(7), nullptr, false);
        if (parsed.is_discarded()) {
            out.result_error = "result line is not valid JSON";
            return;
        }
        auto decoded = queue::decode_output(parsed);
        if (decoded.is_err()) {
            out.result_error = decoded.error().message;
            return;
        }
        out.result = std::move(decoded.value());
        out.result_error.reset();
    }
}

}  // namespace

auto shell_quote(std::string_view value) -> std::string {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

command_pipeline::command_pipeline(std::string command,
                                   std::filesystem::path work_directory,
                                   std::shared_ptr<di::ILogger> logger)
    : command_(std::move(command)),
      work_directory_(std::move(work_directory)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto command_pipeline::run(const queue::job_record& job, progress_sink& progress)
    -> Result<queue::job_output> {
    if (command_.empty()) {
        return pipeline_error("No generator command configured");
    }

    if (!queue::is_valid_job_id(job.job_id)) {
        return pipeline_error("Refusing job id unusable as a directory name: " + job.job_id);
    }

    auto job_directory = work_directory_ / job.job_id;
    auto output_directory = job_directory / "output";
    auto job_file = job_directory / "job.json";

    std::error_code ec;
    std::filesystem::create_directories(output_directory, ec);
    if (ec) {
        return pipeline_error("Failed to create output directory: " + ec.message());
    }

    {
        std::ofstream file(job_file, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            return pipeline_error("Failed to write job file: " + job_file.string());
        }
        file << queue::encode_job(job).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
             << '\n';
        if (!file.good()) {
            return pipeline_error("Failed to write job file: " + job_file.string());
        }
    }

    auto command_line = genqueue::compat::format(
        "{} {} {} 2>&1", command_, shell_quote(job_file.string()),
        shell_quote(output_directory.string()));
    logger_->debug_fmt("Running generator for job {}: {}", job.job_id, command_line);

    FILE* pipe = popen(command_line.c_str(), "r");
    if (!pipe) {
        return pipeline_error("Failed to start generator: " + command_);
    }

    command_output out;
    std::array<char, 512> buf{};
    std::string pending;
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        pending += buf.data();
        if (!pending.empty() && pending.back() == '\n') {
            handle_line(pending, progress, out);
            pending.clear();
        }
    }
    if (!pending.empty()) {
        handle_line(pending, progress, out);
    }

    auto status = pclose(pipe);
    if (status == -1) {
        return pipeline_error("Failed to wait for generator: " + command_);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        auto code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        auto reason = out.last_line.empty()
                          ? genqueue::compat::format("generator exited with status {}", code)
                          : out.last_line;
        return pipeline_error(reason);
    }

    if (out.result_error.has_value()) {
        return pipeline_error("Invalid generator result: " + *out.result_error);
    }
    if (out.result.has_value()) {
        return ok(std::move(*out.result));
    }

    queue::job_output fallback;
    fallback.output_url = output_directory.string();
    fallback.output_dir = output_directory.string();
    return ok(std::move(fallback));
}

}  // namespace genqueue::worker
