//
//  remux_invoker.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "remux_invoker.hpp"

#include <unistd.h>

#include <atomic>
#include <sstream>
#include <system_error>
#include <utility>

#include "ffmetadata_writer.hpp"
#include "logging.hpp"
#include "process_runner.hpp"

namespace chaptify {

namespace {

// Removes the file on scope exit unless released.
class TempFileGuard {
   public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) {
                CY_LOG("warn", "could not remove " << path_.string() << ": " << ec.message());
            }
        }
    }
    TempFileGuard(const TempFileGuard &) = delete;
    TempFileGuard &operator=(const TempFileGuard &) = delete;

    void release() { path_.clear(); }

   private:
    std::filesystem::path path_;
};

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

Status remux_error(const std::string &msg, std::vector<std::string> details = {}) {
    CY_LOG("error", msg);
    return make_error(ErrorKind::Remux, msg, std::move(details));
}

}  // namespace

std::vector<std::string> build_ffmpeg_command(const std::string &ffmpeg_path,
                                              const std::string &input_path,
                                              const std::string &control_path,
                                              const std::string &output_path) {
    return {ffmpeg_path,     "-hide_banner",   "-nostdin", "-loglevel", "error",
            "-y",            "-i",             input_path, "-f",        "ffmetadata",
            "-i",            control_path,     "-map",     "0",         "-dn",
            "-map_metadata", "0",              "-map_chapters", "1",    "-c",
            "copy",          output_path};
}

std::filesystem::path temp_sibling_path(const std::filesystem::path &target,
                                        const std::string &suffix) {
    static std::atomic<unsigned> counter{0};
    const auto n = counter.fetch_add(1, std::memory_order_relaxed);
    std::string name = "." + target.stem().string() + ".chaptify-" +
                       std::to_string(::getpid()) + "-" + std::to_string(n) + suffix;
    return target.parent_path() / name;
}

FfmpegChapterWriter::FfmpegChapterWriter(RemuxConfig config, MediaInspector &inspector)
    : config_(std::move(config)), inspector_(inspector) {}

Status FfmpegChapterWriter::write(const RemuxRequest &request) {
    const std::filesystem::path input(request.input_path);
    const std::filesystem::path target(request.output_path.empty() ? request.input_path
                                                                   : request.output_path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input, ec)) {
        return remux_error("input " + input.string() + " is not a regular file");
    }

    const auto control_path = temp_sibling_path(target, ".ffmetadata");
    TempFileGuard control_guard(control_path);
    if (!write_ffmetadata(control_path.string(), request.markers)) {
        return remux_error("cannot write chapter control file " + control_path.string());
    }

    // ffmpeg picks the muxer from the temporary's extension; a bare target borrows the input's.
    std::string container = target.extension().string();
    if (container.empty()) {
        container = input.extension().string();
    }
    if (container.empty()) {
        return remux_error("cannot choose a container for " + target.string() +
                           ": neither it nor the input has a file extension");
    }
    const auto tmp_path = temp_sibling_path(target, container);
    TempFileGuard tmp_guard(tmp_path);
    const auto argv = build_ffmpeg_command(config_.ffmpeg_path, input.string(),
                                           control_path.string(), tmp_path.string());
    CY_LOG("info", "embedding " << request.markers.size() << " chapter(s) into "
                                << target.string());
    const ProcessResult proc = run_process(argv, config_.timeout);
    if (!proc.succeeded()) {
        std::string msg = config_.ffmpeg_path + " " + process_outcome_name(proc.outcome);
        if (proc.outcome == ProcessOutcome::Exited) {
            msg += " with status " + std::to_string(proc.exit_code);
        } else if (proc.outcome == ProcessOutcome::Signaled) {
            msg += " by signal " + std::to_string(proc.signal_number);
        } else if (proc.outcome == ProcessOutcome::TimedOut) {
            msg += " after " + std::to_string(config_.timeout.count()) + "ms";
        }
        return remux_error(msg, split_lines(proc.stderr_tail));
    }

    const auto size = std::filesystem::file_size(tmp_path, ec);
    if (ec || size == 0) {
        return remux_error(config_.ffmpeg_path + " reported success but produced no output");
    }
    auto probed = inspector_.inspect(tmp_path.string());
    if (!probed.ok()) {
        return remux_error("output is not readable: " + probed.status.message);
    }
    const int64_t diff = probed.value.duration_ms - request.expected_duration_ms;
    if (diff > config_.duration_tolerance_ms || -diff > config_.duration_tolerance_ms) {
        return remux_error("output duration " + std::to_string(probed.value.duration_ms) +
                           "ms differs from expected " +
                           std::to_string(request.expected_duration_ms) + "ms");
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        return remux_error("cannot replace " + target.string() + ": " + ec.message());
    }
    tmp_guard.release();
    CY_LOG("info", "wrote " << target.string() << " (" << size << " bytes)");
    return ok_status();
}

}  // namespace chaptify
