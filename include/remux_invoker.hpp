//
//  remux_invoker.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chapter_marker.hpp"
#include "mp4_probe.hpp"
#include "status.hpp"

namespace chaptify {

struct RemuxConfig {
    std::string ffmpeg_path = "ffmpeg";
    std::chrono::milliseconds timeout{600000};
    int64_t duration_tolerance_ms = 1000;  ///< allowed output vs. expected duration difference
};

struct RemuxRequest {
    std::string input_path;
    std::string output_path;  ///< empty: replace input_path
    std::vector<ChapterMarker> markers;
    int64_t expected_duration_ms = 0;
};

/// Capability that embeds markers into a container.
class ChapterWriter {
   public:
    virtual ~ChapterWriter() = default;
    virtual Status write(const RemuxRequest &request) = 0;
};

/**
 * @brief Embeds chapters with ffmpeg in a stream-copy pass.
 *
 * The tool writes to a temporary sibling of the target; the target is replaced by rename() only
 * after the tool exits 0 and the output is non-empty with a duration within tolerance. Any
 * failure leaves the target untouched and removes the temporaries.
 */
class FfmpegChapterWriter : public ChapterWriter {
   public:
    FfmpegChapterWriter(RemuxConfig config, MediaInspector &inspector);

    Status write(const RemuxRequest &request) override;

   private:
    const RemuxConfig config_;
    MediaInspector &inspector_;
};

/// Argument vector for the ffmpeg pass.
std::vector<std::string> build_ffmpeg_command(const std::string &ffmpeg_path,
                                              const std::string &input_path,
                                              const std::string &control_path,
                                              const std::string &output_path);

/// Unique temporary path next to `target`; keeps `suffix` as the extension.
std::filesystem::path temp_sibling_path(const std::filesystem::path &target,
                                        const std::string &suffix);

}  // namespace chaptify
