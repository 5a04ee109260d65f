//
//  chaptify.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "chapter_marker.hpp"
#include "config.hpp"
#include "identity.hpp"
#include "mp4_probe.hpp"
#include "remux_invoker.hpp"
#include "status.hpp"

namespace chaptify {

/// @defgroup api Chaptify Public API
/// Resolve catalog chapters for an audiobook file and embed them losslessly.
/// @{

/**
 * @brief Return the Chaptify version string (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

struct PipelineOptions {
    std::string output_path;  ///< empty: replace the input in place
    bool dry_run = false;     ///< resolve and render only; never remux
};

/**
 * @brief Outcome of one file's processing.
 *
 * On failure `status` names the first stage that failed; fields filled by earlier stages stay
 * populated for diagnosis.
 */
struct PipelineResult {
    Status status;
    IdentityKey identity;
    int64_t actual_duration_ms = 0;
    CatalogWork work;
    std::vector<ChapterMarker> markers;
    std::string control_text;  ///< ffmetadata rendering of `markers`
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief One pipeline per file: probe, identify, search, match, fetch, resolve, emit, remux.
 *
 * Holds no per-file state, so one instance may be used from several threads as long as the
 * injected collaborators allow it. Only CatalogTransient failures are retried, with exponential
 * backoff; every other failure aborts the file at once.
 */
class ChapterPipeline {
   public:
    ChapterPipeline(CatalogClient &catalog, MediaInspector &inspector, ChapterWriter &writer,
                    ChaptifyConfig config, SleepFunction sleep = {});

    PipelineResult process(const std::string &path, const PipelineOptions &options = {}) const;

   private:
    template <typename T, typename Call>
    Result<T> with_retry(const std::string &what, Call &&call) const;

    CatalogClient &catalog_;
    MediaInspector &inspector_;
    ChapterWriter &writer_;
    const ChaptifyConfig config_;
    SleepFunction sleep_;
};

/// @}

}  // namespace chaptify
