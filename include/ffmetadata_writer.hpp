//
//  ffmetadata_writer.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "chapter_marker.hpp"

namespace chaptify {

/**
 * @brief Serialize markers as an FFmpeg `ffmetadata` control file.
 *
 * Output is `;FFMETADATA1` followed by one `[CHAPTER]` section per marker with
 * `TIMEBASE=1/1000`, `START`, `END` and `title`. Deterministic for equal input.
 */
std::string build_ffmetadata(const std::vector<ChapterMarker> &markers);

/// Backslash-escape `=`, `;`, `#`, `\` and newlines as ffmetadata values require.
std::string escape_ffmetadata_value(const std::string &value);

/// Write build_ffmetadata() output to `path`; false on I/O failure.
bool write_ffmetadata(const std::string &path, const std::vector<ChapterMarker> &markers);

}  // namespace chaptify
