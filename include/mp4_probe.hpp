//
//  mp4_probe.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "metadata_set.hpp"
#include "status.hpp"

namespace chaptify {

struct Mp4AtomInfo {
    uint32_t type = 0;
    uint64_t size = 0;    // total atom size.
    uint64_t offset = 0;  // offset in file.
};

// What the pipeline needs to know about an input container.
struct MediaInfo {
    int64_t duration_ms = 0;  ///< Ground-truth duration
    uint32_t timescale = 0;   ///< Timescale the duration was read in
    uint64_t duration = 0;    ///< Duration in timescale units
    bool from_movie_header = false;  ///< true when no audio track carried a duration
    MetadataSet tags;
};

// Utility: read big-endian 32-bit value.
uint32_t read_u32(std::istream &in);

// Utility: read big-endian 64-bit value.
uint64_t read_u64(std::istream &in);

/**
 * @brief Read duration and ilst tags from an MP4-family file (m4b/m4a/mp4).
 *
 * Duration comes from the longest `soun` track's mdhd, falling back to mvhd. Fails with
 * ErrorKind::Probe when the file cannot be opened, carries no moov, or has no positive duration.
 */
Result<MediaInfo> probe_mp4(const std::string &path);

/// Container inspection capability; lets the pipeline run against fakes.
class MediaInspector {
   public:
    virtual ~MediaInspector() = default;
    virtual Result<MediaInfo> inspect(const std::string &path) = 0;
};

class Mp4Inspector : public MediaInspector {
   public:
    Result<MediaInfo> inspect(const std::string &path) override { return probe_mp4(path); }
};

#ifdef CHAPTIFY_TESTING
// Test-only wrappers for the lower-level parsing steps.
MetadataSet parse_ilst_for_test(const std::vector<uint8_t> &ilst_payload);
MetadataSet parse_meta_for_test(const std::vector<uint8_t> &meta_payload);
#endif

}  // namespace chaptify
