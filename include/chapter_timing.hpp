//
//  chapter_timing.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "catalog.hpp"
#include "chapter_marker.hpp"
#include "status.hpp"

namespace chaptify {

inline constexpr double kDefaultDurationTolerance = 0.15;

/**
 * @brief Rescale nominal catalog track lengths onto the file's real duration.
 *
 * Each track gets round(nominal * actual / nominal_total) ms (at least 1ms); the rounding
 * residual goes to the last track so the markers partition [0, actual_duration_ms] exactly.
 *
 * Fails with UnresolvableTimecodes for an empty list, a non-positive track or total, or a
 * non-positive actual duration, and with DurationMismatch when the relative difference between
 * actual and nominal totals exceeds `tolerance`.
 */
Result<std::vector<ChapterMarker>> resolve_timecodes(const std::vector<CatalogTrack> &tracks,
                                                     int64_t actual_duration_ms,
                                                     double tolerance = kDefaultDurationTolerance);

/// Title used for a marker: the track name, or "Chapter N" (1-based) when empty.
std::string chapter_title(const CatalogTrack &track);

/// True when markers are contiguous, strictly increasing and end at `total_ms`.
bool is_partition(const std::vector<ChapterMarker> &markers, int64_t total_ms);

}  // namespace chaptify
