//
//  chapter_timing.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chapter_timing.hpp"

#include <cmath>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <string>

#include "logging.hpp"

namespace chaptify {

namespace {

Result<std::vector<ChapterMarker>> unresolvable(const std::string &why) {
    return make_failure<std::vector<ChapterMarker>>(
        make_error(ErrorKind::UnresolvableTimecodes, why));
}

}  // namespace

std::string chapter_title(const CatalogTrack &track) {
    if (!track.name.empty()) {
        return track.name;
    }
    return "Chapter " + std::to_string(track.index + 1);
}

Result<std::vector<ChapterMarker>> resolve_timecodes(const std::vector<CatalogTrack> &tracks,
                                                     int64_t actual_duration_ms,
                                                     double tolerance) {
    if (tracks.empty()) {
        return unresolvable("catalog returned no tracks");
    }
    if (actual_duration_ms <= 0) {
        return unresolvable("actual duration is " + std::to_string(actual_duration_ms) + "ms");
    }
    int64_t nominal_total = 0;
    for (const auto &t : tracks) {
        if (t.nominal_duration_ms <= 0) {
            return unresolvable("track " + std::to_string(t.index) + " has nominal duration " +
                                std::to_string(t.nominal_duration_ms) + "ms");
        }
        if (t.nominal_duration_ms > std::numeric_limits<int64_t>::max() - nominal_total) {
            return unresolvable("nominal track total overflows at track " +
                                std::to_string(t.index));
        }
        nominal_total += t.nominal_duration_ms;
    }

    const double drift =
        std::fabs(static_cast<double>(actual_duration_ms - nominal_total)) /
        static_cast<double>(nominal_total);
    CY_LOG("timing", "nominal total=" << nominal_total << "ms actual=" << actual_duration_ms
                                      << "ms drift=" << drift * 100.0 << "%");
    if (drift > tolerance) {
        return make_failure<std::vector<ChapterMarker>>(make_error(
            ErrorKind::DurationMismatch,
            "catalog total " + std::to_string(nominal_total) + "ms differs from file duration " +
                std::to_string(actual_duration_ms) + "ms by " +
                std::to_string(static_cast<int>(std::lround(drift * 100.0))) +
                "% (tolerance " +
                std::to_string(static_cast<int>(std::lround(tolerance * 100.0))) + "%)"));
    }

    std::vector<int64_t> durations;
    durations.reserve(tracks.size());
    int64_t assigned = 0;
    for (const auto &t : tracks) {
        // long double keeps the product exact for any realistic duration.
        const auto scaled = static_cast<int64_t>(
            std::llround(static_cast<long double>(t.nominal_duration_ms) * actual_duration_ms /
                         nominal_total));
        durations.push_back(std::max<int64_t>(1, scaled));
        assigned += durations.back();
    }
    const int64_t residual = actual_duration_ms - assigned;
    durations.back() += residual;
    if (durations.back() <= 0) {
        return unresolvable("rounding residual " + std::to_string(residual) +
                            "ms leaves no room for the last track");
    }
    if (residual != 0) {
        CY_LOG("timing", "rounding residual " << residual << "ms added to last track");
    }

    std::vector<ChapterMarker> markers;
    markers.reserve(tracks.size());
    int64_t cursor = 0;
    for (size_t i = 0; i < tracks.size(); ++i) {
        ChapterMarker m;
        m.index = static_cast<uint32_t>(i);
        m.title = chapter_title(tracks[i]);
        m.start_ms = cursor;
        m.end_ms = cursor + durations[i];
        cursor = m.end_ms;
        markers.push_back(std::move(m));
    }
    return make_result(std::move(markers));
}

bool is_partition(const std::vector<ChapterMarker> &markers, int64_t total_ms) {
    if (markers.empty() || markers.front().start_ms != 0) {
        return false;
    }
    for (size_t i = 0; i < markers.size(); ++i) {
        if (markers[i].end_ms <= markers[i].start_ms) {
            return false;
        }
        if (i + 1 < markers.size() && markers[i + 1].start_ms != markers[i].end_ms) {
            return false;
        }
    }
    return markers.back().end_ms == total_ms;
}

}  // namespace chaptify
