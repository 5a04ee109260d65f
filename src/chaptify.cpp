//
//  chaptify.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "chaptify.hpp"
#include "chaptify_version.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include "chapter_timing.hpp"
#include "ffmetadata_writer.hpp"
#include "logging.hpp"
#include "work_matcher.hpp"

namespace chaptify {

std::string version_string() { return CHAPTIFY_VERSION_DISPLAY; }

ChapterPipeline::ChapterPipeline(CatalogClient &catalog, MediaInspector &inspector,
                                 ChapterWriter &writer, ChaptifyConfig config,
                                 SleepFunction sleep)
    : catalog_(catalog),
      inspector_(inspector),
      writer_(writer),
      config_(std::move(config)),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

template <typename T, typename Call>
Result<T> ChapterPipeline::with_retry(const std::string &what, Call &&call) const {
    std::chrono::milliseconds backoff(config_.retry_backoff_ms);
    for (int attempt = 1;; ++attempt) {
        Result<T> r = call();
        if (r.status.kind != ErrorKind::CatalogTransient || attempt >= config_.retry_attempts) {
            if (!r.ok() && attempt > 1) {
                r.status.message += " (after " + std::to_string(attempt) + " attempts)";
            }
            return r;
        }
        CY_LOG("warn", what << " failed (" << r.status.message << "), retry " << attempt << "/"
                            << (config_.retry_attempts - 1) << " in " << backoff.count()
                            << "ms");
        sleep_(backoff);
        backoff *= 2;
    }
}

PipelineResult ChapterPipeline::process(const std::string &path,
                                        const PipelineOptions &options) const {
    const auto t0 = std::chrono::steady_clock::now();
    PipelineResult res;
    auto fail = [&](Status st) {
        CY_LOG("debug", path << ": " << describe(st));
        res.status = std::move(st);
        return res;
    };

    auto probe = inspector_.inspect(path);
    if (!probe.ok()) {
        return fail(std::move(probe.status));
    }
    res.actual_duration_ms = probe.value.duration_ms;

    auto identity = extract_identity(path, probe.value.tags);
    if (!identity.ok()) {
        return fail(std::move(identity.status));
    }
    res.identity = identity.value;
    CY_LOG("info", "looking up '" << res.identity.title << "' by '" << res.identity.author
                                  << "' (" << res.actual_duration_ms << "ms)");

    auto found = with_retry<std::vector<CatalogWork>>(
        "search", [&]() { return catalog_.search(res.identity); });
    if (!found.ok()) {
        return fail(std::move(found.status));
    }
    std::vector<CatalogWork> candidates = std::move(found.value);

    // Several title-tier candidates: fetch their listings so the file duration can decide.
    const auto shortlist = shortlist_candidates(res.identity, candidates);
    if (shortlist.size() > 1) {
        for (size_t idx : shortlist) {
            auto &c = candidates[idx];
            auto tracks = with_retry<std::vector<CatalogTrack>>(
                "fetch tracks " + c.id, [&]() { return catalog_.fetch_tracks(c.id); });
            if (!tracks.ok()) {
                return fail(std::move(tracks.status));
            }
            c.tracks = std::move(tracks.value);
        }
    }

    auto chosen = select_work(res.identity, candidates, res.actual_duration_ms);
    if (!chosen.ok()) {
        return fail(std::move(chosen.status));
    }
    res.work = std::move(candidates[chosen.value]);
    if (res.work.tracks.empty()) {
        auto tracks = with_retry<std::vector<CatalogTrack>>(
            "fetch tracks " + res.work.id, [&]() { return catalog_.fetch_tracks(res.work.id); });
        if (!tracks.ok()) {
            return fail(std::move(tracks.status));
        }
        res.work.tracks = std::move(tracks.value);
    }

    std::vector<CatalogTrack> tracks = res.work.tracks;
    if (config_.drop_trailing_track && tracks.size() > 1) {
        CY_LOG("debug", "dropping trailing track '" << tracks.back().name << "'");
        tracks.pop_back();
    }
    auto markers = resolve_timecodes(tracks, res.actual_duration_ms, config_.duration_tolerance);
    if (!markers.ok()) {
        return fail(std::move(markers.status));
    }
    res.markers = std::move(markers.value);
    res.control_text = build_ffmetadata(res.markers);

    if (options.dry_run) {
        CY_LOG("info", "dry run: " << res.markers.size() << " chapter(s) resolved for " << path);
        return res;
    }

    RemuxRequest request;
    request.input_path = path;
    request.output_path = options.output_path;
    request.markers = res.markers;
    request.expected_duration_ms = res.actual_duration_ms;
    Status written = writer_.write(request);
    if (!written.ok()) {
        return fail(std::move(written));
    }
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - t0)
                              .count();
    CY_LOG("debug", "process " << path << " total=" << total_ms << "ms");
    return res;
}

}  // namespace chaptify
