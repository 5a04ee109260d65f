//
//  work_matcher.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "work_matcher.hpp"

#include <algorithm>
#include <limits>

#include "logging.hpp"

namespace chaptify {

namespace {

bool is_rotation(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    if (a.size() != b.size() || a.empty()) {
        return false;
    }
    for (size_t shift = 0; shift < a.size(); ++shift) {
        bool same = true;
        for (size_t i = 0; i < a.size() && same; ++i) {
            same = a[(i + shift) % a.size()] == b[i];
        }
        if (same) {
            return true;
        }
    }
    return false;
}

std::string describe_candidate(const CatalogWork &w) {
    std::string line = w.id + ": '" + w.title + "' by '" + w.author + "'";
    if (!w.tracks.empty()) {
        line += " (" + std::to_string(w.tracks.size()) + " tracks, " +
                std::to_string(w.nominal_total_ms()) + "ms)";
    }
    return line;
}

std::vector<std::string> describe_candidates(const std::vector<CatalogWork> &candidates) {
    std::vector<std::string> out;
    out.reserve(candidates.size());
    for (const auto &c : candidates) {
        out.push_back(describe_candidate(c));
    }
    return out;
}

}  // namespace

bool author_matches(const std::string &query_author, const CatalogWork &candidate) {
    const auto query = name_tokens(normalize_name(query_author));
    if (query.empty()) {
        return false;
    }
    std::vector<std::string> names = candidate.authors;
    if (names.empty() && !candidate.author.empty()) {
        names.push_back(candidate.author);
    }
    std::string joined;
    for (const auto &name : names) {
        if (is_rotation(name_tokens(normalize_name(name)), query)) {
            return true;
        }
        joined += name + " ";
    }
    return names.size() > 1 && name_tokens(normalize_name(joined)) == query;
}

TitleMatch title_match(const std::string &query_title, const std::string &candidate_title) {
    const std::string q = normalize_name(query_title);
    const std::string c = normalize_name(candidate_title);
    if (q.empty() || c.empty()) {
        return TitleMatch::None;
    }
    if (q == c) {
        return TitleMatch::Exact;
    }
    const std::string &shorter = q.size() < c.size() ? q : c;
    const std::string &longer = q.size() < c.size() ? c : q;
    if (longer.compare(0, shorter.size(), shorter) == 0 && longer[shorter.size()] == ' ') {
        return TitleMatch::Partial;
    }
    return TitleMatch::None;
}

std::vector<size_t> shortlist_candidates(const IdentityKey &key,
                                         const std::vector<CatalogWork> &candidates) {
    TitleMatch best = TitleMatch::None;
    std::vector<size_t> shortlist;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto &c = candidates[i];
        if (!author_matches(key.author, c)) {
            CY_LOG("match", "excluded (author): " << describe_candidate(c));
            continue;
        }
        const TitleMatch tm = title_match(key.title, c.title);
        if (tm == TitleMatch::None) {
            CY_LOG("match", "excluded (title): " << describe_candidate(c));
            continue;
        }
        if (tm > best) {
            best = tm;
            shortlist.clear();
        }
        if (tm == best) {
            shortlist.push_back(i);
        }
    }
    return shortlist;
}

Result<size_t> select_work(const IdentityKey &key, const std::vector<CatalogWork> &candidates,
                           std::optional<int64_t> duration_hint_ms) {
    const auto shortlist = shortlist_candidates(key, candidates);
    if (shortlist.empty()) {
        return make_failure<size_t>(make_error(
            ErrorKind::NoMatch,
            "no catalog work by '" + key.author + "' titled '" + key.title + "' among " +
                std::to_string(candidates.size()) + " candidate(s)",
            describe_candidates(candidates)));
    }
    if (shortlist.size() == 1 || !duration_hint_ms) {
        CY_LOG("match", "selected " << describe_candidate(candidates[shortlist.front()])
                                    << " (provider order among " << shortlist.size() << ")");
        return make_result(shortlist.front());
    }

    // Duration tie-break; unknown totals rank behind every known total.
    constexpr int64_t kUnknown = std::numeric_limits<int64_t>::max();
    auto distance = [&](size_t idx) {
        const int64_t total = candidates[idx].nominal_total_ms();
        if (total <= 0) {
            return kUnknown;
        }
        return total > *duration_hint_ms ? total - *duration_hint_ms : *duration_hint_ms - total;
    };
    std::vector<std::pair<int64_t, size_t>> ranked;
    ranked.reserve(shortlist.size());
    for (size_t idx : shortlist) {
        ranked.emplace_back(distance(idx), idx);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto &a, const auto &b) { return a.first < b.first; });
    if (ranked[0].first == ranked[1].first) {
        std::vector<CatalogWork> tied;
        for (const auto &r : ranked) {
            if (r.first == ranked[0].first) {
                tied.push_back(candidates[r.second]);
            }
        }
        return make_failure<size_t>(make_error(
            ErrorKind::AmbiguousMatch,
            std::to_string(tied.size()) + " candidates for '" + key.title +
                "' are equally close to the file duration of " +
                std::to_string(*duration_hint_ms) + "ms",
            describe_candidates(tied)));
    }
    CY_LOG("match", "selected " << describe_candidate(candidates[ranked[0].second])
                                << " (closest to " << *duration_hint_ms << "ms)");
    return make_result(ranked[0].second);
}

}  // namespace chaptify
