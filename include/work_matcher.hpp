//
//  work_matcher.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "identity.hpp"
#include "status.hpp"

namespace chaptify {

/// Title relation between query and candidate; higher is better.
enum class TitleMatch { None = 0, Partial = 1, Exact = 2 };

/**
 * @brief True when a candidate author names the query author.
 *
 * Compared on normalized tokens: identical sequences, or a rotation of the query tokens
 * ("Jones, Diana Wynne" vs. "Diana Wynne Jones"). Each entry of `authors` is tried on its own,
 * then all of them joined (multi-author queries).
 */
bool author_matches(const std::string &query_author, const CatalogWork &candidate);

/// Exact when normalized titles are equal; Partial when one starts with the other on a word
/// boundary (e.g. an "Unabridged" suffix); None otherwise.
TitleMatch title_match(const std::string &query_title, const std::string &candidate_title);

/**
 * @brief Indices of the candidates in the best title tier among author matches, in provider
 * order. Empty when no candidate passes the author filter with at least a partial title.
 */
std::vector<size_t> shortlist_candidates(const IdentityKey &key,
                                         const std::vector<CatalogWork> &candidates);

/**
 * @brief Select exactly one candidate.
 *
 * Authors filter, titles rank. Inside the best title tier, a duration hint picks the candidate
 * whose nominal track total is closest to it; without a hint the first candidate in provider
 * order wins. Fails with NoMatch on an empty shortlist, and with AmbiguousMatch when a hint is
 * given but the best candidates cannot be told apart by it (equal distance, or unknown totals).
 * Failure details list the candidates.
 */
Result<size_t> select_work(const IdentityKey &key, const std::vector<CatalogWork> &candidates,
                           std::optional<int64_t> duration_hint_ms = std::nullopt);

}  // namespace chaptify
