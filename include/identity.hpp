//
//  identity.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "metadata_set.hpp"
#include "status.hpp"

namespace chaptify {

/// Normalized (author, title) lookup key. Both fields are non-empty.
struct IdentityKey {
    std::string author;
    std::string title;
};

/**
 * @brief Case-fold ASCII, drop apostrophes, turn other punctuation into blanks and collapse
 * whitespace. Non-ASCII UTF-8 sequences pass through unchanged (except U+2019, treated as an
 * apostrophe).
 */
std::string normalize_name(std::string_view text);

/// Split a normalized name into its blank-separated tokens.
std::vector<std::string> name_tokens(std::string_view normalized);

/**
 * @brief Derive the identity of an audiobook file.
 *
 * Embedded tags win when both author and title are present. Otherwise the file stem is parsed as
 * `[<prefix>] <author> - <title>`; the bracketed prefix is optional and the split happens on the
 * first " - " only. Fails with ErrorKind::Identity when neither source yields both fields.
 */
Result<IdentityKey> extract_identity(const std::string &path, const MetadataSet &tags);

/// @overload filename only.
Result<IdentityKey> extract_identity(const std::string &path);

}  // namespace chaptify
