//
//  identity.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "identity.hpp"

#include <cctype>
#include <filesystem>

#include "logging.hpp"

namespace chaptify {

namespace {

constexpr std::string_view kSeparator = " - ";

bool is_ascii_punct(unsigned char c) {
    return (c >= 0x21 && c <= 0x2F) || (c >= 0x3A && c <= 0x40) || (c >= 0x5B && c <= 0x60) ||
           (c >= 0x7B && c <= 0x7E);
}

bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_ascii_space(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ascii_space(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

Result<IdentityKey> make_key(std::string_view author, std::string_view title,
                             const char *source) {
    IdentityKey key{normalize_name(author), normalize_name(title)};
    if (key.author.empty() || key.title.empty()) {
        return make_failure<IdentityKey>(make_error(
            ErrorKind::Identity, std::string("author/title empty after normalization (") +
                                     source + ")"));
    }
    CY_LOG("match", "identity from " << source << ": author='" << key.author << "' title='"
                                     << key.title << "'");
    return make_result(std::move(key));
}

}  // namespace

std::string normalize_name(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_blank = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        // U+2019 RIGHT SINGLE QUOTATION MARK, the typographic apostrophe.
        if (c == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80 &&
            static_cast<unsigned char>(text[i + 2]) == 0x99) {
            i += 2;
            continue;
        }
        if (c == '\'') {
            continue;
        }
        if (is_ascii_space(c) || is_ascii_punct(c)) {
            pending_blank = !out.empty();
            continue;
        }
        if (pending_blank) {
            out.push_back(' ');
            pending_blank = false;
        }
        out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> name_tokens(std::string_view normalized) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < normalized.size()) {
        size_t end = normalized.find(' ', pos);
        if (end == std::string_view::npos) {
            end = normalized.size();
        }
        if (end > pos) {
            tokens.emplace_back(normalized.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return tokens;
}

Result<IdentityKey> extract_identity(const std::string &path, const MetadataSet &tags) {
    if (!tags.title.empty() && !tags.author().empty()) {
        auto key = make_key(tags.author(), tags.title, "tags");
        if (key.ok()) {
            return key;
        }
        CY_LOG("warn", "embedded tags unusable for " << path << ", trying filename");
    }
    return extract_identity(path);
}

Result<IdentityKey> extract_identity(const std::string &path) {
    const std::string stem = std::filesystem::path(path).stem().string();
    std::string_view rest = trim(stem);

    // Optional leading "[...] " group (series or collection tag).
    if (!rest.empty() && rest.front() == '[') {
        const size_t close = rest.find(']');
        if (close != std::string_view::npos) {
            rest = trim(rest.substr(close + 1));
        }
    }

    const size_t sep = rest.find(kSeparator);
    if (sep == std::string_view::npos) {
        return make_failure<IdentityKey>(make_error(
            ErrorKind::Identity, "no usable tags and filename '" + stem +
                                     "' does not match '<author> - <title>'"));
    }
    return make_key(trim(rest.substr(0, sep)), trim(rest.substr(sep + kSeparator.size())),
                    "filename");
}

}  // namespace chaptify
