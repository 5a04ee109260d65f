//
//  status.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chaptify {

/// Failure taxonomy shared by every pipeline stage.
enum class ErrorKind {
    None = 0,
    Identity,
    CatalogTransient,
    CatalogNotFound,
    CatalogUnauthorized,
    CatalogMalformed,
    NoMatch,
    AmbiguousMatch,
    UnresolvableTimecodes,
    DurationMismatch,
    Probe,
    Remux,
    Config,
};

/// Stable, user-facing name of an error kind (e.g. `CatalogError{transient}`).
const char *error_kind_name(ErrorKind kind);

/**
 * @brief Result status with a typed failure kind.
 *
 * When `ok()`, `message` and `details` are empty. On failure, `message` is a one-line reason and
 * `details` may carry diagnosis lines (candidate lists, child process stderr).
 */
struct Status {
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::vector<std::string> details;

    bool ok() const { return kind == ErrorKind::None; }
};

inline Status ok_status() { return Status{}; }

inline Status make_error(ErrorKind kind, std::string message,
                         std::vector<std::string> details = {}) {
    return Status{kind, std::move(message), std::move(details)};
}

/// Value plus status; `value` is meaningful only when `status.ok()`.
template <typename T>
struct Result {
    Status status;
    T value{};

    bool ok() const { return status.ok(); }
};

template <typename T>
Result<T> make_result(T value) {
    return Result<T>{ok_status(), std::move(value)};
}

template <typename T>
Result<T> make_failure(Status status) {
    Result<T> r;
    r.status = std::move(status);
    return r;
}

// "<Kind>: <message>" as printed by the CLI.
std::string describe(const Status &status);

}  // namespace chaptify
