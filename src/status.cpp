//
//  status.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "status.hpp"

namespace chaptify {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "OK";
        case ErrorKind::Identity:
            return "IdentityError";
        case ErrorKind::CatalogTransient:
            return "CatalogError{transient}";
        case ErrorKind::CatalogNotFound:
            return "CatalogError{notFound}";
        case ErrorKind::CatalogUnauthorized:
            return "CatalogError{unauthorized}";
        case ErrorKind::CatalogMalformed:
            return "CatalogError{malformed}";
        case ErrorKind::NoMatch:
            return "NoMatchError";
        case ErrorKind::AmbiguousMatch:
            return "AmbiguousMatchError";
        case ErrorKind::UnresolvableTimecodes:
            return "UnresolvableTimecodesError";
        case ErrorKind::DurationMismatch:
            return "DurationMismatchError";
        case ErrorKind::Probe:
            return "ProbeError";
        case ErrorKind::Remux:
            return "RemuxError";
        case ErrorKind::Config:
            return "ConfigError";
    }
    return "UnknownError";
}

std::string describe(const Status &status) {
    std::string out = error_kind_name(status.kind);
    if (!status.message.empty()) {
        out += ": ";
        out += status.message;
    }
    return out;
}

}  // namespace chaptify
