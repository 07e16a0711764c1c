//
//  status.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace subforge {

/// @ingroup api
/// Failure categories surfaced by the public API. `None` only appears on success.
enum class ErrorKind {
    None,
    Validation,         ///< bad size, extension, content type or request shape
    UnsupportedFormat,  ///< unknown source/target format
    Parse,              ///< grammar failure or zero usable captions
    Serialization,      ///< build failure for a valid document
    BatchSize,          ///< item count over the per-call cap
    UpstreamFormat,     ///< optimizer returned non-conforming output
    UpstreamAuth,       ///< credential rejected by the provider
    Upstream,           ///< any other provider or transport failure
    RateLimit,          ///< admission window exceeded
    Cancelled,          ///< caller cancelled the request
};

/**
 * @brief Result object with success flag, error kind and optional message.
 *
 * When `ok == true`, `kind` is `None` and `message` is empty. On failure, `message`
 * contains a short, human-readable description.
 */
struct Status {
    bool ok{false};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

inline Status ok_status() { return Status{true, ErrorKind::None, {}}; }

inline Status make_error(ErrorKind kind, std::string msg) {
    return Status{false, kind, std::move(msg)};
}

// Stable identifier used in structured failure responses ("validation", "parse", ...).
const char *error_kind_name(ErrorKind kind);

// HTTP-style status code a hosting layer should answer with for the given kind.
int error_kind_http_status(ErrorKind kind);

}  // namespace subforge
