//
//  status.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "status.hpp"

namespace subforge {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::UnsupportedFormat:
        return "unsupported_format";
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::Serialization:
        return "serialization";
    case ErrorKind::BatchSize:
        return "batch_size";
    case ErrorKind::UpstreamFormat:
        return "upstream_format";
    case ErrorKind::UpstreamAuth:
        return "upstream_auth";
    case ErrorKind::Upstream:
        return "upstream";
    case ErrorKind::RateLimit:
        return "rate_limit";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

int error_kind_http_status(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return 200;
    case ErrorKind::Validation:
    case ErrorKind::UnsupportedFormat:
    case ErrorKind::Serialization:
    case ErrorKind::BatchSize:
        return 400;
    case ErrorKind::Parse:
        return 422;
    case ErrorKind::UpstreamAuth:
        return 401;
    case ErrorKind::RateLimit:
        return 429;
    case ErrorKind::Cancelled:
        return 499;
    case ErrorKind::UpstreamFormat:
        return 502;
    case ErrorKind::Upstream:
        return 500;
    }
    return 500;
}

}  // namespace subforge
