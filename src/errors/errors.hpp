#pragma once

#include <string>
#include <utility>

namespace agentrun::errors {

enum class ErrorKind {
    kNone,
    kValidation,
    kNotFound,
    kUpstreamFetch,
    kExecutionTimeout,
    kExecution,
    kUnsupportedAgent,
    kQueueFull,
    kProxyAuth,
    kProxyUpstreamTimeout,
    kProxyUpstreamUnreachable,
    kProxyUpstreamStatus,
    kInternal
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kValidation: return "validation_error";
        case ErrorKind::kNotFound: return "not_found";
        case ErrorKind::kUpstreamFetch: return "upstream_fetch_error";
        case ErrorKind::kExecutionTimeout: return "execution_timeout";
        case ErrorKind::kExecution: return "execution_error";
        case ErrorKind::kUnsupportedAgent: return "unsupported_agent";
        case ErrorKind::kQueueFull: return "queue_full";
        case ErrorKind::kProxyAuth: return "proxy_auth_error";
        case ErrorKind::kProxyUpstreamTimeout: return "proxy_upstream_timeout";
        case ErrorKind::kProxyUpstreamUnreachable: return "proxy_upstream_unreachable";
        case ErrorKind::kProxyUpstreamStatus: return "proxy_upstream_status";
        case ErrorKind::kInternal: return "internal_error";
    }
    return "unknown";
}

// HTTP status class used when an error crosses an HTTP surface.
inline int HttpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return 200;
        case ErrorKind::kValidation: return 400;
        case ErrorKind::kNotFound: return 404;
        case ErrorKind::kProxyAuth: return 401;
        case ErrorKind::kUnsupportedAgent: return 422;
        case ErrorKind::kQueueFull: return 503;
        case ErrorKind::kProxyUpstreamTimeout: return 504;
        case ErrorKind::kUpstreamFetch:
        case ErrorKind::kProxyUpstreamUnreachable: return 502;
        case ErrorKind::kExecutionTimeout:
        case ErrorKind::kExecution:
        case ErrorKind::kProxyUpstreamStatus:
        case ErrorKind::kInternal: return 500;
    }
    return 500;
}

struct Error {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::kNone; }
};

inline Error MakeError(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

}  // namespace agentrun::errors
