// Closed error taxonomy produced by the session backends. Retry and recovery
// decisions are taken on ErrorKind, never on message wording.
#pragma once
#include <string>

namespace openxfer {

enum class ErrorKind {
    None,
    // Application errors: surfaced immediately, never retried.
    NotFound,
    PermissionDenied,
    NotADirectory,
    AlreadyExists,
    InvalidArgument,
    LocalIo,
    Protocol,
    Other,
    // Transport faults: the session is suspect and the operation may be
    // re-issued on a fresh session.
    ConnectionReset,
    BrokenPipe,
    UnexpectedEof,
    ChannelClosed,
    Timeout,
    NoProgress,
    NotConnected,
    // User cancellation; not a failure.
    Cancelled
};

struct SftpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    SftpError() = default;
    SftpError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool empty() const { return kind == ErrorKind::None; }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
};

// True for faults that invalidate the session (reset, broken pipe, EOF,
// channel closed, timeout, watchdog, not connected).
bool isTransportFault(ErrorKind kind);

// Faults worth another attempt on a fresh session. Cancellation and
// application errors are never retryable.
bool isRetryable(ErrorKind kind);

const char *errorKindName(ErrorKind kind);

// "<kind>: <message>" for logs and user-facing error strings.
std::string describe(const SftpError &err);

} // namespace openxfer
