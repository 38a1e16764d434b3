#include "openxfer/SftpError.hpp"

namespace openxfer {

bool isTransportFault(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectionReset:
    case ErrorKind::BrokenPipe:
    case ErrorKind::UnexpectedEof:
    case ErrorKind::ChannelClosed:
    case ErrorKind::Timeout:
    case ErrorKind::NoProgress:
    case ErrorKind::NotConnected:
        return true;
    default:
        return false;
    }
}

bool isRetryable(ErrorKind kind) { return isTransportFault(kind); }

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::PermissionDenied:
        return "permission-denied";
    case ErrorKind::NotADirectory:
        return "not-a-directory";
    case ErrorKind::AlreadyExists:
        return "already-exists";
    case ErrorKind::InvalidArgument:
        return "invalid-argument";
    case ErrorKind::LocalIo:
        return "local-io";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::Other:
        return "other";
    case ErrorKind::ConnectionReset:
        return "connection-reset";
    case ErrorKind::BrokenPipe:
        return "broken-pipe";
    case ErrorKind::UnexpectedEof:
        return "unexpected-eof";
    case ErrorKind::ChannelClosed:
        return "channel-closed";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::NoProgress:
        return "no-progress";
    case ErrorKind::NotConnected:
        return "not-connected";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::string describe(const SftpError &err) {
    if (err.message.empty())
        return errorKindName(err.kind);
    return std::string(errorKindName(err.kind)) + ": " + err.message;
}

} // namespace openxfer
