#include "TransferTypes.hpp"

const char *transferKindName(TransferKind kind) {
    switch (kind) {
    case TransferKind::Download:
        return "download";
    case TransferKind::Upload:
        return "upload";
    case TransferKind::UploadMultiFile:
        return "upload-multifile";
    case TransferKind::UploadFolder:
        return "upload-folder";
    case TransferKind::DownloadFolder:
        return "download-folder";
    }
    return "unknown";
}

const char *transferStateName(TransferState state) {
    switch (state) {
    case TransferState::Queued:
        return "queued";
    case TransferState::Scanning:
        return "scanning";
    case TransferState::Transferring:
        return "transferring";
    case TransferState::Completed:
        return "completed";
    case TransferState::Cancelled:
        return "cancelled";
    case TransferState::Failed:
        return "failed";
    }
    return "unknown";
}

bool isUploadKind(TransferKind kind) {
    return kind == TransferKind::Upload ||
           kind == TransferKind::UploadMultiFile ||
           kind == TransferKind::UploadFolder;
}
