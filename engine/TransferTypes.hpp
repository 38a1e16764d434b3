// Value types exchanged between the engine and its collaborators: transfer
// kinds and states, UI events, and batch results.
#pragma once
#include "openxfer/SftpError.hpp"
#include "openxfer/SftpTypes.hpp"

#include <QMetaType>
#include <QString>
#include <QVector>
#include <vector>

enum class TransferKind {
    Download,
    Upload,
    UploadMultiFile,
    UploadFolder,
    DownloadFolder
};

// queued -> scanning (folders only) -> transferring -> terminal state
enum class TransferState {
    Queued,
    Scanning,
    Transferring,
    Completed,
    Cancelled,
    Failed
};

const char *transferKindName(TransferKind kind);
const char *transferStateName(TransferState state);
bool isUploadKind(TransferKind kind);

// Payload for the progress sink.
struct TransferProgressEvent {
    QString transferKey;
    QString connectionId;
    int progress = 0; // 0..100
    QString fileName;
    quint64 transferredBytes = 0;
    quint64 totalBytes = 0;
    double transferSpeed = 0.0; // bytes/s, smoothed
    double remainingTime = 0.0; // seconds
    int processedFiles = 0;
    int totalFiles = 0;
    bool operationComplete = false;
    int successfulFiles = 0;
    int failedFiles = 0;
    bool cancelled = false;
    QString error;
};

// Payload for the sync-status sink (state machine transitions).
struct SyncStatusEvent {
    QString transferKey;
    QString connectionId;
    TransferState state = TransferState::Queued;
    QString message;
};

struct FileFailure {
    QString path;
    openxfer::SftpError error;
};

struct TransferResult {
    QString key;
    TransferKind kind = TransferKind::Download;
    // Cancellation is success-shaped: success && cancelled.
    bool success = false;
    bool cancelled = false;
    int successfulFiles = 0;
    int failedFiles = 0;
    QVector<FileFailure> failures;
    quint64 transferredBytes = 0;
    quint64 totalBytes = 0;
    int concurrency = 0;
    // Set when the whole batch could not run (or a single file failed).
    openxfer::SftpError error;
};

using RemoteEntries = std::vector<openxfer::FileInfo>;

Q_DECLARE_METATYPE(TransferProgressEvent)
Q_DECLARE_METATYPE(SyncStatusEvent)
Q_DECLARE_METATYPE(TransferResult)
Q_DECLARE_METATYPE(RemoteEntries)
