// Tracks in-flight transfers by key and cancels them cooperatively.
#pragma once
#include "CancelToken.hpp"
#include "DataPipe.hpp"
#include "TransferTypes.hpp"

#include <QString>
#include <QStringList>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

class ActiveTransfer {
public:
    ActiveTransfer(QString key, QString connectionId, TransferKind kind,
                   QString source, QString target, QString workingPath);

    const QString &key() const { return key_; }
    const QString &connectionId() const { return connectionId_; }
    TransferKind kind() const { return kind_; }
    const QString &source() const { return source_; }
    const QString &target() const { return target_; }
    // Remote directory refreshed after a cancellation.
    const QString &workingPath() const { return workingPath_; }
    const CancelTokenPtr &token() const { return token_; }
    bool cancelled() const { return token_->isCancelled(); }

    std::atomic<quint64> totalBytes{0};

    TransferState state() const;
    void setState(TransferState state);

    // A stream added after cancellation is destroyed immediately.
    void addStream(const StreamHandlePtr &stream);
    // Also detaches the stream from its session.
    void removeStream(const StreamHandlePtr &stream);
    int destroyStreams(openxfer::ErrorKind kind, const QString &reason);
    int activeStreams() const;

private:
    const QString key_;
    const QString connectionId_;
    const TransferKind kind_;
    const QString source_;
    const QString target_;
    const QString workingPath_;
    CancelTokenPtr token_;

    mutable std::mutex mtx_;
    TransferState state_ = TransferState::Queued;
    std::vector<StreamHandlePtr> streams_;
};

using TransferPtr = std::shared_ptr<ActiveTransfer>;

class TransferRegistry {
public:
    // False when the key is already registered.
    bool registerTransfer(const TransferPtr &transfer);
    TransferPtr get(const QString &key) const;
    // Marks the transfer cancelled, destroys its active streams and removes
    // it. When `key` is not registered, the first transfer of `connectionId`
    // (key prefix and owning connection both match) is cancelled instead. Returns the cancelled
    // transfer, or null when nothing matched.
    TransferPtr cancel(const QString &key,
                       const QString &connectionId = QString(),
                       const QString &reason = QStringLiteral(
                           "Transfer cancelled"));
    bool remove(const QString &key);
    QStringList keysForConnection(const QString &connectionId) const;
    int size() const;

private:
    mutable std::mutex mtx_;
    std::map<QString, TransferPtr> transfers_;
};
