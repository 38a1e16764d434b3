// Facade over the session pool, operation queue, registry and orchestrator.
// Transfers run on worker threads; events are emitted as Qt signals from
// those threads.
#pragma once
#include "EngineConfig.hpp"
#include "OperationQueue.hpp"
#include "SessionPool.hpp"
#include "TransferOrchestrator.hpp"
#include "TransferRegistry.hpp"
#include "TransferTypes.hpp"

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

class TransferEngine : public QObject {
    Q_OBJECT
public:
    explicit TransferEngine(const EngineConfig &cfg = EngineConfig(),
                            QObject *parent = nullptr);
    ~TransferEngine();

    // Registers the connection's primary session (connecting it if needed).
    bool connectSession(const QString &connectionId,
                        std::unique_ptr<openxfer::SftpClient> client,
                        const openxfer::SessionOptions &opt,
                        openxfer::SftpError &err);
    // Cancels the connection's transfers, drops its queue and closes every
    // session.
    void disconnectSession(const QString &connectionId);

    // Each start call returns the transfer key immediately, or an empty
    // string when the connection is unknown.
    QString startDownload(const QString &connectionId, const QString &remotePath,
                          const QString &localPath);
    QString startUpload(const QString &connectionId, const QString &targetDir,
                        const QStringList &localPaths);
    QString startFolderUpload(const QString &connectionId,
                              const QString &localFolder,
                              const QString &targetDir);
    QString startFolderDownload(const QString &connectionId,
                                const QString &remoteFolder,
                                const QString &localDir);

    // Blocks until the transfer has finished and hands its result to the
    // caller, which consumes it. False on timeout, unknown key or a result
    // already claimed. At most kMaxUnclaimedResults results are kept for
    // transfers nobody waits on.
    bool waitForTransfer(const QString &key, int timeoutMs,
                         TransferResult *result = nullptr);
    static constexpr std::size_t kMaxUnclaimedResults = 64;
    std::size_t unclaimedResults();

    // Cancels the transfer (falling back to the connection's first transfer
    // when the key is unknown), drops pending queue work and schedules a
    // refresh of the transfer's working directory. False if nothing matched.
    bool cancelTransfer(const QString &connectionId, const QString &key);
    // Cancels every transfer of the connection. Returns how many.
    int cleanupTransfersForConnection(const QString &connectionId);

    // Queued metadata operations on the primary session.
    OperationFuture listDirectory(const QString &connectionId,
                                  const QString &path,
                                  QueuePriority priority = QueuePriority::Normal);
    OperationFuture statPath(const QString &connectionId, const QString &path);
    OperationFuture makeDirectory(const QString &connectionId,
                                  const QString &path);
    OperationFuture renamePath(const QString &connectionId, const QString &from,
                               const QString &to, bool overwrite = false);
    OperationFuture removePath(const QString &connectionId, const QString &path,
                               bool isDir);
    bool ensureRemoteDirectory(const QString &connectionId,
                               const QString &remoteDir,
                               openxfer::SftpError &err);

    const EngineConfig &config() const { return cfg_; }
    SessionPool &sessionPool() { return pool_; }
    OperationQueue &operationQueue() { return queue_; }
    TransferRegistry &registry() { return registry_; }

signals:
    void transferProgress(const TransferProgressEvent &event);
    void syncStatus(const SyncStatusEvent &event);
    void transferFinished(const TransferResult &result);
    void directoryRefreshed(const QString &connectionId, const QString &path,
                            const RemoteEntries &entries);

private:
    const EngineConfig cfg_;
    SessionPool pool_;
    OperationQueue queue_;
    TransferRegistry registry_;
    TransferOrchestrator orchestrator_;

    std::mutex jobsMtx_;
    std::condition_variable jobsCv_;
    std::map<QString, std::thread> jobs_;
    std::map<QString, TransferResult> finished_;
    std::deque<QString> finishedOrder_;
    std::atomic<quint64> nextSeq_{1};
    std::set<QString> connections_;

    QString makeKey(const QString &connectionId, TransferKind kind);
    QString launch(const TransferPtr &t,
                   std::function<TransferResult(const TransferPtr &)> job);
    void scheduleRefresh(const QString &connectionId, const QString &path);
    void reapFinishedLocked();
};
