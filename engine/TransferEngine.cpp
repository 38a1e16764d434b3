#include "TransferEngine.hpp"
#include "RemotePath.hpp"
#include "openxfer/RuntimeLogging.hpp"
#include <QDateTime>
#include <QLoggingCategory>
#include <algorithm>
#include <chrono>
Q_LOGGING_CATEGORY(ocEngine, "openxfer.engine")

TransferEngine::TransferEngine(const EngineConfig &cfg, QObject *parent)
    : QObject(parent), cfg_(cfg), pool_(cfg_), queue_(pool_, cfg_),
      orchestrator_(
          pool_, queue_, cfg_,
          [this](const TransferProgressEvent &ev) { emit transferProgress(ev); },
          [this](const SyncStatusEvent &ev) { emit syncStatus(ev); }) {
    qRegisterMetaType<TransferProgressEvent>("TransferProgressEvent");
    qRegisterMetaType<SyncStatusEvent>("SyncStatusEvent");
    qRegisterMetaType<TransferResult>("TransferResult");
    qRegisterMetaType<RemoteEntries>("RemoteEntries");
}

TransferEngine::~TransferEngine() {
    std::set<QString> conns;
    {
        std::lock_guard<std::mutex> lk(jobsMtx_);
        conns = connections_;
    }
    for (const QString &c : conns)
        cleanupTransfersForConnection(c);
    std::map<QString, std::thread> jobs;
    {
        std::lock_guard<std::mutex> lk(jobsMtx_);
        jobs.swap(jobs_);
    }
    for (auto &kv : jobs)
        if (kv.second.joinable())
            kv.second.join();
    // Queue workers may still emit refresh signals; stop them while this
    // object is intact.
    for (const QString &c : conns) {
        queue_.closeConnection(c);
        pool_.closeConnection(c);
    }
}

bool TransferEngine::connectSession(const QString &connectionId,
                                    std::unique_ptr<openxfer::SftpClient> client,
                                    const openxfer::SessionOptions &opt,
                                    openxfer::SftpError &err) {
    if (connectionId.isEmpty() || !client) {
        err.set(openxfer::ErrorKind::InvalidArgument,
                "Connection id and session are required");
        return false;
    }
    if (!pool_.openConnection(connectionId, std::move(client), opt, err)) {
        qCWarning(ocEngine) << "Connect failed" << connectionId
                            << openxfer::describe(err).c_str();
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(jobsMtx_);
        connections_.insert(connectionId);
    }
    qCInfo(ocEngine) << "Connection ready" << connectionId << "host="
                     << openxfer::loggableHost(opt.host).c_str();
    return true;
}

void TransferEngine::disconnectSession(const QString &connectionId) {
    const int cancelled = cleanupTransfersForConnection(connectionId);
    queue_.closeConnection(connectionId);
    pool_.closeConnection(connectionId);
    {
        std::lock_guard<std::mutex> lk(jobsMtx_);
        connections_.erase(connectionId);
    }
    qCInfo(ocEngine) << "Connection closed" << connectionId
                     << "cancelledTransfers=" << cancelled;
}

QString TransferEngine::makeKey(const QString &connectionId, TransferKind kind) {
    return QStringLiteral("%1-%2-%3-%4")
        .arg(connectionId)
        .arg(QString::fromLatin1(transferKindName(kind)))
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(nextSeq_.fetch_add(1));
}

void TransferEngine::reapFinishedLocked() {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (finished_.count(it->first)) {
            if (it->second.joinable())
                it->second.join();
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
    // Every remaining result belongs to a joined thread; drop the oldest
    // ones nobody waited for.
    while (finished_.size() > kMaxUnclaimedResults && !finishedOrder_.empty()) {
        finished_.erase(finishedOrder_.front());
        finishedOrder_.pop_front();
    }
}

std::size_t TransferEngine::unclaimedResults() {
    std::lock_guard<std::mutex> lk(jobsMtx_);
    return finished_.size();
}

QString
TransferEngine::launch(const TransferPtr &t,
                       std::function<TransferResult(const TransferPtr &)> job) {
    if (!pool_.hasConnection(t->connectionId())) {
        qCWarning(ocEngine) << "Transfer rejected, unknown connection"
                            << t->connectionId();
        return QString();
    }
    if (!registry_.registerTransfer(t)) {
        qCWarning(ocEngine) << "Duplicate transfer key" << t->key();
        return QString();
    }
    qCInfo(ocEngine) << "Transfer queued" << t->key()
                     << "kind=" << transferKindName(t->kind());
    emit syncStatus(SyncStatusEvent{t->key(), t->connectionId(),
                                    TransferState::Queued, QString()});

    std::lock_guard<std::mutex> lk(jobsMtx_);
    reapFinishedLocked();
    jobs_[t->key()] = std::thread([this, t, job]() {
        TransferResult result = job(t);
        result.key = t->key();
        result.kind = t->kind();
        registry_.remove(t->key());
        qCInfo(ocEngine) << "Transfer finished" << t->key()
                         << "success=" << result.success
                         << "cancelled=" << result.cancelled
                         << "ok=" << result.successfulFiles
                         << "failed=" << result.failedFiles;
        emit transferFinished(result);
        {
            std::lock_guard<std::mutex> lk2(jobsMtx_);
            finished_[t->key()] = result;
            finishedOrder_.push_back(t->key());
        }
        jobsCv_.notify_all();
    });
    return t->key();
}

QString TransferEngine::startDownload(const QString &connectionId,
                                      const QString &remotePath,
                                      const QString &localPath) {
    auto t = std::make_shared<ActiveTransfer>(
        makeKey(connectionId, TransferKind::Download), connectionId,
        TransferKind::Download, remotePath, localPath,
        RemotePath::parent(remotePath));
    return launch(t, [this, remotePath, localPath](const TransferPtr &tr) {
        return orchestrator_.download(tr, remotePath, localPath);
    });
}

QString TransferEngine::startUpload(const QString &connectionId,
                                    const QString &targetDir,
                                    const QStringList &localPaths) {
    const TransferKind kind = localPaths.size() > 1
                                  ? TransferKind::UploadMultiFile
                                  : TransferKind::Upload;
    auto t = std::make_shared<ActiveTransfer>(
        makeKey(connectionId, kind), connectionId, kind,
        localPaths.join(QLatin1Char(';')), targetDir, targetDir);
    return launch(t, [this, localPaths, targetDir](const TransferPtr &tr) {
        return orchestrator_.upload(tr, localPaths, targetDir);
    });
}

QString TransferEngine::startFolderUpload(const QString &connectionId,
                                          const QString &localFolder,
                                          const QString &targetDir) {
    auto t = std::make_shared<ActiveTransfer>(
        makeKey(connectionId, TransferKind::UploadFolder), connectionId,
        TransferKind::UploadFolder, localFolder, targetDir, targetDir);
    return launch(t, [this, localFolder, targetDir](const TransferPtr &tr) {
        return orchestrator_.uploadFolder(tr, localFolder, targetDir);
    });
}

QString TransferEngine::startFolderDownload(const QString &connectionId,
                                            const QString &remoteFolder,
                                            const QString &localDir) {
    auto t = std::make_shared<ActiveTransfer>(
        makeKey(connectionId, TransferKind::DownloadFolder), connectionId,
        TransferKind::DownloadFolder, remoteFolder, localDir,
        RemotePath::parent(remoteFolder));
    return launch(t, [this, remoteFolder, localDir](const TransferPtr &tr) {
        return orchestrator_.downloadFolder(tr, remoteFolder, localDir);
    });
}

bool TransferEngine::waitForTransfer(const QString &key, int timeoutMs,
                                     TransferResult *result) {
    std::unique_lock<std::mutex> lk(jobsMtx_);
    if (!jobs_.count(key) && !finished_.count(key))
        return false;
    // A concurrent waiter may claim the result first.
    jobsCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] {
        return finished_.count(key) > 0 || !jobs_.count(key);
    });
    auto done = finished_.find(key);
    if (done == finished_.end())
        return false;
    if (result)
        *result = done->second;
    finished_.erase(done);
    finishedOrder_.erase(
        std::remove(finishedOrder_.begin(), finishedOrder_.end(), key),
        finishedOrder_.end());
    auto it = jobs_.find(key);
    if (it != jobs_.end()) {
        if (it->second.joinable())
            it->second.join();
        jobs_.erase(it);
    }
    jobsCv_.notify_all();
    return true;
}

bool TransferEngine::cancelTransfer(const QString &connectionId,
                                    const QString &key) {
    TransferPtr t = registry_.cancel(key, connectionId);
    if (!t)
        return false;
    const int dropped = queue_.clearPendingForConnection(
        t->connectionId(), QStringLiteral("Transfer cancelled"));
    qCInfo(ocEngine) << "Cancel requested" << t->key()
                     << "droppedQueueEntries=" << dropped;
    if (!t->workingPath().isEmpty())
        scheduleRefresh(t->connectionId(), t->workingPath());
    return true;
}

int TransferEngine::cleanupTransfersForConnection(const QString &connectionId) {
    int count = 0;
    for (const QString &key : registry_.keysForConnection(connectionId)) {
        if (registry_.cancel(key, QString(),
                             QStringLiteral("Connection closed")))
            ++count;
    }
    queue_.clearPendingForConnection(connectionId,
                                     QStringLiteral("Connection closed"));
    if (count > 0)
        qCInfo(ocEngine) << "Cleaned up transfers" << connectionId
                         << "count=" << count;
    return count;
}

void TransferEngine::scheduleRefresh(const QString &connectionId,
                                     const QString &path) {
    const std::string remote = path.toStdString();
    QueueRequest req(QueueOpType::Readdir, path, QueuePriority::High, true,
                     std::chrono::milliseconds(cfg_.refreshDelayMs));
    queue_.enqueue(connectionId, req,
                   [this, connectionId, path,
                    remote](openxfer::SftpClient &c, OperationResult &r) {
                       if (!c.list(remote, r.entries, r.error))
                           return false;
                       emit directoryRefreshed(connectionId, path, r.entries);
                       return true;
                   });
}

OperationFuture TransferEngine::listDirectory(const QString &connectionId,
                                              const QString &path,
                                              QueuePriority priority) {
    return queue_.readdir(connectionId, path, priority);
}

OperationFuture TransferEngine::statPath(const QString &connectionId,
                                         const QString &path) {
    return queue_.stat(connectionId, path);
}

OperationFuture TransferEngine::makeDirectory(const QString &connectionId,
                                              const QString &path) {
    return queue_.mkdir(connectionId, path);
}

OperationFuture TransferEngine::renamePath(const QString &connectionId,
                                           const QString &from,
                                           const QString &to, bool overwrite) {
    return queue_.rename(connectionId, from, to, overwrite);
}

OperationFuture TransferEngine::removePath(const QString &connectionId,
                                           const QString &path, bool isDir) {
    return queue_.remove(connectionId, path, isDir);
}

bool TransferEngine::ensureRemoteDirectory(const QString &connectionId,
                                           const QString &remoteDir,
                                           openxfer::SftpError &err) {
    return orchestrator_.ensureRemoteDirectory(connectionId, remoteDir, err);
}
