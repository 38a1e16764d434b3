#include "OperationQueue.hpp"
#include "SessionPool.hpp"
#include "openxfer/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <algorithm>
Q_LOGGING_CATEGORY(ocQueue, "openxfer.queue")

const char *queueOpTypeName(QueueOpType type) {
    switch (type) {
    case QueueOpType::List:
        return "list";
    case QueueOpType::Readdir:
        return "readdir";
    case QueueOpType::Stat:
        return "stat";
    case QueueOpType::Mkdir:
        return "mkdir";
    case QueueOpType::Rename:
        return "rename";
    case QueueOpType::Delete:
        return "delete";
    }
    return "unknown";
}

const char *queuePriorityName(QueuePriority priority) {
    switch (priority) {
    case QueuePriority::Low:
        return "low";
    case QueuePriority::Normal:
        return "normal";
    case QueuePriority::High:
        return "high";
    }
    return "unknown";
}

static OperationFuture readyResult(openxfer::ErrorKind kind,
                                   const std::string &message) {
    std::promise<OperationResult> p;
    OperationResult r;
    r.error.set(kind, message);
    p.set_value(std::move(r));
    return p.get_future().share();
}

static std::string loggable(const QString &path) {
    return openxfer::loggablePath(path.toStdString());
}

OperationQueue::OperationQueue(SessionPool &pool, const EngineConfig &cfg)
    : pool_(pool), cfg_(cfg) {}

OperationQueue::~OperationQueue() {
    std::vector<QString> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : lanes_)
            ids.push_back(kv.first);
    }
    for (const auto &id : ids)
        closeConnection(id);
}

int OperationQueue::rankOf(QueuePriority priority) const {
    switch (priority) {
    case QueuePriority::High:
        return cfg_.priorityHigh;
    case QueuePriority::Low:
        return cfg_.priorityLow;
    case QueuePriority::Normal:
        break;
    }
    return cfg_.priorityNormal;
}

OperationFuture OperationQueue::enqueue(const QString &connectionId,
                                        const QueueRequest &request,
                                        OperationWork work) {
    if (connectionId.isEmpty() || request.path.isEmpty() || !work)
        return readyResult(openxfer::ErrorKind::InvalidArgument,
                           "Queue entry requires connection, path and work");

    std::lock_guard<std::mutex> lk(mtx_);
    auto &slot = lanes_[connectionId];
    if (!slot) {
        slot = std::make_unique<Lane>();
        Lane *lane = slot.get();
        lane->worker = std::thread(
            [this, connectionId, lane]() { workerLoop(connectionId, lane); });
    }
    Lane &lane = *slot;
    if (lane.stopping)
        return readyResult(openxfer::ErrorKind::Cancelled,
                           "Connection is closing");

    const auto notBefore = Clock::now() + request.delay;
    const int rank = rankOf(request.priority);
    if (request.mergeable) {
        for (auto &e : lane.pending) {
            if (e.mergeable && e.type == request.type &&
                e.path == request.path) {
                // Keep the stronger scheduling constraints of both requests.
                if (rank > e.rank) {
                    e.rank = rank;
                    e.priority = request.priority;
                }
                e.notBefore = std::min(e.notBefore, notBefore);
                ++e.subscribers;
                qCInfo(ocQueue) << "Merged" << queueOpTypeName(request.type)
                                << "path=" << loggable(request.path).c_str()
                                << "subscribers=" << e.subscribers;
                lane.cv.notify_one();
                return e.future;
            }
        }
    }

    Entry e;
    e.seq = nextSeq_++;
    e.type = request.type;
    e.path = request.path;
    e.priority = request.priority;
    e.rank = rank;
    e.mergeable = request.mergeable;
    e.notBefore = notBefore;
    e.work = std::move(work);
    e.promise = std::make_shared<std::promise<OperationResult>>();
    e.future = e.promise->get_future().share();
    OperationFuture future = e.future;
    qCDebug(ocQueue) << "Enqueued" << queueOpTypeName(e.type)
                     << "priority=" << queuePriorityName(e.priority)
                     << "path=" << loggable(e.path).c_str()
                     << "pending=" << (lane.pending.size() + 1);
    lane.pending.push_back(std::move(e));
    lane.cv.notify_one();
    return future;
}

void OperationQueue::workerLoop(QString connectionId, Lane *lane) {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!lane->stopping) {
        const auto now = Clock::now();
        auto best = lane->pending.end();
        auto wakeAt = Clock::time_point::max();
        for (auto it = lane->pending.begin(); it != lane->pending.end(); ++it) {
            if (it->notBefore > now) {
                wakeAt = std::min(wakeAt, it->notBefore);
                continue;
            }
            if (best == lane->pending.end() || it->rank > best->rank ||
                (it->rank == best->rank && it->seq < best->seq))
                best = it;
        }
        if (best == lane->pending.end()) {
            if (wakeAt == Clock::time_point::max())
                lane->cv.wait(lk);
            else
                lane->cv.wait_until(lk, wakeAt);
            continue;
        }

        Entry entry = std::move(*best);
        lane->pending.erase(best);
        lane->running = true;
        lk.unlock();

        OperationResult result = execute(connectionId, entry);
        entry.promise->set_value(std::move(result));

        lk.lock();
        lane->running = false;
        idleCv_.notify_all();
    }
}

OperationResult OperationQueue::execute(const QString &connectionId,
                                        const Entry &entry) {
    OperationResult result;
    auto session = pool_.acquirePrimary(connectionId, result.error);
    if (!session)
        return result;
    result.ok = entry.work(*session, result);
    if (result.ok || !SessionPool::isFaultError(result.error))
        return result;

    qCWarning(ocQueue) << queueOpTypeName(entry.type)
                       << "hit a transport fault; recovering primary"
                       << "connection=" << connectionId
                       << "error=" << openxfer::describe(result.error).c_str();
    openxfer::SftpError recoverErr;
    if (!pool_.recoverPrimary(connectionId, recoverErr))
        return result;
    session = pool_.acquirePrimary(connectionId, recoverErr);
    if (!session)
        return result;
    OperationResult retry;
    retry.ok = entry.work(*session, retry);
    return retry;
}

OperationFuture OperationQueue::readdir(const QString &connectionId,
                                        const QString &path,
                                        QueuePriority priority,
                                        bool mergeable) {
    const std::string p = path.toStdString();
    return enqueue(connectionId,
                   QueueRequest(QueueOpType::Readdir, path, priority, mergeable),
                   [p](openxfer::SftpClient &s, OperationResult &r) {
                       return s.list(p, r.entries, r.error);
                   });
}

OperationFuture OperationQueue::stat(const QString &connectionId,
                                     const QString &path,
                                     QueuePriority priority) {
    const std::string p = path.toStdString();
    return enqueue(connectionId,
                   QueueRequest(QueueOpType::Stat, path, priority, true),
                   [p](openxfer::SftpClient &s, OperationResult &r) {
                       return s.stat(p, r.info, r.error);
                   });
}

OperationFuture OperationQueue::mkdir(const QString &connectionId,
                                      const QString &path,
                                      QueuePriority priority) {
    const std::string p = path.toStdString();
    return enqueue(
        connectionId, QueueRequest(QueueOpType::Mkdir, path, priority, true),
        [p](openxfer::SftpClient &s, OperationResult &r) {
            if (s.mkdir(p, r.error))
                return true;
            if (openxfer::isTransportFault(r.error.kind))
                return false;
            // Servers disagree on the status for an existing path; look.
            openxfer::FileInfo info;
            openxfer::SftpError statErr;
            if (!s.stat(p, info, statErr))
                return false;
            if (!info.is_dir) {
                r.error.set(openxfer::ErrorKind::NotADirectory,
                            "Path exists and is not a directory");
                return false;
            }
            r.info = info;
            r.error.clear();
            return true;
        });
}

OperationFuture OperationQueue::rename(const QString &connectionId,
                                       const QString &from, const QString &to,
                                       bool overwrite) {
    const std::string src = from.toStdString();
    const std::string dst = to.toStdString();
    return enqueue(connectionId, QueueRequest(QueueOpType::Rename, from),
                   [src, dst, overwrite](openxfer::SftpClient &s,
                                         OperationResult &r) {
                       return s.rename(src, dst, r.error, overwrite);
                   });
}

OperationFuture OperationQueue::remove(const QString &connectionId,
                                       const QString &path, bool isDir) {
    const std::string p = path.toStdString();
    return enqueue(connectionId, QueueRequest(QueueOpType::Delete, path),
                   [p, isDir](openxfer::SftpClient &s, OperationResult &r) {
                       return isDir ? s.removeDir(p, r.error)
                                    : s.removeFile(p, r.error);
                   });
}

int OperationQueue::clearPendingForConnection(const QString &connectionId,
                                              const QString &reason) {
    std::vector<Entry> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = lanes_.find(connectionId);
        if (it == lanes_.end())
            return 0;
        dropped.swap(it->second->pending);
        idleCv_.notify_all();
    }
    const std::string why = reason.isEmpty()
                                ? std::string("Operation cancelled")
                                : reason.toStdString();
    for (auto &e : dropped) {
        OperationResult r;
        r.error.set(openxfer::ErrorKind::Cancelled, why);
        e.promise->set_value(std::move(r));
    }
    if (!dropped.empty())
        qCInfo(ocQueue) << "Cleared pending operations"
                        << "connection=" << connectionId
                        << "count=" << dropped.size()
                        << "reason=" << reason;
    return static_cast<int>(dropped.size());
}

void OperationQueue::closeConnection(const QString &connectionId) {
    clearPendingForConnection(connectionId, QStringLiteral("Connection closed"));
    std::unique_ptr<Lane> lane;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = lanes_.find(connectionId);
        if (it == lanes_.end())
            return;
        it->second->stopping = true;
        it->second->cv.notify_all();
        lane = std::move(it->second);
        lanes_.erase(it);
        idleCv_.notify_all();
    }
    if (lane->worker.joinable())
        lane->worker.join();
    // Anything enqueued between the clear and the stop.
    for (auto &e : lane->pending) {
        OperationResult r;
        r.error.set(openxfer::ErrorKind::Cancelled, "Connection closed");
        e.promise->set_value(std::move(r));
    }
}

std::vector<PendingOperation>
OperationQueue::pending(const QString &connectionId) const {
    std::vector<PendingOperation> out;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lanes_.find(connectionId);
    if (it == lanes_.end())
        return out;
    std::vector<const Entry *> sorted;
    for (const auto &e : it->second->pending)
        sorted.push_back(&e);
    std::sort(sorted.begin(), sorted.end(), [](const Entry *a, const Entry *b) {
        if (a->rank != b->rank)
            return a->rank > b->rank;
        return a->seq < b->seq;
    });
    for (const Entry *e : sorted)
        out.push_back(
            {e->type, e->path, e->priority, e->mergeable, e->subscribers});
    return out;
}

bool OperationQueue::waitIdle(const QString &connectionId,
                              std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return idleCv_.wait_for(lk, timeout, [&] {
        auto it = lanes_.find(connectionId);
        return it == lanes_.end() ||
               (it->second->pending.empty() && !it->second->running);
    });
}
