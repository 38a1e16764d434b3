// Per-connection priority queue for metadata operations. Every entry runs
// exclusively against the connection's primary session, on one worker thread
// per connection.
#pragma once
#include "EngineConfig.hpp"
#include "openxfer/SftpClient.hpp"

#include <QString>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class SessionPool;

enum class QueueOpType { List, Readdir, Stat, Mkdir, Rename, Delete };
enum class QueuePriority { Low, Normal, High };

const char *queueOpTypeName(QueueOpType type);
const char *queuePriorityName(QueuePriority priority);

struct OperationResult {
    bool ok = false;
    openxfer::SftpError error;
    std::vector<openxfer::FileInfo> entries; // list/readdir
    openxfer::FileInfo info;                 // stat
};

using OperationFuture = std::shared_future<OperationResult>;
// Runs on the primary session. Returns ok and fills result.error on failure.
using OperationWork =
    std::function<bool(openxfer::SftpClient &, OperationResult &)>;

struct QueueRequest {
    QueueOpType type;
    QString path;
    QueuePriority priority = QueuePriority::Normal;
    // Pending entries with the same (type, path) share one execution.
    bool mergeable = false;
    // Not runnable before this delay elapses; later entries are not blocked.
    std::chrono::milliseconds delay{0};

    QueueRequest(QueueOpType t, QString p,
                 QueuePriority prio = QueuePriority::Normal, bool merge = false,
                 std::chrono::milliseconds notBefore =
                     std::chrono::milliseconds(0))
        : type(t), path(std::move(p)), priority(prio), mergeable(merge),
          delay(notBefore) {}
};

struct PendingOperation {
    QueueOpType type;
    QString path;
    QueuePriority priority;
    bool mergeable;
    int subscribers;
};

class OperationQueue {
public:
    OperationQueue(SessionPool &pool, const EngineConfig &cfg);
    ~OperationQueue();

    OperationQueue(const OperationQueue &) = delete;
    OperationQueue &operator=(const OperationQueue &) = delete;

    // Schedules `work`. Higher priority runs first; equal priority runs in
    // arrival order. A transport fault re-establishes the primary session
    // and re-runs the work once.
    OperationFuture enqueue(const QString &connectionId,
                            const QueueRequest &request, OperationWork work);

    OperationFuture readdir(const QString &connectionId, const QString &path,
                            QueuePriority priority = QueuePriority::Normal,
                            bool mergeable = true);
    OperationFuture stat(const QString &connectionId, const QString &path,
                         QueuePriority priority = QueuePriority::Normal);
    // Succeeds when the directory already exists; NotADirectory when the
    // path exists as something else.
    OperationFuture mkdir(const QString &connectionId, const QString &path,
                          QueuePriority priority = QueuePriority::Normal);
    OperationFuture rename(const QString &connectionId, const QString &from,
                           const QString &to, bool overwrite = false);
    OperationFuture remove(const QString &connectionId, const QString &path,
                           bool isDir);

    // Resolves every not-yet-started entry with Cancelled and `reason`.
    // Entries already executing are left alone. Returns the number dropped.
    int clearPendingForConnection(const QString &connectionId,
                                  const QString &reason);
    // Drops pending entries and stops the connection's worker.
    void closeConnection(const QString &connectionId);

    std::vector<PendingOperation> pending(const QString &connectionId) const;
    // Blocks until the connection has nothing pending or running.
    bool waitIdle(const QString &connectionId,
                  std::chrono::milliseconds timeout) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        quint64 seq = 0;
        QueueOpType type = QueueOpType::Stat;
        QString path;
        QueuePriority priority = QueuePriority::Normal;
        int rank = 0;
        bool mergeable = false;
        int subscribers = 1;
        Clock::time_point notBefore;
        OperationWork work;
        std::shared_ptr<std::promise<OperationResult>> promise;
        OperationFuture future;
    };

    struct Lane {
        std::vector<Entry> pending;
        bool running = false;
        bool stopping = false;
        std::condition_variable cv;
        std::thread worker;
    };

    SessionPool &pool_;
    const EngineConfig &cfg_;
    mutable std::mutex mtx_;
    mutable std::condition_variable idleCv_;
    std::map<QString, std::unique_ptr<Lane>> lanes_;
    quint64 nextSeq_ = 1;

    int rankOf(QueuePriority priority) const;
    void workerLoop(QString connectionId, Lane *lane);
    OperationResult execute(const QString &connectionId, const Entry &entry);
};
