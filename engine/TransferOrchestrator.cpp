// Transfer orchestration. Metadata goes through the operation queue; file
// data goes straight to borrowed sessions so browsing is never stuck behind
// a large transfer.
#include "TransferOrchestrator.hpp"
#include "DataPipe.hpp"
#include "RemotePath.hpp"
#include "openxfer/RuntimeLogging.hpp"
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSet>
#include <QTimeZone>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
Q_LOGGING_CATEGORY(ocXfer, "openxfer.transfer")

static std::string loggable(const QString &path) {
    return openxfer::loggablePath(path.toStdString());
}

static QString partPathFor(const QString &localPath) {
    return localPath + QStringLiteral(".part");
}

TransferOrchestrator::TransferOrchestrator(SessionPool &pool,
                                           OperationQueue &queue,
                                           const EngineConfig &cfg,
                                           ProgressSink progress,
                                           StatusSink status)
    : pool_(pool), queue_(queue), cfg_(cfg),
      progressSink_(std::move(progress)), statusSink_(std::move(status)) {}

ProgressCoordinator::Emitter TransferOrchestrator::progressEmitter() const {
    ProgressSink sink = progressSink_;
    return [sink](const TransferProgressEvent &ev) {
        if (sink)
            sink(ev);
    };
}

void TransferOrchestrator::setState(const TransferPtr &t, TransferState state,
                                    const QString &message) {
    // Once cancelled, only the cancelled state is published.
    if (t->cancelled() && state != TransferState::Cancelled)
        return;
    t->setState(state);
    qCInfo(ocXfer) << "Transfer state" << t->key() << transferStateName(state);
    if (statusSink_)
        statusSink_(SyncStatusEvent{t->key(), t->connectionId(), state, message});
}

TransferResult TransferOrchestrator::abortBatch(const TransferPtr &t,
                                                TransferResult result,
                                                const openxfer::SftpError &err) {
    ProgressCoordinator progress(t->key(), t->connectionId(), 0, 0, cfg_,
                                 progressEmitter());
    if (t->cancelled())
        return finishCancelled(t, progress, std::move(result));
    result.success = false;
    result.error = err;
    const QString msg = QString::fromStdString(openxfer::describe(err));
    qCWarning(ocXfer) << "Transfer aborted" << t->key() << msg;
    setState(t, TransferState::Failed, msg);
    progress.reportFailed(msg);
    return result;
}

TransferResult TransferOrchestrator::finishCancelled(const TransferPtr &t,
                                                     ProgressCoordinator &progress,
                                                     TransferResult result) {
    result.success = true;
    result.cancelled = true;
    result.transferredBytes = progress.transferredBytes();
    setState(t, TransferState::Cancelled, QStringLiteral("Transfer cancelled"));
    progress.reportCancelled();
    qCInfo(ocXfer) << "Transfer cancelled" << t->key()
                   << "completedFiles=" << result.successfulFiles;
    return result;
}

bool TransferOrchestrator::checkRemoteDirectory(const QString &connectionId,
                                                const QString &dir,
                                                openxfer::SftpError &err) {
    const OperationResult st = queue_.stat(connectionId, dir).get();
    if (!st.ok) {
        err = st.error;
        return false;
    }
    if (!st.info.is_dir) {
        err.set(openxfer::ErrorKind::NotADirectory,
                "Target is not a directory: " + loggable(dir));
        return false;
    }
    return true;
}

TransferResult TransferOrchestrator::download(const TransferPtr &t,
                                              const QString &remotePath,
                                              const QString &localPath) {
    TransferResult result;
    result.key = t->key();
    result.kind = t->kind();

    const OperationResult st = queue_.stat(t->connectionId(), remotePath).get();
    if (!st.ok)
        return abortBatch(t, result, st.error);
    if (st.info.is_dir)
        return abortBatch(t, result,
                          openxfer::SftpError(openxfer::ErrorKind::InvalidArgument,
                                              "Remote path is a directory"));

    QString target = localPath;
    if (QFileInfo(target).isDir())
        target = QDir(target).filePath(RemotePath::baseName(remotePath));
    const QString parentDir = QFileInfo(target).absolutePath();
    if (!QDir().mkpath(parentDir))
        return abortBatch(t, result,
                          openxfer::SftpError(openxfer::ErrorKind::LocalIo,
                                              "Cannot create local directory"));

    FileUnit unit;
    unit.id = remotePath;
    unit.name = RemotePath::baseName(remotePath);
    unit.localPath = target;
    unit.remotePath = remotePath;
    unit.totalBytes = st.info.size;
    unit.mtime = st.info.mtime;
    std::vector<FileUnit> files{unit};
    return runBatch(t, files, false, std::move(result));
}

TransferResult TransferOrchestrator::upload(const TransferPtr &t,
                                            const QStringList &localPaths,
                                            const QString &targetDir) {
    TransferResult result;
    result.key = t->key();
    result.kind = t->kind();

    openxfer::SftpError err;
    if (!checkRemoteDirectory(t->connectionId(), targetDir, err))
        return abortBatch(t, result, err);

    std::vector<FileUnit> files;
    QSet<QString> targets;
    for (const QString &path : localPaths) {
        const QFileInfo fi(path);
        const QString remotePath = RemotePath::join(targetDir, fi.fileName());
        FileFailure f;
        f.path = path;
        if (!fi.exists() || !fi.isFile()) {
            f.error.set(fi.isDir() ? openxfer::ErrorKind::InvalidArgument
                                   : openxfer::ErrorKind::NotFound,
                        fi.isDir() ? "Is a directory" : "Local file not found");
        } else if (targets.contains(remotePath)) {
            // The first source with a given name wins the target.
            f.error.set(openxfer::ErrorKind::InvalidArgument,
                        "Duplicate target name");
        }
        if (!f.error.empty()) {
            qCWarning(ocXfer) << "Skipping upload source"
                              << loggable(path).c_str()
                              << openxfer::describe(f.error).c_str();
            result.failures.push_back(f);
            ++result.failedFiles;
            continue;
        }
        targets.insert(remotePath);
        FileUnit unit;
        unit.id = fi.absoluteFilePath();
        unit.name = fi.fileName();
        unit.localPath = fi.absoluteFilePath();
        unit.remotePath = remotePath;
        unit.totalBytes = static_cast<quint64>(fi.size());
        files.push_back(unit);
    }
    if (files.empty() && result.failedFiles > 0) {
        result.error = result.failures.front().error;
        return abortBatch(t, result, result.error);
    }
    return runBatch(t, files, true, std::move(result));
}

TransferResult TransferOrchestrator::uploadFolder(const TransferPtr &t,
                                                  const QString &localFolder,
                                                  const QString &targetDir) {
    TransferResult result;
    result.key = t->key();
    result.kind = t->kind();
    setState(t, TransferState::Scanning);

    const QFileInfo rootInfo(localFolder);
    if (!rootInfo.exists() || !rootInfo.isDir())
        return abortBatch(t, result,
                          openxfer::SftpError(openxfer::ErrorKind::InvalidArgument,
                                              "Local folder not found"));
    openxfer::SftpError err;
    if (!checkRemoteDirectory(t->connectionId(), targetDir, err))
        return abortBatch(t, result, err);

    const QString rootPath = rootInfo.absoluteFilePath();
    const QString remoteRoot = RemotePath::join(targetDir, rootInfo.fileName());
    std::map<int, QStringList> byDepth;
    byDepth[0] << remoteRoot;
    std::vector<FileUnit> files;
    QDirIterator it(rootPath,
                    QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (t->cancelled())
            break;
        it.next();
        const QFileInfo fi = it.fileInfo();
        const QString rel = QDir(rootPath).relativeFilePath(fi.absoluteFilePath());
        if (fi.isDir()) {
            if (!fi.isSymLink())
                byDepth[rel.count('/') + 1] << RemotePath::join(remoteRoot, rel);
            continue;
        }
        if (!fi.isFile())
            continue;
        FileUnit unit;
        unit.id = rel;
        unit.name = fi.fileName();
        unit.localPath = fi.absoluteFilePath();
        unit.remotePath = RemotePath::join(remoteRoot, rel);
        unit.totalBytes = static_cast<quint64>(fi.size());
        files.push_back(unit);
    }
    std::sort(files.begin(), files.end(),
              [](const FileUnit &a, const FileUnit &b) { return a.id < b.id; });
    qCInfo(ocXfer) << "Scanned local folder" << loggable(rootPath).c_str()
                   << "files=" << files.size() << "levels=" << byDepth.size();

    std::vector<QStringList> levels;
    for (const auto &kv : byDepth)
        levels.push_back(kv.second);
    if (!createRemoteLevels(t, levels, err))
        return abortBatch(t, result, err);
    return runBatch(t, files, true, std::move(result));
}

TransferResult TransferOrchestrator::downloadFolder(const TransferPtr &t,
                                                    const QString &remoteFolder,
                                                    const QString &localDir) {
    TransferResult result;
    result.key = t->key();
    result.kind = t->kind();
    setState(t, TransferState::Scanning);

    openxfer::SftpError err;
    if (!checkRemoteDirectory(t->connectionId(), remoteFolder, err))
        return abortBatch(t, result, err);

    const QString localRoot =
        QDir(localDir).filePath(RemotePath::baseName(remoteFolder));
    if (!QDir().mkpath(localRoot))
        return abortBatch(t, result,
                          openxfer::SftpError(openxfer::ErrorKind::LocalIo,
                                              "Cannot create local folder"));

    QStringList dirs;
    std::vector<FileUnit> files;
    if (!scanRemote(t, RemotePath::trimmed(remoteFolder), localRoot, dirs, files,
                    err))
        return abortBatch(t, result, err);
    for (const QString &rel : dirs) {
        if (!QDir(localRoot).mkpath(rel))
            return abortBatch(t, result,
                              openxfer::SftpError(openxfer::ErrorKind::LocalIo,
                                                  "Cannot create local folder"));
    }
    return runBatch(t, files, false, std::move(result));
}

bool TransferOrchestrator::scanRemote(const TransferPtr &t,
                                      const QString &remoteRoot,
                                      const QString &localRoot,
                                      QStringList &dirs,
                                      std::vector<FileUnit> &files,
                                      openxfer::SftpError &err) {
    std::deque<QString> pending{QString()};
    while (!pending.empty()) {
        if (t->cancelled()) {
            err.set(openxfer::ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
        const QString rel = pending.front();
        pending.pop_front();
        const QString dir =
            rel.isEmpty() ? remoteRoot : RemotePath::join(remoteRoot, rel);
        const OperationResult r =
            queue_.readdir(t->connectionId(), dir, QueuePriority::Low).get();
        if (!r.ok) {
            err = r.error;
            return false;
        }
        for (const auto &e : r.entries) {
            const QString name = QString::fromStdString(e.name);
            const QString childRel = rel.isEmpty() ? name : rel + '/' + name;
            if (e.is_dir) {
                dirs << childRel;
                pending.push_back(childRel);
                continue;
            }
            FileUnit unit;
            unit.id = childRel;
            unit.name = name;
            unit.remotePath = RemotePath::join(remoteRoot, childRel);
            unit.localPath = QDir(localRoot).filePath(childRel);
            unit.totalBytes = e.size;
            unit.mtime = e.mtime;
            files.push_back(unit);
        }
    }
    std::sort(files.begin(), files.end(),
              [](const FileUnit &a, const FileUnit &b) { return a.id < b.id; });
    qCInfo(ocXfer) << "Scanned remote folder" << loggable(remoteRoot).c_str()
                   << "files=" << files.size() << "dirs=" << dirs.size();
    return true;
}

bool TransferOrchestrator::createRemoteLevels(
    const TransferPtr &t, const std::vector<QStringList> &levels,
    openxfer::SftpError &err) {
    for (const QStringList &level : levels) {
        if (t->cancelled()) {
            err.set(openxfer::ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
        // A level only depends on the previous one, so it goes out at once.
        std::vector<OperationFuture> futures;
        futures.reserve(static_cast<std::size_t>(level.size()));
        for (const QString &dir : level)
            futures.push_back(queue_.mkdir(t->connectionId(), dir));
        bool ok = true;
        for (auto &f : futures) {
            const OperationResult &r = f.get();
            if (!r.ok && ok) {
                err = r.error;
                ok = false;
            }
        }
        if (!ok)
            return false;
    }
    return true;
}

bool TransferOrchestrator::ensureRemoteDirectory(const QString &connectionId,
                                                 const QString &remoteDir,
                                                 openxfer::SftpError &err) {
    const QStringList parts = RemotePath::components(remoteDir);
    for (const QString &dir : parts) {
        const OperationResult r = queue_.mkdir(connectionId, dir).get();
        if (!r.ok) {
            err = r.error;
            return false;
        }
    }
    return true;
}

TransferResult TransferOrchestrator::runBatch(const TransferPtr &t,
                                              std::vector<FileUnit> &files,
                                              bool upload,
                                              TransferResult result) {
    quint64 total = 0;
    for (const auto &f : files)
        total += f.totalBytes;
    t->totalBytes.store(total);
    result.totalBytes = total;

    const int count = static_cast<int>(files.size());
    ProgressCoordinator progress(t->key(), t->connectionId(), count, total,
                                 cfg_, progressEmitter());
    for (const auto &f : files)
        progress.registerFile(f.id, f.name, f.totalBytes);
    progress.setFileCounts(0, result.failedFiles);

    const int workers = cfg_.chooseConcurrency(count, total, upload);
    result.concurrency = workers;
    setState(t, TransferState::Transferring);
    qCInfo(ocXfer) << "Batch start" << t->key()
                   << "kind=" << transferKindName(t->kind())
                   << "files=" << count << "bytes=" << total
                   << "workers=" << workers;

    std::atomic<std::size_t> next{0};
    std::mutex resultMtx;
    auto work = [&]() {
        for (;;) {
            if (t->cancelled())
                return;
            const std::size_t i = next.fetch_add(1);
            if (i >= files.size())
                return;
            openxfer::SftpError err;
            const bool ok = transferFile(t, files[i], upload, progress, err);
            std::lock_guard<std::mutex> lk(resultMtx);
            if (ok) {
                ++result.successfulFiles;
            } else if (!t->cancelled() &&
                       err.kind != openxfer::ErrorKind::Cancelled) {
                ++result.failedFiles;
                result.failures.push_back(
                    FileFailure{upload ? files[i].localPath : files[i].remotePath,
                                err});
                qCWarning(ocXfer) << "File failed" << t->key()
                                  << loggable(files[i].name).c_str()
                                  << openxfer::describe(err).c_str();
            }
            progress.setFileCounts(result.successfulFiles, result.failedFiles);
        }
    };
    if (workers <= 1) {
        work();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<std::size_t>(workers));
        for (int i = 0; i < workers; ++i)
            pool.emplace_back(work);
        for (auto &th : pool)
            th.join();
    }

    if (t->cancelled())
        return finishCancelled(t, progress, std::move(result));

    result.transferredBytes = progress.transferredBytes();
    result.success = result.failedFiles == 0;
    if (result.success) {
        setState(t, TransferState::Completed);
        progress.finalize();
        qCInfo(ocXfer) << "Batch complete" << t->key()
                       << "files=" << result.successfulFiles;
        return result;
    }
    if (result.error.empty())
        result.error = result.failures.size() == 1 && result.successfulFiles == 0
                           ? result.failures.front().error
                           : openxfer::SftpError(
                                 openxfer::ErrorKind::Other,
                                 std::to_string(result.failedFiles) +
                                     " file(s) failed");
    const QString msg = QString::fromStdString(openxfer::describe(result.error));
    setState(t, TransferState::Failed, msg);
    if (result.successfulFiles == 0)
        progress.reportFailed(msg);
    else
        progress.finalize(msg);
    return result;
}

bool TransferOrchestrator::resumeOffset(openxfer::SftpClient &session,
                                        const FileUnit &unit, bool upload,
                                        quint64 &offset,
                                        openxfer::SftpError &err) {
    offset = 0;
    if (!upload) {
        const QFileInfo part(partPathFor(unit.localPath));
        if (part.exists() && part.size() >= 0 &&
            static_cast<quint64>(part.size()) <= unit.totalBytes)
            offset = static_cast<quint64>(part.size());
        return true;
    }
    openxfer::FileInfo info;
    openxfer::SftpError statErr;
    if (session.stat(unit.remotePath.toStdString(), info, statErr)) {
        if (!info.is_dir && info.size <= unit.totalBytes)
            offset = info.size;
        return true;
    }
    if (openxfer::isTransportFault(statErr.kind)) {
        err = statErr;
        return false;
    }
    return true;
}

bool TransferOrchestrator::transferFile(const TransferPtr &t,
                                        const FileUnit &unit, bool upload,
                                        ProgressCoordinator &progress,
                                        openxfer::SftpError &err) {
    const QString connId = t->connectionId();
    openxfer::SftpError lastErr;
    bool cancelled = false;
    for (int attempt = 1; attempt <= cfg_.maxAttempts; ++attempt) {
        if (t->cancelled()) {
            cancelled = true;
            break;
        }
        if (attempt > 1) {
            const int delay = cfg_.retryDelayMs(attempt - 1);
            qCInfo(ocXfer) << "Retrying" << loggable(unit.name).c_str()
                           << "attempt=" << attempt << "delayMs=" << delay
                           << "after=" << openxfer::errorKindName(lastErr.kind);
            if (t->token()->waitFor(std::chrono::milliseconds(delay))) {
                cancelled = true;
                break;
            }
        }
        lastErr.clear();
        SessionPool::Lease lease = pool_.borrow(connId, lastErr, t->token().get());
        if (!lease) {
            if (t->cancelled() || lastErr.kind == openxfer::ErrorKind::Cancelled) {
                cancelled = true;
                break;
            }
            if (openxfer::isRetryable(lastErr.kind))
                continue;
            break;
        }

        quint64 offset = 0;
        bool sessionLost = false;
        bool ok = attempt == 1 ||
                  resumeOffset(*lease.session, unit, upload, offset, lastErr);
        if (ok) {
            if (offset > 0) {
                qCInfo(ocXfer) << "Resuming" << loggable(unit.name).c_str()
                               << "offset=" << offset;
                progress.updateFile(unit.id, offset);
            }
            ok = upload ? uploadOnce(t, lease.session, unit, offset, progress,
                                     sessionLost, lastErr)
                        : downloadOnce(t, lease.session, unit, offset, progress,
                                       sessionLost, lastErr);
        }
        // A stream destroyed before it was detached left its session
        // interrupted, even when every byte had already landed.
        const bool faulted =
            sessionLost ||
            (!ok && (openxfer::isTransportFault(lastErr.kind) ||
                     lastErr.kind == openxfer::ErrorKind::Cancelled));
        pool_.release(connId, lease.id, faulted);
        if (ok) {
            progress.completeFile(unit.id);
            return true;
        }
        if (t->cancelled() || lastErr.kind == openxfer::ErrorKind::Cancelled) {
            cancelled = true;
            break;
        }
        if (!openxfer::isRetryable(lastErr.kind))
            break;
        qCWarning(ocXfer) << "Transport fault on" << loggable(unit.name).c_str()
                          << "attempt=" << attempt
                          << openxfer::describe(lastErr).c_str();
    }

    if (!upload)
        QFile::remove(partPathFor(unit.localPath));
    if (cancelled) {
        err.set(openxfer::ErrorKind::Cancelled, "Transfer cancelled");
        return false;
    }
    err = lastErr.empty() ? openxfer::SftpError(openxfer::ErrorKind::Other,
                                                "Transfer failed")
                          : lastErr;
    return false;
}

bool TransferOrchestrator::downloadOnce(
    const TransferPtr &t, const std::shared_ptr<openxfer::SftpClient> &session,
    const FileUnit &unit, quint64 offset, ProgressCoordinator &progress,
    bool &sessionLost, openxfer::SftpError &err) {
    sessionLost = false;
    const QString partPath = partPathFor(unit.localPath);
    QFile part(partPath);
    QIODevice::OpenMode mode = QIODevice::WriteOnly;
    mode |= offset == 0 ? QIODevice::Truncate : QIODevice::Append;
    if (!part.open(mode)) {
        err.set(openxfer::ErrorKind::LocalIo,
                "Cannot open local file: " + part.errorString().toStdString());
        return false;
    }

    auto remote = session->openRead(unit.remotePath.toStdString(), offset, err);
    if (!remote)
        return false;
    auto handle = std::make_shared<StreamHandle>(unit.name, session);
    t->addStream(handle);

    DataPipe pipe(handle, cfg_.chooseChunkSize(unit.totalBytes),
                  std::chrono::milliseconds(
                      cfg_.noProgressTimeoutMs(unit.totalBytes)));
    quint64 done = offset;
    quint64 moved = 0;
    bool ok = pipe.run(
        [&remote](char *buf, std::size_t len, openxfer::SftpError &e) {
            return remote->read(buf, len, e);
        },
        [&part](const char *buf, std::size_t len,
                openxfer::SftpError &e) -> long long {
            const qint64 w = part.write(buf, static_cast<qint64>(len));
            if (w < 0) {
                e.set(openxfer::ErrorKind::LocalIo,
                      part.errorString().toStdString());
                return -1;
            }
            return w;
        },
        [&](quint64 n) {
            done += n;
            progress.updateFile(unit.id, done);
            return !t->cancelled();
        },
        moved, err);
    // The remote stream is closed before the session can go back to the pool.
    remote->close();
    remote.reset();
    t->removeStream(handle);
    sessionLost = handle->destroyed();
    if (!part.flush() && ok) {
        err.set(openxfer::ErrorKind::LocalIo, part.errorString().toStdString());
        ok = false;
    }
    part.close();
    if (!ok)
        return false;
    if (done < unit.totalBytes) {
        err.set(openxfer::ErrorKind::UnexpectedEof, "Remote file ended early");
        return false;
    }

    if (QFile::exists(unit.localPath) && !QFile::remove(unit.localPath)) {
        err.set(openxfer::ErrorKind::LocalIo, "Cannot replace existing file");
        return false;
    }
    if (!QFile::rename(partPath, unit.localPath)) {
        err.set(openxfer::ErrorKind::LocalIo, "Cannot rename partial file");
        return false;
    }
    if (unit.mtime > 0) {
        QFile f(unit.localPath);
        const QDateTime tsUtc = QDateTime::fromSecsSinceEpoch(
            static_cast<qint64>(unit.mtime), QTimeZone::utc());
        if (!f.open(QIODevice::Append) ||
            !f.setFileTime(tsUtc, QFileDevice::FileModificationTime)) {
            qCWarning(ocXfer) << "Failed to set mtime for"
                              << loggable(unit.localPath).c_str();
        }
    }
    return true;
}

bool TransferOrchestrator::uploadOnce(
    const TransferPtr &t, const std::shared_ptr<openxfer::SftpClient> &session,
    const FileUnit &unit, quint64 offset, ProgressCoordinator &progress,
    bool &sessionLost, openxfer::SftpError &err) {
    sessionLost = false;
    QFile src(unit.localPath);
    if (!src.open(QIODevice::ReadOnly)) {
        err.set(openxfer::ErrorKind::LocalIo,
                "Cannot open local file: " + src.errorString().toStdString());
        return false;
    }
    if (offset > 0 && !src.seek(static_cast<qint64>(offset))) {
        err.set(openxfer::ErrorKind::LocalIo, "Cannot seek local file");
        return false;
    }

    auto remote = session->openWrite(unit.remotePath.toStdString(), offset,
                                     offset == 0, err);
    if (!remote)
        return false;
    auto handle = std::make_shared<StreamHandle>(unit.name, session);
    t->addStream(handle);

    DataPipe pipe(handle, cfg_.chooseChunkSize(unit.totalBytes),
                  std::chrono::milliseconds(
                      cfg_.noProgressTimeoutMs(unit.totalBytes)));
    quint64 done = offset;
    quint64 moved = 0;
    const bool ok = pipe.run(
        [&src](char *buf, std::size_t len,
               openxfer::SftpError &e) -> long long {
            const qint64 n = src.read(buf, static_cast<qint64>(len));
            if (n < 0) {
                e.set(openxfer::ErrorKind::LocalIo,
                      src.errorString().toStdString());
                return -1;
            }
            return n;
        },
        [&remote](const char *buf, std::size_t len, openxfer::SftpError &e) {
            return remote->write(buf, len, e);
        },
        [&](quint64 n) {
            done += n;
            progress.updateFile(unit.id, done);
            return !t->cancelled();
        },
        moved, err);
    remote->close();
    remote.reset();
    t->removeStream(handle);
    sessionLost = handle->destroyed();
    return ok;
}
