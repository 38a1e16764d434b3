#include "ProgressCoordinator.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <chrono>
Q_LOGGING_CATEGORY(ocProgress, "openxfer.progress")

static qint64 steadyMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

ProgressCoordinator::ProgressCoordinator(QString transferKey,
                                         QString connectionId, int totalFiles,
                                         quint64 totalBytes,
                                         const EngineConfig &cfg,
                                         Emitter emitter, MsClock clock)
    : key_(std::move(transferKey)), connectionId_(std::move(connectionId)),
      totalFiles_(totalFiles), totalBytes_(totalBytes),
      intervalMs_(cfg.progressIntervalMs), smoothing_(cfg.speedSmoothing),
      lockMs_(cfg.displayLockMs), emit_(std::move(emitter)),
      clock_(clock ? std::move(clock) : MsClock(steadyMs)) {
    lastSampleMs_ = clock_();
}

void ProgressCoordinator::registerFile(const QString &id, const QString &name,
                                       quint64 totalBytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    FileState f;
    f.name = name;
    f.total = totalBytes;
    f.activity = ++activitySeq_;
    files_[id] = f;
}

void ProgressCoordinator::updateFile(const QString &id,
                                     quint64 transferredBytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(id);
    if (it == files_.end()) {
        qCWarning(ocProgress) << "Update for unknown file unit" << id;
        return;
    }
    FileState &f = it->second;
    if (f.completed || transferredBytes <= f.transferred)
        return;
    overall_ += transferredBytes - f.transferred;
    f.transferred = transferredBytes;
    f.activity = ++activitySeq_;
    // Completion is left to completeFile(): a file at full size may still
    // fail its rename or close.
    maybeReportLocked(false);
}

void ProgressCoordinator::completeFile(const QString &id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(id);
    if (it == files_.end())
        return;
    FileState &f = it->second;
    if (!f.completed) {
        if (f.total > f.transferred) {
            overall_ += f.total - f.transferred;
            f.transferred = f.total;
        }
        f.completed = true;
        ++completed_;
        f.activity = ++activitySeq_;
    }
    if (displayedId_ == id) {
        displayedId_.clear();
        displayLockUntil_ = 0;
    }
    maybeReportLocked(true);
}

void ProgressCoordinator::setFileCounts(int successfulFiles, int failedFiles) {
    std::lock_guard<std::mutex> lk(mtx_);
    successful_ = successfulFiles;
    failed_ = failedFiles;
}

void ProgressCoordinator::finalize(const QString &error) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (finished_)
        return;
    overall_ = totalBytes_;
    completed_ = totalFiles_;
    lastProgress_ = 100;
    speed_ = 0.0;
    remaining_ = 0.0;
    TransferProgressEvent ev = baseEventLocked();
    ev.progress = 100;
    ev.fileName = QStringLiteral("Transfer complete");
    ev.error = error;
    emitTerminalLocked(ev);
}

void ProgressCoordinator::reportCancelled() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (finished_)
        return;
    speed_ = 0.0;
    remaining_ = 0.0;
    TransferProgressEvent ev = baseEventLocked();
    ev.fileName = QStringLiteral("Transfer cancelled");
    ev.cancelled = true;
    emitTerminalLocked(ev);
}

void ProgressCoordinator::reportFailed(const QString &error) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (finished_)
        return;
    speed_ = 0.0;
    remaining_ = 0.0;
    TransferProgressEvent ev = baseEventLocked();
    ev.fileName = QStringLiteral("Transfer failed");
    ev.error = error;
    emitTerminalLocked(ev);
}

quint64 ProgressCoordinator::transferredBytes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return overall_;
}

quint64 ProgressCoordinator::totalBytes() const { return totalBytes_; }

double ProgressCoordinator::speed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return speed_;
}

QString ProgressCoordinator::displayedFile() const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(displayedId_);
    return it == files_.end() ? QString() : it->second.name;
}

int ProgressCoordinator::lastProgress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastProgress_;
}

int ProgressCoordinator::completedFiles() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_;
}

void ProgressCoordinator::maybeReportLocked(bool force) {
    if (finished_)
        return;
    const qint64 now = clock_();
    if (!force && reportedOnce_ && now - lastReportMs_ < intervalMs_)
        return;
    reportLocked(now);
}

void ProgressCoordinator::updateSpeedLocked(qint64 now) {
    const qint64 elapsed = now - lastSampleMs_;
    if (elapsed <= 0 || elapsed < intervalMs_)
        return;
    const double instant =
        double(overall_ - lastSampleBytes_) * 1000.0 / double(elapsed);
    if (speed_ == 0.0)
        speed_ = instant;
    else
        speed_ = smoothing_ * instant + (1.0 - smoothing_) * speed_;
    const quint64 left = totalBytes_ > overall_ ? totalBytes_ - overall_ : 0;
    remaining_ = speed_ > 0.0 ? double(left) / speed_ : 0.0;
    lastSampleMs_ = now;
    lastSampleBytes_ = overall_;
}

const ProgressCoordinator::FileState *
ProgressCoordinator::selectDisplayLocked(qint64 now, QString &name) {
    if (!displayedId_.isEmpty() && now < displayLockUntil_) {
        auto it = files_.find(displayedId_);
        if (it != files_.end() && !it->second.completed) {
            name = it->second.name;
            return &it->second;
        }
    }
    const FileState *best = nullptr;
    QString bestId;
    for (const auto &kv : files_) {
        if (kv.second.completed)
            continue;
        if (!best || kv.second.activity > best->activity) {
            best = &kv.second;
            bestId = kv.first;
        }
    }
    if (!best) {
        displayedId_.clear();
        displayLockUntil_ = 0;
        return nullptr;
    }
    displayedId_ = bestId;
    displayLockUntil_ = now + lockMs_;
    name = best->name;
    return best;
}

void ProgressCoordinator::reportLocked(qint64 now) {
    updateSpeedLocked(now);
    QString name;
    if (!selectDisplayLocked(now, name))
        name = QStringLiteral("Transferring...");
    int progress = 0;
    if (totalBytes_ > 0)
        progress = static_cast<int>(
            std::min<quint64>(100, overall_ * 100 / totalBytes_));
    lastProgress_ = std::max(lastProgress_, progress);

    TransferProgressEvent ev = baseEventLocked();
    ev.fileName = name;
    lastReportMs_ = now;
    reportedOnce_ = true;
    if (emit_)
        emit_(ev);
}

TransferProgressEvent ProgressCoordinator::baseEventLocked() const {
    TransferProgressEvent ev;
    ev.transferKey = key_;
    ev.connectionId = connectionId_;
    ev.progress = lastProgress_;
    ev.transferredBytes = overall_;
    ev.totalBytes = totalBytes_;
    ev.transferSpeed = speed_;
    ev.remainingTime = remaining_;
    ev.processedFiles = completed_;
    ev.totalFiles = totalFiles_;
    ev.successfulFiles = successful_;
    ev.failedFiles = failed_;
    return ev;
}

void ProgressCoordinator::emitTerminalLocked(TransferProgressEvent ev) {
    ev.operationComplete = true;
    finished_ = true;
    qCInfo(ocProgress) << "Transfer progress finished" << key_
                       << "progress=" << ev.progress
                       << "cancelled=" << ev.cancelled
                       << "ok=" << ev.successfulFiles
                       << "failed=" << ev.failedFiles;
    if (emit_)
        emit_(ev);
}
