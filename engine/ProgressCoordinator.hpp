// Aggregates byte counters of concurrently running file units into one
// throttled progress signal with a smoothed speed and a stable file name.
#pragma once
#include "EngineConfig.hpp"
#include "TransferTypes.hpp"

#include <QString>
#include <functional>
#include <map>
#include <mutex>

class ProgressCoordinator {
public:
    using Emitter = std::function<void(const TransferProgressEvent &)>;
    using MsClock = std::function<qint64()>;

    // `emitter` is invoked with the coordinator lock held, so events reach it
    // in order; it must not call back into the coordinator. `clock` defaults
    // to a monotonic millisecond clock.
    ProgressCoordinator(QString transferKey, QString connectionId,
                        int totalFiles, quint64 totalBytes,
                        const EngineConfig &cfg, Emitter emitter,
                        MsClock clock = MsClock());

    void registerFile(const QString &id, const QString &name,
                      quint64 totalBytes);
    // Absolute byte count for the file. Counters never move backwards.
    void updateFile(const QString &id, quint64 transferredBytes);
    // Credits any remainder so the aggregate reaches the declared total.
    void completeFile(const QString &id);
    void setFileCounts(int successfulFiles, int failedFiles);

    // Forces the aggregate to the total and emits the final 100% event.
    void finalize(const QString &error = QString());
    // Final event of a cancelled transfer; progress stays where it was.
    void reportCancelled();
    // Final event of a transfer that could not run.
    void reportFailed(const QString &error);

    quint64 transferredBytes() const;
    quint64 totalBytes() const;
    double speed() const;
    QString displayedFile() const;
    int lastProgress() const;
    int completedFiles() const;

private:
    struct FileState {
        QString name;
        quint64 total = 0;
        quint64 transferred = 0;
        bool completed = false;
        quint64 activity = 0; // larger = more recent
    };

    const QString key_;
    const QString connectionId_;
    const int totalFiles_;
    const quint64 totalBytes_;
    const qint64 intervalMs_;
    const double smoothing_;
    const qint64 lockMs_;
    Emitter emit_;
    MsClock clock_;

    mutable std::mutex mtx_;
    std::map<QString, FileState> files_;
    quint64 overall_ = 0;
    int completed_ = 0;
    int successful_ = 0;
    int failed_ = 0;
    quint64 activitySeq_ = 0;

    qint64 lastReportMs_ = 0;
    bool reportedOnce_ = false;
    qint64 lastSampleMs_ = 0;
    quint64 lastSampleBytes_ = 0;
    double speed_ = 0.0;
    double remaining_ = 0.0;
    int lastProgress_ = 0;
    bool finished_ = false;

    QString displayedId_;
    qint64 displayLockUntil_ = 0;

    void maybeReportLocked(bool force);
    void reportLocked(qint64 now);
    void updateSpeedLocked(qint64 now);
    const FileState *selectDisplayLocked(qint64 now, QString &name);
    TransferProgressEvent baseEventLocked() const;
    void emitTerminalLocked(TransferProgressEvent ev);
};
