#include "EngineConfig.hpp"
#include <QSettings>
#include <QtGlobal>
#include <algorithm>

void EngineConfig::load(QSettings &s) {
    maxIdleSessions =
        qMax(0, s.value("Session/maxIdleSessions", maxIdleSessions).toInt());
    sessionCreateAttempts = qMax(
        1, s.value("Session/createAttempts", sessionCreateAttempts).toInt());
    sessionCreateBackoffMs = qMax(
        0, s.value("Session/createBackoffMs", sessionCreateBackoffMs).toInt());

    defaultUploadConcurrency = qBound(
        1, s.value("Transfer/uploadConcurrency", defaultUploadConcurrency).toInt(),
        64);
    defaultDownloadConcurrency =
        qBound(1,
               s.value("Transfer/downloadConcurrency", defaultDownloadConcurrency)
                   .toInt(),
               64);
    highConcurrency =
        qBound(1, s.value("Transfer/highConcurrency", highConcurrency).toInt(), 64);
    mediumConcurrency = qBound(
        1, s.value("Transfer/mediumConcurrency", mediumConcurrency).toInt(), 64);
    lowConcurrency =
        qBound(1, s.value("Transfer/lowConcurrency", lowConcurrency).toInt(), 64);
    manyFilesThreshold = qMax(
        1, s.value("Transfer/manyFilesThreshold", manyFilesThreshold).toInt());

    watchdogMs = qMax(1000, s.value("Transfer/noProgressTimeoutMs", watchdogMs).toInt());
    watchdogLargeMs = qMax(
        watchdogMs,
        s.value("Transfer/noProgressTimeoutLargeMs", watchdogLargeMs).toInt());

    maxAttempts = qBound(1, s.value("Transfer/maxAttempts", maxAttempts).toInt(), 10);
    retryBaseDelayMs =
        qMax(0, s.value("Transfer/retryBaseDelayMs", retryBaseDelayMs).toInt());
    refreshDelayMs =
        qMax(0, s.value("Transfer/refreshDelayMs", refreshDelayMs).toInt());

    progressIntervalMs =
        qMax(10, s.value("Progress/intervalMs", progressIntervalMs).toInt());
    speedSmoothing =
        qBound(0.01, s.value("Progress/smoothing", speedSmoothing).toDouble(), 1.0);
    displayLockMs =
        qMax(0, s.value("Progress/displayLockMs", displayLockMs).toInt());
}

std::size_t EngineConfig::chooseChunkSize(std::uint64_t totalBytes) const {
    if (totalBytes == 0)
        return mediumChunkSize;
    if (totalBytes <= smallFileThreshold)
        return smallChunkSize;
    if (totalBytes <= mediumFileThreshold)
        return mediumChunkSize;
    return largeChunkSize;
}

int EngineConfig::chooseConcurrency(int fileCount, std::uint64_t totalBytes,
                                    bool isUpload) const {
    if (fileCount <= 1)
        return 1;
    const int base =
        isUpload ? defaultUploadConcurrency : defaultDownloadConcurrency;
    const std::uint64_t avg = totalBytes / static_cast<std::uint64_t>(fileCount);
    int chosen = base;
    if (fileCount >= manyFilesThreshold && avg <= smallFileThreshold)
        chosen = highConcurrency;
    else if (avg > mediumFileThreshold)
        chosen = lowConcurrency;
    else if (avg > smallFileThreshold)
        chosen = mediumConcurrency;
    return std::max(1, std::min(chosen, fileCount));
}

int EngineConfig::noProgressTimeoutMs(std::uint64_t fileSize) const {
    return fileSize > mediumFileThreshold ? watchdogLargeMs : watchdogMs;
}

int EngineConfig::retryDelayMs(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    long long delay = retryBaseDelayMs;
    for (int i = 1; i < attempt; ++i)
        delay *= retryMultiplier;
    return static_cast<int>(std::min<long long>(delay, 5 * 60 * 1000));
}
