// Tunables for the transfer engine. Defaults match the production values;
// load() applies overrides from QSettings("OpenXfer", "OpenXfer").
#pragma once
#include <cstddef>
#include <cstdint>

class QSettings;

struct EngineConfig {
    // Session pool
    int maxIdleSessions = 3; // borrowed sessions kept for reuse per connection
    int sessionCreateAttempts = 3;
    int sessionCreateBackoffMs = 500; // doubled on every failed attempt

    // Concurrency scheduler
    int defaultUploadConcurrency = 4;
    int defaultDownloadConcurrency = 4;
    std::uint64_t smallFileThreshold = 10ull * 1024 * 1024;
    std::uint64_t mediumFileThreshold = 100ull * 1024 * 1024;
    int highConcurrency = 12;
    int mediumConcurrency = 4;
    int lowConcurrency = 2;
    int manyFilesThreshold = 8;

    // Chunk sizes for the data pipe
    std::size_t smallChunkSize = 256 * 1024;
    std::size_t mediumChunkSize = 1024 * 1024;
    std::size_t largeChunkSize = 2 * 1024 * 1024;

    // No-progress watchdog
    int watchdogMs = 30000;      // files up to mediumFileThreshold
    int watchdogLargeMs = 60000; // bigger files

    // Per-file retry
    int maxAttempts = 3;
    int retryBaseDelayMs = 1000;
    int retryMultiplier = 2;

    // Operation queue priorities
    int priorityHigh = 10;
    int priorityNormal = 5;
    int priorityLow = 1;

    // Progress reporting
    int progressIntervalMs = 100;
    double speedSmoothing = 0.3;
    int displayLockMs = 1000;

    // Delay before the directory refresh that follows a cancellation
    int refreshDelayMs = 500;

    // Reads Transfer/*, Session/* and Progress/* keys. Values out of range
    // are clamped.
    void load(QSettings &s);

    std::size_t chooseChunkSize(std::uint64_t totalBytes) const;
    // Worker pool size for a batch, chosen from the average file size.
    int chooseConcurrency(int fileCount, std::uint64_t totalBytes,
                          bool isUpload) const;
    int noProgressTimeoutMs(std::uint64_t fileSize) const;
    // Backoff before retry number `attempt` (1-based).
    int retryDelayMs(int attempt) const;
};
