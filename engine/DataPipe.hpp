// Bounded-memory copy loop between a local file and a remote stream, with a
// per-file no-progress watchdog.
#pragma once
#include "openxfer/SftpClient.hpp"

#include <QString>
#include <QtGlobal>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// One active stream of a transfer. destroy() tears down the remote end by
// interrupting the session that opened it; the pipe notices and unwinds.
class StreamHandle {
public:
    StreamHandle(QString name, std::shared_ptr<openxfer::SftpClient> session)
        : name_(std::move(name)), session_(std::move(session)) {}

    // Thread-safe and idempotent; the first reason wins. No-op once detached.
    void destroy(openxfer::ErrorKind kind, const QString &reason);
    // Drops the session. Called when the stream is finished so a late
    // destroy() cannot reach a session that went back to the pool.
    void detach();
    bool destroyed() const { return destroyed_.load(); }
    openxfer::SftpError destroyError() const;
    const QString &name() const { return name_; }

private:
    QString name_;
    std::shared_ptr<openxfer::SftpClient> session_;
    std::atomic<bool> destroyed_{false};
    mutable std::mutex mtx_;
    openxfer::SftpError reason_;
};

using StreamHandlePtr = std::shared_ptr<StreamHandle>;

// Calls onExpire once if kick() is not called for `timeout`. Stops on
// destruction.
class NoProgressWatchdog {
public:
    NoProgressWatchdog(std::chrono::milliseconds timeout,
                       std::function<void()> onExpire);
    ~NoProgressWatchdog();

    void kick();
    void stop();
    bool fired() const { return fired_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    std::chrono::milliseconds timeout_;
    std::function<void()> onExpire_;
    std::mutex mtx_;
    std::condition_variable cv_;
    Clock::time_point lastKick_;
    bool stopped_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;

    void run();
};

using PipeRead =
    std::function<long long(char *, std::size_t, openxfer::SftpError &)>;
using PipeWrite =
    std::function<long long(const char *, std::size_t, openxfer::SftpError &)>;
// Called after each chunk lands; returning false stops the pipe (Cancelled).
using PipeChunk = std::function<bool(quint64 chunkBytes)>;

class DataPipe {
public:
    DataPipe(StreamHandlePtr handle, std::size_t chunkSize,
             std::chrono::milliseconds noProgressTimeout);

    // Moves bytes until the source reports EOF. `moved` counts bytes written
    // to the sink. When the handle was destroyed, err carries its reason
    // instead of the I/O error it provoked.
    bool run(const PipeRead &read, const PipeWrite &write,
             const PipeChunk &onChunk, quint64 &moved,
             openxfer::SftpError &err);

private:
    StreamHandlePtr handle_;
    std::size_t chunkSize_;
    std::chrono::milliseconds timeout_;

    bool failFromHandle(openxfer::SftpError &err) const;
};
