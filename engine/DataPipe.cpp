#include "DataPipe.hpp"
#include <QLoggingCategory>
#include <vector>
Q_LOGGING_CATEGORY(ocPipe, "openxfer.transfer.pipe")

void StreamHandle::destroy(openxfer::ErrorKind kind, const QString &reason) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (destroyed_.load() || !session_)
        return;
    reason_.set(kind, reason.toStdString());
    destroyed_.store(true);
    qCInfo(ocPipe) << "Destroying stream" << name_
                   << "kind=" << openxfer::errorKindName(kind)
                   << "reason=" << reason;
    // Under the lock so detach() cannot overlap the interrupt.
    session_->interrupt();
}

void StreamHandle::detach() {
    std::lock_guard<std::mutex> lk(mtx_);
    session_.reset();
}

openxfer::SftpError StreamHandle::destroyError() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reason_;
}

NoProgressWatchdog::NoProgressWatchdog(std::chrono::milliseconds timeout,
                                       std::function<void()> onExpire)
    : timeout_(timeout), onExpire_(std::move(onExpire)),
      lastKick_(Clock::now()) {
    thread_ = std::thread([this]() { run(); });
}

NoProgressWatchdog::~NoProgressWatchdog() { stop(); }

void NoProgressWatchdog::kick() {
    std::lock_guard<std::mutex> lk(mtx_);
    lastKick_ = Clock::now();
}

void NoProgressWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

void NoProgressWatchdog::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopped_) {
        const auto deadline = lastKick_ + timeout_;
        if (Clock::now() >= deadline) {
            fired_.store(true);
            lk.unlock();
            onExpire_();
            return;
        }
        cv_.wait_until(lk, deadline);
    }
}

DataPipe::DataPipe(StreamHandlePtr handle, std::size_t chunkSize,
                   std::chrono::milliseconds noProgressTimeout)
    : handle_(std::move(handle)), chunkSize_(chunkSize ? chunkSize : 1),
      timeout_(noProgressTimeout) {}

bool DataPipe::failFromHandle(openxfer::SftpError &err) const {
    if (!handle_->destroyed())
        return false;
    err = handle_->destroyError();
    return true;
}

bool DataPipe::run(const PipeRead &read, const PipeWrite &write,
                   const PipeChunk &onChunk, quint64 &moved,
                   openxfer::SftpError &err) {
    moved = 0;
    StreamHandlePtr handle = handle_;
    const auto timeout = timeout_;
    NoProgressWatchdog watchdog(timeout_, [handle, timeout]() {
        handle->destroy(openxfer::ErrorKind::NoProgress,
                        QStringLiteral("No progress for %1 ms")
                            .arg(static_cast<qint64>(timeout.count())));
    });

    std::vector<char> buf(chunkSize_);
    for (;;) {
        if (failFromHandle(err))
            return false;
        const long long n = read(buf.data(), buf.size(), err);
        if (n < 0) {
            failFromHandle(err);
            return false;
        }
        if (n == 0)
            break;
        std::size_t off = 0;
        while (off < static_cast<std::size_t>(n)) {
            const long long w =
                write(buf.data() + off, static_cast<std::size_t>(n) - off, err);
            if (w < 0) {
                failFromHandle(err);
                return false;
            }
            if (w == 0) {
                if (!failFromHandle(err))
                    err.set(openxfer::ErrorKind::UnexpectedEof,
                            "Sink accepted no bytes");
                return false;
            }
            off += static_cast<std::size_t>(w);
            watchdog.kick();
        }
        moved += static_cast<quint64>(n);
        if (onChunk && !onChunk(static_cast<quint64>(n))) {
            err.set(openxfer::ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
    }
    watchdog.stop();
    return !failFromHandle(err);
}
