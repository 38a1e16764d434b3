// Session pool: one primary per connection plus capped idle reuse of
// borrowed sessions.
#include "SessionPool.hpp"
#include "openxfer/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <chrono>
#include <thread>
Q_LOGGING_CATEGORY(ocSession, "openxfer.session")

SessionPool::SessionPool(const EngineConfig &cfg) : cfg_(cfg) {}

SessionPool::~SessionPool() {
    std::vector<QString> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : conns_)
            ids.push_back(kv.first);
    }
    for (const auto &id : ids)
        closeConnection(id);
}

bool SessionPool::openConnection(const QString &connectionId,
                                 std::unique_ptr<openxfer::SftpClient> primary,
                                 const openxfer::SessionOptions &opt,
                                 openxfer::SftpError &err) {
    if (!primary) {
        err.set(openxfer::ErrorKind::InvalidArgument, "No session given");
        return false;
    }
    if (!primary->isConnected() && !primary->connect(opt, err)) {
        qCWarning(ocSession) << "Primary connect failed"
                             << "connection=" << connectionId
                             << "error=" << openxfer::describe(err).c_str();
        return false;
    }
    closeConnection(connectionId);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Connection c;
        c.primary = std::shared_ptr<openxfer::SftpClient>(std::move(primary));
        c.options = opt;
        conns_[connectionId] = std::move(c);
    }
    qCInfo(ocSession) << "Connection opened" << "connection=" << connectionId
                      << "host="
                      << openxfer::loggablePath(opt.host).c_str();
    return true;
}

void SessionPool::closeConnection(const QString &connectionId) {
    Connection c;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end())
            return;
        c = std::move(it->second);
        conns_.erase(it);
    }
    // Leased sessions still belong to their file unit; only abort their I/O.
    for (auto &kv : c.leased)
        kv.second->interrupt();
    for (auto &s : c.idle)
        s->disconnect();
    if (c.primary)
        c.primary->disconnect();
    qCInfo(ocSession) << "Connection closed" << "connection=" << connectionId
                      << "leased=" << c.leased.size()
                      << "idle=" << c.idle.size();
}

bool SessionPool::hasConnection(const QString &connectionId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return conns_.count(connectionId) > 0;
}

std::shared_ptr<openxfer::SftpClient>
SessionPool::acquirePrimary(const QString &connectionId,
                            openxfer::SftpError &err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end()) {
            err.set(openxfer::ErrorKind::NotConnected, "Unknown connection");
            return nullptr;
        }
        if (it->second.primary && it->second.primary->isConnected())
            return it->second.primary;
    }
    if (!recoverPrimary(connectionId, err))
        return nullptr;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = conns_.find(connectionId);
    if (it == conns_.end()) {
        err.set(openxfer::ErrorKind::NotConnected, "Connection closed");
        return nullptr;
    }
    return it->second.primary;
}

bool SessionPool::recoverPrimary(const QString &connectionId,
                                 openxfer::SftpError &err) {
    std::shared_ptr<openxfer::SftpClient> prototype;
    openxfer::SessionOptions opt;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end() || !it->second.primary) {
            err.set(openxfer::ErrorKind::NotConnected, "Unknown connection");
            return false;
        }
        prototype = it->second.primary;
        opt = it->second.options;
    }
    qCInfo(ocSession) << "Re-establishing primary session"
                      << "connection=" << connectionId;
    auto fresh = createSession(*prototype, opt, err, nullptr);
    if (!fresh) {
        qCWarning(ocSession) << "Primary recovery failed"
                             << "connection=" << connectionId
                             << "error=" << openxfer::describe(err).c_str();
        return false;
    }
    std::shared_ptr<openxfer::SftpClient> old;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end()) {
            err.set(openxfer::ErrorKind::NotConnected, "Connection closed");
            return false;
        }
        old = std::move(it->second.primary);
        it->second.primary =
            std::shared_ptr<openxfer::SftpClient>(std::move(fresh));
        ++it->second.recoveries;
    }
    // The old primary is dropped once its last user lets go.
    old->interrupt();
    return true;
}

SessionPool::Lease SessionPool::borrow(const QString &connectionId,
                                       openxfer::SftpError &err,
                                       const CancelToken *cancel) {
    Lease lease;
    std::shared_ptr<openxfer::SftpClient> prototype;
    openxfer::SessionOptions opt;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end() || !it->second.primary) {
            err.set(openxfer::ErrorKind::NotConnected, "Unknown connection");
            return lease;
        }
        Connection &c = it->second;
        while (!c.idle.empty()) {
            auto s = std::move(c.idle.back());
            c.idle.pop_back();
            if (!s->isConnected())
                continue;
            lease.session = std::move(s);
            lease.id = nextLeaseId_++;
            c.leased[lease.id] = lease.session;
            qCDebug(ocSession) << "Borrowed idle session"
                               << "connection=" << connectionId
                               << "lease=" << lease.id;
            return lease;
        }
        prototype = c.primary;
        opt = c.options;
    }

    auto fresh = createSession(*prototype, opt, err, cancel);
    if (!fresh)
        return lease;
    std::shared_ptr<openxfer::SftpClient> session(std::move(fresh));
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it != conns_.end()) {
            lease.session = session;
            lease.id = nextLeaseId_++;
            it->second.leased[lease.id] = session;
            ++it->second.created;
        }
    }
    if (!lease) {
        session->disconnect();
        err.set(openxfer::ErrorKind::NotConnected,
                "Connection closed while borrowing");
        return lease;
    }
    qCInfo(ocSession) << "Borrowed new session" << "connection=" << connectionId
                      << "lease=" << lease.id;
    return lease;
}

bool SessionPool::release(const QString &connectionId, quint64 leaseId,
                          bool faulted) {
    std::shared_ptr<openxfer::SftpClient> discard;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = conns_.find(connectionId);
        if (it == conns_.end())
            return false;
        Connection &c = it->second;
        auto lit = c.leased.find(leaseId);
        if (lit == c.leased.end())
            return false;
        auto session = std::move(lit->second);
        c.leased.erase(lit);
        if (!faulted && session->isConnected() &&
            static_cast<int>(c.idle.size()) < cfg_.maxIdleSessions) {
            c.idle.push_back(std::move(session));
        } else {
            discard = std::move(session);
        }
    }
    if (discard) {
        qCDebug(ocSession) << "Discarding borrowed session"
                           << "connection=" << connectionId
                           << "lease=" << leaseId << "faulted=" << faulted;
        discard->disconnect();
    }
    return true;
}

bool SessionPool::isFaultError(const openxfer::SftpError &err) {
    return openxfer::isTransportFault(err.kind);
}

SessionPool::Stats SessionPool::stats(const QString &connectionId) const {
    Stats s;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = conns_.find(connectionId);
    if (it == conns_.end())
        return s;
    s.known = true;
    s.primaryConnected = it->second.primary && it->second.primary->isConnected();
    s.idle = static_cast<int>(it->second.idle.size());
    s.leased = static_cast<int>(it->second.leased.size());
    s.created = it->second.created;
    s.recoveries = it->second.recoveries;
    return s;
}

std::unique_ptr<openxfer::SftpClient>
SessionPool::createSession(openxfer::SftpClient &prototype,
                           const openxfer::SessionOptions &opt,
                           openxfer::SftpError &err, const CancelToken *cancel) {
    using namespace std::chrono_literals;
    openxfer::SftpError lastErr;
    const int attempts = cfg_.sessionCreateAttempts;
    for (int i = 0; i < attempts; ++i) {
        if (cancel && cancel->isCancelled()) {
            err.set(openxfer::ErrorKind::Cancelled, "Transfer cancelled");
            return nullptr;
        }
        std::unique_ptr<openxfer::SftpClient> conn;
        {
            std::lock_guard<std::mutex> lk(factoryMutex_);
            lastErr.clear();
            conn = prototype.newConnectionLike(opt, lastErr);
        }
        if (conn)
            return conn;
        qCWarning(ocSession) << "Session creation failed"
                             << "attempt=" << (i + 1)
                             << "error=" << openxfer::describe(lastErr).c_str();
        if (i + 1 < attempts) {
            const auto delay = std::chrono::milliseconds(
                (1 << i) * cfg_.sessionCreateBackoffMs);
            if (cancel) {
                if (cancel->waitFor(delay)) {
                    err.set(openxfer::ErrorKind::Cancelled,
                            "Transfer cancelled");
                    return nullptr;
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
    if (lastErr.empty())
        err.set(openxfer::ErrorKind::NotConnected,
                "Could not create transfer connection");
    else
        err = lastErr;
    return nullptr;
}
