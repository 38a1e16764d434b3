// Owns the primary session of every connection and lends extra sessions for
// parallel data transfers.
#pragma once
#include "CancelToken.hpp"
#include "EngineConfig.hpp"
#include "openxfer/SftpClient.hpp"

#include <QString>
#include <QtGlobal>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

class SessionPool {
public:
    struct Lease {
        std::shared_ptr<openxfer::SftpClient> session;
        quint64 id = 0;
        explicit operator bool() const { return session != nullptr; }
    };

    struct Stats {
        bool known = false;
        bool primaryConnected = false;
        int idle = 0;
        int leased = 0;
        int created = 0; // borrowed sessions opened so far
        int recoveries = 0;
    };

    explicit SessionPool(const EngineConfig &cfg);
    ~SessionPool();

    SessionPool(const SessionPool &) = delete;
    SessionPool &operator=(const SessionPool &) = delete;

    // Registers `primary` for the connection, connecting it first if needed.
    // Replaces any previous state for the same id.
    bool openConnection(const QString &connectionId,
                        std::unique_ptr<openxfer::SftpClient> primary,
                        const openxfer::SessionOptions &opt,
                        openxfer::SftpError &err);
    // Disconnects primary and idle sessions; interrupts leased ones.
    void closeConnection(const QString &connectionId);
    bool hasConnection(const QString &connectionId) const;

    // The long-lived session used by the operation queue. Re-established if
    // it is no longer connected.
    std::shared_ptr<openxfer::SftpClient>
    acquirePrimary(const QString &connectionId, openxfer::SftpError &err);
    // Replaces the primary session with a freshly connected one.
    bool recoverPrimary(const QString &connectionId, openxfer::SftpError &err);

    // An extra session usable concurrently with the primary. Must not be used
    // after release(). `cancel` aborts the connect/backoff loop.
    Lease borrow(const QString &connectionId, openxfer::SftpError &err,
                 const CancelToken *cancel = nullptr);
    // Returns a borrowed session. Idempotent: an unknown or already released
    // lease is a no-op and returns false. Faulted sessions are discarded.
    bool release(const QString &connectionId, quint64 leaseId,
                 bool faulted = false);

    static bool isFaultError(const openxfer::SftpError &err);

    Stats stats(const QString &connectionId) const;

private:
    struct Connection {
        std::shared_ptr<openxfer::SftpClient> primary;
        openxfer::SessionOptions options;
        std::vector<std::shared_ptr<openxfer::SftpClient>> idle;
        std::unordered_map<quint64, std::shared_ptr<openxfer::SftpClient>>
            leased;
        int created = 0;
        int recoveries = 0;
    };

    const EngineConfig &cfg_;
    mutable std::mutex mtx_;
    std::map<QString, Connection> conns_;
    quint64 nextLeaseId_ = 1;
    // Session creation is funneled through one entry point.
    std::mutex factoryMutex_;

    std::unique_ptr<openxfer::SftpClient>
    createSession(openxfer::SftpClient &prototype,
                  const openxfer::SessionOptions &opt, openxfer::SftpError &err,
                  const CancelToken *cancel);
};
