// Runs transfers end to end: scanning, remote directory creation through the
// operation queue, and per-file streaming over borrowed sessions with
// retry/resume. Every call blocks until the transfer reaches a terminal state.
#pragma once
#include "EngineConfig.hpp"
#include "OperationQueue.hpp"
#include "ProgressCoordinator.hpp"
#include "SessionPool.hpp"
#include "TransferRegistry.hpp"
#include "TransferTypes.hpp"

#include <QString>
#include <QStringList>
#include <functional>
#include <vector>

class TransferOrchestrator {
public:
    using ProgressSink = std::function<void(const TransferProgressEvent &)>;
    using StatusSink = std::function<void(const SyncStatusEvent &)>;

    TransferOrchestrator(SessionPool &pool, OperationQueue &queue,
                         const EngineConfig &cfg, ProgressSink progress,
                         StatusSink status);

    // Remote file -> local path (or into it, when it is a directory).
    TransferResult download(const TransferPtr &t, const QString &remotePath,
                            const QString &localPath);
    // Local files -> existing remote directory.
    TransferResult upload(const TransferPtr &t, const QStringList &localPaths,
                          const QString &targetDir);
    // Local folder -> targetDir/<folder name>.
    TransferResult uploadFolder(const TransferPtr &t, const QString &localFolder,
                                const QString &targetDir);
    // Remote folder -> localDir/<folder name>.
    TransferResult downloadFolder(const TransferPtr &t,
                                  const QString &remoteFolder,
                                  const QString &localDir);

    // Creates every missing component of `remoteDir`, one queued mkdir per
    // level. Existing directories count as success.
    bool ensureRemoteDirectory(const QString &connectionId,
                               const QString &remoteDir,
                               openxfer::SftpError &err);

private:
    struct FileUnit {
        QString id;
        QString name;
        QString localPath;
        QString remotePath;
        quint64 totalBytes = 0;
        std::uint64_t mtime = 0;
    };

    SessionPool &pool_;
    OperationQueue &queue_;
    const EngineConfig &cfg_;
    ProgressSink progressSink_;
    StatusSink statusSink_;

    TransferResult runBatch(const TransferPtr &t, std::vector<FileUnit> &files,
                            bool upload, TransferResult result);
    bool transferFile(const TransferPtr &t, const FileUnit &unit, bool upload,
                      ProgressCoordinator &progress, openxfer::SftpError &err);
    bool resumeOffset(openxfer::SftpClient &session, const FileUnit &unit,
                      bool upload, quint64 &offset, openxfer::SftpError &err);
    bool downloadOnce(const TransferPtr &t,
                      const std::shared_ptr<openxfer::SftpClient> &session,
                      const FileUnit &unit, quint64 offset,
                      ProgressCoordinator &progress, bool &sessionLost,
                      openxfer::SftpError &err);
    bool uploadOnce(const TransferPtr &t,
                    const std::shared_ptr<openxfer::SftpClient> &session,
                    const FileUnit &unit, quint64 offset,
                    ProgressCoordinator &progress, bool &sessionLost,
                    openxfer::SftpError &err);

    bool createRemoteLevels(const TransferPtr &t,
                            const std::vector<QStringList> &levels,
                            openxfer::SftpError &err);
    bool scanRemote(const TransferPtr &t, const QString &remoteRoot,
                    const QString &localRoot, QStringList &dirs,
                    std::vector<FileUnit> &files, openxfer::SftpError &err);
    bool checkRemoteDirectory(const QString &connectionId, const QString &dir,
                              openxfer::SftpError &err);

    void setState(const TransferPtr &t, TransferState state,
                  const QString &message = QString());
    TransferResult abortBatch(const TransferPtr &t, TransferResult result,
                              const openxfer::SftpError &err);
    TransferResult finishCancelled(const TransferPtr &t,
                                   ProgressCoordinator &progress,
                                   TransferResult result);
    ProgressCoordinator::Emitter progressEmitter() const;
};
