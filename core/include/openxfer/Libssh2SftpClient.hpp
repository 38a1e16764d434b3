// SftpClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "SftpClient.hpp"

#include <atomic>
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace openxfer {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, SftpError &err) override;
    void disconnect() override;
    bool isConnected() const override {
        return connected_ && !interrupted_.load();
    }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              SftpError &err) override;
    bool stat(const std::string &remote_path, FileInfo &info,
              SftpError &err) override;
    bool exists(const std::string &remote_path, bool &isDir,
                SftpError &err) override;
    bool mkdir(const std::string &remote_dir, SftpError &err,
               unsigned int mode = 0755) override;
    bool removeFile(const std::string &remote_path, SftpError &err) override;
    bool removeDir(const std::string &remote_dir, SftpError &err) override;
    bool rename(const std::string &from, const std::string &to,
                SftpError &err, bool overwrite = false) override;
    bool chmod(const std::string &remote_path, std::uint32_t mode,
               SftpError &err) override;
    bool chown(const std::string &remote_path, std::uint32_t uid,
               std::uint32_t gid, SftpError &err) override;
    bool setTimes(const std::string &remote_path, std::uint64_t atime,
                  std::uint64_t mtime, SftpError &err) override;

    std::unique_ptr<RemoteFile> openRead(const std::string &remote_path,
                                         std::uint64_t offset,
                                         SftpError &err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string &remote_path,
                                          std::uint64_t offset, bool truncate,
                                          SftpError &err) override;

    void interrupt() override;

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions &opt,
                                                  SftpError &err) override;

    // Maps the last libssh2/SFTP failure of this session onto an ErrorKind.
    // Used by the remote file handles as well.
    ErrorKind classifyLastError(int rc) const;

private:
    bool connected_ = false;
    std::atomic<int> sock_{-1};
    std::atomic<bool> interrupted_{false};
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, uint16_t port, SftpError &err);
    bool verifyHostKey(const SessionOptions &opt, SftpError &err);
    bool authenticate(const SessionOptions &opt, SftpError &err);
    bool authenticateWithAgent(const std::string &user);
    bool ensureReady(SftpError &err) const;
    void fail(SftpError &err, int rc, const std::string &what) const;
};

} // namespace openxfer
