// Abstract interface for SFTP sessions. Concrete implementations (libssh2,
// in-memory mock) must follow this API so the transfer engine stays decoupled
// from the backend.
#pragma once
#include "SftpError.hpp"
#include "SftpTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace openxfer {

// An open remote file handle. Not thread-safe: owned by one pipe at a time.
// Closing is implicit on destruction.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read (0 at EOF) or -1 with err filled.
    virtual long long read(char *buf, std::size_t len, SftpError &err) = 0;
    // Returns bytes written (may be short) or -1 with err filled.
    virtual long long write(const char *buf, std::size_t len,
                            SftpError &err) = 0;
    virtual void close() = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions &opt, SftpError &err) = 0;
    virtual void disconnect() = 0;
    // False once interrupt() was called, until the next connect().
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." are skipped)
    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out, SftpError &err) = 0;

    // Detailed metadata (stat). Returns false with kind NotFound if absent.
    virtual bool stat(const std::string &remote_path, FileInfo &info,
                      SftpError &err) = 0;

    // Existence check: returns false and leaves err empty if it does not exist
    virtual bool exists(const std::string &remote_path, bool &isDir,
                        SftpError &err) = 0;

    virtual bool mkdir(const std::string &remote_dir, SftpError &err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            SftpError &err) = 0;

    virtual bool removeDir(const std::string &remote_dir, SftpError &err) = 0;

    virtual bool rename(const std::string &from, const std::string &to,
                        SftpError &err, bool overwrite = false) = 0;

    // Change permissions (POSIX mode, e.g. 0644)
    virtual bool chmod(const std::string &remote_path, std::uint32_t mode,
                       SftpError &err) = 0;

    // Change owner/group (if supported by the server); -1 leaves a field as is
    virtual bool chown(const std::string &remote_path, std::uint32_t uid,
                       std::uint32_t gid, SftpError &err) = 0;

    virtual bool setTimes(const std::string &remote_path, std::uint64_t atime,
                          std::uint64_t mtime, SftpError &err) = 0;

    // Open for streaming read, positioned at offset.
    virtual std::unique_ptr<RemoteFile> openRead(const std::string &remote_path,
                                                 std::uint64_t offset,
                                                 SftpError &err) = 0;

    // Open for streaming write at offset. truncate=true starts a fresh file;
    // false keeps the bytes already present (resume).
    virtual std::unique_ptr<RemoteFile>
    openWrite(const std::string &remote_path, std::uint64_t offset,
              bool truncate, SftpError &err) = 0;

    // Thread-safe: abort any blocking call and every stream on this session.
    // The session is unusable afterwards and must be discarded or reconnected.
    virtual void interrupt() = 0;

    // Create a new, independently connected session of the same type.
    virtual std::unique_ptr<SftpClient>
    newConnectionLike(const SessionOptions &opt, SftpError &err) = 0;
};

} // namespace openxfer
