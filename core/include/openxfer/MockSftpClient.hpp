// In-memory SFTP backend for tests. Every MockSftpClient created from the same
// MockRemoteFs sees the same remote tree, so borrowed sessions and the primary
// session observe each other's writes exactly like real SFTP channels would.
#pragma once
#include "SftpClient.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace openxfer {

class MockRemoteFs {
public:
    enum class Op { Read, Write };

    struct OpenRecord {
        std::string path;
        std::uint64_t offset = 0;
        bool write = false;
        bool truncate = false;
    };

    // Creates an empty tree containing only "/".
    MockRemoteFs();

    // Seeds the small tree used by the client tests.
    void seedSample();

    void addDirectory(const std::string &path);
    void addFile(const std::string &path, const std::string &contents,
                 std::uint64_t mtime = 0);
    bool fileContents(const std::string &path, std::string &out) const;
    bool hasDirectory(const std::string &path) const;
    bool hasFile(const std::string &path) const;

    // The next `times` streams of `op` on `path` fail with `kind` once they
    // reach byte `afterBytes`.
    void failAt(Op op, const std::string &path, std::uint64_t afterBytes,
                ErrorKind kind, int times = 1);
    // Same trigger, but the call blocks until the session is interrupted.
    void stallAt(Op op, const std::string &path, std::uint64_t afterBytes,
                 int times = 1);
    // Metadata operations on `path` answer with `kind` (e.g. PermissionDenied).
    void denyPath(const std::string &path, ErrorKind kind);
    // The next `count` metadata operations on any path fail with `kind`.
    void failNextMetadataOps(int count, ErrorKind kind);
    // The next `count` connect attempts fail with NotConnected.
    void failNextConnects(int count);
    // Sleep applied to every read/write call.
    void setIoDelay(std::chrono::milliseconds delay);

    std::vector<OpenRecord> openLog() const;
    std::vector<OpenRecord> openLogFor(const std::string &path) const;
    std::vector<std::string> listLog() const;
    int sessionsConnected() const { return sessionsConnected_.load(); }
    int maxConcurrentStreams() const { return maxOpenStreams_.load(); }
    int openStreams() const { return openStreams_.load(); }

    static std::string normalize(const std::string &path);

private:
    friend class MockSftpClient;
    friend class MockRemoteFile;

    struct Node {
        bool dir = false;
        std::string data;
        std::uint64_t mtime = 0;
        std::uint32_t mode = 0;
    };
    struct Trigger {
        Op op;
        std::string path;
        std::uint64_t afterBytes = 0;
        ErrorKind kind = ErrorKind::None;
        bool stall = false;
        int remaining = 0;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::vector<Trigger> triggers_;
    std::map<std::string, ErrorKind> denied_;
    std::vector<OpenRecord> opens_;
    std::vector<std::string> lists_;
    int metadataFailures_ = 0;
    ErrorKind metadataFailureKind_ = ErrorKind::None;
    int connectFailures_ = 0;
    std::chrono::milliseconds ioDelay_{0};

    std::atomic<int> sessionsConnected_{0};
    std::atomic<int> openStreams_{0};
    std::atomic<int> maxOpenStreams_{0};

    static std::string parentOf(const std::string &path);
    bool checkMetadata(const std::string &path, SftpError &err);
    void mkpathLocked(const std::string &path);
    void streamOpened();
    void streamClosed();
};

class MockSftpClient : public SftpClient {
public:
    // Stand-alone client over the sample tree.
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);
    ~MockSftpClient() override;

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

    void interrupt() override { interrupted_.store(true); }
    bool interrupted() const { return interrupted_.load(); }

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions &opt,
                                                  SftpError &err) override;

    const std::shared_ptr<MockRemoteFs> &fs() const { return fs_; }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
    std::atomic<bool> interrupted_{false};

    bool ready(SftpError &err) const;
};

} // namespace openxfer
