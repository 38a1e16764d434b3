#include "openxfer/MockSftpClient.hpp"
#include <algorithm>
#include <thread>

namespace openxfer {

MockRemoteFs::MockRemoteFs() { nodes_["/"] = Node{true, {}, 0, 040755}; }

std::string MockRemoteFs::normalize(const std::string &path) {
    std::string out = "/";
    std::size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/')
            ++i;
        std::size_t j = i;
        while (j < path.size() && path[j] != '/')
            ++j;
        if (j > i) {
            const std::string part = path.substr(i, j - i);
            if (part != ".") {
                if (out.size() > 1)
                    out += '/';
                out += part;
            }
        }
        i = j;
    }
    return out;
}

std::string MockRemoteFs::parentOf(const std::string &path) {
    const std::size_t cut = path.find_last_of('/');
    if (cut == std::string::npos || cut == 0)
        return "/";
    return path.substr(0, cut);
}

void MockRemoteFs::mkpathLocked(const std::string &path) {
    const std::string p = normalize(path);
    if (p == "/")
        return;
    mkpathLocked(parentOf(p));
    auto &n = nodes_[p];
    n.dir = true;
    n.mode = 040755;
}

void MockRemoteFs::seedSample() {
    addDirectory("/home/alice/projects");
    addDirectory("/home/guest");
    addDirectory("/var/log");
    addFile("/readme.txt", std::string(1280, 'r'));
    addFile("/home/notes.md", std::string(2048, 'n'));
    addFile("/home/alice/photo.jpg", std::string(34567, 'p'));
}

void MockRemoteFs::addDirectory(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    mkpathLocked(path);
}

void MockRemoteFs::addFile(const std::string &path,
                           const std::string &contents, std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    mkpathLocked(parentOf(p));
    nodes_[p] = Node{false, contents, mtime, 0100644};
}

bool MockRemoteFs::fileContents(const std::string &path,
                                std::string &out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.dir)
        return false;
    out = it->second.data;
    return true;
}

bool MockRemoteFs::hasDirectory(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.dir;
}

bool MockRemoteFs::hasFile(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && !it->second.dir;
}

void MockRemoteFs::failAt(Op op, const std::string &path,
                          std::uint64_t afterBytes, ErrorKind kind,
                          int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    triggers_.push_back(
        Trigger{op, normalize(path), afterBytes, kind, false, times});
}

void MockRemoteFs::stallAt(Op op, const std::string &path,
                           std::uint64_t afterBytes, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    triggers_.push_back(Trigger{op, normalize(path), afterBytes,
                                ErrorKind::ChannelClosed, true, times});
}

void MockRemoteFs::denyPath(const std::string &path, ErrorKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    denied_[normalize(path)] = kind;
}

void MockRemoteFs::failNextMetadataOps(int count, ErrorKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    metadataFailures_ = count;
    metadataFailureKind_ = kind;
}

void MockRemoteFs::failNextConnects(int count) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectFailures_ = count;
}

void MockRemoteFs::setIoDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mtx_);
    ioDelay_ = delay;
}

std::vector<MockRemoteFs::OpenRecord> MockRemoteFs::openLog() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return opens_;
}

std::vector<MockRemoteFs::OpenRecord>
MockRemoteFs::openLogFor(const std::string &path) const {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<OpenRecord> out;
    for (const auto &r : opens_)
        if (r.path == p)
            out.push_back(r);
    return out;
}

std::vector<std::string> MockRemoteFs::listLog() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lists_;
}

// Caller holds mtx_.
bool MockRemoteFs::checkMetadata(const std::string &path, SftpError &err) {
    if (metadataFailures_ > 0) {
        --metadataFailures_;
        err.set(metadataFailureKind_, "Injected metadata failure");
        return false;
    }
    auto it = denied_.find(path);
    if (it != denied_.end()) {
        err.set(it->second, "Injected denial for " + path);
        return false;
    }
    return true;
}

void MockRemoteFs::streamOpened() {
    const int now = openStreams_.fetch_add(1) + 1;
    int prev = maxOpenStreams_.load();
    while (now > prev && !maxOpenStreams_.compare_exchange_weak(prev, now)) {
    }
}

void MockRemoteFs::streamClosed() { openStreams_.fetch_sub(1); }

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockRemoteFs> fs,
                   const MockSftpClient *owner, std::string path,
                   std::uint64_t offset, bool write)
        : fs_(std::move(fs)), owner_(owner), path_(std::move(path)),
          pos_(offset), write_(write) {
        fs_->streamOpened();
    }
    ~MockRemoteFile() override { close(); }

    long long read(char *buf, std::size_t len, SftpError &err) override {
        return transfer(buf, nullptr, len, err);
    }

    long long write(const char *buf, std::size_t len, SftpError &err) override {
        return transfer(nullptr, buf, len, err);
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            fs_->streamClosed();
        }
    }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    const MockSftpClient *owner_;
    std::string path_;
    std::uint64_t pos_;
    bool write_;
    bool closed_ = false;

    long long transfer(char *out, const char *in, std::size_t len,
                       SftpError &err) {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            delay = fs_->ioDelay_;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        if (closed_) {
            err.set(ErrorKind::ChannelClosed, "Handle closed");
            return -1;
        }
        if (owner_->interrupted()) {
            err.set(ErrorKind::ChannelClosed, "Session interrupted");
            return -1;
        }

        bool stall = false;
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            const MockRemoteFs::Op op =
                write_ ? MockRemoteFs::Op::Write : MockRemoteFs::Op::Read;
            for (auto &t : fs_->triggers_) {
                if (t.remaining <= 0 || t.op != op || t.path != path_)
                    continue;
                if (pos_ < t.afterBytes) {
                    // Stop exactly at the trigger offset.
                    len = std::min<std::size_t>(
                        len, static_cast<std::size_t>(t.afterBytes - pos_));
                    continue;
                }
                --t.remaining;
                if (t.stall) {
                    stall = true;
                    break;
                }
                err.set(t.kind, "Injected fault");
                return -1;
            }
            if (!stall) {
                auto it = fs_->nodes_.find(path_);
                if (it == fs_->nodes_.end() || it->second.dir) {
                    err.set(ErrorKind::NotFound, "No such file");
                    return -1;
                }
                std::string &data = it->second.data;
                if (in) {
                    if (data.size() < pos_ + len)
                        data.resize(static_cast<std::size_t>(pos_ + len));
                    std::copy(in, in + len,
                              data.begin() + static_cast<std::ptrdiff_t>(pos_));
                    pos_ += len;
                    return static_cast<long long>(len);
                }
                if (pos_ >= data.size())
                    return 0;
                const std::size_t n = std::min<std::size_t>(
                    len, data.size() - static_cast<std::size_t>(pos_));
                std::copy(data.begin() + static_cast<std::ptrdiff_t>(pos_),
                          data.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                          out);
                pos_ += n;
                return static_cast<long long>(n);
            }
        }
        while (!owner_->interrupted())
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        err.set(ErrorKind::ChannelClosed, "Session interrupted while stalled");
        return -1;
    }
};

MockSftpClient::MockSftpClient() : fs_(std::make_shared<MockRemoteFs>()) {
    fs_->seedSample();
}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs)
    : fs_(std::move(fs)) {}

MockSftpClient::~MockSftpClient() { disconnect(); }

bool MockSftpClient::connect(const SessionOptions &opt, SftpError &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::InvalidArgument, "Host and user are required");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (fs_->connectFailures_ > 0) {
            --fs_->connectFailures_;
            err.set(ErrorKind::NotConnected, "Injected connect failure");
            return false;
        }
    }
    if (!connected_)
        fs_->sessionsConnected_.fetch_add(1);
    connected_ = true;
    interrupted_.store(false);
    return true;
}

void MockSftpClient::disconnect() {
    if (connected_)
        fs_->sessionsConnected_.fetch_sub(1);
    connected_ = false;
}

bool MockSftpClient::ready(SftpError &err) const {
    if (!connected_) {
        err.set(ErrorKind::NotConnected, "Not connected");
        return false;
    }
    if (interrupted_.load()) {
        err.set(ErrorKind::ChannelClosed, "Session interrupted");
        return false;
    }
    return true;
}

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<FileInfo> &out, SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    fs_->lists_.push_back(path);
    if (!fs_->checkMetadata(path, err))
        return false;
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "Remote path not found in mock: " + path);
        return false;
    }
    if (!it->second.dir) {
        err.set(ErrorKind::NotADirectory, "Not a directory: " + path);
        return false;
    }
    out.clear();
    const std::string prefix = path == "/" ? "/" : path + "/";
    for (auto c = fs_->nodes_.lower_bound(prefix);
         c != fs_->nodes_.end() && c->first.compare(0, prefix.size(), prefix) == 0;
         ++c) {
        const std::string rest = c->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos)
            continue;
        FileInfo fi;
        fi.name = rest;
        fi.is_dir = c->second.dir;
        fi.size = c->second.dir ? 0 : c->second.data.size();
        fi.mtime = c->second.mtime;
        fi.mode = c->second.mode;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // dirs first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, FileInfo &info,
                          SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(path, err))
        return false;
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such file: " + path);
        return false;
    }
    info = FileInfo{};
    info.name = path.substr(path.find_last_of('/') + 1);
    info.is_dir = it->second.dir;
    info.size = it->second.dir ? 0 : it->second.data.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.mode;
    return true;
}

bool MockSftpClient::exists(const std::string &remote_path, bool &isDir,
                            SftpError &err) {
    isDir = false;
    FileInfo info;
    if (stat(remote_path, info, err)) {
        isDir = info.is_dir;
        return true;
    }
    if (err.kind == ErrorKind::NotFound)
        err.clear();
    return false;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, SftpError &err,
                           unsigned int mode) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(path, err))
        return false;
    if (fs_->nodes_.count(path)) {
        err.set(ErrorKind::AlreadyExists, "Already exists: " + path);
        return false;
    }
    auto parent = fs_->nodes_.find(MockRemoteFs::parentOf(path));
    if (parent == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "Missing parent for " + path);
        return false;
    }
    if (!parent->second.dir) {
        err.set(ErrorKind::NotADirectory, "Parent is not a directory");
        return false;
    }
    fs_->nodes_[path] = MockRemoteFs::Node{true, {}, 0, 040000u | mode};
    return true;
}

bool MockSftpClient::removeFile(const std::string &remote_path,
                                SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(path, err))
        return false;
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end() || it->second.dir) {
        err.set(ErrorKind::NotFound, "No such file: " + path);
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string &remote_dir, SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(path, err))
        return false;
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end() || !it->second.dir) {
        err.set(ErrorKind::NotFound, "No such directory: " + path);
        return false;
    }
    auto next = std::next(it);
    if (next != fs_->nodes_.end() &&
        next->first.compare(0, path.size() + 1, path + "/") == 0) {
        err.set(ErrorKind::Other, "Directory not empty");
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string &from, const std::string &to,
                            SftpError &err, bool overwrite) {
    if (!ready(err))
        return false;
    const std::string src = MockRemoteFs::normalize(from);
    const std::string dst = MockRemoteFs::normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(src, err))
        return false;
    auto it = fs_->nodes_.find(src);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such file: " + src);
        return false;
    }
    if (fs_->nodes_.count(dst) && !overwrite) {
        err.set(ErrorKind::AlreadyExists, "Target exists: " + dst);
        return false;
    }
    // Move the node and, for directories, everything below it.
    std::vector<std::pair<std::string, MockRemoteFs::Node>> moved;
    for (auto c = fs_->nodes_.begin(); c != fs_->nodes_.end();) {
        if (c->first == src || c->first.compare(0, src.size() + 1, src + "/") == 0) {
            moved.emplace_back(dst + c->first.substr(src.size()), c->second);
            c = fs_->nodes_.erase(c);
        } else {
            ++c;
        }
    }
    for (auto &m : moved)
        fs_->nodes_[m.first] = std::move(m.second);
    return true;
}

bool MockSftpClient::chmod(const std::string &remote_path, std::uint32_t mode,
                           SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->checkMetadata(path, err))
        return false;
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such file: " + path);
        return false;
    }
    it->second.mode = (it->second.mode & ~07777u) | (mode & 07777u);
    return true;
}

bool MockSftpClient::chown(const std::string &remote_path, std::uint32_t,
                           std::uint32_t, SftpError &err) {
    FileInfo info;
    return stat(remote_path, info, err);
}

bool MockSftpClient::setTimes(const std::string &remote_path, std::uint64_t,
                              std::uint64_t mtime, SftpError &err) {
    if (!ready(err))
        return false;
    const std::string path = MockRemoteFs::normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, "No such file: " + path);
        return false;
    }
    it->second.mtime = mtime;
    return true;
}

std::unique_ptr<RemoteFile>
MockSftpClient::openRead(const std::string &remote_path, std::uint64_t offset,
                         SftpError &err) {
    if (!ready(err))
        return nullptr;
    const std::string path = MockRemoteFs::normalize(remote_path);
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (!fs_->checkMetadata(path, err))
            return nullptr;
        auto it = fs_->nodes_.find(path);
        if (it == fs_->nodes_.end()) {
            err.set(ErrorKind::NotFound, "No such file: " + path);
            return nullptr;
        }
        if (it->second.dir) {
            err.set(ErrorKind::InvalidArgument, "Is a directory: " + path);
            return nullptr;
        }
        fs_->opens_.push_back({path, offset, false, false});
    }
    return std::make_unique<MockRemoteFile>(fs_, this, path, offset, false);
}

std::unique_ptr<RemoteFile>
MockSftpClient::openWrite(const std::string &remote_path, std::uint64_t offset,
                          bool truncate, SftpError &err) {
    if (!ready(err))
        return nullptr;
    const std::string path = MockRemoteFs::normalize(remote_path);
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (!fs_->checkMetadata(path, err))
            return nullptr;
        auto parent = fs_->nodes_.find(MockRemoteFs::parentOf(path));
        if (parent == fs_->nodes_.end() || !parent->second.dir) {
            err.set(ErrorKind::NotFound, "Missing parent for " + path);
            return nullptr;
        }
        auto &node = fs_->nodes_[path];
        if (node.dir) {
            err.set(ErrorKind::InvalidArgument, "Is a directory: " + path);
            return nullptr;
        }
        node.mode = 0100644;
        if (truncate)
            node.data.clear();
        fs_->opens_.push_back({path, truncate ? 0 : offset, true, truncate});
    }
    return std::make_unique<MockRemoteFile>(fs_, this, path,
                                            truncate ? 0 : offset, true);
}

std::unique_ptr<SftpClient>
MockSftpClient::newConnectionLike(const SessionOptions &opt, SftpError &err) {
    auto conn = std::make_unique<MockSftpClient>(fs_);
    if (!conn->connect(opt, err))
        return nullptr;
    return conn;
}

} // namespace openxfer
