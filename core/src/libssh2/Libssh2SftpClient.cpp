// libssh2 backend: manages the TCP socket, SSH session and SFTP channel.
// Includes keepalive, known_hosts validation, resumable stream handles and
// translation of libssh2/SFTP status codes into ErrorKind.
#include "openxfer/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace openxfer {

namespace {

std::once_flag g_libssh2_init;

// Context for keyboard-interactive: answers user/password by prompt text
struct KbdIntCtx {
    const char *user;
    const char *pass;
    const KbdIntPromptsCB *cb; // optional UI callback for prompts
};

char *dupResponse(const std::string &s, unsigned int &len) {
    len = 0;
    if (s.empty())
        return nullptr;
    char *buf = static_cast<char *>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = static_cast<unsigned int>(s.size());
    return buf;
}

bool promptAsksForUser(const char *prompt) {
    std::string p = prompt ? prompt : "";
    for (char &c : p)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return p.find("user") != std::string::npos ||
           p.find("name") != std::string::npos;
}

void kbintCallback(const char *name, int name_len, const char *instruction,
                   int instruction_len, int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                   void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve(static_cast<std::size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char *t = (prompts && prompts[i].text)
                                ? reinterpret_cast<const char *>(prompts[i].text)
                                : "";
            texts.emplace_back(t, prompts ? prompts[i].length : 0);
        }
        std::vector<std::string> answers;
        const std::string nm =
            (name && name_len > 0)
                ? std::string(name, static_cast<std::size_t>(name_len))
                : std::string();
        const std::string ins =
            (instruction && instruction_len > 0)
                ? std::string(instruction,
                              static_cast<std::size_t>(instruction_len))
                : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) &&
            static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                responses[i].text =
                    dupResponse(answers[static_cast<std::size_t>(i)],
                                responses[i].length);
            }
            return;
        }
        // callback could not answer; fall back to the simple heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        const char *prompt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
        const char *value = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
        responses[i].text = dupResponse(value ? value : "", responses[i].length);
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char *hostKeyAlgName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

std::string hostKeyFingerprint(LIBSSH2_SESSION *session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char *prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char *prefix = "SHA1:";
#endif
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session, hashType));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

std::string lastSessionMessage(LIBSSH2_SESSION *session) {
    if (!session)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(const Libssh2SftpClient *owner, LIBSSH2_SFTP_HANDLE *h)
        : owner_(owner), handle_(h) {}
    ~Libssh2RemoteFile() override { close(); }

    long long read(char *buf, std::size_t len, SftpError &err) override {
        if (!handle_) {
            err.set(ErrorKind::ChannelClosed, "Remote handle closed");
            return -1;
        }
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            err.set(owner_->classifyLastError(static_cast<int>(n)),
                    "Remote read failed");
            return -1;
        }
        return static_cast<long long>(n);
    }

    long long write(const char *buf, std::size_t len, SftpError &err) override {
        if (!handle_) {
            err.set(ErrorKind::ChannelClosed, "Remote handle closed");
            return -1;
        }
        ssize_t n = libssh2_sftp_write(handle_, buf, len);
        if (n < 0) {
            err.set(owner_->classifyLastError(static_cast<int>(n)),
                    "Remote write failed");
            return -1;
        }
        return static_cast<long long>(n);
    }

    void close() override {
        if (handle_) {
            libssh2_sftp_close(handle_);
            handle_ = nullptr;
        }
    }

private:
    const Libssh2SftpClient *owner_;
    LIBSSH2_SFTP_HANDLE *handle_;
};

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, []() { libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

ErrorKind Libssh2SftpClient::classifyLastError(int rc) const {
    if (interrupted_.load())
        return ErrorKind::ChannelClosed;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        switch (libssh2_sftp_last_error(sftp_)) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return ErrorKind::NotFound;
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return ErrorKind::PermissionDenied;
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            return ErrorKind::AlreadyExists;
        case LIBSSH2_FX_NOT_A_DIRECTORY:
            return ErrorKind::NotADirectory;
        case LIBSSH2_FX_INVALID_FILENAME:
        case LIBSSH2_FX_INVALID_HANDLE:
            return ErrorKind::InvalidArgument;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return ErrorKind::ConnectionReset;
        case LIBSSH2_FX_EOF:
            return ErrorKind::UnexpectedEof;
        case LIBSSH2_FX_BAD_MESSAGE:
        case LIBSSH2_FX_OP_UNSUPPORTED:
            return ErrorKind::Protocol;
        default:
            return ErrorKind::Other;
        }
    }
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_RECV:
        return ErrorKind::ConnectionReset;
    case LIBSSH2_ERROR_SOCKET_SEND:
        return ErrorKind::BrokenPipe;
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        return ErrorKind::Timeout;
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
    case LIBSSH2_ERROR_CHANNEL_FAILURE:
        return ErrorKind::ChannelClosed;
    default:
        return ErrorKind::Other;
    }
}

void Libssh2SftpClient::fail(SftpError &err, int rc,
                             const std::string &what) const {
    const std::string detail = lastSessionMessage(session_);
    err.set(classifyLastError(rc),
            detail.empty() ? what : what + " (" + detail + ")");
}

bool Libssh2SftpClient::ensureReady(SftpError &err) const {
    if (!connected_ || !sftp_) {
        err.set(ErrorKind::NotConnected, "Not connected");
        return false;
    }
    if (interrupted_.load()) {
        err.set(ErrorKind::ChannelClosed, "Session interrupted");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::tcpConnect(const std::string &host, uint16_t port,
                                   SftpError &err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    const std::string portStr = std::to_string(port);
    if (getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res) != 0 || !res) {
        err.set(ErrorKind::NotConnected, "Could not resolve host");
        return false;
    }
    int fd = -1;
    for (addrinfo *rp = res; rp; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd == -1)
            continue;
        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0)
            break;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);
    if (fd == -1) {
        err.set(ErrorKind::NotConnected, "Could not connect to host");
        return false;
    }
    int one = 1;
    (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    sock_.store(fd);
    return true;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      SftpError &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Other, "Could not initialize known_hosts");
        return false;
    }
    struct KnownHostsGuard {
        LIBSSH2_KNOWNHOSTS *h;
        ~KnownHostsGuard() { libssh2_knownhost_free(h); }
    } guard{nh};

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool khLoaded =
        !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err.set(ErrorKind::PermissionDenied,
                "known_hosts unavailable or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err.set(ErrorKind::Protocol, "Could not obtain host key");
        return false;
    }
    const int alg = knownHostKeyAlg(keytype);

    struct libssh2_knownhost *entry = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), opt.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &entry);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), opt.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &entry);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        const bool confirmed =
            opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgName(keytype),
                                   hostKeyFingerprint(session_));
        if (!confirmed) {
            err.set(ErrorKind::PermissionDenied,
                    "Unknown host: fingerprint not confirmed");
            return false;
        }
        if (khPath.empty()) {
            err.set(ErrorKind::InvalidArgument, "known_hosts path not defined");
            return false;
        }
        const int addMask =
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        if (libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey,
                                   keylen, nullptr, 0, addMask, nullptr) != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            err.set(ErrorKind::LocalIo, "Could not write host to known_hosts");
            return false;
        }
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorKind::PermissionDenied,
                check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                    ? "Host key does not match known_hosts"
                    : "Host unknown in known_hosts");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authenticateWithAgent(const std::string &user) {
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (!agent)
        return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        const int kMaxAgentTries = 3;
        for (int tries = 0;
             tries < kMaxAgentTries &&
             libssh2_agent_get_identity(agent, &identity, prev) == 0;
             ++tries) {
            prev = identity;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     SftpError &err) {
    const std::string &user = opt.username;

    // Explicit key first: no fallback, the user asked for this identity.
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(
            session_, user.c_str(), nullptr, opt.private_key_path->c_str(),
            passphrase);
        if (rc != 0) {
            err.set(ErrorKind::PermissionDenied,
                    "Public key authentication failed");
            return false;
        }
        return true;
    }

    auto authMethods = [&]() {
        char *methods = libssh2_userauth_list(
            session_, user.c_str(), static_cast<unsigned>(user.size()));
        return methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        // Password directly, without probing with 'none' first.
        int rc = libssh2_userauth_password(session_, user.c_str(),
                                           opt.password->c_str());
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err.set(ErrorKind::ConnectionReset,
                    "Server closed the connection after password attempt");
            return false;
        }
        const std::string methods = authMethods();
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{user.c_str(), opt.password->c_str(),
                          &opt.keyboard_interactive_cb};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                       kbintCallback);
            if (abs)
                *abs = nullptr;
            if (rc == 0)
                return true;
        }
        if (methods.find("publickey") != std::string::npos &&
            authenticateWithAgent(user))
            return true;
        const std::string detail = lastSessionMessage(session_);
        err.set(ErrorKind::PermissionDenied,
                "Password/keyboard-interactive authentication failed" +
                    (methods.empty() ? std::string()
                                     : " (methods: " + methods + ")") +
                    (detail.empty() ? std::string() : " - " + detail));
        return false;
    }

    if (authMethods().find("publickey") != std::string::npos &&
        authenticateWithAgent(user))
        return true;
    err.set(ErrorKind::PermissionDenied,
            "No credentials: key/agent/password not available");
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, SftpError &err) {
    if (connected_ && !interrupted_.load()) {
        err.set(ErrorKind::InvalidArgument, "Already connected");
        return false;
    }
    if (connected_)
        disconnect();
    if (opt.host.empty() || opt.username.empty()) {
        err.set(ErrorKind::InvalidArgument, "Host and user are required");
        return false;
    }
    interrupted_.store(false);
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Other, "libssh2_session_init failed");
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms > 0 ? opt.timeout_ms
                                                             : 20000);
    // Keepalive: ask libssh2 to send messages every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    const int hs = libssh2_session_handshake(session_, sock_.load());
    if (hs != 0) {
        fail(err, hs, "SSH handshake failed");
        disconnect();
        return false;
    }
    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        fail(err, libssh2_session_last_errno(session_),
             "Could not initialize SFTP");
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        if (!interrupted_.load())
            libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int fd = sock_.exchange(-1);
    if (fd != -1)
        ::close(fd);
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    interrupted_.store(true);
    // shutdown() is safe from any thread and wakes a blocked libssh2 call;
    // the descriptor itself is closed by disconnect() on the owning thread.
    const int fd = sock_.load();
    if (fd != -1)
        ::shutdown(fd, SHUT_RDWR);
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<FileInfo> &out, SftpError &err) {
    if (!ensureReady(err))
        return false;
    const std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        fail(err, libssh2_session_last_errno(session_),
             "sftp_opendir failed");
        return false;
    }

    out.clear();
    out.reserve(64);
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc =
            libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), longentry,
                                    sizeof(longentry), &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            fail(err, rc, "sftp_readdir_ex failed");
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi{};
        fi.name = std::string(filename, static_cast<std::size_t>(rc));
        if (fi.name == "." || fi.name == "..")
            continue;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            fi.mode = attrs.permissions;
            fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                        LIBSSH2_SFTP_S_IFDIR;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            fi.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            fi.mtime = attrs.mtime;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
            fi.uid = attrs.uid;
            fi.gid = attrs.gid;
        }
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, FileInfo &info,
                             SftpError &err) {
    if (!ensureReady(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        fail(err, rc, "Remote stat failed");
        return false;
    }
    info = FileInfo{};
    const std::size_t cut = remote_path.find_last_of('/');
    info.name = cut == std::string::npos ? remote_path
                                         : remote_path.substr(cut + 1);
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.mode = st.permissions;
        info.is_dir =
            (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE)
        info.size = st.filesize;
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        info.mtime = st.mtime;
    if (st.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        info.uid = st.uid;
        info.gid = st.gid;
    }
    return true;
}

bool Libssh2SftpClient::exists(const std::string &remote_path, bool &isDir,
                               SftpError &err) {
    isDir = false;
    FileInfo info;
    if (stat(remote_path, info, err)) {
        isDir = info.is_dir;
        return true;
    }
    // Servers commonly answer FX_FAILURE for missing paths.
    if (err.kind == ErrorKind::NotFound || err.kind == ErrorKind::Other)
        err.clear();
    return false;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, SftpError &err,
                              unsigned int mode) {
    if (!ensureReady(err))
        return false;
    const int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        fail(err, rc, "sftp_mkdir failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &remote_path,
                                   SftpError &err) {
    if (!ensureReady(err))
        return false;
    const int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        fail(err, rc, "sftp_unlink failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &remote_dir,
                                  SftpError &err) {
    if (!ensureReady(err))
        return false;
    const int rc = libssh2_sftp_rmdir(sftp_, remote_dir.c_str());
    if (rc != 0) {
        fail(err, rc, "sftp_rmdir failed (directory not empty?)");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               SftpError &err, bool overwrite) {
    if (!ensureReady(err))
        return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    const int rc = libssh2_sftp_rename_ex(
        sftp_, from.c_str(), static_cast<unsigned>(from.size()), to.c_str(),
        static_cast<unsigned>(to.size()), flags);
    if (rc != 0) {
        fail(err, rc, "sftp_rename_ex failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::chmod(const std::string &remote_path,
                              std::uint32_t mode, SftpError &err) {
    if (!ensureReady(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode;
    const int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        fail(err, rc, "Remote chmod failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::chown(const std::string &remote_path,
                              std::uint32_t uid, std::uint32_t gid,
                              SftpError &err) {
    if (!ensureReady(err))
        return false;
    const std::uint32_t keep = static_cast<std::uint32_t>(-1);
    if (uid == keep && gid == keep) {
        err.clear();
        return true;
    }
    // SETSTAT needs both ids; fill the untouched one from the current owner.
    FileInfo cur;
    if ((uid == keep || gid == keep) && !stat(remote_path, cur, err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_UIDGID;
    a.uid = uid == keep ? cur.uid : uid;
    a.gid = gid == keep ? cur.gid : gid;
    const int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        fail(err, rc, "Remote chown failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::setTimes(const std::string &remote_path,
                                 std::uint64_t atime, std::uint64_t mtime,
                                 SftpError &err) {
    if (!ensureReady(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(atime);
    a.mtime = static_cast<unsigned long>(mtime);
    const int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        fail(err, rc, "Remote setTimes failed");
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile>
Libssh2SftpClient::openRead(const std::string &remote_path,
                            std::uint64_t offset, SftpError &err) {
    if (!ensureReady(err))
        return nullptr;
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(err, libssh2_session_last_errno(session_),
             "Could not open remote file for reading");
        return nullptr;
    }
    if (offset > 0)
        libssh2_sftp_seek64(h, static_cast<libssh2_uint64_t>(offset));
    return std::make_unique<Libssh2RemoteFile>(this, h);
}

std::unique_ptr<RemoteFile>
Libssh2SftpClient::openWrite(const std::string &remote_path,
                             std::uint64_t offset, bool truncate,
                             SftpError &err) {
    if (!ensureReady(err))
        return nullptr;
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
    if (truncate)
        flags |= LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(err, libssh2_session_last_errno(session_),
             "Could not open remote file for writing");
        return nullptr;
    }
    if (!truncate && offset > 0)
        libssh2_sftp_seek64(h, static_cast<libssh2_uint64_t>(offset));
    return std::make_unique<Libssh2RemoteFile>(this, h);
}

std::unique_ptr<SftpClient>
Libssh2SftpClient::newConnectionLike(const SessionOptions &opt,
                                     SftpError &err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace openxfer
