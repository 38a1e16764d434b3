// Core unit tests without external framework (run via CTest).
#include "openxfer/MockSftpClient.hpp"
#include "openxfer/RuntimeLogging.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

openxfer::SessionOptions validOptions() {
    openxfer::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

void test_session_defaults(TestContext &t) {
    openxfer::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == openxfer::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
}

void test_error_classification(TestContext &t) {
    using openxfer::ErrorKind;
    const ErrorKind faults[] = {ErrorKind::ConnectionReset, ErrorKind::BrokenPipe,
                                ErrorKind::UnexpectedEof, ErrorKind::ChannelClosed,
                                ErrorKind::Timeout, ErrorKind::NoProgress,
                                ErrorKind::NotConnected};
    for (ErrorKind k : faults) {
        t.check(openxfer::isTransportFault(k),
                std::string(openxfer::errorKindName(k)) +
                    " should be a transport fault");
        t.check(openxfer::isRetryable(k),
                std::string(openxfer::errorKindName(k)) + " should be retryable");
    }
    const ErrorKind appErrors[] = {
        ErrorKind::None,          ErrorKind::NotFound,
        ErrorKind::PermissionDenied, ErrorKind::NotADirectory,
        ErrorKind::AlreadyExists, ErrorKind::InvalidArgument,
        ErrorKind::LocalIo,       ErrorKind::Protocol,
        ErrorKind::Other,         ErrorKind::Cancelled};
    for (ErrorKind k : appErrors) {
        t.check(!openxfer::isTransportFault(k),
                std::string(openxfer::errorKindName(k)) +
                    " should not be a transport fault");
        t.check(!openxfer::isRetryable(k),
                std::string(openxfer::errorKindName(k)) +
                    " should not be retryable");
    }

    openxfer::SftpError err(ErrorKind::NotFound, "missing");
    t.check(openxfer::describe(err) == "not-found: missing",
            "describe should prefix the kind name");
    err.clear();
    t.check(err.empty() && openxfer::describe(err) == "none",
            "cleared error should be empty");
}

void test_connect_validation(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    openxfer::SessionOptions opt;
    opt.host = "";
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(err.kind == openxfer::ErrorKind::InvalidArgument,
            "empty host should be an invalid argument");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
}

void test_disconnect_changes_state(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    auto opt = validOptions();
    t.check(c.connect(opt, err),
            "connect should succeed before disconnect test");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");

    std::vector<openxfer::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err), "list should fail after disconnect");
    t.check(err.kind == openxfer::ErrorKind::NotConnected,
            "list after disconnect should report NotConnected");
}

void test_list_sorting_and_known_path(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    auto opt = validOptions();
    t.check(c.connect(opt, err), "connect should succeed before list test");

    std::vector<openxfer::FileInfo> out;
    t.check(c.list("/home", out, err),
            "list('/home') should succeed in mock FS");
    t.check(out.size() == 3, "list('/home') should return 3 entries");
    if (out.size() == 3) {
        t.check(out[0].is_dir && out[0].name == "alice",
                "first entry should be dir 'alice'");
        t.check(out[1].is_dir && out[1].name == "guest",
                "second entry should be dir 'guest'");
        t.check(!out[2].is_dir && out[2].name == "notes.md" &&
                    out[2].size == 2048,
                "third entry should be file 'notes.md'");
    }
}

void test_list_root_and_empty_path(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    auto opt = validOptions();
    t.check(c.connect(opt, err),
            "connect should succeed before root listing test");

    std::vector<openxfer::FileInfo> root;
    t.check(c.list("/", root, err), "list('/') should succeed");
    t.check(root.size() == 3, "list('/') should return expected mock entries");
    if (root.size() == 3) {
        t.check(root[0].is_dir && root[0].name == "home",
                "root[0] should be 'home' directory");
        t.check(root[1].is_dir && root[1].name == "var",
                "root[1] should be 'var' directory");
        t.check(!root[2].is_dir && root[2].name == "readme.txt",
                "root[2] should be 'readme.txt' file");
    }

    std::vector<openxfer::FileInfo> emptyPath;
    err.clear();
    t.check(c.list("", emptyPath, err), "list('') should be treated as '/'");
    t.check(emptyPath.size() == root.size(),
            "list('') should match root entry count");
}

void test_missing_path_error(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    auto opt = validOptions();
    t.check(c.connect(opt, err),
            "connect should succeed before missing path test");

    std::vector<openxfer::FileInfo> out;
    err.clear();
    t.check(!c.list("/does-not-exist", out, err),
            "list on missing path should fail");
    t.check(err.kind == openxfer::ErrorKind::NotFound,
            "missing path should report NotFound");

    err.clear();
    t.check(!c.list("/readme.txt", out, err), "list on a file should fail");
    t.check(err.kind == openxfer::ErrorKind::NotADirectory,
            "list on a file should report NotADirectory");
}

void test_metadata_operations(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    t.check(c.connect(validOptions(), err), "connect for metadata test");

    bool isDir = false;
    t.check(c.exists("/home/alice", isDir, err) && isDir,
            "exists should report the directory");
    t.check(!c.exists("/nope", isDir, err) && err.empty(),
            "exists on a missing path should not set an error");

    openxfer::FileInfo info;
    t.check(c.stat("/home/alice/photo.jpg", info, err) && !info.is_dir &&
                info.size == 34567,
            "stat should report file size");

    t.check(c.mkdir("/home/alice/new", err), "mkdir should create a dir");
    err.clear();
    t.check(!c.mkdir("/home/alice/new", err) &&
                err.kind == openxfer::ErrorKind::AlreadyExists,
            "second mkdir should report AlreadyExists");
    err.clear();
    t.check(!c.mkdir("/missing/child", err) &&
                err.kind == openxfer::ErrorKind::NotFound,
            "mkdir without parent should report NotFound");

    err.clear();
    t.check(c.rename("/home/alice/photo.jpg", "/home/alice/new/photo.jpg", err),
            "rename should move a file");
    t.check(c.fs()->hasFile("/home/alice/new/photo.jpg") &&
                !c.fs()->hasFile("/home/alice/photo.jpg"),
            "rename should update the tree");

    err.clear();
    t.check(!c.removeDir("/home/alice/new", err),
            "removeDir should refuse a non-empty directory");
    err.clear();
    t.check(c.removeFile("/home/alice/new/photo.jpg", err),
            "removeFile should delete the file");
    t.check(c.removeDir("/home/alice/new", err),
            "removeDir should delete the now empty directory");

    t.check(c.chmod("/readme.txt", 0600, err), "chmod should succeed");
    t.check(c.stat("/readme.txt", info, err) && (info.mode & 0777) == 0600,
            "chmod should update permission bits");
    t.check(c.setTimes("/readme.txt", 10, 20, err), "setTimes should succeed");
    t.check(c.stat("/readme.txt", info, err) && info.mtime == 20,
            "setTimes should update mtime");
}

void test_streams_and_fault_injection(TestContext &t) {
    auto fs = std::make_shared<openxfer::MockRemoteFs>();
    fs->addFile("/data/blob.bin", std::string(1000, 'x'));
    fs->failAt(openxfer::MockRemoteFs::Op::Read, "/data/blob.bin", 600,
               openxfer::ErrorKind::ConnectionReset);
    openxfer::MockSftpClient c(fs);
    openxfer::SftpError err;
    t.check(c.connect(validOptions(), err), "connect for stream test");

    auto f = c.openRead("/data/blob.bin", 100, err);
    t.check(static_cast<bool>(f), "openRead should succeed");
    if (f) {
        char buf[4096];
        t.check(f->read(buf, sizeof(buf), err) == 500,
                "read should stop at the injected offset");
        t.check(f->read(buf, sizeof(buf), err) == -1 &&
                    err.kind == openxfer::ErrorKind::ConnectionReset,
                "read past the trigger should fail with the injected kind");
        f->close();
    }
    t.check(fs->openLogFor("/data/blob.bin").size() == 1 &&
                fs->openLogFor("/data/blob.bin")[0].offset == 100,
            "open log should record the offset");

    err.clear();
    auto w = c.openWrite("/data/out.bin", 0, true, err);
    t.check(static_cast<bool>(w), "openWrite should succeed");
    if (w) {
        t.check(w->write("hello", 5, err) == 5, "write should accept data");
        w->close();
    }
    std::string contents;
    t.check(fs->fileContents("/data/out.bin", contents) && contents == "hello",
            "written data should land in the tree");
    t.check(fs->openStreams() == 0, "every stream should be closed");
}

void test_interrupt_kills_session(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SftpError err;
    t.check(c.connect(validOptions(), err), "connect for interrupt test");
    auto f = c.openRead("/readme.txt", 0, err);
    c.interrupt();
    char buf[16];
    t.check(f && f->read(buf, sizeof(buf), err) == -1 &&
                err.kind == openxfer::ErrorKind::ChannelClosed,
            "interrupted session should fail stream reads");
    std::vector<openxfer::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err) &&
                openxfer::isTransportFault(err.kind),
            "interrupted session should fail metadata with a transport fault");
    t.check(!c.isConnected(), "an interrupted session reports disconnected");
    err.clear();
    t.check(c.connect(validOptions(), err) && c.isConnected(),
            "reconnecting should clear the interrupt");
}

void test_new_connection_like(TestContext &t) {
    openxfer::MockSftpClient c;
    auto opt = validOptions();
    openxfer::SftpError err;
    auto conn = c.newConnectionLike(opt, err);
    t.check(static_cast<bool>(conn),
            "newConnectionLike should return a client");
    t.check(conn && conn->isConnected(),
            "newConnectionLike client should be connected");
    std::vector<openxfer::FileInfo> out;
    t.check(conn && conn->list("/home", out, err) && out.size() == 3,
            "new connection should share the remote tree");
}

void test_new_connection_like_validation(TestContext &t) {
    openxfer::MockSftpClient c;
    openxfer::SessionOptions bad;
    bad.host = "";
    bad.username = "alice";
    openxfer::SftpError err;
    auto conn = c.newConnectionLike(bad, err);
    t.check(!conn, "newConnectionLike should fail with invalid options");
    t.checkContains(err.message, "required",
                    "newConnectionLike should report validation errors");
}

void test_log_redaction(TestContext &t) {
    t.check(openxfer::redactPath("/home/alice/photo.jpg", false) ==
                ".../photo.jpg",
            "paths should be reduced to their base name");
    t.check(openxfer::redactPath("/home/alice/", false) == ".../alice",
            "trailing separators should be ignored");
    t.check(openxfer::redactPath("/", false) == "/", "root stays as is");
    t.check(openxfer::redactPath("/home/alice/photo.jpg", true) ==
                "/home/alice/photo.jpg",
            "sensitive logging keeps the full path");
    t.check(openxfer::redactHost("example.test", false) == "e***.test",
            "host names should be masked");
    t.check(openxfer::redactHost("localhost", false) == "l***",
            "single-label hosts keep only the initial");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_error_classification(t);
    test_connect_validation(t);
    test_disconnect_changes_state(t);
    test_list_sorting_and_known_path(t);
    test_list_root_and_empty_path(t);
    test_missing_path_error(t);
    test_metadata_operations(t);
    test_streams_and_fault_injection(t);
    test_interrupt_kills_session(t);
    test_new_connection_like(t);
    test_new_connection_like_validation(t);
    test_log_redaction(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openxfer_core_tests\n";
    return EXIT_SUCCESS;
}
