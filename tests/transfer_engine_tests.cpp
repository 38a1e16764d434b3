// End-to-end transfers through TransferEngine against the in-memory backend.
#include "TransferEngine.hpp"
#include "openxfer/MockSftpClient.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
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
};

using namespace std::chrono_literals;
using Op = openxfer::MockRemoteFs::Op;

constexpr std::uint64_t kMiB = 1024ull * 1024ull;
const QString kConn = QStringLiteral("c1");

EngineConfig testConfig() {
    EngineConfig cfg;
    cfg.sessionCreateBackoffMs = 1;
    cfg.retryBaseDelayMs = 10;
    cfg.refreshDelayMs = 20;
    return cfg;
}

std::string pattern(std::size_t size, int seed = 0) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<char>((i * 31 + static_cast<std::size_t>(seed)) % 251);
    return out;
}

bool writeLocal(const QString &path, const std::string &data) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(data.data(), static_cast<qint64>(data.size())) ==
           static_cast<qint64>(data.size());
}

bool readLocal(const QString &path, std::string &out) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return false;
    const QByteArray all = f.readAll();
    out.assign(all.constData(), static_cast<std::size_t>(all.size()));
    return true;
}

bool waitUntil(const std::function<bool()> &pred,
               std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

struct Fixture {
    std::shared_ptr<openxfer::MockRemoteFs> fs =
        std::make_shared<openxfer::MockRemoteFs>();
    QTemporaryDir tmp;
    std::unique_ptr<TransferEngine> engine;
    bool connected = false;

    std::mutex mtx;
    std::vector<TransferProgressEvent> progress;
    std::vector<SyncStatusEvent> statuses;
    std::atomic<int> processedFiles{0};

    explicit Fixture(const EngineConfig &cfg = testConfig()) {
        engine = std::make_unique<TransferEngine>(cfg);
        QObject::connect(engine.get(), &TransferEngine::transferProgress,
                         [this](const TransferProgressEvent &ev) {
                             std::lock_guard<std::mutex> lk(mtx);
                             progress.push_back(ev);
                             if (ev.processedFiles > processedFiles.load())
                                 processedFiles.store(ev.processedFiles);
                         });
        QObject::connect(engine.get(), &TransferEngine::syncStatus,
                         [this](const SyncStatusEvent &ev) {
                             std::lock_guard<std::mutex> lk(mtx);
                             statuses.push_back(ev);
                         });
        openxfer::SessionOptions opt;
        opt.host = "example.test";
        opt.username = "alice";
        openxfer::SftpError err;
        connected = engine->connectSession(
            kConn, std::make_unique<openxfer::MockSftpClient>(fs), opt, err);
    }

    QString local(const QString &rel) const { return tmp.filePath(rel); }

    TransferResult wait(const QString &key, TestContext &t,
                        int timeoutMs = 60000) {
        TransferResult r;
        t.check(!key.isEmpty(), "transfer should start");
        t.check(engine->waitForTransfer(key, timeoutMs, &r),
                "transfer should finish in time");
        return r;
    }

    std::vector<TransferProgressEvent> progressFor(const QString &key) {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<TransferProgressEvent> out;
        for (const auto &ev : progress)
            if (ev.transferKey == key)
                out.push_back(ev);
        return out;
    }

    std::vector<TransferState> statesFor(const QString &key) {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<TransferState> out;
        for (const auto &ev : statuses)
            if (ev.transferKey == key)
                out.push_back(ev.state);
        return out;
    }
};

bool progressIsMonotonic(const std::vector<TransferProgressEvent> &events) {
    int last = 0;
    for (const auto &ev : events) {
        if (ev.progress < last)
            return false;
        last = ev.progress;
    }
    return true;
}

void test_download_resumes_after_reset(TestContext &t) {
    Fixture fx;
    t.check(fx.connected, "engine should connect");
    const std::string payload = pattern(50 * kMiB);
    fx.fs->addFile("/data/big.bin", payload, 1700000000);
    fx.fs->failAt(Op::Read, "/data/big.bin", 20 * kMiB,
                  openxfer::ErrorKind::ConnectionReset);

    const QString key =
        fx.engine->startDownload(kConn, "/data/big.bin", fx.tmp.path());
    const TransferResult r = fx.wait(key, t);
    t.check(r.success && !r.cancelled, "download should succeed after retry");
    t.check(r.successfulFiles == 1 && r.failedFiles == 0, "one file done");
    t.check(r.kind == TransferKind::Download, "result kind");

    const auto opens = fx.fs->openLogFor("/data/big.bin");
    t.check(opens.size() == 2, "file should be opened twice");
    if (opens.size() == 2) {
        t.check(opens[0].offset == 0, "first attempt starts at zero");
        t.check(opens[1].offset == 20 * kMiB,
                "retry resumes at the failure offset");
    }

    const QString target = fx.local("big.bin");
    std::string got;
    t.check(readLocal(target, got) && got == payload,
            "downloaded content should match the remote file");
    t.check(!QFile::exists(target + ".part"), "partial file should be gone");
    t.check(QFileInfo(target).lastModified().toSecsSinceEpoch() == 1700000000,
            "remote mtime should be preserved");

    const auto events = fx.progressFor(key);
    t.check(!events.empty() && events.back().operationComplete &&
                events.back().progress == 100,
            "last progress event should be complete at 100%");
    t.check(progressIsMonotonic(events), "progress should never go back");
    const auto states = fx.statesFor(key);
    t.check(!states.empty() && states.front() == TransferState::Queued &&
                states.back() == TransferState::Completed,
            "state should go from queued to completed");
    t.check(!fx.engine->registry().get(key), "finished key leaves the registry");
}

void test_download_application_error_not_retried(TestContext &t) {
    Fixture fx;
    fx.fs->addFile("/data/secret.bin", pattern(100000));
    fx.fs->failAt(Op::Read, "/data/secret.bin", 5000,
                  openxfer::ErrorKind::PermissionDenied);
    const QString key =
        fx.engine->startDownload(kConn, "/data/secret.bin", fx.local("s.bin"));
    const TransferResult r = fx.wait(key, t);
    t.check(!r.success && r.failedFiles == 1, "download should fail");
    t.check(r.error.kind == openxfer::ErrorKind::PermissionDenied,
            "application error should be surfaced as is");
    t.check(fx.fs->openLogFor("/data/secret.bin").size() == 1,
            "application errors are not retried");
    t.check(!QFile::exists(fx.local("s.bin.part")),
            "partial file should be removed on failure");

    const QString missing =
        fx.engine->startDownload(kConn, "/data/nope.bin", fx.local("n.bin"));
    const TransferResult m = fx.wait(missing, t);
    t.check(!m.success && m.error.kind == openxfer::ErrorKind::NotFound,
            "missing remote file should fail with NotFound");
    const auto states = fx.statesFor(missing);
    t.check(!states.empty() && states.back() == TransferState::Failed,
            "failed transfer should end in the failed state");
}

void test_download_retries_exhausted(TestContext &t) {
    Fixture fx;
    fx.fs->addFile("/data/flaky.bin", pattern(10000));
    fx.fs->failAt(Op::Read, "/data/flaky.bin", 1000,
                  openxfer::ErrorKind::BrokenPipe, 10);
    const QString key =
        fx.engine->startDownload(kConn, "/data/flaky.bin", fx.local("f.bin"));
    const TransferResult r = fx.wait(key, t);
    t.check(!r.success, "download should fail after every attempt faulted");
    t.check(r.error.kind == openxfer::ErrorKind::BrokenPipe,
            "last transport error should be reported");
    t.check(fx.fs->openLogFor("/data/flaky.bin").size() == 3,
            "file should be attempted maxAttempts times");
}

void test_upload_resumes_at_remote_size(TestContext &t) {
    Fixture fx;
    fx.fs->addDirectory("/up");
    const std::string payload = pattern(300000, 7);
    const QString src = fx.local("src/file.bin");
    t.check(writeLocal(src, payload), "local source should be written");
    fx.fs->failAt(Op::Write, "/up/file.bin", 100000,
                  openxfer::ErrorKind::BrokenPipe);

    const QString key = fx.engine->startUpload(kConn, "/up", {src});
    const TransferResult r = fx.wait(key, t);
    t.check(r.success && r.successfulFiles == 1, "upload should succeed");

    const auto opens = fx.fs->openLogFor("/up/file.bin");
    t.check(opens.size() == 2, "upload should be opened twice");
    if (opens.size() == 2) {
        t.check(opens[0].offset == 0 && opens[0].truncate,
                "first attempt truncates");
        t.check(opens[1].offset == 100000 && !opens[1].truncate,
                "retry appends at the remote size");
    }
    std::string remote;
    t.check(fx.fs->fileContents("/up/file.bin", remote) && remote == payload,
            "remote content should match the local file");
}

void test_multi_upload_partial_failure(TestContext &t) {
    Fixture fx;
    fx.fs->addDirectory("/up");
    const QString good = fx.local("src/good.txt");
    writeLocal(good, "hello");
    const QString bad = fx.local("src/missing.txt");

    const QString key = fx.engine->startUpload(kConn, "/up", {good, bad});
    t.check(key.contains("upload-multifile"), "key should name the kind");
    const TransferResult r = fx.wait(key, t);
    t.check(r.kind == TransferKind::UploadMultiFile, "multi-file kind");
    t.check(!r.success, "batch with a failure is not a success");
    t.check(r.successfulFiles == 1 && r.failedFiles == 1, "counts per file");
    t.check(r.failures.size() == 1 && r.failures[0].path == bad,
            "the missing file should be reported");
    t.check(fx.fs->hasFile("/up/good.txt"), "the good file should be uploaded");
}

void test_upload_duplicate_names(TestContext &t) {
    Fixture fx;
    fx.fs->addDirectory("/up");
    const QString first = fx.local("a/same.txt");
    const QString second = fx.local("b/same.txt");
    writeLocal(first, "first");
    writeLocal(second, "second");

    const QString key = fx.engine->startUpload(kConn, "/up", {first, second});
    const TransferResult r = fx.wait(key, t);
    t.check(r.successfulFiles == 1 && r.failedFiles == 1,
            "a second source with the same name should fail");
    t.check(r.failures.size() == 1 && r.failures[0].path == second &&
                r.failures[0].error.kind == openxfer::ErrorKind::InvalidArgument,
            "the later duplicate should be reported");
    std::string got;
    t.check(fx.fs->fileContents("/up/same.txt", got) && got == "first",
            "the first source should own the target");
    t.check(fx.fs->openLogFor("/up/same.txt").size() == 1,
            "the target should be written by one stream only");
}

void test_cancel_during_retry_backoff(TestContext &t) {
    EngineConfig cfg = testConfig();
    cfg.retryBaseDelayMs = 60000;
    Fixture fx(cfg);
    fx.fs->addFile("/data/slow.bin", pattern(64 * 1024));
    fx.fs->failAt(Op::Read, "/data/slow.bin", 1024,
                  openxfer::ErrorKind::ConnectionReset);

    const QString key =
        fx.engine->startDownload(kConn, "/data/slow.bin", fx.tmp.path());
    t.check(waitUntil(
                [&] {
                    return fx.fs->openLogFor("/data/slow.bin").size() == 1 &&
                           fx.fs->openStreams() == 0;
                },
                5000ms),
            "the first attempt should fail and close its stream");
    const auto started = std::chrono::steady_clock::now();
    t.check(fx.engine->cancelTransfer(kConn, key), "cancel should match");
    const TransferResult r = fx.wait(key, t, 5000);
    t.check(std::chrono::steady_clock::now() - started < 3s,
            "cancel should cut the backoff short");
    t.check(r.cancelled, "the transfer should end cancelled");
    t.check(fx.fs->openLogFor("/data/slow.bin").size() == 1,
            "no retry should be opened after the cancel");
}

void test_finished_results_are_released(TestContext &t) {
    std::atomic<int> done{0};
    Fixture fx;
    QObject::connect(fx.engine.get(), &TransferEngine::transferFinished,
                     [&done](const TransferResult &) { ++done; });

    for (int i = 0; i < 3; ++i) {
        const std::string name = "/r/w" + std::to_string(i) + ".bin";
        fx.fs->addFile(name, pattern(512, i));
        const QString key = fx.engine->startDownload(
            kConn, QString::fromStdString(name), fx.tmp.path());
        const TransferResult r = fx.wait(key, t);
        t.check(r.success, "small download should succeed");
        t.check(!fx.engine->waitForTransfer(key, 10),
                "a consumed result cannot be claimed twice");
    }
    t.check(fx.engine->unclaimedResults() == 0,
            "waited results should not be kept");

    // Transfers nobody waits on are capped, oldest first.
    const int total = static_cast<int>(TransferEngine::kMaxUnclaimedResults) + 6;
    QStringList keys;
    for (int i = 0; i < total; ++i) {
        const std::string name = "/r/u" + std::to_string(i) + ".bin";
        fx.fs->addFile(name, pattern(256, i));
        keys << fx.engine->startDownload(kConn, QString::fromStdString(name),
                                         fx.tmp.path());
        const std::size_t expected =
            std::min<std::size_t>(static_cast<std::size_t>(i),
                                  TransferEngine::kMaxUnclaimedResults) + 1;
        waitUntil([&] { return done.load() == 3 + i + 1; }, 5000ms);
        waitUntil([&] { return fx.engine->unclaimedResults() == expected; },
                  5000ms);
    }
    fx.fs->addFile("/r/last.bin", "x");
    const QString last =
        fx.engine->startDownload(kConn, "/r/last.bin", fx.tmp.path());
    fx.wait(last, t);
    t.check(fx.engine->unclaimedResults() == TransferEngine::kMaxUnclaimedResults,
            "unclaimed results should stay bounded");
    t.check(!fx.engine->waitForTransfer(keys.front(), 10),
            "the oldest unclaimed result should be dropped");
    TransferResult newest;
    t.check(fx.engine->waitForTransfer(keys.back(), 1000, &newest) &&
                newest.success,
            "recent unclaimed results are still available");
}

void test_upload_to_missing_directory(TestContext &t) {
    Fixture fx;
    const QString src = fx.local("a.txt");
    writeLocal(src, "abc");
    const QString key = fx.engine->startUpload(kConn, "/missing", {src});
    const TransferResult r = fx.wait(key, t);
    t.check(!r.success && r.error.kind == openxfer::ErrorKind::NotFound,
            "missing target directory should abort the batch");
    const auto events = fx.progressFor(key);
    t.check(!events.empty() && events.back().operationComplete &&
                !events.back().error.isEmpty(),
            "a terminal event should carry the error");

    fx.fs->addFile("/plain", "x");
    const QString notDir = fx.engine->startUpload(kConn, "/plain", {src});
    const TransferResult n = fx.wait(notDir, t);
    t.check(!n.success && n.error.kind == openxfer::ErrorKind::NotADirectory,
            "a file as target should report NotADirectory");
}

void test_folder_upload_many_small_files(TestContext &t) {
    Fixture fx;
    fx.fs->addDirectory("/dest");
    const QString root = fx.local("bulk");
    for (int i = 0; i < 500; ++i) {
        const QString rel =
            QStringLiteral("sub%1/f%2.bin").arg(i % 5).arg(i, 3, 10, QChar('0'));
        writeLocal(QDir(root).filePath(rel), pattern(50 * 1024, i));
    }

    const QString key = fx.engine->startFolderUpload(kConn, root, "/dest");
    const TransferResult r = fx.wait(key, t, 120000);
    t.check(r.success, "folder upload should succeed");
    t.check(r.concurrency == 12, "many small files should use 12 workers");
    t.check(r.successfulFiles == 500 && r.failedFiles == 0,
            "every file should be uploaded");
    t.check(r.totalBytes == 500ull * 50 * 1024, "total bytes");
    t.check(fx.fs->hasDirectory("/dest/bulk/sub4"),
            "subdirectories should be created");
    std::string remote;
    t.check(fx.fs->fileContents("/dest/bulk/sub2/f007.bin", remote) &&
                remote == pattern(50 * 1024, 7),
            "uploaded content should match");
    t.check(fx.fs->maxConcurrentStreams() <= 12,
            "no more streams than workers should be open");
    const auto states = fx.statesFor(key);
    t.check(std::find(states.begin(), states.end(), TransferState::Scanning) !=
                states.end(),
            "folder transfers should report scanning");
}

void test_empty_folder_upload(TestContext &t) {
    Fixture fx;
    fx.fs->addDirectory("/dest");
    const QString root = fx.local("empty");
    QDir().mkpath(root);
    const QString key = fx.engine->startFolderUpload(kConn, root, "/dest");
    const TransferResult r = fx.wait(key, t);
    t.check(r.success && r.successfulFiles == 0,
            "empty folder should succeed with zero files");
    t.check(fx.fs->hasDirectory("/dest/empty"), "root should be created");
}

void test_folder_download(TestContext &t) {
    Fixture fx;
    fx.fs->addFile("/remote/tree/a.txt", "alpha", 1600000000);
    fx.fs->addFile("/remote/tree/sub/b.txt", "beta");
    fx.fs->addDirectory("/remote/tree/sub/empty");
    const QString key =
        fx.engine->startFolderDownload(kConn, "/remote/tree", fx.tmp.path());
    const TransferResult r = fx.wait(key, t);
    t.check(r.success && r.successfulFiles == 2, "folder download succeeds");
    std::string got;
    t.check(readLocal(fx.local("tree/sub/b.txt"), got) && got == "beta",
            "nested file should be downloaded");
    t.check(QFileInfo(fx.local("tree/sub/empty")).isDir(),
            "empty remote directories should be recreated");
}

void test_cancel_folder_download(TestContext &t) {
    EngineConfig cfg = testConfig();
    cfg.refreshDelayMs = 60000;
    Fixture fx(cfg);
    for (int i = 0; i < 100; ++i) {
        const std::string path = "/remote/batch/f" +
                                 QString::number(i).rightJustified(3, '0')
                                     .toStdString();
        fx.fs->addFile(path, pattern(4096, i));
        if (i >= 3)
            fx.fs->stallAt(Op::Read, path, 0);
    }

    const QString key =
        fx.engine->startFolderDownload(kConn, "/remote/batch", fx.tmp.path());
    const bool stalled = waitUntil(
        [&] {
            return fx.processedFiles.load() >= 3 &&
                   fx.fs->openStreams() == 12;
        },
        10000ms);
    t.check(stalled, "three files should finish and twelve streams stall");
    const std::size_t opensBefore = fx.fs->openLog().size();

    t.check(fx.engine->cancelTransfer(kConn, key), "cancel should match");
    const TransferResult r = fx.wait(key, t, 10000);
    t.check(r.cancelled && r.success, "cancel is reported as a success");
    t.check(r.successfulFiles == 3, "only the finished files count");
    t.check(r.failedFiles == 0, "cancelled files are not failures");
    t.check(fx.fs->openLog().size() == opensBefore,
            "no file should start after the cancel");
    t.check(fx.fs->openStreams() == 0, "every stream should be torn down");
    t.check(!fx.engine->registry().get(key), "key should leave the registry");
    t.check(!QFile::exists(fx.local("batch/f005.part")),
            "partial files of cancelled units should be removed");

    const auto events = fx.progressFor(key);
    t.check(!events.empty() && events.back().cancelled &&
                events.back().operationComplete,
            "a final cancelled event should be emitted");
    const auto states = fx.statesFor(key);
    t.check(!states.empty() && states.back() == TransferState::Cancelled,
            "state should end as cancelled");

    bool refreshQueued = false;
    for (const auto &p : fx.engine->operationQueue().pending(kConn))
        if (p.type == QueueOpType::Readdir && p.priority == QueuePriority::High &&
            p.path == "/remote")
            refreshQueued = true;
    t.check(refreshQueued, "a high priority refresh should be queued");
    t.check(!fx.engine->cancelTransfer(kConn, key),
            "a second cancel has nothing left to cancel");
}

void test_refresh_after_cancel(TestContext &t) {
    Fixture fx;
    fx.fs->addFile("/remote/slow.bin", pattern(8192));
    fx.fs->stallAt(Op::Read, "/remote/slow.bin", 100);
    std::atomic<int> refreshes{0};
    QObject::connect(fx.engine.get(), &TransferEngine::directoryRefreshed,
                     [&](const QString &, const QString &path,
                         const RemoteEntries &entries) {
                         if (path == "/remote" && entries.size() == 1)
                             ++refreshes;
                     });
    const QString key =
        fx.engine->startDownload(kConn, "/remote/slow.bin", fx.tmp.path());
    waitUntil([&] { return fx.fs->openStreams() == 1; }, 5000ms);
    t.check(fx.engine->cancelTransfer(kConn, key), "cancel should match");
    const TransferResult r = fx.wait(key, t, 10000);
    t.check(r.cancelled, "download should be cancelled");
    t.check(waitUntil([&] { return refreshes.load() == 1; }, 5000ms),
            "the working directory should be refreshed once");
}

void test_watchdog_recovers_stall(TestContext &t) {
    EngineConfig cfg = testConfig();
    cfg.watchdogMs = 200;
    cfg.watchdogLargeMs = 200;
    Fixture fx(cfg);
    const std::string payload = pattern(1000000, 3);
    fx.fs->addFile("/data/slow.bin", payload);
    fx.fs->stallAt(Op::Read, "/data/slow.bin", 300000);

    const QString key =
        fx.engine->startDownload(kConn, "/data/slow.bin", fx.local("slow.bin"));
    const TransferResult r = fx.wait(key, t, 20000);
    t.check(r.success, "download should recover from the stall");
    const auto opens = fx.fs->openLogFor("/data/slow.bin");
    t.check(opens.size() == 2 && opens[1].offset == 300000,
            "the retry should resume where the stall began");
    std::string got;
    t.check(readLocal(fx.local("slow.bin"), got) && got == payload,
            "content should be intact");
}

void test_metadata_facade(TestContext &t) {
    Fixture fx;
    fx.fs->seedSample();
    const OperationResult list = fx.engine->listDirectory(kConn, "/home").get();
    t.check(list.ok && list.entries.size() == 3, "listDirectory");
    const OperationResult st = fx.engine->statPath(kConn, "/readme.txt").get();
    t.check(st.ok && st.info.size == 1280, "statPath");

    openxfer::SftpError err;
    t.check(fx.engine->ensureRemoteDirectory(kConn, "/a/b/c", err),
            "ensureRemoteDirectory should create every level");
    t.check(fx.fs->hasDirectory("/a/b/c"), "nested directory should exist");
    t.check(fx.engine->ensureRemoteDirectory(kConn, "/a/b", err),
            "existing directories count as success");
    err.clear();
    t.check(!fx.engine->ensureRemoteDirectory(kConn, "/readme.txt/x", err) &&
                err.kind == openxfer::ErrorKind::NotADirectory,
            "a file in the path should report NotADirectory");

    t.check(fx.engine->makeDirectory(kConn, "/made").get().ok, "makeDirectory");
    t.check(fx.engine->renamePath(kConn, "/made", "/moved").get().ok,
            "renamePath");
    t.check(fx.engine->removePath(kConn, "/moved", true).get().ok, "removePath");
    t.check(!fx.fs->hasDirectory("/moved"), "directory should be removed");
}

void test_unknown_connection_and_cleanup(TestContext &t) {
    Fixture fx;
    t.check(fx.engine->startDownload("nope", "/x", fx.tmp.path()).isEmpty(),
            "unknown connection should not start");
    t.check(!fx.engine->cancelTransfer(kConn, "c1-download-0-0"),
            "nothing to cancel");

    fx.fs->addFile("/remote/s1.bin", pattern(4096));
    fx.fs->stallAt(Op::Read, "/remote/s1.bin", 0);
    const QString key =
        fx.engine->startDownload(kConn, "/remote/s1.bin", fx.tmp.path());
    waitUntil([&] { return fx.fs->openStreams() == 1; }, 5000ms);
    t.check(fx.engine->cleanupTransfersForConnection(kConn) == 1,
            "cleanup should cancel the running transfer");
    const TransferResult r = fx.wait(key, t, 10000);
    t.check(r.cancelled, "cleaned up transfer ends cancelled");
    fx.engine->disconnectSession(kConn);
    t.check(!fx.engine->sessionPool().hasConnection(kConn),
            "disconnect should drop the connection");
    t.check(fx.fs->sessionsConnected() == 0,
            "every session should be disconnected");
}

} // namespace

int main() {
    TestContext t;
    test_download_resumes_after_reset(t);
    test_download_application_error_not_retried(t);
    test_download_retries_exhausted(t);
    test_upload_resumes_at_remote_size(t);
    test_multi_upload_partial_failure(t);
    test_upload_duplicate_names(t);
    test_upload_to_missing_directory(t);
    test_folder_upload_many_small_files(t);
    test_empty_folder_upload(t);
    test_folder_download(t);
    test_cancel_folder_download(t);
    test_refresh_after_cancel(t);
    test_watchdog_recovers_stall(t);
    test_metadata_facade(t);
    test_unknown_connection_and_cleanup(t);
    test_cancel_during_retry_backoff(t);
    test_finished_results_are_released(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openxfer_transfer_tests\n";
    return EXIT_SUCCESS;
}
