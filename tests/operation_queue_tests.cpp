// Operation queue: priority order, merging, delays, clearing and recovery.
#include "OperationQueue.hpp"
#include "SessionPool.hpp"
#include "openxfer/MockSftpClient.hpp"

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
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
};

using namespace std::chrono_literals;

struct Fixture {
    EngineConfig cfg;
    std::shared_ptr<openxfer::MockRemoteFs> fs =
        std::make_shared<openxfer::MockRemoteFs>();
    SessionPool pool{cfg};
    OperationQueue queue{pool, cfg};

    Fixture() {
        cfg.sessionCreateBackoffMs = 1;
        fs->seedSample();
        openxfer::SessionOptions opt;
        opt.host = "example.test";
        opt.username = "alice";
        openxfer::SftpError err;
        pool.openConnection("c1", std::make_unique<openxfer::MockSftpClient>(fs),
                            opt, err);
    }
};

// Occupies the worker until open() is called.
struct Gate {
    std::promise<void> release;
    std::shared_future<void> opened = release.get_future().share();
    std::promise<void> entered;

    OperationFuture block(OperationQueue &q) {
        auto opened_ = opened;
        auto enteredPtr = &entered;
        OperationFuture f = q.enqueue(
            "c1", QueueRequest(QueueOpType::Stat, "/gate"),
            [opened_, enteredPtr](openxfer::SftpClient &, OperationResult &) {
                enteredPtr->set_value();
                opened_.wait();
                return true;
            });
        entered.get_future().wait();
        return f;
    }
    void open() { release.set_value(); }
};

OperationWork recorder(std::vector<std::string> &order, std::mutex &mtx,
                       const std::string &tag) {
    return [&order, &mtx, tag](openxfer::SftpClient &, OperationResult &) {
        std::lock_guard<std::mutex> lk(mtx);
        order.push_back(tag);
        return true;
    };
}

void test_priority_order(TestContext &t) {
    Fixture fx;
    Gate gate;
    auto g = gate.block(fx.queue);

    std::vector<std::string> order;
    std::mutex mtx;
    auto low = fx.queue.enqueue(
        "c1", QueueRequest(QueueOpType::Stat, "/low", QueuePriority::Low),
        recorder(order, mtx, "low"));
    auto high = fx.queue.enqueue(
        "c1", QueueRequest(QueueOpType::Stat, "/high", QueuePriority::High),
        recorder(order, mtx, "high"));
    auto normal = fx.queue.enqueue(
        "c1", QueueRequest(QueueOpType::Stat, "/normal", QueuePriority::Normal),
        recorder(order, mtx, "normal"));

    const auto snapshot = fx.queue.pending("c1");
    t.check(snapshot.size() == 3, "three entries should be pending");
    if (snapshot.size() == 3)
        t.check(snapshot[0].priority == QueuePriority::High &&
                    snapshot[2].priority == QueuePriority::Low,
                "pending snapshot should be sorted by priority");

    gate.open();
    g.wait();
    low.wait();
    high.wait();
    normal.wait();
    t.check(order == std::vector<std::string>({"high", "normal", "low"}),
            "execution order should be high, normal, low");
}

void test_fifo_within_priority(TestContext &t) {
    Fixture fx;
    Gate gate;
    auto g = gate.block(fx.queue);
    std::vector<std::string> order;
    std::mutex mtx;
    std::vector<OperationFuture> fs;
    for (int i = 0; i < 5; ++i)
        fs.push_back(fx.queue.enqueue(
            "c1", QueueRequest(QueueOpType::Stat, QString("/p%1").arg(i)),
            recorder(order, mtx, std::to_string(i))));
    gate.open();
    for (auto &f : fs)
        f.wait();
    t.check(order == std::vector<std::string>({"0", "1", "2", "3", "4"}),
            "equal priority should run in arrival order");
}

void test_merge(TestContext &t) {
    Fixture fx;
    Gate gate;
    auto g = gate.block(fx.queue);

    auto a = fx.queue.readdir("c1", "/home", QueuePriority::Low);
    auto b = fx.queue.readdir("c1", "/home", QueuePriority::High);
    auto other = fx.queue.readdir("c1", "/var");
    auto unmerged = fx.queue.readdir("c1", "/home", QueuePriority::Normal, false);

    const auto snapshot = fx.queue.pending("c1");
    t.check(snapshot.size() == 3, "mergeable duplicate should share an entry");
    if (!snapshot.empty()) {
        t.check(snapshot[0].path == "/home" && snapshot[0].subscribers == 2 &&
                    snapshot[0].priority == QueuePriority::High,
                "merged entry should carry both subscribers and the higher "
                "priority");
    }

    gate.open();
    const OperationResult &ra = a.get();
    const OperationResult &rb = b.get();
    t.check(ra.ok && rb.ok, "merged subscribers should both succeed");
    t.check(ra.entries.size() == 3 && rb.entries.size() == 3,
            "merged subscribers should get the same listing");
    t.check(other.get().ok && unmerged.get().ok, "other entries should run");

    int homeLists = 0;
    for (const auto &p : fx.fs->listLog())
        if (p == "/home")
            ++homeLists;
    t.check(homeLists == 2, "merged entry should list once, unmerged once more");
}

void test_delay_does_not_block(TestContext &t) {
    Fixture fx;
    std::vector<std::string> order;
    std::mutex mtx;
    auto delayed = fx.queue.enqueue(
        "c1",
        QueueRequest(QueueOpType::Readdir, "/home", QueuePriority::High, true,
                     200ms),
        recorder(order, mtx, "delayed"));
    auto now = fx.queue.enqueue(
        "c1", QueueRequest(QueueOpType::Stat, "/var", QueuePriority::Low),
        recorder(order, mtx, "now"));
    now.wait();
    t.check(delayed.wait_for(0ms) != std::future_status::ready,
            "delayed entry should not have run yet");
    delayed.wait();
    t.check(order == std::vector<std::string>({"now", "delayed"}),
            "a delayed entry should not hold back later entries");
}

void test_clear_pending(TestContext &t) {
    Fixture fx;
    Gate gate;
    auto g = gate.block(fx.queue);
    auto s1 = fx.queue.stat("c1", "/readme.txt");
    auto s2 = fx.queue.readdir("c1", "/home");
    const int dropped =
        fx.queue.clearPendingForConnection("c1", "Transfer cancelled");
    t.check(dropped == 2, "both pending entries should be dropped");
    const OperationResult &r = s1.get();
    t.check(!r.ok && r.error.kind == openxfer::ErrorKind::Cancelled,
            "dropped entry should resolve as cancelled");
    t.check(r.error.message == "Transfer cancelled",
            "dropped entry should carry the reason");
    t.check(!s2.get().ok, "second dropped entry should resolve too");
    gate.open();
    t.check(g.get().ok, "running entry should be left alone");
    t.check(fx.queue.waitIdle("c1", 2000ms), "queue should drain");
}

void test_fault_recovery(TestContext &t) {
    Fixture fx;
    fx.fs->failNextMetadataOps(1, openxfer::ErrorKind::ConnectionReset);
    auto r = fx.queue.readdir("c1", "/home").get();
    t.check(r.ok, "transport fault should be recovered and re-run");
    t.check(fx.pool.stats("c1").recoveries == 1,
            "primary should be re-established once");

    fx.fs->failNextMetadataOps(1, openxfer::ErrorKind::PermissionDenied);
    auto denied = fx.queue.readdir("c1", "/home").get();
    t.check(!denied.ok &&
                denied.error.kind == openxfer::ErrorKind::PermissionDenied,
            "application errors should surface without recovery");
    t.check(fx.pool.stats("c1").recoveries == 1,
            "application errors should not trigger recovery");
}

void test_mkdir_semantics(TestContext &t) {
    Fixture fx;
    t.check(fx.queue.mkdir("c1", "/home/new").get().ok, "mkdir should create");
    t.check(fx.fs->hasDirectory("/home/new"), "directory should exist");
    t.check(fx.queue.mkdir("c1", "/home/new").get().ok,
            "mkdir on an existing directory should succeed");
    const OperationResult r = fx.queue.mkdir("c1", "/readme.txt").get();
    t.check(!r.ok && r.error.kind == openxfer::ErrorKind::NotADirectory,
            "mkdir on a file should report NotADirectory");
}

void test_rename_and_remove(TestContext &t) {
    Fixture fx;
    t.check(fx.queue.rename("c1", "/readme.txt", "/README").get().ok,
            "rename should succeed");
    t.check(fx.fs->hasFile("/README"), "renamed file should exist");
    t.check(fx.queue.remove("c1", "/README", false).get().ok,
            "remove should succeed");
    t.check(!fx.fs->hasFile("/README"), "removed file should be gone");
    const OperationResult r = fx.queue.remove("c1", "/home", true).get();
    t.check(!r.ok, "removing a non-empty directory should fail");
}

void test_invalid_and_closed(TestContext &t) {
    Fixture fx;
    auto bad = fx.queue.enqueue("c1", QueueRequest(QueueOpType::Stat, ""),
                                [](openxfer::SftpClient &, OperationResult &) {
                                    return true;
                                });
    t.check(bad.get().error.kind == openxfer::ErrorKind::InvalidArgument,
            "entries without a path should be rejected");
    auto unknown = fx.queue.stat("other", "/").get();
    t.check(!unknown.ok && unknown.error.kind == openxfer::ErrorKind::NotConnected,
            "unknown connection should fail with NotConnected");

    Gate gate;
    auto g = gate.block(fx.queue);
    auto pending = fx.queue.stat("c1", "/readme.txt");
    gate.open();
    fx.queue.closeConnection("c1");
    t.check(pending.wait_for(0ms) == std::future_status::ready,
            "closing should resolve every pending entry");
}

} // namespace

int main() {
    TestContext t;
    test_priority_order(t);
    test_fifo_within_priority(t);
    test_merge(t);
    test_delay_does_not_block(t);
    test_clear_pending(t);
    test_fault_recovery(t);
    test_mkdir_semantics(t);
    test_rename_and_remove(t);
    test_invalid_and_closed(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openxfer_operation_queue_tests\n";
    return EXIT_SUCCESS;
}
