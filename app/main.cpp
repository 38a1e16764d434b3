// Command-line driver: one connection, one command, progress on stderr.
#include "TransferEngine.hpp"
#include "openxfer/Libssh2SftpClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
Q_LOGGING_CATEGORY(ocCli, "openxfer.cli")

static std::atomic<bool> g_interrupted{false};

static void onSigint(int) { g_interrupted.store(true); }

static QString humanBytes(double bytes) {
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int u = 0;
    while (bytes >= 1024.0 && u < 4) {
        bytes /= 1024.0;
        ++u;
    }
    return QString::number(bytes, 'f', u == 0 ? 0 : 1) + ' ' + units[u];
}

static int printListing(QTextStream &out, const OperationResult &r) {
    if (!r.ok) {
        qCWarning(ocCli) << "List failed" << openxfer::describe(r.error).c_str();
        return 1;
    }
    for (const auto &e : r.entries) {
        out << (e.is_dir ? "d " : "- ") << QString::number(e.size).rightJustified(12)
            << ' ' << QString::fromStdString(e.name) << (e.is_dir ? "/" : "")
            << '\n';
    }
    out.flush();
    return 0;
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("openxfer");
    app.setOrganizationName("OpenXfer");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Parallel SFTP transfers.\n\n"
        "Commands:\n"
        "  ls <remote-dir>\n"
        "  get <remote-file> <local-path>\n"
        "  put <remote-dir> <local-file>...\n"
        "  get-dir <remote-dir> <local-dir>\n"
        "  put-dir <local-dir> <remote-dir>\n"
        "  mkdir <remote-dir>");
    parser.addHelpOption();
    QCommandLineOption hostOpt({"H", "host"}, "Server host.", "host");
    QCommandLineOption portOpt({"p", "port"}, "Server port.", "port", "22");
    QCommandLineOption userOpt({"u", "user"}, "User name.", "user");
    QCommandLineOption keyOpt({"i", "identity"}, "Private key file.", "path");
    QCommandLineOption knownHostsOpt("known-hosts", "known_hosts file.", "path");
    QCommandLineOption policyOpt(
        "host-key-policy", "strict, accept-new or off.", "policy", "strict");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Engine debug logging.");
    parser.addOption(hostOpt);
    parser.addOption(portOpt);
    parser.addOption(userOpt);
    parser.addOption(keyOpt);
    parser.addOption(knownHostsOpt);
    parser.addOption(policyOpt);
    parser.addOption(verboseOpt);
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    if (!parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules("openxfer.*.info=false\n"
                                         "openxfer.*.debug=false");

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || !parser.isSet(hostOpt) || !parser.isSet(userOpt)) {
        parser.showHelp(2);
    }
    const QString cmd = args.first();
    const QStringList rest = args.mid(1);

    openxfer::SessionOptions opt;
    opt.host = parser.value(hostOpt).toStdString();
    opt.port = static_cast<std::uint16_t>(parser.value(portOpt).toUInt());
    opt.username = parser.value(userOpt).toStdString();
    const QByteArray pw = qgetenv("OPEN_XFER_PASSWORD");
    if (!pw.isEmpty())
        opt.password = pw.toStdString();
    if (parser.isSet(keyOpt))
        opt.private_key_path = parser.value(keyOpt).toStdString();
    if (parser.isSet(knownHostsOpt))
        opt.known_hosts_path = parser.value(knownHostsOpt).toStdString();
    const QString policy = parser.value(policyOpt).toLower();
    if (policy == "accept-new")
        opt.known_hosts_policy = openxfer::KnownHostsPolicy::AcceptNew;
    else if (policy == "off")
        opt.known_hosts_policy = openxfer::KnownHostsPolicy::Off;

    EngineConfig cfg;
    QSettings settings("OpenXfer", "OpenXfer");
    cfg.load(settings);
    TransferEngine engine(cfg);

    const QString conn = QStringLiteral("cli");
    openxfer::SftpError err;
    if (!engine.connectSession(conn,
                               std::make_unique<openxfer::Libssh2SftpClient>(),
                               opt, err)) {
        qCCritical(ocCli) << "Connection failed:"
                          << openxfer::describe(err).c_str();
        return 1;
    }

    QTextStream out(stdout);
    if (cmd == "ls") {
        const QString dir = rest.value(0, QStringLiteral("/"));
        const int rc = printListing(out, engine.listDirectory(conn, dir).get());
        engine.disconnectSession(conn);
        return rc;
    }
    if (cmd == "mkdir") {
        if (rest.size() != 1)
            parser.showHelp(2);
        const bool ok = engine.ensureRemoteDirectory(conn, rest[0], err);
        if (!ok)
            qCCritical(ocCli) << "mkdir failed:" << openxfer::describe(err).c_str();
        engine.disconnectSession(conn);
        return ok ? 0 : 1;
    }

    // A transfer may finish before exec() runs.
    QObject::connect(
        &engine, &TransferEngine::transferProgress, &app,
        [](const TransferProgressEvent &ev) {
            std::fprintf(stderr, "\r%3d%%  %s / %s  %s/s  %d/%d  %-40s",
                         ev.progress,
                         qPrintable(humanBytes(double(ev.transferredBytes))),
                         qPrintable(humanBytes(double(ev.totalBytes))),
                         qPrintable(humanBytes(ev.transferSpeed)),
                         ev.processedFiles, ev.totalFiles,
                         qPrintable(ev.fileName.left(40)));
            if (ev.operationComplete)
                std::fprintf(stderr, "\n");
        },
        Qt::QueuedConnection);
    QObject::connect(
        &engine, &TransferEngine::transferFinished, &app,
        [&app](const TransferResult &r) {
            for (const auto &f : r.failures)
                qCWarning(ocCli) << "Failed:" << f.path
                                 << openxfer::describe(f.error).c_str();
            if (r.cancelled)
                app.exit(130);
            else
                app.exit(r.success ? 0 : 1);
        },
        Qt::QueuedConnection);

    QString key;
    if (cmd == "get" && rest.size() == 2)
        key = engine.startDownload(conn, rest[0], rest[1]);
    else if (cmd == "put" && rest.size() >= 2)
        key = engine.startUpload(conn, rest[0], rest.mid(1));
    else if (cmd == "get-dir" && rest.size() == 2)
        key = engine.startFolderDownload(conn, rest[0], rest[1]);
    else if (cmd == "put-dir" && rest.size() == 2)
        key = engine.startFolderUpload(conn, rest[0], rest[1]);
    else
        parser.showHelp(2);
    if (key.isEmpty()) {
        qCCritical(ocCli) << "Transfer could not start";
        return 1;
    }

    std::signal(SIGINT, onSigint);
    QTimer sigPoll;
    QObject::connect(&sigPoll, &QTimer::timeout, &app, [&]() {
        if (!g_interrupted.exchange(false))
            return;
        qCInfo(ocCli) << "Interrupted, cancelling" << key;
        engine.cancelTransfer(conn, key);
    });
    sigPoll.start(100);

    const int rc = app.exec();
    sigPoll.stop();
    if (!engine.waitForTransfer(key, 5000))
        qCWarning(ocCli) << "Transfer did not stop in time" << key;
    engine.disconnectSession(conn);
    return rc;
}
