// POSIX-style helpers for remote paths (always '/'-separated).
#pragma once
#include <QString>
#include <QStringList>

namespace RemotePath {

inline QString join(const QString &base, const QString &name) {
    if (base.isEmpty())
        return QStringLiteral("/") + name;
    if (base.endsWith('/'))
        return base + name;
    return base + '/' + name;
}

inline QString trimmed(const QString &path) {
    QString p = path;
    while (p.size() > 1 && p.endsWith('/'))
        p.chop(1);
    return p;
}

inline QString parent(const QString &path) {
    const QString p = trimmed(path);
    const int cut = p.lastIndexOf('/');
    if (cut <= 0)
        return QStringLiteral("/");
    return p.left(cut);
}

inline QString baseName(const QString &path) {
    const QString p = trimmed(path);
    const int cut = p.lastIndexOf('/');
    return cut < 0 ? p : p.mid(cut + 1);
}

// "/a/b/c" -> {"/a", "/a/b", "/a/b/c"}
inline QStringList components(const QString &path) {
    QStringList out;
    QString cur;
    const QStringList parts = path.split('/', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        cur += '/' + part;
        out << cur;
    }
    return out;
}

} // namespace RemotePath
