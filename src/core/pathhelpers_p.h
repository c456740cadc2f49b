/*
    This file is part of the KDE project.
    SPDX-FileCopyrightText: 2017 Anthony Fieroni <bvbfan@abv.bg>
    SPDX-FileCopyrightText: 2022 Ahmad Samir <a.samirh78@gmail.com>

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_PATHHELPERS_P_H
#define KTRANSACT_PATHHELPERS_P_H

#include <QDir>
#include <QString>

inline QString concatPaths(const QString &path1, const QString &path2)
{
    Q_ASSERT(!path2.startsWith(QLatin1Char('/')));

    if (path1.isEmpty()) {
        return path2;
    } else if (!path1.endsWith(QLatin1Char('/'))) {
        return path1 + QLatin1Char('/') + path2;
    } else {
        return path1 + path2;
    }
}

inline bool isAbsoluteLocalPath(const QString &path)
{
    // QDir::isAbsolutePath() will return true if "path" starts with ':', the latter denotes a
    // Qt Resource (qrc).
    // "Local" as in on local disk not in memory (qrc)
    return !path.startsWith(QLatin1Char(':')) && QDir::isAbsolutePath(path);
}

namespace Utils
{
inline void removeTrailingSlash(QString &path)
{
    if (path.size() > 1 && path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
}

/**
 * Returns @p path made absolute against the current directory, cleaned,
 * and without a trailing slash.
 */
[[nodiscard]] inline QString absoluteCleanPath(const QString &path)
{
    if (path.isEmpty()) {
        return path;
    }
    QString result = QDir::cleanPath(QDir::isAbsolutePath(path) ? path : QDir::current().absoluteFilePath(path));
    removeTrailingSlash(result);
    return result;
}

/**
 * The folder containing @p path, e.g. "/a" for "/a/b".
 */
[[nodiscard]] inline QString parentPath(const QString &path)
{
    const int idx = path.lastIndexOf(QLatin1Char('/'));
    if (idx <= 0) {
        return QStringLiteral("/");
    }
    return path.left(idx);
}

/**
 * The last component of @p path.
 */
[[nodiscard]] inline QString fileName(const QString &path)
{
    return path.mid(path.lastIndexOf(QLatin1Char('/')) + 1);
}

/**
 * Whether @p path is @p dir itself or located somewhere below it.
 */
[[nodiscard]] inline bool isSameOrInside(const QString &path, const QString &dir)
{
    return path == dir || path.startsWith(dir.endsWith(QLatin1Char('/')) ? dir : dir + QLatin1Char('/'));
}
}

#endif /* KTRANSACT_PATHHELPERS_P_H */
