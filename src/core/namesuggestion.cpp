/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "namesuggestion.h"
#include "pathhelpers_p.h"

#include <KLocalizedString>

#include <QStringList>

namespace KTransact
{
std::pair<QString, QString> splitExtension(const QString &fileName)
{
    // Compound extensions that must not be split in the middle
    static const QStringList compoundExtensions = {
        QStringLiteral(".tar.gz"),
        QStringLiteral(".tar.bz2"),
        QStringLiteral(".tar.xz"),
        QStringLiteral(".tar.zst"),
        QStringLiteral(".tar.lz"),
        QStringLiteral(".tar.lzma"),
        QStringLiteral(".tar.Z"),
    };
    for (const QString &ext : compoundExtensions) {
        if (fileName.size() > ext.size() && fileName.endsWith(ext, Qt::CaseInsensitive)) {
            const int pos = fileName.size() - ext.size();
            return {fileName.left(pos), fileName.mid(pos)};
        }
    }

    const int dot = fileName.lastIndexOf(QLatin1Char('.'));
    if (dot <= 0) { // no dot, or a dot file
        return {fileName, QString()};
    }
    return {fileName.left(dot), fileName.mid(dot)};
}

QString suggestName(const QString &fileName, int attempt, NamingStyle style)
{
    if (attempt <= 0) {
        return fileName;
    }

    const auto [base, extension] = splitExtension(fileName);
    QString suffix;
    switch (style) {
    case CopyNaming:
        suffix = attempt == 1 ? i18nc("@item:intext suffix of a duplicated file name", "(Copy)")
                              : i18nc("@item:intext suffix of a duplicated file name, %1 is a number", "(Copy %1)", QString::number(attempt));
        break;
    case NumberedNaming:
        suffix = QStringLiteral("(%1)").arg(attempt + 1);
        break;
    }
    return base + QLatin1Char(' ') + suffix + extension;
}

QString findFreeName(const QString &path, NamingStyle style, const std::function<bool(const QString &)> &exists, int maxAttempts)
{
    const QString dir = Utils::parentPath(path);
    const QString fileName = Utils::fileName(path);
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        const QString candidate = concatPaths(dir, suggestName(fileName, attempt, style));
        if (!exists(candidate)) {
            return candidate;
        }
    }
    return QString();
}

NamingStyle namingStyleFor(FileOperation::Type type)
{
    return type == FileOperation::Copy ? CopyNaming : NumberedNaming;
}
}
