/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRASHIMPL_P_H
#define KTRANSACT_TRASHIMPL_P_H

#include "filesystemadapter_p.h"
#include "trashitem.h"

#include <QString>

namespace KTransact
{
/**
 * Bookkeeping of the home trash, $XDG_DATA_HOME/Trash.
 *
 * The structure of the trash directory follows the freedesktop.org standard:
 * files/ holds the trashed entries, info/ one <fileId>.trashinfo per entry.
 *
 * TrashImpl only deals with the info files and the layout; moving data in
 * and out of files/ is done by LocalFileSystemAdapter. Not thread-safe,
 * callers serialize access.
 */
class TrashImpl
{
public:
    TrashImpl();

    /// Check the trash directory and its info and files subdirs
    AdapterResult init();

    /// Create a .trashinfo file for origPath; fileId receives the chosen id
    AdapterResult createInfo(const QString &origPath, QString &fileId);
    bool deleteInfo(const QString &fileId);

    AdapterResult list(TrashItemList &items);
    bool infoForFile(const QString &fileId, TrashItem &item);

    QString trashDirectory() const;
    QString infoPath(const QString &fileId) const;
    QString filesPath(const QString &fileId) const;

    /// Entries of files/ that have no info file
    QStringList orphanedFiles() const;

    static filesize_t sizeOfPath(const QString &path);

private:
    AdapterResult testDir(const QString &name) const;
    bool readInfoFile(const QString &infoPath, TrashItem &item);

    enum { InitToBeDone, InitOK, InitError } m_initStatus;
    QString m_trashDir;
};
}

#endif
