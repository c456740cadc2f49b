/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_LOCALFILESYSTEMADAPTER_P_H
#define KTRANSACT_LOCALFILESYSTEMADAPTER_P_H

#include "filesystemadapter_p.h"
#include "ktransactcore_export.h"

#include <memory>

namespace KTransact
{
class LocalFileSystemAdapterPrivate;

/*!
 * \class KTransact::LocalFileSystemAdapter
 *
 * \brief FileSystemAdapter for local paths, using POSIX calls and the
 * freedesktop.org home trash in $XDG_DATA_HOME/Trash.
 */
class KTRANSACTCORE_EXPORT LocalFileSystemAdapter : public FileSystemAdapter
{
public:
    LocalFileSystemAdapter();
    ~LocalFileSystemAdapter() override;

    AdapterResult stat(const QString &path, FileStat &info) const override;
    AdapterResult listDirectory(const QString &path, QStringList &entries) const override;
    AdapterResult copyFile(const QString &src, const QString &dest, Flags flags, const ProgressCallback &progress, const CancelToken &cancel) override;
    AdapterResult move(const QString &src, const QString &dest, Flags flags) override;
    AdapterResult rename(const QString &path, const QString &newName, Flags flags) override;
    AdapterResult makeDirectory(const QString &path) override;
    AdapterResult createFile(const QString &path, Flags flags) override;
    AdapterResult createSymlink(const QString &target, const QString &linkPath, Flags flags) override;
    AdapterResult remove(const QString &path) override;
    AdapterResult trash(const QString &path, TrashItem &item) override;
    AdapterResult restore(const TrashItem &item, const QString &dest, Flags flags) override;
    AdapterResult listTrash(TrashItemList &items) override;
    AdapterResult emptyTrash() override;

    /*!
     * The home trash directory, created on first use.
     */
    QString trashDirectory() const;

private:
    std::unique_ptr<LocalFileSystemAdapterPrivate> const d;
};
}

#endif
