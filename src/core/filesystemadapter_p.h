/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2022 Harald Sitter <sitter@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only OR LGPL-3.0-only OR LicenseRef-KDE-Accepted-LGPL
*/

#ifndef KTRANSACT_FILESYSTEMADAPTER_P_H
#define KTRANSACT_FILESYSTEMADAPTER_P_H

#include "global.h"
#include "ktransactcore_export.h"
#include "trashitem.h"

#include <QDateTime>
#include <QFlags>
#include <QStringList>

#include <atomic>
#include <functional>
#include <memory>

namespace KTransact
{
class AdapterResultPrivate;

/*!
 * \class KTransact::AdapterResult
 *
 * \brief The result of a FileSystemAdapter primitive.
 *
 * Either a success, carrying the actual absolute path the primitive
 * produced, or a failure with an error code from KTransact::Error and
 * the path or message the error relates to.
 */
class KTRANSACTCORE_EXPORT AdapterResult
{
public:
    /// Use fail() or pass();
    AdapterResult() = delete;
    ~AdapterResult();
    AdapterResult(const AdapterResult &);
    AdapterResult &operator=(const AdapterResult &);
    AdapterResult(AdapterResult &&) noexcept;
    AdapterResult &operator=(AdapterResult &&) noexcept;

    /*!
     * Whether or not the result was a success.
     */
    bool success() const;
    /*!
     * The error code (or ERR_UNKNOWN) of the result, 0 on success.
     */
    int error() const;
    /*!
     * The error text, usually the path the error relates to.
     */
    QString errorText() const;
    /*!
     * The resulting absolute path, if the primitive produces one.
     */
    QString path() const;

    /*!
     * Constructs a failure result.
     */
    Q_REQUIRED_RESULT static AdapterResult fail(int _error = KTransact::ERR_UNKNOWN, const QString &_errorText = QString());
    /*!
     * Constructs a success result.
     */
    Q_REQUIRED_RESULT static AdapterResult pass(const QString &_path = QString());

private:
    KTRANSACTCORE_NO_EXPORT explicit AdapterResult(std::unique_ptr<AdapterResultPrivate> &&dptr);
    std::unique_ptr<AdapterResultPrivate> d;
};

/*!
 * What stat() found at a path. Symbolic links are not followed.
 */
struct FileStat {
    enum Type {
        NotFound,
        File,
        Directory,
        Symlink,
        Other,
    };
    Type type = NotFound;
    filesize_t size = 0;
    QDateTime modificationTime;
    QString linkTarget;

    bool exists() const
    {
        return type != NotFound;
    }
    bool isDir() const
    {
        return type == Directory;
    }
};

/*!
 * \class KTransact::FileSystemAdapter
 *
 * \brief Synchronous, blocking file system primitives used by the transaction engine.
 *
 * Every primitive runs to completion in the calling thread and returns an
 * AdapterResult. Implementations must allow concurrent calls from several
 * worker threads.
 *
 * The adapter is handed to the TransactionManager, which owns it; there is
 * no way to reach it from outside the engine.
 */
class KTRANSACTCORE_EXPORT FileSystemAdapter
{
public:
    /*!
     * \value DefaultFlags
     * \value Overwrite Replace an existing destination
     */
    enum Flag {
        DefaultFlags = 0,
        Overwrite = 1,
    };
    Q_DECLARE_FLAGS(Flags, Flag)

    /// processed bytes, total bytes of the file being copied
    typedef std::function<void(filesize_t, filesize_t)> ProgressCallback;

    virtual ~FileSystemAdapter();

    /*!
     * Fills \a info for \a path without following symbolic links.
     * A missing path is not an error: info.type is NotFound and the result passes.
     */
    virtual AdapterResult stat(const QString &path, FileStat &info) const = 0;

    /*!
     * Convenience wrapper around stat().
     */
    bool exists(const QString &path) const;

    /*!
     * Lists the entries of \a path, without "." and "..", sorted by name.
     */
    virtual AdapterResult listDirectory(const QString &path, QStringList &entries) const = 0;

    /*!
     * Copies a regular file or a symbolic link (as a link) from \a src to \a dest.
     * The copy honours \a cancel between chunks and removes the partial file when cancelled.
     */
    virtual AdapterResult
    copyFile(const QString &src, const QString &dest, Flags flags, const ProgressCallback &progress = {}, const CancelToken &cancel = {}) = 0;

    /*!
     * Moves \a src to \a dest with rename(2) semantics. Fails with ERR_CROSS_DEVICE
     * when both are on different file systems, and with ERR_WOULD_MERGE when
     * \a src is a folder and \a dest an existing folder while Overwrite is set.
     */
    virtual AdapterResult move(const QString &src, const QString &dest, Flags flags) = 0;

    /*!
     * Renames \a path to \a newName in the same folder; the result carries the new path.
     */
    virtual AdapterResult rename(const QString &path, const QString &newName, Flags flags) = 0;

    /*!
     * Creates the folder \a path. The parent must exist. Fails with ERR_DIR_ALREADY_EXIST
     * or ERR_FILE_ALREADY_EXIST if something is in the way.
     */
    virtual AdapterResult makeDirectory(const QString &path) = 0;

    /*!
     * Creates an empty regular file, failing if \a path exists unless Overwrite is set.
     */
    virtual AdapterResult createFile(const QString &path, Flags flags) = 0;

    virtual AdapterResult createSymlink(const QString &target, const QString &linkPath, Flags flags) = 0;

    /*!
     * Removes a file, a symbolic link or an empty folder.
     */
    virtual AdapterResult remove(const QString &path) = 0;

    /*!
     * Moves \a path to the trash and fills \a item with the new trash entry.
     */
    virtual AdapterResult trash(const QString &path, TrashItem &item) = 0;

    /*!
     * Moves \a item out of the trash to \a dest, or to its original path if \a dest is empty.
     */
    virtual AdapterResult restore(const TrashItem &item, const QString &dest, Flags flags) = 0;

    virtual AdapterResult listTrash(TrashItemList &items) = 0;

    /*!
     * Permanently deletes the content of the trash. Entries that could not be
     * removed keep their info file so that they remain listed.
     */
    virtual AdapterResult emptyTrash() = 0;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(FileSystemAdapter::Flags)
}

#endif
