/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_FILEOPERATION_H
#define KTRANSACT_FILEOPERATION_H

#include "ktransactcore_export.h"
#include "trashitem.h"

#include <QFlags>
#include <QMetaType>
#include <QObject>
#include <QString>

class QDebug;

namespace KTransact
{
/*!
 * \class KTransact::FileOperation
 *
 * \brief Describes one mutating file operation: its kind and the payload that kind needs.
 *
 * Operations are created with the static factory functions and handed to
 * TransactionManager::addOperation(). Nothing else in the public API touches
 * the file system.
 *
 * \code
 * const QUuid id = manager->startTransaction(i18n("Move"));
 * manager->addOperation(id, KTransact::FileOperation::move(QStringLiteral("/a/f.txt"), QStringLiteral("/b/f.txt")));
 * manager->commit(id);
 * \endcode
 */
class KTRANSACTCORE_EXPORT FileOperation
{
    Q_GADGET
public:
    /*!
     * The kind of operation.
     *
     * \value Copy Copy source to destination (the full destination path)
     * \value Move Move source to destination (the full destination path)
     * \value Trash Move source to the trash
     * \value Restore Move a trashed item back to its original location, or to destination
     * \value Rename Rename source in place; destination is the new full path
     * \value CreateFolder Create the folder at source
     * \value CreateFile Create an empty file at source
     * \value CreateSymlink Create a symbolic link at destination pointing to linkTarget
     * \value EmptyTrash Permanently delete everything in the trash
     */
    enum Type {
        Copy,
        Move,
        Trash,
        Restore,
        Rename,
        CreateFolder,
        CreateFile,
        CreateSymlink,
        EmptyTrash,
    };
    Q_ENUM(Type)

    /*!
     * \value DefaultFlags
     * \value Overwrite Replace an existing destination instead of raising a conflict
     * \value AutoRename On a name collision pick a free name silently
     * \value Irreversible Never record this operation for undo
     */
    enum Flag {
        DefaultFlags = 0,
        Overwrite = 1,
        AutoRename = 2,
        Irreversible = 4,
    };
    Q_DECLARE_FLAGS(Flags, Flag)
    Q_FLAG(Flags)

    /*!
     * Constructs an invalid operation.
     */
    FileOperation();

    static FileOperation copy(const QString &src, const QString &dest, Flags flags = DefaultFlags);
    static FileOperation move(const QString &src, const QString &dest, Flags flags = DefaultFlags);
    static FileOperation trash(const QString &path);
    /*!
     * Restores \a item. If \a dest is empty the item goes back to its original path.
     */
    static FileOperation restore(const TrashItem &item, const QString &dest = QString(), Flags flags = DefaultFlags);
    /*!
     * Renames \a path to \a newName inside the same folder. \a newName must not contain a '/'.
     */
    static FileOperation rename(const QString &path, const QString &newName, Flags flags = DefaultFlags);
    static FileOperation createFolder(const QString &path, Flags flags = DefaultFlags);
    static FileOperation createFile(const QString &path, Flags flags = DefaultFlags);
    static FileOperation createSymlink(const QString &target, const QString &linkPath, Flags flags = DefaultFlags);
    static FileOperation emptyTrash();

    Type type() const;
    bool isValid() const;

    /*!
     * The path the operation reads from, or creates for CreateFolder and CreateFile.
     * For Restore this is the physical path inside the trash.
     */
    QString source() const;

    /*!
     * The full destination path, empty for kinds without one.
     */
    QString destination() const;
    void setDestination(const QString &dest);

    /*!
     * The file name part of destination(); the requested new name for Rename.
     */
    QString newName() const;

    QString linkTarget() const;
    TrashItem trashItem() const;

    Flags flags() const;
    void setFlags(Flags flags);

    /*!
     * The path this operation will write to and which may collide with an
     * existing entry. Empty for Trash and EmptyTrash.
     */
    QString targetPath() const;

    /*!
     * Changes the path returned by targetPath(), used when a conflict is resolved by renaming.
     */
    void setTargetPath(const QString &path);

    /*!
     * Returns true if a completed operation of this kind can be reverted.
     * Copy and EmptyTrash never are, nor anything flagged Irreversible.
     */
    bool isReversible() const;

    /*!
     * Returns true for Copy and Move, whose generated names use the "name (Copy)" pattern.
     */
    bool isCopyLike() const;

    /*!
     * Translated, human readable name of the kind, e.g. "Move".
     */
    static QString typeName(Type type);

    bool operator==(const FileOperation &other) const;

private:
    Type m_type = Copy;
    bool m_valid = false;
    Flags m_flags = DefaultFlags;
    QString m_src;
    QString m_dest;
    QString m_linkTarget;
    TrashItem m_trashItem;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(FileOperation::Flags)

KTRANSACTCORE_EXPORT QDebug operator<<(QDebug dbg, const FileOperation &op);
}

Q_DECLARE_METATYPE(KTransact::FileOperation)

#endif
