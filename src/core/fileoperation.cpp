/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "fileoperation.h"
#include "pathhelpers_p.h"

#include <KLocalizedString>

#include <QDebug>

using namespace KTransact;

FileOperation::FileOperation() = default;

FileOperation FileOperation::copy(const QString &src, const QString &dest, Flags flags)
{
    FileOperation op;
    op.m_type = Copy;
    op.m_valid = !src.isEmpty() && !dest.isEmpty();
    op.m_src = Utils::absoluteCleanPath(src);
    op.m_dest = Utils::absoluteCleanPath(dest);
    op.m_flags = flags;
    return op;
}

FileOperation FileOperation::move(const QString &src, const QString &dest, Flags flags)
{
    FileOperation op = copy(src, dest, flags);
    op.m_type = Move;
    return op;
}

FileOperation FileOperation::trash(const QString &path)
{
    FileOperation op;
    op.m_type = Trash;
    op.m_valid = !path.isEmpty();
    op.m_src = Utils::absoluteCleanPath(path);
    return op;
}

FileOperation FileOperation::restore(const TrashItem &item, const QString &dest, Flags flags)
{
    FileOperation op;
    op.m_type = Restore;
    op.m_valid = item.isValid();
    op.m_src = item.physicalPath;
    op.m_dest = Utils::absoluteCleanPath(dest);
    op.m_trashItem = item;
    op.m_flags = flags;
    return op;
}

FileOperation FileOperation::rename(const QString &path, const QString &newName, Flags flags)
{
    FileOperation op;
    op.m_type = Rename;
    op.m_valid = !path.isEmpty() && !newName.isEmpty() && !newName.contains(QLatin1Char('/'));
    op.m_src = Utils::absoluteCleanPath(path);
    if (op.m_valid) {
        op.m_dest = concatPaths(Utils::parentPath(op.m_src), newName);
    }
    op.m_flags = flags;
    return op;
}

FileOperation FileOperation::createFolder(const QString &path, Flags flags)
{
    FileOperation op;
    op.m_type = CreateFolder;
    op.m_valid = !path.isEmpty();
    op.m_src = Utils::absoluteCleanPath(path);
    op.m_flags = flags;
    return op;
}

FileOperation FileOperation::createFile(const QString &path, Flags flags)
{
    FileOperation op = createFolder(path, flags);
    op.m_type = CreateFile;
    return op;
}

FileOperation FileOperation::createSymlink(const QString &target, const QString &linkPath, Flags flags)
{
    FileOperation op;
    op.m_type = CreateSymlink;
    op.m_valid = !target.isEmpty() && !linkPath.isEmpty();
    op.m_linkTarget = target; // relative targets are kept as they are
    op.m_dest = Utils::absoluteCleanPath(linkPath);
    op.m_flags = flags;
    return op;
}

FileOperation FileOperation::emptyTrash()
{
    FileOperation op;
    op.m_type = EmptyTrash;
    op.m_valid = true;
    op.m_flags = Irreversible;
    return op;
}

FileOperation::Type FileOperation::type() const
{
    return m_type;
}

bool FileOperation::isValid() const
{
    return m_valid;
}

QString FileOperation::source() const
{
    return m_src;
}

QString FileOperation::destination() const
{
    return m_dest;
}

void FileOperation::setDestination(const QString &dest)
{
    m_dest = dest;
}

QString FileOperation::newName() const
{
    return Utils::fileName(targetPath());
}

QString FileOperation::linkTarget() const
{
    return m_linkTarget;
}

TrashItem FileOperation::trashItem() const
{
    return m_trashItem;
}

FileOperation::Flags FileOperation::flags() const
{
    return m_flags;
}

void FileOperation::setFlags(Flags flags)
{
    m_flags = flags;
}

QString FileOperation::targetPath() const
{
    switch (m_type) {
    case Copy:
    case Move:
    case Rename:
    case CreateSymlink:
        return m_dest;
    case Restore:
        return m_dest.isEmpty() ? m_trashItem.originalPath : m_dest;
    case CreateFolder:
    case CreateFile:
        return m_src;
    case Trash:
    case EmptyTrash:
        break;
    }
    return QString();
}

void FileOperation::setTargetPath(const QString &path)
{
    switch (m_type) {
    case Copy:
    case Move:
    case Rename:
    case CreateSymlink:
    case Restore:
        m_dest = path;
        break;
    case CreateFolder:
    case CreateFile:
        m_src = path;
        break;
    case Trash:
    case EmptyTrash:
        qWarning() << "setTargetPath called for an operation without a target" << m_type;
        break;
    }
}

bool FileOperation::isReversible() const
{
    if (m_flags.testFlag(Irreversible)) {
        return false;
    }
    return m_type != Copy && m_type != EmptyTrash;
}

bool FileOperation::isCopyLike() const
{
    return m_type == Copy || m_type == Move;
}

QString FileOperation::typeName(Type type)
{
    switch (type) {
    case Copy:
        return i18nc("@action file operation", "Copy");
    case Move:
        return i18nc("@action file operation", "Move");
    case Trash:
        return i18nc("@action file operation", "Trash");
    case Restore:
        return i18nc("@action file operation", "Restore");
    case Rename:
        return i18nc("@action file operation", "Rename");
    case CreateFolder:
        return i18nc("@action file operation", "Create Folder");
    case CreateFile:
        return i18nc("@action file operation", "Create File");
    case CreateSymlink:
        return i18nc("@action file operation", "Create Link");
    case EmptyTrash:
        return i18nc("@action file operation", "Empty Trash");
    }
    /* NOTREACHED */
    return QString();
}

bool FileOperation::operator==(const FileOperation &other) const
{
    return m_type == other.m_type && m_valid == other.m_valid && m_flags == other.m_flags && m_src == other.m_src && m_dest == other.m_dest
        && m_linkTarget == other.m_linkTarget && m_trashItem.fileId == other.m_trashItem.fileId;
}

QDebug KTransact::operator<<(QDebug dbg, const FileOperation &op)
{
    QDebugStateSaver saver(dbg);
    if (op.isValid()) {
        dbg.nospace() << "FileOperation(" << op.type() << " src=" << op.source() << " dest=" << op.destination() << " flags=" << op.flags() << ')';
    } else {
        dbg << "Invalid FileOperation";
    }
    return dbg;
}

#include "moc_fileoperation.cpp"
