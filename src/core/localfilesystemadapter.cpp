/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000-2002 Stephan Kulow <coolo@kde.org>
    SPDX-FileCopyrightText: 2000-2002 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "localfilesystemadapter_p.h"
#include "ktransactcoredebug.h"
#include "ktransacttrashdebug.h"
#include "pathhelpers_p.h"
#include "trashimpl_p.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <qplatformdefs.h>

#include <array>
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

using namespace KTransact;

static constexpr int s_copyChunkSize = 64 * 1024;

static bool same_inode(const QT_STATBUF &src, const QT_STATBUF &dest)
{
    return src.st_ino == dest.st_ino && src.st_dev == dest.st_dev;
}

static AdapterResult alreadyExists(const QString &path, bool isDir)
{
    return AdapterResult::fail(isDir ? ERR_DIR_ALREADY_EXIST : ERR_FILE_ALREADY_EXIST, path);
}

class KTransact::LocalFileSystemAdapterPrivate
{
public:
    explicit LocalFileSystemAdapterPrivate(LocalFileSystemAdapter *qq)
        : q(qq)
    {
    }

    // rename(2), falling back to copy+delete across file systems
    AdapterResult moveAcrossDevices(const QString &src, const QString &dest);
    AdapterResult copyTree(const QString &src, const QString &dest);
    AdapterResult removeTree(const QString &path);

    LocalFileSystemAdapter *const q;
    TrashImpl m_trash;
    QMutex m_trashMutex; // guards m_trash and the .trashinfo files, not the data moves
};

AdapterResult LocalFileSystemAdapterPrivate::moveAcrossDevices(const QString &src, const QString &dest)
{
    // Do not use QFile::rename here, we need to be able to move broken symlinks too
    // (and we need to make sure errno is set)
    if (::rename(QFile::encodeName(src).constData(), QFile::encodeName(dest).constData()) == 0) {
        return AdapterResult::pass(dest);
    }
    if (errno != EXDEV) {
        if (errno == EROFS) { // The file is on a read-only filesystem
            return AdapterResult::fail(ERR_CANNOT_DELETE, src);
        }
        return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_RENAME), src);
    }

    qCDebug(KTRANSACT_TRASH) << "rename across devices, copying" << src << "to" << dest;
    const AdapterResult copied = copyTree(src, dest);
    if (!copied.success()) {
        // don't keep a partial copy
        const AdapterResult cleanup = removeTree(dest);
        if (!cleanup.success()) {
            qCWarning(KTRANSACT_TRASH) << "could not remove partial copy" << dest << cleanup.errorText();
        }
        return copied;
    }
    const AdapterResult removed = removeTree(src);
    if (!removed.success()) {
        return AdapterResult::fail(ERR_CANNOT_DELETE_ORIGINAL, src);
    }
    return AdapterResult::pass(dest);
}

AdapterResult LocalFileSystemAdapterPrivate::copyTree(const QString &src, const QString &dest)
{
    FileStat info;
    const AdapterResult statResult = q->stat(src, info);
    if (!statResult.success()) {
        return statResult;
    }
    if (!info.exists()) {
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
    }
    if (!info.isDir()) {
        return q->copyFile(src, dest, FileSystemAdapter::DefaultFlags);
    }

    const AdapterResult mkdirResult = q->makeDirectory(dest);
    if (!mkdirResult.success()) {
        return mkdirResult;
    }
    QStringList entries;
    const AdapterResult listResult = q->listDirectory(src, entries);
    if (!listResult.success()) {
        return listResult;
    }
    for (const QString &entry : std::as_const(entries)) {
        const AdapterResult result = copyTree(concatPaths(src, entry), concatPaths(dest, entry));
        if (!result.success()) {
            return result;
        }
    }
    return AdapterResult::pass(dest);
}

AdapterResult LocalFileSystemAdapterPrivate::removeTree(const QString &path)
{
    FileStat info;
    const AdapterResult statResult = q->stat(path, info);
    if (!statResult.success()) {
        return statResult;
    }
    if (!info.exists()) {
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, path);
    }
    if (info.isDir()) {
        // First ensure that the dir has u+w permissions,
        // otherwise we won't be able to delete files in it (#130780).
        QT_STATBUF buff;
        const QByteArray path_c = QFile::encodeName(path);
        if (QT_LSTAT(path_c.constData(), &buff) == 0 && (buff.st_mode & S_IWUSR) == 0) {
            ::chmod(path_c.constData(), buff.st_mode | S_IWUSR | S_IXUSR);
        }
        QStringList entries;
        const AdapterResult listResult = q->listDirectory(path, entries);
        if (!listResult.success()) {
            return listResult;
        }
        for (const QString &entry : std::as_const(entries)) {
            const AdapterResult result = removeTree(concatPaths(path, entry));
            if (!result.success()) {
                return result;
            }
        }
    }
    return q->remove(path);
}

LocalFileSystemAdapter::LocalFileSystemAdapter()
    : d(new LocalFileSystemAdapterPrivate(this))
{
}

LocalFileSystemAdapter::~LocalFileSystemAdapter() = default;

AdapterResult LocalFileSystemAdapter::stat(const QString &path, FileStat &info) const
{
    info = FileStat();
    const QByteArray path_c = QFile::encodeName(path);
    QT_STATBUF buff;
    if (QT_LSTAT(path_c.constData(), &buff) == -1) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return AdapterResult::pass(path);
        }
        if (errno == EACCES) {
            return AdapterResult::fail(ERR_ACCESS_DENIED, path);
        }
        return AdapterResult::fail(ERR_CANNOT_STAT, path);
    }

    if (S_ISLNK(buff.st_mode)) {
        info.type = FileStat::Symlink;
        std::array<char, PATH_MAX + 1> buffer;
        const ssize_t n = ::readlink(path_c.constData(), buffer.data(), PATH_MAX);
        if (n >= 0) {
            info.linkTarget = QFile::decodeName(QByteArray(buffer.data(), n));
        }
    } else if (S_ISDIR(buff.st_mode)) {
        info.type = FileStat::Directory;
    } else if (S_ISREG(buff.st_mode)) {
        info.type = FileStat::File;
    } else {
        info.type = FileStat::Other;
    }
    info.size = buff.st_size;
    info.modificationTime = QDateTime::fromSecsSinceEpoch(buff.st_mtime);
    return AdapterResult::pass(path);
}

AdapterResult LocalFileSystemAdapter::listDirectory(const QString &path, QStringList &entries) const
{
    entries.clear();
    DIR *dp = ::opendir(QFile::encodeName(path).constData());
    if (dp == nullptr) {
        switch (errno) {
        case ENOENT:
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, path);
        case ENOTDIR:
            return AdapterResult::fail(ERR_IS_FILE, path);
        case EACCES:
            return AdapterResult::fail(ERR_ACCESS_DENIED, path);
        default:
            return AdapterResult::fail(ERR_CANNOT_ENTER_DIRECTORY, path);
        }
    }

    QT_DIRENT *ep;
    while ((ep = QT_READDIR(dp)) != nullptr) {
        const char *name = ep->d_name;
        if (qstrcmp(name, ".") == 0 || qstrcmp(name, "..") == 0) {
            continue;
        }
        entries.append(QFile::decodeName(name));
    }
    ::closedir(dp);

    entries.sort();
    return AdapterResult::pass(path);
}

AdapterResult
LocalFileSystemAdapter::copyFile(const QString &src, const QString &dest, Flags flags, const ProgressCallback &progress, const CancelToken &cancel)
{
    const QByteArray _src(QFile::encodeName(src));
    QByteArray _dest(QFile::encodeName(dest));

    QT_STATBUF buffSrc;
    if (QT_LSTAT(_src.constData(), &buffSrc) == -1) {
        if (errno == EACCES) {
            return AdapterResult::fail(ERR_ACCESS_DENIED, src);
        }
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
    }

    if (S_ISDIR(buffSrc.st_mode)) {
        return AdapterResult::fail(ERR_IS_DIRECTORY, src);
    }
    if (!S_ISREG(buffSrc.st_mode) && !S_ISLNK(buffSrc.st_mode)) {
        return AdapterResult::fail(ERR_CANNOT_OPEN_FOR_READING, src);
    }

    QT_STATBUF buffDest;
    const bool dest_exists = (QT_LSTAT(_dest.constData(), &buffDest) != -1);
    bool writeToPart = false;
    if (dest_exists) {
        if (same_inode(buffDest, buffSrc)) {
            return AdapterResult::fail(ERR_IDENTICAL_FILES, dest);
        }
        if (S_ISDIR(buffDest.st_mode)) {
            return AdapterResult::fail(ERR_DIR_ALREADY_EXIST, dest);
        }
        if (!flags.testFlag(Overwrite)) {
            return AdapterResult::fail(ERR_FILE_ALREADY_EXIST, dest);
        }
        // If the destination is a symlink and overwrite is TRUE,
        // remove the symlink first to prevent the scenario where
        // the symlink actually points to current source!
        if (S_ISLNK(buffDest.st_mode) || S_ISLNK(buffSrc.st_mode)) {
            if (::unlink(_dest.constData()) == -1) {
                return AdapterResult::fail(ERR_CANNOT_DELETE_ORIGINAL, dest);
            }
        } else {
            writeToPart = true;
        }
    }

    if (S_ISLNK(buffSrc.st_mode)) {
        FileStat linkInfo;
        const AdapterResult linkResult = stat(src, linkInfo);
        if (!linkResult.success()) {
            return linkResult;
        }
        if (::symlink(QFile::encodeName(linkInfo.linkTarget).constData(), _dest.constData()) == -1) {
            if (errno == EEXIST) {
                return AdapterResult::fail(ERR_FILE_ALREADY_EXIST, dest);
            }
            return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_SYMLINK), dest);
        }
        if (progress) {
            progress(buffSrc.st_size, buffSrc.st_size);
        }
        return AdapterResult::pass(dest);
    }

    const QString partPath = writeToPart ? dest + QLatin1String(".part") : dest;
    const QByteArray _part = QFile::encodeName(partPath);

    QFile srcFile(src);
    if (!srcFile.open(QIODevice::ReadOnly)) {
        return AdapterResult::fail(ERR_CANNOT_OPEN_FOR_READING, src);
    }

    // O_EXCL unless we are replacing: another job may have created dest since the check above
    const int openFlags = O_WRONLY | O_CREAT | O_CLOEXEC | (writeToPart ? O_TRUNC : O_EXCL);
    const int fd = ::open(_part.constData(), openFlags, S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH);
    if (fd == -1) {
        if (errno == EEXIST) {
            return AdapterResult::fail(ERR_FILE_ALREADY_EXIST, dest);
        }
        if (errno == EACCES) {
            return AdapterResult::fail(ERR_WRITE_ACCESS_DENIED, dest);
        }
        return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_OPEN_FOR_WRITING), dest);
    }
    QFile destFile;
    if (!destFile.open(fd, QIODevice::WriteOnly, QFileDevice::AutoCloseHandle)) {
        ::close(fd);
        QFile::remove(partPath);
        return AdapterResult::fail(ERR_CANNOT_OPEN_FOR_WRITING, dest);
    }

    const filesize_t totalSize = buffSrc.st_size;
    filesize_t sizeProcessed = 0;
    if (progress) {
        progress(sizeProcessed, totalSize);
    }

    std::array<char, s_copyChunkSize> buffer;
    for (;;) {
        if (cancel && cancel->load()) {
            qCDebug(KTRANSACT_CORE) << "Clean dest file after cancellation:" << partPath;
            destFile.close();
            QFile::remove(partPath); // don't keep partly copied file
            return AdapterResult::fail(ERR_USER_CANCELED, dest);
        }

        const qint64 readBytes = srcFile.read(buffer.data(), s_copyChunkSize);
        if (readBytes == 0) {
            break;
        }
        if (readBytes < 0) {
            qCWarning(KTRANSACT_CORE) << "Couldn't read. Error:" << srcFile.errorString();
            destFile.close();
            QFile::remove(partPath);
            return AdapterResult::fail(ERR_CANNOT_READ, src);
        }

        if (destFile.write(buffer.data(), readBytes) != readBytes) {
            const bool diskFull = destFile.error() == QFileDevice::ResourceError;
            qCWarning(KTRANSACT_CORE) << "Couldn't write. Error:" << destFile.errorString();
            destFile.close();
            QFile::remove(partPath);
            return AdapterResult::fail(diskFull ? ERR_DISK_FULL : ERR_CANNOT_WRITE, dest);
        }
        sizeProcessed += readBytes;
        if (progress) {
            progress(sizeProcessed, totalSize);
        }
    }

    srcFile.close();
    destFile.flush(); // so the write() happens before futimens()

    // copy permissions, access and modification time
    if (::fchmod(destFile.handle(), buffSrc.st_mode & 07777) != 0) {
        qCDebug(KTRANSACT_CORE) << "Couldn't preserve permissions for" << dest;
    }
    struct timespec ut[2];
    ut[0] = buffSrc.st_atim;
    ut[1] = buffSrc.st_mtim;
    // need to do this with the dest file still opened, or this fails
    if (::futimens(destFile.handle(), ut) != 0) {
        qCDebug(KTRANSACT_CORE) << "Couldn't preserve access and modification time for" << dest;
    }

    destFile.close();
    if (destFile.error() != QFile::NoError) {
        qCWarning(KTRANSACT_CORE) << "Error when closing file descriptor:" << destFile.errorString();
        QFile::remove(partPath);
        return AdapterResult::fail(ERR_CANNOT_WRITE, dest);
    }

    if (writeToPart) {
        if (::rename(_part.constData(), _dest.constData()) == -1) {
            QFile::remove(partPath);
            return AdapterResult::fail(ERR_CANNOT_RENAME_PARTIAL, dest);
        }
    }

    return AdapterResult::pass(dest);
}

AdapterResult LocalFileSystemAdapter::move(const QString &src, const QString &dest, Flags flags)
{
    const QByteArray _src(QFile::encodeName(src));
    const QByteArray _dest(QFile::encodeName(dest));

    QT_STATBUF buffSrc;
    if (QT_LSTAT(_src.constData(), &buffSrc) == -1) {
        if (errno == EACCES) {
            return AdapterResult::fail(ERR_ACCESS_DENIED, src);
        }
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
    }
    const bool srcIsDir = S_ISDIR(buffSrc.st_mode);

    if (srcIsDir && Utils::isSameOrInside(dest, src)) {
        return AdapterResult::fail(ERR_CANNOT_MOVE_INTO_ITSELF, src);
    }

    QT_STATBUF buffDest;
    if (QT_LSTAT(_dest.constData(), &buffDest) != -1) {
        const bool destIsDir = S_ISDIR(buffDest.st_mode);
        if (same_inode(buffDest, buffSrc)) {
            return AdapterResult::fail(ERR_IDENTICAL_FILES, dest);
        }
        if (!flags.testFlag(Overwrite)) {
            return alreadyExists(dest, destIsDir);
        }
        if (srcIsDir && destIsDir) {
            return AdapterResult::fail(ERR_WOULD_MERGE, dest);
        }
        if (destIsDir) {
            // a file does not replace a folder
            return AdapterResult::fail(ERR_DIR_ALREADY_EXIST, dest);
        }
        if (srcIsDir && ::unlink(_dest.constData()) == -1) {
            return AdapterResult::fail(ERR_CANNOT_DELETE_ORIGINAL, dest);
        }
    }

    if (::rename(_src.constData(), _dest.constData()) == -1) {
        switch (errno) {
        case EXDEV:
            return AdapterResult::fail(ERR_CROSS_DEVICE, src);
        case ENOTEMPTY:
        case EEXIST:
            return srcIsDir ? AdapterResult::fail(ERR_WOULD_MERGE, dest) : AdapterResult::fail(ERR_FILE_ALREADY_EXIST, dest);
        case EINVAL:
            return AdapterResult::fail(ERR_CANNOT_MOVE_INTO_ITSELF, src);
        case EACCES:
        case EPERM:
            return AdapterResult::fail(ERR_ACCESS_DENIED, dest);
        case ENOENT:
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, Utils::parentPath(dest));
        default:
            return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_RENAME), src);
        }
    }
    return AdapterResult::pass(dest);
}

AdapterResult LocalFileSystemAdapter::rename(const QString &path, const QString &newName, Flags flags)
{
    if (newName.isEmpty() || newName.contains(QLatin1Char('/')) || newName == QLatin1Char('.') || newName == QLatin1String("..")) {
        return AdapterResult::fail(ERR_CANNOT_RENAME, newName);
    }
    const QString dest = concatPaths(Utils::parentPath(path), newName);
    if (dest == path) {
        return AdapterResult::pass(path);
    }
    return move(path, dest, flags);
}

AdapterResult LocalFileSystemAdapter::makeDirectory(const QString &path)
{
    const QByteArray _path(QFile::encodeName(path));
    if (::mkdir(_path.constData(), S_IRWXU | S_IRWXG | S_IRWXO) == -1) {
        if (errno == EEXIST) {
            FileStat info;
            const AdapterResult result = stat(path, info);
            return alreadyExists(path, result.success() && info.isDir());
        }
        if (errno == ENOENT) {
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, Utils::parentPath(path));
        }
        if (errno == EACCES || errno == EPERM) {
            return AdapterResult::fail(ERR_ACCESS_DENIED, path);
        }
        if (errno == ENOSPC) {
            return AdapterResult::fail(ERR_DISK_FULL, path);
        }
        return AdapterResult::fail(ERR_CANNOT_MKDIR, path);
    }
    return AdapterResult::pass(path);
}

AdapterResult LocalFileSystemAdapter::createFile(const QString &path, Flags flags)
{
    const QByteArray _path(QFile::encodeName(path));
    const int openFlags = O_WRONLY | O_CREAT | O_CLOEXEC | (flags.testFlag(Overwrite) ? O_TRUNC : O_EXCL);
    const int fd = ::open(_path.constData(), openFlags, S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH);
    if (fd == -1) {
        switch (errno) {
        case EEXIST:
            return alreadyExists(path, QFileInfo(path).isDir());
        case EISDIR:
            return AdapterResult::fail(ERR_DIR_ALREADY_EXIST, path);
        case ENOENT:
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, Utils::parentPath(path));
        case EACCES:
        case EPERM:
            return AdapterResult::fail(ERR_WRITE_ACCESS_DENIED, path);
        default:
            return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_OPEN_FOR_WRITING), path);
        }
    }
    ::close(fd);
    return AdapterResult::pass(path);
}

AdapterResult LocalFileSystemAdapter::createSymlink(const QString &target, const QString &linkPath, Flags flags)
{
    const QByteArray _link(QFile::encodeName(linkPath));
    FileStat info;
    const AdapterResult statResult = stat(linkPath, info);
    if (!statResult.success()) {
        return statResult;
    }
    if (info.exists()) {
        if (!flags.testFlag(Overwrite) || info.isDir()) {
            return alreadyExists(linkPath, info.isDir());
        }
        if (::unlink(_link.constData()) == -1) {
            return AdapterResult::fail(ERR_CANNOT_DELETE_ORIGINAL, linkPath);
        }
    }

    if (::symlink(QFile::encodeName(target).constData(), _link.constData()) == -1) {
        if (errno == EEXIST) {
            return AdapterResult::fail(ERR_FILE_ALREADY_EXIST, linkPath);
        }
        if (errno == ENOENT) {
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, Utils::parentPath(linkPath));
        }
        return AdapterResult::fail(errorFromErrno(errno, ERR_CANNOT_SYMLINK), linkPath);
    }
    return AdapterResult::pass(linkPath);
}

AdapterResult LocalFileSystemAdapter::remove(const QString &path)
{
    const QByteArray _path(QFile::encodeName(path));
    QT_STATBUF buff;
    if (QT_LSTAT(_path.constData(), &buff) == -1) {
        return AdapterResult::fail(errno == EACCES ? ERR_ACCESS_DENIED : ERR_DOES_NOT_EXIST, path);
    }

    if (S_ISDIR(buff.st_mode)) {
        if (::rmdir(_path.constData()) == -1) {
            if (errno == EACCES || errno == EPERM) {
                return AdapterResult::fail(ERR_ACCESS_DENIED, path);
            }
            return AdapterResult::fail(ERR_CANNOT_RMDIR, path);
        }
    } else if (::unlink(_path.constData()) == -1) {
        if (errno == EACCES || errno == EPERM) {
            return AdapterResult::fail(ERR_ACCESS_DENIED, path);
        }
        return AdapterResult::fail(ERR_CANNOT_DELETE, path);
    }
    return AdapterResult::pass(path);
}

AdapterResult LocalFileSystemAdapter::trash(const QString &path, TrashItem &item)
{
    FileStat info;
    const AdapterResult statResult = stat(path, info);
    if (!statResult.success()) {
        return statResult;
    }
    if (!info.exists()) {
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, path);
    }

    // The info file reserves the id, so the data move itself runs unlocked
    // and trashing a large tree does not stall other trash operations.
    QMutexLocker locker(&d->m_trashMutex);
    const AdapterResult initResult = d->m_trash.init();
    if (!initResult.success()) {
        return initResult;
    }
    if (Utils::isSameOrInside(path, d->m_trash.trashDirectory())) {
        return AdapterResult::fail(ERR_CANNOT_TRASH, path);
    }

    QString fileId;
    const AdapterResult infoResult = d->m_trash.createInfo(path, fileId);
    if (!infoResult.success()) {
        return infoResult;
    }
    const QString dest = d->m_trash.filesPath(fileId);
    locker.unlock();

    const AdapterResult moved = d->moveAcrossDevices(path, dest);
    locker.relock();
    if (!moved.success()) {
        // Maybe the move failed due to no permissions to delete source.
        // In that case, delete dest to keep things consistent.
        if (QFileInfo::exists(dest) || QFileInfo(dest).isSymLink()) {
            const AdapterResult cleanup = d->removeTree(dest);
            if (!cleanup.success()) {
                qCWarning(KTRANSACT_TRASH) << "could not clean up" << dest;
            }
        }
        d->m_trash.deleteInfo(fileId);
        return moved;
    }

    if (!d->m_trash.infoForFile(fileId, item)) {
        qCWarning(KTRANSACT_TRASH) << "could not read back the info file for" << fileId;
        return AdapterResult::fail(ERR_CANNOT_OPEN_FOR_READING, d->m_trash.infoPath(fileId));
    }
    qCDebug(KTRANSACT_TRASH) << "trashed" << path << "as" << fileId;
    return AdapterResult::pass(dest);
}

AdapterResult LocalFileSystemAdapter::restore(const TrashItem &item, const QString &dest, Flags flags)
{
    QMutexLocker locker(&d->m_trashMutex);
    const AdapterResult initResult = d->m_trash.init();
    if (!initResult.success()) {
        return initResult;
    }
    const QString physicalPath = item.physicalPath.isEmpty() ? d->m_trash.filesPath(item.fileId) : item.physicalPath;
    locker.unlock();

    const QString target = dest.isEmpty() ? item.originalPath : dest;

    FileStat srcInfo;
    const AdapterResult srcResult = stat(physicalPath, srcInfo);
    if (!srcResult.success()) {
        return srcResult;
    }
    if (!srcInfo.exists()) {
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, item.displayName.isEmpty() ? physicalPath : item.displayName);
    }

    if (!QFileInfo(Utils::parentPath(target)).isDir()) {
        qCDebug(KTRANSACT_TRASH) << "the folder" << Utils::parentPath(target) << "does not exist anymore";
        return AdapterResult::fail(ERR_CANNOT_RESTORE, target);
    }

    FileStat destInfo;
    const AdapterResult destResult = stat(target, destInfo);
    if (!destResult.success()) {
        return destResult;
    }
    if (destInfo.exists()) {
        if (!flags.testFlag(Overwrite)) {
            return alreadyExists(target, destInfo.isDir());
        }
        const AdapterResult removed = d->removeTree(target);
        if (!removed.success()) {
            return AdapterResult::fail(ERR_CANNOT_DELETE_ORIGINAL, target);
        }
    }

    const AdapterResult moved = d->moveAcrossDevices(physicalPath, target);
    if (!moved.success()) {
        return moved;
    }
    locker.relock();
    if (!d->m_trash.deleteInfo(item.fileId)) {
        qCWarning(KTRANSACT_TRASH) << "could not remove the info file of" << item.fileId;
    }
    qCDebug(KTRANSACT_TRASH) << "restored" << item.fileId << "to" << target;
    return AdapterResult::pass(target);
}

AdapterResult LocalFileSystemAdapter::listTrash(TrashItemList &items)
{
    QMutexLocker locker(&d->m_trashMutex);
    items.clear();
    return d->m_trash.list(items);
}

AdapterResult LocalFileSystemAdapter::emptyTrash()
{
    QMutexLocker locker(&d->m_trashMutex);
    // The naive implementation "delete info and files in every trash directory"
    // breaks when deleted directories contain files owned by other users.
    // We need to ensure that the .trashinfo file is only removed when the
    // corresponding files could indeed be removed (#116371)

    // On the other hand, we certainly want to remove any file that has no associated
    // .trashinfo file for some reason (#167051)
    TrashItemList items;
    const AdapterResult listResult = d->m_trash.list(items);
    if (!listResult.success()) {
        return listResult;
    }

    int myErrorCode = 0;
    QString myErrorText;
    for (const TrashItem &item : std::as_const(items)) {
        const AdapterResult result = d->removeTree(item.physicalPath);
        if (result.success() || result.error() == ERR_DOES_NOT_EXIST) {
            d->m_trash.deleteInfo(item.fileId);
        } else {
            // remember the error, so that successfully removing another file doesn't erase it
            myErrorCode = result.error();
            myErrorText = result.errorText();
            qCDebug(KTRANSACT_TRASH) << "Unremovable:" << item.physicalPath;
        }
    }

    // Now do the orphaned-files cleanup
    const QStringList orphans = d->m_trash.orphanedFiles();
    for (const QString &filePath : orphans) {
        qCWarning(KTRANSACT_TRASH) << "Removing orphaned file" << filePath;
        const AdapterResult result = d->removeTree(filePath);
        if (!result.success()) {
            qCWarning(KTRANSACT_TRASH) << "could not remove orphaned file" << filePath << result.error();
        }
    }

    if (myErrorCode) {
        return AdapterResult::fail(myErrorCode, myErrorText);
    }
    return AdapterResult::pass(d->m_trash.trashDirectory());
}

QString LocalFileSystemAdapter::trashDirectory() const
{
    QMutexLocker locker(&d->m_trashMutex);
    const AdapterResult result = d->m_trash.init();
    return result.success() ? d->m_trash.trashDirectory() : QString();
}
