/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "trashimpl_p.h"
#include "ktransacttrashdebug.h"
#include "pathhelpers_p.h"

#include <KConfig>
#include <KConfigGroup>
#include <KFileUtils>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <qplatformdefs.h>
#include <QUrl>

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace KTransact;

static const QLatin1String s_infoTail(".trashinfo");

TrashImpl::TrashImpl()
    : m_initStatus(InitToBeDone)
{
}

/**
 * Test if a directory exists, create otherwise
 * @param name full path of the directory
 */
AdapterResult TrashImpl::testDir(const QString &name) const
{
    const QFileInfo info(name);
    if (info.isDir()) {
        return AdapterResult::pass(name);
    }
    if (info.exists() || info.isSymLink()) {
        qCWarning(KTRANSACT_TRASH) << name << "exists and is not a folder";
        return AdapterResult::fail(ERR_DIR_ALREADY_EXIST, name);
    }
    if (!QDir().mkpath(name)) {
        qCWarning(KTRANSACT_TRASH) << "could not create" << name;
        return AdapterResult::fail(ERR_CANNOT_MKDIR, name);
    }
    // The trash must not be readable by others
    QFile::setPermissions(name, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return AdapterResult::pass(name);
}

AdapterResult TrashImpl::init()
{
    if (m_initStatus == InitOK) {
        return AdapterResult::pass(m_trashDir);
    }

    // $XDG_DATA_HOME/Trash, i.e. ~/.local/share/Trash by default.
    // Checked again after an error, the user may have fixed the permissions meanwhile.
    const QString trashDir = concatPaths(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation), QStringLiteral("Trash"));
    for (const QString &dir : {trashDir, trashDir + QLatin1String("/info"), trashDir + QLatin1String("/files")}) {
        const AdapterResult result = testDir(dir);
        if (!result.success()) {
            m_initStatus = InitError;
            return result;
        }
    }

    m_trashDir = trashDir;
    m_initStatus = InitOK;
    qCDebug(KTRANSACT_TRASH) << "initialization OK, home trash dir:" << m_trashDir;
    return AdapterResult::pass(m_trashDir);
}

QString TrashImpl::trashDirectory() const
{
    return m_trashDir;
}

QString TrashImpl::infoPath(const QString &fileId) const
{
    return m_trashDir + QLatin1String("/info/") + fileId + s_infoTail;
}

QString TrashImpl::filesPath(const QString &fileId) const
{
    return m_trashDir + QLatin1String("/files/") + fileId;
}

AdapterResult TrashImpl::createInfo(const QString &origPath, QString &fileId)
{
    const AdapterResult initResult = init();
    if (!initResult.success()) {
        return initResult;
    }

    const QString infoDir = m_trashDir + QLatin1String("/info");
    QString fileName = Utils::fileName(origPath) + s_infoTail; // we first try with the original file name

    // Here we need to use O_EXCL to avoid race conditions with other processes trashing the same name
    int fd = -1;
    do {
        const QString candidate = concatPaths(infoDir, fileName);
        fd = ::open(QFile::encodeName(candidate).constData(), O_WRONLY | O_CREAT | O_EXCL, 0600);
        if (fd < 0) {
            if (errno == EEXIST) {
                fileName = KFileUtils::suggestName(QUrl::fromLocalFile(infoDir), fileName);
                // and try again on the next iteration
            } else {
                return AdapterResult::fail(ERR_CANNOT_WRITE, candidate);
            }
        }
    } while (fd < 0);

    const QString infoFilePath = concatPaths(infoDir, fileName);
    fileId = fileName;
    Q_ASSERT(fileId.endsWith(s_infoTail));
    fileId.chop(s_infoTail.size()); // remove .trashinfo from fileId

    FILE *file = ::fdopen(fd, "w");
    if (!file) { // can't see how this would happen
        ::close(fd);
        QFile::remove(infoFilePath);
        return AdapterResult::fail(ERR_CANNOT_WRITE, infoFilePath);
    }

    // Contents of the info file. We could use KConfig, but that would
    // mean closing and reopening fd, i.e. opening a race condition...
    QByteArray info = "[Trash Info]\n";
    info += "Path=";
    // home trash: absolute path, escaped the way it is encoded on the filesystem
    info += QUrl::toPercentEncoding(origPath, "/");
    info += '\n';
    info += "DeletionDate=" + QDateTime::currentDateTime().toString(Qt::ISODate).toLatin1() + '\n';
    const size_t sz = info.size();

    const size_t written = ::fwrite(info.data(), 1, sz, file);
    if (written != sz) {
        ::fclose(file);
        QFile::remove(infoFilePath);
        return AdapterResult::fail(ERR_DISK_FULL, infoFilePath);
    }

    ::fclose(file);

    qCDebug(KTRANSACT_TRASH) << "info file created:" << fileId;
    return AdapterResult::pass(infoFilePath);
}

bool TrashImpl::deleteInfo(const QString &fileId)
{
    return QFile::remove(infoPath(fileId));
}

AdapterResult TrashImpl::list(TrashItemList &items)
{
    const AdapterResult initResult = init();
    if (!initResult.success()) {
        return initResult;
    }

    const QString infoDir = m_trashDir + QLatin1String("/info");
    const QStringList entryNames = QDir(infoDir).entryList(QDir::Files | QDir::Hidden | QDir::System, QDir::Name);
    for (const QString &fileName : entryNames) {
        if (!fileName.endsWith(s_infoTail)) {
            qCWarning(KTRANSACT_TRASH) << "Invalid info file found in" << infoDir << ":" << fileName;
            continue;
        }

        TrashItem item;
        if (infoForFile(fileName.chopped(s_infoTail.size()), item)) {
            items << item;
        }
    }
    return AdapterResult::pass(infoDir);
}

bool TrashImpl::infoForFile(const QString &fileId, TrashItem &item)
{
    item.fileId = fileId;
    item.physicalPath = filesPath(fileId);
    if (!readInfoFile(infoPath(fileId), item)) {
        return false;
    }
    const QFileInfo fileInfo(item.physicalPath);
    item.isDir = fileInfo.isDir() && !fileInfo.isSymLink();
    item.size = sizeOfPath(item.physicalPath);
    item.displayName = Utils::fileName(item.originalPath);
    return true;
}

bool TrashImpl::readInfoFile(const QString &infoPath, TrashItem &item)
{
    KConfig cfg(infoPath, KConfig::SimpleConfig);
    if (!cfg.hasGroup(QStringLiteral("Trash Info"))) {
        qCWarning(KTRANSACT_TRASH) << "no [Trash Info] group in" << infoPath;
        return false;
    }
    const KConfigGroup group = cfg.group(QStringLiteral("Trash Info"));
    item.originalPath = QUrl::fromPercentEncoding(group.readEntry("Path").toLatin1());
    if (item.originalPath.isEmpty()) {
        return false; // path is mandatory...
    }
    if (!item.originalPath.startsWith(QLatin1Char('/'))) {
        qCWarning(KTRANSACT_TRASH) << "relative path in home trash info file" << infoPath;
        return false;
    }
    const QString line = group.readEntry("DeletionDate");
    if (!line.isEmpty()) {
        item.deletionDate = QDateTime::fromString(line, Qt::ISODate);
    }
    return true;
}

QStringList TrashImpl::orphanedFiles() const
{
    QStringList orphans;
    const QString filesDir = m_trashDir + QLatin1String("/files");
    const QStringList entries = QDir(filesDir).entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QString &fileName : entries) {
        if (!QFileInfo::exists(infoPath(fileName))) {
            orphans << concatPaths(filesDir, fileName);
        }
    }
    return orphans;
}

filesize_t TrashImpl::sizeOfPath(const QString &path)
{
    const QFileInfo info(path);
    if (info.isSymLink()) {
        // QFileInfo::size does not return the actual size of a symlink. #253776
        QT_STATBUF buff;
        return QT_LSTAT(QFile::encodeName(path).constData(), &buff) == 0 ? buff.st_size : 0;
    } else if (info.isFile()) {
        return info.size();
    } else if (info.isDir()) {
        QDirIterator it(path, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
        filesize_t sum = 0;
        while (it.hasNext()) {
            sum += sizeOfPath(it.next());
        }
        return sum;
    }
    return 0;
}
