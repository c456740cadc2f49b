/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2006 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

// This file can only be included once in a given binary

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTest>
#include <QTimer>
#include <qplatformdefs.h>

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include "transaction.h"
#include "transactionmanager.h"

QString homeTmpDir()
{
    const QString dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/ktransacttests/"));
    if (!QFile::exists(dir)) {
        const bool ok = QDir().mkpath(dir);
        if (!ok) {
            qFatal("Couldn't create %s", qPrintable(dir));
        }
    }
    return dir;
}

static void createTestFile(const QString &path, const QByteArray &data = QByteArrayLiteral("Hello world"))
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        qFatal("Couldn't create %s: %s", qPrintable(path), qPrintable(f.errorString()));
    }
    f.write(data);
    f.close();
}

static void createTestSymlink(const QString &path, const QByteArray &target = "/IDontExist")
{
    QFile::remove(path);
    if (::symlink(target.constData(), QFile::encodeName(path).constData()) != 0) {
        qFatal("couldn't create symlink: %s", strerror(errno));
    }
    QT_STATBUF buf;
    QVERIFY(QT_LSTAT(QFile::encodeName(path).constData(), &buf) == 0);
    QVERIFY((buf.st_mode & QT_STAT_MASK) == QT_STAT_LNK);
}

enum CreateTestDirectoryOptions { DefaultOptions = 0, NoSymlink = 1, Empty = 2 };
static inline void createTestDirectory(const QString &path, CreateTestDirectoryOptions opt = DefaultOptions)
{
    QDir dir;
    bool ok = dir.mkpath(path);
    if (!ok) {
        qFatal("Couldn't create %s", qPrintable(path));
    }

    if ((opt & Empty) == 0) {
        createTestFile(path + QStringLiteral("/testfile"));
        if ((opt & NoSymlink) == 0) {
            createTestSymlink(path + QStringLiteral("/testlink"));
        }
    }
}

static QByteArray fileContents(const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return f.readAll();
}

// Relative paths of everything below @p dir, with the content of regular files
static QStringList treeSnapshot(const QString &dir)
{
    QStringList entries;
    QDirIterator it(dir, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info = it.fileInfo();
        QString entry = QDir(dir).relativeFilePath(path);
        if (info.isSymLink()) {
            entry += QLatin1String(" -> ") + info.symLinkTarget();
        } else if (info.isDir()) {
            entry += QLatin1Char('/');
        } else {
            entry += QLatin1String(" = ") + QString::fromUtf8(fileContents(path));
        }
        entries.append(entry);
    }
    entries.sort();
    return entries;
}

static void removeTestTree(const QString &path)
{
    QDir dir(path);
    if (dir.exists()) {
        QVERIFY(dir.removeRecursively());
    }
}

// Waits for the transaction @p id to finish and returns its final state
static KTransact::Transaction waitForTransaction(KTransact::TransactionManager &manager, const QUuid &id, int timeout = 20000)
{
    KTransact::Transaction current = manager.transaction(id);
    if (current.isTerminal()) {
        return current;
    }
    KTransact::Transaction result;
    QEventLoop loop;
    QObject::connect(&manager, &KTransact::TransactionManager::transactionFinished, &loop, [&](const KTransact::Transaction &transaction) {
        if (transaction.id() == id) {
            result = transaction;
            loop.quit();
        }
    });
    QTimer::singleShot(timeout, &loop, &QEventLoop::quit);
    loop.exec();
    if (!result.isValid()) {
        qWarning() << "timeout waiting for transaction" << id;
    }
    return result;
}
