/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "localfilesystemadapter_p.h"

#include "ktransacttesthelper.h"

#include <QSet>
#include <QStandardPaths>
#include <QThread>
#include <QTest>

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>

using namespace KTransact;

class LocalFileSystemAdapterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanupTestCase();

    void testStat();
    void testListDirectory();
    void testCopyFile();
    void testCopyFileExisting();
    void testCopyFileOverwrite();
    void testCopySymlink();
    void testCopyDirectoryFails();
    void testCopyCancelled();
    void testMoveFile();
    void testMoveDirectoryOverDirectory();
    void testMoveIntoItself();
    void testRename();
    void testRenameInvalidName();
    void testMakeDirectory();
    void testCreateFile();
    void testCreateSymlink();
    void testRemove();
    void testTrashAndRestore();
    void testTrashSameNameTwice();
    void testTrashMissing();
    void testTrashInsideTrash();
    void testRestoreOccupied();
    void testRestoreParentGone();
    void testEmptyTrash();
    void testConcurrentTrash();

private:
    QString path(const QString &relative) const
    {
        return m_dir + relative;
    }
    TrashItemList trashItems();
    bool isTrashed(const QString &originalPath);

    std::unique_ptr<LocalFileSystemAdapter> m_adapter;
    QString m_dir;
};

void LocalFileSystemAdapterTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    m_dir = homeTmpDir() + QStringLiteral("adapter/");
    m_adapter = std::make_unique<LocalFileSystemAdapter>();

    // start from an empty trash
    const QString trashDir = m_adapter->trashDirectory();
    QVERIFY(!trashDir.isEmpty());
    QVERIFY(trashDir.startsWith(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)));
    QVERIFY(m_adapter->emptyTrash().success());
}

void LocalFileSystemAdapterTest::init()
{
    removeTestTree(m_dir);
    QVERIFY(QDir().mkpath(m_dir));
}

void LocalFileSystemAdapterTest::cleanupTestCase()
{
    removeTestTree(m_dir);
    QVERIFY(m_adapter->emptyTrash().success());
}

TrashItemList LocalFileSystemAdapterTest::trashItems()
{
    TrashItemList items;
    const AdapterResult result = m_adapter->listTrash(items);
    if (!result.success()) {
        qWarning() << "listTrash failed" << result.error() << result.errorText();
    }
    return items;
}

bool LocalFileSystemAdapterTest::isTrashed(const QString &originalPath)
{
    const TrashItemList items = trashItems();
    return std::any_of(items.cbegin(), items.cend(), [&originalPath](const TrashItem &item) {
        return item.originalPath == originalPath;
    });
}

void LocalFileSystemAdapterTest::testStat()
{
    createTestFile(path(QStringLiteral("file")), "12345");
    createTestSymlink(path(QStringLiteral("link")));

    FileStat info;
    QVERIFY(m_adapter->stat(path(QStringLiteral("file")), info).success());
    QCOMPARE(info.type, FileStat::File);
    QCOMPARE(info.size, filesize_t(5));

    QVERIFY(m_adapter->stat(path(QStringLiteral("link")), info).success());
    QCOMPARE(info.type, FileStat::Symlink);
    QCOMPARE(info.linkTarget, QStringLiteral("/IDontExist"));

    QVERIFY(m_adapter->stat(m_dir, info).success());
    QVERIFY(info.isDir());

    // a missing path is not an error
    QVERIFY(m_adapter->stat(path(QStringLiteral("missing")), info).success());
    QVERIFY(!info.exists());
    QVERIFY(!m_adapter->exists(path(QStringLiteral("missing"))));
}

void LocalFileSystemAdapterTest::testListDirectory()
{
    createTestFile(path(QStringLiteral("b")));
    createTestFile(path(QStringLiteral("a")));
    createTestFile(path(QStringLiteral(".hidden")));
    createTestDirectory(path(QStringLiteral("c")));

    QStringList entries;
    QVERIFY(m_adapter->listDirectory(m_dir, entries).success());
    QCOMPARE(entries, (QStringList{QStringLiteral(".hidden"), QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")}));

    const AdapterResult onFile = m_adapter->listDirectory(path(QStringLiteral("a")), entries);
    QVERIFY(!onFile.success());
    QCOMPARE(onFile.error(), int(ERR_IS_FILE));

    const AdapterResult missing = m_adapter->listDirectory(path(QStringLiteral("missing")), entries);
    QCOMPARE(missing.error(), int(ERR_DOES_NOT_EXIST));
}

void LocalFileSystemAdapterTest::testCopyFile()
{
    const QByteArray data(200 * 1024, 'x');
    createTestFile(path(QStringLiteral("src")), data);

    filesize_t lastProcessed = 0;
    filesize_t lastTotal = 0;
    auto progress = [&](filesize_t processed, filesize_t total) {
        QVERIFY(processed >= lastProcessed);
        lastProcessed = processed;
        lastTotal = total;
    };
    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("src")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags, progress, {});
    QVERIFY2(result.success(), qPrintable(result.errorText()));
    QCOMPARE(result.path(), path(QStringLiteral("dest")));
    QCOMPARE(fileContents(path(QStringLiteral("dest"))), data);
    QCOMPARE(lastProcessed, filesize_t(data.size()));
    QCOMPARE(lastTotal, filesize_t(data.size()));
    QVERIFY(QFile::exists(path(QStringLiteral("src"))));
    QCOMPARE(QFileInfo(path(QStringLiteral("dest"))).lastModified(), QFileInfo(path(QStringLiteral("src"))).lastModified());
}

void LocalFileSystemAdapterTest::testCopyFileExisting()
{
    createTestFile(path(QStringLiteral("src")), "new");
    createTestFile(path(QStringLiteral("dest")), "old");

    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("src")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags, {}, {});
    QVERIFY(!result.success());
    QCOMPARE(result.error(), int(ERR_FILE_ALREADY_EXIST));
    QCOMPARE(fileContents(path(QStringLiteral("dest"))), QByteArray("old"));

    const AdapterResult same = m_adapter->copyFile(path(QStringLiteral("src")), path(QStringLiteral("src")), FileSystemAdapter::Overwrite, {}, {});
    QCOMPARE(same.error(), int(ERR_IDENTICAL_FILES));
}

void LocalFileSystemAdapterTest::testCopyFileOverwrite()
{
    createTestFile(path(QStringLiteral("src")), "new");
    createTestFile(path(QStringLiteral("dest")), "old contents");

    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("src")), path(QStringLiteral("dest")), FileSystemAdapter::Overwrite, {}, {});
    QVERIFY2(result.success(), qPrintable(result.errorText()));
    QCOMPARE(fileContents(path(QStringLiteral("dest"))), QByteArray("new"));
    QVERIFY(!QFile::exists(path(QStringLiteral("dest.part"))));
}

void LocalFileSystemAdapterTest::testCopySymlink()
{
    createTestSymlink(path(QStringLiteral("link")), "target");

    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("link")), path(QStringLiteral("linkcopy")), FileSystemAdapter::DefaultFlags, {}, {});
    QVERIFY2(result.success(), qPrintable(result.errorText()));
    QVERIFY(QFileInfo(path(QStringLiteral("linkcopy"))).isSymLink());
    QCOMPARE(QFile::symLinkTarget(path(QStringLiteral("linkcopy"))), path(QStringLiteral("target")));
}

void LocalFileSystemAdapterTest::testCopyDirectoryFails()
{
    createTestDirectory(path(QStringLiteral("dir")));
    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("dir")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags, {}, {});
    QCOMPARE(result.error(), int(ERR_IS_DIRECTORY));

    const AdapterResult missing = m_adapter->copyFile(path(QStringLiteral("missing")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags, {}, {});
    QCOMPARE(missing.error(), int(ERR_DOES_NOT_EXIST));
}

void LocalFileSystemAdapterTest::testCopyCancelled()
{
    createTestFile(path(QStringLiteral("src")), QByteArray(300 * 1024, 'y'));
    const CancelToken cancel = std::make_shared<std::atomic_bool>(true);

    const AdapterResult result = m_adapter->copyFile(path(QStringLiteral("src")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags, {}, cancel);
    QCOMPARE(result.error(), int(ERR_USER_CANCELED));
    // no partial file is left behind
    QVERIFY(!QFile::exists(path(QStringLiteral("dest"))));
}

void LocalFileSystemAdapterTest::testMoveFile()
{
    createTestFile(path(QStringLiteral("src")), "moved");

    const AdapterResult result = m_adapter->move(path(QStringLiteral("src")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags);
    QVERIFY2(result.success(), qPrintable(result.errorText()));
    QVERIFY(!QFile::exists(path(QStringLiteral("src"))));
    QCOMPARE(fileContents(path(QStringLiteral("dest"))), QByteArray("moved"));

    createTestFile(path(QStringLiteral("other")), "other");
    const AdapterResult existing = m_adapter->move(path(QStringLiteral("other")), path(QStringLiteral("dest")), FileSystemAdapter::DefaultFlags);
    QCOMPARE(existing.error(), int(ERR_FILE_ALREADY_EXIST));

    const AdapterResult overwritten = m_adapter->move(path(QStringLiteral("other")), path(QStringLiteral("dest")), FileSystemAdapter::Overwrite);
    QVERIFY(overwritten.success());
    QCOMPARE(fileContents(path(QStringLiteral("dest"))), QByteArray("other"));

    const AdapterResult missing = m_adapter->move(path(QStringLiteral("missing")), path(QStringLiteral("dest2")), FileSystemAdapter::DefaultFlags);
    QCOMPARE(missing.error(), int(ERR_DOES_NOT_EXIST));
}

void LocalFileSystemAdapterTest::testMoveDirectoryOverDirectory()
{
    createTestDirectory(path(QStringLiteral("a")));
    createTestDirectory(path(QStringLiteral("b")));

    const AdapterResult refused = m_adapter->move(path(QStringLiteral("a")), path(QStringLiteral("b")), FileSystemAdapter::DefaultFlags);
    QCOMPARE(refused.error(), int(ERR_DIR_ALREADY_EXIST));

    // replacing a folder is a merge, left to the caller
    const AdapterResult merge = m_adapter->move(path(QStringLiteral("a")), path(QStringLiteral("b")), FileSystemAdapter::Overwrite);
    QCOMPARE(merge.error(), int(ERR_WOULD_MERGE));
    QVERIFY(QFile::exists(path(QStringLiteral("a/testfile"))));
    QVERIFY(QFile::exists(path(QStringLiteral("b/testfile"))));

    // a file does not replace a folder
    createTestFile(path(QStringLiteral("file")));
    const AdapterResult fileOverDir = m_adapter->move(path(QStringLiteral("file")), path(QStringLiteral("b")), FileSystemAdapter::Overwrite);
    QCOMPARE(fileOverDir.error(), int(ERR_DIR_ALREADY_EXIST));
}

void LocalFileSystemAdapterTest::testMoveIntoItself()
{
    createTestDirectory(path(QStringLiteral("dir")));
    const AdapterResult result = m_adapter->move(path(QStringLiteral("dir")), path(QStringLiteral("dir/sub")), FileSystemAdapter::DefaultFlags);
    QCOMPARE(result.error(), int(ERR_CANNOT_MOVE_INTO_ITSELF));
    QVERIFY(QFileInfo(path(QStringLiteral("dir"))).isDir());
}

void LocalFileSystemAdapterTest::testRename()
{
    createTestFile(path(QStringLiteral("a.txt")), "a");
    createTestFile(path(QStringLiteral("b.txt")), "b");

    const AdapterResult result = m_adapter->rename(path(QStringLiteral("a.txt")), QStringLiteral("c.txt"), FileSystemAdapter::DefaultFlags);
    QVERIFY2(result.success(), qPrintable(result.errorText()));
    QCOMPARE(result.path(), path(QStringLiteral("c.txt")));
    QCOMPARE(fileContents(path(QStringLiteral("c.txt"))), QByteArray("a"));

    const AdapterResult collision = m_adapter->rename(path(QStringLiteral("c.txt")), QStringLiteral("b.txt"), FileSystemAdapter::DefaultFlags);
    QCOMPARE(collision.error(), int(ERR_FILE_ALREADY_EXIST));
    QCOMPARE(fileContents(path(QStringLiteral("b.txt"))), QByteArray("b"));

    // renaming to the same name does nothing
    QVERIFY(m_adapter->rename(path(QStringLiteral("b.txt")), QStringLiteral("b.txt"), FileSystemAdapter::DefaultFlags).success());
}

void LocalFileSystemAdapterTest::testRenameInvalidName()
{
    createTestFile(path(QStringLiteral("a")));
    for (const QString &name : {QString(), QStringLiteral("x/y"), QStringLiteral("."), QStringLiteral("..")}) {
        const AdapterResult result = m_adapter->rename(path(QStringLiteral("a")), name, FileSystemAdapter::DefaultFlags);
        QCOMPARE(result.error(), int(ERR_CANNOT_RENAME));
    }
    QVERIFY(QFile::exists(path(QStringLiteral("a"))));
}

void LocalFileSystemAdapterTest::testMakeDirectory()
{
    QVERIFY(m_adapter->makeDirectory(path(QStringLiteral("new"))).success());
    QVERIFY(QFileInfo(path(QStringLiteral("new"))).isDir());

    QCOMPARE(m_adapter->makeDirectory(path(QStringLiteral("new"))).error(), int(ERR_DIR_ALREADY_EXIST));

    createTestFile(path(QStringLiteral("file")));
    QCOMPARE(m_adapter->makeDirectory(path(QStringLiteral("file"))).error(), int(ERR_FILE_ALREADY_EXIST));

    const AdapterResult noParent = m_adapter->makeDirectory(path(QStringLiteral("missing/new")));
    QCOMPARE(noParent.error(), int(ERR_DOES_NOT_EXIST));
    QCOMPARE(noParent.errorText(), path(QStringLiteral("missing")));
}

void LocalFileSystemAdapterTest::testCreateFile()
{
    QVERIFY(m_adapter->createFile(path(QStringLiteral("empty")), FileSystemAdapter::DefaultFlags).success());
    QVERIFY(QFile::exists(path(QStringLiteral("empty"))));
    QCOMPARE(QFileInfo(path(QStringLiteral("empty"))).size(), qint64(0));

    createTestFile(path(QStringLiteral("full")), "data");
    QCOMPARE(m_adapter->createFile(path(QStringLiteral("full")), FileSystemAdapter::DefaultFlags).error(), int(ERR_FILE_ALREADY_EXIST));
    QCOMPARE(fileContents(path(QStringLiteral("full"))), QByteArray("data"));

    QVERIFY(m_adapter->createFile(path(QStringLiteral("full")), FileSystemAdapter::Overwrite).success());
    QCOMPARE(QFileInfo(path(QStringLiteral("full"))).size(), qint64(0));
}

void LocalFileSystemAdapterTest::testCreateSymlink()
{
    QVERIFY(m_adapter->createSymlink(QStringLiteral("../elsewhere"), path(QStringLiteral("link")), FileSystemAdapter::DefaultFlags).success());
    FileStat info;
    QVERIFY(m_adapter->stat(path(QStringLiteral("link")), info).success());
    QCOMPARE(info.type, FileStat::Symlink);
    QCOMPARE(info.linkTarget, QStringLiteral("../elsewhere"));

    QCOMPARE(m_adapter->createSymlink(QStringLiteral("x"), path(QStringLiteral("link")), FileSystemAdapter::DefaultFlags).error(), int(ERR_FILE_ALREADY_EXIST));
    QVERIFY(m_adapter->createSymlink(QStringLiteral("x"), path(QStringLiteral("link")), FileSystemAdapter::Overwrite).success());
    QVERIFY(m_adapter->stat(path(QStringLiteral("link")), info).success());
    QCOMPARE(info.linkTarget, QStringLiteral("x"));

    // never replaces a folder
    createTestDirectory(path(QStringLiteral("dir")));
    QCOMPARE(m_adapter->createSymlink(QStringLiteral("x"), path(QStringLiteral("dir")), FileSystemAdapter::Overwrite).error(), int(ERR_DIR_ALREADY_EXIST));
}

void LocalFileSystemAdapterTest::testRemove()
{
    createTestDirectory(path(QStringLiteral("dir")));
    QCOMPARE(m_adapter->remove(path(QStringLiteral("dir"))).error(), int(ERR_CANNOT_RMDIR));

    QVERIFY(m_adapter->remove(path(QStringLiteral("dir/testfile"))).success());
    QVERIFY(m_adapter->remove(path(QStringLiteral("dir/testlink"))).success());
    QVERIFY(m_adapter->remove(path(QStringLiteral("dir"))).success());
    QVERIFY(!QFile::exists(path(QStringLiteral("dir"))));

    QCOMPARE(m_adapter->remove(path(QStringLiteral("dir"))).error(), int(ERR_DOES_NOT_EXIST));
}

void LocalFileSystemAdapterTest::testTrashAndRestore()
{
    const QString file = path(QStringLiteral("trashme.txt"));
    createTestFile(file, "trash contents");

    TrashItem item;
    const AdapterResult trashed = m_adapter->trash(file, item);
    QVERIFY2(trashed.success(), qPrintable(trashed.errorText()));
    QVERIFY(!QFile::exists(file));
    QVERIFY(item.isValid());
    QCOMPARE(item.originalPath, file);
    QCOMPARE(item.displayName, QStringLiteral("trashme.txt"));
    QCOMPARE(item.physicalPath, trashed.path());
    QVERIFY(!item.isDir);
    QCOMPARE(item.size, filesize_t(14));
    QVERIFY(item.deletionDate.isValid());
    QCOMPARE(fileContents(item.physicalPath), QByteArray("trash contents"));
    QVERIFY(isTrashed(file));

    const AdapterResult restored = m_adapter->restore(item, QString(), FileSystemAdapter::DefaultFlags);
    QVERIFY2(restored.success(), qPrintable(restored.errorText()));
    QCOMPARE(restored.path(), file);
    QCOMPARE(fileContents(file), QByteArray("trash contents"));
    QVERIFY(!QFile::exists(item.physicalPath));
    QVERIFY(!isTrashed(file));
}

void LocalFileSystemAdapterTest::testTrashSameNameTwice()
{
    const QString dir = path(QStringLiteral("dir"));
    createTestDirectory(dir);
    createTestFile(path(QStringLiteral("other/dir/testfile")), "second");

    TrashItem first;
    TrashItem second;
    QVERIFY(m_adapter->trash(dir, first).success());
    QVERIFY(m_adapter->trash(path(QStringLiteral("other/dir")), second).success());
    QVERIFY(first.fileId != second.fileId);
    QVERIFY(first.isDir);
    QVERIFY(second.isDir);

    // restore into another place
    const QString dest = path(QStringLiteral("restored"));
    QVERIFY(m_adapter->restore(second, dest, FileSystemAdapter::DefaultFlags).success());
    QCOMPARE(fileContents(dest + QStringLiteral("/testfile")), QByteArray("second"));
    QVERIFY(m_adapter->restore(first, QString(), FileSystemAdapter::DefaultFlags).success());
    QVERIFY(QFileInfo(dir + QStringLiteral("/testlink")).isSymLink());
}

void LocalFileSystemAdapterTest::testTrashMissing()
{
    TrashItem item;
    const AdapterResult result = m_adapter->trash(path(QStringLiteral("missing")), item);
    QCOMPARE(result.error(), int(ERR_DOES_NOT_EXIST));
    QVERIFY(!isTrashed(path(QStringLiteral("missing"))));
}

void LocalFileSystemAdapterTest::testTrashInsideTrash()
{
    TrashItem item;
    const AdapterResult result = m_adapter->trash(m_adapter->trashDirectory() + QStringLiteral("/files"), item);
    QCOMPARE(result.error(), int(ERR_CANNOT_TRASH));
}

void LocalFileSystemAdapterTest::testRestoreOccupied()
{
    const QString file = path(QStringLiteral("file"));
    createTestFile(file, "original");
    TrashItem item;
    QVERIFY(m_adapter->trash(file, item).success());
    createTestFile(file, "newcomer");

    const AdapterResult refused = m_adapter->restore(item, QString(), FileSystemAdapter::DefaultFlags);
    QCOMPARE(refused.error(), int(ERR_FILE_ALREADY_EXIST));
    QCOMPARE(fileContents(file), QByteArray("newcomer"));
    QVERIFY(isTrashed(file));

    QVERIFY(m_adapter->restore(item, QString(), FileSystemAdapter::Overwrite).success());
    QCOMPARE(fileContents(file), QByteArray("original"));
}

void LocalFileSystemAdapterTest::testRestoreParentGone()
{
    const QString file = path(QStringLiteral("sub/file"));
    createTestFile(file);
    TrashItem item;
    QVERIFY(m_adapter->trash(file, item).success());
    QVERIFY(QDir(path(QStringLiteral("sub"))).removeRecursively());

    const AdapterResult result = m_adapter->restore(item, QString(), FileSystemAdapter::DefaultFlags);
    QCOMPARE(result.error(), int(ERR_CANNOT_RESTORE));
    QVERIFY(QFile::exists(item.physicalPath));
    QVERIFY(isTrashed(file));
}

void LocalFileSystemAdapterTest::testEmptyTrash()
{
    createTestFile(path(QStringLiteral("one")));
    createTestDirectory(path(QStringLiteral("two")));
    TrashItem item;
    QVERIFY(m_adapter->trash(path(QStringLiteral("one")), item).success());
    QVERIFY(m_adapter->trash(path(QStringLiteral("two")), item).success());
    QVERIFY(!trashItems().isEmpty());

    // a file without info file is removed too
    createTestFile(m_adapter->trashDirectory() + QStringLiteral("/files/orphan"));

    QVERIFY(m_adapter->emptyTrash().success());
    QVERIFY(trashItems().isEmpty());
    QVERIFY(QDir(m_adapter->trashDirectory() + QStringLiteral("/files")).isEmpty());
}

void LocalFileSystemAdapterTest::testConcurrentTrash()
{
    // Two threads trash files of the same name while a third restores,
    // every id must stay unique and every info file must match its data.
    QVERIFY(m_adapter->emptyTrash().success());
    const int count = 25;
    for (int i = 0; i < count; ++i) {
        createTestFile(path(QStringLiteral("left/%1/same").arg(i)), QByteArray::number(i));
        createTestFile(path(QStringLiteral("right/%1/same").arg(i)), QByteArray::number(i));
    }
    const QString restoreMe = path(QStringLiteral("restore/same"));
    createTestFile(restoreMe, "back");
    TrashItem toRestore;
    QVERIFY(m_adapter->trash(restoreMe, toRestore).success());

    QList<TrashItem> left;
    QList<TrashItem> right;
    std::atomic<int> failures{0};
    const auto trashAll = [&](const QString &side, QList<TrashItem> &items) {
        for (int i = 0; i < count; ++i) {
            TrashItem item;
            if (!m_adapter->trash(path(QStringLiteral("%1/%2/same").arg(side).arg(i)), item).success()) {
                ++failures;
            }
            items.append(item);
        }
    };
    std::unique_ptr<QThread> leftThread(QThread::create(trashAll, QStringLiteral("left"), std::ref(left)));
    std::unique_ptr<QThread> rightThread(QThread::create(trashAll, QStringLiteral("right"), std::ref(right)));
    leftThread->start();
    rightThread->start();
    const AdapterResult restored = m_adapter->restore(toRestore, QString(), FileSystemAdapter::DefaultFlags);
    QVERIFY(leftThread->wait());
    QVERIFY(rightThread->wait());

    QVERIFY2(restored.success(), qPrintable(restored.errorText()));
    QCOMPARE(fileContents(restoreMe), QByteArray("back"));
    QCOMPARE(failures.load(), 0);

    QSet<QString> ids;
    for (const QList<TrashItem> *items : {&left, &right}) {
        QCOMPARE(items->size(), count);
        for (int i = 0; i < count; ++i) {
            const TrashItem &item = items->at(i);
            QVERIFY(item.isValid());
            QCOMPARE(fileContents(item.physicalPath), QByteArray::number(i));
            ids.insert(item.fileId);
        }
    }
    QCOMPARE(ids.size(), 2 * count);

    const TrashItemList listed = trashItems();
    QCOMPARE(listed.size(), 2 * count);
    for (const TrashItem &item : listed) {
        QVERIFY(ids.contains(item.fileId));
    }
    QVERIFY(m_adapter->emptyTrash().success());
}

QTEST_GUILESS_MAIN(LocalFileSystemAdapterTest)

#include "localfilesystemadaptertest.moc"
