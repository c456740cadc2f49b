/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2006 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "undomanagertest.h"

#include "faultinjectingadapter.h"
#include "localfilesystemadapter_p.h"
#include "transactionmanager.h"
#include "transactionmanager_p.h"
#include "transactionsettings.h"
#include "undomanager.h"

#include "ktransacttesthelper.h"

#include <QDir>
#include <QFile>
#include <QLocale>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

QTEST_GUILESS_MAIN(UndoManagerTest)

using namespace KTransact;

void UndoManagerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QLocale::setDefault(QLocale::c());
    qputenv("LANGUAGE", "en_US");

    m_dir = homeTmpDir() + QStringLiteral("undo/");
}

void UndoManagerTest::init()
{
    removeTestTree(m_dir);
    QVERIFY(QDir().mkpath(m_dir + QStringLiteral("work")));

    TransactionSettings settings;
    settings.progressInterval = 10;
    auto adapter = std::make_unique<FaultInjectingAdapter>();
    m_adapter = adapter.get();
    m_manager = TransactionManagerPrivate::create(std::move(adapter), settings);
    m_undoManager = std::make_unique<UndoManager>(m_manager.get());
}

void UndoManagerTest::cleanup()
{
    m_undoManager.reset();
    m_manager.reset();
    m_adapter = nullptr;
}

void UndoManagerTest::cleanupTestCase()
{
    removeTestTree(m_dir);
    LocalFileSystemAdapter adapter;
    QVERIFY(adapter.emptyTrash().success());
}

void UndoManagerTest::runAndWait(const QUuid &transactionId)
{
    QVERIFY(!transactionId.isNull());
    const Transaction transaction = waitForTransaction(*m_manager, transactionId);
    QVERIFY(transaction.isValid());
}

bool UndoManagerTest::undoAndWait()
{
    QSignalSpy spy(m_undoManager.get(), &UndoManager::undoJobFinished);
    m_undoManager->undo();
    return spy.wait(10000);
}

bool UndoManagerTest::redoAndWait()
{
    QSignalSpy spy(m_undoManager.get(), &UndoManager::undoJobFinished);
    m_undoManager->redo();
    return spy.wait(10000);
}

void UndoManagerTest::moveAndUndo()
{
    const QString src = path(QStringLiteral("work/x.txt"));
    const QString dest = path(QStringLiteral("other/x.txt"));
    createTestFile(src, "undo me");
    QVERIFY(QDir().mkpath(path(QStringLiteral("other"))));

    QVERIFY(!m_undoManager->isUndoAvailable());
    QCOMPARE(m_undoManager->undoText(), QStringLiteral("Und&o"));
    QSignalSpy undoAvailableSpy(m_undoManager.get(), &UndoManager::undoAvailable);
    QSignalSpy redoAvailableSpy(m_undoManager.get(), &UndoManager::redoAvailable);

    runAndWait(m_manager->execute(FileOperation::move(src, dest)));
    QVERIFY(QFile::exists(dest));
    QVERIFY(m_undoManager->isUndoAvailable());
    QVERIFY(!m_undoManager->isRedoAvailable());
    QCOMPARE(m_undoManager->undoCount(), 1);
    QCOMPARE(m_undoManager->undoText(), QStringLiteral("Und&o: Move"));
    QCOMPARE(undoAvailableSpy.count(), 1);
    QVERIFY(undoAvailableSpy.at(0).at(0).toBool());

    QSignalSpy finishedSpy(m_undoManager.get(), &UndoManager::operationFinished);
    QVERIFY(undoAndWait());
    QCOMPARE(fileContents(src), QByteArray("undo me"));
    QVERIFY(!QFile::exists(dest));

    QVERIFY(!m_undoManager->isUndoAvailable());
    QVERIFY(m_undoManager->isRedoAvailable());
    QCOMPARE(m_undoManager->redoText(), QStringLiteral("&Redo: Move"));
    QVERIFY(!m_undoManager->isBusy());
    QVERIFY(!undoAvailableSpy.last().at(0).toBool());
    QVERIFY(redoAvailableSpy.last().at(0).toBool());

    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(finishedSpy.at(0).at(0).toBool());
    QCOMPARE(finishedSpy.at(0).at(1).toString(), QStringLiteral("Undo finished."));
}

void UndoManagerTest::undoRoundTrip_data()
{
    QTest::addColumn<QString>("kind");

    QTest::newRow("move_folder") << "move";
    QTest::newRow("rename") << "rename";
    QTest::newRow("create_folder") << "createFolder";
    QTest::newRow("create_file") << "createFile";
    QTest::newRow("create_symlink") << "createSymlink";
    QTest::newRow("trash") << "trash";
    QTest::newRow("restore") << "restore";
    QTest::newRow("several") << "several";
    QTest::newRow("merge_folder") << "mergeFolder";
    QTest::newRow("merge_nested_folders") << "mergeNested";
    QTest::newRow("move_across_devices") << "crossDevice";
}

void UndoManagerTest::undoRoundTrip()
{
    QFETCH(QString, kind);

    const QString work = path(QStringLiteral("work/"));
    createTestDirectory(work + QStringLiteral("dir"));
    createTestFile(work + QStringLiteral("a.txt"), "a");
    createTestFile(work + QStringLiteral("d.txt"), "d");

    if (kind == QLatin1String("restore")) {
        runAndWait(m_manager->execute(FileOperation::trash(work + QStringLiteral("a.txt"))));
        m_undoManager->clearHistory();
    } else if (kind == QLatin1String("mergeFolder")) {
        createTestFile(work + QStringLiteral("merge/dir/other"), "keep");
    } else if (kind == QLatin1String("mergeNested")) {
        createTestFile(work + QStringLiteral("dir/sub/inner"), "inner");
        createTestFile(work + QStringLiteral("merge/dir/sub/kept"), "kept");
        createTestFile(work + QStringLiteral("merge/dir/other"), "keep");
    } else if (kind == QLatin1String("crossDevice")) {
        m_adapter->failOn(FaultInjectingAdapter::Move, work + QStringLiteral("dir"), ERR_CROSS_DEVICE);
    }
    const QStringList before = treeSnapshot(work);

    QUuid id;
    if (kind == QLatin1String("move") || kind == QLatin1String("crossDevice")) {
        id = m_manager->execute(FileOperation::move(work + QStringLiteral("dir"), work + QStringLiteral("moved")));
    } else if (kind == QLatin1String("mergeFolder") || kind == QLatin1String("mergeNested")) {
        id = m_manager->execute(FileOperation::move(work + QStringLiteral("dir"), work + QStringLiteral("merge/dir"), FileOperation::Overwrite));
    } else if (kind == QLatin1String("rename")) {
        id = m_manager->execute(FileOperation::rename(work + QStringLiteral("a.txt"), QStringLiteral("b.txt")));
    } else if (kind == QLatin1String("createFolder")) {
        id = m_manager->execute(FileOperation::createFolder(work + QStringLiteral("newdir")));
    } else if (kind == QLatin1String("createFile")) {
        id = m_manager->execute(FileOperation::createFile(work + QStringLiteral("new.txt")));
    } else if (kind == QLatin1String("createSymlink")) {
        id = m_manager->execute(FileOperation::createSymlink(QStringLiteral("a.txt"), work + QStringLiteral("link")));
    } else if (kind == QLatin1String("trash")) {
        id = m_manager->execute(FileOperation::trash(work + QStringLiteral("dir")));
    } else if (kind == QLatin1String("restore")) {
        const TrashItemList items = m_manager->trashContents();
        TrashItem item;
        for (const TrashItem &candidate : items) {
            if (candidate.originalPath == work + QStringLiteral("a.txt")) {
                item = candidate;
            }
        }
        QVERIFY(item.isValid());
        id = m_manager->execute(FileOperation::restore(item));
    } else {
        id = m_manager->startTransaction(QStringLiteral("Several"));
        m_manager->addOperation(id, FileOperation::rename(work + QStringLiteral("a.txt"), QStringLiteral("b.txt")));
        m_manager->addOperation(id, FileOperation::createFile(work + QStringLiteral("c.txt")));
        m_manager->addOperation(id, FileOperation::trash(work + QStringLiteral("d.txt")));
        m_manager->addOperation(id, FileOperation::move(work + QStringLiteral("dir"), work + QStringLiteral("moved")));
        QVERIFY(m_manager->commit(id));
    }
    runAndWait(id);
    QCOMPARE(m_manager->transaction(id).status(), Transaction::Completed);
    QVERIFY(treeSnapshot(work) != before);
    QCOMPARE(m_undoManager->undoCount(), 1);

    QVERIFY(undoAndWait());
    QCOMPARE(treeSnapshot(work), before);
    QCOMPARE(m_undoManager->undoCount(), 0);
    QCOMPARE(m_undoManager->redoCount(), 1);
}

void UndoManagerTest::undoUsesActualDestination()
{
    createTestFile(path(QStringLiteral("work/a.txt")), "a");
    createTestFile(path(QStringLiteral("work/b.txt")), "b");
    const QStringList before = treeSnapshot(path(QStringLiteral("work")));

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::rename(path(QStringLiteral("work/a.txt")), QStringLiteral("b.txt")));
    QCOMPARE(conflictSpy.count(), 1);
    QVERIFY(m_manager->resolveConflict(conflictSpy.at(0).at(0).value<ConflictRecord>().jobId, Rename));
    runAndWait(id);
    QCOMPARE(fileContents(path(QStringLiteral("work/b (2).txt"))), QByteArray("a"));

    const Transaction record = m_undoManager->nextUndo();
    QCOMPARE(record.jobs().at(0).operation().targetPath(), path(QStringLiteral("work/b (2).txt")));

    QVERIFY(undoAndWait());
    QCOMPARE(treeSnapshot(path(QStringLiteral("work"))), before);
}

void UndoManagerTest::undoMergeResolvedByOverwrite()
{
    createTestDirectory(path(QStringLiteral("work/a/dir")));
    createTestFile(path(QStringLiteral("work/a/dir/sub/inner")), "inner");
    createTestFile(path(QStringLiteral("work/b/dir/other")), "keep");
    createTestFile(path(QStringLiteral("work/b/dir/sub/kept")), "kept");
    const QStringList before = treeSnapshot(path(QStringLiteral("work")));

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::move(path(QStringLiteral("work/a/dir")), path(QStringLiteral("work/b/dir"))));
    QCOMPARE(conflictSpy.count(), 1);
    QVERIFY(m_manager->resolveConflict(conflictSpy.at(0).at(0).value<ConflictRecord>().jobId, Overwrite));
    runAndWait(id);
    QVERIFY(!QFile::exists(path(QStringLiteral("work/a/dir"))));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/sub/inner"))), QByteArray("inner"));
    QCOMPARE(m_undoManager->undoCount(), 1);

    QVERIFY(undoAndWait());
    QCOMPARE(treeSnapshot(path(QStringLiteral("work"))), before);
    // untouched by the move, so untouched by its undo
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/other"))), QByteArray("keep"));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/sub/kept"))), QByteArray("kept"));

    QVERIFY(redoAndWait());
    QVERIFY(!QFile::exists(path(QStringLiteral("work/a/dir/testfile"))));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/testfile"))), QByteArray("Hello world"));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/sub/inner"))), QByteArray("inner"));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/other"))), QByteArray("keep"));
}

void UndoManagerTest::overwriteIsNotRecorded_data()
{
    QTest::addColumn<bool>("folder");

    QTest::newRow("file_over_file") << false;
    QTest::newRow("folder_over_folder_with_same_file") << true;
}

void UndoManagerTest::overwriteIsNotRecorded()
{
    QFETCH(bool, folder);

    const QString src = path(folder ? QStringLiteral("work/a/dir") : QStringLiteral("work/a/x.txt"));
    const QString dest = path(folder ? QStringLiteral("work/b/dir") : QStringLiteral("work/b/x.txt"));
    if (folder) {
        createTestFile(src + QStringLiteral("/x.txt"), "new");
        createTestFile(dest + QStringLiteral("/x.txt"), "old");
        createTestFile(dest + QStringLiteral("/other"), "keep");
    } else {
        createTestFile(src, "new");
        createTestFile(dest, "old");
    }

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::move(src, dest));
    QCOMPARE(conflictSpy.count(), 1);
    QVERIFY(m_manager->resolveConflict(conflictSpy.at(0).at(0).value<ConflictRecord>().jobId, Overwrite));
    runAndWait(id);
    QCOMPARE(m_manager->transaction(id).status(), Transaction::Completed);

    const QString replaced = folder ? dest + QStringLiteral("/x.txt") : dest;
    QCOMPARE(fileContents(replaced), QByteArray("new"));

    // "old" cannot be brought back, undo must not pretend otherwise
    QVERIFY(!m_undoManager->isUndoAvailable());
    QCOMPARE(m_undoManager->undoCount(), 0);
    m_undoManager->undo();
    QVERIFY(!m_undoManager->isBusy());
    QCOMPARE(fileContents(replaced), QByteArray("new"));
    if (folder) {
        QCOMPARE(fileContents(dest + QStringLiteral("/other")), QByteArray("keep"));
    }
}

void UndoManagerTest::partialUndoOfMergeKeepsTheRest()
{
    createTestFile(path(QStringLiteral("work/a/dir/one")), "1");
    createTestFile(path(QStringLiteral("work/a/dir/two")), "2");
    createTestFile(path(QStringLiteral("work/b/dir/other")), "keep");

    runAndWait(m_manager->execute(FileOperation::move(path(QStringLiteral("work/a/dir")), path(QStringLiteral("work/b/dir")), FileOperation::Overwrite)));
    QCOMPARE(m_undoManager->undoCount(), 1);

    // recreate a/dir, move "two" back, fail on "one"
    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("work/b/dir/one")), ERR_ACCESS_DENIED);
    QVERIFY(undoAndWait());
    QCOMPARE(fileContents(path(QStringLiteral("work/a/dir/two"))), QByteArray("2"));
    QCOMPARE(fileContents(path(QStringLiteral("work/b/dir/one"))), QByteArray("1"));

    // only "one" is left to take back
    QCOMPARE(m_undoManager->undoCount(), 1);
    const Transaction rest = m_undoManager->nextUndo();
    QCOMPARE(rest.totalOps(), 1);
    const JobResult result = rest.jobs().at(0).result();
    QCOMPARE(result.movedEntries().size(), 1);
    QCOMPARE(result.movedEntries().at(0).destination, path(QStringLiteral("work/b/dir/one")));
    QVERIFY(result.removedDirectories().isEmpty());

    m_adapter->clearFailures();
    QVERIFY(undoAndWait());
    QCOMPARE(fileContents(path(QStringLiteral("work/a/dir/one"))), QByteArray("1"));
    QCOMPARE(fileContents(path(QStringLiteral("work/a/dir/two"))), QByteArray("2"));
    QCOMPARE(treeSnapshot(path(QStringLiteral("work/b/dir"))), QStringList{QStringLiteral("other = keep")});
    QCOMPARE(m_undoManager->undoCount(), 0);
}

void UndoManagerTest::redo()
{
    const QString src = path(QStringLiteral("work/x.txt"));
    const QString dest = path(QStringLiteral("work/y.txt"));
    createTestFile(src, "x");

    runAndWait(m_manager->execute(FileOperation::rename(src, QStringLiteral("y.txt"))));
    QVERIFY(undoAndWait());
    QVERIFY(QFile::exists(src));

    QVERIFY(redoAndWait());
    QVERIFY(!QFile::exists(src));
    QCOMPARE(fileContents(dest), QByteArray("x"));
    QVERIFY(m_undoManager->isUndoAvailable());
    QVERIFY(!m_undoManager->isRedoAvailable());
    QCOMPARE(m_undoManager->undoText(), QStringLiteral("Und&o: Rename"));

    // and back again
    QVERIFY(undoAndWait());
    QVERIFY(QFile::exists(src));
    QVERIFY(!QFile::exists(dest));
}

void UndoManagerTest::newWorkClearsRedo()
{
    createTestFile(path(QStringLiteral("work/a")));
    runAndWait(m_manager->execute(FileOperation::createFolder(path(QStringLiteral("work/new")))));
    QVERIFY(undoAndWait());
    QVERIFY(m_undoManager->isRedoAvailable());

    QSignalSpy redoAvailableSpy(m_undoManager.get(), &UndoManager::redoAvailable);
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/b")))));
    QVERIFY(!m_undoManager->isRedoAvailable());
    QCOMPARE(m_undoManager->redoCount(), 0);
    QCOMPARE(redoAvailableSpy.count(), 1);
    QVERIFY(!redoAvailableSpy.at(0).at(0).toBool());
    QCOMPARE(m_undoManager->undoCount(), 1);

    // a copy records nothing but is new work too
    QVERIFY(undoAndWait());
    QVERIFY(m_undoManager->isRedoAvailable());
    runAndWait(m_manager->execute(FileOperation::copy(path(QStringLiteral("work/a")), path(QStringLiteral("work/a2")))));
    QVERIFY(!m_undoManager->isRedoAvailable());
}

void UndoManagerTest::copyIsNotRecorded()
{
    createTestFile(path(QStringLiteral("work/a")));
    runAndWait(m_manager->execute(FileOperation::copy(path(QStringLiteral("work/a")), path(QStringLiteral("work/b")))));
    QVERIFY(QFile::exists(path(QStringLiteral("work/b"))));
    QVERIFY(!m_undoManager->isUndoAvailable());

    runAndWait(m_manager->execute(FileOperation::move(path(QStringLiteral("work/b")), path(QStringLiteral("work/c")), FileOperation::Irreversible)));
    QVERIFY(!m_undoManager->isUndoAvailable());
    QCOMPARE(m_undoManager->undoCount(), 0);
}

void UndoManagerTest::failedJobsAreNotRecorded()
{
    createTestFile(path(QStringLiteral("work/a")));
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/new")))));
    QVERIFY(undoAndWait());
    QVERIFY(m_undoManager->isRedoAvailable());

    m_adapter->failOn(FaultInjectingAdapter::Trash, path(QStringLiteral("work/a")), ERR_ACCESS_DENIED);
    const QUuid id = m_manager->execute(FileOperation::trash(path(QStringLiteral("work/a"))));
    runAndWait(id);
    QCOMPARE(m_manager->transaction(id).status(), Transaction::Failed);

    // nothing happened, nothing changes
    QVERIFY(!m_undoManager->isUndoAvailable());
    QVERIFY(m_undoManager->isRedoAvailable());
}

void UndoManagerTest::partialFailureIsolation()
{
    QStringList sources;
    for (int i = 1; i <= 4; ++i) {
        const QString name = QStringLiteral("f%1").arg(i);
        createTestFile(path(QStringLiteral("work/") + name), name.toUtf8());
        sources << path(QStringLiteral("work/") + name);
    }
    QVERIFY(QDir().mkpath(path(QStringLiteral("dest"))));
    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("work/f2")), ERR_ACCESS_DENIED);

    const QUuid id = m_manager->transfer(sources, path(QStringLiteral("dest")), TransactionManager::MoveMode);
    runAndWait(id);
    QVERIFY(m_manager->transaction(id).isPartial());

    const Transaction record = m_undoManager->nextUndo();
    QCOMPARE(record.totalOps(), 3);
    for (const Job &job : record.jobs()) {
        QVERIFY(!job.operation().source().endsWith(QLatin1String("/f2")));
    }

    m_adapter->clearCalls();
    QVERIFY(undoAndWait());
    const QStringList calls = m_adapter->calls();
    QCOMPARE(calls.size(), 3);
    for (const QString &call : calls) {
        QVERIFY2(!call.contains(QLatin1String("f2")), qPrintable(call));
    }
    for (const QString &source : std::as_const(sources)) {
        QVERIFY(QFile::exists(source));
    }
    QCOMPARE(m_undoManager->undoCount(), 0);
}

void UndoManagerTest::partialUndoKeepsRemainder()
{
    QStringList sources;
    for (const QString &name : {QStringLiteral("f1"), QStringLiteral("f2")}) {
        createTestFile(path(QStringLiteral("work/") + name), name.toUtf8());
        sources << path(QStringLiteral("work/") + name);
    }
    QVERIFY(QDir().mkpath(path(QStringLiteral("dest"))));
    runAndWait(m_manager->transfer(sources, path(QStringLiteral("dest")), TransactionManager::MoveMode));
    QCOMPARE(m_undoManager->nextUndo().totalOps(), 2);

    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("dest/f2")), ERR_ACCESS_DENIED);
    QSignalSpy finishedSpy(m_undoManager.get(), &UndoManager::operationFinished);
    QVERIFY(undoAndWait());

    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(!finishedSpy.at(0).at(0).toBool());
    QCOMPARE(finishedSpy.at(0).at(1).toString(), QStringLiteral("One operation could not be undone."));
    QVERIFY(QFile::exists(path(QStringLiteral("work/f1"))));
    QVERIFY(QFile::exists(path(QStringLiteral("dest/f2"))));

    // what could not be undone stays undoable, what was undone can be redone
    QCOMPARE(m_undoManager->undoCount(), 1);
    const Transaction remainder = m_undoManager->nextUndo();
    QCOMPARE(remainder.totalOps(), 1);
    QCOMPARE(remainder.jobs().at(0).operation().source(), path(QStringLiteral("work/f2")));
    QVERIFY(remainder.isPartial());
    QCOMPARE(m_undoManager->redoCount(), 1);
    QCOMPARE(m_undoManager->nextRedo().totalOps(), 1);

    m_adapter->clearFailures();
    QVERIFY(undoAndWait());
    QVERIFY(QFile::exists(path(QStringLiteral("work/f2"))));
    QCOMPARE(m_undoManager->undoCount(), 0);
    QCOMPARE(m_undoManager->redoCount(), 2);
}

void UndoManagerTest::limit()
{
    m_undoManager = std::make_unique<UndoManager>(m_manager.get(), 2);
    QCOMPARE(m_undoManager->limit(), 2);

    for (const QString &name : {QStringLiteral("one"), QStringLiteral("two"), QStringLiteral("three")}) {
        runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/") + name)), name));
    }
    QCOMPARE(m_undoManager->undoCount(), 2);
    QCOMPARE(m_undoManager->undoText(), QStringLiteral("Und&o: three"));

    QVERIFY(undoAndWait());
    QVERIFY(undoAndWait());
    QVERIFY(!m_undoManager->isUndoAvailable());
    // the oldest entry was dropped
    QVERIFY(QFile::exists(path(QStringLiteral("work/one"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("work/two"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("work/three"))));
}

void UndoManagerTest::busyWhileRunning()
{
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/one")))));
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/two")))));
    QCOMPARE(m_undoManager->undoCount(), 2);

    QSignalSpy finishedSpy(m_undoManager.get(), &UndoManager::undoJobFinished);
    m_undoManager->undo();
    QVERIFY(m_undoManager->isBusy());
    QVERIFY(!m_undoManager->isUndoAvailable());
    // ignored while the first one runs
    m_undoManager->undo();
    m_undoManager->clearHistory();

    QVERIFY(finishedSpy.wait(10000));
    QTest::qWait(100);
    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(!m_undoManager->isBusy());
    QCOMPARE(m_undoManager->undoCount(), 1);
    QCOMPARE(m_undoManager->redoCount(), 1);
    QVERIFY(QFile::exists(path(QStringLiteral("work/one"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("work/two"))));
}

void UndoManagerTest::clearHistory()
{
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/one")))));
    runAndWait(m_manager->execute(FileOperation::createFile(path(QStringLiteral("work/two")))));
    QVERIFY(undoAndWait());
    QVERIFY(m_undoManager->isUndoAvailable());
    QVERIFY(m_undoManager->isRedoAvailable());

    QSignalSpy undoAvailableSpy(m_undoManager.get(), &UndoManager::undoAvailable);
    m_undoManager->clearHistory();
    QVERIFY(!m_undoManager->isUndoAvailable());
    QVERIFY(!m_undoManager->isRedoAvailable());
    QCOMPARE(undoAvailableSpy.count(), 1);
    QCOMPARE(m_undoManager->undoText(), QStringLiteral("Und&o"));
    QCOMPARE(m_undoManager->redoText(), QStringLiteral("&Redo"));
    QVERIFY(!m_undoManager->nextUndo().isValid());
}

#include "moc_undomanagertest.cpp"
