/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004-2006 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "transactionmanagertest.h"

#include "conflictresolverinterface.h"
#include "faultinjectingadapter.h"
#include "transactionmanager.h"
#include "transactionmanager_p.h"

#include "ktransacttesthelper.h"

#include <QLocale>
#include <QSemaphore>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

#include <algorithm>

QTEST_GUILESS_MAIN(TransactionManagerTest)

using namespace KTransact;

namespace
{
// Answers every conflict with the same action and counts how often it was asked
class FixedResolver : public ConflictResolverInterface
{
public:
    FixedResolver(ConflictAction action, bool applyToAll, int *askCount)
        : m_action(action)
        , m_applyToAll(applyToAll)
        , m_askCount(askCount)
    {
    }

    ConflictResolution askUserConflict(const ConflictRecord &) override
    {
        ++*m_askCount;
        ConflictResolution resolution;
        resolution.action = m_action;
        resolution.applyToAll = m_applyToAll;
        return resolution;
    }

private:
    const ConflictAction m_action;
    const bool m_applyToAll;
    int *const m_askCount;
};

// Claims to create files without doing it
class LyingAdapter : public LocalFileSystemAdapter
{
public:
    AdapterResult createFile(const QString &path, Flags) override
    {
        return AdapterResult::pass(path);
    }
};

QString callKey(FaultInjectingAdapter::Primitive primitive, const QString &path)
{
    return QString::number(primitive) + QLatin1Char(' ') + path;
}
}

void TransactionManagerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QLocale::setDefault(QLocale::c());
    qputenv("LANGUAGE", "en_US");

    m_dir = homeTmpDir() + QStringLiteral("manager/");
}

void TransactionManagerTest::init()
{
    removeTestTree(m_dir);
    QVERIFY(QDir().mkpath(m_dir));
    createManager();
}

void TransactionManagerTest::cleanup()
{
    m_manager.reset();
    m_adapter = nullptr;
}

void TransactionManagerTest::cleanupTestCase()
{
    removeTestTree(m_dir);
    LocalFileSystemAdapter adapter;
    QVERIFY(adapter.emptyTrash().success());
}

void TransactionManagerTest::createManager(int nameProbeLimit)
{
    TransactionSettings settings;
    settings.nameProbeLimit = nameProbeLimit;
    settings.progressInterval = 10;
    auto adapter = std::make_unique<FaultInjectingAdapter>();
    m_adapter = adapter.get();
    m_manager = TransactionManagerPrivate::create(std::move(adapter), settings);
}

void TransactionManagerTest::moveFile()
{
    const QString src = path(QStringLiteral("a/x.txt"));
    const QString dest = path(QStringLiteral("b/x.txt"));
    createTestFile(src, "moving");
    QVERIFY(QDir().mkpath(path(QStringLiteral("b"))));

    QSignalSpy startedSpy(m_manager.get(), &TransactionManager::transactionStarted);
    QSignalSpy jobStartedSpy(m_manager.get(), &TransactionManager::jobStarted);
    QSignalSpy completedSpy(m_manager.get(), &TransactionManager::jobCompleted);
    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);

    const QUuid id = m_manager->execute(FileOperation::move(src, dest));
    QVERIFY(!id.isNull());
    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(startedSpy.at(0).at(1).toString(), QStringLiteral("Move"));
    QVERIFY(m_manager->isActive(id));

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QVERIFY(transaction.isValid());
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(!transaction.isPartial());
    QCOMPARE(transaction.totalOps(), 1);
    QCOMPARE(transaction.jobs().at(0).status(), Job::Completed);
    QCOMPARE(transaction.jobs().at(0).result().outcome(), JobResult::Success);
    QVERIFY(!m_manager->isActive(id));
    QVERIFY(m_manager->activeTransactions().isEmpty());

    QVERIFY(!QFile::exists(src));
    QCOMPARE(fileContents(dest), QByteArray("moving"));

    QCOMPARE(jobStartedSpy.count(), 1);
    QCOMPARE(jobStartedSpy.at(0).at(2).toString(), src);
    QCOMPARE(completedSpy.count(), 1);
    QCOMPARE(completedSpy.at(0).at(2).toString(), dest);

    // a reversible success is handed to the history
    QCOMPARE(historySpy.count(), 1);
    const Transaction record = historySpy.at(0).at(0).value<Transaction>();
    QCOMPARE(record.id(), id);
    QCOMPARE(record.totalOps(), 1);

    // still queryable after the end
    QCOMPARE(m_manager->transaction(id).status(), Transaction::Completed);
}

void TransactionManagerTest::moveFolder()
{
    createTestDirectory(path(QStringLiteral("a/dir")));
    const QStringList before = treeSnapshot(path(QStringLiteral("a/dir")));

    const QUuid id = m_manager->transfer({path(QStringLiteral("a/dir"))}, path(QStringLiteral("b")), TransactionManager::MoveMode);
    // the destination folder does not exist
    Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Failed);
    QVERIFY(QFileInfo(path(QStringLiteral("a/dir"))).isDir());

    QVERIFY(QDir().mkpath(path(QStringLiteral("b"))));
    const QUuid id2 = m_manager->transfer({path(QStringLiteral("a/dir"))}, path(QStringLiteral("b")), TransactionManager::MoveMode);
    transaction = waitForTransaction(*m_manager, id2);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(!QFile::exists(path(QStringLiteral("a/dir"))));
    QCOMPARE(treeSnapshot(path(QStringLiteral("b/dir"))), before);
}

void TransactionManagerTest::copyFolderReportsProgress()
{
    createTestDirectory(path(QStringLiteral("src")), NoSymlink);
    createTestFile(path(QStringLiteral("src/big")), QByteArray(1000, 'z'));
    const filesize_t expected = 1000 + 11;

    QSignalSpy progressSpy(m_manager.get(), &TransactionManager::transactionProgress);
    QSignalSpy updateSpy(m_manager.get(), &TransactionManager::transactionUpdate);
    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);

    const QUuid id = m_manager->execute(FileOperation::copy(path(QStringLiteral("src")), path(QStringLiteral("dest"))));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(treeSnapshot(path(QStringLiteral("dest"))), treeSnapshot(path(QStringLiteral("src"))));

    QVERIFY(progressSpy.count() > 0);
    const QList<QVariant> last = progressSpy.last();
    QCOMPARE(last.at(1).value<filesize_t>(), expected);
    QCOMPARE(last.at(2).value<filesize_t>(), expected);
    QCOMPARE(transaction.processedAmount(), expected);
    QCOMPARE(transaction.totalAmount(), expected);

    QVERIFY(updateSpy.count() > 0);
    QCOMPARE(updateSpy.last().at(1).toInt(), 1);
    QCOMPARE(updateSpy.last().at(2).toInt(), 1);

    // a copy offers nothing to undo, but still counts as new work
    QCOMPARE(historySpy.count(), 1);
    QCOMPARE(historySpy.at(0).at(0).value<Transaction>().totalOps(), 0);
}

void TransactionManagerTest::trashAndRestore()
{
    const QString file = path(QStringLiteral("trashme"));
    createTestFile(file, "in the trash");

    const QUuid id = m_manager->execute(FileOperation::trash(file));
    Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(!QFile::exists(file));

    const TrashItem item = transaction.jobs().at(0).result().trashItem();
    QVERIFY(item.isValid());
    QCOMPARE(item.originalPath, file);
    const TrashItemList contents = m_manager->trashContents();
    QVERIFY(std::any_of(contents.cbegin(), contents.cend(), [&item](const TrashItem &entry) {
        return entry.fileId == item.fileId;
    }));

    const QUuid restoreId = m_manager->execute(FileOperation::restore(item));
    transaction = waitForTransaction(*m_manager, restoreId);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(fileContents(file), QByteArray("in the trash"));
    QCOMPARE(transaction.jobs().at(0).operation().targetPath(), file);
}

void TransactionManagerTest::createOperations()
{
    const QUuid id = m_manager->startTransaction(QStringLiteral("New things"));
    QVERIFY(!m_manager->addOperation(id, FileOperation::createFolder(path(QStringLiteral("folder")))).isNull());
    QVERIFY(!m_manager->addOperation(id, FileOperation::createFile(path(QStringLiteral("file.txt")))).isNull());
    QVERIFY(!m_manager->addOperation(id, FileOperation::createSymlink(QStringLiteral("file.txt"), path(QStringLiteral("link")))).isNull());
    QCOMPARE(m_manager->transaction(id).status(), Transaction::Pending);
    QVERIFY(m_manager->commit(id));

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(transaction.description(), QStringLiteral("New things"));
    QCOMPARE(transaction.succeededOps(), 3);
    QVERIFY(QFileInfo(path(QStringLiteral("folder"))).isDir());
    QVERIFY(QFileInfo(path(QStringLiteral("file.txt"))).isFile());
    QCOMPARE(QFileInfo(path(QStringLiteral("link"))).symLinkTarget(), path(QStringLiteral("file.txt")));
}

void TransactionManagerTest::renameCollisionPrompt()
{
    createTestFile(path(QStringLiteral("d/a.txt")), "a");
    createTestFile(path(QStringLiteral("d/b.txt")), "b");

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    QSignalSpy resolvedSpy(m_manager.get(), &TransactionManager::conflictResolved);
    QSignalSpy completedSpy(m_manager.get(), &TransactionManager::jobCompleted);

    const QUuid id = m_manager->execute(FileOperation::rename(path(QStringLiteral("d/a.txt")), QStringLiteral("b.txt")));
    QCOMPARE(conflictSpy.count(), 1);
    const ConflictRecord conflict = conflictSpy.at(0).at(0).value<ConflictRecord>();
    QCOMPARE(conflict.transactionId, id);
    QCOMPARE(conflict.type, FileOperation::Rename);
    QCOMPARE(conflict.source, path(QStringLiteral("d/a.txt")));
    QCOMPARE(conflict.destination, path(QStringLiteral("d/b.txt")));
    QVERIFY(!conflict.destinationIsDir);
    QCOMPARE(conflict.options, ConflictActions(Skip | Overwrite | Rename | CancelAll));
    QCOMPARE(conflict.suggestedName, QStringLiteral("b (2).txt"));

    // nothing happens while the question is open
    QTest::qWait(50);
    QVERIFY(m_manager->isActive(id));
    QCOMPARE(m_manager->transaction(id).jobs().at(0).status(), Job::Pending);

    QVERIFY(m_manager->resolveConflict(conflict.jobId, Rename));
    QCOMPARE(resolvedSpy.count(), 1);
    QCOMPARE(resolvedSpy.at(0).at(1).value<ConflictAction>(), Rename);

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(completedSpy.count(), 1);
    const JobResult result = completedSpy.at(0).at(3).value<JobResult>();
    QCOMPARE(result.resultPath(), path(QStringLiteral("d/b (2).txt")));
    QCOMPARE(transaction.jobs().at(0).operation().targetPath(), path(QStringLiteral("d/b (2).txt")));
    QCOMPARE(fileContents(path(QStringLiteral("d/b (2).txt"))), QByteArray("a"));
    QCOMPARE(fileContents(path(QStringLiteral("d/b.txt"))), QByteArray("b"));
    QVERIFY(!QFile::exists(path(QStringLiteral("d/a.txt"))));
}

void TransactionManagerTest::renameCollisionExplicitName()
{
    createTestFile(path(QStringLiteral("d/a.txt")), "a");
    createTestFile(path(QStringLiteral("d/b.txt")), "b");
    createTestFile(path(QStringLiteral("d/c.txt")), "c");

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::rename(path(QStringLiteral("d/a.txt")), QStringLiteral("b.txt")));
    QCOMPARE(conflictSpy.count(), 1);
    const QUuid jobId = conflictSpy.at(0).at(0).value<ConflictRecord>().jobId;

    // the new name is taken too: asked again
    QVERIFY(m_manager->resolveConflict(jobId, Rename, QStringLiteral("c.txt")));
    QCOMPARE(conflictSpy.count(), 2);
    QCOMPARE(conflictSpy.at(1).at(0).value<ConflictRecord>().destination, path(QStringLiteral("d/c.txt")));

    QVERIFY(m_manager->resolveConflict(jobId, Rename, QStringLiteral("renamed.txt")));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(fileContents(path(QStringLiteral("d/renamed.txt"))), QByteArray("a"));
    QCOMPARE(fileContents(path(QStringLiteral("d/c.txt"))), QByteArray("c"));
}

void TransactionManagerTest::conflictOptionsWithoutOverwrite()
{
    createTestFile(path(QStringLiteral("src/item")));
    createTestDirectory(path(QStringLiteral("dest/item")));

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->startTransaction(QStringLiteral("Conflicts"));
    m_manager->addOperation(id, FileOperation::copy(path(QStringLiteral("src/item")), path(QStringLiteral("dest/item"))));
    m_manager->addOperation(id, FileOperation::createFolder(path(QStringLiteral("dest/item"))));
    QVERIFY(m_manager->commit(id));

    // a file never replaces a folder
    QCOMPARE(conflictSpy.count(), 1);
    const ConflictRecord first = conflictSpy.at(0).at(0).value<ConflictRecord>();
    QVERIFY(first.destinationIsDir);
    QCOMPARE(first.options, ConflictActions(Skip | Rename | CancelAll));
    QCOMPARE(first.suggestedName, QStringLiteral("item (Copy)"));

    QVERIFY(m_manager->resolveConflict(first.jobId, Skip));

    // creating never replaces anything
    QCOMPARE(conflictSpy.count(), 2);
    const ConflictRecord second = conflictSpy.at(1).at(0).value<ConflictRecord>();
    QCOMPARE(second.type, FileOperation::CreateFolder);
    QCOMPARE(second.options, ConflictActions(Skip | Rename | CancelAll));
    QCOMPARE(second.suggestedName, QStringLiteral("item (2)"));
    QVERIFY(m_manager->resolveConflict(second.jobId, Rename));

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(transaction.isPartial());
    QCOMPARE(transaction.jobs().at(0).status(), Job::Cancelled);
    QCOMPARE(transaction.jobs().at(0).result().error(), int(ERR_USER_CANCELED));
    QCOMPARE(transaction.jobs().at(1).status(), Job::Completed);
    QVERIFY(QFileInfo(path(QStringLiteral("dest/item (2)"))).isDir());
}

void TransactionManagerTest::applyToAllSignals()
{
    const QStringList names{QStringLiteral("one"), QStringLiteral("two"), QStringLiteral("three")};
    QStringList sources;
    for (const QString &name : names) {
        createTestFile(path(QStringLiteral("src/") + name), "new");
        createTestFile(path(QStringLiteral("dest/") + name), "old");
        sources << path(QStringLiteral("src/") + name);
    }

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    QSignalSpy resolvedSpy(m_manager.get(), &TransactionManager::conflictResolved);
    QSignalSpy cancelledSpy(m_manager.get(), &TransactionManager::jobCancelled);
    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);

    const QUuid id = m_manager->transfer(sources, path(QStringLiteral("dest")), TransactionManager::CopyMode);
    // one question at a time
    QCOMPARE(conflictSpy.count(), 1);
    const ConflictRecord conflict = conflictSpy.at(0).at(0).value<ConflictRecord>();

    QVERIFY(m_manager->resolveConflict(conflict.jobId, Skip, QString(), true));
    QCOMPARE(conflictSpy.count(), 1);
    QCOMPARE(resolvedSpy.count(), 3);
    QCOMPARE(cancelledSpy.count(), 3);

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Cancelled);
    QCOMPARE(historySpy.count(), 0);
    for (const QString &name : names) {
        QCOMPARE(fileContents(path(QStringLiteral("dest/") + name)), QByteArray("old"));
    }
}

void TransactionManagerTest::applyToAllResolver()
{
    QStringList sources;
    for (const QString &name : {QStringLiteral("one"), QStringLiteral("two"), QStringLiteral("three")}) {
        createTestFile(path(QStringLiteral("src/") + name), "new");
        createTestFile(path(QStringLiteral("dest/") + name), "old");
        sources << path(QStringLiteral("src/") + name);
    }
    int asked = 0;
    auto resolver = std::make_unique<FixedResolver>(Overwrite, true, &asked);
    const ConflictResolverInterface *installed = resolver.get();
    m_manager->setConflictResolver(std::move(resolver));
    QCOMPARE(m_manager->conflictResolver(), installed);
    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);

    const QUuid id = m_manager->transfer(sources, path(QStringLiteral("dest")), TransactionManager::CopyMode);
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(asked, 1);
    QCOMPARE(conflictSpy.count(), 0);
    for (const QString &source : std::as_const(sources)) {
        QCOMPARE(fileContents(path(QStringLiteral("dest/")) + QFileInfo(source).fileName()), QByteArray("new"));
    }

    // back to the signal based protocol
    m_manager->setConflictResolver(nullptr);
    QVERIFY(!m_manager->conflictResolver());
    createTestFile(path(QStringLiteral("src/four")), "new");
    createTestFile(path(QStringLiteral("dest/four")), "old");
    const QUuid id2 = m_manager->execute(FileOperation::copy(path(QStringLiteral("src/four")), path(QStringLiteral("dest/four"))));
    QTRY_COMPARE(conflictSpy.count(), 1);
    QCOMPARE(asked, 1);
    QVERIFY(m_manager->cancel(id2));
    QCOMPARE(waitForTransaction(*m_manager, id2).status(), Transaction::Cancelled);
}

void TransactionManagerTest::resolverCancelAll()
{
    QStringList sources;
    for (const QString &name : {QStringLiteral("one"), QStringLiteral("two")}) {
        createTestFile(path(QStringLiteral("src/") + name), "new");
        createTestFile(path(QStringLiteral("dest/") + name), "old");
        sources << path(QStringLiteral("src/") + name);
    }
    createTestFile(path(QStringLiteral("src/three")), "new");
    sources << path(QStringLiteral("src/three"));

    int asked = 0;
    m_manager->setConflictResolver(std::make_unique<FixedResolver>(CancelAll, false, &asked));
    const QUuid id = m_manager->transfer(sources, path(QStringLiteral("dest")), TransactionManager::MoveMode);
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Cancelled);
    QCOMPARE(asked, 1);
    for (const Job &job : transaction.jobs()) {
        QCOMPARE(job.status(), Job::Cancelled);
    }
    QCOMPARE(fileContents(path(QStringLiteral("dest/one"))), QByteArray("old"));
    QVERIFY(QFile::exists(path(QStringLiteral("src/three"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("dest/three"))));
}

void TransactionManagerTest::resolveConflictRejectsUnofferedAction()
{
    createTestFile(path(QStringLiteral("new")));
    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::createFile(path(QStringLiteral("new"))));
    QCOMPARE(conflictSpy.count(), 1);
    const QUuid jobId = conflictSpy.at(0).at(0).value<ConflictRecord>().jobId;

    QVERIFY(!m_manager->resolveConflict(jobId, Overwrite));
    QVERIFY(!m_manager->resolveConflict(QUuid::createUuid(), Skip));
    QVERIFY(m_manager->isActive(id));

    QVERIFY(m_manager->resolveConflict(jobId, CancelAll));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Cancelled);

    // not waiting anymore
    QVERIFY(!m_manager->resolveConflict(jobId, Skip));
}

void TransactionManagerTest::missingSourceIsCancelled()
{
    QSignalSpy cancelledSpy(m_manager.get(), &TransactionManager::jobCancelled);
    QSignalSpy failedSpy(m_manager.get(), &TransactionManager::jobFailed);

    const QUuid id = m_manager->execute(FileOperation::move(path(QStringLiteral("missing")), path(QStringLiteral("dest"))));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Cancelled);
    const Job job = transaction.jobs().at(0);
    QCOMPARE(job.status(), Job::Cancelled);
    QCOMPARE(job.result().error(), int(ERR_DOES_NOT_EXIST));
    QCOMPARE(job.result().errorText(), path(QStringLiteral("missing")));
    QCOMPARE(cancelledSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);
}

void TransactionManagerTest::permissionDenied()
{
    const QString file = path(QStringLiteral("a.txt"));
    createTestFile(file);
    m_adapter->failOn(FaultInjectingAdapter::Rename, file, ERR_ACCESS_DENIED);

    QSignalSpy failedSpy(m_manager.get(), &TransactionManager::jobFailed);
    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);

    const QUuid id = m_manager->execute(FileOperation::rename(file, QStringLiteral("b.txt")));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Failed);
    QCOMPARE(transaction.jobs().at(0).status(), Job::Failed);
    QCOMPARE(transaction.jobs().at(0).result().outcome(), JobResult::Failure);

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<FileOperation::Type>(), FileOperation::Rename);
    QCOMPARE(failedSpy.at(0).at(3).toInt(), int(ERR_ACCESS_DENIED));
    QCOMPARE(failedSpy.at(0).at(4).toString(), file);
    QCOMPARE(historySpy.count(), 0);
    QVERIFY(QFile::exists(file));
}

void TransactionManagerTest::crossDeviceFallback()
{
    createTestDirectory(path(QStringLiteral("src/dir")));
    createTestFile(path(QStringLiteral("src/single")), "single");
    QVERIFY(QDir().mkpath(path(QStringLiteral("dest"))));
    const QStringList before = treeSnapshot(path(QStringLiteral("src/dir")));
    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("src/dir")), ERR_CROSS_DEVICE);
    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("src/single")), ERR_CROSS_DEVICE);

    const QUuid id =
        m_manager->transfer({path(QStringLiteral("src/dir")), path(QStringLiteral("src/single"))}, path(QStringLiteral("dest")), TransactionManager::MoveMode);
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(!transaction.isPartial());

    QVERIFY(!QFile::exists(path(QStringLiteral("src/dir"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("src/single"))));
    QCOMPARE(treeSnapshot(path(QStringLiteral("dest/dir"))), before);
    QCOMPARE(fileContents(path(QStringLiteral("dest/single"))), QByteArray("single"));

    const QStringList calls = m_adapter->calls();
    QVERIFY(calls.contains(callKey(FaultInjectingAdapter::MakeDirectory, path(QStringLiteral("dest/dir")))));
    QVERIFY(std::any_of(calls.cbegin(), calls.cend(), [this](const QString &call) {
        return call.startsWith(callKey(FaultInjectingAdapter::CopyFile, path(QStringLiteral("src/single"))));
    }));
    QVERIFY(calls.contains(callKey(FaultInjectingAdapter::Remove, path(QStringLiteral("src/single")))));

    // what was carried over piece by piece is kept for undo
    const JobResult dirResult = transaction.jobs().at(0).result();
    QCOMPARE(dirResult.createdDirectories(), QStringList{path(QStringLiteral("dest/dir"))});
    QCOMPARE(dirResult.removedDirectories(), QStringList{path(QStringLiteral("src/dir"))});
    QCOMPARE(dirResult.movedEntries().size(), 2);
    QVERIFY(!dirResult.replacedExisting());
    const JobResult fileResult = transaction.jobs().at(1).result();
    QCOMPARE(fileResult.movedEntries().size(), 1);
    QCOMPARE(fileResult.movedEntries().at(0).source, path(QStringLiteral("src/single")));
    QCOMPARE(fileResult.movedEntries().at(0).destination, path(QStringLiteral("dest/single")));
    QCOMPARE(transaction.undoRecord().totalOps(), 2);
}

void TransactionManagerTest::moveMergesFolders()
{
    createTestDirectory(path(QStringLiteral("a/dir")));
    createTestFile(path(QStringLiteral("b/dir/testfile")), "old");
    createTestFile(path(QStringLiteral("b/dir/other")), "keep");

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id = m_manager->execute(FileOperation::move(path(QStringLiteral("a/dir")), path(QStringLiteral("b/dir"))));
    QCOMPARE(conflictSpy.count(), 1);
    const ConflictRecord conflict = conflictSpy.at(0).at(0).value<ConflictRecord>();
    QVERIFY(conflict.destinationIsDir);
    QVERIFY(conflict.options.testFlag(Overwrite));
    QVERIFY(m_manager->resolveConflict(conflict.jobId, Overwrite));

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(!transaction.isPartial());
    QVERIFY(transaction.jobs().at(0).operation().flags().testFlag(FileOperation::Overwrite));

    QVERIFY(!QFile::exists(path(QStringLiteral("a/dir"))));
    QCOMPARE(fileContents(path(QStringLiteral("b/dir/testfile"))), QByteArray("Hello world"));
    QCOMPARE(fileContents(path(QStringLiteral("b/dir/other"))), QByteArray("keep"));
    QVERIFY(QFileInfo(path(QStringLiteral("b/dir/testlink"))).isSymLink());

    // the old b/dir/testfile is gone for good, so there is nothing to undo
    const JobResult result = transaction.jobs().at(0).result();
    QVERIFY(result.replacedExisting());
    QVERIFY(result.createdDirectories().isEmpty());
    QCOMPARE(result.removedDirectories(), QStringList{path(QStringLiteral("a/dir"))});
    QCOMPARE(result.movedEntries().size(), 2);
    QVERIFY(transaction.undoRecord().jobs().isEmpty());
}

void TransactionManagerTest::nameCollisionExhausted()
{
    createManager(3);
    for (const QString &name : {QStringLiteral("x.txt"), QStringLiteral("x (2).txt"), QStringLiteral("x (3).txt"), QStringLiteral("x (4).txt")}) {
        createTestFile(path(name));
    }

    const QUuid id = m_manager->execute(FileOperation::createFile(path(QStringLiteral("x.txt")), FileOperation::AutoRename));
    Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Failed);
    QCOMPARE(transaction.jobs().at(0).result().error(), int(ERR_NAME_COLLISION_EXHAUSTED));
    QVERIFY(!QFile::exists(path(QStringLiteral("x (5).txt"))));

    // one free slot within the limit is enough
    QVERIFY(QFile::remove(path(QStringLiteral("x (3).txt"))));
    const QUuid id2 = m_manager->execute(FileOperation::createFile(path(QStringLiteral("x.txt")), FileOperation::AutoRename));
    transaction = waitForTransaction(*m_manager, id2);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(transaction.jobs().at(0).operation().targetPath(), path(QStringLiteral("x (3).txt")));
}

void TransactionManagerTest::cancelDuringRecursion()
{
    QStringList expected;
    for (int i = 1; i <= 20; ++i) {
        const QString name = QStringLiteral("file%1").arg(i, 2, 10, QLatin1Char('0'));
        createTestFile(path(QStringLiteral("src/") + name), name.toUtf8());
        if (i <= 3) {
            expected << name + QLatin1String(" = ") + name;
        }
    }

    QSemaphore reached;
    QSemaphore proceed;
    const QString blocker = path(QStringLiteral("src/file03"));
    m_adapter->setBeforeCopyHook([&](const QString &src) {
        if (src == blocker) {
            reached.release();
            proceed.acquire();
        }
    });

    const QUuid id = m_manager->startTransaction(QStringLiteral("Copy"));
    const QUuid jobId = m_manager->addOperation(id, FileOperation::copy(path(QStringLiteral("src")), path(QStringLiteral("dest"))));
    QVERIFY(m_manager->commit(id));

    const bool blocked = reached.tryAcquire(1, 10000);
    const bool cancelled = m_manager->cancel(jobId);
    proceed.release();
    QVERIFY(blocked);
    QVERIFY(cancelled);

    const Transaction transaction = waitForTransaction(*m_manager, id);
    m_adapter->setBeforeCopyHook({});
    QVERIFY(transaction.isValid());

    // the file being copied is finished, nothing after it is started
    QCOMPARE(treeSnapshot(path(QStringLiteral("dest"))), expected);

    const Job job = transaction.jobs().at(0);
    QCOMPARE(job.status(), Job::Completed);
    QVERIFY(job.isPartial());
    QCOMPARE(job.result().outcome(), JobResult::PartialSuccess);
    const QList<SkippedItem> skipped = job.result().skippedItems();
    QCOMPARE(skipped.size(), 17);
    QCOMPARE(skipped.first().path, path(QStringLiteral("src/file04")));
    QCOMPARE(skipped.last().path, path(QStringLiteral("src/file20")));
    for (const SkippedItem &item : skipped) {
        QCOMPARE(item.error, int(ERR_USER_CANCELED));
    }
    QVERIFY(transaction.isPartial());
}

void TransactionManagerTest::cancelBeforeCommit()
{
    createTestFile(path(QStringLiteral("a")));
    createTestFile(path(QStringLiteral("b")));

    const QUuid id = m_manager->startTransaction(QStringLiteral("Trash"));
    const QUuid first = m_manager->addOperation(id, FileOperation::trash(path(QStringLiteral("a"))));
    m_manager->addOperation(id, FileOperation::trash(path(QStringLiteral("b"))));
    QVERIFY(m_manager->cancel(first));
    QCOMPARE(m_manager->transaction(id).job(first).status(), Job::Cancelled);

    QVERIFY(m_manager->commit(id));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(transaction.isPartial());
    QVERIFY(QFile::exists(path(QStringLiteral("a"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("b"))));

    // everything cancelled
    const QUuid id2 = m_manager->startTransaction(QStringLiteral("Trash"));
    m_manager->addOperation(id2, FileOperation::trash(path(QStringLiteral("a"))));
    QVERIFY(m_manager->cancel(id2));
    QCOMPARE(waitForTransaction(*m_manager, id2).status(), Transaction::Cancelled);
    QVERIFY(!m_manager->cancel(id2));
    QVERIFY(!m_manager->commit(id2));
    QVERIFY(QFile::exists(path(QStringLiteral("a"))));
}

void TransactionManagerTest::cancelHeldConflict()
{
    createTestFile(path(QStringLiteral("src/one")), "new");
    createTestFile(path(QStringLiteral("dest/one")), "old");
    createTestFile(path(QStringLiteral("src/two")), "new");
    createTestFile(path(QStringLiteral("dest/two")), "old");

    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);
    const QUuid id =
        m_manager->transfer({path(QStringLiteral("src/one")), path(QStringLiteral("src/two"))}, path(QStringLiteral("dest")), TransactionManager::CopyMode);
    QCOMPARE(conflictSpy.count(), 1);
    const QUuid firstJob = conflictSpy.at(0).at(0).value<ConflictRecord>().jobId;

    // cancelling the prompted job brings up the next question
    QVERIFY(m_manager->cancel(firstJob));
    QCOMPARE(conflictSpy.count(), 2);
    const ConflictRecord second = conflictSpy.at(1).at(0).value<ConflictRecord>();
    QVERIFY(second.jobId != firstJob);
    QCOMPARE(second.destination, path(QStringLiteral("dest/two")));

    QVERIFY(m_manager->resolveConflict(second.jobId, Overwrite));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(transaction.isPartial());
    QCOMPARE(fileContents(path(QStringLiteral("dest/one"))), QByteArray("old"));
    QCOMPARE(fileContents(path(QStringLiteral("dest/two"))), QByteArray("new"));
}

void TransactionManagerTest::transferDuplicates()
{
    createTestFile(path(QStringLiteral("a.txt")), "dup");
    QSignalSpy conflictSpy(m_manager.get(), &TransactionManager::conflictDetected);

    QUuid id = m_manager->transfer({path(QStringLiteral("a.txt"))}, m_dir, TransactionManager::CopyMode);
    Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(transaction.jobs().at(0).result().resultPath(), path(QStringLiteral("a (Copy).txt")));

    id = m_manager->transfer({path(QStringLiteral("a.txt"))}, m_dir, TransactionManager::CopyMode);
    transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.jobs().at(0).result().resultPath(), path(QStringLiteral("a (Copy 2).txt")));
    QCOMPARE(fileContents(path(QStringLiteral("a (Copy 2).txt"))), QByteArray("dup"));
    QCOMPARE(conflictSpy.count(), 0);
}

void TransactionManagerTest::transferMoveOntoItself()
{
    createTestFile(path(QStringLiteral("a.txt")));
    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);

    const QUuid id = m_manager->transfer({path(QStringLiteral("a.txt"))}, m_dir, TransactionManager::MoveMode);
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QCOMPARE(transaction.totalOps(), 0);
    QCOMPARE(historySpy.count(), 0);
    QVERIFY(QFile::exists(path(QStringLiteral("a.txt"))));
}

void TransactionManagerTest::addOperationAfterCommit()
{
    createTestFile(path(QStringLiteral("a")));
    const QUuid id = m_manager->startTransaction(QStringLiteral("Trash"));
    QVERIFY(!m_manager->addOperation(id, FileOperation::trash(path(QStringLiteral("a")))).isNull());
    QVERIFY(m_manager->commit(id));
    QVERIFY(!m_manager->commit(id));
    QVERIFY(m_manager->addOperation(id, FileOperation::createFile(path(QStringLiteral("b")))).isNull());

    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.totalOps(), 1);
    QVERIFY(!QFile::exists(path(QStringLiteral("b"))));

    QVERIFY(m_manager->addOperation(QUuid::createUuid(), FileOperation::createFile(path(QStringLiteral("b")))).isNull());
    QVERIFY(!m_manager->commit(QUuid::createUuid()));
}

void TransactionManagerTest::invalidOperation()
{
    QVERIFY(m_manager->execute(FileOperation::rename(path(QStringLiteral("a")), QStringLiteral("sub/b"))).isNull());
    QVERIFY(m_manager->execute(FileOperation()).isNull());
    QVERIFY(m_manager->activeTransactions().isEmpty());
}

void TransactionManagerTest::partialCopy()
{
    createTestDirectory(path(QStringLiteral("src")), NoSymlink);
    createTestFile(path(QStringLiteral("src/locked")), "locked");
    m_adapter->failOn(FaultInjectingAdapter::CopyFile, path(QStringLiteral("src/locked")), ERR_ACCESS_DENIED);

    QSignalSpy completedSpy(m_manager.get(), &TransactionManager::jobCompleted);
    const QUuid id = m_manager->execute(FileOperation::copy(path(QStringLiteral("src")), path(QStringLiteral("dest"))));
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(transaction.isPartial());

    QCOMPARE(completedSpy.count(), 1);
    const JobResult result = completedSpy.at(0).at(3).value<JobResult>();
    QCOMPARE(result.outcome(), JobResult::PartialSuccess);
    QCOMPARE(result.skippedCount(), 1);
    QCOMPARE(result.skippedItems().at(0).path, path(QStringLiteral("src/locked")));
    QCOMPARE(result.skippedItems().at(0).error, int(ERR_ACCESS_DENIED));

    QVERIFY(QFile::exists(path(QStringLiteral("dest/testfile"))));
    QVERIFY(!QFile::exists(path(QStringLiteral("dest/locked"))));
}

void TransactionManagerTest::mixedOutcome()
{
    createTestFile(path(QStringLiteral("src/good")));
    createTestFile(path(QStringLiteral("src/bad")));
    QVERIFY(QDir().mkpath(path(QStringLiteral("dest"))));
    m_adapter->failOn(FaultInjectingAdapter::Move, path(QStringLiteral("src/bad")), ERR_ACCESS_DENIED);

    QSignalSpy historySpy(m_manager.get(), &TransactionManager::historyCommitted);
    const QUuid id =
        m_manager->transfer({path(QStringLiteral("src/good")), path(QStringLiteral("src/bad"))}, path(QStringLiteral("dest")), TransactionManager::MoveMode);
    const Transaction transaction = waitForTransaction(*m_manager, id);
    QCOMPARE(transaction.status(), Transaction::Completed);
    QVERIFY(transaction.isPartial());
    QCOMPARE(transaction.succeededOps(), 1);
    QCOMPARE(transaction.completedOps(), 2);

    // only what happened can be undone
    QCOMPARE(historySpy.count(), 1);
    const Transaction record = historySpy.at(0).at(0).value<Transaction>();
    QCOMPARE(record.totalOps(), 1);
    QCOMPARE(record.jobs().at(0).operation().source(), path(QStringLiteral("src/good")));
}

void TransactionManagerTest::validationReportsBrokenPostCondition()
{
    const std::unique_ptr<TransactionManager> manager = TransactionManagerPrivate::create(std::make_unique<LyingAdapter>());
    QSignalSpy validationSpy(manager.get(), &TransactionManager::validationFailed);

    const QUuid id = manager->execute(FileOperation::createFile(path(QStringLiteral("ghost"))));
    const Transaction transaction = waitForTransaction(*manager, id);
    // the job itself is not changed by the check
    QCOMPARE(transaction.status(), Transaction::Completed);

    if (validationSpy.isEmpty()) {
        QVERIFY(validationSpy.wait(5000));
    }
    QCOMPARE(validationSpy.count(), 1);
    QCOMPARE(validationSpy.at(0).at(0).toUuid(), transaction.jobs().at(0).id());
    QCOMPARE(validationSpy.at(0).at(1).toString(), path(QStringLiteral("ghost")));
    QVERIFY(!validationSpy.at(0).at(2).toString().isEmpty());
}

void TransactionManagerTest::defaultManagerWorksOnLocalFiles()
{
    TransactionSettings settings;
    settings.progressInterval = 10;
    TransactionManager manager(settings);
    QCOMPARE(manager.settings().progressInterval, 10);

    const QUuid id = manager.execute(FileOperation::createFolder(path(QStringLiteral("made"))));
    QCOMPARE(waitForTransaction(manager, id).status(), Transaction::Completed);
    QVERIFY(QFileInfo(path(QStringLiteral("made"))).isDir());
}

void TransactionManagerTest::uncommittedTransactionsAreBounded()
{
    createTestFile(path(QStringLiteral("a")));
    QSignalSpy finishedSpy(m_manager.get(), &TransactionManager::transactionFinished);

    QList<QUuid> ids;
    for (int i = 0; i < 32; ++i) {
        const QUuid id = m_manager->startTransaction(QStringLiteral("Never committed"));
        m_manager->addOperation(id, FileOperation::trash(path(QStringLiteral("a"))));
        ids << id;
    }
    QTest::qWait(20);
    QCOMPARE(finishedSpy.count(), 0);
    for (const QUuid &id : std::as_const(ids)) {
        QCOMPARE(m_manager->transaction(id).status(), Transaction::Pending);
    }

    // one more pushes the oldest out
    const QUuid newest = m_manager->startTransaction(QStringLiteral("Newest"));
    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(0).value<Transaction>().id(), ids.constFirst());
    QCOMPARE(m_manager->transaction(ids.constFirst()).status(), Transaction::Cancelled);
    QVERIFY(!m_manager->commit(ids.constFirst()));
    QCOMPARE(m_manager->transaction(ids.at(1)).status(), Transaction::Pending);
    QVERIFY(QFile::exists(path(QStringLiteral("a"))));

    // committed or cancelled ones no longer count
    QVERIFY(m_manager->cancel(ids.at(1)));
    QVERIFY(m_manager->commit(newest));
    QVERIFY(waitForTransaction(*m_manager, newest).isTerminal());
    QTRY_COMPARE(finishedSpy.count(), 3);
    m_manager->startTransaction(QStringLiteral("Fits"));
    QTest::qWait(20);
    QCOMPARE(finishedSpy.count(), 3);
    QCOMPARE(m_manager->transaction(ids.at(2)).status(), Transaction::Pending);

    for (int i = 2; i < ids.size(); ++i) {
        QVERIFY(m_manager->cancel(ids.at(i)));
    }
}

#include "moc_transactionmanagertest.cpp"
