/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "fileoperation.h"
#include "job.h"
#include "transaction.h"
#include "transactionsettings.h"

#include <KConfigGroup>

#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

using namespace KTransact;

class TransactionTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void testOperationTargets()
    {
        QCOMPARE(FileOperation::copy(QStringLiteral("/a/x"), QStringLiteral("/b/x")).targetPath(), QStringLiteral("/b/x"));
        QCOMPARE(FileOperation::rename(QStringLiteral("/a/x.txt"), QStringLiteral("y.txt")).targetPath(), QStringLiteral("/a/y.txt"));
        QCOMPARE(FileOperation::createFolder(QStringLiteral("/a/new")).targetPath(), QStringLiteral("/a/new"));
        QCOMPARE(FileOperation::createSymlink(QStringLiteral("target"), QStringLiteral("/a/link")).targetPath(), QStringLiteral("/a/link"));
        QVERIFY(FileOperation::trash(QStringLiteral("/a/x")).targetPath().isEmpty());

        // paths are cleaned
        QCOMPARE(FileOperation::move(QStringLiteral("/a//x/"), QStringLiteral("/b/./x")).source(), QStringLiteral("/a/x"));

        TrashItem item;
        item.fileId = QStringLiteral("x");
        item.originalPath = QStringLiteral("/a/x");
        item.physicalPath = QStringLiteral("/home/user/.local/share/Trash/files/x");
        QCOMPARE(FileOperation::restore(item).targetPath(), QStringLiteral("/a/x"));
        QCOMPARE(FileOperation::restore(item, QStringLiteral("/c/x")).targetPath(), QStringLiteral("/c/x"));
    }

    void testInvalidOperations()
    {
        QVERIFY(!FileOperation().isValid());
        QVERIFY(!FileOperation::copy(QString(), QStringLiteral("/b")).isValid());
        QVERIFY(!FileOperation::rename(QStringLiteral("/a/x"), QStringLiteral("sub/y")).isValid());
        QVERIFY(!FileOperation::rename(QStringLiteral("/a/x"), QString()).isValid());
        QVERIFY(!FileOperation::restore(TrashItem()).isValid());
        QVERIFY(FileOperation::emptyTrash().isValid());
    }

    void testReversibility()
    {
        QVERIFY(!FileOperation::copy(QStringLiteral("/a"), QStringLiteral("/b")).isReversible());
        QVERIFY(!FileOperation::emptyTrash().isReversible());
        QVERIFY(FileOperation::move(QStringLiteral("/a"), QStringLiteral("/b")).isReversible());
        QVERIFY(FileOperation::trash(QStringLiteral("/a")).isReversible());
        QVERIFY(!FileOperation::move(QStringLiteral("/a"), QStringLiteral("/b"), FileOperation::Irreversible).isReversible());
    }

    void testJobStatusIsMonotonic()
    {
        Job job(QUuid::createUuid(), FileOperation::trash(QStringLiteral("/a")));
        QVERIFY(!job.id().isNull());
        QCOMPARE(job.status(), Job::Pending);
        QVERIFY(job.setStatus(Job::Running));
        QVERIFY(!job.setStatus(Job::Pending));
        QVERIFY(job.setStatus(Job::Completed));
        QVERIFY(job.isTerminal());
        QVERIFY(!job.setStatus(Job::Failed));
        QVERIFY(!job.setStatus(Job::Running));
        QCOMPARE(job.status(), Job::Completed);

        // a pending job may end without running
        Job skipped(QUuid::createUuid(), FileOperation::trash(QStringLiteral("/b")));
        QVERIFY(skipped.setStatus(Job::Cancelled));
        QVERIFY(skipped.isTerminal());
    }

    void testJobCancelToken()
    {
        Job job(QUuid::createUuid(), FileOperation::trash(QStringLiteral("/a")));
        const CancelToken token = job.cancelToken();
        QVERIFY(token);
        QVERIFY(!job.isCancelRequested());
        Job copy = job;
        copy.requestCancel();
        // copies share the flag with the worker
        QVERIFY(job.isCancelRequested());
        QVERIFY(token->load());
    }

    void testJobPartial()
    {
        Job job(QUuid::createUuid(), FileOperation::copy(QStringLiteral("/a"), QStringLiteral("/b")));
        JobResult result;
        result.setSkippedItems({SkippedItem{QStringLiteral("/a/f"), ERR_ACCESS_DENIED, QStringLiteral("/a/f")}});
        job.setResult(result);
        QVERIFY(!job.isPartial()); // not finished yet
        QVERIFY(job.setStatus(Job::Running));
        QVERIFY(job.setStatus(Job::Completed));
        QVERIFY(job.isPartial());
        QCOMPARE(job.result().skippedCount(), 1);
    }

    void testJobAmountsNeverDecrease()
    {
        Job job(QUuid::createUuid(), FileOperation::copy(QStringLiteral("/a"), QStringLiteral("/b")));
        job.setAmounts(50, 100);
        job.setAmounts(20, 100);
        QCOMPARE(job.processedAmount(), filesize_t(50));
        QCOMPARE(job.totalAmount(), filesize_t(100));
    }

    void testTransactionCounters()
    {
        Transaction transaction(QStringLiteral("Move"));
        QVERIFY(transaction.isValid());
        QCOMPARE(transaction.origin(), Transaction::UserAction);
        QCOMPARE(transaction.totalOps(), 0);

        Job done(transaction.id(), FileOperation::move(QStringLiteral("/a/1"), QStringLiteral("/b/1")));
        done.setStatus(Job::Completed);
        done.setAmounts(10, 10);
        Job failed(transaction.id(), FileOperation::move(QStringLiteral("/a/2"), QStringLiteral("/b/2")));
        failed.setStatus(Job::Failed);
        Job pending(transaction.id(), FileOperation::move(QStringLiteral("/a/3"), QStringLiteral("/b/3")));
        pending.setAmounts(0, 5);
        transaction.appendJob(done);
        transaction.appendJob(failed);
        transaction.appendJob(pending);

        QCOMPARE(transaction.totalOps(), 3);
        QCOMPARE(transaction.completedOps(), 2);
        QCOMPARE(transaction.succeededOps(), 1);
        QCOMPARE(transaction.processedAmount(), filesize_t(10));
        QCOMPARE(transaction.totalAmount(), filesize_t(15));
        QCOMPARE(transaction.indexOf(failed.id()), 1);
        QVERIFY(transaction.contains(pending.id()));
        QVERIFY(!transaction.contains(QUuid::createUuid()));
        QCOMPARE(transaction.job(done.id()).status(), Job::Completed);
        QVERIFY(transaction.job(QUuid::createUuid()).id().isNull());
    }

    void testTransactionStatus()
    {
        Transaction transaction(QStringLiteral("Trash"));
        QCOMPARE(transaction.status(), Transaction::Pending);
        QVERIFY(transaction.setStatus(Transaction::Running));
        QVERIFY(transaction.setStatus(Transaction::Completed));
        QVERIFY(transaction.isTerminal());
        QVERIFY(!transaction.setStatus(Transaction::Running));
        QVERIFY(!transaction.setStatus(Transaction::Cancelled));
        QCOMPARE(transaction.status(), Transaction::Completed);
    }

    void testUndoRecord()
    {
        Transaction transaction(QStringLiteral("Mixed"));
        auto addJob = [&transaction](const FileOperation &op, Job::Status status) {
            Job job(transaction.id(), op);
            job.setStatus(status);
            transaction.appendJob(job);
            return job.id();
        };
        const QUuid moved = addJob(FileOperation::move(QStringLiteral("/a/1"), QStringLiteral("/b/1")), Job::Completed);
        addJob(FileOperation::copy(QStringLiteral("/a/2"), QStringLiteral("/b/2")), Job::Completed);
        addJob(FileOperation::move(QStringLiteral("/a/3"), QStringLiteral("/b/3")), Job::Failed);
        addJob(FileOperation::move(QStringLiteral("/a/4"), QStringLiteral("/b/4")), Job::Cancelled);
        const QUuid created = addJob(FileOperation::createFolder(QStringLiteral("/b/5")), Job::Completed);
        addJob(FileOperation::move(QStringLiteral("/a/6"), QStringLiteral("/b/6"), FileOperation::Irreversible), Job::Completed);

        const Transaction record = transaction.undoRecord();
        QCOMPARE(record.id(), transaction.id());
        QCOMPARE(record.description(), QStringLiteral("Mixed"));
        QCOMPARE(record.totalOps(), 2);
        QCOMPARE(record.jobs().at(0).id(), moved);
        QCOMPARE(record.jobs().at(1).id(), created);
    }

    void testRemainder()
    {
        Transaction transaction(QStringLiteral("Rename"));
        QList<QUuid> ids;
        for (int i = 0; i < 3; ++i) {
            Job job(transaction.id(), FileOperation::createFile(QStringLiteral("/a/%1").arg(i)));
            job.setStatus(Job::Completed);
            transaction.appendJob(job);
            ids.append(job.id());
        }

        const Transaction rest = transaction.remainder({ids.at(1)});
        QVERIFY(rest.isValid());
        QVERIFY(rest.id() != transaction.id());
        QCOMPARE(rest.description(), transaction.description());
        QVERIFY(rest.isPartial());
        QCOMPARE(rest.totalOps(), 2);
        QCOMPARE(rest.jobs().at(0).id(), ids.at(0));
        QCOMPARE(rest.jobs().at(1).id(), ids.at(2));

        QCOMPARE(transaction.remainder(ids).totalOps(), 0);
    }

    void testSettingsDefaults()
    {
        const TransactionSettings settings;
        QCOMPARE(settings.maxWorkerThreads, 8);
        QCOMPARE(settings.undoLimit, 50);
        QCOMPARE(settings.progressInterval, 100);
        QCOMPARE(settings.nameProbeLimit, 10000);
        QVERIFY(settings.validateResults);
    }

    void testSettingsSaveLoad()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        KSharedConfig::Ptr config = KSharedConfig::openConfig(dir.filePath(QStringLiteral("ktransactrc")), KConfig::SimpleConfig);

        TransactionSettings settings;
        settings.maxWorkerThreads = 2;
        settings.undoLimit = 7;
        settings.nameProbeLimit = 3;
        settings.validateResults = false;
        settings.save(config);

        const TransactionSettings loaded = TransactionSettings::load(config);
        QCOMPARE(loaded.maxWorkerThreads, 2);
        QCOMPARE(loaded.undoLimit, 7);
        QCOMPARE(loaded.progressInterval, 100);
        QCOMPARE(loaded.nameProbeLimit, 3);
        QVERIFY(!loaded.validateResults);
    }

    void testSettingsIgnoreInvalidValues()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        KSharedConfig::Ptr config = KSharedConfig::openConfig(dir.filePath(QStringLiteral("ktransactrc")), KConfig::SimpleConfig);
        KConfigGroup group = config->group(QStringLiteral("Transactions"));
        group.writeEntry("MaxWorkerThreads", 0);
        group.writeEntry("UndoLimit", -4);

        const TransactionSettings loaded = TransactionSettings::load(config);
        QCOMPARE(loaded.maxWorkerThreads, 8);
        QCOMPARE(loaded.undoLimit, 50);
    }
};

QTEST_GUILESS_MAIN(TransactionTest)

#include "transactiontest.moc"
