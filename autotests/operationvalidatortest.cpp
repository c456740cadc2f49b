/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "localfilesystemadapter_p.h"
#include "operationvalidator_p.h"

#include "ktransacttesthelper.h"

#include <QDir>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

using namespace KTransact;

class OperationValidatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        qputenv("LANGUAGE", "en_US");
        m_dir = homeTmpDir() + QStringLiteral("validator/");
    }

    void init()
    {
        removeTestTree(m_dir);
        QVERIFY(QDir().mkpath(m_dir));
    }

    void cleanupTestCase()
    {
        removeTestTree(m_dir);
    }

    void testCheckMove()
    {
        createTestFile(m_dir + QStringLiteral("dest"));
        const FileOperation move = FileOperation::move(m_dir + QStringLiteral("src"), m_dir + QStringLiteral("dest"));
        QVERIFY(OperationValidator::check(&m_adapter, move, resultAt(m_dir + QStringLiteral("dest"))).isEmpty());

        createTestFile(m_dir + QStringLiteral("src"));
        QCOMPARE(OperationValidator::check(&m_adapter, move, resultAt(m_dir + QStringLiteral("dest"))),
                 QStringLiteral("%1 still exists after the operation.").arg(m_dir + QStringLiteral("src")));

        QCOMPARE(OperationValidator::check(&m_adapter, move, resultAt(m_dir + QStringLiteral("elsewhere"))),
                 QStringLiteral("%1 does not exist after the operation.").arg(m_dir + QStringLiteral("elsewhere")));
    }

    void testCheckCopy()
    {
        createTestFile(m_dir + QStringLiteral("src"));
        const FileOperation copy = FileOperation::copy(m_dir + QStringLiteral("src"), m_dir + QStringLiteral("dest"));
        QVERIFY(!OperationValidator::check(&m_adapter, copy, resultAt(m_dir + QStringLiteral("dest"))).isEmpty());

        createTestFile(m_dir + QStringLiteral("dest"));
        QVERIFY(OperationValidator::check(&m_adapter, copy, resultAt(m_dir + QStringLiteral("dest"))).isEmpty());

        // a copy keeps its source
        QVERIFY(QFile::remove(m_dir + QStringLiteral("src")));
        QVERIFY(!OperationValidator::check(&m_adapter, copy, resultAt(m_dir + QStringLiteral("dest"))).isEmpty());
    }

    void testCheckCreate()
    {
        const QString target = m_dir + QStringLiteral("thing");
        createTestFile(target);

        QVERIFY(OperationValidator::check(&m_adapter, FileOperation::createFile(target), resultAt(target)).isEmpty());
        QCOMPARE(OperationValidator::check(&m_adapter, FileOperation::createFolder(target), resultAt(target)),
                 QStringLiteral("%1 is not a folder after the operation.").arg(target));
        QVERIFY(!OperationValidator::check(&m_adapter, FileOperation::createSymlink(QStringLiteral("x"), target), resultAt(target)).isEmpty());

        const QString link = m_dir + QStringLiteral("link");
        createTestSymlink(link);
        QVERIFY(OperationValidator::check(&m_adapter, FileOperation::createSymlink(QStringLiteral("x"), link), resultAt(link)).isEmpty());
    }

    void testCheckTrash()
    {
        const QString path = m_dir + QStringLiteral("gone");
        QVERIFY(OperationValidator::check(&m_adapter, FileOperation::trash(path), JobResult()).isEmpty());
        createTestFile(path);
        QVERIFY(!OperationValidator::check(&m_adapter, FileOperation::trash(path), JobResult()).isEmpty());
        QVERIFY(OperationValidator::check(&m_adapter, FileOperation::emptyTrash(), JobResult()).isEmpty());
    }

    void testValidateReportsFailure()
    {
        createTestFile(m_dir + QStringLiteral("src"));
        createTestFile(m_dir + QStringLiteral("dest"));

        OperationValidator validator(&m_adapter);
        QSignalSpy spy(&validator, &OperationValidator::validationFailed);

        Job job(QUuid::createUuid(), FileOperation::move(m_dir + QStringLiteral("src"), m_dir + QStringLiteral("dest")));
        QVERIFY(job.setStatus(Job::Running));
        QVERIFY(job.setStatus(Job::Completed));
        job.setResult(resultAt(m_dir + QStringLiteral("dest")));
        validator.validate(job);

        QVERIFY(spy.wait(5000));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toUuid(), job.id());
        QCOMPARE(spy.at(0).at(1).toString(), m_dir + QStringLiteral("dest"));
    }

    void testValidateSkipsUnsuccessfulJobs()
    {
        OperationValidator validator(&m_adapter);
        QSignalSpy spy(&validator, &OperationValidator::validationFailed);

        // would fail the check, but only fully successful jobs are looked at
        Job failed(QUuid::createUuid(), FileOperation::createFile(m_dir + QStringLiteral("missing")));
        QVERIFY(failed.setStatus(Job::Failed));
        validator.validate(failed);

        Job partial(QUuid::createUuid(), FileOperation::createFolder(m_dir + QStringLiteral("missing")));
        QVERIFY(partial.setStatus(Job::Running));
        QVERIFY(partial.setStatus(Job::Completed));
        JobResult result = resultAt(m_dir + QStringLiteral("missing"));
        result.setOutcome(JobResult::PartialSuccess);
        partial.setResult(result);
        validator.validate(partial);

        QVERIFY(validator.waitForDone(5000));
        QCoreApplication::processEvents();
        QCOMPARE(spy.count(), 0);
    }

private:
    static JobResult resultAt(const QString &path)
    {
        JobResult result;
        result.setResultPath(path);
        return result;
    }

    QString m_dir;
    LocalFileSystemAdapter m_adapter;
};

QTEST_GUILESS_MAIN(OperationValidatorTest)

#include "operationvalidatortest.moc"
