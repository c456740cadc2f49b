/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004-2006 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef TRANSACTIONMANAGERTEST_H
#define TRANSACTIONMANAGERTEST_H

#include <QObject>
#include <QString>

#include <memory>

namespace KTransact
{
class TransactionManager;
}
class FaultInjectingAdapter;

class TransactionManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();
    void cleanupTestCase();

    void moveFile();
    void moveFolder();
    void copyFolderReportsProgress();
    void trashAndRestore();
    void createOperations();
    void renameCollisionPrompt();
    void renameCollisionExplicitName();
    void conflictOptionsWithoutOverwrite();
    void applyToAllSignals();
    void applyToAllResolver();
    void resolverCancelAll();
    void resolveConflictRejectsUnofferedAction();
    void missingSourceIsCancelled();
    void permissionDenied();
    void crossDeviceFallback();
    void moveMergesFolders();
    void nameCollisionExhausted();
    void cancelDuringRecursion();
    void cancelBeforeCommit();
    void cancelHeldConflict();
    void transferDuplicates();
    void transferMoveOntoItself();
    void addOperationAfterCommit();
    void invalidOperation();
    void partialCopy();
    void mixedOutcome();
    void validationReportsBrokenPostCondition();
    void defaultManagerWorksOnLocalFiles();
    void uncommittedTransactionsAreBounded();

private:
    QString path(const QString &relative) const
    {
        return m_dir + relative;
    }
    void createManager(int nameProbeLimit = 10000);

    QString m_dir;
    FaultInjectingAdapter *m_adapter = nullptr; // owned by m_manager
    std::unique_ptr<KTransact::TransactionManager> m_manager;
};

#endif
