/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2006 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef UNDOMANAGERTEST_H
#define UNDOMANAGERTEST_H

#include <QObject>
#include <QString>
#include <QUuid>

#include <memory>

namespace KTransact
{
class TransactionManager;
class UndoManager;
}
class FaultInjectingAdapter;

class UndoManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();
    void cleanupTestCase();

    void moveAndUndo();
    void undoRoundTrip_data();
    void undoRoundTrip();
    void undoUsesActualDestination();
    void undoMergeResolvedByOverwrite();
    void overwriteIsNotRecorded_data();
    void overwriteIsNotRecorded();
    void partialUndoOfMergeKeepsTheRest();
    void redo();
    void newWorkClearsRedo();
    void copyIsNotRecorded();
    void failedJobsAreNotRecorded();
    void partialFailureIsolation();
    void partialUndoKeepsRemainder();
    void limit();
    void busyWhileRunning();
    void clearHistory();

private:
    QString path(const QString &relative) const
    {
        return m_dir + relative;
    }
    void runAndWait(const QUuid &transactionId);
    bool undoAndWait();
    bool redoAndWait();

    QString m_dir;
    FaultInjectingAdapter *m_adapter = nullptr; // owned by m_manager
    std::unique_ptr<KTransact::TransactionManager> m_manager;
    std::unique_ptr<KTransact::UndoManager> m_undoManager;
};

#endif
