/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000 Simon Hausmann <hausmann@kde.org>
    SPDX-FileCopyrightText: 2006, 2008 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_UNDOMANAGER_P_H
#define KTRANSACT_UNDOMANAGER_P_H

#include "transaction.h"
#include "undomanager.h"

#include <QList>
#include <QPointer>

namespace KTransact
{
class TransactionManager;

class UndoManagerPrivate
{
public:
    UndoManagerPrivate(UndoManager *qq, TransactionManager *manager, int limit);

    // Returns the operations reverting @p job, in the order they must run; empty if there are none
    static QList<FileOperation> reciprocals(const Job &job);
    // Returns @p job with the parts the completed @p reverted reciprocals took back removed from its move record
    static Job withoutReverted(const Job &job, const QList<Job> &reverted);

    void recordTransaction(const Transaction &record);
    void startUndoOrRedo(bool redo);
    void slotTransactionFinished(const Transaction &transaction);

    void pushUndoCommand(const Transaction &cmd);
    void popUndoCommand();
    void pushRedoCommand(const Transaction &cmd);
    void popRedoCommand();
    void clearRedoStack();
    void lock();
    void unlock();

    UndoManager *const q;
    QPointer<TransactionManager> m_manager;
    const int m_limit;

    // The top of each stack is the last element
    QList<Transaction> m_undoCommands;
    QList<Transaction> m_redoCommands;

    bool m_lock = false;
    bool m_running = false;
    bool m_runningRedo = false;
    QUuid m_runningCmdId; // the stack entry being reverted
    QUuid m_runningId; // the transaction reverting it
};
}

#endif
