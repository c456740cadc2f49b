/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000 Simon Hausmann <hausmann@kde.org>
    SPDX-FileCopyrightText: 2006, 2008 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_UNDOMANAGER_H
#define KTRANSACT_UNDOMANAGER_H

#include "ktransactcore_export.h"
#include "transaction.h"

#include <QObject>

#include <memory>

namespace KTransact
{
class TransactionManager;
class UndoManagerPrivate;

/*!
 * \class KTransact::UndoManager
 *
 * \brief Makes it possible to undo and redo transactions.
 *
 * The undo manager listens to the TransactionManager it is attached to and
 * records, for every user transaction, the jobs that succeeded and can be
 * reverted. Copies, emptying the trash and operations flagged
 * FileOperation::Irreversible are never recorded.
 *
 * Undoing runs the reverse operations, in reverse registration order, as a
 * new transaction of the same manager. If only some of them succeed, the
 * jobs that were not reverted stay on the undo stack as a transaction of
 * their own, and only the reverted ones become available for redo.
 *
 * The history lives in memory only.
 */
class KTRANSACTCORE_EXPORT UndoManager : public QObject
{
    Q_OBJECT
public:
    /*!
     * Records the transactions of \a manager, which must outlive the undo manager.
     * At most \a limit entries are kept on each stack, the oldest are dropped.
     */
    explicit UndoManager(TransactionManager *manager, int limit = 50, QObject *parent = nullptr);
    ~UndoManager() override;

    /*!
     * Returns true if undo is possible. Usually used for enabling/disabling the undo action.
     * Always false while an undo or redo is running.
     */
    bool isUndoAvailable() const;

    /*!
     * Returns true if redo is possible. Usually used for enabling/disabling the redo action.
     */
    bool isRedoAvailable() const;

    /*!
     * Returns the current text for the undo action.
     */
    QString undoText() const;

    /*!
     * Returns the current text for the redo action.
     */
    QString redoText() const;

    int undoCount() const;
    int redoCount() const;
    int limit() const;

    /*!
     * The transaction undo() would revert, invalid if there is none.
     */
    Transaction nextUndo() const;
    Transaction nextRedo() const;

    /*!
     * Whether an undo or redo is running.
     */
    bool isBusy() const;

public Q_SLOTS:
    /*!
     * Undoes the last transaction.
     *
     * This operation is asynchronous.
     * undoJobFinished will be emitted once the undo is complete.
     */
    void undo();

    /*!
     * Redoes the last undone transaction.
     *
     * This operation is asynchronous.
     * undoJobFinished will be emitted once the redo is complete.
     */
    void redo();

    /*!
     * Forgets both stacks. Ignored while an undo or redo is running.
     */
    void clearHistory();

Q_SIGNALS:
    /*!
     * Emitted when the value of isUndoAvailable() changes
     */
    void undoAvailable(bool avail);

    /*!
     * Emitted when the value of isRedoAvailable() changes
     */
    void redoAvailable(bool avail);

    /*!
     * Emitted when the value of undoText() changes
     */
    void undoTextChanged(const QString &text);

    /*!
     * Emitted when the value of redoText() changes
     */
    void redoTextChanged(const QString &text);

    /*!
     * Emitted when an undo (or redo) job finishes. Used for unit testing.
     */
    void undoJobFinished();

    /*!
     * Emitted after an undo or redo with whether every operation was
     * reverted, and a translated message describing the outcome.
     */
    void operationFinished(bool success, const QString &message);

private:
    friend class UndoManagerPrivate;
    std::unique_ptr<UndoManagerPrivate> d;
};
}

#endif
