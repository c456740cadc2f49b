/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRANSACTIONMANAGER_H
#define KTRANSACT_TRANSACTIONMANAGER_H

#include "conflict.h"
#include "fileoperation.h"
#include "job.h"
#include "ktransactcore_export.h"
#include "transaction.h"
#include "transactionsettings.h"
#include "trashitem.h"

#include <QObject>
#include <QStringList>
#include <QUuid>

#include <memory>

namespace KTransact
{
class ConflictResolverInterface;
class FileSystemAdapter;
class TransactionManagerPrivate;

/*!
 * \class KTransact::TransactionManager
 *
 * \brief Runs file operations as cancellable, conflict-aware transactions.
 *
 * A transaction is started with startTransaction(), filled with
 * addOperation() and handed to the worker pool with commit(). Before a job
 * is submitted the manager checks whether its destination already exists;
 * such a job is held back until the conflict is resolved, either by the
 * installed ConflictResolverInterface or by a call to resolveConflict() in
 * answer to conflictDetected().
 *
 * All methods must be called from the thread the manager lives in, and all
 * signals are emitted there. The manager is the only way to the file system:
 * it owns the adapter performing the operations, and that adapter is not
 * reachable from outside.
 *
 * \code
 * auto *manager = new KTransact::TransactionManager();
 * const QUuid id = manager->startTransaction(i18n("Tidy up"));
 * manager->addOperation(id, KTransact::FileOperation::move(QStringLiteral("/a/f.txt"), QStringLiteral("/b/f.txt")));
 * manager->addOperation(id, KTransact::FileOperation::trash(QStringLiteral("/a/old")));
 * manager->commit(id);
 * \endcode
 */
class KTRANSACTCORE_EXPORT TransactionManager : public QObject
{
    Q_OBJECT
public:
    /*!
     * \value CopyMode
     * \value MoveMode
     */
    enum TransferMode {
        CopyMode,
        MoveMode,
    };
    Q_ENUM(TransferMode)

    /*!
     * Creates a manager working on the local file system and the home trash.
     */
    explicit TransactionManager(const TransactionSettings &settings = TransactionSettings::load(), QObject *parent = nullptr);
    /*!
     * Cancels everything still running and waits for the workers.
     */
    ~TransactionManager() override;

    TransactionSettings settings() const;

    /*!
     * Installs \a resolver, which is then asked synchronously instead of
     * emitting conflictDetected(). Pass nullptr to go back to the signal
     * based protocol.
     */
    void setConflictResolver(std::unique_ptr<ConflictResolverInterface> resolver);
    ConflictResolverInterface *conflictResolver() const;

    /*!
     * Creates an empty transaction and returns its id.
     *
     * The transaction must be ended with commit() or cancel(). At most 32
     * transactions stay uncommitted: starting one more cancels the oldest,
     * which then finishes with the Cancelled status.
     */
    QUuid startTransaction(const QString &description);

    /*!
     * Registers \a operation as a new job of the transaction \a transactionId.
     * Returns the job id, or a null id if the transaction does not exist, was
     * already committed, or \a operation is invalid.
     */
    QUuid addOperation(const QUuid &transactionId, const FileOperation &operation);

    /*!
     * Starts executing the transaction. Returns false if there is no such
     * pending transaction.
     */
    bool commit(const QUuid &transactionId);

    /*!
     * Answers a conflict announced by conflictDetected().
     * For ConflictAction::Rename, \a newName is the new file name; when empty
     * a free name is generated. With \a applyToAll the action is used for
     * every later conflict of the same transaction without asking.
     */
    bool resolveConflict(const QUuid &jobId, ConflictAction action, const QString &newName = QString(), bool applyToAll = false);

    /*!
     * Cancels a transaction, or a single job, by id.
     * Jobs that have not started yet end as Cancelled, running ones stop
     * after the file they are working on.
     */
    bool cancel(const QUuid &id);

    /*!
     * Runs a transaction made of \a operation alone.
     * The description defaults to the name of the operation.
     */
    QUuid execute(const FileOperation &operation, const QString &description = QString());

    /*!
     * Copies or moves each of \a sources into the folder \a destDir in one
     * transaction. Copying an item into its own folder creates a duplicate
     * named "name (Copy)"; moving an item onto itself is left out.
     */
    QUuid transfer(const QStringList &sources, const QString &destDir, TransferMode mode);

    /*!
     * A snapshot of the transaction \a id, invalid if it is unknown.
     * Finished transactions remain available for a while.
     */
    Transaction transaction(const QUuid &id) const;

    /*!
     * Whether the transaction or job \a id exists and has not finished yet.
     */
    bool isActive(const QUuid &id) const;

    QList<QUuid> activeTransactions() const;

    /*!
     * The current content of the trash.
     */
    TrashItemList trashContents() const;

Q_SIGNALS:
    void transactionStarted(const QUuid &transactionId, const QString &description);
    /*!
     * Bytes processed so far over all jobs of the transaction.
     */
    void transactionProgress(const QUuid &transactionId, KTransact::filesize_t processed, KTransact::filesize_t total);
    /*!
     * Emitted each time a job of the transaction reaches a terminal state.
     */
    void transactionUpdate(const QUuid &transactionId, int completedOps, int totalOps);
    void transactionFinished(const KTransact::Transaction &transaction);
    /*!
     * Emitted when a user transaction that did something finishes.
     * \a record contains only the jobs that succeeded and can be reverted,
     * in registration order, and may be empty.
     */
    void historyCommitted(const KTransact::Transaction &record);

    void jobStarted(const QUuid &jobId, KTransact::FileOperation::Type type, const QString &path);
    void jobProgress(const QUuid &jobId, KTransact::filesize_t processed, KTransact::filesize_t total);
    /*!
     * \a result tells a complete success from one with skipped items.
     */
    void jobCompleted(const QUuid &jobId, KTransact::FileOperation::Type type, const QString &path, const KTransact::JobResult &result);
    void jobFailed(const QUuid &jobId, KTransact::FileOperation::Type type, const QString &path, int error, const QString &errorText);
    void jobCancelled(const QUuid &jobId, KTransact::FileOperation::Type type, const QString &path);

    void conflictDetected(const KTransact::ConflictRecord &conflict);
    void conflictResolved(const QUuid &jobId, KTransact::ConflictAction action);

    /*!
     * A completed job did not leave the file system in the expected state.
     */
    void validationFailed(const QUuid &jobId, const QString &path, const QString &message);

private:
    friend class TransactionManagerPrivate;
    friend class UndoManagerPrivate;

    // See TransactionManagerPrivate::create()
    KTRANSACTCORE_NO_EXPORT TransactionManager(std::unique_ptr<FileSystemAdapter> adapter, const TransactionSettings &settings, QObject *parent);

    // Used for undo and redo; the jobs of such transactions run one after another
    KTRANSACTCORE_NO_EXPORT QUuid startTransaction(const QString &description, Transaction::Origin origin);
    KTRANSACTCORE_NO_EXPORT QUuid addReciprocal(const QUuid &transactionId, const FileOperation &operation, const QUuid &reciprocalOf);

    std::unique_ptr<TransactionManagerPrivate> d;
};
}

#endif
