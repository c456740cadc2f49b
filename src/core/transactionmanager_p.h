/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRANSACTIONMANAGER_P_H
#define KTRANSACT_TRANSACTIONMANAGER_P_H

#include "conflictresolverinterface.h"
#include "filesystemadapter_p.h"
#include "jobrunnable_p.h"
#include "operationvalidator_p.h"
#include "transactionmanager.h"
#include "workerpool_p.h"

#include <QHash>
#include <QList>
#include <QSet>

#include <memory>
#include <optional>

namespace KTransact
{
struct TransactionState {
    Transaction transaction;
    // Jobs held back because of a conflict; the first one is the one being asked about
    QList<ConflictRecord> heldConflicts;
    bool prompting = false;
    std::optional<ConflictAction> applyToAll;
    // Undo and redo transactions run their jobs in registration order, one at a time
    bool sequential = false;
    bool finishQueued = false;
};

class TransactionManagerPrivate : public JobEventReceiver
{
public:
    TransactionManagerPrivate(TransactionManager *qq, std::unique_ptr<FileSystemAdapter> adapter, const TransactionSettings &settings);
    ~TransactionManagerPrivate() override;

    static TransactionManagerPrivate *get(TransactionManager *manager)
    {
        return manager->d.get();
    }

    /**
     * Creates a manager running its operations through @p adapter instead of
     * the local file system. Used by the autotests.
     */
    KTRANSACTCORE_EXPORT static std::unique_ptr<TransactionManager> create(std::unique_ptr<FileSystemAdapter> adapter,
                                                                           const TransactionSettings &settings = TransactionSettings());

    std::shared_ptr<TransactionState> stateForTransaction(const QUuid &transactionId) const;
    std::shared_ptr<TransactionState> stateForJob(const QUuid &jobId) const;
    Job *findJob(TransactionState &state, const QUuid &jobId);

    QUuid createTransaction(const QString &description, Transaction::Origin origin);
    QUuid registerJob(const QUuid &transactionId, const FileOperation &operation, const QUuid &reciprocalOf);

    void scheduleJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId);
    void scheduleNextSequential(const std::shared_ptr<TransactionState> &state);
    void submitJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId);

    // Fills @p conflict and returns true if the job's destination is taken
    bool checkConflict(const Job &job, ConflictRecord &conflict) const;
    // Returns true if the job has to be checked again
    bool applyResolution(const std::shared_ptr<TransactionState> &state, const QUuid &jobId, const ConflictResolution &resolution);
    void holdConflict(const std::shared_ptr<TransactionState> &state, const ConflictRecord &conflict);
    void promptNextConflict(const std::shared_ptr<TransactionState> &state);
    void dropHeldConflict(TransactionState &state, const QUuid &jobId);

    void cancelTransaction(const std::shared_ptr<TransactionState> &state);
    void cancelJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId);
    // Ends a job that never reached a worker
    void endUnsubmittedJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId, int error, const QString &errorText);

    void emitJobEnd(const Job &job);
    void jobTerminated(const std::shared_ptr<TransactionState> &state);
    void finishTransaction(const QUuid &transactionId);
    void emitTransactionProgress(const TransactionState &state);

    void jobStarted(const QUuid &jobId) override;
    void jobProgress(const QUuid &jobId, filesize_t processed, filesize_t total) override;
    void jobFinished(const QUuid &jobId, Job::Status status, const JobResult &result) override;

    void shutdown();

    static QString jobPath(const FileOperation &operation);

    TransactionManager *const q;
    const TransactionSettings m_settings;
    std::unique_ptr<FileSystemAdapter> m_adapter;
    std::unique_ptr<ConflictResolverInterface> m_resolver;

    QHash<QUuid, std::shared_ptr<TransactionState>> m_transactions;
    QHash<QUuid, QUuid> m_jobToTransaction;
    QSet<QUuid> m_submittedJobs;
    // Finished transactions, oldest first, kept for transaction()
    QList<QUuid> m_finishedOrder;
    // Uncommitted transactions, oldest first
    QList<QUuid> m_openOrder;

    OperationValidator m_validator;
    // Declared last: destroyed first, while the adapter is still alive
    WorkerPool m_pool;
};
}

#endif
