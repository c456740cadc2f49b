/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRANSACTION_H
#define KTRANSACT_TRANSACTION_H

#include "job.h"
#include "ktransactcore_export.h"

#include <QList>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace KTransact
{
/*!
 * \class KTransact::Transaction
 *
 * \brief A named, ordered batch of jobs executed and undone as one unit.
 *
 * The order of jobs() is the registration order, whatever order the jobs
 * completed in. Undo replays reversals in the opposite order.
 */
class KTRANSACTCORE_EXPORT Transaction
{
public:
    /*!
     * \value Pending Jobs are being added
     * \value Running Committed, not every job has finished
     * \value Completed At least one job succeeded; see isPartial()
     * \value Failed No job succeeded and at least one failed
     * \value Cancelled No job succeeded, none failed
     */
    enum Status {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled,
    };

    /*!
     * Who started the transaction.
     *
     * \value UserAction Fresh work; recorded for undo and clears the redo history
     * \value UndoAction The reversal of an undo entry
     * \value RedoAction The reversal of a redo entry
     */
    enum Origin {
        UserAction,
        UndoAction,
        RedoAction,
    };

    Transaction();
    explicit Transaction(const QString &description, Origin origin = UserAction);

    bool isValid() const;
    QUuid id() const;

    QString description() const;
    void setDescription(const QString &description);

    Origin origin() const;

    Status status() const;
    bool setStatus(Status status);
    bool isTerminal() const;

    /*!
     * True when the transaction finished with some jobs not done, or done
     * with skipped sub-paths. Distinct from Failed.
     */
    bool isPartial() const;
    void setPartial(bool partial);

    bool isCommitted() const;
    void setCommitted();

    QList<Job> jobs() const;
    int indexOf(const QUuid &jobId) const;
    bool contains(const QUuid &jobId) const;
    Job job(const QUuid &jobId) const;
    Job &jobRef(int index);

    /*!
     * Adds \a job at the end of the registration order.
     */
    void appendJob(const Job &job);

    int totalOps() const;
    /*!
     * Number of jobs in a terminal state.
     */
    int completedOps() const;
    int succeededOps() const;

    filesize_t processedAmount() const;
    filesize_t totalAmount() const;

    /*!
     * Returns a transaction with the same identity and description holding
     * only the completed, reversible jobs, in registration order. Jobs that
     * replaced an existing file are left out.
     */
    Transaction undoRecord() const;

    /*!
     * Returns a new transaction, with its own id, holding the jobs of this
     * one whose ids are not in \a excluded.
     */
    Transaction remainder(const QList<QUuid> &excluded) const;

private:
    QUuid m_id;
    QString m_description;
    Origin m_origin = UserAction;
    Status m_status = Pending;
    bool m_partial = false;
    bool m_committed = false;
    QList<Job> m_jobs;
};

KTRANSACTCORE_EXPORT QDebug operator<<(QDebug dbg, const Transaction &transaction);
}

Q_DECLARE_METATYPE(KTransact::Transaction)

#endif
