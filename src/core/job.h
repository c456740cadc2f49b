/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_JOB_H
#define KTRANSACT_JOB_H

#include "fileoperation.h"
#include "global.h"
#include "ktransactcore_export.h"
#include "trashitem.h"

#include <QList>
#include <QMetaType>
#include <QStringList>
#include <QUuid>

namespace KTransact
{
/*!
 * A path inside a recursive operation that was not processed, and why.
 */
struct SkippedItem {
    QString path;
    int error = 0;
    QString errorText;
};

/*!
 * One entry a Move carried over piece by piece, by rename or by copy and delete.
 */
struct MovedEntry {
    QString source;
    QString destination;
};

/*!
 * \class KTransact::JobResult
 *
 * \brief Describes how a job ended, as delivered with TransactionManager::jobCompleted().
 *
 * A PartialSuccess carries the sub-paths that were skipped; a progress view
 * should not auto-dismiss on it.
 */
class KTRANSACTCORE_EXPORT JobResult
{
public:
    /*!
     * \value Success Everything was done
     * \value PartialSuccess The job completed but skippedItems() were left out
     * \value Failure Nothing was done, see error()
     * \value Cancelled The job was skipped or cancelled before doing anything
     */
    enum Outcome {
        Success,
        PartialSuccess,
        Failure,
        Cancelled,
    };

    JobResult() = default;

    Outcome outcome() const;
    void setOutcome(Outcome outcome);

    int error() const;
    QString errorText() const;
    void setError(int error, const QString &errorText);

    /*!
     * Translated message for error(), empty if there is none.
     */
    QString errorString() const;

    /*!
     * The absolute path the job produced; may differ from the requested destination.
     */
    QString resultPath() const;
    void setResultPath(const QString &path);

    QList<SkippedItem> skippedItems() const;
    void setSkippedItems(const QList<SkippedItem> &items);
    int skippedCount() const;

    /*!
     * The trash entry created by a Trash job.
     */
    TrashItem trashItem() const;
    void setTrashItem(const TrashItem &item);

    /*!
     * For a Move that could not rename its source in one go (across devices,
     * or merging into an existing folder): the entries it carried over, in
     * the order they were moved. Empty otherwise.
     */
    QList<MovedEntry> movedEntries() const;
    void setMovedEntries(const QList<MovedEntry> &entries);

    /*!
     * Folders such a Move created at the destination, parents first.
     */
    QStringList createdDirectories() const;
    void setCreatedDirectories(const QStringList &dirs);

    /*!
     * Source folders such a Move removed once emptied, children first.
     */
    QStringList removedDirectories() const;
    void setRemovedDirectories(const QStringList &dirs);

    /*!
     * Whether the job replaced an existing file. What was replaced is gone,
     * so such a job cannot be undone.
     */
    bool replacedExisting() const;
    void setReplacedExisting(bool replaced);

private:
    Outcome m_outcome = Success;
    int m_error = 0;
    QString m_errorText;
    QString m_resultPath;
    QList<SkippedItem> m_skipped;
    TrashItem m_trashItem;
    QList<MovedEntry> m_movedEntries;
    QStringList m_createdDirectories;
    QStringList m_removedDirectories;
    bool m_replacedExisting = false;
};

/*!
 * \class KTransact::Job
 *
 * \brief One file operation inside a transaction, together with its execution state.
 *
 * Jobs are created by TransactionManager::addOperation() and belong to
 * their Transaction. Copies handed out through signals are snapshots.
 */
class KTRANSACTCORE_EXPORT Job
{
public:
    /*!
     * \value Pending Registered, waiting for commit, for a worker, or for a conflict resolution
     * \value Running A worker is executing the job
     * \value Completed The job succeeded, possibly partially (see result())
     * \value Failed The job did nothing, see result().error()
     * \value Cancelled The job was cancelled or skipped
     */
    enum Status {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled,
    };

    Job();
    Job(const QUuid &transactionId, const FileOperation &operation);

    QUuid id() const;
    QUuid transactionId() const;

    FileOperation operation() const;
    void setOperation(const FileOperation &operation);

    Status status() const;
    /*!
     * Moves the job to \a status. Returns false, leaving the status unchanged,
     * for a transition that would go backwards or leave a terminal state.
     */
    bool setStatus(Status status);
    bool isTerminal() const;

    /*!
     * True for a Completed job that skipped some sub-paths.
     */
    bool isPartial() const;

    JobResult result() const;
    void setResult(const JobResult &result);

    filesize_t processedAmount() const;
    filesize_t totalAmount() const;
    void setAmounts(filesize_t processed, filesize_t total);

    /*!
     * For jobs created by undo or redo, the id of the job this one reverts.
     */
    QUuid reciprocalOf() const;
    void setReciprocalOf(const QUuid &id);

    /*!
     * The cancellation flag shared with the worker executing this job.
     */
    CancelToken cancelToken() const;
    void requestCancel();
    bool isCancelRequested() const;

    static QString statusName(Status status);

private:
    QUuid m_id;
    QUuid m_transactionId;
    FileOperation m_operation;
    Status m_status = Pending;
    JobResult m_result;
    filesize_t m_processedAmount = 0;
    filesize_t m_totalAmount = 0;
    QUuid m_reciprocalOf;
    CancelToken m_cancelToken;
};

KTRANSACTCORE_EXPORT QDebug operator<<(QDebug dbg, const Job &job);
}

Q_DECLARE_METATYPE(KTransact::JobResult)
Q_DECLARE_METATYPE(KTransact::Job)

#endif
