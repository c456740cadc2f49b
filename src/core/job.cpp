/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "job.h"
#include "ktransactcoredebug.h"

#include <QDebug>

using namespace KTransact;

JobResult::Outcome JobResult::outcome() const
{
    return m_outcome;
}

void JobResult::setOutcome(Outcome outcome)
{
    m_outcome = outcome;
}

int JobResult::error() const
{
    return m_error;
}

QString JobResult::errorText() const
{
    return m_errorText;
}

void JobResult::setError(int error, const QString &errorText)
{
    m_error = error;
    m_errorText = errorText;
}

QString JobResult::errorString() const
{
    return m_error ? buildErrorString(m_error, m_errorText) : QString();
}

QString JobResult::resultPath() const
{
    return m_resultPath;
}

void JobResult::setResultPath(const QString &path)
{
    m_resultPath = path;
}

QList<SkippedItem> JobResult::skippedItems() const
{
    return m_skipped;
}

void JobResult::setSkippedItems(const QList<SkippedItem> &items)
{
    m_skipped = items;
}

int JobResult::skippedCount() const
{
    return m_skipped.count();
}

TrashItem JobResult::trashItem() const
{
    return m_trashItem;
}

void JobResult::setTrashItem(const TrashItem &item)
{
    m_trashItem = item;
}

QList<MovedEntry> JobResult::movedEntries() const
{
    return m_movedEntries;
}

void JobResult::setMovedEntries(const QList<MovedEntry> &entries)
{
    m_movedEntries = entries;
}

QStringList JobResult::createdDirectories() const
{
    return m_createdDirectories;
}

void JobResult::setCreatedDirectories(const QStringList &dirs)
{
    m_createdDirectories = dirs;
}

QStringList JobResult::removedDirectories() const
{
    return m_removedDirectories;
}

void JobResult::setRemovedDirectories(const QStringList &dirs)
{
    m_removedDirectories = dirs;
}

bool JobResult::replacedExisting() const
{
    return m_replacedExisting;
}

void JobResult::setReplacedExisting(bool replaced)
{
    m_replacedExisting = replaced;
}

Job::Job() = default;

Job::Job(const QUuid &transactionId, const FileOperation &operation)
    : m_id(QUuid::createUuid())
    , m_transactionId(transactionId)
    , m_operation(operation)
    , m_cancelToken(std::make_shared<std::atomic_bool>(false))
{
}

QUuid Job::id() const
{
    return m_id;
}

QUuid Job::transactionId() const
{
    return m_transactionId;
}

FileOperation Job::operation() const
{
    return m_operation;
}

void Job::setOperation(const FileOperation &operation)
{
    m_operation = operation;
}

Job::Status Job::status() const
{
    return m_status;
}

bool Job::setStatus(Status status)
{
    if (status == m_status) {
        return true;
    }
    // Pending -> Running -> {Completed, Failed, Cancelled}, Pending may end directly
    const bool allowed = (m_status == Pending) || (m_status == Running && status != Pending);
    if (!allowed) {
        qCWarning(KTRANSACT_CORE) << "refusing status change of job" << m_id << "from" << statusName(m_status) << "to" << statusName(status);
        return false;
    }
    m_status = status;
    return true;
}

bool Job::isTerminal() const
{
    return m_status == Completed || m_status == Failed || m_status == Cancelled;
}

bool Job::isPartial() const
{
    return m_status == Completed && m_result.skippedCount() > 0;
}

JobResult Job::result() const
{
    return m_result;
}

void Job::setResult(const JobResult &result)
{
    m_result = result;
}

filesize_t Job::processedAmount() const
{
    return m_processedAmount;
}

filesize_t Job::totalAmount() const
{
    return m_totalAmount;
}

void Job::setAmounts(filesize_t processed, filesize_t total)
{
    // never go backwards, the last worker update may arrive after a final one
    m_processedAmount = qMax(m_processedAmount, processed);
    m_totalAmount = qMax(m_totalAmount, total);
}

QUuid Job::reciprocalOf() const
{
    return m_reciprocalOf;
}

void Job::setReciprocalOf(const QUuid &id)
{
    m_reciprocalOf = id;
}

CancelToken Job::cancelToken() const
{
    return m_cancelToken;
}

void Job::requestCancel()
{
    if (m_cancelToken) {
        m_cancelToken->store(true);
    }
}

bool Job::isCancelRequested() const
{
    return m_cancelToken && m_cancelToken->load();
}

QString Job::statusName(Status status)
{
    static const char *const s_statusNames[] = {"Pending", "Running", "Completed", "Failed", "Cancelled"};
    return QString::fromLatin1(s_statusNames[status]);
}

QDebug KTransact::operator<<(QDebug dbg, const Job &job)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "Job(" << job.id() << ' ' << Job::statusName(job.status()) << ' ' << job.operation() << ')';
    return dbg;
}
