/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "transaction.h"
#include "ktransactcoredebug.h"

#include <QDebug>

#include <algorithm>

using namespace KTransact;

Transaction::Transaction() = default;

Transaction::Transaction(const QString &description, Origin origin)
    : m_id(QUuid::createUuid())
    , m_description(description)
    , m_origin(origin)
{
}

bool Transaction::isValid() const
{
    return !m_id.isNull();
}

QUuid Transaction::id() const
{
    return m_id;
}

QString Transaction::description() const
{
    return m_description;
}

void Transaction::setDescription(const QString &description)
{
    m_description = description;
}

Transaction::Origin Transaction::origin() const
{
    return m_origin;
}

Transaction::Status Transaction::status() const
{
    return m_status;
}

bool Transaction::setStatus(Status status)
{
    if (status == m_status) {
        return true;
    }
    const bool allowed = (m_status == Pending) || (m_status == Running && status != Pending);
    if (!allowed) {
        qCWarning(KTRANSACT_CORE) << "refusing status change of transaction" << m_id << "from" << m_status << "to" << status;
        return false;
    }
    m_status = status;
    return true;
}

bool Transaction::isTerminal() const
{
    return m_status == Completed || m_status == Failed || m_status == Cancelled;
}

bool Transaction::isPartial() const
{
    return m_partial;
}

void Transaction::setPartial(bool partial)
{
    m_partial = partial;
}

bool Transaction::isCommitted() const
{
    return m_committed;
}

void Transaction::setCommitted()
{
    m_committed = true;
}

QList<Job> Transaction::jobs() const
{
    return m_jobs;
}

int Transaction::indexOf(const QUuid &jobId) const
{
    for (int i = 0; i < m_jobs.size(); ++i) {
        if (m_jobs.at(i).id() == jobId) {
            return i;
        }
    }
    return -1;
}

bool Transaction::contains(const QUuid &jobId) const
{
    return indexOf(jobId) != -1;
}

Job Transaction::job(const QUuid &jobId) const
{
    const int idx = indexOf(jobId);
    return idx == -1 ? Job() : m_jobs.at(idx);
}

Job &Transaction::jobRef(int index)
{
    return m_jobs[index];
}

void Transaction::appendJob(const Job &job)
{
    m_jobs.append(job);
}

int Transaction::totalOps() const
{
    return m_jobs.size();
}

int Transaction::completedOps() const
{
    return std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job) {
        return job.isTerminal();
    });
}

int Transaction::succeededOps() const
{
    return std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job) {
        return job.status() == Job::Completed;
    });
}

filesize_t Transaction::processedAmount() const
{
    filesize_t sum = 0;
    for (const Job &job : m_jobs) {
        sum += job.processedAmount();
    }
    return sum;
}

filesize_t Transaction::totalAmount() const
{
    filesize_t sum = 0;
    for (const Job &job : m_jobs) {
        sum += job.totalAmount();
    }
    return sum;
}

Transaction Transaction::undoRecord() const
{
    Transaction record(*this);
    record.m_jobs.clear();
    for (const Job &job : m_jobs) {
        if (job.status() != Job::Completed || !job.operation().isReversible()) {
            continue;
        }
        if (job.result().replacedExisting()) {
            qCDebug(KTRANSACT_CORE) << "not recording" << job << "for undo, it replaced an existing file";
            continue;
        }
        record.m_jobs.append(job);
    }
    return record;
}

Transaction Transaction::remainder(const QList<QUuid> &excluded) const
{
    Transaction rest(m_description, m_origin);
    rest.m_status = m_status;
    rest.m_partial = true;
    rest.m_committed = true;
    for (const Job &job : m_jobs) {
        if (!excluded.contains(job.id())) {
            rest.m_jobs.append(job);
        }
    }
    return rest;
}

QDebug KTransact::operator<<(QDebug dbg, const Transaction &transaction)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "Transaction(" << transaction.id() << ' ' << transaction.description() << " status=" << transaction.status()
                  << " partial=" << transaction.isPartial() << " jobs=" << transaction.totalOps() << ')';
    return dbg;
}
