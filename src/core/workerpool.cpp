/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "workerpool_p.h"
#include "jobrunnable_p.h"
#include "ktransactcoredebug.h"

#include <QThread>

using namespace KTransact;

WorkerPool::WorkerPool(int maxThreads)
{
    m_pool.setMaxThreadCount(boundedThreadCount(maxThreads));
    m_pool.setObjectName(QStringLiteral("KTransactWorkerPool"));
    qCDebug(KTRANSACT_CORE) << "worker pool with" << m_pool.maxThreadCount() << "threads";
}

WorkerPool::~WorkerPool()
{
    m_pool.clear();
    m_pool.waitForDone();
}

QUuid WorkerPool::submit(JobRunnable *runnable)
{
    const QUuid id = runnable->jobId();
    runnable->setAutoDelete(true);
    m_pool.start(runnable);
    return id;
}

int WorkerPool::maxThreadCount() const
{
    return m_pool.maxThreadCount();
}

int WorkerPool::activeThreadCount() const
{
    return m_pool.activeThreadCount();
}

bool WorkerPool::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

int WorkerPool::boundedThreadCount(int cap)
{
    return qBound(1, QThread::idealThreadCount(), qMax(1, cap));
}
