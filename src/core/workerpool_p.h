/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_WORKERPOOL_P_H
#define KTRANSACT_WORKERPOOL_P_H

#include <QThreadPool>
#include <QUuid>

namespace KTransact
{
class JobRunnable;

/**
 * Bounded set of reusable threads running JobRunnables in FIFO order.
 *
 * The pool size is the ideal thread count of the machine, capped by the
 * configured maximum, so large batches never create unbounded threads.
 */
class WorkerPool
{
public:
    explicit WorkerPool(int maxThreads);
    ~WorkerPool();

    /**
     * Queues @p runnable and returns immediately. The pool takes ownership.
     * @return the id of the job the runnable executes
     */
    QUuid submit(JobRunnable *runnable);

    int maxThreadCount() const;
    int activeThreadCount() const;
    bool waitForDone(int msecs = -1);

    static int boundedThreadCount(int cap);

private:
    QThreadPool m_pool;
};
}

#endif
