/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_JOBRUNNABLE_P_H
#define KTRANSACT_JOBRUNNABLE_P_H

#include "filesystemadapter_p.h"
#include "job.h"
#include "namesuggestion.h"

#include <QElapsedTimer>
#include <QPointer>
#include <QRunnable>

#include <functional>

namespace KTransact
{
/**
 * Receives the events of running jobs on the coordinating thread.
 */
class JobEventReceiver
{
public:
    virtual ~JobEventReceiver() = default;
    virtual void jobStarted(const QUuid &jobId) = 0;
    virtual void jobProgress(const QUuid &jobId, filesize_t processed, filesize_t total) = 0;
    virtual void jobFinished(const QUuid &jobId, Job::Status status, const JobResult &result) = 0;
};

/**
 * Executes one job on a worker thread.
 *
 * The runnable works on its own copy of the job and never touches the
 * transaction data; every event is posted to the receiver through a queued
 * invocation on @p context. The cancellation token is polled before the job
 * starts and before each entry of a directory recursion.
 */
class JobRunnable : public QRunnable
{
public:
    JobRunnable(const Job &job, FileSystemAdapter *adapter, QObject *context, JobEventReceiver *receiver, int progressInterval, int nameProbeLimit);
    ~JobRunnable() override;

    QUuid jobId() const;

    void run() override;

private:
    AdapterResult execute();
    AdapterResult runTransfer(bool isMove);
    AdapterResult transferItem(const QString &src, const QString &dest, const FileStat &srcInfo, bool isMove, bool overwrite, bool isRoot);
    void transferChildren(const QString &src, const QString &dest, bool isMove, bool overwrite);
    AdapterResult copyOneFile(const QString &src, const QString &dest, const FileStat &srcInfo, bool overwrite, bool isRoot);

    // Calls @p attempt with @p target, then with numbered names, while the name is taken
    AdapterResult withFreeName(const QString &target, NamingStyle style, const std::function<AdapterResult(const QString &)> &attempt);

    template<typename Func>
    void post(Func func);

    filesize_t treeSize(const QString &path);
    bool isCancelled() const;
    void addSkipped(const QString &path, int error, const QString &errorText);
    void reportProgress(bool force);

    Job m_job;
    FileOperation m_op;
    FileSystemAdapter *const m_adapter;
    QPointer<QObject> m_context;
    JobEventReceiver *const m_receiver;
    const int m_progressInterval;
    const int m_nameProbeLimit;

    QElapsedTimer m_progressTimer;
    filesize_t m_processed = 0;
    filesize_t m_total = 0;
    TrashItem m_trashItem;
    QList<SkippedItem> m_skipped;

    // What a Move did piece by piece, for undo
    QList<MovedEntry> m_movedEntries;
    QStringList m_createdDirectories;
    QStringList m_removedDirectories;
    bool m_replacedExisting = false;
};
}

#endif
