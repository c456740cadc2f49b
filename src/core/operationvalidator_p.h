/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_OPERATIONVALIDATOR_P_H
#define KTRANSACT_OPERATIONVALIDATOR_P_H

#include "filesystemadapter_p.h"
#include "job.h"
#include "ktransactcore_export.h"

#include <QObject>
#include <QThreadPool>

namespace KTransact
{
/**
 * Checks in the background that a completed job left the file system in
 * the state it promised, e.g. that a moved file is gone from its source.
 *
 * A failed check is only reported, it never changes the job.
 */
class KTRANSACTCORE_EXPORT OperationValidator : public QObject
{
    Q_OBJECT
public:
    explicit OperationValidator(FileSystemAdapter *adapter, QObject *parent = nullptr);
    ~OperationValidator() override;

    /**
     * Queues the check of @p job. Only fully successful jobs are checked.
     */
    void validate(const Job &job);

    bool waitForDone(int msecs = -1);

    /**
     * Runs the check in the calling thread. Returns an empty string when the
     * post-condition holds, a translated description of the problem otherwise.
     */
    static QString check(const FileSystemAdapter *adapter, const FileOperation &operation, const JobResult &result);

Q_SIGNALS:
    void validationFailed(const QUuid &jobId, const QString &path, const QString &message);

private:
    FileSystemAdapter *const m_adapter;
    QThreadPool m_pool;
};
}

#endif
