/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "operationvalidator_p.h"
#include "ktransactcoredebug.h"

#include <KLocalizedString>

#include <QFutureWatcher>
#include <QtConcurrentRun>

using namespace KTransact;

OperationValidator::OperationValidator(FileSystemAdapter *adapter, QObject *parent)
    : QObject(parent)
    , m_adapter(adapter)
{
    m_pool.setMaxThreadCount(1);
    m_pool.setObjectName(QStringLiteral("KTransactValidator"));
}

OperationValidator::~OperationValidator()
{
    m_pool.clear();
    m_pool.waitForDone();
}

bool OperationValidator::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

static FileStat::Type typeOf(const FileSystemAdapter *adapter, const QString &path)
{
    FileStat info;
    if (!adapter->stat(path, info).success()) {
        return FileStat::NotFound;
    }
    return info.type;
}

QString OperationValidator::check(const FileSystemAdapter *adapter, const FileOperation &operation, const JobResult &result)
{
    const QString src = operation.source();
    const QString dest = result.resultPath();

    auto missing = [](const QString &path) {
        return i18n("%1 does not exist after the operation.", path);
    };
    auto stillThere = [](const QString &path) {
        return i18n("%1 still exists after the operation.", path);
    };

    switch (operation.type()) {
    case FileOperation::Copy:
        if (typeOf(adapter, dest) == FileStat::NotFound) {
            return missing(dest);
        }
        if (typeOf(adapter, src) == FileStat::NotFound) {
            return missing(src);
        }
        break;
    case FileOperation::Move:
    case FileOperation::Rename:
        if (typeOf(adapter, dest) == FileStat::NotFound) {
            return missing(dest);
        }
        if (src != dest && typeOf(adapter, src) != FileStat::NotFound) {
            return stillThere(src);
        }
        break;
    case FileOperation::Trash:
        if (typeOf(adapter, src) != FileStat::NotFound) {
            return stillThere(src);
        }
        break;
    case FileOperation::Restore:
        if (typeOf(adapter, dest) == FileStat::NotFound) {
            return missing(dest);
        }
        break;
    case FileOperation::CreateFolder:
        if (typeOf(adapter, dest) != FileStat::Directory) {
            return i18n("%1 is not a folder after the operation.", dest);
        }
        break;
    case FileOperation::CreateFile:
        if (typeOf(adapter, dest) != FileStat::File) {
            return i18n("%1 is not a file after the operation.", dest);
        }
        break;
    case FileOperation::CreateSymlink:
        if (typeOf(adapter, dest) != FileStat::Symlink) {
            return i18n("%1 is not a symbolic link after the operation.", dest);
        }
        break;
    case FileOperation::EmptyTrash:
        break;
    }
    return QString();
}

void OperationValidator::validate(const Job &job)
{
    if (job.status() != Job::Completed || job.result().outcome() != JobResult::Success) {
        return;
    }

    const QUuid jobId = job.id();
    const FileOperation operation = job.operation();
    const JobResult result = job.result();
    const FileSystemAdapter *adapter = m_adapter;

    auto *watcher = new QFutureWatcher<QString>(this);
    connect(watcher, &QFutureWatcher<QString>::finished, this, [this, watcher, jobId, operation, result]() {
        const QString message = watcher->result();
        watcher->deleteLater();
        if (!message.isEmpty()) {
            qCWarning(KTRANSACT_CORE) << "validation of" << operation << "failed:" << message;
            const QString path = result.resultPath().isEmpty() ? operation.source() : result.resultPath();
            Q_EMIT validationFailed(jobId, path, message);
        }
    });
    watcher->setFuture(QtConcurrent::run(&m_pool, &OperationValidator::check, adapter, operation, result));
}

#include "moc_operationvalidator_p.cpp"
