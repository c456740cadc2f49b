/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000-2013 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "jobrunnable_p.h"
#include "ktransactcoredebug.h"
#include "pathhelpers_p.h"

#include <QMetaObject>

using namespace KTransact;

JobRunnable::JobRunnable(const Job &job, FileSystemAdapter *adapter, QObject *context, JobEventReceiver *receiver, int progressInterval, int nameProbeLimit)
    : m_job(job)
    , m_op(job.operation())
    , m_adapter(adapter)
    , m_context(context)
    , m_receiver(receiver)
    , m_progressInterval(progressInterval)
    , m_nameProbeLimit(nameProbeLimit)
{
}

JobRunnable::~JobRunnable() = default;

QUuid JobRunnable::jobId() const
{
    return m_job.id();
}

template<typename Func>
void JobRunnable::post(Func func)
{
    QObject *context = m_context.data();
    if (!context) {
        return;
    }
    JobEventReceiver *receiver = m_receiver;
    QMetaObject::invokeMethod(
        context,
        [receiver, func]() {
            func(receiver);
        },
        Qt::QueuedConnection);
}

bool JobRunnable::isCancelled() const
{
    return m_job.isCancelRequested();
}

void JobRunnable::addSkipped(const QString &path, int error, const QString &errorText)
{
    qCDebug(KTRANSACT_CORE) << "skipping" << path << "error" << error << errorText;
    SkippedItem item;
    item.path = path;
    item.error = error;
    item.errorText = errorText;
    m_skipped.append(item);
}

void JobRunnable::reportProgress(bool force)
{
    if (!force && m_progressTimer.isValid() && m_progressTimer.elapsed() < m_progressInterval) {
        return;
    }
    m_progressTimer.restart();
    const QUuid id = m_job.id();
    const filesize_t processed = m_processed;
    const filesize_t total = m_total;
    post([id, processed, total](JobEventReceiver *receiver) {
        receiver->jobProgress(id, processed, total);
    });
}

void JobRunnable::run()
{
    const QUuid id = m_job.id();
    JobResult result;

    if (isCancelled()) {
        result.setOutcome(JobResult::Cancelled);
        result.setError(ERR_USER_CANCELED, m_op.source());
        post([id, result](JobEventReceiver *receiver) {
            receiver->jobFinished(id, Job::Cancelled, result);
        });
        return;
    }

    post([id](JobEventReceiver *receiver) {
        receiver->jobStarted(id);
    });
    m_progressTimer.start();

    const AdapterResult res = execute();
    reportProgress(true);

    Job::Status status;
    result.setSkippedItems(m_skipped);
    if (res.success()) {
        status = Job::Completed;
        result.setOutcome(m_skipped.isEmpty() ? JobResult::Success : JobResult::PartialSuccess);
        result.setResultPath(res.path());
        result.setTrashItem(m_trashItem);
        result.setMovedEntries(m_movedEntries);
        result.setCreatedDirectories(m_createdDirectories);
        result.setRemovedDirectories(m_removedDirectories);
        result.setReplacedExisting(m_replacedExisting);
    } else if (res.error() == ERR_USER_CANCELED) {
        status = Job::Cancelled;
        result.setOutcome(JobResult::Cancelled);
        result.setError(res.error(), res.errorText());
    } else if (res.error() == ERR_DOES_NOT_EXIST && !m_op.source().isEmpty() && res.errorText() == m_op.source()) {
        // The source vanished before we got to it: skip, the batch goes on
        qCWarning(KTRANSACT_CORE) << "source of" << m_op << "does not exist anymore, skipping";
        status = Job::Cancelled;
        result.setOutcome(JobResult::Cancelled);
        result.setError(res.error(), res.errorText());
    } else {
        qCWarning(KTRANSACT_CORE) << m_op << "failed:" << buildErrorString(res.error(), res.errorText());
        status = Job::Failed;
        result.setOutcome(JobResult::Failure);
        result.setError(res.error(), res.errorText());
    }

    post([id, status, result](JobEventReceiver *receiver) {
        receiver->jobFinished(id, status, result);
    });
}

AdapterResult JobRunnable::execute()
{
    const QString src = m_op.source();
    const bool autoRename = m_op.flags().testFlag(FileOperation::AutoRename);
    const FileSystemAdapter::Flags flags = m_op.flags().testFlag(FileOperation::Overwrite) ? FileSystemAdapter::Overwrite : FileSystemAdapter::DefaultFlags;
    const NamingStyle style = namingStyleFor(m_op.type());

    // Wraps a primitive producing m_op.targetPath() into the auto-rename loop if requested
    auto produce = [&](const std::function<AdapterResult(const QString &)> &attempt) {
        if (autoRename) {
            return withFreeName(m_op.targetPath(), style, attempt);
        }
        if (flags.testFlag(FileSystemAdapter::Overwrite)) {
            m_replacedExisting = m_adapter->exists(m_op.targetPath());
        }
        return attempt(m_op.targetPath());
    };

    switch (m_op.type()) {
    case FileOperation::Copy:
        return runTransfer(false);
    case FileOperation::Move:
        return runTransfer(true);
    case FileOperation::Trash: {
        FileStat info;
        const AdapterResult statResult = m_adapter->stat(src, info);
        if (!statResult.success()) {
            return statResult;
        }
        if (!info.exists()) {
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
        }
        m_total = info.size;
        const AdapterResult res = m_adapter->trash(src, m_trashItem);
        if (res.success()) {
            m_processed = m_total;
        }
        return res;
    }
    case FileOperation::Restore: {
        const TrashItem item = m_op.trashItem();
        if (!m_adapter->exists(item.physicalPath)) {
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
        }
        m_total = item.size;
        const AdapterResult res = produce([&](const QString &target) {
            return m_adapter->restore(item, target, flags);
        });
        if (res.success()) {
            m_processed = m_total;
        }
        return res;
    }
    case FileOperation::Rename:
        if (!m_adapter->exists(src)) {
            return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
        }
        return produce([&](const QString &target) {
            return m_adapter->rename(src, Utils::fileName(target), flags);
        });
    case FileOperation::CreateFolder:
        return produce([&](const QString &target) {
            return m_adapter->makeDirectory(target);
        });
    case FileOperation::CreateFile:
        return produce([&](const QString &target) {
            return m_adapter->createFile(target, flags);
        });
    case FileOperation::CreateSymlink:
        return produce([&](const QString &target) {
            return m_adapter->createSymlink(m_op.linkTarget(), target, flags);
        });
    case FileOperation::EmptyTrash:
        return m_adapter->emptyTrash();
    }
    return AdapterResult::fail(ERR_UNSUPPORTED_ACTION, FileOperation::typeName(m_op.type()));
}

AdapterResult JobRunnable::withFreeName(const QString &target, NamingStyle style, const std::function<AdapterResult(const QString &)> &attempt)
{
    const QString dir = Utils::parentPath(target);
    const QString fileName = Utils::fileName(target);
    for (int i = 0; i <= m_nameProbeLimit; ++i) {
        if (isCancelled()) {
            return AdapterResult::fail(ERR_USER_CANCELED, target);
        }
        const QString candidate = i == 0 ? target : concatPaths(dir, suggestName(fileName, i, style));
        if (m_adapter->exists(candidate)) {
            continue;
        }
        const AdapterResult res = attempt(candidate);
        if (res.success() || (res.error() != ERR_FILE_ALREADY_EXIST && res.error() != ERR_DIR_ALREADY_EXIST)) {
            return res;
        }
        // Somebody else created it meanwhile, try the next one
        qCDebug(KTRANSACT_CORE) << candidate << "appeared while probing, trying the next name";
    }
    return AdapterResult::fail(ERR_NAME_COLLISION_EXHAUSTED, target);
}

filesize_t JobRunnable::treeSize(const QString &path)
{
    FileStat info;
    if (!m_adapter->stat(path, info).success() || !info.exists()) {
        return 0;
    }
    if (!info.isDir()) {
        return info.size;
    }
    filesize_t size = 0;
    QStringList entries;
    if (!m_adapter->listDirectory(path, entries).success()) {
        return 0;
    }
    for (const QString &entry : std::as_const(entries)) {
        if (isCancelled()) {
            break;
        }
        size += treeSize(concatPaths(path, entry));
    }
    return size;
}

AdapterResult JobRunnable::runTransfer(bool isMove)
{
    const QString src = m_op.source();
    const QString dest = m_op.destination();

    FileStat info;
    const AdapterResult statResult = m_adapter->stat(src, info);
    if (!statResult.success()) {
        return statResult;
    }
    if (!info.exists()) {
        return AdapterResult::fail(ERR_DOES_NOT_EXIST, src);
    }
    if (info.isDir() && Utils::isSameOrInside(dest, src) && dest != src) {
        return AdapterResult::fail(ERR_CANNOT_MOVE_INTO_ITSELF, dest);
    }

    m_total = info.isDir() ? treeSize(src) : info.size;
    reportProgress(true);

    const bool overwrite = m_op.flags().testFlag(FileOperation::Overwrite);
    if (!m_op.flags().testFlag(FileOperation::AutoRename)) {
        if (src == dest) {
            return AdapterResult::fail(ERR_IDENTICAL_FILES, dest);
        }
        return transferItem(src, dest, info, isMove, overwrite, true);
    }
    return withFreeName(dest, namingStyleFor(m_op.type()), [&](const QString &candidate) {
        return transferItem(src, candidate, info, isMove, overwrite, true);
    });
}

AdapterResult JobRunnable::copyOneFile(const QString &src, const QString &dest, const FileStat &srcInfo, bool overwrite, bool isRoot)
{
    const filesize_t base = m_processed;
    auto progress = [this, base](filesize_t done, filesize_t) {
        m_processed = base + done;
        reportProgress(false);
    };
    // Inside a recursion the current file is always finished, cancellation is checked between files
    const AdapterResult res = m_adapter->copyFile(src,
                                                  dest,
                                                  overwrite ? FileSystemAdapter::Overwrite : FileSystemAdapter::DefaultFlags,
                                                  progress,
                                                  isRoot ? m_job.cancelToken() : CancelToken());
    if (res.success()) {
        m_processed = base + srcInfo.size;
    } else {
        m_processed = base;
    }
    return res;
}

AdapterResult JobRunnable::transferItem(const QString &src, const QString &dest, const FileStat &srcInfo, bool isMove, bool overwrite, bool isRoot)
{
    bool merging = false;
    const bool replacing = overwrite && !srcInfo.isDir() && m_adapter->exists(dest);
    if (isMove) {
        const AdapterResult moved = m_adapter->move(src, dest, overwrite ? FileSystemAdapter::Overwrite : FileSystemAdapter::DefaultFlags);
        if (moved.success()) {
            m_processed += srcInfo.isDir() ? treeSize(dest) : srcInfo.size;
            reportProgress(false);
            m_replacedExisting = m_replacedExisting || replacing;
            // A root renamed in one go is reverted by the reverse rename
            if (!isRoot) {
                m_movedEntries.append(MovedEntry{src, dest});
            }
            return moved;
        }
        if (moved.error() != ERR_CROSS_DEVICE && moved.error() != ERR_WOULD_MERGE) {
            return moved;
        }
        qCDebug(KTRANSACT_CORE) << "moving" << src << "to" << dest << "by copying, error" << moved.error();
        merging = moved.error() == ERR_WOULD_MERGE;
    }

    if (!srcInfo.isDir()) {
        const AdapterResult copied = copyOneFile(src, dest, srcInfo, overwrite, isRoot);
        if (!copied.success()) {
            return copied;
        }
        m_replacedExisting = m_replacedExisting || replacing;
        if (isMove) {
            const AdapterResult removed = m_adapter->remove(src);
            if (!removed.success()) {
                addSkipped(src, ERR_CANNOT_DELETE_ORIGINAL, src);
            } else {
                m_movedEntries.append(MovedEntry{src, dest});
            }
        }
        return AdapterResult::pass(dest);
    }

    const AdapterResult made = m_adapter->makeDirectory(dest);
    if (!made.success() && !(made.error() == ERR_DIR_ALREADY_EXIST && (overwrite || merging))) {
        return made;
    }
    if (made.success() && isMove) {
        m_createdDirectories.append(dest);
    }

    const int skippedBefore = m_skipped.size();
    transferChildren(src, dest, isMove, overwrite || merging);
    if (isMove && m_skipped.size() == skippedBefore) {
        const AdapterResult removed = m_adapter->remove(src);
        if (!removed.success()) {
            addSkipped(src, ERR_CANNOT_DELETE_ORIGINAL, src);
        } else {
            m_removedDirectories.append(src);
        }
    }
    return AdapterResult::pass(dest);
}

void JobRunnable::transferChildren(const QString &src, const QString &dest, bool isMove, bool overwrite)
{
    QStringList entries;
    const AdapterResult listed = m_adapter->listDirectory(src, entries);
    if (!listed.success()) {
        addSkipped(src, listed.error(), listed.errorText());
        return;
    }

    for (int i = 0; i < entries.size(); ++i) {
        const QString childSrc = concatPaths(src, entries.at(i));
        if (isCancelled()) {
            // No more writes once cancelled; everything not visited is reported
            for (int j = i; j < entries.size(); ++j) {
                const QString path = concatPaths(src, entries.at(j));
                addSkipped(path, ERR_USER_CANCELED, path);
            }
            return;
        }

        FileStat info;
        const AdapterResult statResult = m_adapter->stat(childSrc, info);
        if (!statResult.success() || !info.exists()) {
            addSkipped(childSrc, statResult.success() ? int(ERR_DOES_NOT_EXIST) : statResult.error(), childSrc);
            continue;
        }

        const AdapterResult res = transferItem(childSrc, concatPaths(dest, entries.at(i)), info, isMove, overwrite, false);
        if (!res.success()) {
            addSkipped(childSrc, res.error(), res.errorText());
        }
    }
}
