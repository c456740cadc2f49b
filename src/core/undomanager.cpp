/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000 Simon Hausmann <hausmann@kde.org>
    SPDX-FileCopyrightText: 2006, 2008 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "undomanager.h"
#include "ktransactundodebug.h"
#include "pathhelpers_p.h"
#include "transactionmanager.h"
#include "undomanager_p.h"

#include <KLocalizedString>

#include <QHash>
#include <QSet>

#include <algorithm>

using namespace KTransact;

UndoManagerPrivate::UndoManagerPrivate(UndoManager *qq, TransactionManager *manager, int limit)
    : q(qq)
    , m_manager(manager)
    , m_limit(qMax(1, limit))
{
}

static bool hasMovePlan(const JobResult &result)
{
    return !result.movedEntries().isEmpty() || !result.createdDirectories().isEmpty() || !result.removedDirectories().isEmpty();
}

QList<FileOperation> UndoManagerPrivate::reciprocals(const Job &job)
{
    const FileOperation op = job.operation();
    const JobResult result = job.result();
    switch (op.type()) {
    case FileOperation::Move: {
        if (!hasMovePlan(result)) {
            return {FileOperation::move(op.targetPath(), op.source())};
        }
        // Moved piece by piece: recreate the removed source folders, take back
        // exactly what was moved, then drop the folders the move created
        QList<FileOperation> ops;
        const QStringList removed = result.removedDirectories();
        for (auto it = removed.crbegin(); it != removed.crend(); ++it) {
            ops.append(FileOperation::createFolder(*it));
        }
        const QList<MovedEntry> moved = result.movedEntries();
        for (auto it = moved.crbegin(); it != moved.crend(); ++it) {
            ops.append(FileOperation::move(it->destination, it->source));
        }
        const QStringList created = result.createdDirectories();
        for (auto it = created.crbegin(); it != created.crend(); ++it) {
            ops.append(FileOperation::trash(*it));
        }
        return ops;
    }
    case FileOperation::Rename:
        return {FileOperation::rename(op.targetPath(), Utils::fileName(op.source()))};
    case FileOperation::CreateFolder:
    case FileOperation::CreateFile:
    case FileOperation::CreateSymlink:
    case FileOperation::Restore:
        return {FileOperation::trash(op.targetPath())};
    case FileOperation::Trash:
        return {FileOperation::restore(result.trashItem())};
    case FileOperation::Copy:
    case FileOperation::EmptyTrash:
        break;
    }
    return {};
}

Job UndoManagerPrivate::withoutReverted(const Job &job, const QList<Job> &reverted)
{
    JobResult result = job.result();
    QList<MovedEntry> moved = result.movedEntries();
    QStringList created = result.createdDirectories();
    QStringList removed = result.removedDirectories();
    for (const Job &reciprocal : reverted) {
        const FileOperation op = reciprocal.operation();
        switch (op.type()) {
        case FileOperation::Move:
            moved.erase(std::remove_if(moved.begin(),
                                       moved.end(),
                                       [&op](const MovedEntry &entry) {
                                           return entry.destination == op.source() && entry.source == op.destination();
                                       }),
                        moved.end());
            break;
        case FileOperation::CreateFolder:
            removed.removeAll(op.targetPath());
            break;
        case FileOperation::Trash:
            created.removeAll(op.source());
            break;
        default:
            break;
        }
    }
    result.setMovedEntries(moved);
    result.setCreatedDirectories(created);
    result.setRemovedDirectories(removed);
    Job rest(job);
    rest.setResult(result);
    return rest;
}

void UndoManagerPrivate::recordTransaction(const Transaction &record)
{
    // Any new user work invalidates what was undone before
    clearRedoStack();
    if (record.jobs().isEmpty()) {
        return;
    }
    qCDebug(KTRANSACT_UNDO) << "recording" << record;
    pushUndoCommand(record);
}

void UndoManagerPrivate::startUndoOrRedo(bool redo)
{
    if (m_lock || !m_manager) {
        qCWarning(KTRANSACT_UNDO) << "cannot start, busy:" << m_lock;
        return;
    }
    const QList<Transaction> &commands = redo ? m_redoCommands : m_undoCommands;
    if (commands.isEmpty()) {
        qCWarning(KTRANSACT_UNDO) << "nothing to" << (redo ? "redo" : "undo");
        return;
    }
    const Transaction cmd = commands.last();

    lock();
    const QUuid id = m_manager->startTransaction(cmd.description(), redo ? Transaction::RedoAction : Transaction::UndoAction);
    const QList<Job> jobs = cmd.jobs();
    for (auto it = jobs.crbegin(); it != jobs.crend(); ++it) {
        const QList<FileOperation> ops = reciprocals(*it);
        if (ops.isEmpty()) {
            qCWarning(KTRANSACT_UNDO) << "no way to revert" << *it;
            continue;
        }
        for (const FileOperation &op : ops) {
            m_manager->addReciprocal(id, op, it->id());
        }
    }

    qCDebug(KTRANSACT_UNDO) << "starting" << (redo ? "redo" : "undo") << "of" << cmd << "as" << id;
    m_running = true;
    m_runningRedo = redo;
    m_runningCmdId = cmd.id();
    m_runningId = id;
    m_manager->commit(id);
}

void UndoManagerPrivate::slotTransactionFinished(const Transaction &transaction)
{
    if (!m_running || transaction.id() != m_runningId) {
        return;
    }
    const bool redo = m_runningRedo;
    m_running = false;
    m_runningId = QUuid();

    // A job counts as reverted only when every one of its reciprocals completed fully
    QList<QUuid> notReverted;
    QSet<QUuid> incomplete;
    QHash<QUuid, QList<Job>> completedFor;
    const QList<Job> jobs = transaction.jobs();
    for (const Job &job : jobs) {
        if (job.status() == Job::Completed && !job.isPartial()) {
            completedFor[job.reciprocalOf()].append(job);
        } else {
            notReverted.append(job.id());
            incomplete.insert(job.reciprocalOf());
        }
    }
    QList<QUuid> reverted;
    for (auto it = completedFor.cbegin(); it != completedFor.cend(); ++it) {
        if (!incomplete.contains(it.key())) {
            reverted.append(it.key());
        }
    }
    const Transaction done = transaction.remainder(notReverted);

    QList<Transaction> &source = redo ? m_redoCommands : m_undoCommands;
    int index = -1;
    for (int i = 0; i < source.size(); ++i) {
        if (source.at(i).id() == m_runningCmdId) {
            index = i;
            break;
        }
    }
    int left = 0;
    if (index >= 0) {
        const Transaction cmd = source.at(index);
        Transaction rest = cmd.remainder(reverted);
        // Half reverted moves keep only what is still to be taken back
        for (const QUuid &jobId : std::as_const(incomplete)) {
            const int i = rest.indexOf(jobId);
            if (i >= 0 && completedFor.contains(jobId)) {
                rest.jobRef(i) = withoutReverted(rest.jobs().at(i), completedFor.value(jobId));
            }
        }
        left = rest.totalOps();
        if (index == source.size() - 1) {
            if (redo) {
                popRedoCommand();
            } else {
                popUndoCommand();
            }
            if (left > 0) {
                if (redo) {
                    pushRedoCommand(rest);
                } else {
                    pushUndoCommand(rest);
                }
            }
        } else if (left > 0) {
            source[index] = rest;
        } else {
            source.removeAt(index);
        }
    } else {
        // Invalidated by new work while running, see recordTransaction
        qCDebug(KTRANSACT_UNDO) << "reverted transaction is not on the stack anymore";
    }
    m_runningCmdId = QUuid();

    if (done.totalOps() > 0) {
        if (redo) {
            pushUndoCommand(done);
        } else {
            pushRedoCommand(done);
        }
    }
    unlock();

    const bool success = left == 0 && notReverted.isEmpty();
    QString message;
    if (success) {
        message = redo ? i18n("Redo finished.") : i18n("Undo finished.");
    } else if (redo) {
        message = i18np("One operation could not be redone.", "%1 operations could not be redone.", qMax(left, int(notReverted.size())));
    } else {
        message = i18np("One operation could not be undone.", "%1 operations could not be undone.", qMax(left, int(notReverted.size())));
    }
    qCDebug(KTRANSACT_UNDO) << message;
    Q_EMIT q->operationFinished(success, message);
    Q_EMIT q->undoJobFinished();
}

void UndoManagerPrivate::pushUndoCommand(const Transaction &cmd)
{
    m_undoCommands.append(cmd);
    while (m_undoCommands.size() > m_limit) {
        m_undoCommands.removeFirst();
    }
    if (m_undoCommands.size() == 1 && !m_lock) {
        Q_EMIT q->undoAvailable(true);
    }
    Q_EMIT q->undoTextChanged(q->undoText());
}

void UndoManagerPrivate::popUndoCommand()
{
    m_undoCommands.removeLast();
    if (m_undoCommands.isEmpty() && !m_lock) {
        Q_EMIT q->undoAvailable(false);
    }
    Q_EMIT q->undoTextChanged(q->undoText());
}

void UndoManagerPrivate::pushRedoCommand(const Transaction &cmd)
{
    m_redoCommands.append(cmd);
    while (m_redoCommands.size() > m_limit) {
        m_redoCommands.removeFirst();
    }
    if (m_redoCommands.size() == 1 && !m_lock) {
        Q_EMIT q->redoAvailable(true);
    }
    Q_EMIT q->redoTextChanged(q->redoText());
}

void UndoManagerPrivate::popRedoCommand()
{
    m_redoCommands.removeLast();
    if (m_redoCommands.isEmpty() && !m_lock) {
        Q_EMIT q->redoAvailable(false);
    }
    Q_EMIT q->redoTextChanged(q->redoText());
}

void UndoManagerPrivate::clearRedoStack()
{
    const bool wasEmpty = m_redoCommands.isEmpty();
    m_redoCommands.clear();
    if (!wasEmpty && !m_lock) {
        Q_EMIT q->redoAvailable(false);
    }
    if (!wasEmpty) {
        Q_EMIT q->redoTextChanged(q->redoText());
    }
}

void UndoManagerPrivate::lock()
{
    if (q->isUndoAvailable()) {
        Q_EMIT q->undoAvailable(false);
    }
    if (q->isRedoAvailable()) {
        Q_EMIT q->redoAvailable(false);
    }
    m_lock = true;
}

void UndoManagerPrivate::unlock()
{
    m_lock = false;
    if (q->isUndoAvailable()) {
        Q_EMIT q->undoAvailable(true);
    }
    if (q->isRedoAvailable()) {
        Q_EMIT q->redoAvailable(true);
    }
}

UndoManager::UndoManager(TransactionManager *manager, int limit, QObject *parent)
    : QObject(parent)
    , d(new UndoManagerPrivate(this, manager, limit))
{
    connect(manager, &TransactionManager::historyCommitted, this, [this](const Transaction &record) {
        d->recordTransaction(record);
    });
    connect(manager, &TransactionManager::transactionFinished, this, [this](const Transaction &transaction) {
        d->slotTransactionFinished(transaction);
    });
}

UndoManager::~UndoManager() = default;

bool UndoManager::isUndoAvailable() const
{
    return !d->m_undoCommands.isEmpty() && !d->m_lock;
}

bool UndoManager::isRedoAvailable() const
{
    return !d->m_redoCommands.isEmpty() && !d->m_lock;
}

QString UndoManager::undoText() const
{
    if (d->m_undoCommands.isEmpty()) {
        return i18n("Und&o");
    }
    return i18n("Und&o: %1", d->m_undoCommands.last().description());
}

QString UndoManager::redoText() const
{
    if (d->m_redoCommands.isEmpty()) {
        return i18n("&Redo");
    }
    return i18n("&Redo: %1", d->m_redoCommands.last().description());
}

int UndoManager::undoCount() const
{
    return d->m_undoCommands.size();
}

int UndoManager::redoCount() const
{
    return d->m_redoCommands.size();
}

int UndoManager::limit() const
{
    return d->m_limit;
}

Transaction UndoManager::nextUndo() const
{
    return d->m_undoCommands.isEmpty() ? Transaction() : d->m_undoCommands.last();
}

Transaction UndoManager::nextRedo() const
{
    return d->m_redoCommands.isEmpty() ? Transaction() : d->m_redoCommands.last();
}

bool UndoManager::isBusy() const
{
    return d->m_running;
}

void UndoManager::undo()
{
    d->startUndoOrRedo(false);
}

void UndoManager::redo()
{
    d->startUndoOrRedo(true);
}

void UndoManager::clearHistory()
{
    if (d->m_lock) {
        qCWarning(KTRANSACT_UNDO) << "not clearing the history while busy";
        return;
    }
    d->clearRedoStack();
    if (!d->m_undoCommands.isEmpty()) {
        d->m_undoCommands.clear();
        Q_EMIT undoAvailable(false);
        Q_EMIT undoTextChanged(undoText());
    }
}

#include "moc_undomanager.cpp"
