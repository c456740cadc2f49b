/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "transactionmanager.h"
#include "ktransactcoredebug.h"
#include "localfilesystemadapter_p.h"
#include "namesuggestion.h"
#include "pathhelpers_p.h"
#include "transactionmanager_p.h"

#include <KLocalizedString>

#include <QMetaObject>

#include <algorithm>

using namespace KTransact;

// Number of finished transactions transaction() can still return
static const int s_finishedTransactionsKept = 100;
// Started but never committed nor cancelled; the oldest is cancelled beyond this
static const int s_openTransactionsKept = 32;

TransactionManagerPrivate::TransactionManagerPrivate(TransactionManager *qq, std::unique_ptr<FileSystemAdapter> adapter, const TransactionSettings &settings)
    : q(qq)
    , m_settings(settings)
    , m_adapter(std::move(adapter))
    , m_validator(m_adapter.get())
    , m_pool(settings.maxWorkerThreads)
{
}

TransactionManagerPrivate::~TransactionManagerPrivate() = default;

QString TransactionManagerPrivate::jobPath(const FileOperation &operation)
{
    return operation.source().isEmpty() ? operation.targetPath() : operation.source();
}

std::shared_ptr<TransactionState> TransactionManagerPrivate::stateForTransaction(const QUuid &transactionId) const
{
    return m_transactions.value(transactionId);
}

std::shared_ptr<TransactionState> TransactionManagerPrivate::stateForJob(const QUuid &jobId) const
{
    return m_transactions.value(m_jobToTransaction.value(jobId));
}

Job *TransactionManagerPrivate::findJob(TransactionState &state, const QUuid &jobId)
{
    const int index = state.transaction.indexOf(jobId);
    if (index < 0) {
        return nullptr;
    }
    return &state.transaction.jobRef(index);
}

QUuid TransactionManagerPrivate::createTransaction(const QString &description, Transaction::Origin origin)
{
    auto state = std::make_shared<TransactionState>();
    state->transaction = Transaction(description, origin);
    state->sequential = origin != Transaction::UserAction;
    const QUuid id = state->transaction.id();
    m_transactions.insert(id, state);
    m_openOrder.append(id);
    qCDebug(KTRANSACT_CORE) << "new transaction" << id << description << origin;

    while (m_openOrder.size() > s_openTransactionsKept) {
        const auto abandoned = stateForTransaction(m_openOrder.constFirst());
        if (!abandoned) {
            m_openOrder.removeFirst();
            continue;
        }
        qCWarning(KTRANSACT_CORE) << "transaction" << abandoned->transaction.id() << "was never committed, cancelling it";
        cancelTransaction(abandoned);
    }
    return id;
}

QUuid TransactionManagerPrivate::registerJob(const QUuid &transactionId, const FileOperation &operation, const QUuid &reciprocalOf)
{
    const auto state = stateForTransaction(transactionId);
    if (!state) {
        qCWarning(KTRANSACT_CORE) << "addOperation: no transaction" << transactionId;
        return QUuid();
    }
    if (state->transaction.isCommitted()) {
        qCWarning(KTRANSACT_CORE) << "addOperation: transaction" << transactionId << "was already committed";
        return QUuid();
    }
    if (!operation.isValid()) {
        qCWarning(KTRANSACT_CORE) << "addOperation: invalid operation" << operation;
        return QUuid();
    }

    Job job(transactionId, operation);
    job.setReciprocalOf(reciprocalOf);
    state->transaction.appendJob(job);
    m_jobToTransaction.insert(job.id(), transactionId);
    return job.id();
}

bool TransactionManagerPrivate::checkConflict(const Job &job, ConflictRecord &conflict) const
{
    const FileOperation op = job.operation();
    if (op.flags().testFlag(FileOperation::AutoRename) || op.flags().testFlag(FileOperation::Overwrite)) {
        return false;
    }

    const QString target = op.targetPath();
    switch (op.type()) {
    case FileOperation::Trash:
    case FileOperation::EmptyTrash:
        return false;
    case FileOperation::Copy:
    case FileOperation::Move:
    case FileOperation::Rename:
        if (target == op.source()) {
            return false;
        }
        break;
    default:
        break;
    }

    FileStat destInfo;
    if (!m_adapter->stat(target, destInfo).success() || !destInfo.exists()) {
        return false;
    }

    conflict.jobId = job.id();
    conflict.transactionId = job.transactionId();
    conflict.type = op.type();
    conflict.source = op.source();
    conflict.destination = target;
    conflict.destinationIsDir = destInfo.isDir();
    conflict.options = ConflictActions(Skip | Rename | CancelAll);

    bool canOverwrite = false;
    switch (op.type()) {
    case FileOperation::Copy:
    case FileOperation::Move:
    case FileOperation::Rename: {
        FileStat srcInfo;
        if (m_adapter->stat(op.source(), srcInfo).success() && srcInfo.exists()) {
            canOverwrite = srcInfo.isDir() == destInfo.isDir();
        }
        break;
    }
    case FileOperation::Restore:
        canOverwrite = op.trashItem().isDir == destInfo.isDir();
        break;
    default:
        // Creating something new never replaces what is there
        break;
    }
    if (canOverwrite) {
        conflict.options |= Overwrite;
    }

    const int limit = m_settings.nameProbeLimit;
    const QString freePath = findFreeName(
        target,
        namingStyleFor(op.type()),
        [this](const QString &path) {
            return m_adapter->exists(path);
        },
        limit);
    conflict.suggestedName = Utils::fileName(freePath);
    return true;
}

void TransactionManagerPrivate::scheduleJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId)
{
    for (;;) {
        Job *job = findJob(*state, jobId);
        if (!job || job->isTerminal() || m_submittedJobs.contains(jobId)) {
            return;
        }
        if (job->isCancelRequested()) {
            endUnsubmittedJob(state, jobId, ERR_USER_CANCELED, jobPath(job->operation()));
            return;
        }

        ConflictRecord conflict;
        if (!checkConflict(*job, conflict)) {
            submitJob(state, jobId);
            return;
        }
        qCDebug(KTRANSACT_CORE) << "conflict for job" << jobId << "at" << conflict.destination;

        ConflictResolution resolution;
        if (state->applyToAll) {
            resolution.action = *state->applyToAll;
            if (!conflict.options.testFlag(resolution.action)) {
                // e.g. Overwrite cached but not possible for this one
                holdConflict(state, conflict);
                return;
            }
        } else if (m_resolver) {
            resolution = m_resolver->askUserConflict(conflict);
            if (!conflict.options.testFlag(resolution.action)) {
                qCWarning(KTRANSACT_CORE) << "resolver chose" << resolution.action << "which is not offered, skipping";
                resolution.action = Skip;
            }
            if (resolution.applyToAll) {
                state->applyToAll = resolution.action;
            }
        } else {
            holdConflict(state, conflict);
            return;
        }

        if (!applyResolution(state, jobId, resolution)) {
            return;
        }
    }
}

void TransactionManagerPrivate::scheduleNextSequential(const std::shared_ptr<TransactionState> &state)
{
    const QList<Job> jobs = state->transaction.jobs();
    for (const Job &job : jobs) {
        if (job.isTerminal()) {
            continue;
        }
        if (m_submittedJobs.contains(job.id())) {
            return;
        }
        for (const ConflictRecord &held : std::as_const(state->heldConflicts)) {
            if (held.jobId == job.id()) {
                return;
            }
        }
        scheduleJob(state, job.id());
        return;
    }
}

void TransactionManagerPrivate::submitJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId)
{
    const Job *job = findJob(*state, jobId);
    auto *runnable = new JobRunnable(*job, m_adapter.get(), q, this, m_settings.progressInterval, m_settings.nameProbeLimit);
    m_submittedJobs.insert(jobId);
    m_pool.submit(runnable);
}

bool TransactionManagerPrivate::applyResolution(const std::shared_ptr<TransactionState> &state, const QUuid &jobId, const ConflictResolution &resolution)
{
    Job *job = findJob(*state, jobId);
    if (!job) {
        return false;
    }
    FileOperation op = job->operation();
    bool recheck = false;

    switch (resolution.action) {
    case Skip:
        endUnsubmittedJob(state, jobId, ERR_USER_CANCELED, op.targetPath());
        break;
    case CancelAll:
        cancelTransaction(state);
        break;
    case Overwrite:
        op.setFlags(op.flags() | FileOperation::Overwrite);
        job->setOperation(op);
        recheck = true;
        break;
    case Rename:
        if (resolution.newName.isEmpty()) {
            // The worker picks the first free name and retries if it is taken meanwhile
            op.setFlags(op.flags() | FileOperation::AutoRename);
        } else {
            op.setTargetPath(concatPaths(Utils::parentPath(op.targetPath()), resolution.newName));
        }
        job->setOperation(op);
        recheck = true;
        break;
    }

    Q_EMIT q->conflictResolved(jobId, resolution.action);
    return recheck;
}

void TransactionManagerPrivate::holdConflict(const std::shared_ptr<TransactionState> &state, const ConflictRecord &conflict)
{
    state->heldConflicts.append(conflict);
    if (!state->prompting) {
        promptNextConflict(state);
    }
}

void TransactionManagerPrivate::promptNextConflict(const std::shared_ptr<TransactionState> &state)
{
    if (state->heldConflicts.isEmpty()) {
        state->prompting = false;
        return;
    }
    state->prompting = true;
    Q_EMIT q->conflictDetected(state->heldConflicts.constFirst());
}

void TransactionManagerPrivate::dropHeldConflict(TransactionState &state, const QUuid &jobId)
{
    for (int i = 0; i < state.heldConflicts.size(); ++i) {
        if (state.heldConflicts.at(i).jobId == jobId) {
            if (i == 0) {
                state.prompting = false;
            }
            state.heldConflicts.removeAt(i);
            return;
        }
    }
}

void TransactionManagerPrivate::endUnsubmittedJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId, int error, const QString &errorText)
{
    Job *job = findJob(*state, jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    dropHeldConflict(*state, jobId);

    JobResult result;
    result.setOutcome(JobResult::Cancelled);
    result.setError(error, errorText);
    job->setResult(result);
    job->setStatus(Job::Cancelled);

    const Job snapshot = *job;
    emitJobEnd(snapshot);
    jobTerminated(state);
}

void TransactionManagerPrivate::cancelJob(const std::shared_ptr<TransactionState> &state, const QUuid &jobId)
{
    Job *job = findJob(*state, jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->requestCancel();
    if (!m_submittedJobs.contains(jobId)) {
        endUnsubmittedJob(state, jobId, ERR_USER_CANCELED, jobPath(job->operation()));
    }
}

void TransactionManagerPrivate::cancelTransaction(const std::shared_ptr<TransactionState> &state)
{
    qCDebug(KTRANSACT_CORE) << "cancelling transaction" << state->transaction.id();
    if (!state->transaction.isCommitted()) {
        m_openOrder.removeOne(state->transaction.id());
        state->transaction.setCommitted();
        state->transaction.setStatus(Transaction::Running);
    }
    state->applyToAll.reset();

    const QList<Job> jobs = state->transaction.jobs();
    for (const Job &job : jobs) {
        cancelJob(state, job.id());
    }
    state->heldConflicts.clear();
    state->prompting = false;

    // Nothing was pending: finish now
    jobTerminated(state);
}

void TransactionManagerPrivate::emitJobEnd(const Job &job)
{
    const FileOperation op = job.operation();
    const QString path = jobPath(op);
    switch (job.status()) {
    case Job::Completed:
        Q_EMIT q->jobCompleted(job.id(), op.type(), job.result().resultPath().isEmpty() ? path : job.result().resultPath(), job.result());
        break;
    case Job::Failed:
        Q_EMIT q->jobFailed(job.id(), op.type(), path, job.result().error(), job.result().errorText());
        break;
    case Job::Cancelled:
        Q_EMIT q->jobCancelled(job.id(), op.type(), path);
        break;
    case Job::Pending:
    case Job::Running:
        break;
    }
}

void TransactionManagerPrivate::emitTransactionProgress(const TransactionState &state)
{
    Q_EMIT q->transactionProgress(state.transaction.id(), state.transaction.processedAmount(), state.transaction.totalAmount());
}

void TransactionManagerPrivate::jobTerminated(const std::shared_ptr<TransactionState> &state)
{
    const Transaction &transaction = state->transaction;
    if (!transaction.isCommitted() || transaction.isTerminal()) {
        return;
    }
    Q_EMIT q->transactionUpdate(transaction.id(), transaction.completedOps(), transaction.totalOps());

    if (transaction.completedOps() < transaction.totalOps()) {
        if (state->sequential) {
            scheduleNextSequential(state);
        }
        return;
    }
    if (state->finishQueued) {
        return;
    }
    state->finishQueued = true;
    // Finish from the event loop so that callers of commit() or resolveConflict() see the signal afterwards
    const QUuid id = transaction.id();
    QMetaObject::invokeMethod(
        q,
        [this, id]() {
            finishTransaction(id);
        },
        Qt::QueuedConnection);
}

void TransactionManagerPrivate::finishTransaction(const QUuid &transactionId)
{
    const auto state = stateForTransaction(transactionId);
    if (!state || state->transaction.isTerminal()) {
        return;
    }
    Transaction &transaction = state->transaction;

    const QList<Job> jobs = transaction.jobs();
    const int succeeded = transaction.succeededOps();
    bool anyFailed = false;
    bool anyPartial = false;
    for (const Job &job : jobs) {
        anyFailed |= job.status() == Job::Failed;
        anyPartial |= job.isPartial();
    }

    if (succeeded == jobs.size()) {
        transaction.setStatus(Transaction::Completed);
        transaction.setPartial(anyPartial);
    } else if (succeeded > 0) {
        transaction.setStatus(Transaction::Completed);
        transaction.setPartial(true);
    } else {
        transaction.setStatus(anyFailed ? Transaction::Failed : Transaction::Cancelled);
    }
    qCDebug(KTRANSACT_CORE) << "finished" << transaction;

    for (const Job &job : jobs) {
        m_jobToTransaction.remove(job.id());
        m_submittedJobs.remove(job.id());
    }
    m_finishedOrder.append(transactionId);
    while (m_finishedOrder.size() > s_finishedTransactionsKept) {
        m_transactions.remove(m_finishedOrder.takeFirst());
    }

    const Transaction snapshot = transaction;
    Q_EMIT q->transactionFinished(snapshot);
    if (snapshot.origin() == Transaction::UserAction && succeeded > 0) {
        Q_EMIT q->historyCommitted(snapshot.undoRecord());
    }
}

void TransactionManagerPrivate::jobStarted(const QUuid &jobId)
{
    const auto state = stateForJob(jobId);
    if (!state) {
        return;
    }
    Job *job = findJob(*state, jobId);
    if (!job || !job->setStatus(Job::Running)) {
        return;
    }
    const FileOperation op = job->operation();
    Q_EMIT q->jobStarted(jobId, op.type(), jobPath(op));
}

void TransactionManagerPrivate::jobProgress(const QUuid &jobId, filesize_t processed, filesize_t total)
{
    const auto state = stateForJob(jobId);
    if (!state) {
        return;
    }
    Job *job = findJob(*state, jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    job->setAmounts(processed, total);
    Q_EMIT q->jobProgress(jobId, job->processedAmount(), job->totalAmount());
    emitTransactionProgress(*state);
}

void TransactionManagerPrivate::jobFinished(const QUuid &jobId, Job::Status status, const JobResult &result)
{
    const auto state = stateForJob(jobId);
    if (!state) {
        return;
    }
    Job *job = findJob(*state, jobId);
    if (!job || job->isTerminal()) {
        return;
    }
    m_submittedJobs.remove(jobId);

    if (status == Job::Completed && !result.resultPath().isEmpty()) {
        FileOperation op = job->operation();
        if (op.type() != FileOperation::Trash && op.type() != FileOperation::EmptyTrash && op.targetPath() != result.resultPath()) {
            // Remember where things really ended up, undo depends on it
            op.setTargetPath(result.resultPath());
            job->setOperation(op);
        }
    }
    job->setResult(result);
    job->setStatus(status);

    const Job snapshot = *job;
    emitJobEnd(snapshot);
    emitTransactionProgress(*state);
    if (m_settings.validateResults) {
        m_validator.validate(snapshot);
    }
    jobTerminated(state);
}

void TransactionManagerPrivate::shutdown()
{
    for (const auto &state : std::as_const(m_transactions)) {
        const QList<Job> jobs = state->transaction.jobs();
        for (const Job &job : jobs) {
            if (!job.isTerminal()) {
                state->transaction.jobRef(state->transaction.indexOf(job.id())).requestCancel();
            }
        }
    }
    m_pool.waitForDone();
    m_validator.waitForDone();
}

std::unique_ptr<TransactionManager> TransactionManagerPrivate::create(std::unique_ptr<FileSystemAdapter> adapter, const TransactionSettings &settings)
{
    return std::unique_ptr<TransactionManager>(new TransactionManager(std::move(adapter), settings, nullptr));
}

TransactionManager::TransactionManager(const TransactionSettings &settings, QObject *parent)
    : TransactionManager(std::make_unique<LocalFileSystemAdapter>(), settings, parent)
{
}

TransactionManager::TransactionManager(std::unique_ptr<FileSystemAdapter> adapter, const TransactionSettings &settings, QObject *parent)
    : QObject(parent)
    , d(new TransactionManagerPrivate(this, std::move(adapter), settings))
{
    qRegisterMetaType<KTransact::Transaction>();
    qRegisterMetaType<KTransact::Job>();
    qRegisterMetaType<KTransact::JobResult>();
    qRegisterMetaType<KTransact::ConflictRecord>();
    qRegisterMetaType<KTransact::ConflictAction>();
    qRegisterMetaType<KTransact::filesize_t>("KTransact::filesize_t");

    connect(&d->m_validator, &OperationValidator::validationFailed, this, &TransactionManager::validationFailed);
}

TransactionManager::~TransactionManager()
{
    d->shutdown();
}

TransactionSettings TransactionManager::settings() const
{
    return d->m_settings;
}

void TransactionManager::setConflictResolver(std::unique_ptr<ConflictResolverInterface> resolver)
{
    d->m_resolver = std::move(resolver);
}

ConflictResolverInterface *TransactionManager::conflictResolver() const
{
    return d->m_resolver.get();
}

QUuid TransactionManager::startTransaction(const QString &description)
{
    return d->createTransaction(description, Transaction::UserAction);
}

QUuid TransactionManager::startTransaction(const QString &description, Transaction::Origin origin)
{
    return d->createTransaction(description, origin);
}

QUuid TransactionManager::addOperation(const QUuid &transactionId, const FileOperation &operation)
{
    return d->registerJob(transactionId, operation, QUuid());
}

QUuid TransactionManager::addReciprocal(const QUuid &transactionId, const FileOperation &operation, const QUuid &reciprocalOf)
{
    return d->registerJob(transactionId, operation, reciprocalOf);
}

bool TransactionManager::commit(const QUuid &transactionId)
{
    const auto state = d->stateForTransaction(transactionId);
    if (!state || state->transaction.isCommitted()) {
        qCWarning(KTRANSACT_CORE) << "commit: no pending transaction" << transactionId;
        return false;
    }
    d->m_openOrder.removeOne(transactionId);
    state->transaction.setCommitted();
    state->transaction.setStatus(Transaction::Running);
    Q_EMIT transactionStarted(transactionId, state->transaction.description());

    if (state->sequential) {
        d->scheduleNextSequential(state);
    } else {
        const QList<Job> jobs = state->transaction.jobs();
        for (const Job &job : jobs) {
            d->scheduleJob(state, job.id());
        }
    }
    // Empty, or every job was cancelled before the commit
    if (state->transaction.completedOps() == state->transaction.totalOps()) {
        d->jobTerminated(state);
    }
    return true;
}

bool TransactionManager::resolveConflict(const QUuid &jobId, ConflictAction action, const QString &newName, bool applyToAll)
{
    const auto state = d->stateForJob(jobId);
    if (!state) {
        qCWarning(KTRANSACT_CORE) << "resolveConflict: unknown job" << jobId;
        return false;
    }
    auto it = std::find_if(state->heldConflicts.cbegin(), state->heldConflicts.cend(), [&jobId](const ConflictRecord &record) {
        return record.jobId == jobId;
    });
    if (it == state->heldConflicts.cend()) {
        qCWarning(KTRANSACT_CORE) << "resolveConflict: job" << jobId << "is not waiting for a resolution";
        return false;
    }
    if (!it->options.testFlag(action)) {
        qCWarning(KTRANSACT_CORE) << "resolveConflict:" << action << "is not an option for job" << jobId;
        return false;
    }
    d->dropHeldConflict(*state, jobId);

    ConflictResolution resolution;
    resolution.action = action;
    resolution.newName = newName;
    resolution.applyToAll = applyToAll;
    if (applyToAll && action != CancelAll) {
        state->applyToAll = action;
    }

    if (d->applyResolution(state, jobId, resolution)) {
        d->scheduleJob(state, jobId);
    }

    if (applyToAll && state->applyToAll) {
        // Settle everything that was waiting behind this conflict
        const QList<ConflictRecord> waiting = state->heldConflicts;
        state->heldConflicts.clear();
        state->prompting = false;
        for (const ConflictRecord &record : waiting) {
            d->scheduleJob(state, record.jobId);
        }
    }
    if (!state->prompting) {
        d->promptNextConflict(state);
    }
    return true;
}

bool TransactionManager::cancel(const QUuid &id)
{
    if (const auto state = d->stateForTransaction(id)) {
        if (state->transaction.isTerminal()) {
            return false;
        }
        d->cancelTransaction(state);
        return true;
    }
    if (const auto state = d->stateForJob(id)) {
        qCDebug(KTRANSACT_CORE) << "cancelling job" << id;
        const bool wasPrompted = !state->heldConflicts.isEmpty() && state->heldConflicts.constFirst().jobId == id;
        d->cancelJob(state, id);
        if (wasPrompted) {
            d->promptNextConflict(state);
        }
        return true;
    }
    return false;
}

QUuid TransactionManager::execute(const FileOperation &operation, const QString &description)
{
    const QUuid id = startTransaction(description.isEmpty() ? FileOperation::typeName(operation.type()) : description);
    if (addOperation(id, operation).isNull()) {
        d->m_transactions.remove(id);
        d->m_openOrder.removeOne(id);
        return QUuid();
    }
    commit(id);
    return id;
}

QUuid TransactionManager::transfer(const QStringList &sources, const QString &destDir, TransferMode mode)
{
    const QString dir = Utils::absoluteCleanPath(destDir);
    const QUuid id = startTransaction(FileOperation::typeName(mode == MoveMode ? FileOperation::Move : FileOperation::Copy));
    for (const QString &source : sources) {
        const QString src = Utils::absoluteCleanPath(source);
        const QString dest = concatPaths(dir, Utils::fileName(src));
        if (mode == MoveMode) {
            if (dest == src) {
                qCDebug(KTRANSACT_CORE) << "not moving" << src << "onto itself";
                continue;
            }
            addOperation(id, FileOperation::move(src, dest));
        } else if (dest == src) {
            addOperation(id, FileOperation::copy(src, dest, FileOperation::AutoRename));
        } else {
            addOperation(id, FileOperation::copy(src, dest));
        }
    }
    commit(id);
    return id;
}

Transaction TransactionManager::transaction(const QUuid &id) const
{
    const auto state = d->stateForTransaction(id);
    return state ? state->transaction : Transaction();
}

bool TransactionManager::isActive(const QUuid &id) const
{
    if (const auto state = d->stateForTransaction(id)) {
        return !state->transaction.isTerminal();
    }
    return d->m_jobToTransaction.contains(id);
}

QList<QUuid> TransactionManager::activeTransactions() const
{
    QList<QUuid> ids;
    for (auto it = d->m_transactions.cbegin(); it != d->m_transactions.cend(); ++it) {
        if (!it.value()->transaction.isTerminal()) {
            ids.append(it.key());
        }
    }
    return ids;
}

TrashItemList TransactionManager::trashContents() const
{
    TrashItemList items;
    const AdapterResult result = d->m_adapter->listTrash(items);
    if (!result.success()) {
        qCWarning(KTRANSACT_CORE) << "cannot list the trash:" << buildErrorString(result.error(), result.errorText());
        return TrashItemList();
    }
    return items;
}

#include "moc_transactionmanager.cpp"
