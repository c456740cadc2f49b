/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2020 Ahmad Samir <a.samirh78@gmail.com>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only OR LGPL-3.0-only OR LicenseRef-KDE-Accepted-LGPL
*/

#ifndef KTRANSACT_CONFLICTRESOLVERINTERFACE_H
#define KTRANSACT_CONFLICTRESOLVERINTERFACE_H

#include "conflict.h"
#include "ktransactcore_export.h"

namespace KTransact
{
/*!
 * \class KTransact::ConflictResolverInterface
 *
 * \brief The interface an application implements to answer destination conflicts synchronously.
 *
 * When an implementation is installed with TransactionManager::setConflictResolver(),
 * askUserConflict() is called on the coordinating thread each time a job would
 * write to an existing destination, unless an earlier answer in the same
 * transaction had applyToAll set. A dialog shown from here blocks the caller,
 * never a worker thread.
 *
 * Without an installed resolver, TransactionManager::conflictDetected() is
 * emitted instead and the job waits for TransactionManager::resolveConflict().
 */
class KTRANSACTCORE_EXPORT ConflictResolverInterface
{
public:
    ConflictResolverInterface();
    virtual ~ConflictResolverInterface();

    /*!
     * Returns how to proceed with the job described by \a conflict.
     * The returned action must be one of conflict.options.
     */
    virtual ConflictResolution askUserConflict(const ConflictRecord &conflict) = 0;

private:
    Q_DISABLE_COPY(ConflictResolverInterface)
};
}

#endif
