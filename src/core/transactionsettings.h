/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRANSACTIONSETTINGS_H
#define KTRANSACT_TRANSACTIONSETTINGS_H

#include "ktransactcore_export.h"

#include <KSharedConfig>

namespace KTransact
{
/*!
 * \class KTransact::TransactionSettings
 *
 * \brief Tunables of the transaction engine.
 *
 * Read from the [Transactions] group of ktransactrc:
 * \code
 * [Transactions]
 * MaxWorkerThreads=8
 * UndoLimit=50
 * ProgressInterval=100
 * NameProbeLimit=10000
 * ValidateResults=true
 * \endcode
 */
class KTRANSACTCORE_EXPORT TransactionSettings
{
public:
    TransactionSettings();

    /*!
     * Reads the settings from \a config, or from ktransactrc when null.
     * Missing or out of range entries fall back to the defaults.
     */
    static TransactionSettings load(KSharedConfig::Ptr config = KSharedConfig::Ptr());

    /*!
     * Writes the settings back to \a config.
     */
    void save(KSharedConfig::Ptr config) const;

    /// upper bound of the worker pool, the pool never exceeds the ideal thread count
    int maxWorkerThreads = 8;
    /// entries kept on each of the undo and redo stacks
    int undoLimit = 50;
    /// minimum interval between two progress reports of a job, in milliseconds
    int progressInterval = 100;
    /// candidates probed when looking for a free name
    int nameProbeLimit = 10000;
    /// check the post-condition of every completed job
    bool validateResults = true;
};
}

#endif
