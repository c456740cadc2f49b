/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000 Stephan Kulow <coolo@kde.org>
    SPDX-FileCopyrightText: 2000 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_CONFLICT_H
#define KTRANSACT_CONFLICT_H

#include "fileoperation.h"
#include "ktransactcore_export.h"

#include <QFlags>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace KTransact
{
/*!
 * The answers to a conflict.
 *
 * \value Skip Do not run this job; it is marked Cancelled and the transaction continues
 * \value Overwrite Run the job with overwrite semantics
 * \value Rename Run the job with another destination name
 * \value CancelAll Cancel this job and everything not yet finished in the transaction
 */
enum ConflictAction {
    Skip = 1,
    Overwrite = 2,
    Rename = 4,
    CancelAll = 8,
};
Q_DECLARE_FLAGS(ConflictActions, ConflictAction)
Q_DECLARE_OPERATORS_FOR_FLAGS(ConflictActions)

/*!
 * \class KTransact::ConflictRecord
 *
 * \brief A job that is held because its destination already exists.
 */
struct ConflictRecord {
    QUuid jobId;
    QUuid transactionId;
    FileOperation::Type type = FileOperation::Copy;
    QString source;
    QString destination;
    bool destinationIsDir = false;
    /// what the user may choose from
    ConflictActions options = ConflictActions(Skip | Overwrite | Rename | CancelAll);
    /// the name Rename would pick if no name is given
    QString suggestedName;
};

/*!
 * \class KTransact::ConflictResolution
 *
 * \brief The answer to a ConflictRecord.
 */
struct ConflictResolution {
    ConflictAction action = Skip;
    /// For Rename: the new file name; generated when empty
    QString newName;
    /// Resolve every later conflict of the same transaction the same way
    bool applyToAll = false;
};
}

Q_DECLARE_METATYPE(KTransact::ConflictAction)
Q_DECLARE_METATYPE(KTransact::ConflictRecord)
Q_DECLARE_METATYPE(KTransact::ConflictResolution)

#endif
