/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000-2005 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only
*/
#ifndef KTRANSACT_GLOBAL_H
#define KTRANSACT_GLOBAL_H

#include "ktransactcore_export.h"

#include <QString>

#include <KJob>

#include <atomic>
#include <memory>

/*!
 * \namespace KTransact
 *
 * \brief A namespace for the transaction engine globals.
 */
namespace KTransact
{
/// 64-bit file size
typedef qulonglong filesize_t;

/*!
 * Shared between the coordinator, which sets it, and a worker, which polls it.
 */
typedef std::shared_ptr<std::atomic_bool> CancelToken;

/*!
 * Error codes reported by file operations, jobs and transactions.
 *
 * The values start after KJob::UserDefinedError so that they can travel
 * through anything that speaks KJob error codes.
 */
enum Error {
    ERR_CANNOT_OPEN_FOR_READING = KJob::UserDefinedError + 1,
    ERR_CANNOT_OPEN_FOR_WRITING = KJob::UserDefinedError + 2,
    ERR_INTERNAL = KJob::UserDefinedError + 4,
    ERR_UNSUPPORTED_ACTION = KJob::UserDefinedError + 8,
    ERR_IS_DIRECTORY = KJob::UserDefinedError + 9, ///< ... where a file was expected
    ERR_IS_FILE = KJob::UserDefinedError + 10, ///< ... where a directory was expected
    ERR_DOES_NOT_EXIST = KJob::UserDefinedError + 11,
    ERR_FILE_ALREADY_EXIST = KJob::UserDefinedError + 12,
    ERR_DIR_ALREADY_EXIST = KJob::UserDefinedError + 13,
    ERR_ACCESS_DENIED = KJob::UserDefinedError + 15,
    ERR_WRITE_ACCESS_DENIED = KJob::UserDefinedError + 16,
    ERR_CANNOT_ENTER_DIRECTORY = KJob::UserDefinedError + 17,
    ERR_USER_CANCELED = KJob::KilledJobError,
    ERR_CANNOT_READ = KJob::UserDefinedError + 28,
    ERR_CANNOT_WRITE = KJob::UserDefinedError + 29,
    ERR_CANNOT_STAT = KJob::UserDefinedError + 34,
    ERR_CANNOT_MKDIR = KJob::UserDefinedError + 37,
    ERR_CANNOT_RMDIR = KJob::UserDefinedError + 38,
    ERR_CANNOT_RENAME = KJob::UserDefinedError + 40,
    ERR_CANNOT_DELETE = KJob::UserDefinedError + 42,
    ERR_UNKNOWN = KJob::UserDefinedError + 51,
    ERR_CANNOT_DELETE_ORIGINAL = KJob::UserDefinedError + 54,
    ERR_CANNOT_DELETE_PARTIAL = KJob::UserDefinedError + 55,
    ERR_CANNOT_RENAME_PARTIAL = KJob::UserDefinedError + 57,
    ERR_CANNOT_SYMLINK = KJob::UserDefinedError + 59,
    ERR_DISK_FULL = KJob::UserDefinedError + 61,
    ERR_IDENTICAL_FILES = KJob::UserDefinedError + 62, ///< src==dest when moving/copying
    ERR_CANNOT_MOVE_INTO_ITSELF = KJob::UserDefinedError + 71,
    ERR_CROSS_DEVICE = KJob::UserDefinedError + 100, ///< rename(2) across file systems, handled by a copy+delete fallback
    ERR_WOULD_MERGE = KJob::UserDefinedError + 101, ///< directory moved over an existing directory, handled by merging
    ERR_NAME_COLLISION_EXHAUSTED = KJob::UserDefinedError + 102, ///< no free name found within the probe limit
    ERR_CANNOT_TRASH = KJob::UserDefinedError + 103,
    ERR_CANNOT_RESTORE = KJob::UserDefinedError + 104,
};

/*!
 * Returns a translated error message for \a errorCode using the
 * additional error information provided by \a errorText, which is
 * usually the path the error relates to.
 */
KTRANSACTCORE_EXPORT QString buildErrorString(int errorCode, const QString &errorText);

/*!
 * Maps a POSIX errno value, as set by a failed call on \a path, to an Error.
 * \a fallback is returned for errno values without a more specific code.
 */
KTRANSACTCORE_EXPORT int errorFromErrno(int errnoValue, int fallback);

/*!
 * Converts \a size from bytes to a human readable string, e.g. 123.4 KiB.
 */
KTRANSACTCORE_EXPORT QString convertSize(filesize_t size);

/*!
 * Returns a translated summary such as "3 items" used in transaction descriptions.
 */
KTRANSACTCORE_EXPORT QString itemsSummaryString(int items);
}

#endif
