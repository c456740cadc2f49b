/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2000 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only
*/

#include "global.h"

#include <KFormat>
#include <KLocalizedString>
#include <KStringHandler>

#include <cerrno>

static const int s_maxFilePathLength = 80;

KTRANSACTCORE_EXPORT QString KTransact::buildErrorString(int errorCode, const QString &errorText)
{
    QString result;

    switch (errorCode) {
    case KTransact::ERR_CANNOT_OPEN_FOR_READING:
        result = i18n("Could not read %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_OPEN_FOR_WRITING:
        result = i18n("Could not write to %1.", KStringHandler::csqueeze(errorText, s_maxFilePathLength));
        break;
    case KTransact::ERR_INTERNAL:
        result = i18n("Internal Error\n%1", errorText);
        break;
    case KTransact::ERR_UNSUPPORTED_ACTION:
        result = errorText;
        break;
    case KTransact::ERR_IS_DIRECTORY:
        result = i18n("%1 is a folder, but a file was expected.", errorText);
        break;
    case KTransact::ERR_IS_FILE:
        result = i18n("%1 is a file, but a folder was expected.", errorText);
        break;
    case KTransact::ERR_DOES_NOT_EXIST:
        result = i18n("The file or folder %1 does not exist.", errorText);
        break;
    case KTransact::ERR_FILE_ALREADY_EXIST:
        result = i18n("A file named %1 already exists.", errorText);
        break;
    case KTransact::ERR_DIR_ALREADY_EXIST:
        result = i18n("A folder named %1 already exists.", errorText);
        break;
    case KTransact::ERR_ACCESS_DENIED:
        result = i18n("Access denied to %1.", errorText);
        break;
    case KTransact::ERR_WRITE_ACCESS_DENIED:
        result = i18n("Access denied.\nCould not write to %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_ENTER_DIRECTORY:
        result = i18n("Could not enter folder %1.", errorText);
        break;
    case KTransact::ERR_USER_CANCELED:
        // Do nothing in this case. The user doesn't need to be told what he just did.
        break;
    case KTransact::ERR_CANNOT_READ:
        result = i18n("Could not read file %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_WRITE:
        result = i18n("Could not write to file %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_STAT:
        result = i18n("Could not access %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_MKDIR:
        result = i18n("Could not make folder %1.", KStringHandler::csqueeze(errorText, s_maxFilePathLength));
        break;
    case KTransact::ERR_CANNOT_RMDIR:
        result = i18n("Could not remove folder %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_RENAME:
        result = i18n("Could not rename file %1.", KStringHandler::csqueeze(errorText, s_maxFilePathLength));
        break;
    case KTransact::ERR_CANNOT_DELETE:
        result = i18n("Could not delete file %1.", errorText);
        break;
    case KTransact::ERR_CANNOT_DELETE_ORIGINAL:
        result = i18n("Could not delete original file %1.\nPlease check permissions.", errorText);
        break;
    case KTransact::ERR_CANNOT_DELETE_PARTIAL:
        result = i18n("Could not delete partial file %1.\nPlease check permissions.", errorText);
        break;
    case KTransact::ERR_CANNOT_RENAME_PARTIAL:
        result = i18n("Could not rename partial file %1.\nPlease check permissions.", errorText);
        break;
    case KTransact::ERR_CANNOT_SYMLINK:
        result = i18n("Could not create symlink %1.\nPlease check permissions.", errorText);
        break;
    case KTransact::ERR_DISK_FULL:
        result = i18n("There is not enough space on the disk to write %1.", errorText);
        break;
    case KTransact::ERR_IDENTICAL_FILES:
        result = i18n("The source and destination are the same file.\n%1", errorText);
        break;
    case KTransact::ERR_CANNOT_MOVE_INTO_ITSELF:
        result = i18n("A folder cannot be moved into itself");
        break;
    case KTransact::ERR_CROSS_DEVICE:
        result = i18n("Could not move %1 directly, it is on a different file system.", errorText);
        break;
    case KTransact::ERR_WOULD_MERGE:
        result = i18n("Moving %1 would merge it with an existing folder.", errorText);
        break;
    case KTransact::ERR_NAME_COLLISION_EXHAUSTED:
        result = i18n("Could not find a free name for %1.", KStringHandler::csqueeze(errorText, s_maxFilePathLength));
        break;
    case KTransact::ERR_CANNOT_TRASH:
        result = i18n("Could not move %1 to the trash.", errorText);
        break;
    case KTransact::ERR_CANNOT_RESTORE:
        result = i18n("Could not restore %1 from the trash.", errorText);
        break;
    default:
        result = i18n("Unknown error code %1\n%2\nPlease send a full bug report at https://bugs.kde.org.", errorCode, errorText);
        break;
    }

    return result;
}

KTRANSACTCORE_EXPORT int KTransact::errorFromErrno(int errnoValue, int fallback)
{
    switch (errnoValue) {
    case ENOENT:
    case ENOTDIR:
        return KTransact::ERR_DOES_NOT_EXIST;
    case EACCES:
    case EPERM:
        return KTransact::ERR_ACCESS_DENIED;
    case EROFS:
        return KTransact::ERR_WRITE_ACCESS_DENIED;
    case EXDEV:
        return KTransact::ERR_CROSS_DEVICE;
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
        return KTransact::ERR_DISK_FULL;
    case EEXIST:
        return KTransact::ERR_FILE_ALREADY_EXIST;
    case EISDIR:
        return KTransact::ERR_IS_DIRECTORY;
    default:
        return fallback;
    }
}

KTRANSACTCORE_EXPORT QString KTransact::convertSize(KTransact::filesize_t fileSize)
{
    return KFormat().formatByteSize(fileSize, 1, KFormat::IECBinaryDialect);
}

KTRANSACTCORE_EXPORT QString KTransact::itemsSummaryString(int items)
{
    return i18np("%1 Item", "%1 Items", items);
}
