/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_TRASHITEM_H
#define KTRANSACT_TRASHITEM_H

#include "global.h"

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

namespace KTransact
{
/*!
 * \class KTransact::TrashItem
 *
 * \brief One entry of the trash, as described by its .trashinfo file.
 *
 * The structure of the trash directory follows the freedesktop.org standard:
 * each trashed item lives in Trash/files/<fileId> and is described by
 * Trash/info/<fileId>.trashinfo.
 */
struct TrashItem {
    QString fileId; // name of the entry under files/
    QString displayName; // file name of the original path
    QString originalPath; // from info file
    QString physicalPath; // for stat'ing etc.
    QDateTime deletionDate; // from info file
    filesize_t size = 0;
    bool isDir = false;

    bool isValid() const
    {
        return !fileId.isEmpty() && !originalPath.isEmpty();
    }
};

typedef QList<TrashItem> TrashItemList;
}

Q_DECLARE_METATYPE(KTransact::TrashItem)

#endif
