/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KTRANSACT_NAMESUGGESTION_H
#define KTRANSACT_NAMESUGGESTION_H

#include "fileoperation.h"
#include "ktransactcore_export.h"

#include <QString>

#include <functional>
#include <utility>

namespace KTransact
{
/*!
 * How a free name is derived from a colliding one.
 *
 * \value CopyNaming "name (Copy).ext", "name (Copy 2).ext", ... used when duplicating
 * \value NumberedNaming "name (2).ext", "name (3).ext", ... used for renames and new items
 */
enum NamingStyle {
    CopyNaming,
    NumberedNaming,
};

/*!
 * Default number of candidates probed before giving up.
 */
constexpr int DefaultNameProbeLimit = 10000;

/*!
 * Splits \a fileName into the part that receives the suffix and the extension,
 * including its dot. Compound archive extensions such as ".tar.gz" stay whole,
 * and dot files such as ".bashrc" have no extension.
 *
 * \code
 * splitExtension("a.tar.gz") == {"a", ".tar.gz"}
 * splitExtension(".bashrc") == {".bashrc", ""}
 * \endcode
 */
KTRANSACTCORE_EXPORT std::pair<QString, QString> splitExtension(const QString &fileName);

/*!
 * Returns candidate number \a attempt (starting at 1) for \a fileName in \a style.
 * Attempt 0 returns \a fileName unchanged.
 */
KTRANSACTCORE_EXPORT QString suggestName(const QString &fileName, int attempt, NamingStyle style);

/*!
 * Probes candidates for \a path, in the folder of \a path, until \a exists
 * returns false for one of them, and returns its full path.
 *
 * \a path itself is not considered; the first probed name is candidate 1.
 * Returns an empty string when \a maxAttempts candidates were all taken.
 * The result only depends on the answers of \a exists, so repeated calls
 * against an unchanged folder return the same name.
 */
KTRANSACTCORE_EXPORT QString
findFreeName(const QString &path, NamingStyle style, const std::function<bool(const QString &)> &exists, int maxAttempts = DefaultNameProbeLimit);

/*!
 * Copies get "(Copy)" names, every other kind of operation numbered ones.
 */
KTRANSACTCORE_EXPORT NamingStyle namingStyleFor(FileOperation::Type type);
}

#endif
