/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "transactionsettings.h"
#include "ktransactcoredebug.h"

#include <KConfigGroup>

using namespace KTransact;

static const char s_groupName[] = "Transactions";

TransactionSettings::TransactionSettings() = default;

TransactionSettings TransactionSettings::load(KSharedConfig::Ptr config)
{
    if (!config) {
        config = KSharedConfig::openConfig(QStringLiteral("ktransactrc"), KConfig::NoGlobals);
    }

    TransactionSettings settings;
    const KConfigGroup group = config->group(QLatin1String(s_groupName));
    auto readPositive = [&group](const char *key, int defaultValue) {
        const int value = group.readEntry(key, defaultValue);
        if (value <= 0) {
            qCWarning(KTRANSACT_CORE) << "Ignoring invalid value" << value << "for" << key;
            return defaultValue;
        }
        return value;
    };
    settings.maxWorkerThreads = readPositive("MaxWorkerThreads", settings.maxWorkerThreads);
    settings.undoLimit = readPositive("UndoLimit", settings.undoLimit);
    settings.progressInterval = readPositive("ProgressInterval", settings.progressInterval);
    settings.nameProbeLimit = readPositive("NameProbeLimit", settings.nameProbeLimit);
    settings.validateResults = group.readEntry("ValidateResults", settings.validateResults);
    return settings;
}

void TransactionSettings::save(KSharedConfig::Ptr config) const
{
    KConfigGroup group = config->group(QLatin1String(s_groupName));
    group.writeEntry("MaxWorkerThreads", maxWorkerThreads);
    group.writeEntry("UndoLimit", undoLimit);
    group.writeEntry("ProgressInterval", progressInterval);
    group.writeEntry("NameProbeLimit", nameProbeLimit);
    group.writeEntry("ValidateResults", validateResults);
    group.sync();
}
