/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2022 Harald Sitter <sitter@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only OR LGPL-3.0-only OR LicenseRef-KDE-Accepted-LGPL
*/

#include "filesystemadapter_p.h"

namespace KTransact
{
class AdapterResultPrivate
{
public:
    bool success;
    int error;
    QString errorText;
    QString path;
};

AdapterResult::~AdapterResult() = default;

AdapterResult::AdapterResult(const AdapterResult &rhs)
    : d(std::make_unique<AdapterResultPrivate>(*rhs.d))
{
}

AdapterResult &AdapterResult::operator=(const AdapterResult &rhs)
{
    if (this == &rhs) {
        return *this;
    }
    d = std::make_unique<AdapterResultPrivate>(*rhs.d);
    return *this;
}

AdapterResult::AdapterResult(AdapterResult &&) noexcept = default;
AdapterResult &AdapterResult::operator=(AdapterResult &&) noexcept = default;

bool AdapterResult::success() const
{
    return d->success;
}

int AdapterResult::error() const
{
    return d->error;
}

QString AdapterResult::errorText() const
{
    return d->errorText;
}

QString AdapterResult::path() const
{
    return d->path;
}

Q_REQUIRED_RESULT AdapterResult AdapterResult::fail(int _error, const QString &_errorText)
{
    return AdapterResult(std::make_unique<AdapterResultPrivate>(AdapterResultPrivate{false, _error, _errorText, QString()}));
}

Q_REQUIRED_RESULT AdapterResult AdapterResult::pass(const QString &_path)
{
    return AdapterResult(std::make_unique<AdapterResultPrivate>(AdapterResultPrivate{true, 0, QString(), _path}));
}

AdapterResult::AdapterResult(std::unique_ptr<AdapterResultPrivate> &&dptr)
    : d(std::move(dptr))
{
}

FileSystemAdapter::~FileSystemAdapter() = default;

bool FileSystemAdapter::exists(const QString &path) const
{
    FileStat info;
    const AdapterResult result = stat(path, info);
    return result.success() && info.exists();
}
}
