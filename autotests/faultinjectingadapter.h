/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef FAULTINJECTINGADAPTER_H
#define FAULTINJECTINGADAPTER_H

#include "localfilesystemadapter_p.h"

#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

#include <functional>

/*
 * A LocalFileSystemAdapter that fails chosen primitives on chosen paths,
 * records every call and can stop a worker inside copyFile().
 */
class FaultInjectingAdapter : public KTransact::LocalFileSystemAdapter
{
public:
    enum Primitive {
        CopyFile,
        Move,
        Rename,
        MakeDirectory,
        CreateFile,
        CreateSymlink,
        Remove,
        Trash,
        Restore,
    };

    // Make @p primitive fail with @p error whenever it is called for @p path
    void failOn(Primitive primitive, const QString &path, int error)
    {
        QMutexLocker locker(&m_mutex);
        m_failures.insert(key(primitive, path), error);
    }

    void clearFailures()
    {
        QMutexLocker locker(&m_mutex);
        m_failures.clear();
    }

    // Called in the worker thread before each copyFile(); set it before committing
    void setBeforeCopyHook(const std::function<void(const QString &)> &hook)
    {
        m_beforeCopy = hook;
    }

    // "primitive path" for every mutating call so far
    QStringList calls() const
    {
        QMutexLocker locker(&m_mutex);
        return m_calls;
    }

    void clearCalls()
    {
        QMutexLocker locker(&m_mutex);
        m_calls.clear();
    }

    KTransact::AdapterResult
    copyFile(const QString &src, const QString &dest, Flags flags, const ProgressCallback &progress, const KTransact::CancelToken &cancel) override
    {
        if (m_beforeCopy) {
            m_beforeCopy(src);
        }
        if (const int error = check(CopyFile, src, dest)) {
            return KTransact::AdapterResult::fail(error, src);
        }
        return LocalFileSystemAdapter::copyFile(src, dest, flags, progress, cancel);
    }

    KTransact::AdapterResult move(const QString &src, const QString &dest, Flags flags) override
    {
        if (const int error = check(Move, src, dest)) {
            return KTransact::AdapterResult::fail(error, src);
        }
        return LocalFileSystemAdapter::move(src, dest, flags);
    }

    KTransact::AdapterResult rename(const QString &path, const QString &newName, Flags flags) override
    {
        if (const int error = check(Rename, path, newName)) {
            return KTransact::AdapterResult::fail(error, path);
        }
        return LocalFileSystemAdapter::rename(path, newName, flags);
    }

    KTransact::AdapterResult makeDirectory(const QString &path) override
    {
        if (const int error = check(MakeDirectory, path)) {
            return KTransact::AdapterResult::fail(error, path);
        }
        return LocalFileSystemAdapter::makeDirectory(path);
    }

    KTransact::AdapterResult createFile(const QString &path, Flags flags) override
    {
        if (const int error = check(CreateFile, path)) {
            return KTransact::AdapterResult::fail(error, path);
        }
        return LocalFileSystemAdapter::createFile(path, flags);
    }

    KTransact::AdapterResult createSymlink(const QString &target, const QString &linkPath, Flags flags) override
    {
        if (const int error = check(CreateSymlink, linkPath)) {
            return KTransact::AdapterResult::fail(error, linkPath);
        }
        return LocalFileSystemAdapter::createSymlink(target, linkPath, flags);
    }

    KTransact::AdapterResult remove(const QString &path) override
    {
        if (const int error = check(Remove, path)) {
            return KTransact::AdapterResult::fail(error, path);
        }
        return LocalFileSystemAdapter::remove(path);
    }

    KTransact::AdapterResult trash(const QString &path, KTransact::TrashItem &item) override
    {
        if (const int error = check(Trash, path)) {
            return KTransact::AdapterResult::fail(error, path);
        }
        return LocalFileSystemAdapter::trash(path, item);
    }

    KTransact::AdapterResult restore(const KTransact::TrashItem &item, const QString &dest, Flags flags) override
    {
        const QString target = dest.isEmpty() ? item.originalPath : dest;
        if (const int error = check(Restore, target)) {
            return KTransact::AdapterResult::fail(error, target);
        }
        return LocalFileSystemAdapter::restore(item, dest, flags);
    }

private:
    static QString key(Primitive primitive, const QString &path)
    {
        return QString::number(primitive) + QLatin1Char(' ') + path;
    }

    int check(Primitive primitive, const QString &path, const QString &other = QString())
    {
        QMutexLocker locker(&m_mutex);
        m_calls.append(key(primitive, path) + (other.isEmpty() ? QString() : QLatin1Char(' ') + other));
        return m_failures.value(key(primitive, path), 0);
    }

    mutable QMutex m_mutex;
    QHash<QString, int> m_failures;
    QStringList m_calls;
    std::function<void(const QString &)> m_beforeCopy;
};

#endif
