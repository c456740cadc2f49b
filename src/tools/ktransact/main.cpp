/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2004 David Faure <faure@kde.org>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "conflictresolverinterface.h"
#include "transactionmanager.h"

#include <KLocalizedString>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLocale>
#include <QTextStream>

#include <algorithm>
#include <cstdio>
#include <memory>

using namespace KTransact;

namespace
{
// Asks on the terminal, or skips when stdin is not interactive
class ConsoleConflictResolver : public ConflictResolverInterface
{
public:
    explicit ConsoleConflictResolver(ConflictAction fixedAction, bool interactive)
        : m_fixedAction(fixedAction)
        , m_interactive(interactive)
    {
    }

    ConflictResolution askUserConflict(const ConflictRecord &conflict) override
    {
        ConflictResolution resolution;
        if (!m_interactive) {
            resolution.action = conflict.options.testFlag(m_fixedAction) ? m_fixedAction : Skip;
            return resolution;
        }

        QTextStream out(stdout);
        QTextStream in(stdin);
        for (;;) {
            out << i18n("%1 already exists.", conflict.destination) << '\n';
            QString choices = i18n("[s]kip, [r]ename to \"%1\", [c]ancel all", conflict.suggestedName);
            if (conflict.options.testFlag(Overwrite)) {
                choices += i18n(", [o]verwrite");
            }
            out << choices << i18n(" (uppercase: apply to all)? ") << Qt::flush;

            const QString answer = in.readLine().trimmed();
            if (answer.isEmpty()) {
                if (in.atEnd()) {
                    resolution.action = CancelAll;
                    return resolution;
                }
                continue;
            }
            const QChar key = answer.at(0);
            resolution.applyToAll = key.isUpper();
            switch (key.toLower().toLatin1()) {
            case 's':
                resolution.action = Skip;
                return resolution;
            case 'r':
                resolution.action = Rename;
                return resolution;
            case 'c':
                resolution.action = CancelAll;
                return resolution;
            case 'o':
                if (conflict.options.testFlag(Overwrite)) {
                    resolution.action = Overwrite;
                    return resolution;
                }
                break;
            default:
                break;
            }
        }
    }

private:
    const ConflictAction m_fixedAction;
    const bool m_interactive;
};

QString typeOfItem(const TrashItem &item)
{
    return item.isDir ? i18nc("type of a trash entry", "folder") : i18nc("type of a trash entry", "file");
}

int listTrash(TransactionManager &manager)
{
    QTextStream out(stdout);
    const TrashItemList items = manager.trashContents();
    for (const TrashItem &item : items) {
        out << item.fileId << '\t' << typeOfItem(item) << '\t' << convertSize(item.size) << '\t'
            << QLocale().toString(item.deletionDate, QLocale::ShortFormat) << '\t' << item.originalPath << '\n';
    }
    out << itemsSummaryString(items.size()) << '\n';
    return 0;
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ktransact"));
    app.setApplicationVersion(QStringLiteral(PROJECT_VERSION));
    app.setOrganizationDomain(QStringLiteral("kde.org"));

    QCommandLineParser parser;
    parser.addVersionOption();
    parser.addHelpOption();
    parser.setApplicationDescription(i18n("Runs a file operation through the transaction engine"));

    parser.addPositionalArgument(QStringLiteral("command"),
                                 i18n("One of: copy, move, trash, restore, rename, mkdir, touch, symlink, empty, list"));
    parser.addPositionalArgument(QStringLiteral("arguments"), i18n("Arguments of the command"), QStringLiteral("[arguments...]"));

    const QCommandLineOption overwriteOption(QStringList{QStringLiteral("o"), QStringLiteral("overwrite")}, i18n("Overwrite existing destinations"));
    const QCommandLineOption autoRenameOption(QStringList{QStringLiteral("r"), QStringLiteral("auto-rename")},
                                              i18n("Pick a free name when a destination exists"));
    const QCommandLineOption skipOption(QStringList{QStringLiteral("s"), QStringLiteral("skip")}, i18n("Skip existing destinations without asking"));
    parser.addOption(overwriteOption);
    parser.addOption(autoRenameOption);
    parser.addOption(skipOption);

    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.takeFirst();

    FileOperation::Flags flags = FileOperation::DefaultFlags;
    if (parser.isSet(overwriteOption)) {
        flags |= FileOperation::Overwrite;
    }
    if (parser.isSet(autoRenameOption)) {
        flags |= FileOperation::AutoRename;
    }

    TransactionManager manager;
    const bool interactive = !parser.isSet(skipOption);
    manager.setConflictResolver(std::make_unique<ConsoleConflictResolver>(Skip, interactive));

    auto requireArgs = [&](int min, int max) {
        if (args.size() < min || (max >= 0 && args.size() > max)) {
            qCritical().noquote() << i18n("Wrong number of arguments for %1", command);
            parser.showHelp(1);
        }
    };

    QUuid transactionId;
    if (command == QLatin1String("list")) {
        requireArgs(0, 0);
        return listTrash(manager);
    } else if (command == QLatin1String("copy") || command == QLatin1String("move")) {
        requireArgs(2, -1);
        const QString destDir = args.takeLast();
        const bool isMove = command == QLatin1String("move");
        if (flags == FileOperation::DefaultFlags) {
            transactionId = manager.transfer(args, destDir, isMove ? TransactionManager::MoveMode : TransactionManager::CopyMode);
        } else {
            transactionId = manager.startTransaction(FileOperation::typeName(isMove ? FileOperation::Move : FileOperation::Copy));
            for (const QString &src : std::as_const(args)) {
                const QString dest = destDir + QLatin1Char('/') + src.section(QLatin1Char('/'), -1, -1, QString::SectionSkipEmpty);
                manager.addOperation(transactionId, isMove ? FileOperation::move(src, dest, flags) : FileOperation::copy(src, dest, flags));
            }
            manager.commit(transactionId);
        }
    } else if (command == QLatin1String("trash")) {
        requireArgs(1, -1);
        transactionId = manager.startTransaction(FileOperation::typeName(FileOperation::Trash));
        for (const QString &path : std::as_const(args)) {
            manager.addOperation(transactionId, FileOperation::trash(path));
        }
        manager.commit(transactionId);
    } else if (command == QLatin1String("restore")) {
        requireArgs(1, 2);
        const TrashItemList items = manager.trashContents();
        auto it = std::find_if(items.cbegin(), items.cend(), [&args](const TrashItem &item) {
            return item.fileId == args.at(0) || item.originalPath == args.at(0);
        });
        if (it == items.cend()) {
            qCritical().noquote() << i18n("%1 is not in the trash", args.at(0));
            return 1;
        }
        transactionId = manager.execute(FileOperation::restore(*it, args.value(1), flags));
    } else if (command == QLatin1String("rename")) {
        requireArgs(2, 2);
        transactionId = manager.execute(FileOperation::rename(args.at(0), args.at(1), flags));
    } else if (command == QLatin1String("mkdir")) {
        requireArgs(1, 1);
        transactionId = manager.execute(FileOperation::createFolder(args.at(0), flags));
    } else if (command == QLatin1String("touch")) {
        requireArgs(1, 1);
        transactionId = manager.execute(FileOperation::createFile(args.at(0), flags));
    } else if (command == QLatin1String("symlink")) {
        requireArgs(2, 2);
        transactionId = manager.execute(FileOperation::createSymlink(args.at(0), args.at(1), flags));
    } else if (command == QLatin1String("empty")) {
        requireArgs(0, 0);
        transactionId = manager.execute(FileOperation::emptyTrash());
    } else {
        qCritical().noquote() << i18n("Unknown command %1", command);
        parser.showHelp(1);
    }

    if (transactionId.isNull()) {
        qCritical().noquote() << i18n("Invalid arguments for %1", command);
        return 1;
    }

    int exitCode = 0;
    QObject::connect(&manager,
                     &TransactionManager::jobFailed,
                     &app,
                     [&exitCode](const QUuid &, FileOperation::Type, const QString &, int error, const QString &errorText) {
                         qCritical().noquote() << buildErrorString(error, errorText);
                         exitCode = 1;
                     });
    QObject::connect(&manager, &TransactionManager::jobCompleted, &app, [](const QUuid &, FileOperation::Type, const QString &path, const JobResult &result) {
        QTextStream out(stdout);
        out << path << '\n';
        const QList<SkippedItem> skipped = result.skippedItems();
        for (const SkippedItem &item : skipped) {
            out << i18n("  skipped %1: %2", item.path, buildErrorString(item.error, item.errorText)) << '\n';
        }
    });
    QObject::connect(&manager, &TransactionManager::transactionFinished, &app, [&app, &exitCode, transactionId](const Transaction &transaction) {
        if (transaction.id() != transactionId) {
            return;
        }
        if (transaction.status() != Transaction::Completed || transaction.isPartial()) {
            exitCode = qMax(exitCode, 1);
        }
        app.exit(exitCode);
    });

    return app.exec();
}
