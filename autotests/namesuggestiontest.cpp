/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "namesuggestion.h"

#include <QSet>
#include <QTest>

using namespace KTransact;

class NameSuggestionTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        // Untranslated "(Copy)"
        QLocale::setDefault(QLocale::c());
        qputenv("LANGUAGE", "en_US");
    }

    void testSplitExtension_data()
    {
        QTest::addColumn<QString>("fileName");
        QTest::addColumn<QString>("base");
        QTest::addColumn<QString>("extension");

        QTest::newRow("plain") << "report.txt" << "report" << ".txt";
        QTest::newRow("no_extension") << "Makefile" << "Makefile" << "";
        QTest::newRow("dotfile") << ".bashrc" << ".bashrc" << "";
        QTest::newRow("dotfile_with_extension") << ".config.bak" << ".config" << ".bak";
        QTest::newRow("tar_gz") << "archive.tar.gz" << "archive" << ".tar.gz";
        QTest::newRow("tar_xz") << "archive.tar.xz" << "archive" << ".tar.xz";
        QTest::newRow("only_tar_gz") << ".tar.gz" << ".tar" << ".gz";
        QTest::newRow("two_dots") << "photo.2024.jpg" << "photo.2024" << ".jpg";
        QTest::newRow("trailing_dot") << "name." << "name" << ".";
    }

    void testSplitExtension()
    {
        QFETCH(QString, fileName);
        QFETCH(QString, base);
        QFETCH(QString, extension);

        const auto [actualBase, actualExtension] = splitExtension(fileName);
        QCOMPARE(actualBase, base);
        QCOMPARE(actualExtension, extension);
    }

    void testSuggestName_data()
    {
        QTest::addColumn<QString>("fileName");
        QTest::addColumn<int>("attempt");
        QTest::addColumn<int>("style");
        QTest::addColumn<QString>("expected");

        QTest::newRow("attempt_0") << "b.txt" << 0 << int(NumberedNaming) << "b.txt";
        QTest::newRow("numbered_1") << "b.txt" << 1 << int(NumberedNaming) << "b (2).txt";
        QTest::newRow("numbered_2") << "b.txt" << 2 << int(NumberedNaming) << "b (3).txt";
        QTest::newRow("numbered_dir") << "folder" << 1 << int(NumberedNaming) << "folder (2)";
        QTest::newRow("copy_1") << "b.txt" << 1 << int(CopyNaming) << "b (Copy).txt";
        QTest::newRow("copy_2") << "b.txt" << 2 << int(CopyNaming) << "b (Copy 2).txt";
        QTest::newRow("copy_big") << "b.txt" << 1234 << int(CopyNaming) << "b (Copy 1234).txt";
        QTest::newRow("copy_tar") << "data.tar.bz2" << 1 << int(CopyNaming) << "data (Copy).tar.bz2";
        QTest::newRow("copy_dotfile") << ".profile" << 1 << int(CopyNaming) << ".profile (Copy)";
    }

    void testSuggestName()
    {
        QFETCH(QString, fileName);
        QFETCH(int, attempt);
        QFETCH(int, style);
        QFETCH(QString, expected);

        QCOMPARE(suggestName(fileName, attempt, NamingStyle(style)), expected);
    }

    void testFindFreeNameAvoidsTakenNames()
    {
        const QSet<QString> taken = {
            QStringLiteral("/d/b.txt"),
            QStringLiteral("/d/b (2).txt"),
            QStringLiteral("/d/b (3).txt"),
            QStringLiteral("/d/b (5).txt"),
        };
        auto exists = [&taken](const QString &path) {
            return taken.contains(path);
        };

        const QString first = findFreeName(QStringLiteral("/d/b.txt"), NumberedNaming, exists);
        QCOMPARE(first, QStringLiteral("/d/b (4).txt"));
        QVERIFY(!taken.contains(first));

        // Deterministic as long as the folder does not change
        for (int i = 0; i < 5; ++i) {
            QCOMPARE(findFreeName(QStringLiteral("/d/b.txt"), NumberedNaming, exists), first);
        }
    }

    void testFindFreeNameNeverReturnsTakenName()
    {
        // Grow the set with each answer: every answer must be new
        QSet<QString> taken = {QStringLiteral("/x/file.tar.gz")};
        auto exists = [&taken](const QString &path) {
            return taken.contains(path);
        };
        for (int i = 0; i < 50; ++i) {
            const QString name = findFreeName(QStringLiteral("/x/file.tar.gz"), CopyNaming, exists);
            QVERIFY(!name.isEmpty());
            QVERIFY2(!taken.contains(name), qPrintable(name));
            QVERIFY(name.endsWith(QLatin1String(".tar.gz")));
            taken.insert(name);
        }
    }

    void testFindFreeNameExhausted()
    {
        auto everythingExists = [](const QString &) {
            return true;
        };
        QVERIFY(findFreeName(QStringLiteral("/d/a"), NumberedNaming, everythingExists, 10).isEmpty());
    }

    void testFindFreeNameRootFolder()
    {
        auto exists = [](const QString &path) {
            return path == QLatin1String("/a (2)");
        };
        QCOMPARE(findFreeName(QStringLiteral("/a"), NumberedNaming, exists), QStringLiteral("/a (3)"));
    }

    void testNamingStyleFor()
    {
        QCOMPARE(int(namingStyleFor(FileOperation::Copy)), int(CopyNaming));
        QCOMPARE(int(namingStyleFor(FileOperation::Rename)), int(NumberedNaming));
        QCOMPARE(int(namingStyleFor(FileOperation::Move)), int(NumberedNaming));
        QCOMPARE(int(namingStyleFor(FileOperation::CreateFolder)), int(NumberedNaming));
    }
};

QTEST_GUILESS_MAIN(NameSuggestionTest)

#include "namesuggestiontest.moc"
