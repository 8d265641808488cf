/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <launcher.h>

#include <QDir>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

using KRecentFolders::Launcher;

class LauncherTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void testResolvePath_data()
    {
        QTest::addColumn<QString>("path");
        QTest::addColumn<QString>("expected");

        const QString home = QDir::homePath();
        QTest::newRow("tilde") << QStringLiteral("~") << home;
        QTest::newRow("tilde_slash") << QStringLiteral("~/") << QString(home + QLatin1Char('/'));
        QTest::newRow("tilde_subfolder") << QStringLiteral("~/Documents/My Folder/") << QString(home + QLatin1String("/Documents/My Folder/"));
        QTest::newRow("absolute") << QStringLiteral("/srv/music/") << QStringLiteral("/srv/music/");
        QTest::newRow("tilde_inside") << QStringLiteral("/srv/~backup/") << QStringLiteral("/srv/~backup/");
        QTest::newRow("empty") << QString() << QString();
    }

    void testResolvePath()
    {
        QFETCH(QString, path);
        QFETCH(QString, expected);

        QCOMPARE(Launcher::resolvePath(path), expected);
    }

    void testDefaultOpener()
    {
        const Launcher launcher;
        QCOMPARE(launcher.openerProgram(), QStringLiteral("xdg-open"));
    }

    void testOpen()
    {
        const QString truePath = QStandardPaths::findExecutable(QStringLiteral("true"));
        if (truePath.isEmpty()) {
            QSKIP("This test needs the true program");
        }

        Launcher launcher(truePath);
        QVERIFY(launcher.open(QStringLiteral("~/")));
    }

    void testOpenMissingProgram()
    {
        QTemporaryDir tempDir;
        QVERIFY(tempDir.isValid());

        Launcher launcher(tempDir.filePath(QStringLiteral("no-opener-here")));
        QVERIFY(!launcher.open(QStringLiteral("/srv/music/")));
    }
};

QTEST_GUILESS_MAIN(LauncherTest)

#include "launchertest.moc"
