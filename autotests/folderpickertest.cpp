/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "mockdialoginterface.h"

#include <folderextractor.h>
#include <folderpicker.h>
#include "krecentfolders_version.h"

#include <QDir>
#include <QStandardPaths>
#include <QTest>

using namespace KRecentFolders;

class FolderPickerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void testChoices_data()
    {
        QTest::addColumn<QStringList>("folders");

        QTest::newRow("empty") << QStringList();
        QTest::newRow("one") << QStringList{QStringLiteral("/home/user/docs/")};
        QTest::newRow("three") << QStringList{QStringLiteral("/srv/music/"), QStringLiteral("/home/user/My Folder/"), QStringLiteral("/tmp/a/")};
    }

    void testChoices()
    {
        QFETCH(QStringList, folders);

        const QStringList choices = FolderPicker::choices(folders);
        QCOMPARE(choices.size(), folders.size() + 2);
        QCOMPARE(choices.first(), FolderPicker::homeFolder());
        QCOMPARE(choices.last(), FolderPicker::clearMarker());
        QCOMPARE(choices.mid(1, folders.size()), folders);
    }

    void testHomeFolder()
    {
        const QString home = FolderPicker::homeFolder();
        QVERIFY(home.endsWith(QLatin1Char('/')));
        QCOMPARE(QDir(home).canonicalPath(), QDir(QDir::homePath()).canonicalPath());
    }

    void testClearMarker()
    {
        QVERIFY(FolderPicker::clearMarker().startsWith(QStringLiteral("⚠")));
        QVERIFY(!QDir::isAbsolutePath(FolderPicker::clearMarker()));
    }

    void testWindowTitle()
    {
        QVERIFY(FolderPicker::windowTitle().contains(QStringLiteral(KRECENTFOLDERS_VERSION_STRING)));
    }

    void testChooserSize_data()
    {
        QTest::addColumn<QSize>("screenSize");
        QTest::addColumn<int>("maxPathLength");
        QTest::addColumn<QSize>("expected");

        QTest::newRow("short_paths") << QSize(1920, 1080) << 50 << QSize(400, 864);
        QTest::newRow("long_paths") << QSize(1000, 800) << 200 << QSize(800, 640);
        QTest::newRow("exact_bound") << QSize(1000, 500) << 100 << QSize(800, 400);
        QTest::newRow("no_paths") << QSize(1920, 1080) << 0 << QSize(0, 864);
        QTest::newRow("no_screen") << QSize() << 40 << QSize(0, 0);
    }

    void testChooserSize()
    {
        QFETCH(QSize, screenSize);
        QFETCH(int, maxPathLength);
        QFETCH(QSize, expected);

        QCOMPARE(FolderPicker::chooserSize(screenSize, maxPathLength), expected);
    }

    void testPick_data()
    {
        QTest::addColumn<ProcessResult>("chooserResult");
        QTest::addColumn<int>("expectedAction");
        QTest::addColumn<QString>("expectedPath");

        QTest::newRow("folder") << processSuccess(QStringLiteral("/home/user/docs/")) << int(FolderPicker::Chosen) << QStringLiteral("/home/user/docs/");
        QTest::newRow("home") << processSuccess(FolderPicker::homeFolder()) << int(FolderPicker::Chosen) << FolderPicker::homeFolder();
        QTest::newRow("clear") << processSuccess(FolderPicker::clearMarker()) << int(FolderPicker::ClearRequested) << QString();
        QTest::newRow("nothing_selected") << processSuccess(QString()) << int(FolderPicker::Dismissed) << QString();
        QTest::newRow("closed") << processNonZeroExit(1) << int(FolderPicker::Dismissed) << QString();
        QTest::newRow("timeout") << processNonZeroExit(5) << int(FolderPicker::Dismissed) << QString();
        QTest::newRow("no_chooser") << processSpawnFailure() << int(FolderPicker::Failed) << QString();
    }

    void testPick()
    {
        QFETCH(ProcessResult, chooserResult);
        QFETCH(int, expectedAction);
        QFETCH(QString, expectedPath);

        MockDialogInterface dialogs;
        dialogs.m_chooserResults << chooserResult;
        FolderPicker picker(&dialogs, QSize(1920, 1080));

        FolderList folderList;
        folderList.folders = QStringList{QStringLiteral("/home/user/docs/"), QStringLiteral("/srv/music/")};
        folderList.maxPathLength = 30;

        const FolderPicker::Selection selection = picker.pick(folderList);
        QCOMPARE(int(selection.action), expectedAction);
        QCOMPARE(selection.path, expectedPath);
        QCOMPARE(selection.errorString.isEmpty(), selection.action != FolderPicker::Failed);

        QCOMPARE(dialogs.m_choiceCalls.size(), 1);
        QCOMPARE(dialogs.m_choiceCalls.first(), FolderPicker::choices(folderList.folders));
        QCOMPARE(dialogs.m_sizes.first(), QSize(240, 864));
        QCOMPARE(dialogs.m_titles.first(), FolderPicker::windowTitle());
        QCOMPARE(dialogs.m_questionCalls, 0);
    }

    void testConfirmClear_data()
    {
        QTest::addColumn<ProcessResult>("questionResult");
        QTest::addColumn<int>("expected");

        QTest::newRow("delete") << processSuccess() << int(FolderPicker::Confirmed);
        QTest::newRow("abort") << processNonZeroExit(1) << int(FolderPicker::Aborted);
        QTest::newRow("no_dialog") << processSpawnFailure() << int(FolderPicker::ConfirmationFailed);
    }

    void testConfirmClear()
    {
        QFETCH(ProcessResult, questionResult);
        QFETCH(int, expected);

        MockDialogInterface dialogs;
        dialogs.m_questionResult = questionResult;
        FolderPicker picker(&dialogs, QSize(1920, 1080));

        QCOMPARE(int(picker.confirmClear()), expected);
        QCOMPARE(dialogs.m_questionCalls, 1);
        QCOMPARE(dialogs.m_questionLabels, (QStringList{QStringLiteral("Delete"), QStringLiteral("Abort")}));
        QVERIFY(dialogs.m_choiceCalls.isEmpty());
    }
};

QTEST_GUILESS_MAIN(FolderPickerTest)

#include "folderpickertest.moc"
