/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "recentfolderscontrollertest.h"
#include "mockdialoginterface.h"
#include "xbeltesthelper.h"

#include <bookmarkdocument.h>
#include <folderpicker.h>
#include <recentfolderscontroller.h>

#include <QDir>
#include <QLockFile>
#include <QStandardPaths>
#include <QTest>

QTEST_GUILESS_MAIN(RecentFoldersControllerTest)

using namespace KRecentFolders;

static const QSize s_screenSize(1920, 1080);

static QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void RecentFoldersControllerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_tempDir.isValid());
    QVERIFY(QDir(m_tempDir.path()).mkpath(QStringLiteral("docs")));
    QVERIFY(QDir(m_tempDir.path()).mkpath(QStringLiteral("music")));
}

void RecentFoldersControllerTest::init()
{
    QFile::remove(xbelPath());
    createXbelFile(xbelPath(), fixtureHrefs());
}

QString RecentFoldersControllerTest::folder(const QString &name) const
{
    return m_tempDir.path() + QLatin1Char('/') + name + QLatin1Char('/');
}

QString RecentFoldersControllerTest::xbelPath() const
{
    return m_tempDir.filePath(QStringLiteral("recently-used.xbel"));
}

QStringList RecentFoldersControllerTest::fixtureHrefs() const
{
    return QStringList{
        fileUri(folder(QStringLiteral("docs")) + QLatin1String("a.txt")),
        fileUri(folder(QStringLiteral("music")) + QLatin1String("b.ogg")),
        fileUri(folder(QStringLiteral("docs")) + QLatin1String("c.txt")),
    };
}

void RecentFoldersControllerTest::testMissingBookmarkFile()
{
    MockDialogInterface dialogs;
    MockLauncher launcher;
    RecentFoldersController controller(m_tempDir.filePath(QStringLiteral("nothing-here.xbel")), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QVERIFY(!controller.errorString().isEmpty());
    QCOMPARE(dialogs.m_errors, QStringList{controller.errorString()});
    // nothing else is attempted
    QVERIFY(dialogs.m_choiceCalls.isEmpty());
    QVERIFY(launcher.m_opened.isEmpty());
}

void RecentFoldersControllerTest::testMalformedBookmarkFile()
{
    QFile file(xbelPath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("<xbel version=\"1.0\"><bookmark href=\"file:///home/a.txt\">");
    file.close();

    MockDialogInterface dialogs;
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QCOMPARE(controller.document().error(), BookmarkDocument::StoreUnavailable);
    QVERIFY(dialogs.m_choiceCalls.isEmpty());
}

void RecentFoldersControllerTest::testCancel()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processNonZeroExit(1);
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Cancelled);
    QCOMPARE(dialogs.m_choiceCalls.size(), 1);
    QVERIFY(dialogs.m_errors.isEmpty());
    QVERIFY(launcher.m_opened.isEmpty());
    QVERIFY(controller.openedPath().isEmpty());
}

void RecentFoldersControllerTest::testOpenFolder()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(folder(QStringLiteral("music")));
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Opened);
    QCOMPARE(controller.openedPath(), folder(QStringLiteral("music")));
    QCOMPARE(launcher.m_opened, QStringList{folder(QStringLiteral("music"))});

    const QStringList expectedChoices{
        FolderPicker::homeFolder(),
        folder(QStringLiteral("docs")),
        folder(QStringLiteral("music")),
        FolderPicker::clearMarker(),
    };
    QCOMPARE(dialogs.m_choiceCalls.size(), 1);
    QCOMPARE(dialogs.m_choiceCalls.first(), expectedChoices);

    const int maxPathLength = folder(QStringLiteral("music")).size();
    QCOMPARE(dialogs.m_sizes.first(), QSize(maxPathLength * 8, 864));
}

void RecentFoldersControllerTest::testOpenHomeFolder()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(QStringLiteral("~/"));
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Opened);
    QCOMPARE(launcher.m_opened, QStringList{QDir::homePath() + QLatin1Char('/')});
}

void RecentFoldersControllerTest::testEmptyDocumentOffersHomeAndClear()
{
    createXbelFile(xbelPath(), {});

    MockDialogInterface dialogs;
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Cancelled);
    QCOMPARE(dialogs.m_choiceCalls.size(), 1);
    QCOMPARE(dialogs.m_choiceCalls.first(), (QStringList{FolderPicker::homeFolder(), FolderPicker::clearMarker()}));
}

void RecentFoldersControllerTest::testClearAborted()
{
    const QByteArray before = readFile(xbelPath());

    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(FolderPicker::clearMarker()) << processNonZeroExit(1);
    dialogs.m_questionResult = processNonZeroExit(1);
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Cancelled);
    QCOMPARE(dialogs.m_questionCalls, 1);

    // the same list is shown again
    QCOMPARE(dialogs.m_choiceCalls.size(), 2);
    QCOMPARE(dialogs.m_choiceCalls.at(1), dialogs.m_choiceCalls.at(0));
    QCOMPARE(dialogs.m_sizes.at(1), dialogs.m_sizes.at(0));

    QCOMPARE(controller.document().entryCount(), 3);
    QCOMPARE(readFile(xbelPath()), before);
}

void RecentFoldersControllerTest::testClearConfirmed()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(FolderPicker::clearMarker()) << processNonZeroExit(1);
    dialogs.m_questionResult = processSuccess();
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Cancelled);
    QCOMPARE(dialogs.m_questionCalls, 1);
    QCOMPARE(dialogs.m_choiceCalls.size(), 2);
    QCOMPARE(dialogs.m_choiceCalls.at(0).size(), 4);
    QCOMPARE(dialogs.m_choiceCalls.at(1), (QStringList{FolderPicker::homeFolder(), FolderPicker::clearMarker()}));

    BookmarkDocument reloaded;
    QVERIFY(reloaded.load(xbelPath()));
    QCOMPARE(reloaded.entryCount(), 0);
}

void RecentFoldersControllerTest::testClearThenOpen()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(FolderPicker::clearMarker()) << processSuccess(FolderPicker::homeFolder());
    dialogs.m_questionResult = processSuccess();
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 0);
    QCOMPARE(controller.state(), RecentFoldersController::Opened);
    QCOMPARE(launcher.m_opened, QStringList{FolderPicker::homeFolder()});
    QCOMPARE(controller.document().entryCount(), 0);
}

void RecentFoldersControllerTest::testConfirmationUnavailable()
{
    const QByteArray before = readFile(xbelPath());

    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(FolderPicker::clearMarker());
    dialogs.m_questionResult = processSpawnFailure();
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QCOMPARE(dialogs.m_choiceCalls.size(), 1);
    QCOMPARE(readFile(xbelPath()), before);
}

void RecentFoldersControllerTest::testClearWhileLocked()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(FolderPicker::clearMarker());
    dialogs.m_questionResult = processSuccess();
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QLockFile lockFile(xbelPath() + QLatin1String(".lock"));
    QVERIFY(lockFile.lock());

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QCOMPARE(controller.document().error(), BookmarkDocument::PersistFailure);
    QCOMPARE(dialogs.m_errors.size(), 1);

    BookmarkDocument onDisk;
    QVERIFY(onDisk.load(xbelPath()));
    QCOMPARE(onDisk.entryCount(), 3);
}

void RecentFoldersControllerTest::testChooserUnavailable()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSpawnFailure();
    MockLauncher launcher;
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QCOMPARE(dialogs.m_errors.size(), 1);
    QVERIFY(launcher.m_opened.isEmpty());
}

void RecentFoldersControllerTest::testLauncherFailure()
{
    MockDialogInterface dialogs;
    dialogs.m_chooserResults << processSuccess(folder(QStringLiteral("docs")));
    MockLauncher launcher;
    launcher.setRetVal(false);
    RecentFoldersController controller(xbelPath(), &dialogs, &launcher, s_screenSize);

    QCOMPARE(controller.exec(), 1);
    QCOMPARE(controller.state(), RecentFoldersController::Error);
    QVERIFY(controller.openedPath().isEmpty());
    QCOMPARE(dialogs.m_errors.size(), 1);
}
