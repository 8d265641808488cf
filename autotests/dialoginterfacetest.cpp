/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <dialoginterface.h>
#include <processrunner.h>

#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

using namespace KRecentFolders;

class DialogInterfaceTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QVERIFY(m_tempDir.isValid());

        m_sh = QStandardPaths::findExecutable(QStringLiteral("sh"));
        if (m_sh.isEmpty()) {
            m_sh = QStringLiteral("/bin/sh");
        }

        // Stand-in for zenity: prints its last argument, or exits with $FAKE_ZENITY_EXIT
        m_fakeZenity = m_tempDir.filePath(QStringLiteral("fake-zenity"));
        QFile script(m_fakeZenity);
        QVERIFY(script.open(QIODevice::WriteOnly));
        script.write(
            "#!/bin/sh\n"
            "if [ -n \"$FAKE_ZENITY_EXIT\" ]; then exit \"$FAKE_ZENITY_EXIT\"; fi\n"
            "for arg; do last=\"$arg\"; done\n"
            "printf '%s\\n' \"$last\"\n");
        script.close();
        QVERIFY(script.setPermissions(script.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser));
    }

    void init()
    {
        qunsetenv("FAKE_ZENITY_EXIT");
    }

    void testRunProcessOutput()
    {
        const ProcessResult result = runProcess(m_sh, {QStringLiteral("-c"), QStringLiteral("printf 'hello world\\n'")});
        QCOMPARE(result.status, ProcessResult::Success);
        QCOMPARE(result.exitCode, 0);
        QCOMPARE(result.output, QStringLiteral("hello world"));
    }

    void testRunProcessStripsOneLineTerminator()
    {
        const ProcessResult result = runProcess(m_sh, {QStringLiteral("-c"), QStringLiteral("printf '/home/user/\\n\\n'")});
        QCOMPARE(result.status, ProcessResult::Success);
        QCOMPARE(result.output, QStringLiteral("/home/user/\n"));
    }

    void testRunProcessNonZeroExit()
    {
        const ProcessResult result = runProcess(m_sh, {QStringLiteral("-c"), QStringLiteral("printf partial; exit 3")});
        QCOMPARE(result.status, ProcessResult::NonZeroExit);
        QCOMPARE(result.exitCode, 3);
        QCOMPARE(result.output, QStringLiteral("partial"));
    }

    void testRunProcessSpawnFailure()
    {
        const ProcessResult result = runProcess(m_tempDir.filePath(QStringLiteral("does-not-exist")), {});
        QCOMPARE(result.status, ProcessResult::SpawnFailure);
        QVERIFY(!result.errorString.isEmpty());
    }

    void testListArguments()
    {
        const QStringList choices{QStringLiteral("/home/user/"), QStringLiteral("/srv/My Music/"), QStringLiteral("⚠ Clear recent folders")};
        const QStringList args =
            ZenityDialogs::listArguments(QStringLiteral("Recent Folders 1.0"), QStringLiteral("Pick"), QStringLiteral("Folder"), choices, QSize(400, 864));

        const QStringList expected{
            QStringLiteral("--list"),
            QStringLiteral("--title=Recent Folders 1.0"),
            QStringLiteral("--text=Pick"),
            QStringLiteral("--width=400"),
            QStringLiteral("--height=864"),
            QStringLiteral("--column=Folder"),
            QStringLiteral("/home/user/"),
            QStringLiteral("/srv/My Music/"),
            QStringLiteral("⚠ Clear recent folders"),
        };
        QCOMPARE(args, expected);
    }

    void testListArgumentsWithoutSize()
    {
        const QStringList args = ZenityDialogs::listArguments(QStringLiteral("T"), QStringLiteral("P"), QStringLiteral("C"), {}, QSize(0, 0));
        QVERIFY(!args.contains(QStringLiteral("--width=0")));
        QVERIFY(!args.contains(QStringLiteral("--height=0")));
        QCOMPARE(args.last(), QStringLiteral("--column=C"));
    }

    void testQuestionArguments()
    {
        const QStringList args =
            ZenityDialogs::questionArguments(QStringLiteral("T"), QStringLiteral("Really?"), QStringLiteral("Delete"), QStringLiteral("Abort"));
        QCOMPARE(args.first(), QStringLiteral("--question"));
        QVERIFY(args.contains(QStringLiteral("--text=Really?")));
        QVERIFY(args.contains(QStringLiteral("--ok-label=Delete")));
        QVERIFY(args.contains(QStringLiteral("--cancel-label=Abort")));
    }

    void testChooseFromList()
    {
        ZenityDialogs dialogs(m_fakeZenity);
        const ProcessResult result = dialogs.chooseFromList(QStringLiteral("T"),
                                                            QStringLiteral("P"),
                                                            QStringLiteral("C"),
                                                            {QStringLiteral("/home/user/"), QStringLiteral("/srv/My Music/")},
                                                            QSize(400, 800));
        QCOMPARE(result.status, ProcessResult::Success);
        QCOMPARE(result.output, QStringLiteral("/srv/My Music/"));
    }

    void testChooseFromListDismissed()
    {
        qputenv("FAKE_ZENITY_EXIT", "1");
        ZenityDialogs dialogs(m_fakeZenity);
        const ProcessResult result = dialogs.chooseFromList(QStringLiteral("T"), QStringLiteral("P"), QStringLiteral("C"), {QStringLiteral("/a/")}, QSize());
        QCOMPARE(result.status, ProcessResult::NonZeroExit);
        QCOMPARE(result.exitCode, 1);
    }

    void testAskQuestion()
    {
        ZenityDialogs dialogs(m_fakeZenity);
        QCOMPARE(dialogs.askQuestion(QStringLiteral("T"), QStringLiteral("Q"), QStringLiteral("Delete"), QStringLiteral("Abort")).status,
                 ProcessResult::Success);

        qputenv("FAKE_ZENITY_EXIT", "1");
        QCOMPARE(dialogs.askQuestion(QStringLiteral("T"), QStringLiteral("Q"), QStringLiteral("Delete"), QStringLiteral("Abort")).status,
                 ProcessResult::NonZeroExit);
    }

    void testMissingChooser()
    {
        ZenityDialogs dialogs(m_tempDir.filePath(QStringLiteral("no-zenity-here")));
        const ProcessResult result = dialogs.chooseFromList(QStringLiteral("T"), QStringLiteral("P"), QStringLiteral("C"), {}, QSize());
        QCOMPARE(result.status, ProcessResult::SpawnFailure);
        // must not block nor crash
        dialogs.showError(QStringLiteral("T"), QStringLiteral("E"));
    }

private:
    QTemporaryDir m_tempDir;
    QString m_sh;
    QString m_fakeZenity;
};

QTEST_GUILESS_MAIN(DialogInterfaceTest)

#include "dialoginterfacetest.moc"
