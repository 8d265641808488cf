/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include <settings.h>

#include <KConfigGroup>

#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

using KRecentFolders::Settings;

class SettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QVERIFY(m_tempDir.isValid());
    }

    void testDefaults()
    {
        const Settings settings(KSharedConfig::openConfig(m_tempDir.filePath(QStringLiteral("emptyrc")), KConfig::SimpleConfig));

        QCOMPARE(settings.bookmarkFile(), Settings::defaultBookmarkFile());
        QCOMPARE(settings.chooserProgram(), QStringLiteral("zenity"));
        QCOMPARE(settings.openerProgram(), QStringLiteral("xdg-open"));
    }

    void testDefaultBookmarkFile()
    {
        const QString expected = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QLatin1String("/recently-used.xbel");
        QCOMPARE(Settings::defaultBookmarkFile(), expected);
    }

    void testConfiguredValues()
    {
        KSharedConfig::Ptr config = KSharedConfig::openConfig(m_tempDir.filePath(QStringLiteral("krecentfoldersrc")), KConfig::SimpleConfig);
        KConfigGroup cg(config, QStringLiteral("General"));
        cg.writePathEntry("BookmarkFile", QStringLiteral("/srv/shared/recently-used.xbel"));
        cg.writeEntry("ChooserProgram", QStringLiteral("qarma"));
        cg.writeEntry("OpenerProgram", QStringLiteral("dolphin"));
        QVERIFY(config->sync());

        const Settings settings(config);
        QCOMPARE(settings.bookmarkFile(), QStringLiteral("/srv/shared/recently-used.xbel"));
        QCOMPARE(settings.chooserProgram(), QStringLiteral("qarma"));
        QCOMPARE(settings.openerProgram(), QStringLiteral("dolphin"));

        // re-read from disk
        const Settings reread(KSharedConfig::openConfig(m_tempDir.filePath(QStringLiteral("krecentfoldersrc")), KConfig::SimpleConfig));
        QCOMPARE(reread.chooserProgram(), QStringLiteral("qarma"));
    }

    void testEmptyBookmarkFileFallsBack()
    {
        KSharedConfig::Ptr config = KSharedConfig::openConfig(m_tempDir.filePath(QStringLiteral("blankrc")), KConfig::SimpleConfig);
        KConfigGroup cg(config, QStringLiteral("General"));
        cg.writePathEntry("BookmarkFile", QString());

        const Settings settings(config);
        QCOMPARE(settings.bookmarkFile(), Settings::defaultBookmarkFile());
    }

private:
    QTemporaryDir m_tempDir;
};

QTEST_GUILESS_MAIN(SettingsTest)

#include "settingstest.moc"
