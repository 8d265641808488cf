/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef RECENTFOLDERSCONTROLLERTEST_H
#define RECENTFOLDERSCONTROLLERTEST_H

#include <QObject>
#include <QStringList>
#include <QTemporaryDir>

class RecentFoldersControllerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();

    void testMissingBookmarkFile();
    void testMalformedBookmarkFile();
    void testCancel();
    void testOpenFolder();
    void testOpenHomeFolder();
    void testEmptyDocumentOffersHomeAndClear();
    void testClearAborted();
    void testClearConfirmed();
    void testClearThenOpen();
    void testConfirmationUnavailable();
    void testClearWhileLocked();
    void testChooserUnavailable();
    void testLauncherFailure();

private:
    QString folder(const QString &name) const;
    QString xbelPath() const;
    QStringList fixtureHrefs() const;

    QTemporaryDir m_tempDir;
};

#endif // RECENTFOLDERSCONTROLLERTEST_H
