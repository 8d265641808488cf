/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef FOLDEREXTRACTORTEST_H
#define FOLDEREXTRACTORTEST_H

#include <QObject>
#include <QTemporaryDir>

class FolderExtractorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testParentFolderFromUri_data();
    void testParentFolderFromUri();
    void testIsTransientFolder_data();
    void testIsTransientFolder();

    void testMostRecentFirstWithoutDuplicates();
    void testTempRootExcluded();
    void testTempSubfolderKept();
    void testCacheFolderExcluded();
    void testMissingFolderExcluded();
    void testPercentDecodedFolder();
    void testNonFileBookmarksIgnored();
    void testEmptyDocument();
    void testIdempotent();

private:
    QString folder(const QString &name) const;
    QString xbelPath() const;

    QTemporaryDir m_tempDir;
};

#endif // FOLDEREXTRACTORTEST_H
