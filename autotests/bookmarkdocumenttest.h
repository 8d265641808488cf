/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef BOOKMARKDOCUMENTTEST_H
#define BOOKMARKDOCUMENTTEST_H

#include <QObject>
#include <QTemporaryDir>

class BookmarkDocumentTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();

    void testLoad();
    void testLoadMissingFile();
    void testLoadMalformed_data();
    void testLoadMalformed();
    void testClearAndSave();
    void testClearKeepsOtherElements();
    void testEmptyDocumentRoundTrip();
    void testSaveAddsDeclaration();
    void testSaveWhileLocked();

private:
    QString xbelPath() const;

    QTemporaryDir m_tempDir;
};

#endif // BOOKMARKDOCUMENTTEST_H
