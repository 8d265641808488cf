/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "folderextractortest.h"
#include "xbeltesthelper.h"

#include <bookmarkdocument.h>
#include <folderextractor.h>

#include <QDir>
#include <QStandardPaths>
#include <QTest>

QTEST_GUILESS_MAIN(FolderExtractorTest)

using namespace KRecentFolders;

void FolderExtractorTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_tempDir.isValid());

    const QStringList subdirs{
        QStringLiteral("docs"),
        QStringLiteral("music"),
        QStringLiteral("photos"),
        QStringLiteral("My Folder"),
        QStringLiteral(".cache/thumbnails"),
    };
    for (const QString &subdir : subdirs) {
        QVERIFY(QDir(m_tempDir.path()).mkpath(subdir));
    }
}

// local path of a folder in the fixture, with trailing slash as extracted
QString FolderExtractorTest::folder(const QString &name) const
{
    return m_tempDir.path() + QLatin1Char('/') + name + QLatin1Char('/');
}

QString FolderExtractorTest::xbelPath() const
{
    return m_tempDir.filePath(QStringLiteral("recently-used.xbel"));
}

void FolderExtractorTest::testParentFolderFromUri_data()
{
    QTest::addColumn<QString>("uri");
    QTest::addColumn<QString>("expected");

    QTest::newRow("plain") << QStringLiteral("file:///home/user/docs/report.odt") << QStringLiteral("/home/user/docs/");
    QTest::newRow("space") << QStringLiteral("file:///home/user/My%20Folder/file.txt") << QStringLiteral("/home/user/My Folder/");
    QTest::newRow("utf8") << QStringLiteral("file:///home/user/%C3%A9t%C3%A9/a.txt") << QStringLiteral("/home/user/été/");
    QTest::newRow("tmp") << QStringLiteral("file:///tmp/x.txt") << QStringLiteral("/tmp/");
    QTest::newRow("root") << QStringLiteral("file:///vmlinuz") << QStringLiteral("/");
    QTest::newRow("directory") << QStringLiteral("file:///home/user/docs/") << QStringLiteral("/home/user/docs/");
    QTest::newRow("https") << QStringLiteral("https://kde.org/index.html") << QString();
    QTest::newRow("no_scheme") << QStringLiteral("/home/user/docs/report.odt") << QString();
    QTest::newRow("empty") << QString() << QString();
}

void FolderExtractorTest::testParentFolderFromUri()
{
    QFETCH(QString, uri);
    QFETCH(QString, expected);

    QCOMPARE(parentFolderFromUri(uri), expected);
}

void FolderExtractorTest::testIsTransientFolder_data()
{
    QTest::addColumn<QString>("folder");
    QTest::addColumn<bool>("expected");

    QTest::newRow("tmp_root") << QStringLiteral("/tmp/") << true;
    QTest::newRow("tmp_subfolder") << QStringLiteral("/tmp/a/") << false;
    QTest::newRow("var_tmp") << QStringLiteral("/var/tmp/") << false;
    QTest::newRow("cache_root") << QStringLiteral("/home/user/.cache/") << true;
    QTest::newRow("cache_subfolder") << QStringLiteral("/home/user/.cache/thumbnails/large/") << true;
    QTest::newRow("cache_without_dot") << QStringLiteral("/home/user/cache/") << false;
    QTest::newRow("cache_prefix") << QStringLiteral("/home/user/.cachefiles/") << false;
    QTest::newRow("home") << QStringLiteral("/home/user/") << false;
}

void FolderExtractorTest::testIsTransientFolder()
{
    QFETCH(QString, folder);
    QFETCH(bool, expected);

    QCOMPARE(isTransientFolder(folder), expected);
}

void FolderExtractorTest::testMostRecentFirstWithoutDuplicates()
{
    createXbelFile(xbelPath(),
                   {
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("a.txt")),
                       fileUri(folder(QStringLiteral("music")) + QLatin1String("song.ogg")),
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("b.txt")),
                       fileUri(folder(QStringLiteral("photos")) + QLatin1String("cat.jpg")),
                       fileUri(folder(QStringLiteral("music")) + QLatin1String("other.ogg")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    const QStringList expected{
        folder(QStringLiteral("music")),
        folder(QStringLiteral("photos")),
        folder(QStringLiteral("docs")),
    };
    QCOMPARE(list.folders, expected);

    QStringList unique = list.folders;
    QVERIFY(unique.removeDuplicates() == 0);
}

void FolderExtractorTest::testTempRootExcluded()
{
    if (!QFileInfo::exists(QStringLiteral("/tmp/"))) {
        QSKIP("This test needs /tmp");
    }

    createXbelFile(xbelPath(),
                   {
                       QStringLiteral("file:///tmp/x.txt"),
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("y.txt")),
                       QStringLiteral("file:///tmp/z.txt"),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QCOMPARE(list.folders, QStringList{folder(QStringLiteral("docs"))});
}

void FolderExtractorTest::testTempSubfolderKept()
{
    // only the temporary root itself is excluded, not what is below it
    QTemporaryDir underTmp(QStringLiteral("/tmp/krecentfolderstest-XXXXXX"));
    if (!underTmp.isValid()) {
        QSKIP("Cannot create a folder in /tmp");
    }
    const QString tmpFolder = underTmp.path() + QLatin1Char('/');
    const QString docs = folder(QStringLiteral("docs"));

    createXbelFile(xbelPath(),
                   {
                       fileUri(tmpFolder + QLatin1String("x.txt")),
                       fileUri(docs + QLatin1String("y.txt")),
                       fileUri(docs + QLatin1String("z.txt")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    const QStringList expected{docs, tmpFolder};
    QCOMPARE(list.folders, expected);
}

void FolderExtractorTest::testCacheFolderExcluded()
{
    const QString cache = folder(QStringLiteral(".cache/thumbnails"));
    QVERIFY(QFileInfo::exists(cache));

    createXbelFile(xbelPath(),
                   {
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("a.txt")),
                       fileUri(cache + QLatin1String("0123456789abcdef0123456789abcdef.png")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QCOMPARE(list.folders, QStringList{folder(QStringLiteral("docs"))});
    // the filtered path still counts for the chooser width
    QCOMPARE(list.maxPathLength, int(cache.size()));
}

void FolderExtractorTest::testMissingFolderExcluded()
{
    const QString missing = folder(QStringLiteral("this folder was deleted since"));
    QVERIFY(!QFileInfo::exists(missing));

    createXbelFile(xbelPath(),
                   {
                       fileUri(missing + QLatin1String("gone.txt")),
                       fileUri(folder(QStringLiteral("photos")) + QLatin1String("cat.jpg")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QCOMPARE(list.folders, QStringList{folder(QStringLiteral("photos"))});
    QCOMPARE(list.maxPathLength, int(missing.size()));
}

void FolderExtractorTest::testPercentDecodedFolder()
{
    const QString myFolder = folder(QStringLiteral("My Folder"));
    const QString uri = fileUri(myFolder + QLatin1String("file.txt"));
    QVERIFY(uri.contains(QLatin1String("My%20Folder")));

    createXbelFile(xbelPath(), {uri});

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QCOMPARE(list.folders, QStringList{myFolder});
    QCOMPARE(list.maxPathLength, int(myFolder.size()));
}

void FolderExtractorTest::testNonFileBookmarksIgnored()
{
    createXbelFile(xbelPath(),
                   {
                       QStringLiteral("https://kde.org/a/very/long/path/that/is/longer/than/any/local/folder/of/this/test/index.html"),
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("a.txt")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QCOMPARE(list.folders, QStringList{folder(QStringLiteral("docs"))});
    QCOMPARE(list.maxPathLength, int(folder(QStringLiteral("docs")).size()));
}

void FolderExtractorTest::testEmptyDocument()
{
    createXbelFile(xbelPath(), {});

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));

    const FolderList list = extractFolders(document);
    QVERIFY(list.folders.isEmpty());
    QCOMPARE(list.maxPathLength, 0);
}

void FolderExtractorTest::testIdempotent()
{
    createXbelFile(xbelPath(),
                   {
                       fileUri(folder(QStringLiteral("photos")) + QLatin1String("cat.jpg")),
                       fileUri(folder(QStringLiteral("docs")) + QLatin1String("a.txt")),
                       fileUri(folder(QStringLiteral("photos")) + QLatin1String("dog.jpg")),
                   });

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    const QStringList hrefs = document.hrefs();

    const FolderList first = extractFolders(document);
    const FolderList second = extractFolders(document);
    QCOMPARE(first.folders, second.folders);
    QCOMPARE(first.maxPathLength, second.maxPathLength);
    QCOMPARE(document.hrefs(), hrefs);
}
