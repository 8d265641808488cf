/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "bookmarkdocumenttest.h"
#include "xbeltesthelper.h"

#include <bookmarkdocument.h>

#include <QDomDocument>
#include <QLockFile>
#include <QStandardPaths>
#include <QTest>

QTEST_GUILESS_MAIN(BookmarkDocumentTest)

using KRecentFolders::BookmarkDocument;

static QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

static void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QVERIFY(file.write(content) == content.size());
}

void BookmarkDocumentTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_tempDir.isValid());
}

void BookmarkDocumentTest::init()
{
    QFile::remove(xbelPath());
}

QString BookmarkDocumentTest::xbelPath() const
{
    return m_tempDir.filePath(QStringLiteral("recently-used.xbel"));
}

void BookmarkDocumentTest::testLoad()
{
    const QStringList hrefs{
        QStringLiteral("file:///home/user/a.txt"),
        QStringLiteral("file:///home/user/My%20Folder/b.txt"),
        QStringLiteral("https://kde.org/"),
    };
    createXbelFile(xbelPath(), hrefs);

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    QCOMPARE(document.error(), BookmarkDocument::NoError);
    QVERIFY(document.errorString().isEmpty());
    QCOMPARE(document.filePath(), xbelPath());
    QCOMPARE(document.entryCount(), 3);
    QCOMPARE(document.hrefs(), hrefs);
}

void BookmarkDocumentTest::testLoadMissingFile()
{
    BookmarkDocument document;
    QVERIFY(!document.load(xbelPath()));
    QCOMPARE(document.error(), BookmarkDocument::StoreUnavailable);
    QVERIFY(document.errorString().contains(xbelPath()));
    QCOMPARE(document.entryCount(), 0);
}

void BookmarkDocumentTest::testLoadMalformed_data()
{
    QTest::addColumn<QByteArray>("content");

    QTest::newRow("empty") << QByteArray();
    QTest::newRow("not_xml") << QByteArray("this is not a bookmark file\n");
    QTest::newRow("truncated") << QByteArray("<?xml version=\"1.0\"?>\n<xbel version=\"1.0\">\n  <bookmark href=\"file:///home/a.txt\">\n");
    QTest::newRow("wrong_root") << QByteArray("<?xml version=\"1.0\"?>\n<html><body/></html>\n");
}

void BookmarkDocumentTest::testLoadMalformed()
{
    QFETCH(QByteArray, content);
    writeFile(xbelPath(), content);

    BookmarkDocument document;
    QVERIFY(!document.load(xbelPath()));
    QCOMPARE(document.error(), BookmarkDocument::StoreUnavailable);
    QVERIFY(!document.errorString().isEmpty());
    QCOMPARE(document.entryCount(), 0);
    QVERIFY(document.hrefs().isEmpty());
}

void BookmarkDocumentTest::testClearAndSave()
{
    createXbelFile(xbelPath(), {QStringLiteral("file:///home/user/a.txt"), QStringLiteral("file:///home/user/b.txt")});

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    QCOMPARE(document.entryCount(), 2);

    document.clearEntries();
    QCOMPARE(document.entryCount(), 0);
    // not written yet
    BookmarkDocument onDisk;
    QVERIFY(onDisk.load(xbelPath()));
    QCOMPARE(onDisk.entryCount(), 2);

    QVERIFY(document.save());
    QCOMPARE(document.error(), BookmarkDocument::NoError);

    const QByteArray content = readFile(xbelPath());
    QVERIFY(content.startsWith("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<xbel"));
    // pretty printed
    QVERIFY(content.contains("\n"));

    BookmarkDocument reloaded;
    QVERIFY(reloaded.load(xbelPath()));
    QCOMPARE(reloaded.entryCount(), 0);
    QVERIFY(reloaded.hrefs().isEmpty());
    QVERIFY(!QFile::exists(xbelPath() + QLatin1String(".lock")));
}

void BookmarkDocumentTest::testClearKeepsOtherElements()
{
    writeFile(xbelPath(),
              "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
              "<xbel version=\"1.0\">\n"
              "  <title>Recent</title>\n"
              "  <bookmark href=\"file:///home/user/a.txt\"/>\n"
              "  <bookmark href=\"file:///home/user/b.txt\"/>\n"
              "</xbel>\n");

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    document.clearEntries();
    QVERIFY(document.save());

    QDomDocument reader;
    QVERIFY(reader.setContent(readFile(xbelPath())));
    QCOMPARE(reader.documentElement().tagName(), QStringLiteral("xbel"));
    QCOMPARE(reader.documentElement().attribute(QStringLiteral("version")), QStringLiteral("1.0"));
    QCOMPARE(reader.elementsByTagName(QStringLiteral("bookmark")).length(), 0);
    QCOMPARE(reader.elementsByTagName(QStringLiteral("title")).length(), 1);
}

void BookmarkDocumentTest::testEmptyDocumentRoundTrip()
{
    createXbelFile(xbelPath(), {});

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    QCOMPARE(document.entryCount(), 0);

    document.clearEntries();
    QVERIFY(document.save());

    BookmarkDocument reloaded;
    QVERIFY(reloaded.load(xbelPath()));
    QCOMPARE(reloaded.entryCount(), 0);
}

void BookmarkDocumentTest::testSaveAddsDeclaration()
{
    writeFile(xbelPath(), "<xbel version=\"1.0\"><bookmark href=\"file:///home/user/a.txt\"/></xbel>");

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    QCOMPARE(document.entryCount(), 1);
    QVERIFY(document.save());

    const QByteArray content = readFile(xbelPath());
    QVERIFY(content.startsWith("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
    // only once
    QVERIFY(content.count("<?xml") == 1);

    BookmarkDocument reloaded;
    QVERIFY(reloaded.load(xbelPath()));
    QCOMPARE(reloaded.hrefs(), QStringList{QStringLiteral("file:///home/user/a.txt")});
}

void BookmarkDocumentTest::testSaveWhileLocked()
{
    createXbelFile(xbelPath(), {QStringLiteral("file:///home/user/a.txt")});
    const QByteArray before = readFile(xbelPath());

    BookmarkDocument document;
    QVERIFY(document.load(xbelPath()));
    document.clearEntries();

    QLockFile lockFile(xbelPath() + QLatin1String(".lock"));
    QVERIFY(lockFile.lock());

    QVERIFY(!document.save());
    QCOMPARE(document.error(), BookmarkDocument::PersistFailure);
    QVERIFY(!document.errorString().isEmpty());
    QCOMPARE(readFile(xbelPath()), before);

    lockFile.unlock();
    QVERIFY(document.save());
}
