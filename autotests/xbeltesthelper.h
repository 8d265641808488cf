/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef XBELTESTHELPER_H
#define XBELTESTHELPER_H

#include <QFile>
#include <QStringList>
#include <QTest>
#include <QUrl>

// Writes a recently-used.xbel holding one bookmark per href, in the same shape as
// the files written by KRecentDocument and GTK
static inline void createXbelFile(const QString &path, const QStringList &hrefs)
{
    QByteArray content =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<xbel version=\"1.0\"\n"
        "      xmlns:bookmark=\"http://www.freedesktop.org/standards/desktop-bookmarks\"\n"
        "      xmlns:mime=\"http://www.freedesktop.org/standards/shared-mime-info\"\n"
        ">\n";
    for (const QString &href : hrefs) {
        content += "  <bookmark href=\"" + href.toHtmlEscaped().toUtf8()
            + "\" added=\"2024-03-01T10:00:00.000000Z\" modified=\"2024-03-01T10:00:00.000000Z\" visited=\"2024-03-01T10:00:00.000000Z\">\n"
              "    <info>\n"
              "      <metadata owner=\"http://freedesktop.org\">\n"
              "        <mime:mime-type type=\"text/plain\"/>\n"
              "        <bookmark:applications>\n"
              "          <bookmark:application name=\"kate\" exec=\"&apos;kate %u&apos;\" modified=\"2024-03-01T10:00:00.000000Z\" count=\"1\"/>\n"
              "        </bookmark:applications>\n"
              "      </metadata>\n"
              "    </info>\n"
              "  </bookmark>\n";
    }
    content += "</xbel>\n";

    QFile file(path);
    QVERIFY2(file.open(QIODevice::WriteOnly), qPrintable(file.errorString()));
    QVERIFY(file.write(content) == content.size());
}

// "file://" URI of a local file, percent encoded like in real bookmark files
static inline QString fileUri(const QString &localPath)
{
    return QUrl::fromLocalFile(localPath).toString(QUrl::FullyEncoded);
}

#endif // XBELTESTHELPER_H
