/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "folderextractor.h"

#include "bookmarkdocument.h"
#include "krecentfolders_debug.h"

#include <QFileInfo>
#include <QSet>
#include <QUrl>

#include <algorithm>

namespace KRecentFolders
{
static const QLatin1String fileScheme("file://");
static const QLatin1String tempRoot("/tmp/");
static const QLatin1String cacheMarker("/.cache/");

QString parentFolderFromUri(const QString &uri)
{
    if (!uri.startsWith(fileScheme)) {
        return QString();
    }

    QString path = uri.mid(fileScheme.size());
    path.truncate(path.lastIndexOf(QLatin1Char('/')) + 1);
    return QUrl::fromPercentEncoding(path.toUtf8());
}

bool isTransientFolder(const QString &folder)
{
    return folder == tempRoot || folder.contains(cacheMarker);
}

FolderList extractFolders(const BookmarkDocument &document)
{
    FolderList ret;
    QStringList folders;

    const QStringList hrefs = document.hrefs();
    for (const QString &href : hrefs) {
        const QString folder = parentFolderFromUri(href);
        if (folder.isEmpty()) {
            qCDebug(KRECENTFOLDERS_LOG) << "Skipping non local bookmark" << href;
            continue;
        }

        ret.maxPathLength = std::max(ret.maxPathLength, int(folder.size()));

        if (isTransientFolder(folder) || !QFileInfo::exists(folder)) {
            continue;
        }
        folders.append(folder);
    }

    // bookmarks are appended, so the last one is the most recent
    std::reverse(folders.begin(), folders.end());

    QSet<QString> seen;
    for (const QString &folder : std::as_const(folders)) {
        if (!seen.contains(folder)) {
            seen.insert(folder);
            ret.folders.append(folder);
        }
    }

    qCDebug(KRECENTFOLDERS_LOG) << "Extracted" << ret.folders.size() << "folders out of" << hrefs.size() << "bookmarks";
    return ret;
}

} // namespace KRecentFolders
