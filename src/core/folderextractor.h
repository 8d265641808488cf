/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_FOLDEREXTRACTOR_H
#define KRECENTFOLDERS_FOLDEREXTRACTOR_H

#include "krecentfolderscore_export.h"

#include <QString>
#include <QStringList>

namespace KRecentFolders
{
class BookmarkDocument;

/*!
 * Folders recovered from a bookmark document, most recently used first.
 */
struct FolderList {
    QStringList folders;
    /*!
     * Length of the longest decoded folder path, including the ones that
     * were filtered out. Used to size the chooser.
     */
    int maxPathLength = 0;
};

/*!
 * Returns the decoded parent folder of a \c file:// URI, with a trailing
 * slash, e.g. "file:///home/user/My%20Folder/file.txt" gives
 * "/home/user/My Folder/". Returns an empty string for other schemes.
 */
KRECENTFOLDERSCORE_EXPORT QString parentFolderFromUri(const QString &uri);

/*!
 * Returns \c true when \a folder must never be offered: the temporary
 * directory root itself, or anything below a cache directory.
 *
 * Only the exact "/tmp/" is rejected, subfolders of it are kept.
 */
KRECENTFOLDERSCORE_EXPORT bool isTransientFolder(const QString &folder);

/*!
 * Walks the bookmarks of \a document and returns the unique, existing,
 * non transient parent folders, most recently added bookmark first.
 *
 * The document is not modified.
 */
KRECENTFOLDERSCORE_EXPORT FolderList extractFolders(const BookmarkDocument &document);

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_FOLDEREXTRACTOR_H
