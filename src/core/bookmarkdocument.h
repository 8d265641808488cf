/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_BOOKMARKDOCUMENT_H
#define KRECENTFOLDERS_BOOKMARKDOCUMENT_H

#include "krecentfolderscore_export.h"

#include <QDomDocument>
#include <QString>
#include <QStringList>

namespace KRecentFolders
{
/*!
 * \class KRecentFolders::BookmarkDocument
 *
 * \brief In-memory copy of an XBEL desktop bookmark file.
 *
 * The document keeps the path it was loaded from so that it can be written
 * back in place after clearEntries().
 *
 * Ref: https://www.freedesktop.org/wiki/Specifications/desktop-bookmark-spec
 */
class KRECENTFOLDERSCORE_EXPORT BookmarkDocument
{
public:
    /*!
     * \value NoError No error occurred
     * \value StoreUnavailable The bookmark file is missing, unreadable or not an XBEL document
     * \value PersistFailure The bookmark file could not be written back
     */
    enum Error {
        NoError = 0,
        StoreUnavailable,
        PersistFailure,
    };

    BookmarkDocument();

    /*!
     * Parses the XBEL file at \a filePath.
     *
     * Returns \c false and sets error() to StoreUnavailable when the file
     * cannot be read or is not well formed. The previous content is discarded
     * in either case.
     */
    bool load(const QString &filePath);

    /*!
     * Writes the document to filePath(), pretty printed, UTF-8 encoded and
     * with an XML declaration. The file is replaced atomically.
     *
     * Returns \c false and sets error() to PersistFailure on failure.
     */
    bool save();

    /*!
     * Removes every bookmark entry. Other children of the root element are kept.
     */
    void clearEntries();

    /*!
     * The href attribute of each bookmark entry, in document order.
     */
    QStringList hrefs() const;

    int entryCount() const;

    QString filePath() const;

    Error error() const;
    QString errorString() const;

private:
    QDomElement rootElement() const;
    void setError(Error error, const QString &errorString);

    QDomDocument m_document;
    QString m_filePath;
    Error m_error = NoError;
    QString m_errorString;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_BOOKMARKDOCUMENT_H
