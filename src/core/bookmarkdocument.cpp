/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "bookmarkdocument.h"

#include "krecentfolders_debug.h"

#include <KLocalizedString>

#include <QFile>
#include <QLockFile>
#include <QSaveFile>

namespace KRecentFolders
{
static const QLatin1String xbelTag("xbel");
static const QLatin1String bookmarkTag("bookmark");
static const QLatin1String hrefAttribute("href");
static const QLatin1String versionAttribute("version");
static const QLatin1String expectedVersion("1.0");

BookmarkDocument::BookmarkDocument() = default;

bool BookmarkDocument::load(const QString &filePath)
{
    m_document.clear();
    m_filePath = filePath;
    setError(NoError, QString());

    QFile input(filePath);
    if (!input.open(QIODevice::ReadOnly)) {
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to open" << filePath << input.errorString();
        setError(StoreUnavailable, i18n("Could not open the bookmark file %1: %2", filePath, input.errorString()));
        return false;
    }

    const QDomDocument::ParseResult result = m_document.setContent(input.readAll());
    input.close();
    if (!result) {
        qCWarning(KRECENTFOLDERS_LOG) << "Malformed bookmark file" << filePath << result.errorMessage << "at line" << result.errorLine;
        m_document.clear();
        setError(StoreUnavailable,
                 i18n("The bookmark file %1 is malformed (line %2, column %3): %4",
                      filePath,
                      result.errorLine,
                      result.errorColumn,
                      result.errorMessage));
        return false;
    }

    const QDomElement root = rootElement();
    if (root.isNull() || root.tagName() != xbelTag) {
        qCWarning(KRECENTFOLDERS_LOG) << filePath << "is not an XBEL file, root element is" << root.tagName();
        m_document.clear();
        setError(StoreUnavailable, i18n("The file %1 is not an XBEL bookmark file.", filePath));
        return false;
    }

    if (root.attribute(versionAttribute) != expectedVersion) {
        qCDebug(KRECENTFOLDERS_LOG) << filePath << "has XBEL version" << root.attribute(versionAttribute) << "reading it anyway";
    }

    qCDebug(KRECENTFOLDERS_LOG) << "Loaded" << entryCount() << "bookmarks from" << filePath;
    return true;
}

bool BookmarkDocument::save()
{
    if (m_document.isNull() || m_filePath.isEmpty()) {
        setError(PersistFailure, i18n("There is no bookmark file to write."));
        return false;
    }

    // Won't help against GTK applications, but we can be good citizens ourselves
    QLockFile lockFile(m_filePath + QLatin1String(".lock"));
    lockFile.setStaleLockTime(0);
    if (!lockFile.tryLock(100)) { // give it 100ms
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to lock" << m_filePath;
        setError(PersistFailure, i18n("The bookmark file %1 is locked by another application.", m_filePath));
        return false;
    }

    // always written as UTF-8, whatever the declaration we parsed said
    QDomNode first = m_document.firstChild();
    if (first.isProcessingInstruction() && first.nodeName() == QLatin1String("xml")) {
        const QDomNode declaration = first;
        first = first.nextSibling();
        m_document.removeChild(declaration);
    }
    m_document.insertBefore(m_document.createProcessingInstruction(QStringLiteral("xml"), QStringLiteral("version=\"1.0\" encoding=\"UTF-8\"")), first);

    QSaveFile output(m_filePath);
    if (!output.open(QIODevice::WriteOnly)) {
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to open" << m_filePath << "for writing:" << output.errorString();
        setError(PersistFailure, i18n("Could not write the bookmark file %1: %2", m_filePath, output.errorString()));
        return false;
    }

    if (output.write(m_document.toByteArray(2)) == -1 || !output.commit()) {
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to write" << m_filePath << output.errorString();
        setError(PersistFailure, i18n("Could not write the bookmark file %1: %2", m_filePath, output.errorString()));
        return false;
    }

    setError(NoError, QString());
    return true;
}

void BookmarkDocument::clearEntries()
{
    QDomElement root = rootElement();
    QDomElement bookmark = root.firstChildElement(bookmarkTag);
    while (!bookmark.isNull()) {
        const QDomElement next = bookmark.nextSiblingElement(bookmarkTag);
        root.removeChild(bookmark);
        bookmark = next;
    }
}

QStringList BookmarkDocument::hrefs() const
{
    QStringList ret;
    const QDomElement root = rootElement();
    for (QDomElement bookmark = root.firstChildElement(bookmarkTag); !bookmark.isNull(); bookmark = bookmark.nextSiblingElement(bookmarkTag)) {
        ret.append(bookmark.attribute(hrefAttribute));
    }
    return ret;
}

int BookmarkDocument::entryCount() const
{
    int count = 0;
    const QDomElement root = rootElement();
    for (QDomElement bookmark = root.firstChildElement(bookmarkTag); !bookmark.isNull(); bookmark = bookmark.nextSiblingElement(bookmarkTag)) {
        ++count;
    }
    return count;
}

QString BookmarkDocument::filePath() const
{
    return m_filePath;
}

BookmarkDocument::Error BookmarkDocument::error() const
{
    return m_error;
}

QString BookmarkDocument::errorString() const
{
    return m_errorString;
}

QDomElement BookmarkDocument::rootElement() const
{
    return m_document.documentElement();
}

void BookmarkDocument::setError(Error error, const QString &errorString)
{
    m_error = error;
    m_errorString = errorString;
}

} // namespace KRecentFolders
