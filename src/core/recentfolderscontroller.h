/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_RECENTFOLDERSCONTROLLER_H
#define KRECENTFOLDERS_RECENTFOLDERSCONTROLLER_H

#include "krecentfolderscore_export.h"

#include "bookmarkdocument.h"
#include "folderpicker.h"

#include <QSize>
#include <QString>

namespace KRecentFolders
{
class DialogInterface;
class Launcher;

/*!
 * \class KRecentFolders::RecentFoldersController
 *
 * \brief Loads the bookmarks, lets the user pick a folder and opens it.
 *
 * Picking the clear marker asks for confirmation, wipes the bookmark file
 * and shows the (now empty) list again. Everything runs synchronously.
 */
class KRECENTFOLDERSCORE_EXPORT RecentFoldersController
{
public:
    /*!
     * \value Loading Reading the bookmark file
     * \value Listing Extracting the folders
     * \value Selecting Waiting for the user to pick a folder
     * \value Clearing Confirming and wiping the history
     * \value Opened A folder was handed to the launcher
     * \value Cancelled The user closed the chooser
     * \value Error Something failed, see errorString()
     */
    enum State {
        Loading,
        Listing,
        Selecting,
        Clearing,
        Opened,
        Cancelled,
        Error,
    };

    /*!
     * \a dialogs and \a launcher must outlive the controller.
     */
    RecentFoldersController(const QString &bookmarkFile, DialogInterface *dialogs, Launcher *launcher, const QSize &screenSize);

    /*!
     * Runs until a folder is opened, the user cancels or an error occurs.
     *
     * Returns the exit code for the process: 0 when a folder was opened or
     * the user cancelled, 1 on error.
     */
    int exec();

    State state() const;
    QString errorString() const;

    /*!
     * The folder handed to the launcher, if any.
     */
    QString openedPath() const;

    const BookmarkDocument &document() const;

private:
    int fail(const QString &errorString);
    bool clearHistory();

    QString m_bookmarkFile;
    DialogInterface *const m_dialogs;
    Launcher *const m_launcher;
    FolderPicker m_picker;
    BookmarkDocument m_document;
    State m_state = Loading;
    QString m_errorString;
    QString m_openedPath;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_RECENTFOLDERSCONTROLLER_H
