/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_FOLDERPICKER_H
#define KRECENTFOLDERS_FOLDERPICKER_H

#include "krecentfolderscore_export.h"

#include <QSize>
#include <QString>
#include <QStringList>

namespace KRecentFolders
{
class DialogInterface;
struct FolderList;

/*!
 * \class KRecentFolders::FolderPicker
 *
 * \brief Lets the user pick one of the recent folders.
 *
 * The list offered always starts with the home folder and ends with
 * clearMarker(), which asks for the history to be wiped instead of
 * opening a folder.
 */
class KRECENTFOLDERSCORE_EXPORT FolderPicker
{
public:
    /*!
     * \value Chosen A folder was chosen, see Selection::path
     * \value ClearRequested The user picked the clear marker
     * \value Dismissed The user closed the chooser without choosing
     * \value Failed The chooser could not be shown
     */
    enum Action {
        Chosen,
        ClearRequested,
        Dismissed,
        Failed,
    };

    struct Selection {
        Action action = Dismissed;
        QString path;
        QString errorString;
    };

    /*!
     * \value Confirmed The user accepted to clear the history
     * \value Aborted The user declined or closed the question
     * \value ConfirmationFailed The question could not be shown
     */
    enum Confirmation {
        Confirmed,
        Aborted,
        ConfirmationFailed,
    };

    /*!
     * \a dialogs must outlive the picker. \a screenSize is the size of the
     * primary display, used to size the chooser.
     */
    FolderPicker(DialogInterface *dialogs, const QSize &screenSize);

    /*!
     * Shows the chooser for \a folderList and waits for the user.
     */
    Selection pick(const FolderList &folderList);

    /*!
     * Asks the user to confirm that the recent folders should be deleted.
     */
    Confirmation confirmClear();

    /*!
     * The rows of the chooser: home folder, \a folders, then clearMarker().
     */
    static QStringList choices(const QStringList &folders);

    /*!
     * Width is 80% of the screen width, or eight times \a maxPathLength if
     * that is smaller. Height is 80% of the screen height.
     */
    static QSize chooserSize(const QSize &screenSize, int maxPathLength);

    static QString clearMarker();

    /*!
     * The home folder as offered in the list, with a trailing slash.
     */
    static QString homeFolder();

    /*!
     * Window title, holding the program name and version.
     */
    static QString windowTitle();

private:
    DialogInterface *const m_dialogs;
    const QSize m_screenSize;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_FOLDERPICKER_H
