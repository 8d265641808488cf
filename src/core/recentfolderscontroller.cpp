/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "recentfolderscontroller.h"

#include "dialoginterface.h"
#include "folderextractor.h"
#include "krecentfolders_debug.h"
#include "launcher.h"

#include <KLocalizedString>

namespace KRecentFolders
{
RecentFoldersController::RecentFoldersController(const QString &bookmarkFile, DialogInterface *dialogs, Launcher *launcher, const QSize &screenSize)
    : m_bookmarkFile(bookmarkFile)
    , m_dialogs(dialogs)
    , m_launcher(launcher)
    , m_picker(dialogs, screenSize)
{
}

int RecentFoldersController::exec()
{
    m_state = Loading;
    if (!m_document.load(m_bookmarkFile)) {
        return fail(m_document.errorString());
    }

    while (true) {
        m_state = Listing;
        const FolderList folderList = extractFolders(m_document);

        m_state = Selecting;
        const FolderPicker::Selection selection = m_picker.pick(folderList);

        switch (selection.action) {
        case FolderPicker::Dismissed:
            m_state = Cancelled;
            return 0;
        case FolderPicker::Failed:
            return fail(selection.errorString);
        case FolderPicker::ClearRequested:
            m_state = Clearing;
            if (!clearHistory()) {
                return fail(m_errorString);
            }
            continue;
        case FolderPicker::Chosen:
            if (!m_launcher->open(selection.path)) {
                return fail(i18n("Could not open %1 with %2.", selection.path, m_launcher->openerProgram()));
            }
            m_openedPath = selection.path;
            m_state = Opened;
            return 0;
        }
    }
}

bool RecentFoldersController::clearHistory()
{
    switch (m_picker.confirmClear()) {
    case FolderPicker::Aborted:
        qCDebug(KRECENTFOLDERS_LOG) << "Clearing aborted by the user";
        return true;
    case FolderPicker::ConfirmationFailed:
        m_errorString = i18n("The confirmation dialog could not be started.");
        return false;
    case FolderPicker::Confirmed:
        break;
    }

    m_document.clearEntries();
    if (!m_document.save()) {
        m_errorString = m_document.errorString();
        return false;
    }
    qCDebug(KRECENTFOLDERS_LOG) << "Cleared" << m_document.filePath();
    return true;
}

int RecentFoldersController::fail(const QString &errorString)
{
    m_state = Error;
    m_errorString = errorString;
    qCCritical(KRECENTFOLDERS_LOG) << errorString;
    m_dialogs->showError(FolderPicker::windowTitle(), errorString);
    return 1;
}

RecentFoldersController::State RecentFoldersController::state() const
{
    return m_state;
}

QString RecentFoldersController::errorString() const
{
    return m_errorString;
}

QString RecentFoldersController::openedPath() const
{
    return m_openedPath;
}

const BookmarkDocument &RecentFoldersController::document() const
{
    return m_document;
}

} // namespace KRecentFolders
