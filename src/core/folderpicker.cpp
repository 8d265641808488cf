/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "folderpicker.h"

#include "dialoginterface.h"
#include "folderextractor.h"
#include "krecentfolders_debug.h"
#include "krecentfolders_version.h"

#include <KLocalizedString>

#include <QDir>

#include <algorithm>

namespace KRecentFolders
{
FolderPicker::FolderPicker(DialogInterface *dialogs, const QSize &screenSize)
    : m_dialogs(dialogs)
    , m_screenSize(screenSize)
{
}

FolderPicker::Selection FolderPicker::pick(const FolderList &folderList)
{
    Selection selection;

    const QSize size = chooserSize(m_screenSize, folderList.maxPathLength);
    const ProcessResult result =
        m_dialogs->chooseFromList(windowTitle(), i18n("Select a folder to open:"), i18n("Recent Folders"), choices(folderList.folders), size);

    switch (result.status) {
    case ProcessResult::SpawnFailure:
        selection.action = Failed;
        selection.errorString = i18n("The folder chooser could not be started: %1", result.errorString);
        break;
    case ProcessResult::NonZeroExit:
        qCDebug(KRECENTFOLDERS_LOG) << "Chooser dismissed, exit code" << result.exitCode;
        selection.action = Dismissed;
        break;
    case ProcessResult::Success:
        if (result.output.isEmpty()) {
            // "OK" without any row selected
            selection.action = Dismissed;
        } else if (result.output == clearMarker()) {
            selection.action = ClearRequested;
        } else {
            selection.action = Chosen;
            selection.path = result.output;
        }
        break;
    }

    return selection;
}

FolderPicker::Confirmation FolderPicker::confirmClear()
{
    const ProcessResult result = m_dialogs->askQuestion(windowTitle(),
                                                        i18n("Do you really want to delete the list of recent folders?\nThis cannot be undone."),
                                                        i18nc("@action:button", "Delete"),
                                                        i18nc("@action:button", "Abort"));
    switch (result.status) {
    case ProcessResult::Success:
        return Confirmed;
    case ProcessResult::NonZeroExit:
        return Aborted;
    case ProcessResult::SpawnFailure:
        break;
    }
    qCWarning(KRECENTFOLDERS_LOG) << "Could not ask for confirmation:" << result.errorString;
    return ConfirmationFailed;
}

QStringList FolderPicker::choices(const QStringList &folders)
{
    QStringList ret;
    ret.reserve(folders.size() + 2);
    ret.append(homeFolder());
    ret.append(folders);
    ret.append(clearMarker());
    return ret;
}

QSize FolderPicker::chooserSize(const QSize &screenSize, int maxPathLength)
{
    const int width = std::min(int(screenSize.width() * 0.8), maxPathLength * 8);
    const int height = int(screenSize.height() * 0.8);
    return QSize(width, height);
}

QString FolderPicker::clearMarker()
{
    return QStringLiteral("⚠ ") + i18n("Clear recent folders");
}

QString FolderPicker::homeFolder()
{
    QString home = QDir::homePath();
    if (!home.endsWith(QLatin1Char('/'))) {
        home += QLatin1Char('/');
    }
    return home;
}

QString FolderPicker::windowTitle()
{
    return i18n("Recent Folders %1", QStringLiteral(KRECENTFOLDERS_VERSION_STRING));
}

} // namespace KRecentFolders
