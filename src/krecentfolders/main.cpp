/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "krecentfolders_app_debug.h"
#include "krecentfolders_version.h"

#include <dialoginterface.h>
#include <launcher.h>
#include <recentfolderscontroller.h>
#include <settings.h>

#include <KAboutData>
#include <KLocalizedString>

#include <QGuiApplication>
#include <QScreen>

int main(int argc, char **argv)
{
    QGuiApplication app(argc, argv);
    KLocalizedString::setApplicationDomain("krecentfolders");

    KAboutData aboutData(QStringLiteral("krecentfolders"),
                         i18n("Recent Folders"),
                         QStringLiteral(KRECENTFOLDERS_VERSION_STRING),
                         i18n("Opens one of the recently used folders in the file manager"),
                         KAboutLicense::GPL);
    KAboutData::setApplicationData(aboutData);

    QSize screenSize;
    if (QScreen *screen = QGuiApplication::primaryScreen()) {
        screenSize = screen->size();
    } else {
        qCWarning(KRECENTFOLDERS_APP_LOG) << "No primary screen, leaving the chooser size to the dialog";
    }

    const KRecentFolders::Settings settings;
    qCDebug(KRECENTFOLDERS_APP_LOG) << "Using bookmark file" << settings.bookmarkFile();

    KRecentFolders::ZenityDialogs dialogs(settings.chooserProgram());
    KRecentFolders::Launcher launcher(settings.openerProgram());
    KRecentFolders::RecentFoldersController controller(settings.bookmarkFile(), &dialogs, &launcher, screenSize);

    return controller.exec();
}
