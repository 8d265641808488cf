/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_SETTINGS_H
#define KRECENTFOLDERS_SETTINGS_H

#include "krecentfolderscore_export.h"

#include <KSharedConfig>

#include <QString>

namespace KRecentFolders
{
/*!
 * \class KRecentFolders::Settings
 *
 * \brief Read access to the "General" group of krecentfoldersrc.
 *
 * \list
 * \li BookmarkFile: the XBEL file to read, defaults to defaultBookmarkFile()
 * \li ChooserProgram: zenity compatible dialog program, defaults to "zenity"
 * \li OpenerProgram: program opening the chosen folder, defaults to "xdg-open"
 * \endlist
 */
class KRECENTFOLDERSCORE_EXPORT Settings
{
public:
    explicit Settings(KSharedConfig::Ptr config = KSharedConfig::openConfig());

    QString bookmarkFile() const;
    QString chooserProgram() const;
    QString openerProgram() const;

    /*!
     * The per-user recently-used.xbel shared by KDE and GTK applications.
     */
    static QString defaultBookmarkFile();

private:
    KSharedConfig::Ptr m_config;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_SETTINGS_H
