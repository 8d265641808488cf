/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "settings.h"

#include <KConfigGroup>

#include <QStandardPaths>

namespace KRecentFolders
{
Settings::Settings(KSharedConfig::Ptr config)
    : m_config(std::move(config))
{
}

QString Settings::bookmarkFile() const
{
    const KConfigGroup cg(m_config, QStringLiteral("General"));
    const QString file = cg.readPathEntry("BookmarkFile", QString());
    return file.isEmpty() ? defaultBookmarkFile() : file;
}

QString Settings::chooserProgram() const
{
    const KConfigGroup cg(m_config, QStringLiteral("General"));
    return cg.readEntry("ChooserProgram", QStringLiteral("zenity"));
}

QString Settings::openerProgram() const
{
    const KConfigGroup cg(m_config, QStringLiteral("General"));
    return cg.readEntry("OpenerProgram", QStringLiteral("xdg-open"));
}

QString Settings::defaultBookmarkFile()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QLatin1String("/recently-used.xbel");
}

} // namespace KRecentFolders
