/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_LAUNCHER_H
#define KRECENTFOLDERS_LAUNCHER_H

#include "krecentfolderscore_export.h"

#include <QString>

namespace KRecentFolders
{
/*!
 * \class KRecentFolders::Launcher
 *
 * \brief Opens a folder with the default application, without waiting for it.
 */
class KRECENTFOLDERSCORE_EXPORT Launcher
{
public:
    explicit Launcher(const QString &openerProgram = QStringLiteral("xdg-open"));
    virtual ~Launcher();

    /*!
     * Starts the opener program on resolvePath(\a path), detached.
     *
     * Returns \c false if the program could not be started.
     */
    virtual bool open(const QString &path);

    /*!
     * Expands a leading "~" or "~user" in \a path.
     */
    static QString resolvePath(const QString &path);

    QString openerProgram() const;

private:
    QString m_openerProgram;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_LAUNCHER_H
