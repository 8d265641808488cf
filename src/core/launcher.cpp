/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "launcher.h"

#include "krecentfolders_debug.h"

#include <KShell>

#include <QProcess>

namespace KRecentFolders
{
Launcher::Launcher(const QString &openerProgram)
    : m_openerProgram(openerProgram)
{
}

Launcher::~Launcher() = default;

bool Launcher::open(const QString &path)
{
    const QString resolved = resolvePath(path);
    qCDebug(KRECENTFOLDERS_LOG) << "Opening" << resolved << "with" << m_openerProgram;

    if (!QProcess::startDetached(m_openerProgram, QStringList{resolved})) {
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to start" << m_openerProgram << "for" << resolved;
        return false;
    }
    return true;
}

QString Launcher::resolvePath(const QString &path)
{
    return KShell::tildeExpand(path);
}

QString Launcher::openerProgram() const
{
    return m_openerProgram;
}

} // namespace KRecentFolders
