/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_PROCESSRUNNER_H
#define KRECENTFOLDERS_PROCESSRUNNER_H

#include "krecentfolderscore_export.h"

#include <QString>
#include <QStringList>

namespace KRecentFolders
{
/*!
 * Outcome of a blocking external program invocation.
 */
struct ProcessResult {
    /*!
     * \value Success The program ran and exited with status 0
     * \value NonZeroExit The program ran but exited with another status, or crashed
     * \value SpawnFailure The program could not be started at all
     */
    enum Status {
        Success,
        NonZeroExit,
        SpawnFailure,
    };

    Status status = SpawnFailure;
    int exitCode = -1;
    /*!
     * Standard output, without its trailing line terminator.
     */
    QString output;
    QString errorString;
};

/*!
 * Runs \a program with \a arguments and waits, without timeout, until it exits.
 * Standard error is forwarded to ours.
 */
KRECENTFOLDERSCORE_EXPORT ProcessResult runProcess(const QString &program, const QStringList &arguments);

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_PROCESSRUNNER_H
