/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "processrunner.h"

#include "krecentfolders_debug.h"

#include <QProcess>

namespace KRecentFolders
{
ProcessResult runProcess(const QString &program, const QStringList &arguments)
{
    ProcessResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    qCDebug(KRECENTFOLDERS_LOG) << "Starting process:" << program << arguments;
    process.start(program, arguments);

    if (!process.waitForStarted(-1)) {
        qCWarning(KRECENTFOLDERS_LOG) << "Failed to start" << program << process.errorString();
        result.status = ProcessResult::SpawnFailure;
        result.errorString = process.errorString();
        return result;
    }

    // user dialogs may stay open forever
    process.waitForFinished(-1);

    QString output = QString::fromLocal8Bit(process.readAllStandardOutput());
    if (output.endsWith(QLatin1Char('\n'))) {
        output.chop(1);
        if (output.endsWith(QLatin1Char('\r'))) {
            output.chop(1);
        }
    }
    result.output = output;

    if (process.exitStatus() == QProcess::CrashExit) {
        qCWarning(KRECENTFOLDERS_LOG) << program << "crashed";
        result.status = ProcessResult::NonZeroExit;
        result.errorString = process.errorString();
        return result;
    }

    result.exitCode = process.exitCode();
    result.status = result.exitCode == 0 ? ProcessResult::Success : ProcessResult::NonZeroExit;
    qCDebug(KRECENTFOLDERS_LOG) << program << "exited with" << result.exitCode;
    return result;
}

} // namespace KRecentFolders
