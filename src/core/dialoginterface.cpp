/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#include "dialoginterface.h"

#include "krecentfolders_debug.h"

namespace KRecentFolders
{
// fixed, the question only holds a couple of lines
static const int s_questionWidth = 360;
static const int s_questionHeight = 120;

DialogInterface::~DialogInterface() = default;

ZenityDialogs::ZenityDialogs(const QString &program)
    : m_program(program)
{
}

QStringList ZenityDialogs::listArguments(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size)
{
    QStringList args{QStringLiteral("--list"), QStringLiteral("--title=") + title, QStringLiteral("--text=") + prompt};
    if (size.width() > 0) {
        args << QStringLiteral("--width=%1").arg(size.width());
    }
    if (size.height() > 0) {
        args << QStringLiteral("--height=%1").arg(size.height());
    }
    args << QStringLiteral("--column=") + column;
    args << choices;
    return args;
}

QStringList ZenityDialogs::questionArguments(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel)
{
    return QStringList{
        QStringLiteral("--question"),
        QStringLiteral("--icon-name=dialog-warning"),
        QStringLiteral("--width=%1").arg(s_questionWidth),
        QStringLiteral("--height=%1").arg(s_questionHeight),
        QStringLiteral("--title=") + title,
        QStringLiteral("--text=") + text,
        QStringLiteral("--ok-label=") + acceptLabel,
        QStringLiteral("--cancel-label=") + rejectLabel,
    };
}

ProcessResult ZenityDialogs::chooseFromList(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size)
{
    return runProcess(m_program, listArguments(title, prompt, column, choices, size));
}

ProcessResult ZenityDialogs::askQuestion(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel)
{
    return runProcess(m_program, questionArguments(title, text, acceptLabel, rejectLabel));
}

void ZenityDialogs::showError(const QString &title, const QString &text)
{
    const ProcessResult result = runProcess(m_program, {QStringLiteral("--error"), QStringLiteral("--title=") + title, QStringLiteral("--text=") + text});
    if (result.status == ProcessResult::SpawnFailure) {
        qCWarning(KRECENTFOLDERS_LOG) << "Could not show error dialog:" << result.errorString;
    }
}

} // namespace KRecentFolders
