/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef MOCKDIALOGINTERFACE_H
#define MOCKDIALOGINTERFACE_H

#include <dialoginterface.h>
#include <launcher.h>

#include <QList>
#include <QMetaType>

using KRecentFolders::ProcessResult;

Q_DECLARE_METATYPE(KRecentFolders::ProcessResult)

static inline ProcessResult processSuccess(const QString &output = QString())
{
    ProcessResult result;
    result.status = ProcessResult::Success;
    result.exitCode = 0;
    result.output = output;
    return result;
}

static inline ProcessResult processNonZeroExit(int exitCode = 1)
{
    ProcessResult result;
    result.status = ProcessResult::NonZeroExit;
    result.exitCode = exitCode;
    return result;
}

static inline ProcessResult processSpawnFailure()
{
    ProcessResult result;
    result.status = ProcessResult::SpawnFailure;
    result.errorString = QStringLiteral("No such file or directory");
    return result;
}

class MockDialogInterface : public KRecentFolders::DialogInterface
{
public:
    ProcessResult chooseFromList(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size) override
    {
        Q_UNUSED(prompt)
        Q_UNUSED(column)
        m_titles << title;
        m_choiceCalls << choices;
        m_sizes << size;
        // nothing scripted anymore: behave as if the user closed the window
        return m_chooserResults.isEmpty() ? processNonZeroExit() : m_chooserResults.takeFirst();
    }

    ProcessResult askQuestion(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel) override
    {
        Q_UNUSED(title)
        Q_UNUSED(text)
        m_questionLabels << acceptLabel << rejectLabel;
        ++m_questionCalls;
        return m_questionResult;
    }

    void showError(const QString &title, const QString &text) override
    {
        Q_UNUSED(title)
        m_errors << text;
    }

    QList<ProcessResult> m_chooserResults;
    ProcessResult m_questionResult = processNonZeroExit();

    QStringList m_titles;
    QList<QStringList> m_choiceCalls;
    QList<QSize> m_sizes;
    QStringList m_questionLabels;
    int m_questionCalls = 0;
    QStringList m_errors;
};

class MockLauncher : public KRecentFolders::Launcher
{
public:
    bool open(const QString &path) override
    {
        m_opened << resolvePath(path);
        return m_retVal;
    }

    void setRetVal(bool b) { m_retVal = b; }

    QStringList m_opened;

private:
    bool m_retVal = true;
};

#endif // MOCKDIALOGINTERFACE_H
