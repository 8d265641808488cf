/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2026 The KRecentFolders Authors

    SPDX-License-Identifier: LGPL-2.0-or-later
*/

#ifndef KRECENTFOLDERS_DIALOGINTERFACE_H
#define KRECENTFOLDERS_DIALOGINTERFACE_H

#include "krecentfolderscore_export.h"
#include "processrunner.h"

#include <QSize>
#include <QString>
#include <QStringList>

namespace KRecentFolders
{
/*!
 * \class KRecentFolders::DialogInterface
 *
 * \brief The dialogs the folder picker needs from the user.
 *
 * Each call blocks until the user answers. ZenityDialogs is the default
 * implementation; the autotests provide their own.
 */
class KRECENTFOLDERSCORE_EXPORT DialogInterface
{
public:
    virtual ~DialogInterface();

    /*!
     * Shows a single column list of \a choices under the header \a column.
     * On success, the output of the result holds the chosen row.
     *
     * A width or height of zero or less leaves that dimension to the dialog.
     */
    virtual ProcessResult chooseFromList(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size) = 0;

    /*!
     * Asks a warning question. A successful result means the user accepted.
     */
    virtual ProcessResult askQuestion(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel) = 0;

    virtual void showError(const QString &title, const QString &text) = 0;
};

/*!
 * \class KRecentFolders::ZenityDialogs
 *
 * \brief Dialogs shown by running zenity, or a program with the same command line.
 */
class KRECENTFOLDERSCORE_EXPORT ZenityDialogs : public DialogInterface
{
public:
    explicit ZenityDialogs(const QString &program = QStringLiteral("zenity"));

    ProcessResult chooseFromList(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size) override;
    ProcessResult askQuestion(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel) override;
    void showError(const QString &title, const QString &text) override;

    /*!
     * The command line used by chooseFromList(), without the program.
     */
    static QStringList listArguments(const QString &title, const QString &prompt, const QString &column, const QStringList &choices, const QSize &size);

    /*!
     * The command line used by askQuestion(), without the program.
     */
    static QStringList questionArguments(const QString &title, const QString &text, const QString &acceptLabel, const QString &rejectLabel);

private:
    QString m_program;
};

} // namespace KRecentFolders

#endif // KRECENTFOLDERS_DIALOGINTERFACE_H
