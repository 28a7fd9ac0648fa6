#pragma once

#include <QString>

/*!
 * \brief Runs the user's text editor on a file and waits for it to exit
 *
 * The command may carry arguments, quoted as QProcess::splitCommand() understands; the file path is appended as the
 * last argument. The editor shares this process's terminal.
 */
class EditorLauncher {
    QString m_command;

public:
    explicit EditorLauncher(QString command) : m_command(command) {}

    QString command() const { return m_command; }

    /**
     * @brief Open the file in the editor, blocking until the editor exits
     * @param filePath The file to edit
     * @return True if the editor ran and exited normally with status 0; false otherwise
     */
    bool edit(const QString& filePath) const;
};
