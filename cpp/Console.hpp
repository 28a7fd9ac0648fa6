#pragma once

#include <QString>
#include <QtGlobal>

/*!
 * \brief The terminal beeline talks to
 *
 * Qt log messages are routed here by installing messageHandler(). Warnings and errors always go to stderr with a
 * level prefix; debug and info messages only in verbose mode. Lines meant as the command's output go to stdout
 * through print().
 */
class Console {
public:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message);

    static bool verbose();
    static void setVerbose(bool verbose);

    //! True if stdout is a terminal and the NO_COLOR convention isn't in effect
    static bool colorEnabled();

    //! Print a line of command output to stdout
    static void print(const QString& line);
};
