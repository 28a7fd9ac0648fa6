#include <Console.hpp>
#include <Strings.hpp>

#include <QTextStream>

#include <atomic>
#include <cstdio>

#include <unistd.h>

// File-local verbosity flag, shared by all message handler invocations
static std::atomic<bool> verboseOutput{false};

bool Console::verbose() { return verboseOutput; }
void Console::setVerbose(bool verbose) { verboseOutput = verbose; }

void Console::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    const char* prefix = "";
    switch (type) {
    case QtDebugMsg:
        prefix = "debug: ";
        break;
    case QtInfoMsg:
        prefix = "info: ";
        break;
    case QtWarningMsg:
        prefix = "warning: ";
        break;
    case QtCriticalMsg:
        prefix = "error: ";
        break;
    case QtFatalMsg:
        prefix = "fatal: ";
        break;
    }

    if ((type == QtDebugMsg || type == QtInfoMsg) && !verbose())
        return;

    QByteArray logLine = message.toLocal8Bit();
    // In verbose mode, say where the message came from, if the build recorded it
    if (verbose() && context.file != nullptr)
        logLine.append(QStringLiteral(" (%1:%2)").arg(QString::fromLocal8Bit(context.file)).arg(context.line)
                       .toLocal8Bit());

    std::fprintf(stderr, "%s%s\n", prefix, logLine.constData());
    std::fflush(stderr);
}

bool Console::colorEnabled() {
    if (qEnvironmentVariableIsSet(Strings::NoColorVariable.toLatin1().constData()))
        return false;
    return isatty(fileno(stdout)) != 0;
}

void Console::print(const QString& line) {
    static QTextStream out(stdout);
    out << line << '\n';
    out.flush();
}
