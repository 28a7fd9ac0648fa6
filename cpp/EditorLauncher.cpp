#include <EditorLauncher.hpp>

#include <QDebug>
#include <QProcess>

bool EditorLauncher::edit(const QString& filePath) const {
    auto arguments = QProcess::splitCommand(m_command);
    if (arguments.isEmpty()) {
        qCritical() << "Failed to open editor: no editor command is configured";
        return false;
    }
    auto program = arguments.takeFirst();
    arguments.append(filePath);

    // The editor needs the terminal, so don't capture any of its channels
    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);

    qDebug() << "Launching editor" << program << arguments;
    process.start(program, arguments);
    if (!process.waitForStarted(-1)) {
        qCritical().noquote() << QStringLiteral("Failed to open editor '%1': %2").arg(program, process.errorString());
        return false;
    }
    process.waitForFinished(-1);

    if (process.exitStatus() != QProcess::NormalExit) {
        qCritical().noquote() << QStringLiteral("Editor '%1' crashed: %2").arg(program, process.errorString());
        return false;
    }
    if (process.exitCode() != 0) {
        qCritical().noquote() << QStringLiteral("Editor '%1' exited with status %2").arg(program)
                                 .arg(process.exitCode());
        return false;
    }
    return true;
}
