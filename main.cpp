#include <BackupWriter.hpp>
#include <BeeminderClient.hpp>
#include <Configuration.hpp>
#include <DatapointTable.hpp>
#include <Console.hpp>
#include <EditSession.hpp>
#include <EditorLauncher.hpp>
#include <GoalList.hpp>
#include <Strings.hpp>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QSet>
#include <QSettings>
#include <QSysInfo>
#include <QUuid>

namespace {
bool listGoals(GoalService& service) {
    auto goals = service.goals();
    if (!goals.has_value()) {
        qCritical("Failed to fetch goals");
        return false;
    }

    auto zone = QTimeZone::systemTimeZone();
    auto today = QDateTime::currentDateTime().toTimeZone(zone).date();
    sortGoals(*goals, today, zone);
    bool color = Console::colorEnabled();
    for (const auto& goal : *goals)
        Console::print(formatGoal(goal, hasEntryToday(goal, today, zone), color));
    return true;
}

bool addDatapoint(GoalService& service, QString goal, QString valueText, QString comment) {
    bool ok = false;
    double value = valueText.toDouble(&ok);
    if (!ok) {
        qCritical().noquote() << QStringLiteral("Invalid value '%1' for goal '%2'").arg(valueText, goal);
        return false;
    }

    NewDatapoint datapoint{QDateTime::currentDateTimeUtc(), value, comment,
                           QUuid::createUuid().toString(QUuid::WithoutBraces)};
    auto created = service.createDatapoint(goal, datapoint);
    if (!created.has_value())
        return false;
    Console::print(QStringLiteral("Added datapoint %1 to goal '%2'.").arg(formatValue(value), goal));
    return true;
}
}

int main(int argc, char *argv[]) {
    // Install the Console as the log message handler
    qInstallMessageHandler(&Console::messageHandler);

    // On Windows, use an ini file for persistence rather than the registry
    if (QSet<QString>{QStringLiteral("winrt"), QStringLiteral("windows")}.contains(QSysInfo::productType()))
        QSettings::setDefaultFormat(QSettings::IniFormat);

    QCoreApplication app(argc, argv);
    app.setApplicationName(Strings::ApplicationName);
    app.setApplicationVersion(QStringLiteral(BEELINE_VERSION));
    app.setOrganizationName(Strings::OrganizationName);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("A command-line client for Beeminder goals"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption verboseOption(QStringList{QStringLiteral("V"), QStringLiteral("verbose")},
                                     QStringLiteral("Log debugging information to stderr."));
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of: list, add <goal> <value> [comment], edit <goal>, "
                                                "backup [filename]"));
    parser.process(app);
    Console::setVerbose(parser.isSet(verboseOption));

    auto arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        qCritical("No command given");
        parser.showHelp(1);
    }
    auto command = arguments.takeFirst();

    // Check arity before any configuration or network access
    bool arityOk = false;
    if (command == Strings::List)
        arityOk = arguments.isEmpty();
    else if (command == Strings::Add)
        arityOk = arguments.size() == 2 || arguments.size() == 3;
    else if (command == Strings::Edit)
        arityOk = arguments.size() == 1;
    else if (command == Strings::Backup)
        arityOk = arguments.size() <= 1;
    else {
        qCritical().noquote() << QStringLiteral("Unknown command '%1'").arg(command);
        parser.showHelp(1);
    }
    if (!arityOk) {
        qCritical().noquote() << QStringLiteral("Wrong number of arguments for '%1'").arg(command);
        parser.showHelp(1);
    }

    auto config = Configuration::load();
    if (!config.has_value())
        return 1;
    qDebug() << "Using API at" << config->apiBaseUrl << "and editor" << config->editor;

    BeeminderClient client(config->apiKey, config->apiBaseUrl);
    bool success = false;

    if (command == Strings::List) {
        success = listGoals(client);
    } else if (command == Strings::Add) {
        success = addDatapoint(client, arguments[0], arguments[1], arguments.value(2));
    } else if (command == Strings::Edit) {
        EditorLauncher launcher(config->editor);
        EditSession session(&client, [&launcher](const QString& path) { return launcher.edit(path); });
        session.setRecentCount(config->recentCount);
        QObject::connect(&session, &EditSession::progress, &Console::print);
        QObject::connect(&session, &EditSession::rowRejected, [](QString message) {
            qWarning().noquote() << message;
        });
        success = session.run(arguments[0]);
    } else if (command == Strings::Backup) {
        BackupWriter writer(&client);
        QObject::connect(&writer, &BackupWriter::progress, &Console::print);
        success = writer.write(arguments.value(0, Strings::DefaultBackupFile));
    }

    return success? 0 : 1;
}
