#include <BackupWriter.hpp>
#include <JsonSupport.hpp>
#include <Strings.hpp>

#include <QDebug>
#include <QSaveFile>

BackupWriter::BackupWriter(GoalService* service, QObject* parent) : QObject(parent), service(service) {
    if (service == nullptr)
        qCritical("BackupWriter created with a nullptr for GoalService! This won't end well.");
}

std::optional<QJsonDocument> BackupWriter::collect(QDateTime takenAt) {
    emit progress(QStringLiteral("Fetching active goals..."));
    auto activeGoals = service->goals();
    if (!activeGoals.has_value()) {
        qCritical("Failed to fetch active goals");
        return {};
    }

    emit progress(QStringLiteral("Fetching archived goals..."));
    auto archivedGoals = service->archivedGoals();
    if (!archivedGoals.has_value()) {
        qCritical("Failed to fetch archived goals");
        return {};
    }

    const auto totalGoals = activeGoals->size() + archivedGoals->size();
    emit progress(QStringLiteral("Found %1 active goals and %2 archived goals")
                  .arg(activeGoals->size()).arg(archivedGoals->size()));

    int processed = 0;
    // Pair each goal with its full history; kind is "active" or "archived", for messages
    auto withDatapoints = [this, &processed, totalGoals](const QList<GoalSummary>& goals,
                                                         const QString& kind) -> std::optional<QJsonArray> {
        QJsonArray result;
        for (const auto& goal : goals) {
            ++processed;
            emit progress(QStringLiteral("Fetching datapoints for %1 goal: %2 (%3/%4)")
                          .arg(kind, goal.slug).arg(processed).arg(totalGoals));
            auto datapoints = service->datapoints(goal.slug, Strings::Timestamp, 0);
            if (!datapoints.has_value()) {
                qCritical().noquote() << QStringLiteral("Failed to fetch datapoints for %1 goal: %2")
                                         .arg(kind, goal.slug);
                return {};
            }
            emit progress(QStringLiteral("  Found %1 datapoints").arg(datapoints->size()));
            result.append(QJsonObject{{Strings::Goal, Convert<GoalSummary>::toJsonObject(goal)},
                                      {Strings::Datapoints, Convert<Datapoint>::toJsonArray(*datapoints)}});
        }
        return result;
    };

    auto active = withDatapoints(*activeGoals, Strings::Active);
    if (!active.has_value())
        return {};
    auto archived = withDatapoints(*archivedGoals, Strings::Archived);
    if (!archived.has_value())
        return {};

    QJsonObject metadata{{Strings::BackupTimestamp, takenAt.toUTC().toString(Qt::ISODate)},
                         {Strings::BeelineVersion, QStringLiteral(BEELINE_VERSION)}};
    QJsonObject goals{{Strings::Active, *active}, {Strings::Archived, *archived}};
    return QJsonDocument(QJsonObject{{Strings::Metadata, metadata}, {Strings::Goals, goals}});
}

bool BackupWriter::write(QString filename) {
    emit progress(QStringLiteral("Starting backup..."));
    auto backup = collect(QDateTime::currentDateTimeUtc());
    if (!backup.has_value())
        return false;

    emit progress(QStringLiteral("Writing backup to file: %1").arg(filename));
    QSaveFile file(filename);
    if (!file.open(QIODevice::WriteOnly)) {
        qCritical().noquote() << QStringLiteral("Failed to create backup file %1: %2").arg(filename, file.errorString());
        return false;
    }
    auto json = backup->toJson(QJsonDocument::Indented);
    if (file.write(json) != json.size() || !file.commit()) {
        qCritical().noquote() << QStringLiteral("Failed to write backup data to file %1: %2")
                                 .arg(filename, file.errorString());
        return false;
    }

    emit progress(QStringLiteral("Backup completed successfully! Saved to: %1").arg(filename));
    return true;
}
