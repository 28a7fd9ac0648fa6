#pragma once

#include <GoalService.hpp>

#include <QDateTime>
#include <QJsonDocument>
#include <QObject>

#include <optional>

/*!
 * \brief Saves all of the user's goals and their complete datapoint histories to a JSON file
 *
 * The document holds a metadata object (when the backup was taken and by which version) and a goals object with an
 * active and an archived array. Each array entry pairs a goal summary with all of the goal's datapoints, sorted by
 * timestamp as the server returns them.
 */
class BackupWriter : public QObject {
    Q_OBJECT

    GoalService* service;

public:
    explicit BackupWriter(GoalService* service, QObject* parent = nullptr);

    /**
     * @brief Fetch everything to back up and assemble the backup document
     * @param takenAt The time to record as when the backup was taken
     * @return The document, or null if any fetch failed
     */
    std::optional<QJsonDocument> collect(QDateTime takenAt);

    /**
     * @brief Collect a backup and write it to a file, replacing the file only once the backup is complete
     * @return True if the backup was written
     */
    bool write(QString filename);

signals:
    //! Emitted as each stage of the backup begins or finishes
    void progress(QString message);
};
