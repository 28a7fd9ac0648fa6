#pragma once

#include <QString>

// Namespace struct containing constant static QStrings for API paths, JSON keys, environment variables, settings
// keys, etc.
struct Strings {
    // Pre-define commonly used strings to avoid typos and make program faster

    const static QString ApplicationName;
    const static QString OrganizationName;

    // API calls, relative to the API base URL
    const static QString DefaultApiUrl;
    const static QString GetGoals;
    const static QString GetArchivedGoals;
    const static QString GoalDatapoints;
    const static QString GoalDatapoint;

    // Query parameters and sort keys
    const static QString AuthToken;
    const static QString Sort;
    const static QString Count;
    const static QString Timestamp;

    // Editable datapoint table
    const static QString TableHeader;
    const static QString TimestampFormat;

    // Environment variables
    const static QString ApiKeyVariable;
    const static QString ApiUrlVariable;
    const static QString VisualVariable;
    const static QString EditorVariable;
    const static QString NoColorVariable;

    // Settings keys
    const static QString ApiUrlSetting;
    const static QString EditorSetting;
    const static QString RecentCountSetting;

    // Defaults
    const static QString DefaultEditor;
    const static QString DefaultBackupFile;

    // Backup document keys
    const static QString Metadata;
    const static QString BackupTimestamp;
    const static QString BeelineVersion;
    const static QString Goals;
    const static QString Active;
    const static QString Archived;
    const static QString Goal;
    const static QString Datapoints;

    // Command names
    const static QString List;
    const static QString Add;
    const static QString Edit;
    const static QString Backup;
};

// Helpers to generate the API paths for a goal's datapoints
inline QString goalDatapointsPath(QString goal) {
    return Strings::GoalDatapoints.arg(goal);
}
inline QString goalDatapointPath(QString goal, QString id) {
    return Strings::GoalDatapoint.arg(goal, id);
}
