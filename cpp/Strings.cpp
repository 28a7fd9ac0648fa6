#include <Strings.hpp>

const QString Strings::ApplicationName = QStringLiteral("beeline");
const QString Strings::OrganizationName = QStringLiteral("Beeline");

const QString Strings::DefaultApiUrl = QStringLiteral("https://www.beeminder.com/api/v1/");
const QString Strings::GetGoals = QStringLiteral("users/me/goals.json");
const QString Strings::GetArchivedGoals = QStringLiteral("users/me/goals/archived.json");
const QString Strings::GoalDatapoints = QStringLiteral("users/me/goals/%1/datapoints.json");
const QString Strings::GoalDatapoint = QStringLiteral("users/me/goals/%1/datapoints/%2.json");

const QString Strings::AuthToken = QStringLiteral("auth_token");
const QString Strings::Sort = QStringLiteral("sort");
const QString Strings::Count = QStringLiteral("count");
const QString Strings::Timestamp = QStringLiteral("timestamp");

const QString Strings::TableHeader = QStringLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID");
const QString Strings::TimestampFormat = QStringLiteral("yyyy-MM-dd HH:mm:ss");

const QString Strings::ApiKeyVariable = QStringLiteral("BEEMINDER_API_KEY");
const QString Strings::ApiUrlVariable = QStringLiteral("BEEMINDER_API_URL");
const QString Strings::VisualVariable = QStringLiteral("VISUAL");
const QString Strings::EditorVariable = QStringLiteral("EDITOR");
const QString Strings::NoColorVariable = QStringLiteral("NO_COLOR");

const QString Strings::ApiUrlSetting = QStringLiteral("api/baseUrl");
const QString Strings::EditorSetting = QStringLiteral("edit/editor");
const QString Strings::RecentCountSetting = QStringLiteral("edit/recentCount");

const QString Strings::DefaultEditor = QStringLiteral("nvim");
const QString Strings::DefaultBackupFile = QStringLiteral("beedata.json");

const QString Strings::Metadata = QStringLiteral("metadata");
const QString Strings::BackupTimestamp = QStringLiteral("backup_timestamp");
const QString Strings::BeelineVersion = QStringLiteral("beeline_version");
const QString Strings::Goals = QStringLiteral("goals");
const QString Strings::Active = QStringLiteral("active");
const QString Strings::Archived = QStringLiteral("archived");
const QString Strings::Goal = QStringLiteral("goal");
const QString Strings::Datapoints = QStringLiteral("datapoints");

const QString Strings::List = QStringLiteral("list");
const QString Strings::Add = QStringLiteral("add");
const QString Strings::Edit = QStringLiteral("edit");
const QString Strings::Backup = QStringLiteral("backup");
