#include <Configuration.hpp>
#include <Strings.hpp>

#include <QDebug>

namespace {
QString firstSet(const QProcessEnvironment& environment, std::initializer_list<QString> names) {
    for (const auto& name : names) {
        auto value = environment.value(name);
        if (!value.isEmpty())
            return value;
    }
    return {};
}
}

std::optional<Configuration> Configuration::load(const QProcessEnvironment& environment, const QSettings& settings) {
    Configuration config;

    config.apiKey = environment.value(Strings::ApiKeyVariable);
    if (config.apiKey.isEmpty()) {
        qCritical().noquote() << QStringLiteral("Please create environment variable %1").arg(Strings::ApiKeyVariable);
        return {};
    }

    auto url = firstSet(environment, {Strings::ApiUrlVariable});
    if (url.isEmpty())
        url = settings.value(Strings::ApiUrlSetting, Strings::DefaultApiUrl).toString();
    // API paths are resolved relative to the base, which only keeps its last segment if it ends with a slash
    if (!url.endsWith(QLatin1Char('/')))
        url.append(QLatin1Char('/'));
    config.apiBaseUrl = QUrl(url, QUrl::StrictMode);
    if (!config.apiBaseUrl.isValid() || config.apiBaseUrl.isRelative()) {
        qCritical().noquote() << QStringLiteral("Invalid API URL '%1'").arg(url);
        return {};
    }

    config.editor = firstSet(environment, {Strings::VisualVariable, Strings::EditorVariable});
    if (config.editor.isEmpty())
        config.editor = settings.value(Strings::EditorSetting, Strings::DefaultEditor).toString();

    bool ok = false;
    auto recentCount = settings.value(Strings::RecentCountSetting, config.recentCount).toInt(&ok);
    if (!ok || recentCount < 1) {
        qCritical().noquote() << QStringLiteral("Invalid setting %1: '%2' is not a positive number")
                                 .arg(Strings::RecentCountSetting,
                                      settings.value(Strings::RecentCountSetting).toString());
        return {};
    }
    config.recentCount = recentCount;

    qDebug() << "Configuration: API" << config.apiBaseUrl.toString() << "editor" << config.editor
             << "recent count" << config.recentCount << "settings from" << settings.fileName();
    return config;
}

std::optional<Configuration> Configuration::load() {
    QSettings settings(Strings::OrganizationName, Strings::ApplicationName);
    return load(QProcessEnvironment::systemEnvironment(), settings);
}
