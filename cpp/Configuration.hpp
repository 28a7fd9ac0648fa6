#pragma once

#include <QProcessEnvironment>
#include <QSettings>
#include <QString>
#include <QUrl>

#include <optional>

/*!
 * \brief The settings beeline runs with
 *
 * Each value comes from the environment if set there, otherwise from the user's settings file, otherwise from the
 * built-in default. The API key can only come from the environment.
 */
struct Configuration {
    QString apiKey;
    QUrl apiBaseUrl;
    QString editor;
    int recentCount = 20;

    /**
     * @brief Load the configuration
     * @param environment The environment to read variables from
     * @param settings The settings to fall back on
     * @return The configuration, or null if the API key is missing or a setting is invalid
     */
    static std::optional<Configuration> load(const QProcessEnvironment& environment, const QSettings& settings);
    //! Load the configuration from the process environment and the user's settings
    static std::optional<Configuration> load();
};
