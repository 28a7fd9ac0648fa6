#pragma once

#include "TestHarness.hpp"

#include <Configuration.hpp>

#include <QTemporaryDir>

namespace tests {

//! \brief A settings file of its own in a scratch directory
struct ScratchSettings {
    QTemporaryDir directory;
    QSettings settings{directory.filePath(QStringLiteral("beeline.ini")), QSettings::IniFormat};
};

static QProcessEnvironment environmentWithKey() {
    QProcessEnvironment environment;
    environment.insert(QStringLiteral("BEEMINDER_API_KEY"), QStringLiteral("secret"));
    return environment;
}

static bool configurationRequiresApiKey() {
    ScratchSettings scratch;
    EXPECT(!Configuration::load(QProcessEnvironment(), scratch.settings).has_value(), "no key, no configuration");
    return true;
}

static bool configurationDefaults() {
    ScratchSettings scratch;
    auto config = Configuration::load(environmentWithKey(), scratch.settings);
    EXPECT(config.has_value(), "key alone is enough");
    EXPECT_EQ(config->apiKey, QStringLiteral("secret"), "api key");
    EXPECT_EQ(config->apiBaseUrl.toString(), QStringLiteral("https://www.beeminder.com/api/v1/"), "default API");
    EXPECT_EQ(config->editor, QStringLiteral("nvim"), "default editor");
    EXPECT_EQ(config->recentCount, 20, "default recent count");
    return true;
}

static bool configurationEnvironmentWinsOverSettings() {
    ScratchSettings scratch;
    scratch.settings.setValue(QStringLiteral("api/baseUrl"), QStringLiteral("https://settings.example/api"));
    scratch.settings.setValue(QStringLiteral("edit/editor"), QStringLiteral("nano"));
    auto environment = environmentWithKey();

    auto config = Configuration::load(environment, scratch.settings);
    EXPECT(config.has_value(), "configuration loads");
    EXPECT_EQ(config->apiBaseUrl.toString(), QStringLiteral("https://settings.example/api/"),
              "settings URL, with trailing slash added");
    EXPECT_EQ(config->editor, QStringLiteral("nano"), "settings editor");

    environment.insert(QStringLiteral("BEEMINDER_API_URL"), QStringLiteral("http://localhost:3000/api/v1/"));
    environment.insert(QStringLiteral("EDITOR"), QStringLiteral("vi"));
    config = Configuration::load(environment, scratch.settings);
    EXPECT_EQ(config->apiBaseUrl.toString(), QStringLiteral("http://localhost:3000/api/v1/"), "environment URL");
    EXPECT_EQ(config->editor, QStringLiteral("vi"), "EDITOR beats settings");

    environment.insert(QStringLiteral("VISUAL"), QStringLiteral("code --wait"));
    config = Configuration::load(environment, scratch.settings);
    EXPECT_EQ(config->editor, QStringLiteral("code --wait"), "VISUAL beats EDITOR");
    return true;
}

static bool configurationRejectsBadSettings() {
    ScratchSettings scratch;
    scratch.settings.setValue(QStringLiteral("edit/recentCount"), QStringLiteral("lots"));
    EXPECT(!Configuration::load(environmentWithKey(), scratch.settings).has_value(), "non-numeric count");
    scratch.settings.setValue(QStringLiteral("edit/recentCount"), 0);
    EXPECT(!Configuration::load(environmentWithKey(), scratch.settings).has_value(), "zero count");
    scratch.settings.setValue(QStringLiteral("edit/recentCount"), 50);
    auto config = Configuration::load(environmentWithKey(), scratch.settings);
    EXPECT(config.has_value() && config->recentCount == 50, "configured count");

    auto environment = environmentWithKey();
    environment.insert(QStringLiteral("BEEMINDER_API_URL"), QStringLiteral("not a url"));
    EXPECT(!Configuration::load(environment, scratch.settings).has_value(), "relative API URL");
    return true;
}

inline void runConfigurationTests() {
    RUN_TEST(configurationRequiresApiKey);
    RUN_TEST(configurationDefaults);
    RUN_TEST(configurationEnvironmentWinsOverSettings);
    RUN_TEST(configurationRejectsBadSettings);
}

} // namespace tests
