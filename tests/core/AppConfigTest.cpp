#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "todo/core/AppConfig.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/data/TaskList.hpp"

using namespace todo::core;

class AppConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void defaultsToHomeDirectory();
    void failsWithoutUsableHomeDirectory();
    void commandLineWinsOverEnvironment();
    void environmentWinsOverSettings();
    void settingsWinOverHomeDirectory();
    void colorFollowsTerminal();
    void colorCanBeDisabled_data();
    void colorCanBeDisabled();
    void contextLoadsConfiguredFile();

private:
    ConfigSources sources() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<QSettings> m_settings;
};

void AppConfigTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settings = std::make_unique<QSettings>(m_dir->filePath(QStringLiteral("todo.ini")), QSettings::IniFormat);
}

void AppConfigTest::cleanup()
{
    m_settings.reset();
    m_dir.reset();
}

ConfigSources AppConfigTest::sources() const
{
    ConfigSources result;
    result.environment = QProcessEnvironment();
    result.settings = m_settings.get();
    result.homePath = m_dir->path();
    result.stdoutIsTerminal = true;
    return result;
}

void AppConfigTest::defaultsToHomeDirectory()
{
    const auto config = AppConfig::resolve(ConfigOverrides{}, sources());
    QVERIFY(config.has_value());
    QCOMPARE(config->filePath, m_dir->filePath(QStringLiteral("todo.txt")));
}

void AppConfigTest::failsWithoutUsableHomeDirectory()
{
    ConfigSources missingHome = sources();
    missingHome.homePath = m_dir->filePath(QStringLiteral("does-not-exist"));

    QString error;
    QVERIFY(!AppConfig::resolve(ConfigOverrides{}, missingHome, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("does-not-exist")));

    missingHome.homePath.clear();
    QVERIFY(!AppConfig::resolve(ConfigOverrides{}, missingHome).has_value());

    // An explicit file makes the home directory irrelevant.
    ConfigOverrides overrides;
    overrides.filePath = QStringLiteral("/tmp/elsewhere.txt");
    QVERIFY(AppConfig::resolve(overrides, missingHome).has_value());
}

void AppConfigTest::commandLineWinsOverEnvironment()
{
    ConfigSources withEnvironment = sources();
    withEnvironment.environment.insert(QStringLiteral("TODO_FILE"), QStringLiteral("/from/env.txt"));

    ConfigOverrides overrides;
    overrides.filePath = QStringLiteral("/from/cli.txt");
    const auto config = AppConfig::resolve(overrides, withEnvironment);
    QVERIFY(config.has_value());
    QCOMPARE(config->filePath, QStringLiteral("/from/cli.txt"));
}

void AppConfigTest::environmentWinsOverSettings()
{
    m_settings->setValue(QStringLiteral("storage/file"), QStringLiteral("/from/settings.txt"));
    ConfigSources withEnvironment = sources();
    withEnvironment.environment.insert(QStringLiteral("TODO_FILE"), QStringLiteral("/from/env.txt"));

    const auto config = AppConfig::resolve(ConfigOverrides{}, withEnvironment);
    QVERIFY(config.has_value());
    QCOMPARE(config->filePath, QStringLiteral("/from/env.txt"));
}

void AppConfigTest::settingsWinOverHomeDirectory()
{
    m_settings->setValue(QStringLiteral("storage/file"), QStringLiteral("/from/settings.txt"));
    const auto config = AppConfig::resolve(ConfigOverrides{}, sources());
    QVERIFY(config.has_value());
    QCOMPARE(config->filePath, QStringLiteral("/from/settings.txt"));
}

void AppConfigTest::colorFollowsTerminal()
{
    ConfigSources terminal = sources();
    QVERIFY(AppConfig::resolve(ConfigOverrides{}, terminal)->colorEnabled);

    terminal.stdoutIsTerminal = false;
    QVERIFY(!AppConfig::resolve(ConfigOverrides{}, terminal)->colorEnabled);
}

void AppConfigTest::colorCanBeDisabled_data()
{
    QTest::addColumn<QString>("source");

    QTest::newRow("option") << "option";
    QTest::newRow("environment") << "environment";
    QTest::newRow("settings") << "settings";
}

void AppConfigTest::colorCanBeDisabled()
{
    QFETCH(QString, source);

    ConfigOverrides overrides;
    ConfigSources input = sources();
    if (source == QLatin1String("option")) {
        overrides.noColor = true;
    } else if (source == QLatin1String("environment")) {
        input.environment.insert(QStringLiteral("NO_COLOR"), QStringLiteral("1"));
    } else {
        m_settings->setValue(QStringLiteral("output/color"), false);
    }

    const auto config = AppConfig::resolve(overrides, input);
    QVERIFY(config.has_value());
    QVERIFY(!config->colorEnabled);
}

void AppConfigTest::contextLoadsConfiguredFile()
{
    AppConfig config;
    config.filePath = m_dir->filePath(QStringLiteral("list.txt"));
    config.colorEnabled = true;

    AppContext context(config);
    QVERIFY(!context.isOpen());
    QVERIFY(context.open());
    QVERIFY(context.isOpen());
    QVERIFY(context.palette().colorEnabled());
    QCOMPARE(context.taskList().filePath(), config.filePath);
    QVERIFY(QFile::exists(config.filePath));
}

QTEST_GUILESS_MAIN(AppConfigTest)
#include "AppConfigTest.moc"
