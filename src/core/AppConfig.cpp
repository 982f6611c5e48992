#include "todo/core/AppConfig.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QVariant>

#include <cstdio>
#include <unistd.h>

#include "todo/core/Logging.hpp"

namespace todo {
namespace core {

namespace {
constexpr auto FILE_ENV = "TODO_FILE";
constexpr auto NO_COLOR_ENV = "NO_COLOR";
constexpr auto FILE_KEY = "storage/file";
constexpr auto COLOR_KEY = "output/color";
constexpr auto DEFAULT_FILE_NAME = "todo.txt";

std::optional<QString> resolveFilePath(const ConfigOverrides &overrides,
                                       const ConfigSources &sources,
                                       QString *errorString)
{
    if (!overrides.filePath.isEmpty()) {
        qCDebug(lcCli) << "file from command line:" << overrides.filePath;
        return overrides.filePath;
    }

    const QString fromEnvironment = sources.environment.value(QLatin1String(FILE_ENV));
    if (!fromEnvironment.isEmpty()) {
        qCDebug(lcCli) << "file from" << FILE_ENV << ":" << fromEnvironment;
        return fromEnvironment;
    }

    if (sources.settings) {
        const QString fromSettings = sources.settings->value(QLatin1String(FILE_KEY)).toString();
        if (!fromSettings.isEmpty()) {
            qCDebug(lcCli) << "file from settings:" << fromSettings;
            return fromSettings;
        }
    }

    const QFileInfo home(sources.homePath);
    if (sources.homePath.isEmpty() || !home.isDir() || !home.isReadable()) {
        if (errorString) {
            *errorString = QStringLiteral("cannot use home directory \"%1\"").arg(sources.homePath);
        }
        return std::nullopt;
    }
    return QDir(sources.homePath).filePath(QLatin1String(DEFAULT_FILE_NAME));
}

bool resolveColor(const ConfigOverrides &overrides, const ConfigSources &sources)
{
    if (overrides.noColor) {
        return false;
    }
    if (!sources.environment.value(QLatin1String(NO_COLOR_ENV)).isEmpty()) {
        return false;
    }
    if (sources.settings && !sources.settings->value(QLatin1String(COLOR_KEY), true).toBool()) {
        return false;
    }
    return sources.stdoutIsTerminal;
}
} // namespace

ConfigSources ConfigSources::system(QSettings &settings)
{
    ConfigSources sources;
    sources.environment = QProcessEnvironment::systemEnvironment();
    sources.settings = &settings;
    sources.homePath = QDir::homePath();
    sources.stdoutIsTerminal = isatty(fileno(stdout)) != 0;
    return sources;
}

std::optional<AppConfig> AppConfig::resolve(const ConfigOverrides &overrides,
                                            const ConfigSources &sources,
                                            QString *errorString)
{
    auto filePath = resolveFilePath(overrides, sources, errorString);
    if (!filePath) {
        return std::nullopt;
    }

    AppConfig config;
    config.filePath = std::move(*filePath);
    config.colorEnabled = resolveColor(overrides, sources);
    return config;
}

} // namespace core
} // namespace todo
