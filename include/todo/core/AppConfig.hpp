#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <optional>

class QSettings;

namespace todo {
namespace core {

// Values given on the command line; they win over every other source.
struct ConfigOverrides
{
    QString filePath;
    bool noColor = false;
};

// Process-wide inputs, gathered once so the resolution itself stays pure.
struct ConfigSources
{
    QProcessEnvironment environment;
    QSettings *settings = nullptr;
    QString homePath;
    bool stdoutIsTerminal = false;

    static ConfigSources system(QSettings &settings);
};

struct AppConfig
{
    QString filePath;
    bool colorEnabled = false;

    static std::optional<AppConfig> resolve(const ConfigOverrides &overrides,
                                            const ConfigSources &sources,
                                            QString *errorString = nullptr);
};

} // namespace core
} // namespace todo
