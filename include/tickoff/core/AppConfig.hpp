#pragma once

#include <QString>
#include <QStringList>

class QSettings;

namespace tickoff {
namespace core {

struct AppConfig
{
    QString filePath;
    bool verbose = false;

    static QString defaultFilePath();
};

struct ConfigResult
{
    enum class Action
    {
        Run,
        ShowHelp,
        ShowVersion,
        Fail,
    };

    Action action = Action::Run;
    AppConfig config;
    // Help or version text, or the error followed by usage for Fail.
    QString message;
};

// Command line options win over the storage/file settings key, which wins
// over the built-in default. arguments includes the program name.
ConfigResult resolveConfig(const QStringList &arguments, const QSettings &settings);

} // namespace core
} // namespace tickoff
