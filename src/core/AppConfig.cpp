#include "tickoff/core/AppConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>

#include "version.h"

namespace tickoff {
namespace core {

namespace {
constexpr auto SETTINGS_FILE_KEY = "storage/file";
} // namespace

QString AppConfig::defaultFilePath()
{
    return QStringLiteral("tasks.txt");
}

ConfigResult resolveConfig(const QStringList &arguments, const QSettings &settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Console to-do list manager with persistent storage."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption fileOption({ QStringLiteral("f"), QStringLiteral("file") },
                                        QStringLiteral("Store tasks in <path> (default: %1).")
                                            .arg(AppConfig::defaultFilePath()),
                                        QStringLiteral("path"));
    // -v is taken by --version.
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Print debug logging to stderr."));
    parser.addOption(fileOption);
    parser.addOption(verboseOption);

    ConfigResult result;
    if (!parser.parse(arguments)) {
        result.action = ConfigResult::Action::Fail;
        result.message = parser.errorText() + QLatin1Char('\n') + parser.helpText();
        return result;
    }
    if (parser.isSet(helpOption)) {
        result.action = ConfigResult::Action::ShowHelp;
        result.message = parser.helpText();
        return result;
    }
    if (parser.isSet(versionOption)) {
        result.action = ConfigResult::Action::ShowVersion;
        result.message = QStringLiteral("tickoff %1\n").arg(QLatin1String(kTickoffVersion));
        return result;
    }
    if (!parser.positionalArguments().isEmpty()) {
        result.action = ConfigResult::Action::Fail;
        result.message = QStringLiteral("Unexpected argument '%1'.\n").arg(parser.positionalArguments().constFirst())
            + parser.helpText();
        return result;
    }

    result.config.verbose = parser.isSet(verboseOption);
    if (parser.isSet(fileOption)) {
        result.config.filePath = parser.value(fileOption);
    } else {
        result.config.filePath = settings.value(QLatin1String(SETTINGS_FILE_KEY)).toString();
    }
    if (result.config.filePath.trimmed().isEmpty()) {
        result.config.filePath = AppConfig::defaultFilePath();
    }
    return result;
}

} // namespace core
} // namespace tickoff
