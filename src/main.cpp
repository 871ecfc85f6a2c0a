#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>
#include <signal.h>
#include <unistd.h>

#include "version.h"

#include "tickoff/core/AppConfig.hpp"
#include "tickoff/core/AppContext.hpp"
#include "tickoff/core/Logging.hpp"
#include "tickoff/core/TaskStore.hpp"
#include "tickoff/ui/ConsoleMenu.hpp"

namespace {

// Every mutation is flushed before it returns, so an interrupt while waiting
// for input has nothing left to save.
void handleInterrupt(int)
{
    static const char message[] = "\n\n\xF0\x9F\x91\x8B Goodbye! Your tasks have been saved.\n";
    const ssize_t written = ::write(STDOUT_FILENO, message, sizeof(message) - 1);
    static_cast<void>(written);
    _exit(0);
}

void installInterruptHandler()
{
    struct sigaction action = {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("tickoff"));
    QCoreApplication::setApplicationName(QStringLiteral("tickoff"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTickoffVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    out.setCodec("UTF-8");
    err.setCodec("UTF-8");

    const QSettings settings;
    const auto resolved = tickoff::core::resolveConfig(app.arguments(), settings);
    switch (resolved.action) {
    case tickoff::core::ConfigResult::Action::ShowHelp:
    case tickoff::core::ConfigResult::Action::ShowVersion:
        out << resolved.message;
        return 0;
    case tickoff::core::ConfigResult::Action::Fail:
        err << resolved.message;
        return 2;
    case tickoff::core::ConfigResult::Action::Run:
        break;
    }

    tickoff::core::configureLogging(resolved.config.verbose);
    installInterruptHandler();

    tickoff::core::AppContext context(resolved.config);
    QTextStream in(stdin);
    in.setCodec("UTF-8");
    tickoff::ui::ConsoleMenu menu(context.taskStore(), in, out);
    return menu.run();
}
