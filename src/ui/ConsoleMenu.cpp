#include "tickoff/ui/ConsoleMenu.hpp"

#include <QTextStream>
#include <exception>

#include "tickoff/core/Logging.hpp"
#include "tickoff/core/TaskStore.hpp"
#include "tickoff/ui/TaskFormatter.hpp"

namespace tickoff {
namespace ui {

ConsoleMenu::ConsoleMenu(core::TaskStore &store, QTextStream &in, QTextStream &out)
    : m_store(store)
    , m_in(in)
    , m_out(out)
{
}

int ConsoleMenu::run()
{
    print(welcomeText(m_store.location()));
    if (!m_store.loadWarning().isEmpty()) {
        print(renderLoadWarning(m_store.loadWarning()));
    }

    Step step = Step::Continue;
    while (step == Step::Continue) {
        print(menuText());
        const auto choice = prompt(QStringLiteral("Enter your choice (1-9): "));
        if (!choice) {
            print(QStringLiteral("\n\n👋 Goodbye! Your tasks have been saved."));
            break;
        }

        // Keeps the session alive when an action fails unexpectedly.
        try {
            step = dispatch(choice->trimmed());
        } catch (const std::exception &e) {
            qCCritical(lcUi) << "menu action" << *choice << "failed:" << e.what();
            print(QStringLiteral("❌ An error occurred: %1").arg(QString::fromLocal8Bit(e.what())));
        }
    }
    return 0;
}

ConsoleMenu::Step ConsoleMenu::dispatch(const QString &choice)
{
    if (choice == QLatin1String("1")) {
        return addTask();
    }
    if (choice == QLatin1String("2")) {
        print(renderTaskList(m_store.listAll()));
        return Step::Continue;
    }
    if (choice == QLatin1String("3")) {
        print(renderPending(m_store.listPending()));
        return Step::Continue;
    }
    if (choice == QLatin1String("4")) {
        return completeTask();
    }
    if (choice == QLatin1String("5")) {
        return removeTask();
    }
    if (choice == QLatin1String("6")) {
        print(renderCleared(m_store.clearCompleted()));
        return Step::Continue;
    }
    if (choice == QLatin1String("7")) {
        print(renderStats(m_store.stats()));
        return Step::Continue;
    }
    if (choice == QLatin1String("8")) {
        print(helpText(m_store.location()));
        return Step::Continue;
    }
    if (choice == QLatin1String("9")) {
        print(farewellText());
        return Step::Stop;
    }
    print(QStringLiteral("❌ Invalid choice! Please enter a number between 1-9."));
    return Step::Continue;
}

ConsoleMenu::Step ConsoleMenu::addTask()
{
    const auto description = prompt(QStringLiteral("\n📝 Enter task description: "));
    if (!description) {
        return Step::Stop;
    }
    const auto result = m_store.add(*description);
    print(result ? renderAdded(result.value()) : renderError(result.error()));
    return Step::Continue;
}

ConsoleMenu::Step ConsoleMenu::completeTask()
{
    print(renderPending(m_store.listPending()));
    if (!m_store.hasPending()) {
        return Step::Continue;
    }
    const auto id = prompt(QStringLiteral("\n✅ Enter task ID to mark as completed: "));
    if (!id) {
        return Step::Stop;
    }
    const auto result = m_store.complete(*id);
    print(result ? renderCompleted(result.value()) : renderError(result.error()));
    return Step::Continue;
}

ConsoleMenu::Step ConsoleMenu::removeTask()
{
    print(renderTaskList(m_store.listAll()));
    if (m_store.tasks().empty()) {
        return Step::Continue;
    }
    const auto id = prompt(QStringLiteral("\n🗑️  Enter task ID to remove: "));
    if (!id) {
        return Step::Stop;
    }
    const auto result = m_store.remove(*id);
    print(result ? renderRemoved(result.value()) : renderError(result.error()));
    return Step::Continue;
}

std::optional<QString> ConsoleMenu::prompt(const QString &text)
{
    m_out << text;
    m_out.flush();
    const QString line = m_in.readLine();
    if (line.isNull()) {
        return std::nullopt;
    }
    return line;
}

void ConsoleMenu::print(const QString &text)
{
    m_out << text << '\n';
    m_out.flush();
}

} // namespace ui
} // namespace tickoff
