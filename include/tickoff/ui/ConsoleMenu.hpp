#pragma once

#include <QString>
#include <optional>

class QTextStream;

namespace tickoff {
namespace core {
class TaskStore;
}

namespace ui {

// Numbered request/response menu over a TaskStore. Reads one line per
// prompt from in and writes everything it renders to out.
class ConsoleMenu
{
public:
    ConsoleMenu(core::TaskStore &store, QTextStream &in, QTextStream &out);

    // Returns when the user exits or input ends.
    int run();

private:
    enum class Step
    {
        Continue,
        Stop,
    };

    Step dispatch(const QString &choice);
    Step addTask();
    Step completeTask();
    Step removeTask();

    std::optional<QString> prompt(const QString &text);
    void print(const QString &text);

    core::TaskStore &m_store;
    QTextStream &m_in;
    QTextStream &m_out;
};

} // namespace ui
} // namespace tickoff
