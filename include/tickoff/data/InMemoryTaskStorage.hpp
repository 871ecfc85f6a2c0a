#pragma once

#include "tickoff/data/TaskStorage.hpp"

namespace tickoff {
namespace data {

class InMemoryTaskStorage : public TaskStorage
{
public:
    InMemoryTaskStorage();
    explicit InMemoryTaskStorage(std::vector<Task> tasks);
    ~InMemoryTaskStorage() override;

    std::vector<Task> load(QString *warning) override;
    bool save(const std::vector<Task> &tasks, QString *errorMessage) override;
    QString location() const override;

    const std::vector<Task> &savedTasks() const;
    int saveCount() const;

    void setFailSaves(bool fail);
    void setLoadWarning(const QString &warning);

private:
    std::vector<Task> m_tasks;
    int m_saveCount = 0;
    bool m_failSaves = false;
    QString m_loadWarning;
};

} // namespace data
} // namespace tickoff
