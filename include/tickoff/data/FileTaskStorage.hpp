#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

#include "tickoff/data/TaskStorage.hpp"

namespace tickoff {
namespace data {

// Persists tasks as an indented UTF-8 JSON array. Writes go through
// QSaveFile, so the previous file survives a failed save.
class FileTaskStorage : public TaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() override = default;

    std::vector<Task> load(QString *warning) override;
    bool save(const std::vector<Task> &tasks, QString *errorMessage) override;
    QString location() const override;

    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

private:
    static QJsonObject taskToJson(const Task &task);
    static std::optional<Task> taskFromJson(const QJsonValue &value, QString *reason);

    QString m_filePath;
};

} // namespace data
} // namespace tickoff
