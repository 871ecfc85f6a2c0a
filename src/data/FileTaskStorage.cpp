#include "tickoff/data/FileTaskStorage.hpp"

#include "tickoff/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <climits>
#include <cmath>

namespace tickoff {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyy-MM-dd HH:mm:ss";

constexpr auto KEY_ID = "id";
constexpr auto KEY_DESCRIPTION = "description";
constexpr auto KEY_COMPLETED = "completed";
constexpr auto KEY_CREATED_AT = "created_at";
constexpr auto KEY_COMPLETED_AT = "completed_at";

bool fail(QString *target, const QString &message)
{
    if (target) {
        *target = message;
    }
    return false;
}
} // namespace

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::vector<Task> FileTaskStorage::load(QString *warning)
{
    std::vector<Task> tasks;

    auto reject = [&](const QString &reason) {
        const QString message = QStringLiteral("Could not load tasks from %1 (%2). Starting with empty list.")
                                    .arg(m_filePath, reason);
        qCWarning(lcStorage).noquote() << message;
        fail(warning, message);
        return std::vector<Task>{};
    };

    QFile file(m_filePath);
    if (m_filePath.isEmpty() || !file.exists()) {
        qCDebug(lcStorage) << "no task file at" << m_filePath;
        return tasks;
    }
    if (QFileInfo(m_filePath).isDir()) {
        return reject(QStringLiteral("path is a directory"));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return reject(file.errorString());
    }

    const QByteArray content = file.readAll();
    if (content.trimmed().isEmpty()) {
        return tasks;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(content, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return reject(QStringLiteral("%1 at offset %2").arg(parseError.errorString()).arg(parseError.offset));
    }
    if (!document.isArray()) {
        return reject(QStringLiteral("expected a JSON array"));
    }

    const QJsonArray records = document.array();
    tasks.reserve(static_cast<size_t>(records.size()));
    for (int i = 0; i < records.size(); ++i) {
        QString reason;
        auto task = taskFromJson(records.at(i), &reason);
        if (!task) {
            return reject(QStringLiteral("record %1: %2").arg(i).arg(reason));
        }
        tasks.push_back(std::move(*task));
    }

    qCDebug(lcStorage) << "loaded" << tasks.size() << "tasks from" << m_filePath;
    return tasks;
}

bool FileTaskStorage::save(const std::vector<Task> &tasks, QString *errorMessage)
{
    auto reject = [&](const QString &reason) {
        const QString message = QStringLiteral("Error saving tasks to %1: %2").arg(m_filePath, reason);
        qCWarning(lcStorage).noquote() << message;
        return fail(errorMessage, message);
    };

    if (m_filePath.isEmpty()) {
        return reject(QStringLiteral("no file path configured"));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return reject(QStringLiteral("cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return reject(file.errorString());
    }

    QJsonArray records;
    for (const Task &task : tasks) {
        records.append(taskToJson(task));
    }
    const QByteArray payload = QJsonDocument(records).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return reject(reason);
    }
    if (!file.commit()) {
        return reject(file.errorString());
    }

    qCDebug(lcStorage) << "saved" << tasks.size() << "tasks to" << m_filePath;
    return true;
}

QString FileTaskStorage::location() const
{
    return m_filePath;
}

QString FileTaskStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toLocalTime().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileTaskStorage::parseDateTime(const QString &value)
{
    return QDateTime::fromString(value, QLatin1String(DATE_TIME_FORMAT));
}

QJsonObject FileTaskStorage::taskToJson(const Task &task)
{
    QJsonObject object;
    object.insert(QLatin1String(KEY_ID), task.id);
    object.insert(QLatin1String(KEY_DESCRIPTION), task.description);
    object.insert(QLatin1String(KEY_COMPLETED), task.completed);
    object.insert(QLatin1String(KEY_CREATED_AT), formatDateTime(task.createdAt));
    if (task.completed && task.completedAt.isValid()) {
        object.insert(QLatin1String(KEY_COMPLETED_AT), formatDateTime(task.completedAt));
    }
    return object;
}

std::optional<Task> FileTaskStorage::taskFromJson(const QJsonValue &value, QString *reason)
{
    if (!value.isObject()) {
        fail(reason, QStringLiteral("not an object"));
        return std::nullopt;
    }
    const QJsonObject object = value.toObject();
    Task task;

    const QJsonValue id = object.value(QLatin1String(KEY_ID));
    const double rawId = id.toDouble(-1);
    if (!id.isDouble() || rawId < 1 || rawId > INT_MAX || std::floor(rawId) != rawId) {
        fail(reason, QStringLiteral("\"id\" must be a positive integer"));
        return std::nullopt;
    }
    task.id = static_cast<int>(rawId);

    const QJsonValue description = object.value(QLatin1String(KEY_DESCRIPTION));
    if (!description.isString() || description.toString().trimmed().isEmpty()) {
        fail(reason, QStringLiteral("\"description\" must be non-empty text"));
        return std::nullopt;
    }
    task.description = description.toString();

    const QJsonValue completed = object.value(QLatin1String(KEY_COMPLETED));
    if (!completed.isBool()) {
        fail(reason, QStringLiteral("\"completed\" must be a boolean"));
        return std::nullopt;
    }
    task.completed = completed.toBool();

    task.createdAt = parseDateTime(object.value(QLatin1String(KEY_CREATED_AT)).toString());
    if (!task.createdAt.isValid()) {
        fail(reason, QStringLiteral("\"created_at\" must be a YYYY-MM-DD HH:MM:SS timestamp"));
        return std::nullopt;
    }

    // Older files may mark a task completed without recording when.
    const QJsonValue completedAt = object.value(QLatin1String(KEY_COMPLETED_AT));
    if (task.completed && !completedAt.isUndefined() && !completedAt.isNull()) {
        task.completedAt = parseDateTime(completedAt.toString());
        if (!task.completedAt.isValid()) {
            fail(reason, QStringLiteral("\"completed_at\" must be a YYYY-MM-DD HH:MM:SS timestamp"));
            return std::nullopt;
        }
    }

    return task;
}

} // namespace data
} // namespace tickoff
