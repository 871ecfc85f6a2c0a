#pragma once

#include <QDateTime>
#include <QString>

namespace tickoff {
namespace data {

struct Task
{
    int id = 0;
    QString description;
    bool completed = false;
    QDateTime createdAt;
    QDateTime completedAt;

    bool operator==(const Task &other) const
    {
        return id == other.id && description == other.description && completed == other.completed
            && createdAt == other.createdAt && completedAt == other.completedAt;
    }
    bool operator!=(const Task &other) const { return !(*this == other); }
};

} // namespace data
} // namespace tickoff
