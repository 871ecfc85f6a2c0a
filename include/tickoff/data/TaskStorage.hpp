#pragma once

#include <QString>
#include <vector>

#include "tickoff/data/Task.hpp"

namespace tickoff {
namespace data {

class TaskStorage
{
public:
    virtual ~TaskStorage() = default;

    // Never throws. Missing or blank storage yields an empty list without a
    // warning; unreadable or malformed storage yields an empty list and sets
    // *warning when it is non-null.
    virtual std::vector<Task> load(QString *warning) = 0;
    virtual bool save(const std::vector<Task> &tasks, QString *errorMessage) = 0;
    virtual QString location() const = 0;
};

} // namespace data
} // namespace tickoff
