#pragma once

#include <QString>
#include <optional>
#include <utility>

namespace tickoff {
namespace core {

enum class ErrorKind
{
    Validation,
    InvalidArgument,
    NotFound,
};

struct TaskError
{
    ErrorKind kind;
    QString message;
};

// Outcome of a write-through flush. A failed flush does not undo the
// in-memory change it followed.
struct PersistenceStatus
{
    bool saved = true;
    QString warning;
};

template <typename T>
class Result
{
public:
    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(ErrorKind kind, QString message)
    {
        return Result(TaskError{ kind, std::move(message) });
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T &value() const { return *m_value; }
    const T *operator->() const { return &*m_value; }
    const TaskError &error() const { return *m_error; }

private:
    explicit Result(T value)
        : m_value(std::move(value))
    {
    }
    explicit Result(TaskError error)
        : m_error(std::move(error))
    {
    }

    std::optional<T> m_value;
    std::optional<TaskError> m_error;
};

} // namespace core
} // namespace tickoff
