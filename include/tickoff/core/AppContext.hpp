#pragma once

#include <memory>

namespace tickoff {
namespace data {
class TaskStorage;
}

namespace core {

struct AppConfig;
class TaskStore;

class AppContext
{
public:
    explicit AppContext(const AppConfig &config);
    ~AppContext();

    TaskStore &taskStore();

private:
    std::shared_ptr<data::TaskStorage> m_storage;
    std::unique_ptr<TaskStore> m_taskStore;
};

} // namespace core
} // namespace tickoff
