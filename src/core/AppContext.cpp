#include "tickoff/core/AppContext.hpp"

#include "tickoff/core/AppConfig.hpp"
#include "tickoff/core/TaskStore.hpp"
#include "tickoff/data/FileTaskStorage.hpp"

namespace tickoff {
namespace core {

AppContext::AppContext(const AppConfig &config)
    : m_storage(std::make_shared<data::FileTaskStorage>(config.filePath))
    , m_taskStore(std::make_unique<TaskStore>(m_storage))
{
}

AppContext::~AppContext() = default;

TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

} // namespace core
} // namespace tickoff
