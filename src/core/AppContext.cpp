#include "todo/core/AppContext.hpp"

#include "todo/data/TaskList.hpp"

namespace todo {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_palette(m_config.colorEnabled)
{
}

AppContext::~AppContext() = default;

bool AppContext::open(data::LoadError *error)
{
    auto list = data::TaskList::load(m_config.filePath, error);
    if (!list) {
        return false;
    }
    m_taskList = std::make_unique<data::TaskList>(std::move(*list));
    return true;
}

bool AppContext::isOpen() const
{
    return m_taskList != nullptr;
}

const Palette &AppContext::palette() const
{
    return m_palette;
}

data::TaskList &AppContext::taskList()
{
    return *m_taskList;
}

} // namespace core
} // namespace todo
