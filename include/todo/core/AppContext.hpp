#pragma once

#include <memory>

#include "todo/core/AppConfig.hpp"
#include "todo/core/Palette.hpp"

namespace todo {
namespace data {
class TaskList;
struct LoadError;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    // Loads the configured task list. Must succeed before taskList() is used.
    bool open(data::LoadError *error = nullptr);
    bool isOpen() const;

    const Palette &palette() const;
    data::TaskList &taskList();

private:
    AppConfig m_config;
    Palette m_palette;
    std::unique_ptr<data::TaskList> m_taskList;
};

} // namespace core
} // namespace todo
