/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Ordered startup and reverse-order shutdown of process modules.
 ******************************************************************************/
#include "lgs_base.hpp"

#include "utils/lifecycle.hpp"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <exception>

namespace logspray::utils
{

namespace
{
std::atomic<bool> g_has_owner{false};
std::atomic<bool> g_initialized{false};

void validate_modules(const std::vector<ModuleDef> &modules, const std::source_location &loc)
{
    for (size_t i = 0; i < modules.size(); ++i)
    {
        const char *name = modules[i].name;
        if (name == nullptr || *name == '\0')
        {
            LGS_PANIC("[LGS_LifeCycle] module #{} passed to the guard at {}:{} has no name", i,
                      format_tools::filename_only(loc.file_name()), loc.line());
        }
        for (size_t j = 0; j < i; ++j)
        {
            if (std::strcmp(modules[j].name, name) == 0)
            {
                LGS_PANIC("[LGS_LifeCycle] module '{}' is registered twice", name);
            }
        }
    }
}
} // namespace

LifecycleGuard::LifecycleGuard(std::vector<ModuleDef> modules, std::source_location loc)
    : m_loc(loc)
{
    bool expected = false;
    if (!g_has_owner.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        LGS_DEBUG("[LGS_LifeCycle] [PID {}] guard at {}:{} ignored: an owner already exists.",
                  platform::get_pid(), format_tools::filename_only(m_loc.file_name()),
                  m_loc.line());
        return;
    }
    m_is_owner = true;

    validate_modules(modules, m_loc);
    m_started.reserve(modules.size());
    for (const auto &mod : modules)
    {
        LGS_DEBUG("[LGS_LifeCycle] -> starting module '{}'", mod.name);
        try
        {
            if (mod.startup != nullptr)
            {
                mod.startup();
            }
        }
        catch (const std::exception &e)
        {
            LGS_PANIC("[LGS_LifeCycle] module '{}' failed to start: {}", mod.name, e.what());
        }
        m_started.push_back(mod);
    }
    g_initialized.store(true, std::memory_order_release);
}

LifecycleGuard::~LifecycleGuard() noexcept
{
    if (!m_is_owner)
    {
        return;
    }
    g_initialized.store(false, std::memory_order_release);
    for (auto it = m_started.rbegin(); it != m_started.rend(); ++it)
    {
        LGS_DEBUG("[LGS_LifeCycle] <- stopping module '{}'", it->name);
        if (it->shutdown == nullptr)
        {
            continue;
        }
        try
        {
            it->shutdown();
        }
        catch (const std::exception &e)
        {
            // Keep going: the remaining modules still need to stop.
            std::fprintf(stderr, "[LGS_LifeCycle] module '%s' threw on shutdown: %s\n", it->name,
                         e.what());
            std::fflush(stderr);
        }
    }
}

bool IsAppInitialized() noexcept
{
    return g_initialized.load(std::memory_order_acquire);
}

} // namespace logspray::utils
