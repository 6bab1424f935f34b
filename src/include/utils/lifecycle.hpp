#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Starts and stops process-wide services in a fixed order.
 *
 * Every logspray process (the coordinator and each worker) owns exactly one
 * `LifecycleGuard` in `main`. The guard starts the modules it is given in list
 * order and shuts them down in reverse order when it leaves scope.
 *
 * ```cpp
 * int main(int argc, char *argv[])
 * {
 *     logspray::utils::LifecycleGuard app_lifecycle({logspray::utils::Logger::GetLifecycleModule()});
 *     LOGGER_INFO("started");
 *     return 0;
 * }
 * ```
 *
 * An unnamed module, a duplicate name or a startup callback that throws is a
 * programming error and aborts the process with a report.
 ******************************************************************************/
#include "lgs_base.hpp"
#include "logspray_utils_export.h"

#include <source_location>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace logspray::utils
{

using LifecycleCallback = void (*)();

/// A process-wide service the lifecycle starts and stops.
struct ModuleDef
{
    const char *name = "";
    LifecycleCallback startup = nullptr;
    LifecycleCallback shutdown = nullptr;
};

/**
 * @brief RAII owner of the process lifecycle.
 *
 * The first guard constructed in a process starts its modules; its destructor
 * stops them. Any later guard is inert and its modules are ignored.
 */
class LOGSPRAY_UTILS_EXPORT LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> modules,
                            std::source_location loc = std::source_location::current());
    ~LifecycleGuard() noexcept;

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    std::vector<ModuleDef> m_started;
    std::source_location m_loc;
    bool m_is_owner{false};
};

/// True once the owning guard has started all of its modules.
LOGSPRAY_UTILS_EXPORT bool IsAppInitialized() noexcept;

} // namespace logspray::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
