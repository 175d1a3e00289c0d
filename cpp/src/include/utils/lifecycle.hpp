#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * @see src/utils/lifecycle.cpp
 *
 * Modules declare their dependencies by name; the `LifecycleManager` performs a
 * topological sort to start them in dependency order and shuts them down in the
 * reverse order. Cycles, duplicates and undefined dependencies are fatal at
 * initialization. Each shutdown callback runs under its own timeout, so a hanging
 * module cannot block process exit.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     using namespace zworkers;
 *     utils::LifecycleGuard app_lifecycle(utils::MakeModDefList(
 *         utils::Logger::GetLifecycleModule(),
 *         pool::GetZMQContextModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     // ... run the worker pool, streamer, etc. ...
 *     return 0; // ~LifecycleGuard finalizes all modules
 * }
 * ```
 ******************************************************************************/
#include "zw_base.hpp"
#include "zworkers_utils_export.h"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace zworkers::utils
{

class LifecycleManagerImpl;

/// @brief Helper factory: constructs a vector<ModuleDef> by moving the supplied ModuleDef args.
// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @brief Severity levels for lifecycle manager internal log messages.
 */
enum class LifecycleLogLevel : int
{
    Debug = 1,
    Warn = 3,
    Error = 4
};

/**
 * @brief Callback type for the lifecycle log sink.
 *
 * When set, the lifecycle manager routes its runtime messages (module start/stop,
 * shutdown timeouts) through this function instead of ZW_DEBUG. The callback may be
 * invoked from a shutdown thread, so it must be thread-safe.
 */
using LifecycleLogSink = std::function<void(LifecycleLogLevel, const std::string &)>;

/**
 * @class LifecycleManager
 * @brief The singleton manager for the application lifecycle.
 */
class ZWORKERS_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module with the lifecycle system.
     *
     * All modules must be registered before `initialize()`. Registration after
     * initialization has begun is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     *
     * Aborts the application on a dependency cycle, a duplicate module name, an
     * undefined dependency or an exception thrown by a startup callback.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts modules down in reverse start order, each under its own timeout.
     * Idempotent; a no-op if `initialize()` was never called.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    /**
     * @brief Installs a sink for lifecycle runtime messages.
     *
     * Typically called from the logger module's startup callback so that lifecycle
     * events appear in the application log. An empty sink clears the current one.
     */
    void set_lifecycle_log_sink(LifecycleLogSink sink);

    /**
     * @brief Removes the installed log sink. Messages fall back to ZW_DEBUG.
     */
    void clear_lifecycle_log_sink() noexcept;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes
 * the application; its destructor finalizes. Any later guard is a no-op and says so
 * on stderr.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        ZW_DEBUG("[ZW_LifeCycle] LifecycleGuard constructed in function {} with no modules. ({}:{})",
                 m_loc.function_name(), zworkers::format_tools::filename_only(m_loc.file_name()),
                 m_loc.line());
        init_owner_if_first({});
    }

    // Usage: LifecycleGuard guard(ModuleDef("MyModule"));
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    // Usage: LifecycleGuard guard(MakeModDefList(ModuleDef("Mod1"), ModuleDef("Mod2")));
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @warning Destruction order of statics across translation units is unspecified.
     *          Objects whose destructors use lifecycle-managed services (the logger,
     *          the ZeroMQ context) must be destroyed before the owning guard.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            zworkers::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    // Function-local static atomic flag (ODR-safe header-only)
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                zworkers::utils::RegisterModule(std::move(m));
            }
            // Always initialize, even with no modules, so the lifecycle starts with the
            // first guard.
            zworkers::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            fmt::print(stderr,
                       "[ZW_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                       "already exists. This guard is a no-op; provided modules (if any) were "
                       "ignored. ({}:{})\n",
                       zworkers::platform::get_executable_name(), zworkers::platform::get_pid(),
                       zworkers::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace zworkers::utils
