/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 * @see include/utils/module_def.hpp
 *
 * 1.  `initialize()` builds a graph from the registered modules and starts them in
 *     topological order. This is done once.
 *
 * 2.  `finalize()` runs the shutdown callbacks in reverse start order. Every
 *     callback runs with a real timeout using thread+flag+poll+detach (not
 *     std::async, whose destructor blocks even after wait_for returns timeout).
 ******************************************************************************/
#include "zw_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fmt/ranges.h> // For fmt::join on vectors
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
/**
 * @brief Validates a module name: non-empty, within MAX_MODULE_NAME_LEN.
 * @throws std::invalid_argument if `name` is empty.
 * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
 */
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > zworkers::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(zworkers::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread with a real deadline. Returns without blocking
 *        beyond the deadline even if `func` hangs (the thread is detached on timeout).
 *
 * The state shared with the thread is heap-owned so a detached thread never touches
 * this stack frame after the function returns.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    struct SharedState
    {
        std::function<void()> func;
        std::atomic<bool> completed{false};
        std::exception_ptr ex_ptr{nullptr};
    };
    auto state = std::make_shared<SharedState>();
    state->func = func;

    std::thread thread(
        [state]()
        {
            try
            {
                state->func();
            }
            catch (...)
            {
                // Captured and rethrown on the finalizing thread below.
                state->ex_ptr = std::current_exception();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }

    thread.join();

    if (state->ex_ptr)
    {
        try
        {
            std::rethrow_exception(state->ex_ptr);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "unknown exception"};
        }
    }
    return {true, false, {}};
}

constexpr size_t kDebugInfoReserveBytes = 4096;

} // namespace

namespace zworkers::utils::lifecycle_internal
{
struct InternalModuleShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    InternalModuleShutdownDef shutdown;
};
} // namespace zworkers::utils::lifecycle_internal

namespace zworkers::utils
{
class ModuleDefImpl
{
  public:
    lifecycle_internal::InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;
void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        if (dependency_name.size() > MAX_MODULE_NAME_LEN)
        {
            throw std::length_error("Lifecycle: dependency name exceeds maximum length.");
        }
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}
void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}
void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}
void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}
void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: shutdown argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.shutdown.func = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(zworkers::platform::get_pid()),
          m_app_name(zworkers::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout ///< Shutdown callback did not complete within timeout; thread was detached.
    };

    struct InternalGraphNode
    {
        InternalGraphNode(std::string name_in, std::function<void()> startup_in,
                          lifecycle_internal::InternalModuleShutdownDef shutdown_in,
                          std::vector<std::string> dependencies_in)
            : name(std::move(name_in)), startup(std::move(startup_in)),
              shutdown(std::move(shutdown_in)), dependencies(std::move(dependencies_in))
        {
        }

        std::string name;
        std::function<void()> startup;
        lifecycle_internal::InternalModuleShutdownDef shutdown;
        std::vector<std::string> dependencies;
        std::vector<InternalGraphNode *> dependents;
        std::atomic<ModuleStatus> status = {ModuleStatus::Registered};
    };

    void registerStaticModule(lifecycle_internal::InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    void setLifecycleLogSink(std::shared_ptr<LifecycleLogSink> sink);
    void clearLifecycleLogSink() noexcept;
    [[nodiscard]] bool is_initialized() const
    {
        return m_is_initialized.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_finalized() const
    {
        return m_is_finalized.load(std::memory_order_acquire);
    }

  private:
    void buildStaticGraph();
    static std::vector<InternalGraphNode *>
    topologicalSort(const std::vector<InternalGraphNode *> &nodes);
    void shutdownModuleWithTimeout(InternalGraphNode &mod, std::string &debug_info);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    // Routes `msg` through the installed log sink (if any) or falls back to ZW_DEBUG.
    void lifecycleLog(LifecycleLogLevel level, std::string msg) const;

    template <typename... Args>
    void lifecycleDebug(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        lifecycleLog(LifecycleLogLevel::Debug, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void lifecycleWarn(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        lifecycleLog(LifecycleLogLevel::Warn, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void lifecycleError(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        lifecycleLog(LifecycleLogLevel::Error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    const uint64_t m_pid;
    const std::string m_app_name;
    std::atomic<bool> m_is_initialized = {false};
    std::atomic<bool> m_is_finalized = {false};
    std::mutex m_registry_mutex; // Protects m_registered_modules before initialization
    std::vector<lifecycle_internal::InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode, std::less<>> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::vector<InternalGraphNode *> m_shutdown_order;

    // null -> fall back to ZW_DEBUG.
    std::atomic<std::shared_ptr<LifecycleLogSink>> m_lifecycle_log_sink{nullptr};
};

// ============================================================================
// Registration, initialize, finalize
// ============================================================================

void LifecycleManagerImpl::registerStaticModule(lifecycle_internal::InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        ZW_PANIC("[ZW_LifeCycle]\nEXEC[{}]:PID[{}]\n  "
                 "    **  FATAL: register_module called after initialization.",
                 m_app_name, m_pid);
    }
    m_registered_modules.push_back(std::move(def));
}

/**
 * @brief Initializes the registered modules of the application.
 * @details Idempotent. On the first call it builds the dependency graph, sorts it,
 *          and runs each startup callback in sequence. Any failure is fatal.
 */
void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);

    debug_info += fmt::format("[ZW_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              zworkers::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildStaticGraph();
        std::vector<InternalGraphNode *> nodes;
        nodes.reserve(m_module_graph.size());
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    m_shutdown_order = m_startup_order;
    std::reverse(m_shutdown_order.begin(), m_shutdown_order.end());

    for (auto *mod : m_startup_order)
    {
        try
        {
            debug_info += fmt::format("     -> Starting module: '{}'...", mod->name);
            mod->status.store(ModuleStatus::Initializing, std::memory_order_release);
            if (mod->startup)
            {
                mod->startup();
            }
            mod->status.store(ModuleStatus::Started, std::memory_order_release);
            debug_info += "done.\n";
            lifecycleDebug("Lifecycle: module '{}' started.", mod->name);
        }
        catch (const std::exception &e)
        {
            mod->status.store(ModuleStatus::Failed, std::memory_order_release);
            ZW_DEBUG("{}", debug_info);
            printStatusAndAbort("\n     **** Exception during startup: " + std::string(e.what()),
                                mod->name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    ZW_DEBUG("{}", debug_info);
}

/**
 * @brief Shuts down the started modules in reverse start order.
 * @details Each callback runs under its own timeout. Modules that never started
 *          are marked shut down without running their callback.
 */
void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info +=
        fmt::format("[ZW_LifeCycle] [{}]:PID[{}]\n"
                    "     **** finalize() called, associated with a constructor from {} ({}:{}):\n"
                    "     <- Finalizing application...\n",
                    m_app_name, m_pid, loc.function_name(),
                    zworkers::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto *mod : m_shutdown_order)
    {
        if (mod->status.load(std::memory_order_acquire) == ModuleStatus::Started)
        {
            shutdownModuleWithTimeout(*mod, debug_info);
        }
        else
        {
            mod->status.store(ModuleStatus::Shutdown, std::memory_order_release);
            debug_info +=
                fmt::format("     <- Shutting down module: '{}'...(no-op) done.\n", mod->name);
        }
    }
    debug_info += "     -> Application finalization complete.\n";
    ZW_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(InternalGraphNode &mod,
                                                     std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.name);

    auto outcome = timedShutdown(mod.shutdown.func, mod.shutdown.timeout);

    if (outcome.success)
    {
        mod.status.store(ModuleStatus::Shutdown, std::memory_order_release);
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status.store(ModuleStatus::ShutdownTimeout, std::memory_order_release);
        debug_info +=
            fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.shutdown.timeout.count());
        lifecycleWarn("Lifecycle: module '{}' did not shut down within {}ms; thread detached.",
                      mod.name, mod.shutdown.timeout.count());
    }
    else
    {
        mod.status.store(ModuleStatus::FailedShutdown, std::memory_order_release);
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.name, outcome.exception_msg);
        lifecycleError("Lifecycle: module '{}' threw on shutdown: {}", mod.name,
                       outcome.exception_msg);
    }
}

// ============================================================================
// Graph construction and topology
// ============================================================================

/**
 * @throws std::runtime_error If a duplicate module name is found or a
 *         dependency points to an undefined module.
 */
void LifecycleManagerImpl::buildStaticGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (const auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        m_module_graph.emplace(
            std::piecewise_construct, std::forward_as_tuple(def.name),
            std::forward_as_tuple(def.name, def.startup, def.shutdown, def.dependencies));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the given nodes.
 * @throws std::runtime_error If a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<InternalGraphNode *> &nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[ZW_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[ZW_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}'\n", name);
    }
    fmt::print(stderr, "---------------------\n\n");
    zworkers::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// Log sink
// ============================================================================

void LifecycleManagerImpl::setLifecycleLogSink(std::shared_ptr<LifecycleLogSink> sink)
{
    m_lifecycle_log_sink.store(std::move(sink), std::memory_order_release);
}

void LifecycleManagerImpl::clearLifecycleLogSink() noexcept
{
    m_lifecycle_log_sink.store(nullptr, std::memory_order_release);
}

void LifecycleManagerImpl::lifecycleLog(LifecycleLogLevel level, std::string msg) const
{
    auto sink_ptr = m_lifecycle_log_sink.load(std::memory_order_acquire);
    if (sink_ptr && *sink_ptr)
    {
        (*sink_ptr)(level, msg);
        return;
    }
    (void)level;
    ZW_DEBUG("[Lifecycle] {}", msg);
}

// ============================================================================
// LifecycleManager public API (thin delegation layer)
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;
LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}
void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerStaticModule(std::move(def.pImpl->def));
    }
}
void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}
void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}
bool LifecycleManager::is_initialized()
{
    return pImpl->is_initialized();
}
bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}
void LifecycleManager::set_lifecycle_log_sink(LifecycleLogSink sink)
{
    if (sink)
    {
        pImpl->setLifecycleLogSink(std::make_shared<LifecycleLogSink>(std::move(sink)));
    }
    else
    {
        pImpl->clearLifecycleLogSink();
    }
}
void LifecycleManager::clear_lifecycle_log_sink() noexcept
{
    pImpl->clearLifecycleLogSink();
}

} // namespace zworkers::utils
