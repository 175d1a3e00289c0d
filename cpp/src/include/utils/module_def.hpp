#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "zworkers_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace zworkers::utils
{

// Forward-declare the implementation structs to hide them from the public API,
// which is the essence of the Pimpl idiom.
class ModuleDefImpl;
class LifecycleManager; // Forward-declaration for the friend class

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * A C-style function pointer has a standardised calling convention across shared
 * library boundaries, unlike `std::function`. `arg` is `nullptr` when no argument
 * was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief A builder for a lifecycle module definition.
 *
 * `ModuleDef` hides its `std::string` and `std::vector` members behind a pImpl.
 * It is movable but not copyable; once registered with the `LifecycleManager`,
 * ownership is transferred.
 *
 * All module and dependency names must not exceed `MAX_MODULE_NAME_LEN` characters.
 * Violations are rejected with `std::length_error`; there is no silent truncation.
 */
class ZWORKERS_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @brief Constructs a module definition with a given name.
     *
     * @param name Unique name for this module (e.g. `"ZMQContext"`).
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);

    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares a dependency on another module.
     *
     * The named module is started before this one and shut down after it.
     * An empty `dependency_name` is ignored.
     *
     * @throws std::length_error if `dependency_name.size() > MAX_MODULE_NAME_LEN`.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the startup callback with a string argument.
     * @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
     */
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     *
     * @param shutdown_func Called on module shutdown; must not be null.
     * @param timeout       Maximum time allowed for the callback to complete. A callback
     *                      still running after the deadline is abandoned (its thread is
     *                      detached) and finalization continues.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace zworkers::utils
