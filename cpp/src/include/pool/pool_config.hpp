#pragma once
/**
 * @file pool_config.hpp
 * @brief Layered JSON configuration for masters, pools and submitters.
 *
 * Loading order (priority low -> high):
 *  1. Built-in defaults (the member initializers below)
 *  2. <config_dir>/zworkers.default.json
 *  3. <config_dir>/zworkers.user.json, merged on top
 *  4. An explicit file (`--config` / ZWORKERS_CONFIG_FILE) replaces 2 and 3
 *  5. ZWORKERS_CTRL_PORT, ZWORKERS_TASK_IN_URL, ZWORKERS_TASK_OUT_URL,
 *     ZWORKERS_RECEIVER_URL, ZWORKERS_HOST_CORES, ZWORKERS_REMOTE_PROGRAM
 *
 * JSON layout:
 * @code
 * {
 *   "zworkers": { "ctrl_port": 1909, "task_in_url": "...", "task_out_url": "...",
 *                 "receiver_url": "...", "host_cores": "127.0.0.1 -1",
 *                 "remote_program": "", "remote_shell": "ssh",
 *                 "transition_wait_ms": 10000 },
 *   "logging":  { "file": "", "level": "info" }
 * }
 * @endcode
 */
#include "zworkers_pool_export.h"

#include "pool/result.hpp"
#include "pool/submission.hpp"
#include "pool/worker_master.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace zworkers::pool
{

enum class HostCoresError
{
    Empty,        ///< no host at all
    MissingCores, ///< "host" without a core count
    InvalidCores, ///< core count not an integer, zero, or below -1
    InvalidEntry  ///< malformed JSON entry or extra tokens
};

ZWORKERS_POOL_EXPORT const char *to_string(HostCoresError err) noexcept;

/**
 * @brief Parses "host cores,host cores,...".
 * @return The specs, or an error whose error_code() is the index of the bad entry.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT Result<std::vector<HostSpec>, HostCoresError>
parse_host_cores(std::string_view text);

/**
 * @brief Parses either the textual form or an array of {"host": str, "cores": int}.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT Result<std::vector<HostSpec>, HostCoresError>
parse_host_cores(const nlohmann::json &value);

/**
 * @brief `<bin>/../config` or `<bin>/config`, whichever exists; empty if neither.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT std::filesystem::path discover_config_dir() noexcept;

struct ZWORKERS_POOL_EXPORT PoolConfig
{
    int ctrl_port = 1909;
    std::string task_in_url = "tcp://127.0.0.1:1910";
    std::string task_out_url = "tcp://127.0.0.1:1911";
    std::string receiver_url = "tcp://127.0.0.1:1912-1920";
    std::vector<HostSpec> host_cores{HostSpec{"127.0.0.1", -1}};
    std::string remote_program; ///< empty means the local pool program
    std::string remote_shell = "ssh";
    std::chrono::milliseconds transition_wait{10000};
    std::string log_file; ///< empty means the console
    std::string log_level = "info";

    std::filesystem::path config_dir;                ///< where the layers were found
    std::vector<std::filesystem::path> loaded_files; ///< in load order

    /**
     * @brief Builds the configuration from every layer.
     * @param explicit_file Replaces the file layers when non-empty (takes precedence over
     *                      ZWORKERS_CONFIG_FILE).
     * @param log_values_flag Log each resolved value at INFO.
     * @throws std::invalid_argument for a value of the wrong type or form.
     * @throws std::runtime_error for a config file that exists but is not valid JSON.
     */
    static PoolConfig load(const std::filesystem::path &explicit_file = {},
                           bool log_values_flag = true);

    /// Overlays the recognised keys of @p j. @throws std::invalid_argument
    void apply_json(const nlohmann::json &j);
    /// Overlays the ZWORKERS_* environment variables. @throws std::invalid_argument
    void apply_env();

    /// Applies log_level and log_file to the Logger. @pre Logger module started.
    void apply_logging() const;
    void log_values() const;

    [[nodiscard]] WorkerMaster::Config master_config() const;
    [[nodiscard]] SubmitOptions submit_options() const;
};

} // namespace zworkers::pool
