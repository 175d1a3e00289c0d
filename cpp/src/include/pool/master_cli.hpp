#pragma once
/**
 * @file master_cli.hpp
 * @brief Command line of zworkers-master.
 *
 *   [--config <file>] start | stop | kill | streamer
 *   [--config <file>] status [host]
 *   [--config <file>] getpid <host>
 */
#include "zworkers_pool_export.h"

#include <optional>
#include <string>
#include <vector>

namespace zworkers::pool
{

struct MasterCommandLine
{
    std::string config_file; ///< empty means the discovered configuration layers
    std::string command;
    std::optional<std::string> host;
};

/**
 * @brief Parses the arguments that follow the program name.
 * @return std::nullopt for an unknown command, a missing or extra operand, or a
 *         `--config` without its file.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT std::optional<MasterCommandLine>
parse_master_command_line(const std::vector<std::string> &args);

} // namespace zworkers::pool
