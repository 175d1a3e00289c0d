#include "pool/master_cli.hpp"

namespace zworkers::pool
{

std::optional<MasterCommandLine> parse_master_command_line(const std::vector<std::string> &args)
{
    MasterCommandLine cmd;
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--config")
        {
            if (i + 1 >= args.size() || args[i + 1].empty())
            {
                return std::nullopt;
            }
            cmd.config_file = args[++i];
        }
        else
        {
            rest.push_back(args[i]);
        }
    }
    if (rest.empty())
    {
        return std::nullopt;
    }
    cmd.command = rest[0];

    const bool takes_host = cmd.command == "status" || cmd.command == "getpid";
    const bool known = takes_host || cmd.command == "start" || cmd.command == "stop" ||
                       cmd.command == "kill" || cmd.command == "streamer";
    if (!known || rest.size() > (takes_host ? 2u : 1u))
    {
        return std::nullopt;
    }
    if (rest.size() == 2)
    {
        cmd.host = rest[1];
    }
    if (cmd.command == "getpid" && !cmd.host)
    {
        return std::nullopt;
    }
    return cmd;
}

} // namespace zworkers::pool
