/**
 * @file pool_config.cpp
 * @brief Layered configuration loading (defaults, default/user JSON, explicit file, env).
 */
#include "pool/pool_config.hpp"
#include "zw_service.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace zworkers::pool
{

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

constexpr const char *kDefaultFile = "zworkers.default.json";
constexpr const char *kUserFile = "zworkers.user.json";

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(json &base, const json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Null if the file cannot be opened; throws if it opens but does not parse.
json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return json{};
    try
    {
        json j;
        f >> j;
        return j;
    }
    catch (const json::exception &e)
    {
        throw std::runtime_error(fmt::format("PoolConfig: '{}' is not valid JSON: {}",
                                             path.string(), e.what()));
    }
}

bool parse_int(std::string_view text, int &out) noexcept
{
    text = format_tools::trim_whitespace(text);
    if (text.empty())
        return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// nlohmann's get<int>() truncates wider integers silently.
bool fits_int(const json &v)
{
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (!v.is_number_integer())
        return false;
    const auto n = v.get<std::int64_t>();
    return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

template <typename T> T get_as(const json &section, const char *key)
{
    try
    {
        if constexpr (std::is_same_v<T, int>)
        {
            if (section.at(key).is_number_integer() && !fits_int(section.at(key)))
                throw std::invalid_argument(
                    fmt::format("PoolConfig: bad value for '{}': out of int range", key));
        }
        return section.at(key).get<T>();
    }
    catch (const json::exception &e)
    {
        throw std::invalid_argument(fmt::format("PoolConfig: bad value for '{}': {}", key, e.what()));
    }
}

std::vector<HostSpec> host_cores_or_throw(Result<std::vector<HostSpec>, HostCoresError> r,
                                          std::string_view source)
{
    if (r.is_error())
    {
        throw std::invalid_argument(fmt::format("PoolConfig: bad host_cores from {}: {} (entry {})",
                                                source, to_string(r.error()), r.error_code()));
    }
    return std::move(r).content();
}

std::string host_cores_to_string(const std::vector<HostSpec> &specs)
{
    std::string out;
    for (const auto &s : specs)
    {
        if (!out.empty())
            out += ',';
        out += fmt::format("{} {}", s.host, s.cores);
    }
    return out;
}

} // namespace

const char *to_string(HostCoresError err) noexcept
{
    switch (err)
    {
    case HostCoresError::Empty:
        return "Empty";
    case HostCoresError::MissingCores:
        return "MissingCores";
    case HostCoresError::InvalidCores:
        return "InvalidCores";
    case HostCoresError::InvalidEntry:
        return "InvalidEntry";
    default:
        return "Unknown";
    }
}

Result<std::vector<HostSpec>, HostCoresError> parse_host_cores(std::string_view text)
{
    using R = Result<std::vector<HostSpec>, HostCoresError>;
    std::vector<HostSpec> out;
    int index = 0;
    size_t pos = 0;
    while (pos <= text.size())
    {
        size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos)
            comma = text.size();
        const std::string_view entry = format_tools::trim_whitespace(text.substr(pos, comma - pos));
        pos = comma + 1;
        if (entry.empty())
        {
            if (comma == text.size())
                break;
            return R::error(HostCoresError::InvalidEntry, index);
        }

        const auto tokens = format_tools::split_whitespace(entry);
        if (tokens.size() == 1)
            return R::error(HostCoresError::MissingCores, index);
        if (tokens.size() != 2)
            return R::error(HostCoresError::InvalidEntry, index);
        int cores = 0;
        if (!parse_int(tokens[1], cores) || cores == 0 || cores < -1)
            return R::error(HostCoresError::InvalidCores, index);
        out.push_back(HostSpec{tokens[0], cores});
        ++index;
    }
    if (out.empty())
        return R::error(HostCoresError::Empty);
    return R::ok(std::move(out));
}

Result<std::vector<HostSpec>, HostCoresError> parse_host_cores(const json &value)
{
    using R = Result<std::vector<HostSpec>, HostCoresError>;
    if (value.is_string())
        return parse_host_cores(std::string_view(value.get_ref<const std::string &>()));
    if (!value.is_array())
        return R::error(HostCoresError::InvalidEntry);

    std::vector<HostSpec> out;
    int index = 0;
    for (const auto &item : value)
    {
        if (!item.is_object() || !item.contains("host") || !item.at("host").is_string() ||
            item.at("host").get<std::string>().empty())
            return R::error(HostCoresError::InvalidEntry, index);
        if (!item.contains("cores"))
            return R::error(HostCoresError::MissingCores, index);
        const json &c = item.at("cores");
        if (!fits_int(c))
            return R::error(HostCoresError::InvalidCores, index);
        const int cores = c.get<int>();
        if (cores == 0 || cores < -1)
            return R::error(HostCoresError::InvalidCores, index);
        out.push_back(HostSpec{item.at("host").get<std::string>(), cores});
        ++index;
    }
    if (out.empty())
        return R::error(HostCoresError::Empty);
    return R::ok(std::move(out));
}

fs::path discover_config_dir() noexcept
{
    try
    {
        const fs::path exe(platform::get_executable_name(true));
        if (!exe.is_absolute())
            return {};
        const fs::path bin = exe.parent_path();

        // Staged layout: <root>/bin/ + <root>/config/
        fs::path candidate = bin / ".." / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);

        // Flat layout: config/ next to the binary
        candidate = bin / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);
    }
    catch (const fs::filesystem_error &e)
    {
        LOGGER_WARN("PoolConfig: config directory discovery failed: {}", e.what());
    }
    return {};
}

void PoolConfig::apply_json(const json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("PoolConfig: top-level JSON value must be an object");

    if (j.contains("zworkers"))
    {
        const auto &z = j.at("zworkers");
        if (z.contains("ctrl_port"))
        {
            ctrl_port = get_as<int>(z, "ctrl_port");
        }
        if (z.contains("task_in_url"))
        {
            task_in_url = get_as<std::string>(z, "task_in_url");
        }
        if (z.contains("task_out_url"))
        {
            task_out_url = get_as<std::string>(z, "task_out_url");
        }
        if (z.contains("receiver_url"))
        {
            receiver_url = get_as<std::string>(z, "receiver_url");
        }
        if (z.contains("remote_program"))
        {
            remote_program = get_as<std::string>(z, "remote_program");
        }
        if (z.contains("remote_shell"))
        {
            remote_shell = get_as<std::string>(z, "remote_shell");
        }
        if (z.contains("transition_wait_ms"))
        {
            transition_wait = std::chrono::milliseconds(get_as<int>(z, "transition_wait_ms"));
        }
        if (z.contains("host_cores"))
        {
            host_cores = host_cores_or_throw(parse_host_cores(z.at("host_cores")), "JSON");
        }
    }
    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        if (l.contains("file"))
        {
            log_file = get_as<std::string>(l, "file");
        }
        if (l.contains("level"))
        {
            log_level = get_as<std::string>(l, "level");
        }
    }

    if (ctrl_port <= 0 || ctrl_port > 65535)
        throw std::invalid_argument(fmt::format("PoolConfig: ctrl_port {} out of range", ctrl_port));
    if (!utils::Logger::parse_level(log_level))
        throw std::invalid_argument(fmt::format("PoolConfig: unknown logging.level '{}'", log_level));
}

void PoolConfig::apply_env()
{
    if (const char *env = std::getenv("ZWORKERS_CTRL_PORT"))
    {
        int port = 0;
        if (!parse_int(env, port) || port <= 0 || port > 65535)
            throw std::invalid_argument(fmt::format("PoolConfig: bad ZWORKERS_CTRL_PORT '{}'", env));
        ctrl_port = port;
    }
    if (const char *env = std::getenv("ZWORKERS_TASK_IN_URL"))
        task_in_url = env;
    if (const char *env = std::getenv("ZWORKERS_TASK_OUT_URL"))
        task_out_url = env;
    if (const char *env = std::getenv("ZWORKERS_RECEIVER_URL"))
        receiver_url = env;
    if (const char *env = std::getenv("ZWORKERS_HOST_CORES"))
        host_cores = host_cores_or_throw(parse_host_cores(std::string_view(env)),
                                         "ZWORKERS_HOST_CORES");
    if (const char *env = std::getenv("ZWORKERS_REMOTE_PROGRAM"))
        remote_program = env;
}

PoolConfig PoolConfig::load(const fs::path &explicit_file, bool log_values_flag)
{
    PoolConfig cfg;

    fs::path override_path = explicit_file;
    if (override_path.empty())
    {
        if (const char *env = std::getenv("ZWORKERS_CONFIG_FILE"))
            override_path = env;
    }

    if (!override_path.empty())
    {
        cfg.config_dir = override_path.parent_path();
        json j = read_json_file(override_path);
        if (!j.is_null())
        {
            LOGGER_INFO("PoolConfig: loading '{}'", override_path.string());
            cfg.apply_json(j);
            cfg.loaded_files.push_back(override_path);
        }
        else
        {
            LOGGER_WARN("PoolConfig: '{}' not readable, using defaults", override_path.string());
        }
    }
    else if (fs::path dir = discover_config_dir(); !dir.empty())
    {
        cfg.config_dir = dir;
        json merged = json::object();
        for (const char *name : {kDefaultFile, kUserFile})
        {
            const fs::path file = dir / name;
            json layer = read_json_file(file);
            if (layer.is_null())
                continue;
            LOGGER_INFO("PoolConfig: merging '{}'", file.string());
            json_merge(merged, layer);
            cfg.loaded_files.push_back(file);
        }
        cfg.apply_json(merged);
    }
    else
    {
        LOGGER_INFO("PoolConfig: no config directory found, using built-in defaults");
    }

    cfg.apply_env();
    if (log_values_flag)
        cfg.log_values();
    return cfg;
}

void PoolConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    if (const auto lvl = utils::Logger::parse_level(log_level))
        logger.set_level(*lvl);
    if (!log_file.empty() && !logger.set_logfile(log_file))
    {
        LOGGER_WARN("PoolConfig: cannot log to '{}', staying on the current sink", log_file);
    }
}

void PoolConfig::log_values() const
{
    LOGGER_INFO("PoolConfig: ctrl_port          = {}", ctrl_port);
    LOGGER_INFO("PoolConfig: task_in_url        = {}", task_in_url);
    LOGGER_INFO("PoolConfig: task_out_url       = {}", task_out_url);
    LOGGER_INFO("PoolConfig: receiver_url       = {}", receiver_url);
    LOGGER_INFO("PoolConfig: host_cores         = {}", host_cores_to_string(host_cores));
    LOGGER_INFO("PoolConfig: remote_program     = {}", remote_program);
    LOGGER_INFO("PoolConfig: remote_shell       = {}", remote_shell);
    LOGGER_INFO("PoolConfig: transition_wait_ms = {}", transition_wait.count());
    LOGGER_INFO("PoolConfig: logging.file       = {}", log_file.empty() ? "<console>" : log_file);
    LOGGER_INFO("PoolConfig: logging.level      = {}", log_level);
    LOGGER_INFO("PoolConfig: config_dir         = {}", config_dir.string());
}

WorkerMaster::Config PoolConfig::master_config() const
{
    WorkerMaster::Config mc;
    mc.task_in_url = task_in_url;
    mc.task_out_url = task_out_url;
    mc.ctrl_port = ctrl_port;
    mc.host_cores = host_cores;
    mc.remote_program = remote_program;
    mc.remote_shell = remote_shell;
    mc.transition_wait = transition_wait;
    return mc;
}

SubmitOptions PoolConfig::submit_options() const
{
    return SubmitOptions{task_in_url, receiver_url};
}

} // namespace zworkers::pool
