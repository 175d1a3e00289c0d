#include "zw_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace zworkers::utils
{

FileSink::FileSink(const std::string &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    std::error_code ec;
    const auto parent = m_path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("Failed to create log directory '{}': {}",
                                                 parent.string(), ec.message()));
        }
    }
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code open_ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, open_ec.message()));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    if (m_fd == -1)
        return;

    const auto content = format_logmsg(msg, mode);
    if (m_use_flock)
    {
        // flock is advisory and may be ignored, but provides good-faith serialization.
        ::flock(m_fd, LOCK_EX);
    }

    ssize_t bytes_written = ::write(m_fd, content.data(), content.size());
    const int saved_errno = errno;

    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }

    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
}

void FileSink::flush()
{
    if (m_fd != -1)
    {
        ::fsync(m_fd);
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace zworkers::utils
