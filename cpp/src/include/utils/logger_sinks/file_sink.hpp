#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace zworkers::utils
{

/**
 * @class FileSink
 * @brief Appends log lines to a file.
 *
 * The file is opened with O_APPEND so several processes (a pool supervisor and its
 * workers) can share one log file; with `use_flock` each line is additionally
 * written under an advisory exclusive lock. Missing parent directories are created.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /**
     * @throws std::system_error on a short or failed write.
     */
    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
    int m_fd = -1;
};

} // namespace zworkers::utils
