#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace scenefix::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * The file is opened in append mode and created if missing. With @c use_flock set, each
 * write is wrapped in an advisory `flock` so several processes can share one log file.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
#ifdef SCENEFIX_PLATFORM_WIN64
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace scenefix::utils
