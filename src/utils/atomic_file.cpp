// atomic_file.cpp
#include "sfx_base.hpp"
#include "utils/atomic_file.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>
#include <vector>

#if defined(SCENEFIX_IS_POSIX)
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace scenefix::utils
{

namespace
{
constexpr int kRenameRetries = 5;
constexpr int kRenameDelayMs = 100;

void set_error(std::error_code *err_code, std::error_code ec) noexcept
{
    if (err_code != nullptr)
    {
        *err_code = ec;
    }
}

#if defined(SCENEFIX_PLATFORM_WIN64)

std::error_code last_win_error() noexcept
{
    return {static_cast<int>(GetLastError()), std::system_category()};
}

bool write_all_win(HANDLE h, std::string_view bytes)
{
    size_t written = 0;
    while (written < bytes.size())
    {
        const DWORD chunk = static_cast<DWORD>(
            std::min<size_t>(bytes.size() - written, static_cast<size_t>(1) << 30));
        DWORD n = 0;
        if (!WriteFile(h, bytes.data() + written, chunk, &n, nullptr))
        {
            return false;
        }
        written += n;
    }
    return true;
}

bool atomic_write_win(const fs::path &target, std::string_view bytes, Logger &logger,
                      std::error_code *err_code)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
    {
        parent = ".";
    }
    const fs::path tmp = parent / (target.filename().wstring() + L".tmp." +
                                   std::to_wstring(GetCurrentProcessId()) + L"." +
                                   std::to_wstring(GetCurrentThreadId()));
    HANDLE h = CreateFileW(tmp.wstring().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        const auto ec = last_win_error();
        set_error(err_code, ec);
        SFX_LOG_ERROR(logger, "atomic_write: CreateFileW(temp) failed for '{}': {}", tmp.string(),
                      ec.message());
        return false;
    }
    if (!write_all_win(h, bytes) || !FlushFileBuffers(h))
    {
        const auto ec = last_win_error();
        CloseHandle(h);
        DeleteFileW(tmp.wstring().c_str());
        set_error(err_code, ec);
        SFX_LOG_ERROR(logger, "atomic_write: write failed for '{}': {}", tmp.string(),
                      ec.message());
        return false;
    }
    CloseHandle(h);

    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (MoveFileExW(tmp.wstring().c_str(), target.wstring().c_str(),
                        MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
        {
            return true;
        }
        const DWORD err = GetLastError();
        if (err != ERROR_SHARING_VIOLATION && err != ERROR_ACCESS_DENIED)
        {
            break;
        }
        SFX_LOG_WARN(logger, "atomic_write: sharing violation replacing '{}', retrying...",
                     target.string());
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    const auto ec = last_win_error();
    DeleteFileW(tmp.wstring().c_str());
    set_error(err_code, ec);
    SFX_LOG_ERROR(logger, "atomic_write: MoveFileExW failed for '{}': {}", target.string(),
                  ec.message());
    return false;
}

#else

std::error_code errno_code(int errnum) noexcept
{
    return std::make_error_code(static_cast<std::errc>(errnum));
}

bool reject_if_symlink_posix(const fs::path &target, Logger &logger, std::error_code *err_code)
{
    struct stat lstat_buf;
    if (lstat(target.c_str(), &lstat_buf) != 0 || !S_ISLNK(lstat_buf.st_mode))
    {
        return true;
    }
    set_error(err_code, std::make_error_code(std::errc::operation_not_permitted));
    SFX_LOG_ERROR(logger, "atomic_write: target '{}' is a symbolic link, refusing to write",
                  target.string());
    return false;
}

bool write_all_posix(int fd, std::string_view bytes, int *errnum)
{
    size_t written = 0;
    while (written < bytes.size())
    {
        const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            *errnum = errno;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

/**
 * Creates "<dir>/<name>.tmp.XXXXXX" via mkstemp, writes and fsyncs @p bytes, applies the
 * target's mode (or 0644 for a new file) and closes it. Returns the temp path; on failure
 * the temp file is gone and std::nullopt is returned.
 */
std::optional<std::string> write_temp_posix(const fs::path &target, std::string_view bytes,
                                            Logger &logger, std::error_code *err_code)
{
    std::string dir = target.parent_path().string();
    if (dir.empty())
    {
        dir = ".";
    }
    const std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    const int fd = mkstemp(tmpl_buf.data());
    if (fd == -1)
    {
        const int errnum = errno;
        set_error(err_code, errno_code(errnum));
        SFX_LOG_ERROR(logger, "atomic_write: mkstemp failed for '{}'. Error: {}", tmpl,
                      std::strerror(errnum));
        return std::nullopt;
    }
    std::string tmp_path(tmpl_buf.data());

    auto fail = [&](const char *what, int errnum) -> std::optional<std::string>
    {
        ::close(fd);
        ::unlink(tmp_path.c_str());
        set_error(err_code, errno_code(errnum));
        SFX_LOG_ERROR(logger, "atomic_write: {} failed for '{}'. Error: {}", what, tmp_path,
                      std::strerror(errnum));
        return std::nullopt;
    };

    int errnum = 0;
    if (!write_all_posix(fd, bytes, &errnum))
    {
        return fail("write", errnum);
    }
    if (::fsync(fd) != 0)
    {
        return fail("fsync(file)", errno);
    }
    struct stat stat_buf;
    const mode_t mode = (stat(target.c_str(), &stat_buf) == 0) ? (stat_buf.st_mode & 07777)
                                                               : static_cast<mode_t>(0644);
    if (fchmod(fd, mode) != 0)
    {
        return fail("fchmod", errno);
    }
    if (::close(fd) != 0)
    {
        errnum = errno;
        ::unlink(tmp_path.c_str());
        set_error(err_code, errno_code(errnum));
        SFX_LOG_ERROR(logger, "atomic_write: close failed for '{}'. Error: {}", tmp_path,
                      std::strerror(errnum));
        return std::nullopt;
    }
    return tmp_path;
}

bool atomic_rename_posix(const std::string &tmp_path, const fs::path &target, Logger &logger,
                         std::error_code *err_code)
{
    int last_errnum = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (std::rename(tmp_path.c_str(), target.c_str()) == 0)
        {
            return true;
        }
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
        {
            break;
        }
        SFX_LOG_WARN(logger, "atomic_write: rename hit transient error {} for '{}', retrying...",
                     std::strerror(last_errnum), target.string());
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    ::unlink(tmp_path.c_str());
    set_error(err_code, errno_code(last_errnum));
    SFX_LOG_ERROR(logger, "atomic_write: rename failed for '{}' after retries. Error: {}",
                  target.string(), std::strerror(last_errnum));
    return false;
}

bool fsync_parent_posix(const fs::path &target, Logger &logger, std::error_code *err_code)
{
    std::string dir = target.parent_path().string();
    if (dir.empty())
    {
        dir = ".";
    }
    const int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0)
    {
        const int errnum = errno;
        set_error(err_code, errno_code(errnum));
        SFX_LOG_ERROR(logger, "atomic_write: open(dir) failed for fsync: '{}'. Error: {}", dir,
                      std::strerror(errnum));
        return false;
    }
    bool success = true;
    if (::fsync(dfd) != 0)
    {
        const int errnum = errno;
        set_error(err_code, errno_code(errnum));
        SFX_LOG_ERROR(logger, "atomic_write: fsync(dir) failed for '{}'. Error: {}", dir,
                      std::strerror(errnum));
        success = false;
    }
    ::close(dfd);
    return success;
}

bool atomic_write_posix(const fs::path &target, std::string_view bytes, Logger &logger,
                        std::error_code *err_code)
{
    if (!reject_if_symlink_posix(target, logger, err_code))
    {
        return false;
    }
    auto tmp_path = write_temp_posix(target, bytes, logger, err_code);
    if (!tmp_path)
    {
        return false;
    }
    if (!atomic_rename_posix(*tmp_path, target, logger, err_code))
    {
        return false;
    }
    return fsync_parent_posix(target, logger, err_code);
}

#endif
} // namespace

bool atomic_write(const fs::path &target, std::string_view bytes, Logger &logger,
                  std::error_code *err_code) noexcept
{
    try
    {
        if (err_code != nullptr)
        {
            err_code->clear();
        }
#if defined(SCENEFIX_PLATFORM_WIN64)
        return atomic_write_win(target, bytes, logger, err_code);
#else
        return atomic_write_posix(target, bytes, logger, err_code);
#endif
    }
    catch (const std::exception &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::not_enough_memory));
        SFX_LOG_ERROR(logger, "atomic_write: exception for '{}': {}", target.string(), ex.what());
        return false;
    }
}

std::optional<std::string> read_file(const fs::path &path, std::error_code *err_code) noexcept
{
    try
    {
        if (err_code != nullptr)
        {
            err_code->clear();
        }
        std::FILE *fp = std::fopen(path.string().c_str(), "rb");
        if (fp == nullptr)
        {
            set_error(err_code, std::error_code(errno, std::generic_category()));
            return std::nullopt;
        }
        auto close_guard = scenefix::basics::make_scope_guard([fp]() { std::fclose(fp); });

        std::string content;
        char buf[8192];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0)
        {
            content.append(buf, n);
        }
        if (std::ferror(fp) != 0)
        {
            set_error(err_code, std::make_error_code(std::errc::io_error));
            return std::nullopt;
        }
        return content;
    }
    catch (const std::exception &)
    {
        set_error(err_code, std::make_error_code(std::errc::not_enough_memory));
        return std::nullopt;
    }
}

bool atomic_copy_replace(const fs::path &source, const fs::path &target, Logger &logger,
                         std::error_code *err_code) noexcept
{
    std::error_code read_ec;
    auto content = read_file(source, &read_ec);
    if (!content)
    {
        set_error(err_code, read_ec);
        SFX_LOG_ERROR(logger, "atomic_copy_replace: cannot read '{}': {}", source.string(),
                      read_ec.message());
        return false;
    }
    return atomic_write(target, *content, logger, err_code);
}

bool exclusive_copy(const fs::path &source, const fs::path &dest, Logger &logger,
                    std::error_code *err_code) noexcept
{
    std::error_code read_ec;
    auto content = read_file(source, &read_ec);
    if (!content)
    {
        set_error(err_code, read_ec);
        SFX_LOG_ERROR(logger, "exclusive_copy: cannot read '{}': {}", source.string(),
                      read_ec.message());
        return false;
    }
    try
    {
#if defined(SCENEFIX_PLATFORM_WIN64)
        HANDLE h = CreateFileW(dest.wstring().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE)
        {
            const DWORD err = GetLastError();
            if (err == ERROR_FILE_EXISTS)
            {
                set_error(err_code, std::make_error_code(std::errc::file_exists));
                return false;
            }
            set_error(err_code, std::error_code(static_cast<int>(err), std::system_category()));
            SFX_LOG_ERROR(logger, "exclusive_copy: CreateFileW failed for '{}'", dest.string());
            return false;
        }
        if (!write_all_win(h, *content) || !FlushFileBuffers(h))
        {
            const auto ec = last_win_error();
            CloseHandle(h);
            DeleteFileW(dest.wstring().c_str());
            set_error(err_code, ec);
            SFX_LOG_ERROR(logger, "exclusive_copy: write failed for '{}': {}", dest.string(),
                          ec.message());
            return false;
        }
        CloseHandle(h);
        return true;
#else
        struct stat stat_buf;
        if (stat(source.c_str(), &stat_buf) != 0)
        {
            const int errnum = errno;
            set_error(err_code, errno_code(errnum));
            SFX_LOG_ERROR(logger, "exclusive_copy: stat failed for '{}'. Error: {}",
                          source.string(), std::strerror(errnum));
            return false;
        }
        const int fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                              stat_buf.st_mode & 07777);
        if (fd == -1)
        {
            const int errnum = errno;
            set_error(err_code, errno_code(errnum));
            if (errnum != EEXIST)
            {
                SFX_LOG_ERROR(logger, "exclusive_copy: open failed for '{}'. Error: {}",
                              dest.string(), std::strerror(errnum));
            }
            return false;
        }
        int errnum = 0;
        bool ok = write_all_posix(fd, *content, &errnum);
        if (ok && ::fsync(fd) != 0)
        {
            errnum = errno;
            ok = false;
        }
        // open() applies the umask; force the source's bits.
        if (ok && fchmod(fd, stat_buf.st_mode & 07777) != 0)
        {
            errnum = errno;
            ok = false;
        }
        if (::close(fd) != 0 && ok)
        {
            errnum = errno;
            ok = false;
        }
        if (!ok)
        {
            ::unlink(dest.c_str());
            set_error(err_code, errno_code(errnum));
            SFX_LOG_ERROR(logger, "exclusive_copy: writing '{}' failed. Error: {}", dest.string(),
                          std::strerror(errnum));
            return false;
        }
        return fsync_parent_posix(dest, logger, err_code);
#endif
    }
    catch (const std::exception &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::not_enough_memory));
        SFX_LOG_ERROR(logger, "exclusive_copy: exception for '{}': {}", dest.string(), ex.what());
        return false;
    }
}

} // namespace scenefix::utils
