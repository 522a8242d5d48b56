#pragma once
/**
 * @file file_lock.hpp
 * @brief Exclusive per-path lock held while a document is being repaired.
 *
 * A FileLock on `scenes.yaml` is two locks taken in order:
 *  1. a process-local registry entry keyed by the lock file's absolute path, so two
 *     threads of one process exclude each other (POSIX `flock` does not, when both
 *     threads open their own descriptor);
 *  2. an OS advisory lock on the sibling file `scenes.yaml.lock` (`flock` on POSIX,
 *     `LockFileEx` on Windows), so separate processes exclude each other.
 *
 * The lock file is created on demand and never removed; it is empty and only its lock
 * state matters. The document itself is never opened by this class, so it can be
 * replaced by rename while locked.
 *
 * All operations are `noexcept`. Failure is reported through `valid()` and
 * `error_code()`: `std::errc::timed_out` after a timed acquisition gives up,
 * `std::errc::resource_unavailable_try_again` for a busy non-blocking attempt, or the
 * OS error that prevented creating the lock file.
 *
 * @code
 *  FileLock lock(path, std::chrono::milliseconds(5000));
 *  if (!lock.valid()) {
 *      return fail(lock.error_code());
 *  }
 *  ... read, back up, rewrite ...
 * @endcode
 */
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include "scenefix_utils_export.h"

namespace scenefix::utils
{

enum class LockMode
{
    Blocking,
    NonBlocking
};

struct FileLockImpl;

class SCENEFIX_UTILS_EXPORT FileLock
{
  public:
    /** @brief Acquires the lock, waiting indefinitely in Blocking mode. */
    explicit FileLock(const std::filesystem::path &path,
                      LockMode mode = LockMode::Blocking) noexcept;

    /**
     * @brief Acquires the lock, giving up after @p timeout.
     *
     * The timeout covers both the in-process wait and the OS-level wait.
     */
    FileLock(const std::filesystem::path &path, std::chrono::milliseconds timeout) noexcept;

    ~FileLock();

    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;

    /** @brief Absolute path of the locked document, if the lock is held. */
    [[nodiscard]] std::optional<std::filesystem::path> get_locked_resource_path() const noexcept;

    /** @brief Path of the `.lock` file carrying the OS lock, if the lock is held. */
    [[nodiscard]] std::optional<std::filesystem::path>
    get_canonical_lock_file_path() const noexcept;

    /**
     * @brief Returns the lock file path used for @p path: its absolute, normalized form
     *        with ".lock" appended. Empty if @p path contains control characters.
     */
    static std::filesystem::path
    get_expected_lock_fullname_for(const std::filesystem::path &path) noexcept;

    /** @brief Non-throwing factory; std::nullopt if the lock could not be acquired. */
    static std::optional<FileLock> try_lock(const std::filesystem::path &path,
                                            LockMode mode = LockMode::NonBlocking) noexcept;
    static std::optional<FileLock> try_lock(const std::filesystem::path &path,
                                            std::chrono::milliseconds timeout) noexcept;

  private:
    FileLock() noexcept;

    struct FileLockImplDeleter
    {
        void operator()(FileLockImpl *ptr);
    };
    std::unique_ptr<FileLockImpl, FileLockImplDeleter> pImpl;
};

} // namespace scenefix::utils
