// file_lock.cpp
#include "sfx_base.hpp"
#include "utils/file_lock.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <new>
#include <string>
#include <thread>
#include <unordered_map>

#if defined(SCENEFIX_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace
{
constexpr int kLockFileMode = 0644;
constexpr std::chrono::milliseconds kLockPollingInterval{20};

using Clock = std::chrono::steady_clock;

std::string make_lock_key(const std::filesystem::path &lockpath)
{
#if defined(SCENEFIX_PLATFORM_WIN64)
    // NTFS paths compare case-insensitively.
    std::wstring w = lockpath.wstring();
    for (auto &ch : w)
        ch = towlower(ch);
    return std::filesystem::path(w).generic_string();
#else
    std::error_code ec;
    auto abs = std::filesystem::absolute(lockpath, ec);
    if (ec)
    {
        return lockpath.generic_string();
    }
    return abs.lexically_normal().generic_string();
#endif
}

std::optional<std::chrono::milliseconds> remaining(std::optional<Clock::time_point> deadline)
{
    if (!deadline)
    {
        return std::nullopt;
    }
    const auto now = Clock::now();
    if (now >= *deadline)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
}
} // namespace

namespace scenefix::utils
{

static std::mutex g_proc_registry_mtx;

struct ProcLockState
{
    int owners = 0;
    int waiters = 0;
    std::condition_variable cv;
};
static std::unordered_map<std::string, std::shared_ptr<ProcLockState>> g_proc_locks;

struct FileLockImpl
{
    std::filesystem::path path;
    std::filesystem::path canonical_lock_file_path;
    bool valid = false;
    std::error_code ec;
    std::string lock_key;
    std::shared_ptr<ProcLockState> proc_state;
#if defined(SCENEFIX_PLATFORM_WIN64)
    void *handle = nullptr;
#else
    int fd = -1;
#endif
};

static void release_process_local_lock(FileLockImpl *pImpl)
{
    std::lock_guard<std::mutex> lock_guard(g_proc_registry_mtx);
    if (pImpl->proc_state)
    {
        if (--pImpl->proc_state->owners == 0)
        {
            pImpl->proc_state->cv.notify_all();
            if (pImpl->proc_state->waiters == 0)
            {
                g_proc_locks.erase(pImpl->lock_key);
            }
        }
        pImpl->proc_state.reset();
    }
}

void FileLock::FileLockImplDeleter::operator()(FileLockImpl *ptr)
{
    if (ptr == nullptr)
    {
        return;
    }
    if (ptr->valid)
    {
#if defined(SCENEFIX_PLATFORM_WIN64)
        if (ptr->handle != nullptr)
        {
            OVERLAPPED ov = {};
            UnlockFileEx(static_cast<HANDLE>(ptr->handle), 0, 1, 0, &ov);
            CloseHandle(static_cast<HANDLE>(ptr->handle));
            ptr->handle = nullptr;
        }
#else
        if (ptr->fd != -1)
        {
            // Closing the descriptor releases the flock even if LOCK_UN fails.
            flock(ptr->fd, LOCK_UN);
            ::close(ptr->fd);
            ptr->fd = -1;
        }
#endif
        release_process_local_lock(ptr);
    }
    delete ptr;
}

static void open_and_lock(FileLockImpl *pImpl, LockMode mode,
                          std::optional<std::chrono::milliseconds> timeout);
static bool acquire_process_local_lock(FileLockImpl *pImpl, LockMode mode,
                                       std::optional<Clock::time_point> deadline);
static bool run_os_lock_loop(FileLockImpl *pImpl, LockMode mode,
                             std::optional<Clock::time_point> deadline);

std::filesystem::path
FileLock::get_expected_lock_fullname_for(const std::filesystem::path &path) noexcept
{
    try
    {
        constexpr int kFirstControlCharLimit = 32;
        for (const auto &path_char : path.native())
        {
            if (path_char >= 0 && path_char < kFirstControlCharLimit)
            {
                return {};
            }
        }

        std::error_code err_code;
        auto canonical_target = std::filesystem::weakly_canonical(path, err_code);
        if (err_code)
        {
            canonical_target = std::filesystem::absolute(path).lexically_normal();
        }
        auto lock_path = canonical_target;
        lock_path += ".lock";
        return lock_path;
    }
    catch (const std::exception &)
    {
        return {};
    }
}

FileLock::FileLock(const std::filesystem::path &path, LockMode mode) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (pImpl != nullptr)
    {
        pImpl->path = path;
        open_and_lock(pImpl.get(), mode, std::nullopt);
    }
}

FileLock::FileLock(const std::filesystem::path &path, std::chrono::milliseconds timeout) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (pImpl != nullptr)
    {
        pImpl->path = path;
        open_and_lock(pImpl.get(), LockMode::Blocking, timeout);
    }
}

FileLock::FileLock() noexcept : pImpl(nullptr) {}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->valid;
}

std::error_code FileLock::error_code() const noexcept
{
    return pImpl ? pImpl->ec : std::make_error_code(std::errc::not_enough_memory);
}

std::optional<std::filesystem::path> FileLock::get_locked_resource_path() const noexcept
{
    if (pImpl && pImpl->valid)
    {
        std::error_code ec;
        auto abs = std::filesystem::absolute(pImpl->path, ec);
        if (ec)
        {
            return std::nullopt;
        }
        return abs.lexically_normal();
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> FileLock::get_canonical_lock_file_path() const noexcept
{
    if (pImpl && pImpl->valid)
    {
        return pImpl->canonical_lock_file_path;
    }
    return std::nullopt;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &path,
                                           LockMode mode) noexcept
{
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (lock.pImpl == nullptr)
    {
        return std::nullopt;
    }
    lock.pImpl->path = path;
    open_and_lock(lock.pImpl.get(), mode, std::nullopt);
    if (lock.valid())
    {
        return {std::move(lock)};
    }
    return std::nullopt;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &path,
                                           std::chrono::milliseconds timeout) noexcept
{
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (lock.pImpl == nullptr)
    {
        return std::nullopt;
    }
    lock.pImpl->path = path;
    open_and_lock(lock.pImpl.get(), LockMode::Blocking, timeout);
    if (lock.valid())
    {
        return {std::move(lock)};
    }
    return std::nullopt;
}

// Private Helpers

static void open_and_lock(FileLockImpl *pImpl, LockMode mode,
                          std::optional<std::chrono::milliseconds> timeout)
{
    pImpl->valid = false;
    pImpl->ec.clear();

    std::optional<Clock::time_point> deadline;
    if (timeout)
    {
        deadline = Clock::now() + *timeout;
    }

    pImpl->canonical_lock_file_path = FileLock::get_expected_lock_fullname_for(pImpl->path);
    if (pImpl->canonical_lock_file_path.empty())
    {
        pImpl->ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    if (!acquire_process_local_lock(pImpl, mode, deadline))
    {
        return;
    }

    if (!run_os_lock_loop(pImpl, mode, deadline))
    {
        release_process_local_lock(pImpl);
        return;
    }
    pImpl->valid = true;
}

static bool acquire_process_local_lock(FileLockImpl *pImpl, LockMode mode,
                                       std::optional<Clock::time_point> deadline)
{
    try
    {
        pImpl->lock_key = make_lock_key(pImpl->canonical_lock_file_path);
    }
    catch (const std::exception &)
    {
        pImpl->ec = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    std::unique_lock<std::mutex> regl(g_proc_registry_mtx);
    auto &state_ref = g_proc_locks[pImpl->lock_key];
    if (!state_ref)
    {
        state_ref = std::make_shared<ProcLockState>();
    }
    auto state = state_ref;

    if (state->owners > 0)
    {
        if (mode == LockMode::NonBlocking)
        {
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }

        ++state->waiters;
        auto waiter_guard = scenefix::basics::make_scope_guard([&state]() { --state->waiters; });
        bool acquired = true;
        if (deadline)
        {
            acquired = state->cv.wait_until(regl, *deadline, [&] { return state->owners == 0; });
        }
        else
        {
            state->cv.wait(regl, [&] { return state->owners == 0; });
        }
        if (!acquired)
        {
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
    }

    state->owners++;
    pImpl->proc_state = std::move(state);
    return true;
}

static bool run_os_lock_loop(FileLockImpl *pImpl, LockMode mode,
                             std::optional<Clock::time_point> deadline)
{
    const auto &lockpath = pImpl->canonical_lock_file_path;
#if defined(SCENEFIX_PLATFORM_WIN64)
    HANDLE h = CreateFileW(lockpath.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        pImpl->ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return false;
    }
    auto guard = scenefix::basics::make_scope_guard(
        [&]()
        {
            if (!pImpl->valid)
                CloseHandle(h);
        });

    DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
    if (mode == LockMode::NonBlocking || deadline)
    {
        flags |= LOCKFILE_FAIL_IMMEDIATELY;
    }
    while (true)
    {
        OVERLAPPED ov = {};
        if (LockFileEx(h, flags, 0, 1, 0, &ov))
        {
            pImpl->handle = reinterpret_cast<void *>(h);
            pImpl->valid = true;
            return true;
        }
        const DWORD err = GetLastError();
        pImpl->ec = std::error_code(static_cast<int>(err), std::system_category());
        if (mode == LockMode::NonBlocking || err != ERROR_LOCK_VIOLATION)
        {
            return false;
        }
        if (deadline && Clock::now() >= *deadline)
        {
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        std::this_thread::sleep_for(kLockPollingInterval);
    }
#else
    int lock_fd = ::open(lockpath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW,
                         kLockFileMode);
    if (lock_fd == -1)
    {
        pImpl->ec = std::error_code(errno, std::generic_category());
        return false;
    }
    bool locked = false;
    auto guard = scenefix::basics::make_scope_guard(
        [&]()
        {
            if (!locked)
                ::close(lock_fd);
        });

    if (mode == LockMode::Blocking && !deadline)
    {
        int rc = 0;
        do
        {
            rc = flock(lock_fd, LOCK_EX);
        } while (rc == -1 && errno == EINTR);
        if (rc == 0)
        {
            pImpl->fd = lock_fd;
            locked = true;
            return true;
        }
        pImpl->ec = std::error_code(errno, std::generic_category());
        return false;
    }

    while (true)
    {
        if (flock(lock_fd, LOCK_EX | LOCK_NB) == 0)
        {
            pImpl->fd = lock_fd;
            locked = true;
            return true;
        }
        const int err = errno;
        SFX_DEBUG("PID {} - flock(LOCK_NB) on {} failed: {}", getpid(), lockpath.string(),
                  std::strerror(err));
        if (err != EWOULDBLOCK && err != EAGAIN && err != EINTR)
        {
            pImpl->ec = std::error_code(err, std::generic_category());
            return false;
        }
        if (mode == LockMode::NonBlocking)
        {
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        const auto left = remaining(deadline);
        if (left && left->count() == 0)
        {
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        std::this_thread::sleep_for(left ? std::min(*left, kLockPollingInterval)
                                         : kLockPollingInterval);
    }
#endif
}

} // namespace scenefix::utils
