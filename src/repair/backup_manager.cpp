#include "repair/backup_manager.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "utils/atomic_file.hpp"
#include "utils/format_tools.hpp"

namespace fs = std::filesystem;

namespace scenefix::repair
{

namespace
{

constexpr std::string_view kBackupInfix = ".backup_";
constexpr size_t kStampLength = 15; // YYYYMMDD_HHMMSS

bool is_counter_suffix(std::string_view rest)
{
    if (rest.size() != 4 || rest[0] != '_')
        return false;
    return std::all_of(rest.begin() + 1, rest.end(), [](char c) { return c >= '0' && c <= '9'; });
}

fs::path directory_of(const fs::path &path)
{
    fs::path dir = path.parent_path();
    return dir.empty() ? fs::path(".") : dir;
}

} // namespace

BackupManager::BackupManager(utils::Logger &logger, Clock clock)
    : logger_(logger), clock_(std::move(clock))
{
    if (!clock_)
    {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string BackupManager::backup_name(const std::string &basename,
                                       std::chrono::system_clock::time_point when, int counter)
{
    std::string name = basename;
    name += kBackupInfix;
    name += format_tools::compact_timestamp(when);
    if (counter > 0)
    {
        name += fmt::format("_{:03}", counter);
    }
    return name;
}

RepairResult<BackupHandle> BackupManager::backup(const fs::path &path)
{
    const auto when = clock_();
    const std::string basename = path.filename().string();
    const fs::path dir = directory_of(path);

    for (int counter = 0; counter <= kMaxCounter; ++counter)
    {
        const fs::path candidate = dir / backup_name(basename, when, counter);
        std::error_code ec;
        if (utils::exclusive_copy(path, candidate, logger_, &ec))
        {
            SFX_LOG_INFO(logger_, "Created backup '{}'", candidate.string());
            return RepairResult<BackupHandle>::ok(BackupHandle{path, candidate, when});
        }
        if (ec != std::errc::file_exists)
        {
            return RepairResult<BackupHandle>::error(
                RepairErrc::Io, ec.value(),
                fmt::format("backup of '{}' to '{}' failed: {}", path.string(),
                            candidate.string(), ec.message()));
        }
    }

    SFX_LOG_ERROR(logger_, "No free backup name left for '{}' at {}", path.string(),
                  format_tools::compact_timestamp(when));
    return RepairResult<BackupHandle>::error(
        RepairErrc::Io, 0,
        fmt::format("no free backup name for '{}' ({} candidates taken)", path.string(),
                    kMaxCounter + 1));
}

RepairStatus BackupManager::restore(const BackupHandle &handle)
{
    std::error_code ec;
    if (!fs::is_regular_file(handle.backup_path, ec))
    {
        SFX_LOG_ERROR(logger_, "Backup '{}' is missing; cannot restore '{}'",
                      handle.backup_path.string(), handle.original_path.string());
        return RepairStatus::error(RepairErrc::Io, ec.value(),
                                   fmt::format("backup '{}' is missing",
                                               handle.backup_path.string()));
    }

    if (!utils::atomic_copy_replace(handle.backup_path, handle.original_path, logger_, &ec))
    {
        return RepairStatus::error(RepairErrc::Io, ec.value(),
                                   fmt::format("restoring '{}' from '{}' failed: {}",
                                               handle.original_path.string(),
                                               handle.backup_path.string(), ec.message()));
    }
    SFX_LOG_INFO(logger_, "Restored '{}' from '{}'", handle.original_path.string(),
                 handle.backup_path.string());
    return RepairStatus::ok(std::monostate{});
}

std::vector<fs::path> BackupManager::list_backups(const fs::path &path) const
{
    std::vector<fs::path> backups;
    const std::string prefix = path.filename().string() + std::string(kBackupInfix);

    std::error_code ec;
    fs::directory_iterator it(directory_of(path), ec);
    if (ec)
    {
        SFX_LOG_WARN(logger_, "Cannot list backups of '{}': {}", path.string(), ec.message());
        return backups;
    }
    for (const auto &entry : it)
    {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec))
            continue;
        const std::string name = entry.path().filename().string();
        if (name.size() < prefix.size() + kStampLength || name.compare(0, prefix.size(), prefix) != 0)
            continue;
        const std::string_view stamp = std::string_view(name).substr(prefix.size(), kStampLength);
        const std::string_view rest = std::string_view(name).substr(prefix.size() + kStampLength);
        if (!format_tools::parse_compact_timestamp(stamp))
            continue;
        if (!rest.empty() && !is_counter_suffix(rest))
            continue;
        backups.push_back(entry.path());
    }

    std::sort(backups.begin(), backups.end(),
              [](const fs::path &a, const fs::path &b)
              { return a.filename().string() < b.filename().string(); });
    return backups;
}

} // namespace scenefix::repair
