#pragma once
/**
 * @file backup_manager.hpp
 * @brief Timestamped sibling backups of a scene file, and restoring from them.
 *
 * A backup of `/cfg/scenes.yaml` taken at 2024-03-01 12:00:00 local time is
 * `/cfg/scenes.yaml.backup_20240301_120000`. If that name is taken, `_001` .. `_999` is
 * appended. Backups are created with an exclusive create, so two concurrent backups never
 * share a name, and are never deleted by this class.
 */
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "repair/repair_error.hpp"
#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::repair
{

struct BackupHandle
{
    std::filesystem::path original_path;
    std::filesystem::path backup_path;
    std::chrono::system_clock::time_point created_at;
};

class SCENEFIX_UTILS_EXPORT BackupManager
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kMaxCounter = 999;

    /// @param clock Time source for backup names; system_clock::now when empty.
    explicit BackupManager(utils::Logger &logger, Clock clock = {});
    virtual ~BackupManager() = default;

    BackupManager(const BackupManager &) = delete;
    BackupManager &operator=(const BackupManager &) = delete;

    /**
     * @brief Copies @p path to a new backup file in the same directory.
     *
     * The copy is fsynced and keeps the permission bits of @p path.
     * @return The handle; Io if @p path is unreadable or no free name is left.
     */
    [[nodiscard]] virtual RepairResult<BackupHandle> backup(const std::filesystem::path &path);

    /**
     * @brief Atomically puts the backup content back at the original path.
     *
     * The backup file is kept. Io if the backup is missing or the replace fails.
     */
    [[nodiscard]] virtual RepairStatus restore(const BackupHandle &handle);

    /// Backups of @p path, oldest first.
    [[nodiscard]] std::vector<std::filesystem::path>
    list_backups(const std::filesystem::path &path) const;

    /// `{basename}.backup_{YYYYMMDD_HHMMSS}`, plus `_{NNN}` when @p counter > 0.
    [[nodiscard]] static std::string backup_name(const std::string &basename,
                                                 std::chrono::system_clock::time_point when,
                                                 int counter);

  private:
    utils::Logger &logger_;
    Clock clock_;
};

} // namespace scenefix::repair
