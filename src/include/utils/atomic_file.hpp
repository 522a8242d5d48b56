#pragma once
/**
 * @file atomic_file.hpp
 * @brief Crash-safe file replacement and copying primitives.
 *
 * `atomic_write` replaces a file so that any concurrent or later reader observes either
 * the complete old content or the complete new content:
 *  1. create a unique temp sibling `<name>.tmp.XXXXXX` (mkstemp, mode 0600);
 *  2. write all bytes, fsync, and copy the target's permission bits onto the temp file;
 *  3. rename the temp file over the target (retried on EBUSY/ETXTBSY/EINTR);
 *  4. fsync the parent directory so the rename itself is durable.
 * The temp file is removed on every failure path. Symbolic-link targets are refused.
 *
 * On Windows the rename step is `MoveFileExW(MOVEFILE_REPLACE_EXISTING |
 * MOVEFILE_WRITE_THROUGH)`.
 *
 * All functions are `noexcept`; failures return false (or std::nullopt), set
 * `*err_code` when non-null and are logged at error level.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::utils
{

/**
 * @brief Atomically replaces (or creates) @p target with @p bytes.
 *
 * If @p target exists its permission bits are kept; otherwise the file is created 0644.
 */
SCENEFIX_UTILS_EXPORT bool atomic_write(const std::filesystem::path &target, std::string_view bytes,
                                        Logger &logger, std::error_code *err_code) noexcept;

/**
 * @brief Atomically replaces @p target with the content of @p source.
 *
 * @p source is left untouched. Used to put a backup copy back in place.
 */
SCENEFIX_UTILS_EXPORT bool atomic_copy_replace(const std::filesystem::path &source,
                                               const std::filesystem::path &target, Logger &logger,
                                               std::error_code *err_code) noexcept;

/**
 * @brief Copies @p source to the new file @p dest, failing if @p dest already exists.
 *
 * @p dest is created with `O_CREAT | O_EXCL` and the permission bits of @p source, then
 * fsynced together with its directory. If @p dest exists, *err_code is set to
 * `std::errc::file_exists` and nothing is logged, so callers can probe for a free name.
 */
SCENEFIX_UTILS_EXPORT bool exclusive_copy(const std::filesystem::path &source,
                                          const std::filesystem::path &dest, Logger &logger,
                                          std::error_code *err_code) noexcept;

/**
 * @brief Reads a whole file into memory.
 * @return The file content, or std::nullopt with *err_code set (e.g.
 *         `std::errc::no_such_file_or_directory`).
 */
SCENEFIX_UTILS_EXPORT std::optional<std::string> read_file(const std::filesystem::path &path,
                                                           std::error_code *err_code) noexcept;

} // namespace scenefix::utils
