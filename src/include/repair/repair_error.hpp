#pragma once
/**
 * @file repair_error.hpp
 * @brief Error vocabulary of the repair layer.
 *
 * Core operations return `utils::Result<T, RepairErrc>`; the enum value names the failure
 * class, the Result's code carries the OS error (errno) when one exists and its detail
 * names the failing path and cause. The pipeline lifts a failed Result into a
 * `RepairError`, which also records the defect class being repaired.
 */
#include <optional>
#include <string>
#include <string_view>

#include "scenefix_utils_export.h"
#include "utils/result.hpp"

namespace scenefix::repair
{

enum class RepairErrc
{
    NotFound,        ///< The document path does not exist.
    Parse,           ///< Not well-formed YAML, or not shaped as a scene document.
    Io,              ///< Read, write, copy or rename failure.
    Verification,    ///< The written file did not reload as the repaired document.
    RollbackFailure, ///< Restoring the backup failed; the original may be damaged.
    LockTimeout,     ///< The per-path lock could not be acquired in time.
    Cancelled        ///< The caller cancelled before any mutation.
};

/// Defect classes the engine knows how to detect and repair.
enum class DefectClass
{
    DuplicateIds,
    EmptyAttributes
};

template <typename T>
using RepairResult = utils::Result<T, RepairErrc>;
using RepairStatus = utils::Status<RepairErrc>;

SCENEFIX_UTILS_EXPORT std::string_view to_string(RepairErrc code) noexcept;

/// `duplicate_scene_ids` / `empty_scene_attributes`.
SCENEFIX_UTILS_EXPORT std::string_view to_string(DefectClass cls) noexcept;

/// Inverse of to_string(DefectClass); std::nullopt for an unknown name.
SCENEFIX_UTILS_EXPORT std::optional<DefectClass> defect_class_from_string(std::string_view name);

/**
 * @struct RepairError
 * @brief A pipeline failure: what went wrong, on which file, for which defect class.
 */
struct SCENEFIX_UTILS_EXPORT RepairError
{
    RepairErrc code{RepairErrc::Io};
    std::string path;
    std::optional<DefectClass> defect;
    std::string cause;
    int os_error{0};

    /// One-line description, e.g.
    /// `Io: /cfg/scenes.yaml [duplicate_scene_ids]: rename failed (errno 28: No space left on device)`.
    [[nodiscard]] std::string describe() const;

    template <typename T>
    static RepairError from_result(const RepairResult<T> &res, std::string path,
                                   std::optional<DefectClass> defect)
    {
        return RepairError{res.error(), std::move(path), defect, res.detail(), res.error_code()};
    }
};

} // namespace scenefix::repair
