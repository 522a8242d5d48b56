#pragma once
/**
 * @file repairer.hpp
 * @brief Pure document transforms that remove a defect class.
 *
 * Both transforms return a new document and leave their input untouched.
 */
#include <cstdint>
#include <functional>

#include "repair/repair_error.hpp"
#include "repair/scene_document.hpp"
#include "scenefix_utils_export.h"

namespace scenefix::repair
{

class SCENEFIX_UTILS_EXPORT Repairer
{
  public:
    /// Source of the numeric id suffix; Unix time in milliseconds by default.
    using SuffixClock = std::function<int64_t()>;

    explicit Repairer(SuffixClock clock = {});

    /**
     * @brief Gives every later holder of a repeated id a fresh `{id}_{suffix}` id.
     *
     * Single left-to-right pass: the first holder keeps its id. A candidate that matches
     * any original id, or an id generated earlier in the pass, is retried with suffix + 1.
     */
    [[nodiscard]] SceneDocument resolve_duplicate_ids(const SceneDocument &doc) const;

    /// Removes every null and "" attribute. Entities left empty are kept.
    [[nodiscard]] static SceneDocument strip_empty_attributes(const SceneDocument &doc);

    [[nodiscard]] SceneDocument repair(const SceneDocument &doc, DefectClass cls) const;

  private:
    SuffixClock clock_;
};

} // namespace scenefix::repair
