#pragma once
/**
 * @file detector.hpp
 * @brief Finds duplicate scene ids and empty attribute values. Pure, no I/O.
 */
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "repair/repair_error.hpp"
#include "repair/scene_document.hpp"
#include "scenefix_utils_export.h"

namespace scenefix::repair
{

/// Two or more records sharing `id`, in document order.
struct DuplicateId
{
    std::string id;
    std::vector<SceneRecord> records;
};

/// A record with @c count null or "" attribute values across all of its entities.
struct EmptyAttributes
{
    SceneRecord record;
    size_t count{0};
};

using Finding = std::variant<DuplicateId, EmptyAttributes>;
using Findings = std::vector<Finding>;

/// One finding per id held by more than one record; groups ordered by first appearance.
/// A missing id groups as "".
SCENEFIX_UTILS_EXPORT Findings find_duplicate_ids(const SceneDocument &doc);

/// One finding per record that has at least one empty attribute value.
SCENEFIX_UTILS_EXPORT Findings find_empty_attributes(const SceneDocument &doc);

SCENEFIX_UTILS_EXPORT Findings detect(const SceneDocument &doc, DefectClass cls);

/// Number of empty attribute values in @p rec.
SCENEFIX_UTILS_EXPORT size_t count_empty_attributes(const SceneRecord &rec) noexcept;

} // namespace scenefix::repair
