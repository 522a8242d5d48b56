#pragma once
/**
 * @file scene_document.hpp
 * @brief In-memory model of a scene-configuration document.
 *
 * A document is the ordered list of scene records of one YAML file:
 *
 * @code{.yaml}
 * - id: "1700000000001"
 *   name: Movie night
 *   icon: mdi:movie
 *   entities:
 *     light.sofa:
 *       state: "on"
 *       brightness: 120
 *     media_player.tv:
 *       state: playing
 * @endcode
 *
 * Every mapping keeps its document order. Record keys other than `id`, `name` and
 * `entities` are carried through unchanged in `extra`.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "scenefix_utils_export.h"

namespace scenefix::repair
{

struct AttributeValue;

/// Ordered sequence value, e.g. `rgb_color: [255, 0, 0]`.
using AttributeList = std::vector<AttributeValue>;
/// Ordered mapping value; also used for an entity's attribute map.
using AttributeMapping = std::vector<std::pair<std::string, AttributeValue>>;

/**
 * @struct AttributeValue
 * @brief A YAML value: null, bool, integer, float, string, or a nested list/mapping.
 */
struct SCENEFIX_UTILS_EXPORT AttributeValue
{
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string,
                                 AttributeList, AttributeMapping>;

    Storage value;

    AttributeValue() = default;
    AttributeValue(std::nullptr_t) {}
    AttributeValue(bool b) : value(b) {}
    AttributeValue(int v) : value(static_cast<int64_t>(v)) {}
    AttributeValue(int64_t v) : value(v) {}
    AttributeValue(double v) : value(v) {}
    AttributeValue(const char *s) : value(std::string(s)) {}
    AttributeValue(std::string s) : value(std::move(s)) {}
    AttributeValue(AttributeList l) : value(std::move(l)) {}
    AttributeValue(AttributeMapping m) : value(std::move(m)) {}

    [[nodiscard]] bool is_null() const noexcept
    {
        return std::holds_alternative<std::monostate>(value);
    }
    [[nodiscard]] bool is_string() const noexcept
    {
        return std::holds_alternative<std::string>(value);
    }

    /// True for the placeholder values a cleanup removes: null and "".
    [[nodiscard]] bool is_empty_placeholder() const noexcept;

    /// Compact single-line rendering for log messages.
    [[nodiscard]] std::string debug_string() const;
};

/// Values compare structurally; NaN equals NaN so documents holding `.nan` compare equal.
SCENEFIX_UTILS_EXPORT bool operator==(const AttributeValue &lhs, const AttributeValue &rhs);
inline bool operator!=(const AttributeValue &lhs, const AttributeValue &rhs)
{
    return !(lhs == rhs);
}

using AttributeMap = AttributeMapping;
/// Entity id -> attribute map, in document order.
using EntityMap = std::vector<std::pair<std::string, AttributeMap>>;

/**
 * @struct SceneRecord
 * @brief One scene: identifier, display name, and the captured entity states.
 *
 * The `has_*` flags record whether the key was present in the file, so a record that
 * lacks one is written back without inventing it. A missing id is treated as "" and a
 * missing name is reported as "Unknown".
 */
struct SCENEFIX_UTILS_EXPORT SceneRecord
{
    std::string id;
    std::string name;
    EntityMap entities;

    bool has_id = true;
    bool has_name = true;
    bool has_entities = true;

    /// The id/name came from a plain scalar that reads as a number or bool
    /// (`id: 1700000000001`); it is written back unquoted while unchanged.
    bool id_plain_literal = false;
    bool name_plain_literal = false;

    /// Other record keys (`icon`, `metadata`, ...), in document order.
    AttributeMapping extra;

    /// Order of all record keys as loaded. Empty for records built in code, which are
    /// written as id, name, entities, then `extra`. Not part of equality.
    std::vector<std::string> key_order;

    /// Name used in reports: `name`, or "Unknown" when the key is absent.
    [[nodiscard]] std::string display_name() const;

    /// Attribute map of @p entity_id, or nullptr.
    [[nodiscard]] const AttributeMap *find_entity(const std::string &entity_id) const noexcept;
};

SCENEFIX_UTILS_EXPORT bool operator==(const SceneRecord &lhs, const SceneRecord &rhs);
inline bool operator!=(const SceneRecord &lhs, const SceneRecord &rhs)
{
    return !(lhs == rhs);
}

/// The whole file: records in document order.
using SceneDocument = std::vector<SceneRecord>;

/// Attribute value lookup by key in an ordered mapping; nullptr if absent.
SCENEFIX_UTILS_EXPORT const AttributeValue *find_value(const AttributeMapping &map,
                                                       const std::string &key) noexcept;

} // namespace scenefix::repair
