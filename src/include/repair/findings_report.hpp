#pragma once
/**
 * @file findings_report.hpp
 * @brief Flattened findings for notifiers, the CLI and host issue registries.
 *
 * A duplicate-id finding flattens into one `{name, id}` entry per record; an
 * empty-attribute finding into one `{name, id, empty_count}` entry.
 */
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "repair/detector.hpp"
#include "scenefix_utils_export.h"
#include "utils/logger.hpp"

namespace scenefix::repair
{

struct FindingSummary
{
    std::string name;
    std::string id;
    std::optional<size_t> empty_count;
};

SCENEFIX_UTILS_EXPORT std::vector<FindingSummary> summarize(const Findings &findings);

/// `[{"name": ..., "id": ...}, ...]`; `empty_count` is added where present.
SCENEFIX_UTILS_EXPORT nlohmann::json to_json(const std::vector<FindingSummary> &summaries);

/// One line per entry, joined with '\n':
/// `- {name} (ID: {id})` or `- {name} has {n} empty attributes`.
SCENEFIX_UTILS_EXPORT std::string render_text(const std::vector<FindingSummary> &summaries);

/// Both defect classes of @p doc:
/// `{"duplicate_scene_ids": {"scene_count": n, "scenes": [...]}, "empty_scene_attributes": ...}`.
SCENEFIX_UTILS_EXPORT nlohmann::json detection_report(const SceneDocument &doc);

enum class IssueSeverity
{
    Warning,
    Error
};

SCENEFIX_UTILS_EXPORT const char *to_string(IssueSeverity severity) noexcept;

/// A repair issue as a host registry shows it; `issue_id` is the defect class name.
struct Issue
{
    std::string issue_id;
    DefectClass defect{DefectClass::DuplicateIds};
    IssueSeverity severity{IssueSeverity::Warning};
    bool fixable{true};
    std::map<std::string, std::string> placeholders; ///< `scene_count`, `scene_list`
};

/// Host-side sink for repair issues.
class SCENEFIX_UTILS_EXPORT IssueReporter
{
  public:
    virtual ~IssueReporter() = default;
    virtual void raise(const Issue &issue) = 0;
};

/**
 * @brief Detects both defect classes in @p doc and raises one issue per class found.
 *
 * Duplicate ids are raised with severity Error, empty attributes with severity Warning;
 * each is also logged as a warning with its count. A reporter that throws is logged and
 * does not stop the other class from being reported.
 * @return The number of issues raised.
 */
SCENEFIX_UTILS_EXPORT size_t check_for_repair_issues(const SceneDocument &doc,
                                                     IssueReporter &reporter,
                                                     utils::Logger &logger);

} // namespace scenefix::repair
