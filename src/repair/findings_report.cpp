#include "repair/findings_report.hpp"

#include <fmt/format.h>

namespace scenefix::repair
{

namespace
{

FindingSummary summary_of(const SceneRecord &rec, std::optional<size_t> empty_count)
{
    return FindingSummary{rec.display_name(), rec.id, empty_count};
}

nlohmann::json class_report(const std::vector<FindingSummary> &summaries)
{
    return nlohmann::json{{"scene_count", summaries.size()}, {"scenes", to_json(summaries)}};
}

Issue make_issue(DefectClass cls, IssueSeverity severity,
                 const std::vector<FindingSummary> &summaries)
{
    Issue issue;
    issue.issue_id = std::string(to_string(cls));
    issue.defect = cls;
    issue.severity = severity;
    issue.fixable = true;
    issue.placeholders["scene_count"] = std::to_string(summaries.size());
    issue.placeholders["scene_list"] = render_text(summaries);
    return issue;
}

bool raise_logged(IssueReporter &reporter, const Issue &issue, utils::Logger &logger)
{
    try
    {
        reporter.raise(issue);
        return true;
    }
    catch (const std::exception &e)
    {
        SFX_LOG_ERROR(logger, "Raising issue '{}' failed: {}", issue.issue_id, e.what());
        return false;
    }
}

} // namespace

std::vector<FindingSummary> summarize(const Findings &findings)
{
    std::vector<FindingSummary> out;
    for (const auto &finding : findings)
    {
        if (const auto *dup = std::get_if<DuplicateId>(&finding))
        {
            for (const auto &rec : dup->records)
            {
                out.push_back(summary_of(rec, std::nullopt));
            }
        }
        else if (const auto *empty = std::get_if<EmptyAttributes>(&finding))
        {
            out.push_back(summary_of(empty->record, empty->count));
        }
    }
    return out;
}

nlohmann::json to_json(const std::vector<FindingSummary> &summaries)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &s : summaries)
    {
        nlohmann::json entry{{"name", s.name}, {"id", s.id}};
        if (s.empty_count)
            entry["empty_count"] = *s.empty_count;
        arr.push_back(std::move(entry));
    }
    return arr;
}

std::string render_text(const std::vector<FindingSummary> &summaries)
{
    std::string text;
    for (const auto &s : summaries)
    {
        if (!text.empty())
            text += '\n';
        if (s.empty_count)
            text += fmt::format("- {} has {} empty attributes", s.name, *s.empty_count);
        else
            text += fmt::format("- {} (ID: {})", s.name, s.id);
    }
    return text;
}

nlohmann::json detection_report(const SceneDocument &doc)
{
    nlohmann::json report = nlohmann::json::object();
    report[std::string(to_string(DefectClass::DuplicateIds))] =
        class_report(summarize(find_duplicate_ids(doc)));
    report[std::string(to_string(DefectClass::EmptyAttributes))] =
        class_report(summarize(find_empty_attributes(doc)));
    return report;
}

const char *to_string(IssueSeverity severity) noexcept
{
    return severity == IssueSeverity::Error ? "error" : "warning";
}

size_t check_for_repair_issues(const SceneDocument &doc, IssueReporter &reporter,
                               utils::Logger &logger)
{
    size_t raised = 0;

    const auto duplicates = summarize(find_duplicate_ids(doc));
    if (!duplicates.empty())
    {
        SFX_LOG_WARN(logger, "Found {} scenes with duplicate IDs", duplicates.size());
        if (raise_logged(reporter,
                         make_issue(DefectClass::DuplicateIds, IssueSeverity::Error, duplicates),
                         logger))
            ++raised;
    }

    const auto empties = summarize(find_empty_attributes(doc));
    if (!empties.empty())
    {
        SFX_LOG_WARN(logger, "Found {} scenes with empty attributes", empties.size());
        if (raise_logged(reporter,
                         make_issue(DefectClass::EmptyAttributes, IssueSeverity::Warning, empties),
                         logger))
            ++raised;
    }
    return raised;
}

} // namespace scenefix::repair
