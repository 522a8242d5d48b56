#include "repair/repair_error.hpp"

#include <cstring>

#include <fmt/format.h>

namespace scenefix::repair
{

std::string_view to_string(RepairErrc code) noexcept
{
    switch (code)
    {
    case RepairErrc::NotFound:
        return "NotFound";
    case RepairErrc::Parse:
        return "Parse";
    case RepairErrc::Io:
        return "Io";
    case RepairErrc::Verification:
        return "Verification";
    case RepairErrc::RollbackFailure:
        return "RollbackFailure";
    case RepairErrc::LockTimeout:
        return "LockTimeout";
    case RepairErrc::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::string_view to_string(DefectClass cls) noexcept
{
    switch (cls)
    {
    case DefectClass::DuplicateIds:
        return "duplicate_scene_ids";
    case DefectClass::EmptyAttributes:
        return "empty_scene_attributes";
    }
    return "unknown";
}

std::optional<DefectClass> defect_class_from_string(std::string_view name)
{
    if (name == "duplicate_scene_ids")
        return DefectClass::DuplicateIds;
    if (name == "empty_scene_attributes")
        return DefectClass::EmptyAttributes;
    return std::nullopt;
}

std::string RepairError::describe() const
{
    std::string out = fmt::format("{}: {}", to_string(code), path.empty() ? "<no path>" : path);
    if (defect)
    {
        out += fmt::format(" [{}]", to_string(*defect));
    }
    if (!cause.empty())
    {
        out += ": ";
        out += cause;
    }
    if (os_error != 0)
    {
        out += fmt::format(" (errno {}: {})", os_error, std::strerror(os_error));
    }
    return out;
}

} // namespace scenefix::repair
