#include "repair/repairer.hpp"

#include "sfx_base.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>

#include <fmt/format.h>

namespace scenefix::repair
{

Repairer::Repairer(SuffixClock clock) : clock_(std::move(clock))
{
    if (!clock_)
    {
        clock_ = []
        {
            return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                            std::chrono::system_clock::now().time_since_epoch())
                                            .count());
        };
    }
}

SceneDocument Repairer::resolve_duplicate_ids(const SceneDocument &doc) const
{
    std::unordered_set<std::string> taken;
    for (const auto &rec : doc)
    {
        taken.insert(rec.id);
    }

    const int64_t base = clock_();
    std::unordered_set<std::string> kept;
    SceneDocument out = doc;
    for (auto &rec : out)
    {
        if (kept.insert(rec.id).second)
            continue;

        int64_t suffix = base;
        std::string candidate = fmt::format("{}_{}", rec.id, suffix);
        while (taken.count(candidate) != 0)
        {
            candidate = fmt::format("{}_{}", rec.id, ++suffix);
        }
        taken.insert(candidate);
        rec.id = std::move(candidate);
        rec.has_id = true;
        rec.id_plain_literal = false;
    }
    return out;
}

SceneDocument Repairer::strip_empty_attributes(const SceneDocument &doc)
{
    SceneDocument out = doc;
    for (auto &rec : out)
    {
        for (auto &[entity_id, attrs] : rec.entities)
        {
            attrs.erase(std::remove_if(attrs.begin(), attrs.end(),
                                       [](const auto &kv) { return kv.second.is_empty_placeholder(); }),
                        attrs.end());
        }
    }
    return out;
}

SceneDocument Repairer::repair(const SceneDocument &doc, DefectClass cls) const
{
    switch (cls)
    {
    case DefectClass::DuplicateIds:
        return resolve_duplicate_ids(doc);
    case DefectClass::EmptyAttributes:
        return strip_empty_attributes(doc);
    }
    SFX_PANIC("Repairer::repair: invalid DefectClass {}", static_cast<int>(cls));
}

} // namespace scenefix::repair
