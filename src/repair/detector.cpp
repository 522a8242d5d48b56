#include "repair/detector.hpp"

#include "sfx_base.hpp"

#include <unordered_map>

namespace scenefix::repair
{

Findings find_duplicate_ids(const SceneDocument &doc)
{
    // id -> indices of its holders; `order` keeps first appearance.
    std::unordered_map<std::string, std::vector<size_t>> holders;
    std::vector<std::string> order;
    for (size_t i = 0; i < doc.size(); ++i)
    {
        auto [it, inserted] = holders.try_emplace(doc[i].id);
        if (inserted)
            order.push_back(doc[i].id);
        it->second.push_back(i);
    }

    Findings findings;
    for (const auto &id : order)
    {
        const auto &indices = holders.at(id);
        if (indices.size() < 2)
            continue;
        DuplicateId dup{id, {}};
        dup.records.reserve(indices.size());
        for (size_t idx : indices)
        {
            dup.records.push_back(doc[idx]);
        }
        findings.emplace_back(std::move(dup));
    }
    return findings;
}

size_t count_empty_attributes(const SceneRecord &rec) noexcept
{
    size_t count = 0;
    for (const auto &[entity_id, attrs] : rec.entities)
    {
        for (const auto &[name, value] : attrs)
        {
            if (value.is_empty_placeholder())
                ++count;
        }
    }
    return count;
}

Findings find_empty_attributes(const SceneDocument &doc)
{
    Findings findings;
    for (const auto &rec : doc)
    {
        const size_t count = count_empty_attributes(rec);
        if (count > 0)
            findings.emplace_back(EmptyAttributes{rec, count});
    }
    return findings;
}

Findings detect(const SceneDocument &doc, DefectClass cls)
{
    switch (cls)
    {
    case DefectClass::DuplicateIds:
        return find_duplicate_ids(doc);
    case DefectClass::EmptyAttributes:
        return find_empty_attributes(doc);
    }
    SFX_PANIC("detect: invalid DefectClass {}", static_cast<int>(cls));
}

} // namespace scenefix::repair
