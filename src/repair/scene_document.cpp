#include "repair/scene_document.hpp"

#include <cmath>

#include <fmt/format.h>

namespace scenefix::repair
{

namespace
{

bool same_double(double a, double b)
{
    if (std::isnan(a) && std::isnan(b))
        return true;
    return a == b;
}

template <typename Pair>
bool same_pairs(const std::vector<Pair> &lhs, const std::vector<Pair> &rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        if (lhs[i].first != rhs[i].first || !(lhs[i].second == rhs[i].second))
            return false;
    }
    return true;
}

void append_debug(std::string &out, const AttributeValue &v)
{
    std::visit(
        [&out](const auto &arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                out += "null";
            else if constexpr (std::is_same_v<T, bool>)
                out += arg ? "true" : "false";
            else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>)
                out += fmt::format("{}", arg);
            else if constexpr (std::is_same_v<T, std::string>)
                out += fmt::format("\"{}\"", arg);
            else if constexpr (std::is_same_v<T, AttributeList>)
            {
                out += '[';
                for (size_t i = 0; i < arg.size(); ++i)
                {
                    if (i != 0)
                        out += ", ";
                    append_debug(out, arg[i]);
                }
                out += ']';
            }
            else
            {
                out += '{';
                for (size_t i = 0; i < arg.size(); ++i)
                {
                    if (i != 0)
                        out += ", ";
                    out += arg[i].first;
                    out += ": ";
                    append_debug(out, arg[i].second);
                }
                out += '}';
            }
        },
        v.value);
}

} // namespace

bool AttributeValue::is_empty_placeholder() const noexcept
{
    if (is_null())
        return true;
    const auto *s = std::get_if<std::string>(&value);
    return s != nullptr && s->empty();
}

std::string AttributeValue::debug_string() const
{
    std::string out;
    append_debug(out, *this);
    return out;
}

bool operator==(const AttributeValue &lhs, const AttributeValue &rhs)
{
    if (lhs.value.index() != rhs.value.index())
        return false;
    return std::visit(
        [&rhs](const auto &a) -> bool
        {
            using T = std::decay_t<decltype(a)>;
            const auto &b = std::get<T>(rhs.value);
            if constexpr (std::is_same_v<T, std::monostate>)
                return true;
            else if constexpr (std::is_same_v<T, double>)
                return same_double(a, b);
            else if constexpr (std::is_same_v<T, AttributeList>)
            {
                if (a.size() != b.size())
                    return false;
                for (size_t i = 0; i < a.size(); ++i)
                {
                    if (!(a[i] == b[i]))
                        return false;
                }
                return true;
            }
            else if constexpr (std::is_same_v<T, AttributeMapping>)
                return same_pairs(a, b);
            else
                return a == b;
        },
        lhs.value);
}

std::string SceneRecord::display_name() const
{
    return has_name ? name : std::string("Unknown");
}

const AttributeMap *SceneRecord::find_entity(const std::string &entity_id) const noexcept
{
    for (const auto &[eid, attrs] : entities)
    {
        if (eid == entity_id)
            return &attrs;
    }
    return nullptr;
}

bool operator==(const SceneRecord &lhs, const SceneRecord &rhs)
{
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.has_id == rhs.has_id &&
           lhs.has_name == rhs.has_name && lhs.has_entities == rhs.has_entities &&
           lhs.id_plain_literal == rhs.id_plain_literal &&
           lhs.name_plain_literal == rhs.name_plain_literal &&
           same_pairs(lhs.entities, rhs.entities) && same_pairs(lhs.extra, rhs.extra);
}

const AttributeValue *find_value(const AttributeMapping &map, const std::string &key) noexcept
{
    for (const auto &[k, v] : map)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

} // namespace scenefix::repair
