#include "repair/document_store.hpp"

#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "utils/atomic_file.hpp"

namespace fs = std::filesystem;

namespace scenefix::repair
{

namespace
{

constexpr const char *kStrTag = "tag:yaml.org,2002:str";

// A well-formed YAML stream that does not have the shape of a scene document.
class ShapeError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

constexpr std::array<std::string_view, 5> kNullWords = {"", "~", "null", "Null", "NULL"};
constexpr std::array<std::string_view, 9> kTrueWords = {"true", "True", "TRUE", "yes", "Yes",
                                                        "YES",  "on",   "On",   "ON"};
constexpr std::array<std::string_view, 9> kFalseWords = {"false", "False", "FALSE", "no", "No",
                                                         "NO",    "off",   "Off",   "OFF"};

template <size_t N>
bool one_of(std::string_view text, const std::array<std::string_view, N> &words)
{
    for (auto w : words)
    {
        if (w == text)
            return true;
    }
    return false;
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool looks_like_decimal_int(std::string_view text)
{
    size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+'))
        ++i;
    if (i >= text.size())
        return false;
    if (text[i] == '0')
        return i + 1 == text.size();
    for (; i < text.size(); ++i)
    {
        if (!is_digit(text[i]))
            return false;
    }
    return true;
}

bool looks_like_decimal_float(std::string_view text)
{
    size_t i = 0;
    size_t digits = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+'))
        ++i;
    while (i < text.size() && is_digit(text[i]))
    {
        ++i;
        ++digits;
    }
    if (i >= text.size() || text[i] != '.')
        return false;
    ++i;
    while (i < text.size() && is_digit(text[i]))
    {
        ++i;
        ++digits;
    }
    if (digits == 0)
        return false;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E'))
    {
        ++i;
        if (i < text.size() && (text[i] == '-' || text[i] == '+'))
            ++i;
        size_t exp_digits = 0;
        while (i < text.size() && is_digit(text[i]))
        {
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0)
            return false;
    }
    return i == text.size();
}

std::optional<double> special_float(std::string_view text)
{
    std::string_view body = text;
    bool negative = false;
    if (!body.empty() && (body.front() == '-' || body.front() == '+'))
    {
        negative = body.front() == '-';
        body.remove_prefix(1);
        if (body == ".inf" || body == ".Inf" || body == ".INF")
            return negative ? -std::numeric_limits<double>::infinity()
                            : std::numeric_limits<double>::infinity();
        return std::nullopt;
    }
    if (body == ".inf" || body == ".Inf" || body == ".INF")
        return std::numeric_limits<double>::infinity();
    if (body == ".nan" || body == ".NaN" || body == ".NAN")
        return std::numeric_limits<double>::quiet_NaN();
    return std::nullopt;
}

// ---- YAML node -> model ------------------------------------------------------------------

std::string key_text(const YAML::Node &key, std::string_view where)
{
    if (key.IsNull())
        return {};
    if (!key.IsScalar())
        throw ShapeError(fmt::format("{}: mapping key is not a scalar", where));
    return key.Scalar();
}

AttributeValue scalar_value(const YAML::Node &node, std::string_view where)
{
    const std::string &tag = node.Tag();
    if (tag == "!" || tag == kStrTag)
        return AttributeValue(node.Scalar());
    if (tag.empty() || tag == "?")
        return resolve_plain_scalar(node.Scalar());
    throw ShapeError(fmt::format("{}: unsupported tag '{}'", where, tag));
}

AttributeMapping to_mapping(const YAML::Node &node, std::string_view where);

AttributeValue to_value(const YAML::Node &node, std::string_view where)
{
    switch (node.Type())
    {
    case YAML::NodeType::Null:
        return AttributeValue{};
    case YAML::NodeType::Scalar:
        return scalar_value(node, where);
    case YAML::NodeType::Sequence:
    {
        AttributeList list;
        list.reserve(node.size());
        for (const auto &item : node)
        {
            list.push_back(to_value(item, where));
        }
        return AttributeValue(std::move(list));
    }
    case YAML::NodeType::Map:
        return AttributeValue(to_mapping(node, where));
    case YAML::NodeType::Undefined:
        break;
    }
    throw ShapeError(fmt::format("{}: undefined node", where));
}

AttributeMapping to_mapping(const YAML::Node &node, std::string_view where)
{
    AttributeMapping map;
    map.reserve(node.size());
    for (const auto &kv : node)
    {
        std::string key = key_text(kv.first, where);
        map.emplace_back(key, to_value(kv.second, fmt::format("{}.{}", where, key)));
    }
    return map;
}

// id and name keep their text; a plain scalar that reads as a non-string is flagged so
// it is written back unquoted.
void read_identity(const YAML::Node &node, std::string &text, bool &plain_literal,
                   std::string_view where)
{
    plain_literal = false;
    if (node.IsNull())
    {
        text.clear();
        return;
    }
    if (!node.IsScalar())
        throw ShapeError(fmt::format("{} is not a scalar", where));

    const std::string &tag = node.Tag();
    text = node.Scalar();
    if (tag.empty() || tag == "?")
    {
        plain_literal = !resolve_plain_scalar(text).is_string();
    }
    else if (tag != "!" && tag != kStrTag)
    {
        throw ShapeError(fmt::format("{}: unsupported tag '{}'", where, tag));
    }
}

EntityMap to_entities(const YAML::Node &node, std::string_view where)
{
    EntityMap entities;
    if (node.IsNull())
        return entities;
    if (!node.IsMap())
        throw ShapeError(fmt::format("{}.entities is not a mapping", where));

    for (const auto &kv : node)
    {
        std::string entity_id = key_text(kv.first, where);
        std::string entity_where = fmt::format("{}.entities.{}", where, entity_id);
        const YAML::Node &attrs = kv.second;
        if (attrs.IsNull())
        {
            entities.emplace_back(std::move(entity_id), AttributeMap{});
        }
        else if (attrs.IsMap())
        {
            entities.emplace_back(std::move(entity_id), to_mapping(attrs, entity_where));
        }
        else
        {
            throw ShapeError(fmt::format("{} is not a mapping", entity_where));
        }
    }
    return entities;
}

SceneRecord to_record(const YAML::Node &node, size_t index)
{
    const std::string where = fmt::format("scene #{}", index);
    if (!node.IsMap())
        throw ShapeError(fmt::format("{} is not a mapping", where));

    SceneRecord rec;
    rec.has_id = false;
    rec.has_name = false;
    rec.has_entities = false;

    for (const auto &kv : node)
    {
        std::string key = key_text(kv.first, where);
        for (const auto &seen : rec.key_order)
        {
            if (seen == key)
                throw ShapeError(fmt::format("{}: duplicate key '{}'", where, key));
        }
        rec.key_order.push_back(key);

        if (key == "id")
        {
            rec.has_id = true;
            read_identity(kv.second, rec.id, rec.id_plain_literal, where + ".id");
        }
        else if (key == "name")
        {
            rec.has_name = true;
            read_identity(kv.second, rec.name, rec.name_plain_literal, where + ".name");
        }
        else if (key == "entities")
        {
            rec.has_entities = true;
            rec.entities = to_entities(kv.second, where);
        }
        else
        {
            rec.extra.emplace_back(key, to_value(kv.second, fmt::format("{}.{}", where, key)));
        }
    }
    return rec;
}

SceneDocument to_document(const YAML::Node &root)
{
    SceneDocument doc;
    if (!root.IsDefined() || root.IsNull())
        return doc;
    if (!root.IsSequence())
        throw ShapeError("top level is not a sequence of scenes");

    doc.reserve(root.size());
    size_t index = 0;
    for (const auto &item : root)
    {
        doc.push_back(to_record(item, index++));
    }
    return doc;
}

// ---- model -> YAML text ------------------------------------------------------------------

void emit_string(YAML::Emitter &out, const std::string &s)
{
    if (needs_quoting(s))
        out << YAML::DoubleQuoted << s;
    else
        out << s;
}

void emit_value(YAML::Emitter &out, const AttributeValue &v);

void emit_mapping(YAML::Emitter &out, const AttributeMapping &map)
{
    out << YAML::BeginMap;
    for (const auto &[key, value] : map)
    {
        out << YAML::Key << key << YAML::Value;
        emit_value(out, value);
    }
    out << YAML::EndMap;
}

void emit_value(YAML::Emitter &out, const AttributeValue &v)
{
    std::visit(
        [&out](const auto &arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                out << YAML::Null;
            else if constexpr (std::is_same_v<T, bool>)
                out << (arg ? "true" : "false");
            else if constexpr (std::is_same_v<T, int64_t>)
                out << fmt::format("{}", arg);
            else if constexpr (std::is_same_v<T, double>)
                out << format_float(arg);
            else if constexpr (std::is_same_v<T, std::string>)
                emit_string(out, arg);
            else if constexpr (std::is_same_v<T, AttributeList>)
            {
                out << YAML::BeginSeq;
                for (const auto &item : arg)
                {
                    emit_value(out, item);
                }
                out << YAML::EndSeq;
            }
            else
                emit_mapping(out, arg);
        },
        v.value);
}

void emit_identity(YAML::Emitter &out, const char *key, const std::string &text,
                   bool plain_literal)
{
    out << YAML::Key << key << YAML::Value;
    if (plain_literal)
        out << text;
    else
        emit_string(out, text);
}

void emit_entities(YAML::Emitter &out, const EntityMap &entities)
{
    out << YAML::Key << "entities" << YAML::Value << YAML::BeginMap;
    for (const auto &[entity_id, attrs] : entities)
    {
        out << YAML::Key << entity_id << YAML::Value;
        emit_mapping(out, attrs);
    }
    out << YAML::EndMap;
}

void emit_record_key(YAML::Emitter &out, const SceneRecord &rec, const std::string &key)
{
    if (key == "id")
    {
        if (rec.has_id)
            emit_identity(out, "id", rec.id, rec.id_plain_literal);
    }
    else if (key == "name")
    {
        if (rec.has_name)
            emit_identity(out, "name", rec.name, rec.name_plain_literal);
    }
    else if (key == "entities")
    {
        if (rec.has_entities)
            emit_entities(out, rec.entities);
    }
    else if (const AttributeValue *v = find_value(rec.extra, key); v != nullptr)
    {
        out << YAML::Key << key << YAML::Value;
        emit_value(out, *v);
    }
}

bool in_order(const SceneRecord &rec, const std::string &key)
{
    for (const auto &k : rec.key_order)
    {
        if (k == key)
            return true;
    }
    return false;
}

void emit_record(YAML::Emitter &out, const SceneRecord &rec)
{
    out << YAML::BeginMap;
    for (const auto &key : rec.key_order)
    {
        emit_record_key(out, rec, key);
    }
    // Keys added in code, or records built without a load.
    for (const char *key : {"id", "name", "entities"})
    {
        if (!in_order(rec, key))
            emit_record_key(out, rec, key);
    }
    for (const auto &[key, value] : rec.extra)
    {
        if (!in_order(rec, key))
        {
            out << YAML::Key << key << YAML::Value;
            emit_value(out, value);
        }
    }
    out << YAML::EndMap;
}

} // namespace

AttributeValue resolve_plain_scalar(std::string_view text)
{
    if (one_of(text, kNullWords))
        return AttributeValue{};
    if (one_of(text, kTrueWords))
        return AttributeValue(true);
    if (one_of(text, kFalseWords))
        return AttributeValue(false);

    if (looks_like_decimal_int(text))
    {
        const std::string s(text.front() == '+' ? text.substr(1) : text);
        errno = 0;
        char *end = nullptr;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == 0 && end == s.c_str() + s.size())
            return AttributeValue(static_cast<int64_t>(v));
        // Out of range: kept as text.
        return AttributeValue(std::string(text));
    }
    if (auto special = special_float(text))
        return AttributeValue(*special);
    if (looks_like_decimal_float(text))
    {
        const std::string s(text);
        char *end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() + s.size())
            return AttributeValue(v);
    }
    return AttributeValue(std::string(text));
}

bool needs_quoting(std::string_view text)
{
    return !resolve_plain_scalar(text).is_string();
}

std::string format_float(double value)
{
    if (std::isnan(value))
        return ".nan";
    if (std::isinf(value))
        return value > 0 ? ".inf" : "-.inf";

    std::string text = fmt::format("{}", value);
    const auto epos = text.find_first_of("eE");
    std::string mantissa = text.substr(0, epos);
    if (mantissa.find('.') == std::string::npos)
        mantissa += ".0";
    return epos == std::string::npos ? mantissa : mantissa + text.substr(epos);
}

RepairResult<SceneDocument> DocumentStore::parse(const std::string &text)
{
    try
    {
        YAML::Node root = YAML::Load(text);
        return RepairResult<SceneDocument>::ok(to_document(root));
    }
    catch (const ShapeError &e)
    {
        return RepairResult<SceneDocument>::error(RepairErrc::Parse, 0, e.what());
    }
    catch (const YAML::Exception &e)
    {
        return RepairResult<SceneDocument>::error(RepairErrc::Parse, 0,
                                                  fmt::format("YAML parse error: {}", e.what()));
    }
}

std::string DocumentStore::serialize(const SceneDocument &doc)
{
    YAML::Emitter out;
    out.SetIndent(2);
    out << YAML::BeginSeq;
    for (const auto &rec : doc)
    {
        emit_record(out, rec);
    }
    out << YAML::EndSeq;
    if (!out.good())
    {
        throw std::runtime_error(fmt::format("YAML emitter error: {}", out.GetLastError()));
    }
    std::string text(out.c_str(), out.size());
    text += '\n';
    return text;
}

RepairResult<SceneDocument> DocumentStore::load(const fs::path &path)
{
    std::error_code ec;
    auto bytes = utils::read_file(path, &ec);
    if (!bytes)
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            SFX_LOG_WARN(logger_, "Scene file '{}' does not exist", path.string());
            return RepairResult<SceneDocument>::error(RepairErrc::NotFound, ec.value(),
                                                      fmt::format("'{}' does not exist",
                                                                  path.string()));
        }
        SFX_LOG_ERROR(logger_, "Cannot read scene file '{}': {}", path.string(), ec.message());
        return RepairResult<SceneDocument>::error(
            RepairErrc::Io, ec.value(),
            fmt::format("cannot read '{}': {}", path.string(), ec.message()));
    }

    auto parsed = parse(*bytes);
    if (!parsed.is_ok())
    {
        SFX_LOG_ERROR(logger_, "Cannot parse scene file '{}': {}", path.string(), parsed.detail());
        return RepairResult<SceneDocument>::error(
            RepairErrc::Parse, 0, fmt::format("'{}': {}", path.string(), parsed.detail()));
    }
    SFX_LOG_DEBUG(logger_, "Loaded {} scenes from '{}'", parsed.content().size(), path.string());
    return parsed;
}

RepairStatus DocumentStore::write(const fs::path &path, const SceneDocument &doc)
{
    std::string text;
    try
    {
        text = serialize(doc);
    }
    catch (const std::exception &e)
    {
        SFX_LOG_ERROR(logger_, "Cannot serialize scenes for '{}': {}", path.string(), e.what());
        return RepairStatus::error(RepairErrc::Io, 0, e.what());
    }

    std::error_code ec;
    if (!utils::atomic_write(path, text, logger_, &ec))
    {
        return RepairStatus::error(RepairErrc::Io, ec.value(),
                                   fmt::format("cannot write '{}': {}", path.string(),
                                               ec.message()));
    }
    SFX_LOG_DEBUG(logger_, "Wrote {} scenes ({} bytes) to '{}'", doc.size(), text.size(),
                  path.string());
    return RepairStatus::ok(std::monostate{});
}

} // namespace scenefix::repair
