/**
 * @file repair_service_config.cpp
 * @brief RepairServiceConfig JSON parsing.
 */
#include "repair/repair_service_config.hpp"

#include <fstream>

namespace scenefix::repair
{

namespace
{

std::string where(const std::string &origin)
{
    return origin.empty() ? std::string() : " in '" + origin + "'";
}

std::string get_string(const nlohmann::json &j, const char *key, const std::string &fallback,
                       const std::string &origin)
{
    if (!j.contains(key) || j[key].is_null())
        return fallback;
    if (!j[key].is_string())
        throw std::runtime_error(std::string("Repair config: '") + key + "' must be a string" +
                                 where(origin));
    return j[key].get<std::string>();
}

} // namespace

utils::Logger::Level RepairServiceConfig::level() const
{
    auto lvl = utils::level_from_string(log_level);
    if (!lvl)
        throw std::runtime_error("Repair config: invalid 'log_level' = '" + log_level +
                                 "' (must be 'trace', 'debug', 'info', 'warning', 'error' or "
                                 "'system')");
    return *lvl;
}

std::optional<std::chrono::milliseconds> RepairServiceConfig::lock_timeout() const
{
    if (lock_timeout_ms < 0)
        return std::nullopt;
    return std::chrono::milliseconds(lock_timeout_ms);
}

RepairServiceConfig RepairServiceConfig::from_json(const nlohmann::json &j,
                                                   const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Repair config: top level must be a JSON object" +
                                 where(origin));

    RepairServiceConfig cfg;
    cfg.scene_path = get_string(j, "scene_path", cfg.scene_path, origin);
    cfg.log_level = get_string(j, "log_level", cfg.log_level, origin);
    cfg.log_file = get_string(j, "log_file", cfg.log_file, origin);

    // Validate now rather than when the logger is configured.
    (void)cfg.level();

    if (j.contains("lock_timeout_ms") && !j["lock_timeout_ms"].is_null())
    {
        const auto &t = j["lock_timeout_ms"];
        if (!t.is_number_integer())
            throw std::runtime_error("Repair config: 'lock_timeout_ms' must be an integer" +
                                     where(origin));
        cfg.lock_timeout_ms = t.get<int64_t>();
        if (cfg.lock_timeout_ms < -1)
            throw std::runtime_error("Repair config: 'lock_timeout_ms' must be >= -1" +
                                     where(origin));
    }

    if (j.contains("verify_content") && !j["verify_content"].is_null())
    {
        if (!j["verify_content"].is_boolean())
            throw std::runtime_error("Repair config: 'verify_content' must be a boolean" +
                                     where(origin));
        cfg.verify_content = j["verify_content"].get<bool>();
    }

    return cfg;
}

RepairServiceConfig RepairServiceConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Repair config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Repair config: JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j, path);
}

} // namespace scenefix::repair
