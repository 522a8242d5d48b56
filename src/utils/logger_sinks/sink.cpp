#include "utils/logger_sinks/sink.hpp"

#include <array>
#include <iterator>

namespace scenefix::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<const char *, 6> kLevelNames = {"TRACE", "DEBUG", "INFO",
                                                     "WARN",  "ERROR", "SYSTEM"};
} // namespace

const char *Sink::level_to_string_internal(int lvl)
{
    if (lvl < 0 || lvl >= static_cast<int>(kLevelNames.size()))
        return "UNK";
    return kLevelNames[static_cast<size_t>(lvl)];
}

// [SFX] [LEVEL ] [time] [PID:n TID:n] body
std::string Sink::format_logmsg(const LogMessage &msg)
{
    fmt::memory_buffer line;
    fmt::format_to(std::back_inserter(line), "[SFX] [{:<6}] [{}] [PID:{:5} TID:{:5}] ",
                   level_to_string_internal(msg.level),
                   format_tools::formatted_time(msg.timestamp), msg.process_id, msg.thread_id);
    line.append(msg.body.data(), msg.body.data() + msg.body.size());
    line.push_back('\n');
    return fmt::to_string(line);
}

} // namespace scenefix::utils
