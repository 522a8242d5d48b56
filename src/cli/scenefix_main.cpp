/**
 * @file scenefix_main.cpp
 * @brief scenefix — detect and repair defects in a scene-configuration file.
 *
 * ## Usage
 *
 *     scenefix [options] detect  [<scenes.yaml>]            # JSON report; exit 0 clean, 2 defects
 *     scenefix [options] repair  [<scenes.yaml>] --class <c> # exit 0 on Done/Committed, else 1
 *     scenefix [options] backups [<scenes.yaml>]            # list backups, oldest first
 *
 * ## Options
 *
 *     --config <file.json>   Service configuration (see repair_service_config.hpp)
 *     --log-level <level>    trace | debug | info | warning | error | system
 *     --log-file <path>      Log to a file instead of stderr
 *     --version              Print the scenefix version and exit
 *
 * When no path is given, `scene_path` from the configuration is used. Command-line
 * options override the configuration file. SIGINT/SIGTERM cancel a running repair
 * if it has not started writing yet.
 */

#include "sfx_repair.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace scenefix;

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitDefects = 2;

repair::CancellationToken g_cancel;

void signal_handler(int /*sig*/) noexcept
{
    g_cancel.cancel();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct CliArgs
{
    std::string config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    std::string command;
    std::string scene_path;
    std::string defect_class;
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options] detect  [<scenes.yaml>]\n"
        << "  " << prog << " [options] repair  [<scenes.yaml>] --class <defect class>\n"
        << "  " << prog << " [options] backups [<scenes.yaml>]\n\n"
        << "Defect classes: duplicate_scene_ids, empty_scene_attributes\n\n"
        << "Options:\n"
        << "  --config <file.json>  Service configuration\n"
        << "  --log-level <level>   trace|debug|info|warning|error|system\n"
        << "  --log-file <path>     Log to a file instead of stderr\n"
        << "  --version             Print the version and exit\n"
        << "  --help                Show this message\n";
}

[[noreturn]] void usage_error(const char *prog, const std::string &msg)
{
    std::cerr << "Error: " << msg << "\n\n";
    print_usage(prog);
    std::exit(kExitFailure);
}

CliArgs parse_args(int argc, char *argv[])
{
    CliArgs args;
    auto value_of = [&](int &i, std::string_view flag) -> std::string
    {
        if (i + 1 >= argc)
            usage_error(argv[0], fmt::format("{} requires a value", flag));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(kExitOk);
        }
        if (arg == "--version")
        {
            std::cout << "scenefix " << platform::get_version_string() << "\n";
            std::exit(kExitOk);
        }
        if (arg == "--config")
            args.config_path = value_of(i, arg);
        else if (arg == "--log-level")
            args.log_level = value_of(i, arg);
        else if (arg == "--log-file")
            args.log_file = value_of(i, arg);
        else if (arg == "--class")
            args.defect_class = value_of(i, arg);
        else if (!arg.empty() && arg.front() == '-')
            usage_error(argv[0], fmt::format("unknown option '{}'", arg));
        else if (args.command.empty())
            args.command = std::string(arg);
        else if (args.scene_path.empty())
            args.scene_path = std::string(arg);
        else
            usage_error(argv[0], fmt::format("unexpected argument '{}'", arg));
    }

    if (args.command != "detect" && args.command != "repair" && args.command != "backups")
        usage_error(argv[0], args.command.empty() ? "a command is required"
                                                  : fmt::format("unknown command '{}'",
                                                                args.command));
    return args;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int run_detect(utils::Logger &logger, const std::string &path)
{
    repair::DocumentStore store(logger);
    auto loaded = store.load(path);
    if (!loaded.is_ok())
    {
        std::cerr << "Error: " << repair::to_string(loaded.error()) << ": " << loaded.detail()
                  << "\n";
        return kExitFailure;
    }

    const auto &doc = loaded.content();
    const nlohmann::json report = repair::detection_report(doc);
    std::cout << report.dump(2) << "\n";

    const bool defects = report["duplicate_scene_ids"]["scene_count"].get<size_t>() > 0 ||
                         report["empty_scene_attributes"]["scene_count"].get<size_t>() > 0;
    return defects ? kExitDefects : kExitOk;
}

int run_repair(utils::Logger &logger, const repair::RepairServiceConfig &config,
               const std::string &path, repair::DefectClass cls)
{
    repair::DocumentStore store(logger);
    repair::BackupManager backups(logger);
    repair::RepairPipelineOptions options;
    options.lock_timeout = config.lock_timeout();
    options.verify_content = config.verify_content;
    repair::RepairPipeline pipeline(logger, store, backups, repair::Repairer{}, nullptr, options);

    const repair::RepairOutcome outcome = pipeline.repair(path, cls, &g_cancel);

    std::cout << "state: " << repair::to_string(outcome.state) << "\n";
    std::cout << "repaired: " << outcome.findings_repaired << "\n";
    if (outcome.backup)
        std::cout << "backup: " << outcome.backup->backup_path.string() << "\n";
    if (outcome.cancellation_deferred)
        std::cout << "note: cancellation was requested after writing began\n";
    if (outcome.error)
        std::cerr << "Error: " << outcome.error->describe() << "\n";

    return outcome.succeeded() ? kExitOk : kExitFailure;
}

int run_backups(utils::Logger &logger, const std::string &path)
{
    repair::BackupManager backups(logger);
    for (const auto &p : backups.list_backups(path))
    {
        std::cout << p.string() << "\n";
    }
    return kExitOk;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CliArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    repair::RepairServiceConfig config;
    try
    {
        if (!args.config_path.empty())
            config = repair::RepairServiceConfig::from_json_file(args.config_path);
        if (args.log_level)
            config.log_level = *args.log_level;
        if (args.log_file)
            config.log_file = *args.log_file;
        (void)config.level(); // validates an overridden level
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return kExitFailure;
    }

    const std::string path = args.scene_path.empty() ? config.scene_path : args.scene_path;
    if (path.empty())
        usage_error(argv[0], "no scene file given and no scene_path configured");

    std::optional<repair::DefectClass> cls;
    if (args.command == "repair")
    {
        cls = repair::defect_class_from_string(args.defect_class);
        if (!cls)
            usage_error(argv[0], args.defect_class.empty()
                                     ? "repair requires --class"
                                     : fmt::format("unknown defect class '{}'",
                                                   args.defect_class));
    }

    // ── Logger ────────────────────────────────────────────────────────────────
    utils::Logger logger;
    logger.set_level(config.level());
    if (!config.log_file.empty() && !logger.set_logfile(config.log_file))
    {
        std::cerr << "Error: cannot open log file '" << config.log_file << "'\n";
        return kExitFailure;
    }

    SFX_LOG_DEBUG(logger, "scenefix {} ({}) on '{}'", platform::get_version_string(), args.command,
                  path);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = kExitFailure;
    if (args.command == "detect")
        rc = run_detect(logger, path);
    else if (args.command == "repair")
        rc = run_repair(logger, config, path, *cls);
    else
        rc = run_backups(logger, path);

    logger.flush();
    return rc;
}
