/**
 * @file simpaths_main.cpp
 * @brief simpaths: admin shell over the per-user path registry.
 *
 * ## Usage
 *
 *     simpaths [--config FILE] list   <user> [--pattern GLOB]
 *     simpaths [--config FILE] info   <user> [--path P]... [--pattern GLOB]
 *     simpaths [--config FILE] fetch  <user> <path> [--url] [--out FILE]
 *     simpaths [--config FILE] delete <user> <path>
 *     simpaths [--config FILE] submit <user> <path> <file> [--holding H] [--jobid J]
 *     simpaths [--config FILE] table  <user> <path> <table> [--where COND]...
 *                                     [--format json|json:dict] [--orient O]
 *     simpaths [--config FILE] stream <locator>
 *     simpaths [--config FILE] gc
 *
 * Results are printed as a JSON envelope `{"<key>": ..., "status": bool,
 * "message": str}`. Exit code 0 when status is true, 1 when false, 2 on
 * usage errors.
 */
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "simpaths/registry/config.hpp"
#include "simpaths/registry/path_registry.hpp"
#include "simpaths/registry/sweeper.hpp"
#include "simpaths/utils/Logger.hpp"

using simpaths::registry::PathRegistry;
using simpaths::registry::RegistryConfig;
using simpaths::registry::Status;
using simpaths::utils::Logger;
using json = nlohmann::json;

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void print_usage(const char *prog)
{
    std::cerr << "Usage:\n"
              << "  " << prog << " [--config FILE] list   <user> [--pattern GLOB]\n"
              << "  " << prog << " [--config FILE] info   <user> [--path P]... [--pattern GLOB]\n"
              << "  " << prog << " [--config FILE] fetch  <user> <path> [--url] [--out FILE]\n"
              << "  " << prog << " [--config FILE] delete <user> <path>\n"
              << "  " << prog << " [--config FILE] submit <user> <path> <file> [--holding H] [--jobid J]\n"
              << "  " << prog << " [--config FILE] table  <user> <path> <table> [--where COND]...\n"
              << "  " << std::string(std::string_view(prog).size(), ' ')
              << "                        [--format json|json:dict] [--orient split|records|index|columns|values]\n"
              << "  " << prog << " [--config FILE] stream <locator>\n"
              << "  " << prog << " [--config FILE] gc\n\n"
              << "Environment:\n"
              << "  SIMPATHS_CONFIG_FILE, SIMPATHS_PATHS_DIR, SIMPATHS_SIMS_DIR,\n"
              << "  SIMPATHS_LOCK_TIMEOUT_MS, SIMPATHS_LOG_LEVEL\n";
}

struct CliArgs
{
    std::string config_path;
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::string> paths;
    std::vector<std::string> where;
    std::optional<std::string> pattern;
    std::optional<std::string> holding;
    std::optional<std::string> jobid;
    std::optional<std::string> out;
    std::string format{"json"};
    std::string orient{"split"};
    bool url{false};
};

/// @return nullopt on a usage error (already reported).
std::optional<CliArgs> parse_args(int argc, char *argv[])
{
    CliArgs args;
    auto take_value = [&](int &i, std::string_view flag) -> std::optional<std::string>
    {
        if (i + 1 >= argc)
        {
            std::cerr << "Error: " << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        std::optional<std::string> v;
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(kExitOk);
        }
        else if (arg == "--config")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.config_path = *v;
        }
        else if (arg == "--pattern")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.pattern = *v;
        }
        else if (arg == "--path")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.paths.push_back(*v);
        }
        else if (arg == "--where")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.where.push_back(*v);
        }
        else if (arg == "--holding")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.holding = *v;
        }
        else if (arg == "--jobid")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.jobid = *v;
        }
        else if (arg == "--out")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.out = *v;
        }
        else if (arg == "--format")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.format = *v;
        }
        else if (arg == "--orient")
        {
            if (!(v = take_value(i, arg)))
                return std::nullopt;
            args.orient = *v;
        }
        else if (arg == "--url")
        {
            args.url = true;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
        else if (args.command.empty())
        {
            args.command = std::string(arg);
        }
        else
        {
            args.positional.emplace_back(arg);
        }
    }
    if (args.command.empty())
    {
        std::cerr << "Error: no command given\n";
        return std::nullopt;
    }
    return args;
}

bool expect_positional(const CliArgs &args, std::size_t n)
{
    if (args.positional.size() == n)
        return true;
    std::cerr << "Error: '" << args.command << "' expects " << n << " argument(s), got " << args.positional.size()
              << "\n";
    return false;
}

int emit(const std::optional<std::string> &key, json payload, bool ok, const std::string &message)
{
    json envelope = json::object();
    if (key)
        envelope[*key] = std::move(payload);
    envelope["status"] = ok;
    envelope["message"] = message;
    std::cout << envelope.dump(1, ' ', false, json::error_handler_t::replace) << std::endl;
    return ok ? kExitOk : kExitFailed;
}

int emit_status(const Status &st)
{
    return emit(std::nullopt, nullptr, st.ok, st.message);
}

/// Holding as given on the command line: "inf" stays symbolic, numbers become numbers.
json holding_arg(const std::string &text)
{
    json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && parsed.is_number())
        return parsed;
    return text;
}

json jobid_arg(const std::string &text)
{
    json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && parsed.is_number_integer())
        return parsed;
    return text;
}

void configure_logging(const RegistryConfig &cfg)
{
    Logger &logger = Logger::instance();
    logger.set_write_error_callback([](const std::string &msg) { std::cerr << "Warning: " << msg << "\n"; });
    if (auto lvl = Logger::parse_level(cfg.log_level))
        logger.set_level(*lvl);
    if (!cfg.log_file.empty() && !logger.set_logfile(cfg.log_file.string(), /*use_flock=*/true))
        std::cerr << "Warning: cannot open log file " << cfg.log_file << ", logging to stderr\n";
}

int run_command(const CliArgs &args, const RegistryConfig &cfg)
{
    const std::string &cmd = args.command;

    if (cmd == "gc")
    {
        if (!expect_positional(args, 0))
            return kExitUsage;
        PathRegistry registry(cfg);
        simpaths::registry::Sweeper sweeper(registry.store());
        return emit_status(sweeper.gc());
    }

    if (cmd == "stream")
    {
        if (!expect_positional(args, 1))
            return kExitUsage;
        simpaths::registry::ArtifactLocator locator(cfg);
        auto st = locator.stream(args.positional[0],
                                 [](const char *data, std::size_t size)
                                 { return std::fwrite(data, 1, size, stdout) == size; });
        std::fflush(stdout);
        if (!st.ok)
            std::cerr << st.message << "\n";
        return st.ok ? kExitOk : kExitFailed;
    }

    PathRegistry registry(cfg);

    if (cmd == "list")
    {
        if (!expect_positional(args, 1))
            return kExitUsage;
        auto r = registry.list_paths(args.positional[0], args.pattern);
        return emit("paths", r.payload ? json(*r.payload) : json(nullptr), r.ok, r.message);
    }
    if (cmd == "info")
    {
        if (!expect_positional(args, 1))
            return kExitUsage;
        std::optional<std::vector<std::string>> paths;
        if (!args.paths.empty())
            paths = args.paths;
        auto r = registry.get_info(args.positional[0], paths, args.pattern);
        json infos = nullptr;
        if (r.payload)
        {
            infos = json::array();
            for (const auto &e : *r.payload)
                infos.push_back(simpaths::registry::entry_to_json(e));
        }
        return emit("infos", std::move(infos), r.ok, r.message);
    }
    if (cmd == "fetch")
    {
        if (!expect_positional(args, 2))
            return kExitUsage;
        auto r = registry.fetch(args.positional[0], args.positional[1], args.url);
        if (!r.ok || args.url)
            return emit("file", r.payload ? json(*r.payload) : json(nullptr), r.ok, r.message);
        if (args.out)
        {
            std::ofstream os(*args.out, std::ios::binary | std::ios::trunc);
            os.write(r.payload->data(), static_cast<std::streamsize>(r.payload->size()));
            os.close();
            if (!os)
                return emit("file", nullptr, false, "could not write " + *args.out);
            return emit("file", *args.out, true, r.message);
        }
        std::fwrite(r.payload->data(), 1, r.payload->size(), stdout);
        std::fflush(stdout);
        return kExitOk;
    }
    if (cmd == "delete")
    {
        if (!expect_positional(args, 2))
            return kExitUsage;
        return emit_status(registry.remove(args.positional[0], args.positional[1]));
    }
    if (cmd == "submit")
    {
        if (!expect_positional(args, 3))
            return kExitUsage;
        const json holding = holding_arg(args.holding.value_or("inf"));
        const json jobid = args.jobid ? jobid_arg(*args.jobid) : json(nullptr);
        return emit_status(
            registry.pending().submit(args.positional[0], args.positional[1], args.positional[2], holding, jobid));
    }
    if (cmd == "table")
    {
        if (!expect_positional(args, 3))
            return kExitUsage;
        simpaths::registry::TableRequest request;
        request.table = args.positional[2];
        auto format = simpaths::registry::parse_table_format(args.format);
        auto orient = simpaths::registry::parse_orient(args.orient);
        if (!format || !orient)
        {
            std::cerr << "Error: unknown --format or --orient value\n";
            return kExitUsage;
        }
        request.format = *format;
        request.orient = *orient;
        for (const auto &w : args.where)
        {
            auto cond = simpaths::registry::parse_condition(w);
            if (!cond.ok)
                return emit("table", nullptr, false, cond.message);
            request.conds.push_back(std::move(cond).content());
        }
        auto r = registry.table(args.positional[0], args.positional[1], request);
        json payload = nullptr;
        if (r.payload)
        {
            payload = std::visit([](const auto &v) { return json(v); }, *r.payload);
        }
        return emit("table", std::move(payload), r.ok, r.message);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return kExitUsage;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const auto args = parse_args(argc, argv);
    if (!args)
    {
        print_usage(argv[0]);
        return kExitUsage;
    }

    auto cfg = RegistryConfig::load(args->config_path);
    if (!cfg.ok)
    {
        std::cerr << "Config error: " << cfg.message << "\n";
        Logger::instance().shutdown();
        return kExitFailed;
    }
    configure_logging(cfg.content());

    int rc = kExitFailed;
    try
    {
        rc = run_command(*args, cfg.content());
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("simpaths: unexpected error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
    }

    Logger::instance().shutdown();
    return rc;
}
