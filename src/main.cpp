// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "conf/config.hpp"
#include "core/document.hpp"
#include "core/executor.hpp"
#include "core/list_block.hpp"
#include "core/marker_insert.hpp"
#include "core/pattern_filter.hpp"
#include "core/plan.hpp"
#include "core/tree_merge.hpp"
#include "core/validator.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace scaffix;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path root;
    bool verbose = false;
    bool dry_run = false;
    bool append = false;
    std::string indent;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: scaffix [OPTIONS] <command> [args...]\n\n";
    std::cout << "Plan Commands:\n";
    std::cout << "  apply <plan>                   Apply a migration plan\n";
    std::cout << "  check <plan>                   Validate the plan's [expect] section\n\n";

    std::cout << "Single Operations:\n";
    std::cout << "  filter <file> <pattern>...     Remove lines containing any pattern\n";
    std::cout << "  insert <file> <marker> <text>  Insert text after the first marker line\n";
    std::cout << "  ensure <file> <opener> <entry>...  Add list entries exactly once\n";
    std::cout << "  merge <source> <destination>   Move a directory tree into another\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -r, --root DIR          Project root (default: current directory)\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -n, --dry-run           Report changes without writing\n";
    std::cout << "  -i, --indent STR        Indentation for new list entries\n";
    std::cout << "  -a, --append            insert: skip the already-present check\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -V, --version           Show version\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nPaths given to single operations are relative to the root.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  scaffix -r MyApp apply plans/clean.plan\n";
    std::cout << "  scaffix check plans/redoc.plan\n";
    std::cout << "  scaffix filter Sources/App/routes.swift TodoController\n";
    std::cout << "  scaffix ensure Package.swift 'resources: [' '.process(\"Resources\"),'\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"root", required_argument, 0, 'r'},
                                           {"config", required_argument, 0, 'c'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"dry-run", no_argument, 0, 'n'},
                                           {"indent", required_argument, 0, 'i'},
                                           {"append", no_argument, 0, 'a'},
                                           {"output", required_argument, 0, 'o'},
                                           {"version", no_argument, 0, 'V'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "r:c:vni:ao:Vh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'r':
            opts.root = optarg;
            break;
        case 'c':
            opts.config_file = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'n':
            opts.dry_run = true;
            break;
        case 'i':
            opts.indent = optarg;
            break;
        case 'a':
            opts.append = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'V':
            std::cout << "scaffix " << VERSION << "\n";
            exit(EXIT_OK);
        case 'h':
            print_help();
            exit(EXIT_OK);
        default:
            print_help();
            exit(EXIT_USAGE);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    fs::path root = opts.root.empty() ? fs::path(".") : opts.root;
    Config config;
    if (!opts.config_file.empty()) {
        config = Config::from_file(opts.config_file);
    } else {
        config = Config::load_default(root);
    }
    config.merge_with_cli(root, opts.verbose, opts.dry_run, opts.indent);
    return config;
}

static bool require_args(const CliOptions& cli, size_t count, const char* usage) {
    if (cli.args.size() < count) {
        std::cerr << "Usage: scaffix " << cli.command << " " << usage << "\n";
        return false;
    }
    return true;
}

// Loads, transforms and writes back one file; shared by the single-operation
// commands.
template <typename Transform>
static int edit_file(const Config& config, const std::string& rel, Transform transform) {
    fs::path target = config.root / rel;
    auto loaded = TextDocument::load(target);
    if (!loaded) {
        LOG_ERROR(loaded.error().describe());
        return EXIT_FAILED;
    }

    auto edited = transform(loaded.value());
    if (!edited) {
        LOG_ERROR(edited.error().describe() + " in " + target.string());
        return EXIT_FAILED;
    }

    if (edited.value() == loaded.value()) {
        LOG_INFO("No change to " + target.string());
        return EXIT_OK;
    }
    if (config.dry_run) {
        LOG_INFO("[dry-run] Would update " + target.string());
        return EXIT_OK;
    }

    auto saved = edited.value().save(target, config.atomic_write);
    if (!saved) {
        LOG_ERROR(saved.error().describe());
        return EXIT_FAILED;
    }
    LOG_INFO("Updated " + target.string());
    return EXIT_OK;
}

static void print_report(const ExecutionResult& result) {
    for (const auto& merge : result.merges) {
        std::cout << "merge " << merge.source.string() << " -> " << merge.destination.string()
                  << ": " << merge_status_name(merge.status) << " (" << merge.moved.size()
                  << " moved)\n";
        for (const auto& conflict : merge.conflicts) {
            std::cout << "  conflict: " << conflict.path.string() << "\n";
        }
        for (const auto& failure : merge.failures) {
            std::cout << "  failed: " << failure.describe() << "\n";
        }
    }
    for (const auto& p : result.created_paths) {
        std::cout << "created: " << p.string() << "\n";
    }
    for (const auto& p : result.changed_files) {
        std::cout << "changed: " << p.string() << "\n";
    }
    for (const auto& p : result.removed_paths) {
        std::cout << "removed: " << p.string() << "\n";
    }
    for (const auto& w : result.warnings) {
        std::cout << "warning: " << w.describe() << "\n";
    }
    for (const auto& f : result.failures) {
        std::cout << "failed: " << f.describe() << "\n";
    }
}

static int print_discrepancies(const std::vector<Discrepancy>& found) {
    if (found.empty()) {
        std::cout << "Validation Passed: all expected artifacts are present.\n";
        return EXIT_OK;
    }
    std::cout << "Validation Failed:\n";
    for (const auto& d : found) {
        std::cout << "- " << d.describe() << "\n";
    }
    return EXIT_FAILED;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command.empty()) {
            print_help();
            return EXIT_OK;
        }

        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_file);

        enum class Command { APPLY, CHECK, FILTER, INSERT, ENSURE, MERGE, CONFIG, UNKNOWN };

        auto parse_command = [](const std::string& cmd) -> Command {
            if (cmd == "apply")
                return Command::APPLY;
            if (cmd == "check")
                return Command::CHECK;
            if (cmd == "filter")
                return Command::FILTER;
            if (cmd == "insert")
                return Command::INSERT;
            if (cmd == "ensure")
                return Command::ENSURE;
            if (cmd == "merge")
                return Command::MERGE;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (parse_command(cli.command)) {
        case Command::APPLY: {
            if (!require_args(cli, 1, "<plan>"))
                return EXIT_USAGE;
            MigrationPlan plan = MigrationPlan::from_file(cli.args[0]);
            ExecutionResult result = execute_plan(plan, config);
            print_report(result);
            return result.ok() ? EXIT_OK : EXIT_FAILED;
        }
        case Command::CHECK: {
            if (!require_args(cli, 1, "<plan>"))
                return EXIT_USAGE;
            MigrationPlan plan = MigrationPlan::from_file(cli.args[0]);
            return print_discrepancies(validate_plan(plan, config));
        }
        case Command::FILTER: {
            if (!require_args(cli, 2, "<file> <pattern>..."))
                return EXIT_USAGE;
            std::vector<std::string> patterns(cli.args.begin() + 1, cli.args.end());
            return edit_file(config, cli.args[0], [&](const TextDocument& doc) {
                return Result<TextDocument>(filter_lines(doc, patterns));
            });
        }
        case Command::INSERT: {
            if (!require_args(cli, 3, "<file> <marker> <text>"))
                return EXIT_USAGE;
            const std::string& marker = cli.args[1];
            const std::string& text = cli.args[2];
            bool append = cli.append;
            return edit_file(config, cli.args[0], [&](const TextDocument& doc) {
                return Result<TextDocument>(append ? insert_after_marker(doc, marker, text)
                                                   : insert_once(doc, marker, text));
            });
        }
        case Command::ENSURE: {
            if (!require_args(cli, 3, "<file> <opener> <entry>..."))
                return EXIT_USAGE;
            const std::string& opener = cli.args[1];
            std::vector<std::string> entries(cli.args.begin() + 2, cli.args.end());
            ListEditOptions options;
            options.default_indent = config.default_indent;
            return edit_file(config, cli.args[0], [&](const TextDocument& doc) {
                auto edit = ensure_entries(doc, opener, entries, options);
                if (!edit)
                    return Result<TextDocument>(edit.error());
                return Result<TextDocument>(std::move(edit).value().document);
            });
        }
        case Command::MERGE: {
            if (!require_args(cli, 2, "<source> <destination>"))
                return EXIT_USAGE;
            MergeOptions options;
            options.dry_run = config.dry_run;
            auto report = merge_tree(config.root / cli.args[0], config.root / cli.args[1], options);
            if (!report) {
                LOG_ERROR(report.error().describe());
                return EXIT_FAILED;
            }
            ExecutionResult result;
            result.merges.push_back(report.value());
            print_report(result);
            return result.ok() ? EXIT_OK : EXIT_FAILED;
        }
        case Command::CONFIG: {
            std::string subcmd = cli.args.empty() ? "show" : cli.args[0];
            if (subcmd == "gen") {
                fs::path out = cli.output.empty() ? config.root / CONFIG_FILENAME
                                                  : fs::path(cli.output);
                if (!config.save_to_file(out)) {
                    LOG_ERROR("Failed to write " + out.string());
                    return EXIT_FAILED;
                }
                std::cout << "Wrote " << out.string() << "\n";
                return EXIT_OK;
            } else if (subcmd == "show") {
                std::cout << "root = " << config.root.string() << "\n";
                std::cout << "verbose = " << (config.verbose ? "true" : "false") << "\n";
                std::cout << "dry_run = " << (config.dry_run ? "true" : "false") << "\n";
                std::cout << "atomic_write = " << (config.atomic_write ? "true" : "false")
                          << "\n";
                std::cout << "default_indent = \"" << config.default_indent << "\"\n";
                std::cout << "log_file = " << config.log_file.string() << "\n";
                return EXIT_OK;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        case Command::UNKNOWN:
            std::cerr << "Unknown command: " << cli.command << "\n\n";
            print_help();
            return EXIT_USAGE;
        }
    } catch (const PlanError& e) {
        std::cerr << "Plan error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
    return EXIT_OK;
}
