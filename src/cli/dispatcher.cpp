//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to the command handlers.
//!
//! ```text
//! docforge_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ generate       → run_generate()
//!   ├─ batch          → run_batch()
//!   └─ analyze        → run_analyze()
//! ```
//!
//! Logging flags are consumed by `log::parse_log_options` before the
//! remaining arguments are parsed here.

#include "analysis/element_json.hpp"
#include "analysis/extractor.hpp"
#include "backend/command_backend.hpp"
#include "cli/driver.hpp"
#include "cli/report.hpp"
#include "doc/docstring.hpp"
#include "log/log.hpp"
#include "pipeline/batch.hpp"
#include "pipeline/file_pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace docforge::cli {

namespace {

struct FlagBinding {
    std::string_view flag; ///< Including the trailing '='.
    const char* key;
};

constexpr FlagBinding VALUE_FLAGS[] = {
    {"--style=", "style"},
    {"--max-iterations=", "max_iterations"},
    {"--threshold=", "threshold"},
    {"--jobs=", "batch.jobs"},
    {"--element-jobs=", "batch.element_jobs"},
    {"--backend=", "backend.command"},
    {"--backend-timeout=", "backend.timeout_seconds"},
    {"--report=", "report.json_path"},
};

struct SwitchBinding {
    std::string_view flag;
    const char* key;
    const char* value;
};

constexpr SwitchBinding SWITCH_FLAGS[] = {
    {"--overwrite", "overwrite", "true"},
    {"--no-skip-existing", "skip_existing", "false"},
    {"--dry-run", "batch.dry_run", "true"},
    {"--no-recursive", "batch.recursive", "false"},
    {"--no-evaluate", "backend.evaluate", "false"},
};

auto capabilities_for(const config::Config& config) -> backend::Capabilities {
    return backend::make_capabilities(
        backend::CommandConfig{
            .command = config.backend.command,
            .args = config.backend.args,
            .timeout_seconds = config.backend.timeout_seconds,
        },
        config.backend.evaluate);
}

auto emit_report(const config::Config& config, const std::vector<pipeline::FileReport>& reports)
    -> bool {
    if (config.report.json_path.empty()) {
        return true;
    }
    auto written = write_report(config.report.json_path, reports, config);
    if (is_err(written)) {
        std::cerr << "error: cannot write report: " << unwrap_err(written) << "\n";
        return false;
    }
    DOCFORGE_LOG_INFO("cli", "Report written to " << config.report.json_path);
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int run_generate(const CliArgs& args, const config::Config& config) {
    if (args.positional.size() != 1) {
        std::cerr << "Usage: docforge generate <file> [--output=<path> | --in-place] [--diff]\n";
        return EXIT_USAGE;
    }
    const auto& path = args.positional.front();

    pipeline::FilePipeline file_pipeline(config, capabilities_for(config));
    auto processed = file_pipeline.process_file(path);
    std::vector<pipeline::FileReport> reports{make_report(path, processed)};

    if (is_err(processed)) {
        std::cerr << "error: " << path << ": " << unwrap_err(processed).to_string() << "\n";
        emit_report(config, reports);
        return EXIT_FAILURES;
    }

    const auto& outcome = unwrap(processed);
    std::optional<std::string> target = args.output;
    if (!target && args.in_place) {
        target = path;
    }

    if (args.diff) {
        auto source = lexer::Source::from_file(path);
        if (is_err(source)) {
            std::cerr << "error: " << unwrap_err(source) << "\n";
            return EXIT_FAILURES;
        }
        std::cout << unified_diff(unwrap(source).content(), outcome.rewritten, path);
    } else if (!target) {
        std::cout << outcome.rewritten;
    }

    if (target && (outcome.changed || *target != path)) {
        auto written = pipeline::write_atomic(*target, outcome.rewritten);
        if (is_err(written)) {
            std::cerr << "error: " << unwrap_err(written) << "\n";
            reports.front().error =
                pipeline::FileError{.kind = pipeline::FileErrorKind::Io,
                                    .message = unwrap_err(written)};
            emit_report(config, reports);
            return EXIT_FAILURES;
        }
        reports.front().written = true;
        DOCFORGE_LOG_INFO("cli", "Wrote " << *target);
    }

    std::cerr << render_summary(reports);
    return emit_report(config, reports) ? EXIT_OK : EXIT_FAILURES;
}

int run_batch(const CliArgs& args, const config::Config& config) {
    if (args.positional.size() != 1) {
        std::cerr << "Usage: docforge batch <dir> [--jobs=N] [--dry-run] [--report=<path>]\n";
        return EXIT_USAGE;
    }
    const auto& root = args.positional.front();

    auto files = pipeline::discover_files(root, config.batch.recursive, config.batch.extensions);
    if (files.empty()) {
        std::cout << "No source files found under " << root << "\n";
        return emit_report(config, {}) ? EXIT_OK : EXIT_FAILURES;
    }

    pipeline::FilePipeline file_pipeline(config, capabilities_for(config));
    pipeline::BatchRunner runner(file_pipeline, pipeline::BatchOptions{
                                                    .jobs = config.batch.jobs,
                                                    .dry_run = config.batch.dry_run,
                                                });
    auto reports = runner.run(std::move(files));

    std::cout << render_summary(reports);
    bool report_ok = emit_report(config, reports);
    return pipeline::any_failed(reports) || !report_ok ? EXIT_FAILURES : EXIT_OK;
}

int run_analyze(const CliArgs& args) {
    if (args.positional.size() != 1) {
        std::cerr << "Usage: docforge analyze <file>\n";
        return EXIT_USAGE;
    }
    const auto& path = args.positional.front();

    auto source = lexer::Source::from_file(path);
    if (is_err(source)) {
        std::cerr << "error: " << unwrap_err(source) << "\n";
        return EXIT_FAILURES;
    }
    auto elements = analysis::analyze(unwrap(source));
    if (is_err(elements)) {
        const auto& error = unwrap_err(elements);
        std::cerr << path << ":" << error.span.start.line << ":" << error.span.start.column
                  << ": error: " << error.message << "\n";
        return EXIT_FAILURES;
    }

    auto array = json::json_array();
    for (const auto& element : unwrap(elements)) {
        array.push(analysis::to_json(element));
    }
    std::cout << array.to_string_pretty() << "\n";
    return EXIT_OK;
}

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

auto parse_args(const std::vector<std::string>& args) -> Result<CliArgs, std::string> {
    CliArgs parsed;
    for (const auto& arg : args) {
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            parsed.help = true;
            continue;
        }
        if (arg == "--version" || arg == "-V") {
            parsed.version = true;
            continue;
        }
        if (arg == "--in-place" || arg == "-i") {
            parsed.in_place = true;
            continue;
        }
        if (arg == "--diff") {
            parsed.diff = true;
            continue;
        }
        if (arg.starts_with("--config=")) {
            parsed.config_path = arg.substr(9);
            continue;
        }
        if (arg.starts_with("--output=")) {
            parsed.output = arg.substr(9);
            continue;
        }

        bool matched = false;
        for (const auto& binding : VALUE_FLAGS) {
            if (arg.starts_with(binding.flag)) {
                parsed.overrides.emplace_back(binding.key, arg.substr(binding.flag.size()));
                matched = true;
                break;
            }
        }
        for (const auto& binding : SWITCH_FLAGS) {
            if (!matched && arg == binding.flag) {
                parsed.overrides.emplace_back(binding.key, binding.value);
                matched = true;
            }
        }
        if (matched) {
            continue;
        }

        if (arg.starts_with("-")) {
            return "unknown option '" + arg + "'";
        }
        if (parsed.command.empty()) {
            parsed.command = arg;
        } else {
            parsed.positional.push_back(arg);
        }
    }

    if (parsed.output && parsed.in_place) {
        return std::string("--output and --in-place cannot be combined");
    }
    return parsed;
}

auto build_config(const CliArgs& args, const config::EnvLookup& env)
    -> Result<config::Config, config::ConfigError> {
    return config::load_config(config::LoadOptions{
        .config_path = args.config_path,
        .working_dir = ".",
        .env = env,
        .overrides = args.overrides,
    });
}

// ============================================================================
// Diff
// ============================================================================

auto unified_diff(std::string_view before, std::string_view after, const std::string& path)
    -> std::string {
    auto old_lines = doc::split_lines(before);
    auto new_lines = doc::split_lines(after);

    size_t prefix = 0;
    while (prefix < old_lines.size() && prefix < new_lines.size() &&
           old_lines[prefix] == new_lines[prefix]) {
        ++prefix;
    }
    if (prefix == old_lines.size() && prefix == new_lines.size()) {
        return {};
    }
    size_t suffix = 0;
    while (suffix < old_lines.size() - prefix && suffix < new_lines.size() - prefix &&
           old_lines[old_lines.size() - 1 - suffix] == new_lines[new_lines.size() - 1 - suffix]) {
        ++suffix;
    }

    constexpr size_t CONTEXT = 3;
    size_t start = prefix > CONTEXT ? prefix - CONTEXT : 0;
    size_t old_end = std::min(old_lines.size(), old_lines.size() - suffix + CONTEXT);
    size_t new_end = std::min(new_lines.size(), new_lines.size() - suffix + CONTEXT);

    std::ostringstream out;
    out << "--- a/" << path << "\n+++ b/" << path << "\n";
    out << "@@ -" << (start + 1) << "," << (old_end - start) << " +" << (start + 1) << ","
        << (new_end - start) << " @@\n";
    for (size_t i = start; i < prefix; ++i) {
        out << " " << old_lines[i] << "\n";
    }
    for (size_t i = prefix; i < old_lines.size() - suffix; ++i) {
        out << "-" << old_lines[i] << "\n";
    }
    for (size_t i = prefix; i < new_lines.size() - suffix; ++i) {
        out << "+" << new_lines[i] << "\n";
    }
    for (size_t i = old_lines.size() - suffix; i < old_end; ++i) {
        out << " " << old_lines[i] << "\n";
    }
    return out.str();
}

// ============================================================================
// Entry Point
// ============================================================================

void print_usage() {
    std::cout << "docforge " << VERSION << " - docstring generator for Python sources\n\n"
              << "Usage: docforge <command> [options]\n\n"
              << "Commands:\n"
              << "  generate <file>     Document one file (stdout, --output or --in-place)\n"
              << "  batch <dir>         Document every matching file under a directory\n"
              << "  analyze <file>      Print extracted elements as JSON\n\n"
              << "Options:\n"
              << "  --style=<name>          google, numpy or rst (default google)\n"
              << "  --max-iterations=<n>    Refinement iterations per element (default 3)\n"
              << "  --threshold=<x>         Confidence needed to accept (default 0.8)\n"
              << "  --overwrite             Replace existing docstrings\n"
              << "  --no-skip-existing      Refine documented elements without rewriting them\n"
              << "  --jobs=<n>              File workers, 0 = auto (default 0)\n"
              << "  --element-jobs=<n>      Element workers per file (default 1)\n"
              << "  --backend=<command>     External completion/evaluation command\n"
              << "  --backend-timeout=<s>   Backend timeout in seconds (default 30)\n"
              << "  --no-evaluate           Use the backend for completion only\n"
              << "  --config=<path>         Configuration file (default ./.docgenrc)\n"
              << "  --report=<path>         Write a JSON report\n"
              << "  --output=<path>         generate: write the result to <path>\n"
              << "  --in-place, -i          generate: rewrite the input file\n"
              << "  --diff                  generate: print a unified diff\n"
              << "  --dry-run               batch: never write files\n"
              << "  --no-recursive          batch: do not descend into subdirectories\n"
              << "  --help, -h              Show this help\n"
              << "  --version, -V           Show the version\n\n"
              << "Logging:\n"
              << "  -v, -vv, -vvv           Info, debug or trace output\n"
              << "  -q, --quiet             Errors only\n"
              << "  --log-level=<level>     trace, debug, info, warn, error, off\n"
              << "  --log-filter=<spec>     Per-module levels, e.g. refine=debug,*=warn\n"
              << "  --log-file=<path>       Also write logs to a file\n"
              << "  --log-format=<fmt>      text or json\n";
}

void print_version() {
    std::cout << "docforge " << VERSION << "\n";
}

int docforge_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> raw(argv + 1, argv + argc);
    auto parsed = parse_args(raw);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'docforge --help' for usage information.\n";
        return EXIT_USAGE;
    }
    const auto& args = unwrap(parsed);

    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (args.help || args.command.empty()) {
        print_usage();
        return args.help ? EXIT_OK : EXIT_USAGE;
    }

    if (args.command != "generate" && args.command != "batch" && args.command != "analyze") {
        std::cerr << "error: unknown command '" << args.command << "'\n";
        std::cerr << "Run 'docforge --help' for usage information.\n";
        return EXIT_USAGE;
    }

    if (args.command == "analyze") {
        return run_analyze(args);
    }

    auto loaded = build_config(args, config::process_env());
    if (is_err(loaded)) {
        std::cerr << "error: invalid configuration: " << unwrap_err(loaded).to_string() << "\n";
        return EXIT_USAGE;
    }
    const auto& config = unwrap(loaded);
    DOCFORGE_LOG_DEBUG("cli", "configuration " << config.to_json().to_string());

    if (args.command == "generate") {
        return run_generate(args, config);
    }
    return run_batch(args, config);
}

} // namespace docforge::cli
