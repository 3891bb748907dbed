//! # Documentation Command Implementation
//!
//! This file implements the `vydoc` command for generating documentation.

#include "cli/cmd_doc.hpp"

#include "extract/driver.hpp"
#include "log/log.hpp"
#include "render/generators.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

namespace vydoc::cli {

namespace {

auto parse_jobs(std::string_view text) -> std::optional<unsigned> {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto quoted(const fs::path& path) -> std::string {
    return "\"" + path.string() + "\"";
}

} // namespace

auto parse_doc_args(int argc, const char* const argv[]) -> Result<DocOptions, std::string> {
    DocOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--no-build") {
            options.build = false;
        } else if (arg.starts_with("--format=")) {
            std::string format = arg.substr(9);
            if (format == "rst") {
                options.format = DocFormat::Rst;
            } else if (format == "json") {
                options.format = DocFormat::Json;
            } else {
                return "unknown format '" + format + "' (expected rst or json)";
            }
        } else if (arg.starts_with("--output=") || arg.starts_with("-o=")) {
            options.output_dir = arg.substr(arg.find('=') + 1);
        } else if (arg == "--output" || arg == "-o") {
            if (i + 1 >= argc) {
                return "option '" + arg + "' needs a directory";
            }
            options.output_dir = argv[++i];
        } else if (arg.starts_with("--jobs=") || arg == "-j") {
            std::string value;
            if (arg == "-j") {
                if (i + 1 >= argc) {
                    return std::string("option '-j' needs a number");
                }
                value = argv[++i];
            } else {
                value = arg.substr(7);
            }
            auto jobs = parse_jobs(value);
            if (!jobs) {
                return "invalid job count '" + value + "'";
            }
            options.jobs = *jobs;
        } else if (arg[0] != '-' && options.contracts_dir.empty()) {
            options.contracts_dir = arg;
        } else if (arg[0] != '-') {
            return "unexpected argument '" + arg + "'";
        } else {
            return "unknown option '" + arg + "'";
        }
    }

    if (options.contracts_dir.empty() && !options.show_help) {
        return std::string("missing contracts directory");
    }
    return options;
}

int run_doc(const DocOptions& options) {
    extract::DriverConfig driver_config;
    driver_config.jobs = options.jobs;

    auto collected = extract::collect_contracts(options.contracts_dir, driver_config);
    if (is_err(collected)) {
        std::cerr << "error: " << unwrap_err(collected) << "\n";
        return exit_codes::FAILURE;
    }
    const auto& contracts = unwrap(collected);

    size_t warnings = 0;
    for (const auto& contract : contracts) {
        warnings += contract.all_diagnostics().size();
    }
    VYDOC_LOG_INFO("doc", "Documented " << contracts.size() << " contracts, " << warnings
                                        << " diagnostics");

    fs::path docs_dir = fs::path(options.output_dir) / "docs";
    render::RenderConfig render_config;

    if (options.format == DocFormat::Json) {
        render::JsonGenerator generator(render_config);
        auto written = generator.generate_file(contracts, docs_dir / "contracts.json");
        if (is_err(written)) {
            std::cerr << "error: " << unwrap_err(written) << "\n";
            return exit_codes::FAILURE;
        }
        std::cout << "Documentation written to " << unwrap(written).string() << "\n";
        return exit_codes::SUCCESS;
    }

    render::RstGenerator generator(render_config);
    auto written = generator.generate_directory(contracts, docs_dir);
    if (is_err(written)) {
        std::cerr << "error: " << unwrap_err(written) << "\n";
        return exit_codes::FAILURE;
    }

    if (!options.build) {
        std::cout << "Documentation sources written to " << docs_dir.string() << "\n";
        return exit_codes::SUCCESS;
    }

    fs::path build_dir = docs_dir / "_build" / "html";
    std::string cmd =
        options.sphinx_build + " -b html " + quoted(docs_dir) + " " + quoted(build_dir);
    VYDOC_LOG_DEBUG("doc", "Running: " << cmd);
    int status = std::system(cmd.c_str());
    if (status != 0) {
        std::cerr << "error: sphinx-build failed with status " << status << "\n";
        return exit_codes::FAILURE;
    }

    std::cout << "Documentation built successfully in " << build_dir.string() << "\n";
    return exit_codes::SUCCESS;
}

void print_doc_help() {
    std::cerr << R"(
vydoc - Sphinx documentation for Vyper contracts

Usage: vydoc <contracts_dir> [options]

Options:
  --output=<dir>, -o <dir>  Output root; sources go to <dir>/docs (default: .)
  --format=<fmt>            Output format: rst, json (default: rst)
  --jobs=<n>, -j <n>        Worker threads, 0 for all cores (default: 1)
  --no-build                Write sources only, skip sphinx-build
  --help, -h                Show this help

Logging:
  --log-level=<level>       trace, debug, info, warn, error, fatal, off
  --log-filter=<spec>       Per-module levels, e.g. extract=debug,*=warn
  --log-file=<path>         Also write log records to a file
  --log-format=<fmt>        text or json
  -v, -vv, -vvv             Info, debug, trace
  -q, --quiet               Errors only
  VYDOC_LOG=<level|spec>    Environment fallback

Examples:
  vydoc contracts                       # Build HTML into ./docs/_build/html
  vydoc contracts -o site --no-build    # Write site/docs/*.rst only
  vydoc contracts --format=json -j 0    # JSON for tooling, all cores

)";
}

int vydoc_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_doc_args(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        print_doc_help();
        return exit_codes::USAGE;
    }

    const auto& options = unwrap(parsed);
    if (options.show_help) {
        print_doc_help();
        return exit_codes::SUCCESS;
    }

    int code = run_doc(options);
    log::Logger::instance().flush();
    return code;
}

} // namespace vydoc::cli
