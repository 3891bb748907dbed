//! # Documentation Command
//!
//! Implements `vydoc`: scan a contracts directory, write documentation
//! sources, and optionally build HTML with Sphinx.
//!
//! ## Usage
//!
//! ```bash
//! vydoc <contracts_dir> [options]
//! ```
//!
//! ## Options
//!
//! - `--output=<dir>`, `-o <dir>`: Output root; sources go to `<dir>/docs`. Default: .
//! - `--format=<fmt>`: `rst` (Sphinx project) or `json`. Default: rst
//! - `--jobs=<n>`, `-j <n>`: Worker threads, 0 for all cores. Default: 1
//! - `--no-build`: Write sources only, do not run `sphinx-build`
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                                   |
//! |------|-----------------------------------------------------------|
//! | 0    | Success                                                   |
//! | 1    | Invalid source directory, write failure, or build failure |
//! | 2    | Usage error                                               |

#ifndef VYDOC_CLI_CMD_DOC_HPP
#define VYDOC_CLI_CMD_DOC_HPP

#include "common.hpp"

#include <string>

namespace vydoc::cli {

/// Documentation output format.
enum class DocFormat {
    Rst,  ///< Sphinx reStructuredText project.
    Json, ///< Single JSON document for tooling.
};

/// Options for the doc command.
struct DocOptions {
    std::string contracts_dir;                ///< Directory scanned for contracts.
    std::string output_dir = ".";             ///< Output root.
    DocFormat format = DocFormat::Rst;        ///< Output format.
    unsigned jobs = 1;                        ///< Worker threads.
    bool build = true;                        ///< Run sphinx-build after writing rst.
    bool show_help = false;                   ///< `-h` was given.
    std::string sphinx_build = "sphinx-build"; ///< Builder executable.
};

/// Exit codes returned by `run_doc` and `vydoc_main`.
namespace exit_codes {
constexpr int SUCCESS = 0;
constexpr int FAILURE = 1;
constexpr int USAGE = 2;
} // namespace exit_codes

/// Parses command-line arguments (`argv[0]` is the program name).
///
/// Log options are skipped here; they are read by `log::parse_log_options`.
/// Returns a usage message on error.
[[nodiscard]] auto parse_doc_args(int argc, const char* const argv[])
    -> Result<DocOptions, std::string>;

/// Runs the doc command with the given options.
///
/// @returns An exit code from `exit_codes`.
int run_doc(const DocOptions& options);

/// Prints help for the doc command.
void print_doc_help();

/// Process entry: log setup, argument parsing, dispatch.
int vydoc_main(int argc, char* argv[]);

} // namespace vydoc::cli

#endif // VYDOC_CLI_CMD_DOC_HPP
