//! # vydoc Entry Point
//!
//! The binary is named `vydoc`. All work is done by `cli::vydoc_main()`,
//! which sets up logging, parses arguments and runs the doc command.
//!
//! ## Usage
//!
//! ```bash
//! vydoc contracts                 # Write docs/ and build HTML with Sphinx
//! vydoc contracts --no-build      # Write reStructuredText sources only
//! vydoc contracts --format=json   # Write docs/contracts.json
//! ```

#include "cli/cmd_doc.hpp"

int main(int argc, char* argv[]) {
    return vydoc::cli::vydoc_main(argc, argv);
}
