//! # forge Entry Point
//!
//! The `main()` function is intentionally minimal. All functionality is
//! implemented in the CLI driver (`cli/driver.hpp`), which parses
//! arguments, dispatches to the subcommands and maps results to exit codes.
//!
//! ## Usage
//!
//! ```bash
//! forge build                 # Regenerate stale modules
//! forge build --target pkg.a  # Only pkg.a and what it depends on
//! forge status --json         # Stale / fresh listing
//! forge cache info            # Response cache statistics
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return forge::cli::forge_main(argc, argv);
}
