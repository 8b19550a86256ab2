//! # CLI Driver Interface
//!
//! Entry point shared by `main()` and the CLI tests.

#ifndef FORGE_CLI_DRIVER_HPP
#define FORGE_CLI_DRIVER_HPP

namespace forge::cli {

/// Parses arguments, initializes logging and runs one command.
/// Returns the process exit code.
int forge_main(int argc, char* argv[]);

} // namespace forge::cli

#endif // FORGE_CLI_DRIVER_HPP
