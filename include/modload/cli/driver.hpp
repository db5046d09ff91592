//! # CLI Driver Interface
//!
//! `modload_main()` opens the modules named on the command line and prints
//! their symbol directories.

#pragma once

// Main CLI entry point
int modload_main(int argc, char* argv[]);
