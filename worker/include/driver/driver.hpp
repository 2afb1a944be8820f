//! # Worker Driver Interface
//!
//! `kiln_main()` decides between the two modes:
//!
//! - **Persistent**: `--persistent_worker` as the only argument serves work
//!   requests on stdin/stdout until end of input.
//! - **One-shot**: any other argument list is a single request; its
//!   diagnostics go to stderr and its exit code becomes the process exit code.

#pragma once

// Main worker entry point
int kiln_main(int argc, char* argv[]);
