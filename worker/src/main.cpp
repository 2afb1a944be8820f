//! # kiln Entry Point
//!
//! Delegates to `kiln_main()` in the driver.
//!
//! ## Usage
//!
//! ```bash
//! kiln --persistent_worker                 # Serve work requests on stdin
//! kiln --platform-summary=p.sum --output=a.sum --source=multi-root:///a.kl
//! kiln @request.args                       # Read arguments from a file
//! ```

#include "driver/driver.hpp"

int main(int argc, char* argv[]) {
    return kiln_main(argc, argv);
}
