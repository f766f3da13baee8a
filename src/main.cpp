//! # docforge Entry Point
//!
//! Delegates to the CLI driver, which parses arguments, loads the
//! configuration and dispatches to `generate`, `batch` or `analyze`.
//!
//! ```bash
//! docforge generate shapes.py --style=numpy --in-place
//! docforge batch src/ --jobs=4 --report=docforge.json
//! docforge analyze shapes.py
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return docforge::cli::docforge_main(argc, argv);
}
