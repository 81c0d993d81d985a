//! # comexe-inspect Entry Point
//!
//! Delegates to the inspection driver in `cli/driver.hpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return comexe::cli::inspect_main(argc, argv);
}
