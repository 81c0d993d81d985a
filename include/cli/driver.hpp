//! # Inspection Driver
//!
//! `comexe-inspect` builds an application and a loader context the way a
//! packaged program would, then reports where modules resolve and what the
//! virtual file table sees.

#ifndef COMEXE_CLI_DRIVER_HPP
#define COMEXE_CLI_DRIVER_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace comexe::cli {

struct InspectOptions {
    std::optional<std::string> archive;
    std::optional<std::string> root;
    std::optional<std::string> entry;
    std::optional<std::string> script;
    std::optional<std::string> searchers;
    std::vector<std::string> open_paths;
    std::optional<std::string> extract_dir;
    std::vector<std::string> modules;
    bool show_help = false;
    bool show_version = false;
};

/// Parses everything but the logging options.
auto parse_inspect_args(int argc, char* argv[]) -> Result<InspectOptions>;

/// Returns 0 when every module and path resolved, 1 otherwise, 2 on a
/// usage or configuration error.
int inspect_main(int argc, char* argv[]);

} // namespace comexe::cli

#endif // COMEXE_CLI_DRIVER_HPP
