//! # Inspection Driver
//!
//! ```text
//! comexe-inspect [log options] [--archive=FILE] [--root=DIR] [--entry=NAME]
//!                [--script=FILE] [--searchers=CODES] [--open=PATH]...
//!                [--extract=DIR] [module]...
//! ```
//!
//! | Code | Meaning                                    |
//! |------|--------------------------------------------|
//! | 0    | Every module and path resolved             |
//! | 1    | Something was not found or not readable    |
//! | 2    | Usage or configuration error               |

#include "cli/driver.hpp"

#include "archive/archive_lookup.hpp"
#include "loader/loader_context.hpp"
#include "log/log.hpp"
#include "path/pathname.hpp"

#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <string_view>

namespace comexe::cli {

namespace {

void print_usage() {
    std::cout << "Usage: comexe-inspect [options] [module...]\n"
              << "\n"
              << "Options:\n"
              << "  --archive=FILE     Archive to mount (default: none)\n"
              << "  --root=DIR         Working directory used for the root directory\n"
              << "  --entry=NAME       Application entry point (selects embedded mode)\n"
              << "  --script=FILE      Script path (interpreter mode root)\n"
              << "  --searchers=CODES  Searcher configuration, from \""
              << loader::SEARCHER_CODES << "\"\n"
              << "  --open=PATH        Read PATH through the virtual file table\n"
              << "  --extract=DIR      Write every archive entry under DIR\n"
              << "  --log-level=LEVEL  trace, debug, info, warn, error, off\n"
              << "  --log-filter=SPEC  e.g. vio=trace,*=warn\n"
              << "  -v, -vv, -vvv      Increase verbosity\n"
              << "  -h, --help         Show this help\n"
              << "  -V, --version      Show the version\n";
}

auto option_value(std::string_view arg, std::string_view name) -> std::optional<std::string> {
    if (arg.size() > name.size() && arg.starts_with(name) && arg[name.size()] == '=') {
        return std::string(arg.substr(name.size() + 1));
    }
    return std::nullopt;
}

auto report_module(loader::LoaderContext& context, const std::string& module) -> bool {
    auto loaded = context.require(module);
    if (is_err(loaded)) {
        std::cout << unwrap_err(loaded) << "\n";
        return false;
    }
    const auto& m = unwrap(loaded);
    std::cout << m.name << "\t[" << m.searcher << "] " << m.origin;
    if (m.kind == loader::ModuleKind::NativeLibrary) {
        std::cout << "\t" << m.entry_symbol;
    }
    std::cout << "\n";
    return true;
}

auto report_file(vio::VirtualFileTable& files, const std::string& path) -> bool {
    auto fd = files.open(path, O_RDONLY, 0);
    if (fd < 0) {
        std::cout << path << ": " << vio::describe_result(fd) << "\n";
        return false;
    }

    size_t total = 0;
    bool ok = true;
    while (true) {
        auto chunk = files.read(static_cast<int>(fd), 64 * 1024);
        if (is_err(chunk)) {
            std::cout << path << ": " << vio::describe_result(vio::error_code(unwrap_err(chunk)))
                      << "\n";
            ok = false;
            break;
        }
        if (unwrap(chunk).empty())
            break;
        total += unwrap(chunk).size();
    }

    if (files.close(static_cast<int>(fd)) != 0) {
        ok = false;
    }
    if (ok) {
        std::cout << path << ": " << total << " bytes\n";
    }
    return ok;
}

/// True for entry names that stay inside the extraction directory.
auto is_contained(const path::Pathname& name) -> bool {
    if (name.depth() == 0 || name.is_absolute()) {
        return false;
    }
    return name.segments().front() != path::Segment(std::string(".."));
}

auto extract_archive(loader::LoaderContext& context, native::NativeFileIO& io,
                     const std::string& directory) -> bool {
    auto* reader = context.archive();
    if (!reader) {
        std::cout << "no archive mounted\n";
        return false;
    }

    bool ok = true;
    size_t extracted = 0;
    auto status = archive::for_each_entry(*reader, [&](archive::EntryVisit& visit) {
        const auto& name = visit.info.name;
        if (name.ends_with('/')) {
            return;
        }
        path::Pathname relative(name, path::PathSyntax::Posix);
        if (!is_contained(relative)) {
            std::cout << name << ": outside the extraction directory, skipped\n";
            ok = false;
            return;
        }

        auto target = std::filesystem::path(directory) / relative.convert(path::PathMode::Native);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cout << target.parent_path().string() << ": " << ec.message() << "\n";
            ok = false;
            return;
        }

        auto bytes = visit.read();
        if (is_err(bytes)) {
            std::cout << name << ": " << unwrap_err(bytes).message << "\n";
            ok = false;
            return;
        }
        auto written = native::write_file(io, target.string(), unwrap(bytes));
        if (is_err(written)) {
            std::cout << target.string() << ": " << unwrap_err(written).message << "\n";
            ok = false;
            return;
        }
        COMEXE_LOG_DEBUG("cli", "extracted " << name << " (" << unwrap(written) << " bytes)");
        ++extracted;
    });

    if (status == archive::ArchiveStatus::Error) {
        std::cout << "archive directory is unreadable\n";
        ok = false;
    }
    std::cout << extracted << " entries extracted to " << directory << "\n";
    return ok;
}

} // namespace

auto parse_inspect_args(int argc, char* argv[]) -> Result<InspectOptions> {
    InspectOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.show_version = true;
        } else if (auto v = option_value(arg, "--archive")) {
            options.archive = std::move(v);
        } else if (auto v = option_value(arg, "--root")) {
            options.root = std::move(v);
        } else if (auto v = option_value(arg, "--entry")) {
            options.entry = std::move(v);
        } else if (auto v = option_value(arg, "--script")) {
            options.script = std::move(v);
        } else if (auto v = option_value(arg, "--searchers")) {
            options.searchers = std::move(v);
        } else if (auto v = option_value(arg, "--open")) {
            options.open_paths.push_back(std::move(*v));
        } else if (auto v = option_value(arg, "--extract")) {
            options.extract_dir = std::move(v);
        } else if (arg.starts_with("-")) {
            return "unknown option: " + std::string(arg);
        } else {
            options.modules.emplace_back(arg);
        }
    }
    return options;
}

int inspect_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_inspect_args(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "comexe-inspect: " << unwrap_err(parsed) << "\n";
        print_usage();
        return 2;
    }
    auto& options = unwrap(parsed);
    if (options.show_help) {
        print_usage();
        return 0;
    }
    if (options.show_version) {
        std::cout << "comexe-inspect " << VERSION << "\n";
        return 0;
    }

    native::PosixFileIO io;
    loader::ApplicationConfig config;
    config.executable = argv[0];
    config.archive_path = options.archive.value_or("");
    config.entry_point = options.entry;
    config.script = options.script;
    config.working_directory = options.root;
    if (options.searchers) {
        config.searchers = *options.searchers;
    }

    auto app = loader::Application::create(std::move(config), io);
    if (is_err(app)) {
        std::cerr << "comexe-inspect: " << unwrap_err(app) << "\n";
        return 2;
    }

    loader::DefaultChunkCompiler compiler;
    auto context = loader::LoaderContext::create(*unwrap(app), io, compiler);
    if (is_err(context)) {
        std::cerr << "comexe-inspect: " << unwrap_err(context) << "\n";
        return 2;
    }
    auto& ctx = *unwrap(context);

    COMEXE_LOG_INFO("cli", "root " << unwrap(app)->root_directory() << ", searchers \""
                                   << ctx.registry().configuration() << "\"");

    bool all_ok = true;
    for (const auto& module : options.modules) {
        all_ok = report_module(ctx, module) && all_ok;
    }
    for (const auto& path : options.open_paths) {
        all_ok = report_file(ctx.files(), path) && all_ok;
    }
    if (options.extract_dir) {
        all_ok = extract_archive(ctx, io, *options.extract_dir) && all_ok;
    }

    log::Logger::instance().flush();
    return all_ok ? 0 : 1;
}

} // namespace comexe::cli
