#include "loader/application.hpp"

#include "log/log.hpp"
#include "path/pathname.hpp"
#include "runtime/platform.hpp"

namespace comexe::loader {

auto run_mode_name(RunMode mode) -> const char* {
    switch (mode) {
    case RunMode::Embedded:
        return "EMBEDDED";
    case RunMode::Interpreter:
        return "INTERPRETER";
    }
    return "???";
}

auto validate_searcher_codes(std::string_view codes) -> Result<bool> {
    if (codes.size() > MAX_SEARCHER_CONFIG) {
        return "Searcher configuration too long (max " + std::to_string(MAX_SEARCHER_CONFIG) +
               "): " + std::string(codes);
    }
    for (char code : codes) {
        if (SEARCHER_CODES.find(code) == std::string_view::npos) {
            return "Invalid searcher name: " + std::string(1, code);
        }
    }
    return true;
}

Application::Application(ApplicationConfig config, RunMode mode, std::string root)
    : config_(std::move(config)), run_mode_(mode), root_directory_(std::move(root)),
      archive_path_(config_.archive_path.value_or(config_.executable)),
      defaults_(config_.searchers) {}

auto Application::create(ApplicationConfig config, native::NativeFileIO& io)
    -> Result<Box<Application>> {
    auto valid = validate_searcher_codes(config.searchers);
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    std::string cwd;
    if (config.working_directory) {
        cwd = *config.working_directory;
    } else if (auto current = io.current_directory()) {
        cwd = *current;
    } else {
        return std::string("cannot determine the working directory");
    }
    path::Pathname cwd_path(cwd);

    RunMode mode = config.entry_point ? RunMode::Embedded : RunMode::Interpreter;

    std::string root = cwd_path.to_string();
    if (mode == RunMode::Interpreter && config.script) {
        path::Pathname script(*config.script);
        if (script.is_absolute()) {
            root = script.directory();
        } else if (auto dir = script.directory(); !dir.empty()) {
            root = (cwd_path + path::Pathname(dir)).to_string();
        }
    }

    COMEXE_LOG_INFO("loader", "run mode " << run_mode_name(mode) << ", root " << root);
    return Box<Application>(new Application(std::move(config), mode, std::move(root)));
}

auto Application::parameter(std::string_view key) const -> std::optional<std::string> {
    if (key == "INTERNAL-DIR-SEP")
        return std::string(1, platform::INTERNAL_DIR_SEP);
    if (key == "NATIVE-DIR-SEP")
        return std::string(1, platform::NATIVE_DIR_SEP);
    if (key == "ARCH")
        return std::string(platform::ARCH);
    if (key == "OS")
        return std::string(platform::OS);
    if (key == "RUN-MODE")
        return std::string(run_mode_name(run_mode_));
    if (key == "ROOT-DIR")
        return root_directory_;
    if (key == "EXE")
        return config_.executable;
    if (key == "SCRIPT")
        return config_.script;
    if (key == "ENTRY-POINT")
        return config_.entry_point;
    if (key == "LOADER-CONFIG")
        return defaults_.get();
    return std::nullopt;
}

} // namespace comexe::loader
