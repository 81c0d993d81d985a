#include "loader/loader_context.hpp"

#include "archive/zip_archive_reader.hpp"
#include "log/log.hpp"

namespace comexe::loader {

LoaderContext::LoaderContext(Application& app, Box<archive::ArchiveReader> archive,
                             native::NativeFileIO& io, ChunkCompiler& compiler,
                             LoaderOptions options)
    : app_(app), archive_(std::move(archive)),
      resolver_(app.run_mode(), app.root_directory(), archive_.get(), io),
      registry_(compiler, &app.searcher_defaults(), std::move(options.on_fatal)),
      files_(archive_.get(), io) {
    auto preload = make_box<PreloadSearcher>();
    preload_ = preload.get();
    registry_.register_searcher(std::move(preload));
    registry_.register_searcher(make_box<SourcePathSearcher>(options.source_path, io));
    registry_.register_searcher(make_box<NativeLibrarySearcher>(options.native_path, io));
    registry_.register_searcher(make_box<AllInOneSearcher>(options.native_path, io));
    registry_.register_searcher(
        make_box<ArchiveSearcher>('R', "archive runtime", runtime_candidates(), resolver_));
    registry_.register_searcher(
        make_box<ArchiveSearcher>('Z', "archive application", application_candidates(), resolver_));
    registry_.register_searcher(make_box<FilesystemSearcher>(resolver_));
}

auto LoaderContext::create(Application& app, native::NativeFileIO& io, ChunkCompiler& compiler,
                           LoaderOptions options) -> Result<Box<LoaderContext>> {
    Box<archive::ArchiveReader> archive;
    if (!app.archive_path().empty()) {
        auto opened = archive::ZipArchiveReader::open(app.archive_path());
        if (is_ok(opened)) {
            archive = std::move(unwrap(opened));
        } else if (app.run_mode() == RunMode::Embedded) {
            COMEXE_LOG_WARN("loader", unwrap_err(opened));
        } else {
            COMEXE_LOG_DEBUG("loader", unwrap_err(opened));
        }
    }

    Box<LoaderContext> context(
        new LoaderContext(app, std::move(archive), io, compiler, std::move(options)));

    auto configured = context->registry_.set_configuration(app.searcher_defaults().get());
    if (is_err(configured)) {
        return unwrap_err(configured);
    }
    return std::move(context);
}

void LoaderContext::preload(std::string module, std::string content) {
    preload_->add(std::move(module), std::move(content));
}

auto LoaderContext::parameter(std::string_view key) const -> std::optional<std::string> {
    if (key.starts_with("SEARCHER_") && key.size() == 10) {
        return registry_.find(key.back()) ? "true" : "false";
    }
    return app_.parameter(key);
}

} // namespace comexe::loader
