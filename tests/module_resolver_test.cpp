//! # Module Resolver Tests
//!
//! Backend ordering per run mode, candidate expansion and the probe
//! sequence seen by the native layer.

#include "archive/zip_archive_reader.hpp"
#include "loader/module_resolver.hpp"
#include "runtime/platform.hpp"
#include "support/fake_file_io.hpp"
#include "support/zip_builder.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace comexe;
using namespace comexe::loader;
using comexe::test_support::RecordingFileIO;
using comexe::test_support::ScratchDir;
using comexe::test_support::ZipBuilder;

// ============================================================================
// Candidates
// ============================================================================

TEST(SearchCandidatesTest, ModulePathAndSubstitution) {
    EXPECT_EQ(module_path("a.b.c"), "a/b/c");
    EXPECT_EQ(module_path("plain"), "plain");
    EXPECT_EQ(substitute("lua/?/init.lua", "x/y"), "lua/x/y/init.lua");
    EXPECT_EQ(substitute("?;?", "m"), "m;m");
}

TEST(SearchCandidatesTest, ApplicationCandidateOrder) {
    const auto& list = application_candidates();
    auto bin = platform::binary_suffix();

    ASSERT_EQ(list.size(), 12u);
    EXPECT_EQ(list[0], "lua/?" + bin);
    EXPECT_EQ(list[1], "lua/?.lua");
    EXPECT_EQ(list[2], "lua/?/init" + bin);
    EXPECT_EQ(list[3], "lua/?/init.lua");
    EXPECT_EQ(list[5], "?.lua");
    EXPECT_EQ(list[11], "share/lua/5.5/?/init.lua");
}

TEST(SearchCandidatesTest, RuntimeCandidatesLiveUnderAssetDirectory) {
    for (const auto& pattern : runtime_candidates()) {
        EXPECT_EQ(pattern.rfind("comexe/usr/share/lua/5.5/", 0), 0u) << pattern;
    }
    EXPECT_EQ(runtime_candidates().size(), 4u);
}

// ============================================================================
// Search order
// ============================================================================

class ModuleResolverTest : public ::testing::Test {
protected:
    ScratchDir dir;
    RecordingFileIO io;
    Box<archive::ZipArchiveReader> archive;

    void SetUp() override {
        auto image = ZipBuilder()
                         .add_stored("lua/app.lua", "return 'archive app'")
                         .add_deflated("shared.lua", "return 'archive shared'")
                         .add_stored("comexe/usr/share/lua/5.5/std/init.lua", "return 'std'")
                         .build();
        auto opened = archive::ZipArchiveReader::from_memory(image);
        ASSERT_TRUE(is_ok(opened));
        archive = std::move(unwrap(opened));
    }

    auto resolver(RunMode mode, bool with_archive = true) -> ModuleResolver {
        return ModuleResolver(mode, dir.path().string(), with_archive ? archive.get() : nullptr,
                              io);
    }
};

TEST_F(ModuleResolverTest, SearchOrderFollowsRunMode) {
    auto embedded = resolver(RunMode::Embedded);
    auto interpreter = resolver(RunMode::Interpreter);

    using B = std::vector<Backend>;
    EXPECT_EQ(embedded.search_order(BackendPreference::Auto), B{Backend::Archive});
    EXPECT_EQ(embedded.search_order(BackendPreference::AutoWithFallback),
              (B{Backend::Archive, Backend::Filesystem}));
    EXPECT_EQ(interpreter.search_order(BackendPreference::Auto), B{Backend::Filesystem});
    EXPECT_EQ(interpreter.search_order(BackendPreference::AutoWithFallback),
              (B{Backend::Filesystem, Backend::Archive}));
    EXPECT_EQ(interpreter.search_order(BackendPreference::ArchiveOnly), B{Backend::Archive});
    EXPECT_EQ(embedded.search_order(BackendPreference::FilesystemOnly), B{Backend::Filesystem});
}

TEST_F(ModuleResolverTest, EmbeddedPrefersArchive) {
    dir.write("lua/app.lua", "return 'disk app'");
    auto r = resolver(RunMode::Embedded);

    auto hit = r.resolve("app", application_candidates(), BackendPreference::AutoWithFallback);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->backend, Backend::Archive);
    EXPECT_EQ(hit->location, "lua/app.lua");
    EXPECT_EQ(hit->content, "return 'archive app'");
}

TEST_F(ModuleResolverTest, InterpreterPrefersFilesystem) {
    auto disk = dir.write("lua/app.lua", "return 'disk app'");
    auto r = resolver(RunMode::Interpreter);

    auto hit = r.resolve("app", application_candidates(), BackendPreference::AutoWithFallback);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->backend, Backend::Filesystem);
    EXPECT_EQ(hit->location, disk.string());
}

TEST_F(ModuleResolverTest, FallbackReachesSecondBackend) {
    auto r = resolver(RunMode::Interpreter);

    EXPECT_FALSE(r.resolve("shared", application_candidates(), BackendPreference::Auto));

    auto hit = r.resolve("shared", application_candidates(), BackendPreference::AutoWithFallback);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->backend, Backend::Archive);
    EXPECT_EQ(hit->content, "return 'archive shared'");
}

TEST_F(ModuleResolverTest, FileBeforeDirectoryInit) {
    auto file = dir.write("a/b/c.lua", "return 'file'");
    auto init = dir.write("a/b/c/init.lua", "return 'init'");
    auto r = resolver(RunMode::Interpreter);

    auto hit = r.resolve("a.b.c", application_candidates(), BackendPreference::FilesystemOnly);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->location, file.string());
    EXPECT_EQ(hit->content, "return 'file'");

    EXPECT_EQ(std::find(io.probes.begin(), io.probes.end(), file.string()) + 1, io.probes.end());
    EXPECT_EQ(std::find(io.probes.begin(), io.probes.end(), init.string()), io.probes.end());
}

TEST_F(ModuleResolverTest, DirectoryInitFromRuntimeAssets) {
    auto r = resolver(RunMode::Embedded);
    auto hit = r.resolve("std", runtime_candidates(), BackendPreference::ArchiveOnly);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->location, "comexe/usr/share/lua/5.5/std/init.lua");
}

TEST_F(ModuleResolverTest, NoArchiveMeansArchiveMisses) {
    auto r = resolver(RunMode::Embedded, false);
    EXPECT_FALSE(r.resolve("app", application_candidates(), BackendPreference::ArchiveOnly));
    EXPECT_TRUE(io.probes.empty());
}

TEST_F(ModuleResolverTest, LoadResourceUsesNameVerbatim) {
    dir.write("conf/settings.json", "{}");
    auto r = resolver(RunMode::Embedded);

    auto archived = r.load_resource("./lua/../shared.lua", BackendPreference::ArchiveOnly);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->location, "shared.lua");

    auto on_disk = r.load_resource("conf/settings.json", BackendPreference::AutoWithFallback);
    ASSERT_TRUE(on_disk.has_value());
    EXPECT_EQ(on_disk->backend, Backend::Filesystem);
    EXPECT_EQ(on_disk->content, "{}");
}

TEST_F(ModuleResolverTest, RelativePathJoinsRoot) {
    auto r = resolver(RunMode::Interpreter);
    EXPECT_EQ(r.relative_path("lua/x.lua"), (dir.path() / "lua/x.lua").string());
    EXPECT_EQ(r.relative_path("../up.lua"), (dir.path().parent_path() / "up.lua").string());
}
