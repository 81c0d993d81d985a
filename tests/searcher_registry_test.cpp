//! # Searcher Registry Tests
//!
//! Configuration strings, first-hit dispatch, the not-found report, the
//! fatal path for undecodable chunks and the native library searchers.

#include "loader/searcher_registry.hpp"
#include "support/zip_builder.hpp"

#include <gtest/gtest.h>

using namespace comexe;
using namespace comexe::loader;
using comexe::test_support::ScratchDir;

namespace {

/// Answers from a fixed table and counts its calls.
class TableSearcher : public Searcher {
public:
    TableSearcher(char code, std::string description, std::map<std::string, std::string> table)
        : code_(code), description_(std::move(description)), table_(std::move(table)) {}

    auto code() const -> char override {
        return code_;
    }
    auto description() const -> std::string override {
        return description_;
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override {
        ++calls;
        auto it = table_.find(std::string(module));
        if (it == table_.end())
            return std::nullopt;
        return SearchHit{ModuleKind::Chunk, description_ + ":" + it->first, it->second, {}};
    }

    int calls = 0;

private:
    char code_;
    std::string description_;
    std::map<std::string, std::string> table_;
};

} // namespace

class SearcherRegistryTest : public ::testing::Test {
protected:
    DefaultChunkCompiler compiler;
    SearcherDefaults defaults{DEFAULT_SEARCHER_CONFIG};
    std::vector<std::string> fatal;
    SearcherRegistry registry{compiler, &defaults,
                              [this](const std::string& diagnostic) { fatal.push_back(diagnostic); }};
    TableSearcher* first = nullptr;
    TableSearcher* second = nullptr;

    void SetUp() override {
        auto a = make_box<TableSearcher>('1', "preload",
                                         std::map<std::string, std::string>{{"shared", "return 'one'"}});
        auto b = make_box<TableSearcher>(
            'F', "filesystem",
            std::map<std::string, std::string>{{"shared", "return 'two'"},
                                               {"only_fs", "return 'fs'"},
                                               {"broken", std::string("x\0y", 3)}});
        first = a.get();
        second = b.get();
        registry.register_searcher(std::move(a));
        registry.register_searcher(std::move(b));
    }
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(SearcherRegistryTest, ConfigurationPublishesDefault) {
    ASSERT_TRUE(is_ok(registry.set_configuration("F1")));
    EXPECT_EQ(registry.configuration(), "F1");
    ASSERT_EQ(registry.active().size(), 2u);
    EXPECT_EQ(registry.active()[0], second);
    EXPECT_EQ(defaults.get(), "F1");
}

TEST_F(SearcherRegistryTest, InvalidCodeLeavesConfigurationUnchanged) {
    ASSERT_TRUE(is_ok(registry.set_configuration("1F")));

    auto result = registry.set_configuration("1X");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "Invalid searcher name: X");
    EXPECT_EQ(registry.configuration(), "1F");
    EXPECT_EQ(defaults.get(), "1F");
}

TEST_F(SearcherRegistryTest, UnregisteredCodeRejected) {
    auto result = registry.set_configuration("1Z");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "Searcher not available: Z");
    EXPECT_TRUE(registry.active().empty());
}

TEST_F(SearcherRegistryTest, EmptyConfigurationFindsNothing) {
    ASSERT_TRUE(is_ok(registry.set_configuration("")));
    auto loaded = registry.load("shared");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded), "module 'shared' not found:");
}

TEST_F(SearcherRegistryTest, ReplacingSearcherKeepsActiveListValid) {
    ASSERT_TRUE(is_ok(registry.set_configuration("1")));
    registry.register_searcher(make_box<TableSearcher>(
        '1', "preload", std::map<std::string, std::string>{{"shared", "return 'replaced'"}}));

    auto loaded = registry.load("shared");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).chunk->code, "return 'replaced'");
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(SearcherRegistryTest, FirstHitWins) {
    ASSERT_TRUE(is_ok(registry.set_configuration("1F")));

    auto loaded = registry.load("shared");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).searcher, '1');
    EXPECT_EQ(unwrap(loaded).chunk->code, "return 'one'");
    EXPECT_EQ(second->calls, 0);
}

TEST_F(SearcherRegistryTest, OrderFollowsConfiguration) {
    ASSERT_TRUE(is_ok(registry.set_configuration("F1")));
    auto loaded = registry.load("shared");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).searcher, 'F');
    EXPECT_EQ(unwrap(loaded).origin, "filesystem:shared");
}

TEST_F(SearcherRegistryTest, NotFoundListsEverySearcher) {
    ASSERT_TRUE(is_ok(registry.set_configuration("1F")));
    auto loaded = registry.load("missing.mod");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded),
              "module 'missing.mod' not found:\n\tno preload match\n\tno filesystem match");
}

TEST_F(SearcherRegistryTest, CompileFailureReportsDiagnostic) {
    ASSERT_TRUE(is_ok(registry.set_configuration("F")));
    auto loaded = registry.load("broken");

    ASSERT_EQ(fatal.size(), 1u);
    EXPECT_EQ(fatal[0], "error loading module 'broken' from filesystem:broken (filesystem):\n"
                        "\tfilesystem:broken: unexpected NUL byte in source");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded), fatal[0]);
}

TEST(SearcherRegistryDeathTest, CompileFailureExitsByDefault) {
    DefaultChunkCompiler compiler;
    SearcherRegistry registry(compiler, nullptr);
    registry.register_searcher(make_box<TableSearcher>(
        'F', "filesystem", std::map<std::string, std::string>{{"bad", std::string("\x1bnope")}}));
    ASSERT_TRUE(is_ok(registry.set_configuration("F")));

    EXPECT_EXIT((void)registry.load("bad"), ::testing::ExitedWithCode(1),
                "error loading module 'bad'");
}

// ============================================================================
// Native library searchers
// ============================================================================

TEST(NativeSearcherTest, EntrySymbol) {
    EXPECT_EQ(native_entry_symbol("socket"), "luaopen_socket");
    EXPECT_EQ(native_entry_symbol("socket.core"), "luaopen_socket_core");
    EXPECT_EQ(native_entry_symbol("v2-json.fast"), "luaopen_json_fast");
}

TEST(NativeSearcherTest, SplitSearchPath) {
    EXPECT_EQ(split_search_path("./?.so;;/usr/lib/?.so;"),
              (std::vector<std::string>{"./?.so", "/usr/lib/?.so"}));
    EXPECT_TRUE(split_search_path("").empty());
}

class NativeLibrarySearcherTest : public ::testing::Test {
protected:
    ScratchDir dir;
    native::PosixFileIO io;

    auto search_path() const -> std::string {
        return (dir.path() / "?.so").string() + ";" + (dir.path() / "lib/?.so").string();
    }
};

TEST_F(NativeLibrarySearcherTest, FindsLibraryAndSymbol) {
    auto library = dir.write("lib/socket/core.so", "ELF");
    NativeLibrarySearcher searcher(search_path(), io);

    auto hit = searcher.search("socket.core");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, ModuleKind::NativeLibrary);
    EXPECT_EQ(hit->origin, library.string());
    EXPECT_EQ(hit->entry_symbol, "luaopen_socket_core");
    EXPECT_FALSE(searcher.search("socket.other").has_value());
}

TEST_F(NativeLibrarySearcherTest, AllInOneUsesRootModuleLibrary) {
    auto library = dir.write("socket.so", "ELF");
    AllInOneSearcher searcher(search_path(), io);

    auto hit = searcher.search("socket.http");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->origin, library.string());
    EXPECT_EQ(hit->entry_symbol, "luaopen_socket_http");

    // A top-level module is never an all-in-one member.
    EXPECT_FALSE(searcher.search("socket").has_value());
}

TEST_F(NativeLibrarySearcherTest, RegistryPassesLibraryThroughUncompiled) {
    dir.write("lib/fastjson.so", "ELF");
    DefaultChunkCompiler compiler;
    SearcherRegistry registry(compiler, nullptr);
    registry.register_searcher(make_box<NativeLibrarySearcher>(search_path(), io));
    ASSERT_TRUE(is_ok(registry.set_configuration("3")));

    auto loaded = registry.load("fastjson");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).kind, ModuleKind::NativeLibrary);
    EXPECT_FALSE(unwrap(loaded).chunk.has_value());
    EXPECT_EQ(unwrap(loaded).entry_symbol, "luaopen_fastjson");
}

TEST_F(NativeLibrarySearcherTest, SourcePathSearcherReadsChunk) {
    auto script = dir.write("mods/util/init.lua", "return {}");
    SourcePathSearcher searcher((dir.path() / "mods/?.lua").string() + ";" +
                                    (dir.path() / "mods/?/init.lua").string(),
                                io);

    auto hit = searcher.search("util");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, ModuleKind::Chunk);
    EXPECT_EQ(hit->origin, script.string());
    EXPECT_EQ(hit->content, "return {}");
}
