//! # comexe-inspect Driver Tests

#include "cli/driver.hpp"
#include "log/log.hpp"
#include "support/zip_builder.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace comexe;
using namespace comexe::cli;
using comexe::test_support::ScratchDir;
using comexe::test_support::ZipBuilder;

namespace {

/// Owns argument strings and exposes them as a mutable argv.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    auto argc() const -> int {
        return static_cast<int>(storage_.size());
    }
    auto argv() -> char** {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

auto slurp(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(ParseInspectArgsTest, CollectsOptionsAndModules) {
    Args args{"comexe-inspect", "--archive=app.zip", "-vv",       "--searchers=ZF",
              "--open=COMRAD-RUNTIME-V2/a", "--open=/etc/hosts", "app.main", "util"};
    auto parsed = parse_inspect_args(args.argc(), args.argv());
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed);

    const auto& options = unwrap(parsed);
    EXPECT_EQ(options.archive, "app.zip");
    EXPECT_EQ(options.searchers, "ZF");
    EXPECT_FALSE(options.root.has_value());
    EXPECT_EQ(options.open_paths, (std::vector<std::string>{"COMRAD-RUNTIME-V2/a", "/etc/hosts"}));
    EXPECT_EQ(options.modules, (std::vector<std::string>{"app.main", "util"}));
}

TEST(ParseInspectArgsTest, ExtractDirectory) {
    Args args{"comexe-inspect", "--extract=/tmp/unpacked"};
    auto parsed = parse_inspect_args(args.argc(), args.argv());
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).extract_dir, "/tmp/unpacked");
}

TEST(ParseInspectArgsTest, UnknownOptionRejected) {
    Args args{"comexe-inspect", "--frobnicate"};
    auto parsed = parse_inspect_args(args.argc(), args.argv());
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed), "unknown option: --frobnicate");
}

TEST(ParseInspectArgsTest, EmptyValueIsNotAnOption) {
    Args args{"comexe-inspect", "--archive"};
    EXPECT_TRUE(is_err(parse_inspect_args(args.argc(), args.argv())));
}

class InspectMainTest : public ::testing::Test {
protected:
    ScratchDir dir;
    std::string archive;

    void SetUp() override {
        archive = (dir.path() / "app.zip").string();
        ZipBuilder()
            .add_stored("lua/app/main.lua", "return 'main'")
            .add_stored("comexe/etc/motd", "welcome")
            .write_to(archive);
    }

    void TearDown() override {
        log::Logger::init(log::LogConfig{});
    }

    auto run(std::initializer_list<std::string> extra) -> int {
        std::vector<std::string> all{"comexe-inspect", "-q", "--archive=" + archive,
                                     "--root=" + dir.path().string()};
        all.insert(all.end(), extra.begin(), extra.end());
        std::vector<char*> argv;
        for (auto& arg : all) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return inspect_main(static_cast<int>(all.size()), argv.data());
    }
};

TEST_F(InspectMainTest, VersionAndHelp) {
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(run({"--help"}), 0);
}

TEST_F(InspectMainTest, UsageErrors) {
    EXPECT_EQ(run({"--bogus"}), 2);
    EXPECT_EQ(run({"--searchers=1Q"}), 2);
}

TEST_F(InspectMainTest, ResolvesModulesAndAssets) {
    EXPECT_EQ(run({"--searchers=Z", "app.main", "--open=COMRAD-RUNTIME-V2/etc/motd"}), 0);
}

TEST_F(InspectMainTest, MissingModuleFails) {
    EXPECT_EQ(run({"--searchers=Z", "app.main", "not.there"}), 1);
    EXPECT_EQ(run({"--open=COMRAD-RUNTIME-V2/etc/none"}), 1);
}

TEST_F(InspectMainTest, ExtractsArchiveEntries) {
    auto out = dir.path() / "out";
    EXPECT_EQ(run({"--extract=" + out.string()}), 0);
    EXPECT_EQ(slurp(out / "lua/app/main.lua"), "return 'main'");
    EXPECT_EQ(slurp(out / "comexe/etc/motd"), "welcome");
}

TEST_F(InspectMainTest, ExtractSkipsEscapingEntries) {
    ZipBuilder().add_stored("../evil.txt", "x").add_stored("ok.txt", "fine").write_to(archive);
    auto out = dir.path() / "out";

    EXPECT_EQ(run({"--extract=" + out.string()}), 1);
    EXPECT_EQ(slurp(out / "ok.txt"), "fine");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "evil.txt"));
}

TEST_F(InspectMainTest, ExtractWithoutArchiveFails) {
    std::filesystem::remove(archive);
    EXPECT_EQ(run({"--extract=" + (dir.path() / "out").string()}), 1);
}
