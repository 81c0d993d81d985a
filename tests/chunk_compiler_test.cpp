//! # Chunk Compiler Tests

#include "loader/chunk_compiler.hpp"

#include <gtest/gtest.h>

using namespace comexe;
using namespace comexe::loader;

class DefaultChunkCompilerTest : public ::testing::Test {
protected:
    DefaultChunkCompiler compiler;
};

TEST_F(DefaultChunkCompilerTest, SourceTextPassesThrough) {
    auto chunk = compiler.compile("return 1\n", "archive:lua/one.lua");
    ASSERT_TRUE(is_ok(chunk));
    EXPECT_EQ(unwrap(chunk).format, ChunkFormat::Source);
    EXPECT_EQ(unwrap(chunk).name, "archive:lua/one.lua");
    EXPECT_EQ(unwrap(chunk).code, "return 1\n");
}

TEST_F(DefaultChunkCompilerTest, ShebangLineDroppedNewlineKept) {
    auto chunk = compiler.compile("#!/usr/bin/env comexe\nprint(1)\n", "script");
    ASSERT_TRUE(is_ok(chunk));
    EXPECT_EQ(unwrap(chunk).code, "\nprint(1)\n");
}

TEST_F(DefaultChunkCompilerTest, ShebangOnly) {
    auto chunk = compiler.compile("#!comexe", "script");
    ASSERT_TRUE(is_ok(chunk));
    EXPECT_TRUE(unwrap(chunk).code.empty());
}

TEST_F(DefaultChunkCompilerTest, NulByteInSourceRejected) {
    auto chunk = compiler.compile(std::string_view("return\0 1", 9), "bad");
    ASSERT_TRUE(is_err(chunk));
    EXPECT_EQ(unwrap_err(chunk), "bad: unexpected NUL byte in source");
}

TEST_F(DefaultChunkCompilerTest, PrecompiledChunkAccepted) {
    std::string bytecode = "\x1bLua";
    bytecode += static_cast<char>(DefaultChunkCompiler::BYTECODE_VERSION);
    bytecode += std::string("\0\x19\x93", 3);

    auto chunk = compiler.compile(bytecode, "mod.bin");
    ASSERT_TRUE(is_ok(chunk));
    EXPECT_EQ(unwrap(chunk).format, ChunkFormat::Binary);
    EXPECT_EQ(unwrap(chunk).code, bytecode);
}

TEST_F(DefaultChunkCompilerTest, WrongBytecodeVersionRejected) {
    std::string bytecode = "\x1bLua";
    bytecode += '\x54';
    auto chunk = compiler.compile(bytecode, "old.bin");
    ASSERT_TRUE(is_err(chunk));
    EXPECT_NE(unwrap_err(chunk).find("version mismatch"), std::string::npos);
}

TEST_F(DefaultChunkCompilerTest, BadBinarySignatureRejected) {
    auto chunk = compiler.compile("\x1bXYZ", "junk");
    ASSERT_TRUE(is_err(chunk));
    EXPECT_NE(unwrap_err(chunk).find("bad binary format"), std::string::npos);

    auto truncated = compiler.compile("\x1bLua", "short");
    ASSERT_TRUE(is_err(truncated));
    EXPECT_NE(unwrap_err(truncated).find("truncated"), std::string::npos);
}
