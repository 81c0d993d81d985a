//! # Chunk Compiler
//!
//! Boundary to the scripting engine: turns located module bytes into a
//! loadable chunk. The loader only needs to know whether compilation
//! succeeded, so the engine plugs in through `ChunkCompiler`.

#ifndef COMEXE_LOADER_CHUNK_COMPILER_HPP
#define COMEXE_LOADER_CHUNK_COMPILER_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace comexe::loader {

enum class ChunkFormat {
    Source, ///< Script text
    Binary  ///< Precompiled bytecode
};

struct CompiledChunk {
    std::string name;
    ChunkFormat format;
    std::string code;
};

class ChunkCompiler {
public:
    virtual ~ChunkCompiler() = default;

    virtual auto compile(std::string_view content, std::string_view chunk_name)
        -> Result<CompiledChunk> = 0;
};

/// Accepts script text and precompiled chunks for the bundled engine.
///
/// - A first line starting with `#` is dropped from source text.
/// - Precompiled chunks start with ESC "Lua" and a version byte; only
///   `BYTECODE_VERSION` is accepted.
/// - Source text must not contain NUL bytes.
class DefaultChunkCompiler : public ChunkCompiler {
public:
    static constexpr unsigned char BYTECODE_VERSION = 0x55;

    auto compile(std::string_view content, std::string_view chunk_name)
        -> Result<CompiledChunk> override;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_CHUNK_COMPILER_HPP
