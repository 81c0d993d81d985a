#include "loader/chunk_compiler.hpp"

namespace comexe::loader {

namespace {

constexpr std::string_view BYTECODE_SIGNATURE = "\x1bLua";

} // namespace

auto DefaultChunkCompiler::compile(std::string_view content, std::string_view chunk_name)
    -> Result<CompiledChunk> {
    std::string name(chunk_name);

    if (!content.empty() && content.front() == BYTECODE_SIGNATURE.front()) {
        if (!content.starts_with(BYTECODE_SIGNATURE)) {
            return name + ": bad binary format (not a precompiled chunk)";
        }
        if (content.size() <= BYTECODE_SIGNATURE.size()) {
            return name + ": truncated precompiled chunk";
        }
        auto version = static_cast<unsigned char>(content[BYTECODE_SIGNATURE.size()]);
        if (version != BYTECODE_VERSION) {
            return name + ": version mismatch in precompiled chunk";
        }
        return CompiledChunk{name, ChunkFormat::Binary, std::string(content)};
    }

    auto text = content;
    if (text.starts_with("#")) {
        size_t eol = text.find('\n');
        // Keep the newline so line numbers stay correct.
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol);
    }
    if (text.find('\0') != std::string_view::npos) {
        return name + ": unexpected NUL byte in source";
    }
    return CompiledChunk{name, ChunkFormat::Source, std::string(text)};
}

} // namespace comexe::loader
