// Description of a compiled contract module: exports, imports, memory, size and hash.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "ccl/ast.hpp"
#include "ccl/builtins.hpp"
#include "ccl/options.hpp"
#include "ccl/types.hpp"

namespace ccl {

inline constexpr const char* kCompilerVersion = "0.1.0";
inline constexpr const char* kBytecodeFormat = "llvm-bc";

struct ParamInfo { std::string name; std::string type; };
struct FunctionInfo { std::string name; std::vector<ParamInfo> params; std::string returns; };
// heap_base: first offset free for `run` String/Did arguments.
struct MemoryInfo { std::string name; uint32_t pages = 0; uint64_t bytes = 0; uint32_t heap_base = 0; };

struct ContractMetadata {
    std::vector<FunctionInfo> exports;
    std::vector<FunctionInfo> imports; // sorted by name
    MemoryInfo memory;
    uint64_t size = 0;
    std::string hash;                  // lowercase hex SHA-256 of the bytecode
    std::string format = kBytecodeFormat;
    std::string version = kCompilerVersion;
};

ContractMetadata build_metadata(const ast::Program& program, const TypeContext& tctx,
                                const std::vector<HostFunction>& imports, uint32_t heap_base,
                                const std::vector<uint8_t>& bytecode, const CompileOptions& opts);

// Compact JSON rendering, same conventions as diagnostics_to_json.
std::string metadata_to_json(const ContractMetadata& m);

} // namespace ccl
