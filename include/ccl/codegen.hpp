// Lowering of a checked contract program to an LLVM module, and bitcode serialization.
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "ccl/ast.hpp"
#include "ccl/builtins.hpp"
#include "ccl/options.hpp"
#include "ccl/types.hpp"

namespace ccl {

// Raised inside code generation for unsupported shapes, invalid pipelines and verifier
// failures. compile() turns it into a CodegenError diagnostic.
class codegen_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr const char* kModuleId = "ccl.contract";
inline constexpr const char* kSourceName = "contract";
inline constexpr const char* kMemoryName = "memory";
inline constexpr const char* kEntryName = "run";
inline constexpr uint32_t kPageSize = 65536;

class CodeGenerator {
public:
    CodeGenerator(TypeContext& tctx, const CompileOptions& opts);
    ~CodeGenerator();

    // Program must have passed analysis. Verifies the module and runs the configured
    // pass pipeline; throws codegen_error on failure.
    std::unique_ptr<llvm::Module> generate(const ast::Program& program, llvm::LLVMContext& llctx);

    // Host functions referenced by the last generated module, sorted by name.
    const std::vector<HostFunction>& imports() const { return imports_; }
    // First offset past the static data; callers place `run` string arguments from here.
    uint32_t heap_base() const { return heap_base_; }

private:
    TypeContext& tctx_;
    CompileOptions opts_;
    std::vector<HostFunction> imports_;
    uint32_t heap_base_ = 0;
};

std::vector<uint8_t> write_bitcode(const llvm::Module& module);

// Lowercase hex SHA-256 of a byte buffer.
std::string sha256_hex(const std::vector<uint8_t>& bytes);

} // namespace ccl
