#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "ccl/ast.hpp"
#include "ccl/builtins.hpp"
#include "ccl/options.hpp"
#include "ccl/types.hpp"

namespace ccl::ir {

// Internal helper functions and globals shared by every lowered function.
struct Runtime {
    llvm::GlobalVariable* memory = nullptr;
    llvm::GlobalVariable* heap_top = nullptr;
    llvm::Function* alloc = nullptr;            // i32 (i32 size)
    llvm::Function* str_eq = nullptr;           // i1 (i32, i32)
    llvm::Function* str_concat = nullptr;       // i32 (i32, i32)
    llvm::Function* array_new = nullptr;        // i32 (i32 len, i32 cap)
    llvm::Function* array_slot = nullptr;       // i32 (i32 arr, i64 index), bounds checked
    llvm::Function* array_push = nullptr;       // i32 (i32 arr, i64 cell), returns the new length
    llvm::Function* array_pop = nullptr;        // i64 (i32 arr)
    llvm::Function* contains_cell = nullptr;    // i1 (i32 arr, i64 cell)
    llvm::Function* contains_str = nullptr;     // i1 (i32 arr, i32 str)
    llvm::Function* init_memory = nullptr;      // void (), emitted once the data segment is final
};

// Static data: string literals, deduplicated, placed from offset 8.
struct DataSegment {
    static constexpr uint32_t kBase = 8;
    std::vector<uint8_t> bytes;
    std::map<std::string, uint32_t> offsets;

    uint32_t intern(const std::string& s);
    uint32_t end() const { return kBase + static_cast<uint32_t>(bytes.size()); }
};

// Shared state for the lowering helpers, in the manner of a builder state bundle.
struct State {
    llvm::IRBuilder<>& builder;
    llvm::LLVMContext& llctx;
    llvm::Module& module;
    TypeContext& tctx;
    const ast::Program& program;
    const CompileOptions& opts;

    Runtime rt;
    DataSegment data;
    std::map<std::string, llvm::Function*> functions; // user functions by source name
    std::map<std::string, llvm::Function*> imports;   // host functions by name
    std::map<std::string, HostFunction> import_sigs;
    uint32_t heap_base = 0;                           // first heap offset, set by finalize_memory

    // --- current function -----------------------------------------------------
    llvm::Function* F = nullptr;
    const ast::FunctionDecl* fn = nullptr;
    std::vector<llvm::AllocaInst*> slots;
    llvm::Instruction* allocaPoint = nullptr; // hidden temporaries are placed before this
    std::vector<llvm::BasicBlock*> loopEndStack;
    std::vector<llvm::BasicBlock*> loopContinueStack;
    int cfCounter = 0;

    uint64_t memory_bytes() const { return static_cast<uint64_t>(opts.memory_pages) * 65536ull; }
};

// Recursive entry points, implemented by the emitter.
llvm::Value* emit_expr(State& S, const ast::Expr& e);
void emit_block(State& S, const ast::Block& b);
void emit_stmts(State& S, const std::vector<ast::StmtPtr>& stmts);

// Hidden alloca in the entry block, after the local slots.
llvm::AllocaInst* hidden_slot(State& S, llvm::Type* ty, const std::string& name);

std::string next_label(State& S, const std::string& stem);

} // namespace ccl::ir
