#pragma once

#include <string>

#include <llvm/IR/IRBuilder.h>

#include "ccl/ir/state.hpp"

namespace ccl::ir::memory_ops {

// Register representation of a contract type: i64, i1, i32 offset, or void for Unit.
llvm::Type* value_type(State& S, TypeId t);
// Representation at the module boundary (Bool widened to i32).
llvm::Type* boundary_type(State& S, TypeId t);

// Typed pointer to `off` bytes into linear memory.
llvm::Value* address(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Type* elemTy);

llvm::Value* load_i32(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off);
llvm::Value* load_i64(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off);
llvm::Value* load_i8(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off);
void store_i32(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Value* v);
void store_i64(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Value* v);

// i32 offset arithmetic
llvm::Value* offset(llvm::IRBuilder<>& B, llvm::Value* base, uint32_t bytes);

// Array header: [len i32][cap i32][cells i32][reserved i32]. The header never moves;
// growth replaces the cell region it points at.
constexpr uint32_t kArrayHeader = 16;
constexpr uint32_t kArrayCellsField = 8;
// Offset of cell `i` (an i32 index) of the array whose header is at `arr`.
llvm::Value* array_cell(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* arr, llvm::Value* i);

// Every element, field and payload occupies one 8-byte cell.
llvm::Value* to_cell(State& S, llvm::Value* v, TypeId t);
llvm::Value* from_cell(State& S, llvm::Value* cell, TypeId t);

llvm::Value* load_cell(State& S, llvm::Value* off, TypeId t);
void store_cell(State& S, llvm::Value* off, llvm::Value* v, TypeId t);

// Branches to a trap block when `cond` holds and continues in a fresh block.
void trap_if(llvm::IRBuilder<>& B, llvm::Function* F, llvm::Value* cond, const std::string& label);

} // namespace ccl::ir::memory_ops
