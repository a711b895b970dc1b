#pragma once

#include "ccl/ir/state.hpp"

namespace ccl::ir::expr_ops {

// Arithmetic traps on division by zero and INT64_MIN / -1; `%` by -1 yields 0.
llvm::Value* emit_binary(State& S, const ast::Expr& e, const ast::Binary& b);
llvm::Value* emit_unary(State& S, const ast::Unary& u);

llvm::Value* emit_array_lit(State& S, const ast::Expr& e, const ast::ArrayLit& a);
llvm::Value* emit_record_lit(State& S, const ast::RecordLit& r);
// Option and Result share the [tag][payload] layout.
llvm::Value* emit_tagged(State& S, uint64_t tag, const ast::Expr* payload);

// Stores into a binding slot, an array element or a record field.
void emit_assign(State& S, const ast::AssignStmt& as);

} // namespace ccl::ir::expr_ops
