#pragma once

#include "ccl/ir/state.hpp"

namespace ccl::ir::control_ops {

// if / else if / else lowered as a chain of two-way branches sharing one merge block.
void emit_if(State& S, const ast::IfStmt& s);
void emit_while(State& S, const ast::WhileStmt& s);
// Iterates by index; the array is evaluated once and its length re-read every iteration.
void emit_for(State& S, const ast::ForStmt& s);
void emit_break(State& S);
void emit_continue(State& S);

// Sequential arm tests; the last arm is the default. Returns null for Unit matches.
llvm::Value* emit_match(State& S, const ast::Expr& e, const ast::Match& m);

} // namespace ccl::ir::control_ops
