#pragma once

#include "ccl/builtins.hpp"
#include "ccl/ir/state.hpp"

namespace ccl::ir::call_ops {

// User function, free-function built-in or host import.
llvm::Value* emit_call(State& S, const ast::Expr& e, const ast::Call& c);
llvm::Value* emit_method(State& S, const ast::Expr& e, const ast::MethodCall& m);

// Built-in over `receiver` with extra arguments args[first..].
llvm::Value* emit_builtin(State& S, ast::Builtin id, TypeId result, const ast::Expr& receiver,
                          const std::vector<ast::ExprPtr>& args, size_t first);

// External declaration for a host function, created on first reference. String and Did
// results come back through a trailing out-buffer argument and an i32 byte count.
llvm::Function* host_import(State& S, const HostFunction& h);

} // namespace ccl::ir::call_ops
