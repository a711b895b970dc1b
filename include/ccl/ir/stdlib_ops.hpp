#pragma once

#include <vector>

#include "ccl/ir/state.hpp"

namespace ccl::ir::stdlib_ops {

// Math, text and utility built-ins. Their runtime helpers (ccl.pow, ccl.str_find, ...)
// are added to the module the first time a call needs them.
llvm::Value* emit_library_call(State& S, ast::Builtin id, TypeId result, const ast::Expr& receiver,
                               const std::vector<ast::ExprPtr>& args, size_t first);

} // namespace ccl::ir::stdlib_ops
