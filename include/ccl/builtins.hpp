// Host function table and built-in library names.
#pragma once
#include "ccl/ast.hpp"
#include "ccl/types.hpp"
#include <string>
#include <vector>

namespace ccl {

// A capability supplied by the execution runtime, imported by name.
struct HostFunction {
    std::string name;
    std::vector<BaseType> params;
    BaseType ret;
};

// Known capabilities, sorted by name. Other `host_` names are imported with the
// signature inferred at their first call site.
const std::vector<HostFunction>& host_functions();
const HostFunction* find_host_function(const std::string& name);

inline constexpr size_t kHostPrefixLength = 5;
bool is_host_name(const std::string& name);
// Types that can cross the module boundary: Integer, Mana, Bool, String, Did.
bool is_host_scalar(BaseType b);

// Free-function built-ins (array_len, string_concat, ...). Arity counts the receiver.
struct BuiltinFunction { const char* name; ast::Builtin id; size_t arity; };
const BuiltinFunction* find_builtin_function(const std::string& name);

// Method form, resolved from the receiver's type kind. Returns Builtin::None when unknown.
ast::Builtin find_builtin_method(const TypeContext& ctx, TypeId receiver, const std::string& method, size_t* extra_arity);

const char* builtin_name(ast::Builtin b);

// Names usable as call targets, for "did you mean" suggestions.
std::vector<std::string> builtin_and_host_names();

} // namespace ccl
