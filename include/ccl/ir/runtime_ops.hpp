#pragma once

#include "ccl/ir/state.hpp"

namespace ccl::ir::runtime_ops {

// Defines the exported linear memory, the heap pointer and the internal helpers
// (bump allocator, string and array primitives). Fills S.rt.
void emit_runtime(State& S);

// Emits the static data segment and ccl.init_memory. Must run after every function body
// so that all string literals are interned.
void finalize_memory(State& S);

} // namespace ccl::ir::runtime_ops
