#pragma once

#include <llvm/IR/Module.h>

#include "ccl/options.hpp"

namespace ccl::ir::pass_pipeline {

// Runs the optimization pipeline selected by the options:
//   pass_pipeline   textual pipeline, overrides opt_level when non-empty
//   opt_level       1/2/3 selects the default per-module pipeline, 0 runs nothing
//   verify_ir       re-verifies the module afterwards
// Throws codegen_error for an unparsable pipeline or a verifier failure.
void run_pass_pipeline(llvm::Module& M, const CompileOptions& opts);

} // namespace ccl::ir::pass_pipeline
