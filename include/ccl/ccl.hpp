// Contract compiler entry point: source text in, LLVM bitcode and metadata out.
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>
#include "ccl/diagnostics.hpp"
#include "ccl/metadata.hpp"
#include "ccl/options.hpp"

namespace ccl {

struct CompileResult {
    bool success = false;
    std::vector<uint8_t> bytecode; // empty unless success
    ContractMetadata metadata;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
};

// Parse, build, analyze, optimize and lower one contract. Never throws for bad input
// and never reads the environment; use detect_options() for that.
CompileResult compile(std::string_view source, const CompileOptions& opts = {});

} // namespace ccl
