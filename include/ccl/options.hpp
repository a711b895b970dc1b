#pragma once
#include <cstdint>
#include <string>

namespace ccl {

enum class ShadowPolicy { Allow, Warn, Error };

struct CompileOptions {
    int opt_level = 0;                 // 0 = AST optimizer only; 1..3 = LLVM default pipeline
    std::string pass_pipeline;         // textual LLVM pipeline, overrides opt_level when set
    bool verify_ir = true;
    uint32_t memory_pages = 16;        // 64 KiB pages of linear memory
    uint32_t host_buffer_size = 256;   // out-buffer capacity for host functions returning strings
    ShadowPolicy shadow_policy = ShadowPolicy::Warn;
    bool trace = false;                // stage tracing on llvm::errs()
};

inline constexpr uint32_t kMaxMemoryPages = 256;
inline constexpr uint32_t kMinHostBuffer = 16;
inline constexpr uint32_t kMaxHostBuffer = 65536;

// Build options from CCL_* process environment variables; unset vars keep defaults.
CompileOptions detect_options();

// Clamps opt_level to 0..3, memory_pages to 1..kMaxMemoryPages and host_buffer_size
// to kMinHostBuffer..kMaxHostBuffer. compile() applies it to every options value.
CompileOptions normalize_options(CompileOptions o);

const char* shadow_policy_name(ShadowPolicy p);

} // namespace ccl
