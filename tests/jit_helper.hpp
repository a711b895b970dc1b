// Loads compiled contract bitcode into an ORC JIT so tests can call `run`
// and inspect the module's linear memory.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <llvm/ExecutionEngine/Orc/LLJIT.h>

namespace ccl::test {

class JitModule {
public:
    // Throws std::runtime_error when the bitcode cannot be read or linked.
    static std::unique_ptr<JitModule> load(const std::vector<uint8_t>& bitcode);

    template<typename Fn>
    Fn entry() const { return reinterpret_cast<Fn>(run_); }

    uint8_t* memory() const { return memory_; }
    std::string read_string(uint32_t offset) const;
    int64_t read_cell(uint32_t offset) const;
    std::vector<int64_t> read_array(uint32_t offset) const;
    // Places a length-prefixed string at `offset` for passing to `run`.
    uint32_t write_string(uint32_t offset, const std::string& s);

    // First free heap offset after the data segment, from the contract metadata.
    uint32_t heap_base() const { return heap_base_; }
    void set_heap_base(uint32_t base) { heap_base_ = base; }

private:
    std::unique_ptr<llvm::orc::LLJIT> jit_;
    void* run_ = nullptr;
    uint8_t* memory_ = nullptr;
    uint32_t heap_base_ = 0;
};

// Memory of the module currently executing, used by host functions that write strings.
extern uint8_t* g_guest_memory;

// Compile and load in one step; throws with the formatted diagnostics on failure.
std::unique_ptr<JitModule> compile_and_load(const std::string& source, int opt_level = 0);

} // namespace ccl::test
