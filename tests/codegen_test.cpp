#include <gtest/gtest.h>
#include "ccl/ccl.hpp"
#include "ccl/codegen.hpp"

#include <llvm/Bitcode/BitcodeReader.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>

#include <algorithm>

using namespace ccl;

namespace {

struct Loaded {
    CompileResult result;
    std::unique_ptr<llvm::LLVMContext> ctx = std::make_unique<llvm::LLVMContext>();
    std::unique_ptr<llvm::Module> module;
};

std::unique_ptr<Loaded> compile_module(const std::string& src, CompileOptions opts = {}){
    auto l = std::make_unique<Loaded>();
    l->result = compile(src, opts);
    if(!l->result.success){
        for(auto& e : l->result.errors) ADD_FAILURE() << format_diagnostic(e);
        return l;
    }
    llvm::StringRef bytes(reinterpret_cast<const char*>(l->result.bytecode.data()), l->result.bytecode.size());
    auto buffer = llvm::MemoryBuffer::getMemBuffer(bytes, "contract", false);
    auto mod = llvm::parseBitcodeFile(buffer->getMemBufferRef(), *l->ctx);
    if(!mod){ ADD_FAILURE() << llvm::toString(mod.takeError()); return l; }
    l->module = std::move(*mod);
    return l;
}

std::vector<std::string> block_names(const llvm::Function& F){
    std::vector<std::string> out;
    for(auto& bb : F) out.push_back(bb.getName().str());
    return out;
}

bool has_block_prefix(const llvm::Function& F, const std::string& prefix){
    for(auto& bb : F) if(bb.getName().startswith(prefix)) return true;
    return false;
}

} // namespace

TEST(Codegen, ModuleIsTargetNeutral){
    auto l = compile_module("fn run() -> Integer { return 1; }");
    ASSERT_TRUE(l->module);
    EXPECT_TRUE(l->module->getTargetTriple().empty());
    EXPECT_TRUE(l->module->getDataLayoutStr().empty());
    EXPECT_EQ(l->module->getSourceFileName(), "contract");
    EXPECT_FALSE(llvm::verifyModule(*l->module, &llvm::errs()));
}

TEST(Codegen, LinearMemoryIsExported){
    CompileOptions opts;
    opts.memory_pages = 2;
    auto l = compile_module("fn run() {}", opts);
    ASSERT_TRUE(l->module);
    llvm::GlobalVariable* mem = l->module->getGlobalVariable(kMemoryName);
    ASSERT_NE(mem, nullptr);
    EXPECT_TRUE(mem->hasExternalLinkage());
    auto* ty = llvm::dyn_cast<llvm::ArrayType>(mem->getValueType());
    ASSERT_NE(ty, nullptr);
    EXPECT_EQ(ty->getNumElements(), 2u * kPageSize);
    EXPECT_TRUE(ty->getElementType()->isIntegerTy(8));
    EXPECT_EQ(l->result.metadata.memory.bytes, 2u * kPageSize);
}

TEST(Codegen, OnlyRunIsExported){
    auto l = compile_module(R"(
        fn helper(x: Integer) -> Integer { return x + 1; }
        fn run(flag: Bool) -> Bool { return flag && helper(1) == 2; }
    )");
    ASSERT_TRUE(l->module);
    llvm::Function* run = l->module->getFunction(kEntryName);
    ASSERT_NE(run, nullptr);
    EXPECT_TRUE(run->hasExternalLinkage());
    EXPECT_FALSE(run->isDeclaration());
    // Bool crosses the boundary as i32
    EXPECT_TRUE(run->getReturnType()->isIntegerTy(32));
    EXPECT_TRUE(run->getFunctionType()->getParamType(0)->isIntegerTy(32));

    llvm::Function* inner = l->module->getFunction("ccl.fn.run");
    ASSERT_NE(inner, nullptr);
    EXPECT_TRUE(inner->hasInternalLinkage());
    EXPECT_TRUE(inner->getReturnType()->isIntegerTy(1));

    for(auto& F : *l->module){
        if(&F == run || F.isDeclaration()) continue;
        EXPECT_TRUE(F.hasLocalLinkage()) << F.getName().str();
    }
    for(auto& G : l->module->globals()){
        if(G.getName() == kMemoryName) continue;
        EXPECT_TRUE(G.hasLocalLinkage()) << G.getName().str();
    }
}

TEST(Codegen, HostImportsAreSortedDeclarations){
    auto l = compile_module(R"(
        fn run(amount: Mana) -> Bool {
            let who = host_get_caller();
            if host_get_reputation(who) < 1 { return false; }
            return host_account_spend_mana(who, amount);
        }
    )");
    ASSERT_TRUE(l->module);
    std::vector<std::string> decls;
    for(auto& F : *l->module)
        if(F.isDeclaration() && !F.isIntrinsic()) decls.push_back(F.getName().str());
    EXPECT_EQ(decls, (std::vector<std::string>{"host_account_spend_mana", "host_get_caller", "host_get_reputation"}));

    // imports close the module
    EXPECT_EQ(l->module->getFunctionList().back().getName(), "host_get_reputation");

    llvm::Function* caller = l->module->getFunction("host_get_caller");
    ASSERT_EQ(caller->arg_size(), 1u); // out buffer
    EXPECT_TRUE(caller->getReturnType()->isIntegerTy(32));
    llvm::Function* spend = l->module->getFunction("host_account_spend_mana");
    ASSERT_EQ(spend->arg_size(), 2u);
    EXPECT_TRUE(spend->getFunctionType()->getParamType(0)->isIntegerTy(32));
    EXPECT_TRUE(spend->getFunctionType()->getParamType(1)->isIntegerTy(64));
    EXPECT_TRUE(spend->getReturnType()->isIntegerTy(32));

    ASSERT_EQ(l->result.metadata.imports.size(), 3u);
    EXPECT_EQ(l->result.metadata.imports[0].name, "host_account_spend_mana");
}

TEST(Codegen, InferredImportsUseTheirCallSignature){
    auto l = compile_module(R"(
        fn run(weight: Integer) -> Integer {
            host_record_vote("did:key:alice", weight);
            let label: String = host_lookup_name("did:key:alice");
            return label.len();
        }
    )");
    ASSERT_TRUE(l->module);
    llvm::Function* vote = l->module->getFunction("host_record_vote");
    ASSERT_NE(vote, nullptr);
    EXPECT_TRUE(vote->isDeclaration());
    EXPECT_TRUE(vote->getReturnType()->isVoidTy());
    ASSERT_EQ(vote->arg_size(), 2u);
    EXPECT_TRUE(vote->getFunctionType()->getParamType(1)->isIntegerTy(64));
    llvm::Function* name = l->module->getFunction("host_lookup_name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->arg_size(), 2u); // argument and out buffer
    EXPECT_FALSE(llvm::verifyModule(*l->module, &llvm::errs()));
}

TEST(Codegen, LibraryHelpersAreInternal){
    auto l = compile_module(R"(
        fn run(n: Integer) -> Integer {
            let s = "a,b";
            return pow(n, 2) + sqrt(n) + s.split(",").len() + s.to_upper().len();
        }
    )");
    ASSERT_TRUE(l->module);
    for(const char* name : {"ccl.pow", "ccl.isqrt", "ccl.str_split", "ccl.str_find", "ccl.str_slice", "ccl.str_upper"}){
        llvm::Function* F = l->module->getFunction(name);
        ASSERT_NE(F, nullptr) << name;
        EXPECT_TRUE(F->hasLocalLinkage()) << name;
    }
    EXPECT_EQ(l->module->getFunction("ccl.str_lower"), nullptr);
    EXPECT_FALSE(llvm::verifyModule(*l->module, &llvm::errs()));
}

TEST(Codegen, SlotsFollowTheLocalTable){
    auto l = compile_module(R"(
        fn run(a: Integer, b: Integer) -> Integer {
            let x = a + b;
            let mut y = x;
            for item in [1, 2] { y = y + item; }
            return y;
        }
    )");
    ASSERT_TRUE(l->module);
    llvm::Function* F = l->module->getFunction("ccl.fn.run");
    ASSERT_NE(F, nullptr);
    std::vector<std::string> allocas;
    for(auto& I : F->getEntryBlock())
        if(auto* a = llvm::dyn_cast<llvm::AllocaInst>(&I)) allocas.push_back(a->getName().str());
    ASSERT_GE(allocas.size(), 5u);
    EXPECT_EQ(allocas[0], "a.slot");
    EXPECT_EQ(allocas[1], "b.slot");
    EXPECT_EQ(allocas[2], "x.slot");
    EXPECT_EQ(allocas[3], "y.slot");
    EXPECT_EQ(allocas[4], "item.slot");
    // hidden temporaries come after the local table
    EXPECT_NE(std::find(allocas.begin() + 5, allocas.end(), "for.arr"), allocas.end());
    EXPECT_NE(std::find(allocas.begin() + 5, allocas.end(), "for.idx"), allocas.end());
}

TEST(Codegen, ControlFlowBlocks){
    auto l = compile_module(R"(
        fn run(n: Integer) -> Integer {
            let mut i = 0;
            while i < n {
                if i == 3 { break; } else if i == 4 { i = i + 2; } else { i = i + 1; }
            }
            let o: Option<Integer> = Some(i);
            return match o { Some(v) => v, None => 0 };
        }
    )");
    ASSERT_TRUE(l->module);
    llvm::Function* F = l->module->getFunction("ccl.fn.run");
    ASSERT_NE(F, nullptr);
    auto names = block_names(*F);
    EXPECT_EQ(names.front(), "entry");
    for(const char* stem : {"body", "while.cond", "while.body", "while.end", "if.then", "if.next", "if.else",
                            "if.end", "match.arm", "match.end"})
        EXPECT_TRUE(has_block_prefix(*F, stem)) << stem;
}

TEST(Codegen, DataSegmentDeduplicatesLiterals){
    auto l = compile_module(R"(
        fn run() -> String {
            let a = "same";
            let b = "same";
            return a.concat(b).concat("other");
        }
    )");
    ASSERT_TRUE(l->module);
    llvm::GlobalVariable* data = l->module->getGlobalVariable("ccl.data", true);
    ASSERT_NE(data, nullptr);
    auto* ty = llvm::cast<llvm::ArrayType>(data->getValueType());
    // "same" at offset 8 takes 8 bytes, "other" at offset 16 takes 9
    EXPECT_EQ(ty->getNumElements(), 17u);
}

TEST(Codegen, OptimizedModuleStillVerifies){
    CompileOptions opts;
    opts.opt_level = 2;
    auto l = compile_module(R"(
        fn run(n: Integer) -> Integer {
            let mut total = 0;
            for x in [1, 2, 3] { total = total + x * n; }
            return total;
        }
    )", opts);
    ASSERT_TRUE(l->module);
    EXPECT_FALSE(llvm::verifyModule(*l->module, &llvm::errs()));
    ASSERT_NE(l->module->getFunction(kEntryName), nullptr);
    EXPECT_NE(l->module->getGlobalVariable(kMemoryName), nullptr);
}

TEST(Codegen, TextualPassPipeline){
    CompileOptions opts;
    opts.pass_pipeline = "function(mem2reg,instcombine)";
    auto l = compile_module("fn run(a: Integer) -> Integer { let b = a * 2; return b + 1; }", opts);
    ASSERT_TRUE(l->module);
    llvm::Function* F = l->module->getFunction("ccl.fn.run");
    ASSERT_NE(F, nullptr);
    for(auto& I : F->getEntryBlock()) EXPECT_FALSE(llvm::isa<llvm::AllocaInst>(I));
}

TEST(Codegen, InvalidPipelineIsCodegenError){
    CompileOptions opts;
    opts.pass_pipeline = "no-such-pass";
    CompileResult r = compile("fn run() {}", opts);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.bytecode.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, DiagKind::CodegenError);
    EXPECT_EQ(r.errors[0].code, "E1900");
}

TEST(Codegen, BitcodeHelpers){
    llvm::LLVMContext ctx;
    llvm::Module m("empty", ctx);
    std::vector<uint8_t> bc = write_bitcode(m);
    ASSERT_GE(bc.size(), 4u);
    EXPECT_EQ(bc[0], 'B');
    EXPECT_EQ(bc[1], 'C');
    EXPECT_EQ(sha256_hex({}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex({'a', 'b', 'c'}), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
