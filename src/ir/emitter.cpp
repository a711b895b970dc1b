#include "ccl/codegen.hpp"
#include "ccl/ir/control_ops.hpp"
#include "ccl/ir/expr_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/ir/pass_pipeline.hpp"
#include "ccl/ir/runtime_ops.hpp"
#include "ccl/ir/state.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/SHA256.h>
#include <llvm/Support/raw_ostream.h>

namespace ccl::ir {
using namespace ccl::ast;

std::string next_label(State& S, const std::string& stem){
    return stem + "." + std::to_string(S.cfCounter++);
}

llvm::AllocaInst* hidden_slot(State& S, llvm::Type* ty, const std::string& name){
    llvm::IRBuilder<> eb(S.allocaPoint);
    return eb.CreateAlloca(ty, nullptr, name);
}

static void emit_stmt(State& S, const Stmt& s){
    auto& B = S.builder;
    if(auto* let = std::get_if<LetStmt>(&s.data)){
        llvm::Value* v = emit_expr(S, *let->init);
        B.CreateStore(v, S.slots.at(static_cast<size_t>(let->slot)));
    } else if(auto* as = std::get_if<AssignStmt>(&s.data)){
        expr_ops::emit_assign(S, *as);
    } else if(auto* rs = std::get_if<ReturnStmt>(&s.data)){
        if(rs->value) B.CreateRet(emit_expr(S, *rs->value));
        else B.CreateRetVoid();
    } else if(auto* es = std::get_if<ExprStmt>(&s.data)){
        emit_expr(S, *es->expr);
    } else if(auto* is = std::get_if<IfStmt>(&s.data)){
        control_ops::emit_if(S, *is);
    } else if(auto* ws = std::get_if<WhileStmt>(&s.data)){
        control_ops::emit_while(S, *ws);
    } else if(auto* fs = std::get_if<ForStmt>(&s.data)){
        control_ops::emit_for(S, *fs);
    } else if(std::holds_alternative<BreakStmt>(s.data)){
        control_ops::emit_break(S);
    } else if(std::holds_alternative<ContinueStmt>(s.data)){
        control_ops::emit_continue(S);
    } else if(auto* bs = std::get_if<BlockStmt>(&s.data)){
        emit_block(S, bs->block);
    } else {
        throw codegen_error("unsupported statement");
    }
}

void emit_stmts(State& S, const std::vector<StmtPtr>& stmts){
    for(auto& s : stmts){
        // statements after return/break/continue go to a block with no predecessors
        if(S.builder.GetInsertBlock()->getTerminator())
            S.builder.SetInsertPoint(llvm::BasicBlock::Create(S.llctx, next_label(S, "dead"), S.F));
        emit_stmt(S, *s);
    }
}

void emit_block(State& S, const Block& b){
    emit_stmts(S, b.stmts);
}

static void declare_functions(State& S){
    for(auto& fn : S.program.functions){
        std::vector<llvm::Type*> params;
        for(auto& p : fn.params) params.push_back(memory_ops::value_type(S, p.resolved));
        auto* FT = llvm::FunctionType::get(memory_ops::value_type(S, fn.ret_type), params, false);
        auto* F = llvm::Function::Create(FT, llvm::Function::InternalLinkage, "ccl.fn." + fn.name, S.module);
        for(size_t i = 0; i < fn.params.size(); ++i) F->getArg(static_cast<unsigned>(i))->setName(fn.params[i].name);
        S.functions[fn.name] = F;
    }
}

static void emit_function(State& S, const FunctionDecl& fn){
    auto& B = S.builder;
    S.F = S.functions.at(fn.name);
    S.fn = &fn;
    S.slots.clear();
    S.loopEndStack.clear();
    S.loopContinueStack.clear();
    S.cfCounter = 0;

    auto* entry = llvm::BasicBlock::Create(S.llctx, "entry", S.F);
    B.SetInsertPoint(entry);
    for(auto& local : fn.locals)
        S.slots.push_back(B.CreateAlloca(memory_ops::value_type(S, local.type), nullptr, local.name + ".slot"));
    for(size_t i = 0; i < fn.params.size(); ++i)
        B.CreateStore(S.F->getArg(static_cast<unsigned>(i)), S.slots.at(i));
    auto* body = llvm::BasicBlock::Create(S.llctx, "body", S.F);
    S.allocaPoint = B.CreateBr(body);
    B.SetInsertPoint(body);

    emit_block(S, fn.body);

    if(!B.GetInsertBlock()->getTerminator()){
        if(S.F->getReturnType()->isVoidTy()) B.CreateRetVoid();
        else B.CreateUnreachable(); // analysis proved every path returns
    }
    S.F = nullptr;
    S.fn = nullptr;
    S.allocaPoint = nullptr;
}

// A String or Did argument is written by the caller at or above the heap base. Its
// region must fit in memory, and the heap resumes past it so later allocations keep it.
static void reserve_argument(State& S, llvm::IRBuilder<>& B, llvm::Function* W, llvm::Value* arg){
    auto* i64 = B.getInt64Ty();
    llvm::Value* start = B.CreateZExt(arg, i64);
    llvm::Value* limit = B.getInt64(S.memory_bytes());
    memory_ops::trap_if(B, W, B.CreateICmpULT(start, B.getInt64(S.heap_base)), "arg.range");
    memory_ops::trap_if(B, W, B.CreateICmpUGT(B.CreateAdd(start, B.getInt64(4)), limit), "arg.range");
    llvm::Value* len = B.CreateZExt(memory_ops::load_i32(B, S.rt.memory, arg), i64);
    llvm::Value* end = B.CreateAdd(B.CreateAdd(start, B.getInt64(4)), len);
    memory_ops::trap_if(B, W, B.CreateICmpUGT(end, limit), "arg.range");
    llvm::Value* aligned = B.CreateTrunc(B.CreateAnd(B.CreateAdd(end, B.getInt64(7)), B.getInt64(~uint64_t(7))), B.getInt32Ty());
    llvm::Value* top = B.CreateLoad(B.getInt32Ty(), S.rt.heap_top);
    B.CreateStore(B.CreateSelect(B.CreateICmpUGT(aligned, top), aligned, top), S.rt.heap_top);
}

// `run` with boundary types: resets memory, reserves argument strings, converts Bool to and from i32.
static void emit_entry(State& S){
    const FunctionDecl* run = S.program.find_function(kEntryName);
    if(!run) throw codegen_error("missing entry point 'run'");
    llvm::Function* inner = S.functions.at(run->name);
    std::vector<llvm::Type*> params;
    for(auto& p : run->params) params.push_back(memory_ops::boundary_type(S, p.resolved));
    auto* FT = llvm::FunctionType::get(memory_ops::boundary_type(S, run->ret_type), params, false);
    auto* W = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, kEntryName, S.module);

    llvm::IRBuilder<> B(llvm::BasicBlock::Create(S.llctx, "entry", W));
    B.CreateCall(S.rt.init_memory);
    std::vector<llvm::Value*> args;
    for(size_t i = 0; i < run->params.size(); ++i){
        llvm::Value* a = W->getArg(static_cast<unsigned>(i));
        a->setName(run->params[i].name);
        if(S.tctx.is_bool(run->params[i].resolved)) a = B.CreateICmpNE(a, B.getInt32(0));
        if(S.tctx.is_stringlike(run->params[i].resolved)) reserve_argument(S, B, W, a);
        args.push_back(a);
    }
    llvm::Value* r = B.CreateCall(inner, args);
    if(FT->getReturnType()->isVoidTy()){ B.CreateRetVoid(); return; }
    if(S.tctx.is_bool(run->ret_type)) r = B.CreateZExt(r, B.getInt32Ty());
    B.CreateRet(r);
}

} // namespace ccl::ir

namespace ccl {

CodeGenerator::CodeGenerator(TypeContext& tctx, const CompileOptions& opts): tctx_(tctx), opts_(opts){}
CodeGenerator::~CodeGenerator() = default;

std::unique_ptr<llvm::Module> CodeGenerator::generate(const ast::Program& program, llvm::LLVMContext& llctx){
    imports_.clear();
    heap_base_ = 0;
    auto M = std::make_unique<llvm::Module>(kModuleId, llctx);
    M->setSourceFileName(kSourceName);
    llvm::IRBuilder<> builder(llctx);
    ir::State S{builder, llctx, *M, tctx_, program, opts_};

    ir::runtime_ops::emit_runtime(S);
    ir::declare_functions(S);
    for(auto& fn : program.functions) ir::emit_function(S, fn);
    ir::runtime_ops::finalize_memory(S);
    ir::emit_entry(S);

    // imports sit at the end of the module, sorted by name
    for(auto& [name, F] : S.imports){
        F->removeFromParent();
        M->getFunctionList().push_back(F);
        imports_.push_back(S.import_sigs.at(name));
    }
    heap_base_ = S.heap_base;

    std::string msg;
    llvm::raw_string_ostream os(msg);
    if(llvm::verifyModule(*M, &os)) throw codegen_error("IR verification failed: " + os.str());

    ir::pass_pipeline::run_pass_pipeline(*M, opts_);
    return M;
}

std::vector<uint8_t> write_bitcode(const llvm::Module& module){
    llvm::SmallVector<char, 0> buffer;
    llvm::raw_svector_ostream os(buffer);
    llvm::WriteBitcodeToFile(module, os);
    return std::vector<uint8_t>(buffer.begin(), buffer.end());
}

std::string sha256_hex(const std::vector<uint8_t>& bytes){
    static const char* digits = "0123456789abcdef";
    auto digest = llvm::SHA256::hash(llvm::ArrayRef<uint8_t>(bytes));
    std::string out;
    out.reserve(digest.size() * 2);
    for(uint8_t b : digest){ out.push_back(digits[b >> 4]); out.push_back(digits[b & 0xf]); }
    return out;
}

} // namespace ccl
