#include "ccl/ir/runtime_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/codegen.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>

namespace ccl::ir {

uint32_t DataSegment::intern(const std::string& s){
    if(auto it = offsets.find(s); it != offsets.end()) return it->second;
    while(bytes.size() % 8) bytes.push_back(0);
    uint32_t off = end();
    uint32_t len = static_cast<uint32_t>(s.size());
    for(int i=0;i<4;++i) bytes.push_back(static_cast<uint8_t>((len >> (8*i)) & 0xff));
    bytes.insert(bytes.end(), s.begin(), s.end());
    offsets[s] = off;
    return off;
}

} // namespace ccl::ir

namespace ccl::ir::runtime_ops {
using namespace memory_ops;

namespace {

llvm::Function* make_fn(llvm::Module& M, const char* name, llvm::Type* ret, llvm::ArrayRef<llvm::Type*> params){
    auto* FT = llvm::FunctionType::get(ret, params, false);
    auto* F = llvm::Function::Create(FT, llvm::Function::InternalLinkage, name, M);
    F->addFnAttr(llvm::Attribute::NoUnwind);
    return F;
}

llvm::BasicBlock* block(llvm::Function* F, const char* name){
    return llvm::BasicBlock::Create(F->getContext(), name, F);
}

void emit_alloc(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.alloc", i32, {i32});
    S.rt.alloc = F;
    llvm::IRBuilder<> B(block(F, "entry"));
    llvm::Value* size = F->getArg(0);
    size->setName("size");
    auto* i64 = B.getInt64Ty();
    llvm::Value* top = B.CreateZExt(B.CreateLoad(i32, S.rt.heap_top), i64);
    llvm::Value* start = B.CreateAnd(B.CreateAdd(top, B.getInt64(7)), B.getInt64(~uint64_t(7)));
    llvm::Value* end = B.CreateAdd(start, B.CreateZExt(size, i64));
    trap_if(B, F, B.CreateICmpUGT(end, B.getInt64(S.memory_bytes())), "oom");
    B.CreateStore(B.CreateTrunc(end, i32), S.rt.heap_top);
    llvm::Value* start32 = B.CreateTrunc(start, i32, "region");
    B.CreateMemSet(address(B, S.rt.memory, start32, B.getInt8Ty()), B.getInt8(0), size, llvm::MaybeAlign(1));
    B.CreateRet(start32);
}

void emit_str_eq(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.str_eq", llvm::Type::getInt1Ty(S.llctx), {i32, i32});
    S.rt.str_eq = F;
    llvm::Value* a = F->getArg(0); a->setName("a");
    llvm::Value* b = F->getArg(1); b->setName("b");
    auto* entry = block(F, "entry");
    auto* lenBB = block(F, "len");
    auto* loopBB = block(F, "loop");
    auto* bodyBB = block(F, "body");
    auto* yesBB = block(F, "equal");
    auto* noBB = block(F, "differ");
    llvm::IRBuilder<> B(entry);
    B.CreateCondBr(B.CreateICmpEQ(a, b), yesBB, lenBB);
    B.SetInsertPoint(lenBB);
    llvm::Value* la = load_i32(B, S.rt.memory, a);
    llvm::Value* lb = load_i32(B, S.rt.memory, b);
    B.CreateCondBr(B.CreateICmpEQ(la, lb), loopBB, noBB);
    B.SetInsertPoint(loopBB);
    auto* i = B.CreatePHI(i32, 2, "i");
    i->addIncoming(B.getInt32(0), lenBB);
    B.CreateCondBr(B.CreateICmpUGE(i, la), yesBB, bodyBB);
    B.SetInsertPoint(bodyBB);
    llvm::Value* ca = load_i8(B, S.rt.memory, B.CreateAdd(offset(B, a, 4), i));
    llvm::Value* cb = load_i8(B, S.rt.memory, B.CreateAdd(offset(B, b, 4), i));
    llvm::Value* inext = B.CreateAdd(i, B.getInt32(1));
    B.CreateCondBr(B.CreateICmpEQ(ca, cb), loopBB, noBB);
    i->addIncoming(inext, bodyBB);
    B.SetInsertPoint(yesBB);
    B.CreateRet(B.getTrue());
    B.SetInsertPoint(noBB);
    B.CreateRet(B.getFalse());
}

void emit_str_concat(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.str_concat", i32, {i32, i32});
    S.rt.str_concat = F;
    llvm::Value* a = F->getArg(0); a->setName("a");
    llvm::Value* b = F->getArg(1); b->setName("b");
    llvm::IRBuilder<> B(block(F, "entry"));
    auto* i8 = B.getInt8Ty();
    llvm::Value* la = load_i32(B, S.rt.memory, a);
    llvm::Value* lb = load_i32(B, S.rt.memory, b);
    llvm::Value* total = B.CreateAdd(la, lb);
    llvm::Value* r = B.CreateCall(S.rt.alloc, {B.CreateAdd(total, B.getInt32(4))});
    store_i32(B, S.rt.memory, r, total);
    B.CreateMemCpy(address(B, S.rt.memory, offset(B, r, 4), i8), llvm::MaybeAlign(1),
                   address(B, S.rt.memory, offset(B, a, 4), i8), llvm::MaybeAlign(1), la);
    B.CreateMemCpy(address(B, S.rt.memory, B.CreateAdd(offset(B, r, 4), la), i8), llvm::MaybeAlign(1),
                   address(B, S.rt.memory, offset(B, b, 4), i8), llvm::MaybeAlign(1), lb);
    B.CreateRet(r);
}

void emit_array_new(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.array_new", i32, {i32, i32});
    S.rt.array_new = F;
    llvm::Value* len = F->getArg(0); len->setName("len");
    llvm::Value* cap = F->getArg(1); cap->setName("cap");
    llvm::IRBuilder<> B(block(F, "entry"));
    llvm::Value* cellBytes = B.CreateMul(cap, B.getInt32(8));
    llvm::Value* r = B.CreateCall(S.rt.alloc, {B.CreateAdd(cellBytes, B.getInt32(kArrayHeader))});
    store_i32(B, S.rt.memory, r, len);
    store_i32(B, S.rt.memory, offset(B, r, 4), cap);
    store_i32(B, S.rt.memory, offset(B, r, kArrayCellsField), offset(B, r, kArrayHeader));
    B.CreateRet(r);
}

void emit_array_slot(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.array_slot", i32, {i32, i64});
    S.rt.array_slot = F;
    llvm::Value* arr = F->getArg(0); arr->setName("arr");
    llvm::Value* idx = F->getArg(1); idx->setName("index");
    llvm::IRBuilder<> B(block(F, "entry"));
    llvm::Value* len = B.CreateZExt(load_i32(B, S.rt.memory, arr), i64);
    // a negative index compares as a huge unsigned value
    trap_if(B, F, B.CreateICmpUGE(idx, len), "bounds");
    B.CreateRet(array_cell(B, S.rt.memory, arr, B.CreateTrunc(idx, i32)));
}

// Appends in place and returns the new length. Every binding holding the header
// observes the push, whether or not the cells had to move.
void emit_array_push(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.array_push", i32, {i32, i64});
    S.rt.array_push = F;
    llvm::Value* arr = F->getArg(0); arr->setName("arr");
    llvm::Value* cell = F->getArg(1); cell->setName("cell");
    auto* entry = block(F, "entry");
    auto* growBB = block(F, "grow");
    auto* storeBB = block(F, "store");
    llvm::IRBuilder<> B(entry);
    llvm::Value* len = load_i32(B, S.rt.memory, arr);
    llvm::Value* cap = load_i32(B, S.rt.memory, offset(B, arr, 4));
    B.CreateCondBr(B.CreateICmpUGE(len, cap), growBB, storeBB);
    B.SetInsertPoint(growBB);
    llvm::Value* doubled = B.CreateSelect(B.CreateICmpEQ(cap, B.getInt32(0)), B.getInt32(4), B.CreateMul(cap, B.getInt32(2)));
    llvm::Value* cells = B.CreateCall(S.rt.alloc, {B.CreateMul(doubled, B.getInt32(8))}, "cells");
    auto* i8 = B.getInt8Ty();
    llvm::Value* old = load_i32(B, S.rt.memory, offset(B, arr, kArrayCellsField));
    B.CreateMemCpy(address(B, S.rt.memory, cells, i8), llvm::MaybeAlign(1),
                   address(B, S.rt.memory, old, i8), llvm::MaybeAlign(1),
                   B.CreateMul(len, B.getInt32(8)));
    store_i32(B, S.rt.memory, offset(B, arr, 4), doubled);
    store_i32(B, S.rt.memory, offset(B, arr, kArrayCellsField), cells);
    B.CreateBr(storeBB);
    B.SetInsertPoint(storeBB);
    store_i64(B, S.rt.memory, array_cell(B, S.rt.memory, arr, len), cell);
    llvm::Value* grown = B.CreateAdd(len, B.getInt32(1));
    store_i32(B, S.rt.memory, arr, grown);
    B.CreateRet(grown);
}

void emit_array_pop(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    auto* F = make_fn(S.module, "ccl.array_pop", i64, {i32});
    S.rt.array_pop = F;
    llvm::Value* arr = F->getArg(0); arr->setName("arr");
    llvm::IRBuilder<> B(block(F, "entry"));
    llvm::Value* len = load_i32(B, S.rt.memory, arr);
    trap_if(B, F, B.CreateICmpEQ(len, B.getInt32(0)), "empty");
    llvm::Value* last = B.CreateSub(len, B.getInt32(1));
    store_i32(B, S.rt.memory, arr, last);
    B.CreateRet(load_i64(B, S.rt.memory, array_cell(B, S.rt.memory, arr, last)));
}

// Linear search; string elements compare by content.
llvm::Function* emit_contains(State& S, const char* name, bool strings){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* needleTy = strings ? i32 : llvm::Type::getInt64Ty(S.llctx);
    auto* F = make_fn(S.module, name, llvm::Type::getInt1Ty(S.llctx), {i32, needleTy});
    llvm::Value* arr = F->getArg(0); arr->setName("arr");
    llvm::Value* needle = F->getArg(1); needle->setName("needle");
    auto* entry = block(F, "entry");
    auto* loopBB = block(F, "loop");
    auto* bodyBB = block(F, "body");
    auto* nextBB = block(F, "next");
    auto* yesBB = block(F, "found");
    auto* noBB = block(F, "missing");
    llvm::IRBuilder<> B(entry);
    llvm::Value* len = load_i32(B, S.rt.memory, arr);
    B.CreateBr(loopBB);
    B.SetInsertPoint(loopBB);
    auto* i = B.CreatePHI(i32, 2, "i");
    i->addIncoming(B.getInt32(0), entry);
    B.CreateCondBr(B.CreateICmpUGE(i, len), noBB, bodyBB);
    B.SetInsertPoint(bodyBB);
    llvm::Value* cell = load_i64(B, S.rt.memory, array_cell(B, S.rt.memory, arr, i));
    llvm::Value* hit = strings ? static_cast<llvm::Value*>(B.CreateCall(S.rt.str_eq, {B.CreateTrunc(cell, i32), needle}))
                               : B.CreateICmpEQ(cell, needle);
    B.CreateCondBr(hit, yesBB, nextBB);
    B.SetInsertPoint(nextBB);
    llvm::Value* inext = B.CreateAdd(i, B.getInt32(1));
    B.CreateBr(loopBB);
    i->addIncoming(inext, nextBB);
    B.SetInsertPoint(yesBB);
    B.CreateRet(B.getTrue());
    B.SetInsertPoint(noBB);
    B.CreateRet(B.getFalse());
    return F;
}

} // namespace

void emit_runtime(State& S){
    auto& M = S.module;
    auto* memTy = llvm::ArrayType::get(llvm::Type::getInt8Ty(S.llctx), S.memory_bytes());
    S.rt.memory = new llvm::GlobalVariable(M, memTy, false, llvm::GlobalValue::ExternalLinkage,
                                           llvm::ConstantAggregateZero::get(memTy), kMemoryName);
    S.rt.memory->setAlignment(llvm::Align(16));
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    S.rt.heap_top = new llvm::GlobalVariable(M, i32, false, llvm::GlobalValue::InternalLinkage,
                                             llvm::ConstantInt::get(i32, 0), "ccl.heap_top");
    emit_alloc(S);
    emit_str_eq(S);
    emit_str_concat(S);
    emit_array_new(S);
    emit_array_slot(S);
    emit_array_push(S);
    emit_array_pop(S);
    S.rt.contains_cell = emit_contains(S, "ccl.array_contains", false);
    S.rt.contains_str = emit_contains(S, "ccl.array_contains_str", true);
}

void finalize_memory(State& S){
    const uint64_t heapStart = (static_cast<uint64_t>(S.data.end()) + 7) & ~uint64_t(7);
    if(heapStart > S.memory_bytes())
        throw codegen_error("static data (" + std::to_string(S.data.bytes.size()) + " bytes) does not fit in linear memory");
    llvm::GlobalVariable* dataGV = nullptr;
    if(!S.data.bytes.empty()){
        auto* init = llvm::ConstantDataArray::get(S.llctx, llvm::ArrayRef<uint8_t>(S.data.bytes));
        dataGV = new llvm::GlobalVariable(S.module, init->getType(), true, llvm::GlobalValue::InternalLinkage, init, "ccl.data");
    }
    S.heap_base = static_cast<uint32_t>(heapStart);
    auto* F = make_fn(S.module, "ccl.init_memory", llvm::Type::getVoidTy(S.llctx), {});
    S.rt.init_memory = F;
    llvm::IRBuilder<> B(block(F, "entry"));
    B.CreateStore(B.getInt32(static_cast<uint32_t>(heapStart)), S.rt.heap_top);
    if(dataGV){
        llvm::Value* src = B.CreateConstInBoundsGEP2_32(dataGV->getValueType(), dataGV, 0, 0);
        B.CreateMemCpy(address(B, S.rt.memory, B.getInt32(DataSegment::kBase), B.getInt8Ty()), llvm::MaybeAlign(1),
                       src, llvm::MaybeAlign(1), B.getInt64(S.data.bytes.size()));
    }
    B.CreateRetVoid();
}

} // namespace ccl::ir::runtime_ops
