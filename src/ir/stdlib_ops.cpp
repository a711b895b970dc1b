#include "ccl/ir/stdlib_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/codegen.hpp"

#include <cstdint>
#include <limits>

#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>

namespace ccl::ir::stdlib_ops {
using namespace ccl::ast;
using namespace memory_ops;

namespace {

constexpr int64_t kSecondsPerDay = 86400;
constexpr int64_t kSecondsPerHour = 3600;
constexpr int64_t kBasisPoints = 10000;

// Existing helper by name, or a new empty definition that the caller fills in.
llvm::Function* helper(State& S, const char* name, llvm::Type* ret, llvm::ArrayRef<llvm::Type*> params, bool& fresh){
    if(llvm::Function* F = S.module.getFunction(name)){
        fresh = false;
        return F;
    }
    auto* FT = llvm::FunctionType::get(ret, params, false);
    auto* F = llvm::Function::Create(FT, llvm::Function::InternalLinkage, name, S.module);
    F->addFnAttr(llvm::Attribute::NoUnwind);
    fresh = true;
    return F;
}

llvm::BasicBlock* block(llvm::Function* F, const char* name){
    return llvm::BasicBlock::Create(F->getContext(), name, F);
}

// s + 4 + i: byte i of a string region
llvm::Value* char_offset(llvm::IRBuilder<>& B, llvm::Value* s, llvm::Value* i){
    return B.CreateAdd(offset(B, s, 4), i);
}

void copy_bytes(State& S, llvm::IRBuilder<>& B, llvm::Value* dst, llvm::Value* src, llvm::Value* n){
    auto* i8 = B.getInt8Ty();
    B.CreateMemCpy(address(B, S.rt.memory, dst, i8), llvm::MaybeAlign(1),
                   address(B, S.rt.memory, src, i8), llvm::MaybeAlign(1), n);
}

// i64 (i64 base, i64 exp): square-and-multiply with wrapping products, traps on a negative exponent.
llvm::Function* pow_fn(State& S){
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.pow", i64, {i64, i64}, fresh);
    if(!fresh) return F;
    llvm::Value* base = F->getArg(0); base->setName("base");
    llvm::Value* exp = F->getArg(1); exp->setName("exp");
    llvm::IRBuilder<> B(block(F, "entry"));
    trap_if(B, F, B.CreateICmpSLT(exp, B.getInt64(0)), "pow.exponent");
    llvm::BasicBlock* start = B.GetInsertBlock();
    auto* loopBB = block(F, "loop");
    auto* stepBB = block(F, "step");
    auto* doneBB = block(F, "done");
    B.CreateBr(loopBB);
    B.SetInsertPoint(loopBB);
    auto* r = B.CreatePHI(i64, 2, "r");
    auto* b = B.CreatePHI(i64, 2, "b");
    auto* e = B.CreatePHI(i64, 2, "e");
    r->addIncoming(B.getInt64(1), start);
    b->addIncoming(base, start);
    e->addIncoming(exp, start);
    B.CreateCondBr(B.CreateICmpEQ(e, B.getInt64(0)), doneBB, stepBB);
    B.SetInsertPoint(stepBB);
    llvm::Value* odd = B.CreateICmpNE(B.CreateAnd(e, B.getInt64(1)), B.getInt64(0));
    r->addIncoming(B.CreateSelect(odd, B.CreateMul(r, b), r), stepBB);
    b->addIncoming(B.CreateMul(b, b), stepBB);
    e->addIncoming(B.CreateLShr(e, B.getInt64(1)), stepBB);
    B.CreateBr(loopBB);
    B.SetInsertPoint(doneBB);
    B.CreateRet(r);
    return F;
}

// i64 (i64 n): floor of the square root by Newton iteration, traps on a negative input.
llvm::Function* isqrt_fn(State& S){
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.isqrt", i64, {i64}, fresh);
    if(!fresh) return F;
    llvm::Value* n = F->getArg(0); n->setName("n");
    llvm::IRBuilder<> B(block(F, "entry"));
    trap_if(B, F, B.CreateICmpSLT(n, B.getInt64(0)), "sqrt.negative");
    auto* smallBB = block(F, "small");
    auto* initBB = block(F, "init");
    auto* loopBB = block(F, "loop");
    auto* stepBB = block(F, "step");
    auto* doneBB = block(F, "done");
    B.CreateCondBr(B.CreateICmpULT(n, B.getInt64(2)), smallBB, initBB);
    B.SetInsertPoint(smallBB);
    B.CreateRet(n);
    B.SetInsertPoint(initBB);
    // unsigned arithmetic: n + 1 and x + n/x stay below 2^64
    llvm::Value* y0 = B.CreateLShr(B.CreateAdd(n, B.getInt64(1)), B.getInt64(1));
    B.CreateBr(loopBB);
    B.SetInsertPoint(loopBB);
    auto* x = B.CreatePHI(i64, 2, "x");
    auto* y = B.CreatePHI(i64, 2, "y");
    x->addIncoming(n, initBB);
    y->addIncoming(y0, initBB);
    B.CreateCondBr(B.CreateICmpULT(y, x), stepBB, doneBB);
    B.SetInsertPoint(stepBB);
    llvm::Value* next = B.CreateLShr(B.CreateAdd(y, B.CreateUDiv(n, y)), B.getInt64(1));
    x->addIncoming(y, stepBB);
    y->addIncoming(next, stepBB);
    B.CreateBr(loopBB);
    B.SetInsertPoint(doneBB);
    B.CreateRet(x);
    return F;
}

// i64 (i32 arr): wrapping sum of the cells.
llvm::Function* sum_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.array_sum", i64, {i32}, fresh);
    if(!fresh) return F;
    llvm::Value* arr = F->getArg(0); arr->setName("arr");
    auto* entry = block(F, "entry");
    auto* loopBB = block(F, "loop");
    auto* bodyBB = block(F, "body");
    auto* doneBB = block(F, "done");
    llvm::IRBuilder<> B(entry);
    llvm::Value* len = load_i32(B, S.rt.memory, arr);
    B.CreateBr(loopBB);
    B.SetInsertPoint(loopBB);
    auto* i = B.CreatePHI(i32, 2, "i");
    auto* acc = B.CreatePHI(i64, 2, "acc");
    i->addIncoming(B.getInt32(0), entry);
    acc->addIncoming(B.getInt64(0), entry);
    B.CreateCondBr(B.CreateICmpUGE(i, len), doneBB, bodyBB);
    B.SetInsertPoint(bodyBB);
    llvm::Value* cell = load_i64(B, S.rt.memory, array_cell(B, S.rt.memory, arr, i));
    i->addIncoming(B.CreateAdd(i, B.getInt32(1)), bodyBB);
    acc->addIncoming(B.CreateAdd(acc, cell), bodyBB);
    B.CreateBr(loopBB);
    B.SetInsertPoint(doneBB);
    B.CreateRet(acc);
    return F;
}

// i32 (i32 hay, i32 needle, i32 from): first byte index >= from where needle occurs, or -1.
// An empty needle is found at `from`.
llvm::Function* find_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_find", i32, {i32, i32, i32}, fresh);
    if(!fresh) return F;
    llvm::Value* hay = F->getArg(0); hay->setName("hay");
    llvm::Value* needle = F->getArg(1); needle->setName("needle");
    llvm::Value* from = F->getArg(2); from->setName("from");
    auto* entry = block(F, "entry");
    auto* startBB = block(F, "start");
    auto* outerBB = block(F, "outer");
    auto* innerBB = block(F, "inner");
    auto* cmpBB = block(F, "cmp");
    auto* nextBB = block(F, "next");
    auto* foundBB = block(F, "found");
    auto* missBB = block(F, "missing");
    llvm::IRBuilder<> B(entry);
    llvm::Value* hl = load_i32(B, S.rt.memory, hay);
    llvm::Value* nl = load_i32(B, S.rt.memory, needle);
    B.CreateCondBr(B.CreateICmpUGT(nl, hl), missBB, startBB);
    B.SetInsertPoint(startBB);
    llvm::Value* last = B.CreateSub(hl, nl, "last");
    B.CreateBr(outerBB);

    B.SetInsertPoint(outerBB);
    auto* i = B.CreatePHI(i32, 2, "i");
    i->addIncoming(from, startBB);
    B.CreateCondBr(B.CreateICmpUGT(i, last), missBB, innerBB);

    B.SetInsertPoint(innerBB);
    auto* j = B.CreatePHI(i32, 2, "j");
    j->addIncoming(B.getInt32(0), outerBB);
    B.CreateCondBr(B.CreateICmpEQ(j, nl), foundBB, cmpBB);

    B.SetInsertPoint(cmpBB);
    llvm::Value* a = load_i8(B, S.rt.memory, char_offset(B, hay, B.CreateAdd(i, j)));
    llvm::Value* b = load_i8(B, S.rt.memory, char_offset(B, needle, j));
    j->addIncoming(B.CreateAdd(j, B.getInt32(1)), cmpBB);
    B.CreateCondBr(B.CreateICmpEQ(a, b), innerBB, nextBB);

    B.SetInsertPoint(nextBB);
    i->addIncoming(B.CreateAdd(i, B.getInt32(1)), nextBB);
    B.CreateBr(outerBB);

    B.SetInsertPoint(foundBB);
    B.CreateRet(i);
    B.SetInsertPoint(missBB);
    B.CreateRet(B.getInt32(-1));
    return F;
}

// i32 (i32 s, i32 start, i32 len): copy of bytes [start, start+len); callers check the range.
llvm::Function* slice_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_slice", i32, {i32, i32, i32}, fresh);
    if(!fresh) return F;
    llvm::Value* s = F->getArg(0); s->setName("s");
    llvm::Value* start = F->getArg(1); start->setName("start");
    llvm::Value* len = F->getArg(2); len->setName("len");
    llvm::IRBuilder<> B(block(F, "entry"));
    llvm::Value* r = B.CreateCall(S.rt.alloc, {B.CreateAdd(len, B.getInt32(4))});
    store_i32(B, S.rt.memory, r, len);
    copy_bytes(S, B, offset(B, r, 4), char_offset(B, s, start), len);
    B.CreateRet(r);
    return F;
}

// i32 (i32 s): copy with ASCII letters in [lo, hi] shifted by delta.
llvm::Function* case_fn(State& S, const char* name, char lo, char hi, int delta){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, name, i32, {i32}, fresh);
    if(!fresh) return F;
    llvm::Value* s = F->getArg(0); s->setName("s");
    auto* entry = block(F, "entry");
    auto* loopBB = block(F, "loop");
    auto* bodyBB = block(F, "body");
    auto* doneBB = block(F, "done");
    llvm::IRBuilder<> B(entry);
    llvm::Value* len = load_i32(B, S.rt.memory, s);
    llvm::Value* r = B.CreateCall(S.rt.alloc, {B.CreateAdd(len, B.getInt32(4))});
    store_i32(B, S.rt.memory, r, len);
    B.CreateBr(loopBB);
    B.SetInsertPoint(loopBB);
    auto* i = B.CreatePHI(i32, 2, "i");
    i->addIncoming(B.getInt32(0), entry);
    B.CreateCondBr(B.CreateICmpUGE(i, len), doneBB, bodyBB);
    B.SetInsertPoint(bodyBB);
    llvm::Value* c = load_i8(B, S.rt.memory, char_offset(B, s, i));
    llvm::Value* in = B.CreateAnd(B.CreateICmpUGE(c, B.getInt8(static_cast<uint8_t>(lo))),
                                  B.CreateICmpULE(c, B.getInt8(static_cast<uint8_t>(hi))));
    llvm::Value* mapped = B.CreateSelect(in, B.CreateAdd(c, B.getInt8(static_cast<uint8_t>(delta))), c);
    B.CreateStore(mapped, address(B, S.rt.memory, char_offset(B, r, i), B.getInt8Ty()));
    i->addIncoming(B.CreateAdd(i, B.getInt32(1)), bodyBB);
    B.CreateBr(loopBB);
    B.SetInsertPoint(doneBB);
    B.CreateRet(r);
    return F;
}

// space, \t, \n, \v, \f, \r
llvm::Value* is_space(llvm::IRBuilder<>& B, llvm::Value* c){
    llvm::Value* control = B.CreateICmpULE(B.CreateSub(c, B.getInt8(9)), B.getInt8(4));
    return B.CreateOr(control, B.CreateICmpEQ(c, B.getInt8(' ')));
}

// i32 (i32 s): copy without leading and trailing whitespace.
llvm::Function* trim_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_trim", i32, {i32}, fresh);
    if(!fresh) return F;
    llvm::Function* slice = slice_fn(S);
    llvm::Value* s = F->getArg(0); s->setName("s");
    auto* entry = block(F, "entry");
    auto* frontBB = block(F, "front");
    auto* frontTestBB = block(F, "front.test");
    auto* backStartBB = block(F, "back.start");
    auto* backBB = block(F, "back");
    auto* backTestBB = block(F, "back.test");
    auto* doneBB = block(F, "done");
    llvm::IRBuilder<> B(entry);
    llvm::Value* len = load_i32(B, S.rt.memory, s);
    B.CreateBr(frontBB);

    B.SetInsertPoint(frontBB);
    auto* a = B.CreatePHI(i32, 2, "a");
    a->addIncoming(B.getInt32(0), entry);
    B.CreateCondBr(B.CreateICmpEQ(a, len), backStartBB, frontTestBB);
    B.SetInsertPoint(frontTestBB);
    llvm::Value* fc = load_i8(B, S.rt.memory, char_offset(B, s, a));
    a->addIncoming(B.CreateAdd(a, B.getInt32(1)), frontTestBB);
    B.CreateCondBr(is_space(B, fc), frontBB, backStartBB);

    B.SetInsertPoint(backStartBB);
    B.CreateBr(backBB);
    B.SetInsertPoint(backBB);
    auto* b = B.CreatePHI(i32, 2, "b");
    b->addIncoming(len, backStartBB);
    B.CreateCondBr(B.CreateICmpEQ(b, a), doneBB, backTestBB);
    B.SetInsertPoint(backTestBB);
    llvm::Value* prev = B.CreateSub(b, B.getInt32(1));
    llvm::Value* bc = load_i8(B, S.rt.memory, char_offset(B, s, prev));
    b->addIncoming(prev, backTestBB);
    B.CreateCondBr(is_space(B, bc), backBB, doneBB);

    B.SetInsertPoint(doneBB);
    B.CreateRet(B.CreateCall(slice, {s, a, B.CreateSub(b, a)}));
    return F;
}

// i32 (i32 s, i32 pat, i32 rep): every non-overlapping occurrence of pat replaced, left to right.
// An empty pattern leaves the string unchanged.
llvm::Function* replace_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_replace", i32, {i32, i32, i32}, fresh);
    if(!fresh) return F;
    llvm::Function* find = find_fn(S);
    llvm::Value* s = F->getArg(0); s->setName("s");
    llvm::Value* pat = F->getArg(1); pat->setName("pat");
    llvm::Value* rep = F->getArg(2); rep->setName("rep");
    auto* entry = block(F, "entry");
    auto* sameBB = block(F, "same");
    auto* countBB = block(F, "count");
    auto* countStepBB = block(F, "count.step");
    auto* sizeBB = block(F, "size");
    auto* copyBB = block(F, "copy");
    auto* pieceBB = block(F, "piece");
    auto* tailBB = block(F, "tail");
    llvm::IRBuilder<> B(entry);
    llvm::Value* sl = load_i32(B, S.rt.memory, s);
    llvm::Value* pl = load_i32(B, S.rt.memory, pat);
    llvm::Value* rl = load_i32(B, S.rt.memory, rep);
    B.CreateCondBr(B.CreateICmpEQ(pl, B.getInt32(0)), sameBB, countBB);
    B.SetInsertPoint(sameBB);
    B.CreateRet(s);

    B.SetInsertPoint(countBB);
    auto* pos = B.CreatePHI(i32, 2, "pos");
    auto* n = B.CreatePHI(i32, 2, "n");
    pos->addIncoming(B.getInt32(0), entry);
    n->addIncoming(B.getInt32(0), entry);
    llvm::Value* k = B.CreateCall(find, {s, pat, pos});
    B.CreateCondBr(B.CreateICmpSLT(k, B.getInt32(0)), sizeBB, countStepBB);
    B.SetInsertPoint(countStepBB);
    pos->addIncoming(B.CreateAdd(k, pl), countStepBB);
    n->addIncoming(B.CreateAdd(n, B.getInt32(1)), countStepBB);
    B.CreateBr(countBB);

    B.SetInsertPoint(sizeBB);
    llvm::Value* total = B.CreateAdd(sl, B.CreateMul(n, B.CreateSub(rl, pl)), "total");
    llvm::Value* r = B.CreateCall(S.rt.alloc, {B.CreateAdd(total, B.getInt32(4))});
    store_i32(B, S.rt.memory, r, total);
    B.CreateBr(copyBB);

    B.SetInsertPoint(copyBB);
    auto* from = B.CreatePHI(i32, 2, "from");
    auto* out = B.CreatePHI(i32, 2, "out");
    from->addIncoming(B.getInt32(0), sizeBB);
    out->addIncoming(B.getInt32(0), sizeBB);
    llvm::Value* hit = B.CreateCall(find, {s, pat, from});
    B.CreateCondBr(B.CreateICmpSLT(hit, B.getInt32(0)), tailBB, pieceBB);

    B.SetInsertPoint(pieceBB);
    llvm::Value* kept = B.CreateSub(hit, from);
    copy_bytes(S, B, char_offset(B, r, out), char_offset(B, s, from), kept);
    llvm::Value* mid = B.CreateAdd(out, kept);
    copy_bytes(S, B, char_offset(B, r, mid), offset(B, rep, 4), rl);
    from->addIncoming(B.CreateAdd(hit, pl), pieceBB);
    out->addIncoming(B.CreateAdd(mid, rl), pieceBB);
    B.CreateBr(copyBB);

    B.SetInsertPoint(tailBB);
    copy_bytes(S, B, char_offset(B, r, out), char_offset(B, s, from), B.CreateSub(sl, from));
    B.CreateRet(r);
    return F;
}

// i32 (i32 s, i32 delim): Array<String> of the pieces between delimiters. An empty
// delimiter yields the whole string as the only element.
llvm::Function* split_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    auto* i64 = llvm::Type::getInt64Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_split", i32, {i32, i32}, fresh);
    if(!fresh) return F;
    llvm::Function* find = find_fn(S);
    llvm::Function* slice = slice_fn(S);
    llvm::Value* s = F->getArg(0); s->setName("s");
    llvm::Value* delim = F->getArg(1); delim->setName("delim");
    auto* entry = block(F, "entry");
    auto* wholeBB = block(F, "whole");
    auto* loopBB = block(F, "loop");
    auto* pieceBB = block(F, "piece");
    auto* lastBB = block(F, "last");
    llvm::IRBuilder<> B(entry);
    llvm::Value* arr = B.CreateCall(S.rt.array_new, {B.getInt32(0), B.getInt32(4)}, "parts");
    llvm::Value* sl = load_i32(B, S.rt.memory, s);
    llvm::Value* dl = load_i32(B, S.rt.memory, delim);
    B.CreateCondBr(B.CreateICmpEQ(dl, B.getInt32(0)), wholeBB, loopBB);

    B.SetInsertPoint(wholeBB);
    B.CreateCall(S.rt.array_push, {arr, B.CreateZExt(s, i64)});
    B.CreateRet(arr);

    B.SetInsertPoint(loopBB);
    auto* pos = B.CreatePHI(i32, 2, "pos");
    pos->addIncoming(B.getInt32(0), entry);
    llvm::Value* k = B.CreateCall(find, {s, delim, pos});
    B.CreateCondBr(B.CreateICmpSLT(k, B.getInt32(0)), lastBB, pieceBB);

    B.SetInsertPoint(pieceBB);
    llvm::Value* part = B.CreateCall(slice, {s, pos, B.CreateSub(k, pos)});
    B.CreateCall(S.rt.array_push, {arr, B.CreateZExt(part, i64)});
    pos->addIncoming(B.CreateAdd(k, dl), pieceBB);
    B.CreateBr(loopBB);

    B.SetInsertPoint(lastBB);
    llvm::Value* rest = B.CreateCall(slice, {s, pos, B.CreateSub(sl, pos)});
    B.CreateCall(S.rt.array_push, {arr, B.CreateZExt(rest, i64)});
    B.CreateRet(arr);
    return F;
}

// i32 (i32 fmt, i32 args): each "{}" replaced by the next element of args. Placeholders
// beyond the last argument are kept as written.
llvm::Function* format_fn(State& S){
    auto* i32 = llvm::Type::getInt32Ty(S.llctx);
    bool fresh = false;
    llvm::Function* F = helper(S, "ccl.str_format", i32, {i32, i32}, fresh);
    if(!fresh) return F;
    llvm::Function* find = find_fn(S);
    llvm::Function* slice = slice_fn(S);
    const uint32_t marker = S.data.intern("{}");
    llvm::Value* fmt = F->getArg(0); fmt->setName("fmt");
    llvm::Value* args = F->getArg(1); args->setName("args");
    auto* entry = block(F, "entry");
    auto* loopBB = block(F, "loop");
    auto* testBB = block(F, "test");
    auto* pieceBB = block(F, "piece");
    auto* tailBB = block(F, "tail");
    llvm::IRBuilder<> B(entry);
    llvm::Value* fl = load_i32(B, S.rt.memory, fmt);
    llvm::Value* al = load_i32(B, S.rt.memory, args);
    llvm::Value* empty = B.CreateCall(S.rt.alloc, {B.getInt32(4)}, "empty");
    B.CreateBr(loopBB);

    B.SetInsertPoint(loopBB);
    auto* pos = B.CreatePHI(i32, 2, "pos");
    auto* i = B.CreatePHI(i32, 2, "i");
    auto* acc = B.CreatePHI(i32, 2, "acc");
    pos->addIncoming(B.getInt32(0), entry);
    i->addIncoming(B.getInt32(0), entry);
    acc->addIncoming(empty, entry);
    B.CreateCondBr(B.CreateICmpUGE(i, al), tailBB, testBB);

    B.SetInsertPoint(testBB);
    llvm::Value* k = B.CreateCall(find, {fmt, B.getInt32(marker), pos});
    B.CreateCondBr(B.CreateICmpSLT(k, B.getInt32(0)), tailBB, pieceBB);

    B.SetInsertPoint(pieceBB);
    llvm::Value* head = B.CreateCall(S.rt.str_concat, {acc, B.CreateCall(slice, {fmt, pos, B.CreateSub(k, pos)})});
    llvm::Value* arg = B.CreateTrunc(load_i64(B, S.rt.memory, array_cell(B, S.rt.memory, args, i)), i32);
    pos->addIncoming(B.CreateAdd(k, B.getInt32(2)), pieceBB);
    i->addIncoming(B.CreateAdd(i, B.getInt32(1)), pieceBB);
    acc->addIncoming(B.CreateCall(S.rt.str_concat, {head, arg}), pieceBB);
    B.CreateBr(loopBB);

    B.SetInsertPoint(tailBB);
    llvm::Value* rest = B.CreateCall(slice, {fmt, pos, B.CreateSub(fl, pos)});
    B.CreateRet(B.CreateCall(S.rt.str_concat, {acc, rest}));
    return F;
}

} // namespace

llvm::Value* emit_library_call(State& S, Builtin id, TypeId, const Expr& receiver,
                               const std::vector<ExprPtr>& args, size_t first){
    auto& B = S.builder;
    auto* i32 = B.getInt32Ty();
    auto* i64 = B.getInt64Ty();
    auto arg = [&](size_t k) -> llvm::Value* { return emit_expr(S, *args.at(first + k)); };
    // string length as i64
    auto length = [&](llvm::Value* s){ return B.CreateZExt(load_i32(B, S.rt.memory, s), i64); };
    switch(id){
        case Builtin::Abs: {
            llvm::Value* x = emit_expr(S, receiver);
            return B.CreateSelect(B.CreateICmpSLT(x, B.getInt64(0)), B.CreateSub(B.getInt64(0), x), x, "abs");
        }
        case Builtin::Min:
        case Builtin::Max: {
            llvm::Value* a = emit_expr(S, receiver);
            llvm::Value* b = arg(0);
            llvm::Value* pick = id == Builtin::Min ? B.CreateICmpSLE(a, b) : B.CreateICmpSGE(a, b);
            return B.CreateSelect(pick, a, b);
        }
        case Builtin::Pow: {
            llvm::Value* base = emit_expr(S, receiver);
            return B.CreateCall(pow_fn(S), {base, arg(0)}, "pow");
        }
        case Builtin::Sqrt:
            return B.CreateCall(isqrt_fn(S), {emit_expr(S, receiver)}, "sqrt");
        case Builtin::Sum:
            return B.CreateCall(sum_fn(S), {emit_expr(S, receiver)}, "sum");
        case Builtin::Percentage: {
            llvm::Value* value = emit_expr(S, receiver);
            llvm::Value* total = arg(0);
            trap_if(B, S.F, B.CreateICmpEQ(total, B.getInt64(0)), "percentage.zero");
            llvm::Value* scaled = B.CreateMul(value, B.getInt64(kBasisPoints));
            llvm::Value* overflow = B.CreateAnd(B.CreateICmpEQ(scaled, B.getInt64(static_cast<uint64_t>(std::numeric_limits<int64_t>::min()))),
                                                B.CreateICmpEQ(total, B.getInt64(static_cast<uint64_t>(-1))));
            trap_if(B, S.F, overflow, "percentage.overflow");
            return B.CreateSDiv(scaled, total, "percentage");
        }
        case Builtin::ApplyPercentage: {
            llvm::Value* value = emit_expr(S, receiver);
            return B.CreateSDiv(B.CreateMul(value, arg(0)), B.getInt64(kBasisPoints), "portion");
        }
        case Builtin::Days:
            return B.CreateMul(emit_expr(S, receiver), B.getInt64(kSecondsPerDay), "days");
        case Builtin::Hours:
            return B.CreateMul(emit_expr(S, receiver), B.getInt64(kSecondsPerHour), "hours");
        case Builtin::AddDuration: {
            llvm::Value* t = emit_expr(S, receiver);
            return B.CreateAdd(t, arg(0));
        }
        case Builtin::Require: {
            llvm::Value* cond = emit_expr(S, receiver);
            arg(0); // the message is for readers of the contract; a failed check traps
            trap_if(B, S.F, B.CreateNot(cond), "require");
            return nullptr;
        }
        case Builtin::StringContains: {
            llvm::Value* s = emit_expr(S, receiver);
            llvm::Value* at = B.CreateCall(find_fn(S), {s, arg(0), B.getInt32(0)});
            return B.CreateICmpSGE(at, B.getInt32(0), "contains");
        }
        case Builtin::Substring: {
            llvm::Value* s = emit_expr(S, receiver);
            llvm::Value* start = arg(0);
            llvm::Value* n = arg(1);
            llvm::Value* len = length(s);
            // negative values compare as huge unsigned values
            trap_if(B, S.F, B.CreateICmpUGT(start, len), "substring.bounds");
            trap_if(B, S.F, B.CreateICmpUGT(n, B.CreateSub(len, start)), "substring.bounds");
            return B.CreateCall(slice_fn(S), {s, B.CreateTrunc(start, i32), B.CreateTrunc(n, i32)}, "substring");
        }
        case Builtin::ToUpper:
            return B.CreateCall(case_fn(S, "ccl.str_upper", 'a', 'z', 'A' - 'a'), {emit_expr(S, receiver)});
        case Builtin::ToLower:
            return B.CreateCall(case_fn(S, "ccl.str_lower", 'A', 'Z', 'a' - 'A'), {emit_expr(S, receiver)});
        case Builtin::Trim:
            return B.CreateCall(trim_fn(S), {emit_expr(S, receiver)});
        case Builtin::CharAt: {
            llvm::Value* s = emit_expr(S, receiver);
            llvm::Value* idx = arg(0);
            trap_if(B, S.F, B.CreateICmpUGE(idx, length(s)), "char_at.bounds");
            llvm::Value* c = load_i8(B, S.rt.memory, B.CreateAdd(offset(B, s, 4), B.CreateTrunc(idx, i32)));
            return B.CreateZExt(c, i64, "char");
        }
        case Builtin::Replace: {
            llvm::Value* s = emit_expr(S, receiver);
            llvm::Value* pat = arg(0);
            llvm::Value* rep = arg(1);
            return B.CreateCall(replace_fn(S), {s, pat, rep});
        }
        case Builtin::Split: {
            llvm::Value* s = emit_expr(S, receiver);
            return B.CreateCall(split_fn(S), {s, arg(0)});
        }
        case Builtin::Format: {
            llvm::Value* fmt = emit_expr(S, receiver);
            return B.CreateCall(format_fn(S), {fmt, arg(0)});
        }
        default:
            break;
    }
    throw codegen_error(std::string("unsupported built-in '") + builtin_name(id) + "'");
}

} // namespace ccl::ir::stdlib_ops
