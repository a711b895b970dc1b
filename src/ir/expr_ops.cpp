#include "ccl/ir/expr_ops.hpp"
#include "ccl/ir/call_ops.hpp"
#include "ccl/ir/control_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/codegen.hpp"

#include <algorithm>
#include <limits>

namespace ccl::ir {
using namespace ccl::ast;

llvm::Value* emit_expr(State& S, const Expr& e){
    auto& B = S.builder;
    if(auto* i = std::get_if<IntLit>(&e.data)) return B.getInt64(static_cast<uint64_t>(i->value));
    if(auto* b = std::get_if<BoolLit>(&e.data)) return B.getInt1(b->value);
    if(auto* s = std::get_if<StringLit>(&e.data)) return B.getInt32(S.data.intern(s->value));
    if(auto* id = std::get_if<Ident>(&e.data)){
        if(id->slot >= 0){
            llvm::AllocaInst* slot = S.slots.at(static_cast<size_t>(id->slot));
            return B.CreateLoad(slot->getAllocatedType(), slot, id->name);
        }
        if(id->const_index >= 0)
            return emit_expr(S, *S.program.constants.at(static_cast<size_t>(id->const_index)).value);
        throw codegen_error("unresolved identifier '" + id->name + "'");
    }
    if(auto* u = std::get_if<Unary>(&e.data)) return expr_ops::emit_unary(S, *u);
    if(auto* b = std::get_if<Binary>(&e.data)) return expr_ops::emit_binary(S, e, *b);
    if(auto* c = std::get_if<Call>(&e.data)) return call_ops::emit_call(S, e, *c);
    if(auto* m = std::get_if<MethodCall>(&e.data)) return call_ops::emit_method(S, e, *m);
    if(auto* a = std::get_if<ArrayLit>(&e.data)) return expr_ops::emit_array_lit(S, e, *a);
    if(auto* ix = std::get_if<Index>(&e.data)){
        llvm::Value* base = emit_expr(S, *ix->base);
        llvm::Value* idx = emit_expr(S, *ix->index);
        llvm::Value* cell = B.CreateCall(S.rt.array_slot, {base, idx});
        return memory_ops::load_cell(S, cell, e.type);
    }
    if(auto* f = std::get_if<Field>(&e.data)){
        if(f->index < 0) throw codegen_error("unresolved field '" + f->name + "'");
        llvm::Value* base = emit_expr(S, *f->base);
        return memory_ops::load_cell(S, memory_ops::offset(B, base, static_cast<uint32_t>(f->index) * 8), e.type);
    }
    if(auto* r = std::get_if<RecordLit>(&e.data)) return expr_ops::emit_record_lit(S, *r);
    if(auto* o = std::get_if<OptionLit>(&e.data)) return expr_ops::emit_tagged(S, o->value ? 1 : 0, o->value.get());
    if(auto* r = std::get_if<ResultLit>(&e.data)) return expr_ops::emit_tagged(S, r->ok ? 0 : 1, r->value.get());
    if(auto* m = std::get_if<Match>(&e.data)) return control_ops::emit_match(S, e, *m);
    throw codegen_error("unsupported expression");
}

} // namespace ccl::ir

namespace ccl::ir::expr_ops {
using namespace ccl::ast;

llvm::Value* emit_unary(State& S, const Unary& u){
    auto& B = S.builder;
    llvm::Value* v = emit_expr(S, *u.operand);
    if(u.op == UnaryOp::Neg) return B.CreateSub(B.getInt64(0), v);
    return B.CreateNot(v);
}

static llvm::Value* emit_logical(State& S, const Binary& b){
    auto& B = S.builder;
    const bool isAnd = b.op == BinaryOp::And;
    const std::string stem = isAnd ? "and" : "or";
    llvm::Value* lhs = emit_expr(S, *b.lhs);
    llvm::BasicBlock* lhsBB = B.GetInsertBlock();
    auto* rhsBB = llvm::BasicBlock::Create(S.llctx, next_label(S, stem + ".rhs"), S.F);
    auto* endBB = llvm::BasicBlock::Create(S.llctx, next_label(S, stem + ".end"), S.F);
    if(isAnd) B.CreateCondBr(lhs, rhsBB, endBB);
    else B.CreateCondBr(lhs, endBB, rhsBB);
    B.SetInsertPoint(rhsBB);
    llvm::Value* rhs = emit_expr(S, *b.rhs);
    llvm::BasicBlock* rhsEnd = B.GetInsertBlock();
    B.CreateBr(endBB);
    B.SetInsertPoint(endBB);
    auto* phi = B.CreatePHI(B.getInt1Ty(), 2, stem);
    phi->addIncoming(B.getInt1(!isAnd), lhsBB);
    phi->addIncoming(rhs, rhsEnd);
    return phi;
}

llvm::Value* emit_binary(State& S, const Expr& e, const Binary& b){
    (void)e;
    auto& B = S.builder;
    if(b.op == BinaryOp::And || b.op == BinaryOp::Or) return emit_logical(S, b);
    llvm::Value* l = emit_expr(S, *b.lhs);
    llvm::Value* r = emit_expr(S, *b.rhs);
    switch(b.op){
        case BinaryOp::Add: return B.CreateAdd(l, r);
        case BinaryOp::Sub: return B.CreateSub(l, r);
        case BinaryOp::Mul: return B.CreateMul(l, r);
        case BinaryOp::Div: {
            memory_ops::trap_if(B, S.F, B.CreateICmpEQ(r, B.getInt64(0)), "div.zero");
            llvm::Value* overflow = B.CreateAnd(B.CreateICmpEQ(l, B.getInt64(static_cast<uint64_t>(std::numeric_limits<int64_t>::min()))),
                                                B.CreateICmpEQ(r, B.getInt64(static_cast<uint64_t>(-1))));
            memory_ops::trap_if(B, S.F, overflow, "div.overflow");
            return B.CreateSDiv(l, r);
        }
        case BinaryOp::Mod: {
            memory_ops::trap_if(B, S.F, B.CreateICmpEQ(r, B.getInt64(0)), "rem.zero");
            // x % -1 is 0; dividing by 1 instead avoids the INT64_MIN overflow
            llvm::Value* safe = B.CreateSelect(B.CreateICmpEQ(r, B.getInt64(static_cast<uint64_t>(-1))), B.getInt64(1), r);
            return B.CreateSRem(l, safe);
        }
        case BinaryOp::Lt: return B.CreateICmpSLT(l, r);
        case BinaryOp::Le: return B.CreateICmpSLE(l, r);
        case BinaryOp::Gt: return B.CreateICmpSGT(l, r);
        case BinaryOp::Ge: return B.CreateICmpSGE(l, r);
        case BinaryOp::Eq:
        case BinaryOp::Ne: {
            llvm::Value* eq = S.tctx.is_stringlike(b.lhs->type)
                ? static_cast<llvm::Value*>(B.CreateCall(S.rt.str_eq, {l, r}))
                : B.CreateICmpEQ(l, r);
            return b.op == BinaryOp::Eq ? eq : B.CreateNot(eq);
        }
        default: break;
    }
    throw codegen_error(std::string("unsupported operator '") + binary_op_name(b.op) + "'");
}

llvm::Value* emit_array_lit(State& S, const Expr& e, const ArrayLit& a){
    auto& B = S.builder;
    const TypeId elem = S.tctx.at(e.type).elem;
    const uint32_t n = static_cast<uint32_t>(a.elems.size());
    llvm::Value* arr = B.CreateCall(S.rt.array_new, {B.getInt32(n), B.getInt32(std::max<uint32_t>(n, 4))});
    for(uint32_t i = 0; i < n; ++i){
        llvm::Value* v = emit_expr(S, *a.elems[i]);
        memory_ops::store_cell(S, memory_ops::array_cell(B, S.rt.memory, arr, B.getInt32(i)), v, elem);
    }
    return arr;
}

llvm::Value* emit_record_lit(State& S, const RecordLit& r){
    auto& B = S.builder;
    const RecordInfo* info = S.tctx.record(r.name);
    if(!info) throw codegen_error("unknown record '" + r.name + "'");
    const uint32_t size = static_cast<uint32_t>(info->fields.size()) * 8;
    llvm::Value* rec = B.CreateCall(S.rt.alloc, {B.getInt32(std::max<uint32_t>(size, 8))}, r.name);
    // fields evaluate in source order and land at their declared position
    for(auto& fi : r.fields){
        if(fi.index < 0) throw codegen_error("unresolved field '" + fi.name + "'");
        llvm::Value* v = emit_expr(S, *fi.value);
        memory_ops::store_cell(S, memory_ops::offset(B, rec, static_cast<uint32_t>(fi.index) * 8), v, info->fields[fi.index].type);
    }
    return rec;
}

llvm::Value* emit_tagged(State& S, uint64_t tag, const Expr* payload){
    auto& B = S.builder;
    llvm::Value* v = payload ? emit_expr(S, *payload) : nullptr;
    llvm::Value* region = B.CreateCall(S.rt.alloc, {B.getInt32(16)});
    memory_ops::store_i64(B, S.rt.memory, region, B.getInt64(tag));
    if(v) memory_ops::store_cell(S, memory_ops::offset(B, region, 8), v, payload->type);
    return region;
}

void emit_assign(State& S, const AssignStmt& as){
    auto& B = S.builder;
    const Expr& t = *as.target;
    if(auto* id = std::get_if<Ident>(&t.data)){
        if(id->slot < 0) throw codegen_error("cannot assign to '" + id->name + "'");
        llvm::Value* v = emit_expr(S, *as.value);
        B.CreateStore(v, S.slots.at(static_cast<size_t>(id->slot)));
        return;
    }
    if(auto* ix = std::get_if<Index>(&t.data)){
        llvm::Value* base = emit_expr(S, *ix->base);
        llvm::Value* idx = emit_expr(S, *ix->index);
        llvm::Value* cell = B.CreateCall(S.rt.array_slot, {base, idx});
        llvm::Value* v = emit_expr(S, *as.value);
        memory_ops::store_cell(S, cell, v, t.type);
        return;
    }
    if(auto* f = std::get_if<Field>(&t.data)){
        llvm::Value* base = emit_expr(S, *f->base);
        llvm::Value* v = emit_expr(S, *as.value);
        memory_ops::store_cell(S, memory_ops::offset(B, base, static_cast<uint32_t>(f->index) * 8), v, t.type);
        return;
    }
    throw codegen_error("unsupported assignment target");
}

} // namespace ccl::ir::expr_ops
