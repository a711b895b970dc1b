#include "ccl/ir/control_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/codegen.hpp"

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>

namespace ccl::ir::control_ops {
using namespace ccl::ast;

static llvm::BasicBlock* make_block(State& S, const std::string& stem){
    return llvm::BasicBlock::Create(S.llctx, next_label(S, stem), S.F);
}

static void branch_if_open(State& S, llvm::BasicBlock* target){
    if(!S.builder.GetInsertBlock()->getTerminator()) S.builder.CreateBr(target);
}

void emit_if(State& S, const IfStmt& s){
    auto& B = S.builder;
    auto* mergeBB = make_block(S, "if.end");
    for(size_t i = 0; i < s.branches.size(); ++i){
        const auto& br = s.branches[i];
        llvm::Value* cond = emit_expr(S, *br.cond);
        auto* thenBB = make_block(S, "if.then");
        llvm::BasicBlock* nextBB = nullptr;
        if(i + 1 < s.branches.size()) nextBB = make_block(S, "if.next");
        else if(s.else_block) nextBB = make_block(S, "if.else");
        else nextBB = mergeBB;
        B.CreateCondBr(cond, thenBB, nextBB);
        B.SetInsertPoint(thenBB);
        emit_block(S, br.body);
        branch_if_open(S, mergeBB);
        B.SetInsertPoint(nextBB);
    }
    if(s.else_block){
        emit_block(S, *s.else_block);
        branch_if_open(S, mergeBB);
    }
    // keep the merge block last so blocks read in source order
    if(B.GetInsertBlock() != mergeBB){
        mergeBB->moveAfter(B.GetInsertBlock());
        B.SetInsertPoint(mergeBB);
    }
}

void emit_while(State& S, const WhileStmt& s){
    auto& B = S.builder;
    auto* condBB = make_block(S, "while.cond");
    auto* bodyBB = make_block(S, "while.body");
    auto* endBB = make_block(S, "while.end");
    B.CreateBr(condBB);
    B.SetInsertPoint(condBB);
    llvm::Value* cond = emit_expr(S, *s.cond);
    B.CreateCondBr(cond, bodyBB, endBB);
    B.SetInsertPoint(bodyBB);
    S.loopEndStack.push_back(endBB);
    S.loopContinueStack.push_back(condBB);
    emit_block(S, s.body);
    S.loopContinueStack.pop_back();
    S.loopEndStack.pop_back();
    branch_if_open(S, condBB);
    endBB->moveAfter(B.GetInsertBlock());
    B.SetInsertPoint(endBB);
}

void emit_for(State& S, const ForStmt& s){
    auto& B = S.builder;
    auto* i32 = B.getInt32Ty();
    auto* i64 = B.getInt64Ty();
    llvm::AllocaInst* arrSlot = hidden_slot(S, i32, "for.arr");
    llvm::AllocaInst* idxSlot = hidden_slot(S, i64, "for.idx");
    B.CreateStore(emit_expr(S, *s.iterable), arrSlot);
    B.CreateStore(B.getInt64(0), idxSlot);
    auto* condBB = make_block(S, "for.cond");
    auto* bodyBB = make_block(S, "for.body");
    auto* stepBB = make_block(S, "for.step");
    auto* endBB = make_block(S, "for.end");
    B.CreateBr(condBB);

    B.SetInsertPoint(condBB);
    llvm::Value* arr = B.CreateLoad(i32, arrSlot, "arr");
    llvm::Value* idx = B.CreateLoad(i64, idxSlot, "idx");
    // the body may push onto the array, so its length is read every time
    llvm::Value* len = B.CreateZExt(memory_ops::load_i32(B, S.rt.memory, arr), i64, "len");
    B.CreateCondBr(B.CreateICmpSLT(idx, len), bodyBB, endBB);

    B.SetInsertPoint(bodyBB);
    llvm::Value* cellOff = memory_ops::array_cell(B, S.rt.memory, arr, B.CreateTrunc(idx, i32));
    B.CreateStore(memory_ops::load_cell(S, cellOff, s.elem_type), S.slots.at(static_cast<size_t>(s.slot)));
    S.loopEndStack.push_back(endBB);
    S.loopContinueStack.push_back(stepBB);
    emit_block(S, s.body);
    S.loopContinueStack.pop_back();
    S.loopEndStack.pop_back();
    branch_if_open(S, stepBB);

    stepBB->moveAfter(B.GetInsertBlock());
    B.SetInsertPoint(stepBB);
    llvm::Value* cur = B.CreateLoad(i64, idxSlot);
    B.CreateStore(B.CreateAdd(cur, B.getInt64(1)), idxSlot);
    B.CreateBr(condBB);
    endBB->moveAfter(stepBB);
    B.SetInsertPoint(endBB);
}

void emit_break(State& S){
    if(S.loopEndStack.empty()) throw codegen_error("'break' outside of a loop");
    S.builder.CreateBr(S.loopEndStack.back());
}

void emit_continue(State& S){
    if(S.loopContinueStack.empty()) throw codegen_error("'continue' outside of a loop");
    S.builder.CreateBr(S.loopContinueStack.back());
}

static llvm::Value* arm_test(State& S, const Pattern& p, llvm::Value* scrutinee, TypeId st){
    auto& B = S.builder;
    auto tag = [&]{ return memory_ops::load_i64(B, S.rt.memory, scrutinee); };
    switch(p.kind){
        case Pattern::Kind::Wildcard:
        case Pattern::Kind::Binding: return nullptr;
        case Pattern::Kind::Int: return B.CreateICmpEQ(scrutinee, B.getInt64(static_cast<uint64_t>(p.int_value)));
        case Pattern::Kind::Bool: return B.CreateICmpEQ(scrutinee, B.getInt1(p.bool_value));
        case Pattern::Kind::String:
            return B.CreateCall(S.rt.str_eq, {scrutinee, B.getInt32(S.data.intern(p.text))});
        case Pattern::Kind::Some:
        case Pattern::Kind::Err: return B.CreateICmpEQ(tag(), B.getInt64(1));
        case Pattern::Kind::None:
        case Pattern::Kind::Ok: return B.CreateICmpEQ(tag(), B.getInt64(0));
    }
    (void)st;
    return nullptr;
}

static void bind_pattern(State& S, const Pattern& p, llvm::Value* scrutinee){
    if(p.slot < 0) return;
    llvm::AllocaInst* slot = S.slots.at(static_cast<size_t>(p.slot));
    if(p.kind == Pattern::Kind::Binding){
        S.builder.CreateStore(scrutinee, slot);
        return;
    }
    const TypeId payloadType = S.fn->locals.at(static_cast<size_t>(p.slot)).type;
    llvm::Value* payload = memory_ops::load_cell(S, memory_ops::offset(S.builder, scrutinee, 8), payloadType);
    S.builder.CreateStore(payload, slot);
}

llvm::Value* emit_match(State& S, const Expr& e, const Match& m){
    auto& B = S.builder;
    if(m.arms.empty()) throw codegen_error("match without arms");
    const TypeId st = m.scrutinee->type;
    llvm::Value* scrutinee = emit_expr(S, *m.scrutinee);
    llvm::AllocaInst* result = nullptr;
    if(!S.tctx.is_unit(e.type)) result = hidden_slot(S, memory_ops::value_type(S, e.type), "match.result");
    auto* endBB = make_block(S, "match.end");
    for(size_t i = 0; i < m.arms.size(); ++i){
        const auto& arm = m.arms[i];
        const bool last = i + 1 == m.arms.size();
        llvm::Value* test = last ? nullptr : arm_test(S, arm.pattern, scrutinee, st);
        llvm::BasicBlock* nextBB = nullptr;
        if(test){
            auto* armBB = make_block(S, "match.arm");
            nextBB = make_block(S, "match.next");
            B.CreateCondBr(test, armBB, nextBB);
            B.SetInsertPoint(armBB);
        }
        bind_pattern(S, arm.pattern, scrutinee);
        emit_stmts(S, arm.body.stmts);
        if(arm.value && !B.GetInsertBlock()->getTerminator()){
            llvm::Value* v = emit_expr(S, *arm.value);
            if(result) B.CreateStore(v, result);
        }
        branch_if_open(S, endBB);
        if(!nextBB) break; // irrefutable or final arm
        B.SetInsertPoint(nextBB);
    }
    endBB->moveAfter(B.GetInsertBlock());
    B.SetInsertPoint(endBB);
    if(!result) return nullptr;
    return B.CreateLoad(result->getAllocatedType(), result, "match");
}

} // namespace ccl::ir::control_ops
