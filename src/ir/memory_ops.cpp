#include "ccl/ir/memory_ops.hpp"
#include "ccl/codegen.hpp"

#include <llvm/IR/Intrinsics.h>

namespace ccl::ir::memory_ops {

llvm::Type* value_type(State& S, TypeId t){
    auto& ctx = S.llctx;
    const Type& ty = S.tctx.at(t);
    if(ty.kind != Type::Kind::Base) return llvm::Type::getInt32Ty(ctx);
    switch(ty.base){
        case BaseType::Integer:
        case BaseType::Mana: return llvm::Type::getInt64Ty(ctx);
        case BaseType::Bool: return llvm::Type::getInt1Ty(ctx);
        case BaseType::String:
        case BaseType::Did: return llvm::Type::getInt32Ty(ctx);
        case BaseType::Unit: return llvm::Type::getVoidTy(ctx);
        case BaseType::Error: break;
    }
    throw codegen_error("cannot lower an unresolved type");
}

llvm::Type* boundary_type(State& S, TypeId t){
    if(S.tctx.is_bool(t)) return llvm::Type::getInt32Ty(S.llctx);
    return value_type(S, t);
}

llvm::Value* address(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Type* elemTy){
    auto* i64 = B.getInt64Ty();
    llvm::Value* idx[] = { llvm::ConstantInt::get(i64, 0), B.CreateZExt(off, i64) };
    llvm::Value* p = B.CreateInBoundsGEP(memory->getValueType(), memory, idx);
    return B.CreateBitCast(p, llvm::PointerType::getUnqual(elemTy));
}

llvm::Value* load_i32(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off){
    return B.CreateLoad(B.getInt32Ty(), address(B, memory, off, B.getInt32Ty()));
}
llvm::Value* load_i64(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off){
    return B.CreateLoad(B.getInt64Ty(), address(B, memory, off, B.getInt64Ty()));
}
llvm::Value* load_i8(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off){
    return B.CreateLoad(B.getInt8Ty(), address(B, memory, off, B.getInt8Ty()));
}
void store_i32(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Value* v){
    B.CreateStore(v, address(B, memory, off, B.getInt32Ty()));
}
void store_i64(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* off, llvm::Value* v){
    B.CreateStore(v, address(B, memory, off, B.getInt64Ty()));
}

llvm::Value* offset(llvm::IRBuilder<>& B, llvm::Value* base, uint32_t bytes){
    if(bytes == 0) return base;
    return B.CreateAdd(base, B.getInt32(bytes));
}

llvm::Value* array_cell(llvm::IRBuilder<>& B, llvm::GlobalVariable* memory, llvm::Value* arr, llvm::Value* i){
    llvm::Value* cells = load_i32(B, memory, offset(B, arr, kArrayCellsField));
    return B.CreateAdd(cells, B.CreateMul(i, B.getInt32(8)));
}

llvm::Value* to_cell(State& S, llvm::Value* v, TypeId t){
    auto& B = S.builder;
    llvm::Type* ty = value_type(S, t);
    if(ty->isIntegerTy(64)) return v;
    return B.CreateZExt(v, B.getInt64Ty());
}

llvm::Value* from_cell(State& S, llvm::Value* cell, TypeId t){
    llvm::Type* ty = value_type(S, t);
    if(ty->isIntegerTy(64)) return cell;
    return S.builder.CreateTrunc(cell, ty);
}

llvm::Value* load_cell(State& S, llvm::Value* off, TypeId t){
    return from_cell(S, load_i64(S.builder, S.rt.memory, off), t);
}

void store_cell(State& S, llvm::Value* off, llvm::Value* v, TypeId t){
    store_i64(S.builder, S.rt.memory, off, to_cell(S, v, t));
}

void trap_if(llvm::IRBuilder<>& B, llvm::Function* F, llvm::Value* cond, const std::string& label){
    auto& llctx = F->getContext();
    auto* trapBB = llvm::BasicBlock::Create(llctx, "trap." + label, F);
    auto* contBB = llvm::BasicBlock::Create(llctx, "ok." + label, F);
    B.CreateCondBr(cond, trapBB, contBB);
    B.SetInsertPoint(trapBB);
    B.CreateCall(llvm::Intrinsic::getDeclaration(F->getParent(), llvm::Intrinsic::trap));
    B.CreateUnreachable();
    B.SetInsertPoint(contBB);
}

} // namespace ccl::ir::memory_ops
