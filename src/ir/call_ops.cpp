#include "ccl/ir/call_ops.hpp"
#include "ccl/ir/memory_ops.hpp"
#include "ccl/ir/stdlib_ops.hpp"
#include "ccl/codegen.hpp"

namespace ccl::ir::call_ops {
using namespace ccl::ast;
using memory_ops::load_i32;

static bool returns_text(const HostFunction& h){
    return h.ret == BaseType::String || h.ret == BaseType::Did;
}

static llvm::Type* host_type(State& S, BaseType b){
    switch(b){
        case BaseType::Unit: return llvm::Type::getVoidTy(S.llctx);
        case BaseType::Integer:
        case BaseType::Mana: return llvm::Type::getInt64Ty(S.llctx);
        case BaseType::Bool:
        case BaseType::String:
        case BaseType::Did: return llvm::Type::getInt32Ty(S.llctx);
        default: break;
    }
    throw codegen_error("host functions cannot use this type");
}

llvm::Function* host_import(State& S, const HostFunction& h){
    if(auto it = S.imports.find(h.name); it != S.imports.end()) return it->second;
    std::vector<llvm::Type*> params;
    for(auto p : h.params) params.push_back(host_type(S, p));
    if(returns_text(h)) params.push_back(llvm::Type::getInt32Ty(S.llctx)); // out buffer
    auto* FT = llvm::FunctionType::get(host_type(S, h.ret), params, false);
    auto* F = llvm::Function::Create(FT, llvm::Function::ExternalLinkage, h.name, S.module);
    S.imports[h.name] = F;
    S.import_sigs[h.name] = h;
    return F;
}

static llvm::Value* emit_host_call(State& S, const HostFunction& h, const Call& c){
    auto& B = S.builder;
    llvm::Function* F = host_import(S, h);
    std::vector<llvm::Value*> args;
    for(size_t i = 0; i < c.args.size(); ++i){
        llvm::Value* v = emit_expr(S, *c.args[i]);
        if(h.params.at(i) == BaseType::Bool) v = B.CreateZExt(v, B.getInt32Ty());
        args.push_back(v);
    }
    if(returns_text(h)){
        const uint32_t cap = S.opts.host_buffer_size;
        llvm::Value* buf = B.CreateCall(S.rt.alloc, {B.getInt32(cap + 4)}, "host.buf");
        args.push_back(buf);
        llvm::Value* n = B.CreateCall(F, args, h.name);
        memory_ops::trap_if(B, S.F, B.CreateICmpUGT(n, B.getInt32(cap)), "host.overflow");
        memory_ops::store_i32(B, S.rt.memory, buf, n);
        return buf;
    }
    if(h.ret == BaseType::Unit){
        B.CreateCall(F, args);
        return nullptr;
    }
    llvm::Value* r = B.CreateCall(F, args, h.name);
    if(h.ret == BaseType::Bool) return B.CreateICmpNE(r, B.getInt32(0));
    return r;
}

llvm::Value* emit_call(State& S, const Expr& e, const Call& c){
    switch(c.kind){
        case CallKind::User: {
            auto it = S.functions.find(c.callee);
            if(it == S.functions.end()) throw codegen_error("call to undeclared function '" + c.callee + "'");
            std::vector<llvm::Value*> args;
            for(auto& a : c.args) args.push_back(emit_expr(S, *a));
            return S.builder.CreateCall(it->second, args);
        }
        case CallKind::Builtin:
            return emit_builtin(S, c.builtin, e.type, *c.args.at(0), c.args, 1);
        case CallKind::Host: {
            if(c.host_ret == BaseType::Error || c.host_params.size() != c.args.size())
                throw codegen_error("host function '" + c.callee + "' has no resolved signature");
            return emit_host_call(S, HostFunction{c.callee, c.host_params, c.host_ret}, c);
        }
        case CallKind::Unresolved: break;
    }
    throw codegen_error("unresolved call to '" + c.callee + "'");
}

llvm::Value* emit_method(State& S, const Expr& e, const MethodCall& m){
    return emit_builtin(S, m.builtin, e.type, *m.receiver, m.args, 0);
}

llvm::Value* emit_builtin(State& S, Builtin id, TypeId result, const Expr& receiver,
                          const std::vector<ExprPtr>& args, size_t first){
    auto& B = S.builder;
    auto* mem = S.rt.memory;
    const TypeId recvType = receiver.type;
    const Type::Kind kind = S.tctx.at(recvType).kind;
    const TypeId elem = S.tctx.at(recvType).elem;
    auto arg = [&](size_t k) -> llvm::Value* { return emit_expr(S, *args.at(first + k)); };
    switch(id){
        case Builtin::ArrayLen:
        case Builtin::StringLen:
            return B.CreateZExt(load_i32(B, mem, emit_expr(S, receiver)), B.getInt64Ty(), "len");
        case Builtin::ArrayPush: {
            llvm::Value* arr = emit_expr(S, receiver);
            llvm::Value* cell = memory_ops::to_cell(S, arg(0), elem);
            llvm::Value* len = B.CreateCall(S.rt.array_push, {arr, cell});
            return B.CreateZExt(len, B.getInt64Ty(), "len");
        }
        case Builtin::ArrayPop: {
            llvm::Value* cell = B.CreateCall(S.rt.array_pop, {emit_expr(S, receiver)});
            return memory_ops::from_cell(S, cell, result);
        }
        case Builtin::ArrayContains: {
            llvm::Value* arr = emit_expr(S, receiver);
            llvm::Value* v = arg(0);
            if(S.tctx.is_stringlike(elem)) return B.CreateCall(S.rt.contains_str, {arr, v});
            return B.CreateCall(S.rt.contains_cell, {arr, memory_ops::to_cell(S, v, elem)});
        }
        case Builtin::StringConcat: {
            llvm::Value* a = emit_expr(S, receiver);
            llvm::Value* b = arg(0);
            return B.CreateCall(S.rt.str_concat, {a, b});
        }
        case Builtin::IsSome:
        case Builtin::IsErr:
            return B.CreateICmpEQ(memory_ops::load_i64(B, mem, emit_expr(S, receiver)), B.getInt64(1));
        case Builtin::IsNone:
        case Builtin::IsOk:
            return B.CreateICmpEQ(memory_ops::load_i64(B, mem, emit_expr(S, receiver)), B.getInt64(0));
        case Builtin::UnwrapOr: {
            llvm::Value* region = emit_expr(S, receiver);
            llvm::Value* fallback = arg(0);
            // Some is tag 1, Ok is tag 0
            const uint64_t present = kind == Type::Kind::Option ? 1 : 0;
            llvm::Value* tag = memory_ops::load_i64(B, mem, region);
            llvm::Value* payload = memory_ops::load_cell(S, memory_ops::offset(B, region, 8), result);
            return B.CreateSelect(B.CreateICmpEQ(tag, B.getInt64(present)), payload, fallback);
        }
        case Builtin::None: break;
        default:
            return stdlib_ops::emit_library_call(S, id, result, receiver, args, first);
    }
    throw codegen_error("unresolved built-in call");
}

} // namespace ccl::ir::call_ops
