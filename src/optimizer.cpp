#include "ccl/optimizer.hpp"
#include <cstdint>
#include <limits>
#include <type_traits>
#include <variant>

namespace ccl {
using namespace ccl::ast;

namespace {

bool is_literal(const Expr& e){
    return std::holds_alternative<IntLit>(e.data) || std::holds_alternative<BoolLit>(e.data) ||
           std::holds_alternative<StringLit>(e.data);
}

const IntLit* as_int(const ExprPtr& e){ return e ? std::get_if<IntLit>(&e->data) : nullptr; }
const BoolLit* as_bool(const ExprPtr& e){ return e ? std::get_if<BoolLit>(&e->data) : nullptr; }

// two's complement wrap, matching the generated i64 arithmetic
int64_t wrap(uint64_t v){ return static_cast<int64_t>(v); }

void replace_with_int(ExprPtr& e, int64_t v){ e->data = IntLit{v}; }
void replace_with_bool(ExprPtr& e, bool v){ e->data = BoolLit{v}; }

} // namespace

OptimizeStats Optimizer::optimize(Program& p){
    stats_ = OptimizeStats{};
    constants_.clear();
    for(auto &c: p.constants){
        fold(c.value);
        constants_.push_back(is_literal(*c.value) ? c.value.get() : nullptr);
    }
    for(auto &fn: p.functions) optimize_block(fn.body);
    return stats_;
}

void Optimizer::fold_unary(ExprPtr& e){
    auto &u = std::get<Unary>(e->data);
    if(u.op==UnaryOp::Neg){
        if(auto* i = as_int(u.operand)){ replace_with_int(e, wrap(0ull - static_cast<uint64_t>(i->value))); ++stats_.folded; }
    } else if(auto* b = as_bool(u.operand)){
        replace_with_bool(e, !b->value); ++stats_.folded;
    }
}

void Optimizer::fold_binary(ExprPtr& e){
    auto &b = std::get<Binary>(e->data);
    if(b.op==BinaryOp::And || b.op==BinaryOp::Or){
        auto* l = as_bool(b.lhs);
        if(!l) return;
        bool absorbing = b.op==BinaryOp::And ? !l->value : l->value;
        ++stats_.folded;
        if(absorbing){ replace_with_bool(e, l->value); return; }
        ExprPtr rhs = std::move(b.rhs);
        TypeId ty = e->type;
        e = std::move(rhs);
        e->type = ty;
        return;
    }
    if(auto* l = as_int(b.lhs)){
        auto* r = as_int(b.rhs);
        if(!r) return;
        const int64_t x = l->value, y = r->value;
        const uint64_t ux = static_cast<uint64_t>(x), uy = static_cast<uint64_t>(y);
        switch(b.op){
            case BinaryOp::Add: replace_with_int(e, wrap(ux + uy)); break;
            case BinaryOp::Sub: replace_with_int(e, wrap(ux - uy)); break;
            case BinaryOp::Mul: replace_with_int(e, wrap(ux * uy)); break;
            case BinaryOp::Div:
                // left for the runtime trap
                if(y==0 || (x==std::numeric_limits<int64_t>::min() && y==-1)) return;
                replace_with_int(e, x / y); break;
            case BinaryOp::Mod:
                if(y==0) return;
                replace_with_int(e, y==-1 ? 0 : x % y); break;
            case BinaryOp::Eq: replace_with_bool(e, x==y); break;
            case BinaryOp::Ne: replace_with_bool(e, x!=y); break;
            case BinaryOp::Lt: replace_with_bool(e, x<y); break;
            case BinaryOp::Le: replace_with_bool(e, x<=y); break;
            case BinaryOp::Gt: replace_with_bool(e, x>y); break;
            case BinaryOp::Ge: replace_with_bool(e, x>=y); break;
            default: return;
        }
        ++stats_.folded;
        return;
    }
    if(auto* l = as_bool(b.lhs)){
        auto* r = as_bool(b.rhs);
        if(!r || (b.op!=BinaryOp::Eq && b.op!=BinaryOp::Ne)) return;
        replace_with_bool(e, (l->value==r->value) == (b.op==BinaryOp::Eq));
        ++stats_.folded;
        return;
    }
    auto* ls = std::get_if<StringLit>(&b.lhs->data);
    auto* rs = std::get_if<StringLit>(&b.rhs->data);
    if(ls && rs && (b.op==BinaryOp::Eq || b.op==BinaryOp::Ne)){
        replace_with_bool(e, (ls->value==rs->value) == (b.op==BinaryOp::Eq));
        ++stats_.folded;
    }
}

void Optimizer::fold(ExprPtr& e){
    if(!e) return;
    if(auto* id = std::get_if<Ident>(&e->data)){
        if(id->const_index>=0 && static_cast<size_t>(id->const_index)<constants_.size() && constants_[id->const_index]){
            const Expr& lit = *constants_[id->const_index];
            e->data = std::visit([](const auto& v) -> ExprData {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T,IntLit> || std::is_same_v<T,BoolLit> || std::is_same_v<T,StringLit>) return v;
                else return IntLit{};
            }, lit.data);
            ++stats_.constants_propagated;
        }
        return;
    }
    if(std::holds_alternative<Unary>(e->data)){
        fold(std::get<Unary>(e->data).operand);
        fold_unary(e);
    } else if(std::holds_alternative<Binary>(e->data)){
        auto &b = std::get<Binary>(e->data);
        fold(b.lhs); fold(b.rhs);
        fold_binary(e);
    } else if(auto* c = std::get_if<Call>(&e->data)){
        for(auto &a: c->args) fold(a);
    } else if(auto* m = std::get_if<MethodCall>(&e->data)){
        fold(m->receiver);
        for(auto &a: m->args) fold(a);
    } else if(auto* a = std::get_if<ArrayLit>(&e->data)){
        for(auto &el: a->elems) fold(el);
    } else if(auto* ix = std::get_if<Index>(&e->data)){
        fold(ix->base); fold(ix->index);
    } else if(auto* f = std::get_if<Field>(&e->data)){
        fold(f->base);
    } else if(auto* rl = std::get_if<RecordLit>(&e->data)){
        for(auto &fi: rl->fields) fold(fi.value);
    } else if(auto* o = std::get_if<OptionLit>(&e->data)){
        fold(o->value);
    } else if(auto* r = std::get_if<ResultLit>(&e->data)){
        fold(r->value);
    } else if(auto* mt = std::get_if<Match>(&e->data)){
        fold(mt->scrutinee);
        for(auto &arm: mt->arms){ optimize_block(arm.body); fold(arm.value); }
    }
}

void Optimizer::optimize_block(Block& b){
    std::vector<StmtPtr> kept;
    kept.reserve(b.stmts.size());
    for(auto &s: b.stmts){
        if(optimize_stmt(s)) kept.push_back(std::move(s));
    }
    b.stmts = std::move(kept);
}

bool Optimizer::optimize_stmt(StmtPtr& s){
    if(auto* let = std::get_if<LetStmt>(&s->data)){ fold(let->init); return true; }
    if(auto* as = std::get_if<AssignStmt>(&s->data)){
        // an Ident target must keep its slot, only its sub-expressions fold
        if(auto* ix = std::get_if<Index>(&as->target->data)){ fold(ix->base); fold(ix->index); }
        else if(auto* f = std::get_if<Field>(&as->target->data)) fold(f->base);
        fold(as->value);
        return true;
    }
    if(auto* rs = std::get_if<ReturnStmt>(&s->data)){ fold(rs->value); return true; }
    if(auto* es = std::get_if<ExprStmt>(&s->data)){ fold(es->expr); return true; }
    if(auto* is = std::get_if<IfStmt>(&s->data)){
        std::vector<IfBranch> branches;
        std::optional<Block> else_block = std::move(is->else_block);
        bool closed = false;
        for(auto &br: is->branches){
            fold(br.cond);
            if(auto* lit = as_bool(br.cond)){
                ++stats_.branches_removed;
                if(!lit->value) continue;
                // a literal `true` guard ends the chain
                optimize_block(br.body);
                else_block = std::move(br.body);
                closed = true;
                break;
            }
            optimize_block(br.body);
            branches.push_back(std::move(br));
        }
        if(else_block && !closed) optimize_block(*else_block);
        if(branches.empty()){
            if(!else_block) return false;
            SourcePos pos = s->pos;
            s = make_stmt(BlockStmt{std::move(*else_block)}, pos);
            return true;
        }
        is->branches = std::move(branches);
        is->else_block = std::move(else_block);
        return true;
    }
    if(auto* ws = std::get_if<WhileStmt>(&s->data)){
        fold(ws->cond);
        if(auto* lit = as_bool(ws->cond); lit && !lit->value){ ++stats_.loops_removed; return false; }
        optimize_block(ws->body);
        return true;
    }
    if(auto* fs = std::get_if<ForStmt>(&s->data)){
        fold(fs->iterable);
        optimize_block(fs->body);
        return true;
    }
    if(auto* bs = std::get_if<BlockStmt>(&s->data)){ optimize_block(bs->block); return true; }
    return true;
}

} // namespace ccl
