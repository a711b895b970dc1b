#include "ccl/sema.hpp"
#include "ccl/builtins.hpp"
#include <algorithm>
#include <set>

namespace ccl {
using namespace ccl::ast;

int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; simple fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist; dist += (int)std::max(n,m)- (int)std::min(n,m); return dist; }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){ for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); } }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(auto &c: pool){
        if(c.empty() || c==target) continue;
        if(std::find(out.begin(), out.end(), c)!=out.end()) continue;
        if(edit_distance(target,c)<=maxDist) out.push_back(c);
    }
    if(out.size()>5) out.resize(5);
    return out;
}

void append_suggestions(Diagnostic& err, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+="'"+suggs[i]+"'"; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    err.notes.push_back(DiagNote{msg,err.line,err.col});
}

// ---- reporting -------------------------------------------------------------

void SemanticAnalyzer::error(DiagKind k, SourcePos p, std::string msg, std::string hint){
    ErrorReporter rep{&r_->errors,&r_->warnings};
    rep.emit_error(rep.make_error(k, std::move(msg), std::move(hint), p.line, p.col));
    r_->success=false;
}

void SemanticAnalyzer::warn(DiagKind k, SourcePos p, std::string msg, std::string hint){
    ErrorReporter rep{&r_->errors,&r_->warnings};
    rep.emit_warning(rep.make_warning(k, std::move(msg), std::move(hint), p.line, p.col));
}

void SemanticAnalyzer::type_mismatch(SourcePos p, const std::string& role, TypeId expected, TypeId actual){
    ErrorReporter rep{&r_->errors,&r_->warnings};
    std::string expStr = ctx_.to_string(expected);
    std::string actStr = ctx_.to_string(actual);
    auto err = rep.make_error(DiagKind::TypeMismatch, role+" type mismatch", "ensure "+role+" has type "+expStr, p.line, p.col);
    err.notes.push_back(DiagNote{"expected: "+expStr, p.line, p.col});
    err.notes.push_back(DiagNote{"   found: "+actStr, p.line, p.col});
    rep.emit_error(err);
    r_->success=false;
}

void SemanticAnalyzer::undefined(SourcePos p, const std::string& what, const std::string& name, const std::vector<std::string>& pool, std::string hint){
    ErrorReporter rep{&r_->errors,&r_->warnings};
    auto err = rep.make_error(DiagKind::UndefinedSymbol, what+" '"+name+"'", std::move(hint), p.line, p.col);
    append_suggestions(err, fuzzy_candidates(name, pool));
    rep.emit_error(err);
    r_->success=false;
}

// ---- declarations ----------------------------------------------------------

AnalysisResult SemanticAnalyzer::analyze(Program& p){
    AnalysisResult r{true,{},{}};
    r_=&r; program_=&p;
    scopes_ = ScopeStack{};
    functions_.clear();
    host_uses_.clear();
    scopes_.push(FrameKind::Global);
    collect_records(p);
    collect_constants(p);
    collect_functions(p);
    for(auto &fn: p.functions) check_function(fn);
    if(!functions_.count("run"))
        error(DiagKind::MissingEntryPoint, SourcePos{1,1}, "contract has no entry point 'run'", "declare 'fn run(...)'; it becomes the module export");
    else if(const FunctionDecl* run = p.find_function("run"))
        check_entry(*run);
    scopes_.pop();
    r_=nullptr; program_=nullptr;
    return r;
}

TypeId SemanticAnalyzer::resolve_type(const TypeExpr& t){
    auto arity = [&](size_t n){
        if(t.args.size()==n) return true;
        error(DiagKind::ArityMismatch, t.pos, "type '"+t.name+"' expects "+std::to_string(n)+" type argument(s), got "+std::to_string(t.args.size()));
        return false;
    };
    if(t.name=="Array" || t.name=="Option" || t.name=="Result"){
        if(!arity(1)) return ctx_.error();
        TypeId inner = resolve_type(t.args[0]);
        if(ctx_.is_unit(inner)){ error(DiagKind::TypeMismatch, t.args[0].pos, "Unit cannot be used as a type argument"); return ctx_.error(); }
        if(t.name=="Array") return ctx_.get_array(inner);
        if(t.name=="Option") return ctx_.get_option(inner);
        return ctx_.get_result(inner);
    }
    static const std::pair<const char*, BaseType> bases[] = {
        {"Integer",BaseType::Integer},{"Bool",BaseType::Bool},{"Boolean",BaseType::Bool},{"String",BaseType::String},
        {"Mana",BaseType::Mana},{"Did",BaseType::Did},{"Unit",BaseType::Unit}};
    for(auto &b: bases){
        if(t.name==b.first){
            if(!arity(0)) return ctx_.error();
            return ctx_.get_base(b.second);
        }
    }
    if(ctx_.record(t.name)){
        if(!arity(0)) return ctx_.error();
        return ctx_.get_record(t.name);
    }
    std::vector<std::string> pool = {"Integer","Bool","String","Mana","Did","Array","Option","Result"};
    for(auto &rec: program_->records) pool.push_back(rec.name);
    undefined(t.pos, "unknown type", t.name, pool);
    return ctx_.error();
}

void SemanticAnalyzer::collect_records(Program& p){
    std::map<std::string, const RecordDecl*> first;
    for(auto &rec: p.records){
        auto it = first.find(rec.name);
        if(it!=first.end()){
            error(DiagKind::DuplicateDeclaration, rec.pos, "duplicate record '"+rec.name+"'", "first declared at line "+std::to_string(it->second->pos.line));
            continue;
        }
        first[rec.name]=&rec;
        ctx_.define_record(rec.name);
    }
    // field types are resolved once every record name is known
    for(auto &rec: p.records){
        if(first[rec.name]!=&rec) continue;
        std::vector<RecordField> fields;
        std::set<std::string> names;
        for(auto &f: rec.fields){
            if(!names.insert(f.name).second){
                error(DiagKind::DuplicateDeclaration, f.pos, "duplicate field '"+f.name+"' in record '"+rec.name+"'");
                continue;
            }
            TypeId ft = resolve_type(f.type);
            if(ctx_.is_unit(ft)){ error(DiagKind::TypeMismatch, f.type.pos, "field '"+f.name+"' cannot have type Unit"); ft = ctx_.error(); }
            fields.push_back(RecordField{f.name, ft});
        }
        ctx_.define_record(rec.name).fields = std::move(fields);
    }
}

bool SemanticAnalyzer::is_constant_expr(const Expr& e) const {
    if(std::holds_alternative<IntLit>(e.data) || std::holds_alternative<BoolLit>(e.data) ||
       std::holds_alternative<StringLit>(e.data) || std::holds_alternative<Ident>(e.data)) return true;
    if(auto* u = std::get_if<Unary>(&e.data)) return is_constant_expr(*u->operand);
    if(auto* b = std::get_if<Binary>(&e.data)) return is_constant_expr(*b->lhs) && is_constant_expr(*b->rhs);
    return false;
}

void SemanticAnalyzer::collect_constants(Program& p){
    for(size_t i=0;i<p.constants.size();++i){
        auto &c = p.constants[i];
        TypeId ty = resolve_type(c.type);
        c.resolved = ty;
        if(!ctx_.is_error(ty) && !ctx_.is_numeric(ty) && !ctx_.is_bool(ty) && !ctx_.is_base(ty, BaseType::String))
            error(DiagKind::TypeMismatch, c.type.pos, "constant '"+c.name+"' must have type Integer, Mana, Bool or String");
        // only constants declared earlier are visible, so initializers cannot form cycles
        if(!is_constant_expr(*c.value))
            error(DiagKind::TypeMismatch, c.value->pos, "initializer of constant '"+c.name+"' is not a constant expression", "use literals, earlier constants and operators only");
        else
            check_value(*c.value, ty, "constant initializer");
        if(scopes_.declared_in_top(c.name)){
            error(DiagKind::DuplicateDeclaration, c.pos, "duplicate constant '"+c.name+"'");
            continue;
        }
        scopes_.declare(c.name, Binding{ty, false, -1, static_cast<int>(i), c.pos});
    }
}

void SemanticAnalyzer::collect_functions(Program& p){
    for(auto &fn: p.functions){
        FunctionSig sig; sig.name = fn.name; sig.pos = fn.pos;
        for(auto &prm: fn.params){
            prm.resolved = resolve_type(prm.type);
            if(ctx_.is_unit(prm.resolved)){ error(DiagKind::TypeMismatch, prm.type.pos, "parameter '"+prm.name+"' cannot have type Unit"); prm.resolved = ctx_.error(); }
            sig.params.push_back(prm.resolved);
        }
        fn.ret_type = fn.ret ? resolve_type(*fn.ret) : ctx_.unit();
        sig.ret = fn.ret_type;
        if(find_builtin_function(fn.name) || find_host_function(fn.name)){
            error(DiagKind::DuplicateDeclaration, fn.pos, "function '"+fn.name+"' conflicts with a built-in or host function", "rename the function");
            continue;
        }
        auto it = functions_.find(fn.name);
        if(it!=functions_.end()){
            error(DiagKind::DuplicateDeclaration, fn.pos, "duplicate function '"+fn.name+"'", "first declared at line "+std::to_string(it->second.pos.line));
            continue;
        }
        functions_[fn.name] = std::move(sig);
    }
}

int SemanticAnalyzer::allocate_slot(const std::string& name, TypeId type, SlotKind kind){
    fn_->locals.push_back(LocalSlot{name, type, kind});
    return static_cast<int>(fn_->locals.size()-1);
}

void SemanticAnalyzer::bind_local(const std::string& name, TypeId type, bool is_mutable, SlotKind kind, SourcePos pos, int* slot_out){
    int slot = allocate_slot(name, type, kind);
    scopes_.declare(name, Binding{type, is_mutable, slot, -1, pos});
    if(slot_out) *slot_out = slot;
}

void SemanticAnalyzer::check_function(FunctionDecl& fn){
    fn_ = &fn;
    fn.locals.clear();
    loop_breaks_.clear();
    scopes_.push(FrameKind::Function);
    std::set<std::string> names;
    for(auto &prm: fn.params){
        if(!names.insert(prm.name).second)
            error(DiagKind::DuplicateDeclaration, prm.pos, "duplicate parameter '"+prm.name+"' in function '"+fn.name+"'");
        // every parameter owns a slot, duplicates included, so slots 0..N-1 stay the parameters
        bind_local(prm.name, prm.resolved, true, SlotKind::Param, prm.pos, nullptr);
    }
    Flow f = check_block(fn.body, FrameKind::Block);
    if(!ctx_.is_unit(fn.ret_type) && !ctx_.is_error(fn.ret_type) && !f.returns)
        error(DiagKind::UnreachableReturn, fn.pos, "function '"+fn.name+"' can reach the end of its body without returning "+ctx_.to_string(fn.ret_type),
              "add a return statement on every path");
    scopes_.pop();
    fn_ = nullptr;
}

bool SemanticAnalyzer::boundary_scalar(TypeId t) const {
    const Type& ty = ctx_.at(t);
    return ty.kind==Type::Kind::Base && is_host_scalar(ty.base);
}

// The export exchanges only scalars with its caller; structured values stay in linear memory.
void SemanticAnalyzer::check_entry(const FunctionDecl& run){
    for(auto &prm: run.params){
        if(ctx_.is_error(prm.resolved) || boundary_scalar(prm.resolved)) continue;
        error(DiagKind::TypeMismatch, prm.type.pos,
              "parameter '"+prm.name+"' of 'run' has type "+ctx_.to_string(prm.resolved)+", which cannot cross the module boundary",
              "entry parameters must be Integer, Mana, Bool, String or Did");
    }
    const TypeId ret = run.ret_type;
    if(ctx_.is_error(ret) || ctx_.is_unit(ret) || boundary_scalar(ret)) return;
    error(DiagKind::TypeMismatch, run.ret ? run.ret->pos : run.pos,
          "'run' returns "+ctx_.to_string(ret)+", which cannot cross the module boundary",
          "return Integer, Mana, Bool, String, Did or nothing");
}

// ---- constant guards -------------------------------------------------------

std::optional<int64_t> SemanticAnalyzer::const_integer(const Expr& e) const {
    if(auto* lit = std::get_if<IntLit>(&e.data)) return lit->value;
    if(auto* id = std::get_if<Ident>(&e.data)){
        if(id->const_index<0 || !program_) return std::nullopt;
        const ConstDecl& c = program_->constants.at(static_cast<size_t>(id->const_index));
        if(!ctx_.is_numeric(c.resolved)) return std::nullopt;
        return const_integer(*c.value);
    }
    if(auto* u = std::get_if<Unary>(&e.data)){
        if(u->op!=UnaryOp::Neg) return std::nullopt;
        auto v = const_integer(*u->operand);
        if(!v) return std::nullopt;
        return static_cast<int64_t>(0 - static_cast<uint64_t>(*v));
    }
    if(auto* b = std::get_if<Binary>(&e.data)){
        if(b->op!=BinaryOp::Add && b->op!=BinaryOp::Sub && b->op!=BinaryOp::Mul) return std::nullopt;
        auto l = const_integer(*b->lhs);
        auto r = const_integer(*b->rhs);
        if(!l || !r) return std::nullopt;
        const uint64_t ul = static_cast<uint64_t>(*l), ur = static_cast<uint64_t>(*r);
        if(b->op==BinaryOp::Add) return static_cast<int64_t>(ul + ur);
        if(b->op==BinaryOp::Sub) return static_cast<int64_t>(ul - ur);
        return static_cast<int64_t>(ul * ur);
    }
    return std::nullopt;
}

std::optional<bool> SemanticAnalyzer::const_condition(const Expr& e) const {
    if(auto* lit = std::get_if<BoolLit>(&e.data)) return lit->value;
    if(auto* id = std::get_if<Ident>(&e.data)){
        if(id->const_index<0 || !program_) return std::nullopt;
        const ConstDecl& c = program_->constants.at(static_cast<size_t>(id->const_index));
        if(!ctx_.is_bool(c.resolved)) return std::nullopt;
        return const_condition(*c.value);
    }
    if(auto* u = std::get_if<Unary>(&e.data)){
        if(u->op!=UnaryOp::Not) return std::nullopt;
        auto v = const_condition(*u->operand);
        if(!v) return std::nullopt;
        return !*v;
    }
    auto* b = std::get_if<Binary>(&e.data);
    if(!b) return std::nullopt;
    if(b->op==BinaryOp::And || b->op==BinaryOp::Or){
        auto l = const_condition(*b->lhs);
        auto r = const_condition(*b->rhs);
        const bool dominant = b->op==BinaryOp::Or;
        if((l && *l==dominant) || (r && *r==dominant)) return dominant;
        if(l && r) return !dominant;
        return std::nullopt;
    }
    if(auto l = const_condition(*b->lhs)){
        auto r = const_condition(*b->rhs);
        if(!r) return std::nullopt;
        if(b->op==BinaryOp::Eq) return *l == *r;
        if(b->op==BinaryOp::Ne) return *l != *r;
        return std::nullopt;
    }
    auto l = const_integer(*b->lhs);
    auto r = const_integer(*b->rhs);
    if(!l || !r) return std::nullopt;
    switch(b->op){
        case BinaryOp::Eq: return *l == *r;
        case BinaryOp::Ne: return *l != *r;
        case BinaryOp::Lt: return *l < *r;
        case BinaryOp::Le: return *l <= *r;
        case BinaryOp::Gt: return *l > *r;
        case BinaryOp::Ge: return *l >= *r;
        default: break;
    }
    return std::nullopt;
}

// ---- statements ------------------------------------------------------------

SemanticAnalyzer::Flow SemanticAnalyzer::check_block(Block& b, FrameKind kind){
    scopes_.push(kind);
    Flow f = check_stmts(b.stmts);
    scopes_.pop();
    return f;
}

SemanticAnalyzer::Flow SemanticAnalyzer::check_stmts(std::vector<StmtPtr>& stmts){
    Flow acc; bool warned=false;
    for(auto &s: stmts){
        if(acc.exits && !warned){
            warn(DiagKind::UnreachableCode, s->pos, "unreachable statement", "remove code after return, break or continue");
            warned=true;
        }
        Flow f = check_stmt(*s);
        acc.returns = acc.returns || f.returns;
        acc.exits = acc.exits || f.exits;
    }
    return acc;
}

void SemanticAnalyzer::check_assign(AssignStmt& as, SourcePos pos){
    (void)pos;
    Expr& t = *as.target;
    TypeId target_ty;
    if(auto* id = std::get_if<Ident>(&t.data)){
        const Binding* b = scopes_.lookup(id->name);
        if(!b){
            undefined(t.pos, "assignment to undeclared name", id->name, scopes_.visible_names(), "declare it first with 'let "+id->name+" = ...'");
            check_expr(*as.value);
            return;
        }
        if(!b->is_mutable){
            error(DiagKind::NotAssignable, t.pos,
                  b->slot<0 ? "cannot assign to constant '"+id->name+"'" : "cannot assign to '"+id->name+"', it is not a mutable binding",
                  "introduce a new binding with 'let'");
        }
        id->slot = b->slot; id->const_index = b->const_index;
        t.type = b->type;
        target_ty = b->type;
    } else {
        target_ty = check_expr(t);
        check_place_root(t, "assign through");
    }
    check_value(*as.value, target_ty, "assigned value");
}

// Field and element updates, and pushes, need a mutable binding at the root of the place.
void SemanticAnalyzer::check_place_root(const Expr& place, const char* what){
    const Expr* root = &place;
    for(;;){
        if(auto* f = std::get_if<Field>(&root->data)){ root = f->base.get(); continue; }
        if(auto* ix = std::get_if<Index>(&root->data)){ root = ix->base.get(); continue; }
        break;
    }
    auto* id = std::get_if<Ident>(&root->data);
    if(!id) return;
    const Binding* b = scopes_.lookup(id->name);
    if(!b || b->is_mutable) return;
    error(DiagKind::NotAssignable, place.pos,
          std::string("cannot ")+what+" '"+id->name+"', it is not a mutable binding",
          "copy it into a 'let mut' binding first");
}

SemanticAnalyzer::Flow SemanticAnalyzer::check_stmt(Stmt& s){
    if(auto* let = std::get_if<LetStmt>(&s.data)){
        TypeId declared = let->annotation ? resolve_type(*let->annotation) : kNoHint;
        TypeId init = check_expr(*let->init, declared);
        TypeId ty = init;
        if(ctx_.is_unit(init)){
            error(DiagKind::TypeMismatch, let->init->pos, "expression has no value to bind to '"+let->name+"'");
            ty = ctx_.error();
        } else if(declared!=kNoHint){
            if(!ctx_.compatible(declared, init)) type_mismatch(let->init->pos, "let initializer", declared, init);
            ty = declared;
        }
        if(opts_.shadow_policy != ShadowPolicy::Allow){
            if(const Binding* outer = scopes_.shadowed_by_control_body(let->name)){
                std::string msg = "'let "+let->name+"' shadows the binding from line "+std::to_string(outer->pos.line)+" instead of updating it";
                std::string hint = "write '"+let->name+" = ...' to update the existing binding, or choose another name";
                if(opts_.shadow_policy==ShadowPolicy::Error) error(DiagKind::ShadowedBinding, s.pos, msg, hint);
                else warn(DiagKind::ShadowedBinding, s.pos, msg, hint);
            }
        }
        let->type = ty;
        bind_local(let->name, ty, true, SlotKind::Let, s.pos, &let->slot);
        return {};
    }
    if(auto* as = std::get_if<AssignStmt>(&s.data)){ check_assign(*as, s.pos); return {}; }
    if(auto* rs = std::get_if<ReturnStmt>(&s.data)){
        TypeId ret = fn_->ret_type;
        if(!rs->value){
            if(!ctx_.is_unit(ret) && !ctx_.is_error(ret))
                error(DiagKind::TypeMismatch, s.pos, "missing return value", "return a value of type "+ctx_.to_string(ret));
        } else if(ctx_.is_unit(ret)){
            error(DiagKind::TypeMismatch, rs->value->pos, "function '"+fn_->name+"' returns Unit but a value is returned", "declare a return type with '-> Type'");
            check_expr(*rs->value);
        } else {
            check_value(*rs->value, ret, "return value");
        }
        return Flow{true,true};
    }
    if(auto* es = std::get_if<ExprStmt>(&s.data)){
        match_flow_ = Flow{};
        check_expr(*es->expr, std::holds_alternative<Call>(es->expr->data) ? ctx_.unit() : kNoHint);
        if(std::holds_alternative<Match>(es->expr->data)) return match_flow_;
        return {};
    }
    if(auto* is = std::get_if<IfStmt>(&s.data)){
        Flow acc{true,true};
        bool closed = false; // an earlier guard is always true
        for(auto &br: is->branches){
            check_value(*br.cond, ctx_.boolean(), "condition");
            Flow f = check_block(br.body, FrameKind::ControlBody);
            std::optional<bool> fixed = const_condition(*br.cond);
            if(closed || (fixed && !*fixed)) continue;
            acc.returns = acc.returns && f.returns;
            acc.exits = acc.exits && f.exits;
            if(fixed) closed = true;
        }
        Flow f;
        if(is->else_block) f = check_block(*is->else_block, FrameKind::ControlBody);
        if(closed) return acc;
        if(!is->else_block) return {};
        acc.returns = acc.returns && f.returns;
        acc.exits = acc.exits && f.exits;
        return acc;
    }
    if(auto* ws = std::get_if<WhileStmt>(&s.data)){
        check_value(*ws->cond, ctx_.boolean(), "condition");
        loop_breaks_.push_back(false);
        check_block(ws->body, FrameKind::ControlBody);
        bool broke = loop_breaks_.back();
        loop_breaks_.pop_back();
        std::optional<bool> fixed = const_condition(*ws->cond);
        // a loop whose guard is always true and that never breaks does not fall through
        if(fixed && *fixed && !broke) return Flow{true,true};
        return {};
    }
    if(auto* fs = std::get_if<ForStmt>(&s.data)){
        TypeId it = check_expr(*fs->iterable);
        TypeId elem = ctx_.error();
        if(ctx_.is_kind(it, Type::Kind::Array)) elem = ctx_.at(it).elem;
        else if(!ctx_.is_error(it))
            error(DiagKind::TypeMismatch, fs->iterable->pos, "for loop requires an Array, found "+ctx_.to_string(it));
        // the loop variable has its own frame so the body can be checked for shadowing it
        scopes_.push(FrameKind::Block);
        fs->elem_type = elem;
        bind_local(fs->var, elem, false, SlotKind::LoopVar, s.pos, &fs->slot);
        loop_breaks_.push_back(false);
        check_block(fs->body, FrameKind::ControlBody);
        loop_breaks_.pop_back();
        scopes_.pop();
        return {};
    }
    if(std::holds_alternative<BreakStmt>(s.data) || std::holds_alternative<ContinueStmt>(s.data)){
        bool is_break = std::holds_alternative<BreakStmt>(s.data);
        if(loop_breaks_.empty())
            error(DiagKind::InvalidControlFlow, s.pos, std::string("'")+(is_break?"break":"continue")+"' outside of a loop");
        else if(is_break) loop_breaks_.back() = true;
        return Flow{false,true};
    }
    if(auto* bs = std::get_if<BlockStmt>(&s.data)) return check_block(bs->block, FrameKind::Block);
    return {};
}

// ---- expressions -----------------------------------------------------------

TypeId SemanticAnalyzer::check_value(Expr& e, TypeId expected, const std::string& role){
    TypeId v = check_expr(e, expected);
    if(ctx_.is_unit(v) && !ctx_.is_unit(expected)){
        error(DiagKind::TypeMismatch, e.pos, role+" has no value", "the expression returns Unit");
        return ctx_.error();
    }
    if(!ctx_.compatible(expected, v)) type_mismatch(e.pos, role, expected, v);
    return v;
}

TypeId SemanticAnalyzer::check_expr(Expr& e, TypeId expected){
    TypeId t = ctx_.error();
    if(std::holds_alternative<IntLit>(e.data)){
        t = (expected!=kNoHint && ctx_.is_base(expected, BaseType::Mana)) ? ctx_.mana() : ctx_.integer();
    } else if(std::holds_alternative<BoolLit>(e.data)){
        t = ctx_.boolean();
    } else if(std::holds_alternative<StringLit>(e.data)){
        t = (expected!=kNoHint && ctx_.is_base(expected, BaseType::Did)) ? ctx_.did() : ctx_.string();
    } else if(auto* id = std::get_if<Ident>(&e.data)){
        if(const Binding* b = scopes_.lookup(id->name)){
            id->slot = b->slot; id->const_index = b->const_index;
            t = b->type;
        } else if(functions_.count(id->name) || find_builtin_function(id->name) || find_host_function(id->name)){
            error(DiagKind::TypeMismatch, e.pos, "function '"+id->name+"' used as a value", "call it with '"+id->name+"(...)'");
        } else {
            undefined(e.pos, "undefined symbol", id->name, scopes_.visible_names());
        }
    } else if(auto* u = std::get_if<Unary>(&e.data)){
        if(u->op==UnaryOp::Neg){
            TypeId o = check_expr(*u->operand, expected!=kNoHint && ctx_.is_numeric(expected) ? expected : kNoHint);
            if(ctx_.is_numeric(o) || ctx_.is_error(o)) t = o;
            else error(DiagKind::TypeMismatch, e.pos, "unary '-' requires Integer or Mana, found "+ctx_.to_string(o));
        } else {
            TypeId o = check_expr(*u->operand, ctx_.boolean());
            if(ctx_.is_bool(o) || ctx_.is_error(o)) t = ctx_.boolean();
            else error(DiagKind::TypeMismatch, e.pos, "operator '!' requires Bool, found "+ctx_.to_string(o));
        }
    } else if(auto* b = std::get_if<Binary>(&e.data)){
        t = check_binary(e, *b);
    } else if(auto* c = std::get_if<Call>(&e.data)){
        t = check_call(e, *c, expected);
    } else if(auto* m = std::get_if<MethodCall>(&e.data)){
        t = check_method(e, *m, expected);
    } else if(auto* a = std::get_if<ArrayLit>(&e.data)){
        TypeId elem = kNoHint;
        if(expected!=kNoHint && ctx_.is_kind(expected, Type::Kind::Array)) elem = ctx_.at(expected).elem;
        for(auto &el: a->elems){
            if(elem==kNoHint){
                TypeId et = check_expr(*el);
                if(ctx_.is_unit(et)){ error(DiagKind::TypeMismatch, el->pos, "array element has no value"); et = ctx_.error(); }
                elem = et;
            } else {
                check_value(*el, elem, "array element");
            }
        }
        if(elem==kNoHint)
            error(DiagKind::TypeMismatch, e.pos, "cannot infer the element type of an empty array literal", "add a type annotation such as ': Array<Integer>'");
        else
            t = ctx_.get_array(elem);
    } else if(auto* ix = std::get_if<Index>(&e.data)){
        TypeId bt = check_expr(*ix->base);
        TypeId it = check_expr(*ix->index);
        if(!ctx_.is_numeric(it) && !ctx_.is_error(it))
            error(DiagKind::TypeMismatch, ix->index->pos, "array index must be Integer, found "+ctx_.to_string(it));
        if(ctx_.is_kind(bt, Type::Kind::Array)) t = ctx_.at(bt).elem;
        else if(!ctx_.is_error(bt)) error(DiagKind::TypeMismatch, e.pos, "cannot index a value of type "+ctx_.to_string(bt));
    } else if(auto* f = std::get_if<Field>(&e.data)){
        TypeId bt = check_expr(*f->base);
        if(const RecordInfo* ri = ctx_.record_of(bt)){
            int idx = ri->field_index(f->name);
            if(idx<0){
                std::vector<std::string> pool; for(auto &fd: ri->fields) pool.push_back(fd.name);
                undefined(e.pos, "record '"+ri->name+"' has no field", f->name, pool);
            } else { f->index = idx; t = ri->fields[idx].type; }
        } else if(!ctx_.is_error(bt)){
            error(DiagKind::TypeMismatch, e.pos, "field access '."+f->name+"' requires a record, found "+ctx_.to_string(bt));
        }
    } else if(auto* rl = std::get_if<RecordLit>(&e.data)){
        const RecordInfo* ri = ctx_.record(rl->name);
        if(!ri){
            std::vector<std::string> pool; for(auto &rec: program_->records) pool.push_back(rec.name);
            undefined(e.pos, "unknown record type", rl->name, pool);
            for(auto &fi: rl->fields) check_expr(*fi.value);
        } else {
            std::vector<bool> seen(ri->fields.size(), false);
            std::vector<std::string> pool; for(auto &fd: ri->fields) pool.push_back(fd.name);
            for(auto &fi: rl->fields){
                int idx = ri->field_index(fi.name);
                if(idx<0){ undefined(fi.pos, "record '"+ri->name+"' has no field", fi.name, pool); check_expr(*fi.value); continue; }
                if(seen[idx]) error(DiagKind::DuplicateDeclaration, fi.pos, "field '"+fi.name+"' is initialized more than once");
                seen[idx] = true;
                fi.index = idx;
                check_value(*fi.value, ri->fields[idx].type, "field '"+fi.name+"'");
            }
            std::string missing;
            for(size_t i=0;i<seen.size();++i) if(!seen[i]) missing += (missing.empty()?"":", ")+ri->fields[i].name;
            if(!missing.empty())
                error(DiagKind::ArityMismatch, e.pos, "record literal '"+rl->name+"' is missing field(s): "+missing);
            t = ctx_.get_record(rl->name);
        }
    } else if(auto* ol = std::get_if<OptionLit>(&e.data)){
        TypeId hint = (expected!=kNoHint && ctx_.is_kind(expected, Type::Kind::Option)) ? ctx_.at(expected).elem : kNoHint;
        if(ol->value){
            TypeId vt = hint!=kNoHint ? check_value(*ol->value, hint, "Some payload") : check_expr(*ol->value);
            if(hint==kNoHint && ctx_.is_unit(vt)) error(DiagKind::TypeMismatch, ol->value->pos, "Some payload has no value");
            else t = hint!=kNoHint ? expected : ctx_.get_option(vt);
        } else if(hint==kNoHint){
            error(DiagKind::TypeMismatch, e.pos, "cannot infer the type of 'None'", "add a type annotation such as ': Option<Integer>'");
        } else {
            t = expected;
        }
    } else if(auto* rs = std::get_if<ResultLit>(&e.data)){
        TypeId hint = (expected!=kNoHint && ctx_.is_kind(expected, Type::Kind::Result)) ? ctx_.at(expected).elem : kNoHint;
        if(rs->ok){
            TypeId vt = hint!=kNoHint ? check_value(*rs->value, hint, "Ok payload") : check_expr(*rs->value);
            if(hint==kNoHint && ctx_.is_unit(vt)) error(DiagKind::TypeMismatch, rs->value->pos, "Ok payload has no value");
            else t = hint!=kNoHint ? expected : ctx_.get_result(vt);
        } else {
            check_value(*rs->value, ctx_.string(), "Err payload");
            if(hint==kNoHint) error(DiagKind::TypeMismatch, e.pos, "cannot infer the type of 'Err(...)'", "add a type annotation such as ': Result<Integer>'");
            else t = expected;
        }
    } else if(auto* mt = std::get_if<Match>(&e.data)){
        t = check_match(e, *mt, expected);
    }
    e.type = t;
    return t;
}

TypeId SemanticAnalyzer::check_binary(Expr& e, Binary& b){
    const std::string op = binary_op_name(b.op);
    auto operand_error = [&](const std::string& need, TypeId l, TypeId r){
        ErrorReporter rep{&r_->errors,&r_->warnings};
        auto err = rep.make_error(DiagKind::TypeMismatch, "operator '"+op+"' requires "+need, "convert the operands to "+need, e.pos.line, e.pos.col);
        err.notes.push_back(DiagNote{" left: "+ctx_.to_string(l), b.lhs->pos.line, b.lhs->pos.col});
        err.notes.push_back(DiagNote{"right: "+ctx_.to_string(r), b.rhs->pos.line, b.rhs->pos.col});
        rep.emit_error(err);
        r_->success=false;
    };
    switch(b.op){
        case BinaryOp::Add: case BinaryOp::Sub: case BinaryOp::Mul: case BinaryOp::Div: case BinaryOp::Mod:
        case BinaryOp::Lt: case BinaryOp::Le: case BinaryOp::Gt: case BinaryOp::Ge: {
            TypeId l = check_expr(*b.lhs);
            TypeId r = check_expr(*b.rhs, ctx_.is_numeric(l) ? l : kNoHint);
            bool lok = ctx_.is_numeric(l) || ctx_.is_error(l);
            bool rok = ctx_.is_numeric(r) || ctx_.is_error(r);
            if(!lok || !rok){ operand_error("Integer or Mana operands", l, r); return ctx_.error(); }
            bool relational = b.op==BinaryOp::Lt || b.op==BinaryOp::Le || b.op==BinaryOp::Gt || b.op==BinaryOp::Ge;
            if(relational) return ctx_.boolean();
            if(ctx_.is_error(l) || ctx_.is_error(r)) return ctx_.error();
            return (ctx_.is_base(l, BaseType::Mana) || ctx_.is_base(r, BaseType::Mana)) ? ctx_.mana() : ctx_.integer();
        }
        case BinaryOp::Eq: case BinaryOp::Ne: {
            TypeId l = check_expr(*b.lhs);
            TypeId r = check_expr(*b.rhs, l);
            if(!ctx_.is_equatable(l) || !ctx_.is_equatable(r)){ operand_error("scalar operands (Integer, Mana, Bool, String or Did)", l, r); return ctx_.boolean(); }
            if(!ctx_.compatible(l, r)) operand_error("operands of the same type", l, r);
            return ctx_.boolean();
        }
        case BinaryOp::And: case BinaryOp::Or: {
            TypeId l = check_expr(*b.lhs, ctx_.boolean());
            TypeId r = check_expr(*b.rhs, ctx_.boolean());
            bool lok = ctx_.is_bool(l) || ctx_.is_error(l);
            bool rok = ctx_.is_bool(r) || ctx_.is_error(r);
            if(!lok || !rok) operand_error("Bool operands", l, r);
            return ctx_.boolean();
        }
    }
    return ctx_.error();
}

void SemanticAnalyzer::check_args(const std::string& callee, SourcePos pos, std::vector<ExprPtr>& args, size_t first, const std::vector<TypeId>& params){
    size_t provided = args.size()-first;
    if(provided != params.size())
        error(DiagKind::ArityMismatch, pos, "'"+callee+"' expects "+std::to_string(params.size())+" argument(s), got "+std::to_string(provided));
    for(size_t i=first;i<args.size();++i){
        size_t pi = i-first;
        if(pi<params.size()) check_value(*args[i], params[pi], "argument "+std::to_string(pi+1)+" of '"+callee+"'");
        else check_expr(*args[i]);
    }
}

TypeId SemanticAnalyzer::check_call(Expr& e, Call& c, TypeId expected){
    auto fit = functions_.find(c.callee);
    if(fit!=functions_.end()){
        c.kind = CallKind::User;
        const FunctionSig sig = fit->second;
        check_args(c.callee, e.pos, c.args, 0, sig.params);
        return sig.ret;
    }
    if(const BuiltinFunction* bf = find_builtin_function(c.callee)){
        c.kind = CallKind::Builtin;
        c.builtin = bf->id;
        if(c.args.size()!=bf->arity){
            error(DiagKind::ArityMismatch, e.pos, "'"+c.callee+"' expects "+std::to_string(bf->arity)+" argument(s), got "+std::to_string(c.args.size()));
            for(auto &a: c.args) check_expr(*a);
            return ctx_.error();
        }
        TypeId recv = check_expr(*c.args[0]);
        return check_builtin(bf->id, e, *c.args[0], recv, c.args, 1);
    }
    if(const HostFunction* hf = find_host_function(c.callee)){
        c.kind = CallKind::Host;
        c.host_params = hf->params;
        c.host_ret = hf->ret;
        std::vector<TypeId> params;
        for(auto p: hf->params) params.push_back(ctx_.get_base(p));
        check_args(c.callee, e.pos, c.args, 0, params);
        return ctx_.get_base(hf->ret);
    }
    if(is_host_name(c.callee)) return check_host_call(e, c, expected);
    std::vector<std::string> pool = builtin_and_host_names();
    for(auto &kv: functions_) pool.push_back(kv.first);
    undefined(e.pos, "undefined function", c.callee, pool);
    for(auto &a: c.args) check_expr(*a);
    return ctx_.error();
}

// A host function outside the known table takes its parameter types from the arguments
// and its result type from the context; the first call fixes the import signature.
TypeId SemanticAnalyzer::check_host_call(Expr& e, Call& c, TypeId expected){
    HostFunction sig{c.callee, {}, BaseType::Error};
    bool ok = true;
    for(auto &a: c.args){
        TypeId at = check_expr(*a);
        if(ctx_.is_error(at)){ ok = false; continue; }
        if(!boundary_scalar(at)){
            error(DiagKind::TypeMismatch, a->pos, "argument of host function '"+c.callee+"' has type "+ctx_.to_string(at)+", which cannot cross the module boundary",
                  "pass Integer, Mana, Bool, String or Did values");
            ok = false;
            continue;
        }
        sig.params.push_back(ctx_.at(at).base);
    }
    if(expected==kNoHint){
        error(DiagKind::TypeMismatch, e.pos, "cannot infer the result type of host function '"+c.callee+"'",
              "annotate the binding, for example 'let v: Integer = "+c.callee+"(...)'");
        return ctx_.error();
    }
    if(ctx_.is_error(expected)) return ctx_.error();
    if(!ctx_.is_unit(expected) && !boundary_scalar(expected)){
        error(DiagKind::TypeMismatch, e.pos, "host function '"+c.callee+"' cannot return "+ctx_.to_string(expected),
              "host results must be Integer, Mana, Bool, String or Did");
        return ctx_.error();
    }
    sig.ret = ctx_.at(expected).base;
    if(!ok) return expected;

    c.kind = CallKind::Host;
    c.host_params = sig.params;
    c.host_ret = sig.ret;
    auto it = host_uses_.find(c.callee);
    if(it==host_uses_.end()){
        host_uses_.emplace(c.callee, HostUse{sig, e.pos});
        return expected;
    }
    const HostFunction& first = it->second.sig;
    if(first.params!=sig.params || first.ret!=sig.ret){
        ErrorReporter rep{&r_->errors,&r_->warnings};
        auto describe = [&](const HostFunction& h){
            std::string out = "(";
            for(size_t i=0;i<h.params.size();++i){ if(i) out += ", "; out += ctx_.to_string(ctx_.get_base(h.params[i])); }
            return out+") -> "+ctx_.to_string(ctx_.get_base(h.ret));
        };
        auto err = rep.make_error(DiagKind::TypeMismatch, "call to host function '"+c.callee+"' does not match its earlier use",
                                  "every call to an imported function must use one signature", e.pos.line, e.pos.col);
        err.notes.push_back(DiagNote{"first used as "+describe(first), it->second.first.line, it->second.first.col});
        err.notes.push_back(DiagNote{"   called as "+describe(sig), e.pos.line, e.pos.col});
        rep.emit_error(err);
        r_->success=false;
    }
    return expected;
}

TypeId SemanticAnalyzer::check_method(Expr& e, MethodCall& m, TypeId expected){
    (void)expected;
    TypeId recv = check_expr(*m.receiver);
    if(ctx_.is_error(recv)){ for(auto &a: m.args) check_expr(*a); return ctx_.error(); }
    size_t extra = 0;
    Builtin id = find_builtin_method(ctx_, recv, m.method, &extra);
    if(id==Builtin::None){
        undefined(e.pos, "no method on "+ctx_.to_string(recv)+" named", m.method,
                  {"len","push","pop","contains","sum","concat","substring","to_upper","to_lower","trim","char_at","replace","split","format",
                   "is_some","is_none","is_ok","is_err","unwrap_or"});
        for(auto &a: m.args) check_expr(*a);
        return ctx_.error();
    }
    m.builtin = id;
    if(m.args.size()!=extra){
        error(DiagKind::ArityMismatch, e.pos, "method '"+m.method+"' expects "+std::to_string(extra)+" argument(s), got "+std::to_string(m.args.size()));
        for(auto &a: m.args) check_expr(*a);
        return ctx_.error();
    }
    return check_builtin(id, e, *m.receiver, recv, m.args, 0);
}

TypeId SemanticAnalyzer::check_builtin(Builtin id, Expr& site, Expr& receiver, TypeId recv, std::vector<ExprPtr>& args, size_t first){
    (void)site;
    const Type::Kind kind = ctx_.at(recv).kind;
    const TypeId elem = kind==Type::Kind::Base ? ctx_.error() : ctx_.at(recv).elem;
    auto require = [&](bool ok, const char* what){
        if(!ok && !ctx_.is_error(recv))
            error(DiagKind::TypeMismatch, receiver.pos, std::string("'")+builtin_name(id)+"' requires "+what+", found "+ctx_.to_string(recv));
        if(!ok) for(size_t i=first;i<args.size();++i) check_expr(*args[i]);
        return ok;
    };
    auto arg = [&](TypeId want, const char* role){ return check_value(*args[first], want, role); };
    auto numeric = [&](size_t k, TypeId hint, const char* role){
        TypeId t = check_expr(*args[k], hint);
        if(ctx_.is_numeric(t) || ctx_.is_error(t)) return t;
        error(DiagKind::TypeMismatch, args[k]->pos, std::string(role)+" of '"+builtin_name(id)+"' must be Integer or Mana, found "+ctx_.to_string(t));
        return ctx_.error();
    };
    auto mana_rule = [&](TypeId a, TypeId b){
        return (ctx_.is_base(a, BaseType::Mana) || ctx_.is_base(b, BaseType::Mana)) ? ctx_.mana() : ctx_.integer();
    };
    switch(id){
        case Builtin::ArrayLen:
            if(!require(kind==Type::Kind::Array, "an Array")) return ctx_.error();
            return ctx_.integer();
        case Builtin::ArrayPush: {
            if(!require(kind==Type::Kind::Array, "an Array")) return ctx_.error();
            arg(elem, "pushed value");
            check_place_root(receiver, "push onto");
            return ctx_.integer();
        }
        case Builtin::ArrayPop:
            if(!require(kind==Type::Kind::Array, "an Array")) return ctx_.error();
            return elem;
        case Builtin::ArrayContains:
            if(!require(kind==Type::Kind::Array, "an Array")) return ctx_.error();
            if(!ctx_.is_equatable(elem)){
                error(DiagKind::TypeMismatch, receiver.pos, "'contains' requires an array of scalar values, found "+ctx_.to_string(recv));
                check_expr(*args[first]);
                return ctx_.boolean();
            }
            arg(elem, "searched value");
            return ctx_.boolean();
        case Builtin::StringLen:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            return ctx_.integer();
        case Builtin::StringConcat:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            arg(ctx_.string(), "concatenated value");
            return ctx_.string();
        case Builtin::IsSome: case Builtin::IsNone:
            if(!require(kind==Type::Kind::Option, "an Option")) return ctx_.error();
            return ctx_.boolean();
        case Builtin::IsOk: case Builtin::IsErr:
            if(!require(kind==Type::Kind::Result, "a Result")) return ctx_.error();
            return ctx_.boolean();
        case Builtin::UnwrapOr:
            if(!require(kind==Type::Kind::Option || kind==Type::Kind::Result, "an Option or Result")) return ctx_.error();
            arg(elem, "default value");
            return elem;
        case Builtin::Abs: case Builtin::Sqrt:
            if(!require(ctx_.is_numeric(recv), "an Integer or Mana value")) return ctx_.error();
            return recv;
        case Builtin::Min: case Builtin::Max: case Builtin::Pow: {
            if(!require(ctx_.is_numeric(recv), "an Integer or Mana value")) return ctx_.error();
            TypeId other = numeric(first, recv, "second operand");
            if(ctx_.is_error(other)) return ctx_.error();
            return mana_rule(recv, other);
        }
        case Builtin::Sum:
            if(!require(kind==Type::Kind::Array && ctx_.is_numeric(elem), "an Array of Integer or Mana")) return ctx_.error();
            return elem;
        case Builtin::Percentage:
            if(!require(ctx_.is_numeric(recv), "an Integer or Mana value")) return ctx_.error();
            numeric(first, recv, "total");
            return ctx_.integer();
        case Builtin::ApplyPercentage:
            if(!require(ctx_.is_numeric(recv), "an Integer or Mana value")) return ctx_.error();
            numeric(first, ctx_.integer(), "basis points");
            return recv;
        case Builtin::Days: case Builtin::Hours:
            if(!require(ctx_.is_numeric(recv), "an Integer")) return ctx_.error();
            return ctx_.integer();
        case Builtin::AddDuration:
            if(!require(ctx_.is_numeric(recv), "an Integer timestamp")) return ctx_.error();
            numeric(first, ctx_.integer(), "duration");
            return ctx_.integer();
        case Builtin::Require:
            if(!require(ctx_.is_bool(recv), "a Bool condition")) return ctx_.error();
            arg(ctx_.string(), "failure message");
            return ctx_.unit();
        case Builtin::StringContains:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            arg(ctx_.string(), "searched text");
            return ctx_.boolean();
        case Builtin::Substring:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            numeric(first, ctx_.integer(), "start");
            numeric(first+1, ctx_.integer(), "length");
            return ctx_.string();
        case Builtin::ToUpper: case Builtin::ToLower: case Builtin::Trim:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            return ctx_.string();
        case Builtin::CharAt:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            numeric(first, ctx_.integer(), "index");
            return ctx_.integer();
        case Builtin::Replace:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            check_value(*args[first], ctx_.string(), "pattern");
            check_value(*args[first+1], ctx_.string(), "replacement");
            return ctx_.string();
        case Builtin::Split:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            arg(ctx_.string(), "delimiter");
            return ctx_.get_array(ctx_.string());
        case Builtin::Format:
            if(!require(ctx_.is_stringlike(recv), "a String")) return ctx_.error();
            arg(ctx_.get_array(ctx_.string()), "format arguments");
            return ctx_.string();
        case Builtin::None:
            break;
    }
    return ctx_.error();
}

bool SemanticAnalyzer::check_pattern(Pattern& p, TypeId st){
    const Type::Kind kind = ctx_.at(st).kind;
    const bool err = ctx_.is_error(st);
    auto bind = [&](TypeId ty){
        if(p.binding.empty()) return;
        bind_local(p.binding, ty, false, SlotKind::MatchBinding, p.pos, &p.slot);
    };
    auto mismatch = [&](const char* what){
        error(DiagKind::TypeMismatch, p.pos, std::string(what)+" pattern cannot match a value of type "+ctx_.to_string(st));
        return false;
    };
    switch(p.kind){
        case Pattern::Kind::Wildcard: return true;
        case Pattern::Kind::Binding: bind(st); return true;
        case Pattern::Kind::Int: return (ctx_.is_numeric(st) || err) ? true : mismatch("integer");
        case Pattern::Kind::Bool: return (ctx_.is_bool(st) || err) ? true : mismatch("boolean");
        case Pattern::Kind::String: return (ctx_.is_stringlike(st) || err) ? true : mismatch("string");
        case Pattern::Kind::None: return (kind==Type::Kind::Option || err) ? true : mismatch("'None'");
        case Pattern::Kind::Some:
            if(kind!=Type::Kind::Option && !err){ bind(ctx_.error()); return mismatch("'Some'"); }
            bind(err ? ctx_.error() : ctx_.at(st).elem);
            return true;
        case Pattern::Kind::Ok:
            if(kind!=Type::Kind::Result && !err){ bind(ctx_.error()); return mismatch("'Ok'"); }
            bind(err ? ctx_.error() : ctx_.at(st).elem);
            return true;
        case Pattern::Kind::Err:
            if(kind!=Type::Kind::Result && !err){ bind(ctx_.error()); return mismatch("'Err'"); }
            bind(ctx_.string());
            return true;
    }
    return false;
}

TypeId SemanticAnalyzer::check_match(Expr& e, Match& m, TypeId expected){
    TypeId st = check_expr(*m.scrutinee);
    const Type::Kind kind = ctx_.at(st).kind;
    bool matchable = ctx_.is_error(st) || kind==Type::Kind::Option || kind==Type::Kind::Result ||
                     ctx_.is_numeric(st) || ctx_.is_bool(st) || ctx_.is_stringlike(st);
    if(!matchable)
        error(DiagKind::TypeMismatch, m.scrutinee->pos, "cannot match on a value of type "+ctx_.to_string(st));
    bool some=false, none=false, ok=false, errArm=false, yes=false, no=false, irrefutable=false;
    TypeId result = kNoHint;
    Flow all{true,true};
    for(auto &arm: m.arms){
        if(irrefutable) warn(DiagKind::UnreachableCode, arm.pos, "unreachable match arm", "an earlier arm matches every value");
        scopes_.push(FrameKind::Block);
        check_pattern(arm.pattern, st);
        switch(arm.pattern.kind){
            case Pattern::Kind::Wildcard: case Pattern::Kind::Binding: irrefutable = true; break;
            case Pattern::Kind::Some: some = true; break;
            case Pattern::Kind::None: none = true; break;
            case Pattern::Kind::Ok: ok = true; break;
            case Pattern::Kind::Err: errArm = true; break;
            case Pattern::Kind::Bool: (arm.pattern.bool_value ? yes : no) = true; break;
            default: break;
        }
        scopes_.push(FrameKind::ControlBody);
        Flow fl = check_stmts(arm.body.stmts);
        TypeId vt = ctx_.unit();
        if(arm.value) vt = check_expr(*arm.value, result!=kNoHint ? result : expected);
        scopes_.pop();
        bool diverges = fl.exits && !arm.value;
        if(!diverges){
            if(result==kNoHint) result = vt;
            else if(!ctx_.compatible(result, vt)) type_mismatch(arm.value ? arm.value->pos : arm.pos, "match arm", result, vt);
        }
        all.returns = all.returns && fl.returns;
        all.exits = all.exits && fl.exits;
        scopes_.pop();
    }
    bool exhaustive = irrefutable || ctx_.is_error(st) ||
        (kind==Type::Kind::Option && some && none) ||
        (kind==Type::Kind::Result && ok && errArm) ||
        (ctx_.is_bool(st) && yes && no);
    if(!exhaustive && matchable){
        std::string hint = "add a '_' arm";
        if(kind==Type::Kind::Option) hint = "cover both 'Some(..)' and 'None', or add a '_' arm";
        else if(kind==Type::Kind::Result) hint = "cover both 'Ok(..)' and 'Err(..)', or add a '_' arm";
        error(DiagKind::NonExhaustiveMatch, e.pos, "match on "+ctx_.to_string(st)+" does not cover every value", hint);
    }
    match_flow_ = m.arms.empty() ? Flow{} : all;
    return result==kNoHint ? ctx_.unit() : result;
}

} // namespace ccl
