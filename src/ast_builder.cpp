#include "ccl/ast_builder.hpp"
#include "parser/grammar.hpp"
#include <charconv>
#include <limits>
#include <stdexcept>

namespace ccl {
namespace g = grammar;
using namespace ccl::ast;

static constexpr const char* kMinMagnitude = "9223372036854775808";

static SourcePos pos_of(const ParseNode& n){
    auto p = n.begin();
    return SourcePos{static_cast<int>(p.line), static_cast<int>(p.column)};
}

const char* ast::binary_op_name(BinaryOp op){
    switch(op){
        case BinaryOp::Add: return "+"; case BinaryOp::Sub: return "-"; case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/"; case BinaryOp::Mod: return "%"; case BinaryOp::Eq: return "==";
        case BinaryOp::Ne: return "!="; case BinaryOp::Lt: return "<"; case BinaryOp::Le: return "<=";
        case BinaryOp::Gt: return ">"; case BinaryOp::Ge: return ">="; case BinaryOp::And: return "&&";
        case BinaryOp::Or: return "||";
    }
    return "?";
}

static BinaryOp map_binary(const std::string& s){
    if(s=="+") return BinaryOp::Add; if(s=="-") return BinaryOp::Sub; if(s=="*") return BinaryOp::Mul;
    if(s=="/") return BinaryOp::Div; if(s=="%") return BinaryOp::Mod; if(s=="==") return BinaryOp::Eq;
    if(s=="!=") return BinaryOp::Ne; if(s=="<") return BinaryOp::Lt; if(s=="<=") return BinaryOp::Le;
    if(s==">") return BinaryOp::Gt; if(s==">=") return BinaryOp::Ge; if(s=="&&") return BinaryOp::And;
    if(s=="||") return BinaryOp::Or;
    throw std::logic_error("unknown binary operator '"+s+"'");
}

void AstBuilder::syntax_error(const ParseNode& n, std::string message, std::string hint){
    ErrorReporter rep{errors_, nullptr};
    auto p = pos_of(n);
    rep.emit_error(rep.make_error(DiagKind::SyntaxError, std::move(message), std::move(hint), p.line, p.col));
}

BuildResult AstBuilder::build(const ParseNode& root){
    BuildResult r; errors_ = &r.errors;
    const ParseNode* contract = &root;
    if(root.is_root() && !root.children.empty()) contract = root.children.front().get();
    for(auto &c: contract->children){
        if(c->is_type<g::fn_decl>()) r.program.functions.push_back(build_function(*c));
        else if(c->is_type<g::struct_decl>()) r.program.records.push_back(build_record(*c));
        else if(c->is_type<g::const_decl>()) r.program.constants.push_back(build_const(*c));
        else syntax_error(*c, "unexpected top-level form");
    }
    errors_ = nullptr;
    r.success = r.errors.empty();
    return r;
}

TypeExpr AstBuilder::build_type(const ParseNode& n){
    TypeExpr t; t.pos = pos_of(n);
    t.name = n.children.at(0)->string();
    for(size_t i=1;i<n.children.size();++i) t.args.push_back(build_type(*n.children[i]));
    return t;
}

FunctionDecl AstBuilder::build_function(const ParseNode& n){
    FunctionDecl fn; fn.pos = pos_of(n);
    fn.name = n.children.at(0)->string();
    for(auto &p: n.children.at(1)->children){
        Param param; param.pos = pos_of(*p);
        param.name = p->children.at(0)->string();
        param.type = build_type(*p->children.at(1));
        fn.params.push_back(std::move(param));
    }
    size_t i = 2;
    if(n.children.at(i)->is_type<g::type_expr>()) fn.ret = build_type(*n.children[i++]);
    fn.body = build_block(*n.children.at(i));
    return fn;
}

RecordDecl AstBuilder::build_record(const ParseNode& n){
    RecordDecl rec; rec.pos = pos_of(n);
    rec.name = n.children.at(0)->string();
    for(size_t i=1;i<n.children.size();++i){
        auto &f = *n.children[i];
        FieldDecl fd; fd.pos = pos_of(f);
        fd.name = f.children.at(0)->string();
        fd.type = build_type(*f.children.at(1));
        rec.fields.push_back(std::move(fd));
    }
    return rec;
}

ConstDecl AstBuilder::build_const(const ParseNode& n){
    ConstDecl c; c.pos = pos_of(n);
    c.name = n.children.at(0)->string();
    c.type = build_type(*n.children.at(1));
    c.value = build_expr(*n.children.at(2));
    return c;
}

Block AstBuilder::build_block(const ParseNode& n){
    Block b; b.pos = pos_of(n);
    for(auto &c: n.children) b.stmts.push_back(build_stmt(*c));
    return b;
}

StmtPtr AstBuilder::build_stmt(const ParseNode& n){
    SourcePos pos = pos_of(n);
    if(n.is_type<g::let_stmt>()){
        LetStmt let; size_t i=0;
        if(n.children.at(0)->is_type<g::mut_kw>()){ let.is_mut = true; ++i; }
        let.name = n.children.at(i++)->string();
        if(n.children.at(i)->is_type<g::type_expr>()) let.annotation = build_type(*n.children[i++]);
        let.init = build_expr(*n.children.at(i));
        return make_stmt(std::move(let), pos);
    }
    if(n.is_type<g::assign_stmt>()){
        AssignStmt as;
        as.target = build_place(*n.children.at(0));
        as.value = build_expr(*n.children.at(1));
        return make_stmt(std::move(as), pos);
    }
    if(n.is_type<g::compound_assign_stmt>()){
        // x op= e  =>  x = x op e
        auto &name = *n.children.at(0);
        std::string op = n.children.at(1)->string();
        op.pop_back();
        AssignStmt as;
        as.target = make_expr(Ident{name.string()}, pos_of(name));
        Binary bin{map_binary(op), make_expr(Ident{name.string()}, pos_of(name)), build_expr(*n.children.at(2))};
        as.value = make_expr(std::move(bin), pos_of(*n.children[1]));
        return make_stmt(std::move(as), pos);
    }
    if(n.is_type<g::return_stmt>()){
        ReturnStmt rs;
        if(!n.children.empty()) rs.value = build_expr(*n.children.front());
        return make_stmt(std::move(rs), pos);
    }
    if(n.is_type<g::break_stmt>()) return make_stmt(BreakStmt{}, pos);
    if(n.is_type<g::continue_stmt>()) return make_stmt(ContinueStmt{}, pos);
    if(n.is_type<g::if_stmt>()) return build_if(n);
    if(n.is_type<g::while_stmt>()){
        WhileStmt ws;
        ws.cond = build_expr(*n.children.at(0));
        ws.body = build_block(*n.children.at(1));
        return make_stmt(std::move(ws), pos);
    }
    if(n.is_type<g::for_stmt>()){
        ForStmt fs;
        fs.var = n.children.at(0)->string();
        fs.iterable = build_expr(*n.children.at(1));
        fs.body = build_block(*n.children.at(2));
        return make_stmt(std::move(fs), pos);
    }
    if(n.is_type<g::block_stmt>()) return make_stmt(BlockStmt{build_block(n)}, pos);
    if(n.is_type<g::match_stmt>() || n.is_type<g::expr_stmt>() || n.is_type<g::arm_expr_stmt>())
        return make_stmt(ExprStmt{build_expr(*n.children.at(0))}, pos);
    syntax_error(n, "unsupported statement form");
    return make_stmt(ExprStmt{make_expr(IntLit{0}, pos)}, pos);
}

StmtPtr AstBuilder::build_if(const ParseNode& n){
    IfStmt is;
    for(auto &c: n.children){
        if(c->is_type<g::else_branch>()){ is.else_block = build_block(*c->children.at(0)); continue; }
        IfBranch br;
        br.cond = build_expr(*c->children.at(0));
        br.body = build_block(*c->children.at(1));
        is.branches.push_back(std::move(br));
    }
    return make_stmt(std::move(is), pos_of(n));
}

ExprPtr AstBuilder::build_place(const ParseNode& target){
    auto &head = *target.children.at(0);
    ExprPtr e = make_expr(Ident{head.string()}, pos_of(head));
    for(size_t i=1;i<target.children.size();++i){
        auto &s = *target.children[i];
        if(s.is_type<g::field_suffix>()) e = make_expr(Field{std::move(e), s.children.at(0)->string()}, pos_of(s));
        else e = make_expr(Index{std::move(e), build_expr(*s.children.at(0))}, pos_of(s));
    }
    return e;
}

std::vector<ExprPtr> AstBuilder::build_args(const ParseNode& call_args){
    std::vector<ExprPtr> args;
    for(auto &a: call_args.children) args.push_back(build_expr(*a));
    return args;
}

int64_t AstBuilder::decode_int(const ParseNode& n, const std::string& text){
    int64_t v = 0;
    auto res = std::from_chars(text.data(), text.data()+text.size(), v);
    if(res.ec != std::errc() || res.ptr != text.data()+text.size()){
        syntax_error(n, "integer literal '"+text+"' does not fit in 64 bits", "use a value between -9223372036854775808 and 9223372036854775807");
        return 0;
    }
    return v;
}

std::string AstBuilder::decode_string(const ParseNode& n){
    std::string raw = n.string();
    std::string out;
    // strip the surrounding quotes
    for(size_t i=1;i+1<raw.size();++i){
        char c = raw[i];
        if(c!='\\'){ out.push_back(c); continue; }
        char e = raw[++i];
        switch(e){
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case '0': out.push_back('\0'); break;
            default: out.push_back(e); break;
        }
    }
    return out;
}

ExprPtr AstBuilder::build_binary_chain(const ParseNode& n){
    ExprPtr lhs = build_expr(*n.children.at(0));
    for(size_t i=1;i+1<n.children.size();i+=2){
        auto &op = *n.children[i];
        Binary bin{map_binary(op.string()), std::move(lhs), build_expr(*n.children[i+1])};
        lhs = make_expr(std::move(bin), pos_of(op));
    }
    return lhs;
}

ExprPtr AstBuilder::build_postfix(const ParseNode& n){
    ExprPtr e = build_expr(*n.children.at(0));
    for(size_t i=1;i<n.children.size();++i){
        auto &s = *n.children[i];
        SourcePos p = pos_of(s);
        if(s.is_type<g::method_suffix>()){
            MethodCall mc{std::move(e), s.children.at(0)->string(), build_args(*s.children.at(1))};
            e = make_expr(std::move(mc), p);
        } else if(s.is_type<g::field_suffix>()){
            e = make_expr(Field{std::move(e), s.children.at(0)->string()}, p);
        } else {
            e = make_expr(Index{std::move(e), build_expr(*s.children.at(0))}, p);
        }
    }
    return e;
}

Pattern AstBuilder::build_pattern(const ParseNode& n){
    Pattern p; p.pos = pos_of(n);
    auto inner = [&](Pattern::Kind k){
        p.kind = k;
        auto &b = *n.children.at(0);
        if(b.is_type<g::binding_name>()) p.binding = b.string();
    };
    if(n.is_type<g::some_pattern>()) inner(Pattern::Kind::Some);
    else if(n.is_type<g::ok_pattern>()) inner(Pattern::Kind::Ok);
    else if(n.is_type<g::err_pattern>()) inner(Pattern::Kind::Err);
    else if(n.is_type<g::none_pattern>()) p.kind = Pattern::Kind::None;
    else if(n.is_type<g::bool_lit>()){ p.kind = Pattern::Kind::Bool; p.bool_value = n.string()=="true"; }
    else if(n.is_type<g::int_pattern>()){ p.kind = Pattern::Kind::Int; p.int_value = decode_int(n, n.string()); }
    else if(n.is_type<g::string_lit>()){ p.kind = Pattern::Kind::String; p.text = decode_string(n); }
    else if(n.is_type<g::binding_name>()){ p.kind = Pattern::Kind::Binding; p.binding = n.string(); }
    else p.kind = Pattern::Kind::Wildcard;
    return p;
}

ExprPtr AstBuilder::build_match(const ParseNode& n){
    Match m;
    m.scrutinee = build_expr(*n.children.at(0));
    for(size_t i=1;i<n.children.size();++i){
        auto &armNode = *n.children[i];
        MatchArm arm; arm.pos = pos_of(armNode);
        arm.pattern = build_pattern(*armNode.children.at(0));
        auto &body = *armNode.children.at(1);
        if(body.is_type<g::arm_block>()){
            arm.body.pos = pos_of(body);
            size_t count = body.children.size();
            // a trailing child that is not a statement is the arm value
            if(count>0){
                auto &last = *body.children.back();
                bool is_stmt = last.is_type<g::let_stmt>() || last.is_type<g::assign_stmt>() || last.is_type<g::compound_assign_stmt>() ||
                    last.is_type<g::return_stmt>() || last.is_type<g::break_stmt>() || last.is_type<g::continue_stmt>() ||
                    last.is_type<g::if_stmt>() || last.is_type<g::while_stmt>() || last.is_type<g::for_stmt>() ||
                    last.is_type<g::match_stmt>() || last.is_type<g::block_stmt>() || last.is_type<g::arm_expr_stmt>();
                if(!is_stmt){ arm.value = build_expr(last); --count; }
            }
            for(size_t k=0;k<count;++k) arm.body.stmts.push_back(build_stmt(*body.children[k]));
        } else {
            arm.value = build_expr(body);
        }
        m.arms.push_back(std::move(arm));
    }
    return make_expr(std::move(m), pos_of(n));
}

ExprPtr AstBuilder::build_expr(const ParseNode& n){
    SourcePos pos = pos_of(n);
    if(n.is_type<g::int_lit>()) return make_expr(IntLit{decode_int(n, n.string())}, pos);
    if(n.is_type<g::string_lit>()) return make_expr(StringLit{decode_string(n)}, pos);
    if(n.is_type<g::bool_lit>()) return make_expr(BoolLit{n.string()=="true"}, pos);
    if(n.is_type<g::ident>()) return make_expr(Ident{n.string()}, pos);
    if(n.is_type<g::call_expr>()){
        Call c; c.callee = n.children.at(0)->string(); c.args = build_args(*n.children.at(1));
        return make_expr(std::move(c), pos);
    }
    if(n.is_type<g::array_lit>()){
        ArrayLit a;
        for(auto &c: n.children) a.elems.push_back(build_expr(*c));
        return make_expr(std::move(a), pos);
    }
    if(n.is_type<g::record_lit>()){
        RecordLit rl; rl.name = n.children.at(0)->string();
        for(size_t i=1;i<n.children.size();++i){
            auto &f = *n.children[i];
            FieldInit fi; fi.pos = pos_of(f);
            fi.name = f.children.at(0)->string();
            fi.value = build_expr(*f.children.at(1));
            rl.fields.push_back(std::move(fi));
        }
        return make_expr(std::move(rl), pos);
    }
    if(n.is_type<g::some_expr>()) return make_expr(OptionLit{build_expr(*n.children.at(0))}, pos);
    if(n.is_type<g::none_lit>()) return make_expr(OptionLit{}, pos);
    if(n.is_type<g::ok_expr>()) return make_expr(ResultLit{true, build_expr(*n.children.at(0))}, pos);
    if(n.is_type<g::err_expr>()) return make_expr(ResultLit{false, build_expr(*n.children.at(0))}, pos);
    if(n.is_type<g::match_expr>()) return build_match(n);
    if(n.is_type<g::postfix_expr>()) return build_postfix(n);
    if(n.is_type<g::unary_expr>()){
        UnaryOp op = n.children.at(0)->string()=="!" ? UnaryOp::Not : UnaryOp::Neg;
        // 9223372036854775808 only fits once negated
        if(op==UnaryOp::Neg){
            const ParseNode* lit = n.children.at(1).get();
            while(!lit->is_type<g::int_lit>() && lit->children.size()==1) lit = lit->children.front().get();
            if(lit->is_type<g::int_lit>() && lit->string()==kMinMagnitude)
                return make_expr(IntLit{std::numeric_limits<int64_t>::min()}, pos);
        }
        return make_expr(Unary{op, build_expr(*n.children.at(1))}, pos);
    }
    if(n.is_type<g::mul_expr>() || n.is_type<g::add_expr>() || n.is_type<g::rel_expr>() ||
       n.is_type<g::eq_expr>() || n.is_type<g::and_expr>() || n.is_type<g::expr>())
        return build_binary_chain(n);
    syntax_error(n, "unsupported expression form");
    return make_expr(IntLit{0}, pos);
}

} // namespace ccl
