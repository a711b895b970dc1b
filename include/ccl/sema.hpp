// Semantic analysis: scoping, type checking, slot assignment.
#pragma once
#include "ccl/ast.hpp"
#include "ccl/builtins.hpp"
#include "ccl/diagnostics.hpp"
#include "ccl/options.hpp"
#include "ccl/scope.hpp"
#include "ccl/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ccl {

struct AnalysisResult { bool success; std::vector<Diagnostic> errors; std::vector<Diagnostic> warnings; };

struct FunctionSig { std::string name; std::vector<TypeId> params; TypeId ret; ast::SourcePos pos; };

class SemanticAnalyzer {
public:
    explicit SemanticAnalyzer(TypeContext& ctx, CompileOptions opts = {}): ctx_(ctx), opts_(std::move(opts)){}
    // Annotates the program in place and collects every error in one pass.
    AnalysisResult analyze(ast::Program& program);

private:
    static constexpr TypeId kNoHint = ~TypeId(0);

    struct Flow { bool returns=false; bool exits=false; };

    TypeContext& ctx_;
    CompileOptions opts_;
    AnalysisResult* r_=nullptr;
    ast::Program* program_=nullptr;
    ScopeStack scopes_;
    std::map<std::string, FunctionSig> functions_;
    // host functions outside the known table, keyed by name, with their first call site
    struct HostUse { HostFunction sig; ast::SourcePos first; };
    std::map<std::string, HostUse> host_uses_;
    // per function state
    ast::FunctionDecl* fn_=nullptr;
    std::vector<bool> loop_breaks_;
    Flow match_flow_{};

    void error(DiagKind k, ast::SourcePos p, std::string msg, std::string hint="");
    void warn(DiagKind k, ast::SourcePos p, std::string msg, std::string hint="");
    void type_mismatch(ast::SourcePos p, const std::string& role, TypeId expected, TypeId actual);
    void undefined(ast::SourcePos p, const std::string& what, const std::string& name, const std::vector<std::string>& pool, std::string hint="");

    TypeId resolve_type(const ast::TypeExpr& t);
    void collect_records(ast::Program& p);
    void collect_constants(ast::Program& p);
    void collect_functions(ast::Program& p);
    void check_function(ast::FunctionDecl& fn);
    void check_entry(const ast::FunctionDecl& run);
    bool boundary_scalar(TypeId t) const;
    bool is_constant_expr(const ast::Expr& e) const;

    int allocate_slot(const std::string& name, TypeId type, ast::SlotKind kind);
    void bind_local(const std::string& name, TypeId type, bool is_mutable, ast::SlotKind kind, ast::SourcePos pos, int* slot_out);

    Flow check_block(ast::Block& b, FrameKind kind);
    Flow check_stmts(std::vector<ast::StmtPtr>& stmts);
    Flow check_stmt(ast::Stmt& s);
    void check_assign(ast::AssignStmt& as, ast::SourcePos pos);
    void check_place_root(const ast::Expr& place, const char* what);

    // Value of a condition built from literals and constants, when it is fixed.
    std::optional<bool> const_condition(const ast::Expr& e) const;
    std::optional<int64_t> const_integer(const ast::Expr& e) const;

    TypeId check_expr(ast::Expr& e, TypeId expected = kNoHint);
    TypeId check_value(ast::Expr& e, TypeId expected, const std::string& role);
    TypeId check_binary(ast::Expr& e, ast::Binary& b);
    TypeId check_call(ast::Expr& e, ast::Call& c, TypeId expected);
    TypeId check_host_call(ast::Expr& e, ast::Call& c, TypeId expected);
    TypeId check_method(ast::Expr& e, ast::MethodCall& m, TypeId expected);
    TypeId check_builtin(ast::Builtin id, ast::Expr& site, ast::Expr& receiver, TypeId recv, std::vector<ast::ExprPtr>& args, size_t first);
    TypeId check_match(ast::Expr& e, ast::Match& m, TypeId expected);
    bool check_pattern(ast::Pattern& p, TypeId scrutinee);
    void check_args(const std::string& callee, ast::SourcePos pos, std::vector<ast::ExprPtr>& args, size_t first, const std::vector<TypeId>& params);
};

// edit-distance helpers used for "did you mean" notes
int edit_distance(const std::string& a, const std::string& b);
std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);
void append_suggestions(Diagnostic& err, const std::vector<std::string>& suggs);

} // namespace ccl
