#pragma once
#include "ccl/ast.hpp"
#include "ccl/diagnostics.hpp"
#include "ccl/parser.hpp"
#include <vector>

namespace ccl {

struct BuildResult { bool success{false}; ast::Program program; std::vector<Diagnostic> errors; };

// Converts a parse tree into the AST. Decodes literals, maps operators and
// desugars compound assignment; never folds or resolves anything.
class AstBuilder {
public:
    BuildResult build(const ParseNode& root);
private:
    std::vector<Diagnostic>* errors_=nullptr;

    ast::FunctionDecl build_function(const ParseNode& n);
    ast::RecordDecl build_record(const ParseNode& n);
    ast::ConstDecl build_const(const ParseNode& n);
    ast::TypeExpr build_type(const ParseNode& n);
    ast::Block build_block(const ParseNode& n);
    ast::StmtPtr build_stmt(const ParseNode& n);
    ast::StmtPtr build_if(const ParseNode& n);
    ast::ExprPtr build_expr(const ParseNode& n);
    ast::ExprPtr build_binary_chain(const ParseNode& n);
    ast::ExprPtr build_postfix(const ParseNode& n);
    ast::ExprPtr build_match(const ParseNode& n);
    ast::Pattern build_pattern(const ParseNode& n);
    ast::ExprPtr build_place(const ParseNode& target);
    std::vector<ast::ExprPtr> build_args(const ParseNode& call_args);
    int64_t decode_int(const ParseNode& n, const std::string& text);
    std::string decode_string(const ParseNode& n);
    void syntax_error(const ParseNode& n, std::string message, std::string hint="");
};

} // namespace ccl
