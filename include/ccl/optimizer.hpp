// AST level optimizer: constant folding, constant propagation, dead branch removal.
#pragma once
#include <cstddef>
#include <vector>
#include "ccl/ast.hpp"
#include "ccl/types.hpp"

namespace ccl {

struct OptimizeStats {
    size_t folded = 0;
    size_t constants_propagated = 0;
    size_t branches_removed = 0;
    size_t loops_removed = 0;
};

// Runs on a program that passed semantic analysis. Type ids on rewritten nodes are kept.
class Optimizer {
public:
    explicit Optimizer(TypeContext& ctx): ctx_(ctx){}
    OptimizeStats optimize(ast::Program& program);

private:
    TypeContext& ctx_;
    OptimizeStats stats_{};
    // folded initializer per constant, null when it did not reduce to a literal
    std::vector<const ast::Expr*> constants_;

    void fold(ast::ExprPtr& e);
    void fold_unary(ast::ExprPtr& e);
    void fold_binary(ast::ExprPtr& e);
    void optimize_block(ast::Block& b);
    // Returns false when the statement should be dropped.
    bool optimize_stmt(ast::StmtPtr& s);
};

} // namespace ccl
