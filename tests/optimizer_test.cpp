#include <gtest/gtest.h>
#include "ccl/ast_builder.hpp"
#include "ccl/optimizer.hpp"
#include "ccl/parser.hpp"
#include "ccl/sema.hpp"

#include <limits>

using namespace ccl;
using namespace ccl::ast;

namespace {

struct Optimized {
    std::string source;
    ParseResult parsed;
    BuildResult built;
    TypeContext tctx;
    OptimizeStats stats;
};

std::unique_ptr<Optimized> optimize(const std::string& src){
    auto o = std::make_unique<Optimized>();
    o->source = src;
    o->parsed = Parser{}.parse_string(o->source);
    if(!o->parsed.success){ ADD_FAILURE() << o->parsed.error_message; return o; }
    o->built = AstBuilder{}.build(*o->parsed.root);
    SemanticAnalyzer sema(o->tctx);
    AnalysisResult r = sema.analyze(o->built.program);
    if(!r.success){
        for(auto& e : r.errors) ADD_FAILURE() << format_diagnostic(e);
        return o;
    }
    o->stats = Optimizer(o->tctx).optimize(o->built.program);
    return o;
}

const Expr& returned(const Optimized& o, size_t fn = 0, size_t stmt = 0){
    return *std::get<ReturnStmt>(o.built.program.functions.at(fn).body.stmts.at(stmt)->data).value;
}

} // namespace

TEST(Optimizer, FoldsArithmetic){
    auto o = optimize("fn run() -> Integer { return 2 + 3 * 4 - -1; }");
    const Expr& e = returned(*o);
    ASSERT_TRUE(std::holds_alternative<IntLit>(e.data));
    EXPECT_EQ(std::get<IntLit>(e.data).value, 15);
    EXPECT_EQ(o->stats.folded, 4u);
    EXPECT_EQ(o->tctx.to_string(e.type), "Integer");
}

TEST(Optimizer, WrapsLikeTheRuntime){
    auto o = optimize("fn run() -> Integer { return 9223372036854775807 + 1; }");
    const Expr& e = returned(*o);
    ASSERT_TRUE(std::holds_alternative<IntLit>(e.data));
    EXPECT_EQ(std::get<IntLit>(e.data).value, std::numeric_limits<int64_t>::min());
}

TEST(Optimizer, LeavesTrappingDivisionAlone){
    auto o = optimize(R"(
        fn run() -> Integer { return 1 / 0; }
        fn b() -> Integer { return (-9223372036854775807 - 1) / -1; }
        fn c() -> Integer { return 7 % 0; }
        fn d() -> Integer { return 7 % -1; }
    )");
    EXPECT_TRUE(std::holds_alternative<Binary>(returned(*o, 0).data));
    const Expr& b = returned(*o, 1);
    ASSERT_TRUE(std::holds_alternative<Binary>(b.data));
    EXPECT_EQ(std::get<IntLit>(std::get<Binary>(b.data).lhs->data).value, std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(std::holds_alternative<Binary>(returned(*o, 2).data));
    const Expr& d = returned(*o, 3);
    ASSERT_TRUE(std::holds_alternative<IntLit>(d.data));
    EXPECT_EQ(std::get<IntLit>(d.data).value, 0);
}

TEST(Optimizer, PropagatesConstantsAndKeepsMana){
    auto o = optimize(R"(
        const BASE: Mana = 2 * 5;
        const GREETING: String = "hi";
        fn run() -> Mana { return BASE + 1; }
        fn greet() -> String { return GREETING; }
    )");
    const Expr& e = returned(*o, 0);
    ASSERT_TRUE(std::holds_alternative<IntLit>(e.data));
    EXPECT_EQ(std::get<IntLit>(e.data).value, 11);
    EXPECT_EQ(o->tctx.to_string(e.type), "Mana");
    EXPECT_EQ(o->stats.constants_propagated, 2u);
    const Expr& g = returned(*o, 1);
    ASSERT_TRUE(std::holds_alternative<StringLit>(g.data));
    EXPECT_EQ(std::get<StringLit>(g.data).value, "hi");
    EXPECT_EQ(o->tctx.to_string(g.type), "String");
}

TEST(Optimizer, ShortCircuitRules){
    auto o = optimize(R"(
        fn side(x: Integer) -> Bool { return x > 0; }
        fn run(flag: Bool) -> Bool {
            let a = false && side(1);
            let b = true || side(2);
            let c = true && flag;
            let d = false || flag;
            return a || b || c || d;
        }
    )");
    auto& body = o->built.program.functions[1].body.stmts;
    auto init = [&](size_t i) -> const Expr& { return *std::get<LetStmt>(body.at(i)->data).init; };
    EXPECT_FALSE(std::get<BoolLit>(init(0).data).value);
    EXPECT_TRUE(std::get<BoolLit>(init(1).data).value);
    EXPECT_EQ(std::get<Ident>(init(2).data).name, "flag");
    EXPECT_EQ(o->tctx.to_string(init(2).type), "Bool");
    EXPECT_EQ(std::get<Ident>(init(3).data).name, "flag");
}

TEST(Optimizer, LiteralTrueGuardBecomesBlock){
    auto o = optimize(R"(
        fn run() -> Integer {
            if true { return 1; } else { return 2; }
        }
    )");
    auto& body = o->built.program.functions[0].body.stmts;
    ASSERT_EQ(body.size(), 1u);
    auto* bs = std::get_if<BlockStmt>(&body[0]->data);
    ASSERT_NE(bs, nullptr);
    EXPECT_EQ(std::get<IntLit>(std::get<ReturnStmt>(bs->block.stmts.at(0)->data).value->data).value, 1);
    EXPECT_EQ(o->stats.branches_removed, 1u);
}

TEST(Optimizer, FalseBranchesAreDropped){
    auto o = optimize(R"(
        const DEBUG: Bool = false;
        fn run(n: Integer) -> Integer {
            if DEBUG { return 99; }
            if n > 0 { return 1; } else if 1 > 2 { return 2; } else { return 3; }
        }
    )");
    auto& body = o->built.program.functions[0].body.stmts;
    ASSERT_EQ(body.size(), 1u);
    auto& is = std::get<IfStmt>(body[0]->data);
    EXPECT_EQ(is.branches.size(), 1u);
    EXPECT_TRUE(is.else_block.has_value());
    EXPECT_EQ(o->stats.branches_removed, 2u);
}

TEST(Optimizer, WhileFalseIsRemoved){
    auto o = optimize(R"(
        fn run() -> Integer {
            let mut i = 0;
            while 1 > 2 { i = i + 1; }
            while i < 3 { i = i + 1; }
            return i;
        }
    )");
    auto& body = o->built.program.functions[0].body.stmts;
    ASSERT_EQ(body.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<WhileStmt>(body[1]->data));
    EXPECT_EQ(o->stats.loops_removed, 1u);
}

TEST(Optimizer, FoldsInsideNestedExpressions){
    auto o = optimize(R"(
        fn run() -> Integer {
            let xs = [1 + 1, 2 * 2];
            let o: Option<Integer> = Some(10 - 4);
            return match o { Some(v) => v + (3 - 3), None => xs[0 + 1] };
        }
    )");
    auto& body = o->built.program.functions[0].body.stmts;
    auto& arr = std::get<ArrayLit>(std::get<LetStmt>(body[0]->data).init->data);
    EXPECT_EQ(std::get<IntLit>(arr.elems[0]->data).value, 2);
    EXPECT_EQ(std::get<IntLit>(arr.elems[1]->data).value, 4);
    auto& some = std::get<OptionLit>(std::get<LetStmt>(body[1]->data).init->data);
    EXPECT_EQ(std::get<IntLit>(some.value->data).value, 6);
    auto& m = std::get<Match>(std::get<ReturnStmt>(body[2]->data).value->data);
    auto& idx = std::get<Index>(m.arms[1].value->data);
    EXPECT_EQ(std::get<IntLit>(idx.index->data).value, 1);
}
