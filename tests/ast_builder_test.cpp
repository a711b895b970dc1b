#include <gtest/gtest.h>
#include "ccl/ast_builder.hpp"
#include "ccl/parser.hpp"

#include <limits>

using namespace ccl;
using namespace ccl::ast;

namespace {

// Parse trees reference the source text, so the source is kept alongside the result.
struct Built {
    std::string source;
    ParseResult parsed;
    BuildResult built;
};

std::unique_ptr<Built> build(const std::string& src){
    auto b = std::make_unique<Built>();
    b->source = src;
    b->parsed = Parser{}.parse_string(b->source);
    if(b->parsed.success) b->built = AstBuilder{}.build(*b->parsed.root);
    return b;
}

const Stmt& body_stmt(const Program& p, size_t fn, size_t i){
    return *p.functions.at(fn).body.stmts.at(i);
}

} // namespace

TEST(AstBuilder, DeclarationsInSourceOrder){
    auto b = build(R"(
        struct Point { x: Integer, y: Integer }
        const LIMIT: Mana = 100;
        fn helper(a: Array<Integer>, o: Option<String>) {}
        fn run() -> Integer { return 0; }
    )");
    ASSERT_TRUE(b->parsed.success) << b->parsed.error_message;
    ASSERT_TRUE(b->built.success);
    const Program& p = b->built.program;
    ASSERT_EQ(p.records.size(), 1u);
    EXPECT_EQ(p.records[0].name, "Point");
    ASSERT_EQ(p.records[0].fields.size(), 2u);
    EXPECT_EQ(p.records[0].fields[1].name, "y");
    ASSERT_EQ(p.constants.size(), 1u);
    EXPECT_EQ(p.constants[0].type.name, "Mana");
    ASSERT_EQ(p.functions.size(), 2u);
    const FunctionDecl& helper = p.functions[0];
    EXPECT_EQ(helper.name, "helper");
    EXPECT_FALSE(helper.ret.has_value());
    ASSERT_EQ(helper.params.size(), 2u);
    EXPECT_EQ(helper.params[0].type.name, "Array");
    ASSERT_EQ(helper.params[0].type.args.size(), 1u);
    EXPECT_EQ(helper.params[0].type.args[0].name, "Integer");
    EXPECT_EQ(helper.params[1].type.args[0].name, "String");
    EXPECT_EQ(p.functions[1].ret->name, "Integer");
    EXPECT_EQ(p.functions[1].pos.line, 5);
}

TEST(AstBuilder, CompoundAssignmentDesugars){
    auto b = build("fn run() -> Integer { let mut x = 1; x += 2; return x; }");
    ASSERT_TRUE(b->built.success);
    const Stmt& s = body_stmt(b->built.program, 0, 1);
    auto* as = std::get_if<AssignStmt>(&s.data);
    ASSERT_NE(as, nullptr);
    auto* target = std::get_if<Ident>(&as->target->data);
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->name, "x");
    auto* bin = std::get_if<Binary>(&as->value->data);
    ASSERT_NE(bin, nullptr);
    EXPECT_EQ(bin->op, BinaryOp::Add);
    EXPECT_EQ(std::get<Ident>(bin->lhs->data).name, "x");
    EXPECT_EQ(std::get<IntLit>(bin->rhs->data).value, 2);

    auto* let = std::get_if<LetStmt>(&body_stmt(b->built.program, 0, 0).data);
    ASSERT_NE(let, nullptr);
    EXPECT_TRUE(let->is_mut);
}

TEST(AstBuilder, StringEscapesAreDecoded){
    auto b = build(R"(fn run() -> String { return "a\n\"b\"\\\tc\q"; })");
    ASSERT_TRUE(b->built.success);
    auto& rs = std::get<ReturnStmt>(body_stmt(b->built.program, 0, 0).data);
    EXPECT_EQ(std::get<StringLit>(rs.value->data).value, "a\n\"b\"\\\tcq");
}

TEST(AstBuilder, IntegerLiteralOutOfRange){
    auto b = build("fn run() -> Integer {\n  return 9223372036854775808;\n}");
    ASSERT_TRUE(b->parsed.success);
    ASSERT_FALSE(b->built.success);
    ASSERT_EQ(b->built.errors.size(), 1u);
    EXPECT_EQ(b->built.errors[0].kind, DiagKind::SyntaxError);
    EXPECT_EQ(b->built.errors[0].code, "E1000");
    EXPECT_EQ(b->built.errors[0].line, 2);
}

TEST(AstBuilder, NegatedMinimumMagnitudeIsOneLiteral){
    auto b = build("fn run() -> Integer { let low = -9223372036854775808; return -5; }");
    ASSERT_TRUE(b->built.success);
    auto& let = std::get<LetStmt>(body_stmt(b->built.program, 0, 0).data);
    EXPECT_EQ(std::get<IntLit>(let.init->data).value, std::numeric_limits<int64_t>::min());
    // other negations stay unary
    auto& rs = std::get<ReturnStmt>(body_stmt(b->built.program, 0, 1).data);
    auto& neg = std::get<Unary>(rs.value->data);
    EXPECT_EQ(neg.op, UnaryOp::Neg);
    EXPECT_EQ(std::get<IntLit>(neg.operand->data).value, 5);

    auto bad = build("fn run() -> Integer { return 1 - 9223372036854775808; }");
    ASSERT_TRUE(bad->parsed.success);
    EXPECT_FALSE(bad->built.success);
}

TEST(AstBuilder, LeftAssociativeChain){
    auto b = build("fn run() -> Integer { return 10 - 3 - 2; }");
    ASSERT_TRUE(b->built.success);
    auto& rs = std::get<ReturnStmt>(body_stmt(b->built.program, 0, 0).data);
    auto& outer = std::get<Binary>(rs.value->data);
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    EXPECT_EQ(std::get<IntLit>(outer.rhs->data).value, 2);
    auto& inner = std::get<Binary>(outer.lhs->data);
    EXPECT_EQ(std::get<IntLit>(inner.lhs->data).value, 10);
    EXPECT_EQ(std::get<IntLit>(inner.rhs->data).value, 3);
}

TEST(AstBuilder, IfChainBranches){
    auto b = build(R"(
        fn run(n: Integer) -> Integer {
            if n > 2 { return 3; } else if n > 1 { return 2; } else { return 1; }
        }
    )");
    ASSERT_TRUE(b->built.success);
    auto& is = std::get<IfStmt>(body_stmt(b->built.program, 0, 0).data);
    EXPECT_EQ(is.branches.size(), 2u);
    ASSERT_TRUE(is.else_block.has_value());
    EXPECT_EQ(is.else_block->stmts.size(), 1u);
}

TEST(AstBuilder, PlacesRecordsAndMethods){
    auto b = build(R"(
        struct Box { items: Array<Integer> }
        fn run() -> Integer {
            let mut b = Box { items: [1, 2] };
            b.items[0] = 5;
            return b.items.len();
        }
    )");
    ASSERT_TRUE(b->built.success);
    const Program& p = b->built.program;
    auto& let = std::get<LetStmt>(body_stmt(p, 0, 0).data);
    auto& rl = std::get<RecordLit>(let.init->data);
    EXPECT_EQ(rl.name, "Box");
    ASSERT_EQ(rl.fields.size(), 1u);
    EXPECT_EQ(std::get<ArrayLit>(rl.fields[0].value->data).elems.size(), 2u);

    auto& as = std::get<AssignStmt>(body_stmt(p, 0, 1).data);
    auto& idx = std::get<Index>(as.target->data);
    auto& field = std::get<Field>(idx.base->data);
    EXPECT_EQ(field.name, "items");
    EXPECT_EQ(std::get<Ident>(field.base->data).name, "b");

    auto& rs = std::get<ReturnStmt>(body_stmt(p, 0, 2).data);
    auto& mc = std::get<MethodCall>(rs.value->data);
    EXPECT_EQ(mc.method, "len");
    EXPECT_TRUE(mc.args.empty());
    EXPECT_TRUE(std::holds_alternative<Field>(mc.receiver->data));
}

TEST(AstBuilder, MatchArmsAndPatterns){
    auto b = build(R"(
        fn run(r: Result<Integer>) -> Integer {
            return match r {
                Ok(v) => v,
                Err(_) => { let fallback = -1; fallback }
            };
        }
    )");
    ASSERT_TRUE(b->built.success);
    auto& rs = std::get<ReturnStmt>(body_stmt(b->built.program, 0, 0).data);
    auto& m = std::get<Match>(rs.value->data);
    ASSERT_EQ(m.arms.size(), 2u);
    EXPECT_EQ(m.arms[0].pattern.kind, Pattern::Kind::Ok);
    EXPECT_EQ(m.arms[0].pattern.binding, "v");
    ASSERT_NE(m.arms[0].value, nullptr);
    EXPECT_EQ(m.arms[1].pattern.kind, Pattern::Kind::Err);
    EXPECT_EQ(m.arms[1].pattern.binding, "");
    EXPECT_EQ(m.arms[1].body.stmts.size(), 1u);
    ASSERT_NE(m.arms[1].value, nullptr);
    EXPECT_EQ(std::get<Ident>(m.arms[1].value->data).name, "fallback");
}

TEST(AstBuilder, ForAndWhileLoops){
    auto b = build(R"(
        fn run(xs: Array<Integer>) -> Integer {
            let mut total = 0;
            for x in xs { total = total + x; }
            while total > 100 { total = total - 100; continue; }
            return total;
        }
    )");
    ASSERT_TRUE(b->built.success);
    const Program& p = b->built.program;
    auto& fs = std::get<ForStmt>(body_stmt(p, 0, 1).data);
    EXPECT_EQ(fs.var, "x");
    EXPECT_EQ(std::get<Ident>(fs.iterable->data).name, "xs");
    auto& ws = std::get<WhileStmt>(body_stmt(p, 0, 2).data);
    ASSERT_EQ(ws.body.stmts.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ContinueStmt>(ws.body.stmts[1]->data));
}
