#include <gtest/gtest.h>
#include "ccl/parser.hpp"
#include "parser/grammar.hpp"

using namespace ccl;
namespace g = ccl::grammar;

namespace {

template<typename Rule>
size_t count_nodes(const ParseNode& n){
    size_t c = (!n.is_root() && n.is_type<Rule>()) ? 1 : 0;
    for(auto& child : n.children) c += count_nodes<Rule>(*child);
    return c;
}

template<typename Rule>
const ParseNode* find_node(const ParseNode& n){
    if(!n.is_root() && n.is_type<Rule>()) return &n;
    for(auto& child : n.children)
        if(const ParseNode* f = find_node<Rule>(*child)) return f;
    return nullptr;
}

} // namespace

TEST(Parser, AcceptsFunctionsRecordsAndConstants){
    const std::string src = R"(
        // governance limits
        const MAX_VOTES: Integer = 10;
        struct Proposal { id: Integer, title: String, votes: Integer }
        /* entry */
        fn run(a: Integer, b: Integer) -> Integer {
            let p = Proposal { id: 1, title: "fund", votes: a };
            return p.votes + b * MAX_VOTES;
        }
    )";
    Parser parser;
    ParseResult r = parser.parse_string(src);
    ASSERT_TRUE(r.success) << r.error_message << " at " << r.line << ":" << r.column;
    EXPECT_EQ(count_nodes<g::const_decl>(*r.root), 1u);
    EXPECT_EQ(count_nodes<g::struct_decl>(*r.root), 1u);
    EXPECT_EQ(count_nodes<g::fn_decl>(*r.root), 1u);
    EXPECT_EQ(count_nodes<g::field_decl>(*r.root), 3u);
    EXPECT_EQ(count_nodes<g::record_lit>(*r.root), 1u);
}

TEST(Parser, ElseIfIsOneChain){
    const std::string src = R"(
        fn grade(score: Integer) -> String {
            if score >= 90 { return "A"; }
            else if score >= 80 { return "B"; }
            else if score >= 70 { return "C"; }
            else { return "F"; }
        }
    )";
    ParseResult r = Parser{}.parse_string(src);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(count_nodes<g::if_stmt>(*r.root), 1u);
    const ParseNode* chain = find_node<g::if_stmt>(*r.root);
    ASSERT_NE(chain, nullptr);
    ASSERT_EQ(chain->children.size(), 4u);
    EXPECT_TRUE(chain->children[0]->is_type<g::if_branch>());
    EXPECT_TRUE(chain->children[1]->is_type<g::else_if_branch>());
    EXPECT_TRUE(chain->children[2]->is_type<g::else_if_branch>());
    EXPECT_TRUE(chain->children[3]->is_type<g::else_branch>());
}

TEST(Parser, LowerCaseConditionIsNotRecordLiteral){
    const std::string src = "fn run(flag: Bool) -> Integer { if flag { return 1; } return 0; }";
    ParseResult r = Parser{}.parse_string(src);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(count_nodes<g::record_lit>(*r.root), 0u);
    EXPECT_EQ(count_nodes<g::if_stmt>(*r.root), 1u);
}

TEST(Parser, PrecedenceGroupsMultiplicationFirst){
    ParseResult r = Parser{}.parse_string("fn run() -> Integer { return 1 + 2 * 3; }");
    ASSERT_TRUE(r.success) << r.error_message;
    const ParseNode* add = find_node<g::add_expr>(*r.root);
    ASSERT_NE(add, nullptr);
    ASSERT_EQ(add->children.size(), 3u);
    EXPECT_TRUE(add->children[0]->is_type<g::int_lit>());
    EXPECT_TRUE(add->children[2]->is_type<g::mul_expr>());
}

TEST(Parser, MatchWithPatterns){
    const std::string src = R"(
        fn run(o: Option<Integer>) -> Integer {
            return match o {
                Some(v) => v,
                None => { let z = 0; z }
            };
        }
    )";
    ParseResult r = Parser{}.parse_string(src);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(count_nodes<g::match_arm>(*r.root), 2u);
    EXPECT_EQ(count_nodes<g::some_pattern>(*r.root), 1u);
    EXPECT_EQ(count_nodes<g::none_pattern>(*r.root), 1u);
    EXPECT_EQ(count_nodes<g::arm_block>(*r.root), 1u);
}

TEST(Parser, MissingSemicolonReportsPosition){
    const std::string src = "fn run() -> Integer {\n    let x = 1\n    return x;\n}";
    ParseResult r = Parser{}.parse_string(src);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.root, nullptr);
    EXPECT_NE(r.error_message.find("expected ';'"), std::string::npos) << r.error_message;
    EXPECT_EQ(r.line, 3);
    EXPECT_EQ(r.column, 5);
}

TEST(Parser, UnterminatedString){
    ParseResult r = Parser{}.parse_string("fn run() -> String { return \"abc; }");
    ASSERT_FALSE(r.success);
    EXPECT_NE(r.error_message.find("unterminated string"), std::string::npos) << r.error_message;
}

TEST(Parser, KeywordIsNotAnIdentifier){
    ParseResult r = Parser{}.parse_string("fn run() { let while = 1; }");
    ASSERT_FALSE(r.success);
    EXPECT_NE(r.error_message.find("expected identifier"), std::string::npos) << r.error_message;
}

TEST(Parser, RejectsStrayTopLevelTokens){
    ParseResult r = Parser{}.parse_string("fn run() {}\nlet x = 1;");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.line, 2);
    EXPECT_NE(r.error_message.find("'fn', 'struct' or 'const'"), std::string::npos) << r.error_message;
}

TEST(Parser, DumpParseTreeShowsContent){
    ParseResult r = Parser{}.parse_string("fn run() -> Integer { return 42; }");
    ASSERT_TRUE(r.success);
    const std::string dump = dump_parse_tree(*r.root);
    EXPECT_EQ(dump.rfind("ROOT", 0), 0u);
    EXPECT_NE(dump.find("fn_decl"), std::string::npos);
    EXPECT_NE(dump.find("int_lit \"42\""), std::string::npos);
}
