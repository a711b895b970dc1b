#pragma once
#include <string>
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace ccl::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : seq< two<'/'>, until< eolf > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct space_or_comment : sor< space, comment_line, block_comment > {};
struct sp : star< space_or_comment > {};

// A token followed by trivia.
template<typename Rule>
struct tok : seq< Rule, sp > {};

// Keywords
struct kw_fn : TAO_PEGTL_KEYWORD("fn") {};
struct kw_struct : TAO_PEGTL_KEYWORD("struct") {};
struct kw_const : TAO_PEGTL_KEYWORD("const") {};
struct kw_let : TAO_PEGTL_KEYWORD("let") {};
struct kw_mut : TAO_PEGTL_KEYWORD("mut") {};
struct kw_return : TAO_PEGTL_KEYWORD("return") {};
struct kw_if : TAO_PEGTL_KEYWORD("if") {};
struct kw_else : TAO_PEGTL_KEYWORD("else") {};
struct kw_while : TAO_PEGTL_KEYWORD("while") {};
struct kw_for : TAO_PEGTL_KEYWORD("for") {};
struct kw_in : TAO_PEGTL_KEYWORD("in") {};
struct kw_match : TAO_PEGTL_KEYWORD("match") {};
struct kw_break : TAO_PEGTL_KEYWORD("break") {};
struct kw_continue : TAO_PEGTL_KEYWORD("continue") {};
struct kw_true : TAO_PEGTL_KEYWORD("true") {};
struct kw_false : TAO_PEGTL_KEYWORD("false") {};
struct kw_some : TAO_PEGTL_KEYWORD("Some") {};
struct kw_none : TAO_PEGTL_KEYWORD("None") {};
struct kw_ok : TAO_PEGTL_KEYWORD("Ok") {};
struct kw_err : TAO_PEGTL_KEYWORD("Err") {};
struct any_keyword : sor< kw_fn, kw_struct, kw_const, kw_let, kw_mut, kw_return, kw_if, kw_else, kw_while, kw_for,
                          kw_in, kw_match, kw_break, kw_continue, kw_true, kw_false, kw_some, kw_none, kw_ok, kw_err > {};

struct ident : seq< not_at< any_keyword >, identifier > {};
// Record names start upper-case so `if flag { ... }` never reads as a record literal.
struct record_name : seq< not_at< any_keyword >, range<'A','Z'>, star< identifier_other > > {};
struct type_name : ident {};
struct binding_name : ident {};
struct mut_kw : TAO_PEGTL_KEYWORD("mut") {};

// Punctuation
struct lparen : tok< one<'('> > {};
struct rparen : tok< one<')'> > {};
struct lbrace : tok< one<'{'> > {};
struct rbrace : tok< one<'}'> > {};
struct lbracket : tok< one<'['> > {};
struct rbracket : tok< one<']'> > {};
struct langle : tok< one<'<'> > {};
struct rangle : tok< one<'>'> > {};
struct comma : tok< one<','> > {};
struct colon : tok< one<':'> > {};
struct semi : tok< one<';'> > {};
struct dot : tok< one<'.'> > {};
struct arrow : tok< string<'-','>'> > {};
struct fat_arrow : tok< string<'=','>'> > {};
struct assign_eq : tok< seq< one<'='>, not_at< one<'=','>'> > > > {};

// Literals
struct int_lit : seq< plus< digit >, not_at< identifier_other > > {};
struct escaped_char : seq< one<'\\'>, any > {};
struct plain_char : not_one< '"', '\\' > {};
struct string_body : until< one<'"'>, sor< escaped_char, plain_char > > {};
struct string_lit : seq< one<'"'>, must< string_body > > {};
struct bool_lit : sor< kw_true, kw_false > {};

// Types: Name or Name<T, ...>
struct type_expr;
struct type_args : seq< langle, must< type_expr >, star< comma, must< type_expr > >, must< rangle > > {};
struct type_expr : seq< tok< type_name >, opt< type_args > > {};

// Operators
struct unary_op : sor< seq< one<'!'>, not_at< one<'='> > >, seq< one<'-'>, not_at< one<'>','='> > > > {};
struct mul_op : sor< seq< one<'*'>, not_at< one<'='> > >, seq< one<'/'>, not_at< one<'='> > >, seq< one<'%'>, not_at< one<'='> > > > {};
struct add_op : sor< seq< one<'+'>, not_at< one<'='> > >, seq< one<'-'>, not_at< one<'=','>'> > > > {};
struct rel_op : sor< string<'<','='>, string<'>','='>, one<'<'>, one<'>'> > {};
struct eq_op : sor< string<'=','='>, string<'!','='> > {};
struct and_op : string<'&','&'> {};
struct or_op : string<'|','|'> {};
struct compound_op : sor< string<'+','='>, string<'-','='>, string<'*','='>, string<'/','='>, string<'%','='> > {};

// Expressions
struct expr;
struct stmt;
struct arm_stmt;

struct call_args : seq< lparen, opt< expr, star< comma, must< expr > > >, must< rparen > > {};
struct paren_expr : seq< lparen, must< expr >, must< rparen > > {};
struct array_lit : seq< lbracket, opt< expr, star< comma, expr > >, opt< comma >, must< rbracket > > {};

struct record_peek : at< one<'{'>, sp, identifier, sp, one<':'> > {};
struct field_init : seq< tok< ident >, must< colon >, must< expr > > {};
struct record_lit : seq< tok< record_name >, record_peek, lbrace, field_init, star< comma, field_init >, opt< comma >, must< rbrace > > {};

struct some_expr : seq< tok< kw_some >, must< lparen >, must< expr >, must< rparen > > {};
struct none_lit : tok< kw_none > {};
struct ok_expr : seq< tok< kw_ok >, must< lparen >, must< expr >, must< rparen > > {};
struct err_expr : seq< tok< kw_err >, must< lparen >, must< expr >, must< rparen > > {};

// match
struct int_pattern : seq< opt< one<'-'> >, plus< digit > > {};
struct wildcard_pattern : seq< one<'_'>, not_at< identifier_other > > {};
struct inner_binding : sor< wildcard_pattern, binding_name > {};
struct some_pattern : seq< tok< kw_some >, must< lparen >, must< tok< inner_binding > >, must< rparen > > {};
struct none_pattern : tok< kw_none > {};
struct ok_pattern : seq< tok< kw_ok >, must< lparen >, must< tok< inner_binding > >, must< rparen > > {};
struct err_pattern : seq< tok< kw_err >, must< lparen >, must< tok< inner_binding > >, must< rparen > > {};
struct pattern : sor< some_pattern, none_pattern, ok_pattern, err_pattern, tok< bool_lit >, tok< int_pattern >,
                      tok< string_lit >, tok< wildcard_pattern >, tok< binding_name > > {};
struct arm_block : seq< lbrace, star< arm_stmt >, opt< expr >, must< rbrace > > {};
struct arm_body : sor< arm_block, expr > {};
struct match_arm : seq< pattern, must< fat_arrow >, must< arm_body > > {};
struct match_expr : seq< tok< kw_match >, must< expr >, must< lbrace >, star< match_arm, opt< comma > >, must< rbrace > > {};

struct call_expr : seq< tok< ident >, call_args > {};
struct primary : sor< paren_expr, match_expr, some_expr, none_lit, ok_expr, err_expr, tok< bool_lit >, record_lit,
                      call_expr, array_lit, tok< int_lit >, tok< string_lit >, tok< ident > > {};

struct method_suffix : seq< dot, tok< ident >, call_args > {};
struct field_suffix : seq< dot, must< tok< ident > > > {};
struct index_suffix : seq< lbracket, must< expr >, must< rbracket > > {};
struct postfix_expr : seq< primary, star< sor< method_suffix, field_suffix, index_suffix > > > {};

struct unary_expr : sor< seq< tok< unary_op >, must< unary_expr > >, postfix_expr > {};
struct mul_expr : seq< unary_expr, star< tok< mul_op >, must< unary_expr > > > {};
struct add_expr : seq< mul_expr, star< tok< add_op >, must< mul_expr > > > {};
struct rel_expr : seq< add_expr, star< tok< rel_op >, must< add_expr > > > {};
struct eq_expr : seq< rel_expr, star< tok< eq_op >, must< rel_expr > > > {};
struct and_expr : seq< eq_expr, star< tok< and_op >, must< eq_expr > > > {};
struct expr : seq< and_expr, star< tok< or_op >, must< and_expr > > > {};

// Statements
struct block : seq< lbrace, until< rbrace, must< stmt > > > {};
struct block_stmt : block {};
struct let_stmt : seq< tok< kw_let >, opt< tok< mut_kw > >, must< tok< ident > >, opt< colon, must< type_expr > >,
                       must< assign_eq >, must< expr >, must< semi > > {};
struct assign_target : seq< tok< ident >, star< sor< field_suffix, index_suffix > > > {};
struct assign_stmt : seq< assign_target, assign_eq, must< expr >, must< semi > > {};
struct compound_assign_stmt : seq< tok< ident >, tok< compound_op >, must< expr >, must< semi > > {};
struct return_stmt : seq< tok< kw_return >, opt< expr >, must< semi > > {};
struct break_stmt : seq< tok< kw_break >, must< semi > > {};
struct continue_stmt : seq< tok< kw_continue >, must< semi > > {};
// if / else if / else is one chain construct
struct if_branch : seq< tok< kw_if >, must< expr >, must< block > > {};
struct else_if_branch : seq< tok< kw_else >, tok< kw_if >, must< expr >, must< block > > {};
struct else_branch : seq< tok< kw_else >, must< block > > {};
struct if_stmt : seq< if_branch, star< else_if_branch >, opt< else_branch > > {};
struct while_stmt : seq< tok< kw_while >, must< expr >, must< block > > {};
struct for_stmt : seq< tok< kw_for >, must< tok< ident > >, must< tok< kw_in > >, must< expr >, must< block > > {};
struct match_stmt : seq< match_expr, opt< semi > > {};
struct expr_stmt : seq< expr, must< semi > > {};
// Inside a match arm block a trailing expression without ';' is the arm value.
struct arm_expr_stmt : seq< expr, semi > {};

struct stmt : sor< let_stmt, return_stmt, if_stmt, while_stmt, for_stmt, break_stmt, continue_stmt, match_stmt,
                   block_stmt, compound_assign_stmt, assign_stmt, expr_stmt > {};
struct arm_stmt : sor< let_stmt, return_stmt, if_stmt, while_stmt, for_stmt, break_stmt, continue_stmt, match_stmt,
                       block_stmt, compound_assign_stmt, assign_stmt, arm_expr_stmt > {};

// Declarations
struct param : seq< tok< ident >, must< colon >, must< type_expr > > {};
struct param_list : seq< lparen, opt< param, star< comma, must< param > > >, must< rparen > > {};
struct fn_decl : seq< tok< kw_fn >, must< tok< ident > >, must< param_list >, opt< arrow, must< type_expr > >, must< block > > {};
struct field_decl : seq< tok< ident >, must< colon >, must< type_expr > > {};
struct struct_decl : seq< tok< kw_struct >, must< tok< record_name > >, must< lbrace >, must< field_decl >,
                          star< comma, field_decl >, opt< comma >, must< rbrace > > {};
struct const_decl : seq< tok< kw_const >, must< tok< ident > >, must< colon >, must< type_expr >, must< assign_eq >,
                         must< expr >, must< semi > > {};
struct top_decl : sor< fn_decl, struct_decl, const_decl > {};
struct contract : seq< sp, until< eof, must< top_decl > > > {};

// Parse tree shape
template< typename Rule >
using selector = tao::pegtl::parse_tree::selector< Rule,
    tao::pegtl::parse_tree::store_content::on<
        ident, record_name, type_name, binding_name, mut_kw, int_lit, string_lit, bool_lit,
        unary_op, mul_op, add_op, rel_op, eq_op, and_op, or_op, compound_op,
        int_pattern, wildcard_pattern >,
    tao::pegtl::parse_tree::remove_content::on<
        contract, fn_decl, param_list, param, struct_decl, field_decl, const_decl, type_expr,
        block, block_stmt, let_stmt, assign_stmt, assign_target, compound_assign_stmt, return_stmt,
        break_stmt, continue_stmt, if_stmt, if_branch, else_if_branch, else_branch, while_stmt, for_stmt,
        match_stmt, expr_stmt, arm_expr_stmt, call_args, call_expr, array_lit, record_lit, field_init,
        some_expr, none_lit, ok_expr, err_expr, match_expr, match_arm, arm_block,
        some_pattern, none_pattern, ok_pattern, err_pattern, method_suffix, field_suffix, index_suffix >,
    tao::pegtl::parse_tree::fold_one::on<
        postfix_expr, unary_expr, mul_expr, add_expr, rel_expr, eq_expr, and_expr, expr > >;

// Expected-token messages for must<> failures.
template< typename Rule > struct error_message { static constexpr const char* text = nullptr; };

#define CCL_SYNTAX_MESSAGE(RULE, MSG) \
    template<> struct error_message< RULE > { static constexpr const char* text = MSG; }

CCL_SYNTAX_MESSAGE(tok< ident >, "expected identifier");
CCL_SYNTAX_MESSAGE(tok< record_name >, "expected record name starting with an upper-case letter");
CCL_SYNTAX_MESSAGE(tok< inner_binding >, "expected binding name or '_'");
CCL_SYNTAX_MESSAGE(tok< kw_in >, "expected 'in'");
CCL_SYNTAX_MESSAGE(lparen, "expected '('");
CCL_SYNTAX_MESSAGE(rparen, "expected ')'");
CCL_SYNTAX_MESSAGE(lbrace, "expected '{'");
CCL_SYNTAX_MESSAGE(rbrace, "expected '}'");
CCL_SYNTAX_MESSAGE(rbracket, "expected ']'");
CCL_SYNTAX_MESSAGE(rangle, "expected '>' to close type arguments");
CCL_SYNTAX_MESSAGE(colon, "expected ':'");
CCL_SYNTAX_MESSAGE(semi, "expected ';'");
CCL_SYNTAX_MESSAGE(assign_eq, "expected '='");
CCL_SYNTAX_MESSAGE(fat_arrow, "expected '=>' after match pattern");
CCL_SYNTAX_MESSAGE(string_body, "unterminated string literal");
CCL_SYNTAX_MESSAGE(type_expr, "expected type");
CCL_SYNTAX_MESSAGE(expr, "expected expression");
CCL_SYNTAX_MESSAGE(unary_expr, "expected operand");
CCL_SYNTAX_MESSAGE(mul_expr, "expected operand");
CCL_SYNTAX_MESSAGE(add_expr, "expected operand");
CCL_SYNTAX_MESSAGE(rel_expr, "expected operand");
CCL_SYNTAX_MESSAGE(eq_expr, "expected operand");
CCL_SYNTAX_MESSAGE(and_expr, "expected operand");
CCL_SYNTAX_MESSAGE(block, "expected '{' to open a block");
CCL_SYNTAX_MESSAGE(stmt, "expected statement");
CCL_SYNTAX_MESSAGE(param_list, "expected parameter list");
CCL_SYNTAX_MESSAGE(param, "expected parameter");
CCL_SYNTAX_MESSAGE(field_decl, "expected field declaration");
CCL_SYNTAX_MESSAGE(arm_body, "expected match arm body");
CCL_SYNTAX_MESSAGE(top_decl, "expected 'fn', 'struct' or 'const' declaration");

#undef CCL_SYNTAX_MESSAGE

template< typename Rule >
struct control : tao::pegtl::normal< Rule > {
    template< typename ParseInput, typename... States >
    [[noreturn]] static void raise( const ParseInput& in, States&&... /*unused*/ ) {
        if( const char* text = error_message< Rule >::text )
            throw tao::pegtl::parse_error( text, in );
        throw tao::pegtl::parse_error( "unexpected input while parsing " + std::string( tao::pegtl::demangle< Rule >() ), in );
    }
};

} // namespace ccl::grammar
