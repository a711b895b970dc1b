// Contract AST: declarations, statements and expressions with source positions.
// Fields below the "annotations" markers are filled in by the semantic analyzer.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "ccl/types.hpp"

namespace ccl::ast
{

    struct SourcePos
    {
        int line = 0;
        int col = 0;
    };

    enum class BinaryOp
    {
        Add,
        Sub,
        Mul,
        Div,
        Mod,
        Eq,
        Ne,
        Lt,
        Le,
        Gt,
        Ge,
        And,
        Or
    };
    enum class UnaryOp
    {
        Neg,
        Not
    };

    const char *binary_op_name(BinaryOp op);

    // Built-in library operations (free-function and method forms share ids).
    enum class Builtin
    {
        None,
        ArrayLen,
        ArrayPush,
        ArrayPop,
        ArrayContains,
        StringLen,
        StringConcat,
        IsSome,
        IsNone,
        IsOk,
        IsErr,
        UnwrapOr,
        // math
        Abs,
        Min,
        Max,
        Pow,
        Sqrt,
        Sum,
        Percentage,
        ApplyPercentage,
        // text
        StringContains,
        Substring,
        ToUpper,
        ToLower,
        Trim,
        CharAt,
        Replace,
        Split,
        Format,
        // utility
        Require,
        Days,
        Hours,
        AddDuration
    };

    // Syntactic type reference, resolved to a TypeId by the analyzer.
    struct TypeExpr
    {
        std::string name;
        std::vector<TypeExpr> args;
        SourcePos pos;
    };

    struct Expr;
    struct Stmt;
    using ExprPtr = std::unique_ptr<Expr>;
    using StmtPtr = std::unique_ptr<Stmt>;

    struct Block
    {
        std::vector<StmtPtr> stmts;
        SourcePos pos;
    };

    struct IntLit
    {
        int64_t value = 0;
    };
    struct BoolLit
    {
        bool value = false;
    };
    struct StringLit
    {
        std::string value;
    };
    struct Ident
    {
        std::string name;
        // annotations
        int slot = -1;          // local storage slot, -1 for constants
        int const_index = -1;   // index into Program::constants when the name is a constant
    };
    struct Unary
    {
        UnaryOp op;
        ExprPtr operand;
    };
    struct Binary
    {
        BinaryOp op;
        ExprPtr lhs;
        ExprPtr rhs;
    };

    enum class CallKind
    {
        Unresolved,
        User,
        Builtin,
        Host
    };
    struct Call
    {
        std::string callee;
        std::vector<ExprPtr> args;
        // annotations
        CallKind kind = CallKind::Unresolved;
        Builtin builtin = Builtin::None;
        // boundary signature of a Host call
        std::vector<BaseType> host_params;
        BaseType host_ret = BaseType::Error;
    };
    struct MethodCall
    {
        ExprPtr receiver;
        std::string method;
        std::vector<ExprPtr> args;
        // annotations
        Builtin builtin = Builtin::None;
    };
    struct ArrayLit
    {
        std::vector<ExprPtr> elems;
    };
    struct Index
    {
        ExprPtr base;
        ExprPtr index;
    };
    struct Field
    {
        ExprPtr base;
        std::string name;
        // annotations
        int index = -1;
    };
    struct FieldInit
    {
        std::string name;
        ExprPtr value;
        SourcePos pos;
        // annotations
        int index = -1;
    };
    struct RecordLit
    {
        std::string name;
        std::vector<FieldInit> fields;
    };
    // Some(e) / None
    struct OptionLit
    {
        ExprPtr value; // null for None
    };
    // Ok(e) / Err(e)
    struct ResultLit
    {
        bool ok = true;
        ExprPtr value;
    };

    struct Pattern
    {
        enum class Kind
        {
            Wildcard,
            Binding,
            Int,
            Bool,
            String,
            Some,
            None,
            Ok,
            Err
        } kind = Kind::Wildcard;
        int64_t int_value = 0;
        bool bool_value = false;
        std::string text;    // string literal value
        std::string binding; // Binding name, or inner binding of Some/Ok/Err ("" for `_`)
        SourcePos pos;
        // annotations
        int slot = -1;
    };
    struct MatchArm
    {
        Pattern pattern;
        Block body;    // statements of a block arm (empty for expression arms)
        ExprPtr value; // tail expression, null when the arm yields Unit
        SourcePos pos;
    };
    struct Match
    {
        ExprPtr scrutinee;
        std::vector<MatchArm> arms;
    };

    using ExprData = std::variant<IntLit, BoolLit, StringLit, Ident, Unary, Binary, Call, MethodCall, ArrayLit, Index, Field,
                                  RecordLit, OptionLit, ResultLit, Match>;

    struct Expr
    {
        ExprData data;
        SourcePos pos;
        TypeId type = 0; // resolved by the analyzer (0 = Error until then)
    };

    template <typename T>
    ExprPtr make_expr(T &&data, SourcePos pos)
    {
        auto e = std::make_unique<Expr>();
        e->data = std::forward<T>(data);
        e->pos = pos;
        return e;
    }

    struct LetStmt
    {
        std::string name;
        bool is_mut = false;
        std::optional<TypeExpr> annotation;
        ExprPtr init;
        // annotations
        int slot = -1;
        TypeId type = 0;
    };
    // target is an Ident, Index or Field expression
    struct AssignStmt
    {
        ExprPtr target;
        ExprPtr value;
    };
    struct ReturnStmt
    {
        ExprPtr value; // null for `return;`
    };
    struct ExprStmt
    {
        ExprPtr expr;
    };
    struct IfBranch
    {
        ExprPtr cond;
        Block body;
    };
    // if / else if* / else as one chain
    struct IfStmt
    {
        std::vector<IfBranch> branches;
        std::optional<Block> else_block;
    };
    struct WhileStmt
    {
        ExprPtr cond;
        Block body;
    };
    struct ForStmt
    {
        std::string var;
        ExprPtr iterable;
        Block body;
        // annotations
        int slot = -1;
        TypeId elem_type = 0;
    };
    struct BreakStmt
    {
    };
    struct ContinueStmt
    {
    };
    struct BlockStmt
    {
        Block block;
    };

    using StmtData = std::variant<LetStmt, AssignStmt, ReturnStmt, ExprStmt, IfStmt, WhileStmt, ForStmt, BreakStmt,
                                  ContinueStmt, BlockStmt>;

    struct Stmt
    {
        StmtData data;
        SourcePos pos;
    };

    template <typename T>
    StmtPtr make_stmt(T &&data, SourcePos pos)
    {
        auto s = std::make_unique<Stmt>();
        s->data = std::forward<T>(data);
        s->pos = pos;
        return s;
    }

    struct Param
    {
        std::string name;
        TypeExpr type;
        SourcePos pos;
        TypeId resolved = 0;
    };

    enum class SlotKind
    {
        Param,
        Let,
        LoopVar,
        MatchBinding
    };
    // One entry per storage slot, in slot order.
    struct LocalSlot
    {
        std::string name;
        TypeId type = 0;
        SlotKind kind = SlotKind::Let;
    };

    struct FunctionDecl
    {
        std::string name;
        std::vector<Param> params;
        std::optional<TypeExpr> ret;
        Block body;
        SourcePos pos;
        // annotations
        TypeId ret_type = 0;
        std::vector<LocalSlot> locals;
    };

    struct FieldDecl
    {
        std::string name;
        TypeExpr type;
        SourcePos pos;
    };
    struct RecordDecl
    {
        std::string name;
        std::vector<FieldDecl> fields;
        SourcePos pos;
    };
    struct ConstDecl
    {
        std::string name;
        TypeExpr type;
        ExprPtr value;
        SourcePos pos;
        TypeId resolved = 0;
    };

    // Top-level declarations, each list in source order.
    struct Program
    {
        std::vector<RecordDecl> records;
        std::vector<ConstDecl> constants;
        std::vector<FunctionDecl> functions;

        const FunctionDecl *find_function(const std::string &name) const
        {
            for (auto &f : functions)
                if (f.name == name)
                    return &f;
            return nullptr;
        }
    };

} // namespace ccl::ast
