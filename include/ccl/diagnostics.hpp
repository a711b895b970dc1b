// Diagnostics shared by every compiler stage.
#pragma once
#include <string>
#include <vector>

namespace ccl {

enum class DiagKind {
    SyntaxError,
    InvalidControlFlow,
    UndefinedSymbol,
    TypeMismatch,
    ArityMismatch,
    DuplicateDeclaration,
    ShadowedBinding,
    UnreachableReturn,
    NotAssignable,
    NonExhaustiveMatch,
    MissingEntryPoint,
    CodegenError,
    UnreachableCode
};

const char* diag_kind_name(DiagKind k);
const char* diag_code(DiagKind k, bool warning=false);

struct DiagNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic { DiagKind kind; std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<DiagNote> notes; };

// Central reporter so every stage shares one formatting path.
struct ErrorReporter {
    std::vector<Diagnostic>* errors=nullptr;
    std::vector<Diagnostic>* warnings=nullptr;
    void emit_error(const Diagnostic& e){ if(errors) errors->push_back(e); }
    void emit_warning(const Diagnostic& w){ if(warnings) warnings->push_back(w); }
    Diagnostic make_error(DiagKind k, std::string message, std::string hint, int line, int col){ return Diagnostic{k,diag_code(k),std::move(message),std::move(hint),line,col,{}}; }
    Diagnostic make_warning(DiagKind k, std::string message, std::string hint, int line, int col){ return Diagnostic{k,diag_code(k,true),std::move(message),std::move(hint),line,col,{}}; }
};

// Human readable "line:col: code: message" rendering used by tools and test failure output.
std::string format_diagnostic(const Diagnostic& d);

} // namespace ccl
