#include "ccl/diagnostics_json.hpp"
#include <cstdlib>
#include <cstdio>
#include <sstream>

namespace ccl {

const char* diag_kind_name(DiagKind k){
    switch(k){
        case DiagKind::SyntaxError: return "SyntaxError";
        case DiagKind::InvalidControlFlow: return "InvalidControlFlow";
        case DiagKind::UndefinedSymbol: return "UndefinedSymbol";
        case DiagKind::TypeMismatch: return "TypeMismatch";
        case DiagKind::ArityMismatch: return "ArityMismatch";
        case DiagKind::DuplicateDeclaration: return "DuplicateDeclaration";
        case DiagKind::ShadowedBinding: return "ShadowedBinding";
        case DiagKind::UnreachableReturn: return "UnreachableReturn";
        case DiagKind::NotAssignable: return "NotAssignable";
        case DiagKind::NonExhaustiveMatch: return "NonExhaustiveMatch";
        case DiagKind::MissingEntryPoint: return "MissingEntryPoint";
        case DiagKind::CodegenError: return "CodegenError";
        case DiagKind::UnreachableCode: return "UnreachableCode";
    }
    return "Unknown";
}

const char* diag_code(DiagKind k, bool warning){
    switch(k){
        case DiagKind::SyntaxError: return "E1000";
        case DiagKind::InvalidControlFlow: return "E1010";
        case DiagKind::UndefinedSymbol: return "E1100";
        case DiagKind::TypeMismatch: return "E1200";
        case DiagKind::ArityMismatch: return "E1300";
        case DiagKind::DuplicateDeclaration: return "E1400";
        case DiagKind::ShadowedBinding: return warning ? "W1410" : "E1410";
        case DiagKind::UnreachableReturn: return "E1500";
        case DiagKind::NotAssignable: return "E1600";
        case DiagKind::NonExhaustiveMatch: return "E1700";
        case DiagKind::MissingEntryPoint: return "E1800";
        case DiagKind::CodegenError: return "E1900";
        case DiagKind::UnreachableCode: return "W1400";
    }
    return "E0000";
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os<<d.line<<":"<<d.col<<": "<<d.code<<" "<<diag_kind_name(d.kind)<<": "<<d.message;
    if(!d.hint.empty()) os<<" (hint: "<<d.hint<<")";
    for(auto &n: d.notes) os<<"\n  note: "<<n.message;
    return os.str();
}

static void write_diagnostics(JsonWriter& w, const std::vector<Diagnostic>& list){
    w.begin_array();
    for(const Diagnostic& d : list){
        w.begin_object()
            .key("code").value(d.code)
            .key("kind").value(diag_kind_name(d.kind))
            .key("message").value(d.message)
            .key("hint").value(d.hint)
            .key("line").value(d.line)
            .key("col").value(d.col)
            .key("notes").begin_array();
        for(const DiagNote& n : d.notes)
            w.begin_object().key("message").value(n.message).key("line").value(n.line).key("col").value(n.col).end_object();
        w.end_array().end_object();
    }
    w.end_array();
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    JsonWriter w;
    w.begin_object().key("success").value(success).key("errors");
    write_diagnostics(w, errors);
    w.key("warnings");
    write_diagnostics(w, warnings);
    w.end_object();
    return w.str();
}

void maybe_print_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    if(const char* env = std::getenv("CCL_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(success, errors, warnings);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace ccl
