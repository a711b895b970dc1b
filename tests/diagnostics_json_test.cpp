#include <gtest/gtest.h>
#include "ccl/diagnostics.hpp"
#include "ccl/diagnostics_json.hpp"

using namespace ccl;

TEST(DiagnosticsJson, EscapesControlCharacters){
    EXPECT_EQ(json_escape("plain"), "\"plain\"");
    EXPECT_EQ(json_escape("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(json_escape("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, SerializesErrorsAndWarnings){
    ErrorReporter rep;
    Diagnostic e = rep.make_error(DiagKind::TypeMismatch, "return value type mismatch", "ensure return value has type Integer", 3, 12);
    e.notes.push_back(DiagNote{"expected: Integer", 3, 12});
    Diagnostic w = rep.make_warning(DiagKind::ShadowedBinding, "'let x' shadows", "", 5, 1);
    const std::string js = diagnostics_to_json(false, {e}, {w});
    EXPECT_EQ(js,
        "{\"success\":false,\"errors\":[{\"code\":\"E1200\",\"kind\":\"TypeMismatch\","
        "\"message\":\"return value type mismatch\",\"hint\":\"ensure return value has type Integer\","
        "\"line\":3,\"col\":12,\"notes\":[{\"message\":\"expected: Integer\",\"line\":3,\"col\":12}]}],"
        "\"warnings\":[{\"code\":\"W1410\",\"kind\":\"ShadowedBinding\",\"message\":\"'let x' shadows\","
        "\"hint\":\"\",\"line\":5,\"col\":1,\"notes\":[]}]}");
}

TEST(DiagnosticsJson, EmptyLists){
    EXPECT_EQ(diagnostics_to_json(true, {}, {}), "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}

TEST(Diagnostics, CodesPerKind){
    EXPECT_STREQ(diag_code(DiagKind::SyntaxError), "E1000");
    EXPECT_STREQ(diag_code(DiagKind::InvalidControlFlow), "E1010");
    EXPECT_STREQ(diag_code(DiagKind::UndefinedSymbol), "E1100");
    EXPECT_STREQ(diag_code(DiagKind::ArityMismatch), "E1300");
    EXPECT_STREQ(diag_code(DiagKind::DuplicateDeclaration), "E1400");
    EXPECT_STREQ(diag_code(DiagKind::ShadowedBinding), "E1410");
    EXPECT_STREQ(diag_code(DiagKind::ShadowedBinding, true), "W1410");
    EXPECT_STREQ(diag_code(DiagKind::UnreachableReturn), "E1500");
    EXPECT_STREQ(diag_code(DiagKind::NotAssignable), "E1600");
    EXPECT_STREQ(diag_code(DiagKind::NonExhaustiveMatch), "E1700");
    EXPECT_STREQ(diag_code(DiagKind::MissingEntryPoint), "E1800");
    EXPECT_STREQ(diag_code(DiagKind::CodegenError), "E1900");
    EXPECT_STREQ(diag_code(DiagKind::UnreachableCode, true), "W1400");
}

TEST(Diagnostics, HumanReadableFormat){
    ErrorReporter rep;
    Diagnostic d = rep.make_error(DiagKind::UndefinedSymbol, "undefined function 'ad'", "", 2, 9);
    d.notes.push_back(DiagNote{"did you mean 'add'", 2, 9});
    EXPECT_EQ(format_diagnostic(d), "2:9: E1100 UndefinedSymbol: undefined function 'ad'\n  note: did you mean 'add'");
}
