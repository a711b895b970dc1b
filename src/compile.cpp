#include "ccl/ccl.hpp"
#include "ccl/ast_builder.hpp"
#include "ccl/codegen.hpp"
#include "ccl/diagnostics_json.hpp"
#include "ccl/optimizer.hpp"
#include "ccl/parser.hpp"
#include "ccl/sema.hpp"

#include <llvm/IR/LLVMContext.h>
#include <llvm/Support/raw_ostream.h>

namespace ccl {

namespace {

struct Tracer {
    bool enabled;
    void operator()(const char* stage, const std::string& msg) const {
        if(enabled) llvm::errs() << "[ccl][" << stage << "] " << msg << "\n";
    }
};

CompileResult finish(CompileResult r){
    if(!r.success) r.bytecode.clear();
    maybe_print_json(r.success, r.errors, r.warnings);
    return r;
}

} // namespace

CompileResult compile(std::string_view source, const CompileOptions& options){
    const CompileOptions opts = normalize_options(options);
    CompileResult result;
    const Tracer trace{opts.trace};
    ErrorReporter rep{&result.errors, &result.warnings};

    Parser parser;
    ParseResult parsed = parser.parse_string(source);
    if(!parsed.success){
        trace("parse", "failed at " + std::to_string(parsed.line) + ":" + std::to_string(parsed.column));
        rep.emit_error(rep.make_error(DiagKind::SyntaxError, parsed.error_message, "", parsed.line, parsed.column));
        return finish(std::move(result));
    }
    trace("parse", "ok (" + std::to_string(source.size()) + " bytes)");

    AstBuilder builder;
    BuildResult built = builder.build(*parsed.root);
    if(!built.success){
        trace("ast", std::to_string(built.errors.size()) + " error(s)");
        result.errors = std::move(built.errors);
        return finish(std::move(result));
    }
    ast::Program& program = built.program;
    trace("ast", std::to_string(program.functions.size()) + " function(s), " + std::to_string(program.records.size()) +
                 " record(s), " + std::to_string(program.constants.size()) + " constant(s)");

    TypeContext tctx;
    SemanticAnalyzer sema(tctx, opts);
    AnalysisResult analysis = sema.analyze(program);
    result.warnings = std::move(analysis.warnings);
    if(!analysis.success){
        trace("sema", std::to_string(analysis.errors.size()) + " error(s)");
        result.errors = std::move(analysis.errors);
        return finish(std::move(result));
    }
    trace("sema", "ok, " + std::to_string(result.warnings.size()) + " warning(s), shadow policy " + shadow_policy_name(opts.shadow_policy));

    Optimizer optimizer(tctx);
    OptimizeStats stats = optimizer.optimize(program);
    trace("optimize", "folded " + std::to_string(stats.folded) + ", propagated " + std::to_string(stats.constants_propagated) +
                      ", branches removed " + std::to_string(stats.branches_removed) + ", loops removed " + std::to_string(stats.loops_removed));

    llvm::LLVMContext llctx;
    CodeGenerator codegen(tctx, opts);
    try {
        std::unique_ptr<llvm::Module> module = codegen.generate(program, llctx);
        trace("codegen", "module verified, " + std::to_string(codegen.imports().size()) + " import(s), opt level " + std::to_string(opts.opt_level));
        result.bytecode = write_bitcode(*module);
    } catch (const codegen_error& e) {
        trace("codegen", std::string("failed: ") + e.what());
        rep.emit_error(rep.make_error(DiagKind::CodegenError, e.what(), "", 0, 0));
        return finish(std::move(result));
    }

    result.metadata = build_metadata(program, tctx, codegen.imports(), codegen.heap_base(), result.bytecode, opts);
    trace("emit", std::to_string(result.metadata.size) + " bytes, sha256 " + result.metadata.hash);
    result.success = true;
    return finish(std::move(result));
}

} // namespace ccl
