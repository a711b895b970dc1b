#include "ccl/ir/pass_pipeline.hpp"
#include "ccl/codegen.hpp"

#include <string>

#include <llvm/IR/Verifier.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace ccl::ir::pass_pipeline {

void run_pass_pipeline(llvm::Module& M, const CompileOptions& opts){
    if(opts.pass_pipeline.empty() && opts.opt_level <= 0) return;
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);

    llvm::ModulePassManager MPM;
    if(!opts.pass_pipeline.empty()){
        if(auto Err = PB.parsePassPipeline(MPM, opts.pass_pipeline))
            throw codegen_error("invalid pass pipeline '" + opts.pass_pipeline + "': " + llvm::toString(std::move(Err)));
    } else {
        llvm::OptimizationLevel level = llvm::OptimizationLevel::O1;
        if(opts.opt_level == 2) level = llvm::OptimizationLevel::O2;
        else if(opts.opt_level >= 3) level = llvm::OptimizationLevel::O3;
        MPM = PB.buildPerModuleDefaultPipeline(level);
    }
    MPM.run(M, MAM);

    if(opts.verify_ir){
        std::string msg;
        llvm::raw_string_ostream os(msg);
        if(llvm::verifyModule(M, &os)) throw codegen_error("IR verification failed after optimization: " + os.str());
    }
}

} // namespace ccl::ir::pass_pipeline
