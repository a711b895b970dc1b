#include <gtest/gtest.h>
#include "ccl/ccl.hpp"
#include "test_env.hpp"

using namespace ccl;

namespace {

const char* kTreasury = R"(
    // treasury disbursement with a quorum check
    const QUORUM: Integer = 3;
    const FEE: Mana = 10;

    struct Vote { voter: Did, approve: Bool, weight: Integer }

    fn tally(votes: Array<Vote>) -> Integer {
        let mut yes = 0;
        for v in votes {
            if v.approve { yes = yes + v.weight; }
        }
        return yes;
    }

    fn disburse(amount: Mana) -> Result<Mana> {
        let me = host_get_caller();
        let votes = [
            Vote { voter: me, approve: true, weight: 2 },
            Vote { voter: "did:key:bob", approve: true, weight: 1 },
            Vote { voter: "did:key:carol", approve: false, weight: 5 },
        ];
        if tally(votes) < QUORUM { return Err("quorum not reached"); }
        if !host_account_spend_mana(me, amount + FEE) { return Err("insufficient mana"); }
        return Ok(amount);
    }

    fn run(amount: Mana) -> Mana { return disburse(amount).unwrap_or(0); }
)";

} // namespace

TEST(Compile, SucceedsWithBytecodeAndMetadata){
    CompileResult r = compile(kTreasury);
    ASSERT_TRUE(r.success) << (r.errors.empty() ? "" : format_diagnostic(r.errors[0]));
    EXPECT_TRUE(r.errors.empty());
    ASSERT_FALSE(r.bytecode.empty());
    EXPECT_EQ(r.metadata.size, r.bytecode.size());
    EXPECT_EQ(r.metadata.hash.size(), 64u);
    ASSERT_EQ(r.metadata.exports.size(), 1u);
    EXPECT_EQ(r.metadata.exports[0].name, "run");
    EXPECT_EQ(r.metadata.exports[0].returns, "Mana");
}

TEST(Compile, DeterministicBytecode){
    for(int level : {0, 2}){
        CompileOptions opts;
        opts.opt_level = level;
        CompileResult a = compile(kTreasury, opts);
        CompileResult b = compile(kTreasury, opts);
        ASSERT_TRUE(a.success);
        ASSERT_TRUE(b.success);
        EXPECT_EQ(a.bytecode, b.bytecode) << "opt level " << level;
        EXPECT_EQ(a.metadata.hash, b.metadata.hash);
    }
}

TEST(Compile, OptionsChangeTheArtifact){
    CompileOptions small;
    small.memory_pages = 1;
    CompileResult a = compile(kTreasury);
    CompileResult b = compile(kTreasury, small);
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_NE(a.metadata.hash, b.metadata.hash);
}

TEST(Compile, OutOfRangeOptionsAreClamped){
    CompileOptions wild;
    wild.opt_level = 9;
    wild.memory_pages = 0;
    wild.host_buffer_size = 1u << 30;
    CompileResult r = compile(kTreasury, wild);
    ASSERT_TRUE(r.success) << (r.errors.empty() ? "" : format_diagnostic(r.errors[0]));
    EXPECT_EQ(r.metadata.memory.pages, 1u);
    EXPECT_EQ(r.metadata.memory.bytes, 65536u);

    CompileOptions tame;
    tame.opt_level = 3;
    tame.memory_pages = 1;
    tame.host_buffer_size = kMaxHostBuffer;
    CompileResult same = compile(kTreasury, tame);
    ASSERT_TRUE(same.success);
    EXPECT_EQ(r.bytecode, same.bytecode);
}

TEST(Compile, OversizedMemoryIsCapped){
    CompileOptions opts;
    opts.memory_pages = 100000;
    CompileResult r = compile("fn run() -> Integer { return 1; }", opts);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.metadata.memory.pages, kMaxMemoryPages);
}

TEST(Compile, SyntaxErrorStopsThePipeline){
    CompileResult r = compile("fn run() -> Integer {\n  return 1\n}");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.bytecode.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, DiagKind::SyntaxError);
    EXPECT_EQ(r.errors[0].code, "E1000");
    EXPECT_EQ(r.errors[0].line, 3);
}

TEST(Compile, SemanticErrorsAreAllReported){
    CompileResult r = compile(R"(
        fn run() -> Integer {
            total = 1;
            let s = "a" + true;
            return missing;
        }
    )");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.bytecode.empty());
    EXPECT_EQ(r.errors.size(), 3u);
}

TEST(Compile, WarningsDoNotFailCompilation){
    CompileResult r = compile(R"(
        fn run() -> Integer {
            let mut n = 0;
            let mut i = 0;
            while i < 3 {
                let n = i;
                i = i + 1;
            }
            return n;
        }
    )");
    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].code, "W1410");
    EXPECT_FALSE(r.bytecode.empty());
}

TEST(Compile, ShadowPolicyErrorFailsCompilation){
    CompileOptions opts;
    opts.shadow_policy = ShadowPolicy::Error;
    CompileResult r = compile(R"(
        fn run(flag: Bool) -> Integer {
            let x = 1;
            if flag { let x = 2; }
            return x;
        }
    )", opts);
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E1410");
}

TEST(Compile, TraceWritesStagePrefixes){
    CompileOptions opts;
    opts.trace = true;
    ::testing::internal::CaptureStderr();
    CompileResult r = compile("fn run() -> Integer { return 2 + 2; }", opts);
    const std::string err = ::testing::internal::GetCapturedStderr();
    ASSERT_TRUE(r.success);
    EXPECT_NE(err.find("[ccl][parse]"), std::string::npos) << err;
    EXPECT_NE(err.find("[ccl][sema]"), std::string::npos) << err;
    EXPECT_NE(err.find("[ccl][optimize] folded 1"), std::string::npos) << err;
    EXPECT_NE(err.find("[ccl][emit]"), std::string::npos) << err;
}

TEST(Compile, DiagnosticsJsonOnRequest){
    ccl::test::ScopedEnv env("CCL_DIAG_JSON", "1");
    ::testing::internal::CaptureStderr();
    CompileResult r = compile("fn helper() {}");
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(r.success);
    EXPECT_NE(err.find("\"success\":false"), std::string::npos) << err;
    EXPECT_NE(err.find("\"code\":\"E1800\""), std::string::npos) << err;
}
