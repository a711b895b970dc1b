#include "ccl/options.hpp"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <cctype>
#include <utility>

namespace ccl {

// Reads process env vars and constructs CompileOptions.
// compile() never calls this; embedders decide whether the environment applies.
CompileOptions detect_options(){
    CompileOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto lower = [](std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); }); return s; };

    if (const char* v = get("CCL_OPT_LEVEL")){
        std::string s = lower(v);
        if(s=="1"||s=="o1") o.opt_level = 1;
        else if(s=="2"||s=="o2") o.opt_level = 2;
        else if(s=="3"||s=="o3") o.opt_level = 3;
        else o.opt_level = 0;
    }

    if (const char* v = get("CCL_PASS_PIPELINE")) o.pass_pipeline = v;

    if (const char* v = get("CCL_VERIFY_IR")) o.verify_ir = (std::string(v) != "0");

    if (const char* v = get("CCL_MEMORY_PAGES")){
        char* end=nullptr; unsigned long n = std::strtoul(v, &end, 10);
        // keep the default on garbage; normalize_options caps the value
        if(end && *end=='\0' && n>0) o.memory_pages = static_cast<uint32_t>(std::min<unsigned long>(n, kMaxMemoryPages));
    }

    if (const char* v = get("CCL_HOST_BUFFER")){
        char* end=nullptr; unsigned long n = std::strtoul(v, &end, 10);
        if(end && *end=='\0' && n>=kMinHostBuffer) o.host_buffer_size = static_cast<uint32_t>(std::min<unsigned long>(n, kMaxHostBuffer));
    }

    if (const char* v = get("CCL_SHADOW_POLICY")){
        std::string s = lower(v);
        if(s=="allow") o.shadow_policy = ShadowPolicy::Allow;
        else if(s=="error") o.shadow_policy = ShadowPolicy::Error;
        else o.shadow_policy = ShadowPolicy::Warn;
    }

    if (const char* v = get("CCL_TRACE")) o.trace = (std::string(v) == "1");

    return normalize_options(std::move(o));
}

CompileOptions normalize_options(CompileOptions o){
    o.opt_level = std::clamp(o.opt_level, 0, 3);
    o.memory_pages = std::clamp<uint32_t>(o.memory_pages, 1, kMaxMemoryPages);
    o.host_buffer_size = std::clamp(o.host_buffer_size, kMinHostBuffer, kMaxHostBuffer);
    return o;
}

const char* shadow_policy_name(ShadowPolicy p){
    switch(p){
        case ShadowPolicy::Allow: return "allow";
        case ShadowPolicy::Warn: return "warn";
        case ShadowPolicy::Error: return "error";
    }
    return "warn";
}

} // namespace ccl
