#include "ccl/metadata.hpp"
#include "ccl/codegen.hpp"
#include "ccl/json_writer.hpp"

namespace ccl {

static std::string base_type_name(BaseType b){
    switch(b){
        case BaseType::Integer: return "Integer";
        case BaseType::Bool: return "Bool";
        case BaseType::String: return "String";
        case BaseType::Mana: return "Mana";
        case BaseType::Did: return "Did";
        case BaseType::Unit: return "Unit";
        case BaseType::Error: break;
    }
    return "<error>";
}

ContractMetadata build_metadata(const ast::Program& program, const TypeContext& tctx,
                                const std::vector<HostFunction>& imports, uint32_t heap_base,
                                const std::vector<uint8_t>& bytecode, const CompileOptions& opts){
    ContractMetadata m;
    if(const ast::FunctionDecl* run = program.find_function(kEntryName)){
        FunctionInfo f{run->name, {}, tctx.to_string(run->ret_type)};
        for(auto &p: run->params) f.params.push_back(ParamInfo{p.name, tctx.to_string(p.resolved)});
        m.exports.push_back(std::move(f));
    }
    for(const HostFunction& h: imports){
        FunctionInfo f{h.name, {}, base_type_name(h.ret)};
        for(size_t i=0;i<h.params.size();++i) f.params.push_back(ParamInfo{"arg"+std::to_string(i), base_type_name(h.params[i])});
        m.imports.push_back(std::move(f));
    }
    m.memory = MemoryInfo{kMemoryName, opts.memory_pages, static_cast<uint64_t>(opts.memory_pages) * kPageSize, heap_base};
    m.size = bytecode.size();
    m.hash = sha256_hex(bytecode);
    return m;
}

static void write_functions(JsonWriter& w, const std::vector<FunctionInfo>& list){
    w.begin_array();
    for(const FunctionInfo& f : list){
        w.begin_object().key("name").value(f.name).key("params").begin_array();
        for(const ParamInfo& p : f.params) w.begin_object().key("name").value(p.name).key("type").value(p.type).end_object();
        w.end_array().key("returns").value(f.returns).end_object();
    }
    w.end_array();
}

std::string metadata_to_json(const ContractMetadata& m){
    JsonWriter w;
    w.begin_object().key("format").value(m.format).key("version").value(m.version).key("exports");
    write_functions(w, m.exports);
    w.key("imports");
    write_functions(w, m.imports);
    w.key("memory").begin_object()
        .key("name").value(m.memory.name)
        .key("pages").value(m.memory.pages)
        .key("bytes").value(m.memory.bytes)
        .key("heap_base").value(m.memory.heap_base)
        .end_object();
    w.key("size").value(m.size).key("hash").value(m.hash).end_object();
    return w.str();
}

} // namespace ccl
