#include "ccl/builtins.hpp"
#include <algorithm>

namespace ccl {
using ast::Builtin;

const std::vector<HostFunction>& host_functions(){
    static const std::vector<HostFunction> table = [](){
        std::vector<HostFunction> t = {
            {"host_account_credit_mana", {BaseType::Did, BaseType::Mana}, BaseType::Bool},
            {"host_account_get_mana", {BaseType::Did}, BaseType::Mana},
            {"host_account_spend_mana", {BaseType::Did, BaseType::Mana}, BaseType::Bool},
            {"host_anchor_receipt", {BaseType::String}, BaseType::Bool},
            {"host_dag_get", {BaseType::String}, BaseType::String},
            {"host_dag_put", {BaseType::String}, BaseType::String},
            {"host_get_caller", {}, BaseType::Did},
            {"host_get_reputation", {BaseType::Did}, BaseType::Integer},
            {"host_get_timestamp", {}, BaseType::Integer},
            {"host_submit_mesh_job", {BaseType::String, BaseType::Mana}, BaseType::Bool},
        };
        std::sort(t.begin(), t.end(), [](const HostFunction& a, const HostFunction& b){ return a.name < b.name; });
        return t;
    }();
    return table;
}

const HostFunction* find_host_function(const std::string& name){
    for(auto &h: host_functions()) if(h.name == name) return &h;
    return nullptr;
}

static const BuiltinFunction kBuiltins[] = {
    {"array_len", Builtin::ArrayLen, 1},
    {"array_length", Builtin::ArrayLen, 1},
    {"array_push", Builtin::ArrayPush, 2},
    {"array_pop", Builtin::ArrayPop, 1},
    {"array_contains", Builtin::ArrayContains, 2},
    {"string_len", Builtin::StringLen, 1},
    {"string_length", Builtin::StringLen, 1},
    {"string_concat", Builtin::StringConcat, 2},
    {"abs", Builtin::Abs, 1},
    {"min", Builtin::Min, 2},
    {"max", Builtin::Max, 2},
    {"pow", Builtin::Pow, 2},
    {"sqrt", Builtin::Sqrt, 1},
    {"sum", Builtin::Sum, 1},
    {"percentage", Builtin::Percentage, 2},
    {"apply_percentage", Builtin::ApplyPercentage, 2},
    {"string_contains", Builtin::StringContains, 2},
    {"string_substring", Builtin::Substring, 3},
    {"string_to_upper", Builtin::ToUpper, 1},
    {"string_to_lower", Builtin::ToLower, 1},
    {"string_trim", Builtin::Trim, 1},
    {"string_char_at", Builtin::CharAt, 2},
    {"string_replace", Builtin::Replace, 3},
    {"string_split", Builtin::Split, 2},
    {"string_format", Builtin::Format, 2},
    {"require", Builtin::Require, 2},
    {"days", Builtin::Days, 1},
    {"hours", Builtin::Hours, 1},
    {"add_duration", Builtin::AddDuration, 2},
};

const BuiltinFunction* find_builtin_function(const std::string& name){
    for(auto &b: kBuiltins) if(name == b.name) return &b;
    return nullptr;
}

Builtin find_builtin_method(const TypeContext& ctx, TypeId receiver, const std::string& method, size_t* extra_arity){
    auto set = [&](Builtin b, size_t n){ if(extra_arity) *extra_arity = n; return b; };
    const Type& t = ctx.at(receiver);
    switch(t.kind){
        case Type::Kind::Array:
            if(method=="len") return set(Builtin::ArrayLen,0);
            if(method=="push") return set(Builtin::ArrayPush,1);
            if(method=="pop") return set(Builtin::ArrayPop,0);
            if(method=="contains") return set(Builtin::ArrayContains,1);
            if(method=="sum") return set(Builtin::Sum,0);
            break;
        case Type::Kind::Option:
            if(method=="is_some") return set(Builtin::IsSome,0);
            if(method=="is_none") return set(Builtin::IsNone,0);
            if(method=="unwrap_or") return set(Builtin::UnwrapOr,1);
            break;
        case Type::Kind::Result:
            if(method=="is_ok") return set(Builtin::IsOk,0);
            if(method=="is_err") return set(Builtin::IsErr,0);
            if(method=="unwrap_or") return set(Builtin::UnwrapOr,1);
            break;
        case Type::Kind::Base:
            if(ctx.is_stringlike(receiver)){
                if(method=="len") return set(Builtin::StringLen,0);
                if(method=="concat") return set(Builtin::StringConcat,1);
                if(method=="contains") return set(Builtin::StringContains,1);
                if(method=="substring") return set(Builtin::Substring,2);
                if(method=="to_upper") return set(Builtin::ToUpper,0);
                if(method=="to_lower") return set(Builtin::ToLower,0);
                if(method=="trim") return set(Builtin::Trim,0);
                if(method=="char_at") return set(Builtin::CharAt,1);
                if(method=="replace") return set(Builtin::Replace,2);
                if(method=="split") return set(Builtin::Split,1);
                if(method=="format") return set(Builtin::Format,1);
            }
            break;
        case Type::Kind::Record:
            break;
    }
    return Builtin::None;
}

const char* builtin_name(Builtin b){
    switch(b){
        case Builtin::None: return "<none>";
        case Builtin::ArrayLen: return "len";
        case Builtin::ArrayPush: return "push";
        case Builtin::ArrayPop: return "pop";
        case Builtin::ArrayContains: return "contains";
        case Builtin::StringLen: return "len";
        case Builtin::StringConcat: return "concat";
        case Builtin::IsSome: return "is_some";
        case Builtin::IsNone: return "is_none";
        case Builtin::IsOk: return "is_ok";
        case Builtin::IsErr: return "is_err";
        case Builtin::UnwrapOr: return "unwrap_or";
        case Builtin::Abs: return "abs";
        case Builtin::Min: return "min";
        case Builtin::Max: return "max";
        case Builtin::Pow: return "pow";
        case Builtin::Sqrt: return "sqrt";
        case Builtin::Sum: return "sum";
        case Builtin::Percentage: return "percentage";
        case Builtin::ApplyPercentage: return "apply_percentage";
        case Builtin::StringContains: return "contains";
        case Builtin::Substring: return "substring";
        case Builtin::ToUpper: return "to_upper";
        case Builtin::ToLower: return "to_lower";
        case Builtin::Trim: return "trim";
        case Builtin::CharAt: return "char_at";
        case Builtin::Replace: return "replace";
        case Builtin::Split: return "split";
        case Builtin::Format: return "format";
        case Builtin::Require: return "require";
        case Builtin::Days: return "days";
        case Builtin::Hours: return "hours";
        case Builtin::AddDuration: return "add_duration";
    }
    return "?";
}

bool is_host_name(const std::string& name){
    return name.size() > kHostPrefixLength && name.compare(0, kHostPrefixLength, "host_") == 0;
}

bool is_host_scalar(BaseType b){
    return b==BaseType::Integer || b==BaseType::Mana || b==BaseType::Bool || b==BaseType::String || b==BaseType::Did;
}

std::vector<std::string> builtin_and_host_names(){
    std::vector<std::string> out;
    for(auto &b: kBuiltins) out.push_back(b.name);
    for(auto &h: host_functions()) out.push_back(h.name);
    return out;
}

} // namespace ccl
