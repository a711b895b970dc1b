// Type interning for contract types.
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ccl
{

    using TypeId = uint32_t;

    enum class BaseType
    {
        Error, // poison type produced after a diagnostic; compatible with everything
        Unit,
        Integer,
        Bool,
        String,
        Mana,
        Did
    };

    struct Type
    {
        enum class Kind
        {
            Base,
            Array,
            Option,
            Result,
            Record
        } kind;
        BaseType base{};         // Base
        TypeId elem{0};          // Array / Option / Result payload
        std::string record_name; // Record
    };

    struct RecordField
    {
        std::string name;
        TypeId type;
    };

    struct RecordInfo
    {
        std::string name;
        std::vector<RecordField> fields;
        int field_index(const std::string &f) const
        {
            for (size_t i = 0; i < fields.size(); ++i)
                if (fields[i].name == f)
                    return static_cast<int>(i);
            return -1;
        }
    };

    class TypeContext
    {
    public:
        TypeContext()
        { // seed base types so ids are stable within a compilation
            get_base(BaseType::Error);
            get_base(BaseType::Unit);
            get_base(BaseType::Integer);
            get_base(BaseType::Bool);
            get_base(BaseType::String);
            get_base(BaseType::Mana);
            get_base(BaseType::Did);
        }

        TypeId get_base(BaseType b)
        {
            auto key = static_cast<int>(b);
            auto it = base_index_.find(key);
            if (it != base_index_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Base;
            t.base = b;
            TypeId id = add_type(std::move(t));
            base_index_[key] = id;
            return id;
        }
        TypeId error() { return get_base(BaseType::Error); }
        TypeId unit() { return get_base(BaseType::Unit); }
        TypeId integer() { return get_base(BaseType::Integer); }
        TypeId boolean() { return get_base(BaseType::Bool); }
        TypeId string() { return get_base(BaseType::String); }
        TypeId mana() { return get_base(BaseType::Mana); }
        TypeId did() { return get_base(BaseType::Did); }

        TypeId get_array(TypeId elem) { return get_wrapped(Type::Kind::Array, elem, array_cache_); }
        TypeId get_option(TypeId elem) { return get_wrapped(Type::Kind::Option, elem, option_cache_); }
        TypeId get_result(TypeId elem) { return get_wrapped(Type::Kind::Result, elem, result_cache_); }

        TypeId get_record(const std::string &name)
        {
            auto it = record_cache_.find(name);
            if (it != record_cache_.end())
                return it->second;
            Type t;
            t.kind = Type::Kind::Record;
            t.record_name = name;
            TypeId id = add_type(t);
            record_cache_[name] = id;
            return id;
        }

        // Record layouts are registered once by the analyzer, in declaration order.
        RecordInfo &define_record(const std::string &name)
        {
            get_record(name);
            auto &info = records_[name];
            info.name = name;
            return info;
        }
        const RecordInfo *record(const std::string &name) const
        {
            auto it = records_.find(name);
            return it == records_.end() ? nullptr : &it->second;
        }
        const RecordInfo *record_of(TypeId id) const
        {
            const Type &t = at(id);
            if (t.kind != Type::Kind::Record)
                return nullptr;
            return record(t.record_name);
        }

        const Type &at(TypeId id) const { return types_.at(id); }

        bool is_base(TypeId id, BaseType b) const
        {
            const Type &t = at(id);
            return t.kind == Type::Kind::Base && t.base == b;
        }
        bool is_error(TypeId id) const { return is_base(id, BaseType::Error); }
        bool is_unit(TypeId id) const { return is_base(id, BaseType::Unit); }
        bool is_bool(TypeId id) const { return is_base(id, BaseType::Bool); }
        bool is_numeric(TypeId id) const { return is_base(id, BaseType::Integer) || is_base(id, BaseType::Mana); }
        bool is_stringlike(TypeId id) const { return is_base(id, BaseType::String) || is_base(id, BaseType::Did); }
        bool is_kind(TypeId id, Type::Kind k) const { return at(id).kind == k; }
        // Scalars compare by value with == and !=.
        bool is_equatable(TypeId id) const
        {
            return is_numeric(id) || is_bool(id) || is_stringlike(id) || is_error(id);
        }
        // Values that live in linear memory and are referenced by an i32 offset.
        bool is_region(TypeId id) const
        {
            const Type &t = at(id);
            return t.kind != Type::Kind::Base || t.base == BaseType::String || t.base == BaseType::Did;
        }

        // Integer and Mana substitute for each other; Error substitutes for anything.
        bool compatible(TypeId expected, TypeId actual) const
        {
            if (expected == actual || is_error(expected) || is_error(actual))
                return true;
            if (is_numeric(expected) && is_numeric(actual))
                return true;
            const Type &e = at(expected);
            const Type &a = at(actual);
            if (e.kind != a.kind || e.kind == Type::Kind::Base || e.kind == Type::Kind::Record)
                return false;
            return compatible(e.elem, a.elem);
        }

        std::string to_string(TypeId id) const
        {
            const Type &t = at(id);
            switch (t.kind)
            {
            case Type::Kind::Base:
                return base_name(t.base);
            case Type::Kind::Array:
                return "Array<" + to_string(t.elem) + ">";
            case Type::Kind::Option:
                return "Option<" + to_string(t.elem) + ">";
            case Type::Kind::Result:
                return "Result<" + to_string(t.elem) + ">";
            case Type::Kind::Record:
                return t.record_name;
            }
            return "<bad-type>";
        }

    private:
        std::vector<Type> types_;
        std::unordered_map<int, TypeId> base_index_;
        std::unordered_map<TypeId, TypeId> array_cache_;
        std::unordered_map<TypeId, TypeId> option_cache_;
        std::unordered_map<TypeId, TypeId> result_cache_;
        std::unordered_map<std::string, TypeId> record_cache_;
        std::map<std::string, RecordInfo> records_;

        TypeId add_type(Type t)
        {
            types_.push_back(std::move(t));
            return static_cast<TypeId>(types_.size() - 1);
        }
        TypeId get_wrapped(Type::Kind kind, TypeId elem, std::unordered_map<TypeId, TypeId> &cache)
        {
            auto it = cache.find(elem);
            if (it != cache.end())
                return it->second;
            Type t;
            t.kind = kind;
            t.elem = elem;
            TypeId id = add_type(t);
            cache[elem] = id;
            return id;
        }
        static std::string base_name(BaseType b)
        {
            switch (b)
            {
            case BaseType::Error:
                return "<error>";
            case BaseType::Unit:
                return "Unit";
            case BaseType::Integer:
                return "Integer";
            case BaseType::Bool:
                return "Bool";
            case BaseType::String:
                return "String";
            case BaseType::Mana:
                return "Mana";
            case BaseType::Did:
                return "Did";
            }
            return "?";
        }
    };

} // namespace ccl
