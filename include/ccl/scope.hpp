#pragma once
#include "ccl/ast.hpp"
#include "ccl/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace ccl {

enum class FrameKind { Global, Function, Block, ControlBody };

struct Binding {
    TypeId type = 0;
    bool is_mutable = true;
    int slot = -1;          // -1 for constants
    int const_index = -1;
    ast::SourcePos pos;
};

// Lexical scope stack: one frame per block, innermost last.
class ScopeStack {
public:
    void push(FrameKind k){ frames_.push_back(Frame{k,{}}); }
    void pop(){ if(!frames_.empty()) frames_.pop_back(); }
    size_t depth() const { return frames_.size(); }

    // Declares in the innermost frame; a same-frame redeclaration replaces the old binding.
    void declare(const std::string& name, const Binding& b){ frames_.back().names[name] = b; }

    bool declared_in_top(const std::string& name) const {
        return !frames_.empty() && frames_.back().names.count(name) != 0;
    }

    const Binding* lookup(const std::string& name) const {
        for(auto it = frames_.rbegin(); it != frames_.rend(); ++it){
            auto f = it->names.find(name);
            if(f != it->names.end()) return &f->second;
        }
        return nullptr;
    }

    // A local binding from outside the innermost control-flow body that `name` would hide.
    const Binding* shadowed_by_control_body(const std::string& name) const {
        size_t body = frames_.size();
        for(size_t i = frames_.size(); i-- > 0;){
            if(frames_[i].kind == FrameKind::ControlBody){ body = i; break; }
        }
        if(body == frames_.size()) return nullptr;
        for(size_t i = body; i-- > 0;){
            auto f = frames_[i].names.find(name);
            if(f != frames_[i].names.end()) return f->second.slot >= 0 ? &f->second : nullptr;
        }
        return nullptr;
    }

    std::vector<std::string> visible_names() const {
        std::vector<std::string> out;
        for(auto &fr: frames_) for(auto &kv: fr.names) out.push_back(kv.first);
        return out;
    }

private:
    struct Frame { FrameKind kind; std::map<std::string, Binding> names; };
    std::vector<Frame> frames_;
};

} // namespace ccl
