#include "ccl/json_writer.hpp"

namespace ccl {

std::string json_escape(const std::string& s){
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(unsigned char c : s){
        if(c == '"' || c == '\\'){ out += '\\'; out += static_cast<char>(c); }
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(c < 0x20){
            out += "\\u00";
            out += hex[c >> 4];
            out += hex[c & 0xf];
        }
        else out += static_cast<char>(c);
    }
    out += '"';
    return out;
}

void JsonWriter::separate(){
    if(after_key_){ after_key_ = false; return; }
    if(first_.empty()) return;
    if(!first_.back()) out_ += ',';
    first_.back() = false;
}

JsonWriter& JsonWriter::begin_object(){ separate(); out_ += '{'; first_.push_back(true); return *this; }
JsonWriter& JsonWriter::end_object(){ out_ += '}'; first_.pop_back(); return *this; }
JsonWriter& JsonWriter::begin_array(){ separate(); out_ += '['; first_.push_back(true); return *this; }
JsonWriter& JsonWriter::end_array(){ out_ += ']'; first_.pop_back(); return *this; }

JsonWriter& JsonWriter::key(const std::string& name){
    separate();
    out_ += json_escape(name);
    out_ += ':';
    after_key_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(const std::string& s){ separate(); out_ += json_escape(s); return *this; }
JsonWriter& JsonWriter::value(int64_t v){ separate(); out_ += std::to_string(v); return *this; }
JsonWriter& JsonWriter::value(uint64_t v){ separate(); out_ += std::to_string(v); return *this; }
JsonWriter& JsonWriter::value(bool v){ separate(); out_ += v ? "true" : "false"; return *this; }

} // namespace ccl
