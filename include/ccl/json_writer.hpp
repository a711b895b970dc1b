// Compact JSON output shared by diagnostics and contract metadata.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ccl {

// Quoted JSON string literal; control characters become \uXXXX.
std::string json_escape(const std::string& s);

// Streaming writer that inserts separators itself. Keys are written with key()
// and must alternate with values inside an object.
class JsonWriter {
public:
    JsonWriter& begin_object();
    JsonWriter& end_object();
    JsonWriter& begin_array();
    JsonWriter& end_array();
    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& s);
    JsonWriter& value(const char* s){ return value(std::string(s)); }
    JsonWriter& value(int64_t v);
    JsonWriter& value(uint64_t v);
    JsonWriter& value(int v){ return value(static_cast<int64_t>(v)); }
    JsonWriter& value(uint32_t v){ return value(static_cast<uint64_t>(v)); }
    JsonWriter& value(bool v);

    const std::string& str() const { return out_; }

private:
    void separate();

    std::string out_;
    std::vector<bool> first_; // one entry per open container
    bool after_key_ = false;
};

} // namespace ccl
