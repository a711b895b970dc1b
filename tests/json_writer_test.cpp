#include <gtest/gtest.h>
#include "ccl/json_writer.hpp"

#include <limits>

using namespace ccl;

TEST(JsonWriter, NestedContainersGetSeparators){
    JsonWriter w;
    w.begin_object();
    w.key("name").value("run");
    w.key("params").begin_array();
    w.begin_object().key("n").value(1).end_object();
    w.begin_object().key("n").value(2).end_object();
    w.end_array();
    w.key("empty").begin_array().end_array();
    w.key("ok").value(true);
    w.end_object();
    EXPECT_EQ(w.str(), "{\"name\":\"run\",\"params\":[{\"n\":1},{\"n\":2}],\"empty\":[],\"ok\":true}");
}

TEST(JsonWriter, NumbersKeepTheirSign){
    JsonWriter w;
    w.begin_array()
        .value(std::numeric_limits<int64_t>::min())
        .value(std::numeric_limits<uint64_t>::max())
        .value(uint32_t{7})
        .value(false)
        .end_array();
    EXPECT_EQ(w.str(), "[-9223372036854775808,18446744073709551615,7,false]");
}

TEST(JsonWriter, KeysAndStringsAreEscaped){
    JsonWriter w;
    w.begin_object().key("a\"b").value(std::string("x\ny\x1f")).end_object();
    EXPECT_EQ(w.str(), "{\"a\\\"b\":\"x\\ny\\u001F\"}");
}

TEST(JsonWriter, EscapeTable){
    EXPECT_EQ(json_escape(""), "\"\"");
    EXPECT_EQ(json_escape("\b\f\r"), "\"\\u0008\\u000C\\r\"");
    EXPECT_EQ(json_escape("/\x7f"), "\"/\x7f\"");
    EXPECT_EQ(json_escape("caf\xc3\xa9"), "\"caf\xc3\xa9\"");
}
